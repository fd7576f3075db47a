#ifndef I_RANDOM_SOURCE_HPP
#define I_RANDOM_SOURCE_HPP

#include <cstddef>

namespace netepi {

/**
 * @brief Interface for the source of every random draw made by the simulation.
 *
 * Contagion coin-flips, stage-duration samples and network generation all draw
 * from an IRandomSource passed in explicitly. Supplying a seeded or scripted
 * implementation makes a run reproducible.
 */
class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    /**
     * @brief Uniform draw in [0, 1).
     */
    virtual double uniform() = 0;

    /**
     * @brief Lognormal draw: exp(N(zeta, sigma^2)).
     * @param zeta Mean of the underlying normal distribution.
     * @param sigma Standard deviation of the underlying normal distribution.
     */
    virtual double lognormal(double zeta, double sigma) = 0;

    /**
     * @brief Uniform integer draw in [0, n). `n` must be positive.
     */
    virtual std::size_t uniformInt(std::size_t n) = 0;
};

} // namespace netepi

#endif // I_RANDOM_SOURCE_HPP
