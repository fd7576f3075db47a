#ifndef GSL_RANDOM_SOURCE_HPP
#define GSL_RANDOM_SOURCE_HPP

#include "model/interfaces/IRandomSource.hpp"
#include <gsl/gsl_rng.h>

namespace netepi {

/**
 * @class GslRandomSource
 * @brief IRandomSource backed by a GSL Mersenne Twister (gsl_rng_mt19937).
 *
 * Owns its gsl_rng; the generator is freed on destruction. Not copyable.
 */
class GslRandomSource : public IRandomSource {
public:
    /**
     * @brief Allocates and seeds the generator.
     * @param seed Seed passed to gsl_rng_set.
     * @throws SimulationException if the generator cannot be allocated.
     */
    explicit GslRandomSource(unsigned long seed);

    /**
     * @brief Seeds from the clock and process id. Runs are not reproducible.
     */
    GslRandomSource();

    ~GslRandomSource() override;

    GslRandomSource(const GslRandomSource&) = delete;
    GslRandomSource& operator=(const GslRandomSource&) = delete;

    double uniform() override;
    double lognormal(double zeta, double sigma) override;
    std::size_t uniformInt(std::size_t n) override;

    /** @brief Re-seeds the generator. */
    void seed(unsigned long seed);

private:
    gsl_rng* rng_;
};

} // namespace netepi

#endif // GSL_RANDOM_SOURCE_HPP
