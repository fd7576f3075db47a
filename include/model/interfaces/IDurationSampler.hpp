#ifndef I_DURATION_SAMPLER_HPP
#define I_DURATION_SAMPLER_HPP

#include "IRandomSource.hpp"
#include <memory>

namespace netepi {

/**
 * @brief Interface for a zero-argument generator of disease stage durations (in days).
 *
 * Results are real numbers that the step engine rounds to a whole day count. A sampler
 * must return values that round to a non-negative integer; this is not checked.
 */
class IDurationSampler {
public:
    virtual ~IDurationSampler() = default;

    /**
     * @brief Draws one duration.
     * @param rng Random source for the draw. Deterministic samplers may ignore it.
     * @return double Duration in days.
     */
    virtual double sample(IRandomSource& rng) const = 0;
};

} // namespace netepi

#endif // I_DURATION_SAMPLER_HPP
