#ifndef DURATION_SAMPLERS_HPP
#define DURATION_SAMPLERS_HPP

#include "model/interfaces/IDurationSampler.hpp"

namespace netepi {

/**
 * @brief Durations drawn from a lognormal distribution exp(N(zeta, sigma^2)).
 *
 * The defaults (zeta = 1.2, sigma = 0.5) give a median of about 3.3 days.
 */
class LognormalDurationSampler : public IDurationSampler {
public:
    explicit LognormalDurationSampler(double zeta = 1.2, double sigma = 0.5)
        : zeta_(zeta), sigma_(sigma) {}

    double sample(IRandomSource& rng) const override {
        return rng.lognormal(zeta_, sigma_);
    }

    double getZeta() const { return zeta_; }
    double getSigma() const { return sigma_; }

private:
    double zeta_;
    double sigma_;
};

/**
 * @brief Always returns the same duration. Does not consume randomness.
 */
class FixedDurationSampler : public IDurationSampler {
public:
    explicit FixedDurationSampler(double days) : days_(days) {}

    double sample(IRandomSource&) const override { return days_; }

private:
    double days_;
};

} // namespace netepi

#endif // DURATION_SAMPLERS_HPP
