#ifndef DISEASE_MODEL_HPP
#define DISEASE_MODEL_HPP

#include "model/interfaces/IDurationSampler.hpp"
#include "model/interfaces/IRandomSource.hpp"
#include <memory>

namespace netepi {

/**
 * @class DiseaseModel
 * @brief Immutable disease parameters: contagiousness and two stage-duration samplers.
 *
 * - contagiousness: probability that an incubating case infects one susceptible
 *   contact on one day. Transmission happens when a uniform [0,1) draw is strictly
 *   below it.
 * - incubation duration sampler and sickness duration sampler.
 *
 * The contagiousness is expected in [0, 1] and samplers are expected to return values
 * that round to non-negative day counts. Neither is validated or clamped here; values
 * outside those ranges give undefined simulation results. Range checks belong to the
 * configuration layer (see loadSimulationConfig).
 */
class DiseaseModel {
public:
    /**
     * @brief Disease with both stage durations lognormal(1.2, 0.5).
     * @param contagiousness Per contact, per day transmission probability.
     */
    explicit DiseaseModel(double contagiousness);

    /**
     * @brief Disease with explicitly supplied duration samplers.
     * @param contagiousness Per contact, per day transmission probability.
     * @param incubation_duration Sampler named for the incubation stage.
     * @param sickness_duration Sampler named for the sickness stage.
     * @throws InvalidParameterException if either sampler is null.
     */
    DiseaseModel(double contagiousness,
                 std::shared_ptr<const IDurationSampler> incubation_duration,
                 std::shared_ptr<const IDurationSampler> sickness_duration);

    double getContagiousness() const { return contagiousness_; }

    const IDurationSampler& getIncubationDurationSampler() const { return *incubation_duration_; }
    const IDurationSampler& getSicknessDurationSampler() const { return *sickness_duration_; }

    /** @brief Draws from the incubation sampler and rounds to whole days. */
    int sampleIncubationDays(IRandomSource& rng) const;

    /** @brief Draws from the sickness sampler and rounds to whole days. */
    int sampleSicknessDays(IRandomSource& rng) const;

    /**
     * @brief Rounds a sampled duration to whole days, halves to even (2.5 -> 2, 3.5 -> 4).
     */
    static int roundDays(double days);

private:
    double contagiousness_;
    std::shared_ptr<const IDurationSampler> incubation_duration_;
    std::shared_ptr<const IDurationSampler> sickness_duration_;
};

} // namespace netepi

#endif // DISEASE_MODEL_HPP
