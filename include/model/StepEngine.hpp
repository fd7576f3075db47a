#ifndef STEP_ENGINE_HPP
#define STEP_ENGINE_HPP

#include "model/DiseaseModel.hpp"
#include "model/Population.hpp"
#include "model/interfaces/IRandomSource.hpp"
#include <memory>
#include <vector>

namespace netepi {

/**
 * @brief Transitions decided during one simulated day, applied together by StepEngine::commit.
 */
struct DayTransitions {
    /** @brief Susceptible individuals infected today, in order of infection. */
    std::vector<NodeId> new_contaminations;
    /** @brief Incubating cases whose counter reached 0 today. */
    std::vector<NodeId> new_sicknesses;
    /** @brief Sick cases whose counter reached 0 today. */
    std::vector<NodeId> new_recoveries;
};

/**
 * @class StepEngine
 * @brief Advances a Population by one day.
 *
 * A day runs in three stages:
 *  1. updateIncubations: each incubating case may infect its susceptible contacts, then
 *     its counter either triggers sickness (at 0) or is decremented.
 *  2. updateSicknesses: each sick case either recovers (at 0) or has its counter decremented.
 *  3. commit: group changes decided in 1 and 2 are applied.
 *
 * Only cases incubating at the start of the day transmit: individuals infected today
 * stay in the susceptible group until commit and are skipped by later draws.
 *
 * New durations are drawn crosswise. A case that becomes sick gets a duration from the
 * disease's incubation sampler; a newly infected individual gets one from the sickness
 * sampler. Existing simulation outputs depend on this assignment.
 */
class StepEngine {
public:
    /**
     * @param disease Disease parameters.
     * @param rng Source of contagion draws and duration samples.
     * @throws InvalidParameterException if either pointer is null.
     */
    StepEngine(std::shared_ptr<const DiseaseModel> disease, std::shared_ptr<IRandomSource> rng);

    /**
     * @brief Stage 1: contagion from incubating cases and incubation progress.
     *
     * For every incubating case (ascending id) and every contact in network order,
     * a contact that is susceptible and not yet infected today gets one uniform draw and
     * is infected if the draw is below the contagiousness. Then the case's counter is
     * checked: 0 schedules sickness, anything else is decremented in place.
     */
    void updateIncubations(Population& population, DayTransitions& transitions);

    /**
     * @brief Stage 2: sick cases with counter 0 are scheduled for recovery, others decremented.
     */
    void updateSicknesses(Population& population, DayTransitions& transitions);

    /**
     * @brief Stage 3: applies the day's transitions.
     *
     * In order: incubating -> sick, susceptible -> incubating, sick -> recovered.
     *
     * @throws StateCorruptionException if a scheduled individual is not in the group it
     *         should leave. The population must not be used afterwards.
     */
    void commit(Population& population, const DayTransitions& transitions);

    /**
     * @brief Runs the three stages for one day.
     * @return DayTransitions What happened during the day.
     */
    DayTransitions simulateDay(Population& population);

    const DiseaseModel& getDisease() const { return *disease_; }
    IRandomSource& getRandomSource() const { return *rng_; }

private:
    std::shared_ptr<const DiseaseModel> disease_;
    std::shared_ptr<IRandomSource> rng_;
};

} // namespace netepi

#endif // STEP_ENGINE_HPP
