#ifndef SIMULATION_DRIVER_HPP
#define SIMULATION_DRIVER_HPP

#include "intervention/GatheringSizeCap.hpp"
#include "model/Population.hpp"
#include "model/StepEngine.hpp"
#include "simulation/Monitor.hpp"
#include "simulation/interfaces/IRecorder.hpp"
#include <map>
#include <memory>

namespace netepi {

/** @brief Index cases: individual -> remaining incubation days. */
using InitialCases = std::map<NodeId, int>;

/**
 * @class SimulationDriver
 * @brief Runs one epidemic: a normal period followed by a period of cancelled gatherings.
 *
 * A run of `ndays` days proceeds as:
 *  - reset the population and seed the index cases as incubating;
 *  - days 0 .. delay-1: record, then simulate the day;
 *  - cancel contacts with the GatheringSizeCap on the network as it is now;
 *  - days delay .. ndays-1: record, then simulate the day;
 *  - restore the cancelled contacts.
 *
 * The recorder therefore sees exactly `ndays` days, each before its transitions. With
 * delay = 0 the cap applies from day 0; with delay >= ndays every day runs uncapped and
 * the cap is applied and lifted without any day in between.
 */
class SimulationDriver {
public:
    /**
     * @param engine Day stepper (disease and randomness).
     * @param policy Gathering-size cap applied after the normal period.
     * @throws InvalidParameterException if `engine` is null.
     */
    SimulationDriver(std::shared_ptr<StepEngine> engine, GatheringSizeCap policy);

    /**
     * @brief Runs one epidemic, sending each day's starting state to `recorder`.
     *
     * The cancelled contacts are restored even if a day fails; the error is then logged
     * and rethrown. Errors that are not ModelException are wrapped in SimulationException.
     *
     * @param population Population to simulate; reset first. Its network is modified during the run.
     * @param initial_cases Index cases seeded as incubating, bypassing contagion.
     * @param delay Number of days before the cap applies.
     * @param ndays Total number of days.
     * @param recorder Observer of each day.
     *
     * @throws InvalidParameterException if `delay` or `ndays` is negative or an index case is not in the network.
     * @throws StateCorruptionException if the population partition breaks during a day.
     */
    void simulateCancelledEvents(Population& population,
                                 const InitialCases& initial_cases,
                                 int delay,
                                 int ndays,
                                 IRecorder& recorder) const;

    /**
     * @brief Same as above, recording into a new Monitor.
     */
    Monitor simulateCancelledEvents(Population& population,
                                    const InitialCases& initial_cases,
                                    int delay = 0,
                                    int ndays = 90) const;

    /**
     * @brief Resets `population` and seeds the index cases as incubating.
     * @throws InvalidParameterException if an index case is not in the network.
     */
    static void seedInitialCases(Population& population, const InitialCases& initial_cases);

    const GatheringSizeCap& getPolicy() const { return policy_; }
    std::shared_ptr<StepEngine> getEngine() const { return engine_; }

private:
    void runDays(Population& population, int first_day, int end_day, IRecorder& recorder) const;

    std::shared_ptr<StepEngine> engine_;
    GatheringSizeCap policy_;
};

} // namespace netepi

#endif // SIMULATION_DRIVER_HPP
