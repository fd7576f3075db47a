#include "simulation/SimulationDriver.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <string>
#include <utility>

namespace netepi {

SimulationDriver::SimulationDriver(std::shared_ptr<StepEngine> engine, GatheringSizeCap policy)
    : engine_(std::move(engine)), policy_(policy) {
    if (!engine_) {
        THROW_INVALID_PARAM("SimulationDriver::SimulationDriver", "Step engine pointer cannot be null.");
    }
}

void SimulationDriver::seedInitialCases(Population& population, const InitialCases& initial_cases) {
    population.reset();
    for (const auto& entry : initial_cases) {
        if (!population.getNetwork().hasNode(entry.first)) {
            THROW_INVALID_PARAM("SimulationDriver::seedInitialCases",
                                "Index case " + std::to_string(entry.first) + " is not in the network.");
        }
        population.susceptible().erase(entry.first);
        population.incubating()[entry.first] = entry.second;
    }
}

void SimulationDriver::runDays(Population& population, int first_day, int end_day, IRecorder& recorder) const {
    for (int day = first_day; day < end_day; ++day) {
        recorder.record(day, population);
        engine_->simulateDay(population);
    }
}

void SimulationDriver::simulateCancelledEvents(Population& population,
                                               const InitialCases& initial_cases,
                                               int delay,
                                               int ndays,
                                               IRecorder& recorder) const {
    if (delay < 0 || ndays < 0) {
        THROW_INVALID_PARAM("SimulationDriver::simulateCancelledEvents",
                            "delay and ndays must be non-negative. Got delay=" + std::to_string(delay) +
                            ", ndays=" + std::to_string(ndays) + ".");
    }
    seedInitialCases(population, initial_cases);

    Logger& logger = Logger::getInstance();
    const int normal_end = std::min(delay, ndays);
    ContactNetwork& network = population.getNetwork();
    EdgeList cancelled;
    bool cap_active = false;

    try {
        logger.info("SimulationDriver::simulateCancelledEvents",
                    "Normal period: days 0.." + std::to_string(normal_end) + " with " +
                    std::to_string(initial_cases.size()) + " index cases.");
        runDays(population, 0, normal_end, recorder);

        cancelled = policy_.cancel(network);
        cap_active = true;

        logger.info("SimulationDriver::simulateCancelledEvents",
                    "Intervention period: days " + std::to_string(normal_end) + ".." + std::to_string(ndays) + ".");
        runDays(population, normal_end, ndays, recorder);
    } catch (const ModelException& e) {
        if (cap_active) GatheringSizeCap::restore(network, cancelled);
        logger.error("SimulationDriver::simulateCancelledEvents", e.what());
        throw;
    } catch (const std::exception& e) {
        if (cap_active) GatheringSizeCap::restore(network, cancelled);
        std::string msg = "Run failed: " + std::string(e.what());
        logger.error("SimulationDriver::simulateCancelledEvents", msg);
        THROW_SIMULATION_ERROR("SimulationDriver::simulateCancelledEvents", msg);
    }

    GatheringSizeCap::restore(network, cancelled);

    const PopulationSnapshot s = population.snapshot();
    logger.info("SimulationDriver::simulateCancelledEvents",
                "Run finished: S=" + std::to_string(s.susceptible) + " I=" + std::to_string(s.incubating) +
                " Sick=" + std::to_string(s.sick) + " R=" + std::to_string(s.recovered));
}

Monitor SimulationDriver::simulateCancelledEvents(Population& population,
                                                  const InitialCases& initial_cases,
                                                  int delay,
                                                  int ndays) const {
    Monitor monitor;
    simulateCancelledEvents(population, initial_cases, delay, ndays, monitor);
    return monitor;
}

} // namespace netepi
