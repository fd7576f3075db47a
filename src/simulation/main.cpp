#include <algorithm>
#include <iostream>
#include <iomanip>
#include <limits>
#include <memory>
#include <set>
#include <string>

#include "config/SimulationConfig.hpp"
#include "exceptions/Exceptions.hpp"
#include "intervention/GatheringSizeCap.hpp"
#include "model/DiseaseModel.hpp"
#include "model/DurationSamplers.hpp"
#include "model/GslRandomSource.hpp"
#include "model/Population.hpp"
#include "model/StepEngine.hpp"
#include "network/NetworkGenerator.hpp"
#include "network/NetworkRenderer.hpp"
#include "simulation/EnsembleRunner.hpp"
#include "simulation/MonitorExporter.hpp"
#include "simulation/SimulationDriver.hpp"
#include "utils/FileUtils.hpp"
#include "utils/Logger.hpp"

using namespace netepi;

namespace {

InitialCases pickInitialCases(const SimulationConfig& config, IRandomSource& rng) {
    std::set<NodeId> chosen;
    while (chosen.size() < config.initial_cases) {
        chosen.insert(rng.uniformInt(config.population_size));
    }
    InitialCases cases;
    for (NodeId id : chosen) {
        cases[id] = config.initial_incubation_days;
    }
    return cases;
}

void runScenario(const std::string& name,
                 const GatheringSizeCap& policy,
                 const std::shared_ptr<StepEngine>& engine,
                 const std::shared_ptr<Population>& population,
                 const InitialCases& initial_cases,
                 const SimulationConfig& config) {
    Logger::getInstance().info("main", "Running scenario '" + name + "'...");
    auto driver = std::make_shared<SimulationDriver>(engine, policy);

    Monitor monitor = driver->simulateCancelledEvents(*population, initial_cases, config.delay, config.ndays);
    MonitorExporter::saveLongFormatCSV(monitor, FileUtils::getOutputPath(name + "_counts.csv"));

    std::cout << "\n--- Scenario '" << name << "' (single run, sample) ---" << std::endl;
    std::cout << "Day | Susceptible | Incubating | Sick" << std::endl;
    const std::size_t stride = std::max<std::size_t>(1, monitor.size() / 10);
    for (std::size_t i = 0; i < monitor.size(); i += stride) {
        std::cout << std::setw(3) << monitor.day[i] << " | "
                  << std::setw(11) << monitor.susceptible[i] << " | "
                  << std::setw(10) << monitor.incubating[i] << " | "
                  << std::setw(4) << monitor.sick[i] << std::endl;
    }

    EnsembleRunner ensemble(driver, population, initial_cases, config.delay, config.ndays);
    ensemble.run(config.replicates);
    EnsembleRunner::saveSummaryCSV(ensemble.summarize(), FileUtils::getOutputPath(name + "_summary.csv"));
}

} // namespace

int main(int argc, char* argv[]) {
    Logger::getInstance().setLogLevel(LogLevel::INFO);
    Logger::getInstance().info("main", "Starting network contagion simulation...");

    try {
        const std::string project_root = FileUtils::getProjectRoot();
        const std::string config_path = argc > 1
            ? std::string(argv[1])
            : FileUtils::joinPaths(project_root, "data/simulation_parameters.txt");
        Logger::getInstance().info("main", "Loading configuration from: " + config_path);
        const SimulationConfig config = loadSimulationConfig(config_path);

        LogLevel level;
        if (Logger::parseLogLevel(config.log_level, level)) {
            Logger::getInstance().setLogLevel(level);
        }

        // --- Network ---
        GslRandomSource network_rng(config.network_seed);
        auto network = std::make_shared<ContactNetwork>(
            NetworkGenerator::powerlawClusterGraph(config.population_size, config.network_m,
                                                   config.network_p, network_rng));
        auto population = std::make_shared<Population>(network);

        // --- Disease & engine ---
        auto rng = std::make_shared<GslRandomSource>(config.rng_seed);
        auto disease = std::make_shared<const DiseaseModel>(
            config.contagiousness,
            std::make_shared<LognormalDurationSampler>(config.incubation_zeta, config.incubation_sigma),
            std::make_shared<LognormalDurationSampler>(config.sickness_zeta, config.sickness_sigma));
        auto engine = std::make_shared<StepEngine>(disease, rng);

        const InitialCases initial_cases = pickInitialCases(config, *rng);
        Logger::getInstance().info("main", "Seeding " + std::to_string(initial_cases.size()) + " index cases.");

        // --- Scenarios ---
        // A cap above every possible degree cancels nothing.
        runScenario("baseline", GatheringSizeCap(std::numeric_limits<std::size_t>::max(), config.min_connections),
                    engine, population, initial_cases, config);
        runScenario("capped", GatheringSizeCap(config.max_gathering_size, config.min_connections),
                    engine, population, initial_cases, config);

        NetworkRenderer::saveDot(*population, FileUtils::getOutputPath("network_final.dot"));
    } catch (const ModelException& e) {
        Logger::getInstance().fatal("main", e.what());
        return 1;
    } catch (const std::exception& e) {
        Logger::getInstance().fatal("main", std::string("Unexpected error: ") + e.what());
        return 1;
    }

    Logger::getInstance().info("main", "Simulation finished. Results in " + FileUtils::getOutputPath());
    return 0;
}
