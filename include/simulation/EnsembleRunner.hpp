#ifndef ENSEMBLE_RUNNER_HPP
#define ENSEMBLE_RUNNER_HPP

#include "simulation/Monitor.hpp"
#include "simulation/SimulationDriver.hpp"
#include <memory>
#include <string>
#include <vector>

namespace netepi {

/**
 * @brief Per-day statistics of one health-state count across replicates.
 */
struct DailyStatistics {
    std::vector<double> mean;
    std::vector<double> median;
    std::vector<double> p05;
    std::vector<double> p95;
};

/**
 * @brief Summary of an ensemble: statistics for each recorded day.
 */
struct EnsembleSummary {
    std::vector<int> day;
    DailyStatistics susceptible;
    DailyStatistics incubating;
    DailyStatistics sick;
};

/**
 * @class EnsembleRunner
 * @brief Repeats the same scenario over independent replicates and summarizes the trajectories.
 *
 * Every replicate resets the population, seeds the same index cases and uses the same
 * network; only the random draws differ. Useful to compare intervention settings, since
 * a single stochastic trajectory says little.
 */
class EnsembleRunner {
public:
    /**
     * @throws InvalidParameterException if `driver` or `population` is null.
     */
    EnsembleRunner(std::shared_ptr<SimulationDriver> driver,
                   std::shared_ptr<Population> population,
                   InitialCases initial_cases,
                   int delay,
                   int ndays);

    /**
     * @brief Runs `replicates` simulations, replacing any previous results.
     * @return const std::vector<Monitor>& One monitor per replicate.
     * @throws InvalidParameterException if `replicates` is 0.
     */
    const std::vector<Monitor>& run(unsigned int replicates);

    const std::vector<Monitor>& getMonitors() const { return monitors_; }

    /**
     * @brief Mean, median, 5th and 95th percentile of each count for each day.
     * @throws InvalidResultException if run() has not produced any replicate.
     */
    EnsembleSummary summarize() const;

    /**
     * @brief Writes a summary as CSV: day, then mean/median/p05/p95 for S, I and sick.
     * @throws FileIOException if the file cannot be opened.
     */
    static void saveSummaryCSV(const EnsembleSummary& summary, const std::string& filename);

private:
    DailyStatistics statisticsOf(std::vector<int> Monitor::*series) const;

    std::shared_ptr<SimulationDriver> driver_;
    std::shared_ptr<Population> population_;
    InitialCases initial_cases_;
    int delay_;
    int ndays_;
    std::vector<Monitor> monitors_;
};

} // namespace netepi

#endif // ENSEMBLE_RUNNER_HPP
