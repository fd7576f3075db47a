#include "simulation/EnsembleRunner.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <gsl/gsl_statistics.h>
#include <algorithm>
#include <initializer_list>
#include <fstream>
#include <utility>

namespace netepi {

EnsembleRunner::EnsembleRunner(std::shared_ptr<SimulationDriver> driver,
                               std::shared_ptr<Population> population,
                               InitialCases initial_cases,
                               int delay,
                               int ndays)
    : driver_(std::move(driver)),
      population_(std::move(population)),
      initial_cases_(std::move(initial_cases)),
      delay_(delay),
      ndays_(ndays) {
    if (!driver_) {
        THROW_INVALID_PARAM("EnsembleRunner::EnsembleRunner", "Simulation driver pointer cannot be null.");
    }
    if (!population_) {
        THROW_INVALID_PARAM("EnsembleRunner::EnsembleRunner", "Population pointer cannot be null.");
    }
}

const std::vector<Monitor>& EnsembleRunner::run(unsigned int replicates) {
    if (replicates == 0) {
        THROW_INVALID_PARAM("EnsembleRunner::run", "Number of replicates must be positive.");
    }
    monitors_.clear();
    monitors_.reserve(replicates);
    for (unsigned int r = 0; r < replicates; ++r) {
        monitors_.push_back(driver_->simulateCancelledEvents(*population_, initial_cases_, delay_, ndays_));
    }
    Logger::getInstance().info("EnsembleRunner::run",
                               "Completed " + std::to_string(replicates) + " replicates of " +
                               std::to_string(ndays_) + " days.");
    return monitors_;
}

DailyStatistics EnsembleRunner::statisticsOf(std::vector<int> Monitor::*series) const {
    const std::size_t replicates = monitors_.size();
    const std::size_t num_days = monitors_.front().size();

    DailyStatistics stats;
    stats.mean.resize(num_days, 0.0);
    stats.median.resize(num_days, 0.0);
    stats.p05.resize(num_days, 0.0);
    stats.p95.resize(num_days, 0.0);

    std::vector<double> data(replicates);
    for (std::size_t d = 0; d < num_days; ++d) {
        for (std::size_t r = 0; r < replicates; ++r) {
            data[r] = static_cast<double>((monitors_[r].*series)[d]);
        }
        std::sort(data.begin(), data.end());
        stats.mean[d] = gsl_stats_mean(data.data(), 1, replicates);
        stats.median[d] = gsl_stats_median_from_sorted_data(data.data(), 1, replicates);
        stats.p05[d] = gsl_stats_quantile_from_sorted_data(data.data(), 1, replicates, 0.05);
        stats.p95[d] = gsl_stats_quantile_from_sorted_data(data.data(), 1, replicates, 0.95);
    }
    return stats;
}

EnsembleSummary EnsembleRunner::summarize() const {
    if (monitors_.empty()) {
        throw InvalidResultException("EnsembleRunner::summarize", "No replicate has been run.");
    }
    for (const auto& monitor : monitors_) {
        if (!monitor.isValid() || monitor.size() != monitors_.front().size()) {
            throw InvalidResultException("EnsembleRunner::summarize", "Replicates recorded different numbers of days.");
        }
    }

    EnsembleSummary summary;
    summary.day = monitors_.front().day;
    summary.susceptible = statisticsOf(&Monitor::susceptible);
    summary.incubating = statisticsOf(&Monitor::incubating);
    summary.sick = statisticsOf(&Monitor::sick);
    return summary;
}

void EnsembleRunner::saveSummaryCSV(const EnsembleSummary& summary, const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw FileIOException("EnsembleRunner::saveSummaryCSV", "Could not open file for writing: " + filename);
    }
    file << "day,S_mean,S_median,S_p05,S_p95,I_mean,I_median,I_p05,I_p95,"
            "Sick_mean,Sick_median,Sick_p05,Sick_p95\n";
    for (std::size_t d = 0; d < summary.day.size(); ++d) {
        file << summary.day[d];
        for (const DailyStatistics* stats : {&summary.susceptible, &summary.incubating, &summary.sick}) {
            file << "," << stats->mean[d]
                 << "," << stats->median[d]
                 << "," << stats->p05[d]
                 << "," << stats->p95[d];
        }
        file << "\n";
    }
    Logger::getInstance().info("EnsembleRunner::saveSummaryCSV", "Summary written to " + filename);
}

} // namespace netepi
