#ifndef MONITOR_HPP
#define MONITOR_HPP

#include "simulation/interfaces/IRecorder.hpp"
#include <cstddef>
#include <vector>

namespace netepi {

/**
 * @brief Recorder that keeps per-day group counts, in recording order.
 *
 * All sequences have one entry per record() call.
 */
struct Monitor : public IRecorder {
    std::vector<int> day;
    std::vector<int> susceptible;
    std::vector<int> incubating;
    std::vector<int> sick;
    std::vector<int> recovered;

    void record(int d, const Population& population) override {
        const PopulationSnapshot s = population.snapshot();
        day.push_back(d);
        susceptible.push_back(static_cast<int>(s.susceptible));
        incubating.push_back(static_cast<int>(s.incubating));
        sick.push_back(static_cast<int>(s.sick));
        recovered.push_back(static_cast<int>(s.recovered));
    }

    std::size_t size() const { return day.size(); }

    bool isValid() const {
        const std::size_t n = day.size();
        return susceptible.size() == n && incubating.size() == n &&
               sick.size() == n && recovered.size() == n;
    }
};

} // namespace netepi

#endif // MONITOR_HPP
