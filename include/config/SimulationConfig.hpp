#ifndef SIMULATION_CONFIG_HPP
#define SIMULATION_CONFIG_HPP

#include <cstddef>
#include <string>

namespace netepi {

/**
 * @brief Settings of a simulation experiment, as read from a parameter file.
 *
 * Defaults reproduce the reference scenario: a 1000-person power-law clustered
 * network (m = 5, p = 1/3), lognormal(1.2, 0.5) stage durations, contacts capped
 * from degree 10 down to 5, 90 days.
 */
struct SimulationConfig {
    // Network
    std::size_t population_size = 1000;
    std::size_t network_m = 5;
    double network_p = 1.0 / 3.0;
    unsigned long network_seed = 1;

    // Disease
    double contagiousness = 0.05;
    double incubation_zeta = 1.2;
    double incubation_sigma = 0.5;
    double sickness_zeta = 1.2;
    double sickness_sigma = 0.5;

    // Intervention
    std::size_t max_gathering_size = 10;
    long min_connections = 5;

    // Run
    int delay = 0;
    int ndays = 90;
    std::size_t initial_cases = 3;
    int initial_incubation_days = 3;
    unsigned int replicates = 20;
    unsigned long rng_seed = 42;
    std::string log_level = "info";
};

/**
 * @brief Loads a simulation configuration from a key/value file.
 *
 * Each non-empty line holds `<key> <value>`. Text after '#' is a comment. Keys that
 * are absent keep their default; unknown keys are logged as warnings and ignored.
 *
 * @param filename Path to the parameter file.
 * @return SimulationConfig The loaded configuration.
 *
 * @throws FileIOException if the file cannot be opened.
 * @throws DataFormatException if a line has no value, a value is not a number of the
 *         expected type, or a value is out of range (probabilities outside [0, 1],
 *         negative durations or day counts, m outside [1, population_size], ...).
 */
SimulationConfig loadSimulationConfig(const std::string& filename);

/**
 * @brief Checks the ranges of a configuration.
 * @throws DataFormatException naming the first offending key.
 */
void validateSimulationConfig(const SimulationConfig& config);

} // namespace netepi

#endif // SIMULATION_CONFIG_HPP
