#include "config/SimulationConfig.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace netepi {

namespace {

const char* const kSource = "loadSimulationConfig";

std::string where(const std::string& filename, int line_number) {
    return filename + ":" + std::to_string(line_number);
}

double parseDouble(const std::string& key, const std::string& value, const std::string& location) {
    try {
        std::size_t pos = 0;
        double result = std::stod(value, &pos);
        if (pos != value.size()) {
            throw std::invalid_argument(value);
        }
        return result;
    } catch (const std::logic_error&) {
        throw DataFormatException(kSource, location + ": value '" + value + "' for '" + key + "' is not a number.");
    }
}

long long parseInteger(const std::string& key, const std::string& value, const std::string& location) {
    try {
        std::size_t pos = 0;
        long long result = std::stoll(value, &pos);
        if (pos != value.size()) {
            throw std::invalid_argument(value);
        }
        return result;
    } catch (const std::logic_error&) {
        throw DataFormatException(kSource, location + ": value '" + value + "' for '" + key + "' is not an integer.");
    }
}

long long parseNonNegative(const std::string& key, const std::string& value, const std::string& location) {
    long long result = parseInteger(key, value, location);
    if (result < 0) {
        throw DataFormatException(kSource, location + ": '" + key + "' cannot be negative. Got " + value + ".");
    }
    return result;
}

void requireProbability(const std::string& key, double value) {
    if (value < 0.0 || value > 1.0) {
        throw DataFormatException("validateSimulationConfig",
                                  "'" + key + "' must be in [0, 1]. Got " + std::to_string(value) + ".");
    }
}

void requirePositive(const std::string& key, double value) {
    if (value <= 0.0) {
        throw DataFormatException("validateSimulationConfig",
                                  "'" + key + "' must be positive. Got " + std::to_string(value) + ".");
    }
}

} // namespace

void validateSimulationConfig(const SimulationConfig& config) {
    if (config.network_m < 1 || config.network_m > config.population_size) {
        throw DataFormatException("validateSimulationConfig",
                                  "'network_m' must be in [1, population_size]. Got " +
                                  std::to_string(config.network_m) + ".");
    }
    requireProbability("network_p", config.network_p);
    requireProbability("contagiousness", config.contagiousness);
    requirePositive("incubation_sigma", config.incubation_sigma);
    requirePositive("sickness_sigma", config.sickness_sigma);
    if (config.min_connections < 0) {
        throw DataFormatException("validateSimulationConfig", "'min_connections' cannot be negative.");
    }
    if (config.delay < 0 || config.ndays < 0) {
        throw DataFormatException("validateSimulationConfig", "'delay' and 'ndays' cannot be negative.");
    }
    if (config.initial_cases > config.population_size) {
        throw DataFormatException("validateSimulationConfig",
                                  "'initial_cases' exceeds 'population_size' (" +
                                  std::to_string(config.initial_cases) + " > " +
                                  std::to_string(config.population_size) + ").");
    }
    if (config.initial_incubation_days < 0) {
        throw DataFormatException("validateSimulationConfig", "'initial_incubation_days' cannot be negative.");
    }
    if (config.replicates == 0) {
        throw DataFormatException("validateSimulationConfig", "'replicates' must be positive.");
    }
    LogLevel level;
    if (!Logger::parseLogLevel(config.log_level, level)) {
        throw DataFormatException("validateSimulationConfig", "Unknown 'log_level': " + config.log_level);
    }
}

SimulationConfig loadSimulationConfig(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw FileIOException(kSource, "Unable to open configuration file: " + filename);
    }

    SimulationConfig config;
    std::string line;
    int line_number = 0;

    while (std::getline(file, line)) {
        line_number++;
        std::size_t comment = line.find('#');
        if (comment != std::string::npos) {
            line.erase(comment);
        }

        std::istringstream iss(line);
        std::string key;
        if (!(iss >> key)) continue;

        const std::string location = where(filename, line_number);
        std::string value;
        if (!(iss >> value)) {
            throw DataFormatException(kSource, location + ": missing value for '" + key + "'.");
        }
        std::string extra;
        if (iss >> extra) {
            throw DataFormatException(kSource, location + ": unexpected token '" + extra + "' after '" + key + "'.");
        }

        if (key == "population_size") config.population_size = parseNonNegative(key, value, location);
        else if (key == "network_m") config.network_m = parseNonNegative(key, value, location);
        else if (key == "network_p") config.network_p = parseDouble(key, value, location);
        else if (key == "network_seed") config.network_seed = parseNonNegative(key, value, location);
        else if (key == "contagiousness") config.contagiousness = parseDouble(key, value, location);
        else if (key == "incubation_zeta") config.incubation_zeta = parseDouble(key, value, location);
        else if (key == "incubation_sigma") config.incubation_sigma = parseDouble(key, value, location);
        else if (key == "sickness_zeta") config.sickness_zeta = parseDouble(key, value, location);
        else if (key == "sickness_sigma") config.sickness_sigma = parseDouble(key, value, location);
        else if (key == "max_gathering_size") config.max_gathering_size = parseNonNegative(key, value, location);
        else if (key == "min_connections") config.min_connections = parseInteger(key, value, location);
        else if (key == "delay") config.delay = static_cast<int>(parseInteger(key, value, location));
        else if (key == "ndays") config.ndays = static_cast<int>(parseInteger(key, value, location));
        else if (key == "initial_cases") config.initial_cases = parseNonNegative(key, value, location);
        else if (key == "initial_incubation_days") config.initial_incubation_days = static_cast<int>(parseInteger(key, value, location));
        else if (key == "replicates") config.replicates = static_cast<unsigned int>(parseNonNegative(key, value, location));
        else if (key == "rng_seed") config.rng_seed = parseNonNegative(key, value, location);
        else if (key == "log_level") config.log_level = value;
        else {
            Logger::getInstance().warning(kSource, location + ": unknown key '" + key + "' ignored.");
        }
    }

    validateSimulationConfig(config);
    Logger::getInstance().info(kSource, "Configuration loaded from " + filename);
    return config;
}

} // namespace netepi
