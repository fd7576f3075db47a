#ifndef EXCEPTIONS_HPP
#define EXCEPTIONS_HPP

#include <stdexcept>
#include <string>
#include <sstream>

namespace netepi {

    inline std::string buildErrorMessage(const char* file, int line, const std::string& functionName, const std::string& category, const std::string& message) {
        std::ostringstream oss;
        oss << "[" << file << ":" << line << " (" << functionName << ")] " << category << ": " << message;
        return oss.str();
    }

/**
 * @brief Base exception for the network contagion simulation.
 */
class ModelException : public std::runtime_error {
public:
    /**
     * @brief Construct a ModelException.
     * @param functionName Name of the function where the error occurred.
     * @param message Descriptive error message.
     */
    ModelException(const std::string& functionName, const std::string& message)
        : std::runtime_error("[" + functionName + "] " + message),
          functionName_(functionName), file_(""), line_(0) {}
    ModelException(const char* file, int line, const std::string& functionName, const std::string& category, const std::string& message)
        : std::runtime_error(buildErrorMessage(file, line, functionName, category, message)),
          functionName_(functionName), file_(file), line_(line) {}

    /**
     * @brief Get the originating function's name.
     * @return const std::string& Function name.
     */
    const std::string& getFunctionName() const noexcept {
        return functionName_;
    }
    const char* getFile() const noexcept { return file_; }
    int getLine() const noexcept { return line_; }

private:
    std::string functionName_;
    const char* file_;
    int line_;
};

/**
 * @brief Exception for invalid method parameters.
 */
class InvalidParameterException : public ModelException {
public:
    InvalidParameterException(const std::string& functionName, const std::string& message)
        : ModelException(functionName, "Invalid Parameter: " + message) {}
    InvalidParameterException(const char* file, int line, const std::string& functionName, const std::string& message)
        : ModelException(file, line, functionName, "InvalidParameterException", message) {}
};

/**
 * @brief Exception for failures while running a simulation.
 */
class SimulationException : public ModelException {
public:
    /**
     * @brief Construct a SimulationException.
     * @param functionName Name of the function where the error occurred.
     * @param message Details about the simulation error.
     */
    SimulationException(const std::string& functionName, const std::string& message)
        : ModelException(functionName, "Simulation Error: " + message) {}
    SimulationException(const char* file, int line, const std::string& functionName, const std::string& message)
        : ModelException(file, line, functionName, "SimulationException", message) {}
};

/**
 * @brief Exception raised when the health-state partition of a population is broken.
 *
 * A node scheduled for a transition is missing from the group it should leave.
 * The population is corrupted; the run cannot continue.
 */
class StateCorruptionException : public ModelException {
public:
    StateCorruptionException(const char* file, int line, const std::string& functionName, const std::string& message)
        : ModelException(file, line, functionName, "StateCorruptionException", message) {}
};

/**
 * @brief Exception for file input/output errors.
 */
class FileIOException : public ModelException {
public:
    /**
     * @brief Construct a FileIOException.
     * @param functionName Name of the function where the error occurred.
     * @param message Details about the file I/O error.
     */
    FileIOException(const std::string& functionName, const std::string& message)
        : ModelException(functionName, "File IO Error: " + message) {}
};

/**
 * @brief Exception for data parsing or format errors.
 */
class DataFormatException : public ModelException {
public:
    /**
     * @brief Construct a DataFormatException.
     * @param functionName Name of the function where the error occurred.
     * @param message Details about the formatting error.
     */
    DataFormatException(const std::string& functionName, const std::string& message)
        : ModelException(functionName, "Data Format Error: " + message) {}
};

/**
 * @brief Exception for invalid simulation results.
 */
class InvalidResultException : public ModelException {
public:
    /**
     * @brief Construct an InvalidResultException.
     * @param functionName Name of the function where the error occurred.
     * @param message Details about the invalid result.
     */
    InvalidResultException(const std::string& functionName, const std::string& message)
        : ModelException(functionName, "Invalid Result: " + message) {}
};

} // namespace netepi

#define THROW_INVALID_PARAM(func, msg) throw netepi::InvalidParameterException(__FILE__, __LINE__, func, msg)
#define THROW_SIMULATION_ERROR(func, msg) throw netepi::SimulationException(__FILE__, __LINE__, func, msg)
#define THROW_STATE_CORRUPTION(func, msg) throw netepi::StateCorruptionException(__FILE__, __LINE__, func, msg)
#define THROW_MODEL_EXCEPTION(func, msg) throw netepi::ModelException(func, msg)

#endif // EXCEPTIONS_HPP
