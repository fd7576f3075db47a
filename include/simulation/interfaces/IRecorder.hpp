#ifndef I_RECORDER_HPP
#define I_RECORDER_HPP

#include "model/Population.hpp"

namespace netepi {

/**
 * @brief Interface for observers of a simulation run.
 *
 * The driver calls record() once per simulated day, before that day's transitions,
 * so the population passed in is the state the day starts from.
 */
class IRecorder {
public:
    virtual ~IRecorder() = default;

    /**
     * @param day Day index, starting at 0.
     * @param population Read-only population state at the start of `day`.
     */
    virtual void record(int day, const Population& population) = 0;
};

} // namespace netepi

#endif // I_RECORDER_HPP
