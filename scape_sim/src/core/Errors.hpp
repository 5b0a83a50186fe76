#pragma once

#include <stdexcept>
#include <string>

namespace scape {

    class SimulationError : public std::runtime_error {
    public:
        explicit SimulationError(const std::string& message) : std::runtime_error(message) {}
    };

    // Coordinate outside [0,width) x [0,height)
    class OutOfBounds : public SimulationError {
    public:
        explicit OutOfBounds(const std::string& message) : SimulationError(message) {}
    };

    // Occupant is not where the caller said it was
    class NotPresent : public SimulationError {
    public:
        explicit NotPresent(const std::string& message) : SimulationError(message) {}
    };

    // Decision violates the action's preconditions; applied as a no-op
    class InvalidAction : public SimulationError {
    public:
        explicit InvalidAction(const std::string& message) : SimulationError(message) {}
    };

    // MRS cannot be computed; fatal when raised from trader construction
    class DivisionUndefined : public SimulationError {
    public:
        explicit DivisionUndefined(const std::string& message) : SimulationError(message) {}
    };

    // External decision-maker failed or timed out
    class NoDecision : public SimulationError {
    public:
        explicit NoDecision(const std::string& message) : SimulationError(message) {}
    };

} // namespace scape
