#pragma once

#include <stdexcept>
#include <string>

namespace nof1 {

/// Malformed or incomplete study parameters. Raised before any simulation.
class SchemaError : public std::invalid_argument {
public:
    explicit SchemaError(const std::string& what)
        : std::invalid_argument("SchemaError: " + what) {}
};

/// The contemporaneous dependency graph contains a cycle.
class CyclicDependencyError : public std::invalid_argument {
public:
    explicit CyclicDependencyError(const std::string& what)
        : std::invalid_argument("CyclicDependencyError: " + what) {}
};

/// A variable has neither a baseline distribution nor inbound edges.
class UnreachableVariableError : public std::invalid_argument {
public:
    explicit UnreachableVariableError(const std::string& what)
        : std::invalid_argument("UnreachableVariableError: " + what) {}
};

/// A patient run produced a value the engine cannot continue from.
/// Aborts the whole cohort.
class SimulationError : public std::runtime_error {
public:
    explicit SimulationError(const std::string& what)
        : std::runtime_error("SimulationError: " + what) {}
};

} // namespace nof1
