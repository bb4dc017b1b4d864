#ifndef EVO_OPTIM__EXCEPTIONS_HPP_
#define EVO_OPTIM__EXCEPTIONS_HPP_

#include <stdexcept>
#include <string>

namespace evo_optim {

// Base of every error raised by the engine.
class EvolutionError : public std::runtime_error {
public:
    explicit EvolutionError(const std::string& what) : std::runtime_error(what) {}
};

// Missing or inconsistent option. Raised before any evaluation happens.
class ConfigurationError : public EvolutionError {
public:
    explicit ConfigurationError(const std::string& what) : EvolutionError(what) {}
};

// Two individuals were ranked while one of them had no fitness.
class ComparisonError : public EvolutionError {
public:
    explicit ComparisonError(const std::string& what) : EvolutionError(what) {}
};

// The evaluation workers themselves failed (not the objective).
class WorkerPoolFault : public EvolutionError {
public:
    explicit WorkerPoolFault(const std::string& what) : EvolutionError(what) {}
};

// Explicit stop request. The run ends early and its population is provisional:
// some individuals may not have been re-evaluated.
class UserAbort : public EvolutionError {
public:
    explicit UserAbort(const std::string& what = "evolution aborted by user") : EvolutionError(what) {}
};

}  // namespace evo_optim

#endif
