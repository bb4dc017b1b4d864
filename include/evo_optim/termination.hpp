#ifndef EVO_OPTIM__TERMINATION_HPP_
#define EVO_OPTIM__TERMINATION_HPP_

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "evo_optim/config.hpp"
#include "evo_optim/run_state.hpp"
#include "evo_optim/statistics.hpp"

namespace evo_optim {

using TerminationPredicate = std::function<bool(const RunState&, const EvolutionConfig&)>;

struct TerminationClause {
    std::string name;
    TerminationPredicate predicate;
};

// Logical OR of clauses, tested in the order they were added. The first
// clause that fires stops the test and names the termination cause.
class Terminator {
public:
    void add(TerminationClause clause);

    bool empty() const { return clauses_.empty(); }
    size_t size() const { return clauses_.size(); }

    std::optional<std::string> should_terminate(const RunState& state, const EvolutionConfig& config) const;

private:
    std::vector<TerminationClause> clauses_;
};

// Always fires; stands in when no other clause is configured.
TerminationClause default_termination();

TerminationClause evaluation_termination(size_t max_evaluations);

TerminationClause generation_termination(size_t max_generations);

// Wall-clock budget measured from the clause's first test.
TerminationClause time_termination(double max_seconds);

// Fires once `stop` is set, e.g. from a signal handler or another thread.
TerminationClause user_termination(std::shared_ptr<const std::atomic<bool>> stop);

// Fires when the best fitness has settled. Needs more than three recorded
// generations, a last step |f[-1] - f[-2]| within |f[-1] * tol|, and the last
// value being both no worse than the previous one and the best ever seen, so a
// temporary stall after a regression does not count as convergence.
TerminationClause convergence_termination(std::shared_ptr<const StatisticsLog> log, double tol, bool maximize);

}  // namespace evo_optim

#endif
