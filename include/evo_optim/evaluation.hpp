#ifndef EVO_OPTIM__EVALUATION_HPP_
#define EVO_OPTIM__EVALUATION_HPP_

#include <functional>
#include <optional>
#include <vector>

#include "evo_optim/config.hpp"
#include "evo_optim/individual.hpp"

namespace evo_optim {

// Everything one evaluation task receives. All fields are plain values, so
// the request is copied into the worker and never refers to engine state.
struct EvaluationRequest {
    size_t index = 0;
    Candidate candidate;
    EvaluationContext context;
};

// An empty fitness marks a candidate that could not be evaluated.
struct EvaluationResult {
    std::optional<double> fitness;
    Responses responses;
};

using EvaluationFunction = std::function<EvaluationResult(const EvaluationRequest&)>;

// Fitness and responses for a batch, index-aligned with the submitted candidates.
struct BatchResult {
    std::vector<std::optional<double>> fitness;
    std::vector<Responses> responses;
};

// The only interface the engine needs from problem code.
using BatchEvaluator = std::function<BatchResult(const std::vector<Candidate>&, const EvaluationContext&)>;

// Evaluates a batch on an OpenMP team of `workers` threads, one task per
// candidate. Results are written to the slot of their submission index, so the
// output order never depends on completion order.
//
// A task that throws yields an empty fitness. std::bad_alloc, std::system_error
// or non-standard exceptions are treated as a failure of the pool itself: the
// batch is drained and WorkerPoolFault is thrown. UserAbort is re-thrown once
// the batch is drained. There is no retry and no per-task timeout.
class ParallelEvaluator {
public:
    ParallelEvaluator(EvaluationFunction function, unsigned workers);

    BatchResult operator()(const std::vector<Candidate>& candidates, const EvaluationContext& context) const;

    unsigned workers() const { return workers_; }

private:
    EvaluationFunction function_;
    unsigned workers_;
};

}  // namespace evo_optim

#endif
