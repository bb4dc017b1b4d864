#include "evo_optim/evaluation.hpp"
#include "evo_optim/exceptions.hpp"

#include <chrono>
#include <cmath>
#include <new>
#include <string>
#include <system_error>

#include "rclcpp/logging.hpp"

namespace evo_optim {

namespace {

rclcpp::Logger logger() {
    return rclcpp::get_logger("evo_optim.evaluation");
}

// NaN cannot be ranked, so it is handled like a missing value.
void normalize(EvaluationResult& result, size_t index) {
    if (result.fitness && std::isnan(*result.fitness)) {
        RCLCPP_WARN(logger(), "candidate %zu evaluated to NaN, treating fitness as undefined", index);
        result.fitness.reset();
    }
}

BatchResult collect(std::vector<EvaluationResult>& results) {
    BatchResult batch;
    batch.fitness.reserve(results.size());
    batch.responses.reserve(results.size());
    for (auto& r : results) {
        batch.fitness.push_back(r.fitness);
        batch.responses.push_back(std::move(r.responses));
    }
    return batch;
}

}  // namespace

ParallelEvaluator::ParallelEvaluator(EvaluationFunction function, unsigned workers)
: function_(std::move(function)), workers_(workers)
{
    if (!function_) throw ConfigurationError("parallel evaluation requires an evaluation function");
    if (workers_ == 0) throw ConfigurationError("parallel evaluation requires at least one worker");
}

BatchResult ParallelEvaluator::operator()(const std::vector<Candidate>& candidates,
                                          const EvaluationContext& context) const {
    const auto start = std::chrono::steady_clock::now();
    const long n = static_cast<long>(candidates.size());
    std::vector<EvaluationResult> results(candidates.size());

    bool aborted = false;
    std::string abort_message;
    bool faulted = false;
    std::string fault_message;

#pragma omp parallel for schedule(dynamic, 1) num_threads(workers_)
    for (long i = 0; i < n; ++i) {
        const size_t index = static_cast<size_t>(i);
        try {
            EvaluationRequest request{index, candidates[index], context};
            results[index] = function_(request);
            normalize(results[index], index);
        } catch (const UserAbort& e) {
#pragma omp critical(evo_optim_evaluation_error)
            {
                if (!aborted) abort_message = e.what();
                aborted = true;
            }
        } catch (const std::bad_alloc& e) {
#pragma omp critical(evo_optim_evaluation_error)
            {
                if (!faulted) fault_message = std::string("out of memory: ") + e.what();
                faulted = true;
            }
        } catch (const std::system_error& e) {
#pragma omp critical(evo_optim_evaluation_error)
            {
                if (!faulted) fault_message = std::string("system error: ") + e.what();
                faulted = true;
            }
        } catch (const std::exception& e) {
            RCLCPP_WARN(logger(), "evaluation of candidate %zu failed: %s", index, e.what());
            results[index].fitness.reset();
        } catch (...) {
#pragma omp critical(evo_optim_evaluation_error)
            {
                if (!faulted) fault_message = "unknown exception in evaluation worker";
                faulted = true;
            }
        }
    }

    if (faulted) {
        RCLCPP_ERROR(logger(), "failed parallel evaluation: %s", fault_message.c_str());
        throw WorkerPoolFault(fault_message);
    }
    if (aborted) throw UserAbort(abort_message);

    const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    RCLCPP_DEBUG(logger(), "completed parallel evaluation of %zu candidates on %u workers in %.3f seconds",
                 candidates.size(), workers_, elapsed);
    return collect(results);
}

}  // namespace evo_optim
