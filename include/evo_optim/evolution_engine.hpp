#ifndef EVO_OPTIM__EVOLUTION_ENGINE_HPP_
#define EVO_OPTIM__EVOLUTION_ENGINE_HPP_

#include <atomic>
#include <functional>
#include <memory>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "rclcpp/logger.hpp"

#include "evo_optim/bounder.hpp"
#include "evo_optim/config.hpp"
#include "evo_optim/evaluation.hpp"
#include "evo_optim/optimization_algorithm.hpp"
#include "evo_optim/run_state.hpp"
#include "evo_optim/statistics.hpp"
#include "evo_optim/termination.hpp"

namespace evo_optim {

using Generator = std::function<Candidate(std::mt19937& rng, const EvolutionConfig& config)>;
using Observer = std::function<void(const RunState& state, const EvolutionConfig& config)>;

enum class EngineState {
    INIT,
    LOOP,
    DONE
};

// Generational loop controller.
//
//   INIT: evaluate seeds and generated candidates, build the archive, notify
//         observers with generation 0.
//   LOOP: test termination; otherwise reproduce, evaluate, replace, archive,
//         count the generation and notify observers.
//   DONE: the population is final.
//
// Offspring construction runs on the calling thread and consumes the engine's
// random stream slot by slot, so a fixed seed reproduces a run. Only the
// evaluation of a batch is parallel, and step() blocks until it completes.
// Errors from observers abort the run; UserAbort from any collaborator ends
// it with a provisional result.
class EvolutionEngine {
public:
    EvolutionEngine(EvolutionConfig config, std::unique_ptr<OptimizationAlgorithm> algorithm);

    void set_generator(Generator generator);
    void set_evaluator(BatchEvaluator evaluator);
    // Evaluates through a ParallelEvaluator with config.workers threads.
    void set_evaluation_function(EvaluationFunction function);
    void set_bounder(BounderPtr bounder);
    void add_observer(std::string name, Observer observer);
    // Clauses added here are tested after the ones derived from the config.
    void add_termination(TerminationClause clause);

    // Runs INIT. Throws ConfigurationError before any evaluation if the
    // configuration or the collaborators are incomplete.
    RunState initialize(std::vector<Candidate> seeds = {});

    // One LOOP iteration (INIT first if needed). Returns the state at the
    // generation boundary; a no-op once DONE.
    RunState step();

    // INIT, then step() until DONE.
    RunResult evolve(std::vector<Candidate> seeds = {});

    // Makes the user_termination clause fire at the next boundary.
    void request_stop() { stop_->store(true); }

    EngineState state() const { return state_; }
    bool done() const { return state_ == EngineState::DONE; }
    RunResult result() const;

    const EvolutionConfig& config() const { return config_; }
    const OptimizationAlgorithm& algorithm() const { return *algorithm_; }
    std::shared_ptr<const StatisticsLog> statistics() const { return statistics_; }

private:
    Population evaluate(const std::vector<Candidate>& candidates, bool drop_failures);
    void install_terminators();
    void notify_observers();
    void finish(const std::string& cause, bool provisional);

    EvolutionConfig config_;
    std::unique_ptr<OptimizationAlgorithm> algorithm_;
    Generator generator_;
    BatchEvaluator evaluator_;
    BounderPtr bounder_;
    std::vector<std::pair<std::string, Observer>> observers_;
    std::vector<TerminationClause> user_clauses_;

    Terminator terminator_;
    EvaluationContext context_;
    std::shared_ptr<StatisticsLog> statistics_;
    std::shared_ptr<std::atomic<bool>> stop_;
    std::mt19937 rng_;

    EngineState state_;
    RunState run_;
    std::string termination_cause_;
    bool provisional_;

    rclcpp::Logger logger_;
};

}  // namespace evo_optim

#endif
