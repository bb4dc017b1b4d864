#include "evo_optim/evolution_engine.hpp"
#include "evo_optim/exceptions.hpp"

#include "rclcpp/logging.hpp"

namespace evo_optim {

EvolutionEngine::EvolutionEngine(EvolutionConfig config, std::unique_ptr<OptimizationAlgorithm> algorithm)
: config_(std::move(config)),
  algorithm_(std::move(algorithm)),
  bounder_(std::make_shared<Bounder>()),
  statistics_(std::make_shared<StatisticsLog>()),
  stop_(std::make_shared<std::atomic<bool>>(false)),
  state_(EngineState::INIT),
  provisional_(false),
  logger_(rclcpp::get_logger("evo_optim.engine"))
{
    if (!algorithm_) throw ConfigurationError("evolution engine requires an algorithm");
    if (config_.seed) {
        rng_.seed(*config_.seed);
    } else {
        std::random_device rd;
        rng_.seed(rd());
    }
}

void EvolutionEngine::set_generator(Generator generator) {
    generator_ = std::move(generator);
}

void EvolutionEngine::set_evaluator(BatchEvaluator evaluator) {
    evaluator_ = std::move(evaluator);
}

void EvolutionEngine::set_evaluation_function(EvaluationFunction function) {
    evaluator_ = ParallelEvaluator(std::move(function), config_.resolved_workers());
}

void EvolutionEngine::set_bounder(BounderPtr bounder) {
    if (!bounder) throw ConfigurationError("bounder must not be null");
    bounder_ = std::move(bounder);
}

void EvolutionEngine::add_observer(std::string name, Observer observer) {
    observers_.emplace_back(std::move(name), std::move(observer));
}

void EvolutionEngine::add_termination(TerminationClause clause) {
    user_clauses_.push_back(std::move(clause));
}

void EvolutionEngine::install_terminators() {
    terminator_ = Terminator();
    if (config_.max_evaluations > 0) terminator_.add(evaluation_termination(config_.max_evaluations));
    if (config_.max_generations > 0) terminator_.add(generation_termination(config_.max_generations));
    if (config_.max_time > 0.0) terminator_.add(time_termination(config_.max_time));
    if (config_.convergence_tolerance) {
        terminator_.add(convergence_termination(statistics_, *config_.convergence_tolerance, config_.maximize));
    }
    for (const auto& clause : user_clauses_) terminator_.add(clause);

    if (terminator_.empty()) {
        RCLCPP_WARN(logger_, "no termination criterion configured, using default_termination");
        terminator_.add(default_termination());
    }
    terminator_.add(user_termination(stop_));
}

Population EvolutionEngine::evaluate(const std::vector<Candidate>& candidates, bool drop_failures) {
    Population individuals;
    if (candidates.empty()) return individuals;

    BatchResult batch = evaluator_(candidates, context_);
    if (batch.fitness.size() != candidates.size() || batch.responses.size() != candidates.size()) {
        throw EvolutionError("evaluator returned " + std::to_string(batch.fitness.size()) +
                             " results for " + std::to_string(candidates.size()) + " candidates");
    }
    run_.num_evaluations += candidates.size();

    individuals.reserve(candidates.size());
    for (size_t i = 0; i < candidates.size(); ++i) {
        Individual ind(candidates[i], config_.maximize);
        if (batch.fitness[i]) {
            ind.set_fitness(*batch.fitness[i]);
        } else if (drop_failures) {
            RCLCPP_WARN(logger_, "excluding candidate %zu because its fitness is undefined", i);
            continue;
        } else {
            RCLCPP_WARN(logger_, "offspring %zu has no fitness and cannot replace its parent", i);
        }
        ind.set_responses(std::move(batch.responses[i]));
        individuals.push_back(std::move(ind));
    }
    return individuals;
}

void EvolutionEngine::notify_observers() {
    statistics_->record(run_);
    for (const auto& observer : observers_) {
        RCLCPP_DEBUG(logger_, "observation using %s at generation %zu and evaluation %zu",
                     observer.first.c_str(), run_.num_generations, run_.num_evaluations);
        observer.second(run_, config_);
    }
}

void EvolutionEngine::finish(const std::string& cause, bool provisional) {
    termination_cause_ = cause;
    provisional_ = provisional;
    state_ = EngineState::DONE;
    RCLCPP_INFO(logger_, "termination from %s at generation %zu and evaluation %zu",
                cause.c_str(), run_.num_generations, run_.num_evaluations);
}

RunState EvolutionEngine::initialize(std::vector<Candidate> seeds) {
    if (state_ != EngineState::INIT) throw EvolutionError("evolution engine already initialized");

    config_.validate();
    if (!evaluator_) throw ConfigurationError("no evaluator configured");
    if (seeds.size() < config_.pop_size && !generator_) {
        throw ConfigurationError("no generator configured and only " + std::to_string(seeds.size()) +
                                 " seeds for a population of " + std::to_string(config_.pop_size));
    }

    context_ = config_.evaluation_context();
    install_terminators();

    std::vector<Candidate> candidates = std::move(seeds);
    while (candidates.size() < config_.pop_size) {
        candidates.push_back(generator_(rng_, config_));
    }
    RCLCPP_DEBUG(logger_, "generating initial population of %zu with %s",
                 candidates.size(), algorithm_->name().c_str());

    run_ = RunState();
    try {
        run_.population = evaluate(candidates, true);
        run_.archive = algorithm_->archive(run_.population, Population());
        state_ = EngineState::LOOP;
        notify_observers();
    } catch (const UserAbort& e) {
        RCLCPP_WARN(logger_, "%s", e.what());
        finish("user_abort", true);
    }
    return run_;
}

RunState EvolutionEngine::step() {
    if (state_ == EngineState::INIT) return initialize();
    if (state_ == EngineState::DONE) return run_;

    if (auto cause = terminator_.should_terminate(run_, config_)) {
        finish(*cause, false);
        return run_;
    }

    try {
        VariationContext variation{config_, *bounder_, rng_};
        const std::vector<Candidate> offspring_cs = algorithm_->reproduce(run_, variation);
        RCLCPP_DEBUG(logger_, "evaluating %zu offspring at generation %zu",
                     offspring_cs.size(), run_.num_generations);

        const Population offspring = evaluate(offspring_cs, false);
        run_.population = algorithm_->replace(run_.population, offspring, config_);
        run_.archive = algorithm_->archive(run_.population, run_.archive);
        run_.num_generations++;
        notify_observers();
    } catch (const UserAbort& e) {
        RCLCPP_WARN(logger_, "%s", e.what());
        finish("user_abort", true);
    }
    return run_;
}

RunResult EvolutionEngine::evolve(std::vector<Candidate> seeds) {
    if (state_ == EngineState::INIT) initialize(std::move(seeds));
    while (!done()) step();
    return result();
}

RunResult EvolutionEngine::result() const {
    RunResult r;
    r.population = run_.population;
    r.archive = run_.archive;
    r.num_generations = run_.num_generations;
    r.num_evaluations = run_.num_evaluations;
    r.termination_cause = termination_cause_;
    r.provisional = provisional_;
    return r;
}

}  // namespace evo_optim
