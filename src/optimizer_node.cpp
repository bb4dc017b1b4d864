#include "evo_optim/optimizer_node.hpp"
#include "evo_optim/de_algorithm.hpp"
#include "evo_optim/exceptions.hpp"
#include "evo_optim/genetic_algorithm.hpp"
#include "evo_optim/pso_algorithm.hpp"
#include "evo_optim/statistics.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <chrono>
#include <filesystem>

namespace evo_optim {

namespace {

std::string normalize(std::string s) {
    std::string out;
    for (unsigned char ch : s) if (std::isalnum(ch)) out.push_back(static_cast<char>(std::tolower(ch)));
    return out;
}

}  // namespace

evo_optim::msg::Individual to_msg(const Individual& individual) {
    evo_optim::msg::Individual msg;
    msg.genes = individual.candidate();
    msg.fitness = individual.fitness().value_or(std::nan(""));
    for (const auto& [name, value] : individual.responses()) {
        msg.response_names.push_back(name);
        msg.response_values.push_back(value);
    }
    return msg;
}

OptimizerNode::OptimizerNode(const rclcpp::NodeOptions& options)
: Node("optimizer_node", options), state_(NodeState::INIT_CHECK)
{
    this->declare_parameter("run_id", "run_0");
    this->declare_parameter("pop_size", 50);
    this->declare_parameter("gene_dim", 10);
    this->declare_parameter("maximize", false);
    this->declare_parameter("algorithm_type", "DE");
    this->declare_parameter("strategy", "DE/rand/1/bin");
    this->declare_parameter("binomial_targeting", "fixed_dimension");
    this->declare_parameter("replacement_comparison", "magnitude");

    // DE
    this->declare_parameter("de_F", 0.5);
    this->declare_parameter("de_CR", 0.9);
    // PSO
    this->declare_parameter("pso_w", 0.5);
    this->declare_parameter("pso_c1", 2.1);
    this->declare_parameter("pso_c2", 2.1);
    // GA
    this->declare_parameter("crossover_rate", 0.8);
    this->declare_parameter("mutation_rate", 0.1);
    this->declare_parameter("tournament_size", 2);
    this->declare_parameter("variators", std::vector<std::string>({"uniform_crossover", "gaussian_mutation"}));

    // termination
    this->declare_parameter("max_evaluations", 0);
    this->declare_parameter("max_generations", 300);
    this->declare_parameter("max_time", 0.0);
    this->declare_parameter("tol", 0.0);

    this->declare_parameter("workers", 0);
    this->declare_parameter("seed", -1);

    // objective
    this->declare_parameter("function_name", "Rastrigin");
    this->declare_parameter("rastrigin_A", 10.0);
    this->declare_parameter("michalewicz_m", 10);
    this->declare_parameter("lower_bound", 0.0);
    this->declare_parameter("upper_bound", 1.0);

    // driver
    this->declare_parameter("timer_period_ms", 10);
    this->declare_parameter("generations_per_tick", 1);
    this->declare_parameter("enable_csv_log", false);
    this->declare_parameter("log_dir", "./evo_logs");
    this->declare_parameter("wait_for_subscribers", false);
    this->declare_parameter("shutdown_on_finish", false);

    run_id_ = this->get_parameter("run_id").as_string();
    enable_csv_log_ = this->get_parameter("enable_csv_log").as_bool();
    log_dir_ = this->get_parameter("log_dir").as_string();
    generations_per_tick_ = static_cast<int>(std::max<int64_t>(1, this->get_parameter("generations_per_tick").as_int()));
    wait_for_subscribers_ = this->get_parameter("wait_for_subscribers").as_bool();
    shutdown_on_finish_ = this->get_parameter("shutdown_on_finish").as_bool();

    if (enable_csv_log_) open_csv_log();

    auto qos = rclcpp::QoS(rclcpp::KeepLast(100)).reliable().transient_local();
    report_pub_ = this->create_publisher<evo_optim::msg::GenerationReport>("generation_reports", qos);

    init_engine();

    const int64_t timer_ms = this->get_parameter("timer_period_ms").as_int();
    timer_ = this->create_wall_timer(std::chrono::milliseconds(timer_ms),
                                     std::bind(&OptimizerNode::state_machine_callback, this));
}

OptimizerNode::~OptimizerNode() {
    if (csv_out_.is_open()) csv_out_.close();
}

void OptimizerNode::open_csv_log() {
    std::filesystem::create_directories(log_dir_);
    const std::string file_path = log_dir_ + "/" + run_id_ + ".csv";
    csv_out_.open(file_path, std::ios::out);
    if (!csv_out_.is_open()) {
        RCLCPP_ERROR(this->get_logger(), "cannot open %s, CSV log disabled", file_path.c_str());
        enable_csv_log_ = false;
        return;
    }
    csv_out_ << "Generation,Evaluations,Population_Size,Worst_Fitness,Best_Fitness,"
                "Median_Fitness,Mean_Fitness,Std_Fitness\n";
}

EvolutionConfig OptimizerNode::read_config() {
    EvolutionConfig config;
    config.pop_size = checked_count(this->get_parameter("pop_size").as_int(), "pop_size");
    config.maximize = this->get_parameter("maximize").as_bool();
    config.strategy = this->get_parameter("strategy").as_string();

    const std::string targeting = normalize(this->get_parameter("binomial_targeting").as_string());
    if (targeting == "rotating") {
        config.binomial_targeting = BinomialTargeting::ROTATING;
    } else if (targeting == "fixeddimension") {
        config.binomial_targeting = BinomialTargeting::FIXED_DIMENSION;
    } else {
        throw ConfigurationError("unknown binomial_targeting '" + targeting + "'");
    }

    const std::string comparison = normalize(this->get_parameter("replacement_comparison").as_string());
    if (comparison == "fitness") {
        config.replacement_comparison = ReplacementComparison::FITNESS;
    } else if (comparison == "magnitude") {
        config.replacement_comparison = ReplacementComparison::MAGNITUDE;
    } else {
        throw ConfigurationError("unknown replacement_comparison '" + comparison + "'");
    }

    config.mutation_scale = this->get_parameter("de_F").as_double();
    config.inertia = this->get_parameter("pso_w").as_double();
    config.cognitive_rate = this->get_parameter("pso_c1").as_double();
    config.social_rate = this->get_parameter("pso_c2").as_double();
    config.mutation_rate = this->get_parameter("mutation_rate").as_double();
    config.tournament_size = checked_count(this->get_parameter("tournament_size").as_int(), "tournament_size");
    config.variators = this->get_parameter("variators").as_string_array();

    // CR is shared by DE and the GA crossover
    const std::string algo_key = normalize(this->get_parameter("algorithm_type").as_string());
    config.crossover_rate = algo_key == "de" ? this->get_parameter("de_CR").as_double()
                                             : this->get_parameter("crossover_rate").as_double();

    config.max_evaluations = static_cast<size_t>(std::max<int64_t>(0, this->get_parameter("max_evaluations").as_int()));
    config.max_generations = static_cast<size_t>(std::max<int64_t>(0, this->get_parameter("max_generations").as_int()));
    config.max_time = this->get_parameter("max_time").as_double();
    const double tol = this->get_parameter("tol").as_double();
    if (tol > 0.0) config.convergence_tolerance = tol;

    config.workers = static_cast<unsigned>(std::max<int64_t>(0, this->get_parameter("workers").as_int()));
    const int64_t seed = this->get_parameter("seed").as_int();
    if (seed >= 0) config.seed = static_cast<std::uint32_t>(seed);

    config.extensions["run_id"] = rclcpp::ParameterValue(run_id_);
    config.extensions["function_name"] = this->get_parameter("function_name").get_parameter_value();
    return config;
}

void OptimizerNode::init_engine() {
    EvolutionConfig config = read_config();
    const size_t gene_dim = checked_count(this->get_parameter("gene_dim").as_int(), "gene_dim");
    const double lb = this->get_parameter("lower_bound").as_double();
    const double ub = this->get_parameter("upper_bound").as_double();
    if (!(lb < ub)) throw ConfigurationError("lower_bound must be below upper_bound");

    const std::string algo_key = normalize(this->get_parameter("algorithm_type").as_string());
    std::unique_ptr<OptimizationAlgorithm> algorithm;
    if (algo_key == "de") {
        algorithm = std::make_unique<DEAlgorithm>(config);
        if (lb != 0.0 || ub != 1.0) {
            RCLCPP_WARN(this->get_logger(), "DE repairs genes into [0, 1]; lower_bound/upper_bound are ignored");
        }
    } else if (algo_key == "pso") {
        algorithm = std::make_unique<PSOAlgorithm>(config);
    } else if (algo_key == "ga") {
        algorithm = std::make_unique<GeneticAlgorithm>(config);
    } else {
        throw ConfigurationError("unknown algorithm_type '" + algo_key + "'");
    }
    const double gene_lb = algo_key == "de" ? 0.0 : lb;
    const double gene_ub = algo_key == "de" ? 1.0 : ub;

    const Benchmark bench = make_benchmark(this->get_parameter("function_name").as_string(),
                                           this->get_parameter("rastrigin_A").as_double(),
                                           static_cast<int>(this->get_parameter("michalewicz_m").as_int()));

    engine_ = std::make_unique<EvolutionEngine>(config, std::move(algorithm));
    engine_->set_generator(uniform_generator(gene_dim, gene_lb, gene_ub));
    engine_->set_bounder(std::make_shared<Bounder>(gene_lb, gene_ub));
    engine_->set_evaluation_function([bench, gene_lb, gene_ub](const EvaluationRequest& request) {
        const auto start = std::chrono::steady_clock::now();
        Candidate x(request.candidate.size());
        const double scale = (bench.upper - bench.lower) / (gene_ub - gene_lb);
        for (size_t i = 0; i < x.size(); ++i) {
            x[i] = bench.lower + (request.candidate[i] - gene_lb) * scale;
        }
        EvaluationResult result;
        result.fitness = bench.function(x);
        result.responses["eval_time_ms"] =
            std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
        return result;
    });

    engine_->add_observer("report_observer", [this](const RunState& state, const EvolutionConfig&) {
        publish_report(state);
    });
    if (enable_csv_log_) {
        engine_->add_observer("file_observer", [this](const RunState& state, const EvolutionConfig&) {
            record_local_log(state);
        });
    }

    RCLCPP_INFO(this->get_logger(), "%s: %s on %s, pop_size=%zu, gene_dim=%zu",
                run_id_.c_str(), engine_->algorithm().name().c_str(), bench.name.c_str(),
                config.pop_size, gene_dim);
}

void OptimizerNode::state_machine_callback() {
    if (!engine_ || state_ == NodeState::FINISHED) return;

    if (state_ == NodeState::INIT_CHECK) {
        if (wait_for_subscribers_ && report_pub_->get_subscription_count() == 0) return;
        state_ = NodeState::COMPUTING;
        return;
    }

    try {
        for (int k = 0; k < generations_per_tick_ && !engine_->done(); ++k) {
            engine_->step();
        }
    } catch (const EvolutionError& e) {
        RCLCPP_ERROR(this->get_logger(), "%s: run failed: %s", run_id_.c_str(), e.what());
        state_ = NodeState::FINISHED;
        timer_->cancel();
        if (csv_out_.is_open()) csv_out_.close();
        throw;
    }

    if (engine_->done()) finish_run();
}

void OptimizerNode::finish_run() {
    state_ = NodeState::FINISHED;
    timer_->cancel();
    if (csv_out_.is_open()) csv_out_.close();

    const RunResult result = engine_->result();
    auto msg = evo_optim::msg::GenerationReport();
    msg.run_id = run_id_;
    msg.generation = result.num_generations;
    msg.evaluations = result.num_evaluations;
    msg.population_size = static_cast<uint32_t>(result.population.size());
    if (!result.population.empty()) {
        const FitnessStatistics stats = fitness_statistics(result.population);
        msg.worst_fitness = stats.worst;
        msg.best_fitness = stats.best;
        msg.median_fitness = stats.median;
        msg.mean_fitness = stats.mean;
        msg.std_fitness = stats.std;
        msg.best = to_msg(*std::min_element(result.population.begin(), result.population.end()));
    }
    msg.termination_cause = result.termination_cause;
    msg.provisional = result.provisional;
    report_pub_->publish(msg);

    RCLCPP_INFO(this->get_logger(), "%s finished (%s) at generation %zu after %zu evaluations, best %.6g",
                run_id_.c_str(), result.termination_cause.c_str(), result.num_generations,
                result.num_evaluations, msg.best_fitness);

    if (shutdown_on_finish_) rclcpp::shutdown();
}

void OptimizerNode::publish_report(const RunState& state) {
    if (state.population.empty()) return;
    const FitnessStatistics stats = fitness_statistics(state.population);

    auto msg = evo_optim::msg::GenerationReport();
    msg.run_id = run_id_;
    msg.generation = state.num_generations;
    msg.evaluations = state.num_evaluations;
    msg.population_size = static_cast<uint32_t>(state.population.size());
    msg.worst_fitness = stats.worst;
    msg.best_fitness = stats.best;
    msg.median_fitness = stats.median;
    msg.mean_fitness = stats.mean;
    msg.std_fitness = stats.std;
    msg.best = to_msg(*std::min_element(state.population.begin(), state.population.end()));
    report_pub_->publish(msg);
}

void OptimizerNode::record_local_log(const RunState& state) {
    if (!csv_out_.is_open() || state.population.empty()) return;
    const FitnessStatistics stats = fitness_statistics(state.population);
    csv_out_ << state.num_generations << "," << state.num_evaluations << "," << state.population.size() << ","
             << stats.worst << "," << stats.best << "," << stats.median << ","
             << stats.mean << "," << stats.std << "\n";
}

}  // namespace evo_optim

int main(int argc, char **argv) {
    rclcpp::init(argc, argv);
    rclcpp::spin(std::make_shared<evo_optim::OptimizerNode>());
    rclcpp::shutdown();
    return 0;
}
