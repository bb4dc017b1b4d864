#ifndef EVO_OPTIM__OPTIMIZER_NODE_HPP_
#define EVO_OPTIM__OPTIMIZER_NODE_HPP_

#include "rclcpp/rclcpp.hpp"
#include <fstream>
#include <memory>
#include <string>

#include "evo_optim/msg/generation_report.hpp"
#include "evo_optim/msg/individual.hpp"
#include "evo_optim/benchmarks.hpp"
#include "evo_optim/evolution_engine.hpp"

namespace evo_optim {

enum class NodeState {
    INIT_CHECK,   // wait for a report subscriber if asked to
    COMPUTING,    // step the engine on every tick
    FINISHED
};

// Drives one optimization run from ROS parameters. Genes live in
// [lower_bound, upper_bound] and are mapped onto the benchmark's own box
// before evaluation.
class OptimizerNode : public rclcpp::Node
{
public:
    explicit OptimizerNode(const rclcpp::NodeOptions& options = rclcpp::NodeOptions());
    ~OptimizerNode() override;

    const EvolutionEngine& engine() const { return *engine_; }
    bool finished() const { return state_ == NodeState::FINISHED; }

private:
    void state_machine_callback();

    EvolutionConfig read_config();
    void init_engine();
    void open_csv_log();
    void publish_report(const RunState& state);
    void record_local_log(const RunState& state);
    void finish_run();

    std::string run_id_;
    bool enable_csv_log_;
    std::string log_dir_;
    int generations_per_tick_;
    bool wait_for_subscribers_;
    bool shutdown_on_finish_;

    NodeState state_;
    std::ofstream csv_out_;

    std::unique_ptr<EvolutionEngine> engine_;

    rclcpp::Publisher<evo_optim::msg::GenerationReport>::SharedPtr report_pub_;
    rclcpp::TimerBase::SharedPtr timer_;
};

// Copies an individual into its wire form.
evo_optim::msg::Individual to_msg(const Individual& individual);

}  // namespace evo_optim

#endif
