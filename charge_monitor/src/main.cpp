#include <charge_monitor/monitor_node.hpp>

#include <memory>

#include <rclcpp/executors/single_threaded_executor.hpp>
#include <rclcpp/rclcpp.hpp>

int main(int argc, char ** argv)
{
  rclcpp::init(argc, argv);

  auto node = std::make_shared<charge_monitor::MonitorNode>(rclcpp::NodeOptions());

  // One executor thread: polling, config draining and lifecycle transitions
  // never overlap.
  rclcpp::executors::SingleThreadedExecutor executor;
  executor.add_node(node->get_node_base_interface());
  executor.spin();

  executor.remove_node(node->get_node_base_interface());
  rclcpp::shutdown();
  return 0;
}
