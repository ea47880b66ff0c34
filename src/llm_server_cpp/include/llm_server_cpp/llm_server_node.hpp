#pragma once

#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "rclcpp/rclcpp.hpp"
#include "std_msgs/msg/string.hpp"
#include "std_srvs/srv/trigger.hpp"

#include "llm_server_cpp/inference_client.hpp"
#include "llm_server_cpp/llama_server_supervisor.hpp"
#include "llm_server_cpp/model_importer.hpp"
#include "llm_server_cpp/streaming_coordinator.hpp"

namespace llm_server_cpp
{

class LlmServerNode : public rclcpp::Node
{
public:
  explicit LlmServerNode(const rclcpp::NodeOptions & options = rclcpp::NodeOptions());
  ~LlmServerNode() override;

  /// 감독자가 다음 start 에 사용할 설정
  ServerConfig server_config() const { return supervisor_->config(); }

private:
  void declare_and_get_parameters();
  rcl_interfaces::msg::SetParametersResult on_set_parameters(
    const std::vector<rclcpp::Parameter> & params);

  void on_prompt(const std_msgs::msg::String::SharedPtr msg);
  void on_select_model(const std_msgs::msg::String::SharedPtr msg);
  void on_import_model(const std_msgs::msg::String::SharedPtr msg);

  void on_start(
    const std::shared_ptr<std_srvs::srv::Trigger::Request> request,
    std::shared_ptr<std_srvs::srv::Trigger::Response> response);
  void on_stop(
    const std::shared_ptr<std_srvs::srv::Trigger::Request> request,
    std::shared_ptr<std_srvs::srv::Trigger::Response> response);
  void on_restart(
    const std::shared_ptr<std_srvs::srv::Trigger::Request> request,
    std::shared_ptr<std_srvs::srv::Trigger::Response> response);
  void on_list_models(
    const std::shared_ptr<std_srvs::srv::Trigger::Request> request,
    std::shared_ptr<std_srvs::srv::Trigger::Response> response);

  void drain_tasks();
  void publish_status();
  void publish_debug(const std::string & text);
  void log_server_result(const char * action, const ServerResult & res);

  std::string prompt_topic_ = "~/prompt";
  std::string token_topic_ = "~/token";
  std::string response_topic_ = "~/response";
  std::string debug_topic_ = "~/debug";
  std::string status_topic_ = "~/status";
  bool autostart_ = true;
  bool stream_ = true;
  double status_period_sec_ = 5.0;

  ServerConfig server_cfg_;
  std::mutex cfg_mutex_;

  std::shared_ptr<LlamaServerSupervisor> supervisor_;
  std::shared_ptr<InferenceClient> client_;
  std::unique_ptr<StreamingCoordinator> coordinator_;
  ModelImporter importer_;
  std::thread import_thread_;

  std::mutex tasks_mutex_;
  std::list<std::shared_ptr<GenerationTask>> tasks_;

  rclcpp::CallbackGroup::SharedPtr lifecycle_group_;

  rclcpp::Subscription<std_msgs::msg::String>::SharedPtr sub_prompt_;
  rclcpp::Subscription<std_msgs::msg::String>::SharedPtr sub_select_model_;
  rclcpp::Subscription<std_msgs::msg::String>::SharedPtr sub_import_model_;
  rclcpp::Publisher<std_msgs::msg::String>::SharedPtr pub_token_;
  rclcpp::Publisher<std_msgs::msg::String>::SharedPtr pub_response_;
  rclcpp::Publisher<std_msgs::msg::String>::SharedPtr pub_debug_;
  rclcpp::Publisher<std_msgs::msg::String>::SharedPtr pub_status_;
  rclcpp::Service<std_srvs::srv::Trigger>::SharedPtr srv_start_;
  rclcpp::Service<std_srvs::srv::Trigger>::SharedPtr srv_stop_;
  rclcpp::Service<std_srvs::srv::Trigger>::SharedPtr srv_restart_;
  rclcpp::Service<std_srvs::srv::Trigger>::SharedPtr srv_list_models_;
  rclcpp::TimerBase::SharedPtr drain_timer_;
  rclcpp::TimerBase::SharedPtr status_timer_;
  rclcpp::node_interfaces::OnSetParametersCallbackHandle::SharedPtr parameter_cb_handle_;
};

}  // namespace llm_server_cpp
