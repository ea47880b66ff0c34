#include "llm_server_cpp/llm_server_node.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iomanip>
#include <sstream>

using namespace std;


namespace llm_server_cpp
{

LlmServerNode::LlmServerNode(const rclcpp::NodeOptions & options)
: Node("llm_server_node", options)
{
  declare_and_get_parameters();

  supervisor_ = std::make_shared<LlamaServerSupervisor>(server_cfg_);
  client_ = std::make_shared<InferenceClient>(
    make_endpoint(server_cfg_), server_cfg_.request_timeout_sec, server_cfg_.health_timeout_sec);
  coordinator_ = std::make_unique<StreamingCoordinator>(client_);

  pub_token_ = create_publisher<std_msgs::msg::String>(token_topic_, 100);
  pub_response_ = create_publisher<std_msgs::msg::String>(response_topic_, 10);
  pub_debug_ = create_publisher<std_msgs::msg::String>(debug_topic_, 10);
  pub_status_ = create_publisher<std_msgs::msg::String>(status_topic_, 10);

  sub_prompt_ = create_subscription<std_msgs::msg::String>(
    prompt_topic_, 10, bind(&LlmServerNode::on_prompt, this, placeholders::_1));
  sub_select_model_ = create_subscription<std_msgs::msg::String>(
    "~/select_model", 10, bind(&LlmServerNode::on_select_model, this, placeholders::_1));
  sub_import_model_ = create_subscription<std_msgs::msg::String>(
    "~/import_model", 10, bind(&LlmServerNode::on_import_model, this, placeholders::_1));

  // start 는 준비 대기로 수 초간 블로킹되므로 토픽 처리와 다른 그룹에서 실행
  lifecycle_group_ = create_callback_group(rclcpp::CallbackGroupType::MutuallyExclusive);
  srv_start_ = create_service<std_srvs::srv::Trigger>(
    "~/start", bind(&LlmServerNode::on_start, this, placeholders::_1, placeholders::_2),
    rmw_qos_profile_services_default, lifecycle_group_);
  srv_stop_ = create_service<std_srvs::srv::Trigger>(
    "~/stop", bind(&LlmServerNode::on_stop, this, placeholders::_1, placeholders::_2),
    rmw_qos_profile_services_default, lifecycle_group_);
  srv_restart_ = create_service<std_srvs::srv::Trigger>(
    "~/restart", bind(&LlmServerNode::on_restart, this, placeholders::_1, placeholders::_2),
    rmw_qos_profile_services_default, lifecycle_group_);
  srv_list_models_ = create_service<std_srvs::srv::Trigger>(
    "~/list_models", bind(&LlmServerNode::on_list_models, this, placeholders::_1, placeholders::_2));

  drain_timer_ = create_wall_timer(chrono::milliseconds(20), [this]() {drain_tasks();});
  status_timer_ = create_wall_timer(
    chrono::duration_cast<chrono::nanoseconds>(chrono::duration<double>(status_period_sec_)),
    [this]() {publish_status();}, lifecycle_group_);

  parameter_cb_handle_ = add_on_set_parameters_callback(
    bind(&LlmServerNode::on_set_parameters, this, placeholders::_1));

  if (!autostart_) {
    RCLCPP_INFO(get_logger(), "llama-server autostart disabled");
  } else if (server_cfg_.model_path.empty() ||
    !std::filesystem::is_regular_file(server_cfg_.model_path))
  {
    RCLCPP_INFO(
      get_logger(), "Skip llama-server autostart (model %s)",
      server_cfg_.model_path.empty() ? "not configured" : "missing");
  } else {
    log_server_result("start", supervisor_->start());
  }

  publish_status();
  RCLCPP_INFO(get_logger(), "llm_server_cpp node started (endpoint %s)", client_->base_url().c_str());
}

LlmServerNode::~LlmServerNode()
{
  if (coordinator_) {
    coordinator_->shutdown();
  }
  importer_.cancel();
  if (import_thread_.joinable()) {
    import_thread_.join();
  }
}

void LlmServerNode::declare_and_get_parameters()
{
  const ServerConfig defaults;

  declare_parameter<string>("prompt_topic", "~/prompt");
  declare_parameter<string>("token_topic", "~/token");
  declare_parameter<string>("response_topic", "~/response");
  declare_parameter<string>("debug_topic", "~/debug");
  declare_parameter<string>("status_topic", "~/status");
  declare_parameter<bool>("autostart", true);
  declare_parameter<bool>("stream", true);
  declare_parameter<double>("status_period_sec", 5.0);

  declare_parameter<string>("server_binary", defaults.server_binary);
  declare_parameter<string>("model_path", defaults.model_path);
  declare_parameter<string>("model_dir", defaults.model_dir);
  declare_parameter<string>("install_dir", defaults.install_dir);
  declare_parameter<string>("host", defaults.host);
  declare_parameter<int>("port", defaults.port);
  declare_parameter<int>("ctx_size", defaults.ctx_size);
  declare_parameter<int>("gpu_layers", defaults.gpu_layers);
  declare_parameter<double>("temperature", defaults.temperature);
  declare_parameter<int>("max_tokens", defaults.max_tokens);
  declare_parameter<double>("top_p", defaults.top_p);
  declare_parameter<int>("top_k", defaults.top_k);
  declare_parameter<double>("repeat_penalty", defaults.repeat_penalty);
  declare_parameter<int>("ready_poll_interval_ms", defaults.ready_poll_interval_ms);
  declare_parameter<int>("ready_poll_attempts", defaults.ready_poll_attempts);
  declare_parameter<int>("stop_timeout_ms", defaults.stop_timeout_ms);
  declare_parameter<int>("request_timeout_sec", static_cast<int>(defaults.request_timeout_sec));
  declare_parameter<int>("health_timeout_sec", static_cast<int>(defaults.health_timeout_sec));
  declare_parameter<string>("log_dir", defaults.log_dir);
  declare_parameter<bool>("stop_on_shutdown", defaults.stop_on_shutdown);

  prompt_topic_ = get_parameter("prompt_topic").as_string();
  token_topic_ = get_parameter("token_topic").as_string();
  response_topic_ = get_parameter("response_topic").as_string();
  debug_topic_ = get_parameter("debug_topic").as_string();
  status_topic_ = get_parameter("status_topic").as_string();
  autostart_ = get_parameter("autostart").as_bool();
  stream_ = get_parameter("stream").as_bool();
  status_period_sec_ = std::max(0.5, get_parameter("status_period_sec").as_double());

  ServerConfig cfg;
  cfg.server_binary = get_parameter("server_binary").as_string();
  cfg.model_path = get_parameter("model_path").as_string();
  cfg.model_dir = get_parameter("model_dir").as_string();
  cfg.install_dir = get_parameter("install_dir").as_string();
  cfg.host = get_parameter("host").as_string();
  cfg.port = static_cast<int>(get_parameter("port").as_int());
  cfg.ctx_size = static_cast<int>(get_parameter("ctx_size").as_int());
  cfg.gpu_layers = static_cast<int>(get_parameter("gpu_layers").as_int());
  cfg.temperature = get_parameter("temperature").as_double();
  cfg.max_tokens = static_cast<int>(get_parameter("max_tokens").as_int());
  cfg.top_p = get_parameter("top_p").as_double();
  cfg.top_k = static_cast<int>(get_parameter("top_k").as_int());
  cfg.repeat_penalty = get_parameter("repeat_penalty").as_double();
  cfg.ready_poll_interval_ms = static_cast<int>(get_parameter("ready_poll_interval_ms").as_int());
  cfg.ready_poll_attempts = static_cast<int>(get_parameter("ready_poll_attempts").as_int());
  cfg.stop_timeout_ms = static_cast<int>(get_parameter("stop_timeout_ms").as_int());
  cfg.request_timeout_sec = get_parameter("request_timeout_sec").as_int();
  cfg.health_timeout_sec = get_parameter("health_timeout_sec").as_int();
  cfg.log_dir = get_parameter("log_dir").as_string();
  cfg.stop_on_shutdown = get_parameter("stop_on_shutdown").as_bool();

  lock_guard<mutex> lock(cfg_mutex_);
  server_cfg_ = cfg;
}

/// 생성 기본값은 즉시 반영, 서버 파라미터는 다음 start 부터 반영.
/// host/port/request_timeout_sec 은 클라이언트에 고정되므로 노드 재시작 필요
rcl_interfaces::msg::SetParametersResult LlmServerNode::on_set_parameters(
  const vector<rclcpp::Parameter> & params)
{
  auto result = rcl_interfaces::msg::SetParametersResult();
  result.successful = true;
  result.reason = "ok";

  lock_guard<mutex> lock(cfg_mutex_);
  ServerConfig cfg = server_cfg_;
  bool server_changed = false;

  for (const auto & p : params) {
    const string & name = p.get_name();
    if (name == "host" || name == "port" || name == "request_timeout_sec") {
      result.successful = false;
      result.reason = name + " cannot change at runtime; restart the node";
      return result;
    } else if (name == "temperature" && p.get_type() == rclcpp::ParameterType::PARAMETER_DOUBLE) {
      cfg.temperature = p.as_double();
    } else if (name == "max_tokens" && p.get_type() == rclcpp::ParameterType::PARAMETER_INTEGER) {
      cfg.max_tokens = static_cast<int>(p.as_int());
    } else if (name == "top_p" && p.get_type() == rclcpp::ParameterType::PARAMETER_DOUBLE) {
      cfg.top_p = p.as_double();
    } else if (name == "top_k" && p.get_type() == rclcpp::ParameterType::PARAMETER_INTEGER) {
      cfg.top_k = static_cast<int>(p.as_int());
    } else if (name == "repeat_penalty" && p.get_type() == rclcpp::ParameterType::PARAMETER_DOUBLE) {
      cfg.repeat_penalty = p.as_double();
    } else if (name == "stream" && p.get_type() == rclcpp::ParameterType::PARAMETER_BOOL) {
      stream_ = p.as_bool();
    } else if (name == "server_binary" && p.get_type() == rclcpp::ParameterType::PARAMETER_STRING) {
      cfg.server_binary = p.as_string();
      server_changed = true;
    } else if (name == "model_path" && p.get_type() == rclcpp::ParameterType::PARAMETER_STRING) {
      cfg.model_path = p.as_string();
      server_changed = true;
    } else if (name == "model_dir" && p.get_type() == rclcpp::ParameterType::PARAMETER_STRING) {
      cfg.model_dir = p.as_string();
      server_changed = true;
    } else if (name == "ctx_size" && p.get_type() == rclcpp::ParameterType::PARAMETER_INTEGER) {
      cfg.ctx_size = static_cast<int>(p.as_int());
      server_changed = true;
    } else if (name == "gpu_layers" && p.get_type() == rclcpp::ParameterType::PARAMETER_INTEGER) {
      cfg.gpu_layers = static_cast<int>(p.as_int());
      server_changed = true;
    } else if (name == "install_dir" && p.get_type() == rclcpp::ParameterType::PARAMETER_STRING) {
      cfg.install_dir = p.as_string();
      server_changed = true;
    } else if (name == "log_dir" && p.get_type() == rclcpp::ParameterType::PARAMETER_STRING) {
      cfg.log_dir = p.as_string();
      server_changed = true;
    } else if (name == "ready_poll_interval_ms" &&
      p.get_type() == rclcpp::ParameterType::PARAMETER_INTEGER)
    {
      cfg.ready_poll_interval_ms = static_cast<int>(p.as_int());
    } else if (name == "ready_poll_attempts" &&
      p.get_type() == rclcpp::ParameterType::PARAMETER_INTEGER)
    {
      cfg.ready_poll_attempts = static_cast<int>(p.as_int());
    } else if (name == "stop_timeout_ms" && p.get_type() == rclcpp::ParameterType::PARAMETER_INTEGER) {
      cfg.stop_timeout_ms = static_cast<int>(p.as_int());
    } else if (name == "health_timeout_sec" &&
      p.get_type() == rclcpp::ParameterType::PARAMETER_INTEGER)
    {
      cfg.health_timeout_sec = p.as_int();
    } else if (name == "stop_on_shutdown" && p.get_type() == rclcpp::ParameterType::PARAMETER_BOOL) {
      cfg.stop_on_shutdown = p.as_bool();
    }
  }

  server_cfg_ = cfg;
  supervisor_->update_config(cfg);
  if (server_changed && supervisor_->has_process_handle()) {
    RCLCPP_INFO(get_logger(), "server parameters updated; restart llama-server to apply");
  }
  return result;
}

void LlmServerNode::on_prompt(const std_msgs::msg::String::SharedPtr msg)
{
  /// 프롬프트 1건을 코디네이터에 제출. 토큰/최종 응답은 drain 타이머가 발행
  const string prompt = msg->data;
  if (prompt.empty()) {
    return;
  }

  GenerationRequest request;
  {
    lock_guard<mutex> lock(cfg_mutex_);
    request = make_request(server_cfg_, prompt, stream_);
  }

  auto task = coordinator_->submit(request);
  {
    lock_guard<mutex> lock(tasks_mutex_);
    tasks_.push_back(task);
  }
  RCLCPP_INFO(
    get_logger(), "generation #%llu submitted (%s, n_predict=%d)",
    static_cast<unsigned long long>(task->id()), request.stream ? "stream" : "blocking",
    request.max_tokens);
}

void LlmServerNode::on_select_model(const std_msgs::msg::String::SharedPtr msg)
{
  const string path = msg->data;
  if (path.empty() || !std::filesystem::is_regular_file(path)) {
    publish_debug("select_model_failed: not a file: " + path);
    return;
  }
  const auto res = set_parameter(rclcpp::Parameter("model_path", path));
  if (!res.successful) {
    publish_debug("select_model_failed: " + res.reason);
    return;
  }
  RCLCPP_INFO(get_logger(), "model selected: %s", path.c_str());
}

void LlmServerNode::on_import_model(const std_msgs::msg::String::SharedPtr msg)
{
  const string source = msg->data;
  if (source.empty()) {
    return;
  }
  // 스레드 생성 전에 점유해야 연속 요청이 join 에서 막히지 않는다
  if (!importer_.try_begin()) {
    publish_debug("import_failed: another import is in progress");
    return;
  }
  if (import_thread_.joinable()) {
    import_thread_.join();
  }

  string dest_dir = supervisor_->config().model_dir;
  if (dest_dir.empty()) {
    dest_dir = ServerLocator().default_model_dir();
  }

  import_thread_ = thread([this, source, dest_dir]() {
      const ImportResult res = importer_.run(source, dest_dir, [this](int percent) {
        if (percent % 10 == 0) {
          publish_debug("import_progress: " + to_string(percent) + "%");
        }
      });
      if (!res.ok) {
        RCLCPP_WARN(get_logger(), "model import failed: %s", res.error.c_str());
        publish_debug("import_failed: " + res.error);
        return;
      }
      RCLCPP_INFO(get_logger(), "model imported: %s", res.path.c_str());
      publish_debug("import_done: " + res.path);

      // 가져온 모델을 바로 선택
      const auto selected = set_parameter(rclcpp::Parameter("model_path", res.path));
      if (!selected.successful) {
        publish_debug("select_model_failed: " + selected.reason);
      }
    });
}

void LlmServerNode::on_start(
  const shared_ptr<std_srvs::srv::Trigger::Request> /*request*/,
  shared_ptr<std_srvs::srv::Trigger::Response> response)
{
  const ServerResult res = supervisor_->start();
  log_server_result("start", res);
  response->success = res.ok;
  response->message = res.message;
  publish_status();
}

void LlmServerNode::on_stop(
  const shared_ptr<std_srvs::srv::Trigger::Request> /*request*/,
  shared_ptr<std_srvs::srv::Trigger::Response> response)
{
  const ServerResult res = supervisor_->stop();
  log_server_result("stop", res);
  response->success = res.ok;
  response->message = res.message;
  publish_status();
}

void LlmServerNode::on_restart(
  const shared_ptr<std_srvs::srv::Trigger::Request> /*request*/,
  shared_ptr<std_srvs::srv::Trigger::Response> response)
{
  const ServerResult res = supervisor_->restart();
  log_server_result("restart", res);
  response->success = res.ok;
  response->message = res.message;
  publish_status();
}

void LlmServerNode::on_list_models(
  const shared_ptr<std_srvs::srv::Trigger::Request> /*request*/,
  shared_ptr<std_srvs::srv::Trigger::Response> response)
{
  const vector<ModelDescriptor> models = supervisor_->find_models();
  response->success = true;
  if (models.empty()) {
    response->message = "No models found";
    return;
  }
  ostringstream oss;
  oss << fixed << setprecision(2);
  for (const auto & m : models) {
    oss << m.name << " (" << m.size_gb() << " GB): " << m.path << "\n";
  }
  response->message = oss.str();
}

void LlmServerNode::drain_tasks()
{
  lock_guard<mutex> lock(tasks_mutex_);
  for (auto it = tasks_.begin(); it != tasks_.end(); ) {
    const auto & task = *it;
    // done 을 먼저 읽어야 결과 발행 전에 남은 청크를 모두 비울 수 있다
    const bool finished = task->done();

    string chunk;
    while (task->try_next_chunk(chunk)) {
      std_msgs::msg::String token;
      token.data = chunk;
      pub_token_->publish(token);
    }

    if (!finished) {
      ++it;
      continue;
    }

    const GenerationResult res = task->result().get();
    if (res.ok) {
      std_msgs::msg::String out;
      out.data = res.text;
      pub_response_->publish(out);
      RCLCPP_INFO(
        get_logger(), "generation #%llu done (%zu chunks, %zu chars)",
        static_cast<unsigned long long>(task->id()), res.chunk_count, res.text.size());
    } else {
      publish_debug("llm_failed[" + error_code_string(res.code) + "]: " + res.error);
      RCLCPP_WARN(
        get_logger(), "generation #%llu failed: %s",
        static_cast<unsigned long long>(task->id()), res.error.c_str());
    }
    it = tasks_.erase(it);
  }
}

void LlmServerNode::publish_status()
{
  supervisor_->reconcile();

  ostringstream oss;
  oss << "state=" << supervisor_->state_string()
      << " running=" << (supervisor_->is_running() ? "true" : "false")
      << " pid=" << supervisor_->pid()
      << " endpoint=" << supervisor_->endpoint();
  std_msgs::msg::String msg;
  msg.data = oss.str();
  pub_status_->publish(msg);
}

void LlmServerNode::publish_debug(const string & text)
{
  std_msgs::msg::String dbg;
  dbg.data = text;
  pub_debug_->publish(dbg);
}

void LlmServerNode::log_server_result(const char * action, const ServerResult & res)
{
  if (!res.ok) {
    RCLCPP_ERROR(
      get_logger(), "llama-server %s failed [%s]: %s",
      action, error_code_string(res.code).c_str(), res.message.c_str());
    publish_debug(string("server_") + action + "_failed: " + res.message);
    return;
  }
  if (res.still_starting) {
    RCLCPP_WARN(get_logger(), "llama-server %s: %s", action, res.message.c_str());
    return;
  }
  RCLCPP_INFO(get_logger(), "llama-server %s: %s", action, res.message.c_str());
}

}  // namespace llm_server_cpp
