#include "llm_server_cpp/llama_server_supervisor.hpp"

#include "llm_server_cpp/health_prober.hpp"

#include <llm_common/string_utils.hpp>

#include <rclcpp/rclcpp.hpp>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <thread>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace std;

namespace fs = std::filesystem;


namespace llm_server_cpp
{
namespace
{

constexpr size_t kOutputExcerptChars = 200;
constexpr int kStopPollMs = 100;

rclcpp::Logger logger()
{
  return rclcpp::get_logger("llama_server_supervisor");
}

/// 좀비(Z/X)까지 종료로 간주하는 프로세스 존재 확인
bool pid_exists(pid_t pid)
{
  if (pid <= 0) {
    return false;
  }
  if (kill(pid, 0) != 0 && errno != EPERM) {
    return false;
  }
  ifstream stat("/proc/" + to_string(pid) + "/stat");
  if (!stat.is_open()) {
    return true;
  }
  string line;
  getline(stat, line);
  // "pid (comm) S ..." : comm 에 공백/괄호가 있을 수 있어 마지막 ')' 기준
  const size_t paren = line.rfind(')');
  if (paren == string::npos || paren + 2 >= line.size()) {
    return true;
  }
  const char st = line[paren + 2];
  return st != 'Z' && st != 'X';
}

/// 자식 프로세스 생존 여부를 회수(reap) 없이 확인
bool child_alive(pid_t pid)
{
  if (pid <= 0) {
    return false;
  }
  siginfo_t info;
  memset(&info, 0, sizeof(info));
  if (waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
    return errno == ECHILD ? pid_exists(pid) : false;
  }
  return info.si_pid == 0;
}

/// WNOHANG 으로 자식을 회수. 종료했으면 true
bool reap_child(pid_t pid, int & status)
{
  status = 0;
  const pid_t waited = waitpid(pid, &status, WNOHANG);
  if (waited == pid) {
    return true;
  }
  return waited < 0 && errno == ECHILD;
}

string describe_exit(int status)
{
  ostringstream oss;
  if (WIFEXITED(status)) {
    oss << "exit code " << WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    oss << "signal " << WTERMSIG(status);
  } else {
    oss << "status " << status;
  }
  return oss.str();
}

/// 서버 로그 앞부분 최대 max_chars 글자
string read_output_excerpt(const string & path, size_t max_chars)
{
  ifstream in(path, ios::binary);
  if (!in.is_open()) {
    return "";
  }
  string buf(max_chars, '\0');
  in.read(&buf[0], static_cast<streamsize>(max_chars));
  buf.resize(static_cast<size_t>(in.gcount()));
  return llm_common::trim(buf);
}

bool wait_until_gone(pid_t pid, int timeout_ms)
{
  const auto deadline = chrono::steady_clock::now() + chrono::milliseconds(timeout_ms);
  while (chrono::steady_clock::now() < deadline) {
    if (!pid_exists(pid)) {
      return true;
    }
    this_thread::sleep_for(chrono::milliseconds(kStopPollMs));
  }
  return !pid_exists(pid);
}

}  // namespace

string server_state_string(ServerState state)
{
  switch (state) {
    case ServerState::STOPPED:
      return "stopped";
    case ServerState::STARTING:
      return "starting";
    case ServerState::RUNNING:
      return "running";
    case ServerState::STOPPING:
      return "stopping";
    default:
      return "unknown";
  }
}

LlamaServerSupervisor::LlamaServerSupervisor(const ServerConfig & cfg)
: config_(cfg), locator_cfg_(make_locator_config(cfg)), locator_from_config_(true)
{
}

LlamaServerSupervisor::LlamaServerSupervisor(const ServerConfig & cfg, const LocatorConfig & locator_cfg)
: config_(cfg), locator_cfg_(locator_cfg), locator_from_config_(false)
{
}

LlamaServerSupervisor::~LlamaServerSupervisor()
{
  bool stop_on_shutdown = false;
  pid_t held = -1;
  {
    lock_guard<mutex> lock(state_mutex_);
    stop_on_shutdown = config_.stop_on_shutdown;
    held = handle_ ? handle_->pid : -1;
  }
  if (stop_on_shutdown) {
    const ServerResult res = stop();
    if (!res.ok) {
      RCLCPP_WARN(logger(), "stop on shutdown failed: %s", res.message.c_str());
    }
    return;
  }
  if (held > 0 && child_alive(held)) {
    RCLCPP_INFO(
      logger(), "leaving llama-server (pid %d) running; detached session owned by the OS",
      static_cast<int>(held));
  }
}

ServerLocator LlamaServerSupervisor::make_locator(const ServerConfig & cfg) const
{
  return ServerLocator(locator_from_config_ ? make_locator_config(cfg) : locator_cfg_);
}

vector<string> LlamaServerSupervisor::build_arguments(
  const string & binary, const string & model, const ServerConfig & cfg)
{
  vector<string> args{
    binary,
    "--model", model,
    "--port", to_string(cfg.port),
    "--ctx-size", to_string(cfg.ctx_size)};
  if (cfg.gpu_layers > 0) {
    args.push_back("--n-gpu-layers");
    args.push_back(to_string(cfg.gpu_layers));
  }
  return args;
}

string LlamaServerSupervisor::server_log_path(const ServerConfig & cfg) const
{
  const string dir = cfg.log_dir.empty() ? string("/tmp") : llm_common::expand_user(cfg.log_dir);
  return (fs::path(dir) / ("llama_server_" + to_string(cfg.port) + ".log")).string();
}

bool LlamaServerSupervisor::probe_health(const ServerConfig & cfg) const
{
  return HealthProber(make_endpoint(cfg), cfg.health_timeout_sec).probe();
}

void LlamaServerSupervisor::set_state(ServerState next)
{
  lock_guard<mutex> lock(state_mutex_);
  state_ = next;
}

void LlamaServerSupervisor::clear_handle(ServerState next)
{
  lock_guard<mutex> lock(state_mutex_);
  handle_.reset();
  state_ = next;
}

void LlamaServerSupervisor::drop_dead_handle()
{
  const pid_t held = pid();
  int status = 0;
  if (held > 0 && reap_child(held, status)) {
    clear_handle(ServerState::STOPPED);
    RCLCPP_WARN(
      logger(), "llama-server (pid %d) exited (%s)",
      static_cast<int>(held), describe_exit(status).c_str());
  }
}

bool LlamaServerSupervisor::is_running() const
{
  pid_t held = -1;
  ServerConfig cfg;
  {
    lock_guard<mutex> lock(state_mutex_);
    held = handle_ ? handle_->pid : -1;
    cfg = config_;
  }
  if (held > 0 && child_alive(held)) {
    return true;
  }
  // 이전 세션에서 띄운 서버가 남아있는 경우
  return probe_health(cfg);
}

ServerResult LlamaServerSupervisor::start(const string & model_override)
{
  lock_guard<mutex> lifecycle(lifecycle_mutex_);

  drop_dead_handle();
  if (is_running()) {
    return make_server_ok("Server already running");
  }

  const ServerConfig cfg = config();
  const ServerLocator locator = make_locator(cfg);

  const optional<string> binary = locator.find_binary(cfg.server_binary);
  if (!binary) {
    RCLCPP_ERROR(logger(), "llama-server binary not found");
    return make_server_error(
      ServerErrorCode::BINARY_NOT_FOUND,
      "llama-server binary not found.\n\n"
      "To fix:\n"
      "1. Install or build llama.cpp so that llama-server is on PATH, or\n"
      "2. Set the 'server_binary' parameter to the llama-server executable");
  }

  const string model = model_override.empty() ? cfg.model_path : model_override;
  if (model.empty()) {
    return make_server_error(
      ServerErrorCode::MODEL_MISSING,
      "No model configured.\n\n"
      "To fix:\n"
      "1. Place .gguf model files in " + locator.default_model_dir() + "\n"
      "2. Select a model (~/select_model topic), or\n"
      "3. Set the 'model_path' parameter");
  }

  const string model_file = llm_common::expand_user(model);
  std::error_code ec;
  if (!fs::exists(model_file, ec)) {
    return make_server_error(
      ServerErrorCode::MODEL_NOT_FOUND,
      "Model file not found:\n" + model_file + "\n\n"
      "Select one of the available models (~/list_models service).");
  }

  const vector<string> args = build_arguments(*binary, model_file, cfg);
  vector<char *> argv;
  argv.reserve(args.size() + 1);
  for (const auto & arg : args) {
    argv.push_back(const_cast<char *>(arg.c_str()));
  }
  argv.push_back(nullptr);

  const string log_file = server_log_path(cfg);
  int log_fd = open(log_file.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (log_fd < 0) {
    RCLCPP_WARN(
      logger(), "cannot open server log %s (%s), discarding server output",
      log_file.c_str(), strerror(errno));
    log_fd = open("/dev/null", O_WRONLY | O_CLOEXEC);
  }
  const int null_fd = open("/dev/null", O_RDONLY | O_CLOEXEC);
  const string exec_error = "failed to exec " + *binary + "\n";

  RCLCPP_INFO(logger(), "starting llama-server: %s", llm_common::join_command(args).c_str());
  set_state(ServerState::STARTING);

  const pid_t child = fork();
  if (child < 0) {
    const string reason = strerror(errno);
    if (log_fd >= 0) {
      close(log_fd);
    }
    if (null_fd >= 0) {
      close(null_fd);
    }
    set_state(ServerState::STOPPED);
    return make_server_error(
      ServerErrorCode::PROCESS_START_FAILURE, "Failed to start server: fork failed: " + reason);
  }

  if (child == 0) {
    // 자식: async-signal-safe 호출만 사용
    setsid();
    sigset_t empty;
    sigemptyset(&empty);
    sigprocmask(SIG_SETMASK, &empty, nullptr);
    if (null_fd >= 0) {
      dup2(null_fd, STDIN_FILENO);
    }
    if (log_fd >= 0) {
      dup2(log_fd, STDOUT_FILENO);
      dup2(log_fd, STDERR_FILENO);
    }
    execv(argv[0], argv.data());
    const ssize_t ignored = write(STDERR_FILENO, exec_error.data(), exec_error.size());
    (void)ignored;
    _exit(127);
  }

  if (log_fd >= 0) {
    close(log_fd);
  }
  if (null_fd >= 0) {
    close(null_fd);
  }

  {
    lock_guard<mutex> lock(state_mutex_);
    handle_ = std::make_unique<ProcessHandle>();
    handle_->pid = child;
    handle_->binary_path = *binary;
    handle_->model_path = model_file;
    handle_->log_path = log_file;
  }

  const HealthProber prober(make_endpoint(cfg), cfg.health_timeout_sec);
  const int attempts = max(1, cfg.ready_poll_attempts);
  const int interval_ms = max(1, cfg.ready_poll_interval_ms);

  for (int i = 0; i < attempts; ++i) {
    this_thread::sleep_for(chrono::milliseconds(interval_ms));

    int status = 0;
    if (reap_child(child, status)) {
      const string excerpt = read_output_excerpt(log_file, kOutputExcerptChars);
      clear_handle(ServerState::STOPPED);
      RCLCPP_ERROR(
        logger(), "llama-server (pid %d) exited during startup (%s)",
        static_cast<int>(child), describe_exit(status).c_str());
      return make_server_error(
        ServerErrorCode::PROCESS_START_FAILURE,
        "Server failed to start: " + (excerpt.empty() ? string("Unknown error") : excerpt));
    }

    if (prober.probe()) {
      set_state(ServerState::RUNNING);
      RCLCPP_INFO(
        logger(), "llama-server ready at %s (pid %d)",
        prober.endpoint().c_str(), static_cast<int>(child));
      return make_server_ok("Server started successfully");
    }
  }

  // 큰 모델은 로딩이 대기 시간을 넘길 수 있어 실패로 보지 않는다
  RCLCPP_WARN(
    logger(), "llama-server (pid %d) not ready after %d ms, still starting",
    static_cast<int>(child), attempts * interval_ms);
  ServerResult out = make_server_ok("Server starting (may take a moment to be ready)");
  out.still_starting = true;
  return out;
}

ServerResult LlamaServerSupervisor::stop()
{
  lock_guard<mutex> lifecycle(lifecycle_mutex_);

  drop_dead_handle();
  if (!is_running()) {
    set_state(ServerState::STOPPED);
    return make_server_ok("Server not running");
  }

  const ServerConfig cfg = config();
  if (has_process_handle()) {
    return stop_tracked(cfg);
  }
  return stop_orphan(cfg);
}

ServerResult LlamaServerSupervisor::stop_tracked(const ServerConfig & cfg)
{
  const pid_t target = pid();
  set_state(ServerState::STOPPING);

  if (kill(target, SIGTERM) != 0 && errno != ESRCH) {
    RCLCPP_WARN(logger(), "failed to send SIGTERM to pid %d: %s", static_cast<int>(target), strerror(errno));
  }

  bool exited = false;
  int status = 0;
  const auto deadline = chrono::steady_clock::now() + chrono::milliseconds(max(0, cfg.stop_timeout_ms));
  while (true) {
    if (reap_child(target, status)) {
      exited = true;
      break;
    }
    if (chrono::steady_clock::now() >= deadline) {
      break;
    }
    this_thread::sleep_for(chrono::milliseconds(kStopPollMs));
  }

  if (!exited) {
    RCLCPP_WARN(
      logger(), "llama-server (pid %d) ignored SIGTERM for %d ms, sending SIGKILL",
      static_cast<int>(target), cfg.stop_timeout_ms);
    if (kill(target, SIGKILL) != 0 && errno != ESRCH) {
      const string reason = strerror(errno);
      set_state(ServerState::RUNNING);
      return make_server_error(
        ServerErrorCode::STOP_FAILURE,
        "Could not stop server (pid " + to_string(target) + "): " + reason);
    }
    if (waitpid(target, &status, 0) < 0 && errno != ECHILD) {
      RCLCPP_WARN(logger(), "waitpid after SIGKILL failed: %s", strerror(errno));
    }
  }

  clear_handle(ServerState::STOPPED);
  RCLCPP_INFO(logger(), "llama-server (pid %d) stopped", static_cast<int>(target));
  return make_server_ok("Server stopped");
}

ServerResult LlamaServerSupervisor::stop_orphan(const ServerConfig & cfg)
{
  const vector<pid_t> candidates = scan_processes(cfg, -1);
  if (candidates.empty()) {
    return make_server_error(
      ServerErrorCode::STOP_FAILURE,
      "Could not stop server: it answers at " + make_endpoint(cfg) +
      " but no matching '" + binary_match_name(cfg) + "' process was found");
  }

  const pid_t target = candidates.front();
  RCLCPP_WARN(
    logger(), "stopping untracked llama-server by command-line match (pid %d, best-effort)",
    static_cast<int>(target));
  set_state(ServerState::STOPPING);

  if (kill(target, SIGTERM) != 0) {
    if (errno != ESRCH) {
      const string reason = strerror(errno);
      set_state(ServerState::RUNNING);
      return make_server_error(
        ServerErrorCode::STOP_FAILURE,
        "Could not stop server (pid " + to_string(target) + "): " + reason);
    }
  }

  if (!wait_until_gone(target, max(0, cfg.stop_timeout_ms))) {
    RCLCPP_WARN(logger(), "untracked pid %d ignored SIGTERM, sending SIGKILL", static_cast<int>(target));
    if ((kill(target, SIGKILL) != 0 && errno != ESRCH) || !wait_until_gone(target, 1000)) {
      set_state(ServerState::RUNNING);
      return make_server_error(
        ServerErrorCode::STOP_FAILURE,
        "Could not stop server (pid " + to_string(target) + ")");
    }
  }

  set_state(ServerState::STOPPED);
  return make_server_ok("Server stopped");
}

ServerResult LlamaServerSupervisor::restart(const string & model_override)
{
  const ServerResult stopped = stop();
  if (!stopped.ok) {
    return stopped;
  }
  this_thread::sleep_for(chrono::milliseconds(300));
  return start(model_override);
}

void LlamaServerSupervisor::reconcile()
{
  unique_lock<mutex> lifecycle(lifecycle_mutex_, try_to_lock);
  if (!lifecycle.owns_lock()) {
    // start/stop 진행 중
    return;
  }

  const ServerConfig cfg = config();
  const pid_t held = pid();
  const ServerState current = state();

  if (held > 0) {
    drop_dead_handle();
    if (!has_process_handle()) {
      return;
    }
    if (current == ServerState::STARTING && probe_health(cfg)) {
      set_state(ServerState::RUNNING);
      RCLCPP_INFO(logger(), "llama-server (pid %d) is now ready", static_cast<int>(held));
    }
    return;
  }

  const bool healthy = probe_health(cfg);
  if (healthy && current != ServerState::RUNNING) {
    RCLCPP_INFO(
      logger(), "untracked llama-server answers at %s", make_endpoint(cfg).c_str());
    set_state(ServerState::RUNNING);
  } else if (!healthy && current != ServerState::STOPPED) {
    set_state(ServerState::STOPPED);
  }
}

string LlamaServerSupervisor::binary_match_name(const ServerConfig & cfg) const
{
  const optional<string> binary = make_locator(cfg).find_binary(cfg.server_binary);
  if (binary) {
    return fs::path(*binary).filename().string();
  }
  if (!cfg.server_binary.empty()) {
    return fs::path(cfg.server_binary).filename().string();
  }
  return make_locator(cfg).binary_name();
}

vector<pid_t> LlamaServerSupervisor::scan_processes(const ServerConfig & cfg, pid_t exclude) const
{
  vector<pid_t> preferred;
  vector<pid_t> others;
  const string needle = binary_match_name(cfg);
  if (needle.empty()) {
    return preferred;
  }
  const pid_t self = getpid();

  std::error_code ec;
  for (fs::directory_iterator it("/proc", ec), end; !ec && it != end; it.increment(ec)) {
    const string name = it->path().filename().string();
    if (name.empty() || !all_of(name.begin(), name.end(), [](char c) {return c >= '0' && c <= '9';})) {
      continue;
    }
    const pid_t candidate = static_cast<pid_t>(stol(name));
    if (candidate == self || candidate == exclude) {
      continue;
    }

    ifstream in(it->path() / "cmdline", ios::binary);
    if (!in.is_open()) {
      continue;
    }
    const string raw((istreambuf_iterator<char>(in)), istreambuf_iterator<char>());
    if (raw.empty()) {
      continue;
    }
    string cmdline = raw;
    replace(cmdline.begin(), cmdline.end(), '\0', ' ');
    if (cmdline.find(needle) == string::npos || !pid_exists(candidate)) {
      continue;
    }
    if (cmdline_has_port(raw, cfg.port)) {
      preferred.push_back(candidate);
    } else {
      others.push_back(candidate);
    }
  }

  sort(preferred.begin(), preferred.end());
  sort(others.begin(), others.end());
  preferred.insert(preferred.end(), others.begin(), others.end());
  return preferred;
}

bool LlamaServerSupervisor::cmdline_has_port(const string & raw_cmdline, int port)
{
  const string wanted = to_string(port);
  vector<string> args;
  string current;
  for (const char c : raw_cmdline) {
    if (c == '\0') {
      args.push_back(current);
      current.clear();
    } else {
      current.push_back(c);
    }
  }
  if (!current.empty()) {
    args.push_back(current);
  }

  for (size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--port" && i + 1 < args.size() && args[i + 1] == wanted) {
      return true;
    }
    if (args[i] == "--port=" + wanted) {
      return true;
    }
  }
  return false;
}

vector<pid_t> LlamaServerSupervisor::find_orphan_processes() const
{
  return scan_processes(config(), pid());
}

vector<ModelDescriptor> LlamaServerSupervisor::find_models(const string & dir) const
{
  const ServerConfig cfg = config();
  return make_locator(cfg).find_models(dir);
}

bool LlamaServerSupervisor::has_process_handle() const
{
  lock_guard<mutex> lock(state_mutex_);
  return static_cast<bool>(handle_);
}

pid_t LlamaServerSupervisor::pid() const
{
  lock_guard<mutex> lock(state_mutex_);
  return handle_ ? handle_->pid : -1;
}

ServerState LlamaServerSupervisor::state() const
{
  lock_guard<mutex> lock(state_mutex_);
  return state_;
}

string LlamaServerSupervisor::state_string() const
{
  return server_state_string(state());
}

string LlamaServerSupervisor::endpoint() const
{
  return make_endpoint(config());
}

string LlamaServerSupervisor::log_path() const
{
  {
    lock_guard<mutex> lock(state_mutex_);
    if (handle_) {
      return handle_->log_path;
    }
  }
  return server_log_path(config());
}

ServerConfig LlamaServerSupervisor::config() const
{
  lock_guard<mutex> lock(state_mutex_);
  return config_;
}

void LlamaServerSupervisor::update_config(const ServerConfig & cfg)
{
  lock_guard<mutex> lock(state_mutex_);
  config_ = cfg;
}

}  // namespace llm_server_cpp
