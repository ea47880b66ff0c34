#pragma once

#include <sys/types.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "llm_server_cpp/server_config.hpp"
#include "llm_server_cpp/server_error.hpp"
#include "llm_server_cpp/server_locator.hpp"

namespace llm_server_cpp
{

enum class ServerState
{
  STOPPED,
  STARTING,
  RUNNING,
  STOPPING
};

/// fork 로 띄운 서버 프로세스 1개에 대한 소유권. 감독자만 보유한다
struct ProcessHandle
{
  pid_t pid = -1;
  std::string binary_path;
  std::string model_path;
  std::string log_path;
};

/// llama-server 프로세스 1개의 수명 관리 (start → 준비 대기 → stop)
/// start/stop/restart/reconcile 은 내부 뮤텍스로 직렬화되고 is_running/state 는 어느 스레드에서나 호출 가능
class LlamaServerSupervisor
{
public:
  explicit LlamaServerSupervisor(const ServerConfig & cfg);
  LlamaServerSupervisor(const ServerConfig & cfg, const LocatorConfig & locator_cfg);
  ~LlamaServerSupervisor();

  LlamaServerSupervisor(const LlamaServerSupervisor &) = delete;
  LlamaServerSupervisor & operator=(const LlamaServerSupervisor &) = delete;

  ServerResult start(const std::string & model_override = "");
  ServerResult stop();
  ServerResult restart(const std::string & model_override = "");

  /// 보유 중인 프로세스가 살아있거나, 설정 포트의 헬스 체크가 성공하면 true
  bool is_running() const;

  /// 종료된 자식 회수, STARTING → RUNNING 승격, 핸들 없는 서버의 상태 반영
  void reconcile();

  /// 명령줄에 바이너리 이름이 포함된 프로세스 목록 (--port 가 일치하는 것이 앞)
  /// 같은 문자열을 가진 무관한 프로세스가 걸릴 수 있는 best-effort 탐색
  std::vector<pid_t> find_orphan_processes() const;

  std::vector<ModelDescriptor> find_models(const std::string & dir = "") const;

  bool has_process_handle() const;
  pid_t pid() const;
  ServerState state() const;
  std::string state_string() const;
  std::string endpoint() const;
  std::string log_path() const;

  ServerConfig config() const;
  /// 다음 start() 부터 적용
  void update_config(const ServerConfig & cfg);

  static std::vector<std::string> build_arguments(
    const std::string & binary, const std::string & model, const ServerConfig & cfg);

  /// /proc/<pid>/cmdline (NUL 구분) 에 `--port <port>` 또는 `--port=<port>` 인자가 있는지
  static bool cmdline_has_port(const std::string & raw_cmdline, int port);

private:
  ServerLocator make_locator(const ServerConfig & cfg) const;
  std::string binary_match_name(const ServerConfig & cfg) const;
  std::vector<pid_t> scan_processes(const ServerConfig & cfg, pid_t exclude) const;
  bool probe_health(const ServerConfig & cfg) const;

  ServerResult stop_tracked(const ServerConfig & cfg);
  ServerResult stop_orphan(const ServerConfig & cfg);

  /// 종료된 자식을 회수하고 핸들을 버린다 (lifecycle_mutex_ 보유 상태에서 호출)
  void drop_dead_handle();
  void set_state(ServerState next);
  void clear_handle(ServerState next);
  std::string server_log_path(const ServerConfig & cfg) const;

  std::mutex lifecycle_mutex_;
  mutable std::mutex state_mutex_;

  ServerConfig config_;
  LocatorConfig locator_cfg_;
  bool locator_from_config_;
  std::unique_ptr<ProcessHandle> handle_;
  ServerState state_ = ServerState::STOPPED;
};

std::string server_state_string(ServerState state);

}  // namespace llm_server_cpp
