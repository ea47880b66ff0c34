#pragma once

#include <cstdint>
#include <string>

namespace llm_server_cpp
{

struct ServerConfig
{
  std::string server_binary;  // empty = auto-detect
  std::string model_path;
  std::string model_dir;      // empty = ~/models
  std::string install_dir;    // empty = $XDG_DATA_HOME/llm_server_cpp/llama.cpp/build/bin
  std::string host = "127.0.0.1";
  int port = 8080;
  int ctx_size = 4096;
  int gpu_layers = 0;

  // 생성 기본값 (재시작 없이 변경 가능)
  double temperature = 0.7;
  int max_tokens = 4096;
  double top_p = 1.0;
  int top_k = 40;
  double repeat_penalty = 1.1;

  int ready_poll_interval_ms = 500;
  int ready_poll_attempts = 30;
  int stop_timeout_ms = 5000;
  long request_timeout_sec = 120;
  long health_timeout_sec = 5;

  std::string log_dir = "/tmp";
  bool stop_on_shutdown = false;
};

struct ModelDescriptor
{
  std::string path;
  std::string name;
  std::uintmax_t size_bytes = 0;

  /// GiB 단위, 소수 둘째 자리 반올림
  double size_gb() const;
};

struct GenerationRequest
{
  std::string prompt;
  int max_tokens = 512;
  double temperature = 0.7;
  bool stream = false;
};

/// http://<host>:<port>
std::string make_endpoint(const ServerConfig & cfg);

/// 설정의 생성 기본값으로 요청을 채운다
GenerationRequest make_request(const ServerConfig & cfg, const std::string & prompt, bool stream);

}  // namespace llm_server_cpp
