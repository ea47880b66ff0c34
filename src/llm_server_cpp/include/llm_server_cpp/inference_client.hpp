#pragma once

#include <atomic>
#include <functional>
#include <string>

#include "llm_server_cpp/health_prober.hpp"
#include "llm_server_cpp/server_config.hpp"
#include "llm_server_cpp/server_error.hpp"

namespace llm_server_cpp
{

class InferenceClient
{
public:
  /// false 를 반환하면 스트림을 포기하고 연결을 닫는다
  using ChunkCallback = std::function<bool(const std::string & chunk)>;

  explicit InferenceClient(
    const std::string & base_url, long timeout_sec = 120, long health_timeout_sec = 5);

  bool health_check() const;

  /// 블로킹 단일 요청 (stream=false). cancel 이 true 가 되면 CANCELLED 로 중단
  GenerationResult generate(
    const GenerationRequest & request, const std::atomic<bool> * cancel = nullptr) const;

  /// stream=true 요청. 청크가 도착하는 순서대로 on_chunk 호출, 연결 종료 시 반환
  GenerationResult generate_stream(
    const GenerationRequest & request, const ChunkCallback & on_chunk,
    const std::atomic<bool> * cancel = nullptr) const;

  const std::string & base_url() const { return base_url_; }
  long timeout_sec() const { return timeout_sec_; }

  static std::string build_completion_body(const GenerationRequest & request, bool stream);

private:
  GenerationResult make_transport_error(
    int curl_code, bool connected, const std::string & cause, const std::string & prefix) const;

  std::string base_url_;
  long timeout_sec_;
  HealthProber prober_;
};

}  // namespace llm_server_cpp
