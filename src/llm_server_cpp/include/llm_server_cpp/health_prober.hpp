#pragma once

#include <string>

namespace llm_server_cpp
{

/// GET /health 한 번으로 서버 생존 여부를 판단. 어떤 입력에도 예외를 던지지 않는다
class HealthProber
{
public:
  explicit HealthProber(const std::string & endpoint, long timeout_sec = 5);

  bool probe() const;

  const std::string & endpoint() const { return endpoint_; }
  long timeout_sec() const { return timeout_sec_; }

private:
  std::string endpoint_;
  long timeout_sec_;
};

}  // namespace llm_server_cpp
