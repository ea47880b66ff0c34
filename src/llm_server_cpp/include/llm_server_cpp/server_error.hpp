#pragma once

#include <cstddef>
#include <string>

namespace llm_server_cpp
{

enum class ServerErrorCode
{
  NONE,
  BINARY_NOT_FOUND,
  MODEL_MISSING,
  MODEL_NOT_FOUND,
  PROCESS_START_FAILURE,
  SERVER_UNREACHABLE,
  REQUEST_TIMEOUT,
  GENERATION_FAILURE,
  STOP_FAILURE,
  CANCELLED
};

std::string error_code_string(ServerErrorCode code);

/// start/stop/restart 결과
struct ServerResult
{
  bool ok = false;
  bool still_starting = false;  ///< 준비 대기 시간 초과, 프로세스는 살아있음
  ServerErrorCode code = ServerErrorCode::NONE;
  std::string message;
};

/// 생성 요청 1건의 결과. 스트리밍이면 text 는 전달된 청크를 이어붙인 값 (실패/취소 시 부분 결과)
struct GenerationResult
{
  bool ok = false;
  ServerErrorCode code = ServerErrorCode::NONE;
  std::string text;
  std::string error;
  size_t chunk_count = 0;
};

ServerResult make_server_ok(const std::string & message);
ServerResult make_server_error(ServerErrorCode code, const std::string & message);

}  // namespace llm_server_cpp
