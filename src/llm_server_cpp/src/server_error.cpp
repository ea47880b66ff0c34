#include "llm_server_cpp/server_error.hpp"

using namespace std;


namespace llm_server_cpp
{

string error_code_string(ServerErrorCode code)
{
  switch (code) {
    case ServerErrorCode::NONE:
      return "none";
    case ServerErrorCode::BINARY_NOT_FOUND:
      return "binary_not_found";
    case ServerErrorCode::MODEL_MISSING:
      return "model_missing";
    case ServerErrorCode::MODEL_NOT_FOUND:
      return "model_not_found";
    case ServerErrorCode::PROCESS_START_FAILURE:
      return "process_start_failure";
    case ServerErrorCode::SERVER_UNREACHABLE:
      return "server_unreachable";
    case ServerErrorCode::REQUEST_TIMEOUT:
      return "request_timeout";
    case ServerErrorCode::GENERATION_FAILURE:
      return "generation_failure";
    case ServerErrorCode::STOP_FAILURE:
      return "stop_failure";
    case ServerErrorCode::CANCELLED:
      return "cancelled";
    default:
      return "unknown";
  }
}

ServerResult make_server_ok(const string & message)
{
  ServerResult out;
  out.ok = true;
  out.message = message;
  return out;
}

ServerResult make_server_error(ServerErrorCode code, const string & message)
{
  ServerResult out;
  out.ok = false;
  out.code = code;
  out.message = message;
  return out;
}

}  // namespace llm_server_cpp
