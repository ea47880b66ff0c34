#include "llm_server_cpp/inference_client.hpp"

#include "llm_server_cpp/sse_frame_parser.hpp"

#include <llm_common/curl_utils.hpp>
#include <llm_common/json_utils.hpp>
#include <llm_common/string_utils.hpp>

#include <curl/curl.h>

#include <algorithm>
#include <sstream>
#include <vector>

using namespace std;


namespace llm_server_cpp
{
namespace
{

static const llm_common::CurlGlobalGuard curl_guard;

const vector<string> kJsonHeaders{"Content-Type: application/json"};

string strip_trailing_slash(string url)
{
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  return url;
}

string describe_http_error(long http_code, const string & body)
{
  ostringstream err;
  err << "http_" << http_code;
  const string trimmed = llm_common::trim(body);
  if (!trimmed.empty()) {
    err << ":" << trimmed.substr(0, 200);
  }
  return err.str();
}

}  // namespace

InferenceClient::InferenceClient(const string & base_url, long timeout_sec, long health_timeout_sec)
: base_url_(strip_trailing_slash(base_url)),
  timeout_sec_(max(1L, timeout_sec)),
  prober_(base_url_, health_timeout_sec)
{
}

bool InferenceClient::health_check() const
{
  return prober_.probe();
}

string InferenceClient::build_completion_body(const GenerationRequest & request, bool stream)
{
  ostringstream body;
  body << "{"
       << "\"prompt\":\"" << llm_common::json_escape(request.prompt) << "\","
       << "\"n_predict\":" << request.max_tokens << ","
       << "\"temperature\":" << request.temperature << ","
       << "\"stream\":" << (stream ? "true" : "false")
       << "}";
  return body.str();
}

GenerationResult InferenceClient::make_transport_error(
  int curl_code, bool connected, const string & cause, const string & prefix) const
{
  GenerationResult out;
  // 연결 전에 타임아웃이 나면 서버가 없는 것과 같다
  if (llm_common::is_connect_error_code(curl_code) ||
    (llm_common::is_timeout_error_code(curl_code) && !connected))
  {
    out.code = ServerErrorCode::SERVER_UNREACHABLE;
    out.error =
      "Cannot connect to LLM server at " + base_url_ + ".\n\n"
      "Start the server first (llm_server_node ~/start service).";
    return out;
  }
  if (llm_common::is_timeout_error_code(curl_code)) {
    out.code = ServerErrorCode::REQUEST_TIMEOUT;
    out.error =
      "Request timed out.\n\n"
      "The model may be loading or the prompt is too long. Try again.";
    return out;
  }
  out.code = ServerErrorCode::GENERATION_FAILURE;
  out.error = prefix + cause;
  return out;
}

/// /completion 블로킹 호출. 응답 JSON 의 content 만 사용
GenerationResult InferenceClient::generate(
  const GenerationRequest & request, const atomic<bool> * cancel) const
{
  llm_common::HttpResult http;
  if (!llm_common::perform_post_json(
      base_url_ + "/completion",
      kJsonHeaders,
      build_completion_body(request, false),
      timeout_sec_,
      http,
      cancel))
  {
    if (http.curl_code == CURLE_ABORTED_BY_CALLBACK) {
      GenerationResult cancelled;
      cancelled.code = ServerErrorCode::CANCELLED;
      cancelled.error = "request cancelled";
      return cancelled;
    }
    return make_transport_error(http.curl_code, http.connected, http.error, "Generation failed: ");
  }

  GenerationResult out;
  if (http.http_code < 200 || http.http_code >= 300) {
    out.code = ServerErrorCode::GENERATION_FAILURE;
    out.error = "Generation failed: " + describe_http_error(http.http_code, http.body);
    return out;
  }
  if (!llm_common::is_json_object(http.body)) {
    out.code = ServerErrorCode::GENERATION_FAILURE;
    out.error = "Generation failed: invalid_response:" + llm_common::trim(http.body).substr(0, 200);
    return out;
  }

  string text;
  if (llm_common::extract_json_string_field(http.body, "content", text)) {
    out.text = text;
  }
  out.ok = true;
  return out;
}

GenerationResult InferenceClient::generate_stream(
  const GenerationRequest & request, const ChunkCallback & on_chunk,
  const atomic<bool> * cancel) const
{
  GenerationResult out;
  SseFrameParser parser;

  const SseFrameParser::ChunkCallback forward = [&out, &on_chunk](const string & chunk) {
      out.text += chunk;
      ++out.chunk_count;
      return on_chunk(chunk);
    };

  const function<bool(const char *, size_t)> on_data = [&parser, &forward](const char * data, size_t size) {
      return parser.feed(data, size, forward);
    };

  llm_common::HttpResult http;
  bool aborted = false;
  const bool transfer_ok = llm_common::perform_post_json_stream(
    base_url_ + "/completion",
    kJsonHeaders,
    build_completion_body(request, true),
    timeout_sec_,
    on_data,
    http,
    aborted,
    cancel);

  if (aborted) {
    out.code = ServerErrorCode::CANCELLED;
    out.error = "stream cancelled by consumer";
    return out;
  }
  if (!transfer_ok) {
    GenerationResult err =
      make_transport_error(http.curl_code, http.connected, http.error, "Streaming failed: ");
    err.text = out.text;
    err.chunk_count = out.chunk_count;
    return err;
  }
  if (http.http_code < 200 || http.http_code >= 300) {
    out.code = ServerErrorCode::GENERATION_FAILURE;
    out.error = "Streaming failed: " + describe_http_error(http.http_code, "");
    return out;
  }

  // 연결이 닫힌 뒤 개행 없이 남은 마지막 프레임
  if (!parser.finish(forward)) {
    out.code = ServerErrorCode::CANCELLED;
    out.error = "stream cancelled by consumer";
    return out;
  }

  out.ok = true;
  return out;
}

}  // namespace llm_server_cpp
