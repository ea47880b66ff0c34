#pragma once

#include <curl/curl.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace llm_common
{

/// cURL 수신 데이터를 std::string 버퍼에 누적하는 콜백
inline size_t curl_write_callback(void * contents, size_t size, size_t nmemb, void * userp)
{
  const size_t total = size * nmemb;
  auto * buffer = static_cast<std::string *>(userp);
  buffer->append(static_cast<const char *>(contents), total);
  return total;
}

/// 서버에 도달하지 못한 경우(DNS, 연결 거부 등)에 해당하는 cURL 에러 코드인지 판별
inline bool is_connect_error_code(int curl_code)
{
  return curl_code == CURLE_COULDNT_RESOLVE_HOST ||
    curl_code == CURLE_COULDNT_RESOLVE_PROXY ||
    curl_code == CURLE_COULDNT_CONNECT;
}

inline bool is_timeout_error_code(int curl_code)
{
  return curl_code == CURLE_OPERATION_TIMEDOUT;
}

/// RAII 방식으로 curl_global_init/cleanup을 관리 (프로세스당 1개 static 인스턴스)
class CurlGlobalGuard
{
public:
  CurlGlobalGuard()
  {
    curl_global_init(CURL_GLOBAL_DEFAULT);
  }

  ~CurlGlobalGuard()
  {
    curl_global_cleanup();
  }

  CurlGlobalGuard(const CurlGlobalGuard &) = delete;
  CurlGlobalGuard & operator=(const CurlGlobalGuard &) = delete;
};

/// HTTP 요청 1회의 전송 결과
struct HttpResult
{
  CURLcode curl_code = CURLE_OK;
  long http_code = 0;
  bool connected = false;   ///< TCP 연결까지 성립했는지 (타임아웃 원인 구분용)
  std::string body;
  std::string error;        ///< curl_easy_strerror 메시지 (curl_code != CURLE_OK 일 때)
};

namespace detail
{

inline void fill_transfer_info(CURL * curl, CURLcode rc, HttpResult & out)
{
  out.curl_code = rc;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &out.http_code);

  long connects = 0;
  curl_easy_getinfo(curl, CURLINFO_NUM_CONNECTS, &connects);
  double connect_time = 0.0;
  curl_easy_getinfo(curl, CURLINFO_CONNECT_TIME, &connect_time);
  out.connected = connects > 0 || connect_time > 0.0 || out.http_code > 0;

  if (rc != CURLE_OK) {
    out.error = curl_easy_strerror(rc);
  }
}

struct StreamSink
{
  const std::function<bool(const char *, size_t)> * on_data = nullptr;
  bool aborted = false;
};

inline size_t stream_write_callback(void * contents, size_t size, size_t nmemb, void * userp)
{
  const size_t total = size * nmemb;
  auto * sink = static_cast<StreamSink *>(userp);
  if (!(*sink->on_data)(static_cast<const char *>(contents), total)) {
    sink->aborted = true;
    // total 과 다른 값을 반환하면 cURL 이 CURLE_WRITE_ERROR 로 전송을 중단하고 연결을 닫는다
    return 0;
  }
  return total;
}

/// abort_flag 가 세워지면 0 이 아닌 값을 반환해 CURLE_ABORTED_BY_CALLBACK 으로 중단
inline int abort_xferinfo_callback(void * clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t)
{
  const auto * abort_flag = static_cast<const std::atomic<bool> *>(clientp);
  return abort_flag->load() ? 1 : 0;
}

}  // namespace detail

/// 짧은 타임아웃 GET 요청. cURL 레벨 에러 시 false + out.error 설정
inline bool perform_get(
  const std::string & url,
  long timeout_sec,
  long connect_timeout_sec,
  HttpResult & out)
{
  out = HttpResult();
  CURL * curl = curl_easy_init();
  if (!curl) {
    out.curl_code = CURLE_FAILED_INIT;
    out.error = "curl_init_failed";
    return false;
  }

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curl_write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &out.body);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_sec);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, connect_timeout_sec);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

  const CURLcode rc = curl_easy_perform(curl);
  detail::fill_transfer_info(curl, rc, out);
  curl_easy_cleanup(curl);
  return rc == CURLE_OK;
}

/// JSON 본문을 HTTP POST로 전송하고 응답 전체를 받아오는 범용 함수
/// 성공 시 true 반환, cURL 레벨 에러 시 false + out.error 설정
/// abort_flag 가 주어지면 전송 중 값이 true 가 되는 즉시 중단
inline bool perform_post_json(
  const std::string & url,
  const std::vector<std::string> & header_lines,
  const std::string & body,
  long timeout_sec,
  HttpResult & out,
  const std::atomic<bool> * abort_flag = nullptr)
{
  out = HttpResult();
  CURL * curl = curl_easy_init();
  if (!curl) {
    out.curl_code = CURLE_FAILED_INIT;
    out.error = "curl_init_failed";
    return false;
  }

  struct curl_slist * headers = nullptr;
  for (const auto & h : header_lines) {
    headers = curl_slist_append(headers, h.c_str());
  }

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(curl, CURLOPT_POST, 1L);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curl_write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &out.body);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_sec);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 5L);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  if (abort_flag) {
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, detail::abort_xferinfo_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, const_cast<std::atomic<bool> *>(abort_flag));
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
  }

  const CURLcode rc = curl_easy_perform(curl);
  detail::fill_transfer_info(curl, rc, out);

  curl_slist_free_all(headers);
  curl_easy_cleanup(curl);
  return rc == CURLE_OK;
}

/// JSON 본문을 POST 하고 응답 본문을 도착하는 대로 on_data 로 흘려보낸다
/// on_data 가 false 를 반환하면 전송을 중단하고 out_aborted = true
/// 스트림은 전체 타임아웃 대신 idle_timeout_sec 동안 데이터가 없을 때만 끊긴다
/// abort_flag 는 데이터가 오지 않는 동안에도 중단할 수 있게 진행 콜백에서 확인
inline bool perform_post_json_stream(
  const std::string & url,
  const std::vector<std::string> & header_lines,
  const std::string & body,
  long idle_timeout_sec,
  const std::function<bool(const char *, size_t)> & on_data,
  HttpResult & out,
  bool & out_aborted,
  const std::atomic<bool> * abort_flag = nullptr)
{
  out = HttpResult();
  out_aborted = false;
  CURL * curl = curl_easy_init();
  if (!curl) {
    out.curl_code = CURLE_FAILED_INIT;
    out.error = "curl_init_failed";
    return false;
  }

  struct curl_slist * headers = nullptr;
  for (const auto & h : header_lines) {
    headers = curl_slist_append(headers, h.c_str());
  }

  detail::StreamSink sink;
  sink.on_data = &on_data;

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(curl, CURLOPT_POST, 1L);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, detail::stream_write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &sink);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 5L);
  curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
  curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, idle_timeout_sec);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  if (abort_flag) {
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, detail::abort_xferinfo_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, const_cast<std::atomic<bool> *>(abort_flag));
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
  }

  const CURLcode rc = curl_easy_perform(curl);
  detail::fill_transfer_info(curl, rc, out);
  out_aborted = sink.aborted || rc == CURLE_ABORTED_BY_CALLBACK;

  curl_slist_free_all(headers);
  curl_easy_cleanup(curl);
  return rc == CURLE_OK;
}

}  // namespace llm_common
