#include "llm_server_cpp/health_prober.hpp"

#include <llm_common/curl_utils.hpp>

#include <algorithm>
#include <exception>

using namespace std;


namespace llm_server_cpp
{
namespace
{

static const llm_common::CurlGlobalGuard curl_guard;

string strip_trailing_slash(string url)
{
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  return url;
}

}  // namespace

HealthProber::HealthProber(const string & endpoint, long timeout_sec)
: endpoint_(strip_trailing_slash(endpoint)), timeout_sec_(max(1L, timeout_sec))
{
}

bool HealthProber::probe() const
{
  try {
    llm_common::HttpResult res;
    const long connect_timeout = min(2L, timeout_sec_);
    if (!llm_common::perform_get(endpoint_ + "/health", timeout_sec_, connect_timeout, res)) {
      return false;
    }
    return res.http_code == 200;
  } catch (const exception &) {
    return false;
  }
}

}  // namespace llm_server_cpp
