#include "llm_server_cpp/server_config.hpp"

#include <cmath>
#include <sstream>

using namespace std;


namespace llm_server_cpp
{

double ModelDescriptor::size_gb() const
{
  const double gb = static_cast<double>(size_bytes) / (1024.0 * 1024.0 * 1024.0);
  return round(gb * 100.0) / 100.0;
}

string make_endpoint(const ServerConfig & cfg)
{
  ostringstream oss;
  oss << "http://" << cfg.host << ":" << cfg.port;
  return oss.str();
}

GenerationRequest make_request(const ServerConfig & cfg, const string & prompt, bool stream)
{
  GenerationRequest req;
  req.prompt = prompt;
  req.max_tokens = cfg.max_tokens;
  req.temperature = cfg.temperature;
  req.stream = stream;
  return req;
}

}  // namespace llm_server_cpp
