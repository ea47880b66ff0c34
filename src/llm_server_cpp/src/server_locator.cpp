#include "llm_server_cpp/server_locator.hpp"

#include <llm_common/string_utils.hpp>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <system_error>

#include <unistd.h>

using namespace std;

namespace fs = std::filesystem;


namespace llm_server_cpp
{

ServerLocator::ServerLocator(const LocatorConfig & cfg)
: cfg_(cfg)
{
}

bool ServerLocator::is_executable_file(const string & path)
{
  if (path.empty()) {
    return false;
  }
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    return false;
  }
  return access(path.c_str(), X_OK) == 0;
}

string ServerLocator::home() const
{
  if (!cfg_.home_dir.empty()) {
    return cfg_.home_dir;
  }
  const char * home = getenv("HOME");
  return home ? string(home) : string();
}

string ServerLocator::install_dir() const
{
  if (!cfg_.install_dir.empty()) {
    return llm_common::expand_user(cfg_.install_dir);
  }
  fs::path data_home;
  const char * xdg = getenv("XDG_DATA_HOME");
  if (xdg && *xdg) {
    data_home = xdg;
  } else {
    const string h = home();
    if (h.empty()) {
      return "";
    }
    data_home = fs::path(h) / ".local" / "share";
  }
  return (data_home / "llm_server_cpp" / "llama.cpp" / "build" / "bin").string();
}

vector<string> ServerLocator::legacy_dirs() const
{
  if (!cfg_.legacy_dirs.empty()) {
    return cfg_.legacy_dirs;
  }
  vector<string> dirs;
  const string h = home();
  if (!h.empty()) {
    dirs.push_back((fs::path(h) / "llama.cpp" / "build" / "bin").string());
    dirs.push_back((fs::path(h) / ".local" / "bin").string());
  }
  dirs.push_back("/usr/local/bin");
  return dirs;
}

vector<string> ServerLocator::binary_candidates(const string & configured) const
{
  vector<string> out;
  if (!configured.empty()) {
    out.push_back(llm_common::expand_user(configured));
  }

  const string install = install_dir();
  if (!install.empty()) {
    out.push_back((fs::path(install) / cfg_.binary_name).string());
  }

  if (cfg_.use_path_env) {
    string path_env = cfg_.path_env;
    if (path_env.empty()) {
      const char * env = getenv("PATH");
      path_env = env ? string(env) : string();
    }
    for (const auto & dir : llm_common::split(path_env, ':')) {
      out.push_back((fs::path(dir) / cfg_.binary_name).string());
    }
  }

  for (const auto & dir : legacy_dirs()) {
    out.push_back((fs::path(llm_common::expand_user(dir)) / cfg_.binary_name).string());
  }
  return out;
}

optional<string> ServerLocator::find_binary(const string & configured) const
{
  for (const auto & candidate : binary_candidates(configured)) {
    if (is_executable_file(candidate)) {
      return candidate;
    }
  }
  return nullopt;
}

string ServerLocator::default_model_dir() const
{
  if (!cfg_.default_model_dir.empty()) {
    return llm_common::expand_user(cfg_.default_model_dir);
  }
  const string h = home();
  return h.empty() ? string("models") : (fs::path(h) / "models").string();
}

vector<ModelDescriptor> ServerLocator::find_models(const string & dir) const
{
  vector<ModelDescriptor> models;
  const string search_dir = dir.empty() ? default_model_dir() : llm_common::expand_user(dir);

  std::error_code ec;
  if (!fs::is_directory(search_dir, ec)) {
    return models;
  }

  const string ext = llm_common::to_lower(cfg_.model_extension);
  fs::recursive_directory_iterator it(
    search_dir, fs::directory_options::skip_permission_denied, ec);
  const fs::recursive_directory_iterator end;
  for (; !ec && it != end; it.increment(ec)) {
    std::error_code entry_ec;
    if (!it->is_regular_file(entry_ec)) {
      continue;
    }
    const fs::path & p = it->path();
    if (llm_common::to_lower(p.extension().string()) != ext) {
      continue;
    }
    const uintmax_t size = fs::file_size(p, entry_ec);
    if (entry_ec) {
      continue;
    }
    ModelDescriptor model;
    model.path = p.string();
    model.name = p.stem().string();
    model.size_bytes = size;
    models.push_back(model);
  }

  sort(models.begin(), models.end(), [](const ModelDescriptor & a, const ModelDescriptor & b) {
    const string la = llm_common::to_lower(a.name);
    const string lb = llm_common::to_lower(b.name);
    if (la != lb) {
      return la < lb;
    }
    return a.path < b.path;
  });
  return models;
}

LocatorConfig make_locator_config(const ServerConfig & cfg)
{
  LocatorConfig out;
  out.install_dir = cfg.install_dir;
  out.default_model_dir = cfg.model_dir;
  return out;
}

}  // namespace llm_server_cpp
