#pragma once

#include <optional>
#include <string>
#include <vector>

#include "llm_server_cpp/server_config.hpp"

namespace llm_server_cpp
{

/// 탐색 루트. 빈 값은 실행 환경에서 기본값을 채운다
struct LocatorConfig
{
  std::string binary_name = "llama-server";
  std::string home_dir;                  // empty = $HOME
  std::string install_dir;               // empty = <data home>/llm_server_cpp/llama.cpp/build/bin
  std::string path_env;                  // empty = $PATH
  bool use_path_env = true;
  std::vector<std::string> legacy_dirs;  // empty = ~/llama.cpp/build/bin, ~/.local/bin, /usr/local/bin
  std::string model_extension = ".gguf";
  std::string default_model_dir;         // empty = ~/models
};

class ServerLocator
{
public:
  explicit ServerLocator(const LocatorConfig & cfg = LocatorConfig());

  /// 설정 경로 → 앱 설치 디렉터리 → PATH → 레거시 위치 순서로 첫 번째 실행 파일 반환
  std::optional<std::string> find_binary(const std::string & configured = "") const;
  std::vector<std::string> binary_candidates(const std::string & configured = "") const;

  /// dir 아래 모델 파일을 재귀 탐색해 이름(대소문자 무시) 순으로 반환. 디렉터리가 없으면 빈 목록
  std::vector<ModelDescriptor> find_models(const std::string & dir = "") const;

  std::string default_model_dir() const;
  const std::string & binary_name() const { return cfg_.binary_name; }
  const std::string & model_extension() const { return cfg_.model_extension; }

  static bool is_executable_file(const std::string & path);

private:
  std::string home() const;
  std::string install_dir() const;
  std::vector<std::string> legacy_dirs() const;

  LocatorConfig cfg_;
};

/// ServerConfig 의 install_dir / model_dir 을 반영한 LocatorConfig
LocatorConfig make_locator_config(const ServerConfig & cfg);

}  // namespace llm_server_cpp
