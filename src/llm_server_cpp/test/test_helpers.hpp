#pragma once

#include <sys/stat.h>
#include <unistd.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace llm_server_cpp
{
namespace test
{

/// mkdtemp 로 만든 디렉터리. 소멸 시 통째로 삭제
class TempDir
{
public:
  TempDir()
  {
    std::string tmpl = (std::filesystem::temp_directory_path() / "llm_server_cpp_test_XXXXXX").string();
    if (!mkdtemp(&tmpl[0])) {
      throw std::runtime_error("mkdtemp failed");
    }
    path_ = tmpl;
  }

  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;

  const std::filesystem::path & path() const { return path_; }
  std::string str() const { return path_.string(); }
  std::filesystem::path operator/(const std::string & name) const { return path_ / name; }

private:
  std::filesystem::path path_;
};

inline void write_file(const std::filesystem::path & path, const std::string & content)
{
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

/// #!/bin/sh 스크립트를 만들고 실행 권한 부여
inline std::string write_script(const std::filesystem::path & path, const std::string & body)
{
  write_file(path, "#!/bin/sh\n" + body + "\n");
  chmod(path.c_str(), 0755);
  return path.string();
}

}  // namespace test
}  // namespace llm_server_cpp
