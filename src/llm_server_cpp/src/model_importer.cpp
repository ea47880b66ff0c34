#include "llm_server_cpp/model_importer.hpp"

#include <llm_common/string_utils.hpp>

#include <rclcpp/rclcpp.hpp>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <vector>

using namespace std;

namespace fs = std::filesystem;


namespace llm_server_cpp
{
namespace
{

constexpr size_t kCopyChunkBytes = 1024 * 1024;

rclcpp::Logger logger()
{
  return rclcpp::get_logger("model_importer");
}

void remove_partial(const fs::path & dest)
{
  std::error_code ec;
  fs::remove(dest, ec);
  if (ec) {
    RCLCPP_WARN(logger(), "failed to remove partial file %s: %s", dest.c_str(), ec.message().c_str());
  }
}

}  // namespace

ModelImporter::ModelImporter()
: cancel_requested_(false), busy_(false)
{
}

void ModelImporter::cancel()
{
  cancel_requested_.store(true);
}

bool ModelImporter::try_begin()
{
  bool expected = false;
  if (!busy_.compare_exchange_strong(expected, true)) {
    return false;
  }
  cancel_requested_.store(false);
  return true;
}

ImportResult ModelImporter::import(
  const string & source, const string & dest_dir, const ProgressCallback & on_progress)
{
  if (!try_begin()) {
    ImportResult out;
    out.error = "another import is in progress";
    return out;
  }
  return run(source, dest_dir, on_progress);
}

// 취소 플래그는 여기서 건드리지 않는다. try_begin() 과 run() 사이의 cancel() 도 유효
ImportResult ModelImporter::run(
  const string & source, const string & dest_dir, const ProgressCallback & on_progress)
{
  ImportResult out;
  struct BusyReset
  {
    atomic<bool> & flag;
    ~BusyReset() {flag.store(false);}
  } busy_reset{busy_};

  const fs::path src(llm_common::expand_user(source));
  const fs::path dir(llm_common::expand_user(dest_dir));
  std::error_code ec;

  if (!fs::is_regular_file(src, ec)) {
    out.error = "Source model not found:\n" + src.string();
    return out;
  }
  const uintmax_t total = fs::file_size(src, ec);
  if (ec) {
    out.error = "Cannot read source model: " + ec.message();
    return out;
  }

  fs::create_directories(dir, ec);
  if (ec) {
    out.error = "Permission denied writing to:\n" + dir.string();
    return out;
  }

  const fs::path dest = dir / src.filename();
  if (fs::exists(dest, ec)) {
    out.error = "Model already exists:\n" + dest.string();
    return out;
  }

  ifstream in(src, ios::binary);
  if (!in.is_open()) {
    out.error = "Cannot open source model: " + src.string();
    return out;
  }
  ofstream dst(dest, ios::binary | ios::trunc);
  if (!dst.is_open()) {
    out.error = "Permission denied writing to:\n" + dir.string();
    return out;
  }

  RCLCPP_INFO(logger(), "importing %s -> %s", src.c_str(), dest.c_str());

  vector<char> buffer(kCopyChunkBytes);
  uintmax_t copied = 0;
  int last_percent = -1;
  while (true) {
    if (cancel_requested_.load()) {
      dst.close();
      remove_partial(dest);
      out.error = "Copy canceled";
      return out;
    }

    in.read(buffer.data(), static_cast<streamsize>(buffer.size()));
    const streamsize got = in.gcount();
    if (got <= 0) {
      break;
    }
    dst.write(buffer.data(), got);
    if (!dst) {
      dst.close();
      remove_partial(dest);
      out.error = "Failed to copy file: write error on " + dest.string();
      return out;
    }
    copied += static_cast<uintmax_t>(got);

    const int percent = total == 0 ? 100 : static_cast<int>((copied * 100) / total);
    if (on_progress && percent != last_percent) {
      on_progress(percent);
      last_percent = percent;
    }
  }

  if (in.bad()) {
    dst.close();
    remove_partial(dest);
    out.error = "Failed to copy file: read error on " + src.string();
    return out;
  }

  dst.close();
  if (!dst) {
    remove_partial(dest);
    out.error = "Failed to copy file: cannot flush " + dest.string();
    return out;
  }
  if (on_progress && last_percent != 100) {
    on_progress(100);
  }

  fs::permissions(dest, fs::status(src, ec).permissions(), fs::perm_options::replace, ec);
  if (ec) {
    RCLCPP_WARN(logger(), "could not copy permissions to %s: %s", dest.c_str(), ec.message().c_str());
  }

  out.ok = true;
  out.path = dest.string();
  return out;
}

}  // namespace llm_server_cpp
