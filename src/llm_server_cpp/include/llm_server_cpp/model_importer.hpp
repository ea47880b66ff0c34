#pragma once

#include <atomic>
#include <functional>
#include <string>

namespace llm_server_cpp
{

struct ImportResult
{
  bool ok = false;
  std::string path;   ///< 복사된 파일 경로 (성공 시)
  std::string error;
};

/// 모델 파일을 모델 디렉터리로 1 MiB 단위 복사 (진행률 보고, 취소 가능)
class ModelImporter
{
public:
  using ProgressCallback = std::function<void(int percent)>;

  ModelImporter();

  /// busy 를 점유하고 취소 플래그를 초기화. 이미 진행 중이면 false
  bool try_begin();

  /// try_begin() 후 호출. 끝나면 busy 를 해제한다
  ImportResult run(
    const std::string & source, const std::string & dest_dir,
    const ProgressCallback & on_progress = ProgressCallback());

  /// try_begin() + run()
  ImportResult import(
    const std::string & source, const std::string & dest_dir,
    const ProgressCallback & on_progress = ProgressCallback());

  /// 다른 스레드에서 호출 가능. 진행 중인 복사는 다음 청크에서 중단되고 부분 파일은 삭제된다
  void cancel();
  bool busy() const { return busy_.load(); }

private:
  std::atomic<bool> cancel_requested_;
  std::atomic<bool> busy_;
};

}  // namespace llm_server_cpp
