#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "llm_server_cpp/inference_client.hpp"
#include "llm_server_cpp/server_config.hpp"
#include "llm_server_cpp/server_error.hpp"

namespace llm_server_cpp
{

/// 생산자 1, 소비자 1 청크 큐. close() 이후 남은 청크를 모두 꺼내면 pop 이 false
class TokenChannel
{
public:
  void push(std::string chunk);
  void close();

  bool pop(std::string & out);
  bool pop_for(std::string & out, std::chrono::milliseconds timeout);
  bool try_pop(std::string & out);

  bool closed() const;

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::string> queue_;
  bool closed_ = false;
};

/// 백그라운드에서 실행 중인 생성 요청 1건
class GenerationTask
{
public:
  GenerationTask(uint64_t id, const GenerationRequest & request);

  uint64_t id() const { return id_; }
  const GenerationRequest & request() const { return request_; }

  /// 다음 청크가 올 때까지 대기. 스트림이 끝나고 큐가 비면 false
  bool next_chunk(std::string & out);
  bool next_chunk_for(std::string & out, std::chrono::milliseconds timeout);
  bool try_next_chunk(std::string & out);

  /// 종료 시 1회 발행되는 최종 결과 (전체 텍스트 또는 에러)
  std::shared_future<GenerationResult> result() const { return result_; }
  bool done() const;

  /// 소비 중단. 진행 중인 스트림은 다음 청크에서 연결을 닫는다
  void cancel();
  bool cancelled() const { return cancelled_.load(); }

private:
  friend class StreamingCoordinator;

  void publish_chunk(const std::string & chunk);
  void finish(const GenerationResult & result);

  uint64_t id_;
  GenerationRequest request_;
  TokenChannel channel_;
  std::atomic<bool> cancelled_;
  std::promise<GenerationResult> promise_;
  std::shared_future<GenerationResult> result_;
};

/// 생성 요청마다 전용 스레드를 띄워 InferenceClient 호출을 호출자 흐름에서 분리
class StreamingCoordinator
{
public:
  explicit StreamingCoordinator(std::shared_ptr<const InferenceClient> client);
  ~StreamingCoordinator();

  StreamingCoordinator(const StreamingCoordinator &) = delete;
  StreamingCoordinator & operator=(const StreamingCoordinator &) = delete;

  std::shared_ptr<GenerationTask> submit(const GenerationRequest & request);

  size_t active_tasks() const;

  /// 진행 중인 요청을 모두 취소하고 작업 스레드를 join
  void shutdown();

private:
  struct Worker
  {
    std::shared_ptr<GenerationTask> task;
    std::thread thread;
  };

  void run_task(const std::shared_ptr<GenerationTask> & task) const;
  void reap_finished_workers();

  std::shared_ptr<const InferenceClient> client_;
  mutable std::mutex workers_mutex_;
  std::list<Worker> workers_;
  std::atomic<uint64_t> next_id_;
  std::atomic<bool> shutting_down_;
};

}  // namespace llm_server_cpp
