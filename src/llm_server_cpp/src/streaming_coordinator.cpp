#include "llm_server_cpp/streaming_coordinator.hpp"

#include <rclcpp/rclcpp.hpp>

#include <exception>
#include <utility>

using namespace std;


namespace llm_server_cpp
{
namespace
{

rclcpp::Logger logger()
{
  return rclcpp::get_logger("streaming_coordinator");
}

}  // namespace

void TokenChannel::push(string chunk)
{
  {
    lock_guard<mutex> lock(mutex_);
    if (closed_) {
      return;
    }
    queue_.push_back(move(chunk));
  }
  cv_.notify_one();
}

void TokenChannel::close()
{
  {
    lock_guard<mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool TokenChannel::pop(string & out)
{
  unique_lock<mutex> lock(mutex_);
  cv_.wait(lock, [this]() {return !queue_.empty() || closed_;});
  if (queue_.empty()) {
    return false;
  }
  out = move(queue_.front());
  queue_.pop_front();
  return true;
}

bool TokenChannel::pop_for(string & out, chrono::milliseconds timeout)
{
  unique_lock<mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [this]() {return !queue_.empty() || closed_;});
  if (queue_.empty()) {
    return false;
  }
  out = move(queue_.front());
  queue_.pop_front();
  return true;
}

bool TokenChannel::try_pop(string & out)
{
  lock_guard<mutex> lock(mutex_);
  if (queue_.empty()) {
    return false;
  }
  out = move(queue_.front());
  queue_.pop_front();
  return true;
}

bool TokenChannel::closed() const
{
  lock_guard<mutex> lock(mutex_);
  return closed_;
}

GenerationTask::GenerationTask(uint64_t id, const GenerationRequest & request)
: id_(id), request_(request), cancelled_(false), result_(promise_.get_future().share())
{
}

bool GenerationTask::next_chunk(string & out)
{
  return channel_.pop(out);
}

bool GenerationTask::next_chunk_for(string & out, chrono::milliseconds timeout)
{
  return channel_.pop_for(out, timeout);
}

bool GenerationTask::try_next_chunk(string & out)
{
  return channel_.try_pop(out);
}

bool GenerationTask::done() const
{
  return result_.wait_for(chrono::seconds(0)) == future_status::ready;
}

void GenerationTask::cancel()
{
  cancelled_.store(true);
}

void GenerationTask::publish_chunk(const string & chunk)
{
  channel_.push(chunk);
}

void GenerationTask::finish(const GenerationResult & result)
{
  // 채널을 먼저 닫아 결과가 준비된 시점에는 더 이상 청크가 오지 않음을 보장
  channel_.close();
  promise_.set_value(result);
}

StreamingCoordinator::StreamingCoordinator(shared_ptr<const InferenceClient> client)
: client_(move(client)), next_id_(1), shutting_down_(false)
{
}

StreamingCoordinator::~StreamingCoordinator()
{
  shutdown();
}

shared_ptr<GenerationTask> StreamingCoordinator::submit(const GenerationRequest & request)
{
  auto task = make_shared<GenerationTask>(next_id_.fetch_add(1), request);

  if (shutting_down_.load() || !client_) {
    GenerationResult res;
    res.code = ServerErrorCode::CANCELLED;
    res.error = client_ ? "coordinator is shutting down" : "inference client is not initialized";
    task->finish(res);
    return task;
  }

  reap_finished_workers();

  lock_guard<mutex> lock(workers_mutex_);
  // shutdown() 이 목록을 비운 뒤라면 여기서 넣은 작업자는 취소되지 않는다
  if (shutting_down_.load()) {
    GenerationResult res;
    res.code = ServerErrorCode::CANCELLED;
    res.error = "coordinator is shutting down";
    task->finish(res);
    return task;
  }
  Worker worker;
  worker.task = task;
  worker.thread = thread(&StreamingCoordinator::run_task, this, task);
  workers_.push_back(move(worker));
  return task;
}

/// 작업 스레드 본체: 스트리밍이면 청크를 채널로 흘리고, 끝나면 최종 결과를 1회 발행
void StreamingCoordinator::run_task(const shared_ptr<GenerationTask> & task) const
{
  GenerationResult res;
  try {
    if (task->request().stream) {
      res = client_->generate_stream(
        task->request(),
        [&task](const string & chunk) {
          if (task->cancelled()) {
            return false;
          }
          task->publish_chunk(chunk);
          return true;
        },
        &task->cancelled_);
    } else {
      res = client_->generate(task->request(), &task->cancelled_);
    }
  } catch (const exception & e) {
    res = GenerationResult();
    res.code = ServerErrorCode::GENERATION_FAILURE;
    res.error = string("Generation failed: ") + e.what();
  }

  if (!res.ok && res.code != ServerErrorCode::CANCELLED) {
    RCLCPP_WARN(
      logger(), "generation #%llu failed (%s): %s",
      static_cast<unsigned long long>(task->id()),
      error_code_string(res.code).c_str(), res.error.c_str());
  }
  task->finish(res);
}

void StreamingCoordinator::reap_finished_workers()
{
  list<Worker> finished;
  {
    lock_guard<mutex> lock(workers_mutex_);
    for (auto it = workers_.begin(); it != workers_.end(); ) {
      if (it->task->done()) {
        finished.splice(finished.end(), workers_, it++);
      } else {
        ++it;
      }
    }
  }
  for (auto & worker : finished) {
    if (worker.thread.joinable()) {
      worker.thread.join();
    }
  }
}

size_t StreamingCoordinator::active_tasks() const
{
  lock_guard<mutex> lock(workers_mutex_);
  size_t count = 0;
  for (const auto & worker : workers_) {
    if (!worker.task->done()) {
      ++count;
    }
  }
  return count;
}

void StreamingCoordinator::shutdown()
{
  shutting_down_.store(true);

  list<Worker> workers;
  {
    lock_guard<mutex> lock(workers_mutex_);
    workers.swap(workers_);
  }
  for (auto & worker : workers) {
    worker.task->cancel();
  }
  for (auto & worker : workers) {
    if (worker.thread.joinable()) {
      worker.thread.join();
    }
  }
}

}  // namespace llm_server_cpp
