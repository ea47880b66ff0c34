#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace llm_server_cpp
{
namespace test
{

struct FakeRequest
{
  std::string method;
  std::string path;
  std::string body;
};

/// 응답 본문은 chunks 를 순서대로 쓰고 연결을 닫아 끝낸다 (Content-Length 없음)
struct FakeResponse
{
  int status = 200;
  std::string content_type = "application/json";
  std::vector<std::string> chunks;
  int delay_ms = 0;        ///< 헤더 전송 전 대기
  int chunk_delay_ms = 0;  ///< 청크 사이 대기
};

/// 127.0.0.1 임의 포트에서 동작하는 llama-server 대역
class FakeLlamaServer
{
public:
  using Handler = std::function<FakeResponse(const FakeRequest &)>;

  explicit FakeLlamaServer(Handler handler)
  : handler_(std::move(handler))
  {
    listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (listen_fd_ < 0) {
      throw std::runtime_error("socket failed");
    }
    const int one = 1;
    setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    if (bind(listen_fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0 ||
      listen(listen_fd_, 16) != 0)
    {
      close(listen_fd_);
      throw std::runtime_error("bind/listen failed");
    }
    socklen_t len = sizeof(addr);
    getsockname(listen_fd_, reinterpret_cast<sockaddr *>(&addr), &len);
    port_ = ntohs(addr.sin_port);

    accept_thread_ = std::thread([this]() {accept_loop();});
  }

  ~FakeLlamaServer()
  {
    stop();
  }

  void stop()
  {
    if (stopping_.exchange(true)) {
      return;
    }
    if (accept_thread_.joinable()) {
      accept_thread_.join();
    }
    close(listen_fd_);
    std::vector<std::thread> conns;
    {
      std::lock_guard<std::mutex> lock(conn_mutex_);
      conns.swap(conn_threads_);
    }
    for (auto & t : conns) {
      if (t.joinable()) {
        t.join();
      }
    }
  }

  int port() const { return port_; }
  std::string endpoint() const { return "http://127.0.0.1:" + std::to_string(port_); }

  std::vector<FakeRequest> requests() const
  {
    std::lock_guard<std::mutex> lock(req_mutex_);
    return requests_;
  }

  size_t request_count(const std::string & path) const
  {
    std::lock_guard<std::mutex> lock(req_mutex_);
    size_t n = 0;
    for (const auto & r : requests_) {
      if (r.path == path) {
        ++n;
      }
    }
    return n;
  }

  /// 연결 직후 닫아 두면 아무도 듣지 않는 포트가 된다
  static int unused_port()
  {
    const int fd = socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
    socklen_t len = sizeof(addr);
    getsockname(fd, reinterpret_cast<sockaddr *>(&addr), &len);
    close(fd);
    return ntohs(addr.sin_port);
  }

  static std::string sse_frame(const std::string & content)
  {
    return "data: {\"content\":\"" + content + "\",\"stop\":false}\n\n";
  }

private:
  void accept_loop()
  {
    while (!stopping_.load()) {
      pollfd pfd{listen_fd_, POLLIN, 0};
      if (poll(&pfd, 1, 50) <= 0) {
        continue;
      }
      const int fd = accept(listen_fd_, nullptr, nullptr);
      if (fd < 0) {
        continue;
      }
      std::lock_guard<std::mutex> lock(conn_mutex_);
      conn_threads_.emplace_back([this, fd]() {serve(fd);});
    }
  }

  bool read_request(int fd, FakeRequest & req)
  {
    std::string data;
    char buf[4096];
    size_t header_end = std::string::npos;
    while (header_end == std::string::npos) {
      const ssize_t n = recv(fd, buf, sizeof(buf), 0);
      if (n <= 0) {
        return false;
      }
      data.append(buf, static_cast<size_t>(n));
      header_end = data.find("\r\n\r\n");
    }

    const std::string head = data.substr(0, header_end);
    const size_t sp1 = head.find(' ');
    const size_t sp2 = head.find(' ', sp1 + 1);
    if (sp1 == std::string::npos || sp2 == std::string::npos) {
      return false;
    }
    req.method = head.substr(0, sp1);
    req.path = head.substr(sp1 + 1, sp2 - sp1 - 1);

    size_t content_length = 0;
    std::string lower = head;
    for (auto & c : lower) {
      c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
    }
    const size_t cl = lower.find("content-length:");
    if (cl != std::string::npos) {
      content_length = static_cast<size_t>(std::strtoul(head.c_str() + cl + 15, nullptr, 10));
    }

    req.body = data.substr(header_end + 4);
    while (req.body.size() < content_length) {
      const ssize_t n = recv(fd, buf, sizeof(buf), 0);
      if (n <= 0) {
        return false;
      }
      req.body.append(buf, static_cast<size_t>(n));
    }
    return true;
  }

  bool send_all(int fd, const std::string & data)
  {
    size_t sent = 0;
    while (sent < data.size()) {
      const ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
      if (n <= 0) {
        return false;
      }
      sent += static_cast<size_t>(n);
    }
    return true;
  }

  /// stop() 이 호출되면 일찍 깨어난다
  void interruptible_sleep(int ms)
  {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
    while (!stopping_.load() && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
  }

  void serve(int fd)
  {
    FakeRequest req;
    if (read_request(fd, req)) {
      {
        std::lock_guard<std::mutex> lock(req_mutex_);
        requests_.push_back(req);
      }
      const FakeResponse res = handler_(req);
      interruptible_sleep(res.delay_ms);

      std::string head = "HTTP/1.1 " + std::to_string(res.status) + " X\r\n";
      head += "Content-Type: " + res.content_type + "\r\n";
      head += "Connection: close\r\n\r\n";
      bool ok = !stopping_.load() && send_all(fd, head);
      for (size_t i = 0; ok && i < res.chunks.size(); ++i) {
        if (i > 0) {
          interruptible_sleep(res.chunk_delay_ms);
        }
        ok = !stopping_.load() && send_all(fd, res.chunks[i]);
      }
    }
    shutdown(fd, SHUT_RDWR);
    close(fd);
  }

  Handler handler_;
  int listen_fd_ = -1;
  int port_ = 0;
  std::atomic<bool> stopping_{false};
  std::thread accept_thread_;

  std::mutex conn_mutex_;
  std::vector<std::thread> conn_threads_;

  mutable std::mutex req_mutex_;
  std::vector<FakeRequest> requests_;
};

/// /health 만 200 으로 응답하는 핸들러
inline FakeResponse healthy_handler(const FakeRequest & req)
{
  FakeResponse res;
  if (req.path == "/health") {
    res.chunks.push_back("{\"status\":\"ok\"}");
  } else {
    res.status = 404;
  }
  return res;
}

}  // namespace test
}  // namespace llm_server_cpp
