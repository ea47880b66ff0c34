#include <gtest/gtest.h>

#include "fake_llama_server.hpp"
#include "llm_server_cpp/health_prober.hpp"
#include "llm_server_cpp/inference_client.hpp"

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace std;
using llm_server_cpp::GenerationRequest;
using llm_server_cpp::GenerationResult;
using llm_server_cpp::HealthProber;
using llm_server_cpp::InferenceClient;
using llm_server_cpp::ServerErrorCode;
using llm_server_cpp::test::FakeLlamaServer;
using llm_server_cpp::test::FakeRequest;
using llm_server_cpp::test::FakeResponse;


namespace
{

/// 결정적 서버: stream=true 면 세 조각, 아니면 한 번에 같은 텍스트
FakeResponse deterministic_handler(const FakeRequest & req)
{
  FakeResponse res;
  if (req.path == "/health") {
    res.chunks.push_back("{\"status\":\"ok\"}");
    return res;
  }
  if (req.body.find("\"stream\":true") != string::npos) {
    res.content_type = "text/event-stream";
    res.chunks = {
      FakeLlamaServer::sse_frame("Hello"),
      FakeLlamaServer::sse_frame(","),
      "data: {broken\n\n",
      FakeLlamaServer::sse_frame(" world"),
      "data: {\"content\":\"\",\"stop\":true}\n\n"};
    return res;
  }
  res.chunks.push_back("{\"content\":\"Hello, world\",\"stop\":true,\"tokens_predicted\":3}");
  return res;
}

GenerationRequest make_prompt(const string & prompt, bool stream)
{
  GenerationRequest req;
  req.prompt = prompt;
  req.max_tokens = 16;
  req.temperature = 0.0;
  req.stream = stream;
  return req;
}

}  // namespace

TEST(ServerError, CodeStringsAndResultBuilders)
{
  EXPECT_EQ(llm_server_cpp::error_code_string(ServerErrorCode::SERVER_UNREACHABLE), "server_unreachable");
  EXPECT_EQ(llm_server_cpp::error_code_string(ServerErrorCode::CANCELLED), "cancelled");

  const auto ok = llm_server_cpp::make_server_ok("Server stopped");
  EXPECT_TRUE(ok.ok);
  EXPECT_EQ(ok.code, ServerErrorCode::NONE);
  EXPECT_EQ(ok.message, "Server stopped");

  const auto err = llm_server_cpp::make_server_error(ServerErrorCode::STOP_FAILURE, "boom");
  EXPECT_FALSE(err.ok);
  EXPECT_EQ(err.code, ServerErrorCode::STOP_FAILURE);
  EXPECT_EQ(err.message, "boom");
}

TEST(HealthProber, HealthyServerAnswers200)
{
  FakeLlamaServer server(llm_server_cpp::test::healthy_handler);
  EXPECT_TRUE(HealthProber(server.endpoint(), 2).probe());
  EXPECT_EQ(server.request_count("/health"), 1u);
}

TEST(HealthProber, NeverThrowsAndReportsFalse)
{
  const int port = FakeLlamaServer::unused_port();
  EXPECT_FALSE(HealthProber("http://127.0.0.1:" + to_string(port), 1).probe());
  EXPECT_FALSE(HealthProber("not a url at all", 1).probe());
  EXPECT_FALSE(HealthProber("", 1).probe());
  EXPECT_FALSE(HealthProber("ftp://[::1", 1).probe());
}

TEST(HealthProber, Non200IsUnhealthy)
{
  FakeLlamaServer server([](const FakeRequest &) {
      FakeResponse res;
      res.status = 503;
      res.chunks.push_back("{\"error\":\"loading model\"}");
      return res;
    });
  EXPECT_FALSE(HealthProber(server.endpoint(), 2).probe());
}

TEST(HealthProber, SlowServerTimesOut)
{
  FakeLlamaServer server([](const FakeRequest &) {
      FakeResponse res;
      res.delay_ms = 3000;
      return res;
    });
  const auto begin = chrono::steady_clock::now();
  EXPECT_FALSE(HealthProber(server.endpoint(), 1).probe());
  EXPECT_LT(chrono::steady_clock::now() - begin, chrono::milliseconds(2500));
}

TEST(InferenceClient, BuildsCompletionBody)
{
  GenerationRequest req = make_prompt("say \"hi\"\n", false);
  req.temperature = 0.5;
  EXPECT_EQ(
    InferenceClient::build_completion_body(req, false),
    "{\"prompt\":\"say \\\"hi\\\"\\n\",\"n_predict\":16,\"temperature\":0.5,\"stream\":false}");
}

TEST(InferenceClient, GenerateReturnsContent)
{
  FakeLlamaServer server(deterministic_handler);
  const InferenceClient client(server.endpoint() + "/", 10);

  const GenerationResult res = client.generate(make_prompt("hi", false));
  ASSERT_TRUE(res.ok) << res.error;
  EXPECT_EQ(res.text, "Hello, world");

  const auto requests = server.requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0].method, "POST");
  EXPECT_EQ(requests[0].path, "/completion");
  EXPECT_NE(requests[0].body.find("\"stream\":false"), string::npos);
  EXPECT_NE(requests[0].body.find("\"n_predict\":16"), string::npos);
}

TEST(InferenceClient, StreamedChunksConcatenateToBlockingResult)
{
  FakeLlamaServer server(deterministic_handler);
  const InferenceClient client(server.endpoint(), 10);

  const GenerationResult blocking = client.generate(make_prompt("hi", false));
  ASSERT_TRUE(blocking.ok) << blocking.error;

  vector<string> chunks;
  const GenerationResult streamed = client.generate_stream(
    make_prompt("hi", true), [&chunks](const string & chunk) {
      chunks.push_back(chunk);
      return true;
    });
  ASSERT_TRUE(streamed.ok) << streamed.error;

  ASSERT_EQ(chunks.size(), 3u);
  EXPECT_EQ(chunks[0], "Hello");
  EXPECT_EQ(chunks[1], ",");
  EXPECT_EQ(chunks[2], " world");
  EXPECT_EQ(streamed.chunk_count, 3u);

  string joined;
  for (const auto & c : chunks) {
    joined += c;
  }
  EXPECT_EQ(joined, blocking.text);
  EXPECT_EQ(streamed.text, blocking.text);
}

TEST(InferenceClient, UnreachableIsDistinctFromTimeout)
{
  const int port = FakeLlamaServer::unused_port();
  const InferenceClient down("http://127.0.0.1:" + to_string(port), 1);
  const GenerationResult unreachable = down.generate(make_prompt("hi", false));
  EXPECT_FALSE(unreachable.ok);
  EXPECT_EQ(unreachable.code, ServerErrorCode::SERVER_UNREACHABLE);
  EXPECT_NE(unreachable.error.find("Start the server"), string::npos);

  FakeLlamaServer slow([](const FakeRequest &) {
      FakeResponse res;
      res.delay_ms = 3000;
      res.chunks.push_back("{\"content\":\"late\"}");
      return res;
    });
  const InferenceClient client(slow.endpoint(), 1);
  const GenerationResult timed_out = client.generate(make_prompt("hi", false));
  EXPECT_FALSE(timed_out.ok);
  EXPECT_EQ(timed_out.code, ServerErrorCode::REQUEST_TIMEOUT);
  EXPECT_NE(timed_out.error.find("timed out"), string::npos);
}

TEST(InferenceClient, StreamAgainstUnreachableServer)
{
  const int port = FakeLlamaServer::unused_port();
  const InferenceClient down("http://127.0.0.1:" + to_string(port), 1);
  size_t calls = 0;
  const GenerationResult res = down.generate_stream(
    make_prompt("hi", true), [&calls](const string &) {
      ++calls;
      return true;
    });
  EXPECT_FALSE(res.ok);
  EXPECT_EQ(res.code, ServerErrorCode::SERVER_UNREACHABLE);
  EXPECT_EQ(calls, 0u);
}

TEST(InferenceClient, HttpErrorIsGenerationFailure)
{
  FakeLlamaServer server([](const FakeRequest &) {
      FakeResponse res;
      res.status = 500;
      res.chunks.push_back("{\"error\":\"context overflow\"}");
      return res;
    });
  const InferenceClient client(server.endpoint(), 5);
  const GenerationResult res = client.generate(make_prompt("hi", false));
  EXPECT_FALSE(res.ok);
  EXPECT_EQ(res.code, ServerErrorCode::GENERATION_FAILURE);
  EXPECT_NE(res.error.find("http_500"), string::npos);
}

TEST(InferenceClient, NonJsonResponseIsGenerationFailure)
{
  FakeLlamaServer server([](const FakeRequest &) {
      FakeResponse res;
      res.content_type = "text/html";
      res.chunks.push_back("<html>proxy error</html>");
      return res;
    });
  const InferenceClient client(server.endpoint(), 5);
  const GenerationResult res = client.generate(make_prompt("hi", false));
  EXPECT_FALSE(res.ok);
  EXPECT_EQ(res.code, ServerErrorCode::GENERATION_FAILURE);
}

TEST(InferenceClient, ConsumerCanAbandonStream)
{
  FakeLlamaServer server([](const FakeRequest &) {
      FakeResponse res;
      res.content_type = "text/event-stream";
      for (int i = 0; i < 50; ++i) {
        res.chunks.push_back(FakeLlamaServer::sse_frame("t" + to_string(i)));
      }
      res.chunk_delay_ms = 50;
      return res;
    });
  const InferenceClient client(server.endpoint(), 10);

  vector<string> chunks;
  const auto begin = chrono::steady_clock::now();
  const GenerationResult res = client.generate_stream(
    make_prompt("hi", true), [&chunks](const string & chunk) {
      chunks.push_back(chunk);
      return chunks.size() < 2;
    });
  EXPECT_FALSE(res.ok);
  EXPECT_EQ(res.code, ServerErrorCode::CANCELLED);
  EXPECT_EQ(chunks.size(), 2u);
  EXPECT_LT(chrono::steady_clock::now() - begin, chrono::seconds(2));
}

TEST(InferenceClient, CancelFlagInterruptsBlockingRequest)
{
  FakeLlamaServer server([](const FakeRequest &) {
      FakeResponse res;
      res.delay_ms = 8000;
      res.chunks.push_back("{\"content\":\"late\"}");
      return res;
    });
  const InferenceClient client(server.endpoint(), 30);

  atomic<bool> cancel(false);
  thread canceller([&cancel]() {
      this_thread::sleep_for(chrono::milliseconds(200));
      cancel.store(true);
    });
  const auto begin = chrono::steady_clock::now();
  const GenerationResult res = client.generate(make_prompt("hi", false), &cancel);
  canceller.join();

  EXPECT_FALSE(res.ok);
  EXPECT_EQ(res.code, ServerErrorCode::CANCELLED);
  EXPECT_LT(chrono::steady_clock::now() - begin, chrono::seconds(5));
}
