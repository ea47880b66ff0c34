#include "llm_server_cpp/sse_frame_parser.hpp"

#include <llm_common/json_utils.hpp>
#include <llm_common/string_utils.hpp>

using namespace std;


namespace llm_server_cpp
{
namespace
{

const char kDataPrefix[] = "data: ";

}  // namespace

bool SseFrameParser::parse_frame(const string & line, string & out_content)
{
  string frame = line;
  if (!frame.empty() && frame.back() == '\r') {
    frame.pop_back();
  }
  if (!llm_common::starts_with(frame, kDataPrefix)) {
    return false;
  }
  const string payload = frame.substr(sizeof(kDataPrefix) - 1);
  if (!llm_common::is_json_object(payload)) {
    return false;
  }
  string content;
  if (!llm_common::extract_json_string_field(payload, "content", content) || content.empty()) {
    return false;
  }
  out_content = content;
  return true;
}

bool SseFrameParser::handle_line(const string & line, const ChunkCallback & on_chunk)
{
  // 프레임 사이 빈 줄은 SSE 구분자
  if (line.empty() || line == "\r") {
    return true;
  }
  string content;
  if (!parse_frame(line, content)) {
    ++skipped_count_;
    return true;
  }
  ++chunk_count_;
  return on_chunk(content);
}

bool SseFrameParser::feed(const char * data, size_t size, const ChunkCallback & on_chunk)
{
  pending_.append(data, size);

  size_t start = 0;
  size_t newline = pending_.find('\n', start);
  while (newline != string::npos) {
    const string line = pending_.substr(start, newline - start);
    start = newline + 1;
    if (!handle_line(line, on_chunk)) {
      pending_.erase(0, start);
      return false;
    }
    newline = pending_.find('\n', start);
  }
  pending_.erase(0, start);
  return true;
}

bool SseFrameParser::finish(const ChunkCallback & on_chunk)
{
  if (pending_.empty()) {
    return true;
  }
  const string line = pending_;
  pending_.clear();
  return handle_line(line, on_chunk);
}

}  // namespace llm_server_cpp
