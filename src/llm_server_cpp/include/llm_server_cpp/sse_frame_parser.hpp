#pragma once

#include <cstddef>
#include <functional>
#include <string>

namespace llm_server_cpp
{

/// llama-server 스트리밍 응답("data: {json}" 줄 단위)을 청크로 분해
/// 형식이 맞지 않는 줄은 건너뛰고 개수만 센다
class SseFrameParser
{
public:
  using ChunkCallback = std::function<bool(const std::string & chunk)>;

  /// 수신 바이트를 누적하고 완성된 줄마다 on_chunk 호출. on_chunk 가 false 를 반환하면 false
  bool feed(const char * data, size_t size, const ChunkCallback & on_chunk);

  /// 연결 종료 시 개행 없이 남은 마지막 줄을 처리
  bool finish(const ChunkCallback & on_chunk);

  size_t chunk_count() const { return chunk_count_; }
  size_t skipped_count() const { return skipped_count_; }

  /// 한 줄이 유효한 프레임이고 content 가 비어있지 않으면 true
  static bool parse_frame(const std::string & line, std::string & out_content);

private:
  bool handle_line(const std::string & line, const ChunkCallback & on_chunk);

  std::string pending_;
  size_t chunk_count_ = 0;
  size_t skipped_count_ = 0;
};

}  // namespace llm_server_cpp
