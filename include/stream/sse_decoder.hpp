#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "data/chat_chunk.hpp"

namespace aigate {

// Incremental decoder for newline-delimited server-sent events carrying
// chat completion chunks. Bytes may be split anywhere, including inside a
// UTF-8 sequence; only complete lines are interpreted.
class SseDecoder {
public:
  enum class Status { kContinue, kDone };

  // Appends decoded chunks to out. Returns kDone once "data: [DONE]" has been
  // seen; input after that is ignored.
  Status feed(std::string_view bytes, std::vector<data::ChatCompletionChunk> &out);

  // End of input: interprets a trailing line that has no newline.
  Status finish(std::vector<data::ChatCompletionChunk> &out);

  bool done() const { return done_; }
  std::size_t skipped_lines() const { return skipped_; }

private:
  void handle_line(std::string_view line,
                   std::vector<data::ChatCompletionChunk> &out);

  std::string pending_;
  bool done_{false};
  std::size_t skipped_{0};
};

} // namespace aigate
