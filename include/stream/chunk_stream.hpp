#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include "api/api_error.hpp"
#include "data/chat_chunk.hpp"
#include "transport/http_transport.hpp"
#include "util/my_logging.hpp"

namespace aigate {

namespace detail {

// Bounded single-producer/single-consumer hand-off shared between the
// consumer handle and the background reader.
class ChunkChannel {
public:
  explicit ChunkChannel(std::size_t capacity);

  // Blocks while the channel is full. Returns false once cancelled.
  bool push(data::ChatCompletionChunk chunk);
  void close(std::optional<Error> error, std::size_t skipped_lines);

  std::optional<data::ChatCompletionChunk> pop();
  void cancel();

  bool cancelled() const { return cancelled_.load(); }
  std::size_t skipped_lines() const;

private:
  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<data::ChatCompletionChunk> queue_;
  bool closed_{false};
  std::optional<Error> error_;
  std::size_t skipped_{0};
  std::atomic<bool> cancelled_{false};
};

} // namespace detail

// Consumer side of a streamed chat completion. A reader thread owned by the
// stream pulls bytes from the response, decodes them with SseDecoder and hands
// chunks over through a bounded buffer.
//
// Destroying the stream cancels it and joins the reader.
class ChunkStream {
public:
  ChunkStream(std::shared_ptr<IResponseStream> response, std::size_t capacity);
  ~ChunkStream();

  ChunkStream(const ChunkStream &) = delete;
  ChunkStream &operator=(const ChunkStream &) = delete;

  // Blocks for the next chunk. std::nullopt when the stream ended normally or
  // was cancelled. A transport failure while reading is rethrown here as
  // ApiException (Timeout or StreamInterrupted) after the chunks that were
  // decoded before it.
  std::optional<data::ChatCompletionChunk> next();

  // Stops delivery and closes the connection. Safe from any thread.
  void cancel();

  bool cancelled() const { return channel_->cancelled(); }

  // Data lines dropped because they did not decode; final once next() has
  // returned std::nullopt.
  std::size_t skipped_lines() const { return channel_->skipped_lines(); }

private:
  std::shared_ptr<detail::ChunkChannel> channel_;
  std::shared_ptr<IResponseStream> response_;
  std::thread reader_;
};

} // namespace aigate
