#include "stream/chunk_stream.hpp"

#include <vector>

#include "stream/sse_decoder.hpp"

namespace aigate {

namespace detail {

ChunkChannel::ChunkChannel(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

bool ChunkChannel::push(data::ChatCompletionChunk chunk) {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] {
    return cancelled_.load() || queue_.size() < capacity_;
  });
  if (cancelled_.load()) {
    return false;
  }
  queue_.push_back(std::move(chunk));
  cv_.notify_all();
  return true;
}

void ChunkChannel::close(std::optional<Error> error, std::size_t skipped_lines) {
  std::lock_guard lock(mutex_);
  closed_ = true;
  skipped_ = skipped_lines;
  if (!cancelled_.load()) {
    error_ = std::move(error);
  }
  cv_.notify_all();
}

std::optional<data::ChatCompletionChunk> ChunkChannel::pop() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] {
    return cancelled_.load() || !queue_.empty() || closed_;
  });
  if (cancelled_.load()) {
    return std::nullopt;
  }
  if (!queue_.empty()) {
    auto chunk = std::move(queue_.front());
    queue_.pop_front();
    cv_.notify_all();
    return chunk;
  }
  if (error_) {
    Error err = std::move(*error_);
    error_.reset();
    throw ApiException(std::move(err));
  }
  return std::nullopt;
}

void ChunkChannel::cancel() {
  std::lock_guard lock(mutex_);
  cancelled_.store(true);
  queue_.clear();
  error_.reset();
  cv_.notify_all();
}

std::size_t ChunkChannel::skipped_lines() const {
  std::lock_guard lock(mutex_);
  return skipped_;
}

} // namespace detail

namespace {

void read_chunks(std::shared_ptr<detail::ChunkChannel> channel,
                 std::shared_ptr<IResponseStream> response) {
  Logger lg;
  SseDecoder decoder;
  std::vector<data::ChatCompletionChunk> batch;
  std::optional<Error> failure;

  auto deliver = [&]() {
    for (auto &chunk : batch) {
      if (!channel->push(std::move(chunk))) {
        return false;
      }
    }
    batch.clear();
    return true;
  };

  try {
    while (!channel->cancelled()) {
      auto piece = response->read_some();
      if (!piece) {
        decoder.finish(batch);
        deliver();
        break;
      }
      const auto status = decoder.feed(*piece, batch);
      if (!deliver() || status == SseDecoder::Status::kDone) {
        break;
      }
    }
  } catch (const ApiException &e) {
    failure = e.error();
  } catch (const std::exception &e) {
    failure = make_error(ErrorKind::StreamInterrupted, e.what());
  }

  response->close();
  if (failure && !channel->cancelled()) {
    BOOST_LOG_SEV(lg, trivial::warning)
        << "stream ended with " << to_string(failure->kind) << ": "
        << failure->what;
  }
  if (decoder.skipped_lines() > 0) {
    BOOST_LOG_SEV(lg, trivial::debug)
        << "skipped " << decoder.skipped_lines() << " undecodable data lines";
  }
  channel->close(std::move(failure), decoder.skipped_lines());
}

} // namespace

ChunkStream::ChunkStream(std::shared_ptr<IResponseStream> response,
                         std::size_t capacity)
    : channel_(std::make_shared<detail::ChunkChannel>(capacity)),
      response_(std::move(response)) {
  reader_ = std::thread([channel = channel_, response = response_] {
    read_chunks(channel, response);
  });
}

ChunkStream::~ChunkStream() {
  cancel();
  if (reader_.joinable()) {
    reader_.join();
  }
}

std::optional<data::ChatCompletionChunk> ChunkStream::next() {
  return channel_->pop();
}

void ChunkStream::cancel() {
  if (channel_->cancelled()) {
    return;
  }
  channel_->cancel();
  response_->close();
}

} // namespace aigate
