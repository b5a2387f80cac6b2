#include "stream/sse_decoder.hpp"

#include <boost/json.hpp>

namespace aigate {
namespace json = boost::json;

namespace {

constexpr std::string_view kDataPrefix = "data: ";
constexpr std::string_view kDoneMarker = "[DONE]";

std::string_view trim(std::string_view s) {
  constexpr std::string_view ws = " \t\r\n";
  const auto first = s.find_first_not_of(ws);
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = s.find_last_not_of(ws);
  return s.substr(first, last - first + 1);
}

} // namespace

SseDecoder::Status
SseDecoder::feed(std::string_view bytes,
                 std::vector<data::ChatCompletionChunk> &out) {
  if (done_) {
    return Status::kDone;
  }
  pending_.append(bytes.data(), bytes.size());

  std::size_t start = 0;
  while (!done_) {
    const auto nl = pending_.find('\n', start);
    if (nl == std::string::npos) {
      break;
    }
    handle_line(std::string_view(pending_).substr(start, nl - start), out);
    start = nl + 1;
  }
  pending_.erase(0, done_ ? pending_.size() : start);
  return done_ ? Status::kDone : Status::kContinue;
}

SseDecoder::Status
SseDecoder::finish(std::vector<data::ChatCompletionChunk> &out) {
  if (!done_ && !pending_.empty()) {
    std::string last;
    last.swap(pending_);
    handle_line(last, out);
  }
  return done_ ? Status::kDone : Status::kContinue;
}

void SseDecoder::handle_line(std::string_view raw,
                             std::vector<data::ChatCompletionChunk> &out) {
  const auto line = trim(raw);
  if (line.empty() || line.front() == ':') {
    return;
  }
  if (line.substr(0, kDataPrefix.size()) != kDataPrefix) {
    return;
  }
  const auto payload = line.substr(kDataPrefix.size());
  if (payload == kDoneMarker) {
    done_ = true;
    return;
  }
  boost::system::error_code ec;
  auto jv = json::parse(payload, ec);
  if (ec) {
    ++skipped_;
    return;
  }
  try {
    out.push_back(json::value_to<data::ChatCompletionChunk>(jv));
  } catch (const std::exception &) {
    ++skipped_;
  }
}

} // namespace aigate
