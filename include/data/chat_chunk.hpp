#pragma once

#include <boost/json.hpp>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace aigate::data {
namespace json = boost::json;

namespace detail {

inline std::optional<std::string> optional_string(const json::object &jo,
                                                  std::string_view key) {
  if (auto *p = jo.if_contains(key)) {
    if (p->is_string()) {
      return json::value_to<std::string>(*p);
    }
    if (!p->is_null()) {
      throw std::runtime_error(std::string(key) + " is not a string");
    }
  }
  return std::nullopt;
}

inline std::int64_t required_int(const json::object &jo, std::string_view key) {
  const auto &v = jo.at(key);
  if (v.is_int64()) {
    return v.as_int64();
  }
  if (v.is_uint64()) {
    return static_cast<std::int64_t>(v.as_uint64());
  }
  throw std::runtime_error(std::string(key) + " is not an integer");
}

} // namespace detail

// data: {"id":"chatcmpl-1","object":"chat.completion.chunk","created":1700000000,
//        "model":"gpt-4o-mini",
//        "choices":[{"index":0,"delta":{"role":"assistant","content":"Hi"},
//                    "finish_reason":null}],
//        "usage":{"prompt_tokens":5,"completion_tokens":1,"total_tokens":6}}

struct ChunkDelta {
  std::optional<std::string> role;
  std::optional<std::string> content;

  friend ChunkDelta tag_invoke(const json::value_to_tag<ChunkDelta> &,
                               const json::value &jv) {
    const auto &jo = jv.as_object();
    ChunkDelta d;
    d.role = detail::optional_string(jo, "role");
    d.content = detail::optional_string(jo, "content");
    return d;
  }
};

struct ChunkChoice {
  std::int64_t index{0};
  ChunkDelta delta;
  std::optional<std::string> finish_reason;

  friend ChunkChoice tag_invoke(const json::value_to_tag<ChunkChoice> &,
                                const json::value &jv) {
    const auto &jo = jv.as_object();
    ChunkChoice c;
    c.index = detail::required_int(jo, "index");
    c.delta = json::value_to<ChunkDelta>(jo.at("delta"));
    c.finish_reason = detail::optional_string(jo, "finish_reason");
    return c;
  }
};

struct Usage {
  std::int64_t prompt_tokens{0};
  std::int64_t completion_tokens{0};
  std::int64_t total_tokens{0};

  friend Usage tag_invoke(const json::value_to_tag<Usage> &,
                          const json::value &jv) {
    const auto &jo = jv.as_object();
    Usage u;
    u.prompt_tokens = detail::required_int(jo, "prompt_tokens");
    u.completion_tokens = detail::required_int(jo, "completion_tokens");
    u.total_tokens = detail::required_int(jo, "total_tokens");
    return u;
  }
};

// Throws (std::exception) when a required member is missing or mistyped.
struct ChatCompletionChunk {
  std::string id;
  std::string object;
  std::int64_t created{0};
  std::string model;
  std::vector<ChunkChoice> choices;
  std::optional<Usage> usage;

  // Concatenated delta content of all choices.
  std::string content() const {
    std::string out;
    for (const auto &c : choices) {
      if (c.delta.content) {
        out += *c.delta.content;
      }
    }
    return out;
  }

  friend ChatCompletionChunk
  tag_invoke(const json::value_to_tag<ChatCompletionChunk> &,
             const json::value &jv) {
    const auto &jo = jv.as_object();
    ChatCompletionChunk chunk;
    chunk.id = json::value_to<std::string>(jo.at("id"));
    chunk.object = json::value_to<std::string>(jo.at("object"));
    chunk.created = detail::required_int(jo, "created");
    chunk.model = json::value_to<std::string>(jo.at("model"));
    chunk.choices = json::value_to<std::vector<ChunkChoice>>(jo.at("choices"));
    if (auto *u = jo.if_contains("usage"); u && !u->is_null()) {
      chunk.usage = json::value_to<Usage>(*u);
    }
    return chunk;
  }
};

} // namespace aigate::data
