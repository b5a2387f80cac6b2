#include "handlers/request_handler.hpp"

#include <fmt/format.h>

#include "api/api_error.hpp"

namespace aigate {

std::optional<json::value> parse_cli_body(const CliCtx &cli_ctx) {
  if (!cli_ctx.params.body) {
    return std::nullopt;
  }
  boost::system::error_code ec;
  auto jv = json::parse(*cli_ctx.params.body, ec);
  if (ec) {
    throw ApiException(make_error(
        ErrorKind::EncodingFailed,
        fmt::format("--body is not valid JSON: {}", ec.message())));
  }
  return jv;
}

void RequestHandler::start() {
  auto path = cli_ctx_.positional_at(1);
  if (!path) {
    throw std::runtime_error(
        fmt::format("usage: aigate {} <path> [--body JSON]", command()));
  }
  if (command() == "stream") {
    run_stream(*path);
  } else {
    run_post(*path);
  }
}

void RequestHandler::run_post(const std::string &path) {
  auto response =
      client_.orchestrator().send(http::verb::post, path, parse_cli_body(cli_ctx_));
  output_hub_.out() << json::serialize(response.data) << std::endl;
  if (response.billing) {
    output_hub_.info() << fmt::format(
                              "credits used={} remaining={} overage={}",
                              response.billing->credits_used_cents,
                              response.billing->credits_remaining_cents,
                              response.billing->is_overage)
                       << std::endl;
  }
}

void RequestHandler::run_stream(const std::string &path) {
  auto body = parse_cli_body(cli_ctx_);
  if (!body || !body->is_object()) {
    throw std::runtime_error("stream requires --body with a JSON object");
  }
  body->as_object()["stream"] = true;

  auto stream =
      client_.orchestrator().send_streaming(http::verb::post, path, *body);
  std::size_t chunks = 0;
  while (auto chunk = stream->next()) {
    ++chunks;
    output_hub_.out() << chunk->content() << std::flush;
    if (chunk->usage) {
      output_hub_.debug() << "\nusage: prompt=" << chunk->usage->prompt_tokens
                          << " completion=" << chunk->usage->completion_tokens
                          << " total=" << chunk->usage->total_tokens
                          << std::endl;
    }
  }
  output_hub_.out() << std::endl;
  BOOST_LOG_SEV(lg, trivial::debug)
      << "stream " << path << " delivered " << chunks << " chunks, skipped "
      << stream->skipped_lines() << " lines";
}

} // namespace aigate
