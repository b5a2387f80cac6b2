#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>

#include "fake_http_transport.hpp"
#include "stream/chunk_stream.hpp"

namespace {

using aigate::ErrorKind;

std::string chunk_line(const std::string &content) {
  return R"(data: {"id":"c1","object":"chat.completion.chunk","created":1,"model":"m","choices":[{"index":0,"delta":{"content":")" +
         content + R"("},"finish_reason":null}]})" + "\n";
}

std::shared_ptr<testinfra::FakeResponseStream>
make_stream(testinfra::FakeStreamSpec spec) {
  return std::make_shared<testinfra::FakeResponseStream>(std::move(spec));
}

TEST(ChunkStreamTest, DeliversChunksInOrderThenEnds) {
  testinfra::FakeStreamSpec spec;
  spec.pieces = {chunk_line("a"), chunk_line("b").substr(0, 20),
                 chunk_line("b").substr(20) + chunk_line("c"),
                 "data: [DONE]\n"};
  auto response = make_stream(spec);
  {
    aigate::ChunkStream stream(response, 1);
    std::string text;
    while (auto chunk = stream.next()) {
      text += chunk->content();
    }
    EXPECT_EQ(text, "abc");
    EXPECT_FALSE(stream.next().has_value());
    EXPECT_EQ(stream.skipped_lines(), 0u);
  }
  EXPECT_TRUE(response->closed());
}

TEST(ChunkStreamTest, StopsReadingAfterDoneMarker) {
  testinfra::FakeStreamSpec spec;
  spec.pieces = {chunk_line("a") + "data: [DONE]\n", chunk_line("late")};
  auto response = make_stream(spec);
  aigate::ChunkStream stream(response, 4);
  auto first = stream.next();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->content(), "a");
  EXPECT_FALSE(stream.next().has_value());
  EXPECT_EQ(response->pieces_read(), 1u);
}

TEST(ChunkStreamTest, EndOfBodyWithoutDoneMarkerEndsNormally) {
  testinfra::FakeStreamSpec spec;
  spec.pieces = {chunk_line("a"), "data: {broken\n", chunk_line("b")};
  aigate::ChunkStream stream(make_stream(spec), 4);
  std::string text;
  while (auto chunk = stream.next()) {
    text += chunk->content();
  }
  EXPECT_EQ(text, "ab");
  EXPECT_EQ(stream.skipped_lines(), 1u);
}

TEST(ChunkStreamTest, TransportFailureSurfacesAfterDecodedChunks) {
  testinfra::FakeStreamSpec spec;
  spec.pieces = {chunk_line("partial")};
  spec.fail_at_end =
      aigate::make_error(ErrorKind::StreamInterrupted, "connection reset");
  aigate::ChunkStream stream(make_stream(spec), 4);

  auto first = stream.next();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->content(), "partial");
  try {
    stream.next();
    FAIL() << "expected StreamInterrupted";
  } catch (const aigate::ApiException &e) {
    EXPECT_EQ(e.kind(), ErrorKind::StreamInterrupted);
  }
  EXPECT_FALSE(stream.next().has_value());
}

TEST(ChunkStreamTest, CancelUnblocksConsumerWithoutError) {
  testinfra::FakeStreamSpec spec;
  spec.pieces = {chunk_line("a")};
  spec.hang_at_end = true;
  auto response = make_stream(spec);
  aigate::ChunkStream stream(response, 4);

  ASSERT_TRUE(stream.next().has_value());
  auto pending = std::async(std::launch::async, [&] { return stream.next(); });
  EXPECT_EQ(pending.wait_for(std::chrono::milliseconds(50)),
            std::future_status::timeout);

  stream.cancel();
  ASSERT_EQ(pending.wait_for(std::chrono::seconds(5)),
            std::future_status::ready);
  EXPECT_FALSE(pending.get().has_value());
  EXPECT_TRUE(stream.cancelled());
  EXPECT_TRUE(response->closed());
  EXPECT_NO_THROW(stream.cancel());
}

TEST(ChunkStreamTest, CancelDiscardsBufferedChunks) {
  testinfra::FakeStreamSpec spec;
  spec.pieces = {chunk_line("a") + chunk_line("b") + chunk_line("c")};
  spec.hang_at_end = true;
  aigate::ChunkStream stream(make_stream(spec), 8);
  ASSERT_TRUE(stream.next().has_value());
  stream.cancel();
  EXPECT_FALSE(stream.next().has_value());
}

TEST(ChunkStreamTest, DestroyingStreamReleasesBlockedReader) {
  testinfra::FakeStreamSpec spec;
  spec.pieces = {chunk_line("a") + chunk_line("b") + chunk_line("c")};
  spec.hang_at_end = true;
  auto response = make_stream(spec);
  auto stream = std::make_unique<aigate::ChunkStream>(response, 1);
  std::this_thread::sleep_for(std::chrono::milliseconds(20));

  auto destroyed =
      std::async(std::launch::async, [&stream] { stream.reset(); });
  ASSERT_EQ(destroyed.wait_for(std::chrono::seconds(5)),
            std::future_status::ready);
  EXPECT_TRUE(response->closed());
}

TEST(ChunkStreamTest, DestroyingStreamClosesResponse) {
  testinfra::FakeStreamSpec spec;
  spec.pieces = {chunk_line("a")};
  spec.hang_at_end = true;
  auto response = make_stream(spec);
  {
    aigate::ChunkStream stream(response, 4);
    ASSERT_TRUE(stream.next().has_value());
  }
  EXPECT_TRUE(response->closed());
}

} // namespace
