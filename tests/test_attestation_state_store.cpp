#include <gtest/gtest.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <set>
#include <thread>
#include <vector>

#include "state/attestation_state_store.hpp"
#include "test_config_utils.hpp"

namespace {

using aigate::AttestationKeySlot;

class AttestationStateStoreTest : public ::testing::Test {
protected:
  testinfra::TempDir runtime_{"aigate-state"};
  aigate::AigateConfigProviderStatic config_{
      testinfra::make_test_config(runtime_.path)};
};

TEST_F(AttestationStateStoreTest, CounterStartsAtZero) {
  aigate::SqliteAttestationStateStore store(config_);
  EXPECT_TRUE(store.available());
  EXPECT_EQ(store.get_counter(), 0);
}

TEST_F(AttestationStateStoreTest, IncrementIsMonotonicAndPersists) {
  {
    aigate::SqliteAttestationStateStore store(config_);
    for (std::int64_t expected = 1; expected <= 3; ++expected) {
      auto [value, err] = store.increment_counter();
      ASSERT_FALSE(err.has_value()) << *err;
      EXPECT_EQ(value, expected);
    }
  }
  aigate::SqliteAttestationStateStore reopened(config_);
  EXPECT_EQ(reopened.get_counter(), 3);
  auto [value, err] = reopened.increment_counter();
  ASSERT_FALSE(err.has_value());
  EXPECT_EQ(value, 4);
}

TEST_F(AttestationStateStoreTest, ConcurrentIncrementsYieldDistinctValues) {
  aigate::SqliteAttestationStateStore store(config_);
  ASSERT_FALSE(store.increment_counter().second.has_value());
  const std::int64_t start = store.get_counter();

  constexpr int kThreads = 8;
  constexpr int kPerThread = 25;
  std::vector<std::vector<std::int64_t>> seen(kThreads);
  std::vector<std::thread> workers;
  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([&, t] {
      for (int i = 0; i < kPerThread; ++i) {
        auto [value, err] = store.increment_counter();
        if (!err) {
          seen[t].push_back(value);
        }
      }
    });
  }
  for (auto &w : workers) {
    w.join();
  }

  std::set<std::int64_t> all;
  for (const auto &values : seen) {
    all.insert(values.begin(), values.end());
  }
  constexpr std::int64_t kTotal = kThreads * kPerThread;
  ASSERT_EQ(all.size(), static_cast<std::size_t>(kTotal));
  EXPECT_EQ(*all.begin(), start + 1);
  EXPECT_EQ(*all.rbegin(), start + kTotal);
  EXPECT_EQ(store.get_counter(), start + kTotal);
}

TEST_F(AttestationStateStoreTest, ClearCounterResetsToZero) {
  aigate::SqliteAttestationStateStore store(config_);
  ASSERT_FALSE(store.increment_counter().second.has_value());
  ASSERT_FALSE(store.increment_counter().second.has_value());
  EXPECT_FALSE(store.clear_counter().has_value());
  EXPECT_EQ(store.get_counter(), 0);
  EXPECT_EQ(store.increment_counter().first, 1);
}

TEST_F(AttestationStateStoreTest, KeySlotsAreIndependent) {
  aigate::SqliteAttestationStateStore store(config_);
  EXPECT_FALSE(store.get_key_id(AttestationKeySlot::Hardware).has_value());
  ASSERT_FALSE(
      store.save_key_id(AttestationKeySlot::Simulator, "SIM-1").has_value());
  EXPECT_FALSE(store.get_key_id(AttestationKeySlot::Hardware).has_value());
  EXPECT_EQ(store.get_key_id(AttestationKeySlot::Simulator).value(), "SIM-1");

  ASSERT_FALSE(
      store.save_key_id(AttestationKeySlot::Hardware, "HW-1").has_value());
  ASSERT_FALSE(store.clear_key_id(AttestationKeySlot::Simulator).has_value());
  EXPECT_FALSE(store.get_key_id(AttestationKeySlot::Simulator).has_value());
  EXPECT_EQ(store.get_key_id(AttestationKeySlot::Hardware).value(), "HW-1");
}

TEST_F(AttestationStateStoreTest, KeyIdsAreNotStoredInPlaintext) {
  {
    aigate::SqliteAttestationStateStore store(config_);
    ASSERT_FALSE(store
                     .save_key_id(AttestationKeySlot::Simulator,
                                  "SIM-PLAINTEXT-MARKER")
                     .has_value());
  }
  const auto db = runtime_.path / "state" / "attestation_state.db";
  ASSERT_TRUE(std::filesystem::exists(db));
  std::ifstream ifs(db, std::ios::binary);
  std::string content((std::istreambuf_iterator<char>(ifs)),
                      std::istreambuf_iterator<char>());
  EXPECT_EQ(content.find("SIM-PLAINTEXT-MARKER"), std::string::npos);
}

TEST(AttestationStateStoreDisabledTest, WithoutRuntimeDirReportsErrors) {
  aigate::AigateConfigProviderStatic config{testinfra::make_test_config()};
  aigate::SqliteAttestationStateStore store(config);
  EXPECT_FALSE(store.available());
  EXPECT_EQ(store.get_counter(), 0);
  auto [value, err] = store.increment_counter();
  EXPECT_TRUE(err.has_value());
  EXPECT_TRUE(
      store.save_key_id(AttestationKeySlot::Hardware, "HW-1").has_value());
  EXPECT_FALSE(store.get_key_id(AttestationKeySlot::Hardware).has_value());
}

} // namespace
