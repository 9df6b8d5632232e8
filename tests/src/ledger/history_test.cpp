#include <swapdot/ledger/history.hpp>
#include <gtest/gtest.h>

#include <algorithm>
#include <random>
#include <string>
#include <vector>

namespace {

using history_t = std::vector<swapdot::schema::user_id_t>;

history_t random_history(std::mt19937& rng, const std::size_t size) {
  auto dist = std::uniform_int_distribution<int>{0, 5};
  auto out = history_t{};
  for (std::size_t i = 0; i < size; ++i) {
    out.push_back("u" + std::to_string(dist(rng)));
  }
  return out;
}

}  // namespace

TEST(history, accepts_single_append) {
  auto existing = history_t{"x", "y"};
  EXPECT_TRUE(swapdot::ledger::validate_append_only(
      existing, history_t{"x", "y", "a"}, "b"));
  EXPECT_TRUE(swapdot::ledger::validate_append_only(existing, existing, "b"));
}

TEST(history, empty_existing_accepts_anything) {
  EXPECT_TRUE(swapdot::ledger::validate_append_only({}, history_t{"a"}, "b"));
  EXPECT_TRUE(swapdot::ledger::validate_append_only({}, history_t{"a", "b"}, "c"));
}

TEST(history, rejects_rewrites_and_shrinking) {
  auto existing = history_t{"x", "y"};
  EXPECT_FALSE(swapdot::ledger::validate_append_only(existing, history_t{"x"}, "b"));
  EXPECT_FALSE(swapdot::ledger::validate_append_only(
      existing, history_t{"x", "z", "a"}, "b"));
  EXPECT_FALSE(swapdot::ledger::validate_append_only(
      existing, history_t{"y", "x", "a"}, "b"));
}

TEST(history, rejects_multiple_appends_and_receiver_in_history) {
  auto existing = history_t{"x"};
  EXPECT_FALSE(swapdot::ledger::validate_append_only(
      existing, history_t{"x", "a", "c"}, "b"));
  EXPECT_FALSE(swapdot::ledger::validate_append_only(
      existing, history_t{"x", "b"}, "b"));
}

TEST(history, propose_history_skips_repeated_tail) {
  EXPECT_EQ(swapdot::ledger::propose_history({"x", "y"}, "a"),
            (history_t{"x", "y", "a"}));
  EXPECT_EQ(swapdot::ledger::propose_history({"x", "a"}, "a"),
            (history_t{"x", "a"}));
  EXPECT_EQ(swapdot::ledger::propose_history({}, "a"), (history_t{"a"}));
}

TEST(history, random_histories_follow_prefix_rule) {
  auto rng = std::mt19937{1234};
  auto size_dist = std::uniform_int_distribution<std::size_t>{1, 6};
  for (auto round = 0; round < 2000; ++round) {
    auto existing = random_history(rng, size_dist(rng));
    auto proposed = random_history(rng, size_dist(rng));
    auto new_owner = random_history(rng, 1).front();

    auto is_prefix = proposed.size() >= existing.size() &&
                     std::equal(std::begin(existing), std::end(existing),
                                std::begin(proposed));
    auto appended = proposed.size() - std::min(proposed.size(), existing.size());
    auto expected = is_prefix && appended <= 1 &&
                    (appended == 0 || proposed.back() != new_owner);
    EXPECT_EQ(swapdot::ledger::validate_append_only(existing, proposed, new_owner),
              expected);

    auto next = swapdot::ledger::propose_history(existing, new_owner);
    if (existing.back() != new_owner) {
      EXPECT_TRUE(swapdot::ledger::validate_append_only(existing, next, "other"));
    }
  }
}
