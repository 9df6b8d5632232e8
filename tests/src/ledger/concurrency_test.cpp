#include <swapdot/testing/ledger_fixture.hpp>
#include <swapdot/testing/service_fixture.hpp>
#include <gtest/gtest.h>

#include <cstddef>
#include <functional>
#include <future>
#include <string>
#include <thread>
#include <vector>

namespace {

using swapdot::schema::error_code_t;
using swapdot::schema::pending_transfer_status_t;
using swapdot::schema::token_status_t;

/// Run each call on its own thread, all released together.
template <typename Result, typename Call>
std::vector<Result> race(const std::vector<Call>& calls) {
  auto start = std::promise<void>{};
  auto gate = start.get_future().share();
  auto results = std::vector<Result>(calls.size());
  auto threads = std::vector<std::thread>{};
  for (std::size_t i = 0; i < calls.size(); ++i) {
    threads.emplace_back([&, i]() {
      gate.wait();
      results[i] = calls[i]();
    });
  }
  start.set_value();
  for (auto& thread : threads) {
    thread.join();
  }
  return results;
}

}  // namespace

TEST(concurrency, racing_initiates_leave_one_open_pending) {
  auto options = swapdot::common::service_options{};
  options.transaction_attempts = 1;
  auto fixture =
      swapdot::testing::ledger_fixture{"swapdot_race_initiate", options};
  auto registered = fixture.register_token("T1", "alice");

  using result_t = swapdot::schema::operation_result<
      swapdot::schema::pending_transfer_t>;
  auto call = [&]() { return fixture.ledger().initiate("T1", "alice"); };
  auto results = race<result_t>(std::vector<decltype(call)>(4, call));

  auto succeeded = 0;
  for (const auto& result : results) {
    if (result.ok()) {
      ++succeeded;
      EXPECT_EQ(result.value.n_next, registered.counter + 1);
    } else {
      EXPECT_EQ(result.status.code, error_code_t::conflict)
          << result.status.log;
    }
  }
  EXPECT_GE(succeeded, 1);

  auto pending = fixture.ledger().pending("T1");
  ASSERT_TRUE(pending.ok());
  EXPECT_EQ(pending.value.status, pending_transfer_status_t::open);
  EXPECT_EQ(pending.value.from_uid, "alice");
  auto token = fixture.token("T1");
  EXPECT_EQ(token.status, token_status_t::pending);
  EXPECT_EQ(token.counter, registered.counter);
}

TEST(concurrency, racing_receivers_finalize_exactly_once) {
  auto fixture = swapdot::testing::ledger_fixture{"swapdot_race_finalize"};
  auto registered = fixture.register_token("T1", "alice");
  ASSERT_TRUE(fixture.ledger().initiate("T1", "alice").ok());

  using result_t =
      swapdot::schema::operation_result<swapdot::schema::token_state_t>;
  auto calls = std::vector<std::function<result_t()>>{
      [&]() { return fixture.ledger().finalize("T1", "bob", std::nullopt); },
      [&]() { return fixture.ledger().finalize("T1", "carol", std::nullopt); }};
  auto results = race<result_t>(calls);

  auto winners = std::vector<std::string>{};
  for (const auto& result : results) {
    if (result.ok()) {
      winners.push_back(result.value.current_owner);
    } else {
      EXPECT_TRUE(result.status.code == error_code_t::conflict ||
                  result.status.code == error_code_t::not_found)
          << result.status.log;
    }
  }
  ASSERT_EQ(winners.size(), 1u);

  auto token = fixture.token("T1");
  EXPECT_EQ(token.current_owner, winners.front());
  EXPECT_EQ(token.counter, registered.counter + 1);
  EXPECT_EQ(token.previous_owners, (std::vector<std::string>{"alice"}));
  auto events = fixture.ledger().events("T1");
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[1].to_owner, winners.front());
}

TEST(concurrency, racing_handshakes_take_one_lease) {
  auto fixture = swapdot::testing::service_fixture{"swapdot_race_lease"};
  ASSERT_TRUE(fixture.service()
                  .register_token("T1", "alice", swapdot::testing::make_hash(1),
                                  std::nullopt, false)
                  .ok());

  using result_t =
      swapdot::schema::operation_result<swapdot::auth::begin_output>;
  auto call = [&]() {
    return fixture.service().begin_authenticate("T1", "alice", false);
  };
  auto results = race<result_t>(std::vector<decltype(call)>(2, call));

  auto winner = std::string{};
  for (const auto& result : results) {
    if (result.ok()) {
      EXPECT_TRUE(winner.empty());
      winner = result.value.session_id;
    } else {
      EXPECT_EQ(result.status.code, error_code_t::conflict)
          << result.status.log;
    }
  }
  ASSERT_FALSE(winner.empty());
  auto token = fixture.service().get_token("T1");
  ASSERT_TRUE(token.ok());
  ASSERT_TRUE(token.value.lease.has_value());
  EXPECT_EQ(token.value.lease->session_id, winner);
}
