#include <swapdot/auth/engine.hpp>
#include <swapdot/auth/key_provider.hpp>
#include <swapdot/ledger/ledger.hpp>
#include <swapdot/session/session_store.hpp>
#include <swapdot/testing/service_fixture.hpp>
#include <swapdot/testing/simulated_card.hpp>
#include <swapdot/testing/storage_fixture.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <utility>

namespace {

using swapdot::schema::bytes_t;
using swapdot::schema::error_code_t;

const auto kToken = std::string{"T1"};

/// The authentication engine over a bare store, with the session store in
/// reach so a test can rewrite a live session.
class engine_harness final {
 public:
  explicit engine_harness(
      const std::string& prefix,
      swapdot::common::service_options options =
          swapdot::testing::make_test_options())
      : store_{prefix},
        options_{std::move(options)},
        sessions_{store_.encoder(), store_.storage(), store_.clock().source(),
                  options_.transaction_attempts},
        keys_{options_.master_key, options_.diversify_keys},
        engine_{store_.encoder(), store_.storage(), sessions_, keys_, options_,
                store_.clock().source()},
        ledger_{store_.encoder(), store_.storage(), options_,
                store_.clock().source()} {
    auto registered = ledger_.register_token(
        kToken, "alice", swapdot::testing::make_hash(1), std::nullopt, false);
    EXPECT_TRUE(registered.ok()) << registered.status.log;
  }

  swapdot::auth::engine& engine() { return engine_; }
  swapdot::session::session_store& sessions() { return sessions_; }
  swapdot::ledger::ledger& ledger() { return ledger_; }
  const swapdot::common::service_options& options() const { return options_; }

  std::string authenticate() {
    auto card = swapdot::testing::simulated_card{options_.master_key};
    auto begin = engine_.begin(kToken, "alice", false);
    EXPECT_TRUE(begin.ok()) << begin.status.log;
    auto first = engine_.continue_authenticate(begin.value.session_id,
                                               card.respond(begin.value.apdu));
    EXPECT_TRUE(first.ok()) << first.status.log;
    auto second = engine_.continue_authenticate(begin.value.session_id,
                                                card.respond(first.value.apdu));
    EXPECT_TRUE(second.ok()) << second.status.log;
    EXPECT_TRUE(second.value.authenticated);
    return begin.value.session_id;
  }

  /// Replace the stored session key of a live session.
  void set_session_key(const std::string& session_id, const bytes_t& key) {
    auto txn = store_.storage().begin_transaction();
    auto session = sessions_.load(txn, session_id);
    ASSERT_TRUE(session.ok()) << session.status.log;
    session.value.session_key = key;
    sessions_.update(txn, session.value);
    ASSERT_EQ(txn.commit(), swapdot::storage::commit_status::committed);
  }

 private:
  swapdot::testing::storage_fixture store_;
  swapdot::common::service_options options_;
  swapdot::session::session_store sessions_;
  swapdot::auth::master_key_provider keys_;
  swapdot::auth::engine engine_;
  swapdot::ledger::ledger ledger_;
};

}  // namespace

TEST(auth_weak_key, change_key_drops_session_and_releases_lease) {
  auto harness = engine_harness{"swapdot_weak_change_key"};
  auto session_id = harness.authenticate();
  harness.set_session_key(session_id, bytes_t(16, 0x01));

  auto change = harness.engine().change_key(session_id, uint8_t{1});
  EXPECT_EQ(change.status.code, error_code_t::weak_key);

  EXPECT_EQ(harness.sessions().get(session_id).status.code,
            error_code_t::not_found);
  auto token = harness.ledger().token(kToken);
  ASSERT_TRUE(token.ok());
  EXPECT_FALSE(token.value.lease.has_value());

  // A fresh handshake works straight away and yields a usable key.
  auto again = harness.authenticate();
  EXPECT_NE(again, session_id);
  EXPECT_TRUE(harness.engine().change_key(again, uint8_t{1}).ok());
}

TEST(auth_weak_key, transfer_write_drops_session_and_releases_lease) {
  auto options = swapdot::testing::make_test_options();
  options.transfer_write_mode = swapdot::schema::comm_mode_t::enciphered;
  auto harness = engine_harness{"swapdot_weak_write", std::move(options)};
  auto transfer =
      harness.ledger().open_session(kToken, "alice", "bob", std::nullopt);
  ASSERT_TRUE(transfer.ok()) << transfer.status.log;

  auto session_id = harness.authenticate();
  harness.set_session_key(session_id, bytes_t(16, 0xFE));

  auto write = harness.engine().write_transfer_data(
      session_id, transfer.value.session_id);
  EXPECT_EQ(write.status.code, error_code_t::weak_key);
  EXPECT_EQ(harness.sessions().get(session_id).status.code,
            error_code_t::not_found);
  EXPECT_FALSE(harness.ledger().token(kToken).value.lease.has_value());
}
