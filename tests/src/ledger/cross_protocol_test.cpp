#include <swapdot/crypto/digest.hpp>
#include <swapdot/testing/ledger_fixture.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

namespace {

using swapdot::schema::audit_type_t;
using swapdot::schema::error_code_t;
using swapdot::schema::pending_transfer_status_t;
using swapdot::schema::staged_transfer_status_t;
using swapdot::schema::token_status_t;
using swapdot::schema::transfer_session_status_t;

const auto kCardKey = swapdot::testing::make_sequence(32, 0xC0);

swapdot::schema::transfer_session_t open_validated(
    swapdot::testing::ledger_fixture& fixture,
    const std::string& owner = "alice",
    const std::string& receiver = "bob") {
  auto session = fixture.ledger().open_session("T1", owner, receiver,
                                               std::nullopt);
  EXPECT_TRUE(session.ok()) << session.status.log;
  auto proof = fixture.ledger().validate_card_key(session.value.session_id,
                                                  kCardKey);
  EXPECT_TRUE(proof.ok()) << proof.status.log;
  return session.value;
}

}  // namespace

TEST(cross_protocol, finalize_cancels_open_transfer_session) {
  auto fixture = swapdot::testing::ledger_fixture{"swapdot_cross_finalize"};
  fixture.register_token("T1", "alice", kCardKey);
  ASSERT_TRUE(fixture.ledger().initiate("T1", "alice").ok());
  auto session = fixture.ledger().open_session("T1", "alice",
                                               std::string{"carol"},
                                               std::nullopt);
  ASSERT_TRUE(session.ok()) << session.status.log;

  auto finalized = fixture.ledger().finalize("T1", "bob", std::nullopt);
  ASSERT_TRUE(finalized.ok()) << finalized.status.log;

  auto stale = fixture.ledger().transfer_session(session.value.session_id);
  ASSERT_TRUE(stale.ok());
  EXPECT_EQ(stale.value.status, transfer_session_status_t::canceled);

  // The new owner can start a two-phase transfer straight away.
  auto next = fixture.ledger().open_session("T1", "bob", std::string{"dave"},
                                            std::nullopt);
  ASSERT_TRUE(next.ok()) << next.status.log;
  EXPECT_EQ(next.value.from_uid, "bob");

  auto corrections = fixture.audits_of(audit_type_t::correction);
  ASSERT_EQ(corrections.size(), 1u);
  EXPECT_EQ(corrections[0].subject_id, session.value.session_id);
  EXPECT_EQ(corrections[0].reason, "superseded by legacy transfer completion");
}

TEST(cross_protocol, initiate_rolls_back_staged_transfer) {
  auto fixture = swapdot::testing::ledger_fixture{"swapdot_cross_initiate"};
  fixture.register_token("T1", "alice", kCardKey);
  auto session = open_validated(fixture);
  auto staged = fixture.ledger().stage(session.session_id, "alice",
                                       swapdot::testing::make_hash(9),
                                       std::nullopt);
  ASSERT_TRUE(staged.ok()) << staged.status.log;

  ASSERT_TRUE(fixture.ledger().initiate("T1", "alice").ok());

  auto canceled = fixture.ledger().transfer_session(session.session_id);
  ASSERT_TRUE(canceled.ok());
  EXPECT_EQ(canceled.value.status, transfer_session_status_t::canceled);
  auto rolled = fixture.ledger().staged_transfer(staged.value.staged_id);
  ASSERT_TRUE(rolled.ok());
  EXPECT_EQ(rolled.value.status, staged_transfer_status_t::rolled_back);
  EXPECT_EQ(rolled.value.rollback_reason,
            std::optional<std::string>{"superseded by legacy transfer initiation"});

  EXPECT_EQ(fixture.ledger().commit(staged.value.staged_id, "bob").status.code,
            error_code_t::conflict);
  auto token = fixture.token("T1");
  EXPECT_EQ(token.current_owner, "alice");
  EXPECT_EQ(token.status, token_status_t::pending);

  // The legacy transfer the owner chose still completes.
  auto finalized = fixture.ledger().finalize("T1", "carol", std::nullopt);
  ASSERT_TRUE(finalized.ok()) << finalized.status.log;
  EXPECT_EQ(finalized.value.current_owner, "carol");
}

TEST(cross_protocol, commit_cancels_open_pending_transfer) {
  auto fixture = swapdot::testing::ledger_fixture{"swapdot_cross_commit"};
  auto registered = fixture.register_token("T1", "alice", kCardKey);
  ASSERT_TRUE(fixture.ledger().initiate("T1", "alice").ok());

  auto session = open_validated(fixture);
  auto staged = fixture.ledger().stage(session.session_id, "alice",
                                       swapdot::testing::make_hash(9),
                                       std::nullopt);
  ASSERT_TRUE(staged.ok()) << staged.status.log;
  auto committed = fixture.ledger().commit(staged.value.staged_id, "bob");
  ASSERT_TRUE(committed.ok()) << committed.status.log;
  EXPECT_EQ(committed.value.status, token_status_t::ok);
  EXPECT_EQ(committed.value.counter, registered.counter + 1);

  auto pending = fixture.ledger().pending("T1");
  ASSERT_TRUE(pending.ok());
  EXPECT_EQ(pending.value.status, pending_transfer_status_t::canceled);

  auto stale = fixture.ledger().finalize("T1", "carol", std::nullopt);
  EXPECT_EQ(stale.status.code, error_code_t::conflict);
  EXPECT_EQ(stale.status.log, "pending transfer canceled");
  EXPECT_EQ(fixture.token("T1").current_owner, "bob");

  // The new owner is not blocked by the canceled record.
  auto next = fixture.ledger().initiate("T1", "bob");
  ASSERT_TRUE(next.ok()) << next.status.log;
  EXPECT_EQ(next.value.from_uid, "bob");
  EXPECT_EQ(next.value.n_next, registered.counter + 2);

  auto corrections = fixture.audits_of(audit_type_t::correction);
  ASSERT_EQ(corrections.size(), 1u);
  EXPECT_EQ(corrections[0].subject_id, "T1");
  EXPECT_EQ(corrections[0].from_uid, "alice");
  EXPECT_EQ(corrections[0].reason, "superseded by two-phase transfer commit");
}
