#include <swapdot/schema/key/ledger_keys.hpp>
#include <swapdot/storage/rocksdb/storage.hpp>
#include <swapdot/storage/transact.hpp>
#include <swapdot/testing/common.hpp>
#include <swapdot/testing/storage_fixture.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string>

namespace {

using swapdot::schema::bytes_t;
using swapdot::schema::token_state_t;

bytes_t key_of(const std::string_view text) {
  return swapdot::schema::make_bytes(text);
}

token_state_t make_token(const std::string& id, const std::string& owner) {
  auto token = token_state_t{};
  token.token_id = id;
  token.current_owner = owner;
  token.previous_owners = {"x", "y"};
  token.key_hash = swapdot::testing::make_hash(9);
  token.counter = 5;
  token.tag_uid = std::string{"04A1B2C3"};
  token.lease = swapdot::schema::token_lease_t{
      .lease_id = "l", .session_id = "s", .expires_at = 77};
  return token;
}

}  // namespace

TEST(storage, records_round_trip_through_put_and_get) {
  auto fixture = swapdot::testing::storage_fixture{"swapdot_storage_round_trip"};
  auto& encoder = fixture.encoder();
  auto key = swapdot::schema::key::make_token_key(encoder, "T1");
  auto token = make_token("T1", "alice");
  fixture.storage().put(encoder, key, token);

  auto loaded = fixture.storage().get<token_state_t>(encoder, key);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->current_owner, "alice");
  EXPECT_EQ(loaded->previous_owners, token.previous_owners);
  EXPECT_EQ(loaded->counter, 5u);
  EXPECT_EQ(loaded->key_hash, token.key_hash);
  ASSERT_TRUE(loaded->lease.has_value());
  EXPECT_EQ(loaded->lease->expires_at, 77u);
  EXPECT_EQ(loaded->tag_uid, token.tag_uid);

  EXPECT_FALSE(fixture.storage()
                   .get<token_state_t>(
                       encoder, swapdot::schema::key::make_token_key(encoder, "T2"))
                   .has_value());
}

TEST(storage, list_by_prefix_selects_keyspace_only) {
  auto fixture = swapdot::testing::storage_fixture{"swapdot_storage_prefix"};
  auto& encoder = fixture.encoder();
  fixture.storage().put(encoder, key_of("A|one"), uint64_t{1});
  fixture.storage().put(encoder, key_of("A|two"), uint64_t{2});
  fixture.storage().put(encoder, key_of("B|one"), uint64_t{9});

  auto rows = fixture.storage().list_by_prefix(key_of("A|"));
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[0].first, key_of("A|one"));
  EXPECT_EQ(encoder.try_decode<uint64_t>(rows[1].second), uint64_t{2});
}

TEST(storage, transaction_sees_its_own_writes) {
  auto fixture = swapdot::testing::storage_fixture{"swapdot_storage_txn_view"};
  auto& encoder = fixture.encoder();
  auto txn = fixture.storage().begin_transaction();
  txn.put(encoder, key_of("P|a"), uint64_t{1});
  txn.put(encoder, key_of("P|b"), uint64_t{2});
  EXPECT_EQ(txn.get_for_update<uint64_t>(encoder, key_of("P|a")), uint64_t{1});
  EXPECT_EQ(txn.list_by_prefix(key_of("P|")).size(), 2u);
  EXPECT_EQ(txn.list_by_prefix(key_of("P|"), 1).size(), 1u);
  EXPECT_TRUE(fixture.storage().list_by_prefix(key_of("P|")).empty());

  txn.erase(key_of("P|b"));
  ASSERT_EQ(txn.commit(), swapdot::storage::commit_status::committed);
  EXPECT_EQ(fixture.storage().list_by_prefix(key_of("P|")).size(), 1u);
}

TEST(storage, interleaved_read_check_write_conflicts) {
  auto fixture = swapdot::testing::storage_fixture{"swapdot_storage_conflict"};
  auto& encoder = fixture.encoder();
  auto key = key_of("C|counter");
  fixture.storage().put(encoder, key, uint64_t{10});

  auto first = fixture.storage().begin_transaction();
  auto second = fixture.storage().begin_transaction();
  auto first_value = first.get_for_update<uint64_t>(encoder, key).value_or(0);
  auto second_value = second.get_for_update<uint64_t>(encoder, key).value_or(0);
  first.put(encoder, key, first_value + 1);
  second.put(encoder, key, second_value + 1);

  EXPECT_EQ(first.commit(), swapdot::storage::commit_status::committed);
  EXPECT_EQ(second.commit(), swapdot::storage::commit_status::conflict);
  EXPECT_EQ(fixture.storage().get<uint64_t>(encoder, key), uint64_t{11});
}

TEST(storage, run_transaction_retries_after_conflict) {
  auto fixture = swapdot::testing::storage_fixture{"swapdot_storage_retry"};
  auto& encoder = fixture.encoder();
  auto key = key_of("R|counter");
  fixture.storage().put(encoder, key, uint64_t{0});

  auto attempts = 0;
  auto result = swapdot::storage::run_transaction(
      fixture.storage(), 3, [&](swapdot::storage::rocksdb_transaction_t& txn) {
        ++attempts;
        auto value = txn.get_for_update<uint64_t>(encoder, key).value_or(0);
        if (attempts == 1) {
          fixture.storage().put(encoder, key, uint64_t{100});
        }
        txn.put(encoder, key, value + 1);
        return value + 1;
      });
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(attempts, 2);
  EXPECT_EQ(*result, 101u);
  EXPECT_EQ(fixture.storage().get<uint64_t>(encoder, key), uint64_t{101});
}

TEST(storage, transact_reports_conflict_when_retries_run_out) {
  auto fixture = swapdot::testing::storage_fixture{"swapdot_storage_exhausted"};
  auto& encoder = fixture.encoder();
  auto key = key_of("E|counter");
  fixture.storage().put(encoder, key, uint64_t{0});

  auto result = swapdot::storage::transact<uint64_t>(
      fixture.storage(), 2, "swapdot.test",
      [&](swapdot::storage::rocksdb_transaction_t& txn) {
        auto value = txn.get_for_update<uint64_t>(encoder, key).value_or(0);
        fixture.storage().put(encoder, key, value + 50);
        txn.put(encoder, key, value + 1);
        return swapdot::schema::make_success(value + 1);
      });
  EXPECT_EQ(result.status.code, swapdot::schema::error_code_t::conflict);
  EXPECT_EQ(result.status.codespace, "swapdot.test");
  EXPECT_EQ(fixture.storage().get<uint64_t>(encoder, key), uint64_t{100});
}
