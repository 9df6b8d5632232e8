#include <swapdot/auth/key_provider.hpp>
#include <swapdot/testing/common.hpp>
#include <gtest/gtest.h>

TEST(key_provider, without_diversification_every_version_uses_master) {
  auto master = swapdot::testing::make_sequence(16, 0x10);
  auto keys = swapdot::auth::master_key_provider{master, false};
  EXPECT_EQ(keys.card_key("T1", 0), master);
  EXPECT_EQ(keys.card_key("T1", 7), master);
  EXPECT_EQ(keys.card_key("T2", 7), master);
}

TEST(key_provider, diversified_keys_depend_on_token_and_version) {
  auto master = swapdot::testing::make_sequence(24, 0x10);
  auto keys = swapdot::auth::master_key_provider{master, true};
  EXPECT_EQ(keys.card_key("T1", 0), master);

  auto v1 = keys.card_key("T1", 1);
  EXPECT_EQ(v1.size(), master.size());
  EXPECT_NE(v1, master);
  EXPECT_EQ(keys.card_key("T1", 1), v1);
  EXPECT_NE(keys.card_key("T1", 2), v1);
  EXPECT_NE(keys.card_key("T2", 1), v1);
}
