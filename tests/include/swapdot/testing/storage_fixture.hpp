#pragma once

#include <swapdot/schema/encoding/scale/encoder.hpp>
#include <swapdot/storage/rocksdb/storage.hpp>
#include <swapdot/testing/common.hpp>

#include <string>
#include <string_view>

namespace swapdot::testing {

class storage_fixture final {
 public:
  explicit storage_fixture(const std::string_view db_prefix)
      : db_path_{make_db_path(db_prefix)},
        encoder_{},
        storage_{swapdot::storage::make_storage<
            swapdot::storage::rocksdb_storage_tag>(db_path_)} {}

  storage_fixture(const storage_fixture&) = delete;
  storage_fixture& operator=(const storage_fixture&) = delete;
  storage_fixture(storage_fixture&&) = delete;
  storage_fixture& operator=(storage_fixture&&) = delete;

  ~storage_fixture() { remove_path(db_path_); }

  swapdot::schema::encoding::scale_encoder_t& encoder() { return encoder_; }
  swapdot::storage::rocksdb_storage_t& storage() { return storage_; }
  manual_clock& clock() { return clock_; }

 private:
  std::string db_path_;
  swapdot::schema::encoding::scale_encoder_t encoder_;
  swapdot::storage::rocksdb_storage_t storage_;
  manual_clock clock_;
};

}  // namespace swapdot::testing
