#include <swapdot/ledger/history.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace swapdot::ledger {

bool validate_append_only(const std::vector<swapdot::schema::user_id_t>& existing,
                          const std::vector<swapdot::schema::user_id_t>& proposed,
                          const swapdot::schema::user_id_t& new_owner) {
  if (existing.empty()) {
    return true;
  }
  if (proposed.size() < existing.size()) {
    spdlog::error("Ownership history violation: shortened from {} to {}",
                  existing.size(), proposed.size());
    return false;
  }
  auto mismatch = std::mismatch(std::begin(existing), std::end(existing),
                                std::begin(proposed));
  if (mismatch.first != std::end(existing)) {
    spdlog::error("Ownership history violation: entry {} rewritten",
                  std::distance(std::begin(existing), mismatch.first));
    return false;
  }
  // One transfer displaces one owner.
  if (proposed.size() > existing.size() + 1) {
    spdlog::error("Ownership history violation: {} entries appended at once",
                  proposed.size() - existing.size());
    return false;
  }
  if (proposed.size() == existing.size() + 1 && proposed.back() == new_owner) {
    spdlog::error("Ownership history violation: new owner recorded as past "
                  "owner");
    return false;
  }
  return true;
}

std::vector<swapdot::schema::user_id_t> propose_history(
    const std::vector<swapdot::schema::user_id_t>& existing,
    const swapdot::schema::user_id_t& previous_owner) {
  auto proposed = existing;
  if (proposed.empty() || proposed.back() != previous_owner) {
    proposed.push_back(previous_owner);
  }
  return proposed;
}

}  // namespace swapdot::ledger
