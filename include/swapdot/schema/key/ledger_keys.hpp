#pragma once

#include <swapdot/schema/primitives.hpp>

#include <cstdint>
#include <string_view>
#include <tuple>

// Canonical key prefixes and key codecs for tokens, protocol sessions,
// transfer records, events and audit entries.
namespace swapdot::schema::key {

inline constexpr std::string_view kTokenKeyPrefix{"SYS|STATE|TOKEN|"};
inline constexpr std::string_view kPendingTransferKeyPrefix{
    "SYS|STATE|PENDING|"};
inline constexpr std::string_view kTransferSessionKeyPrefix{
    "SYS|STATE|TRANSFER_SESSION|"};
inline constexpr std::string_view kActiveTransferSessionKeyPrefix{
    "SYS|STATE|ACTIVE_TRANSFER_SESSION|"};
inline constexpr std::string_view kStagedTransferKeyPrefix{
    "SYS|STATE|STAGED|"};
inline constexpr std::string_view kUserStatsKeyPrefix{"SYS|STATE|USER_STATS|"};
inline constexpr std::string_view kEventSeqKeyPrefix{"SYS|STATE|EVENT_SEQ|"};
inline constexpr std::string_view kAuditSeqKeyPrefix{"SYS|STATE|AUDIT_SEQ|"};
inline constexpr std::string_view kAuthSessionKeyPrefix{"SYS|SESSION|AUTH|"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};
inline constexpr std::string_view kAuditPrefix{"SYS|AUDIT|"};

template <typename Encoder, typename T>
swapdot::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                           std::string_view prefix,
                                           const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
swapdot::schema::bytes_t make_prefix_key(Encoder& encoder,
                                         std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
swapdot::schema::bytes_t make_token_key(Encoder& encoder,
                                        const token_id_t& token_id) {
  return make_prefixed_key(encoder, kTokenKeyPrefix, token_id);
}

template <typename Encoder>
swapdot::schema::bytes_t make_pending_transfer_key(
    Encoder& encoder,
    const token_id_t& token_id) {
  return make_prefixed_key(encoder, kPendingTransferKeyPrefix, token_id);
}

template <typename Encoder>
swapdot::schema::bytes_t make_transfer_session_key(
    Encoder& encoder,
    const std::string& session_id) {
  return make_prefixed_key(encoder, kTransferSessionKeyPrefix, session_id);
}

template <typename Encoder>
swapdot::schema::bytes_t make_active_transfer_session_key(
    Encoder& encoder,
    const token_id_t& token_id) {
  return make_prefixed_key(encoder, kActiveTransferSessionKeyPrefix, token_id);
}

template <typename Encoder>
swapdot::schema::bytes_t make_staged_transfer_key(
    Encoder& encoder,
    const std::string& staged_id) {
  return make_prefixed_key(encoder, kStagedTransferKeyPrefix, staged_id);
}

template <typename Encoder>
swapdot::schema::bytes_t make_user_stats_key(Encoder& encoder,
                                             const user_id_t& user_id) {
  return make_prefixed_key(encoder, kUserStatsKeyPrefix, user_id);
}

template <typename Encoder>
swapdot::schema::bytes_t make_auth_session_key(Encoder& encoder,
                                               const std::string& session_id) {
  return make_prefixed_key(encoder, kAuthSessionKeyPrefix, session_id);
}

template <typename Encoder>
swapdot::schema::bytes_t make_event_sequence_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kEventSeqKeyPrefix,
                           std::string_view{"NEXT"});
}

template <typename Encoder>
swapdot::schema::bytes_t make_audit_sequence_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kAuditSeqKeyPrefix,
                           std::string_view{"NEXT"});
}

/// Events are grouped by token so one prefix scan yields a token's history.
template <typename Encoder>
swapdot::schema::bytes_t make_event_key(Encoder& encoder,
                                        const token_id_t& token_id,
                                        const uint64_t sequence) {
  return make_prefixed_key(encoder, kEventPrefix,
                           std::tuple{token_id, sequence});
}

template <typename Encoder>
swapdot::schema::bytes_t make_token_event_prefix(Encoder& encoder,
                                                 const token_id_t& token_id) {
  return make_prefixed_key(encoder, kEventPrefix, token_id);
}

template <typename Encoder>
swapdot::schema::bytes_t make_audit_key(Encoder& encoder,
                                        const uint64_t sequence) {
  return make_prefixed_key(encoder, kAuditPrefix, sequence);
}

}  // namespace swapdot::schema::key
