#pragma once

#include <swapdot/crypto/des.hpp>
#include <swapdot/crypto/digest.hpp>
#include <swapdot/messaging/codec.hpp>
#include <swapdot/schema/comm_mode.hpp>
#include <swapdot/schema/primitives.hpp>

#include <algorithm>
#include <array>
#include <cstdint>
#include <optional>
#include <stdexcept>

namespace swapdot::testing {

inline swapdot::schema::bytes_t rotate_left(
    const swapdot::schema::bytes_view_t& bytes) {
  auto out = swapdot::schema::make_bytes(bytes);
  if (!out.empty()) {
    std::rotate(std::begin(out), std::begin(out) + 1, std::end(out));
  }
  return out;
}

inline swapdot::crypto::des_key_t require_key(
    const swapdot::schema::bytes_view_t& raw) {
  auto key = swapdot::crypto::normalize_key(raw);
  if (!key) {
    throw std::invalid_argument{"test key must be 8, 16 or 24 bytes"};
  }
  return *key;
}

inline swapdot::schema::bytes_t expect_bytes(
    swapdot::crypto::codec_result_t<swapdot::schema::bytes_t> result) {
  if (auto* error = std::get_if<swapdot::crypto::codec_error_t>(&result)) {
    throw std::runtime_error{
        std::string{swapdot::crypto::to_string(*error)}};
  }
  return std::get<swapdot::schema::bytes_t>(std::move(result));
}

/// Card side of native 3DES authentication.
class simulated_card final {
 public:
  explicit simulated_card(const swapdot::schema::bytes_view_t& card_key)
      : key_{require_key(card_key)} {}

  /// Answer 90 1A or 90 AF. Returns data followed by the status word.
  swapdot::schema::bytes_t respond(const swapdot::schema::bytes_view_t& apdu) {
    if (apdu.size() < 5 || apdu[0] != swapdot::messaging::kCla) {
      return {0x91, 0x7E};
    }
    if (apdu[1] == swapdot::messaging::kCmdAuthenticate) {
      rnd_b_ = swapdot::crypto::random_bytes(swapdot::crypto::kDesBlockSize);
      auto zero_iv = std::array<uint8_t, swapdot::crypto::kDesBlockSize>{};
      last_block_ =
          expect_bytes(swapdot::crypto::encrypt_cbc(key_, zero_iv, rnd_b_));
      return swapdot::schema::concat(last_block_,
                                     std::array<uint8_t, 2>{0x91, 0xAF});
    }
    if (apdu[1] == swapdot::messaging::kCmdAdditionalFrame && apdu[4] == 16 &&
        apdu.size() == 22) {
      auto body = apdu.subspan(5, 16);
      auto plain =
          expect_bytes(swapdot::crypto::decrypt_cbc(key_, last_block_, body));
      auto rnd_a = swapdot::schema::bytes_view_t{plain}.first(8);
      auto rotated_b = swapdot::schema::bytes_view_t{plain}.subspan(8, 8);
      auto expected_b = rotate_left(rnd_b_);
      if (!std::equal(std::begin(rotated_b), std::end(rotated_b),
                      std::begin(expected_b), std::end(expected_b))) {
        return {0x91, 0xAE};
      }
      auto answer = expect_bytes(swapdot::crypto::encrypt_cbc(
          key_, body.last(8), rotate_left(rnd_a)));
      if (tamper_next_answer_) {
        answer[0] ^= 0x01;
        tamper_next_answer_ = false;
      }
      auto b = swapdot::schema::bytes_view_t{rnd_b_};
      session_key_ = swapdot::schema::concat(rnd_a.first(4), b.first(4),
                                             rnd_a.subspan(4, 4),
                                             b.subspan(4, 4));
      return swapdot::schema::concat(answer,
                                     std::array<uint8_t, 2>{0x91, 0x00});
    }
    return {0x91, 0x1C};
  }

  void tamper_next_answer() { tamper_next_answer_ = true; }

  const swapdot::schema::bytes_t& session_key() const { return session_key_; }

 private:
  swapdot::crypto::des_key_t key_;
  swapdot::schema::bytes_t rnd_b_;
  swapdot::schema::bytes_t last_block_;
  swapdot::schema::bytes_t session_key_;
  bool tamper_next_answer_{false};
};

struct command_body final {
  uint8_t command{};
  swapdot::schema::bytes_t first_body;
  swapdot::schema::bytes_t continuation;
};

/// Split chained frames into the first frame body and the joined
/// continuation bodies. std::nullopt when any frame is malformed.
inline std::optional<command_body> split_frames(
    const swapdot::messaging::frames_t& frames) {
  if (frames.empty()) {
    return std::nullopt;
  }
  auto out = command_body{};
  for (std::size_t i = 0; i < frames.size(); ++i) {
    const auto& frame = frames[i];
    if (frame.size() < 6 || frame[0] != swapdot::messaging::kCla ||
        frame[2] != 0x00 || frame[3] != 0x00 || frame.back() != 0x00 ||
        frame.size() != static_cast<std::size_t>(frame[4]) + 6) {
      return std::nullopt;
    }
    auto body = swapdot::schema::bytes_view_t{frame}.subspan(5, frame[4]);
    if (i == 0) {
      out.command = frame[1];
      out.first_body = swapdot::schema::make_bytes(body);
    } else {
      if (frame[1] != swapdot::messaging::kCmdAdditionalFrame) {
        return std::nullopt;
      }
      out.continuation.insert(std::end(out.continuation), std::begin(body),
                              std::end(body));
    }
  }
  return out;
}

inline uint32_t read_le24(const swapdot::schema::bytes_view_t& bytes) {
  return static_cast<uint32_t>(bytes[0]) |
         (static_cast<uint32_t>(bytes[1]) << 8) |
         (static_cast<uint32_t>(bytes[2]) << 16);
}

/// Reference WriteData decoder. Verifies CRC and MAC the way the card does
/// and returns the written bytes.
inline std::optional<swapdot::schema::bytes_t> decode_write_frames(
    const swapdot::messaging::frames_t& frames,
    const swapdot::crypto::des_key_t& session_key,
    const swapdot::schema::comm_mode_t mode) {
  auto split = split_frames(frames);
  if (!split || split->command != swapdot::messaging::kCmdWriteData ||
      split->first_body.size() < swapdot::messaging::kWriteHeaderSize) {
    return std::nullopt;
  }
  auto first = swapdot::schema::bytes_view_t{split->first_body};
  auto header = first.first(swapdot::messaging::kWriteHeaderSize);
  auto length = read_le24(header.subspan(4, 3));
  auto payload = swapdot::schema::concat(
      first.subspan(swapdot::messaging::kWriteHeaderSize), split->continuation);

  auto crc_input = [&](const swapdot::schema::bytes_view_t& data) {
    return swapdot::schema::concat(
        std::array<uint8_t, 1>{swapdot::messaging::kCmdWriteData}, header,
        data);
  };

  switch (mode) {
    case swapdot::schema::comm_mode_t::plain:
      if (payload.size() != length) {
        return std::nullopt;
      }
      return payload;
    case swapdot::schema::comm_mode_t::maced: {
      if (payload.size() != length + 2 + 8) {
        return std::nullopt;
      }
      auto view = swapdot::schema::bytes_view_t{payload};
      auto data = view.first(length);
      auto crc = swapdot::messaging::crc16(crc_input(data));
      if (!std::equal(std::begin(crc), std::end(crc),
                      std::begin(view.subspan(length, 2)))) {
        return std::nullopt;
      }
      auto mac = expect_bytes(swapdot::messaging::mac_cbc(
          session_key, crc_input(view.first(length + 2))));
      auto received = view.subspan(length + 2, 8);
      if (!std::equal(std::begin(mac), std::end(mac), std::begin(received),
                      std::end(received))) {
        return std::nullopt;
      }
      return swapdot::schema::make_bytes(data);
    }
    case swapdot::schema::comm_mode_t::enciphered: {
      if (payload.empty() ||
          payload.size() % swapdot::crypto::kDesBlockSize != 0) {
        return std::nullopt;
      }
      auto zero_iv = std::array<uint8_t, swapdot::crypto::kDesBlockSize>{};
      auto plain = expect_bytes(
          swapdot::crypto::decrypt_cbc(session_key, zero_iv, payload));
      if (plain.size() < length + 2) {
        return std::nullopt;
      }
      auto view = swapdot::schema::bytes_view_t{plain};
      auto data = view.first(length);
      auto crc = swapdot::messaging::crc16(crc_input(data));
      if (!std::equal(std::begin(crc), std::end(crc),
                      std::begin(view.subspan(length, 2)))) {
        return std::nullopt;
      }
      if (swapdot::messaging::unpad_iso9797_m2(view.subspan(length + 2))
              .size() != 0) {
        return std::nullopt;
      }
      return swapdot::schema::make_bytes(data);
    }
  }
  return std::nullopt;
}

struct decoded_change_key final {
  uint8_t key_no{};
  swapdot::schema::bytes_t new_key;
  uint8_t key_version{};
};

/// Reference ChangeKey decoder for a same-slot change. old_key is the
/// normalized key being replaced.
inline std::optional<decoded_change_key> decode_change_key_frames(
    const swapdot::messaging::frames_t& frames,
    const swapdot::crypto::des_key_t& session_key,
    const swapdot::schema::bytes_view_t& old_key) {
  auto split = split_frames(frames);
  if (!split || split->command != swapdot::messaging::kCmdChangeKey ||
      split->first_body.empty()) {
    return std::nullopt;
  }
  auto cryptogram = swapdot::schema::concat(
      swapdot::schema::bytes_view_t{split->first_body}.subspan(1),
      split->continuation);
  auto zero_iv = std::array<uint8_t, swapdot::crypto::kDesBlockSize>{};
  auto plain = expect_bytes(
      swapdot::crypto::decrypt_cbc(session_key, zero_iv, cryptogram));
  if (plain.size() < old_key.size() + 3) {
    return std::nullopt;
  }
  auto out = decoded_change_key{};
  out.key_no = split->first_body[0];
  out.new_key.resize(old_key.size());
  for (std::size_t i = 0; i < old_key.size(); ++i) {
    out.new_key[i] = static_cast<uint8_t>(plain[i] ^ old_key[i]);
  }
  auto crc = swapdot::messaging::crc16(out.new_key);
  if (plain[old_key.size()] != crc[0] || plain[old_key.size() + 1] != crc[1]) {
    return std::nullopt;
  }
  out.key_version = plain[old_key.size() + 2];
  return out;
}

}  // namespace swapdot::testing
