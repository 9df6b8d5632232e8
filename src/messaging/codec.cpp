#include <swapdot/messaging/codec.hpp>

#include <boost/endian/buffers.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace swapdot::messaging {

namespace {

using swapdot::crypto::codec_error_t;
using swapdot::crypto::codec_result_t;
using swapdot::schema::bytes_t;
using swapdot::schema::bytes_view_t;

std::array<uint8_t, 3> le24(const uint32_t value) {
  auto buffer = boost::endian::little_uint24_buf_t{value};
  auto out = std::array<uint8_t, 3>{};
  std::copy_n(buffer.data(), out.size(), std::begin(out));
  return out;
}

/// First frame `90 <cmd> 00 00 <Lc> <prefix> <chunk> 00`, then
/// `90 AF 00 00 <Lc> <chunk> 00` until the payload is exhausted.
frames_t chain_frames(const uint8_t cmd,
                      const bytes_view_t& prefix,
                      const bytes_view_t& payload,
                      const std::size_t first_capacity) {
  auto frames = frames_t{};
  auto first = payload.first(std::min(payload.size(), first_capacity));
  auto lc = static_cast<uint8_t>(prefix.size() + first.size());
  frames.push_back(swapdot::schema::concat(
      std::array<uint8_t, 5>{kCla, cmd, 0x00, 0x00, lc}, prefix, first,
      std::array<uint8_t, 1>{0x00}));

  auto offset = first.size();
  while (offset < payload.size()) {
    auto chunk = payload.subspan(
        offset, std::min(payload.size() - offset, kMaxContinuationPayload));
    frames.push_back(build_additional_frame(chunk));
    offset += chunk.size();
  }
  return frames;
}

}  // namespace

std::array<uint8_t, 2> crc16(const bytes_view_t& data) {
  auto crc = uint16_t{0xFFFF};
  for (auto byte : data) {
    crc ^= byte;
    for (auto bit = 0; bit < 8; ++bit) {
      auto lsb = crc & 1u;
      crc >>= 1;
      if (lsb != 0) {
        crc ^= 0xA001;
      }
    }
  }
  return {static_cast<uint8_t>(crc & 0xFFu), static_cast<uint8_t>(crc >> 8)};
}

std::array<uint8_t, 4> crc32(const bytes_view_t& data) {
  auto crc = uint32_t{0xFFFFFFFF};
  for (auto byte : data) {
    crc ^= byte;
    for (auto bit = 0; bit < 8; ++bit) {
      crc = (crc & 1u) != 0 ? (crc >> 1) ^ 0xEDB88320u : (crc >> 1);
    }
  }
  crc = ~crc;
  return {static_cast<uint8_t>(crc & 0xFFu),
          static_cast<uint8_t>((crc >> 8) & 0xFFu),
          static_cast<uint8_t>((crc >> 16) & 0xFFu),
          static_cast<uint8_t>((crc >> 24) & 0xFFu)};
}

bytes_t pad_iso9797_m2(const bytes_view_t& data, const std::size_t block_size) {
  auto padded = swapdot::schema::make_bytes(data);
  padded.push_back(0x80);
  while ((padded.size() % block_size) != 0) {
    padded.push_back(0x00);
  }
  return padded;
}

bytes_t unpad_iso9797_m2(const bytes_view_t& data) {
  auto end = data.size();
  while (end > 0 && data[end - 1] == 0x00) {
    --end;
  }
  if (end > 0 && data[end - 1] == 0x80) {
    return swapdot::schema::make_bytes(data.first(end - 1));
  }
  return swapdot::schema::make_bytes(data);
}

codec_result_t<bytes_t> mac_cbc(const crypto::des_key_t& key,
                                const bytes_view_t& data) {
  auto zero_iv = std::array<uint8_t, crypto::kDesBlockSize>{};
  auto encrypted = crypto::encrypt_cbc(key, zero_iv, pad_iso9797_m2(data));
  if (auto* error = std::get_if<codec_error_t>(&encrypted)) {
    return *error;
  }
  auto& cipher = std::get<bytes_t>(encrypted);
  return bytes_t(
      std::end(cipher) - static_cast<std::ptrdiff_t>(crypto::kDesBlockSize),
      std::end(cipher));
}

codec_result_t<bytes_t> aes_cmac(const bytes_view_t& key,
                                 const bytes_view_t& data) {
  static_cast<void>(key);
  static_cast<void>(data);
  spdlog::error("AES-CMAC requested but AES sessions are not supported");
  return codec_error_t::not_implemented;
}

bytes_t build_authenticate_frame(const uint8_t key_no) {
  return {kCla, kCmdAuthenticate, 0x00, 0x00, 0x01, key_no, 0x00};
}

bytes_t build_additional_frame(const bytes_view_t& body) {
  if (body.empty()) {
    return {kCla, kCmdAdditionalFrame, 0x00, 0x00, 0x00};
  }
  return swapdot::schema::concat(
      std::array<uint8_t, 5>{kCla, kCmdAdditionalFrame, 0x00, 0x00,
                             static_cast<uint8_t>(body.size())},
      body, std::array<uint8_t, 1>{0x00});
}

codec_result_t<bytes_t> build_read_frame(const uint8_t file_no,
                                         const uint32_t offset,
                                         const uint32_t length) {
  if (offset > kMaxFileOffset || length > kMaxFileOffset) {
    return codec_error_t::parameter_out_of_range;
  }
  return swapdot::schema::concat(
      std::array<uint8_t, 6>{kCla, kCmdReadData, 0x00, 0x00, 0x07, file_no},
      le24(offset), le24(length), std::array<uint8_t, 1>{0x00});
}

codec_result_t<frames_t> build_write_frames(
    const uint8_t file_no,
    const uint32_t offset,
    const bytes_view_t& data,
    const crypto::des_key_t& session_key,
    const swapdot::schema::comm_mode_t mode) {
  if (offset > kMaxFileOffset || data.size() > kMaxFileOffset) {
    return codec_error_t::parameter_out_of_range;
  }
  if (mode != swapdot::schema::comm_mode_t::plain &&
      crypto::is_weak_key(session_key)) {
    spdlog::warn("Refusing WriteData under a weak session key");
    return codec_error_t::weak_key;
  }
  auto header = swapdot::schema::concat(
      std::array<uint8_t, 1>{file_no}, le24(offset),
      le24(static_cast<uint32_t>(data.size())));
  auto checksum = crc16(swapdot::schema::concat(
      std::array<uint8_t, 1>{kCmdWriteData}, header, data));

  auto payload = bytes_t{};
  switch (mode) {
    case swapdot::schema::comm_mode_t::plain:
      payload = swapdot::schema::make_bytes(data);
      break;
    case swapdot::schema::comm_mode_t::maced: {
      auto data_with_crc = swapdot::schema::concat(data, checksum);
      auto mac = mac_cbc(session_key,
                         swapdot::schema::concat(
                             std::array<uint8_t, 1>{kCmdWriteData}, header,
                             data_with_crc));
      if (auto* error = std::get_if<codec_error_t>(&mac)) {
        return *error;
      }
      payload = swapdot::schema::concat(data_with_crc, std::get<bytes_t>(mac));
      break;
    }
    case swapdot::schema::comm_mode_t::enciphered: {
      auto zero_iv = std::array<uint8_t, crypto::kDesBlockSize>{};
      auto encrypted = crypto::encrypt_cbc(
          session_key, zero_iv,
          pad_iso9797_m2(swapdot::schema::concat(data, checksum)));
      if (auto* error = std::get_if<codec_error_t>(&encrypted)) {
        return *error;
      }
      payload = std::move(std::get<bytes_t>(encrypted));
      break;
    }
  }

  spdlog::debug("WriteData file {} offset {}: {} data bytes, {} payload bytes",
                file_no, offset, data.size(), payload.size());
  return chain_frames(kCmdWriteData, header, payload, kMaxFirstWritePayload);
}

codec_result_t<frames_t> build_change_key_frames(
    const uint8_t key_no,
    const bytes_view_t& old_key,
    const bytes_view_t& new_key,
    const crypto::des_key_t& session_key,
    const uint8_t key_version) {
  auto old_normalized = crypto::normalize_key(old_key);
  auto new_normalized = crypto::normalize_key(new_key);
  if (!old_normalized || !new_normalized) {
    return codec_error_t::invalid_key_length;
  }
  auto old_bytes = crypto::key_bytes(*old_normalized);
  auto new_bytes = crypto::key_bytes(*new_normalized);
  if (old_bytes.size() != new_bytes.size()) {
    return codec_error_t::key_length_mismatch;
  }
  if (crypto::is_weak_key(session_key)) {
    spdlog::warn("Refusing ChangeKey under a weak session key");
    return codec_error_t::weak_key;
  }

  auto xored = bytes_t(new_bytes.size());
  std::transform(std::begin(new_bytes), std::end(new_bytes),
                 std::begin(old_bytes), std::begin(xored),
                 [](const uint8_t lhs, const uint8_t rhs) {
                   return static_cast<uint8_t>(lhs ^ rhs);
                 });
  auto cryptogram = swapdot::schema::concat(
      xored, crc16(new_bytes), std::array<uint8_t, 1>{key_version});

  auto zero_iv = std::array<uint8_t, crypto::kDesBlockSize>{};
  auto encrypted =
      crypto::encrypt_cbc(session_key, zero_iv, pad_iso9797_m2(cryptogram));
  if (auto* error = std::get_if<codec_error_t>(&encrypted)) {
    return *error;
  }
  return chain_frames(kCmdChangeKey, std::array<uint8_t, 1>{key_no},
                      std::get<bytes_t>(encrypted), kMaxFirstChangeKeyPayload);
}

}  // namespace swapdot::messaging
