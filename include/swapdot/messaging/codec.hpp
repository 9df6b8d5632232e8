#pragma once

#include <swapdot/crypto/codec_error.hpp>
#include <swapdot/crypto/des.hpp>
#include <swapdot/schema/comm_mode.hpp>
#include <swapdot/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <vector>

// Byte-exact DESFire native command framing. Everything here is a pure
// function of its arguments.
namespace swapdot::messaging {

inline constexpr auto kCla = uint8_t{0x90};
inline constexpr auto kCmdAuthenticate = uint8_t{0x1A};
inline constexpr auto kCmdAdditionalFrame = uint8_t{0xAF};
inline constexpr auto kCmdWriteData = uint8_t{0x3D};
inline constexpr auto kCmdReadData = uint8_t{0xBD};
inline constexpr auto kCmdChangeKey = uint8_t{0xC4};

// Short APDU body limits. The first WriteData frame also carries
// fileNo ‖ offset(3) ‖ length(3); the first ChangeKey frame carries keyNo.
inline constexpr auto kMaxFrameBody = std::size_t{55};
inline constexpr auto kWriteHeaderSize = std::size_t{7};
inline constexpr auto kMaxFirstWritePayload = kMaxFrameBody - kWriteHeaderSize;
inline constexpr auto kMaxFirstChangeKeyPayload = kMaxFrameBody - 1;
inline constexpr auto kMaxContinuationPayload = std::size_t{59};
inline constexpr auto kMaxFileOffset = uint32_t{0xFFFFFF};

using frames_t = std::vector<swapdot::schema::bytes_t>;

/// Reflected CRC16 (init 0xFFFF, poly 0xA001), little-endian.
std::array<uint8_t, 2> crc16(const swapdot::schema::bytes_view_t& data);

/// Reflected CRC32 (poly 0xEDB88320, init and xorout 0xFFFFFFFF),
/// little-endian. Only AES sessions use it.
std::array<uint8_t, 4> crc32(const swapdot::schema::bytes_view_t& data);

/// ISO 9797-1 method 2: 0x80 then zeros up to the next block boundary. A
/// block aligned input still gains a full block.
swapdot::schema::bytes_t pad_iso9797_m2(
    const swapdot::schema::bytes_view_t& data,
    std::size_t block_size = swapdot::crypto::kDesBlockSize);

/// Strip trailing zeros then one 0x80. Data without a marker is returned
/// unchanged.
swapdot::schema::bytes_t unpad_iso9797_m2(
    const swapdot::schema::bytes_view_t& data);

/// Last block of 3DES-CBC (zero IV) over the padded data.
crypto::codec_result_t<swapdot::schema::bytes_t> mac_cbc(
    const crypto::des_key_t& key,
    const swapdot::schema::bytes_view_t& data);

/// AES-CMAC for AES sessions. Not supported: always fails with
/// codec_error_t::not_implemented.
crypto::codec_result_t<swapdot::schema::bytes_t> aes_cmac(
    const swapdot::schema::bytes_view_t& key,
    const swapdot::schema::bytes_view_t& data);

/// `90 1A 00 00 01 <keyNo> 00`
swapdot::schema::bytes_t build_authenticate_frame(uint8_t key_no);

/// `90 AF 00 00 <Lc> <body> 00`, or `90 AF 00 00 00` for an empty body.
swapdot::schema::bytes_t build_additional_frame(
    const swapdot::schema::bytes_view_t& body);

/// `90 BD 00 00 07 <fileNo> <offset:3LE> <length:3LE> 00`. length 0 reads to
/// the end of the file.
crypto::codec_result_t<swapdot::schema::bytes_t> build_read_frame(
    uint8_t file_no,
    uint32_t offset,
    uint32_t length);

/// WriteData (0x3D) split over a first frame and 0xAF continuations.
///
/// plain: payload is the data.
/// maced: data ‖ crc16(cmd‖hdr‖data) ‖ mac_cbc(cmd‖hdr‖data‖crc).
/// enciphered: 3DES-CBC(zero IV, pad(data ‖ crc16(cmd‖hdr‖data))).
crypto::codec_result_t<frames_t> build_write_frames(
    uint8_t file_no,
    uint32_t offset,
    const swapdot::schema::bytes_view_t& data,
    const crypto::des_key_t& session_key,
    swapdot::schema::comm_mode_t mode);

/// ChangeKey (0xC4) for a same-slot key change. The cryptogram is
/// xor(new, old) ‖ crc16(new) ‖ key_version, padded and encrypted with the
/// session key under a zero IV.
crypto::codec_result_t<frames_t> build_change_key_frames(
    uint8_t key_no,
    const swapdot::schema::bytes_view_t& old_key,
    const swapdot::schema::bytes_view_t& new_key,
    const crypto::des_key_t& session_key,
    uint8_t key_version);

}  // namespace swapdot::messaging
