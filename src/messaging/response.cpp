#include <swapdot/messaging/response.hpp>

namespace swapdot::messaging {

namespace {

status_error_t classify(const uint8_t sw2) {
  switch (sw2) {
    case 0x7E:
      return status_error_t::length_error;
    case 0x9D:
      return status_error_t::permission_denied;
    case 0xA0:
    case 0xBD:
    case 0xF0:
      return status_error_t::not_found;
    case 0x1C:
      return status_error_t::command_not_supported;
    case 0x1E:
      return status_error_t::integrity_error;
    case 0xAE:
      return status_error_t::authentication_error;
    case 0xBE:
      return status_error_t::boundary_error;
    default:
      return status_error_t::unknown;
  }
}

}  // namespace

response_t parse_response(const swapdot::schema::bytes_view_t& bytes) {
  if (bytes.size() < 2) {
    return response_error_t{.error = status_error_t::malformed};
  }
  auto sw1 = bytes[bytes.size() - 2];
  auto sw2 = bytes[bytes.size() - 1];
  auto data = swapdot::schema::make_bytes(bytes.first(bytes.size() - 2));
  if (sw1 != kStatusClass) {
    return response_error_t{
        .error = status_error_t::unknown, .sw1 = sw1, .sw2 = sw2};
  }
  if (sw2 == kStatusOk) {
    return response_success_t{.data = std::move(data)};
  }
  if (sw2 == kStatusMoreFrames) {
    return response_more_frames_t{.data = std::move(data)};
  }
  return response_error_t{.error = classify(sw2), .sw1 = sw1, .sw2 = sw2};
}

std::variant<response_success_t, response_error_t> assemble_response(
    const std::vector<swapdot::schema::bytes_t>& responses) {
  if (responses.empty()) {
    return response_error_t{.error = status_error_t::malformed};
  }
  auto assembled = swapdot::schema::bytes_t{};
  for (std::size_t i = 0; i < responses.size(); ++i) {
    auto last = (i + 1) == responses.size();
    auto parsed = parse_response(responses[i]);
    if (auto* error = std::get_if<response_error_t>(&parsed)) {
      return *error;
    }
    if (auto* more = std::get_if<response_more_frames_t>(&parsed)) {
      if (last) {
        return response_error_t{.error = status_error_t::malformed,
                                .sw1 = kStatusClass,
                                .sw2 = kStatusMoreFrames};
      }
      assembled.insert(std::end(assembled), std::begin(more->data),
                       std::end(more->data));
      continue;
    }
    if (!last) {
      return response_error_t{.error = status_error_t::malformed,
                              .sw1 = kStatusClass,
                              .sw2 = kStatusOk};
    }
    auto& success = std::get<response_success_t>(parsed);
    assembled.insert(std::end(assembled), std::begin(success.data),
                     std::end(success.data));
  }
  return response_success_t{.data = std::move(assembled)};
}

}  // namespace swapdot::messaging
