#include <swapdot/relay/server.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <optional>
#include <string>

using namespace swapdot::relay;
using namespace swapdot::schema;

namespace {

inline constexpr auto kCodespace = std::string_view{"swapdot.relay"};

grpc::ServerUnaryReactor* finish(grpc::CallbackServerContext* context,
                                 const operation_status_t& status) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(to_grpc_status(status));
  return reactor;
}

std::optional<hash32_t> try_make_hash32_bytes(const std::string& value) {
  if (value.size() != std::tuple_size_v<hash32_t>) {
    return std::nullopt;
  }
  auto hash = hash32_t{};
  std::copy_n(std::begin(value), hash.size(), std::begin(hash));
  return hash;
}

template <typename T>
std::optional<T> optional_field(bool present, const T& value) {
  if (!present) {
    return std::nullopt;
  }
  return value;
}

void populate_token(const token_state_t& source,
                    swapdot::relay::v1::Token* destination) {
  destination->set_token_id(source.token_id);
  destination->set_current_owner(source.current_owner);
  for (const auto& owner : source.previous_owners) {
    destination->add_previous_owners(owner);
  }
  destination->set_key_hash(make_string(source.key_hash));
  destination->set_counter(source.counter);
  destination->set_status(std::string{to_string(source.status)});
  destination->set_tag_uid(source.tag_uid.value_or(std::string{}));
  destination->set_key_version(source.key_version);
  destination->set_chain_head(make_string(source.chain_head));
  destination->set_created_at(source.created_at);
  destination->set_last_transfer_at(source.last_transfer_at);
}

}  // namespace

namespace swapdot::relay {

grpc::Status to_grpc_status(const operation_status_t& status) {
  switch (status.code) {
    case error_code_t::ok:
      return grpc::Status::OK;
    case error_code_t::invalid_argument:
      return grpc::Status{grpc::StatusCode::INVALID_ARGUMENT, status.log};
    case error_code_t::not_found:
      return grpc::Status{grpc::StatusCode::NOT_FOUND, status.log};
    case error_code_t::permission_denied:
      return grpc::Status{grpc::StatusCode::PERMISSION_DENIED, status.log};
    case error_code_t::conflict:
      return grpc::Status{grpc::StatusCode::ABORTED, status.log};
    case error_code_t::expired:
      return grpc::Status{grpc::StatusCode::DEADLINE_EXCEEDED, status.log};
    case error_code_t::protocol_error:
    case error_code_t::weak_key:
      return grpc::Status{grpc::StatusCode::FAILED_PRECONDITION, status.log};
    case error_code_t::already_exists:
      return grpc::Status{grpc::StatusCode::ALREADY_EXISTS, status.log};
    case error_code_t::not_implemented:
      return grpc::Status{grpc::StatusCode::UNIMPLEMENTED, status.log};
    case error_code_t::internal:
    default:
      return grpc::Status{grpc::StatusCode::INTERNAL, status.log};
  }
}

listener::listener(swapdot::service::service& service,
                   const swapdot::service::admission_gate& gate)
    : service_{service}, gate_{gate} {}

operation_result<user_id_t> listener::admit(
    grpc::CallbackServerContext* context,
    const std::string_view operation,
    const token_id_t& token_id) const {
  const auto& metadata = context->client_metadata();
  auto entry = metadata.find(
      grpc::string_ref{kCallerMetadataKey.data(), kCallerMetadataKey.size()});
  if (entry == std::end(metadata) || entry->second.empty()) {
    spdlog::warn("Rejecting {} from {}: no caller identity", operation,
                 context->peer());
    return make_failure<user_id_t>(error_code_t::permission_denied, kCodespace,
                                   "missing caller identity");
  }
  auto caller = user_id_t{entry->second.data(), entry->second.size()};
  auto admitted = gate_.admit(swapdot::service::admission_request_t{
      .operation = std::string{operation},
      .caller = caller,
      .token_id = token_id,
      .peer = context->peer()});
  if (!admitted.ok()) {
    spdlog::warn("Admission refused {} for {}: {}", operation, caller,
                 admitted.log);
    return {.status = std::move(admitted), .value = {}};
  }
  return make_success(std::move(caller));
}

grpc::ServerUnaryReactor* listener::BeginAuthenticate(
    grpc::CallbackServerContext* context,
    const swapdot::relay::v1::BeginAuthenticateRequest* request,
    swapdot::relay::v1::BeginAuthenticateResponse* response) {
  auto caller = admit(context, "begin_authenticate", request->token_id());
  if (!caller.ok()) {
    return finish(context, caller.status);
  }
  auto result = service_.begin_authenticate(request->token_id(), caller.value,
                                            request->allow_unowned());
  if (result.ok()) {
    response->set_session_id(result.value.session_id);
    response->set_apdu(make_string(result.value.apdu));
    response->set_expires_at(result.value.expires_at);
  }
  return finish(context, result.status);
}

grpc::ServerUnaryReactor* listener::ContinueAuthenticate(
    grpc::CallbackServerContext* context,
    const swapdot::relay::v1::ContinueAuthenticateRequest* request,
    swapdot::relay::v1::ContinueAuthenticateResponse* response) {
  auto caller = admit(context, "continue_authenticate", token_id_t{});
  if (!caller.ok()) {
    return finish(context, caller.status);
  }
  auto result = service_.continue_authenticate(
      request->session_id(), make_bytes_view(request->card_response()));
  if (result.ok()) {
    response->set_authenticated(result.value.authenticated);
    response->set_apdu(make_string(result.value.apdu));
  }
  return finish(context, result.status);
}

grpc::ServerUnaryReactor* listener::ChangeKey(
    grpc::CallbackServerContext* context,
    const swapdot::relay::v1::ChangeKeyRequest* request,
    swapdot::relay::v1::ChangeKeyResponse* response) {
  auto caller = admit(context, "change_key", token_id_t{});
  if (!caller.ok()) {
    return finish(context, caller.status);
  }
  auto key_version = std::optional<uint8_t>{};
  if (request->has_key_version()) {
    if (request->key_version() > 0xFF) {
      return finish(context,
                    make_error(error_code_t::invalid_argument, kCodespace,
                               "key_version must fit in one byte"));
    }
    key_version = static_cast<uint8_t>(request->key_version());
  }
  auto result = service_.change_key(request->session_id(), key_version);
  if (result.ok()) {
    for (const auto& apdu : result.value.apdus) {
      response->add_apdus(make_string(apdu));
    }
    response->set_key_hash(make_string(result.value.key_hash));
    response->set_key_version(result.value.key_version);
  }
  return finish(context, result.status);
}

grpc::ServerUnaryReactor* listener::ConfirmChangeKey(
    grpc::CallbackServerContext* context,
    const swapdot::relay::v1::ConfirmChangeKeyRequest* request,
    swapdot::relay::v1::ConfirmChangeKeyResponse* /*response*/) {
  auto caller = admit(context, "confirm_change_key", token_id_t{});
  if (!caller.ok()) {
    return finish(context, caller.status);
  }
  return finish(context, service_.confirm_change_key(
                             request->session_id(),
                             make_bytes_view(request->card_response())));
}

grpc::ServerUnaryReactor* listener::WriteTransferData(
    grpc::CallbackServerContext* context,
    const swapdot::relay::v1::WriteTransferDataRequest* request,
    swapdot::relay::v1::WriteTransferDataResponse* response) {
  auto caller = admit(context, "write_transfer_data", token_id_t{});
  if (!caller.ok()) {
    return finish(context, caller.status);
  }
  auto result = service_.write_transfer_data(request->session_id(),
                                             request->transfer_session_id());
  if (result.ok()) {
    for (const auto& apdu : result.value.apdus) {
      response->add_apdus(make_string(apdu));
    }
    response->set_key_hash(make_string(result.value.key_hash));
  }
  return finish(context, result.status);
}

grpc::ServerUnaryReactor* listener::ReadFileData(
    grpc::CallbackServerContext* context,
    const swapdot::relay::v1::ReadFileDataRequest* request,
    swapdot::relay::v1::ReadFileDataResponse* response) {
  auto caller = admit(context, "read_file_data", token_id_t{});
  if (!caller.ok()) {
    return finish(context, caller.status);
  }
  if (request->file_no() > 0xFF) {
    return finish(context, make_error(error_code_t::invalid_argument,
                                      kCodespace, "file_no must fit in one byte"));
  }
  auto result = service_.read_file_data(
      request->session_id(), static_cast<uint8_t>(request->file_no()),
      request->offset(),
      optional_field(request->has_length(), request->length()));
  if (result.ok()) {
    response->set_apdu(make_string(result.value));
  }
  return finish(context, result.status);
}

grpc::ServerUnaryReactor* listener::RegisterToken(
    grpc::CallbackServerContext* context,
    const swapdot::relay::v1::RegisterTokenRequest* request,
    swapdot::relay::v1::TokenResponse* response) {
  auto caller = admit(context, "register_token", request->token_id());
  if (!caller.ok()) {
    return finish(context, caller.status);
  }
  auto key_hash = try_make_hash32_bytes(request->key_hash());
  if (!key_hash) {
    return finish(context, make_error(error_code_t::invalid_argument,
                                      kCodespace, "key_hash must be 32 bytes"));
  }
  auto result = service_.register_token(
      request->token_id(), caller.value, *key_hash,
      optional_field(request->has_tag_uid(), request->tag_uid()),
      request->force_overwrite());
  if (result.ok()) {
    populate_token(result.value, response->mutable_token());
  }
  return finish(context, result.status);
}

grpc::ServerUnaryReactor* listener::InitiateTransfer(
    grpc::CallbackServerContext* context,
    const swapdot::relay::v1::InitiateTransferRequest* request,
    swapdot::relay::v1::InitiateTransferResponse* response) {
  auto caller = admit(context, "initiate_transfer", request->token_id());
  if (!caller.ok()) {
    return finish(context, caller.status);
  }
  auto result = service_.initiate_transfer(request->token_id(), caller.value);
  if (result.ok()) {
    response->set_n_next(result.value.n_next);
    response->set_expires_at(result.value.expires_at);
  }
  return finish(context, result.status);
}

grpc::ServerUnaryReactor* listener::FinalizeTransfer(
    grpc::CallbackServerContext* context,
    const swapdot::relay::v1::FinalizeTransferRequest* request,
    swapdot::relay::v1::TokenResponse* response) {
  auto caller = admit(context, "finalize_transfer", request->token_id());
  if (!caller.ok()) {
    return finish(context, caller.status);
  }
  auto result = service_.finalize_transfer(
      request->token_id(), caller.value,
      optional_field(request->has_tag_uid(), request->tag_uid()));
  if (result.ok()) {
    populate_token(result.value, response->mutable_token());
  }
  return finish(context, result.status);
}

grpc::ServerUnaryReactor* listener::OpenTransferSession(
    grpc::CallbackServerContext* context,
    const swapdot::relay::v1::OpenTransferSessionRequest* request,
    swapdot::relay::v1::OpenTransferSessionResponse* response) {
  auto caller = admit(context, "open_transfer_session", request->token_id());
  if (!caller.ok()) {
    return finish(context, caller.status);
  }
  auto result = service_.open_transfer_session(
      request->token_id(), caller.value,
      optional_field(request->has_to_uid(), request->to_uid()),
      optional_field(request->has_ttl_ms(), request->ttl_ms()));
  if (result.ok()) {
    response->set_session_id(result.value.session_id);
    response->set_challenge(make_string(result.value.challenge));
    response->set_expires_at(result.value.expires_at);
  }
  return finish(context, result.status);
}

grpc::ServerUnaryReactor* listener::ValidateCardKey(
    grpc::CallbackServerContext* context,
    const swapdot::relay::v1::ValidateCardKeyRequest* request,
    swapdot::relay::v1::ValidateCardKeyResponse* response) {
  auto caller = admit(context, "validate_card_key", token_id_t{});
  if (!caller.ok()) {
    return finish(context, caller.status);
  }
  auto result = service_.validate_card_key(
      request->transfer_session_id(), make_bytes_view(request->card_bytes()));
  if (result.ok()) {
    response->set_proof(make_string(result.value));
  }
  return finish(context, result.status);
}

grpc::ServerUnaryReactor* listener::StageTransfer(
    grpc::CallbackServerContext* context,
    const swapdot::relay::v1::StageTransferRequest* request,
    swapdot::relay::v1::StageTransferResponse* response) {
  auto caller = admit(context, "stage_transfer", token_id_t{});
  if (!caller.ok()) {
    return finish(context, caller.status);
  }
  auto new_key_hash = try_make_hash32_bytes(request->new_key_hash());
  if (!new_key_hash) {
    return finish(context,
                  make_error(error_code_t::invalid_argument, kCodespace,
                             "new_key_hash must be 32 bytes"));
  }
  auto result = service_.stage_transfer(
      request->transfer_session_id(), caller.value, *new_key_hash,
      optional_field(request->has_to_uid(), request->to_uid()));
  if (result.ok()) {
    response->set_staged_id(result.value.staged_id);
    response->set_expires_at(result.value.expires_at);
  }
  return finish(context, result.status);
}

grpc::ServerUnaryReactor* listener::CommitTransfer(
    grpc::CallbackServerContext* context,
    const swapdot::relay::v1::CommitTransferRequest* request,
    swapdot::relay::v1::TokenResponse* response) {
  auto caller = admit(context, "commit_transfer", token_id_t{});
  if (!caller.ok()) {
    return finish(context, caller.status);
  }
  auto result = service_.commit_transfer(request->staged_id(), caller.value);
  if (result.ok()) {
    populate_token(result.value, response->mutable_token());
  }
  return finish(context, result.status);
}

grpc::ServerUnaryReactor* listener::RollbackTransfer(
    grpc::CallbackServerContext* context,
    const swapdot::relay::v1::RollbackTransferRequest* request,
    swapdot::relay::v1::RollbackTransferResponse* response) {
  auto caller = admit(context, "rollback_transfer", token_id_t{});
  if (!caller.ok()) {
    return finish(context, caller.status);
  }
  auto result = service_.rollback_transfer(
      request->staged_id(), caller.value,
      optional_field(request->has_reason(), request->reason()));
  if (result.ok()) {
    response->set_session_id(result.value.session_id);
  }
  return finish(context, result.status);
}

grpc::ServerUnaryReactor* listener::GetToken(
    grpc::CallbackServerContext* context,
    const swapdot::relay::v1::GetTokenRequest* request,
    swapdot::relay::v1::TokenResponse* response) {
  auto caller = admit(context, "get_token", request->token_id());
  if (!caller.ok()) {
    return finish(context, caller.status);
  }
  auto result = service_.get_token(request->token_id());
  if (result.ok()) {
    populate_token(result.value, response->mutable_token());
  }
  return finish(context, result.status);
}

grpc::ServerUnaryReactor* listener::GetTokenEvents(
    grpc::CallbackServerContext* context,
    const swapdot::relay::v1::GetTokenRequest* request,
    swapdot::relay::v1::TokenEventsResponse* response) {
  auto caller = admit(context, "get_token_events", request->token_id());
  if (!caller.ok()) {
    return finish(context, caller.status);
  }
  for (const auto& event : service_.token_events(request->token_id())) {
    auto* entry = response->add_events();
    entry->set_sequence(event.sequence);
    entry->set_from_owner(event.from_owner);
    entry->set_to_owner(event.to_owner);
    entry->set_counter(event.counter);
    entry->set_protocol(std::string{to_string(event.protocol)});
    entry->set_timestamp(event.timestamp);
    entry->set_chain_head(make_string(event.chain_head));
  }
  return finish(context, operation_status_t{});
}

}  // namespace swapdot::relay
