#pragma once

#include <swapdot/relay/v1/relay.grpc.pb.h>
#include <swapdot/schema/operation_result.hpp>
#include <swapdot/service/admission_gate.hpp>
#include <swapdot/service/service.hpp>

#include <string_view>

namespace swapdot::relay {

/// Metadata entry carrying the caller established by the identity layer.
inline constexpr auto kCallerMetadataKey = std::string_view{"x-swapdot-user"};

grpc::Status to_grpc_status(const swapdot::schema::operation_status_t& status);

/// TokenRelay callback listener. Every call resolves the caller, passes the
/// admission gate, then runs one service operation inline.
struct listener final : public swapdot::relay::v1::TokenRelay::CallbackService {
  listener(swapdot::service::service& service,
           const swapdot::service::admission_gate& gate);

  virtual grpc::ServerUnaryReactor* BeginAuthenticate(
      grpc::CallbackServerContext* context,
      const swapdot::relay::v1::BeginAuthenticateRequest* request,
      swapdot::relay::v1::BeginAuthenticateResponse* response) override final;

  virtual grpc::ServerUnaryReactor* ContinueAuthenticate(
      grpc::CallbackServerContext* context,
      const swapdot::relay::v1::ContinueAuthenticateRequest* request,
      swapdot::relay::v1::ContinueAuthenticateResponse* response)
      override final;

  virtual grpc::ServerUnaryReactor* ChangeKey(
      grpc::CallbackServerContext* context,
      const swapdot::relay::v1::ChangeKeyRequest* request,
      swapdot::relay::v1::ChangeKeyResponse* response) override final;

  virtual grpc::ServerUnaryReactor* ConfirmChangeKey(
      grpc::CallbackServerContext* context,
      const swapdot::relay::v1::ConfirmChangeKeyRequest* request,
      swapdot::relay::v1::ConfirmChangeKeyResponse* response) override final;

  virtual grpc::ServerUnaryReactor* WriteTransferData(
      grpc::CallbackServerContext* context,
      const swapdot::relay::v1::WriteTransferDataRequest* request,
      swapdot::relay::v1::WriteTransferDataResponse* response) override final;

  virtual grpc::ServerUnaryReactor* ReadFileData(
      grpc::CallbackServerContext* context,
      const swapdot::relay::v1::ReadFileDataRequest* request,
      swapdot::relay::v1::ReadFileDataResponse* response) override final;

  virtual grpc::ServerUnaryReactor* RegisterToken(
      grpc::CallbackServerContext* context,
      const swapdot::relay::v1::RegisterTokenRequest* request,
      swapdot::relay::v1::TokenResponse* response) override final;

  virtual grpc::ServerUnaryReactor* InitiateTransfer(
      grpc::CallbackServerContext* context,
      const swapdot::relay::v1::InitiateTransferRequest* request,
      swapdot::relay::v1::InitiateTransferResponse* response) override final;

  virtual grpc::ServerUnaryReactor* FinalizeTransfer(
      grpc::CallbackServerContext* context,
      const swapdot::relay::v1::FinalizeTransferRequest* request,
      swapdot::relay::v1::TokenResponse* response) override final;

  virtual grpc::ServerUnaryReactor* OpenTransferSession(
      grpc::CallbackServerContext* context,
      const swapdot::relay::v1::OpenTransferSessionRequest* request,
      swapdot::relay::v1::OpenTransferSessionResponse* response)
      override final;

  virtual grpc::ServerUnaryReactor* ValidateCardKey(
      grpc::CallbackServerContext* context,
      const swapdot::relay::v1::ValidateCardKeyRequest* request,
      swapdot::relay::v1::ValidateCardKeyResponse* response) override final;

  virtual grpc::ServerUnaryReactor* StageTransfer(
      grpc::CallbackServerContext* context,
      const swapdot::relay::v1::StageTransferRequest* request,
      swapdot::relay::v1::StageTransferResponse* response) override final;

  virtual grpc::ServerUnaryReactor* CommitTransfer(
      grpc::CallbackServerContext* context,
      const swapdot::relay::v1::CommitTransferRequest* request,
      swapdot::relay::v1::TokenResponse* response) override final;

  virtual grpc::ServerUnaryReactor* RollbackTransfer(
      grpc::CallbackServerContext* context,
      const swapdot::relay::v1::RollbackTransferRequest* request,
      swapdot::relay::v1::RollbackTransferResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetToken(
      grpc::CallbackServerContext* context,
      const swapdot::relay::v1::GetTokenRequest* request,
      swapdot::relay::v1::TokenResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetTokenEvents(
      grpc::CallbackServerContext* context,
      const swapdot::relay::v1::GetTokenRequest* request,
      swapdot::relay::v1::TokenEventsResponse* response) override final;

  /// Resolve the caller and consult the gate. The value is the caller id.
  swapdot::schema::operation_result<swapdot::schema::user_id_t> admit(
      grpc::CallbackServerContext* context,
      std::string_view operation,
      const swapdot::schema::token_id_t& token_id) const;

  swapdot::service::service& service_;
  const swapdot::service::admission_gate& gate_;
};

}  // namespace swapdot::relay
