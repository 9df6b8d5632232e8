#include <swapdot/relay/server.hpp>
#include <swapdot/testing/service_fixture.hpp>
#include <gtest/gtest.h>
#include <grpcpp/grpcpp.h>

#include <memory>
#include <string>

namespace {

using swapdot::schema::error_code_t;

class deny_gate final : public swapdot::service::admission_gate {
 public:
  swapdot::schema::operation_status_t admit(
      const swapdot::service::admission_request_t& request) const override {
    if (request.caller == "mallory") {
      return swapdot::schema::make_error(error_code_t::permission_denied,
                                         "swapdot.test", "rate limited");
    }
    return {};
  }
};

/// In-process relay on an ephemeral loopback port.
class relay_harness final {
 public:
  relay_harness(swapdot::service::service& service,
                const swapdot::service::admission_gate& gate)
      : listener_{service, gate} {
    auto builder = grpc::ServerBuilder{};
    auto port = 0;
    builder.AddListeningPort("127.0.0.1:0", grpc::InsecureServerCredentials(),
                             &port);
    builder.RegisterService(&listener_);
    server_ = builder.BuildAndStart();
    auto channel = grpc::CreateChannel("127.0.0.1:" + std::to_string(port),
                                       grpc::InsecureChannelCredentials());
    stub_ = swapdot::relay::v1::TokenRelay::NewStub(channel);
  }

  ~relay_harness() {
    if (server_) {
      server_->Shutdown();
    }
  }

  bool running() const { return server_ != nullptr; }
  swapdot::relay::v1::TokenRelay::Stub& stub() { return *stub_; }

 private:
  swapdot::relay::listener listener_;
  std::unique_ptr<grpc::Server> server_;
  std::unique_ptr<swapdot::relay::v1::TokenRelay::Stub> stub_;
};

std::unique_ptr<grpc::ClientContext> context_for(const std::string& caller) {
  auto context = std::make_unique<grpc::ClientContext>();
  if (!caller.empty()) {
    context->AddMetadata(std::string{swapdot::relay::kCallerMetadataKey},
                         caller);
  }
  return context;
}

}  // namespace

TEST(relay_status, maps_error_codes_to_grpc_codes) {
  auto map = [](const error_code_t code) {
    return swapdot::relay::to_grpc_status(
               swapdot::schema::make_error(code, "swapdot.test", "detail"))
        .error_code();
  };
  EXPECT_EQ(swapdot::relay::to_grpc_status({}).error_code(),
            grpc::StatusCode::OK);
  EXPECT_EQ(map(error_code_t::invalid_argument),
            grpc::StatusCode::INVALID_ARGUMENT);
  EXPECT_EQ(map(error_code_t::not_found), grpc::StatusCode::NOT_FOUND);
  EXPECT_EQ(map(error_code_t::permission_denied),
            grpc::StatusCode::PERMISSION_DENIED);
  EXPECT_EQ(map(error_code_t::conflict), grpc::StatusCode::ABORTED);
  EXPECT_EQ(map(error_code_t::expired), grpc::StatusCode::DEADLINE_EXCEEDED);
  EXPECT_EQ(map(error_code_t::protocol_error),
            grpc::StatusCode::FAILED_PRECONDITION);
  EXPECT_EQ(map(error_code_t::already_exists),
            grpc::StatusCode::ALREADY_EXISTS);
  EXPECT_EQ(map(error_code_t::not_implemented),
            grpc::StatusCode::UNIMPLEMENTED);
  EXPECT_EQ(map(error_code_t::internal), grpc::StatusCode::INTERNAL);

  auto status = swapdot::relay::to_grpc_status(swapdot::schema::make_error(
      error_code_t::conflict, "swapdot.test", "token is locked"));
  EXPECT_EQ(status.error_message(), "token is locked");
}

TEST(relay_server, registers_and_reads_tokens_for_identified_callers) {
  auto fixture = swapdot::testing::service_fixture{"swapdot_relay_register"};
  auto gate = deny_gate{};
  auto relay = relay_harness{fixture.service(), gate};
  ASSERT_TRUE(relay.running());

  auto key_hash = swapdot::testing::make_hash(3);
  auto request = swapdot::relay::v1::RegisterTokenRequest{};
  request.set_token_id("T1");
  request.set_key_hash(std::string{std::begin(key_hash), std::end(key_hash)});
  auto response = swapdot::relay::v1::TokenResponse{};
  auto status =
      relay.stub().RegisterToken(context_for("alice").get(), request, &response);
  ASSERT_TRUE(status.ok()) << status.error_message();
  EXPECT_EQ(response.token().current_owner(), "alice");
  EXPECT_EQ(response.token().counter(), 0u);
  EXPECT_EQ(response.token().key_hash().size(), 32u);

  auto get = swapdot::relay::v1::GetTokenRequest{};
  get.set_token_id("T1");
  auto fetched = swapdot::relay::v1::TokenResponse{};
  status = relay.stub().GetToken(context_for("bob").get(), get, &fetched);
  ASSERT_TRUE(status.ok()) << status.error_message();
  EXPECT_EQ(fetched.token().current_owner(), "alice");

  get.set_token_id("T9");
  status = relay.stub().GetToken(context_for("bob").get(), get, &fetched);
  EXPECT_EQ(status.error_code(), grpc::StatusCode::NOT_FOUND);
}

TEST(relay_server, rejects_anonymous_and_gated_callers) {
  auto fixture = swapdot::testing::service_fixture{"swapdot_relay_gate"};
  auto gate = deny_gate{};
  auto relay = relay_harness{fixture.service(), gate};
  ASSERT_TRUE(relay.running());

  auto request = swapdot::relay::v1::InitiateTransferRequest{};
  request.set_token_id("T1");
  auto response = swapdot::relay::v1::InitiateTransferResponse{};
  auto status =
      relay.stub().InitiateTransfer(context_for("").get(), request, &response);
  EXPECT_EQ(status.error_code(), grpc::StatusCode::PERMISSION_DENIED);
  status = relay.stub().InitiateTransfer(context_for("mallory").get(), request,
                                         &response);
  EXPECT_EQ(status.error_code(), grpc::StatusCode::PERMISSION_DENIED);
  EXPECT_EQ(status.error_message(), "rate limited");

  auto bad_hash = swapdot::relay::v1::RegisterTokenRequest{};
  bad_hash.set_token_id("T1");
  bad_hash.set_key_hash("short");
  auto token = swapdot::relay::v1::TokenResponse{};
  status = relay.stub().RegisterToken(context_for("alice").get(), bad_hash,
                                      &token);
  EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
}
