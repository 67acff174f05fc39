#include "client/cpp/relay_client.h"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "internal/config/paths.hpp"
#include "internal/crypto/crypto.hpp"
#include "internal/pairing/pairing_protocol.hpp"
#include "internal/relay/auth_proof.hpp"

namespace mprisrelay::client {

using namespace mprisrelay::v1;

namespace {

::grpc::Status Failed(::grpc::StatusCode code, const std::string& message) {
  return ::grpc::Status(code, message);
}

PairingRequest Confirmation(bool accepted) {
  PairingRequest request;
  request.mutable_confirmation()->set_accepted(accepted);
  return request;
}

} // namespace

// ------------------------------------------------------------
// PairingClient
// ------------------------------------------------------------

PairingClient::PairingClient(std::shared_ptr<::grpc::Channel> channel) : stub_(Pairing::NewStub(channel)) {}

::grpc::Status PairingClient::Pair(const std::string& client_name, const SasConfirm& confirm,
                                 PairingAttempt* outcome) const {
  auto ephemeral = crypto::GenerateX25519KeyPair();

  ::grpc::ClientContext context;
  auto                stream = stub_->Pair(&context);

  PairingRequest hello;
  hello.mutable_hello()->set_ephemeral_public_key(crypto::ToString(ephemeral.public_key));
  hello.mutable_hello()->set_client_name(client_name);
  if (!stream->Write(hello)) {
    return stream->Finish();
  }

  PairingResponse response;
  if (!stream->Read(&response) || !response.has_hello()) {
    stream->WritesDone();
    auto status = stream->Finish();
    return status.ok() ? Failed(::grpc::StatusCode::INTERNAL, "agent did not answer the hello") : status;
  }
  const auto& server_hello = response.hello();
  const auto  server_eph   = crypto::AsBytes(server_hello.ephemeral_public_key());

  crypto::SecretBytes shared;
  std::string         sas;
  try {
    shared = crypto::X25519Agree(ephemeral.private_key.view(), server_eph);
    sas    = pairing::DeriveSas(shared.view(), ephemeral.public_key, server_eph,
                                static_cast<unsigned>(server_hello.sas().size()));
  } catch (const std::exception& e) {
    stream->Write(Confirmation(false));
    stream->WritesDone();
    stream->Finish();
    return Failed(::grpc::StatusCode::INVALID_ARGUMENT, std::string("agent key unusable: ") + e.what());
  }

  // The agent reports its own code; a different one here means the two
  // sides do not share a secret. Still ask, so the user sees both.
  const bool accepted = confirm(sas, server_hello) && sas == server_hello.sas();

  auto identity_keys = crypto::GenerateEd25519KeyPair();
  if (!accepted) {
    stream->Write(Confirmation(false));
  } else {
    Enrollment enrollment;
    enrollment.set_identity_public_key(crypto::ToString(identity_keys.public_key));
    enrollment.set_client_name(client_name);
    const auto transcript =
        pairing::EnrollmentTranscript(server_hello.session_id(), ephemeral.public_key, server_eph);
    enrollment.set_signature(crypto::ToString(crypto::Ed25519Sign(identity_keys.private_key.view(), transcript)));

    const auto enrollment_key =
        pairing::DeriveEnrollmentKey(shared.view(), ephemeral.public_key, server_eph);
    const auto plain  = enrollment.SerializeAsString();
    const auto sealed = crypto::Seal(enrollment_key.view(), crypto::AsBytes(plain),
                                     crypto::AsBytes(server_hello.session_id()));

    auto request = Confirmation(true);
    auto* box    = request.mutable_confirmation()->mutable_enrollment();
    box->set_nonce(crypto::ToString(sealed.nonce));
    box->set_ciphertext(crypto::ToString(sealed.ciphertext));
    box->set_tag(crypto::ToString(sealed.tag));
    stream->Write(request);
  }
  stream->WritesDone();

  if (!stream->Read(&response) || !response.has_result()) {
    auto status = stream->Finish();
    return status.ok() ? Failed(::grpc::StatusCode::INTERNAL, "agent sent no pairing result") : status;
  }
  outcome->result = response.result();
  auto status     = stream->Finish();
  if (!status.ok()) return status;

  if (outcome->result.outcome() != PAIRING_OUTCOME_ESTABLISHED) {
    return ::grpc::Status::OK;
  }

  const auto identity = pairing::IdentityFromPublicKey(identity_keys.public_key);
  if (outcome->result.identity() != identity) {
    return Failed(::grpc::StatusCode::UNAUTHENTICATED, "agent recorded a different identity");
  }
  auto trust_key = pairing::DeriveTrustKey(shared.view(), ephemeral.public_key, server_eph, identity_keys.public_key);
  const auto expected = pairing::KeyConfirmation(trust_key.view(), identity);
  if (!crypto::ConstantTimeEquals(expected, crypto::AsBytes(outcome->result.key_confirmation()))) {
    return Failed(::grpc::StatusCode::UNAUTHENTICATED, "agent key confirmation does not match");
  }

  auto& credentials = outcome->credentials;
  credentials.set_identity(identity);
  credentials.set_identity_private_key(crypto::ToString(identity_keys.private_key.view()));
  credentials.set_identity_public_key(crypto::ToString(identity_keys.public_key));
  credentials.set_trust_key(crypto::ToString(trust_key.view()));
  credentials.set_client_name(client_name);
  return ::grpc::Status::OK;
}

// ------------------------------------------------------------
// RelayClient
// ------------------------------------------------------------

RelayClient::RelayClient(std::shared_ptr<::grpc::Channel> channel, ClientCredentials credentials)
    : stub_(Relay::NewStub(channel)), credentials_(std::move(credentials)) {}

void RelayClient::Authorize(::grpc::ClientContext* context, const char* method) const {
  const auto proof = relay::MakeAuthProof(crypto::AsBytes(credentials_.trust_key()), method, credentials_.identity());
  context->AddMetadata(relay::kIdentityHeader, proof.identity);
  context->AddMetadata(relay::kTimestampHeader, std::to_string(proof.timestamp_ms));
  context->AddMetadata(relay::kNonceHeader, proof.nonce);
  context->AddMetadata(relay::kProofHeader, proof.proof);
}

::grpc::Status RelayClient::ListPlayers(std::vector<Player>* players) const {
  ::grpc::ClientContext context;
  Authorize(&context, relay::kListPlayersMethod);

  ListPlayersResponse response;
  auto                status = stub_->ListPlayers(&context, ListPlayersRequest{}, &response);
  if (status.ok()) {
    players->assign(response.players().begin(), response.players().end());
  }
  return status;
}

std::unique_ptr<::grpc::ClientReaderWriter<ClientMessage, ServerMessage>> RelayClient::Connect(
    ::grpc::ClientContext* context) const {
  Authorize(context, relay::kConnectMethod);
  return stub_->Connect(context);
}

// ------------------------------------------------------------
// Credential file
// ------------------------------------------------------------

std::filesystem::path DefaultCredentialsFile() {
  return config::ConfigDirectory() / "client-credentials.pb";
}

void SaveCredentials(const std::filesystem::path& path, const ClientCredentials& credentials) {
  if (path.has_parent_path()) config::EnsurePrivateDirectory(path.parent_path());

  const auto data = credentials.SerializeAsString();
  int        fd   = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
  if (fd < 0) {
    throw std::runtime_error("cannot write " + path.string() + ": " + std::strerror(errno));
  }

  std::size_t written = 0;
  while (written < data.size()) {
    ssize_t n = ::write(fd, data.data() + written, data.size() - written);
    if (n < 0) {
      if (errno == EINTR) continue;
      const std::string reason = std::strerror(errno);
      ::close(fd);
      throw std::runtime_error("cannot write " + path.string() + ": " + reason);
    }
    written += static_cast<std::size_t>(n);
  }
  ::fchmod(fd, 0600);
  ::close(fd);
}

ClientCredentials LoadCredentials(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("no credentials at " + path.string() + "; pair first");
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  ClientCredentials credentials;
  if (!credentials.ParseFromString(buffer.str()) || credentials.identity().empty()) {
    throw std::runtime_error("credentials at " + path.string() + " are unreadable");
  }
  return credentials;
}

} // namespace mprisrelay::client
