#include "pairing_server.hpp"

#include <chrono>
#include <future>
#include <thread>

#include "grpc_error.hpp"
#include "internal/observability/logging.hpp"

namespace mprisrelay::grpc {

using namespace mprisrelay::v1;

namespace {

// How long a client gets to half-close after the result is written.
constexpr auto kCloseGrace = std::chrono::seconds(5);

} // namespace

PairingServer::PairingServer(std::shared_ptr<mprisrelay::service::PairingService> svc)
    : service_(std::move(svc)) {}

::grpc::Status PairingServer::Pair(::grpc::ServerContext* ctx,
                                   ::grpc::ServerReaderWriter<PairingResponse, PairingRequest>* stream) {
  std::shared_ptr<pairing::PairingSession> session;
  try {
    session = service_->Open(ctx->peer());
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
  session->SetCancelHook([ctx] { ctx->TryCancel(); });

  // Reads the confirmation while this thread waits on the operator, so a
  // client that disconnects or answers early is noticed immediately.
  std::thread        reader;
  std::promise<void> reader_done;
  auto               reader_finished = reader_done.get_future();

  auto finish = [&](::grpc::Status status, bool graceful) {
    if (reader.joinable()) {
      if (!graceful || reader_finished.wait_for(kCloseGrace) != std::future_status::ready) {
        ctx->TryCancel();
      }
      reader.join();
    }
    service_->Close(session);
    return status;
  };

  try {
    PairingRequest request;
    if (!stream->Read(&request)) {
      return finish(::grpc::Status(::grpc::StatusCode::CANCELLED, "client went away before hello"), false);
    }
    if (!request.has_hello()) {
      return finish(::grpc::Status(::grpc::StatusCode::INVALID_ARGUMENT, "first message must be hello"), false);
    }

    PairingResponse hello;
    *hello.mutable_hello() = service_->Exchange(*session, request.hello());
    if (!stream->Write(hello)) {
      return finish(::grpc::Status(::grpc::StatusCode::CANCELLED, "client went away"), false);
    }

    reader = std::thread([stream, session, done = std::move(reader_done)]() mutable {
      PairingRequest next;
      if (stream->Read(&next) && next.has_confirmation()) {
        session->SetClientConfirmation(next.confirmation());
        // Nothing else is expected; drain until the client half-closes.
        while (stream->Read(&next)) {
        }
      } else {
        session->SetClientGone();
      }
      done.set_value();
    });

    PairingResponse result;
    *result.mutable_result() = service_->Conclude(*session);
    if (!stream->Write(result)) {
      MPRISRELAY_LOG_WARN("Pairing result not delivered", {observability::StringField("peer", ctx->peer())});
      return finish(::grpc::Status(::grpc::StatusCode::CANCELLED, "client went away"), false);
    }
    return finish(::grpc::Status::OK, true);
  } catch (const std::exception& e) {
    MPRISRELAY_LOG_WARN("Pairing failed", {observability::StringField("peer", ctx->peer()),
                                           observability::StringField("error", e.what())});
    return finish(ToStatus(e), false);
  }
}

} // namespace mprisrelay::grpc
