#pragma once

#include <turnstile/events/event_controller.hpp>
#include <turnstile/ledger/journal.hpp>
#include <turnstile/ledger/transfer_engine.hpp>
#include <turnstile/ledger/wallet_store.hpp>
#include <turnstile/v1/ledger.grpc.pb.h>

namespace turnstile::rpc {

/// Callback listener for the turnstile.v1.Ledger service.
///
/// Each handler decodes ids, runs one engine operation on the gRPC callback
/// thread and copies the code/log/codespace envelope into the response.
/// Malformed ids finish the call with INVALID_ARGUMENT instead.
struct listener final : public turnstile::v1::Ledger::CallbackService {
  listener(turnstile::ledger::wallet_store& wallets,
           turnstile::ledger::journal& journal,
           turnstile::ledger::transfer_engine& transfers,
           turnstile::events::event_controller& events);

  virtual grpc::ServerUnaryReactor* Deposit(
      grpc::CallbackServerContext* context,
      const turnstile::v1::DepositRequest* request,
      turnstile::v1::TransferResponse* response) override final;

  virtual grpc::ServerUnaryReactor* OpenWallet(
      grpc::CallbackServerContext* context,
      const turnstile::v1::OpenWalletRequest* request,
      turnstile::v1::WalletResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetWallet(
      grpc::CallbackServerContext* context,
      const turnstile::v1::GetWalletRequest* request,
      turnstile::v1::WalletResponse* response) override final;

  virtual grpc::ServerUnaryReactor* CreateEvent(
      grpc::CallbackServerContext* context,
      const turnstile::v1::CreateEventRequest* request,
      turnstile::v1::EventResponse* response) override final;

  virtual grpc::ServerUnaryReactor* StartEvent(
      grpc::CallbackServerContext* context,
      const turnstile::v1::LifecycleRequest* request,
      turnstile::v1::EventResponse* response) override final;

  virtual grpc::ServerUnaryReactor* EndEvent(
      grpc::CallbackServerContext* context,
      const turnstile::v1::LifecycleRequest* request,
      turnstile::v1::EventResponse* response) override final;

  /// Runs the whole refund cascade before answering.
  virtual grpc::ServerUnaryReactor* CancelEvent(
      grpc::CallbackServerContext* context,
      const turnstile::v1::LifecycleRequest* request,
      turnstile::v1::EventResponse* response) override final;

  virtual grpc::ServerUnaryReactor* PurchaseTicket(
      grpc::CallbackServerContext* context,
      const turnstile::v1::PurchaseTicketRequest* request,
      turnstile::v1::TicketResponse* response) override final;

  virtual grpc::ServerUnaryReactor* SendTip(
      grpc::CallbackServerContext* context,
      const turnstile::v1::SendTipRequest* request,
      turnstile::v1::TipResponse* response) override final;

  virtual grpc::ServerUnaryReactor* JoinEvent(
      grpc::CallbackServerContext* context,
      const turnstile::v1::AttendanceRequest* request,
      turnstile::v1::AttendanceResponse* response) override final;

  virtual grpc::ServerUnaryReactor* LeaveEvent(
      grpc::CallbackServerContext* context,
      const turnstile::v1::AttendanceRequest* request,
      turnstile::v1::AttendanceResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetEvent(
      grpc::CallbackServerContext* context,
      const turnstile::v1::GetEventRequest* request,
      turnstile::v1::EventResponse* response) override final;

  virtual grpc::ServerUnaryReactor* ListEvents(
      grpc::CallbackServerContext* context,
      const turnstile::v1::ListEventsRequest* request,
      turnstile::v1::ListEventsResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetTicket(
      grpc::CallbackServerContext* context,
      const turnstile::v1::GetTicketRequest* request,
      turnstile::v1::TicketResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetEventStats(
      grpc::CallbackServerContext* context,
      const turnstile::v1::GetEventRequest* request,
      turnstile::v1::EventStatsResponse* response) override final;

  virtual grpc::ServerUnaryReactor* ListEventTips(
      grpc::CallbackServerContext* context,
      const turnstile::v1::ListEventTipsRequest* request,
      turnstile::v1::ListEventTipsResponse* response) override final;

  virtual grpc::ServerUnaryReactor* ListActiveAttendees(
      grpc::CallbackServerContext* context,
      const turnstile::v1::GetEventRequest* request,
      turnstile::v1::ListAttendeesResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetTransactionEntries(
      grpc::CallbackServerContext* context,
      const turnstile::v1::GetTransactionEntriesRequest* request,
      turnstile::v1::LedgerEntriesResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetWalletHistory(
      grpc::CallbackServerContext* context,
      const turnstile::v1::GetWalletHistoryRequest* request,
      turnstile::v1::LedgerEntriesResponse* response) override final;

  /// Full journal scan; meant for operators, not hot paths.
  virtual grpc::ServerUnaryReactor* Reconcile(
      grpc::CallbackServerContext* context,
      const turnstile::v1::ReconcileRequest* request,
      turnstile::v1::ReconcileResponse* response) override final;

 private:
  turnstile::ledger::wallet_store& wallets_;
  turnstile::ledger::journal& journal_;
  turnstile::ledger::transfer_engine& transfers_;
  turnstile::events::event_controller& events_;
};

}  // namespace turnstile::rpc
