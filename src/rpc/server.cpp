#include <spdlog/spdlog.h>
#include <turnstile/rpc/server.hpp>
#include <turnstile/schema/ledger_metadata.hpp>

#include <optional>
#include <string>
#include <variant>

using namespace turnstile::rpc;
using namespace turnstile::schema;

namespace {

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status::OK);
  return reactor;
}

grpc::ServerUnaryReactor* finish_invalid(grpc::CallbackServerContext* context,
                                         const std::string& message) {
  spdlog::debug("Rejecting malformed request: {}", message);
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status{grpc::StatusCode::INVALID_ARGUMENT, message});
  return reactor;
}

// Accepts 32 raw bytes or 64 hex characters (optionally 0x-prefixed).
std::optional<hash32_t> parse_id(const std::string& value) {
  if (value.size() == 32) {
    return try_make_hash32(make_bytes_view(value));
  }
  return try_make_hash32(std::string_view{value});
}

template <typename T, typename Response>
bool populate_envelope(const operation_result<T>& result, Response* response) {
  response->set_code(result.code);
  response->set_log(result.log);
  response->set_codespace(result.codespace);
  return result.ok();
}

template <typename Response>
void populate_not_found(Response* response,
                        const ledger_error_code code,
                        const std::string& log,
                        const std::string_view codespace) {
  response->set_code(static_cast<uint32_t>(code));
  response->set_log(log);
  response->set_codespace(std::string{codespace});
}

void populate_wallet(const wallet_state_t& source,
                     turnstile::v1::Wallet* destination) {
  destination->set_wallet_id(make_string(source.wallet_id));
  destination->set_user_id(make_string(source.user_id));
  destination->set_available_balance(source.available_balance);
  destination->set_total_balance(source.total_balance);
  destination->set_currency(source.currency);
  destination->set_created_at(source.created_at);
  destination->set_updated_at(source.updated_at);
}

void populate_entry(const ledger_entry_t& source,
                    turnstile::v1::LedgerEntry* destination) {
  destination->set_transaction_id(make_string(source.transaction_id));
  destination->set_wallet_id(make_string(source.wallet_id));
  destination->set_user_id(make_string(source.user_id));
  destination->set_entry_type(std::string{to_string(source.entry_type)});
  destination->set_transaction_type(
      std::string{to_string(source.transaction_type)});
  destination->set_amount(source.amount);
  destination->set_balance_after(source.balance_after);
  destination->set_currency(source.currency);
  destination->set_reference_type(std::string{to_string(source.reference_type)});
  destination->set_reference_id(make_string(source.reference_id));
  destination->set_description(source.description);
  destination->set_created_at(source.created_at);
  std::visit(
      overloaded{
          [&](const ticket_sale_metadata_t& metadata) {
            auto* out = destination->mutable_ticket_sale();
            out->set_event_id(make_string(metadata.event_id));
            out->set_ticket_id(make_string(metadata.ticket_id));
            out->set_fan_id(make_string(metadata.fan_id));
            out->set_creator_id(make_string(metadata.creator_id));
          },
          [&](const tip_metadata_t& metadata) {
            auto* out = destination->mutable_tip();
            out->set_event_id(make_string(metadata.event_id));
            out->set_from_user_id(make_string(metadata.from_user_id));
            out->set_to_user_id(make_string(metadata.to_user_id));
            if (metadata.message.has_value()) {
              out->set_message(metadata.message.value());
            }
            out->set_is_anonymous(metadata.is_anonymous);
          },
          [&](const refund_metadata_t& metadata) {
            auto* out = destination->mutable_refund();
            out->set_event_id(make_string(metadata.event_id));
            out->set_ticket_id(make_string(metadata.ticket_id));
            out->set_fan_id(make_string(metadata.fan_id));
            out->set_original_transaction_id(
                make_string(metadata.original_transaction_id));
          },
          [&](const deposit_metadata_t& metadata) {
            auto* out = destination->mutable_deposit();
            out->set_processor(metadata.processor);
            out->set_external_reference(metadata.external_reference);
          }},
      source.metadata);
}

void populate_receipt(const transfer_receipt_t& source,
                      turnstile::v1::TransferResponse* destination) {
  destination->set_transaction_id(make_string(source.transaction_id));
  populate_wallet(source.from_wallet, destination->mutable_from_wallet());
  populate_wallet(source.to_wallet, destination->mutable_to_wallet());
  populate_entry(source.debit, destination->mutable_debit());
  populate_entry(source.credit, destination->mutable_credit());
}

void populate_event(const event_state_t& source,
                    turnstile::v1::Event* destination) {
  destination->set_event_id(make_string(source.event_id));
  destination->set_creator_id(make_string(source.creator_id));
  destination->set_title(source.title);
  destination->set_status(std::string{to_string(source.status)});
  destination->set_access_type(std::string{to_string(source.access_type)});
  destination->set_ticket_price_cents(source.ticket_price_cents);
  if (source.max_attendees.has_value()) {
    destination->set_max_attendees(source.max_attendees.value());
  }
  destination->set_scheduled_start_at(source.scheduled_start_at);
  if (source.actual_start_at.has_value()) {
    destination->set_actual_start_at(source.actual_start_at.value());
  }
  if (source.actual_end_at.has_value()) {
    destination->set_actual_end_at(source.actual_end_at.value());
  }
  destination->set_total_revenue_cents(source.total_revenue_cents);
  destination->set_total_tips_cents(source.total_tips_cents);
  destination->set_total_attendees(source.total_attendees);
  destination->set_peak_concurrent_viewers(source.peak_concurrent_viewers);
}

void populate_ticket(const event_ticket_t& source,
                     turnstile::v1::Ticket* destination) {
  destination->set_ticket_id(make_string(source.ticket_id));
  destination->set_event_id(make_string(source.event_id));
  destination->set_fan_id(make_string(source.fan_id));
  destination->set_price_paid_cents(source.price_paid_cents);
  destination->set_transaction_id(make_string(source.transaction_id));
  destination->set_purchased_at(source.purchased_at);
  if (source.refunded_at.has_value()) {
    destination->set_refunded_at(source.refunded_at.value());
  }
  if (source.refund_transaction_id.has_value()) {
    destination->set_refund_transaction_id(
        make_string(source.refund_transaction_id.value()));
  }
}

void populate_tip(const event_tip_t& source, turnstile::v1::Tip* destination) {
  destination->set_tip_id(make_string(source.tip_id));
  destination->set_event_id(make_string(source.event_id));
  destination->set_from_user_id(make_string(source.from_user_id));
  destination->set_to_user_id(make_string(source.to_user_id));
  destination->set_amount_cents(source.amount_cents);
  if (source.message.has_value()) {
    destination->set_message(source.message.value());
  }
  destination->set_is_anonymous(source.is_anonymous);
  destination->set_transaction_id(make_string(source.transaction_id));
  destination->set_tipped_at(source.tipped_at);
}

void populate_attendance(const event_attendance_t& source,
                         turnstile::v1::Attendance* destination) {
  destination->set_event_id(make_string(source.event_id));
  destination->set_user_id(make_string(source.user_id));
  destination->set_joined_at(source.joined_at);
  if (source.left_at.has_value()) {
    destination->set_left_at(source.left_at.value());
  }
  destination->set_is_active(source.is_active);
  destination->set_duration_seconds(source.duration_seconds);
}

}  // namespace

listener::listener(turnstile::ledger::wallet_store& wallets,
                   turnstile::ledger::journal& journal,
                   turnstile::ledger::transfer_engine& transfers,
                   turnstile::events::event_controller& events)
    : wallets_{wallets},
      journal_{journal},
      transfers_{transfers},
      events_{events} {}

grpc::ServerUnaryReactor* listener::Deposit(
    grpc::CallbackServerContext* context,
    const turnstile::v1::DepositRequest* request,
    turnstile::v1::TransferResponse* response) {
  auto user_id = parse_id(request->user_id());
  if (!user_id) {
    return finish_invalid(context, "user_id must be 32 bytes or 64 hex chars");
  }
  auto currency = request->currency().empty() ? transfers_.currency()
                                              : request->currency();
  auto result =
      transfers_.deposit(*user_id, request->amount(), currency,
                         request->processor(), request->external_reference());
  if (populate_envelope(result, response)) {
    populate_receipt(result.value.value(), response);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::OpenWallet(
    grpc::CallbackServerContext* context,
    const turnstile::v1::OpenWalletRequest* request,
    turnstile::v1::WalletResponse* response) {
  auto user_id = parse_id(request->user_id());
  if (!user_id) {
    return finish_invalid(context, "user_id must be 32 bytes or 64 hex chars");
  }
  auto result = transfers_.open_wallet(*user_id);
  if (populate_envelope(result, response)) {
    populate_wallet(result.value.value(), response->mutable_wallet());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetWallet(
    grpc::CallbackServerContext* context,
    const turnstile::v1::GetWalletRequest* request,
    turnstile::v1::WalletResponse* response) {
  auto user_id = parse_id(request->user_id());
  if (!user_id) {
    return finish_invalid(context, "user_id must be 32 bytes or 64 hex chars");
  }
  auto wallet = wallets_.get_wallet(*user_id);
  if (!wallet) {
    populate_not_found(response, ledger_error_code::wallet_not_found,
                       "wallet not found", kWalletCodespace);
    return finish_ok(context);
  }
  populate_wallet(*wallet, response->mutable_wallet());
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::CreateEvent(
    grpc::CallbackServerContext* context,
    const turnstile::v1::CreateEventRequest* request,
    turnstile::v1::EventResponse* response) {
  auto creator_id = parse_id(request->creator_id());
  if (!creator_id) {
    return finish_invalid(context,
                          "creator_id must be 32 bytes or 64 hex chars");
  }
  auto draft = event_draft_t{};
  draft.title = request->title();
  if (!request->access_type().empty()) {
    auto access_type = try_from_string<access_type_t>(request->access_type());
    if (!access_type) {
      return finish_invalid(context, "unknown access_type");
    }
    draft.access_type = *access_type;
  }
  draft.ticket_price_cents = request->ticket_price_cents();
  if (request->has_max_attendees()) {
    draft.max_attendees = request->max_attendees();
  }
  draft.scheduled_start_at = request->scheduled_start_at();

  auto result = events_.create_event(*creator_id, draft);
  if (populate_envelope(result, response)) {
    populate_event(result.value.value(), response->mutable_event());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::StartEvent(
    grpc::CallbackServerContext* context,
    const turnstile::v1::LifecycleRequest* request,
    turnstile::v1::EventResponse* response) {
  auto event_id = parse_id(request->event_id());
  auto creator_id = parse_id(request->creator_id());
  if (!event_id || !creator_id) {
    return finish_invalid(context, "event_id and creator_id are required");
  }
  auto result = events_.start_event(*event_id, *creator_id);
  if (populate_envelope(result, response)) {
    populate_event(result.value.value(), response->mutable_event());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::EndEvent(
    grpc::CallbackServerContext* context,
    const turnstile::v1::LifecycleRequest* request,
    turnstile::v1::EventResponse* response) {
  auto event_id = parse_id(request->event_id());
  auto creator_id = parse_id(request->creator_id());
  if (!event_id || !creator_id) {
    return finish_invalid(context, "event_id and creator_id are required");
  }
  auto result = events_.end_event(*event_id, *creator_id);
  if (populate_envelope(result, response)) {
    populate_event(result.value.value(), response->mutable_event());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::CancelEvent(
    grpc::CallbackServerContext* context,
    const turnstile::v1::LifecycleRequest* request,
    turnstile::v1::EventResponse* response) {
  auto event_id = parse_id(request->event_id());
  auto creator_id = parse_id(request->creator_id());
  if (!event_id || !creator_id) {
    return finish_invalid(context, "event_id and creator_id are required");
  }
  auto result = events_.cancel_event(*event_id, *creator_id);
  if (populate_envelope(result, response)) {
    populate_event(result.value.value(), response->mutable_event());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::PurchaseTicket(
    grpc::CallbackServerContext* context,
    const turnstile::v1::PurchaseTicketRequest* request,
    turnstile::v1::TicketResponse* response) {
  auto event_id = parse_id(request->event_id());
  auto fan_id = parse_id(request->fan_id());
  if (!event_id || !fan_id) {
    return finish_invalid(context, "event_id and fan_id are required");
  }
  auto result =
      events_.purchase_ticket(*event_id, *fan_id, request->price_cents());
  if (populate_envelope(result, response)) {
    populate_ticket(result.value.value(), response->mutable_ticket());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::SendTip(
    grpc::CallbackServerContext* context,
    const turnstile::v1::SendTipRequest* request,
    turnstile::v1::TipResponse* response) {
  auto event_id = parse_id(request->event_id());
  auto from_user_id = parse_id(request->from_user_id());
  auto to_user_id = parse_id(request->to_user_id());
  if (!event_id || !from_user_id || !to_user_id) {
    return finish_invalid(context,
                          "event_id, from_user_id and to_user_id are required");
  }
  auto message = std::optional<std::string>{};
  if (request->has_message()) {
    message = request->message();
  }
  auto result =
      events_.send_tip(*event_id, *from_user_id, *to_user_id,
                       request->amount_cents(), message, request->is_anonymous());
  if (populate_envelope(result, response)) {
    populate_tip(result.value.value(), response->mutable_tip());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::JoinEvent(
    grpc::CallbackServerContext* context,
    const turnstile::v1::AttendanceRequest* request,
    turnstile::v1::AttendanceResponse* response) {
  auto event_id = parse_id(request->event_id());
  auto user_id = parse_id(request->user_id());
  if (!event_id || !user_id) {
    return finish_invalid(context, "event_id and user_id are required");
  }
  auto result = events_.join_event(*event_id, *user_id);
  if (populate_envelope(result, response)) {
    populate_attendance(result.value.value(), response->mutable_attendance());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::LeaveEvent(
    grpc::CallbackServerContext* context,
    const turnstile::v1::AttendanceRequest* request,
    turnstile::v1::AttendanceResponse* response) {
  auto event_id = parse_id(request->event_id());
  auto user_id = parse_id(request->user_id());
  if (!event_id || !user_id) {
    return finish_invalid(context, "event_id and user_id are required");
  }
  auto result = events_.leave_event(*event_id, *user_id);
  if (populate_envelope(result, response)) {
    populate_attendance(result.value.value(), response->mutable_attendance());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetEvent(
    grpc::CallbackServerContext* context,
    const turnstile::v1::GetEventRequest* request,
    turnstile::v1::EventResponse* response) {
  auto event_id = parse_id(request->event_id());
  if (!event_id) {
    return finish_invalid(context, "event_id must be 32 bytes or 64 hex chars");
  }
  auto event = events_.get_event(*event_id);
  if (!event) {
    populate_not_found(response, ledger_error_code::event_not_found,
                       "event not found", kEventCodespace);
    return finish_ok(context);
  }
  populate_event(*event, response->mutable_event());
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::ListEvents(
    grpc::CallbackServerContext* context,
    const turnstile::v1::ListEventsRequest* request,
    turnstile::v1::ListEventsResponse* response) {
  auto query = turnstile::events::event_query{};
  if (!request->status().empty()) {
    query.status = try_from_string<event_status_t>(request->status());
    if (!query.status) {
      return finish_invalid(context, "unknown event status");
    }
  }
  if (!request->creator_id().empty()) {
    query.creator_id = parse_id(request->creator_id());
    if (!query.creator_id) {
      return finish_invalid(context, "creator_id must be 32 bytes or 64 hex chars");
    }
  }
  query.limit = request->limit();
  for (const auto& event : events_.list_events(query)) {
    populate_event(event, response->add_events());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetTicket(
    grpc::CallbackServerContext* context,
    const turnstile::v1::GetTicketRequest* request,
    turnstile::v1::TicketResponse* response) {
  auto event_id = parse_id(request->event_id());
  auto fan_id = parse_id(request->fan_id());
  if (!event_id || !fan_id) {
    return finish_invalid(context, "event_id and fan_id are required");
  }
  auto ticket = events_.get_ticket(*event_id, *fan_id);
  if (!ticket) {
    populate_not_found(response, ledger_error_code::event_not_found,
                       "no ticket for this fan and event", kEventCodespace);
    return finish_ok(context);
  }
  populate_ticket(*ticket, response->mutable_ticket());
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetEventStats(
    grpc::CallbackServerContext* context,
    const turnstile::v1::GetEventRequest* request,
    turnstile::v1::EventStatsResponse* response) {
  auto event_id = parse_id(request->event_id());
  if (!event_id) {
    return finish_invalid(context, "event_id must be 32 bytes or 64 hex chars");
  }
  auto stats = events_.event_stats(*event_id);
  if (!stats) {
    populate_not_found(response, ledger_error_code::event_not_found,
                       "event not found", kEventCodespace);
    return finish_ok(context);
  }
  populate_event(stats->event, response->mutable_event());
  response->set_tickets_sold(stats->tickets_sold);
  response->set_active_tickets(stats->active_tickets);
  response->set_tip_count(stats->tip_count);
  response->set_tip_total_cents(stats->tip_total_cents);
  response->set_active_attendees(stats->active_attendees);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::ListEventTips(
    grpc::CallbackServerContext* context,
    const turnstile::v1::ListEventTipsRequest* request,
    turnstile::v1::ListEventTipsResponse* response) {
  auto event_id = parse_id(request->event_id());
  if (!event_id) {
    return finish_invalid(context, "event_id must be 32 bytes or 64 hex chars");
  }
  for (const auto& tip : events_.event_tips(*event_id, request->limit())) {
    populate_tip(tip, response->add_tips());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::ListActiveAttendees(
    grpc::CallbackServerContext* context,
    const turnstile::v1::GetEventRequest* request,
    turnstile::v1::ListAttendeesResponse* response) {
  auto event_id = parse_id(request->event_id());
  if (!event_id) {
    return finish_invalid(context, "event_id must be 32 bytes or 64 hex chars");
  }
  for (const auto& attendance : events_.active_attendees(*event_id)) {
    populate_attendance(attendance, response->add_attendees());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetTransactionEntries(
    grpc::CallbackServerContext* context,
    const turnstile::v1::GetTransactionEntriesRequest* request,
    turnstile::v1::LedgerEntriesResponse* response) {
  auto transaction_id = parse_id(request->transaction_id());
  if (!transaction_id) {
    return finish_invalid(context,
                          "transaction_id must be 32 bytes or 64 hex chars");
  }
  for (const auto& entry : journal_.entries_for_transaction(*transaction_id)) {
    populate_entry(entry, response->add_entries());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetWalletHistory(
    grpc::CallbackServerContext* context,
    const turnstile::v1::GetWalletHistoryRequest* request,
    turnstile::v1::LedgerEntriesResponse* response) {
  auto user_id = parse_id(request->user_id());
  if (!user_id) {
    return finish_invalid(context, "user_id must be 32 bytes or 64 hex chars");
  }
  for (const auto& entry :
       journal_.entries_for_wallet(*user_id, request->limit())) {
    populate_entry(entry, response->add_entries());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Reconcile(
    grpc::CallbackServerContext* context,
    const turnstile::v1::ReconcileRequest* /*request*/,
    turnstile::v1::ReconcileResponse* response) {
  auto report = journal_.reconcile();
  response->set_transaction_count(report.transaction_count);
  response->set_entry_count(report.entry_count);
  response->set_wallets_checked(report.wallets_checked);
  response->set_total_debits(report.total_debits);
  response->set_total_credits(report.total_credits);
  for (const auto& transaction_id : report.unbalanced_transactions) {
    response->add_unbalanced_transactions(make_string(transaction_id));
  }
  for (const auto& wallet_id : report.mismatched_wallets) {
    response->add_mismatched_wallets(make_string(wallet_id));
  }
  response->set_clean(report.clean());
  return finish_ok(context);
}
