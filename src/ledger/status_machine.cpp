#include <refuge/ledger/status_machine.hpp>

using namespace refuge::schema;

namespace refuge::ledger {

bool can_transition(aid_status_t from, aid_status_t to) {
  switch (from) {
    case aid_status_t::pending:
      return to == aid_status_t::approved || to == aid_status_t::rejected;
    case aid_status_t::approved:
      return to == aid_status_t::distributed;
    case aid_status_t::distributed:
    case aid_status_t::rejected:
      return false;
  }
  return false;
}

bool is_terminal(aid_status_t status) {
  return status == aid_status_t::distributed ||
         status == aid_status_t::rejected;
}

std::optional<aid_status_t> target_status(operation_type_t operation) {
  switch (operation) {
    case operation_type_t::approve_record:
      return aid_status_t::approved;
    case operation_type_t::distribute_record:
      return aid_status_t::distributed;
    case operation_type_t::reject_record:
      return aid_status_t::rejected;
    default:
      return std::nullopt;
  }
}

std::optional<ledger_event_type_t> status_event(aid_status_t status) {
  switch (status) {
    case aid_status_t::approved:
      return ledger_event_type_t::record_approved;
    case aid_status_t::distributed:
      return ledger_event_type_t::record_distributed;
    case aid_status_t::rejected:
      return ledger_event_type_t::record_rejected;
    case aid_status_t::pending:
      return std::nullopt;
  }
  return std::nullopt;
}

}  // namespace refuge::ledger
