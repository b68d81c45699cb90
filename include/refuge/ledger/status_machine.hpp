#pragma once
#include <refuge/schema/aid_status.hpp>
#include <refuge/schema/ledger_event_type.hpp>
#include <refuge/schema/operation_type.hpp>
#include <optional>

// Aid record lifecycle:
//
//   pending -> approved -> distributed
//   pending -> rejected
//
// distributed and rejected are terminal.
namespace refuge::ledger {

bool can_transition(refuge::schema::aid_status_t from,
                    refuge::schema::aid_status_t to);

bool is_terminal(refuge::schema::aid_status_t status);

/// Status an operation moves a record into, for the three status operations.
std::optional<refuge::schema::aid_status_t> target_status(
    refuge::schema::operation_type_t operation);

/// Event recorded when a record enters `status`.
std::optional<refuge::schema::ledger_event_type_t> status_event(
    refuge::schema::aid_status_t status);

}  // namespace refuge::ledger
