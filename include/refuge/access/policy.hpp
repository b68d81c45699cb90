#pragma once
#include <refuge/schema/operation_type.hpp>
#include <refuge/schema/primitives.hpp>
#include <functional>
#include <vector>

namespace refuge::access {

/// Decide whether `caller` may run `operation`. Consulted before any state is
/// read on every mutating call; decryption callbacks are never gated here.
using authorizer_t =
    std::function<bool(const refuge::schema::caller_id_t& caller,
                       refuge::schema::operation_type_t operation)>;

/// Anyone may submit an aid record; every other operation is reserved for
/// the listed agency identities.
authorizer_t make_allowlist_authorizer(
    std::vector<refuge::schema::caller_id_t> agencies);

/// Permit every caller and operation.
authorizer_t allow_all();

/// True when `operation` is restricted to agencies under the allowlist policy.
bool is_agency_operation(refuge::schema::operation_type_t operation);

}  // namespace refuge::access
