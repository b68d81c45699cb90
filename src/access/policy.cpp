#include <refuge/access/policy.hpp>

#include <algorithm>
#include <utility>

namespace refuge::access {

bool is_agency_operation(refuge::schema::operation_type_t operation) {
  return operation != refuge::schema::operation_type_t::create_record;
}

authorizer_t make_allowlist_authorizer(
    std::vector<refuge::schema::caller_id_t> agencies) {
  return [agencies = std::move(agencies)](
             const refuge::schema::caller_id_t& caller,
             refuge::schema::operation_type_t operation) {
    if (!is_agency_operation(operation)) {
      return true;
    }
    return std::ranges::find(agencies, caller) != std::end(agencies);
  };
}

authorizer_t allow_all() {
  return [](const refuge::schema::caller_id_t&,
            refuge::schema::operation_type_t) { return true; };
}

}  // namespace refuge::access
