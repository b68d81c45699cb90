#include <gtest/gtest.h>
#include <refuge/ledger/status_machine.hpp>

#include <array>

using refuge::schema::aid_status_t;

TEST(status_machine, allows_only_forward_transitions) {
  EXPECT_TRUE(refuge::ledger::can_transition(aid_status_t::pending,
                                             aid_status_t::approved));
  EXPECT_TRUE(refuge::ledger::can_transition(aid_status_t::pending,
                                             aid_status_t::rejected));
  EXPECT_TRUE(refuge::ledger::can_transition(aid_status_t::approved,
                                             aid_status_t::distributed));

  EXPECT_FALSE(refuge::ledger::can_transition(aid_status_t::pending,
                                              aid_status_t::distributed));
  EXPECT_FALSE(refuge::ledger::can_transition(aid_status_t::approved,
                                              aid_status_t::rejected));
  EXPECT_FALSE(refuge::ledger::can_transition(aid_status_t::approved,
                                              aid_status_t::pending));
  EXPECT_FALSE(refuge::ledger::can_transition(aid_status_t::pending,
                                              aid_status_t::pending));
}

TEST(status_machine, terminal_states_have_no_exits) {
  constexpr auto all = std::array{aid_status_t::pending, aid_status_t::approved,
                                  aid_status_t::distributed,
                                  aid_status_t::rejected};
  for (auto from : {aid_status_t::distributed, aid_status_t::rejected}) {
    EXPECT_TRUE(refuge::ledger::is_terminal(from));
    for (auto to : all) {
      EXPECT_FALSE(refuge::ledger::can_transition(from, to));
    }
  }
  EXPECT_FALSE(refuge::ledger::is_terminal(aid_status_t::pending));
  EXPECT_FALSE(refuge::ledger::is_terminal(aid_status_t::approved));
}

TEST(status_machine, operations_map_to_targets_and_events) {
  using refuge::schema::ledger_event_type_t;
  using refuge::schema::operation_type_t;
  EXPECT_EQ(refuge::ledger::target_status(operation_type_t::approve_record),
            aid_status_t::approved);
  EXPECT_EQ(refuge::ledger::target_status(operation_type_t::distribute_record),
            aid_status_t::distributed);
  EXPECT_EQ(refuge::ledger::target_status(operation_type_t::reject_record),
            aid_status_t::rejected);
  EXPECT_FALSE(refuge::ledger::target_status(operation_type_t::create_record)
                   .has_value());
  EXPECT_EQ(refuge::ledger::status_event(aid_status_t::rejected),
            ledger_event_type_t::record_rejected);
  EXPECT_FALSE(refuge::ledger::status_event(aid_status_t::pending).has_value());
}
