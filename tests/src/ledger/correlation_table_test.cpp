#include <gtest/gtest.h>
#include <refuge/ledger/correlation_table.hpp>
#include <refuge/storage/memory/storage.hpp>

namespace {

using refuge::schema::ledger_error_code;
using refuge::schema::target_kind_t;

refuge::schema::pending_decryption_t make_entry(
    refuge::schema::request_id_t request_id,
    target_kind_t kind,
    uint64_t target_id) {
  auto entry = refuge::schema::pending_decryption_t{};
  entry.request_id = request_id;
  entry.target_kind = kind;
  entry.target_id = target_id;
  entry.submitted_at = 1;
  return entry;
}

class correlation_table_test : public ::testing::Test {
 protected:
  correlation_table_test()
      : storage_{refuge::storage::make_storage<
            refuge::storage::memory_storage_tag>("")},
        table_{storage_} {}

  void register_committed(const refuge::schema::pending_decryption_t& entry) {
    auto batch = refuge::storage::write_batch{};
    ASSERT_EQ(table_.stage_register(batch, entry), ledger_error_code::ok);
    storage_.commit(batch);
  }

  refuge::storage::storage<refuge::storage::memory_storage_tag> storage_;
  refuge::ledger::correlation_table<refuge::storage::memory_storage_tag> table_;
};

}  // namespace

TEST_F(correlation_table_test, resolve_consumes_entry_exactly_once) {
  register_committed(make_entry(7, target_kind_t::eligibility_computation, 3));

  auto batch = refuge::storage::write_batch{};
  auto entry =
      table_.stage_resolve(batch, target_kind_t::eligibility_computation, 7);
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->target_id, 3u);
  storage_.commit(batch);

  auto replay = refuge::storage::write_batch{};
  EXPECT_FALSE(
      table_.stage_resolve(replay, target_kind_t::eligibility_computation, 7)
          .has_value());
  EXPECT_TRUE(table_.outstanding().empty());
}

TEST_F(correlation_table_test, discarded_resolve_keeps_entry_outstanding) {
  register_committed(make_entry(8, target_kind_t::result_reveal, 1));
  {
    auto batch = refuge::storage::write_batch{};
    ASSERT_TRUE(
        table_.stage_resolve(batch, target_kind_t::result_reveal, 8).has_value());
  }
  EXPECT_TRUE(table_.find(target_kind_t::result_reveal, 8).has_value());
}

TEST_F(correlation_table_test, duplicate_ids_are_refused_per_kind) {
  register_committed(make_entry(9, target_kind_t::eligibility_computation, 1));

  auto batch = refuge::storage::write_batch{};
  EXPECT_EQ(table_.stage_register(
                batch, make_entry(9, target_kind_t::eligibility_computation, 2)),
            ledger_error_code::duplicate_request_id);
  EXPECT_EQ(table_.stage_register(
                batch, make_entry(9, target_kind_t::result_reveal, 2)),
            ledger_error_code::ok);

  auto staged_twice = refuge::storage::write_batch{};
  ASSERT_EQ(table_.stage_register(
                staged_twice, make_entry(10, target_kind_t::result_reveal, 1)),
            ledger_error_code::ok);
  EXPECT_EQ(table_.stage_register(
                staged_twice, make_entry(10, target_kind_t::result_reveal, 1)),
            ledger_error_code::duplicate_request_id);
}

TEST_F(correlation_table_test, ids_never_resolve_across_kinds) {
  register_committed(make_entry(11, target_kind_t::result_reveal, 4));

  auto batch = refuge::storage::write_batch{};
  EXPECT_FALSE(
      table_.stage_resolve(batch, target_kind_t::eligibility_computation, 11)
          .has_value());
  EXPECT_TRUE(batch.empty());
}

TEST_F(correlation_table_test, outstanding_lists_both_kinds) {
  register_committed(make_entry(21, target_kind_t::result_reveal, 1));
  auto with_package =
      make_entry(20, target_kind_t::eligibility_computation, 2);
  with_package.package_id = 5;
  register_committed(with_package);

  auto open = table_.outstanding();
  ASSERT_EQ(open.size(), 2u);
  EXPECT_EQ(open[0].request_id, 20u);
  EXPECT_EQ(open[0].package_id, std::optional<uint64_t>{5});
  EXPECT_EQ(open[1].request_id, 21u);
  EXPECT_EQ(open[1].target_kind, target_kind_t::result_reveal);
}
