#include <gtest/gtest.h>
#include <refuge/ledger/event_log.hpp>
#include <refuge/schema/key/ledger_keys.hpp>
#include <refuge/storage/memory/storage.hpp>

namespace {

using refuge::schema::ledger_event_type_t;

class event_log_test : public ::testing::Test {
 protected:
  event_log_test()
      : storage_{refuge::storage::make_storage<
            refuge::storage::memory_storage_tag>("")},
        log_{storage_} {}

  refuge::schema::ledger_event_t append(ledger_event_type_t type,
                                        uint64_t entity) {
    auto batch = refuge::storage::write_batch{};
    auto event = log_.stage(batch, type, entity, std::nullopt, ++now_);
    storage_.commit(batch);
    return event;
  }

  refuge::storage::storage<refuge::storage::memory_storage_tag> storage_;
  refuge::ledger::event_log<refuge::storage::memory_storage_tag> log_;
  uint64_t now_{};
};

}  // namespace

TEST_F(event_log_test, events_chain_to_their_predecessor) {
  auto first = append(ledger_event_type_t::record_registered, 1);
  auto second = append(ledger_event_type_t::package_created, 1);
  auto third = append(ledger_event_type_t::record_approved, 1);

  EXPECT_EQ(first.event_id, 1u);
  EXPECT_EQ(first.previous_hash, refuge::schema::make_zero_hash());
  EXPECT_EQ(second.previous_hash, first.hash);
  EXPECT_EQ(third.previous_hash, second.hash);
  EXPECT_EQ(third.hash, refuge::ledger::chain_hash(third));
  EXPECT_EQ(log_.head(), third.hash);
  EXPECT_EQ(log_.count(), 3u);
  EXPECT_FALSE(log_.verify_chain().has_value());
}

TEST_F(event_log_test, several_events_in_one_batch_still_chain) {
  auto batch = refuge::storage::write_batch{};
  auto first = log_.stage(batch, ledger_event_type_t::verification_requested,
                          4, 1000, 1);
  auto second = log_.stage(batch, ledger_event_type_t::reveal_requested, 4,
                           1001, 1);
  storage_.commit(batch);

  EXPECT_EQ(second.event_id, first.event_id + 1);
  EXPECT_EQ(second.previous_hash, first.hash);
  EXPECT_FALSE(log_.verify_chain().has_value());
}

TEST_F(event_log_test, list_returns_inclusive_range) {
  for (auto i = uint64_t{1}; i <= 5; ++i) {
    append(ledger_event_type_t::record_registered, i);
  }
  auto middle = log_.list(2, 4);
  ASSERT_EQ(middle.size(), 3u);
  EXPECT_EQ(middle.front().event_id, 2u);
  EXPECT_EQ(middle.back().event_id, 4u);
  EXPECT_TRUE(log_.list(4, 2).empty());
  EXPECT_EQ(log_.list(5, 100).size(), 1u);
}

TEST_F(event_log_test, tampering_is_detected) {
  append(ledger_event_type_t::record_registered, 1);
  auto second = append(ledger_event_type_t::record_registered, 2);
  append(ledger_event_type_t::record_registered, 3);

  auto encoder = refuge::schema::encoding::encoder<
      refuge::schema::encoding::scale_encoder_tag>{};
  second.entity_id = 99;
  auto batch = refuge::storage::write_batch{};
  batch.put(refuge::schema::key::make_event_key(2), encoder.encode(second));
  storage_.commit(batch);

  EXPECT_EQ(log_.verify_chain(), std::optional<uint64_t>{2});
}
