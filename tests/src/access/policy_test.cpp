#include <gtest/gtest.h>
#include <refuge/access/policy.hpp>
#include <refuge/testing/common.hpp>

using refuge::schema::operation_type_t;

TEST(access_policy, allowlist_reserves_agency_operations) {
  auto agency = refuge::testing::make_named_caller(1);
  auto stranger = refuge::testing::make_named_caller(2);
  auto authorize = refuge::access::make_allowlist_authorizer({agency});

  EXPECT_TRUE(authorize(stranger, operation_type_t::create_record));
  for (auto operation :
       {operation_type_t::create_package, operation_type_t::verify_eligibility,
        operation_type_t::approve_record, operation_type_t::distribute_record,
        operation_type_t::reject_record,
        operation_type_t::request_verification_result}) {
    EXPECT_TRUE(authorize(agency, operation));
    EXPECT_FALSE(authorize(stranger, operation));
  }
}

TEST(access_policy, allowlist_matches_key_based_identities) {
  auto agency =
      refuge::schema::caller_id_t{refuge::testing::make_ed25519_signer(5)};
  auto authorize = refuge::access::make_allowlist_authorizer({agency});
  EXPECT_TRUE(authorize(agency, operation_type_t::approve_record));
  EXPECT_FALSE(authorize(
      refuge::schema::caller_id_t{refuge::testing::make_ed25519_signer(6)},
      operation_type_t::approve_record));
}

TEST(access_policy, allow_all_permits_everything) {
  auto authorize = refuge::access::allow_all();
  EXPECT_TRUE(authorize(refuge::testing::make_named_caller(9),
                        operation_type_t::distribute_record));
}
