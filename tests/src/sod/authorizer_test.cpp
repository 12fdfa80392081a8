#include <gtest/gtest.h>
#include <folio/sod/authorizer.hpp>
#include <folio/sod/governance_pack.hpp>
#include <folio/testing/common.hpp>

#include <string>
#include <vector>

namespace {

folio::sod::authorizer make_authorizer(
    const folio::sod::governance_preset_t preset) {
  return folio::sod::authorizer{folio::sod::make_pack(preset)};
}

}  // namespace

TEST(sod_authorizer, empty_role_is_denied) {
  auto authorizer = make_authorizer(folio::sod::governance_preset_t::business);
  auto decision = authorizer.check(folio::testing::make_context(""),
                                   folio::schema::sod_action_t::journal_post);
  EXPECT_FALSE(decision.allowed);
  EXPECT_EQ(decision.reason, "User role is required");
}

TEST(sod_authorizer, unknown_role_is_denied) {
  auto authorizer = make_authorizer(folio::sod::governance_preset_t::business);
  auto decision = authorizer.check(folio::testing::make_context("intern"),
                                   folio::schema::sod_action_t::journal_post);
  EXPECT_FALSE(decision.allowed);
  EXPECT_EQ(decision.reason,
            "Role 'intern' is not defined in the business governance pack");
}

TEST(sod_authorizer, deny_list_wins_over_allow_list) {
  auto authorizer = make_authorizer(folio::sod::governance_preset_t::business);
  auto decision = authorizer.check(folio::testing::make_context("clerk"),
                                   folio::schema::sod_action_t::journal_post);
  EXPECT_FALSE(decision.allowed);
  EXPECT_EQ(decision.reason, "Role 'clerk' is denied 'journal:post'");
}

TEST(sod_authorizer, unlisted_action_is_denied) {
  auto authorizer = make_authorizer(folio::sod::governance_preset_t::business);
  auto decision = authorizer.check(folio::testing::make_context("accountant"),
                                   folio::schema::sod_action_t::period_open);
  EXPECT_FALSE(decision.allowed);
  EXPECT_EQ(decision.reason,
            "Role 'accountant' is not permitted to perform 'period:open'");
}

TEST(sod_authorizer, threshold_is_strictly_greater) {
  auto authorizer = make_authorizer(folio::sod::governance_preset_t::business);
  auto context = folio::testing::make_context("accountant");
  auto at_threshold = authorizer.check(
      context, folio::schema::sod_action_t::journal_post, 30'000.0);
  EXPECT_TRUE(at_threshold.allowed);
  EXPECT_FALSE(at_threshold.requires_approval);
  EXPECT_TRUE(at_threshold.approver_roles.empty());

  auto above = authorizer.check(
      context, folio::schema::sod_action_t::journal_post, 30'000.01);
  EXPECT_TRUE(above.allowed);
  EXPECT_TRUE(above.requires_approval);
  EXPECT_EQ(above.approver_roles,
            (std::vector<std::string>{"manager", "admin"}));
}

TEST(sod_authorizer, role_threshold_overrides_pack_threshold) {
  auto authorizer = make_authorizer(folio::sod::governance_preset_t::business);
  auto decision =
      authorizer.check(folio::testing::make_context("manager"),
                       folio::schema::sod_action_t::journal_post, 40'000.0);
  EXPECT_TRUE(decision.allowed);
  EXPECT_FALSE(decision.requires_approval);
}

TEST(sod_authorizer, gated_action_always_requires_approval) {
  auto authorizer =
      make_authorizer(folio::sod::governance_preset_t::enterprise);
  auto decision = authorizer.check(folio::testing::make_context("cfo"),
                                   folio::schema::sod_action_t::period_close);
  EXPECT_TRUE(decision.allowed);
  EXPECT_TRUE(decision.requires_approval);
  EXPECT_EQ(decision.approver_roles,
            (std::vector<std::string>{"cfo", "controller"}));
}

TEST(sod_authorizer, wildcard_allows_every_action) {
  auto authorizer = make_authorizer(folio::sod::governance_preset_t::starter);
  for (const auto& [name, action] : folio::schema::kSodActionMappings) {
    auto decision =
        authorizer.check(folio::testing::make_context("owner"), action);
    EXPECT_TRUE(decision.allowed) << name;
  }
}

TEST(sod_authorizer, viewer_cannot_post_in_any_pack) {
  for (const auto& [name, preset] : folio::sod::kGovernancePresetMappings) {
    auto authorizer = make_authorizer(preset);
    auto decision = authorizer.check(folio::testing::make_context("viewer"),
                                     folio::schema::sod_action_t::invoice_post);
    EXPECT_FALSE(decision.allowed) << name;
  }
}
