#include <folio/sod/governance_pack.hpp>

#include <algorithm>
#include <iterator>

namespace folio::sod {

namespace {

const auto kAllPostings = std::vector<std::string>{
    "journal:post", "invoice:post", "bill:post", "payment:post"};

std::vector<std::string> with(std::vector<std::string> base,
                              std::initializer_list<std::string_view> more) {
  for (auto action : more) {
    base.emplace_back(action);
  }
  return base;
}

}  // namespace

const role_policy* governance_pack::find_role(const std::string_view role) const {
  auto it = std::ranges::find_if(
      roles, [&](const role_policy& policy) { return policy.role == role; });
  if (it == std::end(roles)) {
    return nullptr;
  }
  return &*it;
}

governance_pack make_starter_pack() {
  return governance_pack{
      .name = "starter",
      .approval_threshold = 50'000.0,
      .roles = {role_policy{.role = "owner", .allow = {"*"}},
                role_policy{.role = "admin", .allow = {"*"}},
                role_policy{.role = "accountant",
                            .allow = with(kAllPostings,
                                          {"period:close", "period:lock"})},
                role_policy{.role = "viewer", .deny = kAllPostings}},
      .approval_actions = {},
      .approver_roles = {"owner", "admin"}};
}

governance_pack make_business_pack() {
  return governance_pack{
      .name = "business",
      .approval_threshold = 30'000.0,
      .roles =
          {role_policy{.role = "owner", .allow = {"*"}},
           role_policy{.role = "admin", .allow = {"*"}},
           role_policy{.role = "manager",
                       .allow = with(kAllPostings,
                                     {"period:close", "period:open",
                                      "period:lock"}),
                       .approval_threshold = 50'000.0},
           role_policy{.role = "accountant",
                       .allow = with(kAllPostings, {"period:close"})},
           role_policy{.role = "clerk",
                       .allow = {"invoice:post", "bill:post"},
                       .deny = {"journal:post", "period:close"}},
           role_policy{.role = "viewer", .deny = kAllPostings}},
      .approval_actions = {folio::schema::sod_action_t::period_open},
      .approver_roles = {"manager", "admin"}};
}

governance_pack make_enterprise_pack() {
  return governance_pack{
      .name = "enterprise",
      .approval_threshold = 10'000.0,
      .roles =
          {role_policy{.role = "owner", .allow = {"*"}},
           role_policy{.role = "admin",
                       .allow = {"*"},
                       .approval_threshold = 25'000.0},
           role_policy{.role = "cfo",
                       .allow = {"journal:post", "period:close", "period:open",
                                 "period:lock"},
                       .deny = {"invoice:post", "bill:post", "payment:post"},
                       .approval_threshold = 100'000.0},
           role_policy{.role = "controller",
                       .allow = {"journal:post", "period:lock"},
                       .deny = {"invoice:post", "bill:post", "payment:post"},
                       .approval_threshold = 50'000.0},
           role_policy{.role = "manager",
                       .allow = kAllPostings,
                       .deny = {"period:close"},
                       .approval_threshold = 15'000.0},
           role_policy{.role = "accountant",
                       .allow = kAllPostings,
                       .deny = {"period:close", "period:open"}},
           role_policy{.role = "clerk",
                       .allow = {"invoice:post", "bill:post"},
                       .deny = {"journal:post", "payment:post"}},
           role_policy{.role = "auditor",
                       .deny = with(kAllPostings,
                                    {"period:close", "period:open"}),
                       .approval_threshold = 0.0},
           role_policy{.role = "viewer", .deny = kAllPostings}},
      .approval_actions = {folio::schema::sod_action_t::period_open,
                           folio::schema::sod_action_t::period_close},
      .approver_roles = {"cfo", "controller"}};
}

governance_pack make_pack(const governance_preset_t preset) {
  switch (preset) {
    case governance_preset_t::starter:
      return make_starter_pack();
    case governance_preset_t::business:
      return make_business_pack();
    case governance_preset_t::enterprise:
      return make_enterprise_pack();
  }
  return make_business_pack();
}

}  // namespace folio::sod
