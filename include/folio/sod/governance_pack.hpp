#pragma once

#include <folio/schema/enum_string.hpp>
#include <folio/schema/primitives.hpp>
#include <folio/schema/sod_action.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace folio::sod {

/// Matches every action in an allow or deny list.
inline constexpr auto kWildcardAction = std::string_view{"*"};

struct role_policy final {
  std::string role;
  std::vector<std::string> allow;
  std::vector<std::string> deny;
  /// Replaces the pack-wide approval threshold for this role.
  std::optional<folio::schema::amount_t> approval_threshold;
};

/// Role/action configuration consumed by the authorizer.
struct governance_pack final {
  std::string name;
  folio::schema::amount_t approval_threshold{};
  std::vector<role_policy> roles;
  /// Actions that always need a second approver, whatever the amount.
  std::vector<folio::schema::sod_action_t> approval_actions;
  std::vector<std::string> approver_roles;

  const role_policy* find_role(std::string_view role) const;
};

enum class governance_preset_t : uint8_t {
  starter = 0,
  business = 1,
  enterprise = 2
};

inline constexpr auto kGovernancePresetMappings = std::array{
    std::pair<std::string_view, governance_preset_t>{
        "starter", governance_preset_t::starter},
    std::pair<std::string_view, governance_preset_t>{
        "business", governance_preset_t::business},
    std::pair<std::string_view, governance_preset_t>{
        "enterprise", governance_preset_t::enterprise}};

/// Small teams: owner and admin do everything, accountants post and close.
governance_pack make_starter_pack();
/// Growing companies: reopening a period always needs manager/admin
/// approval.
governance_pack make_business_pack();
/// Strict separation: preparers cannot close, approvers cannot prepare.
governance_pack make_enterprise_pack();

governance_pack make_pack(governance_preset_t preset);

}  // namespace folio::sod
