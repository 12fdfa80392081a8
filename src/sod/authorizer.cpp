#include <folio/sod/authorizer.hpp>

#include <algorithm>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace folio::sod {

namespace {

bool matches(const std::vector<std::string>& actions,
             const std::string_view action) {
  return std::ranges::any_of(actions, [&](const std::string& candidate) {
    return candidate == kWildcardAction || candidate == action;
  });
}

folio::schema::sod_decision_t deny(std::string reason) {
  return folio::schema::sod_decision_t{.allowed = false,
                                       .requires_approval = false,
                                       .reason = std::move(reason)};
}

}  // namespace

authorizer::authorizer(governance_pack pack) : pack_{std::move(pack)} {}

folio::schema::sod_decision_t authorizer::check(
    const folio::schema::posting_context_t& context,
    const folio::schema::sod_action_t action,
    const folio::schema::amount_t amount) const {
  auto action_name = folio::schema::to_string(action);
  if (context.user_role.empty()) {
    return deny("User role is required");
  }

  const auto* policy = pack_.find_role(context.user_role);
  if (policy == nullptr) {
    return deny(fmt::format("Role '{}' is not defined in the {} governance pack",
                            context.user_role, pack_.name));
  }
  if (matches(policy->deny, action_name)) {
    return deny(fmt::format("Role '{}' is denied '{}'", context.user_role,
                            action_name));
  }
  if (!matches(policy->allow, action_name)) {
    return deny(fmt::format("Role '{}' is not permitted to perform '{}'",
                            context.user_role, action_name));
  }

  auto threshold =
      policy->approval_threshold.value_or(pack_.approval_threshold);
  auto gated = std::ranges::find(pack_.approval_actions, action) !=
               std::end(pack_.approval_actions);
  auto decision = folio::schema::sod_decision_t{};
  decision.allowed = true;
  decision.requires_approval = gated || amount > threshold;
  if (decision.requires_approval) {
    decision.approver_roles = pack_.approver_roles;
    decision.reason =
        gated ? fmt::format("'{}' always requires approval", action_name)
              : fmt::format("Amount {:.2f} exceeds approval threshold {:.2f}",
                            amount, threshold);
  }
  spdlog::debug("SoD {} for role '{}' user '{}': allowed, approval={}",
                action_name, context.user_role, context.user_id,
                decision.requires_approval);
  return decision;
}

const governance_pack& authorizer::pack() const {
  return pack_;
}

const std::vector<std::string>& authorizer::approver_roles() const {
  return pack_.approver_roles;
}

}  // namespace folio::sod
