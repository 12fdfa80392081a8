#pragma once

#include <folio/schema/posting_context.hpp>
#include <folio/schema/primitives.hpp>
#include <folio/schema/sod_action.hpp>
#include <folio/schema/sod_decision.hpp>
#include <folio/sod/governance_pack.hpp>
#include <string>
#include <vector>

namespace folio::sod {

/// Segregation of duties decisions, shared by journal posting and the period
/// lifecycle so both see the same three-state contract.
class authorizer final {
 public:
  explicit authorizer(governance_pack pack);

  /// Decide whether `context.user_role` may perform `action` for `amount`
  /// (base currency, zero for non-monetary actions).
  ///
  /// Denial order: missing role, unknown role, explicit deny, not allowed.
  /// An allowed decision requires approval when the action is approval-gated
  /// or the amount is strictly above the role's effective threshold.
  folio::schema::sod_decision_t check(
      const folio::schema::posting_context_t& context,
      folio::schema::sod_action_t action,
      folio::schema::amount_t amount = 0.0) const;

  const governance_pack& pack() const;
  const std::vector<std::string>& approver_roles() const;

 private:
  governance_pack pack_;
};

}  // namespace folio::sod
