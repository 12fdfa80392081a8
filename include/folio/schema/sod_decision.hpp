#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: SoD decision.
// allowed=false is always fatal. requires_approval with allowed=true means
// proceed and flag for approval, never a block.
namespace folio::schema {

template <uint16_t Version>
struct sod_decision;

template <>
struct sod_decision<1> final {
  uint16_t version{1};
  bool allowed{};
  bool requires_approval{};
  std::optional<std::string> reason;
  std::vector<std::string> approver_roles;
};

using sod_decision_t = sod_decision<1>;

}  // namespace folio::schema
