#pragma once
#include <cstdint>
#include <string>

// Schema type: posting context.
// Caller identity carried through every validation call. Never persisted.
namespace folio::schema {

template <uint16_t Version>
struct posting_context;

template <>
struct posting_context<1> final {
  uint16_t version{1};
  std::string tenant_id;
  std::string company_id;
  std::string user_id;
  std::string user_role;
};

using posting_context_t = posting_context<1>;

}  // namespace folio::schema
