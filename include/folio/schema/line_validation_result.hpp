#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace folio::schema {

template <uint16_t Version>
struct line_validation_result;

template <>
struct line_validation_result<1> final {
  uint16_t version{1};
  bool valid{true};
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

using line_validation_result_t = line_validation_result<1>;

}  // namespace folio::schema
