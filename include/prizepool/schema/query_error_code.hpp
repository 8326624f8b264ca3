#pragma once

#include <cstdint>

// Schema type: query error code.
// Pool workflow: stable numeric codes for read-path diagnostics.
namespace prizepool::schema {

enum class query_error_code : uint32_t {
  invalid_key = 1,
  not_found = 2,
  unsupported_path = 3,
  not_yet_settled = 4,
};

}  // namespace prizepool::schema
