#pragma once

#include <verdict/schema/error_code.hpp>

#include <stdexcept>
#include <string>
#include <string_view>

namespace verdict::schema {

/// Raised anywhere inside request processing. Only the execution engine
/// catches it: the whole transaction is discarded and the code is reported.
class program_error final : public std::runtime_error {
 public:
  explicit program_error(error_code code);
  program_error(error_code code, std::string_view detail);

  error_code code() const noexcept { return code_; }

 private:
  error_code code_;
};

}  // namespace verdict::schema
