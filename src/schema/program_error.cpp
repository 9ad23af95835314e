#include <verdict/schema/program_error.hpp>

#include <fmt/format.h>

namespace verdict::schema {

program_error::program_error(const error_code code)
    : std::runtime_error{std::string{error_name(code)}}, code_{code} {}

program_error::program_error(const error_code code,
                             const std::string_view detail)
    : std::runtime_error{fmt::format("{}: {}", error_name(code), detail)},
      code_{code} {}

}  // namespace verdict::schema
