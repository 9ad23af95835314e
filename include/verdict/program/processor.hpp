#pragma once

#include <verdict/execution/invoke_context.hpp>
#include <verdict/execution/program.hpp>
#include <verdict/program/config.hpp>
#include <verdict/schema/primitives.hpp>

namespace verdict::program {

/// Verdict registration program.
///
/// One request runs validate -> derive -> provision -> encode; any failing
/// step throws and the engine discards the whole request. A second request
/// for the same subject fails with slot_already_exists.
class processor final : public verdict::execution::program {
 public:
  explicit processor(program_config_t config);

  void process(verdict::execution::invoke_context& context,
               const verdict::schema::bytes_view_t& data) override;

  const program_config_t& config() const { return config_; }

 private:
  program_config_t config_;
};

}  // namespace verdict::program
