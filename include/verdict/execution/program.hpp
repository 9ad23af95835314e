#pragma once

#include <verdict/schema/primitives.hpp>

namespace verdict::execution {

class invoke_context;

/// Logic module hosted by the engine under a fixed identity. Failures are
/// reported by throwing schema::program_error; the engine then discards every
/// change the enclosing transaction staged.
class program {
 public:
  virtual ~program() = default;

  virtual void process(invoke_context& context,
                       const verdict::schema::bytes_view_t& data) = 0;
};

}  // namespace verdict::execution
