#pragma once
#include <verdict/schema/primitives.hpp>

namespace verdict::crypto {

/// True when `bytes` decompresses to a point on the ed25519 curve, i.e. when
/// it could be the public half of some signing key. Only the curve equation
/// is checked: small-order and mixed-order points count as on the curve.
bool is_on_curve(const verdict::schema::pubkey_t& bytes);

}  // namespace verdict::crypto
