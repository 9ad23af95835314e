#pragma once

#include <verdict/schema/primitives.hpp>

namespace verdict::crypto {

bool available();

/// Verify an ed25519 signature over `message` by `signer`.
bool verify_signature(const verdict::schema::bytes_view_t& message,
                      const verdict::schema::pubkey_t& signer,
                      const verdict::schema::signature_t& signature);

}  // namespace verdict::crypto
