#pragma once

#include <verdict/schema/primitives.hpp>
#include <functional>

namespace verdict::execution {

using signature_verifier_t =
    std::function<bool(const verdict::schema::bytes_view_t& message,
                       const verdict::schema::pubkey_t& signer,
                       const verdict::schema::signature_t& signature)>;

}  // namespace verdict::execution
