#pragma once

#include <hap/schema/primitives.hpp>

namespace hap::crypto {

bool available();

bool verify_ed25519(const hap::schema::bytes_view_t& message,
                    const hap::schema::ed25519_public_key_t& public_key,
                    const hap::schema::ed25519_signature_t& signature);

}  // namespace hap::crypto
