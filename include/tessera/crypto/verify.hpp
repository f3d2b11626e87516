#pragma once

#include <tessera/schema/primitives.hpp>

namespace tessera::crypto {

bool available();

bool verify_signature(const tessera::schema::bytes_view_t& message,
                      const tessera::schema::signer_id_t& signer,
                      const tessera::schema::signature_t& signature);

/// Ledger address of a signer. Named signers are already addresses; key
/// signers map to blake3(scheme tag || public key).
tessera::schema::address_t derive_address(
    const tessera::schema::signer_id_t& signer);

}  // namespace tessera::crypto
