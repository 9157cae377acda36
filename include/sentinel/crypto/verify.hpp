#pragma once

#include <sentinel/schema/primitives.hpp>

namespace sentinel::crypto {

/// True when the linked OpenSSL provides both ed25519 and secp256k1.
bool available();

bool verify_signature(const sentinel::schema::bytes_view_t& message,
                      const sentinel::schema::signer_id_t& signer,
                      const sentinel::schema::signature_t& signature);

/// ECDSA over SHA-256 of message. signature is bare r || s (64 bytes) or
/// carries a recovery id at either end (65 bytes); the recovery id itself is
/// not used since the key is known.
bool verify_secp256k1(const sentinel::schema::bytes_view_t& message,
                      const sentinel::schema::secp256k1_signer_id& signer,
                      const sentinel::schema::bytes_view_t& signature);

/// Ledger identity of a signer. Named signers and ed25519 keys are used
/// as-is; secp256k1 keys are hashed down to 32 bytes with blake3.
sentinel::schema::address_t derive_address(
    const sentinel::schema::signer_id_t& signer);

}  // namespace sentinel::crypto
