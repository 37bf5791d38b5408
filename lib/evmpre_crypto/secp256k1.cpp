// evmpre: Ethereum precompiled contracts execution layer
// Copyright 2025 The evmpre Authors.
// SPDX-License-Identifier: Apache-2.0

#include "secp256k1.hpp"
#include <ethash/keccak.hpp>
#include <secp256k1_recovery.h>
#include <algorithm>
#include <cstring>

namespace evmpre::crypto
{
evmc::address to_address(std::span<const uint8_t, 64> pubkey) noexcept
{
    const auto hash = ethash::keccak256(pubkey.data(), pubkey.size());
    evmc::address addr;
    std::memcpy(addr.bytes, &hash.bytes[sizeof(hash) - sizeof(addr)], sizeof(addr));
    return addr;
}

bool ecrecover_libsecp256k1(std::span<uint8_t, 64> pubkey, std::span<const uint8_t, 32> hash,
    std::span<const uint8_t, 64> sig_bytes, bool parity) noexcept
{
    secp256k1_ecdsa_recoverable_signature sig;
    if (secp256k1_ecdsa_recoverable_signature_parse_compact(
            secp256k1_context_static, &sig, sig_bytes.data(), parity ? 1 : 0) != 1)
        return false;

    secp256k1_pubkey pk;
    if (secp256k1_ecdsa_recover(secp256k1_context_static, &pk, &sig, hash.data()) != 1)
        return false;

    uint8_t pubkey_prefixed[65];
    auto output_length = sizeof(pubkey_prefixed);
    if (secp256k1_ec_pubkey_serialize(secp256k1_context_static, pubkey_prefixed, &output_length,
            &pk, SECP256K1_EC_UNCOMPRESSED) != 1 ||
        output_length != sizeof(pubkey_prefixed))
        return false;

    std::copy_n(&pubkey_prefixed[1], pubkey.size(), pubkey.data());
    return true;
}

std::optional<evmc::address> ecrecover_libsecp256k1(
    std::span<const uint8_t, 32> hash, std::span<const uint8_t, 64> sig, bool parity) noexcept
{
    uint8_t pubkey[64];
    if (!ecrecover_libsecp256k1(pubkey, hash, sig, parity))
        return std::nullopt;
    return to_address(pubkey);
}
}  // namespace evmpre::crypto
