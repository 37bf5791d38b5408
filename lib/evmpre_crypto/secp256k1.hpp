// evmpre: Ethereum precompiled contracts execution layer
// Copyright 2025 The evmpre Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <optional>
#include <span>

namespace evmpre::crypto
{
using namespace intx::literals;

/// The secp256k1 curve group order (N).
inline constexpr auto SECP256K1_ORDER =
    0xfffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141_u256;

/// The signature of an ECDSA public key recovery backend.
///
/// @param hash    The 32-byte message hash.
/// @param sig     The compact signature r ‖ s. Both r and s are in [1, N).
/// @param parity  The y-parity of the signature point R.
/// @return        The address of the signer or std::nullopt if the key cannot be recovered.
using EcrecoverFn = std::optional<evmc::address>(
    std::span<const uint8_t, 32> hash, std::span<const uint8_t, 64> sig, bool parity) noexcept;

/// Convert the secp256k1 public key (64-byte uncompressed, without the prefix)
/// to Ethereum address: the last 20 bytes of its Keccak-256 hash.
evmc::address to_address(std::span<const uint8_t, 64> pubkey) noexcept;

/// libsecp256k1-based implementation of the ECDSA public key recovery.
bool ecrecover_libsecp256k1(std::span<uint8_t, 64> pubkey, std::span<const uint8_t, 32> hash,
    std::span<const uint8_t, 64> sig, bool parity) noexcept;

/// Recovers the signer address with libsecp256k1.
std::optional<evmc::address> ecrecover_libsecp256k1(
    std::span<const uint8_t, 32> hash, std::span<const uint8_t, 64> sig, bool parity) noexcept;

/// Recovers the signer address with silkpre.
std::optional<evmc::address> ecrecover_silkpre(
    std::span<const uint8_t, 32> hash, std::span<const uint8_t, 64> sig, bool parity) noexcept;
}  // namespace evmpre::crypto
