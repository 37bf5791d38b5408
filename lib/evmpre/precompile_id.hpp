// evmpre: Ethereum precompiled contracts execution layer
// Copyright 2025 The evmpre Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <evmc/evmc.hpp>
#include <cstdint>
#include <optional>

namespace evmpre
{
/// The precompile identifiers.
enum class PrecompileId : uint8_t
{
    ecrecover,
    sha256,
    ripemd160,
    identity,
    expmod,
    ecadd,
    ecmul,
    ecpairing,
    blake2bf,
    point_evaluation,
    bls12_g1add,
    bls12_g1msm,
    bls12_g2add,
    bls12_g2msm,
    bls12_pairing_check,
    bls12_map_fp_to_g1,
    bls12_map_fp2_to_g2,
    p256verify,

    latest = p256verify  ///< The last known precompile.
};

/// The total number of known precompile ids.
inline constexpr std::size_t NumPrecompiles = static_cast<std::size_t>(PrecompileId::latest) + 1;

/// The address at which the precompile is deployed.
///
/// The precompiles 0x01..0x11 are numbered in the order of the enumeration.
/// P256VERIFY lives at 0x0100 (RIP-7212, EIP-7951).
constexpr evmc::address address_of(PrecompileId id) noexcept
{
    evmc::address addr;
    if (id == PrecompileId::p256verify)
        addr.bytes[18] = 0x01;
    else
        addr.bytes[19] = static_cast<uint8_t>(static_cast<uint8_t>(id) + 1);
    return addr;
}

/// Returns the precompile id for the canonical address or std::nullopt.
///
/// This does not tell if the precompile is active in any revision,
/// use the ActivationTable for this.
std::optional<PrecompileId> find_precompile_id(const evmc::address& addr) noexcept;

/// Returns the human-readable name of the precompile, e.g. "ECREC" or "BLS12_G1ADD".
const char* get_name(PrecompileId id) noexcept;
}  // namespace evmpre
