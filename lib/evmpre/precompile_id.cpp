// evmpre: Ethereum precompiled contracts execution layer
// Copyright 2025 The evmpre Authors.
// SPDX-License-Identifier: Apache-2.0

#include "precompile_id.hpp"
#include <array>

namespace evmpre
{
namespace
{
constexpr std::array<const char*, NumPrecompiles> names{
    "ECREC",
    "SHA256",
    "RIPEMD160",
    "ID",
    "MODEXP",
    "BN254_ADD",
    "BN254_MUL",
    "BN254_PAIRING",
    "BLAKE2F",
    "KZG_POINT_EVALUATION",
    "BLS12_G1ADD",
    "BLS12_G1MSM",
    "BLS12_G2ADD",
    "BLS12_G2MSM",
    "BLS12_PAIRING_CHECK",
    "BLS12_MAP_FP_TO_G1",
    "BLS12_MAP_FP2_TO_G2",
    "P256VERIFY",
};
}  // namespace

std::optional<PrecompileId> find_precompile_id(const evmc::address& addr) noexcept
{
    // All precompile addresses have 18 leading zero bytes.
    for (size_t i = 0; i < sizeof(addr.bytes) - 2; ++i)
    {
        if (addr.bytes[i] != 0)
            return {};
    }

    if (addr == address_of(PrecompileId::p256verify))
        return PrecompileId::p256verify;

    if (addr.bytes[18] != 0)
        return {};

    const auto n = addr.bytes[19];
    if (n == 0 || n > static_cast<uint8_t>(PrecompileId::bls12_map_fp2_to_g2) + 1)
        return {};
    return static_cast<PrecompileId>(n - 1);
}

const char* get_name(PrecompileId id) noexcept
{
    const auto index = static_cast<size_t>(id);
    return index < names.size() ? names[index] : "UNKNOWN";
}
}  // namespace evmpre
