// evmpre: Ethereum precompiled contracts execution layer
// Copyright 2025 The evmpre Authors.
// SPDX-License-Identifier: Apache-2.0

#include "silkpre.hpp"
#include "secp256k1.hpp"
#include <silkpre/precompile.h>
#include <algorithm>
#include <cstdlib>
#include <cstring>

namespace evmpre::crypto
{
namespace silkpre
{
namespace
{
// Indexes of kSilkpreContracts, i.e. the precompile addresses minus one.
constexpr size_t ECREC_INDEX = 0;
constexpr size_t BN_ADD_INDEX = 5;
constexpr size_t BN_MUL_INDEX = 6;
constexpr size_t SNARKV_INDEX = 7;
constexpr size_t BLAKE2_F_INDEX = 8;
}  // namespace

long run(size_t index, const uint8_t* input, size_t input_size, uint8_t* output,
    size_t output_size) noexcept
{
    const auto [result, result_size] = kSilkpreContracts[index].run(input, input_size);
    if (result == nullptr)
        return -1;

    const auto trimmed_size = std::min(result_size, output_size);
    std::memcpy(output, result, trimmed_size);
    std::free(result);  // Free output allocation (required by silkpre API).
    return static_cast<long>(trimmed_size);
}

bool bn254_add(uint8_t output[64], const uint8_t input[128]) noexcept
{
    return run(BN_ADD_INDEX, input, 128, output, 64) == 64;
}

bool bn254_mul(uint8_t output[64], const uint8_t input[96]) noexcept
{
    return run(BN_MUL_INDEX, input, 96, output, 64) == 64;
}

bool bn254_pairing_check(uint8_t output[32], const uint8_t* input, size_t input_size) noexcept
{
    return run(SNARKV_INDEX, input, input_size, output, 32) == 32;
}

bool blake2bf(uint8_t output[64], const uint8_t input[213]) noexcept
{
    return run(BLAKE2_F_INDEX, input, 213, output, 64) == 64;
}
}  // namespace silkpre

std::optional<evmc::address> ecrecover_silkpre(
    std::span<const uint8_t, 32> hash, std::span<const uint8_t, 64> sig, bool parity) noexcept
{
    // Re-encode the precompile input: hash ‖ v ‖ r ‖ s.
    uint8_t input[128]{};
    std::copy(hash.begin(), hash.end(), &input[0]);
    input[63] = parity ? 28 : 27;
    std::copy(sig.begin(), sig.end(), &input[64]);

    uint8_t output[32];
    if (silkpre::run(silkpre::ECREC_INDEX, input, sizeof(input), output, sizeof(output)) != 32)
        return std::nullopt;

    evmc::address addr;
    std::memcpy(addr.bytes, &output[12], sizeof(addr));
    return addr;
}
}  // namespace evmpre::crypto
