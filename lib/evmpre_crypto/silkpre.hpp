// evmpre: Ethereum precompiled contracts execution layer
// Copyright 2025 The evmpre Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <cstdint>

/// The primitives provided by the silkpre library.
///
/// The functions do not validate the input beyond what silkpre does itself:
/// callers check lengths and encodings first to report precise failure kinds.
namespace evmpre::crypto::silkpre
{
/// Runs the silkpre contract with the given index into kSilkpreContracts
/// and copies at most @p output_size bytes of its result to @p output.
///
/// @return The number of bytes written or -1 if the contract rejected the input.
long run(size_t index, const uint8_t* input, size_t input_size, uint8_t* output,
    size_t output_size) noexcept;

/// BN254 point addition of two encoded G1 points (128 bytes) into the 64-byte G1 result.
[[nodiscard]] bool bn254_add(uint8_t output[64], const uint8_t input[128]) noexcept;

/// BN254 scalar multiplication of the encoded G1 point by the 32-byte scalar.
[[nodiscard]] bool bn254_mul(uint8_t output[64], const uint8_t input[96]) noexcept;

/// BN254 pairing check of the 192-byte (G1, G2) pairs.
///
/// Writes the 32-byte EVM boolean. Fails if any point is invalid.
[[nodiscard]] bool bn254_pairing_check(
    uint8_t output[32], const uint8_t* input, size_t input_size) noexcept;

/// The BLAKE2b F compression function of the 213-byte EIP-152 input into the 64-byte state.
[[nodiscard]] bool blake2bf(uint8_t output[64], const uint8_t input[213]) noexcept;
}  // namespace evmpre::crypto::silkpre
