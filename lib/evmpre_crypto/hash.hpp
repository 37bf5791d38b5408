// evmpre: Ethereum precompiled contracts execution layer
// Copyright 2025 The evmpre Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <cstdint>

namespace evmpre::crypto
{
/// The size (32 bytes) of the SHA256 message digest.
inline constexpr std::size_t SHA256_HASH_SIZE = 256 / 8;

/// The size (20 bytes) of the RIPEMD-160 message digest.
inline constexpr std::size_t RIPEMD160_HASH_SIZE = 160 / 8;

/// Computes the SHA256 hash function.
///
/// @param[out] hash  The result message digest is written to the provided memory.
/// @param      data  The input data.
/// @param      size  The size of the input data.
/// @return     False only if the OpenSSL digest fails to initialize.
[[nodiscard]] bool sha256(
    uint8_t hash[SHA256_HASH_SIZE], const uint8_t* data, std::size_t size) noexcept;

/// Computes the RIPEMD-160 hash function.
///
/// @param[out] hash  The result message digest is written to the provided memory.
/// @param      data  The input data.
/// @param      size  The size of the input data.
/// @return     False only if the OpenSSL digest is not available.
[[nodiscard]] bool ripemd160(
    uint8_t hash[RIPEMD160_HASH_SIZE], const uint8_t* data, std::size_t size) noexcept;
}  // namespace evmpre::crypto
