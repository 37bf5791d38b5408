// evmpre: Ethereum precompiled contracts execution layer
// Copyright 2025 The evmpre Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <span>

namespace evmpre::crypto
{
/// The signature of a modular exponentiation backend.
///
/// Computes base^exp mod mod and writes the result left-padded to mod.size() bytes to the output.
/// Requires mod not to be zero (having at least one non-zero byte).
///
/// @return False if the backend cannot handle operands of this size.
using ExpmodFn = bool(std::span<const uint8_t> base, std::span<const uint8_t> exp,
    std::span<const uint8_t> mod, uint8_t* output) noexcept;

/// Executes the modular exponentiation using the GMP library.
bool expmod_gmp(std::span<const uint8_t> base, std::span<const uint8_t> exp,
    std::span<const uint8_t> mod, uint8_t* output) noexcept;

/// Executes the modular exponentiation using the OpenSSL BIGNUM library.
bool expmod_openssl(std::span<const uint8_t> base, std::span<const uint8_t> exp,
    std::span<const uint8_t> mod, uint8_t* output) noexcept;
}  // namespace evmpre::crypto
