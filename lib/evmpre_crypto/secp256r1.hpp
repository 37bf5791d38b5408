// evmpre: Ethereum precompiled contracts execution layer
// Copyright 2025 The evmpre Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <evmpre/errors.hpp>
#include <intx/intx.hpp>

namespace evmpre::crypto::secp256r1
{
using namespace intx::literals;

/// The field prime number (P).
inline constexpr auto FIELD_PRIME =
    0xffffffff00000001000000000000000000000000ffffffffffffffffffffffff_u256;

/// The secp256r1 curve group order (N).
inline constexpr auto ORDER =
    0xffffffff00000000ffffffffffffffffbce6faada7179e84f3b9cac2fc632551_u256;

/// Verifies the ECDSA signature (r, s) of the message hash h with the public key (qx, qy).
///
/// @return SUCCESS if the signature is valid, INVALID_SIGNATURE if r or s is out of [1, N) or
///         the signature does not match, INVALID_FIELD_ELEMENT if a key coordinate is ≥ P and
///         POINT_NOT_ON_CURVE if the key is not a curve point.
ErrorCode verify(const uint8_t h[32], const intx::uint256& r, const intx::uint256& s,
    const intx::uint256& qx, const intx::uint256& qy) noexcept;
}  // namespace evmpre::crypto::secp256r1
