// evmpre: Ethereum precompiled contracts execution layer
// Copyright 2025 The evmpre Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <intx/intx.hpp>

namespace evmpre::crypto::bn254
{
using namespace intx::literals;

/// The BN254 base field prime.
inline constexpr auto FIELD_PRIME =
    0x30644e72e131a029b85045b68181585d97816a916871ca8d3c208c16d87cfd47_u256;

/// Checks if the affine point (x, y) with coordinates in [0, FIELD_PRIME) satisfies
/// the curve equation y² = x³ + 3. The point at infinity (0, 0) is accepted.
bool is_on_curve(const intx::uint256& x, const intx::uint256& y) noexcept;
}  // namespace evmpre::crypto::bn254
