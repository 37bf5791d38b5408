// evmpre: Ethereum precompiled contracts execution layer
// Copyright 2025 The evmpre Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <evmpre/errors.hpp>
#include <intx/intx.hpp>

namespace evmpre::crypto::bls
{
using namespace intx::literals;

/// The BLS12-381 field prime number.
inline constexpr auto BLS_FIELD_MODULUS =
    0x1a0111ea397fe69a4b1ba7b6434bacd764774b84f38512bf6730d2a0f6b0f6241eabfffeb153ffffb9feffffffffaaab_u384;

/// The failure kinds reported by the functions below are:
/// INVALID_FIELD_ELEMENT for a coordinate not in the canonical 64-byte encoding,
/// POINT_NOT_ON_CURVE and POINT_NOT_IN_SUBGROUP for invalid points.

/// Addition in BLS12-381 curve group.
///
/// Computes P ⊕ Q for two points in affine coordinates on the BLS12-381 curve.
/// No subgroup check, https://eips.ethereum.org/EIPS/eip-2537#abi-for-g1-addition
[[nodiscard]] ErrorCode g1_add(uint8_t _rx[64], uint8_t _ry[64], const uint8_t _x0[64],
    const uint8_t _y0[64], const uint8_t _x1[64], const uint8_t _y1[64]) noexcept;

/// Scalar multiplication in BLS12-381 curve G1 subgroup.
///
/// Computes [c]P for a point in affine coordinate on the BLS12-381 curve, performs subgroup check.
[[nodiscard]] ErrorCode g1_mul(uint8_t _rx[64], uint8_t _ry[64], const uint8_t _x[64],
    const uint8_t _y[64], const uint8_t _c[32]) noexcept;

/// Addition in BLS12-381 curve group over G2 extension field.
[[nodiscard]] ErrorCode g2_add(uint8_t _rx[128], uint8_t _ry[128], const uint8_t _x0[128],
    const uint8_t _y0[128], const uint8_t _x1[128], const uint8_t _y1[128]) noexcept;

/// Scalar multiplication in BLS12-381 curve G2 subgroup.
[[nodiscard]] ErrorCode g2_mul(uint8_t _rx[128], uint8_t _ry[128], const uint8_t _x[128],
    const uint8_t _y[128], const uint8_t _c[32]) noexcept;

/// Multi scalar multiplication in BLS12-381 curve G1 subgroup.
///
/// Computes ∑ⁿₖ₌₁cₖPₖ for points in affine coordinate on the BLS12-381 curve, performs
/// subgroup check according to https://eips.ethereum.org/EIPS/eip-2537#abi-for-g1-msm.
/// The size must be a multiple of 160.
[[nodiscard]] ErrorCode g1_msm(
    uint8_t _rx[64], uint8_t _ry[64], const uint8_t* _xycs, size_t size) noexcept;

/// Multi scalar multiplication in BLS12-381 curve G2 subgroup. The size must be a multiple of 288.
[[nodiscard]] ErrorCode g2_msm(
    uint8_t _rx[128], uint8_t _ry[128], const uint8_t* _xycs, size_t size) noexcept;

/// Maps field element of Fp to curve point on BLS12-381 curve G1 subgroup.
[[nodiscard]] ErrorCode map_fp_to_g1(
    uint8_t _rx[64], uint8_t _ry[64], const uint8_t _fp[64]) noexcept;

/// Maps field element of Fp2 to curve point on BLS12-381 curve G2 subgroup.
[[nodiscard]] ErrorCode map_fp2_to_g2(
    uint8_t _rx[128], uint8_t _ry[128], const uint8_t _fp[128]) noexcept;

/// Computes pairing for pairs of P and Q point from G1 and G2 accordingly.
///
/// Performs field and groups check for both input points.
/// The size must be a multiple of 384. Writes the 32-byte EVM boolean.
[[nodiscard]] ErrorCode pairing_check(uint8_t _r[32], const uint8_t* _pairs, size_t size) noexcept;
}  // namespace evmpre::crypto::bls
