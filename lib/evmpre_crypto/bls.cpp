// evmpre: Ethereum precompiled contracts execution layer
// Copyright 2025 The evmpre Authors.
// SPDX-License-Identifier: Apache-2.0

#include "bls.hpp"
#include <blst.h>
#include <cstring>
#include <memory>
#include <vector>

namespace evmpre::crypto::bls
{
namespace
{
/// Offset of the beginning of field element. First 16 bytes must be zero,
/// https://eips.ethereum.org/EIPS/eip-2537#field-elements-encoding
constexpr auto FP_BYTES_OFFSET = 64 - 48;

constexpr size_t FP_SIZE = 64;
constexpr size_t FP2_SIZE = 2 * FP_SIZE;
constexpr size_t P1_SIZE = 2 * FP_SIZE;
constexpr size_t P2_SIZE = 2 * FP2_SIZE;
constexpr size_t SCALAR_SIZE = 32;

/// Loads the big-endian integer as the element of the BLS12-381 Fp field.
[[nodiscard]] ErrorCode load_fp(blst_fp& out, const uint8_t _p[64]) noexcept
{
    if (intx::be::unsafe::load<intx::uint512>(_p) >= BLS_FIELD_MODULUS)
        return INVALID_FIELD_ELEMENT;

    blst_fp_from_bendian(&out, &_p[FP_BYTES_OFFSET]);
    return SUCCESS;
}

/// Loads the element of the Fp2 extension field: c0 ‖ c1.
[[nodiscard]] ErrorCode load_fp2(blst_fp2& out, const uint8_t _p[128]) noexcept
{
    if (const auto ec = load_fp(out.fp[0], _p); ec != SUCCESS)
        return ec;
    return load_fp(out.fp[1], &_p[FP_SIZE]);
}

/// Loads the affine G1 point. Checks that point coordinates are from the BLS12-381 field and
/// that the point is on curve.
[[nodiscard]] ErrorCode load_p1(
    blst_p1_affine& out, const uint8_t _x[64], const uint8_t _y[64]) noexcept
{
    if (const auto ec = load_fp(out.x, _x); ec != SUCCESS)
        return ec;
    if (const auto ec = load_fp(out.y, _y); ec != SUCCESS)
        return ec;
    return blst_p1_affine_on_curve(&out) ? SUCCESS : POINT_NOT_ON_CURVE;
}

/// Loads the affine G1 point and checks it is in the G1 subgroup.
[[nodiscard]] ErrorCode load_p1_in_g1(
    blst_p1_affine& out, const uint8_t _x[64], const uint8_t _y[64]) noexcept
{
    if (const auto ec = load_p1(out, _x, _y); ec != SUCCESS)
        return ec;
    return blst_p1_affine_in_g1(&out) ? SUCCESS : POINT_NOT_IN_SUBGROUP;
}

/// Loads the affine G2 point. Checks that point coordinates are from the BLS12-381 field and
/// that the point is on curve.
[[nodiscard]] ErrorCode load_p2(
    blst_p2_affine& out, const uint8_t _x[128], const uint8_t _y[128]) noexcept
{
    if (const auto ec = load_fp2(out.x, _x); ec != SUCCESS)
        return ec;
    if (const auto ec = load_fp2(out.y, _y); ec != SUCCESS)
        return ec;
    return blst_p2_affine_on_curve(&out) ? SUCCESS : POINT_NOT_ON_CURVE;
}

[[nodiscard]] ErrorCode load_p2_in_g2(
    blst_p2_affine& out, const uint8_t _x[128], const uint8_t _y[128]) noexcept
{
    if (const auto ec = load_p2(out, _x, _y); ec != SUCCESS)
        return ec;
    return blst_p2_affine_in_g2(&out) ? SUCCESS : POINT_NOT_IN_SUBGROUP;
}

/// Stores fp in 64-bytes array with big endian encoding zero padded.
void store(uint8_t _rx[64], const blst_fp& _x) noexcept
{
    std::memset(_rx, 0, FP_BYTES_OFFSET);
    blst_bendian_from_fp(&_rx[FP_BYTES_OFFSET], &_x);
}

/// Stores fp2 in 128-bytes array with big endian encoding zero padded.
void store(uint8_t _rx[128], const blst_fp2& _x) noexcept
{
    store(_rx, _x.fp[0]);
    store(&_rx[FP_SIZE], _x.fp[1]);
}

void store(uint8_t _rx[64], uint8_t _ry[64], const blst_p1& p) noexcept
{
    blst_p1_affine result;
    blst_p1_to_affine(&result, &p);
    store(_rx, result.x);
    store(_ry, result.y);
}

void store(uint8_t _rx[128], uint8_t _ry[128], const blst_p2& p) noexcept
{
    blst_p2_affine result;
    blst_p2_to_affine(&result, &p);
    store(_rx, result.x);
    store(_ry, result.y);
}
}  // namespace

ErrorCode g1_add(uint8_t _rx[64], uint8_t _ry[64], const uint8_t _x0[64], const uint8_t _y0[64],
    const uint8_t _x1[64], const uint8_t _y1[64]) noexcept
{
    blst_p1_affine p0_affine;
    if (const auto ec = load_p1(p0_affine, _x0, _y0); ec != SUCCESS)
        return ec;
    blst_p1_affine p1_affine;
    if (const auto ec = load_p1(p1_affine, _x1, _y1); ec != SUCCESS)
        return ec;

    blst_p1 p0;
    blst_p1_from_affine(&p0, &p0_affine);

    blst_p1 out;
    blst_p1_add_or_double_affine(&out, &p0, &p1_affine);
    store(_rx, _ry, out);
    return SUCCESS;
}

ErrorCode g1_mul(uint8_t _rx[64], uint8_t _ry[64], const uint8_t _x[64], const uint8_t _y[64],
    const uint8_t _c[32]) noexcept
{
    blst_p1_affine p_affine;
    if (const auto ec = load_p1_in_g1(p_affine, _x, _y); ec != SUCCESS)
        return ec;

    blst_scalar scalar;
    blst_scalar_from_bendian(&scalar, _c);

    blst_p1 p;
    blst_p1_from_affine(&p, &p_affine);

    blst_p1 out;
    blst_p1_mult(&out, &p, scalar.b, 256);
    store(_rx, _ry, out);
    return SUCCESS;
}

ErrorCode g2_add(uint8_t _rx[128], uint8_t _ry[128], const uint8_t _x0[128],
    const uint8_t _y0[128], const uint8_t _x1[128], const uint8_t _y1[128]) noexcept
{
    blst_p2_affine p0_affine;
    if (const auto ec = load_p2(p0_affine, _x0, _y0); ec != SUCCESS)
        return ec;
    blst_p2_affine p1_affine;
    if (const auto ec = load_p2(p1_affine, _x1, _y1); ec != SUCCESS)
        return ec;

    blst_p2 p0;
    blst_p2_from_affine(&p0, &p0_affine);

    blst_p2 out;
    blst_p2_add_or_double_affine(&out, &p0, &p1_affine);
    store(_rx, _ry, out);
    return SUCCESS;
}

ErrorCode g2_mul(uint8_t _rx[128], uint8_t _ry[128], const uint8_t _x[128],
    const uint8_t _y[128], const uint8_t _c[32]) noexcept
{
    blst_p2_affine p_affine;
    if (const auto ec = load_p2_in_g2(p_affine, _x, _y); ec != SUCCESS)
        return ec;

    blst_scalar scalar;
    blst_scalar_from_bendian(&scalar, _c);

    blst_p2 p;
    blst_p2_from_affine(&p, &p_affine);

    blst_p2 out;
    blst_p2_mult(&out, &p, scalar.b, 256);
    store(_rx, _ry, out);
    return SUCCESS;
}

ErrorCode g1_msm(uint8_t _rx[64], uint8_t _ry[64], const uint8_t* _xycs, size_t size) noexcept
{
    constexpr auto SINGLE_ENTRY_SIZE = P1_SIZE + SCALAR_SIZE;
    const auto npoints = size / SINGLE_ENTRY_SIZE;

    std::vector<blst_p1_affine> p1_affines;
    std::vector<blst_scalar> scalars;
    p1_affines.reserve(npoints);
    scalars.reserve(npoints);

    const auto end = _xycs + npoints * SINGLE_ENTRY_SIZE;
    for (auto ptr = _xycs; ptr != end; ptr += SINGLE_ENTRY_SIZE)
    {
        blst_p1_affine p_affine;
        if (const auto ec = load_p1_in_g1(p_affine, ptr, &ptr[FP_SIZE]); ec != SUCCESS)
            return ec;

        // Point at infinity must be filtered out for BLST library.
        if (blst_p1_affine_is_inf(&p_affine))
            continue;

        p1_affines.emplace_back(p_affine);
        blst_scalar_from_bendian(&scalars.emplace_back(), &ptr[P1_SIZE]);
    }

    if (p1_affines.empty())
    {
        std::memset(_rx, 0, FP_SIZE);
        std::memset(_ry, 0, FP_SIZE);
        return SUCCESS;
    }

    // The pointer arrays are built after the vectors stop growing.
    std::vector<const blst_p1_affine*> p1_affine_ptrs;
    std::vector<const uint8_t*> scalars_ptrs;
    p1_affine_ptrs.reserve(p1_affines.size());
    scalars_ptrs.reserve(scalars.size());
    for (size_t i = 0; i < p1_affines.size(); ++i)
    {
        p1_affine_ptrs.emplace_back(&p1_affines[i]);
        scalars_ptrs.emplace_back(scalars[i].b);
    }

    const auto scratch_size =
        blst_p1s_mult_pippenger_scratch_sizeof(p1_affine_ptrs.size()) / sizeof(limb_t);
    const auto scratch_space = std::make_unique_for_overwrite<limb_t[]>(scratch_size);
    blst_p1 out;
    blst_p1s_mult_pippenger(&out, p1_affine_ptrs.data(), p1_affine_ptrs.size(), scalars_ptrs.data(),
        256, scratch_space.get());
    store(_rx, _ry, out);
    return SUCCESS;
}

ErrorCode g2_msm(uint8_t _rx[128], uint8_t _ry[128], const uint8_t* _xycs, size_t size) noexcept
{
    constexpr auto SINGLE_ENTRY_SIZE = P2_SIZE + SCALAR_SIZE;
    const auto npoints = size / SINGLE_ENTRY_SIZE;

    std::vector<blst_p2_affine> p2_affines;
    std::vector<blst_scalar> scalars;
    p2_affines.reserve(npoints);
    scalars.reserve(npoints);

    const auto end = _xycs + npoints * SINGLE_ENTRY_SIZE;
    for (auto ptr = _xycs; ptr != end; ptr += SINGLE_ENTRY_SIZE)
    {
        blst_p2_affine p_affine;
        if (const auto ec = load_p2_in_g2(p_affine, ptr, &ptr[FP2_SIZE]); ec != SUCCESS)
            return ec;

        // Point at infinity must be filtered out for BLST library.
        if (blst_p2_affine_is_inf(&p_affine))
            continue;

        p2_affines.emplace_back(p_affine);
        blst_scalar_from_bendian(&scalars.emplace_back(), &ptr[P2_SIZE]);
    }

    if (p2_affines.empty())
    {
        std::memset(_rx, 0, FP2_SIZE);
        std::memset(_ry, 0, FP2_SIZE);
        return SUCCESS;
    }

    std::vector<const blst_p2_affine*> p2_affine_ptrs;
    std::vector<const uint8_t*> scalars_ptrs;
    p2_affine_ptrs.reserve(p2_affines.size());
    scalars_ptrs.reserve(scalars.size());
    for (size_t i = 0; i < p2_affines.size(); ++i)
    {
        p2_affine_ptrs.emplace_back(&p2_affines[i]);
        scalars_ptrs.emplace_back(scalars[i].b);
    }

    const auto scratch_size =
        blst_p2s_mult_pippenger_scratch_sizeof(p2_affine_ptrs.size()) / sizeof(limb_t);
    const auto scratch_space = std::make_unique_for_overwrite<limb_t[]>(scratch_size);
    blst_p2 out;
    blst_p2s_mult_pippenger(&out, p2_affine_ptrs.data(), p2_affine_ptrs.size(), scalars_ptrs.data(),
        256, scratch_space.get());
    store(_rx, _ry, out);
    return SUCCESS;
}

ErrorCode map_fp_to_g1(uint8_t _rx[64], uint8_t _ry[64], const uint8_t _fp[64]) noexcept
{
    blst_fp fp;
    if (const auto ec = load_fp(fp, _fp); ec != SUCCESS)
        return ec;

    blst_p1 out;
    blst_map_to_g1(&out, &fp);
    store(_rx, _ry, out);
    return SUCCESS;
}

ErrorCode map_fp2_to_g2(uint8_t _rx[128], uint8_t _ry[128], const uint8_t _fp2[128]) noexcept
{
    blst_fp2 fp2;
    if (const auto ec = load_fp2(fp2, _fp2); ec != SUCCESS)
        return ec;

    blst_p2 out;
    blst_map_to_g2(&out, &fp2);
    store(_rx, _ry, out);
    return SUCCESS;
}

ErrorCode pairing_check(uint8_t _r[32], const uint8_t* _pairs, size_t size) noexcept
{
    static constexpr auto PAIR_SIZE = P1_SIZE + P2_SIZE;

    auto acc = *blst_fp12_one();
    const auto pairs_end = _pairs + (size / PAIR_SIZE) * PAIR_SIZE;
    for (auto ptr = _pairs; ptr != pairs_end; ptr += PAIR_SIZE)
    {
        blst_p1_affine P_affine;
        if (const auto ec = load_p1_in_g1(P_affine, ptr, &ptr[FP_SIZE]); ec != SUCCESS)
            return ec;

        blst_p2_affine Q_affine;
        if (const auto ec = load_p2_in_g2(Q_affine, &ptr[P1_SIZE], &ptr[P1_SIZE + FP2_SIZE]);
            ec != SUCCESS)
            return ec;

        // Skip a pair containing any point at infinity.
        if (blst_p1_affine_is_inf(&P_affine) || blst_p2_affine_is_inf(&Q_affine))
            continue;

        blst_fp12 ml_res;
        blst_miller_loop(&ml_res, &Q_affine, &P_affine);
        blst_fp12_mul(&acc, &acc, &ml_res);
    }

    blst_final_exp(&acc, &acc);
    const auto result = blst_fp12_is_one(&acc);
    std::memset(_r, 0, 31);
    _r[31] = result ? 1 : 0;
    return SUCCESS;
}
}  // namespace evmpre::crypto::bls
