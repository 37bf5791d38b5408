// evmpre: Ethereum precompiled contracts execution layer
// Copyright 2025 The evmpre Authors.
// SPDX-License-Identifier: Apache-2.0

#include "kzg.hpp"
#include <blst.h>
#include <optional>
#include <span>

namespace evmpre::crypto
{
namespace
{
/// The field element 1 in Montgomery form.
constexpr blst_fp ONE = {0x760900000002fffd, 0xebf4000bc40c0002, 0x5f48985753c758ba,
    0x77ce585370525745, 0x5c071a97a256ec6d, 0x15f65ec3fa80e493};

/// The negation of the subgroup G1 generator -[1]₁ (Jacobian coordinates in Montgomery form).
constexpr blst_p1 G1_GENERATOR_NEGATIVE = {
    {0x5cb38790fd530c16, 0x7817fc679976fff5, 0x154f95c7143ba1c1, 0xf0ae6acdf3d0e747,
        0xedce6ecc21dbf440, 0x120177419e0bfb75},
    {0xff526c2af318883a, 0x92899ce4383b0270, 0x89d7738d9fa9d055, 0x12caf35ba344c12a,
        0x3cff1b76964b5317, 0x0e44d2ede9774430},
    ONE};

/// The negation of the subgroup G2 generator -[1]₂ (Jacobian coordinates in Montgomery form).
constexpr blst_p2 G2_GENERATOR_NEGATIVE{
    {{{0xf5f28fa202940a10, 0xb3f5fb2687b4961a, 0xa1a893b53e2ae580, 0x9894999d1a3caee9,
          0x6f67b7631863366b, 0x058191924350bcd7},
        {0xa5a9c0759e23f606, 0xaaa0c59dbccd60c3, 0x3bb17e18e2867806, 0x1b1ab6cc8541b367,
            0xc2b6ed0ef2158547, 0x11922a097360edf3}}},
    {{{0x6d8bf5079fb65e61, 0xc52f05df531d63a5, 0x7f4a4d344ca692c9, 0xa887959b8577c95f,
          0x4347fe40525c8734, 0x197d145bbaff0bb5},
        {0x0c3e036d209afa4e, 0x0601d8f4863f9e23, 0xe0832636bacc0a84, 0xeb2def362a476f84,
            0x64044f659f0ee1e9, 0x0ed54f48d5a1caa7}}},
    {{ONE, {}}}};

/// The point [s]₂ of the Ethereum KZG trusted setup (index 1 of the G2 monomial series),
/// affine coordinates in Montgomery form.
constexpr blst_p2_affine KZG_SETUP_G2_1{
    {{{0x6120a2099b0379f9, 0xa2df815cb8210e4e, 0xcb57be5577bd3d4f, 0x62da0ea89a0c93f8,
          0x02e0ee16968e150d, 0x171f09aea833acd5},
        {0x11a3670749dfd455, 0x04991d7b3abffadc, 0x85446a8e14437f41, 0x27174e7b4e76e3f2,
            0x7bfa6dd397f60a20, 0x02fcc329ac07080f}}},
    {{{0xaa130838793b2317, 0xe236dd220f891637, 0x6502782925760980, 0xd05c25f60557ec89,
          0x6095767a44064474, 0x185693917080d405},
        {0x549f9e175b03dc0a, 0x32c0c95a77106cfe, 0x64a74eae5705d080, 0x53deeaf56659ed9e,
            0x09a1d368508afb93, 0x12cf3a4525b5e9bd}}}};

std::optional<blst_scalar> load_scalar(std::span<const uint8_t, 32> b) noexcept
{
    blst_scalar v;
    blst_scalar_from_bendian(&v, b.data());
    return blst_scalar_fr_check(&v) ? std::optional{v} : std::nullopt;
}

/// Uncompress and validate a point from G1 subgroup.
std::optional<blst_p1_affine> load_g1(std::span<const uint8_t, 48> b) noexcept
{
    blst_p1_affine r;
    if (blst_p1_uncompress(&r, b.data()) != BLST_SUCCESS)
        return std::nullopt;
    if (!blst_p1_affine_in_g1(&r))
        return std::nullopt;
    return r;
}

blst_p1_affine add_or_double(const blst_p1_affine& p, const blst_p1& q) noexcept
{
    blst_p1 r;
    blst_p1_add_or_double_affine(&r, &q, &p);
    blst_p1_affine ra;
    blst_p1_to_affine(&ra, &r);
    return ra;
}

blst_p2_affine add_or_double(const blst_p2_affine& p, const blst_p2& q) noexcept
{
    blst_p2 r;
    blst_p2_add_or_double_affine(&r, &q, &p);
    blst_p2_affine ra;
    blst_p2_to_affine(&ra, &r);
    return ra;
}

blst_p1 mult(const blst_p1& p, const blst_scalar& v) noexcept
{
    blst_p1 r;
    blst_p1_mult(&r, &p, v.b, BLS_MODULUS_BITS);
    return r;
}

blst_p2 mult(const blst_p2& p, const blst_scalar& v) noexcept
{
    blst_p2 r;
    blst_p2_mult(&r, &p, v.b, BLS_MODULUS_BITS);
    return r;
}

/// Checks e(a1, [1]₂) == e(b1, b2).
bool pairings_verify(
    const blst_p1_affine& a1, const blst_p1_affine& b1, const blst_p2_affine& b2) noexcept
{
    blst_fp12 left;
    blst_aggregated_in_g1(&left, &a1);
    blst_fp12 right;
    blst_miller_loop(&right, &b2, &b1);
    return blst_fp12_finalverify(&left, &right);
}

class BlstKzgVerifier : public KzgVerifier
{
public:
    ErrorCode verify_proof(const uint8_t z[32], const uint8_t y[32], const uint8_t commitment[48],
        const uint8_t proof[48]) const noexcept override
    {
        const auto zz = load_scalar(std::span<const uint8_t, 32>{z, 32});
        const auto yy = load_scalar(std::span<const uint8_t, 32>{y, 32});
        if (!zz || !yy)
            return INVALID_FIELD_ELEMENT;

        // The commitment C and the proof Pi may be points at infinity
        // when they prove a commitment to a constant polynomial.
        const auto C = load_g1(std::span<const uint8_t, 48>{commitment, 48});
        const auto Pi = load_g1(std::span<const uint8_t, 48>{proof, 48});
        if (!C || !Pi)
            return INVALID_POINT;

        // C - [y]₁. It can happen that C == [y]₁ so doubling may be needed.
        const auto C_sub_Y = add_or_double(*C, mult(G1_GENERATOR_NEGATIVE, *yy));

        // [s - z]₂.
        const auto X_sub_Z = add_or_double(KZG_SETUP_G2_1, mult(G2_GENERATOR_NEGATIVE, *zz));

        // e(C - [y]₁, [1]₂) =? e(Pi, [s - z]₂)
        return pairings_verify(C_sub_Y, *Pi, X_sub_Z) ? SUCCESS : VERIFICATION_FAILED;
    }
};
}  // namespace

std::unique_ptr<KzgVerifier> create_blst_kzg_verifier()
{
    return std::make_unique<BlstKzgVerifier>();
}
}  // namespace evmpre::crypto
