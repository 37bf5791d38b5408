// evmpre: Ethereum precompiled contracts execution layer
// Copyright 2025 The evmpre Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <evmc/evmc.hpp>
#include <evmpre_crypto/bn254.hpp>
#include <intx/intx.hpp>
#include <algorithm>
#include <array>
#include <cstdint>
#include <optional>

/// Byte-exact input/output framing of the precompiles.
///
/// Everything here is pure and knows nothing about gas or revisions.
namespace evmpre::codec
{
using evmc::bytes;
using evmc::bytes_view;
/// The size of the EVM word.
inline constexpr size_t WORD_SIZE = 32;

/// Returns the number of EVM words needed to hold the given number of bytes, i.e. ⌈size/32⌉.
constexpr uint64_t num_words(size_t size_in_bytes) noexcept
{
    return (static_cast<uint64_t>(size_in_bytes) / WORD_SIZE) +
           (static_cast<uint64_t>(size_in_bytes) % WORD_SIZE != 0);
}

/// Copies the input range [offset, offset + width) to @p out.
/// Bytes missing from the input (including the whole range for offsets past the input end)
/// are filled with zeros.
void read_fixed(uint8_t* out, bytes_view input, size_t offset, size_t width) noexcept;

/// Returns the input range [offset, offset + width) zero-extended to the full width.
bytes read_fixed(bytes_view input, size_t offset, size_t width);

/// Returns the fixed-size input range [offset, offset + N) zero-extended to the full size.
template <size_t N>
std::array<uint8_t, N> read_fixed(bytes_view input, size_t offset) noexcept
{
    std::array<uint8_t, N> out;
    read_fixed(out.data(), input, offset, N);
    return out;
}

/// Loads the big-endian 256-bit word at the input offset (zero-extended).
intx::uint256 load_uint256(bytes_view input, size_t offset) noexcept;

/// Decodes a big-endian unsigned integer of any length into the intx integer type.
///
/// @return The value or std::nullopt if the value does not fit into UintT.
template <typename UintT>
std::optional<UintT> big_endian_to_uint(bytes_view data) noexcept
{
    constexpr auto num_bytes = sizeof(UintT);
    const auto first_nonzero = data.find_first_not_of(uint8_t{0});
    if (first_nonzero == bytes_view::npos)
        return UintT{0};
    const auto significant = data.substr(first_nonzero);
    if (significant.size() > num_bytes)
        return std::nullopt;

    uint8_t buffer[num_bytes]{};
    std::copy(significant.begin(), significant.end(), &buffer[num_bytes - significant.size()]);
    return intx::be::unsafe::load<UintT>(buffer);
}

/// Returns the number of significant bits of the big-endian integer.
size_t bit_width(bytes_view data) noexcept;

/// Left-pads the data with zeros to the width. If the data is longer, only the rightmost
/// (least significant) width bytes are kept.
bytes pad_left(bytes_view data, size_t width);

/// Writes the 32-byte EVM boolean: 31 zero bytes followed by 0 or 1.
void store_bool(uint8_t out[WORD_SIZE], bool v) noexcept;

/// The BN254 (alt_bn128) point framing of EIP-196 and EIP-197.
namespace bn254
{
using crypto::bn254::FIELD_PRIME;

/// The size of the encoded G1 point: x ‖ y.
inline constexpr size_t G1_SIZE = 2 * WORD_SIZE;

/// The size of the encoded G2 point: x.im ‖ x.re ‖ y.im ‖ y.re.
inline constexpr size_t G2_SIZE = 4 * WORD_SIZE;

/// The G1 point in affine coordinates. (0, 0) is the point at infinity.
struct G1Point
{
    intx::uint256 x;
    intx::uint256 y;

    friend bool operator==(const G1Point&, const G1Point&) = default;
};

/// The Fp2 element a + b·i.
struct Fp2
{
    intx::uint256 re;
    intx::uint256 im;

    friend bool operator==(const Fp2&, const Fp2&) = default;
};

/// The G2 point in affine coordinates over Fp2.
struct G2Point
{
    Fp2 x;
    Fp2 y;

    friend bool operator==(const G2Point&, const G2Point&) = default;
};

/// Decodes the G1 point. Rejects non-canonical coordinates (≥ FIELD_PRIME).
/// Does not check if the point is on the curve.
std::optional<G1Point> decode_g1(const uint8_t in[G1_SIZE]) noexcept;

/// Encodes the G1 point.
void encode_g1(uint8_t out[G1_SIZE], const G1Point& p) noexcept;

/// Decodes the G2 point in the EIP-197 order (imaginary part first).
/// Rejects non-canonical coordinates (≥ FIELD_PRIME).
std::optional<G2Point> decode_g2(const uint8_t in[G2_SIZE]) noexcept;

/// Encodes the G2 point in the EIP-197 order (imaginary part first).
void encode_g2(uint8_t out[G2_SIZE], const G2Point& p) noexcept;
}  // namespace bn254
}  // namespace evmpre::codec
