// evmpre: Ethereum precompiled contracts execution layer
// Copyright 2025 The evmpre Authors.
// SPDX-License-Identifier: Apache-2.0

#include "codec.hpp"
#include <algorithm>
#include <bit>
#include <cstring>

namespace evmpre::codec
{
void read_fixed(uint8_t* out, bytes_view input, size_t offset, size_t width) noexcept
{
    size_t n = 0;
    if (offset < input.size())
    {
        n = std::min(width, input.size() - offset);
        std::memcpy(out, &input[offset], n);
    }
    std::fill_n(out + n, width - n, uint8_t{0});
}

bytes read_fixed(bytes_view input, size_t offset, size_t width)
{
    bytes out(width, 0);
    read_fixed(out.data(), input, offset, width);
    return out;
}

intx::uint256 load_uint256(bytes_view input, size_t offset) noexcept
{
    const auto word = read_fixed<WORD_SIZE>(input, offset);
    return intx::be::unsafe::load<intx::uint256>(word.data());
}

size_t bit_width(bytes_view data) noexcept
{
    const auto first_nonzero = data.find_first_not_of(uint8_t{0});
    if (first_nonzero == bytes_view::npos)
        return 0;
    const auto num_tail_bytes = data.size() - first_nonzero - 1;
    return num_tail_bytes * 8 + static_cast<size_t>(std::bit_width(data[first_nonzero]));
}

bytes pad_left(bytes_view data, size_t width)
{
    if (data.size() >= width)
        return bytes{data.substr(data.size() - width)};

    bytes out(width - data.size(), 0);
    out += data;
    return out;
}

void store_bool(uint8_t out[WORD_SIZE], bool v) noexcept
{
    std::fill_n(out, WORD_SIZE - 1, uint8_t{0});
    out[WORD_SIZE - 1] = v ? 1 : 0;
}

namespace bn254
{
namespace
{
std::optional<intx::uint256> decode_fp(const uint8_t in[WORD_SIZE]) noexcept
{
    const auto v = intx::be::unsafe::load<intx::uint256>(in);
    if (v >= FIELD_PRIME)
        return std::nullopt;
    return v;
}
}  // namespace

std::optional<G1Point> decode_g1(const uint8_t in[G1_SIZE]) noexcept
{
    const auto x = decode_fp(in);
    if (!x.has_value())
        return std::nullopt;
    const auto y = decode_fp(&in[WORD_SIZE]);
    if (!y.has_value())
        return std::nullopt;
    return G1Point{*x, *y};
}

void encode_g1(uint8_t out[G1_SIZE], const G1Point& p) noexcept
{
    intx::be::unsafe::store(out, p.x);
    intx::be::unsafe::store(&out[WORD_SIZE], p.y);
}

std::optional<G2Point> decode_g2(const uint8_t in[G2_SIZE]) noexcept
{
    const auto x_im = decode_fp(in);
    const auto x_re = decode_fp(&in[WORD_SIZE]);
    const auto y_im = decode_fp(&in[2 * WORD_SIZE]);
    const auto y_re = decode_fp(&in[3 * WORD_SIZE]);
    if (!x_im || !x_re || !y_im || !y_re)
        return std::nullopt;
    return G2Point{{*x_re, *x_im}, {*y_re, *y_im}};
}

void encode_g2(uint8_t out[G2_SIZE], const G2Point& p) noexcept
{
    intx::be::unsafe::store(out, p.x.im);
    intx::be::unsafe::store(&out[WORD_SIZE], p.x.re);
    intx::be::unsafe::store(&out[2 * WORD_SIZE], p.y.im);
    intx::be::unsafe::store(&out[3 * WORD_SIZE], p.y.re);
}
}  // namespace bn254
}  // namespace evmpre::codec
