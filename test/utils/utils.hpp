// evmpre: Ethereum precompiled contracts execution layer
// Copyright 2025 The evmpre Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>
#include <string_view>

namespace evmpre::test
{
using evmc::bytes;
using evmc::bytes_view;
using evmc::from_hex;
using evmc::from_spaced_hex;
using evmc::hex;

/// Converts a string to bytes by casting individual characters.
inline bytes to_bytes(std::string_view s)
{
    return {s.begin(), s.end()};
}

/// Produces bytes out of string literal.
inline bytes operator""_b(const char* data, size_t size)
{
    return to_bytes({data, size});
}

inline bytes operator""_hex(const char* s, size_t size)
{
    return from_spaced_hex({s, size}).value();
}

/// Returns the input of the expmod precompile: the three 32-byte lengths followed by operands.
inline bytes expmod_input(bytes_view base, bytes_view exp, bytes_view mod)
{
    bytes input(3 * 32, 0);
    input[31] = static_cast<uint8_t>(base.size());
    input[32 + 31] = static_cast<uint8_t>(exp.size());
    input[64 + 31] = static_cast<uint8_t>(mod.size());
    input += base;
    input += exp;
    input += mod;
    return input;
}
}  // namespace evmpre::test
