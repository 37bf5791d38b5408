// evmpre: Ethereum precompiled contracts execution layer
// Copyright 2025 The evmpre Authors.
// SPDX-License-Identifier: Apache-2.0

#include <evmpre/precompile_id.hpp>
#include <gtest/gtest.h>
#include <string_view>

using namespace evmc::literals;
using namespace evmpre;

TEST(precompile_id, address_of)
{
    EXPECT_EQ(address_of(PrecompileId::ecrecover), 0x01_address);
    EXPECT_EQ(address_of(PrecompileId::identity), 0x04_address);
    EXPECT_EQ(address_of(PrecompileId::blake2bf), 0x09_address);
    EXPECT_EQ(address_of(PrecompileId::point_evaluation), 0x0a_address);
    EXPECT_EQ(address_of(PrecompileId::bls12_map_fp2_to_g2), 0x11_address);
    EXPECT_EQ(address_of(PrecompileId::p256verify), 0x0100_address);
}

TEST(precompile_id, find_round_trip)
{
    for (size_t i = 0; i < NumPrecompiles; ++i)
    {
        const auto id = static_cast<PrecompileId>(i);
        EXPECT_EQ(find_precompile_id(address_of(id)), id) << get_name(id);
    }
}

TEST(precompile_id, find_unknown)
{
    EXPECT_FALSE(find_precompile_id(0x00_address).has_value());
    EXPECT_FALSE(find_precompile_id(0x12_address).has_value());
    EXPECT_FALSE(find_precompile_id(0xff_address).has_value());
    EXPECT_FALSE(find_precompile_id(0x0101_address).has_value());
    EXPECT_FALSE(find_precompile_id(0x0200_address).has_value());
    EXPECT_FALSE(find_precompile_id(0x0100000000000000000000000000000000000001_address).has_value());
}

TEST(precompile_id, names)
{
    EXPECT_EQ(std::string_view{get_name(PrecompileId::ecrecover)}, "ECREC");
    EXPECT_EQ(std::string_view{get_name(PrecompileId::expmod)}, "MODEXP");
    EXPECT_EQ(std::string_view{get_name(PrecompileId::bls12_g1add)}, "BLS12_G1ADD");
    EXPECT_EQ(std::string_view{get_name(PrecompileId::p256verify)}, "P256VERIFY");
    EXPECT_EQ(std::string_view{get_name(static_cast<PrecompileId>(200))}, "UNKNOWN");
}
