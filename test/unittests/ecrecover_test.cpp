// evmpre: Ethereum precompiled contracts execution layer
// Copyright 2025 The evmpre Authors.
// SPDX-License-Identifier: Apache-2.0

#include <evmc/evmc.hpp>
#include <evmpre/evmpre.hpp>
#include <evmpre_crypto/secp256k1.hpp>
#include <gtest/gtest.h>
#include <test/utils/utils.hpp>

using namespace evmc::literals;
using namespace evmpre;
using namespace evmpre::test;

namespace
{
struct TestCaseECRecovery
{
    bytes input;
    bytes expected_output;
};

const TestCaseECRecovery test_cases[] = {
    {"18c547e4f7b0f325ad1e56f57e26c745b09a3e503d86e00e5255ff7f715d3d1c000000000000000000000000000000000000000000000000000000000000001c73b1693892219d736caba55bdb67216e485557ea6b6af75f37096c9aa6a5a75feeb940b1d03b21e36b0e47e79769f095fe2ab855bd91e3a38756b7d75a9c4549"_hex,
        "000000000000000000000000a94f5374fce5edbc8e2a8697c15331677e6ebf0b"_hex},
    {"18c547e4f7b0f325ad1e56f57e26c745b09a3e503d86e00e5255ff7f715d3d1c000000000000000000000000000000000000000000000000000000000000001b7af9e73057870458f03c143483bc5fcb6f39d01c9b26d28ed9f3fe23714f66283134a4ba8fafe11b351a720538398a5635e235c0b3258dce19942000731079ec"_hex,
        "0000000000000000000000009a04aede774152f135315670f562c19c5726df2c"_hex},
    {"38d18acb67d25c8bb9942764b62f18e17054f66a817bd4295423adf9ed98873e000000000000000000000000000000000000000000000000000000000000001b38d18acb67d25c8bb9942764b62f18e17054f66a817bd4295423adf9ed98873e789d1dd423d25f0772d2748d60f7e4b81bb14d086eba8e8e8efb6dcff8a4ae02"_hex,
        "000000000000000000000000ceaccac640adf55b2028469bd36ba501f28b699d"_hex},
    // hash >= N
    {"fffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141000000000000000000000000000000000000000000000000000000000000001b7af9e73057870458f03c143483bc5fcb6f39d01c9b26d28ed9f3fe23714f66283134a4ba8fafe11b351a720538398a5635e235c0b3258dce19942000731079ec"_hex,
        "000000000000000000000000b32cf3c8616537a28583fc00d29a3e8c9614cd61"_hex},
    // The recovered key is the point at infinity.
    {"6b8d2c81b11b2d699528dde488dbdf2f94293d0d33c32e347f255fa4a6c1f0a9000000000000000000000000000000000000000000000000000000000000001b79be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f817986b8d2c81b11b2d699528dde488dbdf2f94293d0d33c32e347f255fa4a6c1f0a9"_hex,
        {}},
    // r = 0
    {"18c547e4f7b0f325ad1e56f57e26c745b09a3e503d86e00e5255ff7f715d3d1c000000000000000000000000000000000000000000000000000000000000001c0000000000000000000000000000000000000000000000000000000000000000eeb940b1d03b21e36b0e47e79769f095fe2ab855bd91e3a38756b7d75a9c4549"_hex,
        {}},
    // s = 0
    {"18c547e4f7b0f325ad1e56f57e26c745b09a3e503d86e00e5255ff7f715d3d1c000000000000000000000000000000000000000000000000000000000000001c73b1693892219d736caba55bdb67216e485557ea6b6af75f37096c9aa6a5a75f0000000000000000000000000000000000000000000000000000000000000000"_hex,
        {}},
    // r >= N
    {"18c547e4f7b0f325ad1e56f57e26c745b09a3e503d86e00e5255ff7f715d3d1c000000000000000000000000000000000000000000000000000000000000001cfffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141eeb940b1d03b21e36b0e47e79769f095fe2ab855bd91e3a38756b7d75a9c4549"_hex,
        {}},
    // s >= N
    {"18c547e4f7b0f325ad1e56f57e26c745b09a3e503d86e00e5255ff7f715d3d1c000000000000000000000000000000000000000000000000000000000000001c73b1693892219d736caba55bdb67216e485557ea6b6af75f37096c9aa6a5a75ffffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141"_hex,
        {}},
    // v = 29
    {"18c547e4f7b0f325ad1e56f57e26c745b09a3e503d86e00e5255ff7f715d3d1c000000000000000000000000000000000000000000000000000000000000001d73b1693892219d736caba55bdb67216e485557ea6b6af75f37096c9aa6a5a75feeb940b1d03b21e36b0e47e79769f095fe2ab855bd91e3a38756b7d75a9c4549"_hex,
        {}},
    // v with garbage in the high bytes
    {"18c547e4f7b0f325ad1e56f57e26c745b09a3e503d86e00e5255ff7f715d3d1c010000000000000000000000000000000000000000000000000000000000001c73b1693892219d736caba55bdb67216e485557ea6b6af75f37096c9aa6a5a75feeb940b1d03b21e36b0e47e79769f095fe2ab855bd91e3a38756b7d75a9c4549"_hex,
        {}},
};

class ecrecover : public testing::TestWithParam<Secp256k1Backend>
{
protected:
    std::shared_ptr<const ActivationTable> table;

    ecrecover()
    {
        Config config;
        config.secp256k1 = GetParam();
        table = make_activation_table(EVMC_CANCUN, config);
    }
};
}  // namespace

TEST_P(ecrecover, test_vectors)
{
    for (const auto& t : test_cases)
    {
        const auto outcome = call(*table, 0x01_address, t.input, 3000);
        EXPECT_EQ(gas_used(outcome), 3000);
        if (t.expected_output.empty())
        {
            EXPECT_EQ(status(outcome), make_error_code(INVALID_SIGNATURE)) << hex(t.input);
            EXPECT_TRUE(output(outcome).empty());
        }
        else
        {
            ASSERT_TRUE(std::holds_alternative<Success>(outcome)) << hex(t.input);
            EXPECT_EQ(hex(output(outcome)), hex(t.expected_output));
        }
    }
}

TEST_P(ecrecover, short_input_is_zero_extended)
{
    // Remove the trailing zero bytes of s.
    auto input =
        "18c547e4f7b0f325ad1e56f57e26c745b09a3e503d86e00e5255ff7f715d3d1c000000000000000000000000000000000000000000000000000000000000001b7af9e73057870458f03c143483bc5fcb6f39d01c9b26d28ed9f3fe23714f6628"_hex;
    input += "3134a4ba8fafe11b351a720538398a5635e235c0b3258dce1994200073100000"_hex;
    const auto full = call(*table, 0x01_address, input, 3000);
    input.resize(input.size() - 2);
    const auto shortened = call(*table, 0x01_address, input, 3000);
    EXPECT_EQ(full, shortened);
}

TEST_P(ecrecover, extra_input_is_ignored)
{
    auto input = test_cases[0].input;
    input += "ff"_hex;
    const auto outcome = call(*table, 0x01_address, input, 3000);
    ASSERT_TRUE(std::holds_alternative<Success>(outcome));
    EXPECT_EQ(hex(output(outcome)), hex(test_cases[0].expected_output));
}

TEST_P(ecrecover, empty_input)
{
    const auto outcome = call(*table, 0x01_address, {}, 3000);
    EXPECT_EQ(status(outcome), make_error_code(INVALID_SIGNATURE));
    EXPECT_EQ(gas_used(outcome), 3000);
}

INSTANTIATE_TEST_SUITE_P(evmpre, ecrecover,
    testing::Values(Secp256k1Backend::libsecp256k1, Secp256k1Backend::silkpre),
    [](const testing::TestParamInfo<Secp256k1Backend>& info) {
        return info.param == Secp256k1Backend::libsecp256k1 ? "libsecp256k1" : "silkpre";
    });

TEST(secp256k1, to_address)
{
    // The public key of the private key 1 is the curve generator G.
    const auto g =
        "79be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798"
        "483ada7726a3c4655da4fbfc0e1108a8fd17b448a68554199c47d08ffb10d4b8"_hex;
    EXPECT_EQ(crypto::to_address(std::span<const uint8_t, 64>{g.data(), 64}),
        0x7e5f4552091a69125d5dfcb7b8c2659029395bdf_address);
}
