// evmpre: Ethereum precompiled contracts execution layer
// Copyright 2025 The evmpre Authors.
// SPDX-License-Identifier: Apache-2.0

#include <evmc/hex.hpp>
#include <evmpre/evmpre.hpp>
#include <evmpre/precompiles_internal.hpp>
#include <gtest/gtest.h>
#include <test/utils/utils.hpp>

using namespace evmc::literals;
using evmpre::test::expmod_input;
using evmpre::test::operator""_hex;

struct TestCase
{
    std::string base;
    std::string exp;
    std::string mod;
    std::string expected_result;
};

/// Test vectors for expmod precompile.
static const std::vector<TestCase> test_cases{
    {"", "", "", ""},
    {"", "", "00", "00"},
    {"", "", "01", "00"},
    {"", "", "02", "01"},
    {"02", "01", "03", "02"},
    {"03", "1c93", "61", "5f"},
    {"02", "", "0000", "0000"},
    {"ff", "02", "00ff", "0000"},
    {
        "03",
        "fffffffffffffffffffffffffffffffffffffffffffffffffffffffefffffc2e",
        "fffffffffffffffffffffffffffffffffffffffffffffffffffffffefffffc2f",
        "0000000000000000000000000000000000000000000000000000000000000001",
    },
};

class expmod : public testing::TestWithParam<evmpre::crypto::ExpmodFn*>
{};

TEST_P(expmod, test_vectors)
{
    for (const auto& [base, exp, mod, expected_result] : test_cases)
    {
        const auto input =
            expmod_input(*evmc::from_hex(base), *evmc::from_hex(exp), *evmc::from_hex(mod));

        evmc::bytes result(expected_result.size() / 2, 0xfe);
        const auto r = evmpre::expmod_execute(input.data(), input.size(), result.data(),
            result.size(), GetParam(), std::numeric_limits<size_t>::max());
        EXPECT_EQ(r.status, evmpre::SUCCESS);
        EXPECT_EQ(r.output_size, result.size());
        EXPECT_EQ(evmc::hex(result), expected_result) << base << " " << exp << " " << mod;
    }
}

TEST_P(expmod, operands_are_zero_extended)
{
    // The declared modulus of 2 bytes is missing the last byte: 02**03 mod 0x0100 = 8.
    auto input = expmod_input("02"_hex, "03"_hex, "01"_hex);
    input[64 + 31] = 2;

    evmc::bytes result(2, 0xfe);
    const auto r = evmpre::expmod_execute(input.data(), input.size(), result.data(),
        result.size(), GetParam(), std::numeric_limits<size_t>::max());
    EXPECT_EQ(r.status, evmpre::SUCCESS);
    EXPECT_EQ(evmc::hex(result), "0008");
}

TEST_P(expmod, operand_bound)
{
    const auto input = expmod_input("02"_hex, "03"_hex, "05"_hex);
    uint8_t result[1];
    const auto r =
        evmpre::expmod_execute(input.data(), input.size(), result, sizeof(result), GetParam(), 0);
    EXPECT_EQ(r.status, evmpre::INPUT_TOO_LARGE);
}

INSTANTIATE_TEST_SUITE_P(backends, expmod,
    testing::Values(evmpre::crypto::expmod_gmp, evmpre::crypto::expmod_openssl),
    [](const testing::TestParamInfo<evmpre::crypto::ExpmodFn*>& info) {
        return info.param == evmpre::crypto::expmod_gmp ? "gmp" : "openssl";
    });

TEST(expmod_precompile, zero_modulus_length)
{
    const auto input = expmod_input("02"_hex, "03"_hex, {});
    const auto outcome = evmpre::execute(0x05_address, input, 1000, EVMC_CANCUN);
    ASSERT_TRUE(std::holds_alternative<evmpre::Success>(outcome));
    EXPECT_TRUE(evmpre::output(outcome).empty());
    EXPECT_EQ(evmpre::gas_used(outcome), 200);
}

TEST(expmod_precompile, backend_from_config)
{
    const auto input = expmod_input("03"_hex, "1c93"_hex, "61"_hex);
    for (const auto backend : {evmpre::ExpmodBackend::gmp, evmpre::ExpmodBackend::openssl})
    {
        const auto table = evmpre::make_activation_table(EVMC_BERLIN, {.expmod = backend});
        const auto outcome = evmpre::call(*table, 0x05_address, input, 1000);
        EXPECT_EQ(evmc::hex(evmpre::output(outcome)), "5f");
    }
}
