// evmpre: Ethereum precompiled contracts execution layer
// Copyright 2025 The evmpre Authors.
// SPDX-License-Identifier: Apache-2.0

#include <evmpre/evmpre.hpp>
#include <gtest/gtest.h>
#include <sstream>

using namespace evmpre;

namespace
{
Config load(std::string_view json)
{
    std::istringstream in{std::string{json}};
    return load_config(in);
}
}  // namespace

TEST(config, to_revision)
{
    EXPECT_EQ(to_revision("Frontier"), EVMC_FRONTIER);
    EXPECT_EQ(to_revision("Homestead"), EVMC_HOMESTEAD);
    EXPECT_EQ(to_revision("EIP150"), EVMC_TANGERINE_WHISTLE);
    EXPECT_EQ(to_revision("Tangerine Whistle"), EVMC_TANGERINE_WHISTLE);
    EXPECT_EQ(to_revision("EIP158"), EVMC_SPURIOUS_DRAGON);
    EXPECT_EQ(to_revision("Byzantium"), EVMC_BYZANTIUM);
    EXPECT_EQ(to_revision("ConstantinopleFix"), EVMC_PETERSBURG);
    EXPECT_EQ(to_revision("Istanbul"), EVMC_ISTANBUL);
    EXPECT_EQ(to_revision("Berlin"), EVMC_BERLIN);
    EXPECT_EQ(to_revision("ArrowGlacier"), EVMC_LONDON);
    EXPECT_EQ(to_revision("Merge"), EVMC_PARIS);
    EXPECT_EQ(to_revision("Shanghai"), EVMC_SHANGHAI);
    EXPECT_EQ(to_revision("Cancun"), EVMC_CANCUN);
    EXPECT_EQ(to_revision("Prague"), EVMC_PRAGUE);
    EXPECT_EQ(to_revision("Osaka"), EVMC_OSAKA);
    EXPECT_THROW(to_revision("osaka"), std::invalid_argument);
    EXPECT_THROW(to_revision(""), std::invalid_argument);
}

TEST(config, defaults)
{
    const auto config = load("{}");
    EXPECT_EQ(config.revision, EVMC_LATEST_STABLE_REVISION);
    EXPECT_EQ(config.secp256k1, Secp256k1Backend::libsecp256k1);
    EXPECT_EQ(config.kzg, KzgBackend::blst);
    EXPECT_TRUE(config.kzg_trusted_setup.empty());
    EXPECT_EQ(config.expmod, ExpmodBackend::gmp);
    EXPECT_FALSE(config.p256verify);
    EXPECT_FALSE(config.ecpairing_max_input_size.has_value());
    EXPECT_FALSE(config.bls12_g1msm_max_input_size.has_value());
    EXPECT_FALSE(config.bls12_g2msm_max_input_size.has_value());
    EXPECT_FALSE(config.bls12_pairing_check_max_input_size.has_value());
}

TEST(config, all_keys)
{
    const auto config = load(R"({
        "fork": "Prague",
        "secp256k1": "silkpre",
        "kzg": "ckzg",
        "kzg_trusted_setup": "/etc/kzg/trusted_setup.txt",
        "expmod": "openssl",
        "p256verify": true,
        "ecpairing_max_input_size": 1920,
        "bls12_g1msm_max_input_size": 160,
        "bls12_g2msm_max_input_size": 288,
        "bls12_pairing_check_max_input_size": 384
    })");
    EXPECT_EQ(config.revision, EVMC_PRAGUE);
    EXPECT_EQ(config.secp256k1, Secp256k1Backend::silkpre);
    EXPECT_EQ(config.kzg, KzgBackend::ckzg);
    EXPECT_EQ(config.kzg_trusted_setup, "/etc/kzg/trusted_setup.txt");
    EXPECT_EQ(config.expmod, ExpmodBackend::openssl);
    EXPECT_TRUE(config.p256verify);
    EXPECT_EQ(config.ecpairing_max_input_size, 1920);
    EXPECT_EQ(config.bls12_g1msm_max_input_size, 160);
    EXPECT_EQ(config.bls12_g2msm_max_input_size, 288);
    EXPECT_EQ(config.bls12_pairing_check_max_input_size, 384);
}

TEST(config, invalid_json)
{
    EXPECT_THROW(load(""), std::invalid_argument);
    EXPECT_THROW(load("{"), std::invalid_argument);
    EXPECT_THROW(load("[]"), std::invalid_argument);
    EXPECT_THROW(load("\"Cancun\""), std::invalid_argument);
}

TEST(config, unknown_key)
{
    EXPECT_THROW(load(R"({"forks": "Cancun"})"), std::invalid_argument);
}

TEST(config, unknown_values)
{
    EXPECT_THROW(load(R"({"fork": "Paris2"})"), std::invalid_argument);
    EXPECT_THROW(load(R"({"secp256k1": "openssl"})"), std::invalid_argument);
    EXPECT_THROW(load(R"({"kzg": "gmp"})"), std::invalid_argument);
    EXPECT_THROW(load(R"({"expmod": "blst"})"), std::invalid_argument);
}

TEST(config, wrong_types)
{
    EXPECT_THROW(load(R"({"fork": 12})"), std::invalid_argument);
    EXPECT_THROW(load(R"({"kzg_trusted_setup": null})"), std::invalid_argument);
    EXPECT_THROW(load(R"({"p256verify": "yes"})"), std::invalid_argument);
    EXPECT_THROW(load(R"({"p256verify": 1})"), std::invalid_argument);
    EXPECT_THROW(load(R"({"ecpairing_max_input_size": -1})"), std::invalid_argument);
    EXPECT_THROW(load(R"({"ecpairing_max_input_size": 1.5})"), std::invalid_argument);
    EXPECT_THROW(load(R"({"bls12_g1msm_max_input_size": "160"})"), std::invalid_argument);
    EXPECT_THROW(load(R"({"bls12_pairing_check_max_input_size": -384})"), std::invalid_argument);
}
