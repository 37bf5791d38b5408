// evmpre: Ethereum precompiled contracts execution layer
// Copyright 2025 The evmpre Authors.
// SPDX-License-Identifier: Apache-2.0

#include <evmc/bytes.hpp>
#include <evmpre/evmpre.hpp>
#include <evmpre_crypto/bls.hpp>
#include <gtest/gtest.h>
#include <test/utils/utils.hpp>
#include <array>

using namespace evmc::literals;
using evmpre::test::operator""_hex;
namespace bls = evmpre::crypto::bls;

namespace
{
const auto G1_X =
    "0000000000000000000000000000000017f1d3a73197d7942695638c4fa9ac0fc3688c4f9774b905a14e3a3f171bac586c55e83ff97a1aeffb3af00adb22c6bb"_hex;
const auto G1_Y =
    "0000000000000000000000000000000008b3f481e3aaa0f1a09e30ed741d8ae4fcf5e095d5d00af600db18cb2c04b3edd03cc744a2888ae40caa232946c5e7e1"_hex;
const auto G2_X =
    "00000000000000000000000000000000024aa2b2f08f0a91260805272dc51051c6e47ad4fa403b02b4510b647ae3d1770bac0326a805bbefd48056c8c121bdb80000000000000000000000000000000013e02b6052719f607dacd3a088274f65596bd0d09920b61ab5da61bbdc7f5049334cf11213945d57e5ac7d055d042b7e"_hex;
const auto G2_Y =
    "000000000000000000000000000000000ce5d527727d6e118cc9cdc6da2e351aadfd9baa8cbdd3a76d429a695160d12c923ac9cc3baca289e193548608b82801000000000000000000000000000000000606c4a02ea734cc32acd2b02bc28b99cb3e287e85a763af267492ab572e99ab3f370d275cec1da1aaa9075ff05f79be"_hex;

/// Returns the 64-byte encoding of the field element p - y.
evmc::bytes negate(const evmc::bytes& y)
{
    const auto v = intx::be::unsafe::load<intx::uint512>(y.data());
    evmc::bytes out(64, 0);
    intx::be::unsafe::store(out.data(), intx::uint512{bls::BLS_FIELD_MODULUS} - v);
    return out;
}

evmc::bytes scalar(uint8_t c)
{
    evmc::bytes out(32, 0);
    out[31] = c;
    return out;
}
}  // namespace

TEST(bls, g1_add)
{
    const auto x1 =
        "00000000000000000000000000000000112b98340eee2777cc3c14163dea3ec97977ac3dc5c70da32e6e87578f44912e902ccef9efe28d4a78b8999dfbca9426"_hex;
    const auto y1 =
        "00000000000000000000000000000000186b28d92356c4dfec4b5201ad099dbdede3781f8998ddf929b4cd7756192185ca7b8f4ef7088f813270ac3d48868a21"_hex;

    uint8_t rx[64];
    uint8_t ry[64];

    EXPECT_EQ(bls::g1_add(rx, ry, G1_X.data(), G1_Y.data(), x1.data(), y1.data()),
        evmpre::SUCCESS);

    const auto expected_x =
        "000000000000000000000000000000000a40300ce2dec9888b60690e9a41d3004fda4886854573974fab73b046d3147ba5b7a5bde85279ffede1b45b3918d82d"_hex;
    const auto expected_y =
        "0000000000000000000000000000000006d3d887e9f53b9ec4eb6cedf5607226754b07c01ace7834f57f3e7315faefb739e59018e22c492006190fba4a870025"_hex;

    EXPECT_EQ(evmc::bytes_view(rx, sizeof rx), expected_x);
    EXPECT_EQ(evmc::bytes_view(ry, sizeof ry), expected_y);
}

TEST(bls, g1_add_not_on_curve)
{
    auto y = G1_Y;
    y[63] ^= 1;

    uint8_t rx[64];
    uint8_t ry[64];
    EXPECT_EQ(bls::g1_add(rx, ry, G1_X.data(), y.data(), G1_X.data(), G1_Y.data()),
        evmpre::POINT_NOT_ON_CURVE);
    EXPECT_EQ(bls::g1_add(rx, ry, G1_X.data(), G1_Y.data(), G1_X.data(), y.data()),
        evmpre::POINT_NOT_ON_CURVE);
}

TEST(bls, invalid_field_element)
{
    uint8_t rx[64];
    uint8_t ry[64];

    // The 16 leading bytes must be zero.
    auto x = G1_X;
    x[0] = 1;
    EXPECT_EQ(bls::g1_add(rx, ry, x.data(), G1_Y.data(), G1_X.data(), G1_Y.data()),
        evmpre::INVALID_FIELD_ELEMENT);

    // The field modulus itself is not canonical.
    evmc::bytes p(64, 0);
    intx::be::unsafe::store(p.data(), intx::uint512{bls::BLS_FIELD_MODULUS});
    EXPECT_EQ(bls::map_fp_to_g1(rx, ry, p.data()), evmpre::INVALID_FIELD_ELEMENT);
}

TEST(bls, g1_mul)
{
    const auto c = scalar(2);

    uint8_t rx[64];
    uint8_t ry[64];

    EXPECT_EQ(bls::g1_mul(rx, ry, G1_X.data(), G1_Y.data(), c.data()), evmpre::SUCCESS);

    const auto expected_x =
        "000000000000000000000000000000000572cbea904d67468808c8eb50a9450c9721db309128012543902d0ac358a62ae28f75bb8f1c7c42c39a8c5529bf0f4e"_hex;
    const auto expected_y =
        "00000000000000000000000000000000166a9d8cabc673a322fda673779d8e3822ba3ecb8670e461f73bb9021d5fd76a4c56d9d4cd16bd1bba86881979749d28"_hex;

    EXPECT_EQ(evmc::bytes_view(rx, sizeof rx), expected_x);
    EXPECT_EQ(evmc::bytes_view(ry, sizeof ry), expected_y);
}

TEST(bls, g2_add)
{
    const auto x1 =
        "00000000000000000000000000000000103121a2ceaae586d240843a398967325f8eb5a93e8fea99b62b9f88d8556c80dd726a4b30e84a36eeabaf3592937f2700000000000000000000000000000000086b990f3da2aeac0a36143b7d7c824428215140db1bb859338764cb58458f081d92664f9053b50b3fbd2e4723121b68"_hex;
    const auto y1 =
        "000000000000000000000000000000000f9e7ba9a86a8f7624aa2b42dcc8772e1af4ae115685e60abc2c9b90242167acef3d0be4050bf935eed7c3b6fc7ba77e000000000000000000000000000000000d22c3652d0dc6f0fc9316e14268477c2049ef772e852108d269d9c38dba1d4802e8dae479818184c08f9a569d878451"_hex;

    uint8_t rx[128];
    uint8_t ry[128];

    EXPECT_EQ(bls::g2_add(rx, ry, G2_X.data(), G2_Y.data(), x1.data(), y1.data()),
        evmpre::SUCCESS);

    const auto expected_x =
        "000000000000000000000000000000000b54a8a7b08bd6827ed9a797de216b8c9057b3a9ca93e2f88e7f04f19accc42da90d883632b9ca4dc38d013f71ede4db00000000000000000000000000000000077eba4eecf0bd764dce8ed5f45040dd8f3b3427cb35230509482c14651713282946306247866dfe39a8e33016fcbe52"_hex;
    const auto expected_y =
        "0000000000000000000000000000000014e60a76a29ef85cbd69f251b9f29147b67cfe3ed2823d3f9776b3a0efd2731941d47436dc6d2b58d9e65f8438bad073000000000000000000000000000000001586c3c910d95754fef7a732df78e279c3d37431c6a2b77e67a00c7c130a8fcd4d19f159cbeb997a178108fffffcbd20"_hex;

    EXPECT_EQ(evmc::bytes_view(rx, sizeof rx), expected_x);
    EXPECT_EQ(evmc::bytes_view(ry, sizeof ry), expected_y);
}

TEST(bls, g1msm_single_pair_is_mul)
{
    const auto input = G1_X + G1_Y + scalar(2);
    const auto outcome = evmpre::execute(0x0c_address, input, 12000, EVMC_PRAGUE);
    ASSERT_TRUE(std::holds_alternative<evmpre::Success>(outcome));

    uint8_t expected[128];
    ASSERT_EQ(bls::g1_mul(expected, &expected[64], G1_X.data(), G1_Y.data(), scalar(2).data()),
        evmpre::SUCCESS);
    EXPECT_EQ(evmpre::output(outcome), evmc::bytes_view(expected, sizeof(expected)));
}

TEST(bls, g1msm_sum)
{
    // 1·G + 1·G = 2·G
    const auto input = G1_X + G1_Y + scalar(1) + G1_X + G1_Y + scalar(1);
    const auto outcome = evmpre::execute(0x0c_address, input, 1'000'000, EVMC_PRAGUE);
    ASSERT_TRUE(std::holds_alternative<evmpre::Success>(outcome));
    EXPECT_EQ(evmpre::gas_used(outcome), 2 * 12000 * 949 / 1000);

    uint8_t expected[128];
    ASSERT_EQ(bls::g1_mul(expected, &expected[64], G1_X.data(), G1_Y.data(), scalar(2).data()),
        evmpre::SUCCESS);
    EXPECT_EQ(evmpre::output(outcome), evmc::bytes_view(expected, sizeof(expected)));
}

TEST(bls, g2msm_infinity)
{
    // The point at infinity times any scalar is the point at infinity.
    const auto input = evmc::bytes(256, 0) + scalar(7);
    const auto outcome = evmpre::execute(0x0e_address, input, 1'000'000, EVMC_PRAGUE);
    ASSERT_TRUE(std::holds_alternative<evmpre::Success>(outcome));
    EXPECT_EQ(evmpre::output(outcome), evmc::bytes(256, 0));
}

TEST(bls, pairing_check)
{
    // e(G1, G2) · e(-G1, G2) = 1
    const auto input = G1_X + G1_Y + G2_X + G2_Y + G1_X + negate(G1_Y) + G2_X + G2_Y;
    const auto outcome = evmpre::execute(0x0f_address, input, 1'000'000, EVMC_PRAGUE);
    ASSERT_TRUE(std::holds_alternative<evmpre::Success>(outcome));
    EXPECT_EQ(evmpre::gas_used(outcome), 37700 + 2 * 32600);
    EXPECT_EQ(evmc::hex(evmpre::output(outcome)),
        "0000000000000000000000000000000000000000000000000000000000000001");

    const auto single = evmpre::execute(0x0f_address, G1_X + G1_Y + G2_X + G2_Y, 1'000'000,
        EVMC_PRAGUE);
    EXPECT_EQ(evmc::hex(evmpre::output(single)),
        "0000000000000000000000000000000000000000000000000000000000000000");
}

TEST(bls, invalid_lengths)
{
    const std::pair<evmc::address, size_t> cases[] = {
        {0x0b_address, 255},
        {0x0c_address, 0},
        {0x0c_address, 161},
        {0x0d_address, 511},
        {0x0e_address, 0},
        {0x0f_address, 0},
        {0x0f_address, 383},
        {0x10_address, 63},
        {0x11_address, 129},
    };
    for (const auto& [addr, size] : cases)
    {
        const auto outcome = evmpre::execute(addr, evmc::bytes(size, 0), 1'000'000, EVMC_PRAGUE);
        EXPECT_EQ(evmpre::status(outcome), evmpre::make_error_code(evmpre::INVALID_INPUT_LENGTH))
            << evmc::hex(addr) << " " << size;
        EXPECT_TRUE(evmpre::output(outcome).empty());
    }
}

TEST(bls, map_fp_to_g1_in_subgroup)
{
    // The result of the mapping is a valid G1 input of the scalar multiplication.
    const auto mapped = evmpre::execute(0x10_address, G1_X, 5500, EVMC_PRAGUE);
    ASSERT_TRUE(std::holds_alternative<evmpre::Success>(mapped));
    const auto point = evmc::bytes{evmpre::output(mapped)};
    ASSERT_EQ(point.size(), 128);

    const auto mul = evmpre::execute(0x0c_address, point + scalar(1), 12000, EVMC_PRAGUE);
    ASSERT_TRUE(std::holds_alternative<evmpre::Success>(mul));
    EXPECT_EQ(evmpre::output(mul), point);
}
