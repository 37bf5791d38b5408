// evmpre: Ethereum precompiled contracts execution layer
// Copyright 2025 The evmpre Authors.
// SPDX-License-Identifier: Apache-2.0

#include "codec.hpp"
#include "precompiles_internal.hpp"
#include <evmpre_crypto/bls.hpp>
#include <evmpre_crypto/bn254.hpp>
#include <evmpre_crypto/hash.hpp>
#include <evmpre_crypto/secp256r1.hpp>
#include <evmpre_crypto/silkpre.hpp>
#include <intx/intx.hpp>
#include <algorithm>
#include <cstring>
#include <limits>
#include <memory>
#include <new>

namespace evmpre
{
using evmc::bytes_view;

namespace
{
/// Decodes the G1 point and checks it is on the curve.
ErrorCode validate_bn254_g1(const uint8_t in[codec::bn254::G1_SIZE]) noexcept
{
    const auto p = codec::bn254::decode_g1(in);
    if (!p.has_value())
        return INVALID_FIELD_ELEMENT;
    if (!crypto::bn254::is_on_curve(p->x, p->y))
        return POINT_NOT_ON_CURVE;
    return SUCCESS;
}
}  // namespace

ExecutionResult ecrecover_execute(const uint8_t* input, size_t input_size, uint8_t* output,
    [[maybe_unused]] size_t output_size, crypto::EcrecoverFn* recover) noexcept
{
    const auto in = codec::read_fixed<128>({input, input_size}, 0);

    const auto v = intx::be::unsafe::load<intx::uint256>(&in[32]);
    if (v != 27 && v != 28)
        return {INVALID_SIGNATURE, 0};
    const bool parity = v == 28;

    const auto r = intx::be::unsafe::load<intx::uint256>(&in[64]);
    const auto s = intx::be::unsafe::load<intx::uint256>(&in[96]);
    if (r == 0 || r >= crypto::SECP256K1_ORDER || s == 0 || s >= crypto::SECP256K1_ORDER)
        return {INVALID_SIGNATURE, 0};

    const auto addr = recover(std::span<const uint8_t, 32>{&in[0], 32},
        std::span<const uint8_t, 64>{&in[64], 64}, parity);
    if (!addr.has_value())
        return {INVALID_SIGNATURE, 0};

    std::fill_n(output, 12, uint8_t{0});
    std::memcpy(&output[12], addr->bytes, sizeof(addr->bytes));
    return {SUCCESS, 32};
}

ExecutionResult sha256_execute(const uint8_t* input, size_t input_size, uint8_t* output,
    [[maybe_unused]] size_t output_size) noexcept
{
    if (!crypto::sha256(output, input, input_size))
        return {INVALID_INPUT, 0};
    return {SUCCESS, crypto::SHA256_HASH_SIZE};
}

ExecutionResult ripemd160_execute(const uint8_t* input, size_t input_size, uint8_t* output,
    [[maybe_unused]] size_t output_size) noexcept
{
    static constexpr auto PADDING = codec::WORD_SIZE - crypto::RIPEMD160_HASH_SIZE;
    std::fill_n(output, PADDING, uint8_t{0});
    if (!crypto::ripemd160(&output[PADDING], input, input_size))
        return {INVALID_INPUT, 0};
    return {SUCCESS, codec::WORD_SIZE};
}

ExecutionResult identity_execute(const uint8_t* input, size_t input_size, uint8_t* output,
    [[maybe_unused]] size_t output_size) noexcept
{
    std::copy_n(input, input_size, output);
    return {SUCCESS, input_size};
}

ExecutionResult expmod_execute(const uint8_t* input, size_t input_size, uint8_t* output,
    size_t output_size, crypto::ExpmodFn* expmod, size_t max_operand_size) noexcept
{
    const bytes_view in{input, input_size};
    const auto base_len = codec::load_uint256(in, 0);
    const auto exp_len = codec::load_uint256(in, 32);
    const auto mod_len = codec::load_uint256(in, 64);

    if (base_len > max_operand_size || exp_len > max_operand_size || mod_len > max_operand_size)
        return {INPUT_TOO_LARGE, 0};

    const auto mod_size = static_cast<size_t>(mod_len);
    if (mod_size == 0)
        return {SUCCESS, 0};

    static constexpr auto SIZE_LIMIT = std::numeric_limits<size_t>::max() - EXPMOD_HEADER_SIZE;
    if (base_len + exp_len + mod_len > SIZE_LIMIT || output_size < mod_size)
        return {INPUT_TOO_LARGE, 0};

    const auto base_size = static_cast<size_t>(base_len);
    const auto exp_size = static_cast<size_t>(exp_len);

    // The operands are zero-extended to their declared lengths.
    const std::unique_ptr<uint8_t[]> operands{
        new (std::nothrow) uint8_t[base_size + exp_size + mod_size]};
    if (!operands)
        return {INPUT_TOO_LARGE, 0};
    codec::read_fixed(operands.get(), in, EXPMOD_HEADER_SIZE, base_size + exp_size + mod_size);

    const std::span<const uint8_t> base{operands.get(), base_size};
    const std::span<const uint8_t> exp{&operands[base_size], exp_size};
    const std::span<const uint8_t> mod{&operands[base_size + exp_size], mod_size};

    if (std::ranges::all_of(mod, [](uint8_t b) { return b == 0; }))
    {
        std::fill_n(output, mod_size, uint8_t{0});
        return {SUCCESS, mod_size};
    }

    if (!expmod(base, exp, mod, output))
        return {INPUT_TOO_LARGE, 0};
    return {SUCCESS, mod_size};
}

ExecutionResult ecadd_execute(const uint8_t* input, size_t input_size, uint8_t* output,
    [[maybe_unused]] size_t output_size) noexcept
{
    const auto in = codec::read_fixed<2 * codec::bn254::G1_SIZE>({input, input_size}, 0);

    if (const auto ec = validate_bn254_g1(&in[0]); ec != SUCCESS)
        return {ec, 0};
    if (const auto ec = validate_bn254_g1(&in[codec::bn254::G1_SIZE]); ec != SUCCESS)
        return {ec, 0};

    if (!crypto::silkpre::bn254_add(output, in.data()))
        return {INVALID_POINT, 0};
    return {SUCCESS, codec::bn254::G1_SIZE};
}

ExecutionResult ecmul_execute(const uint8_t* input, size_t input_size, uint8_t* output,
    [[maybe_unused]] size_t output_size) noexcept
{
    const auto in =
        codec::read_fixed<codec::bn254::G1_SIZE + codec::WORD_SIZE>({input, input_size}, 0);

    if (const auto ec = validate_bn254_g1(&in[0]); ec != SUCCESS)
        return {ec, 0};

    if (!crypto::silkpre::bn254_mul(output, in.data()))
        return {INVALID_POINT, 0};
    return {SUCCESS, codec::bn254::G1_SIZE};
}

ExecutionResult ecpairing_execute(const uint8_t* input, size_t input_size, uint8_t* output,
    [[maybe_unused]] size_t output_size, size_t max_input_size) noexcept
{
    static constexpr auto OUTPUT_SIZE = codec::WORD_SIZE;

    if (input_size > max_input_size)
        return {INPUT_TOO_LARGE, 0};
    if (input_size % BN254_PAIR_SIZE != 0)
        return {INVALID_INPUT_LENGTH, 0};

    if (input_size == 0)
    {
        codec::store_bool(output, true);
        return {SUCCESS, OUTPUT_SIZE};
    }

    for (auto ptr = input; ptr != input + input_size; ptr += BN254_PAIR_SIZE)
    {
        if (const auto ec = validate_bn254_g1(ptr); ec != SUCCESS)
            return {ec, 0};
        if (!codec::bn254::decode_g2(&ptr[codec::bn254::G1_SIZE]).has_value())
            return {INVALID_FIELD_ELEMENT, 0};
    }

    // The G2 curve and subgroup checks are done by the pairing itself.
    if (!crypto::silkpre::bn254_pairing_check(output, input, input_size))
        return {INVALID_POINT, 0};
    return {SUCCESS, OUTPUT_SIZE};
}

ExecutionResult blake2bf_execute(const uint8_t* input, size_t input_size, uint8_t* output,
    [[maybe_unused]] size_t output_size) noexcept
{
    if (input_size != BLAKE2BF_INPUT_SIZE)
        return {INVALID_INPUT_LENGTH, 0};

    const auto f = input[BLAKE2BF_INPUT_SIZE - 1];
    if (f != 0 && f != 1) [[unlikely]]
        return {INVALID_FINAL_FLAG, 0};

    if (!crypto::silkpre::blake2bf(output, input))
        return {INVALID_INPUT, 0};
    return {SUCCESS, BLAKE2BF_OUTPUT_SIZE};
}

ExecutionResult point_evaluation_execute(const uint8_t* input, size_t input_size,
    uint8_t* output, [[maybe_unused]] size_t output_size,
    const crypto::KzgVerifier& verifier) noexcept
{
    if (input_size != POINT_EVALUATION_INPUT_SIZE)
        return {INVALID_INPUT_LENGTH, 0};

    const auto versioned_hash = &input[0];
    const auto z = &input[32];
    const auto y = &input[64];
    const auto commitment = &input[96];
    const auto proof = &input[96 + 48];

    uint8_t computed_versioned_hash[crypto::SHA256_HASH_SIZE];
    if (!crypto::sha256(computed_versioned_hash, commitment, 48))
        return {INVALID_INPUT, 0};
    computed_versioned_hash[0] = crypto::VERSIONED_HASH_VERSION_KZG;
    if (!std::equal(std::begin(computed_versioned_hash), std::end(computed_versioned_hash),
            versioned_hash))
        return {INVALID_VERSIONED_HASH, 0};

    if (intx::be::unsafe::load<intx::uint256>(z) >= crypto::BLS_MODULUS ||
        intx::be::unsafe::load<intx::uint256>(y) >= crypto::BLS_MODULUS)
        return {INVALID_FIELD_ELEMENT, 0};

    if (const auto ec = verifier.verify_proof(z, y, commitment, proof); ec != SUCCESS)
        return {ec, 0};

    // Return FIELD_ELEMENTS_PER_BLOB and BLS_MODULUS as padded 32 byte big endian values
    // as required by the EIP-4844.
    intx::be::unsafe::store(output, crypto::FIELD_ELEMENTS_PER_BLOB);
    intx::be::unsafe::store(output + 32, crypto::BLS_MODULUS);
    return {SUCCESS, 64};
}

ExecutionResult bls12_g1add_execute(const uint8_t* input, size_t input_size, uint8_t* output,
    [[maybe_unused]] size_t output_size) noexcept
{
    if (input_size != 2 * BLS12_G1_POINT_SIZE)
        return {INVALID_INPUT_LENGTH, 0};

    if (const auto ec =
            crypto::bls::g1_add(output, &output[64], input, &input[64], &input[128], &input[192]);
        ec != SUCCESS)
        return {ec, 0};

    return {SUCCESS, BLS12_G1_POINT_SIZE};
}

ExecutionResult bls12_g1msm_execute(const uint8_t* input, size_t input_size, uint8_t* output,
    [[maybe_unused]] size_t output_size, size_t max_input_size) noexcept
{
    if (input_size > max_input_size)
        return {INPUT_TOO_LARGE, 0};
    if (input_size == 0 || input_size % BLS12_G1_MUL_INPUT_SIZE != 0)
        return {INVALID_INPUT_LENGTH, 0};

    // A single pair is the plain scalar multiplication.
    const auto ec =
        input_size == BLS12_G1_MUL_INPUT_SIZE ?
            crypto::bls::g1_mul(output, &output[64], input, &input[64], &input[128]) :
            crypto::bls::g1_msm(output, &output[64], input, input_size);
    if (ec != SUCCESS)
        return {ec, 0};

    return {SUCCESS, BLS12_G1_POINT_SIZE};
}

ExecutionResult bls12_g2add_execute(const uint8_t* input, size_t input_size, uint8_t* output,
    [[maybe_unused]] size_t output_size) noexcept
{
    if (input_size != 2 * BLS12_G2_POINT_SIZE)
        return {INVALID_INPUT_LENGTH, 0};

    if (const auto ec = crypto::bls::g2_add(
            output, &output[128], input, &input[128], &input[256], &input[384]);
        ec != SUCCESS)
        return {ec, 0};

    return {SUCCESS, BLS12_G2_POINT_SIZE};
}

ExecutionResult bls12_g2msm_execute(const uint8_t* input, size_t input_size, uint8_t* output,
    [[maybe_unused]] size_t output_size, size_t max_input_size) noexcept
{
    if (input_size > max_input_size)
        return {INPUT_TOO_LARGE, 0};
    if (input_size == 0 || input_size % BLS12_G2_MUL_INPUT_SIZE != 0)
        return {INVALID_INPUT_LENGTH, 0};

    const auto ec =
        input_size == BLS12_G2_MUL_INPUT_SIZE ?
            crypto::bls::g2_mul(output, &output[128], input, &input[128], &input[256]) :
            crypto::bls::g2_msm(output, &output[128], input, input_size);
    if (ec != SUCCESS)
        return {ec, 0};

    return {SUCCESS, BLS12_G2_POINT_SIZE};
}

ExecutionResult bls12_pairing_check_execute(const uint8_t* input, size_t input_size,
    uint8_t* output, [[maybe_unused]] size_t output_size, size_t max_input_size) noexcept
{
    if (input_size > max_input_size)
        return {INPUT_TOO_LARGE, 0};
    if (input_size == 0 || input_size % BLS12_PAIR_SIZE != 0)
        return {INVALID_INPUT_LENGTH, 0};

    if (const auto ec = crypto::bls::pairing_check(output, input, input_size); ec != SUCCESS)
        return {ec, 0};

    return {SUCCESS, codec::WORD_SIZE};
}

ExecutionResult bls12_map_fp_to_g1_execute(const uint8_t* input, size_t input_size,
    uint8_t* output, [[maybe_unused]] size_t output_size) noexcept
{
    if (input_size != BLS12_FIELD_ELEMENT_SIZE)
        return {INVALID_INPUT_LENGTH, 0};

    if (const auto ec = crypto::bls::map_fp_to_g1(output, &output[64], input); ec != SUCCESS)
        return {ec, 0};

    return {SUCCESS, BLS12_G1_POINT_SIZE};
}

ExecutionResult bls12_map_fp2_to_g2_execute(const uint8_t* input, size_t input_size,
    uint8_t* output, [[maybe_unused]] size_t output_size) noexcept
{
    if (input_size != 2 * BLS12_FIELD_ELEMENT_SIZE)
        return {INVALID_INPUT_LENGTH, 0};

    if (const auto ec = crypto::bls::map_fp2_to_g2(output, &output[128], input); ec != SUCCESS)
        return {ec, 0};

    return {SUCCESS, BLS12_G2_POINT_SIZE};
}

ExecutionResult p256verify_execute(const uint8_t* input, size_t input_size, uint8_t* output,
    [[maybe_unused]] size_t output_size) noexcept
{
    if (input_size != P256VERIFY_INPUT_SIZE)
        return {INVALID_INPUT_LENGTH, 0};

    const auto r = intx::be::unsafe::load<intx::uint256>(&input[32]);
    const auto s = intx::be::unsafe::load<intx::uint256>(&input[64]);
    const auto qx = intx::be::unsafe::load<intx::uint256>(&input[96]);
    const auto qy = intx::be::unsafe::load<intx::uint256>(&input[128]);

    if (const auto ec = crypto::secp256r1::verify(input, r, s, qx, qy); ec != SUCCESS)
        return {ec, 0};

    codec::store_bool(output, true);
    return {SUCCESS, codec::WORD_SIZE};
}
}  // namespace evmpre
