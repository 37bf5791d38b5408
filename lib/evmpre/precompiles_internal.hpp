// evmpre: Ethereum precompiled contracts execution layer
// Copyright 2025 The evmpre Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "errors.hpp"
#include <evmpre_crypto/kzg.hpp>
#include <evmpre_crypto/modexp.hpp>
#include <evmpre_crypto/secp256k1.hpp>
#include <cstddef>
#include <cstdint>

namespace evmpre
{
inline constexpr size_t EXPMOD_HEADER_SIZE = 3 * 32;

/// The EIP-7823 upper bound of each of the expmod operand lengths.
inline constexpr size_t EXPMOD_MAX_OPERAND_SIZE_EIP7823 = 1024;

inline constexpr size_t BN254_PAIR_SIZE = 192;

inline constexpr size_t BLAKE2BF_INPUT_SIZE = 213;
inline constexpr size_t BLAKE2BF_OUTPUT_SIZE = 64;

inline constexpr size_t POINT_EVALUATION_INPUT_SIZE = 192;

inline constexpr size_t BLS12_SCALAR_SIZE = 32;
inline constexpr size_t BLS12_FIELD_ELEMENT_SIZE = 64;
inline constexpr size_t BLS12_G1_POINT_SIZE = 2 * BLS12_FIELD_ELEMENT_SIZE;
inline constexpr size_t BLS12_G2_POINT_SIZE = 4 * BLS12_FIELD_ELEMENT_SIZE;
inline constexpr size_t BLS12_G1_MUL_INPUT_SIZE = BLS12_G1_POINT_SIZE + BLS12_SCALAR_SIZE;
inline constexpr size_t BLS12_G2_MUL_INPUT_SIZE = BLS12_G2_POINT_SIZE + BLS12_SCALAR_SIZE;
inline constexpr size_t BLS12_PAIR_SIZE = BLS12_G1_POINT_SIZE + BLS12_G2_POINT_SIZE;

inline constexpr size_t P256VERIFY_INPUT_SIZE = 160;

/// The result of the primitive execution.
struct ExecutionResult
{
    ErrorCode status;
    size_t output_size;
};

/// The primitive adapters.
///
/// The output buffer has at least the max_output_size reported by the cost analysis of the input.
/// The adapters never throw: every rejected input is reported as the status.

ExecutionResult ecrecover_execute(const uint8_t* input, size_t input_size, uint8_t* output,
    size_t output_size, crypto::EcrecoverFn* recover) noexcept;
ExecutionResult sha256_execute(
    const uint8_t* input, size_t input_size, uint8_t* output, size_t output_size) noexcept;
ExecutionResult ripemd160_execute(
    const uint8_t* input, size_t input_size, uint8_t* output, size_t output_size) noexcept;
ExecutionResult identity_execute(
    const uint8_t* input, size_t input_size, uint8_t* output, size_t output_size) noexcept;

/// The expmod adapter.
///
/// @param max_operand_size  The upper bound of the base, exponent and modulus lengths.
ExecutionResult expmod_execute(const uint8_t* input, size_t input_size, uint8_t* output,
    size_t output_size, crypto::ExpmodFn* expmod, size_t max_operand_size) noexcept;

ExecutionResult ecadd_execute(
    const uint8_t* input, size_t input_size, uint8_t* output, size_t output_size) noexcept;
ExecutionResult ecmul_execute(
    const uint8_t* input, size_t input_size, uint8_t* output, size_t output_size) noexcept;

/// The BN254 pairing check adapter.
///
/// @param max_input_size  The upper bound of the input size.
ExecutionResult ecpairing_execute(const uint8_t* input, size_t input_size, uint8_t* output,
    size_t output_size, size_t max_input_size) noexcept;

ExecutionResult blake2bf_execute(
    const uint8_t* input, size_t input_size, uint8_t* output, size_t output_size) noexcept;
ExecutionResult point_evaluation_execute(const uint8_t* input, size_t input_size,
    uint8_t* output, size_t output_size, const crypto::KzgVerifier& verifier) noexcept;
ExecutionResult bls12_g1add_execute(
    const uint8_t* input, size_t input_size, uint8_t* output, size_t output_size) noexcept;
ExecutionResult bls12_g2add_execute(
    const uint8_t* input, size_t input_size, uint8_t* output, size_t output_size) noexcept;

/// The BLS12-381 MSM and pairing check adapters.
///
/// @param max_input_size  The upper bound of the input size.
ExecutionResult bls12_g1msm_execute(const uint8_t* input, size_t input_size, uint8_t* output,
    size_t output_size, size_t max_input_size) noexcept;
ExecutionResult bls12_g2msm_execute(const uint8_t* input, size_t input_size, uint8_t* output,
    size_t output_size, size_t max_input_size) noexcept;
ExecutionResult bls12_pairing_check_execute(const uint8_t* input, size_t input_size,
    uint8_t* output, size_t output_size, size_t max_input_size) noexcept;

ExecutionResult bls12_map_fp_to_g1_execute(
    const uint8_t* input, size_t input_size, uint8_t* output, size_t output_size) noexcept;
ExecutionResult bls12_map_fp2_to_g2_execute(
    const uint8_t* input, size_t input_size, uint8_t* output, size_t output_size) noexcept;
ExecutionResult p256verify_execute(
    const uint8_t* input, size_t input_size, uint8_t* output, size_t output_size) noexcept;
}  // namespace evmpre
