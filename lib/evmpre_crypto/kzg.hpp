// evmpre: Ethereum precompiled contracts execution layer
// Copyright 2025 The evmpre Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <evmpre/errors.hpp>
#include <intx/intx.hpp>
#include <filesystem>
#include <memory>

namespace evmpre::crypto
{
using namespace intx::literals;

/// The KZG version number of the versioned hash.
inline constexpr uint8_t VERSIONED_HASH_VERSION_KZG = 0x01;

/// An EIP-4844 parameter.
inline constexpr auto FIELD_ELEMENTS_PER_BLOB = 4096_u256;

/// Scalar field modulus of BLS12-381.
inline constexpr auto BLS_MODULUS =
    52435875175126190479447740508185965837690552500527637822603658699938581184513_u256;

/// Number of significant bits of the BLS_MODULUS.
inline constexpr size_t BLS_MODULUS_BITS = 255;
static_assert((BLS_MODULUS >> BLS_MODULUS_BITS) == 0);

/// The KZG proof verification backend.
///
/// Verifies that the polynomial committed to evaluates to y at z.
/// Implementations are immutable after construction and can be shared between threads.
class KzgVerifier
{
public:
    virtual ~KzgVerifier() = default;

    /// @param z           The evaluation point, big-endian, less than BLS_MODULUS.
    /// @param y           The claimed evaluation, big-endian, less than BLS_MODULUS.
    /// @param commitment  The compressed G1 commitment.
    /// @param proof       The compressed G1 proof.
    /// @return SUCCESS, INVALID_FIELD_ELEMENT, INVALID_POINT or VERIFICATION_FAILED.
    [[nodiscard]] virtual ErrorCode verify_proof(const uint8_t z[32], const uint8_t y[32],
        const uint8_t commitment[48], const uint8_t proof[48]) const noexcept = 0;
};

/// Creates the blst-based verifier using the built-in [s]₂ point of the Ethereum trusted setup.
std::unique_ptr<KzgVerifier> create_blst_kzg_verifier();

/// Creates the c-kzg-4844 verifier loading the trusted setup file.
///
/// @throws std::runtime_error if the file cannot be opened or is not a valid trusted setup.
std::unique_ptr<KzgVerifier> create_ckzg_verifier(const std::filesystem::path& trusted_setup);
}  // namespace evmpre::crypto
