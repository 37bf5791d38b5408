// evmpre: Ethereum precompiled contracts execution layer
// Copyright 2025 The evmpre Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <evmc/evmc.hpp>
#include <cstdint>
#include <limits>

/// The precompiles gas model.
///
/// Every function is a pure function of the input. Formulas which changed between revisions
/// have one function per variant; the activation table picks the right one for a revision.
namespace evmpre::gas
{
/// The cost returned when the cost computation overflows. No gas limit can cover it.
inline constexpr auto GasCostMax = std::numeric_limits<uint64_t>::max();

struct PrecompileAnalysis
{
    uint64_t gas_cost;
    size_t max_output_size;
};

/// The signature of the cost function.
using AnalyzeFn = PrecompileAnalysis(evmc::bytes_view input) noexcept;

PrecompileAnalysis ecrecover_analyze(evmc::bytes_view input) noexcept;
PrecompileAnalysis sha256_analyze(evmc::bytes_view input) noexcept;
PrecompileAnalysis ripemd160_analyze(evmc::bytes_view input) noexcept;
PrecompileAnalysis identity_analyze(evmc::bytes_view input) noexcept;

/// EIP-198 pricing of the expmod (Byzantium).
PrecompileAnalysis expmod_analyze_eip198(evmc::bytes_view input) noexcept;

/// EIP-2565 pricing of the expmod (Berlin).
PrecompileAnalysis expmod_analyze_eip2565(evmc::bytes_view input) noexcept;

/// EIP-7883 pricing of the expmod (Osaka).
PrecompileAnalysis expmod_analyze_eip7883(evmc::bytes_view input) noexcept;

/// BN254 precompiles pricing introduced in Byzantium by EIP-196 and EIP-197.
PrecompileAnalysis ecadd_analyze_byzantium(evmc::bytes_view input) noexcept;
PrecompileAnalysis ecmul_analyze_byzantium(evmc::bytes_view input) noexcept;
PrecompileAnalysis ecpairing_analyze_byzantium(evmc::bytes_view input) noexcept;

/// BN254 precompiles repricing of EIP-1108 (Istanbul).
PrecompileAnalysis ecadd_analyze_istanbul(evmc::bytes_view input) noexcept;
PrecompileAnalysis ecmul_analyze_istanbul(evmc::bytes_view input) noexcept;
PrecompileAnalysis ecpairing_analyze_istanbul(evmc::bytes_view input) noexcept;

PrecompileAnalysis blake2bf_analyze(evmc::bytes_view input) noexcept;
PrecompileAnalysis point_evaluation_analyze(evmc::bytes_view input) noexcept;
PrecompileAnalysis bls12_g1add_analyze(evmc::bytes_view input) noexcept;
PrecompileAnalysis bls12_g1msm_analyze(evmc::bytes_view input) noexcept;
PrecompileAnalysis bls12_g2add_analyze(evmc::bytes_view input) noexcept;
PrecompileAnalysis bls12_g2msm_analyze(evmc::bytes_view input) noexcept;
PrecompileAnalysis bls12_pairing_check_analyze(evmc::bytes_view input) noexcept;
PrecompileAnalysis bls12_map_fp_to_g1_analyze(evmc::bytes_view input) noexcept;
PrecompileAnalysis bls12_map_fp2_to_g2_analyze(evmc::bytes_view input) noexcept;

/// P256VERIFY pricing of RIP-7212 (used by L2 chains).
PrecompileAnalysis p256verify_analyze_rip7212(evmc::bytes_view input) noexcept;

/// P256VERIFY pricing of EIP-7951 (Osaka).
PrecompileAnalysis p256verify_analyze_eip7951(evmc::bytes_view input) noexcept;

/// The EIP-2537 MSM discount (in ‰) for the given number of pairs k.
/// For k above the table size the last entry applies, k = 0 is treated as 1.
uint64_t bls12_g1msm_discount(size_t k) noexcept;
uint64_t bls12_g2msm_discount(size_t k) noexcept;
}  // namespace evmpre::gas
