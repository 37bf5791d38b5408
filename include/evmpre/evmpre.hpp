// evmpre: Ethereum precompiled contracts execution layer
// Copyright 2025 The evmpre Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <evmc/evmc.hpp>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string_view>
#include <system_error>
#include <variant>

namespace evmpre
{
class ActivationTable;
class Tracer;

/// The successful precompile call.
struct Success
{
    evmc::bytes output;
    uint64_t gas_used = 0;

    friend bool operator==(const Success&, const Success&) = default;
};

/// The precompile rejected the input or the gas limit was too low. The output is empty.
struct Error
{
    std::error_code kind;
    uint64_t gas_used = 0;

    friend bool operator==(const Error&, const Error&) = default;
};

/// The caller misused the precompile layer, e.g. called an address which is not a precompile
/// in the active revision. Nothing is charged.
struct Fatal
{
    std::error_code kind;

    friend bool operator==(const Fatal&, const Fatal&) = default;
};

/// The outcome of a precompile call.
using Outcome = std::variant<Success, Error, Fatal>;

/// Returns the gas charged by the call (0 for Fatal).
uint64_t gas_used(const Outcome& outcome) noexcept;

/// Returns the call output (empty unless Success).
evmc::bytes_view output(const Outcome& outcome) noexcept;

/// Returns the failure kind, evmpre::SUCCESS for Success.
std::error_code status(const Outcome& outcome) noexcept;

/// The secp256k1 public key recovery backend for ECRECOVER.
enum class Secp256k1Backend
{
    libsecp256k1,
    silkpre,
};

/// The KZG proof verification backend for the point evaluation precompile.
enum class KzgBackend
{
    blst,
    ckzg,
};

/// The modular exponentiation backend.
enum class ExpmodBackend
{
    gmp,
    openssl,
};

/// The precompile layer configuration: backends and feature toggles.
struct Config
{
    /// The revision used by the tools when none is given explicitly.
    evmc_revision revision = EVMC_LATEST_STABLE_REVISION;

    Secp256k1Backend secp256k1 = Secp256k1Backend::libsecp256k1;

    KzgBackend kzg = KzgBackend::blst;

    /// The trusted setup file. Required by KzgBackend::ckzg.
    std::filesystem::path kzg_trusted_setup;

    ExpmodBackend expmod = ExpmodBackend::gmp;

    /// Enables P256VERIFY (RIP-7212) in revisions that do not have it.
    bool p256verify = false;

    /// The optional upper bound of the BN254 pairing input size.
    std::optional<size_t> ecpairing_max_input_size;

    /// The optional upper bounds of the BLS12-381 MSM and pairing check input sizes.
    std::optional<size_t> bls12_g1msm_max_input_size;
    std::optional<size_t> bls12_g2msm_max_input_size;
    std::optional<size_t> bls12_pairing_check_max_input_size;
};

/// Translates the hardfork name to EVM revision.
///
/// @throws std::invalid_argument for unknown names.
evmc_revision to_revision(std::string_view name);

/// Loads the Config from the JSON document.
///
/// All keys are optional: "fork", "secp256k1", "kzg", "kzg_trusted_setup", "expmod",
/// "p256verify", "ecpairing_max_input_size", "bls12_g1msm_max_input_size",
/// "bls12_g2msm_max_input_size", "bls12_pairing_check_max_input_size".
///
/// @throws std::invalid_argument for unknown enumerator values or keys of wrong type.
Config load_config(std::istream& in);

/// Builds the activation table for the revision.
///
/// @throws std::invalid_argument if the revision is out of range.
/// @throws std::runtime_error if a configured backend cannot be initialized.
std::shared_ptr<const ActivationTable> make_activation_table(
    evmc_revision rev, const Config& config = {});

/// Returns the process-wide activation table for the revision built with the default Config.
///
/// @throws std::invalid_argument if the revision is out of range.
const ActivationTable& default_activation_table(evmc_revision rev);

/// Checks if the address is a precompile in the table.
bool is_precompile(const ActivationTable& table, const evmc::address& addr) noexcept;

/// Calls the precompile at the address.
///
/// The precompile runs only if the gas limit covers its cost. The optional tracer is notified
/// about calls of active precompiles.
Outcome call(const ActivationTable& table, const evmc::address& addr, evmc::bytes_view input,
    uint64_t gas_limit, Tracer* tracer = nullptr) noexcept;

/// Calls the precompile at the address using the default activation table of the revision.
///
/// @throws std::invalid_argument if the revision is out of range.
Outcome execute(
    const evmc::address& addr, evmc::bytes_view input, uint64_t gas_limit, evmc_revision rev);

/// Executes the EVMC message to a precompile (msg.code_address).
///
/// Success maps to EVMC_SUCCESS, out of gas to EVMC_OUT_OF_GAS, other failures to
/// EVMC_PRECOMPILE_FAILURE and a non-precompile address to EVMC_REJECTED.
///
/// A signature rejected by ECREC or P256VERIFY is a failure as well: EVMC_PRECOMPILE_FAILURE
/// with gas_left 0 and no output. The EVM returns the empty output with the success status
/// for these (see EIP-7951), hosts needing this should use call() and handle INVALID_SIGNATURE.
evmc::Result call_precompile(const ActivationTable& table, const evmc_message& msg) noexcept;
}  // namespace evmpre
