// evmpre: Ethereum precompiled contracts execution layer
// Copyright 2025 The evmpre Authors.
// SPDX-License-Identifier: Apache-2.0

#include "activation_table.hpp"
#include <array>
#include <limits>
#include <map>
#include <new>
#include <stdexcept>
#include <string>

namespace evmpre
{
using evmc::bytes_view;

Outcome PrecompileSpec::run(bytes_view input, uint64_t gas_limit) const noexcept
{
    const auto [gas_cost, max_output_size] = m_analyze(input);
    if (gas_limit < gas_cost)
        return Error{make_error_code(OUT_OF_GAS), gas_limit};

    evmc::bytes output;
    if (max_output_size > output.max_size())
        return Error{make_error_code(INPUT_TOO_LARGE), gas_cost};
    try
    {
        output.resize(max_output_size);
    }
    catch (const std::bad_alloc&)
    {
        return Error{make_error_code(INPUT_TOO_LARGE), gas_cost};
    }

    const auto [status, output_size] =
        m_execute(input.data(), input.size(), output.data(), output.size());
    if (status != SUCCESS)
        return Error{make_error_code(status), gas_cost};

    output.resize(output_size);
    return Success{std::move(output), gas_cost};
}

ActivationTable::ActivationTable(evmc_revision rev, std::vector<PrecompileSpec> specs)
  : m_rev{rev}, m_specs{std::move(specs)}
{
    m_index.reserve(m_specs.size());
    for (size_t i = 0; i < m_specs.size(); ++i)
    {
        if (i != 0 && !(m_specs[i - 1].address() < m_specs[i].address()))
            throw std::invalid_argument{"precompiles must be sorted by unique addresses"};
        m_index.emplace(m_specs[i].address(), i);
    }
}

namespace
{
/// The backends and parameters resolved from the Config.
struct Backends
{
    crypto::EcrecoverFn* ecrecover = nullptr;
    crypto::ExpmodFn* expmod = nullptr;
    size_t ecpairing_max_input_size = std::numeric_limits<size_t>::max();
    size_t bls12_g1msm_max_input_size = std::numeric_limits<size_t>::max();
    size_t bls12_g2msm_max_input_size = std::numeric_limits<size_t>::max();
    size_t bls12_pairing_check_max_input_size = std::numeric_limits<size_t>::max();
    KzgBackend kzg = KzgBackend::blst;
    std::filesystem::path kzg_trusted_setup;

    /// Created by the upgrade introducing the point evaluation.
    std::shared_ptr<const crypto::KzgVerifier> kzg_verifier;

    explicit Backends(const Config& config)
      : kzg{config.kzg}, kzg_trusted_setup{config.kzg_trusted_setup}
    {
        switch (config.secp256k1)
        {
        case Secp256k1Backend::libsecp256k1:
            ecrecover = crypto::ecrecover_libsecp256k1;
            break;
        case Secp256k1Backend::silkpre:
            ecrecover = crypto::ecrecover_silkpre;
            break;
        }

        switch (config.expmod)
        {
        case ExpmodBackend::gmp:
            expmod = crypto::expmod_gmp;
            break;
        case ExpmodBackend::openssl:
            expmod = crypto::expmod_openssl;
            break;
        }

        if (ecrecover == nullptr || expmod == nullptr)
            throw std::invalid_argument{"invalid backend configuration"};

        ecpairing_max_input_size =
            config.ecpairing_max_input_size.value_or(ecpairing_max_input_size);
        bls12_g1msm_max_input_size =
            config.bls12_g1msm_max_input_size.value_or(bls12_g1msm_max_input_size);
        bls12_g2msm_max_input_size =
            config.bls12_g2msm_max_input_size.value_or(bls12_g2msm_max_input_size);
        bls12_pairing_check_max_input_size = config.bls12_pairing_check_max_input_size.value_or(
            bls12_pairing_check_max_input_size);
    }
};

/// The mutable set of precompiles the upgrades are applied to.
class TableBuilder
{
    std::map<evmc::address, PrecompileSpec> m_specs;

    PrecompileSpec& get(PrecompileId id)
    {
        const auto it = m_specs.find(address_of(id));
        if (it == m_specs.end())
            throw std::logic_error{std::string{"upgrade of inactive precompile "} + get_name(id)};
        return it->second;
    }

public:
    void add(PrecompileId id, gas::AnalyzeFn* analyze, ExecuteFn execute)
    {
        m_specs.insert_or_assign(address_of(id), PrecompileSpec{id, analyze, std::move(execute)});
    }

    void replace_cost(PrecompileId id, gas::AnalyzeFn* analyze)
    {
        auto& spec = get(id);
        spec = spec.with_cost(analyze);
    }

    void replace_execute(PrecompileId id, ExecuteFn execute)
    {
        auto& spec = get(id);
        spec = spec.with_execute(std::move(execute));
    }

    [[nodiscard]] bool contains(PrecompileId id) const { return m_specs.contains(address_of(id)); }

    [[nodiscard]] std::vector<PrecompileSpec> build() const
    {
        std::vector<PrecompileSpec> specs;
        specs.reserve(m_specs.size());
        for (const auto& [addr, spec] : m_specs)
            specs.emplace_back(spec);
        return specs;
    }
};

/// Binds the input size limit to the adapter of the variable-length input precompile.
template <ExecutionResult (*Execute)(const uint8_t*, size_t, uint8_t*, size_t, size_t) noexcept>
ExecuteFn bind_max_input_size(size_t max_input_size)
{
    return [max_input_size](const uint8_t* input, size_t input_size, uint8_t* output,
               size_t output_size) noexcept {
        return Execute(input, input_size, output, output_size, max_input_size);
    };
}

ExecuteFn bind_expmod(crypto::ExpmodFn* expmod, size_t max_operand_size)
{
    return [expmod, max_operand_size](const uint8_t* input, size_t input_size, uint8_t* output,
               size_t output_size) noexcept {
        return expmod_execute(input, input_size, output, output_size, expmod, max_operand_size);
    };
}

void frontier(TableBuilder& t, Backends& b)
{
    t.add(PrecompileId::ecrecover, gas::ecrecover_analyze,
        [recover = b.ecrecover](const uint8_t* input, size_t input_size, uint8_t* output,
            size_t output_size) noexcept {
            return ecrecover_execute(input, input_size, output, output_size, recover);
        });
    t.add(PrecompileId::sha256, gas::sha256_analyze, sha256_execute);
    t.add(PrecompileId::ripemd160, gas::ripemd160_analyze, ripemd160_execute);
    t.add(PrecompileId::identity, gas::identity_analyze, identity_execute);
}

void byzantium(TableBuilder& t, Backends& b)
{
    t.add(PrecompileId::expmod, gas::expmod_analyze_eip198,
        bind_expmod(b.expmod, std::numeric_limits<size_t>::max()));
    t.add(PrecompileId::ecadd, gas::ecadd_analyze_byzantium, ecadd_execute);
    t.add(PrecompileId::ecmul, gas::ecmul_analyze_byzantium, ecmul_execute);
    t.add(PrecompileId::ecpairing, gas::ecpairing_analyze_byzantium,
        bind_max_input_size<ecpairing_execute>(b.ecpairing_max_input_size));
}

void istanbul(TableBuilder& t, Backends& /*b*/)
{
    t.replace_cost(PrecompileId::ecadd, gas::ecadd_analyze_istanbul);
    t.replace_cost(PrecompileId::ecmul, gas::ecmul_analyze_istanbul);
    t.replace_cost(PrecompileId::ecpairing, gas::ecpairing_analyze_istanbul);
    t.add(PrecompileId::blake2bf, gas::blake2bf_analyze, blake2bf_execute);
}

void berlin(TableBuilder& t, Backends& /*b*/)
{
    t.replace_cost(PrecompileId::expmod, gas::expmod_analyze_eip2565);
}

void cancun(TableBuilder& t, Backends& b)
{
    if (!b.kzg_verifier)
    {
        b.kzg_verifier = b.kzg == KzgBackend::ckzg ?
                             crypto::create_ckzg_verifier(b.kzg_trusted_setup) :
                             crypto::create_blst_kzg_verifier();
    }

    t.add(PrecompileId::point_evaluation, gas::point_evaluation_analyze,
        [verifier = b.kzg_verifier](const uint8_t* input, size_t input_size, uint8_t* output,
            size_t output_size) noexcept {
            return point_evaluation_execute(input, input_size, output, output_size, *verifier);
        });
}

void prague(TableBuilder& t, Backends& b)
{
    t.add(PrecompileId::bls12_g1add, gas::bls12_g1add_analyze, bls12_g1add_execute);
    t.add(PrecompileId::bls12_g1msm, gas::bls12_g1msm_analyze,
        bind_max_input_size<bls12_g1msm_execute>(b.bls12_g1msm_max_input_size));
    t.add(PrecompileId::bls12_g2add, gas::bls12_g2add_analyze, bls12_g2add_execute);
    t.add(PrecompileId::bls12_g2msm, gas::bls12_g2msm_analyze,
        bind_max_input_size<bls12_g2msm_execute>(b.bls12_g2msm_max_input_size));
    t.add(PrecompileId::bls12_pairing_check, gas::bls12_pairing_check_analyze,
        bind_max_input_size<bls12_pairing_check_execute>(b.bls12_pairing_check_max_input_size));
    t.add(PrecompileId::bls12_map_fp_to_g1, gas::bls12_map_fp_to_g1_analyze,
        bls12_map_fp_to_g1_execute);
    t.add(PrecompileId::bls12_map_fp2_to_g2, gas::bls12_map_fp2_to_g2_analyze,
        bls12_map_fp2_to_g2_execute);
}

void osaka(TableBuilder& t, Backends& b)
{
    t.replace_cost(PrecompileId::expmod, gas::expmod_analyze_eip7883);
    t.replace_execute(
        PrecompileId::expmod, bind_expmod(b.expmod, EXPMOD_MAX_OPERAND_SIZE_EIP7823));
    t.add(PrecompileId::p256verify, gas::p256verify_analyze_eip7951, p256verify_execute);
}

struct Upgrade
{
    evmc_revision rev;
    void (*apply)(TableBuilder&, Backends&);
};

/// The upgrades changing the precompile set, in activation order.
constexpr Upgrade upgrades[] = {
    {EVMC_FRONTIER, frontier},
    {EVMC_BYZANTIUM, byzantium},
    {EVMC_ISTANBUL, istanbul},
    {EVMC_BERLIN, berlin},
    {EVMC_CANCUN, cancun},
    {EVMC_PRAGUE, prague},
    {EVMC_OSAKA, osaka},
};

void check_revision(evmc_revision rev)
{
    if (rev < EVMC_FRONTIER || rev > EVMC_MAX_REVISION)
        throw std::invalid_argument{"revision out of range: " + std::to_string(rev)};
}
}  // namespace

std::shared_ptr<const ActivationTable> make_activation_table(
    evmc_revision rev, const Config& config)
{
    check_revision(rev);

    Backends backends{config};
    TableBuilder builder;
    for (const auto& upgrade : upgrades)
    {
        if (upgrade.rev <= rev)
            upgrade.apply(builder, backends);
    }

    if (config.p256verify && !builder.contains(PrecompileId::p256verify))
    {
        builder.add(
            PrecompileId::p256verify, gas::p256verify_analyze_rip7212, p256verify_execute);
    }

    return std::make_shared<const ActivationTable>(rev, builder.build());
}

const ActivationTable& default_activation_table(evmc_revision rev)
{
    check_revision(rev);

    static const auto tables = [] {
        std::array<std::shared_ptr<const ActivationTable>, EVMC_MAX_REVISION + 1> t;
        for (size_t i = 0; i < t.size(); ++i)
            t[i] = make_activation_table(static_cast<evmc_revision>(i));
        return t;
    }();
    return *tables[static_cast<size_t>(rev)];
}
}  // namespace evmpre
