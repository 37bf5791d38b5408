// evmpre: Ethereum precompiled contracts execution layer
// Copyright 2025 The evmpre Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "gas.hpp"
#include "precompile_id.hpp"
#include "precompiles_internal.hpp"
#include <evmpre/evmpre.hpp>
#include <functional>
#include <unordered_map>
#include <vector>

namespace evmpre
{
/// The primitive bound to its backends.
using ExecuteFn = std::function<ExecutionResult(
    const uint8_t* input, size_t input_size, uint8_t* output, size_t output_size)>;

/// The precompile as active in a revision: the address, the cost formula and the primitive.
class PrecompileSpec
{
    PrecompileId m_id;
    evmc::address m_address;
    gas::AnalyzeFn* m_analyze;
    ExecuteFn m_execute;

public:
    PrecompileSpec(PrecompileId id, gas::AnalyzeFn* analyze, ExecuteFn execute) noexcept
      : m_id{id}, m_address{address_of(id)}, m_analyze{analyze}, m_execute{std::move(execute)}
    {}

    [[nodiscard]] PrecompileId id() const noexcept { return m_id; }

    [[nodiscard]] const evmc::address& address() const noexcept { return m_address; }

    [[nodiscard]] const char* name() const noexcept { return get_name(m_id); }

    /// Returns the cost analysis of the input.
    [[nodiscard]] gas::PrecompileAnalysis analyze(evmc::bytes_view input) const noexcept
    {
        return m_analyze(input);
    }

    /// Returns the gas cost of the call with the input.
    [[nodiscard]] uint64_t required_gas(evmc::bytes_view input) const noexcept
    {
        return m_analyze(input).gas_cost;
    }

    /// Runs the precompile.
    ///
    /// Checks the gas limit before the primitive is executed.
    /// Charges the whole gas limit if it does not cover the cost.
    [[nodiscard]] Outcome run(evmc::bytes_view input, uint64_t gas_limit) const noexcept;

    /// Returns the copy of the precompile with the replaced cost formula.
    [[nodiscard]] PrecompileSpec with_cost(gas::AnalyzeFn* analyze) const
    {
        return {m_id, analyze, m_execute};
    }

    /// Returns the copy of the precompile with the replaced primitive.
    [[nodiscard]] PrecompileSpec with_execute(ExecuteFn execute) const
    {
        return {m_id, m_analyze, std::move(execute)};
    }
};

/// The immutable set of precompiles active in one revision, ordered by address.
class ActivationTable
{
    evmc_revision m_rev;
    std::vector<PrecompileSpec> m_specs;
    std::unordered_map<evmc::address, size_t> m_index;

public:
    /// @param specs  The precompiles with unique addresses, sorted by address.
    ActivationTable(evmc_revision rev, std::vector<PrecompileSpec> specs);

    [[nodiscard]] evmc_revision revision() const noexcept { return m_rev; }

    /// Returns the precompile at the address or null.
    [[nodiscard]] const PrecompileSpec* find(const evmc::address& addr) const noexcept
    {
        const auto it = m_index.find(addr);
        return it != m_index.end() ? &m_specs[it->second] : nullptr;
    }

    [[nodiscard]] bool contains(const evmc::address& addr) const noexcept
    {
        return m_index.contains(addr);
    }

    [[nodiscard]] size_t size() const noexcept { return m_specs.size(); }

    [[nodiscard]] auto begin() const noexcept { return m_specs.begin(); }
    [[nodiscard]] auto end() const noexcept { return m_specs.end(); }
};
}  // namespace evmpre
