// evmpre: Ethereum precompiled contracts execution layer
// Copyright 2025 The evmpre Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <evmc/evmc.hpp>
#include <evmpre/evmpre.hpp>
#include <memory>
#include <ostream>

namespace evmpre
{
class PrecompileSpec;

class Tracer
{
    friend void add_tracer(std::unique_ptr<Tracer>& chain, std::unique_ptr<Tracer> tracer) noexcept;
    std::unique_ptr<Tracer> m_next_tracer;

public:
    virtual ~Tracer() = default;

    void notify_call_start(  // NOLINT(misc-no-recursion)
        const PrecompileSpec& precompile, evmc::bytes_view input, uint64_t gas_limit) noexcept
    {
        on_call_start(precompile, input, gas_limit);
        if (m_next_tracer)
            m_next_tracer->notify_call_start(precompile, input, gas_limit);
    }

    void notify_call_end(  // NOLINT(misc-no-recursion)
        const PrecompileSpec& precompile, const Outcome& outcome) noexcept
    {
        on_call_end(precompile, outcome);
        if (m_next_tracer)
            m_next_tracer->notify_call_end(precompile, outcome);
    }

private:
    virtual void on_call_start(
        const PrecompileSpec& precompile, evmc::bytes_view input, uint64_t gas_limit) noexcept = 0;
    virtual void on_call_end(const PrecompileSpec& precompile, const Outcome& outcome) noexcept = 0;
};

/// Appends the tracer to the end of the chain.
inline void add_tracer(std::unique_ptr<Tracer>& chain, std::unique_ptr<Tracer> tracer) noexcept
{
    auto* end = &chain;
    while (*end)
        end = &(*end)->m_next_tracer;
    *end = std::move(tracer);
}

/// Creates the tracer reporting every precompile call as a JSON line.
///
/// @param out  Report output stream.
std::unique_ptr<Tracer> create_call_tracer(std::ostream& out);

/// Creates the tracer counting calls, failures and gas used per precompile.
/// The CSV report is written when the tracer is destroyed.
std::unique_ptr<Tracer> create_stats_tracer(std::ostream& out);
}  // namespace evmpre
