// evmpre: Ethereum precompiled contracts execution layer
// Copyright 2025 The evmpre Authors.
// SPDX-License-Identifier: Apache-2.0

#include "tracing.hpp"
#include "activation_table.hpp"
#include <evmc/hex.hpp>
#include <array>

namespace evmpre
{
namespace
{
/// @see create_call_tracer()
class CallTracer : public Tracer
{
    std::ostream& m_out;
    uint64_t m_gas_limit = 0;
    size_t m_input_size = 0;

    void on_call_start(
        const PrecompileSpec& /*precompile*/, evmc::bytes_view input, uint64_t gas_limit) noexcept override
    {
        m_input_size = input.size();
        m_gas_limit = gas_limit;
    }

    void on_call_end(const PrecompileSpec& precompile, const Outcome& outcome) noexcept override
    {
        m_out << "{";
        m_out << R"("address":"0x)" << evmc::hex(precompile.address()) << '"';
        m_out << R"(,"name":")" << precompile.name() << '"';
        m_out << R"(,"inputSize":)" << m_input_size;
        m_out << R"(,"gasLimit":)" << m_gas_limit;
        m_out << R"(,"status":")" << status(outcome).message() << '"';
        m_out << R"(,"gasUsed":)" << gas_used(outcome);
        m_out << R"(,"output":"0x)" << evmc::hex(output(outcome)) << '"';
        m_out << "}\n";
    }

public:
    explicit CallTracer(std::ostream& out) noexcept : m_out{out}
    {
        m_out << std::dec;  // JSON numbers are decimal.
    }
};

/// @see create_stats_tracer()
class StatsTracer : public Tracer
{
    struct Counters
    {
        uint64_t calls = 0;
        uint64_t failures = 0;
        uint64_t gas_used = 0;
    };

    std::array<Counters, NumPrecompiles> m_counters{};
    std::ostream& m_out;

    void on_call_start(const PrecompileSpec& /*precompile*/, evmc::bytes_view /*input*/,
        uint64_t /*gas_limit*/) noexcept override
    {}

    void on_call_end(const PrecompileSpec& precompile, const Outcome& outcome) noexcept override
    {
        auto& c = m_counters[static_cast<size_t>(precompile.id())];
        ++c.calls;
        if (!std::holds_alternative<Success>(outcome))
            ++c.failures;
        c.gas_used += gas_used(outcome);
    }

public:
    explicit StatsTracer(std::ostream& out) noexcept : m_out{out} {}

    ~StatsTracer() noexcept override
    {
        m_out << "precompile,calls,failures,gas_used\n";
        for (size_t i = 0; i < m_counters.size(); ++i)
        {
            const auto& c = m_counters[i];
            if (c.calls == 0)
                continue;
            m_out << get_name(static_cast<PrecompileId>(i)) << ',' << c.calls << ',' << c.failures
                  << ',' << c.gas_used << '\n';
        }
    }
};
}  // namespace

std::unique_ptr<Tracer> create_call_tracer(std::ostream& out)
{
    return std::make_unique<CallTracer>(out);
}

std::unique_ptr<Tracer> create_stats_tracer(std::ostream& out)
{
    return std::make_unique<StatsTracer>(out);
}
}  // namespace evmpre
