// evmpre: Ethereum precompiled contracts execution layer
// Copyright 2025 The evmpre Authors.
// SPDX-License-Identifier: Apache-2.0

#include "activation_table.hpp"
#include "tracing.hpp"
#include <evmpre/evmpre.hpp>

namespace evmpre
{
uint64_t gas_used(const Outcome& outcome) noexcept
{
    if (const auto* s = std::get_if<Success>(&outcome))
        return s->gas_used;
    if (const auto* e = std::get_if<Error>(&outcome))
        return e->gas_used;
    return 0;
}

evmc::bytes_view output(const Outcome& outcome) noexcept
{
    if (const auto* s = std::get_if<Success>(&outcome))
        return s->output;
    return {};
}

std::error_code status(const Outcome& outcome) noexcept
{
    if (const auto* e = std::get_if<Error>(&outcome))
        return e->kind;
    if (const auto* f = std::get_if<Fatal>(&outcome))
        return f->kind;
    return make_error_code(SUCCESS);
}

bool is_precompile(const ActivationTable& table, const evmc::address& addr) noexcept
{
    return table.contains(addr);
}

Outcome call(const ActivationTable& table, const evmc::address& addr, evmc::bytes_view input,
    uint64_t gas_limit, Tracer* tracer) noexcept
{
    const auto* precompile = table.find(addr);
    if (precompile == nullptr)
        return Fatal{make_error_code(NOT_PRECOMPILE)};

    if (tracer != nullptr)
        tracer->notify_call_start(*precompile, input, gas_limit);

    auto outcome = precompile->run(input, gas_limit);

    if (tracer != nullptr)
        tracer->notify_call_end(*precompile, outcome);
    return outcome;
}

Outcome execute(
    const evmc::address& addr, evmc::bytes_view input, uint64_t gas_limit, evmc_revision rev)
{
    return call(default_activation_table(rev), addr, input, gas_limit);
}

evmc::Result call_precompile(const ActivationTable& table, const evmc_message& msg) noexcept
{
    const auto gas_limit = msg.gas > 0 ? static_cast<uint64_t>(msg.gas) : uint64_t{0};
    const auto outcome = call(table, msg.code_address, {msg.input_data, msg.input_size}, gas_limit);

    if (std::holds_alternative<Fatal>(outcome))
        return evmc::Result{EVMC_REJECTED};

    if (const auto* s = std::get_if<Success>(&outcome))
    {
        // gas_used never exceeds msg.gas.
        const auto gas_left = msg.gas - static_cast<int64_t>(s->gas_used);
        return evmc::Result{EVMC_SUCCESS, gas_left, 0, s->output.data(), s->output.size()};
    }

    const auto& e = std::get<Error>(outcome);
    if (e.kind == make_error_code(OUT_OF_GAS))
        return evmc::Result{EVMC_OUT_OF_GAS};
    return evmc::Result{EVMC_PRECOMPILE_FAILURE};
}
}  // namespace evmpre
