// evmpre: Ethereum precompiled contracts execution layer
// Copyright 2025 The evmpre Authors.
// SPDX-License-Identifier: Apache-2.0

#include <CLI/CLI.hpp>
#include <evmc/hex.hpp>
#include <evmpre/activation_table.hpp>
#include <evmpre/evmpre.hpp>
#include <evmpre/precompile_id.hpp>
#include <evmpre/tracing.hpp>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace
{
/// The exit code of the invalid arguments or configuration.
constexpr int EXIT_USAGE = 2;
}  // namespace

int main(int argc, char* argv[])
{
    try
    {
        CLI::App app{"evmpre precompile runner"};

        std::optional<std::string> fork;
        app.add_option("--fork", fork, "Hardfork name, e.g. Cancun");

        std::optional<std::string> config_file;
        app.add_option("--config", config_file, "JSON configuration file")
            ->check(CLI::ExistingFile);

        uint64_t gas = 10'000'000;
        app.add_option("--gas", gas, "Gas limit")->capture_default_str();

        bool trace = false;
        bool trace_summary = false;
        const auto trace_opt = app.add_flag("--trace", trace, "Trace the call as JSON");
        app.add_flag("--trace-summary", trace_summary, "Output per-precompile statistics")
            ->excludes(trace_opt);

        std::string address_hex;
        app.add_option("address", address_hex, "Precompile address, e.g. 0x02")->required();

        std::string input_hex;
        app.add_option("input", input_hex, "Input as hex");

        try
        {
            app.parse(argc, argv);
        }
        catch (const CLI::ParseError& e)
        {
            const auto ec = app.exit(e);
            return ec == 0 ? 0 : EXIT_USAGE;
        }

        evmpre::Config config;
        if (config_file)
        {
            std::ifstream in{*config_file};
            config = evmpre::load_config(in);
        }
        if (fork)
            config.revision = evmpre::to_revision(*fork);

        const auto address = evmc::from_hex<evmc::address>(address_hex);
        if (!address)
        {
            std::cerr << "invalid address: " << address_hex << "\n";
            return EXIT_USAGE;
        }
        const auto input = evmc::from_hex(input_hex);
        if (!input)
        {
            std::cerr << "invalid input hex\n";
            return EXIT_USAGE;
        }

        const auto table = evmpre::make_activation_table(config.revision, config);

        std::unique_ptr<evmpre::Tracer> tracer;
        if (trace)
            evmpre::add_tracer(tracer, evmpre::create_call_tracer(std::clog));
        if (trace_summary)
            evmpre::add_tracer(tracer, evmpre::create_stats_tracer(std::clog));

        const auto outcome = evmpre::call(*table, *address, *input, gas, tracer.get());
        tracer.reset();  // Flush the summary before the result.

        auto& out = std::cout;
        if (const auto id = evmpre::find_precompile_id(*address))
            out << "Name:     " << evmpre::get_name(*id) << "\n";
        out << "Result:   " << evmpre::status(outcome).message() << "\nGas used: "
            << evmpre::gas_used(outcome) << "\n";
        if (std::holds_alternative<evmpre::Success>(outcome))
            out << "Output:   " << evmc::hex(evmpre::output(outcome)) << "\n";

        return std::holds_alternative<evmpre::Fatal>(outcome) ? 1 : 0;
    }
    catch (const std::exception& ex)
    {
        std::cerr << ex.what() << "\n";
        return EXIT_USAGE;
    }
}
