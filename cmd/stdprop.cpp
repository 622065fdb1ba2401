// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <stdprop/core/log_level_map.hpp>
#include <stdprop/explore/explorer.hpp>
#include <stdprop/explore/report.hpp>
#include <stdprop/property/catalog.hpp>
#include <stdprop/property/generator.hpp>
#include <stdprop/property/property.hpp>
#include <stdprop/token/reference_token.hpp>
#include <stdprop/token/token_flaw.hpp>

#include <CLI/CLI.hpp>

#include <fmt/format.h>

#include <quill/LogLevel.h>
#include <quill/Quill.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <random>
#include <string>
#include <utility>
#include <vector>

using namespace stdprop;

namespace
{
    constexpr int EXIT_USAGE = 2;

    struct arguments
    {
        using seed_t = Generator::seed_t;

        seed_t seed = 0;
        size_t iterations = 256;
        size_t max_retries = 64;
        size_t max_steps = 16;
        uint64_t time_budget_ms = 10'000;
        size_t shrink_rounds = 64;
        unsigned threads = 1;
        std::vector<std::string> properties{};
        std::vector<TokenFlaw> flaws{};
        bool unlimited_allowance = false;
        bool list = false;
        quill::LogLevel log_level = quill::LogLevel::Info;

        // every seed value is valid, so only an absent --seed picks one
        void set_random_seed_if_unset(CLI::Option const &option)
        {
            if (option.count() == 0) {
                seed = std::random_device()();
            }
        }
    };
}

static arguments parse_args(int const argc, char **const argv)
{
    auto app = CLI::App("ERC-20 property checker");
    auto args = arguments{};

    app.set_config("--config", "", "INI or TOML file with any of the options");
    auto const *const seed_option = app.add_option(
        "--seed",
        args.seed,
        "Seed to use for reproducible exploration (random by default)");
    app.add_option(
        "-i,--iterations",
        args.iterations,
        "Satisfied evaluations per property (default 256)");
    app.add_option(
        "--max-retries",
        args.max_retries,
        "Resamples per iteration before giving up on it (default 64)");
    app.add_option(
        "--max-steps",
        args.max_steps,
        "Adapter calls per evaluation, setup included (default 16)");
    app.add_option(
        "--time-budget-ms",
        args.time_budget_ms,
        "Wall clock budget per property in milliseconds (default 10000)");
    app.add_option(
        "--shrink-rounds",
        args.shrink_rounds,
        "Shrinking rounds per counterexample (default 64)");
    app.add_option("-j,--threads", args.threads, "Worker threads (default 1)")
        ->check(CLI::PositiveNumber);
    app.add_option(
        "-p,--property",
        args.properties,
        "Property to explore, by id or number (all by default)");
    app.add_option("--flaw", args.flaws, "Defect to inject into the token")
        ->transform(CLI::CheckedTransformer(flaw_name_map(), CLI::ignore_case));
    app.add_flag(
        "--unlimited-allowance",
        args.unlimited_allowance,
        "Token treats an allowance of MAX as unlimited");
    app.add_flag("--list", args.list, "Print the property catalog and exit");
    app.add_option("--log_level", args.log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));

    try {
        app.parse(argc, argv);
    }
    catch (CLI::ParseError const &e) {
        auto const code = app.exit(e);
        std::exit(code == 0 ? EXIT_SUCCESS : EXIT_USAGE);
    }

    args.set_random_seed_if_unset(*seed_option);
    return args;
}

static void print_catalog()
{
    for (auto const &property : catalog()) {
        fmt::print(
            "{} {:<40} {:<12} {:<5} {}\n",
            property.id,
            property.name,
            to_string(property.operation),
            to_string(property.mode),
            property.statement);
    }
    fmt::print("\nflaws:\n");
    for (auto const &[name, flaw] : flaw_name_map()) {
        fmt::print("  {:<26} {}\n", name, flaw_description(flaw));
    }
}

int main(int argc, char **argv)
{
    auto const args = parse_args(argc, argv);
    if (args.list) {
        print_catalog();
        return EXIT_SUCCESS;
    }

    std::vector<Property> selected;
    for (auto const &id : args.properties) {
        auto const *const property = find_property(id);
        if (property == nullptr) {
            fmt::print(stderr, "unknown property '{}'\n", id);
            return EXIT_USAGE;
        }
        selected.push_back(*property);
    }
    if (selected.empty()) {
        auto const all = catalog();
        selected.assign(all.begin(), all.end());
    }

    auto stdout_handler = quill::stdout_handler();
    stdout_handler->set_pattern(
        "%(ascii_time) [%(thread)] %(filename):%(lineno) LOG_%(level_name)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stdout_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(args.log_level);

    ReferenceToken::Config token_config{
        .flaws = FlawSet(args.flaws.begin(), args.flaws.end()),
        .unlimited_allowance = args.unlimited_allowance};
    for (auto const flaw : token_config.flaws) {
        LOG_INFO(
            "injecting {}: {}",
            std::string{flaw_name(flaw)},
            std::string{flaw_description(flaw)});
    }

    Explorer const explorer{
        ExplorerConfig{
            .seed = args.seed,
            .iterations = args.iterations,
            .max_retries = args.max_retries,
            .max_steps = args.max_steps,
            .time_budget = std::chrono::milliseconds{args.time_budget_ms},
            .shrink_rounds = args.shrink_rounds,
            .threads = args.threads},
        make_reference_token_factory(std::move(token_config))};

    auto const reports = explorer.run(selected);
    quill::flush();

    size_t failed = 0;
    size_t inconclusive = 0;
    for (auto const &report : reports) {
        fmt::print("{}\n", report);
        failed += report.verdict == Verdict::Fail;
        inconclusive += report.verdict == Verdict::Inconclusive;
    }
    fmt::print(
        "seed {}: {} passed, {} failed, {} inconclusive\n",
        args.seed,
        reports.size() - failed - inconclusive,
        failed,
        inconclusive);

    return failed == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
