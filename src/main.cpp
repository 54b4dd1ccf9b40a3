/// @file src/main.cpp
/// @brief demurrage CLI entry point.
///
/// Usage:
///   demurrage --project <balance> <rate> <periods> [--rate-decimals D]
///   demurrage --replay <csv_file> [options]
///   demurrage --help

#include "demurrage/constants.hpp"
#include "demurrage/errors.hpp"
#include "demurrage/fixed_point.hpp"
#include "demurrage/scenario.hpp"
#include "demurrage/token.hpp"

#include <fmt/core.h>

#include <charconv>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

using demurrage::Amount;
using demurrage::fixed_point::FixedPoint;

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  demurrage --project <balance> <rate> <periods> [--rate-decimals D]\n"
        "      Print the decayed balance after each of <periods> periods.\n"
        "  demurrage --replay <csv_file> [options]\n"
        "      Replay a ledger scenario.\n"
        "  demurrage --help\n"
        "\n"
        "Replay options:\n"
        "  --genesis <unix_seconds>   Start of period 0          (default 0)\n"
        "  --period <seconds>         Period duration            (default 30 days)\n"
        "  --rate <fixed_point>       Initial retention rate     (default 1.0)\n"
        "  --rate-decimals <D>        Rate precision digits      (default 25)\n"
        "  --owner <account>          Mint/schedule owner        (default owner)\n"
        "  --verbose                  Diagnostics on stderr\n"
        "\n"
        "Amounts and rates are base-unit integers; '9985e21' is accepted.\n"
        "CSV format (header required):\n"
        "  timestamp,action,caller,from,to,amount,period\n"
    );
}

std::optional<std::uint64_t> parse_u64(std::string_view text) {
    std::uint64_t value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

/// Print balance · (rate/SCALE)^p for p = 0..periods.
/// Returns 0 on success, 1 on error.
int run_project(const std::vector<std::string>& args) {
    if (args.size() < 3) {
        fmt::print(stderr, "Error: --project requires <balance> <rate> <periods>\n");
        return 1;
    }

    unsigned rate_decimals = demurrage::constants::DEFAULT_RATE_DECIMALS;
    for (std::size_t i = 3; i < args.size(); ++i) {
        if (args[i] == "--rate-decimals" && i + 1 < args.size()) {
            const auto d = parse_u64(args[++i]);
            if (!d || *d == 0 || *d > demurrage::constants::MAX_RATE_DECIMALS) {
                fmt::print(stderr, "Error: invalid --rate-decimals '{}'\n", args[i]);
                return 1;
            }
            rate_decimals = static_cast<unsigned>(*d);
        } else {
            fmt::print(stderr, "Unknown option: {}\n", args[i]);
            return 1;
        }
    }

    const auto balance = FixedPoint::parse(args[0]);
    const auto rate    = FixedPoint::parse(args[1]);
    const auto periods = parse_u64(args[2]);
    if (!balance || !rate || !periods) {
        fmt::print(stderr, "Error: <balance>, <rate> and <periods> must be non-negative integers\n");
        return 1;
    }

    const Amount scale = *FixedPoint::pow10(rate_decimals);
    fmt::print("Rate {} per period\n", FixedPoint::format_scaled(*rate, rate_decimals));
    fmt::print("{:>8}  {}\n", "period", "balance");

    for (std::uint64_t p = 0; p <= *periods; ++p) {
        const auto factor = FixedPoint::rpow(*rate, p, scale);
        std::optional<Amount> value;
        if (factor) {
            value = FixedPoint::mul_div(*balance, *factor, scale);
        }
        if (!value) {
            fmt::print(stderr, "Error: arithmetic overflow at period {}\n", p);
            return 1;
        }
        fmt::print("{:>8}  {}\n", p, FixedPoint::to_string(*value));
    }
    return 0;
}

/// Replay a CSV scenario and print one line per step.
/// Returns 0 if every step succeeded, 2 if some steps failed, 1 on error.
int run_replay(const std::vector<std::string>& args) {
    if (args.empty()) {
        fmt::print(stderr, "Error: --replay requires a CSV file path\n");
        return 1;
    }

    demurrage::TokenConfig config;
    config.owner = "owner";

    for (std::size_t i = 1; i < args.size(); ++i) {
        const std::string& opt = args[i];
        if (opt == "--verbose") {
            config.verbose = true;
            continue;
        }
        if (i + 1 >= args.size()) {
            fmt::print(stderr, "Error: option {} requires a value\n", opt);
            return 1;
        }
        const std::string& value = args[++i];

        if (opt == "--genesis" || opt == "--period" || opt == "--rate-decimals") {
            const auto n = parse_u64(value);
            if (!n) {
                fmt::print(stderr, "Error: invalid value '{}' for {}\n", value, opt);
                return 1;
            }
            if (opt == "--genesis") {
                config.genesis_timestamp = *n;
            } else if (opt == "--period") {
                config.period_duration_seconds = *n;
            } else {
                if (*n == 0 || *n > demurrage::constants::MAX_RATE_DECIMALS) {
                    fmt::print(stderr, "Error: --rate-decimals {} outside [1, {}]\n",
                               value, demurrage::constants::MAX_RATE_DECIMALS);
                    return 1;
                }
                config.rate_decimals = static_cast<unsigned>(*n);
            }
        } else if (opt == "--rate") {
            const auto rate = FixedPoint::parse(value);
            if (!rate) {
                fmt::print(stderr, "Error: invalid rate '{}'\n", value);
                return 1;
            }
            config.initial_rate = *rate;
        } else if (opt == "--owner") {
            config.owner = value;
        } else {
            fmt::print(stderr, "Unknown option: {}\n", opt);
            return 1;
        }
    }

    const auto steps = demurrage::scenario::ScenarioLoader::load_csv(args[0]);
    if (!steps) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", args[0]);
        return 1;
    }
    fmt::print("Loaded {} steps from '{}'\n", steps->size(), args[0]);

    try {
        demurrage::scenario::ScenarioRunner runner(config);
        std::size_t failures = 0;

        for (const auto& step : *steps) {
            const auto outcome = runner.apply(step);
            if (!outcome.ok) ++failures;
            fmt::print("{:>12}  p{:<4} {:<15} {:<6} {}\n",
                       step.timestamp,
                       outcome.period,
                       demurrage::scenario::to_string(step.action),
                       outcome.ok ? "ok" : "FAILED",
                       outcome.detail);
        }

        fmt::print("Total supply {}\n", FixedPoint::to_string(runner.token().total_supply()));
        fmt::print("{} steps, {} failed\n", steps->size(), failures);
        return failures == 0 ? 0 : 2;
    } catch (const std::invalid_argument& e) {
        fmt::print(stderr, "Error: invalid configuration: {}\n", e.what());
        return 1;
    } catch (const demurrage::LedgerError& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        return 1;
    }
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);
    const std::vector<std::string> rest(argv + 2, argv + argc);

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    if (mode == "--project") {
        return run_project(rest);
    }

    if (mode == "--replay") {
        return run_replay(rest);
    }

    fmt::print(stderr, "Unknown option: {}\n", mode);
    print_usage();
    return 1;
}
