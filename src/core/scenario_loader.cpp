/// @file src/core/scenario_loader.cpp
/// @brief CSV ScenarioLoader for replayable ledger operations.

#include "demurrage/scenario.hpp"
#include "demurrage/fixed_point.hpp"

#include <array>
#include <charconv>
#include <fstream>
#include <sstream>
#include <utility>

namespace demurrage::scenario {

using fixed_point::FixedPoint;

namespace {

constexpr std::array<std::pair<std::string_view, Action>, 11> ACTION_NAMES = {{
    {"mint",           Action::Mint},
    {"transfer",       Action::Transfer},
    {"transfer_from",  Action::TransferFrom},
    {"approve",        Action::Approve},
    {"burn",           Action::Burn},
    {"burn_from",      Action::BurnFrom},
    {"schedule",       Action::Schedule},
    {"persist",        Action::Persist},
    {"persist_supply", Action::PersistSupply},
    {"balance",        Action::Balance},
    {"supply",         Action::Supply},
}};

std::string_view trim(std::string_view text) noexcept {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

/// Split on ',' keeping empty fields, including trailing ones.
std::vector<std::string_view> split_fields(std::string_view line) {
    std::vector<std::string_view> fields;
    std::size_t start = 0;
    for (;;) {
        const auto comma = line.find(',', start);
        if (comma == std::string_view::npos) {
            fields.push_back(trim(line.substr(start)));
            return fields;
        }
        fields.push_back(trim(line.substr(start, comma - start)));
        start = comma + 1;
    }
}

std::optional<std::uint64_t> parse_u64(std::string_view text) noexcept {
    if (text.empty()) return std::nullopt;
    std::uint64_t value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

/// True if the fields `action` needs are present.
bool has_required_fields(const ScenarioStep& step, bool has_amount, bool has_period) noexcept {
    switch (step.action) {
        case Action::Mint:
        case Action::Transfer:
        case Action::Approve:
            return !step.caller.empty() && !step.to.empty() && has_amount;
        case Action::TransferFrom:
            return !step.caller.empty() && !step.from.empty() && !step.to.empty() && has_amount;
        case Action::Burn:
            return !step.caller.empty() && has_amount;
        case Action::BurnFrom:
            return !step.caller.empty() && !step.from.empty() && has_amount;
        case Action::Schedule:
            return !step.caller.empty() && has_amount && has_period;
        case Action::Persist:
        case Action::Balance:
            return !step.from.empty();
        case Action::PersistSupply:
        case Action::Supply:
            return true;
    }
    return false;
}

}  // namespace

// ─── Action names ─────────────────────────────────────────────────────────────

std::optional<Action> parse_action(std::string_view text) noexcept {
    for (const auto& [name, action] : ACTION_NAMES) {
        if (name == text) return action;
    }
    return std::nullopt;
}

std::string_view to_string(Action action) noexcept {
    for (const auto& [name, value] : ACTION_NAMES) {
        if (value == action) return name;
    }
    return "unknown";
}

// ─── ScenarioLoader::parse_row ────────────────────────────────────────────────

std::optional<ScenarioStep>
ScenarioLoader::parse_row(const std::string& line) noexcept {
    const std::string_view trimmed = trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
        return std::nullopt;
    }

    const auto fields = split_fields(trimmed);
    if (fields.size() != 6 && fields.size() != 7) {
        return std::nullopt;
    }

    const auto timestamp = parse_u64(fields[0]);
    const auto action    = parse_action(fields[1]);
    if (!timestamp || !action) {
        return std::nullopt;
    }

    ScenarioStep step{
        .timestamp = *timestamp,
        .action    = *action,
        .caller    = AccountId{fields[2]},
        .from      = AccountId{fields[3]},
        .to        = AccountId{fields[4]},
        .amount    = 0,
        .period    = 0,
    };

    const bool has_amount = !fields[5].empty();
    if (has_amount) {
        const auto amount = FixedPoint::parse(fields[5]);
        if (!amount) return std::nullopt;
        step.amount = *amount;
    }

    const bool has_period = fields.size() == 7 && !fields[6].empty();
    if (has_period) {
        const auto period = parse_u64(fields[6]);
        if (!period) return std::nullopt;
        step.period = *period;
    }

    if (!has_required_fields(step, has_amount, has_period)) {
        return std::nullopt;
    }
    return step;
}

// ─── ScenarioLoader::parse_csv_string ─────────────────────────────────────────

std::vector<ScenarioStep>
ScenarioLoader::parse_csv_string(const std::string& csv_content) noexcept {
    std::vector<ScenarioStep> steps;
    std::istringstream stream(csv_content);
    std::string line;
    bool header_skipped = false;

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (!header_skipped) {
            const auto head = trim(line);
            if (!head.empty() && head.front() != '#') {
                header_skipped = true;
            }
            continue;
        }

        auto step = parse_row(line);
        if (step) {
            steps.push_back(std::move(*step));
        }
    }

    return steps;
}

// ─── ScenarioLoader::load_csv ─────────────────────────────────────────────────

std::optional<std::vector<ScenarioStep>>
ScenarioLoader::load_csv(const std::string& filepath) noexcept {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_csv_string(contents.str());
}

}  // namespace demurrage::scenario
