/// @file src/core/scenario_runner.cpp
/// @brief ScenarioRunner: replays steps against a manually clocked token.

#include "demurrage/scenario.hpp"
#include "demurrage/errors.hpp"
#include "demurrage/fixed_point.hpp"

#include <fmt/format.h>

#include <utility>

namespace demurrage::scenario {

using fixed_point::FixedPoint;

ScenarioRunner::ScenarioRunner(TokenConfig config)
    : now_(std::make_shared<Timestamp>(config.genesis_timestamp))
{
    token_ = std::make_unique<DemurrageToken>(
        std::move(config),
        [clock = now_] { return *clock; });
}

StepOutcome ScenarioRunner::apply(const ScenarioStep& step) {
    StepOutcome outcome{.step = step, .period = 0, .ok = false, .detail = {}};

    if (step.timestamp < *now_) {
        outcome.period = token_->current_period();
        outcome.detail = fmt::format("timestamp {} precedes the replay clock {}", step.timestamp, *now_);
        return outcome;
    }
    *now_ = step.timestamp;
    outcome.period = token_->current_period();

    try {
        execute(step, outcome);
        outcome.ok = true;
    } catch (const LedgerError& e) {
        outcome.ok     = false;
        outcome.detail = e.what();
    }
    return outcome;
}

std::vector<StepOutcome> ScenarioRunner::run(std::span<const ScenarioStep> steps) {
    std::vector<StepOutcome> outcomes;
    outcomes.reserve(steps.size());
    for (const auto& step : steps) {
        outcomes.push_back(apply(step));
    }
    return outcomes;
}

void ScenarioRunner::execute(const ScenarioStep& step, StepOutcome& outcome) {
    DemurrageToken& token = *token_;

    switch (step.action) {
        case Action::Mint:
            token.mint(step.caller, step.to, step.amount);
            break;
        case Action::Transfer:
            token.transfer(step.caller, step.to, step.amount);
            break;
        case Action::TransferFrom:
            token.transfer_from(step.caller, step.from, step.to, step.amount);
            break;
        case Action::Approve:
            token.approve(step.caller, step.to, step.amount);
            break;
        case Action::Burn:
            token.burn(step.caller, step.amount);
            break;
        case Action::BurnFrom:
            token.burn_from(step.caller, step.from, step.amount);
            break;
        case Action::Schedule: {
            const auto event = token.schedule_change(step.caller, step.period, step.amount);
            outcome.detail = fmt::format("effective at {}", event.effective_timestamp);
            break;
        }
        case Action::Persist:
            outcome.detail = FixedPoint::to_string(token.persist_balance_decay(step.from).value);
            break;
        case Action::PersistSupply:
            outcome.detail = FixedPoint::to_string(token.persist_total_supply_decay().value);
            break;
        case Action::Balance:
            outcome.detail = FixedPoint::to_string(token.balance_of(step.from));
            break;
        case Action::Supply:
            outcome.detail = FixedPoint::to_string(token.total_supply());
            break;
    }
}

}  // namespace demurrage::scenario
