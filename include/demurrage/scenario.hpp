#pragma once

/// @file include/demurrage/scenario.hpp
/// @brief CSV scenario loader and deterministic replay driver.
///
/// # Module: Scenario
///
/// ## Responsibility
/// Parse a time-stamped list of ledger operations and replay it against a
/// `DemurrageToken` whose clock is advanced to each row's timestamp. Used
/// by the `demurrage --replay` CLI and by the integration tests.
///
/// ## Expected CSV Format
/// ```
/// timestamp,action,caller,from,to,amount,period
/// 1700000000,mint,owner,,alice,10000000000000000000000,
/// 1702592000,transfer,alice,,bob,100000000000000000000,
/// 1702592000,schedule,owner,,,9900000000000000000000000,3
/// 1705184000,balance,,alice,,,
/// ```
/// The first line is a header and is skipped. Blank lines and lines
/// starting with '#' are ignored. The `period` column may be omitted
/// except for `schedule` rows.
///
/// ## Actions
/// | action          | fields used                    |
/// |-----------------|--------------------------------|
/// | mint            | caller, to, amount             |
/// | transfer        | caller, to, amount             |
/// | transfer_from   | caller, from, to, amount       |
/// | approve         | caller, to (spender), amount   |
/// | burn            | caller, amount                 |
/// | burn_from       | caller, from, amount           |
/// | schedule        | caller, amount (rate), period  |
/// | persist         | from (account)                 |
/// | persist_supply  | (none)                         |
/// | balance         | from (account)                 |
/// | supply          | (none)                         |
///
/// ## Guarantees
/// - Loader never throws; malformed rows are skipped
/// - Runner never lets a `LedgerError` escape; each row reports success or
///   the error message

#include "demurrage/token.hpp"
#include "demurrage/types.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace demurrage::scenario {

// ─── Steps ────────────────────────────────────────────────────────────────────

enum class Action {
    Mint,
    Transfer,
    TransferFrom,
    Approve,
    Burn,
    BurnFrom,
    Schedule,
    Persist,
    PersistSupply,
    Balance,
    Supply,
};

/// Parse the CSV spelling of an action ("transfer_from", ...).
[[nodiscard]] std::optional<Action> parse_action(std::string_view text) noexcept;

/// CSV spelling of `action`.
[[nodiscard]] std::string_view to_string(Action action) noexcept;

/// One parsed CSV row.
struct ScenarioStep {
    Timestamp timestamp{0};
    Action    action{Action::Supply};
    AccountId caller;
    AccountId from;
    AccountId to;
    Amount    amount{0};
    Period    period{0};
};

// ─── ScenarioLoader ───────────────────────────────────────────────────────────

class ScenarioLoader {
public:
    /// Load steps from a CSV file.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened
    /// - Parsed steps otherwise, skipping malformed rows
    [[nodiscard]] static std::optional<std::vector<ScenarioStep>>
    load_csv(const std::string& filepath) noexcept;

    /// Parse steps from CSV text. First non-comment line is the header.
    [[nodiscard]] static std::vector<ScenarioStep>
    parse_csv_string(const std::string& csv_content) noexcept;

    /// Parse a single data row.
    ///
    /// # Returns
    /// `nullopt` for blank/comment lines, a wrong field count, an unknown
    /// action, a malformed number, or missing fields the action needs.
    [[nodiscard]] static std::optional<ScenarioStep>
    parse_row(const std::string& line) noexcept;
};

// ─── ScenarioRunner ───────────────────────────────────────────────────────────

/// Result of replaying one step.
struct StepOutcome {
    ScenarioStep step;
    Period       period{0};  ///< Period the step ran in
    bool         ok{false};
    std::string  detail;     ///< Value for reads, error message on failure
};

/// Owns a token driven by a manual clock.
class ScenarioRunner {
public:
    /// The clock starts at `config.genesis_timestamp`.
    /// # Throws
    /// Whatever `DemurrageToken`'s constructor throws for a bad config.
    explicit ScenarioRunner(TokenConfig config);

    /// Advance the clock to `step.timestamp` and apply the step.
    /// Steps earlier than the current clock are rejected.
    StepOutcome apply(const ScenarioStep& step);

    /// Apply every step in order.
    std::vector<StepOutcome> run(std::span<const ScenarioStep> steps);

    [[nodiscard]] const DemurrageToken& token() const noexcept { return *token_; }
    [[nodiscard]] DemurrageToken& token() noexcept { return *token_; }
    [[nodiscard]] Timestamp clock() const noexcept { return *now_; }

private:
    void execute(const ScenarioStep& step, StepOutcome& outcome);

    std::shared_ptr<Timestamp>      now_;
    std::unique_ptr<DemurrageToken> token_;
};

}  // namespace demurrage::scenario
