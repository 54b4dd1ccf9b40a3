/**
 * @file  fuzz_scenario.cpp
 * @brief libFuzzer target for the CSV scenario loader and replay runner
 *
 * Build:
 *   cmake -DDEMURRAGE_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_scenario
 *
 * Run for 60 seconds:
 *   ./fuzz_scenario -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. The loader never throws and only yields rows with a known action.
 *   3. The runner never lets a LedgerError escape.
 *   4. Failed steps carry a non-empty error message.
 *   5. The replay clock never moves backwards.
 *
 * Fuzzer strategy:
 *   Input is passed directly as CSV text. A fixed header line is prepended
 *   so the fuzzer spends its time on data rows.
 */

#include <cstddef>
#include <cstdint>
#include <cassert>
#include <string>

#include "demurrage/scenario.hpp"

using namespace demurrage;
using namespace demurrage::scenario;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    std::string csv = "timestamp,action,caller,from,to,amount,period\n";
    csv.append(reinterpret_cast<const char*>(data), size);

    const auto steps = ScenarioLoader::parse_csv_string(csv);

    TokenConfig config;
    config.owner             = "owner";
    config.genesis_timestamp = 0;
    config.initial_rate      = Rate{"9985000000000000000000000"};

    ScenarioRunner runner(config);
    for (const auto& step : steps) {
        // Invariant 2
        assert(parse_action(to_string(step.action)) == step.action);

        const Timestamp before  = runner.clock();
        const auto      outcome = runner.apply(step);

        // Invariant 4
        if (!outcome.ok) {
            assert(!outcome.detail.empty());
        }

        // Invariant 5
        assert(runner.clock() >= before);
        if (step.timestamp < before) {
            assert(!outcome.ok);
            assert(runner.clock() == before);
        }
    }

    return 0;
}
