/**
 * @file  fuzz_elegant.cpp
 * @brief libFuzzer target for the Elegant lattice parser
 *
 * Build:
 *   cmake -DRINGTRACK_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_elegant
 *
 * Run for 60 seconds:
 *   ./fuzz_elegant -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Malformed input is reported as ringtrack::Error and nothing else.
 *   3. If elements are returned, a Lattice can be built from them and its
 *      circumference equals the sum of the element lengths.
 *
 * Fuzzer strategy:
 *   The input is passed as the whole file contents. The parser must handle
 *     • Binary garbage (null bytes, high bytes)
 *     • Unbalanced parentheses and quotes
 *     • Broken RPN expressions ("1 +", "pi 0 /")
 *     • Lines that refer to themselves or to undefined parts
 *     • Continuation characters at end of input
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "ringtrack/elegant.hpp"
#include "ringtrack/errors.hpp"
#include "ringtrack/lattice.hpp"

using namespace ringtrack;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    // Each line may still expand to MAX_LINE_ELEMENTS; keep inputs small.
    if (size > 4096) return 0;
    const std::string_view input{reinterpret_cast<const char*>(data), size};

    try {
        auto elems = elegant::expand_elegant(input, {}, 3.0, 100);
        double total = 0.0;
        for (const auto& e : elems) {
            if (e.has_length()) total += e.length();
        }
        const Lattice ring(std::move(elems));
        const double c = ring.circumference();
        assert(c == total || (std::isnan(c) && std::isnan(total)));
    } catch (const Error&) {
        // Rejected input.
    }
    return 0;
}
