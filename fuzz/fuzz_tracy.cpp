/**
 * @file  fuzz_tracy.cpp
 * @brief libFuzzer target for the Tracy lattice parser
 *
 * Build:
 *   cmake -DRINGTRACK_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_tracy
 *
 * Run for 60 seconds:
 *   ./fuzz_tracy -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Malformed input is reported as ringtrack::Error and nothing else.
 *   3. If an expansion is returned, every element has a pass method.
 *   4. Comment stripping never grows the input.
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "ringtrack/errors.hpp"
#include "ringtrack/tracy.hpp"

using namespace ringtrack;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size > 4096) return 0;
    const std::string_view input{reinterpret_cast<const char*>(data), size};

    assert(tracy::strip_comments(input).size() <= input.size());

    try {
        const auto expansion = tracy::expand_tracy(input);
        for (const auto& e : expansion.elements) {
            assert(e.has_pass_method());
        }
    } catch (const Error&) {
        // Rejected input.
    }
    return 0;
}
