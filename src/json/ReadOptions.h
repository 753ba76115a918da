#ifndef LAZYJSON_JSON_READ_OPTIONS_H
#define LAZYJSON_JSON_READ_OPTIONS_H

#include <cstddef>
#include <string_view>

namespace lazyjson::json {

// Optional instrumentation for callers that want to verify how much of a document was touched.
struct ScanCounters {
    std::size_t entries_visited = 0;
    std::size_t values_materialized = 0;

    void reset() {
        entries_visited = 0;
        values_materialized = 0;
    }
};

struct ReadOptions {
    // Accept the `nan`/`inf`/`ninf` spellings below as numbers.
    bool allownan = false;
    // Spellings are borrowed, like the input buffer; they must outlive every LazyValue.
    std::string_view nan = "NaN";
    std::string_view inf = "Infinity";
    std::string_view ninf = "-Infinity";
    // Treat the input as newline-delimited values forming an implicit array.
    bool jsonlines = false;
    // Accept a leading '+' on numbers (not RFC 8259).
    bool allow_leading_plus = false;
    // Objects and arrays nested deeper than this fail with MaxDepthExceeded.
    std::size_t max_depth = 512;
    ScanCounters *counters = nullptr;

    [[nodiscard]] ReadOptions nested() const {
        ReadOptions copy = *this;
        copy.jsonlines = false;
        return copy;
    }
};

} // namespace lazyjson::json

#endif // LAZYJSON_JSON_READ_OPTIONS_H
