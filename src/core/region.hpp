#pragma once

#include <stddef.h>
#include <stdint.h>
#include <regex>
#include <cz/heap_string.hpp>
#include <cz/heap_vector.hpp>
#include <cz/str.hpp>

namespace braid {

/// The compiled delimiter pair.  `start` opens a code region, `end` closes it.
struct Region_Patterns {
    std::regex* start;
    std::regex* end;

    void drop();
};

/// Compile `start` and `end` (ECMAScript syntax).  Returns `false` and
/// describes the failing pattern in `error` if either doesn't compile.
bool compile_region_patterns(cz::Str start,
                             cz::Str end,
                             bool case_sensitive,
                             Region_Patterns* patterns,
                             cz::Heap_String* error);

struct Region {
    enum Kind {
        PROSE,
        CODE,
        /// A single line matching one of the patterns.  Never commented or uncommented.
        DELIMITER,
    } kind;

    /// Lines `[start_line, end_line)`.
    size_t start_line;
    size_t end_line;

    /// Bytes `[start, end)`, including the trailing newline of the last line.
    uint64_t start;
    uint64_t end;
};

struct Region_Map {
    cz::Heap_Vector<Region> regions;
    size_t line_count;

    /// Set if the text ended inside a code region or closed a code region that was
    /// never opened.  The map is still complete: the tail keeps the kind of the last
    /// delimiter and a stray end delimiter stays prose.
    bool unbalanced;

    void drop();
};

/// Test if `pattern` is found anywhere in `line`.
bool line_matches(const std::regex& pattern, cz::Str line);

/// Partition `text` into alternating prose and code regions separated by delimiter lines.
/// Every line is in exactly one region and empty regions are omitted.
void classify_regions(cz::Str text, const Region_Patterns& patterns, Region_Map* map);

}
