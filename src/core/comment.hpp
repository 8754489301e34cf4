#pragma once

#include <stdint.h>
#include <cz/heap_string.hpp>
#include <cz/str.hpp>

namespace braid {

/// For each line in `text[start, end)` append `comment_start` followed by the line to `out`.
///
/// Empty lines are commented too so that `remove_line_comments` restores them exactly.
/// `start` must be at the start of a line.
void insert_line_comments(cz::Str text,
                          uint64_t start,
                          uint64_t end,
                          cz::Str comment_start,
                          cz::Heap_String* out);

/// For each line in `text[start, end)` append the line to `out` with one leading
/// `comment_start` removed.  Lines that don't start with `comment_start` are copied as is.
///
/// Returns the number of lines that were uncommented.
size_t remove_line_comments(cz::Str text,
                            uint64_t start,
                            uint64_t end,
                            cz::Str comment_start,
                            cz::Heap_String* out);

}
