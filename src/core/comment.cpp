#include "comment.hpp"

#include <cz/assert.hpp>

namespace braid {

void insert_line_comments(cz::Str text,
                          uint64_t start,
                          uint64_t end,
                          cz::Str comment_start,
                          cz::Heap_String* out) {
    CZ_DEBUG_ASSERT(start == 0 || text[start - 1] == '\n');
    CZ_DEBUG_ASSERT(end <= text.len);

    cz::Str remaining = text.slice(start, end);
    while (remaining.len > 0) {
        cz::Str line = remaining;
        bool split = remaining.split_excluding('\n', &line, &remaining);

        out->reserve(comment_start.len + line.len + 1);
        out->append(comment_start);
        out->append(line);
        if (split) {
            out->push('\n');
        } else {
            break;
        }
    }
}

size_t remove_line_comments(cz::Str text,
                            uint64_t start,
                            uint64_t end,
                            cz::Str comment_start,
                            cz::Heap_String* out) {
    CZ_DEBUG_ASSERT(start == 0 || text[start - 1] == '\n');
    CZ_DEBUG_ASSERT(end <= text.len);

    size_t removed = 0;
    cz::Str remaining = text.slice(start, end);
    while (remaining.len > 0) {
        cz::Str line = remaining;
        bool split = remaining.split_excluding('\n', &line, &remaining);

        // Strip exactly one comment.  `;; ;; x` becomes `;; x`.
        if (line.starts_with(comment_start)) {
            line = line.slice_start(comment_start.len);
            ++removed;
        }

        out->reserve(line.len + 1);
        out->append(line);
        if (split) {
            out->push('\n');
        } else {
            break;
        }
    }
    return removed;
}

}
