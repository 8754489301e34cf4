#pragma once

#include <cz/heap_string.hpp>
#include <cz/str.hpp>

namespace braid {

/// One side of a link: the documentation form or a source form of the same document.
///
/// The engine never reads or writes files.  Loading `contents` from `path` and
/// saving it back is the job of whoever owns the buffer.
struct Buffer {
    /// The name of the buffer.  Configurations refer to buffers by this name.
    cz::Heap_String name;

    /// The backing file, or empty if the buffer has no file.
    cz::Heap_String path;

    /// The text.  Lines are separated by `'\n'`; a trailing `'\n'` terminates the last
    /// line rather than starting a new empty one.
    cz::Heap_String contents;

    void drop();

    bool has_path() const { return path.len > 0; }
};

/// Copy `name` and `contents` into a fresh buffer.
void init_buffer(Buffer* buffer, cz::Str name, cz::Str contents);

/// Replace the contents with `*contents` and take ownership of it.  `*contents` is left
/// holding the old text, which the caller must drop.
void swap_contents(Buffer* buffer, cz::Heap_String* contents);

/// Replace `*string` with a copy of `str`.
void assign_string(cz::Heap_String* string, cz::Str str);

/// Count the lines in `text` using the same rules as `Buffer::contents`.
size_t count_lines(cz::Str text);

}
