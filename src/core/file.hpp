#pragma once

#include <cz/heap_string.hpp>
#include <cz/str.hpp>

namespace braid {

/// Get the final component of `path`.
cz::Str path_file_name(cz::Str path);

/// Replace the extension of the final component of `path` with `extension` (which should
/// include the dot) and append the result to `out`.  If the file has no extension then
/// `extension` is appended.  A leading dot (as in `.emacs`) doesn't start an extension.
///
/// Returns `false` if `path` doesn't name a file (it is empty or ends in a slash).
bool swap_extension(cz::Str path, cz::Str extension, cz::Heap_String* out);

}
