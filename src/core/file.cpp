#include "file.hpp"

#include <tracy/Tracy.hpp>

namespace braid {

cz::Str path_file_name(cz::Str path) {
    cz::Str directory, name;
    if (!path.split_after_last('/', &directory, &name)) {
        return path;
    }
    return name;
}

bool swap_extension(cz::Str path, cz::Str extension, cz::Heap_String* out) {
    ZoneScoped;

    cz::Str name = path_file_name(path);
    if (name.len == 0) {
        return false;
    }

    // Dots in directories and at the start of the name don't count.
    size_t stem_len = path.len;
    const char* dot = name.rfind('.');
    if (dot && dot != name.buffer) {
        stem_len = dot - path.buffer;
    }

    out->reserve(stem_len + extension.len);
    out->append(path.slice_end(stem_len));
    out->append(extension);
    return true;
}

}
