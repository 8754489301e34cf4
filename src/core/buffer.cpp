#include "buffer.hpp"

#include <cz/util.hpp>

namespace braid {

void Buffer::drop() {
    name.drop();
    path.drop();
    contents.drop();
}

void init_buffer(Buffer* buffer, cz::Str name, cz::Str contents) {
    *buffer = {};
    assign_string(&buffer->name, name);
    assign_string(&buffer->contents, contents);
}

void swap_contents(Buffer* buffer, cz::Heap_String* contents) {
    cz::swap(buffer->contents, *contents);
}

void assign_string(cz::Heap_String* string, cz::Str str) {
    string->len = 0;
    string->reserve(str.len);
    string->append(str);
}

size_t count_lines(cz::Str text) {
    size_t lines = 0;
    for (size_t i = 0; i < text.len; ++i) {
        if (text[i] == '\n') {
            ++lines;
        }
    }

    // Unterminated last line.
    if (text.len > 0 && text[text.len - 1] != '\n') {
        ++lines;
    }
    return lines;
}

}
