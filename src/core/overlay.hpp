#pragma once

#include <regex>
#include <cz/heap_string.hpp>
#include <cz/heap_vector.hpp>
#include <cz/slice.hpp>
#include <cz/str.hpp>
#include "region.hpp"

namespace braid {

/// A line anchored regex substitution layered on top of a block strategy.
struct Line_Rule {
    enum Scope {
        /// Only the text before the first line break is searched.
        FIRST_LINE,
        /// Each line is searched separately.
        EVERY_LINE,
    } scope;

    /// ECMAScript regex.  `^` and `$` anchor to the line.
    cz::Str pattern;

    /// Replaces the first match in the line.  `$1` refers to the first group.
    cz::Str replacement;
};

/// A pair of rule tables describing one extra convention of the source form.
///
/// Both tables are written against the commented (source) text.  `to_source` runs on the
/// output after prose has been commented.  `to_document` runs on the input before prose is
/// uncommented.  Each rule in one table should be the textual inverse of a rule in the other.
struct Overlay {
    cz::Slice<const Line_Rule> to_source;
    cz::Slice<const Line_Rule> to_document;

    bool empty() const { return to_source.len == 0 && to_document.len == 0; }
};

/// A `Line_Rule` with its pattern compiled.  Owns copies of the rule's strings.
struct Compiled_Rule {
    Line_Rule::Scope scope;
    cz::Heap_String source;
    std::regex* pattern;
    cz::Heap_String replacement;

    void drop();
};

struct Compiled_Overlay {
    cz::Heap_Vector<Compiled_Rule> rules;

    void drop();
};

/// Compile `rules` in order.  Returns `false` and describes the failing rule in `error`.
/// The rules compiled before the failure stay in `overlay` and are released by `drop`.
bool compile_line_rules(cz::Slice<const Line_Rule> rules,
                        Compiled_Overlay* overlay,
                        cz::Heap_String* error);

/// Append a `Line_Rule` for each rule in `overlay` to `rules`.  The
/// appended rules refer to `overlay`'s strings and must not outlive it.
void borrow_line_rules(const Compiled_Overlay& overlay, cz::Heap_Vector<Line_Rule>* rules);

/// Apply every rule to the prose lines of `text` in order, appending the result to `out`.
/// Code and delimiter lines are copied as is.  `FIRST_LINE` rules only apply if the
/// first line of `text` is prose.
///
/// `map` must have the same lines as `text` but its byte offsets are ignored, so the map
/// of the text before commenting or uncommenting can be used.  A rule that doesn't match
/// is not an error: `out` gets `text` unchanged.  The number of lines never changes as
/// long as no replacement contains a line break.
///
/// Returns the number of substitutions made.
size_t apply_line_rules(const Compiled_Overlay& overlay,
                        cz::Str text,
                        const Region_Map& map,
                        cz::Heap_String* out);

}
