#pragma once

#include <stdint.h>
#include <cz/heap_string.hpp>
#include <cz/str.hpp>
#include "block.hpp"
#include "buffer.hpp"
#include "overlay.hpp"
#include "region.hpp"

namespace braid {

/// The fields needed to build a `Configuration`.  Zero initialize and fill in.
struct Configuration_Options {
    /// Identifies the configuration in error messages (ex. `"org-el"`).
    cz::Str name;

    /// The name of the buffer the configuration reads from.
    cz::Str this_name;
    /// The target buffer.  Callers supply this explicitly; it is
    /// usually a path derived from `this` by `swap_extension`.
    cz::Str that_name;

    Block_Strategy strategy;

    /// Prepended to a line to comment it out (ex. `";; "`).
    cz::Str comment;

    /// Patterns for the lines that open and close a code region (ex. `"#\\+BEGIN_SRC"`).
    cz::Str region_start;
    cz::Str region_end;

    /// Region patterns ignore case unless this is set.
    bool case_sensitive;

    Overlay overlay;
};

/// A link between two buffers and the transformation that regenerates `that` from `this`.
///
/// A `Configuration` owns copies of all of its strings, its line rules and its compiled
/// patterns, so the options it was made from may be released afterwards.  It keeps no
/// state between transformations so it can be used for any number of `clone` calls.
struct Configuration {
    cz::Heap_String name;
    cz::Heap_String this_name;
    cz::Heap_String that_name;
    Block_Strategy strategy;
    cz::Heap_String comment;
    cz::Heap_String region_start;
    cz::Heap_String region_end;
    bool case_sensitive;

    Region_Patterns patterns;
    /// `overlay.to_source` for `UNCOMMENTED_BLOCK`, `overlay.to_document` for `COMMENTED_BLOCK`.
    Compiled_Overlay line_rules;
    /// The other table of the overlay.  Only used to build the inverse.
    Compiled_Overlay inverse_rules;

    void drop();
};

/// Validate `options` and build `config`.
///
/// Fails if the name, comment, either region pattern or the target is empty, or if a
/// pattern doesn't compile.  On failure `error` names the configuration and the offending
/// field and `config` is left empty.
bool make_configuration(const Configuration_Options& options,
                        Configuration* config,
                        cz::Heap_String* error);

/// Build the configuration for the opposite direction: `this` and `that` are swapped and
/// the strategy is flipped.  Everything else (comment, patterns, case sensitivity,
/// overlay) is preserved.
bool invert_configuration(const Configuration& config,
                          Configuration* inverse,
                          cz::Heap_String* error);

/// Transform `text` and append the result to `out`.  On failure nothing is appended.
bool transform(const Configuration& config,
               cz::Str text,
               cz::Heap_String* out,
               cz::Heap_String* error);

/// Regenerate `that_buffer` from `this_buffer`.
///
/// The contents of `that_buffer` are replaced wholesale only if the transformation
/// succeeds; otherwise it is left untouched and `error` describes which configuration
/// and buffers failed.  An unnamed `that_buffer` is given the configured target name.
bool clone(const Configuration& config,
           const Buffer& this_buffer,
           Buffer* that_buffer,
           cz::Heap_String* error);

/// Find the position in the transformed text of the character at `position` in `this_text`.
///
/// The line is preserved and the column shifts by however much the line grew or shrank,
/// clamped to the line.  Positions at or past the end map to the end.
bool convert_location(const Configuration& config,
                      cz::Str this_text,
                      uint64_t position,
                      uint64_t* that_position,
                      cz::Heap_String* error);

/// Transform `text` with `config` and then back with its inverse.  `*matches` is set
/// to whether the result is identical to `text`.
bool check_round_trip(const Configuration& config,
                      cz::Str text,
                      bool* matches,
                      cz::Heap_String* error);

}
