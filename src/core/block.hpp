#pragma once

#include <cz/heap_string.hpp>
#include <cz/str.hpp>
#include "region.hpp"

namespace braid {

/// Which form the `this` buffer is in, and therefore what `transform_blocks` does to it.
enum Block_Strategy {
    /// `this` is the documentation form: prose is bare.  Prose gets commented and
    /// code is copied so that the result parses as source.
    UNCOMMENTED_BLOCK,

    /// `this` is the source form: prose is commented.  Prose gets uncommented and
    /// code is copied so that the result reads as documentation.
    COMMENTED_BLOCK,
};

Block_Strategy invert_strategy(Block_Strategy strategy);

const char* strategy_name(Block_Strategy strategy);

/// Rewrite `text` region by region according to `strategy`, appending the result to `out`.
///
/// Code and delimiter lines are copied verbatim.  The result has exactly
/// as many lines as `text`.  `map` must have been built from `text`.
void transform_blocks(Block_Strategy strategy,
                      cz::Str comment,
                      cz::Str text,
                      const Region_Map& map,
                      cz::Heap_String* out);

}
