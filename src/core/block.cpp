#include "block.hpp"

#include <cz/assert.hpp>
#include <tracy/Tracy.hpp>
#include "comment.hpp"

namespace braid {

Block_Strategy invert_strategy(Block_Strategy strategy) {
    switch (strategy) {
    case UNCOMMENTED_BLOCK:
        return COMMENTED_BLOCK;
    case COMMENTED_BLOCK:
        return UNCOMMENTED_BLOCK;
    }
    CZ_PANIC("Invalid block strategy");
}

const char* strategy_name(Block_Strategy strategy) {
    switch (strategy) {
    case UNCOMMENTED_BLOCK:
        return "uncommented block";
    case COMMENTED_BLOCK:
        return "commented block";
    }
    CZ_PANIC("Invalid block strategy");
}

void transform_blocks(Block_Strategy strategy,
                      cz::Str comment,
                      cz::Str text,
                      const Region_Map& map,
                      cz::Heap_String* out) {
    ZoneScoped;

    // Commenting grows each prose line by the prefix; uncommenting never grows the text.
    out->reserve(text.len + (strategy == UNCOMMENTED_BLOCK ? map.line_count * comment.len : 0));

    for (size_t i = 0; i < map.regions.len; ++i) {
        const Region& region = map.regions[i];
        if (region.kind != Region::PROSE) {
            out->reserve(region.end - region.start);
            out->append(text.slice(region.start, region.end));
            continue;
        }

        if (strategy == UNCOMMENTED_BLOCK) {
            insert_line_comments(text, region.start, region.end, comment, out);
        } else {
            remove_line_comments(text, region.start, region.end, comment, out);
        }
    }
}

}
