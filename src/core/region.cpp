#include "region.hpp"

#include <cz/assert.hpp>
#include <cz/defer.hpp>
#include <cz/format.hpp>
#include <tracy/Tracy.hpp>
#include "tracy_format.hpp"

namespace braid {

void Region_Patterns::drop() {
    delete start;
    delete end;
    start = nullptr;
    end = nullptr;
}

static bool compile_pattern(cz::Str source,
                            cz::Str field,
                            std::regex::flag_type flags,
                            std::regex** pattern,
                            cz::Heap_String* error) {
    try {
        *pattern = new std::regex(source.buffer, source.len, flags);
        return true;
    } catch (std::regex_error& ex) {
        error->len = 0;
        cz::Heap_String message =
            cz::format("Invalid ", field, " pattern `", source, "`: ", cz::Str(ex.what()));
        CZ_DEFER(message.drop());
        error->reserve(message.len);
        error->append(message);
        return false;
    }
}

bool compile_region_patterns(cz::Str start,
                             cz::Str end,
                             bool case_sensitive,
                             Region_Patterns* patterns,
                             cz::Heap_String* error) {
    ZoneScoped;

    std::regex::flag_type flags = std::regex::ECMAScript;
    if (!case_sensitive) {
        flags |= std::regex::icase;
    }

    *patterns = {};
    if (!compile_pattern(start, "region start", flags, &patterns->start, error)) {
        return false;
    }
    if (!compile_pattern(end, "region end", flags, &patterns->end, error)) {
        patterns->drop();
        return false;
    }
    return true;
}

void Region_Map::drop() {
    regions.drop();
}

bool line_matches(const std::regex& pattern, cz::Str line) {
    return std::regex_search(line.buffer, line.buffer + line.len, pattern);
}

static void push_region(Region_Map* map, const Region& region) {
    // Empty regions happen between adjacent delimiters and at the edges of the text.
    if (region.start_line == region.end_line) {
        return;
    }

    map->regions.reserve(1);
    map->regions.push(region);
}

void classify_regions(cz::Str text, const Region_Patterns& patterns, Region_Map* map) {
    ZoneScoped;

    CZ_DEBUG_ASSERT(patterns.start);
    CZ_DEBUG_ASSERT(patterns.end);

    map->regions.len = 0;
    map->line_count = 0;
    map->unbalanced = false;

    Region current = {};
    current.kind = Region::PROSE;

    uint64_t position = 0;
    cz::Str remaining = text;
    while (remaining.len > 0) {
        cz::Str line = remaining;
        bool split = remaining.split_excluding('\n', &line, &remaining);
        uint64_t line_end = position + line.len + split;

        const std::regex& delimiter =
            (current.kind == Region::PROSE ? *patterns.start : *patterns.end);
        if (line_matches(delimiter, line)) {
            current.end_line = map->line_count;
            current.end = position;
            push_region(map, current);

            Region marker;
            marker.kind = Region::DELIMITER;
            marker.start_line = map->line_count;
            marker.end_line = map->line_count + 1;
            marker.start = position;
            marker.end = line_end;
            push_region(map, marker);

            current.kind = (current.kind == Region::PROSE ? Region::CODE : Region::PROSE);
            current.start_line = map->line_count + 1;
            current.start = line_end;
        } else if (current.kind == Region::PROSE && line_matches(*patterns.end, line)) {
            // A code region is closed without being opened.  Keep it as prose.
            map->unbalanced = true;
            TracyFormat(message, len, 128, "Stray region end delimiter at line %zu",
                        map->line_count + 1);
            TracyMessage(message, len);
        }

        ++map->line_count;
        position = line_end;
        if (!split) {
            break;
        }
    }

    current.end_line = map->line_count;
    current.end = position;
    push_region(map, current);

    if (current.kind == Region::CODE) {
        map->unbalanced = true;
        TracyMessageL("Code region is never closed; treating the rest of the text as code");
    }

    CZ_DEBUG_ASSERT(position == text.len);
}

}
