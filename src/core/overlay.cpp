#include "overlay.hpp"

#include <iterator>
#include <string>
#include <cz/defer.hpp>
#include <cz/format.hpp>
#include <cz/util.hpp>
#include <tracy/Tracy.hpp>

namespace braid {

void Compiled_Rule::drop() {
    source.drop();
    delete pattern;
    replacement.drop();
}

void Compiled_Overlay::drop() {
    for (size_t i = 0; i < rules.len; ++i) {
        rules[i].drop();
    }
    rules.drop();
}

bool compile_line_rules(cz::Slice<const Line_Rule> rules,
                        Compiled_Overlay* overlay,
                        cz::Heap_String* error) {
    ZoneScoped;

    overlay->rules.reserve(rules.len);
    for (size_t i = 0; i < rules.len; ++i) {
        Compiled_Rule rule = {};
        rule.scope = rules[i].scope;
        try {
            rule.pattern = new std::regex(rules[i].pattern.buffer, rules[i].pattern.len,
                                          std::regex::ECMAScript);
        } catch (std::regex_error& ex) {
            error->len = 0;
            cz::Heap_String message =
                cz::format("Invalid line rule `", rules[i].pattern, "`: ", cz::Str(ex.what()));
            CZ_DEFER(message.drop());
            error->reserve(message.len);
            error->append(message);
            return false;
        }

        rule.source.reserve(rules[i].pattern.len);
        rule.source.append(rules[i].pattern);
        rule.replacement.reserve(rules[i].replacement.len);
        rule.replacement.append(rules[i].replacement);
        overlay->rules.push(rule);
    }
    return true;
}

void borrow_line_rules(const Compiled_Overlay& overlay, cz::Heap_Vector<Line_Rule>* rules) {
    rules->reserve(overlay.rules.len);
    for (size_t i = 0; i < overlay.rules.len; ++i) {
        Line_Rule rule;
        rule.scope = overlay.rules[i].scope;
        rule.pattern = overlay.rules[i].source;
        rule.replacement = overlay.rules[i].replacement;
        rules->push(rule);
    }
}

/// Apply `rule` to a single line.  Returns `true` and appends the
/// rewritten line if it matched, otherwise appends nothing.
static bool apply_rule(const Compiled_Rule& rule, cz::Str line, cz::Heap_String* out) {
    std::cmatch match;
    if (!std::regex_search(line.buffer, line.buffer + line.len, match, *rule.pattern)) {
        return false;
    }

    std::string replaced;
    match.format(std::back_inserter(replaced), rule.replacement.buffer,
                 rule.replacement.buffer + rule.replacement.len);

    size_t start = match.position(0);
    size_t end = start + match.length(0);
    cz::Str before = line.slice_end(start);
    cz::Str after = line.slice_start(end);
    out->reserve(before.len + replaced.size() + after.len);
    out->append(before);
    out->append(cz::Str{replaced.data(), replaced.size()});
    out->append(after);
    return true;
}

/// Run every rule over `line` in order, leaving the result in `*result`.
static size_t apply_rules_to_line(const Compiled_Overlay& overlay,
                                  cz::Str line,
                                  bool first_line,
                                  cz::Heap_String* result,
                                  cz::Heap_String* scratch) {
    result->len = 0;
    result->reserve(line.len);
    result->append(line);

    size_t count = 0;
    for (size_t i = 0; i < overlay.rules.len; ++i) {
        const Compiled_Rule& rule = overlay.rules[i];
        if (rule.scope == Line_Rule::FIRST_LINE && !first_line) {
            continue;
        }

        scratch->len = 0;
        if (apply_rule(rule, *result, scratch)) {
            cz::swap(*result, *scratch);
            ++count;
        }
    }
    return count;
}

size_t apply_line_rules(const Compiled_Overlay& overlay,
                        cz::Str text,
                        const Region_Map& map,
                        cz::Heap_String* out) {
    ZoneScoped;

    out->reserve(text.len);
    if (overlay.rules.len == 0) {
        out->append(text);
        return 0;
    }

    cz::Heap_String result = {};
    CZ_DEFER(result.drop());
    cz::Heap_String scratch = {};
    CZ_DEFER(scratch.drop());

    size_t count = 0;
    size_t region = 0;
    size_t line_number = 0;
    cz::Str remaining = text;
    while (remaining.len > 0) {
        cz::Str line = remaining;
        bool split = remaining.split_excluding('\n', &line, &remaining);

        while (region < map.regions.len && map.regions[region].end_line <= line_number) {
            ++region;
        }

        if (region < map.regions.len && map.regions[region].kind == Region::PROSE) {
            count += apply_rules_to_line(overlay, line, line_number == 0, &result, &scratch);
            line = result;
        }

        out->reserve(line.len + 1);
        out->append(line);
        if (split) {
            out->push('\n');
        } else {
            break;
        }
        ++line_number;
    }
    return count;
}

}
