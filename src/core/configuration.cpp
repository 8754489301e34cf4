#include "configuration.hpp"

#include <cz/defer.hpp>
#include <cz/format.hpp>
#include <cz/util.hpp>
#include <tracy/Tracy.hpp>
#include "tracy_format.hpp"

namespace braid {

void Configuration::drop() {
    name.drop();
    this_name.drop();
    that_name.drop();
    comment.drop();
    region_start.drop();
    region_end.drop();
    patterns.drop();
    line_rules.drop();
    inverse_rules.drop();
}

static void set_error(cz::Heap_String* error, cz::Str message) {
    error->len = 0;
    error->reserve(message.len);
    error->append(message);
}

static bool check_field(cz::Str configuration,
                        cz::Str field,
                        cz::Str value,
                        cz::Heap_String* error) {
    if (value.len > 0) {
        return true;
    }

    cz::Heap_String message = cz::format("Configuration ", configuration, ": missing ", field);
    CZ_DEFER(message.drop());
    set_error(error, message);
    return false;
}

/// Prefix `error` with the configuration name.
static void qualify_error(cz::Str configuration, cz::Heap_String* error) {
    cz::Heap_String message = cz::format("Configuration ", configuration, ": ", *error);
    CZ_DEFER(message.drop());
    set_error(error, message);
}

bool make_configuration(const Configuration_Options& options,
                        Configuration* config,
                        cz::Heap_String* error) {
    ZoneScoped;

    *config = {};

    cz::Str name = options.name.len > 0 ? options.name : cz::Str("<unnamed>");
    if (!check_field(name, "name", options.name, error) ||
        !check_field(name, "this buffer", options.this_name, error) ||
        !check_field(name, "target", options.that_name, error) ||
        !check_field(name, "comment", options.comment, error) ||
        !check_field(name, "region start pattern", options.region_start, error) ||
        !check_field(name, "region end pattern", options.region_end, error)) {
        return false;
    }

    if (!compile_region_patterns(options.region_start, options.region_end,
                                 options.case_sensitive, &config->patterns, error)) {
        qualify_error(name, error);
        return false;
    }

    cz::Slice<const Line_Rule> rules = options.overlay.to_source;
    cz::Slice<const Line_Rule> inverse_rules = options.overlay.to_document;
    if (options.strategy == COMMENTED_BLOCK) {
        cz::swap(rules, inverse_rules);
    }
    if (!compile_line_rules(rules, &config->line_rules, error) ||
        !compile_line_rules(inverse_rules, &config->inverse_rules, error)) {
        qualify_error(name, error);
        config->drop();
        *config = {};
        return false;
    }

    assign_string(&config->name, options.name);
    assign_string(&config->this_name, options.this_name);
    assign_string(&config->that_name, options.that_name);
    config->strategy = options.strategy;
    assign_string(&config->comment, options.comment);
    assign_string(&config->region_start, options.region_start);
    assign_string(&config->region_end, options.region_end);
    config->case_sensitive = options.case_sensitive;
    return true;
}

bool invert_configuration(const Configuration& config,
                          Configuration* inverse,
                          cz::Heap_String* error) {
    ZoneScoped;

    Configuration_Options options = {};
    options.name = config.name;
    options.this_name = config.that_name;
    options.that_name = config.this_name;
    options.strategy = invert_strategy(config.strategy);
    options.comment = config.comment;
    options.region_start = config.region_start;
    options.region_end = config.region_end;
    options.case_sensitive = config.case_sensitive;

    cz::Heap_Vector<Line_Rule> to_source = {};
    CZ_DEFER(to_source.drop());
    cz::Heap_Vector<Line_Rule> to_document = {};
    CZ_DEFER(to_document.drop());
    if (config.strategy == UNCOMMENTED_BLOCK) {
        borrow_line_rules(config.line_rules, &to_source);
        borrow_line_rules(config.inverse_rules, &to_document);
    } else {
        borrow_line_rules(config.inverse_rules, &to_source);
        borrow_line_rules(config.line_rules, &to_document);
    }
    options.overlay.to_source = {to_source.elems, to_source.len};
    options.overlay.to_document = {to_document.elems, to_document.len};

    return make_configuration(options, inverse, error);
}

static void transform_unchecked(const Configuration& config, cz::Str text, cz::Heap_String* out) {
    Region_Map map = {};
    CZ_DEFER(map.drop());
    classify_regions(text, config.patterns, &map);

    if (config.strategy == UNCOMMENTED_BLOCK) {
        // Comment the prose and then rewrite the commented prose lines.
        cz::Heap_String commented = {};
        CZ_DEFER(commented.drop());
        transform_blocks(config.strategy, config.comment, text, map, &commented);

        apply_line_rules(config.line_rules, commented, map, out);
    } else if (config.line_rules.rules.len == 0) {
        transform_blocks(config.strategy, config.comment, text, map, out);
    } else {
        // Rewrite the commented prose lines and then uncomment them.
        cz::Heap_String rewritten = {};
        CZ_DEFER(rewritten.drop());
        apply_line_rules(config.line_rules, text, map, &rewritten);

        // The lines are the same but their byte offsets moved.
        classify_regions(rewritten, config.patterns, &map);
        transform_blocks(config.strategy, config.comment, rewritten, map, out);
    }
}

bool transform(const Configuration& config,
               cz::Str text,
               cz::Heap_String* out,
               cz::Heap_String* error) {
    ZoneScoped;

    cz::Heap_String result = {};
    CZ_DEFER(result.drop());
    try {
        transform_unchecked(config, text, &result);
    } catch (std::regex_error& ex) {
        cz::Heap_String message =
            cz::format("Configuration ", config.name, ": ", cz::Str(ex.what()));
        CZ_DEFER(message.drop());
        set_error(error, message);
        return false;
    }

    out->reserve(result.len);
    out->append(result);
    return true;
}

bool clone(const Configuration& config,
           const Buffer& this_buffer,
           Buffer* that_buffer,
           cz::Heap_String* error) {
    ZoneScoped;

    TracyFormat(message, len, 1024, "Clone %.*s: %.*s -> %.*s", (int)config.name.len,
                config.name.buffer, (int)this_buffer.name.len, this_buffer.name.buffer,
                (int)config.that_name.len, config.that_name.buffer);
    TracyMessage(message, len);

    cz::Heap_String contents = {};
    CZ_DEFER(contents.drop());
    if (!transform(config, this_buffer.contents, &contents, error)) {
        cz::Heap_String message = cz::format("Failed to clone ", config.name, " (",
                                             this_buffer.name, " -> ", config.that_name,
                                             "): ", *error);
        CZ_DEFER(message.drop());
        set_error(error, message);
        return false;
    }

    if (that_buffer->name.len == 0) {
        assign_string(&that_buffer->name, config.that_name);
    }

    // `contents` now holds the old text and is dropped on return.
    swap_contents(that_buffer, &contents);
    return true;
}

/// Find the start and length of line `line` in `text`.
static void find_line(cz::Str text, size_t line, uint64_t* start, uint64_t* len) {
    uint64_t position = 0;
    for (size_t l = 0; l < line && position < text.len; ++position) {
        if (text[position] == '\n') {
            ++l;
        }
    }
    *start = position;
    *len = text.slice_start(position).find_index('\n');
}

bool convert_location(const Configuration& config,
                      cz::Str this_text,
                      uint64_t position,
                      uint64_t* that_position,
                      cz::Heap_String* error) {
    ZoneScoped;

    cz::Heap_String that_text = {};
    CZ_DEFER(that_text.drop());
    if (!transform(config, this_text, &that_text, error)) {
        return false;
    }

    if (position >= this_text.len) {
        *that_position = that_text.len;
        return true;
    }

    size_t line = 0;
    uint64_t this_start = 0;
    for (uint64_t i = 0; i < position; ++i) {
        if (this_text[i] == '\n') {
            ++line;
            this_start = i + 1;
        }
    }
    uint64_t this_len = this_text.slice_start(this_start).find_index('\n');
    uint64_t column = position - this_start;

    uint64_t that_start, that_len;
    find_line(that_text, line, &that_start, &that_len);

    // Commenting pushes the text right; uncommenting pulls it left.
    if (that_len >= this_len) {
        column += that_len - this_len;
    } else if (column >= this_len - that_len) {
        column -= this_len - that_len;
    } else {
        column = 0;
    }
    if (column > that_len) {
        column = that_len;
    }

    *that_position = that_start + column;
    return true;
}

bool check_round_trip(const Configuration& config,
                      cz::Str text,
                      bool* matches,
                      cz::Heap_String* error) {
    ZoneScoped;

    Configuration inverse = {};
    if (!invert_configuration(config, &inverse, error)) {
        return false;
    }
    CZ_DEFER(inverse.drop());

    cz::Heap_String there = {};
    CZ_DEFER(there.drop());
    if (!transform(config, text, &there, error)) {
        return false;
    }

    cz::Heap_String back = {};
    CZ_DEFER(back.drop());
    if (!transform(inverse, there, &back, error)) {
        return false;
    }

    *matches = (cz::Str(back) == text);
    return true;
}

}
