#include <czt/test_base.hpp>

#include <cz/defer.hpp>
#include <cz/heap_string.hpp>
#include "core/overlay.hpp"
#include "core/region.hpp"
#include "custom/config.hpp"

using namespace braid;

namespace {
struct Overlay_Runner {
    Compiled_Overlay overlay = {};
    Region_Patterns patterns = {};
    Region_Map map = {};
    cz::Heap_String out = {};
    size_t count = 0;

    explicit Overlay_Runner(cz::Slice<const Line_Rule> rules) {
        cz::Heap_String error = {};
        CZ_DEFER(error.drop());
        REQUIRE(compile_line_rules(rules, &overlay, &error));
        REQUIRE(compile_region_patterns("#\\+BEGIN_SRC", "#\\+END_SRC", false, &patterns,
                                        &error));
    }
    ~Overlay_Runner() {
        overlay.drop();
        patterns.drop();
        map.drop();
        out.drop();
    }

    cz::Str run(cz::Str text) {
        out.len = 0;
        classify_regions(text, patterns, &map);
        count = apply_line_rules(overlay, text, map, &out);
        return out;
    }
};
}

TEST_CASE("apply_line_rules: summary line to source") {
    Overlay_Runner to_source(custom::orgel_overlay.to_source);
    CHECK(to_source.run(";; # # blah") == ";;; blah");
    CHECK(to_source.count == 1);
}

TEST_CASE("apply_line_rules: summary line to document") {
    Overlay_Runner to_document(custom::orgel_overlay.to_document);
    CHECK(to_document.run(";;; blah") == ";; # # blah");
}

TEST_CASE("apply_line_rules: summary rule only looks at the first line") {
    Overlay_Runner to_source(custom::orgel_overlay.to_source);
    CHECK(to_source.run(";; intro\n;; # # not a summary\n") == ";; intro\n;; # # not a summary\n");
    CHECK(to_source.count == 0);

    Overlay_Runner to_document(custom::orgel_overlay.to_document);
    CHECK(to_document.run(";; intro\n;;; not a summary\n") == ";; intro\n;;; not a summary\n");
    CHECK(to_document.count == 0);
}

TEST_CASE("apply_line_rules: single word headers round trip") {
    Overlay_Runner to_source(custom::orgel_overlay.to_source);
    Overlay_Runner to_document(custom::orgel_overlay.to_document);

    cz::Str doc = ";; intro\n;; * Foo\n(code)\n;; * Bar\n";
    cz::Str source = ";; intro\n;;; Foo:\n(code)\n;;; Bar:\n";
    CHECK(to_source.run(doc) == source);
    CHECK(to_source.count == 2);
    CHECK(to_document.run(source) == doc);
    CHECK(to_document.count == 2);
}

TEST_CASE("apply_line_rules: multi word headers are left alone") {
    Overlay_Runner to_source(custom::orgel_overlay.to_source);
    CHECK(to_source.run(";; x\n;; * Foo Bar\n") == ";; x\n;; * Foo Bar\n");

    Overlay_Runner to_document(custom::orgel_overlay.to_document);
    CHECK(to_document.run(";; x\n;;; Foo Bar:\n;;; Foo\n") == ";; x\n;;; Foo Bar:\n;;; Foo\n");
}

TEST_CASE("apply_line_rules: no rules copies the text") {
    Overlay_Runner none(cz::Slice<const Line_Rule>{});
    CHECK(none.run(";; # # x\n;; * Foo\n") == ";; # # x\n;; * Foo\n");
    CHECK(none.count == 0);
}

TEST_CASE("apply_line_rules: absent constructs are a no-op") {
    Overlay_Runner to_source(custom::orgel_overlay.to_source);
    cz::Str text = ";; plain prose\n#+BEGIN_SRC emacs-lisp\n(foo)\n#+END_SRC\n";
    CHECK(to_source.run(text) == text);
    CHECK(to_source.count == 0);
}

TEST_CASE("apply_line_rules: code lines are never rewritten") {
    Overlay_Runner to_source(custom::orgel_overlay.to_source);
    cz::Str doc = ";; * Foo\n#+BEGIN_SRC emacs-lisp\n;; * Bar\n#+END_SRC\n;; * Baz\n";
    CHECK(to_source.run(doc) ==
          ";;; Foo:\n#+BEGIN_SRC emacs-lisp\n;; * Bar\n#+END_SRC\n;;; Baz:\n");
    CHECK(to_source.count == 2);

    Overlay_Runner to_document(custom::orgel_overlay.to_document);
    cz::Str source = ";; x\n#+BEGIN_SRC emacs-lisp\n;;; Commentary:\n(foo)\n#+END_SRC\n";
    CHECK(to_document.run(source) == source);
    CHECK(to_document.count == 0);
}

TEST_CASE("apply_line_rules: summary rule skips a first line that opens a block") {
    static const Line_Rule rules[] = {
        {Line_Rule::FIRST_LINE, "^#", ";;; #"},
    };
    Overlay_Runner runner({rules, 1});
    cz::Str text = "#+BEGIN_SRC emacs-lisp\n(foo)\n#+END_SRC\n";
    CHECK(runner.run(text) == text);
    CHECK(runner.count == 0);
}

TEST_CASE("compile_line_rules: rules own their strings") {
    cz::Heap_String pattern = {};
    CZ_DEFER(pattern.drop());
    pattern.reserve(16);
    pattern.append("^;; \\* (\\w+)$");
    cz::Heap_String replacement = {};
    CZ_DEFER(replacement.drop());
    replacement.reserve(8);
    replacement.append(";;; $1:");

    Line_Rule rules[] = {
        {Line_Rule::EVERY_LINE, pattern, replacement},
    };
    Overlay_Runner runner({rules, 1});

    // Clobber the originals so that any reference to them would be noticed.
    for (size_t i = 0; i < pattern.len; ++i) {
        pattern.buffer[i] = 'x';
    }
    for (size_t i = 0; i < replacement.len; ++i) {
        replacement.buffer[i] = 'x';
    }

    CHECK(runner.run(";; * Foo\n") == ";;; Foo:\n");
    REQUIRE(runner.overlay.rules.len == 1);
    CHECK(runner.overlay.rules[0].source == "^;; \\* (\\w+)$");
    CHECK(runner.overlay.rules[0].replacement == ";;; $1:");

    cz::Heap_Vector<Line_Rule> borrowed = {};
    CZ_DEFER(borrowed.drop());
    borrow_line_rules(runner.overlay, &borrowed);
    REQUIRE(borrowed.len == 1);
    CHECK(borrowed[0].scope == Line_Rule::EVERY_LINE);
    CHECK(borrowed[0].pattern == "^;; \\* (\\w+)$");
    CHECK(borrowed[0].replacement == ";;; $1:");
}

TEST_CASE("compile_line_rules: invalid rule") {
    static const Line_Rule rules[] = {
        {Line_Rule::EVERY_LINE, "^a", "b"},
        {Line_Rule::EVERY_LINE, "[", "c"},
    };
    Compiled_Overlay overlay = {};
    CZ_DEFER(overlay.drop());
    cz::Heap_String error = {};
    CZ_DEFER(error.drop());
    CHECK_FALSE(compile_line_rules({rules, 2}, &overlay, &error));
    CHECK(error.starts_with("Invalid line rule `[`"));
}
