#include <czt/test_base.hpp>

#include <cz/defer.hpp>
#include <cz/heap_string.hpp>
#include "core/buffer.hpp"

using namespace braid;

TEST_CASE("count_lines") {
    CHECK(count_lines("") == 0);
    CHECK(count_lines("a") == 1);
    CHECK(count_lines("a\n") == 1);
    CHECK(count_lines("\n") == 1);
    CHECK(count_lines("a\nb") == 2);
    CHECK(count_lines("a\n\n") == 2);
}

TEST_CASE("swap_contents") {
    Buffer buffer = {};
    CZ_DEFER(buffer.drop());
    init_buffer(&buffer, "name", "old");
    CHECK_FALSE(buffer.has_path());

    cz::Heap_String contents = {};
    CZ_DEFER(contents.drop());
    assign_string(&contents, "new");

    swap_contents(&buffer, &contents);
    CHECK(buffer.contents == "new");
    CHECK(contents == "old");
}
