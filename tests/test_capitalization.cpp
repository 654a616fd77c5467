#include <czt/test_base.hpp>

#include <cz/buffer_array.hpp>
#include <cz/defer.hpp>
#include <cz/heap.hpp>
#include "snippet/capitalization.hpp"

using namespace snip;

TEST_CASE("parse_components") {
    cz::Vector<cz::Str> components = {};
    CZ_DEFER(components.drop(cz::heap_allocator()));

    SECTION("snake") {
        parse_components("abc_def", cz::heap_allocator(), &components);
        REQUIRE(components.len == 2);
        CHECK(components[0] == "abc");
        CHECK(components[1] == "def");
    }

    SECTION("kebab") {
        parse_components("abc-def-g", cz::heap_allocator(), &components);
        REQUIRE(components.len == 3);
        CHECK(components[2] == "g");
    }

    SECTION("repeated separators are skipped") {
        parse_components("abc__def", cz::heap_allocator(), &components);
        REQUIRE(components.len == 2);
        CHECK(components[0] == "abc");
        CHECK(components[1] == "def");
    }

    SECTION("camel") {
        parse_components("aComponent", cz::heap_allocator(), &components);
        REQUIRE(components.len == 2);
        CHECK(components[0] == "a");
        CHECK(components[1] == "Component");
    }

    SECTION("mixed separators and case") {
        parse_components("foo_barBaz qux2Quux", cz::heap_allocator(), &components);
        REQUIRE(components.len == 5);
        CHECK(components[0] == "foo");
        CHECK(components[1] == "bar");
        CHECK(components[2] == "Baz");
        CHECK(components[3] == "qux2");
        CHECK(components[4] == "Quux");
    }

    SECTION("capital chains") {
        parse_components("ANSISwissMAP", cz::heap_allocator(), &components);
        REQUIRE(components.len == 3);
        CHECK(components[0] == "ANSI");
        CHECK(components[1] == "Swiss");
        CHECK(components[2] == "MAP");
    }
}

TEST_CASE("apply_case_shape") {
    cz::Buffer_Array buffer_array;
    buffer_array.init();
    CZ_DEFER(buffer_array.drop());
    cz::String out = {};

    SECTION("upcase") {
        apply_case_shape(Case_Shape::UPCASE, "hello World", buffer_array.allocator(), &out);
        CHECK(out == "HELLO WORLD");
    }
    SECTION("downcase") {
        apply_case_shape(Case_Shape::DOWNCASE, "Hello WORLD", buffer_array.allocator(), &out);
        CHECK(out == "hello world");
    }
    SECTION("capitalize") {
        apply_case_shape(Case_Shape::CAPITALIZE, "hello world", buffer_array.allocator(), &out);
        CHECK(out == "Hello world");
    }
    SECTION("camel") {
        apply_case_shape(Case_Shape::CAMELCASE, "foo_bar_baz", buffer_array.allocator(), &out);
        CHECK(out == "fooBarBaz");
    }
    SECTION("pascal") {
        apply_case_shape(Case_Shape::PASCALCASE, "foo-bar", buffer_array.allocator(), &out);
        CHECK(out == "FooBar");
    }
    SECTION("surrounding underscores are kept") {
        apply_case_shape(Case_Shape::CAMELCASE, "_foo_bar_", buffer_array.allocator(), &out);
        CHECK(out == "_fooBar_");
    }
    SECTION("none") {
        apply_case_shape(Case_Shape::NONE, "fOo", buffer_array.allocator(), &out);
        CHECK(out == "fOo");
    }
    SECTION("empty") {
        apply_case_shape(Case_Shape::PASCALCASE, "", buffer_array.allocator(), &out);
        CHECK(out == "");
    }
}

TEST_CASE("parse_case_shape") {
    Case_Shape shape = Case_Shape::NONE;
    CHECK(parse_case_shape("upcase", &shape));
    CHECK(shape == Case_Shape::UPCASE);
    CHECK(parse_case_shape("pascalcase", &shape));
    CHECK(shape == Case_Shape::PASCALCASE);
    CHECK_FALSE(parse_case_shape("UPCASE", &shape));
    CHECK_FALSE(parse_case_shape("", &shape));
}
