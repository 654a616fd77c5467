#include <czt/test_base.hpp>

#include <cz/buffer_array.hpp>
#include <cz/defer.hpp>
#include "snippet/parser.hpp"

using namespace snip;

static cz::String render(cz::Allocator allocator, const Snippet& snippet) {
    cz::String out = {};
    snippet.render(allocator, &out);
    return out;
}

static const Marker& top(const Snippet& snippet, size_t index) {
    return snippet.markers[snippet.children[index]];
}

TEST_CASE("parse: plain text") {
    cz::Buffer_Array buffer_array;
    buffer_array.init();
    CZ_DEFER(buffer_array.drop());

    Snippet snippet = {};
    parse("hello world", false, &snippet);
    CZ_DEFER(snippet.drop());

    REQUIRE(snippet.children.len == 1);
    CHECK(top(snippet, 0).tag == Marker::TEXT);
    CHECK(top(snippet, 0).value == "hello world");
    CHECK(render(buffer_array.allocator(), snippet) == "hello world");
}

TEST_CASE("parse: tabstops") {
    cz::Buffer_Array buffer_array;
    buffer_array.init();
    CZ_DEFER(buffer_array.drop());

    Snippet snippet = {};
    parse("a$1b${22}c", false, &snippet);
    CZ_DEFER(snippet.drop());

    REQUIRE(snippet.children.len == 5);
    CHECK(top(snippet, 1).tag == Marker::PLACEHOLDER);
    CHECK(top(snippet, 1).index == 1);
    CHECK(top(snippet, 1).children.len == 0);
    CHECK(top(snippet, 3).tag == Marker::PLACEHOLDER);
    CHECK(top(snippet, 3).index == 22);
    CHECK(render(buffer_array.allocator(), snippet) == "abc");
}

TEST_CASE("parse: placeholders") {
    cz::Buffer_Array buffer_array;
    buffer_array.init();
    CZ_DEFER(buffer_array.drop());

    Snippet snippet = {};
    parse("${1:foo ${2:bar ${3:baz}}}", false, &snippet);
    CZ_DEFER(snippet.drop());

    REQUIRE(snippet.children.len == 1);
    const Marker& one = top(snippet, 0);
    CHECK(one.index == 1);
    REQUIRE(one.children.len == 2);

    const Marker& two = snippet.markers[one.children[1]];
    CHECK(two.tag == Marker::PLACEHOLDER);
    CHECK(two.index == 2);
    CHECK(two.parent == snippet.children[0]);
    REQUIRE(two.children.len == 2);

    const Marker& three = snippet.markers[two.children[1]];
    CHECK(three.index == 3);
    CHECK(snippet.is_descendant(two.children[1], snippet.children[0]));

    CHECK(render(buffer_array.allocator(), snippet) == "foo bar baz");
}

TEST_CASE("parse: choices") {
    cz::Buffer_Array buffer_array;
    buffer_array.init();
    CZ_DEFER(buffer_array.drop());

    Snippet snippet = {};

    SECTION("basic") {
        parse("${1|red,green,blue|}", false, &snippet);
        REQUIRE(snippet.children.len == 1);
        const Marker& marker = top(snippet, 0);
        REQUIRE(marker.choices.len == 3);
        CHECK(marker.choices[0] == "red");
        CHECK(marker.choices[1] == "green");
        CHECK(marker.choices[2] == "blue");
        CHECK(render(buffer_array.allocator(), snippet) == "red");
    }

    SECTION("escapes") {
        parse("${1|a\\,b,c\\|d,\\$e|}", false, &snippet);
        REQUIRE(snippet.children.len == 1);
        const Marker& marker = top(snippet, 0);
        REQUIRE(marker.choices.len == 3);
        CHECK(marker.choices[0] == "a,b");
        CHECK(marker.choices[1] == "c|d");
        CHECK(marker.choices[2] == "$e");
    }

    SECTION("missing closing brace after the choices") {
        parse("${1|a,b|x}", false, &snippet);
        CHECK(render(buffer_array.allocator(), snippet) == "${1|a,b|x}");
    }

    snippet.drop();
}

TEST_CASE("parse: variables") {
    cz::Buffer_Array buffer_array;
    buffer_array.init();
    CZ_DEFER(buffer_array.drop());

    Snippet snippet = {};
    parse("$TM_FILENAME ${TM_SELECTED_TEXT} ${FOO:${1:bar}}", false, &snippet);
    CZ_DEFER(snippet.drop());

    REQUIRE(snippet.children.len == 5);
    CHECK(top(snippet, 0).tag == Marker::VARIABLE);
    CHECK(top(snippet, 0).value == "TM_FILENAME");
    CHECK(top(snippet, 2).tag == Marker::VARIABLE);
    CHECK(top(snippet, 2).value == "TM_SELECTED_TEXT");

    const Marker& foo = top(snippet, 4);
    CHECK(foo.value == "FOO");
    REQUIRE(foo.children.len == 1);
    CHECK(snippet.markers[foo.children[0]].tag == Marker::PLACEHOLDER);

    // Unresolved variables without a default are empty.
    CHECK(render(buffer_array.allocator(), snippet) == "  bar");
}

TEST_CASE("parse: transforms") {
    Snippet snippet = {};
    parse("${1/(a|b)\\/c/$1\\/x/gi}", false, &snippet);
    CZ_DEFER(snippet.drop());

    REQUIRE(snippet.children.len == 1);
    const Marker& marker = top(snippet, 0);
    bool has_transform = marker.transform;
    REQUIRE(has_transform);
    CHECK(marker.transform->regex_source == "(a|b)/c");
    CHECK(marker.transform->format_source == "$1\\/x");
    CHECK(marker.transform->flags == "gi");
    CHECK(marker.transform->global);
    CHECK(marker.transform->case_insensitive);
    REQUIRE(marker.transform->format.len == 2);
    CHECK(marker.transform->format[0].tag == Format_Fragment::GROUP);
    CHECK(marker.transform->format[0].group == 1);
    CHECK(marker.transform->format[1].tag == Format_Fragment::TEXT);
    CHECK(marker.transform->format[1].text == "/x");
}

TEST_CASE("parse: transform format with case shapes") {
    cz::Buffer_Array buffer_array;
    buffer_array.init();
    CZ_DEFER(buffer_array.drop());

    Snippet snippet = {};
    parse("${1/(.*)/${1:/upcase}/g}x", false, &snippet);
    CZ_DEFER(snippet.drop());

    REQUIRE(snippet.children.len == 2);
    const Marker& marker = top(snippet, 0);
    bool has_transform = marker.transform;
    REQUIRE(has_transform);
    CHECK(marker.transform->format_source == "${1:/upcase}");
    CHECK(marker.transform->flags == "g");
    REQUIRE(marker.transform->format.len == 1);
    CHECK(marker.transform->format[0].tag == Format_Fragment::GROUP);
    CHECK(marker.transform->format[0].shape == Case_Shape::UPCASE);
    CHECK(top(snippet, 1).value == "x");
}

TEST_CASE("parse: escapes") {
    cz::Buffer_Array buffer_array;
    buffer_array.init();
    CZ_DEFER(buffer_array.drop());

    Snippet snippet = {};

    SECTION("special characters") {
        parse("\\$1 \\} \\\\", false, &snippet);
        REQUIRE(snippet.children.len == 1);
        CHECK(render(buffer_array.allocator(), snippet) == "$1 } \\");
    }

    SECTION("other backslashes are literal") {
        parse("a\\b\\", false, &snippet);
        CHECK(render(buffer_array.allocator(), snippet) == "a\\b\\");
    }

    SECTION("inside a placeholder") {
        parse("${1:a\\}b}", false, &snippet);
        REQUIRE(snippet.children.len == 1);
        CHECK(render(buffer_array.allocator(), snippet) == "a}b");
    }

    snippet.drop();
}

TEST_CASE("parse: malformed input is text") {
    cz::Buffer_Array buffer_array;
    buffer_array.init();
    CZ_DEFER(buffer_array.drop());

    Snippet snippet = {};

    SECTION("lone dollar") {
        parse("cost: $ 5 $", false, &snippet);
        REQUIRE(snippet.children.len == 1);
        CHECK(render(buffer_array.allocator(), snippet) == "cost: $ 5 $");
    }

    SECTION("empty braces") {
        parse("${}", false, &snippet);
        CHECK(render(buffer_array.allocator(), snippet) == "${}");
    }

    SECTION("top level closing brace") {
        parse("a}b", false, &snippet);
        REQUIRE(snippet.children.len == 1);
        CHECK(render(buffer_array.allocator(), snippet) == "a}b");
    }

    SECTION("unterminated brace") {
        parse("a ${1:foo $2", false, &snippet);
        REQUIRE(snippet.children.len == 1);
        CHECK(top(snippet, 0).tag == Marker::TEXT);
        CHECK(render(buffer_array.allocator(), snippet) == "a ${1:foo $2");
    }

    SECTION("unterminated nested brace") {
        parse("x ${1:a ${2:b} c", false, &snippet);
        REQUIRE(snippet.children.len == 1);
        CHECK(render(buffer_array.allocator(), snippet) == "x ${1:a ${2:b} c");
    }

    SECTION("unterminated transform") {
        parse("${1/a/b", false, &snippet);
        REQUIRE(snippet.children.len == 1);
        CHECK(render(buffer_array.allocator(), snippet) == "${1/a/b");
    }

    SECTION("bad character resumes parsing") {
        parse("${1x} $2", false, &snippet);
        REQUIRE(snippet.children.len == 2);
        CHECK(top(snippet, 0).value == "${1x} ");
        CHECK(top(snippet, 1).tag == Marker::PLACEHOLDER);
        CHECK(top(snippet, 1).index == 2);
    }

    SECTION("invalid regex") {
        parse("${1/(/x/}", false, &snippet);
        REQUIRE(snippet.children.len == 1);
        CHECK(top(snippet, 0).tag == Marker::TEXT);
        CHECK(render(buffer_array.allocator(), snippet) == "${1/(/x/}");
    }

    snippet.drop();
}

TEST_CASE("parse: final tabstop") {
    Snippet snippet = {};

    SECTION("appended") {
        parse("a$1", true, &snippet);
        REQUIRE(snippet.children.len == 3);
        CHECK(top(snippet, 2).tag == Marker::PLACEHOLDER);
        CHECK(top(snippet, 2).index == 0);
        CHECK(top(snippet, 2).children.len == 0);
    }

    SECTION("explicit") {
        parse("a$0b", true, &snippet);
        REQUIRE(snippet.children.len == 3);
        CHECK(top(snippet, 1).index == 0);
    }

    SECTION("nested explicit") {
        parse("${1:${0}}", true, &snippet);
        CHECK(snippet.children.len == 1);
    }

    SECTION("disabled") {
        parse("a$1", false, &snippet);
        CHECK(snippet.children.len == 2);
    }

    SECTION("only inside a mirror") {
        parse("${1:a} ${1:$0}", true, &snippet);
        CHECK(snippet.has_tabstop(0));
        REQUIRE(snippet.children.len == 4);
        CHECK(top(snippet, 3).index == 0);
        CHECK(top(snippet, 3).children.len == 0);
    }

    snippet.drop();
}

TEST_CASE("parse: mirrors take the value of the first placeholder") {
    cz::Buffer_Array buffer_array;
    buffer_array.init();
    CZ_DEFER(buffer_array.drop());

    Snippet snippet = {};
    parse("${1:foo} $1 ${1:bar}", false, &snippet);
    CZ_DEFER(snippet.drop());

    CHECK(render(buffer_array.allocator(), snippet) == "foo foo foo");
}
