#include <czt/test_base.hpp>

#include <cz/defer.hpp>
#include "custom/config.hpp"
#include "test_runner.hpp"

using namespace snip;

TEST_CASE("Snippet_Registry: insert_snippet") {
    Test_Runner tr;
    tr.setup("|");

    CHECK_FALSE(tr.registry.buffer_entered(tr.buffer_id));

    REQUIRE(tr.insert_snippet("${1:a}"));
    CHECK(tr.registry.entries.len == 1);
    CHECK(tr.registry.buffer_entered(tr.buffer_id));

    // Other buffers are unaffected.
    Buffer_Id other = {2};
    CHECK(tr.registry.active_session(other) == nullptr);
    CHECK_FALSE(tr.registry.next_placeholder(other));
}

TEST_CASE("Snippet_Registry: a new snippet replaces the old session") {
    Test_Runner tr;
    tr.setup("|");

    REQUIRE(tr.insert_snippet("${1:a}"));

    tr.move_cursor(1);
    REQUIRE(tr.insert_snippet("${1:b}"));
    CHECK(tr.stringify() == "a(b|");
    CHECK(tr.registry.entries.len == 1);
    CHECK(tr.messages.len == 0);

    Snippet_Session* second = tr.session();
    REQUIRE(second);
    CHECK(second->active_span() == Range{1, 2});
}

TEST_CASE("Snippet_Registry: placeholder commands without a session") {
    Test_Runner tr;
    tr.setup("|");

    CHECK_FALSE(tr.registry.next_placeholder(tr.buffer_id));
    CHECK_FALSE(tr.registry.previous_placeholder(tr.buffer_id));
    CHECK_FALSE(tr.registry.select_current_placeholder(tr.buffer_id));

    // Notifications for buffers without a session are ignored.
    Text_Change change = {};
    change.range = {0, 0};
    change.new_text = "x";
    tr.registry.text_changed(tr.buffer_id, {&change, 1});
    tr.registry.cursor_moved(tr.buffer_id, 0);
    CHECK(tr.messages.len == 0);
}

TEST_CASE("Snippet_Registry: cancel") {
    Test_Runner tr;
    tr.setup("|");

    REQUIRE(tr.insert_snippet("${1:a} $2"));
    tr.registry.cancel(tr.buffer_id);
    CHECK_FALSE(tr.session());
    CHECK(tr.registry.entries.len == 0);
    CHECK(tr.messages.len == 0);
    CHECK_FALSE(tr.registry.next_placeholder(tr.buffer_id));

    // Cancelling twice is harmless.
    tr.registry.cancel(tr.buffer_id);
}

TEST_CASE("Snippet_Registry: buffer_closed") {
    Test_Runner tr;
    tr.setup("|");

    REQUIRE(tr.insert_snippet("${1:a}"));
    tr.registry.buffer_closed(tr.buffer_id);
    CHECK(tr.registry.entries.len == 0);
    CHECK_FALSE(tr.registry.buffer_entered(tr.buffer_id));
}

TEST_CASE("Snippet_Registry: finished sessions are removed") {
    Test_Runner tr;
    tr.setup("|");

    REQUIRE(tr.insert_snippet("${1:a}b"));
    CHECK(tr.registry.next_placeholder(tr.buffer_id));
    CHECK(tr.stringify() == "ab|");
    CHECK(tr.registry.entries.len == 0);
    CHECK(tr.messages.len == 0);
}

TEST_CASE("Snippet_Registry: resolve_snippet") {
    Test_Runner tr;
    tr.context.file_path = "/tmp/list.hpp";

    Snippet snippet = {};
    tr.registry.resolve_snippet("#pragma once // ${1:$TM_FILENAME}",
                                context_variable_resolver(&tr.context), &snippet);
    CZ_DEFER(snippet.drop());

    cz::String rendered = {};
    snippet.render(tr.allocator(), &rendered);
    CHECK(rendered == "#pragma once // list.hpp");
    CHECK(snippet.start == 0);
    CHECK(snippet.end == rendered.len);
    CHECK(snippet.has_tabstop(0));
    CHECK(tr.registry.entries.len == 0);
}
