#pragma once

#include <cz/str.hpp>

namespace snip {
namespace custom {

/// Add an empty `$0` to the end of snippets that don't have one so the
/// cursor ends up after the snippet once every tabstop has been visited.
extern bool insert_final_tabstop;

/// Select the text of a placeholder when it becomes active.  Otherwise the
/// cursor is put at the end of it.
extern bool select_on_insert;

/// Shown by the mode line while a buffer has an active snippet.
extern cz::Str snippet_status_text;

/// Shown when a session ends because of an edit or cursor movement outside it.
extern cz::Str cancel_message;

}
}
