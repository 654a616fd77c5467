#pragma once

#include <stdint.h>
#include <cz/slice.hpp>
#include <cz/str.hpp>
#include "core/buffer_id.hpp"
#include "core/edit.hpp"
#include "core/text_buffer.hpp"
#include "snippet/placeholder_groups.hpp"
#include "snippet/snippet.hpp"
#include "snippet/variables.hpp"

namespace snip {

namespace Session_State_ {
enum Session_State {
    /// Not started or the snippet had no tabstops.
    INACTIVE,
    /// Editing the tabstop `Snippet_Session::active_index`.
    ACTIVE,
    /// Navigated to `$0` or past the last tabstop.
    FINISHED,
    /// Cancelled explicitly or because the user left the snippet.
    CANCELLED,
};
}
using Session_State_::Session_State;

/// One expansion of a snippet into a buffer.
///
/// The session mirrors edits to the active tabstop into the other placeholders
/// sharing its index and walks the cursor through the tabstops.  It sees the
/// buffer only through `buffer`.
struct Snippet_Session {
    Buffer_Id buffer_id;
    Text_Buffer buffer;

    Session_State state;
    Snippet snippet;
    Placeholder_Groups groups;
    uint64_t active_index;

    /// Set while the session is changing the buffer itself.  Change notifications
    /// received in the meantime are our own edits and are ignored.
    bool applying_edits;

    void init(Buffer_Id buffer_id, Text_Buffer buffer);
    void drop();

    /// Insert `body` at `position` and activate the first tabstop.
    /// Returns `true` if the session is now active.
    bool start(cz::Str body,
               const Variable_Resolver& resolver,
               bool select_on_insert,
               uint64_t position);

    /// Update the snippet after the buffer has been edited.
    void synchronize_updated_placeholders(const Text_Change& change);
    /// Process `changes` in the order they were applied to the buffer.
    void synchronize_updated_placeholders(cz::Slice<const Text_Change> changes);

    void next_placeholder();
    void previous_placeholder();

    /// Select the active placeholder again.
    void select_current_placeholder();

    /// Cancel if `cursor` has left the active placeholder.
    void check_position(uint64_t cursor);

    void cancel();

    bool is_active() const { return state == Session_State::ACTIVE; }

    /// The span of the active placeholder.  Only valid while active.
    Range active_span() const;
};

}
