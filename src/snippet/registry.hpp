#pragma once

#include <stdint.h>
#include <cz/slice.hpp>
#include <cz/str.hpp>
#include <cz/vector.hpp>
#include "core/buffer_id.hpp"
#include "core/edit.hpp"
#include "core/text_buffer.hpp"
#include "custom/config.hpp"
#include "snippet/session.hpp"

namespace snip {

/// Tracks the snippet session of each buffer.  A buffer has at most one session;
/// sessions are destroyed as soon as they stop being active.
///
/// The editor owns the registry and forwards buffer events to it.
struct Snippet_Registry {
    struct Entry {
        Buffer_Id buffer_id;
        Snippet_Session* session;
    };
    cz::Vector<Entry> entries;

    void drop();

    /// Expand `body` at `position`, replacing the buffer's current session.
    /// Returns `true` if a session is now active.
    bool insert_snippet(Buffer_Id buffer_id,
                        Text_Buffer buffer,
                        const Variable_Resolver& resolver,
                        cz::Str body,
                        uint64_t position,
                        bool select_on_insert = custom::select_on_insert);

    /// Parse and resolve `body` without inserting it.  Used to
    /// preview what a completion will insert.
    void resolve_snippet(cz::Str body, const Variable_Resolver& resolver, Snippet* out);

    /// The active session of the buffer or `nullptr`.
    Snippet_Session* active_session(Buffer_Id buffer_id);

    void text_changed(Buffer_Id buffer_id, cz::Slice<const Text_Change> changes);
    void cursor_moved(Buffer_Id buffer_id, uint64_t cursor);

    /// These return `false` if the buffer has no active
    /// session so the key can fall back to its normal binding.
    bool next_placeholder(Buffer_Id buffer_id);
    bool previous_placeholder(Buffer_Id buffer_id);
    bool select_current_placeholder(Buffer_Id buffer_id);

    void cancel(Buffer_Id buffer_id);

    /// Returns `true` if the status indicator
    /// (`custom::snippet_status_text`) should be shown.
    bool buffer_entered(Buffer_Id buffer_id);
    void buffer_closed(Buffer_Id buffer_id);
};

}
