#include "registry.hpp"

#include <cz/assert.hpp>
#include <cz/heap.hpp>
#include <tracy/Tracy.hpp>
#include "snippet/parser.hpp"

namespace snip {

static void destroy_session(Snippet_Session* session) {
    session->drop();
    cz::heap_allocator().dealloc(session);
}

void Snippet_Registry::drop() {
    for (size_t i = 0; i < entries.len; ++i) {
        destroy_session(entries[i].session);
    }
    entries.drop(cz::heap_allocator());
}

static bool find_entry(const Snippet_Registry* registry, Buffer_Id buffer_id, size_t* index) {
    for (size_t i = 0; i < registry->entries.len; ++i) {
        if (registry->entries[i].buffer_id == buffer_id) {
            *index = i;
            return true;
        }
    }
    return false;
}

static void remove_entry(Snippet_Registry* registry, size_t index) {
    destroy_session(registry->entries[index].session);
    registry->entries.remove(index);
}

/// Destroy the buffer's session if it is no longer active.
static void prune(Snippet_Registry* registry, Buffer_Id buffer_id) {
    size_t index;
    if (find_entry(registry, buffer_id, &index) && !registry->entries[index].session->is_active()) {
        remove_entry(registry, index);
    }
}

bool Snippet_Registry::insert_snippet(Buffer_Id buffer_id,
                                      Text_Buffer buffer,
                                      const Variable_Resolver& resolver,
                                      cz::Str body,
                                      uint64_t position,
                                      bool select_on_insert) {
    ZoneScoped;

    // Remove the old session first so it doesn't see the insertion.
    size_t index;
    if (find_entry(this, buffer_id, &index)) {
        remove_entry(this, index);
    }

    Snippet_Session* session = cz::heap_allocator().alloc<Snippet_Session>();
    CZ_ASSERT(session);
    session->init(buffer_id, buffer);

    if (!session->start(body, resolver, select_on_insert, position)) {
        destroy_session(session);
        return false;
    }

    Entry entry;
    entry.buffer_id = buffer_id;
    entry.session = session;
    entries.reserve(cz::heap_allocator(), 1);
    entries.push(entry);
    return true;
}

void Snippet_Registry::resolve_snippet(cz::Str body,
                                       const Variable_Resolver& resolver,
                                       Snippet* out) {
    parse(body, custom::insert_final_tabstop, out);
    out->resolve_variables(resolver);
    out->compute_offsets(0);
}

Snippet_Session* Snippet_Registry::active_session(Buffer_Id buffer_id) {
    size_t index;
    if (!find_entry(this, buffer_id, &index)) {
        return nullptr;
    }
    Snippet_Session* session = entries[index].session;
    if (!session->is_active()) {
        return nullptr;
    }
    return session;
}

void Snippet_Registry::text_changed(Buffer_Id buffer_id, cz::Slice<const Text_Change> changes) {
    Snippet_Session* session = active_session(buffer_id);
    if (!session) {
        return;
    }

    // Changes the session makes itself are echoed back here while it is still working.
    if (session->applying_edits) {
        return;
    }

    session->synchronize_updated_placeholders(changes);
    prune(this, buffer_id);
}

void Snippet_Registry::cursor_moved(Buffer_Id buffer_id, uint64_t cursor) {
    Snippet_Session* session = active_session(buffer_id);
    if (!session || session->applying_edits) {
        return;
    }

    session->check_position(cursor);
    prune(this, buffer_id);
}

bool Snippet_Registry::next_placeholder(Buffer_Id buffer_id) {
    Snippet_Session* session = active_session(buffer_id);
    if (!session) {
        return false;
    }

    session->next_placeholder();
    prune(this, buffer_id);
    return true;
}

bool Snippet_Registry::previous_placeholder(Buffer_Id buffer_id) {
    Snippet_Session* session = active_session(buffer_id);
    if (!session) {
        return false;
    }

    session->previous_placeholder();
    prune(this, buffer_id);
    return true;
}

bool Snippet_Registry::select_current_placeholder(Buffer_Id buffer_id) {
    Snippet_Session* session = active_session(buffer_id);
    if (!session) {
        return false;
    }

    session->select_current_placeholder();
    return true;
}

void Snippet_Registry::cancel(Buffer_Id buffer_id) {
    size_t index;
    if (find_entry(this, buffer_id, &index)) {
        entries[index].session->cancel();
        remove_entry(this, index);
    }
}

bool Snippet_Registry::buffer_entered(Buffer_Id buffer_id) {
    prune(this, buffer_id);
    return active_session(buffer_id) != nullptr;
}

void Snippet_Registry::buffer_closed(Buffer_Id buffer_id) {
    cancel(buffer_id);
}

}
