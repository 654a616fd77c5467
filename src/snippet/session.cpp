#include "session.hpp"

#include <cz/assert.hpp>
#include <cz/defer.hpp>
#include <cz/heap.hpp>
#include <tracy/Tracy.hpp>
#include "custom/config.hpp"
#include "snippet/parser.hpp"

namespace snip {

void Snippet_Session::init(Buffer_Id buffer_id, Text_Buffer buffer) {
    this->buffer_id = buffer_id;
    this->buffer = buffer;
    state = Session_State::INACTIVE;
    snippet = {};
    groups = {};
    active_index = 0;
    applying_edits = false;
}

void Snippet_Session::drop() {
    snippet.drop();
    groups.drop();
}

static void cancel_with_message(Snippet_Session* session) {
    if (!session->is_active()) {
        return;
    }
    session->cancel();
    session->buffer.show_message(custom::cancel_message);
}

static void show_span(Snippet_Session* session, Range span, bool select) {
    if (select && span.len() > 0) {
        session->buffer.set_selection(span);
    } else {
        session->buffer.set_cursor(span.end);
    }
}

/// Make the group at `position` (in navigation order) active.
static void activate_group(Snippet_Session* session, size_t position, bool select) {
    const Placeholder_Group& group = session->groups.groups[position];
    const Marker& marker = session->snippet.markers[group.canonical()];
    Range span = marker.span();

    if (group.index == 0) {
        session->active_index = 0;
        session->state = Session_State::FINISHED;
        session->buffer.set_cursor(span.start);
        return;
    }

    session->active_index = group.index;
    session->state = Session_State::ACTIVE;
    show_span(session, span, select);

    if (marker.choices.len > 0) {
        session->buffer.show_choices(marker.choices.as_const_slice(), span);
    }
}

bool Snippet_Session::start(cz::Str body,
                            const Variable_Resolver& resolver,
                            bool select_on_insert,
                            uint64_t position) {
    ZoneScoped;

    parse(body, custom::insert_final_tabstop, &snippet);
    snippet.resolve_variables(resolver);
    snippet.compute_offsets(position);
    groups.rebuild(snippet);

    cz::String text = {};
    CZ_DEFER(text.drop(cz::heap_allocator()));
    snippet.render(cz::heap_allocator(), &text);
    CZ_DEBUG_ASSERT(snippet.end - snippet.start == text.len);

    applying_edits = true;
    buffer.insert_text(position, text);
    applying_edits = false;

    if (groups.groups.len == 0) {
        buffer.set_cursor(snippet.end);
        return false;
    }

    activate_group(this, 0, select_on_insert);
    return is_active();
}

Range Snippet_Session::active_span() const {
    const Placeholder_Group* group = groups.find(active_index);
    CZ_DEBUG_ASSERT(group);
    return snippet.markers[group->canonical()].span();
}

///////////////////////////////////////////////////////////////////////////////
// Synchronization
///////////////////////////////////////////////////////////////////////////////

/// Find the child of `parent` containing `range`.  Placeholders and variables
/// are preferred over text so insertions at their edges go into them.
static size_t find_child_containing(const Snippet& snippet, size_t parent, Range range) {
    const cz::Vector<size_t>& children = snippet.children_of(parent);
    size_t text = NO_MARKER;
    for (size_t i = 0; i < children.len; ++i) {
        const Marker& child = snippet.markers[children[i]];
        if (!child.span().contains(range)) {
            continue;
        }
        if (child.is_container()) {
            return children[i];
        }
        if (text == NO_MARKER) {
            text = children[i];
        }
    }
    return text;
}

/// Find the deepest marker under `marker` that can take an edit to `range`.
static size_t find_target(const Snippet& snippet, size_t marker, Range range) {
    while (1) {
        const Marker& current = snippet.markers[marker];
        // The children of a transformed marker aren't in the buffer.
        if (current.tag == Marker::TEXT || current.transform) {
            return marker;
        }

        size_t child = find_child_containing(snippet, marker, range);
        if (child == NO_MARKER) {
            return marker;
        }
        marker = child;
    }
}

/// Is `target` inside a mirror that isn't canonical?  Such mirrors are
/// overwritten by their canonical placeholder so they can't be edited.
static bool inside_mirror(const Snippet_Session* session, size_t target) {
    for (size_t index = target; index != NO_MARKER;
         index = session->snippet.markers[index].parent) {
        const Marker& marker = session->snippet.markers[index];
        if (marker.tag != Marker::PLACEHOLDER) {
            continue;
        }

        const Placeholder_Group* group = session->groups.find(marker.index);
        CZ_DEBUG_ASSERT(group);
        size_t canonical = group->canonical();
        if (canonical != index && !session->snippet.is_descendant(index, canonical)) {
            return true;
        }
    }
    return false;
}

static void splice(cz::String* string, const Text_Change& change, uint64_t offset) {
    string->remove_range(offset, offset + change.range.len());
    string->reserve(cz::heap_allocator(), change.new_text.len);
    string->insert(offset, change.new_text);
}

static void apply_change(Snippet* snippet, size_t target, const Text_Change& change) {
    Marker* marker = &snippet->markers[target];
    uint64_t offset = change.range.start - marker->start;

    if (marker->tag == Marker::TEXT) {
        splice(&marker->value, change, offset);
        return;
    }

    // The edit replaces what was displayed, which may have been transformed.
    cz::String text = {};
    CZ_DEFER(text.drop(cz::heap_allocator()));
    snippet->render_marker(target, cz::heap_allocator(), &text);
    splice(&text, change, offset);

    destroy_transform(marker->transform);
    marker->transform = nullptr;
    snippet->replace_children_with_text(target, text);
}

/// Copy the value of the canonical placeholder `source` into its mirrors.
static void propagate(Snippet_Session* session, size_t source) {
    Snippet* snippet = &session->snippet;

    cz::String value = {};
    CZ_DEFER(value.drop(cz::heap_allocator()));
    snippet->render_value(source, cz::heap_allocator(), &value);

    // Copy the mirrors because the groups are rebuilt as the mirrors change.
    cz::Vector<size_t> mirrors = {};
    CZ_DEFER(mirrors.drop(cz::heap_allocator()));
    const Placeholder_Group* group = session->groups.find(snippet->markers[source].index);
    CZ_DEBUG_ASSERT(group);
    mirrors.reserve(cz::heap_allocator(), group->mirrors.len);
    for (size_t i = 0; i < group->mirrors.len; ++i) {
        mirrors.push(group->mirrors[i]);
    }

    cz::String rendered = {};
    CZ_DEFER(rendered.drop(cz::heap_allocator()));

    for (size_t i = 0; i < mirrors.len; ++i) {
        size_t mirror = mirrors[i];
        if (mirror == source || snippet->markers[mirror].detached ||
            snippet->is_descendant(mirror, source) || snippet->is_descendant(source, mirror)) {
            continue;
        }

        Range old_span = snippet->markers[mirror].span();
        snippet->replace_children_with_text(mirror, value);

        rendered.len = 0;
        snippet->render_marker(mirror, cz::heap_allocator(), &rendered);

        session->applying_edits = true;
        session->buffer.replace_range(old_span, rendered);
        session->applying_edits = false;

        snippet->compute_offsets(snippet->start);
    }

    session->groups.rebuild(*snippet);
}

void Snippet_Session::synchronize_updated_placeholders(const Text_Change& change) {
    ZoneScoped;

    if (state != Session_State::ACTIVE || applying_edits) {
        return;
    }

    const Placeholder_Group* active = groups.find(active_index);
    if (!active) {
        cancel_with_message(this);
        return;
    }

    size_t target;
    size_t canonical = active->canonical();
    if (snippet.markers[canonical].span().contains(change.range)) {
        target = find_target(snippet, canonical, change.range);
    } else {
        Range whole = {snippet.start, snippet.end};
        size_t top = NO_MARKER;
        if (whole.contains(change.range)) {
            top = find_child_containing(snippet, NO_MARKER, change.range);
        }

        // The edit is outside of the snippet or spans multiple parts of it.
        if (top == NO_MARKER) {
            cancel_with_message(this);
            return;
        }
        target = find_target(snippet, top, change.range);
    }

    if (inside_mirror(this, target)) {
        cancel_with_message(this);
        return;
    }

    apply_change(&snippet, target, change);
    snippet.compute_offsets(snippet.start);
    groups.rebuild(snippet);

    for (size_t index = target; index != NO_MARKER; index = snippet.markers[index].parent) {
        if (snippet.markers[index].tag != Marker::PLACEHOLDER) {
            continue;
        }
        const Placeholder_Group* group = groups.find(snippet.markers[index].index);
        if (group && group->canonical() == index) {
            propagate(this, index);
        }
    }

    if (!groups.find(active_index)) {
        cancel_with_message(this);
    }
}

void Snippet_Session::synchronize_updated_placeholders(cz::Slice<const Text_Change> changes) {
    for (size_t i = 0; i < changes.len; ++i) {
        if (!is_active()) {
            return;
        }
        synchronize_updated_placeholders(changes[i]);
    }
}

///////////////////////////////////////////////////////////////////////////////
// Navigation
///////////////////////////////////////////////////////////////////////////////

void Snippet_Session::next_placeholder() {
    ZoneScoped;

    if (!is_active()) {
        return;
    }

    size_t position;
    if (!groups.find(active_index, &position)) {
        cancel();
        return;
    }

    if (position + 1 >= groups.groups.len) {
        // There is no `$0` so we are done.
        state = Session_State::FINISHED;
        return;
    }

    activate_group(this, position + 1, /*select=*/true);
}

void Snippet_Session::previous_placeholder() {
    ZoneScoped;

    if (!is_active()) {
        return;
    }

    size_t position;
    if (!groups.find(active_index, &position)) {
        cancel();
        return;
    }

    if (position == 0) {
        return;
    }

    activate_group(this, position - 1, /*select=*/true);
}

void Snippet_Session::select_current_placeholder() {
    if (!is_active()) {
        return;
    }
    show_span(this, active_span(), /*select=*/true);
}

void Snippet_Session::check_position(uint64_t cursor) {
    if (!is_active()) {
        return;
    }
    if (!active_span().contains(cursor)) {
        cancel_with_message(this);
    }
}

void Snippet_Session::cancel() {
    if (state == Session_State::ACTIVE) {
        state = Session_State::CANCELLED;
    }
}

}
