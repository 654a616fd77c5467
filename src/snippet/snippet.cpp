#include "snippet.hpp"

#include <cz/assert.hpp>
#include <cz/defer.hpp>
#include <cz/format.hpp>
#include <cz/heap.hpp>
#include <tracy/Tracy.hpp>

namespace snip {

void Marker::drop() {
    value.drop(cz::heap_allocator());
    children.drop(cz::heap_allocator());
    for (size_t i = 0; i < choices.len; ++i) {
        choices[i].drop(cz::heap_allocator());
    }
    choices.drop(cz::heap_allocator());
    destroy_transform(transform);
    transform = nullptr;
}

void Snippet::drop() {
    for (size_t i = 0; i < markers.len; ++i) {
        markers[i].drop();
    }
    markers.drop(cz::heap_allocator());
    children.drop(cz::heap_allocator());
}

size_t Snippet::push(const Marker& marker) {
    markers.reserve(cz::heap_allocator(), 1);
    markers.push(marker);
    return markers.len - 1;
}

size_t Snippet::push_text(size_t parent, cz::Str text) {
    Marker marker = {};
    marker.tag = Marker::TEXT;
    marker.parent = parent;
    marker.value = text.clone(cz::heap_allocator());
    return push(marker);
}

const cz::Vector<size_t>& Snippet::children_of(size_t marker) const {
    if (marker == NO_MARKER) {
        return children;
    }
    return markers[marker].children;
}

bool Snippet::is_descendant(size_t marker, size_t ancestor) const {
    if (ancestor == NO_MARKER) {
        return marker != NO_MARKER;
    }
    while (marker != NO_MARKER) {
        marker = markers[marker].parent;
        if (marker == ancestor) {
            return true;
        }
    }
    return false;
}

static void preorder_children(const Snippet& snippet,
                              size_t parent,
                              cz::Allocator allocator,
                              cz::Vector<size_t>* out) {
    const cz::Vector<size_t>& children = snippet.children_of(parent);
    for (size_t i = 0; i < children.len; ++i) {
        out->reserve(allocator, 1);
        out->push(children[i]);
        preorder_children(snippet, children[i], allocator, out);
    }
}

void Snippet::preorder(cz::Allocator allocator, cz::Vector<size_t>* out) const {
    preorder_children(*this, NO_MARKER, allocator, out);
}

static size_t find_canonical_in(const Snippet& snippet, size_t parent, uint64_t index) {
    const cz::Vector<size_t>& children = snippet.children_of(parent);
    for (size_t i = 0; i < children.len; ++i) {
        const Marker& marker = snippet.markers[children[i]];
        if (marker.tag == Marker::PLACEHOLDER && marker.index == index) {
            return children[i];
        }
        size_t found = find_canonical_in(snippet, children[i], index);
        if (found != NO_MARKER) {
            return found;
        }
    }
    return NO_MARKER;
}

size_t Snippet::find_canonical(uint64_t index) const {
    return find_canonical_in(*this, NO_MARKER, index);
}

void Snippet::render(cz::Allocator allocator, cz::String* out) const {
    for (size_t i = 0; i < children.len; ++i) {
        render_marker(children[i], allocator, out);
    }
}

void Snippet::render_marker(size_t index, cz::Allocator allocator, cz::String* out) const {
    const Marker& marker = markers[index];
    if (marker.tag == Marker::TEXT) {
        cz::append(allocator, out, marker.value);
        return;
    }

    if (!marker.transform) {
        render_value(index, allocator, out);
        return;
    }

    cz::String value = {};
    CZ_DEFER(value.drop(cz::heap_allocator()));
    render_value(index, cz::heap_allocator(), &value);
    marker.transform->apply(value, allocator, out);
}

void Snippet::render_value(size_t index, cz::Allocator allocator, cz::String* out) const {
    const Marker& marker = markers[index];
    if (marker.tag == Marker::TEXT) {
        cz::append(allocator, out, marker.value);
        return;
    }

    if (marker.children.len == 0 && marker.choices.len > 0) {
        cz::append(allocator, out, marker.choices[0]);
        return;
    }

    for (size_t i = 0; i < marker.children.len; ++i) {
        render_marker(marker.children[i], allocator, out);
    }
}

/// The text of a transformed marker isn't its children so they are collapsed to its start.
static void collapse_offsets(Snippet* snippet, size_t index, uint64_t position) {
    Marker* marker = &snippet->markers[index];
    marker->start = position;
    marker->end = position;
    for (size_t i = 0; i < marker->children.len; ++i) {
        collapse_offsets(snippet, marker->children[i], position);
    }
}

static uint64_t compute_marker_offsets(Snippet* snippet, size_t index, uint64_t position) {
    Marker* marker = &snippet->markers[index];
    marker->start = position;

    if (marker->tag == Marker::TEXT) {
        marker->end = position + marker->value.len;
        return marker->end;
    }

    if (marker->transform) {
        for (size_t i = 0; i < marker->children.len; ++i) {
            collapse_offsets(snippet, marker->children[i], position);
        }

        cz::String rendered = {};
        CZ_DEFER(rendered.drop(cz::heap_allocator()));
        snippet->render_marker(index, cz::heap_allocator(), &rendered);
        marker->end = position + rendered.len;
        return marker->end;
    }

    if (marker->children.len == 0 && marker->choices.len > 0) {
        marker->end = position + marker->choices[0].len;
        return marker->end;
    }

    for (size_t i = 0; i < marker->children.len; ++i) {
        position = compute_marker_offsets(snippet, marker->children[i], position);
    }

    // Recursion doesn't reallocate the arena so `marker` is still valid.
    marker->end = position;
    return position;
}

uint64_t Snippet::compute_offsets(uint64_t position) {
    ZoneScoped;

    start = position;
    for (size_t i = 0; i < children.len; ++i) {
        position = compute_marker_offsets(this, children[i], position);
    }
    end = position;
    return end;
}

static void detach(Snippet* snippet, size_t index) {
    Marker* marker = &snippet->markers[index];
    marker->detached = true;
    for (size_t i = 0; i < marker->children.len; ++i) {
        detach(snippet, marker->children[i]);
    }
}

void Snippet::replace_children_with_text(size_t index, cz::Str text) {
    CZ_DEBUG_ASSERT(markers[index].is_container());

    for (size_t i = 0; i < markers[index].children.len; ++i) {
        detach(this, markers[index].children[i]);
    }

    size_t text_index = push_text(index, text);

    Marker* marker = &markers[index];
    marker->children.len = 0;
    marker->children.reserve(cz::heap_allocator(), 1);
    marker->children.push(text_index);
}

void Snippet::fill_mirrors() {
    ZoneScoped;

    cz::Vector<size_t> order = {};
    CZ_DEFER(order.drop(cz::heap_allocator()));
    preorder(cz::heap_allocator(), &order);

    cz::String value = {};
    CZ_DEFER(value.drop(cz::heap_allocator()));

    for (size_t i = 0; i < order.len; ++i) {
        size_t index = order[i];
        if (markers[index].detached || markers[index].tag != Marker::PLACEHOLDER) {
            continue;
        }

        size_t canonical = find_canonical(markers[index].index);
        if (canonical == index || is_descendant(index, canonical) ||
            is_descendant(canonical, index)) {
            continue;
        }

        value.len = 0;
        render_value(canonical, cz::heap_allocator(), &value);
        replace_children_with_text(index, value);
    }

    // `$0` is missing or was detached along with a mirror or variable default.
    if (final_tabstop && !has_tabstop(0)) {
        Marker marker = {};
        marker.tag = Marker::PLACEHOLDER;
        marker.parent = NO_MARKER;
        marker.index = 0;
        size_t tabstop = push(marker);
        children.reserve(cz::heap_allocator(), 1);
        children.push(tabstop);
    }
}

void Snippet::resolve_variables(const Variable_Resolver& resolver) {
    ZoneScoped;

    cz::Vector<size_t> order = {};
    CZ_DEFER(order.drop(cz::heap_allocator()));
    preorder(cz::heap_allocator(), &order);

    cz::String value = {};
    CZ_DEFER(value.drop(cz::heap_allocator()));

    for (size_t i = 0; i < order.len; ++i) {
        size_t index = order[i];
        // Variables nested in the default of a resolved variable have been detached.
        if (markers[index].detached || markers[index].tag != Marker::VARIABLE) {
            continue;
        }

        value.len = 0;
        if (!resolver.resolve(markers[index].value, cz::heap_allocator(), &value)) {
            continue;
        }
        replace_children_with_text(index, value);
    }

    fill_mirrors();
}

///////////////////////////////////////////////////////////////////////////////
// Serialization
///////////////////////////////////////////////////////////////////////////////

static void append_escaped(cz::Str text, cz::Str special, cz::Allocator allocator, cz::String* out) {
    out->reserve(allocator, text.len);
    for (size_t i = 0; i < text.len; ++i) {
        if (special.find(text[i])) {
            out->reserve(allocator, text.len - i + 1);
            out->push('\\');
        }
        out->push(text[i]);
    }
}

static void append_transform(const Transform& transform, cz::Allocator allocator, cz::String* out) {
    cz::append(allocator, out, '/');
    // The only unescaped `/` in a regex came from `\/`.
    append_escaped(transform.regex_source, "/", allocator, out);
    cz::append(allocator, out, '/', transform.format_source, '/', transform.flags);
}

static void to_textmate_marker(const Snippet& snippet,
                               size_t index,
                               cz::Allocator allocator,
                               cz::String* out) {
    const Marker& marker = snippet.markers[index];
    switch (marker.tag) {
    case Marker::TEXT:
        append_escaped(marker.value, "$}\\", allocator, out);
        return;

    case Marker::PLACEHOLDER:
        cz::append(allocator, out, "${", marker.index);
        if (marker.transform) {
            append_transform(*marker.transform, allocator, out);
        } else if (marker.children.len == 0 && marker.choices.len > 0) {
            cz::append(allocator, out, '|');
            for (size_t i = 0; i < marker.choices.len; ++i) {
                if (i > 0) {
                    cz::append(allocator, out, ',');
                }
                append_escaped(marker.choices[i], "$}\\,|", allocator, out);
            }
            cz::append(allocator, out, '|');
        } else if (marker.children.len > 0) {
            cz::append(allocator, out, ':');
            for (size_t i = 0; i < marker.children.len; ++i) {
                to_textmate_marker(snippet, marker.children[i], allocator, out);
            }
        }
        cz::append(allocator, out, '}');
        return;

    case Marker::VARIABLE:
        if (marker.transform) {
            cz::String rendered = {};
            CZ_DEFER(rendered.drop(cz::heap_allocator()));
            snippet.render_marker(index, cz::heap_allocator(), &rendered);
            append_escaped(rendered, "$}\\", allocator, out);
            return;
        }

        cz::append(allocator, out, "${", marker.value);
        if (marker.children.len > 0) {
            cz::append(allocator, out, ':');
            for (size_t i = 0; i < marker.children.len; ++i) {
                to_textmate_marker(snippet, marker.children[i], allocator, out);
            }
        }
        cz::append(allocator, out, '}');
        return;
    }

    CZ_PANIC("to_textmate: invalid Marker::Tag");
}

void to_textmate(const Snippet& snippet, cz::Allocator allocator, cz::String* out) {
    for (size_t i = 0; i < snippet.children.len; ++i) {
        to_textmate_marker(snippet, snippet.children[i], allocator, out);
    }
}

}
