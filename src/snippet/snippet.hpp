#pragma once

#include <stddef.h>
#include <stdint.h>
#include <cz/allocator.hpp>
#include <cz/str.hpp>
#include <cz/string.hpp>
#include <cz/vector.hpp>
#include "core/edit.hpp"
#include "snippet/transform.hpp"
#include "snippet/variables.hpp"

namespace snip {

/// Index into `Snippet::markers` that refers to nothing.  Used as the
/// parent of top level markers.
constexpr const size_t NO_MARKER = (size_t)-1;

/// A node of a parsed snippet.
///
/// Markers are stored in an arena (`Snippet::markers`) and refer to each other by
/// index.  Markers are never removed from the arena while the snippet is alive;
/// when a subtree is replaced its old markers are marked as `detached` instead.
struct Marker {
    enum Tag {
        /// Literal text stored in `value`.
        TEXT,
        /// A tabstop `index` with default content `children`.
        PLACEHOLDER,
        /// A variable named `value` with default content `children`.
        VARIABLE,
    } tag;

    size_t parent;
    cz::String value;
    uint64_t index;
    cz::Vector<size_t> children;
    /// `${1|one,two|}`.  Rendered as the first choice while `children` is empty.
    cz::Vector<cz::String> choices;
    /// Optional; owned by the marker.
    Transform* transform;

    /// The span `[start, end)` this marker occupies in the buffer.
    /// Updated by `Snippet::compute_offsets`.
    uint64_t start;
    uint64_t end;

    bool detached;

    Range span() const { return {start, end}; }
    bool is_container() const { return tag == PLACEHOLDER || tag == VARIABLE; }

    void drop();
};

struct Snippet {
    cz::Vector<Marker> markers;
    /// The top level markers.
    cz::Vector<size_t> children;

    uint64_t start;
    uint64_t end;

    /// Keep an empty `$0` at the end if the snippet would otherwise lose its final tabstop.
    bool final_tabstop;

    void drop();

    /// Add `marker` to the arena and return its index.
    size_t push(const Marker& marker);
    size_t push_text(size_t parent, cz::Str text);

    /// The children of `marker` or the top level markers if `marker` is `NO_MARKER`.
    const cz::Vector<size_t>& children_of(size_t marker) const;

    /// Is `marker` strictly inside `ancestor`?
    bool is_descendant(size_t marker, size_t ancestor) const;

    /// Reachable markers in document order.
    void preorder(cz::Allocator allocator, cz::Vector<size_t>* out) const;

    /// The first placeholder with tabstop `index` in document order, or `NO_MARKER`.
    size_t find_canonical(uint64_t index) const;

    /// Render the entire snippet as it appears in the buffer.
    void render(cz::Allocator allocator, cz::String* out) const;
    /// Render `marker` as it appears in the buffer.
    void render_marker(size_t marker, cz::Allocator allocator, cz::String* out) const;
    /// Render `marker` without applying its transform.  This is the value that is
    /// copied into mirrors.
    void render_value(size_t marker, cz::Allocator allocator, cz::String* out) const;

    /// Assign every reachable marker its span given the snippet starts at `start`.
    /// Returns the end of the snippet.
    uint64_t compute_offsets(uint64_t start);

    /// Replace the children of `marker` with a single text marker holding `text`.
    /// The old children are detached.
    void replace_children_with_text(size_t marker, cz::Str text);

    /// Ask `resolver` for the value of every variable.  Variables it knows
    /// about have their default content replaced.  Mirrors are refilled afterwards.
    void resolve_variables(const Variable_Resolver& resolver);

    /// Copy the value of each canonical placeholder into its mirrors.  Then
    /// append `$0` if `final_tabstop` is set and no live `$0` is left.
    void fill_mirrors();

    bool has_tabstop(uint64_t index) const { return find_canonical(index) != NO_MARKER; }
};

/// Serialize `snippet` back into template syntax.  Parsing the result renders the
/// same text.  Variables with a transform are written as their rendered text.
void to_textmate(const Snippet& snippet, cz::Allocator allocator, cz::String* out);

}
