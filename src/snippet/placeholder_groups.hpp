#pragma once

#include <stddef.h>
#include <stdint.h>
#include <cz/vector.hpp>
#include "snippet/snippet.hpp"

namespace snip {

/// All the placeholders sharing one tabstop.
struct Placeholder_Group {
    uint64_t index;
    /// Markers in document order.  The first is the canonical placeholder.
    cz::Vector<size_t> mirrors;

    size_t canonical() const { return mirrors[0]; }
};

/// The tabstops of a snippet in navigation order: ascending with `$0` last.
struct Placeholder_Groups {
    cz::Vector<Placeholder_Group> groups;

    /// Recalculate the groups from the live markers of `snippet`.
    void rebuild(const Snippet& snippet);

    /// Find the position of the group for tabstop `index` in `groups`.
    bool find(uint64_t index, size_t* position) const;
    const Placeholder_Group* find(uint64_t index) const;

    void drop();
};

}
