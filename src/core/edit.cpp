#include "edit.hpp"

namespace snip {

void position_after_change(const Text_Change& change, uint64_t* position, bool insert_before) {
    uint64_t start = change.range.start;
    uint64_t end = change.range.end;
    uint64_t inserted = change.new_text.len;

    if (*position < start) {
        return;
    }

    if (*position == start) {
        // Replacements never move a position at their start.
        if (start == end && insert_before) {
            *position += inserted;
        }
        return;
    }

    if (*position >= end) {
        *position = *position - (end - start) + inserted;
    } else {
        // Inside the removed region.
        *position = start + inserted;
    }
}

void position_after_changes(cz::Slice<const Text_Change> changes,
                            uint64_t* position,
                            bool insert_before) {
    for (size_t i = 0; i < changes.len; ++i) {
        position_after_change(changes[i], position, insert_before);
    }
}

}
