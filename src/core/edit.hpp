#pragma once

#include <stddef.h>
#include <stdint.h>
#include <cz/slice.hpp>
#include <cz/str.hpp>

namespace snip {

/// A half open range `[start, end)` of byte offsets into a buffer.
struct Range {
    uint64_t start;
    uint64_t end;

    uint64_t len() const { return end - start; }

    /// Test if `other` lies inside this range.  The end is inclusive so that an
    /// insertion directly after the last character is still considered inside.
    bool contains(Range other) const { return start <= other.start && other.end <= end; }
    bool contains(uint64_t position) const { return start <= position && position <= end; }

    bool operator==(const Range& other) const { return start == other.start && end == other.end; }
    bool operator!=(const Range& other) const { return !(*this == other); }
};

/// A change notification from the buffer: the text in `range` (as it was before the
/// change) has been replaced by `new_text`.  Insertions have an empty `range`.
struct Text_Change {
    Range range;
    cz::Str new_text;
};

/// Move `position` so it refers to the same character after `change` is applied.
///
/// Positions inside the removed region collapse to the end of the inserted text.  A
/// position at `change.range.start` stays put unless the change is a pure insertion
/// and `insert_before` is set, in which case the insertion happens before it.
void position_after_change(const Text_Change& change, uint64_t* position, bool insert_before);

void position_after_changes(cz::Slice<const Text_Change> changes,
                            uint64_t* position,
                            bool insert_before);

}
