#include "placeholder_groups.hpp"

#include <cz/defer.hpp>
#include <cz/heap.hpp>

namespace snip {

/// Navigation order: `$1 $2 ... $0`.
static bool comes_before(uint64_t left, uint64_t right) {
    if (left == 0) {
        return false;
    }
    return right == 0 || left < right;
}

void Placeholder_Groups::rebuild(const Snippet& snippet) {
    for (size_t i = 0; i < groups.len; ++i) {
        groups[i].mirrors.drop(cz::heap_allocator());
    }
    groups.len = 0;

    cz::Vector<size_t> order = {};
    CZ_DEFER(order.drop(cz::heap_allocator()));
    snippet.preorder(cz::heap_allocator(), &order);

    for (size_t i = 0; i < order.len; ++i) {
        const Marker& marker = snippet.markers[order[i]];
        if (marker.tag != Marker::PLACEHOLDER || marker.detached) {
            continue;
        }

        size_t position = 0;
        if (!find(marker.index, &position)) {
            while (position < groups.len && comes_before(groups[position].index, marker.index)) {
                ++position;
            }

            Placeholder_Group group = {};
            group.index = marker.index;
            groups.reserve(cz::heap_allocator(), 1);
            groups.insert(position, group);
        }

        Placeholder_Group* group = &groups[position];
        group->mirrors.reserve(cz::heap_allocator(), 1);
        group->mirrors.push(order[i]);
    }
}

bool Placeholder_Groups::find(uint64_t index, size_t* position) const {
    for (size_t i = 0; i < groups.len; ++i) {
        if (groups[i].index == index) {
            *position = i;
            return true;
        }
    }
    return false;
}

const Placeholder_Group* Placeholder_Groups::find(uint64_t index) const {
    size_t position;
    if (!find(index, &position)) {
        return nullptr;
    }
    return &groups[position];
}

void Placeholder_Groups::drop() {
    for (size_t i = 0; i < groups.len; ++i) {
        groups[i].mirrors.drop(cz::heap_allocator());
    }
    groups.drop(cz::heap_allocator());
}

}
