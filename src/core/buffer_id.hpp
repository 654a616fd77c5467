#pragma once

#include <stdint.h>

namespace snip {

/// Identifies the editor buffer a snippet session is attached to.
struct Buffer_Id {
    uint64_t value;

    bool operator==(const Buffer_Id& other) const { return value == other.value; }
    bool operator!=(const Buffer_Id& other) const { return !(*this == other); }
};

}
