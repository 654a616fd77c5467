#pragma once

#include <stddef.h>
#include <cz/slice.hpp>
#include <cz/str.hpp>
#include <cz/string.hpp>
#include "core/edit.hpp"

namespace snip {

/// The editor's view of a buffer as seen by a snippet session.  The session never
/// owns the buffer; it only asks the editor to change it through these callbacks.
///
/// Requests are synchronous: by the time a callback returns the buffer must reflect
/// it.  If the editor echoes the resulting change notifications back into the session
/// while a request is in flight they are ignored.
struct Text_Buffer {
    struct VTable {
        void (*insert_text)(uint64_t position, cz::Str text, void*);
        void (*replace_range)(Range range, cz::Str text, void*);
        void (*set_selection)(Range range, void*);
        void (*set_cursor)(uint64_t position, void*);
        void (*show_message)(cz::Str message, void*);

        /// Optional; offers the choices of a choice placeholder spanning `range`.
        void (*show_choices)(cz::Slice<const cz::String> choices, Range range, void*);
    };

    const VTable* vtable;
    void* data;

    void insert_text(uint64_t position, cz::Str text) const {
        vtable->insert_text(position, text, data);
    }

    void replace_range(Range range, cz::Str text) const {
        vtable->replace_range(range, text, data);
    }

    void set_selection(Range range) const { vtable->set_selection(range, data); }

    void set_cursor(uint64_t position) const { vtable->set_cursor(position, data); }

    void show_message(cz::Str message) const { vtable->show_message(message, data); }

    void show_choices(cz::Slice<const cz::String> choices, Range range) const {
        if (vtable->show_choices) {
            vtable->show_choices(choices, range, data);
        }
    }
};

}
