#include "capitalization.hpp"

#include <cz/assert.hpp>
#include <cz/char_type.hpp>
#include <cz/defer.hpp>
#include <cz/format.hpp>
#include <cz/heap.hpp>

namespace snip {

/// Does a new word start at `in[i]`?  Only called for upper case letters.
static bool starts_word(cz::Str in, size_t i) {
    if (!cz::is_upper(in[i - 1])) {
        return true;
    }
    // The last capital of a chain followed by lower case starts a new word: `ANSI|Swiss`.
    return i + 1 < in.len && cz::is_lower(in[i + 1]);
}

void parse_components(cz::Str in, cz::Allocator allocator, cz::Vector<cz::Str>* out) {
    size_t start = 0;
    for (size_t i = 0; i <= in.len; ++i) {
        size_t next_start;
        if (i == in.len || !cz::is_alnum(in[i])) {
            next_start = i + 1;
        } else if (i > start && cz::is_upper(in[i]) && starts_word(in, i)) {
            next_start = i;
        } else {
            continue;
        }

        if (i > start) {
            out->reserve(allocator, 1);
            out->push(in.slice(start, i));
        }
        start = next_start;
    }
}

void to_upcase(cz::Str in, cz::Allocator allocator, cz::String* out) {
    out->reserve(allocator, in.len);
    for (size_t i = 0; i < in.len; ++i) {
        out->push(cz::to_upper(in[i]));
    }
}

void to_downcase(cz::Str in, cz::Allocator allocator, cz::String* out) {
    out->reserve(allocator, in.len);
    for (size_t i = 0; i < in.len; ++i) {
        out->push(cz::to_lower(in[i]));
    }
}

void to_capitalized(cz::Str in, cz::Allocator allocator, cz::String* out) {
    if (in.len == 0) {
        return;
    }
    out->reserve(allocator, in.len);
    out->push(cz::to_upper(in[0]));
    out->append(in.slice_start(1));
}

static void strip(cz::Str* in, cz::Str* prefix, cz::Str* suffix) {
    size_t prefix_end = 0;
    for (; prefix_end < in->len; ++prefix_end) {
        if ((*in)[prefix_end] != '_' && (*in)[prefix_end] != '-') {
            break;
        }
    }

    *prefix = in->slice_end(prefix_end);
    *in = in->slice_start(prefix_end);

    size_t suffix_start = in->len;
    for (; suffix_start-- > 0;) {
        if ((*in)[suffix_start] != '_' && (*in)[suffix_start] != '-') {
            break;
        }
    }
    ++suffix_start;

    *suffix = in->slice_start(suffix_start);
    *in = in->slice_end(suffix_start);
}

static void join_components(cz::Str in,
                            cz::Allocator allocator,
                            cz::String* out,
                            bool capitalize_first) {
    cz::Str prefix, suffix;
    strip(&in, &prefix, &suffix);
    cz::append(allocator, out, prefix);

    cz::Vector<cz::Str> components = {};
    CZ_DEFER(components.drop(cz::heap_allocator()));
    parse_components(in, cz::heap_allocator(), &components);

    for (size_t i = 0; i < components.len; ++i) {
        cz::Str component = components[i];
        out->reserve(allocator, component.len);

        if (i == 0 && !capitalize_first) {
            out->push(cz::to_lower(component[0]));
        } else {
            out->push(cz::to_upper(component[0]));
        }
        for (size_t j = 1; j < component.len; ++j) {
            out->push(cz::to_lower(component[j]));
        }
    }

    cz::append(allocator, out, suffix);
}

void to_camel(cz::Str in, cz::Allocator allocator, cz::String* out) {
    join_components(in, allocator, out, /*capitalize_first=*/false);
}

void to_pascal(cz::Str in, cz::Allocator allocator, cz::String* out) {
    join_components(in, allocator, out, /*capitalize_first=*/true);
}

void apply_case_shape(Case_Shape shape, cz::Str in, cz::Allocator allocator, cz::String* out) {
    switch (shape) {
    case Case_Shape::NONE:
        out->reserve(allocator, in.len);
        out->append(in);
        return;
    case Case_Shape::UPCASE:
        return to_upcase(in, allocator, out);
    case Case_Shape::DOWNCASE:
        return to_downcase(in, allocator, out);
    case Case_Shape::CAPITALIZE:
        return to_capitalized(in, allocator, out);
    case Case_Shape::CAMELCASE:
        return to_camel(in, allocator, out);
    case Case_Shape::PASCALCASE:
        return to_pascal(in, allocator, out);
    }

    CZ_PANIC("apply_case_shape: invalid Case_Shape");
}

bool parse_case_shape(cz::Str name, Case_Shape* shape) {
    if (name == "upcase") {
        *shape = Case_Shape::UPCASE;
    } else if (name == "downcase") {
        *shape = Case_Shape::DOWNCASE;
    } else if (name == "capitalize") {
        *shape = Case_Shape::CAPITALIZE;
    } else if (name == "camelcase") {
        *shape = Case_Shape::CAMELCASE;
    } else if (name == "pascalcase") {
        *shape = Case_Shape::PASCALCASE;
    } else {
        return false;
    }
    return true;
}

}
