#pragma once

#include <stddef.h>
#include <cz/allocator.hpp>
#include <cz/str.hpp>
#include <cz/string.hpp>
#include <cz/vector.hpp>
#include <regex>
#include "snippet/capitalization.hpp"

namespace snip {

/// One piece of the format half of a transform (`/regex/format/flags`).
struct Format_Fragment {
    enum Tag {
        /// Literal text.
        TEXT,
        /// `$n`, `${n}`, or `${n:/shape}`.
        GROUP,
        /// `${n:+if}`, `${n:?if:else}`, `${n:-else}`, or `${n:else}`.
        /// `text` is used if group `n` matched something, otherwise `else_text`.
        CONDITIONAL,
        /// `\U` and `\L` fold the case of everything after them until `\E`.
        /// `\u` and `\l` fold only the next character.
        CASE_FOLD,
    } tag;

    cz::String text;
    cz::String else_text;
    size_t group;
    Case_Shape shape;
    char fold;

    void drop();
};

/// A regex substitution applied to the plain value of a placeholder or variable.
///
/// Transforms own a compiled `std::regex` so they are allocated with `new`.  Use
/// `destroy_transform` to free one.
struct Transform {
    cz::String regex_source;
    /// The format exactly as it was written, used when re-serializing the snippet.
    cz::String format_source;
    cz::String flags;
    cz::Vector<Format_Fragment> format;

    bool global;
    bool case_insensitive;
    std::regex regex;

    /// Compile `regex_source` according to `flags`.  Returns `false` if it is not a valid
    /// ECMAScript regular expression.
    bool compile();

    /// Append the transformation of `value` to `out`.
    void apply(cz::Str value, cz::Allocator allocator, cz::String* out) const;

    void drop();
};

void destroy_transform(Transform* transform);

}
