#pragma once

#include <cz/allocator.hpp>
#include <cz/str.hpp>
#include <cz/string.hpp>
#include <cz/vector.hpp>

namespace snip {

namespace Case_Shape_ {
/// Case shapes a transform can apply to a captured group.
enum Case_Shape {
    NONE,
    UPCASE,
    DOWNCASE,
    /// Uppercase the first character and leave the rest alone.
    CAPITALIZE,
    /// `camelCase`.
    CAMELCASE,
    /// `PascalCase`.
    PASCALCASE,
};
}
using Case_Shape_::Case_Shape;

/// Split `in` into its words.  Words are separated by any character that isn't
/// alphanumeric and by the start of a capitalized word (`ANSISwissMAP` is `ANSI`,
/// `Swiss`, `MAP`).
void parse_components(cz::Str in, cz::Allocator allocator, cz::Vector<cz::Str>* out);

void to_upcase(cz::Str in, cz::Allocator allocator, cz::String* out);
void to_downcase(cz::Str in, cz::Allocator allocator, cz::String* out);
void to_capitalized(cz::Str in, cz::Allocator allocator, cz::String* out);
void to_camel(cz::Str in, cz::Allocator allocator, cz::String* out);
void to_pascal(cz::Str in, cz::Allocator allocator, cz::String* out);

/// Append `in` to `out` reshaped by `shape`.
void apply_case_shape(Case_Shape shape, cz::Str in, cz::Allocator allocator, cz::String* out);

/// Parse the name used in format strings (ex. `upcase` in `${1:/upcase}`).
bool parse_case_shape(cz::Str name, Case_Shape* shape);

}
