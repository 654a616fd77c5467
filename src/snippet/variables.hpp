#pragma once

#include <stdint.h>
#include <cz/allocator.hpp>
#include <cz/option.hpp>
#include <cz/str.hpp>
#include <cz/string.hpp>

namespace snip {

/// Supplies the values of snippet variables such as `$TM_FILENAME`.
struct Variable_Resolver {
    struct VTable {
        /// Append the value of the variable `name` to `out`.  Returns `false` if
        /// the variable is unknown or has no value.
        bool (*resolve)(cz::Str name, cz::Allocator allocator, cz::String* out, void* data);
    };

    const VTable* vtable;
    void* data;

    bool resolve(cz::Str name, cz::Allocator allocator, cz::String* out) const {
        return vtable->resolve(name, allocator, out, data);
    }
};

/// The state of the editor at the time a snippet is inserted.
/// Empty strings are treated as not having a value.
struct Variable_Context {
    cz::Str selected_text;
    cz::Str current_line;
    cz::Str current_word;
    /// Absolute path of the file being edited.
    cz::Str file_path;
    cz::Str clipboard;
    /// Zero based line the snippet is inserted at.
    cz::Option<uint64_t> line_index;
};

/// Resolves the standard textmate variables from `context`.
/// `context` must outlive the returned resolver.
Variable_Resolver context_variable_resolver(const Variable_Context* context);

/// A resolver that never has a value.
Variable_Resolver empty_variable_resolver();

}
