#include "variables.hpp"

#include <stdio.h>
#include <time.h>
#include <cz/date.hpp>
#include <cz/format.hpp>

namespace snip {

static bool append_value(cz::Str value, cz::Allocator allocator, cz::String* out) {
    if (value.len == 0) {
        return false;
    }
    cz::append(allocator, out, value);
    return true;
}

static bool append_number(uint64_t number, int width, cz::Allocator allocator, cz::String* out) {
    char buffer[32];
    snprintf(buffer, sizeof(buffer), "%0*llu", width, (unsigned long long)number);
    cz::append(allocator, out, cz::Str(buffer));
    return true;
}

/// The directory part of `path` without the trailing separator.
static cz::Str path_directory(cz::Str path) {
    const char* slash = path.rfind('/');
    if (!slash) {
        return {};
    }
    return path.slice_end(slash);
}

static cz::Str path_file_name(cz::Str path) {
    const char* slash = path.rfind('/');
    if (!slash) {
        return path;
    }
    return path.slice_start(slash + 1);
}

static bool resolve_date(cz::Str name, cz::Allocator allocator, cz::String* out) {
    cz::Date date = cz::time_t_to_date_local(time(nullptr));

    if (name == "CURRENT_YEAR") {
        return append_number(date.year, 4, allocator, out);
    } else if (name == "CURRENT_YEAR_SHORT") {
        return append_number(date.year % 100, 2, allocator, out);
    } else if (name == "CURRENT_MONTH") {
        return append_number(date.month, 2, allocator, out);
    } else if (name == "CURRENT_DATE") {
        return append_number(date.day_of_month, 2, allocator, out);
    } else if (name == "CURRENT_HOUR") {
        return append_number(date.hour, 2, allocator, out);
    } else if (name == "CURRENT_MINUTE") {
        return append_number(date.minute, 2, allocator, out);
    } else if (name == "CURRENT_SECOND") {
        return append_number(date.second, 2, allocator, out);
    }
    return false;
}

static bool context_resolve(cz::Str name, cz::Allocator allocator, cz::String* out, void* data) {
    const Variable_Context* context = (const Variable_Context*)data;

    if (name == "TM_SELECTED_TEXT" || name == "SELECTION") {
        return append_value(context->selected_text, allocator, out);
    } else if (name == "TM_CURRENT_LINE") {
        return append_value(context->current_line, allocator, out);
    } else if (name == "TM_CURRENT_WORD") {
        return append_value(context->current_word, allocator, out);
    } else if (name == "TM_LINE_INDEX") {
        if (!context->line_index.is_present) {
            return false;
        }
        return append_number(context->line_index.value, 0, allocator, out);
    } else if (name == "TM_LINE_NUMBER") {
        if (!context->line_index.is_present) {
            return false;
        }
        return append_number(context->line_index.value + 1, 0, allocator, out);
    } else if (name == "TM_FILEPATH") {
        return append_value(context->file_path, allocator, out);
    } else if (name == "TM_FILENAME") {
        return append_value(path_file_name(context->file_path), allocator, out);
    } else if (name == "TM_FILENAME_BASE") {
        cz::Str file_name = path_file_name(context->file_path);
        const char* dot = file_name.rfind('.');
        if (dot && dot > file_name.buffer) {
            file_name = file_name.slice_end(dot);
        }
        return append_value(file_name, allocator, out);
    } else if (name == "TM_DIRECTORY") {
        return append_value(path_directory(context->file_path), allocator, out);
    } else if (name == "CLIPBOARD") {
        return append_value(context->clipboard, allocator, out);
    }

    return resolve_date(name, allocator, out);
}

Variable_Resolver context_variable_resolver(const Variable_Context* context) {
    static const Variable_Resolver::VTable vtable = {context_resolve};
    Variable_Resolver resolver;
    resolver.vtable = &vtable;
    resolver.data = (void*)context;
    return resolver;
}

static bool empty_resolve(cz::Str, cz::Allocator, cz::String*, void*) {
    return false;
}

Variable_Resolver empty_variable_resolver() {
    static const Variable_Resolver::VTable vtable = {empty_resolve};
    Variable_Resolver resolver;
    resolver.vtable = &vtable;
    resolver.data = nullptr;
    return resolver;
}

}
