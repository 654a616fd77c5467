#include "transform.hpp"

#include <cz/char_type.hpp>
#include <cz/defer.hpp>
#include <cz/heap.hpp>
#include <string>
#include <tracy/Tracy.hpp>

namespace snip {

void Format_Fragment::drop() {
    text.drop(cz::heap_allocator());
    else_text.drop(cz::heap_allocator());
}

void Transform::drop() {
    regex_source.drop(cz::heap_allocator());
    format_source.drop(cz::heap_allocator());
    flags.drop(cz::heap_allocator());
    for (size_t i = 0; i < format.len; ++i) {
        format[i].drop();
    }
    format.drop(cz::heap_allocator());
}

void destroy_transform(Transform* transform) {
    if (!transform) {
        return;
    }
    transform->drop();
    delete transform;
}

bool Transform::compile() {
    global = false;
    case_insensitive = false;
    for (size_t i = 0; i < flags.len; ++i) {
        if (flags[i] == 'g') {
            global = true;
        } else if (flags[i] == 'i') {
            case_insensitive = true;
        }
    }

    std::regex::flag_type options = std::regex::ECMAScript;
    if (case_insensitive) {
        options |= std::regex::icase;
    }

    try {
        regex.assign(regex_source.buffer, regex_source.len, options);
    } catch (const std::regex_error&) {
        return false;
    }
    return true;
}

namespace transform_impl {
struct Case_Folding {
    /// `'U'`, `'L'`, or 0.
    char mode;
    /// `'u'`, `'l'`, or 0.
    char next;
};
}
using namespace transform_impl;

static void append_folded(Case_Folding* folding,
                          cz::Str str,
                          cz::Allocator allocator,
                          cz::String* out) {
    out->reserve(allocator, str.len);
    for (size_t i = 0; i < str.len; ++i) {
        char ch = str[i];
        if (folding->next == 'u') {
            ch = cz::to_upper(ch);
            folding->next = 0;
        } else if (folding->next == 'l') {
            ch = cz::to_lower(ch);
            folding->next = 0;
        } else if (folding->mode == 'U') {
            ch = cz::to_upper(ch);
        } else if (folding->mode == 'L') {
            ch = cz::to_lower(ch);
        }
        out->push(ch);
    }
}

/// Get the text of `group`.  Groups that don't exist or didn't participate are empty.
static cz::Str group_value(const std::string& input, const std::smatch& match, size_t group) {
    if (group >= match.size() || !match[group].matched) {
        return {};
    }
    return {input.data() + match.position(group), (size_t)match.length(group)};
}

static void append_format(cz::Slice<const Format_Fragment> format,
                          const std::string& input,
                          const std::smatch& match,
                          cz::Allocator allocator,
                          cz::String* out) {
    Case_Folding folding = {};

    for (size_t i = 0; i < format.len; ++i) {
        const Format_Fragment& fragment = format[i];
        switch (fragment.tag) {
        case Format_Fragment::TEXT:
            append_folded(&folding, fragment.text, allocator, out);
            break;

        case Format_Fragment::GROUP: {
            cz::Str value = group_value(input, match, fragment.group);
            if (fragment.shape == Case_Shape::NONE) {
                append_folded(&folding, value, allocator, out);
                break;
            }

            cz::String shaped = {};
            CZ_DEFER(shaped.drop(cz::heap_allocator()));
            apply_case_shape(fragment.shape, value, cz::heap_allocator(), &shaped);
            append_folded(&folding, shaped, allocator, out);
        } break;

        case Format_Fragment::CONDITIONAL: {
            cz::Str value = group_value(input, match, fragment.group);
            if (value.len > 0) {
                append_folded(&folding, fragment.text, allocator, out);
            } else {
                append_folded(&folding, fragment.else_text, allocator, out);
            }
        } break;

        case Format_Fragment::CASE_FOLD:
            if (fragment.fold == 'U' || fragment.fold == 'L') {
                folding.mode = fragment.fold;
            } else if (fragment.fold == 'E') {
                folding.mode = 0;
                folding.next = 0;
            } else {
                folding.next = fragment.fold;
            }
            break;
        }
    }
}

void Transform::apply(cz::Str value, cz::Allocator allocator, cz::String* out) const {
    ZoneScoped;

    std::string input(value.buffer, value.len);
    cz::Slice<const Format_Fragment> fragments = format.as_const_slice();

    size_t last = 0;
    std::sregex_iterator end;
    for (std::sregex_iterator it(input.begin(), input.end(), regex); it != end; ++it) {
        const std::smatch& match = *it;

        size_t position = (size_t)match.position(0);
        out->reserve(allocator, position - last);
        out->append({input.data() + last, position - last});

        append_format(fragments, input, match, allocator, out);

        last = position + (size_t)match.length(0);
        if (!global) {
            break;
        }
    }

    // Values the regex doesn't match are left as is.
    out->reserve(allocator, input.size() - last);
    out->append({input.data() + last, input.size() - last});
}

}
