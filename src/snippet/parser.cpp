#include "parser.hpp"

#include <cz/char_type.hpp>
#include <cz/defer.hpp>
#include <cz/heap.hpp>
#include <tracy/Tracy.hpp>

namespace snip {

namespace parser_impl {
enum Parse_Result {
    MATCH,
    /// The construct is malformed.  Only its `$` is treated as text.
    MISMATCH,
    /// The input ended inside the construct.  Everything from its `$` is treated as text.
    UNTERMINATED,
};

struct Parser {
    cz::Str body;
    size_t index;
    Snippet* snippet;

    bool at_end() const { return index >= body.len; }
    char peek() const { return body[index]; }
};
}
using namespace parser_impl;

static bool is_name_start(char ch) {
    return ch == '_' || cz::is_alpha(ch);
}

static bool is_name_char(char ch) {
    return ch == '_' || cz::is_alnum(ch);
}

/// Throw away markers added since a failed construct started.
static void rollback(Snippet* snippet, size_t markers_len) {
    for (size_t i = markers_len; i < snippet->markers.len; ++i) {
        snippet->markers[i].drop();
    }
    snippet->markers.len = markers_len;
}

static void flush_text(Parser* parser,
                       size_t parent,
                       cz::String* text,
                       cz::Vector<size_t>* children) {
    if (text->len == 0) {
        return;
    }
    size_t marker = parser->snippet->push_text(parent, *text);
    children->reserve(cz::heap_allocator(), 1);
    children->push(marker);
    text->len = 0;
}

static bool parse_index(Parser* parser, uint64_t* index) {
    *index = 0;
    for (; !parser->at_end() && cz::is_digit(parser->peek()); ++parser->index) {
        uint64_t digit = parser->peek() - '0';
        if (*index > (UINT64_MAX - digit) / 10) {
            return false;
        }
        *index = *index * 10 + digit;
    }
    return true;
}

static void parse_name(Parser* parser, cz::String* name) {
    size_t start = parser->index;
    for (; !parser->at_end() && is_name_char(parser->peek()); ++parser->index) {
    }
    name->reserve(cz::heap_allocator(), parser->index - start);
    name->append(parser->body.slice(start, parser->index));
}

static Parse_Result parse_dollar(Parser* parser, size_t parent, size_t* out);

/// Parse markers until the end of the body or, if `nested`, an unescaped `}`.
/// The `}` is not consumed.
static void parse_children(Parser* parser,
                           size_t parent,
                           bool nested,
                           cz::Vector<size_t>* children) {
    cz::String text = {};
    CZ_DEFER(text.drop(cz::heap_allocator()));

    while (!parser->at_end()) {
        char ch = parser->peek();

        if (ch == '\\') {
            if (parser->index + 1 < parser->body.len) {
                char next = parser->body[parser->index + 1];
                if (next == '$' || next == '}' || next == '\\') {
                    text.reserve(cz::heap_allocator(), 1);
                    text.push(next);
                    parser->index += 2;
                    continue;
                }
            }
            text.reserve(cz::heap_allocator(), 1);
            text.push('\\');
            ++parser->index;
            continue;
        }

        if (ch == '}' && nested) {
            break;
        }

        if (ch == '$') {
            size_t dollar = parser->index;
            size_t markers_len = parser->snippet->markers.len;

            size_t marker;
            Parse_Result result = parse_dollar(parser, parent, &marker);
            if (result == MATCH) {
                flush_text(parser, parent, &text, children);
                children->reserve(cz::heap_allocator(), 1);
                children->push(marker);
                continue;
            }

            rollback(parser->snippet, markers_len);

            if (result == MISMATCH) {
                text.reserve(cz::heap_allocator(), 1);
                text.push('$');
                parser->index = dollar + 1;
            } else {
                cz::Str rest = parser->body.slice_start(dollar);
                text.reserve(cz::heap_allocator(), rest.len);
                text.append(rest);
                parser->index = parser->body.len;
            }
            continue;
        }

        text.reserve(cz::heap_allocator(), 1);
        text.push(ch);
        ++parser->index;
    }

    flush_text(parser, parent, &text, children);
}

/// Parse `one,two|}` after the opening `|`.
static Parse_Result parse_choices(Parser* parser, cz::Vector<cz::String>* choices) {
    cz::String choice = {};
    while (1) {
        if (parser->at_end()) {
            choice.drop(cz::heap_allocator());
            return UNTERMINATED;
        }

        char ch = parser->peek();
        ++parser->index;

        if (ch == '\\' && !parser->at_end()) {
            char next = parser->peek();
            if (next == '$' || next == '}' || next == '\\' || next == ',' || next == '|') {
                choice.reserve(cz::heap_allocator(), 1);
                choice.push(next);
                ++parser->index;
                continue;
            }
        }

        if (ch == ',' || ch == '|') {
            choices->reserve(cz::heap_allocator(), 1);
            choices->push(choice);
            choice = {};
            if (ch == '|') {
                break;
            }
            continue;
        }

        choice.reserve(cz::heap_allocator(), 1);
        choice.push(ch);
    }

    if (parser->at_end()) {
        return UNTERMINATED;
    }
    if (parser->peek() != '}') {
        return MISMATCH;
    }
    ++parser->index;
    return MATCH;
}

/// Find the end of a `/` terminated section of a transform.  `\` escapes the next character.
/// In a format section a `/` inside a `${n...}` group doesn't end the section.
static Parse_Result scan_section(Parser* parser, bool format, cz::Str* section) {
    size_t start = parser->index;
    size_t depth = 0;
    while (1) {
        if (parser->at_end()) {
            return UNTERMINATED;
        }

        char ch = parser->peek();
        if (ch == '\\') {
            parser->index += 2;
            continue;
        }
        if (format && ch == '$' && parser->index + 2 < parser->body.len &&
            parser->body[parser->index + 1] == '{' && cz::is_digit(parser->body[parser->index + 2])) {
            ++depth;
            parser->index += 3;
            continue;
        }
        if (ch == '}' && depth > 0) {
            --depth;
        } else if (ch == '/' && depth == 0) {
            *section = parser->body.slice(start, parser->index);
            ++parser->index;
            return MATCH;
        }
        ++parser->index;
    }
}

static void unescape_regex(cz::Str section, cz::String* regex) {
    regex->reserve(cz::heap_allocator(), section.len);
    for (size_t i = 0; i < section.len; ++i) {
        if (section[i] == '\\' && i + 1 < section.len) {
            if (section[i + 1] != '/') {
                // Keep regex escapes such as `\d` intact.
                regex->push('\\');
            }
            regex->push(section[i + 1]);
            ++i;
            continue;
        }
        regex->push(section[i]);
    }
}

static void push_format_text(cz::Vector<Format_Fragment>* format, cz::Str text) {
    if (text.len == 0) {
        return;
    }
    if (format->len == 0 || format->last().tag != Format_Fragment::TEXT) {
        Format_Fragment fragment = {};
        fragment.tag = Format_Fragment::TEXT;
        format->reserve(cz::heap_allocator(), 1);
        format->push(fragment);
    }
    cz::String* string = &format->last().text;
    string->reserve(cz::heap_allocator(), text.len);
    string->append(text);
}

/// Read conditional text up to (not including) one of the characters in `terminators`.
static bool read_conditional_text(cz::Str format,
                                  size_t* index,
                                  cz::Str terminators,
                                  cz::String* out) {
    while (*index < format.len) {
        char ch = format[*index];
        if (terminators.find(ch)) {
            return true;
        }
        if (ch == '\\' && *index + 1 < format.len) {
            ++*index;
            ch = format[*index];
        }
        out->reserve(cz::heap_allocator(), 1);
        out->push(ch);
        ++*index;
    }
    return false;
}

/// Parse the `${` form of a format group starting after the `{`.
/// Returns `false` if it is malformed, in which case the `$` is literal.
static bool parse_format_group(cz::Str format, size_t* index, Format_Fragment* fragment) {
    size_t i = *index;
    if (i >= format.len || !cz::is_digit(format[i])) {
        return false;
    }
    fragment->group = 0;
    for (; i < format.len && cz::is_digit(format[i]); ++i) {
        fragment->group = fragment->group * 10 + (format[i] - '0');
    }
    if (i >= format.len) {
        return false;
    }

    if (format[i] == '}') {
        fragment->tag = Format_Fragment::GROUP;
        *index = i + 1;
        return true;
    }
    if (format[i] != ':' || i + 1 >= format.len) {
        return false;
    }
    ++i;

    char kind = format[i];
    if (kind == '/') {
        size_t name_start = ++i;
        for (; i < format.len && cz::is_alpha(format[i]); ++i) {
        }
        if (i >= format.len || format[i] != '}') {
            return false;
        }
        fragment->tag = Format_Fragment::GROUP;
        if (!parse_case_shape(format.slice(name_start, i), &fragment->shape)) {
            return false;
        }
        *index = i + 1;
        return true;
    }

    fragment->tag = Format_Fragment::CONDITIONAL;
    if (kind == '+') {
        ++i;
        if (!read_conditional_text(format, &i, "}", &fragment->text)) {
            return false;
        }
    } else if (kind == '?') {
        ++i;
        if (!read_conditional_text(format, &i, ":", &fragment->text)) {
            return false;
        }
        ++i;
        if (!read_conditional_text(format, &i, "}", &fragment->else_text)) {
            return false;
        }
    } else {
        if (kind == '-') {
            ++i;
        }
        if (!read_conditional_text(format, &i, "}", &fragment->else_text)) {
            return false;
        }
    }

    *index = i + 1;
    return true;
}

static void parse_format(cz::Str format, cz::Vector<Format_Fragment>* out) {
    size_t i = 0;
    while (i < format.len) {
        char ch = format[i];

        if (ch == '\\' && i + 1 < format.len) {
            char next = format[i + 1];
            switch (next) {
            case '/':
            case '\\':
            case '$':
                push_format_text(out, {&format[i + 1], 1});
                i += 2;
                continue;
            case 'n':
                push_format_text(out, "\n");
                i += 2;
                continue;
            case 't':
                push_format_text(out, "\t");
                i += 2;
                continue;
            case 'U':
            case 'L':
            case 'E':
            case 'u':
            case 'l': {
                Format_Fragment fragment = {};
                fragment.tag = Format_Fragment::CASE_FOLD;
                fragment.fold = next;
                out->reserve(cz::heap_allocator(), 1);
                out->push(fragment);
                i += 2;
                continue;
            }
            }
        }

        if (ch == '$' && i + 1 < format.len) {
            if (cz::is_digit(format[i + 1])) {
                Format_Fragment fragment = {};
                fragment.tag = Format_Fragment::GROUP;
                for (++i; i < format.len && cz::is_digit(format[i]); ++i) {
                    fragment.group = fragment.group * 10 + (format[i] - '0');
                }
                out->reserve(cz::heap_allocator(), 1);
                out->push(fragment);
                continue;
            }

            if (format[i + 1] == '{') {
                Format_Fragment fragment = {};
                size_t end = i + 2;
                if (parse_format_group(format, &end, &fragment)) {
                    out->reserve(cz::heap_allocator(), 1);
                    out->push(fragment);
                    i = end;
                    continue;
                }
                fragment.drop();
            }
        }

        push_format_text(out, {&format[i], 1});
        ++i;
    }
}

/// Parse `regex/format/flags}` after the first `/`.
static Parse_Result parse_transform(Parser* parser, Transform** out) {
    cz::Str regex_section, format_section;
    Parse_Result result = scan_section(parser, /*format=*/false, &regex_section);
    if (result != MATCH) {
        return result;
    }
    result = scan_section(parser, /*format=*/true, &format_section);
    if (result != MATCH) {
        return result;
    }

    size_t flags_start = parser->index;
    for (; !parser->at_end() && parser->peek() != '}'; ++parser->index) {
    }
    if (parser->at_end()) {
        return UNTERMINATED;
    }
    cz::Str flags = parser->body.slice(flags_start, parser->index);
    ++parser->index;

    Transform* transform = new Transform();
    transform->format_source = format_section.clone(cz::heap_allocator());
    transform->flags = flags.clone(cz::heap_allocator());
    unescape_regex(regex_section, &transform->regex_source);
    parse_format(format_section, &transform->format);

    if (!transform->compile()) {
        destroy_transform(transform);
        return MISMATCH;
    }

    *out = transform;
    return MATCH;
}

/// Parse the rest of a braced placeholder or variable after its index or name.
static Parse_Result parse_braced_body(Parser* parser, size_t self, bool allow_choices) {
    if (parser->at_end()) {
        return UNTERMINATED;
    }

    char ch = parser->peek();
    if (ch == '}') {
        ++parser->index;
        return MATCH;
    }

    if (ch == ':') {
        ++parser->index;
        cz::Vector<size_t> children = {};
        parse_children(parser, self, /*nested=*/true, &children);
        parser->snippet->markers[self].children = children;
        if (parser->at_end()) {
            return UNTERMINATED;
        }
        ++parser->index;
        return MATCH;
    }

    if (ch == '|' && allow_choices) {
        ++parser->index;
        return parse_choices(parser, &parser->snippet->markers[self].choices);
    }

    if (ch == '/') {
        ++parser->index;
        Transform* transform = nullptr;
        Parse_Result result = parse_transform(parser, &transform);
        if (result == MATCH) {
            parser->snippet->markers[self].transform = transform;
        }
        return result;
    }

    return MISMATCH;
}

static Parse_Result parse_dollar(Parser* parser, size_t parent, size_t* out) {
    CZ_DEBUG_ASSERT(parser->peek() == '$');
    ++parser->index;
    if (parser->at_end()) {
        return MISMATCH;
    }

    Marker marker = {};
    marker.parent = parent;

    bool braced = false;
    if (parser->peek() == '{') {
        braced = true;
        ++parser->index;
        if (parser->at_end()) {
            return UNTERMINATED;
        }
    }

    char ch = parser->peek();
    if (cz::is_digit(ch)) {
        marker.tag = Marker::PLACEHOLDER;
        if (!parse_index(parser, &marker.index)) {
            return MISMATCH;
        }
    } else if (is_name_start(ch)) {
        marker.tag = Marker::VARIABLE;
        parse_name(parser, &marker.value);
    } else {
        return MISMATCH;
    }

    *out = parser->snippet->push(marker);
    if (!braced) {
        return MATCH;
    }

    return parse_braced_body(parser, *out, marker.tag == Marker::PLACEHOLDER);
}

void parse(cz::Str body, bool insert_final_tabstop, Snippet* out) {
    ZoneScoped;

    *out = {};

    Parser parser = {};
    parser.body = body;
    parser.snippet = out;

    cz::Vector<size_t> children = {};
    parse_children(&parser, NO_MARKER, /*nested=*/false, &children);
    out->children = children;
    out->final_tabstop = insert_final_tabstop;

    out->fill_mirrors();
}

}
