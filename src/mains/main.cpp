#include <inttypes.h>
#include <stdio.h>
#include <cz/defer.hpp>
#include <cz/heap.hpp>
#include <cz/str.hpp>
#include <tracy/Tracy.hpp>
#include "custom/config.hpp"
#include "snippet/parser.hpp"
#include "snippet/placeholder_groups.hpp"
#include "snippet/snippet.hpp"
#include "snippet/variables.hpp"

using namespace snip;

static const char* program_name = "snip";

static int usage() {
    fprintf(stderr,
            "%s [options] TEMPLATE\n\
\n\
Expand a textmate style snippet and print the result.\n\
\n\
Options:\n\
  --help             View the help page.\n\
  --no-final-tabstop Don't add $0 to the end of the snippet.\n\
  --textmate         Print the normalized snippet instead of expanding it.\n\
  --tabstops         Also print the span of each tabstop to stderr.\n\
  --file=PATH        The file the snippet is inserted into (TM_FILENAME, etc.).\n\
  --selection=TEXT   The value of TM_SELECTED_TEXT.\n\
  --clipboard=TEXT   The value of CLIPBOARD.\n\
  --line=NUMBER      The zero based line the snippet is inserted at.\n",
            program_name);
    return 1;
}

static void print_tabstops(const Snippet& snippet) {
    Placeholder_Groups groups = {};
    CZ_DEFER(groups.drop());
    groups.rebuild(snippet);

    for (size_t i = 0; i < groups.groups.len; ++i) {
        const Placeholder_Group& group = groups.groups[i];
        fprintf(stderr, "$%" PRIu64 ":", group.index);
        for (size_t j = 0; j < group.mirrors.len; ++j) {
            const Marker& marker = snippet.markers[group.mirrors[j]];
            fprintf(stderr, " %" PRIu64 "-%" PRIu64, marker.start, marker.end);
        }
        fprintf(stderr, "\n");
    }
}

int main(int argc, char** argv) {
    ZoneScoped;

    if (argc > 0) {
        program_name = argv[0];
    }

    Variable_Context context = {};
    bool textmate = false;
    bool tabstops = false;
    const char* body = nullptr;

    for (int i = 1; i < argc; ++i) {
        cz::Str arg = argv[i];
        if (arg == "--help") {
            usage();
            return 0;
        } else if (arg == "--no-final-tabstop") {
            custom::insert_final_tabstop = false;
        } else if (arg == "--textmate") {
            textmate = true;
        } else if (arg == "--tabstops") {
            tabstops = true;
        } else if (arg.starts_with("--file=")) {
            context.file_path = arg.slice_start(7);
        } else if (arg.starts_with("--selection=")) {
            context.selected_text = arg.slice_start(12);
        } else if (arg.starts_with("--clipboard=")) {
            context.clipboard = arg.slice_start(12);
        } else if (arg.starts_with("--line=")) {
            uint64_t line = 0;
            if (sscanf(argv[i] + 7, "%" SCNu64, &line) != 1) {
                fprintf(stderr, "Invalid line number: %s\n", argv[i] + 7);
                return usage();
            }
            context.line_index = line;
        } else if (arg.starts_with("--")) {
            fprintf(stderr, "Unknown option: %s\n", argv[i]);
            return usage();
        } else if (body) {
            fprintf(stderr, "Only one template can be expanded at a time\n");
            return usage();
        } else {
            body = argv[i];
        }
    }

    if (!body) {
        return usage();
    }

    Snippet snippet = {};
    parse(body, custom::insert_final_tabstop, &snippet);
    CZ_DEFER(snippet.drop());

    cz::String output = {};
    CZ_DEFER(output.drop(cz::heap_allocator()));

    if (textmate) {
        to_textmate(snippet, cz::heap_allocator(), &output);
    } else {
        snippet.resolve_variables(context_variable_resolver(&context));
        snippet.compute_offsets(0);
        snippet.render(cz::heap_allocator(), &output);
    }

    fwrite(output.buffer, 1, output.len, stdout);
    fputc('\n', stdout);

    if (tabstops && !textmate) {
        print_tabstops(snippet);
    }

    return 0;
}
