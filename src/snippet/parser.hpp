#pragma once

#include <cz/str.hpp>
#include "snippet/snippet.hpp"

namespace snip {

/// Parse a textmate style snippet `body` into `out`.
///
/// Parsing never fails.  Malformed constructs are kept as literal text.  If
/// `insert_final_tabstop` is set and the body has no `$0` then an empty
/// placeholder `$0` is added to the end.
void parse(cz::Str body, bool insert_final_tabstop, Snippet* out);

}
