#include "config.hpp"

namespace snip {
namespace custom {

bool insert_final_tabstop = true;
bool select_on_insert = true;

cz::Str snippet_status_text = "SNIP";
cz::Str cancel_message = "Snippet session cancelled";

}
}
