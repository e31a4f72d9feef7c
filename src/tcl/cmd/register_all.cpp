#include "register_all.hpp"

namespace bore::tcl {
void register_all_commands(Console& c) {
    register_cmd_help(c);
    register_cmd_history(c);
    register_cmd_hierarchy(c);
    register_cmd_boring(c);
    register_cmd_names(c);
    register_cmd_annotations(c);
    register_cmd_options(c);
}
} // namespace bore::tcl
