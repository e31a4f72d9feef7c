#pragma once
#include "bore/tcl/console.hpp"

// Declarations of per-file registration
namespace bore::tcl {
void register_cmd_help(Console& c);        // help/commands
void register_cmd_history(Console& c);     // history
void register_cmd_hierarchy(Console& c);   // hierarchy/where/layout
void register_cmd_boring(Console& c);      // add-source/add-sink/bore
void register_cmd_names(Console& c);       // name-exists/names
void register_cmd_annotations(Console& c); // annotations/clear-annotations
void register_cmd_options(Console& c);     // set-option/options

void register_all_commands(Console& c);
} // namespace bore::tcl
