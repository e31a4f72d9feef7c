#include <sstream>

#ifdef BORE_HAVE_READLINE
#include <readline/history.h>
#endif

#include "bore/tcl/console.hpp"

using bore::tcl::Console;

static int cmd_history(Console&, Tcl_Interp* ip, const Console::Args&) {
#ifdef BORE_HAVE_READLINE
    std::ostringstream oss;
    HIST_ENTRY** list = history_list();
    if (list) {
        for (int i = 0; list[i]; i++) {
            oss << (i + history_base) << ": " << list[i]->line << "\n";
        }
    }
    Console::setResult(ip, oss.str());
    return TCL_OK;
#else
    Console::setResult(ip, "history requires readline support");
    return TCL_ERROR;
#endif
}

namespace bore::tcl {
void register_cmd_history(Console& c) {
    c.registerCommand("history", "List the command histories", &cmd_history);
}
} // namespace bore::tcl
