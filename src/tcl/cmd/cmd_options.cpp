#include <sstream>

#include "bore/tcl/console.hpp"

using bore::tcl::Console;

static int cmd_set_option(Console& c, Tcl_Interp* ip, const Console::Args& a) {
    if (a.empty()) {
        Console::setResult(ip, "usage: set-option NAME=VALUE...");
        return TCL_ERROR;
    }
    auto& ctx = c.context();
    std::ostringstream why;
    std::ostream* prev = ctx.diag();
    ctx.setDiag(&why);
    bool ok = ctx.updateOptions(a);
    ctx.setDiag(prev);
    if (!ok) {
        Console::setResult(ip, why.str());
        return TCL_ERROR;
    }
    Console::setResult(ip, "OK");
    return TCL_OK;
}

static int cmd_options(Console& c, Tcl_Interp* ip, const Console::Args&) {
    const auto& o = c.context().options();
    std::ostringstream oss;
    oss << "strict_names=" << (o.mStrictNames ? 1 : 0) << "\n";
    oss << "reserve=";
    for (size_t i = 0; i < o.mReservedKeywords.size(); ++i) {
        if (i) oss << ',';
        oss << o.mReservedKeywords[i];
    }
    oss << "\n";
    Console::setResult(ip, oss.str());
    return TCL_OK;
}

namespace bore::tcl {
void register_cmd_options(Console& c) {
    c.registerCommand("set-option",
                      "Set build options: set-option strict_names=0|1 "
                      "reserve=<name>[,<name>...]",
                      &cmd_set_option);
    c.registerCommand("options", "Show build options", &cmd_options);
}
} // namespace bore::tcl
