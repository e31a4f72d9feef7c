#include <sstream>

#include "bore/tcl/console.hpp"

using bore::tcl::Console;

static const bore::ir::ModuleDef* topOrError(Console& c, Tcl_Interp* ip) {
    const auto* top = c.circuit().top();
    if (!top) Console::setResult(ip, "circuit has no top module");
    return top;
}

static int cmd_hierarchy(Console& c, Tcl_Interp* ip, const Console::Args& a) {
    const bore::ir::ModuleDef* root = nullptr;
    if (a.empty()) {
        root = topOrError(c, ip);
        if (!root) return TCL_ERROR;
    } else {
        root = c.circuit().findModule(a[0]);
        if (!root) {
            Console::setResult(ip, "no such module '" + a[0] + "'");
            return TCL_ERROR;
        }
    }
    std::ostringstream oss;
    bore::ir::hier::dumpInstanceTree(*root, oss);
    Console::setResult(ip, oss.str());
    return TCL_OK;
}

static int cmd_where(Console& c, Tcl_Interp* ip, const Console::Args& a) {
    if (a.size() != 1) {
        Console::setResult(ip, "usage: where <Module>");
        return TCL_ERROR;
    }
    const auto* top = topOrError(c, ip);
    if (!top) return TCL_ERROR;
    const auto* m = c.circuit().findModule(a[0]);
    if (!m) {
        Console::setResult(ip, "no such module '" + a[0] + "'");
        return TCL_ERROR;
    }
    std::ostringstream oss;
    for (const auto& scope : bore::ir::hier::findInstancePaths(*top, *m))
        oss << bore::ir::hier::renderScope(*top, scope) << "\n";
    Console::setResult(ip, oss.str());
    return TCL_OK;
}

static int cmd_layout(Console& c, Tcl_Interp* ip, const Console::Args& a) {
    if (a.size() != 1) {
        Console::setResult(ip, "usage: layout <Module>");
        return TCL_ERROR;
    }
    const auto* m = c.circuit().findModule(a[0]);
    if (!m) {
        Console::setResult(ip, "no such module '" + a[0] + "'");
        return TCL_ERROR;
    }
    std::ostringstream oss;
    m->dumpLayout(oss);
    Console::setResult(ip, oss.str());
    return TCL_OK;
}

static std::vector<std::string> compl_module(Console& c,
                                             const Console::Args& toks) {
    if (toks.size() != 2) return {};
    return c.completeModules(toks[1]);
}

namespace bore::tcl {
void register_cmd_hierarchy(Console& c) {
    c.registerCommand("hierarchy",
                      "Print the instance tree: hierarchy [Module]",
                      &cmd_hierarchy,
                      &compl_module);
    c.registerCommand("where",
                      "List instance paths of a module: where <Module>",
                      &cmd_where,
                      &compl_module);
    c.registerCommand("layout",
                      "Print ports/wires of a module: layout <Module>",
                      &cmd_layout,
                      &compl_module);
}
} // namespace bore::tcl
