#include <sstream>

#include "bore/tcl/console.hpp"
#include "bore/vis/json.hpp"

using bore::tcl::Console;

static int cmd_name_exists(Console& c, Tcl_Interp* ip,
                           const Console::Args& a) {
    if (a.size() != 1) {
        Console::setResult(ip, "usage: name-exists <name>");
        return TCL_ERROR;
    }
    bool found = c.context().boringNamespace().exists(a[0]);
    Tcl_SetObjResult(ip, Tcl_NewBooleanObj(found ? 1 : 0));
    return TCL_OK;
}

static int cmd_names(Console& c, Tcl_Interp* ip, const Console::Args& a) {
    const auto& ns = c.context().boringNamespace();
    if (!a.empty() && a[0] == "-json") {
        Console::setResult(ip, bore::vis::namespaceToJson(ns).dump(2));
        return TCL_OK;
    }
    if (!a.empty()) {
        Console::setResult(ip, "usage: names [-json]");
        return TCL_ERROR;
    }
    std::ostringstream oss;
    for (const auto& n : ns.names())
        oss << n << "\n";
    Console::setResult(ip, oss.str());
    return TCL_OK;
}

namespace bore::tcl {
void register_cmd_names(Console& c) {
    c.registerCommand("name-exists",
                      "Check the boring ID namespace: name-exists <name>",
                      &cmd_name_exists);
    c.registerCommand(
      "names", "List the boring ID namespace: names [-json]", &cmd_names);
}
} // namespace bore::tcl
