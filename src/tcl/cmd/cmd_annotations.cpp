#include <sstream>

#include "bore/tcl/console.hpp"
#include "bore/vis/json.hpp"

using bore::tcl::Console;

static int cmd_annotations(Console& c, Tcl_Interp* ip,
                           const Console::Args& a) {
    auto annos = c.context().annotations().snapshot();
    if (a.empty()) {
        std::ostringstream oss;
        for (size_t i = 0; i < annos.size(); ++i)
            oss << "[" << i << "] " << annos[i].toString() << "\n";
        Console::setResult(ip, oss.str());
        return TCL_OK;
    }
    nlohmann::json j;
    if (a[0] == "-json") {
        j = bore::vis::annotationsToJson(annos);
    } else if (a[0] == "-by-name") {
        j = bore::vis::wiringViewJson(annos);
    } else {
        Console::setResult(ip,
                           "usage: annotations [-json|-by-name [file]]");
        return TCL_ERROR;
    }
    if (a.size() >= 2) {
        bore::vis::writeJsonFile(a[1], j);
        Console::setResult(ip, "wrote " + a[1]);
        return TCL_OK;
    }
    Console::setResult(ip, j.dump(2));
    return TCL_OK;
}

static int cmd_clear_annotations(Console& c, Tcl_Interp* ip,
                                 const Console::Args&) {
    size_t n = c.context().annotations().size();
    c.context().clearAnnotations();
    Console::setResult(ip, "cleared " + std::to_string(n) + " annotations");
    return TCL_OK;
}

namespace bore::tcl {
void register_cmd_annotations(Console& c) {
    c.registerCommand("annotations",
                      "Show recorded intents: annotations [-json|-by-name "
                      "[file]]",
                      &cmd_annotations);
    c.registerCommand("clear-annotations",
                      "Drop recorded intents, keep the namespace",
                      &cmd_clear_annotations);
}
} // namespace bore::tcl
