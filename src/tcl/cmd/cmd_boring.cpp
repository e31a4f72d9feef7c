#include <algorithm>
#include <sstream>

#include "bore/tcl/console.hpp"

using bore::tcl::Console;

// Split trailing "-flag" tokens from positional arguments. Returns false on
// an unknown flag, with the error text left in ip.
static bool splitFlags(Tcl_Interp* ip, const Console::Args& a,
                       const std::vector<std::string>& known,
                       Console::Args& positional,
                       std::vector<std::string>& flags) {
    for (const auto& t : a) {
        if (t.size() > 1 && t[0] == '-') {
            if (std::find(known.begin(), known.end(), t) == known.end()) {
                Console::setResult(ip, "unknown flag: " + t);
                return false;
            }
            flags.push_back(t);
        } else {
            positional.push_back(t);
        }
    }
    return true;
}

static bool hasFlag(const std::vector<std::string>& flags,
                    const std::string& f) {
    return std::find(flags.begin(), flags.end(), f) != flags.end();
}

static bool resolveSource(Console& c, Tcl_Interp* ip, const std::string& path,
                          bore::ir::ComponentRef& out) {
    if (!c.resolveRef(ip, path, out)) return false;
    if (!out.mSignal) {
        Console::setResult(ip,
                           "source must be a signal (Module.signal): " + path);
        return false;
    }
    return true;
}

static int cmd_add_source(Console& c, Tcl_Interp* ip, const Console::Args& a) {
    Console::Args pos;
    std::vector<std::string> flags;
    if (!splitFlags(ip, a, {"-nodedup", "-unique"}, pos, flags))
        return TCL_ERROR;
    if (pos.size() != 2) {
        Console::setResult(
          ip, "usage: add-source <Module.signal> <name> [-nodedup] [-unique]");
        return TCL_ERROR;
    }
    bore::ir::ComponentRef src;
    if (!resolveSource(c, ip, pos[0], src)) return TCL_ERROR;
    std::string id = c.boring().registerSource(*src.mSignal,
                                               pos[1],
                                               hasFlag(flags, "-nodedup"),
                                               hasFlag(flags, "-unique"));
    Console::setResult(ip, id);
    return TCL_OK;
}

static int cmd_add_sink(Console& c, Tcl_Interp* ip, const Console::Args& a) {
    Console::Args pos;
    std::vector<std::string> flags;
    if (!splitFlags(ip, a, {"-nodedup", "-exists"}, pos, flags))
        return TCL_ERROR;
    if (pos.size() != 2) {
        Console::setResult(
          ip,
          "usage: add-sink <Module[.signal]|~> <name> [-nodedup] [-exists]");
        return TCL_ERROR;
    }
    bore::ir::ComponentRef dst;
    if (!c.resolveRef(ip, pos[0], dst)) return TCL_ERROR;
    c.boring().registerSink(
      dst.id(), pos[1], hasFlag(flags, "-nodedup"), hasFlag(flags, "-exists"));
    Console::setResult(ip, "OK");
    return TCL_OK;
}

// Report the module the bore spans when both ends have a single instance.
static void noteSpan(Console& c, const bore::ir::Signal& src,
                     const std::vector<bore::ir::ComponentRef>& sinks) {
    namespace hier = bore::ir::hier;
    const auto* top = c.circuit().top();
    if (!top || sinks.empty()) return;
    auto srcPaths = hier::findInstancePaths(*top, src.owner());
    if (srcPaths.size() != 1) return;
    hier::ScopeId common = srcPaths.front();
    for (const auto& s : sinks) {
        if (!s.mSignal) return;
        auto paths = hier::findInstancePaths(*top, s.mSignal->owner());
        if (paths.size() != 1) return;
        common = hier::lowestCommonAncestor(common, paths.front());
    }
    bore::note(&c.diag(),
               "bore spans " + hier::renderScope(*top, common));
}

static int cmd_bore(Console& c, Tcl_Interp* ip, const Console::Args& a) {
    if (a.empty()) {
        Console::setResult(ip, "usage: bore <Module.signal> <sink>...");
        return TCL_ERROR;
    }
    bore::ir::ComponentRef src;
    if (!resolveSource(c, ip, a[0], src)) return TCL_ERROR;

    std::vector<bore::ir::ComponentRef> refs(a.size() - 1);
    for (size_t i = 1; i < a.size(); ++i)
        if (!c.resolveRef(ip, a[i], refs[i - 1])) return TCL_ERROR;
    std::vector<const bore::ir::InstanceId*> sinks;
    sinks.reserve(refs.size());
    for (const auto& r : refs)
        sinks.push_back(&r.id());

    std::string id = c.boring().bore(*src.mSignal, sinks);
    noteSpan(c, *src.mSignal, refs);
    Console::setResult(ip, id);
    return TCL_OK;
}

static std::vector<std::string> compl_paths(Console& c,
                                            const Console::Args& toks) {
    if (toks.size() < 2) return {};
    const std::string& last = toks.back();
    if (!last.empty() && last[0] == '-') return {};
    return c.completePaths(last);
}

namespace bore::tcl {
void register_cmd_boring(Console& c) {
    c.registerCommand("add-source",
                      "Declare a named source: add-source <Module.signal> "
                      "<name> [-nodedup] [-unique]",
                      &cmd_add_source,
                      &compl_paths);
    c.registerCommand("add-sink",
                      "Declare a named sink: add-sink <Module[.signal]> "
                      "<name> [-nodedup] [-exists]",
                      &cmd_add_sink,
                      &compl_paths);
    c.registerCommand("bore",
                      "Connect a source to sinks with a generated name: bore "
                      "<Module.signal> <sink>...",
                      &cmd_bore,
                      &compl_paths);
}
} // namespace bore::tcl
