#include "bore/tcl/console.hpp"

#include <algorithm>
#include <sstream>

using bore::tcl::Console;

static const char* kOverview =
  "Sources and sinks are matched by boring ID. 'add-source' and 'add-sink'\n"
  "record intents under a name you pick; 'bore' allocates a fresh ID from\n"
  "the namespace and connects one source to every sink given.\n";

// Edit distance between a mistyped command and a known one.
static size_t editDistance(const std::string& typed, const std::string& known) {
    std::vector<size_t> row(known.size() + 1);
    for (size_t j = 0; j < row.size(); ++j)
        row[j] = j;
    for (size_t i = 1; i <= typed.size(); ++i) {
        size_t diag = row[0];
        row[0] = i;
        for (size_t j = 1; j <= known.size(); ++j) {
            size_t up = row[j];
            size_t subst = diag + (typed[i - 1] == known[j - 1] ? 0 : 1);
            row[j] = std::min({up + 1, row[j - 1] + 1, subst});
            diag = up;
        }
    }
    return row.back();
}

// Commands close to what was typed: small edit distance, or containing it
// ("sink" suggests "add-sink").
static std::vector<std::string> suggestions(const Console& c,
                                            const std::string& typed) {
    std::vector<std::pair<size_t, std::string>> scored;
    for (const auto& kv : c.listCommands()) {
        const std::string& name = kv.first;
        size_t d = editDistance(typed, name);
        if (name.find(typed) != std::string::npos) d = 0;
        if (d <= std::max<size_t>(2, typed.size() / 3))
            scored.emplace_back(d, name);
    }
    std::stable_sort(scored.begin(),
                     scored.end(),
                     [](const auto& x, const auto& y) {
                         return x.first < y.first;
                     });
    std::vector<std::string> out;
    for (const auto& s : scored) {
        out.push_back(s.second);
        if (out.size() == 5) break;
    }
    return out;
}

static std::string commandTable(const Console& c) {
    auto list = c.listCommands();
    size_t w = 0;
    for (const auto& p : list)
        w = std::max(w, p.first.size());
    std::ostringstream oss;
    for (const auto& p : list)
        oss << "  " << p.first << std::string(w - p.first.size(), ' ')
            << "  " << p.second << "\n";
    return oss.str();
}

static int cmd_help(Console& c, Tcl_Interp* ip, const Console::Args& a) {
    if (a.empty()) {
        Console::setResult(ip,
                           std::string(kOverview) + "\ncommands:\n" +
                             commandTable(c));
        return TCL_OK;
    }
    std::string help;
    if (c.getCommandHelp(a[0], help)) {
        Console::setResult(ip, a[0] + ": " + help);
        return TCL_OK;
    }
    std::ostringstream oss;
    oss << "unknown command: " << a[0];
    auto near = suggestions(c, a[0]);
    if (!near.empty()) {
        oss << "; did you mean:";
        for (const auto& n : near)
            oss << " " << n;
    }
    Console::setResult(ip, oss.str());
    return TCL_ERROR;
}

static std::vector<std::string> compl_help(Console& c,
                                           const Console::Args& toks) {
    if (toks.size() != 2) return {};
    std::vector<std::string> out;
    for (const auto& p : c.listCommands())
        if (p.first.compare(0, toks[1].size(), toks[1]) == 0)
            out.push_back(p.first);
    return out;
}

// Tcl list of command names, for scripting.
static int cmd_commands(Console& c, Tcl_Interp* ip, const Console::Args&) {
    Tcl_Obj* lst = Tcl_NewListObj(0, nullptr);
    for (const auto& p : c.listCommands())
        Tcl_ListObjAppendElement(
          ip, lst, Tcl_NewStringObj(p.first.c_str(), -1));
    Tcl_SetObjResult(ip, lst);
    return TCL_OK;
}

namespace bore::tcl {
void register_cmd_help(Console& c) {
    c.registerCommand("help",
                      "Overview and command table, or usage of one command: "
                      "help [name]",
                      &cmd_help,
                      &compl_help);
    c.registerCommand(
      "commands", "List command names as a Tcl list", &cmd_commands);
}
} // namespace bore::tcl
