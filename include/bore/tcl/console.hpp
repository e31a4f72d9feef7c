#pragma once
// Interactive Tcl driver over one circuit and one build context. Every
// command is a top-level Tcl command, so scripts can mix them with Tcl.

#include <ostream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <tcl.h>

#include "bore/elab/build_context.hpp"
#include "bore/ir/circuit.hpp"
#include "bore/wiring/boring_utils.hpp"

namespace bore::tcl {

class Console {
  public:
    using Args = std::vector<std::string>;

    // Handlers return TCL_OK/TCL_ERROR and leave their text in the
    // interpreter result. Exceptions become TCL_ERROR.
    using Handler = int (*)(Console&, Tcl_Interp*, const Args&);
    // Gets every token of the line, the command name first.
    using Completer = std::vector<std::string> (*)(Console&, const Args&);

    struct Subcmd {
        std::string mName;
        std::string mHelp; // one line, with usage
        Handler mHandler = nullptr;
        Completer mCompleter = nullptr;
    };

    Console(ir::Circuit& circuit, elab::BuildContext& ctx, std::ostream& diag);
    ~Console();

    Console(const Console&) = delete;
    Console& operator=(const Console&) = delete;

    // Create the interpreter and register the built-in commands.
    bool init();
    int repl();
    // 0 on success; errors are reported to diag.
    int evalLine(const std::string& line);

    void registerCommand(const std::string& name, const std::string& help,
                         Handler handler, Completer completer = nullptr);
    bool hasCommand(const std::string& name) const;
    // (name, help), sorted by name
    std::vector<std::pair<std::string, std::string>> listCommands() const;
    bool getCommandHelp(const std::string& name, std::string& outHelp) const;

    static std::string makeCmdLine(const std::string& sub, const Args& args);
    static void setResult(Tcl_Interp* ip, const std::string& s);

    std::vector<std::string> completeModules(const std::string& prefix) const;
    // "Module." prefixes complete to that module's ports and wires.
    std::vector<std::string> completePaths(const std::string& prefix) const;

    // "~", "Module" or "Module.signal"; the error text is left in ip.
    bool resolveRef(Tcl_Interp* ip, const std::string& path,
                    ir::ComponentRef& out) const;

    Tcl_Interp* interp() const { return mInterp; }
    ir::Circuit& circuit() { return mCircuit; }
    const ir::Circuit& circuit() const { return mCircuit; }
    elab::BuildContext& context() { return mCtx; }
    wiring::BoringUtils& boring() { return mBoring; }
    std::ostream& diag() { return mDiag; }

    // Registers every command group under src/tcl/cmd.
    void registerAllBuiltins();

#ifdef BORE_HAVE_READLINE
    static char** complt(const char* text, int start, int end);
    static Console* sCompletionSelf;
#endif

  private:
    static int TclCmd(ClientData cd, Tcl_Interp* interp, int objc,
                      Tcl_Obj* const objv[]);
    int dispatchCommand(Tcl_Interp* interp, const std::string& cmdName,
                        const Args& args);

    static std::string toStd(Tcl_Obj* obj);
    std::vector<std::string> complete(const std::string& line) const;
    std::vector<std::string>
    completeCommandNames(const std::string& prefix) const;

    Tcl_Interp* mInterp = nullptr;
    std::unordered_map<std::string, Subcmd> mSubcmds;

    ir::Circuit& mCircuit;
    elab::BuildContext& mCtx;
    wiring::BoringUtils mBoring;
    std::ostream& mDiag;
};

} // namespace bore::tcl
