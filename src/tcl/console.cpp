#include "bore/tcl/console.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>

#ifdef BORE_HAVE_READLINE
#include <readline/history.h>
#include <readline/readline.h>
#endif

#include "cmd/register_all.hpp"

namespace bore::tcl {
namespace {
bool hasPrefix(const std::string& s, const std::string& p) {
    return s.compare(0, p.size(), p) == 0;
}

std::string trim(const std::string& s) {
    auto notSpace = [](unsigned char ch) { return !std::isspace(ch); };
    auto b = std::find_if(s.begin(), s.end(), notSpace);
    auto e = std::find_if(s.rbegin(), s.rend(), notSpace).base();
    return b < e ? std::string(b, e) : std::string();
}

std::vector<std::string> words(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream iss(s);
    for (std::string w; iss >> w;)
        out.push_back(w);
    return out;
}
} // namespace

Console::Console(ir::Circuit& circuit, elab::BuildContext& ctx,
                 std::ostream& diag)
    : mCircuit(circuit)
    , mCtx(ctx)
    , mBoring(ctx)
    , mDiag(diag) {}

Console::~Console() {
    if (mInterp) Tcl_DeleteInterp(mInterp);
}

bool Console::init() {
    mInterp = Tcl_CreateInterp();
    if (!mInterp) {
        error(&mDiag, "cannot create Tcl interpreter");
        return false;
    }
    // Without init.tcl only the script library is missing; core commands
    // such as 'source' and 'proc' still work.
    if (Tcl_Init(mInterp) != TCL_OK)
        warn(&mDiag,
             std::string("Tcl_Init failed: ") + Tcl_GetStringResult(mInterp));
    registerAllBuiltins();
    return true;
}

void Console::registerAllBuiltins() { register_all_commands(*this); }

void Console::registerCommand(const std::string& name, const std::string& help,
                              Handler handler, Completer completer) {
    if (hasCommand(name)) warn(&mDiag, "command '" + name + "' redefined");
    mSubcmds[name] = Subcmd{name, help, handler, completer};
    Tcl_CreateObjCommand(
      mInterp, name.c_str(), &Console::TclCmd, this, nullptr);
}

bool Console::hasCommand(const std::string& name) const {
    return mSubcmds.count(name) != 0;
}

std::vector<std::pair<std::string, std::string>>
Console::listCommands() const {
    std::vector<std::pair<std::string, std::string>> out;
    for (const auto& kv : mSubcmds)
        out.emplace_back(kv.first, kv.second.mHelp);
    std::sort(out.begin(), out.end());
    return out;
}

bool Console::getCommandHelp(const std::string& name,
                             std::string& outHelp) const {
    auto it = mSubcmds.find(name);
    if (it == mSubcmds.end()) return false;
    outHelp = it->second.mHelp;
    return true;
}

int Console::evalLine(const std::string& line) {
    if (line.empty()) return 0;
    int code = Tcl_EvalEx(
      mInterp, line.c_str(), static_cast<int>(line.size()), TCL_EVAL_GLOBAL);
    std::string res = Tcl_GetStringResult(mInterp);
    if (code != TCL_OK) {
        error(&mDiag, res);
        return 1;
    }
    if (!res.empty()) {
        mDiag << res;
        if (res.back() != '\n') mDiag << "\n";
    }
    return 0;
}

#ifdef BORE_HAVE_READLINE
Console* Console::sCompletionSelf = nullptr;

// readline calls the generator with state 0 first, then keeps calling it
// until it returns null. Each returned string is freed by readline.
static std::vector<std::string> sMatches;
static char* matchGenerator(const char* text, int state) {
    static size_t next = 0;
    if (state == 0) next = 0;
    while (next < sMatches.size()) {
        const std::string& m = sMatches[next++];
        if (hasPrefix(m, text)) return ::strdup(m.c_str());
    }
    return nullptr;
}

char** Console::complt(const char* text, int start, int end) {
    (void)start;
    (void)end;
    rl_attempted_completion_over = 1;
    if (!sCompletionSelf) return nullptr;
    sMatches = sCompletionSelf->complete(rl_line_buffer ? rl_line_buffer : "");
    // "Module." completes to a signal; do not append a space after it.
    rl_completion_append_character =
      (sMatches.size() == 1 && sMatches[0].back() == '.') ? '\0' : ' ';
    return rl_completion_matches(text, &matchGenerator);
}
#endif

int Console::repl() {
#ifdef BORE_HAVE_READLINE
    sCompletionSelf = this;
    rl_attempted_completion_function = &Console::complt;
#endif
    note(&mDiag,
         "circuit '" + mCircuit.name() + "', " +
           std::to_string(mCircuit.modules().size()) + " modules, " +
           std::to_string(mCtx.annotations().size()) +
           " intents recorded. Type 'help'; Ctrl+D exits.");
    const std::string prompt = "bore:" + mCircuit.name() + "> ";
    while (true) {
        std::string s;
#ifdef BORE_HAVE_READLINE
        char* raw = readline(prompt.c_str());
        if (!raw) break;
        s = trim(raw);
        std::free(raw);
        if (s.empty()) continue;
        add_history(s.c_str());
#else
        mDiag << prompt << std::flush;
        if (!std::getline(std::cin, s)) break;
        s = trim(s);
        if (s.empty()) continue;
#endif
        (void)evalLine(s);
    }
    mDiag << "\n";
#ifdef BORE_HAVE_READLINE
    sCompletionSelf = nullptr;
#endif
    return 0;
}

int Console::TclCmd(ClientData cd, Tcl_Interp* interp, int objc,
                    Tcl_Obj* const objv[]) {
    auto* self = static_cast<Console*>(cd);
    if (!self || objc < 1) return TCL_ERROR;
    Args args;
    for (int i = 1; i < objc; ++i)
        args.push_back(toStd(objv[i]));
    return self->dispatchCommand(interp, toStd(objv[0]), args);
}

int Console::dispatchCommand(Tcl_Interp* interp, const std::string& cmdName,
                             const Args& args) {
    auto it = mSubcmds.find(cmdName);
    if (it == mSubcmds.end() || !it->second.mHandler) {
        setResult(interp, "unknown command: " + cmdName);
        return TCL_ERROR;
    }
    // Boring errors carry a complete message; anything else gets the
    // command line for context.
    try {
        return it->second.mHandler(*this, interp, args);
    } catch (const BoringException& e) {
        setResult(interp, e.what());
    } catch (const std::exception& e) {
        setResult(interp, makeCmdLine(cmdName, args) + ": " + e.what());
    }
    return TCL_ERROR;
}

std::string Console::toStd(Tcl_Obj* obj) {
    int len = 0;
    const char* s = Tcl_GetStringFromObj(obj, &len);
    return std::string(s, static_cast<size_t>(len));
}

std::vector<std::string> Console::complete(const std::string& line) const {
    auto toks = words(line);
    if (toks.empty() || (!line.empty() && std::isspace(
                                            static_cast<unsigned char>(line.back()))))
        toks.emplace_back();
    if (toks.size() == 1) return completeCommandNames(toks[0]);

    auto it = mSubcmds.find(toks[0]);
    if (it == mSubcmds.end() || !it->second.mCompleter) return {};
    return it->second.mCompleter(const_cast<Console&>(*this), toks);
}

std::vector<std::string>
Console::completeCommandNames(const std::string& prefix) const {
    std::vector<std::string> r;
    for (const auto& kv : mSubcmds)
        if (hasPrefix(kv.first, prefix)) r.push_back(kv.first);
    std::sort(r.begin(), r.end());
    return r;
}

std::string Console::makeCmdLine(const std::string& sub, const Args& args) {
    std::string s = sub;
    for (const auto& a : args)
        s += " " + a;
    return s;
}

void Console::setResult(Tcl_Interp* ip, const std::string& s) {
    Tcl_SetObjResult(
      ip, Tcl_NewStringObj(s.c_str(), static_cast<int>(s.size())));
}

std::vector<std::string>
Console::completeModules(const std::string& prefix) const {
    std::vector<std::string> r;
    for (const auto& m : mCircuit.modules())
        if (hasPrefix(m->name(), prefix)) r.push_back(m->name());
    std::sort(r.begin(), r.end());
    return r;
}

std::vector<std::string>
Console::completePaths(const std::string& prefix) const {
    auto dot = prefix.find('.');
    if (dot == std::string::npos) {
        auto r = completeModules(prefix);
        for (auto& s : r)
            s.push_back('.');
        if (hasPrefix("~", prefix)) r.insert(r.begin(), "~");
        return r;
    }
    std::vector<std::string> r;
    const ir::ModuleDef* m = mCircuit.findModule(prefix.substr(0, dot));
    if (!m) return r;
    const std::string head = prefix.substr(0, dot + 1);
    for (const auto& p : m->ports())
        r.push_back(head + p.mName);
    for (const auto& w : m->wires())
        r.push_back(head + w.mName);
    r.erase(std::remove_if(r.begin(),
                           r.end(),
                           [&](const std::string& s) {
                               return !hasPrefix(s, prefix);
                           }),
            r.end());
    std::sort(r.begin(), r.end());
    return r;
}

bool Console::resolveRef(Tcl_Interp* ip, const std::string& path,
                         ir::ComponentRef& out) const {
    std::ostringstream why;
    if (mCircuit.resolve(path, out, &why)) return true;
    std::string msg = trim(why.str());
    const std::string tag = "ERROR: ";
    if (hasPrefix(msg, tag)) msg = msg.substr(tag.size());
    setResult(ip, msg.empty() ? "cannot resolve '" + path + "'" : msg);
    return false;
}

} // namespace bore::tcl
