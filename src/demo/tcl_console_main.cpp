#include <iostream>
#include <string>
#include <vector>

#include "bore/elab/build_context.hpp"
#include "bore/ir/circuit.hpp"
#include "bore/tcl/console.hpp"
#include "demo_circuit.hpp"

using namespace bore;

// Usage: bore_console [NAME=VALUE...] [script.tcl]
int main(int argc, char** argv) {
    std::vector<std::string> toks;
    std::string script;
    for (int i = 1; i < argc; ++i) {
        std::string t(argv[i]);
        if (t.find('=') == std::string::npos) script = t;
        else toks.push_back(t);
    }
    elab::BuildOptions opts = elab::parseOptionTokens(toks, 0, &std::cerr);

    // Build a tiny default circuit so the console is usable out-of-the-box.
    ir::Circuit circuit("Top");
    demo::buildDemoCircuit(circuit);

    elab::BuildContext ctx(opts, &std::cerr);
    bore::tcl::Console console(circuit, ctx, std::cerr);
    if (!console.init()) {
        std::cerr << "Failed to init Tcl console\n";
        return 1;
    }

    if (!script.empty())
        return console.evalLine("source {" + script + "}");
    return console.repl();
}
