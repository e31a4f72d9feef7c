#include <iostream>

#include "bore/elab/build_context.hpp"
#include "bore/ir/circuit.hpp"
#include "bore/vis/json.hpp"
#include "bore/wiring/boring_utils.hpp"
#include "demo_circuit.hpp"

using namespace bore;

int main(int argc, char** argv) {
    ir::Circuit circuit("Top");
    demo::DemoCircuit d = demo::buildDemoCircuit(circuit);

    elab::BuildContext ctx({}, &std::cerr);
    wiring::BoringUtils boring(ctx);

    // Hierarchical: Constant.x drives Expect.y and Monitor.probe.
    auto x = *d.mConstant->wire("x");
    auto y = *d.mExpect->wire("y");
    auto probe = *d.mMonitor->port("probe");
    std::string genName = boring.bore(x, {&y, &probe});
    note(&std::cerr, "bore generated '" + genName + "'");

    // Non-hierarchical: the literal is published under a user-chosen name
    // and picked up by the whole Monitor module.
    auto lit = ir::Signal(*d.mConstant, ir::SignalKind::Literal, 0);
    std::string id = boring.registerSource(lit, "answer");
    boring.registerSink(*d.mMonitor, id);

    std::cerr << "=== Hierarchy ===\n";
    ir::hier::dumpInstanceTree(*d.mTop, std::cerr);

    auto annos = ctx.annotations().snapshot();
    nlohmann::json out = {{"annotations", vis::annotationsToJson(annos)},
                          {"wiring", vis::wiringViewJson(annos)},
                          {"namespace",
                           vis::namespaceToJson(ctx.boringNamespace())}};
    try {
        if (argc > 1) {
            vis::writeJsonFile(argv[1], out);
            std::cerr << "Wrote " << argv[1] << "\n";
        } else {
            std::cout << out.dump(2) << std::endl;
        }
    } catch (const std::exception& e) {
        error(&std::cerr, e.what());
        return 1;
    }
    return 0;
}
