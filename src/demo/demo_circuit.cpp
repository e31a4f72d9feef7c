#include "demo_circuit.hpp"

namespace bore::demo {
DemoCircuit buildDemoCircuit(ir::Circuit& circuit) {
    DemoCircuit d;
    d.mTop = &circuit.addModule("Top");
    d.mConstant = &circuit.addModule("Constant");
    d.mWrapper = &circuit.addModule("Wrapper");
    d.mExpect = &circuit.addModule("Expect");
    d.mMonitor = &circuit.addModule("Monitor");
    circuit.setTop(*d.mTop);

    d.mConstant->addWire("x", 6);
    d.mConstant->addLiteral(42, 6);

    d.mExpect->addWire("y", 6);
    d.mWrapper->addInstance("expect", *d.mExpect);

    d.mMonitor->addPort("probe", PortDirection::In, 6);

    d.mTop->addInstance("constant", *d.mConstant);
    d.mTop->addInstance("wrapper", *d.mWrapper);
    d.mTop->addInstance("monitor", *d.mMonitor);
    return d;
}
} // namespace bore::demo
