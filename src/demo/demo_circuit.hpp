#pragma once
// Small circuit shared by the demo executables and the tests:
//
//   Top
//     constant : Constant   (wire x[6], literal 42)
//     wrapper  : Wrapper
//       expect : Expect     (wire y[6])
//     monitor  : Monitor    (input probe[6])

#include "bore/ir/circuit.hpp"

namespace bore::demo {

struct DemoCircuit {
    ir::ModuleDef* mTop = nullptr;
    ir::ModuleDef* mConstant = nullptr;
    ir::ModuleDef* mWrapper = nullptr;
    ir::ModuleDef* mExpect = nullptr;
    ir::ModuleDef* mMonitor = nullptr;
};

DemoCircuit buildDemoCircuit(ir::Circuit& circuit);

} // namespace bore::demo
