#include "bore/ir/target.hpp"

#include "bore/common.hpp"

namespace bore::ir {
bool operator==(const CircuitTarget& a, const CircuitTarget& b) {
    return a.mCircuit == b.mCircuit;
}
bool operator==(const ModuleTarget& a, const ModuleTarget& b) {
    return a.mCircuit == b.mCircuit && a.mModule == b.mModule;
}
bool operator==(const ComponentTarget& a, const ComponentTarget& b) {
    return a.mModule == b.mModule && a.mRef == b.mRef;
}

std::string toString(const CircuitTarget& t) { return "~" + t.mCircuit; }
std::string toString(const ModuleTarget& t) {
    return "~" + t.mCircuit + "|" + t.mModule;
}
std::string toString(const ComponentTarget& t) {
    return toString(t.mModule) + ">" + t.mRef;
}
std::string toString(const Target& t) {
    return std::visit([](const auto& x) { return toString(x); }, t);
}

ModuleTarget owningModule(const Target& t) {
    if (auto* m = std::get_if<ModuleTarget>(&t)) return *m;
    if (auto* c = std::get_if<ComponentTarget>(&t)) return c->mModule;
    throw InvalidSinkTargetError(toString(t));
}
} // namespace bore::ir
