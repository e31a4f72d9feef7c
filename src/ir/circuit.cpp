#include "bore/ir/circuit.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

namespace bore::ir {
const char* to_string(SignalKind k) {
    switch (k) {
    case SignalKind::Port: return "port";
    case SignalKind::Wire: return "wire";
    case SignalKind::Literal: return "literal";
    }
    return "?";
}

// -------------------------------------------
// Signal
static std::string literalRef(uint32_t index) {
    return "_lit_" + std::to_string(index);
}

ComponentTarget Signal::toComponentTarget() const {
    std::string ref;
    switch (mKind) {
    case SignalKind::Port: ref = mOwner->ports()[mIndex].mName; break;
    case SignalKind::Wire: ref = mOwner->wires()[mIndex].mName; break;
    case SignalKind::Literal: ref = literalRef(mIndex); break;
    }
    return ComponentTarget{mOwner->moduleTarget(), ref};
}

std::optional<std::string> Signal::instanceName() const {
    switch (mKind) {
    case SignalKind::Port: return mOwner->ports()[mIndex].mName;
    case SignalKind::Wire: return mOwner->wires()[mIndex].mName;
    case SignalKind::Literal: break;
    }
    return std::nullopt;
}

uint32_t Signal::width() const {
    switch (mKind) {
    case SignalKind::Port: return mOwner->ports()[mIndex].mWidth;
    case SignalKind::Wire: return mOwner->wires()[mIndex].mWidth;
    case SignalKind::Literal: return mOwner->literals()[mIndex].mWidth;
    }
    return 0;
}
// End of Signal
// -------------------------------------------
// ModuleDef
ModuleDef::ModuleDef(const Circuit& circuit, std::string name)
    : mCircuit(&circuit)
    , mName(std::move(name)) {}

Signal ModuleDef::addPort(const std::string& name, PortDirection dir,
                          uint32_t width) {
    if (mPortIndex.count(name) || mWireIndex.count(name))
        throw std::invalid_argument("duplicate signal '" + name +
                                    "' in module " + mName);
    auto idx = static_cast<uint32_t>(mPorts.size());
    mPorts.push_back(PortDef{name, dir, width});
    mPortIndex.emplace(name, idx);
    return Signal(*this, SignalKind::Port, idx);
}

Signal ModuleDef::addWire(const std::string& name, uint32_t width) {
    if (mPortIndex.count(name) || mWireIndex.count(name))
        throw std::invalid_argument("duplicate signal '" + name +
                                    "' in module " + mName);
    auto idx = static_cast<uint32_t>(mWires.size());
    mWires.push_back(WireDef{name, width});
    mWireIndex.emplace(name, idx);
    return Signal(*this, SignalKind::Wire, idx);
}

Signal ModuleDef::addLiteral(uint64_t value, uint32_t width) {
    auto idx = static_cast<uint32_t>(mLiterals.size());
    mLiterals.push_back(LiteralDef{value, width});
    return Signal(*this, SignalKind::Literal, idx);
}

// True if target is mod itself or is reachable through its instances.
static bool reaches(const ModuleDef& mod, const ModuleDef& target,
                    std::unordered_set<const ModuleDef*>& seen) {
    if (&mod == &target) return true;
    if (!seen.insert(&mod).second) return false;
    for (const auto& inst : mod.instances())
        if (inst.mCallee && reaches(*inst.mCallee, target, seen)) return true;
    return false;
}

void ModuleDef::addInstance(const std::string& name, const ModuleDef& callee) {
    if (findInstanceIndex(name) >= 0)
        throw std::invalid_argument("duplicate instance '" + name +
                                    "' in module " + mName);
    std::unordered_set<const ModuleDef*> seen;
    if (reaches(callee, *this, seen))
        throw std::invalid_argument("instance '" + name + "' of " +
                                    callee.name() + " in module " + mName +
                                    " closes an instantiation cycle");
    mInstances.push_back(InstanceDef{name, &callee});
}

int ModuleDef::findPortIndex(std::string_view n) const {
    auto it = mPortIndex.find(std::string(n));
    return it == mPortIndex.end() ? -1 : static_cast<int>(it->second);
}
int ModuleDef::findWireIndex(std::string_view n) const {
    auto it = mWireIndex.find(std::string(n));
    return it == mWireIndex.end() ? -1 : static_cast<int>(it->second);
}
int ModuleDef::findInstanceIndex(std::string_view n) const {
    for (size_t i = 0; i < mInstances.size(); ++i)
        if (mInstances[i].mName == n) return static_cast<int>(i);
    return -1;
}

std::optional<Signal> ModuleDef::port(std::string_view n) const {
    int idx = findPortIndex(n);
    if (idx < 0) return std::nullopt;
    return Signal(*this, SignalKind::Port, static_cast<uint32_t>(idx));
}
std::optional<Signal> ModuleDef::wire(std::string_view n) const {
    int idx = findWireIndex(n);
    if (idx < 0) return std::nullopt;
    return Signal(*this, SignalKind::Wire, static_cast<uint32_t>(idx));
}
std::optional<Signal> ModuleDef::signal(std::string_view n) const {
    if (auto p = port(n)) return p;
    return wire(n);
}

ModuleTarget ModuleDef::moduleTarget() const {
    return ModuleTarget{mCircuit->name(), mName};
}

void ModuleDef::dumpLayout(std::ostream& os) const {
    os << "Module " << mName << " layout:\n";
    os << "  Ports:\n";
    for (size_t i = 0; i < mPorts.size(); ++i) {
        const auto& p = mPorts[i];
        os << "    [" << i << "] " << p.mName << " dir=" << to_string(p.mDir)
           << " width=" << p.mWidth << "\n";
    }
    os << "  Wires:\n";
    for (size_t i = 0; i < mWires.size(); ++i) {
        const auto& w = mWires[i];
        os << "    [" << i << "] " << w.mName << " width=" << w.mWidth
           << "\n";
    }
    if (!mLiterals.empty()) {
        os << "  Literals:\n";
        for (size_t i = 0; i < mLiterals.size(); ++i) {
            const auto& l = mLiterals[i];
            os << "    [" << i << "] " << l.mValue << " width=" << l.mWidth
               << "\n";
        }
    }
}
// End of ModuleDef
// -------------------------------------------
// Circuit
Circuit::Circuit(std::string name)
    : mName(std::move(name)) {}

ModuleDef& Circuit::addModule(const std::string& name) {
    if (mModuleIndex.count(name))
        throw std::invalid_argument("duplicate module '" + name + "'");
    mModules.push_back(std::make_unique<ModuleDef>(*this, name));
    ModuleDef* m = mModules.back().get();
    mModuleIndex.emplace(name, m);
    if (!mTop) mTop = m;
    return *m;
}

ModuleDef* Circuit::findModule(std::string_view name) {
    auto it = mModuleIndex.find(std::string(name));
    return it == mModuleIndex.end() ? nullptr : it->second;
}
const ModuleDef* Circuit::findModule(std::string_view name) const {
    auto it = mModuleIndex.find(std::string(name));
    return it == mModuleIndex.end() ? nullptr : it->second;
}

bool Circuit::resolve(std::string_view path, ComponentRef& out,
                      std::ostream* diag) const {
    out = ComponentRef{};
    if (path == "~") {
        out.mObject = this;
        return true;
    }
    auto dot = path.find('.');
    std::string_view modName = path.substr(0, dot);
    const ModuleDef* m = findModule(modName);
    if (!m) {
        error(diag, "no such module '" + std::string(modName) + "'");
        return false;
    }
    if (dot == std::string_view::npos) {
        out.mObject = m;
        return true;
    }
    std::string_view sigName = path.substr(dot + 1);
    auto sig = m->signal(sigName);
    if (!sig) {
        error(diag,
              "no such signal '" + std::string(sigName) + "' in module " +
                m->name());
        return false;
    }
    out.mSignal = sig;
    return true;
}
// End of Circuit
// -------------------------------------------

namespace hier {

static void dumpRecur(const ModuleDef& mod, std::ostream& os,
                      const ScopeId& scope, int indent) {
    os << Indent(indent) << "Module '" << mod.name()
       << "' scope=" << scope.toString() << "\n";

    const auto& insts = mod.instances();
    if (!insts.empty()) {
        os << Indent(indent + 2) << "Instances (" << insts.size() << "):\n";
    }

    for (size_t idx = 0; idx < insts.size(); ++idx) {
        const auto& inst = insts[idx];
        os << Indent(indent + 4) << "[" << idx << "] " << inst.mName << " : "
           << (inst.mCallee ? inst.mCallee->name() : std::string("<null>"))
           << "\n";

        // Recurse into callee
        if (inst.mCallee) {
            ScopeId childScope = scope;
            childScope.mPath.push_back(static_cast<uint32_t>(idx));
            dumpRecur(*inst.mCallee, os, childScope, indent + 4);
        }
    }
}

void dumpInstanceTree(const ModuleDef& top, std::ostream& os) {
    ScopeId root;
    dumpRecur(top, os, root, 0);
}

const ModuleDef* moduleAt(const ModuleDef& top, const ScopeId& scope,
                          std::ostream* diag) {
    const ModuleDef* cur = &top;
    for (size_t depth = 0; depth < scope.mPath.size(); ++depth) {
        uint32_t idx = scope.mPath[depth];
        if (idx >= cur->instances().size()) {
            error(diag,
                  "scope path index " + std::to_string(idx) +
                    " out of range at depth " + std::to_string(depth));
            return nullptr;
        }
        const auto& inst = cur->instances()[idx];
        if (!inst.mCallee) {
            error(diag, "null callee at depth " + std::to_string(depth));
            return nullptr;
        }
        cur = inst.mCallee;
    }
    return cur;
}

std::string renderScope(const ModuleDef& top, const ScopeId& scope) {
    std::string s = top.name();
    const ModuleDef* cur = &top;
    for (uint32_t idx : scope.mPath) {
        if (!cur || idx >= cur->instances().size()) {
            s += "/?";
            break;
        }
        const auto& inst = cur->instances()[idx];
        s += "/" + inst.mName;
        cur = inst.mCallee;
    }
    return s;
}

static void collectPaths(const ModuleDef& mod, const ModuleDef& target,
                         ScopeId& scope, std::vector<ScopeId>& out,
                         size_t depth) {
    if (&mod == &target) out.push_back(scope);
    // addInstance keeps the hierarchy acyclic; this only bounds pathological
    // depth.
    if (depth > 256) return;
    const auto& insts = mod.instances();
    for (size_t idx = 0; idx < insts.size(); ++idx) {
        if (!insts[idx].mCallee) continue;
        scope.mPath.push_back(static_cast<uint32_t>(idx));
        collectPaths(*insts[idx].mCallee, target, scope, out, depth + 1);
        scope.mPath.pop_back();
    }
}

std::vector<ScopeId> findInstancePaths(const ModuleDef& top,
                                       const ModuleDef& target) {
    std::vector<ScopeId> out;
    ScopeId scope;
    collectPaths(top, target, scope, out, 0);
    return out;
}

ScopeId lowestCommonAncestor(const ScopeId& a, const ScopeId& b) {
    ScopeId r;
    size_t n = std::min(a.mPath.size(), b.mPath.size());
    for (size_t i = 0; i < n && a.mPath[i] == b.mPath[i]; ++i)
        r.mPath.push_back(a.mPath[i]);
    return r;
}

} // namespace hier
} // namespace bore::ir
