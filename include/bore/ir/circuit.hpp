#pragma once
// Reference circuit model: modules with ports, wires, literals and child
// instances. Modules and signals implement the InstanceId capabilities.

#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "bore/common.hpp"
#include "bore/ir/target.hpp"

namespace bore::ir {

class Circuit;
class ModuleDef;

enum class SignalKind { Port, Wire, Literal };

const char* to_string(SignalKind k);

struct PortDef {
    std::string mName;
    PortDirection mDir = PortDirection::In;
    uint32_t mWidth = 1;
};

struct WireDef {
    std::string mName;
    uint32_t mWidth = 1;
};

// Anonymous constant; has a target but no display name.
struct LiteralDef {
    uint64_t mValue = 0;
    uint32_t mWidth = 1;
};

struct InstanceDef {
    std::string mName;
    const ModuleDef* mCallee = nullptr;
};

// Non-owning handle to a port, wire or literal of a module.
class Signal : public NamedComponent {
  public:
    Signal(const ModuleDef& owner, SignalKind kind, uint32_t index)
        : mOwner(&owner)
        , mKind(kind)
        , mIndex(index) {}

    ComponentTarget toComponentTarget() const override;
    std::optional<std::string> instanceName() const override;

    const ModuleDef& owner() const { return *mOwner; }
    SignalKind kind() const { return mKind; }
    uint32_t index() const { return mIndex; }
    uint32_t width() const;

  private:
    const ModuleDef* mOwner;
    SignalKind mKind;
    uint32_t mIndex;
};

class ModuleDef : public InstanceId {
  public:
    ModuleDef(const Circuit& circuit, std::string name);

    ModuleDef(const ModuleDef&) = delete;
    ModuleDef& operator=(const ModuleDef&) = delete;

    const std::string& name() const { return mName; }
    const Circuit& circuit() const { return *mCircuit; }

    // Duplicate port/wire names throw std::invalid_argument.
    Signal addPort(const std::string& name, PortDirection dir,
                   uint32_t width = 1);
    Signal addWire(const std::string& name, uint32_t width = 1);
    Signal addLiteral(uint64_t value, uint32_t width = 1);
    // Throws std::invalid_argument on a duplicate instance name or if callee
    // already instantiates this module (directly or further down).
    void addInstance(const std::string& name, const ModuleDef& callee);

    int findPortIndex(std::string_view n) const;
    int findWireIndex(std::string_view n) const;
    int findInstanceIndex(std::string_view n) const;

    std::optional<Signal> port(std::string_view n) const;
    std::optional<Signal> wire(std::string_view n) const;
    // Port first, then wire.
    std::optional<Signal> signal(std::string_view n) const;

    const std::vector<PortDef>& ports() const { return mPorts; }
    const std::vector<WireDef>& wires() const { return mWires; }
    const std::vector<LiteralDef>& literals() const { return mLiterals; }
    const std::vector<InstanceDef>& instances() const { return mInstances; }

    ModuleTarget moduleTarget() const;
    Target toTarget() const override { return moduleTarget(); }
    std::optional<std::string> instanceName() const override { return mName; }

    void dumpLayout(std::ostream& os) const;

  private:
    const Circuit* mCircuit;
    std::string mName;
    std::vector<PortDef> mPorts;
    std::vector<WireDef> mWires;
    std::vector<LiteralDef> mLiterals;
    std::vector<InstanceDef> mInstances;

    std::unordered_map<std::string, uint32_t> mPortIndex;
    std::unordered_map<std::string, uint32_t> mWireIndex;
};

// What a textual path resolved to: a signal, or a whole module/circuit.
struct ComponentRef {
    std::optional<Signal> mSignal;
    const InstanceId* mObject = nullptr;

    bool valid() const { return mSignal.has_value() || mObject; }
    const InstanceId& id() const {
        if (mSignal) return *mSignal;
        return *mObject;
    }
};

class Circuit : public InstanceId {
  public:
    explicit Circuit(std::string name);

    Circuit(const Circuit&) = delete;
    Circuit& operator=(const Circuit&) = delete;

    const std::string& name() const { return mName; }

    // Throws std::invalid_argument on a duplicate module name. The first
    // module added becomes the top until setTop is called.
    ModuleDef& addModule(const std::string& name);
    ModuleDef* findModule(std::string_view name);
    const ModuleDef* findModule(std::string_view name) const;

    void setTop(const ModuleDef& top) { mTop = &top; }
    const ModuleDef* top() const { return mTop; }

    const std::vector<std::unique_ptr<ModuleDef>>& modules() const {
        return mModules;
    }

    // "~" (circuit), "Module" or "Module.signal".
    bool resolve(std::string_view path, ComponentRef& out,
                 std::ostream* diag = nullptr) const;

    Target toTarget() const override { return CircuitTarget{mName}; }
    std::optional<std::string> instanceName() const override { return mName; }

  private:
    std::string mName;
    std::vector<std::unique_ptr<ModuleDef>> mModules;
    std::unordered_map<std::string, ModuleDef*> mModuleIndex;
    const ModuleDef* mTop = nullptr;
};

// Instance hierarchy queries rooted at a top module.
namespace hier {

struct ScopeId {
    std::vector<uint32_t> mPath; // child instance indices along hierarchy
    std::string toString() const {
        if (mPath.empty()) return "<root>";
        std::string s;
        for (size_t i = 0; i < mPath.size(); ++i) {
            if (i) s.push_back('/');
            s += std::to_string(mPath[i]);
        }
        return s;
    }
    bool operator==(const ScopeId& o) const { return mPath == o.mPath; }
};

// Dump instance hierarchy recursively.
void dumpInstanceTree(const ModuleDef& top, std::ostream& os);

// Module reached by walking scope from top, or nullptr.
const ModuleDef* moduleAt(const ModuleDef& top, const ScopeId& scope,
                          std::ostream* diag = nullptr);

// Instance-name rendering of a scope, e.g. "Top/constant/x0".
std::string renderScope(const ModuleDef& top, const ScopeId& scope);

// Every scope at which target is instantiated (top itself at <root>).
std::vector<ScopeId> findInstancePaths(const ModuleDef& top,
                                       const ModuleDef& target);

// Longest common prefix of two scopes.
ScopeId lowestCommonAncestor(const ScopeId& a, const ScopeId& b);

} // namespace hier

} // namespace bore::ir
