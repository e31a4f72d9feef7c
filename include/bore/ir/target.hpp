#pragma once
// Annotation targets and the capabilities a circuit object must offer to be
// used as a boring source or sink.

#include <optional>
#include <string>
#include <variant>

namespace bore::ir {

struct CircuitTarget {
    std::string mCircuit;
};

struct ModuleTarget {
    std::string mCircuit;
    std::string mModule;
};

struct ComponentTarget {
    ModuleTarget mModule;
    std::string mRef; // local name inside mModule
};

using Target = std::variant<CircuitTarget, ModuleTarget, ComponentTarget>;

bool operator==(const CircuitTarget& a, const CircuitTarget& b);
bool operator==(const ModuleTarget& a, const ModuleTarget& b);
bool operator==(const ComponentTarget& a, const ComponentTarget& b);
inline bool operator!=(const ModuleTarget& a, const ModuleTarget& b) {
    return !(a == b);
}

// "~Top", "~Top|Expect", "~Top|Expect>y"
std::string toString(const CircuitTarget& t);
std::string toString(const ModuleTarget& t);
std::string toString(const ComponentTarget& t);
std::string toString(const Target& t);

// Module a target lives in. Only module and component targets reduce to one;
// anything else throws InvalidSinkTargetError.
ModuleTarget owningModule(const Target& t);

// Anything that can carry a persistent annotation.
class InstanceId {
  public:
    virtual ~InstanceId() = default;

    virtual Target toTarget() const = 0;
    // Best-effort local display name. Anonymous values have none.
    virtual std::optional<std::string> instanceName() const = 0;
};

// An InstanceId that always lives inside a module (signals, not modules).
class NamedComponent : public InstanceId {
  public:
    virtual ComponentTarget toComponentTarget() const = 0;
    Target toTarget() const override { return toComponentTarget(); }
};

} // namespace bore::ir
