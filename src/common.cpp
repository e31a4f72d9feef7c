#include "bore/common.hpp"

namespace bore {
const char* to_string(PortDirection d) {
    switch (d) {
    case PortDirection::In: return "In";
    case PortDirection::Out: return "Out";
    case PortDirection::InOut: return "InOut";
    }
    return "?";
}

std::ostream& operator<<(std::ostream& os, const Indent& i) {
    for (int k = 0; k < i.mN; ++k)
        os << ' ';
    return os;
}

void note(std::ostream* diag, const std::string& msg, int indent) {
    if (diag) *diag << Indent(indent) << "NOTE: " << msg << "\n";
}
void warn(std::ostream* diag, const std::string& msg, int indent) {
    if (diag) *diag << Indent(indent) << "WARN: " << msg << "\n";
}
void error(std::ostream* diag, const std::string& msg, int indent) {
    if (diag) *diag << Indent(indent) << "ERROR: " << msg << "\n";
}

NameNotFoundError::NameNotFoundError(const std::string& name)
    : BoringException("Sink ID '" + name +
                      "' not found in boring ID namespace")
    , mName(name) {}

InvalidSinkTargetError::InvalidSinkTargetError(const std::string& target)
    : BoringException("Can only add a Module or Component sink, got '" +
                      target + "'") {}

NameCollisionError::NameCollisionError(const std::string& name)
    : BoringException("Source ID '" + name +
                      "' is already taken in boring ID namespace")
    , mName(name) {}
} // namespace bore
