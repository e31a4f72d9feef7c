#pragma once

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

namespace bore {

enum class PortDirection { In, Out, InOut };

const char* to_string(PortDirection d);

struct Indent {
    int mN = 0;
    explicit Indent(int n)
        : mN(n) {}
};
std::ostream& operator<<(std::ostream& os, const Indent& i);

// Diagnostics go to an optional stream; a null stream drops them.
void note(std::ostream* diag, const std::string& msg, int indent = 0);
void warn(std::ostream* diag, const std::string& msg, int indent = 0);
void error(std::ostream* diag, const std::string& msg, int indent = 0);

// Base of every error raised while recording boring intents.
class BoringException : public std::runtime_error {
  public:
    explicit BoringException(const std::string& msg)
        : std::runtime_error(msg) {}
};

// A sink asked to bind to a name the boring namespace never produced.
class NameNotFoundError : public BoringException {
  public:
    explicit NameNotFoundError(const std::string& name);
    const std::string& name() const { return mName; }

  private:
    std::string mName;
};

// A sink target that is neither a module nor a component of a module.
class InvalidSinkTargetError : public BoringException {
  public:
    explicit InvalidSinkTargetError(const std::string& target);
};

// Strict naming only: a verbatim source name that is already taken.
class NameCollisionError : public BoringException {
  public:
    explicit NameCollisionError(const std::string& name);
    const std::string& name() const { return mName; }

  private:
    std::string mName;
};

} // namespace bore
