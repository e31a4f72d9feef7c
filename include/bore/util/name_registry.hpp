#pragma once
// Namespace of boring IDs. Hands out identifiers that never collide with one
// handed out (or reserved) earlier through the same registry.

#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace bore {

class NameRegistry {
  public:
    NameRegistry() = default;
    // Keywords count as taken from the start.
    explicit NameRegistry(const std::vector<std::string>& keywords);

    NameRegistry(const NameRegistry&) = delete;
    NameRegistry& operator=(const NameRegistry&) = delete;

    // Sanitize prefix and return it if free, otherwise the first free
    // "<prefix>_<n>". The result is recorded before the lock is released.
    std::string allocateUnique(std::string_view prefix);

    bool exists(std::string_view name) const;

    // Take a name verbatim. Returns false if it was already taken.
    bool reserve(std::string_view name);

    size_t size() const;
    std::vector<std::string> names() const; // sorted

    // Keep [A-Za-z0-9_] only; prefix '_' if empty or leading digit.
    static std::string sanitize(std::string_view s,
                                bool leadingDigitOk = false);

  private:
    std::string renameLocked(const std::string& base);

    // name -> next suffix to try when the name is requested again
    std::unordered_map<std::string, uint64_t> mNames;
    mutable std::mutex mMu;
};

} // namespace bore
