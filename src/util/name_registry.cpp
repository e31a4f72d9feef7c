#include "bore/util/name_registry.hpp"

#include <algorithm>

namespace bore {
static inline bool legalStart(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}
static inline bool legal(char c) {
    return legalStart(c) || (c >= '0' && c <= '9');
}

NameRegistry::NameRegistry(const std::vector<std::string>& keywords) {
    for (const auto& k : keywords)
        mNames.emplace(k, 1);
}

std::string NameRegistry::sanitize(std::string_view s, bool leadingDigitOk) {
    std::string res;
    res.reserve(s.size());
    for (char c : s)
        if (legal(c)) res.push_back(c);
    bool headOk = !res.empty() && (leadingDigitOk || legalStart(res.front()));
    return headOk ? res : "_" + res;
}

std::string NameRegistry::renameLocked(const std::string& base) {
    uint64_t i = mNames[base];
    std::string candidate = base + "_" + std::to_string(i);
    while (mNames.count(candidate)) {
        ++i;
        candidate = base + "_" + std::to_string(i);
    }
    mNames[base] = i + 1;
    return candidate;
}

std::string NameRegistry::allocateUnique(std::string_view prefix) {
    std::string base = sanitize(prefix);
    std::lock_guard<std::mutex> lock(mMu);
    std::string result = mNames.count(base) ? renameLocked(base) : base;
    mNames.emplace(result, 1);
    return result;
}

bool NameRegistry::exists(std::string_view name) const {
    std::lock_guard<std::mutex> lock(mMu);
    return mNames.find(std::string(name)) != mNames.end();
}

bool NameRegistry::reserve(std::string_view name) {
    std::lock_guard<std::mutex> lock(mMu);
    return mNames.emplace(std::string(name), 1).second;
}

size_t NameRegistry::size() const {
    std::lock_guard<std::mutex> lock(mMu);
    return mNames.size();
}

std::vector<std::string> NameRegistry::names() const {
    std::vector<std::string> out;
    {
        std::lock_guard<std::mutex> lock(mMu);
        out.reserve(mNames.size());
        for (const auto& kv : mNames)
            out.push_back(kv.first);
    }
    std::sort(out.begin(), out.end());
    return out;
}
} // namespace bore
