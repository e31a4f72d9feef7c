#include "bore/elab/build_context.hpp"

#include <algorithm>
#include <sstream>

#include "bore/common.hpp"

namespace bore::elab {
static bool parseBool(const std::string& v, bool& out) {
    if (v == "1" || v == "true" || v == "on" || v == "yes") {
        out = true;
        return true;
    }
    if (v == "0" || v == "false" || v == "off" || v == "no") {
        out = false;
        return true;
    }
    return false;
}

bool applyOption(BuildOptions& opts, const std::string& token,
                 std::ostream* diag) {
    auto eq = token.find('=');
    if (eq == std::string::npos || eq == 0) {
        warn(diag, "ignoring option token (expect NAME=VALUE): " + token);
        return false;
    }
    std::string name = token.substr(0, eq);
    std::string val = token.substr(eq + 1);
    if (name == "strict_names") {
        if (!parseBool(val, opts.mStrictNames)) {
            warn(diag, "non-boolean option value: " + token);
            return false;
        }
        return true;
    }
    if (name == "reserve") {
        std::istringstream iss(val);
        std::string kw;
        bool any = false;
        while (std::getline(iss, kw, ',')) {
            if (kw.empty()) continue;
            any = true;
            auto& kws = opts.mReservedKeywords;
            if (std::find(kws.begin(), kws.end(), kw) == kws.end())
                kws.push_back(kw);
        }
        if (!any) warn(diag, "empty reserve list: " + token);
        return any;
    }
    warn(diag, "unknown option: " + name);
    return false;
}

BuildOptions parseOptionTokens(const std::vector<std::string>& toks,
                               size_t startIdx, std::ostream* diag,
                               BuildOptions base) {
    for (size_t i = startIdx; i < toks.size(); ++i)
        (void)applyOption(base, toks[i], diag);
    return base;
}

BuildContext::BuildContext(BuildOptions opts, std::ostream* diag)
    : mOpts(std::move(opts))
    , mDiag(diag) {}

BuildContext::BuildContext(std::shared_ptr<NameRegistry> ns,
                           BuildOptions opts, std::ostream* diag)
    : mOpts(std::move(opts))
    , mDiag(diag)
    , mNamespace(std::move(ns)) {
    if (!mNamespace) return;
    for (const auto& kw : mOpts.mReservedKeywords)
        mNamespace->reserve(kw);
}

NameRegistry& BuildContext::boringNamespace() { return *sharedNamespace(); }

std::shared_ptr<NameRegistry> BuildContext::sharedNamespace() {
    std::lock_guard<std::mutex> lock(mNsMu);
    if (!mNamespace)
        mNamespace = std::make_shared<NameRegistry>(mOpts.mReservedKeywords);
    return mNamespace;
}

bool BuildContext::updateOptions(const std::vector<std::string>& toks) {
    BuildOptions next = mOpts;
    bool ok = true;
    for (const auto& t : toks)
        ok = applyOption(next, t, mDiag) && ok;
    if (!ok) {
        error(mDiag, "options left unchanged");
        return false;
    }
    mOpts = std::move(next);
    if (hasNamespace()) {
        auto& ns = boringNamespace();
        for (const auto& kw : mOpts.mReservedKeywords)
            (void)ns.reserve(kw);
    }
    return true;
}

bool BuildContext::hasNamespace() const {
    std::lock_guard<std::mutex> lock(mNsMu);
    return mNamespace != nullptr;
}
} // namespace bore::elab
