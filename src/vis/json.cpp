#include "bore/vis/json.hpp"

#include <algorithm>

namespace bore {
namespace vis {

using nlohmann::json;

json annotationToJson(const anno::Annotation& a) {
    json j = {{"class", anno::to_string(a.mKind)},
              {"target", ir::toString(a.mTarget)}};
    if (a.mKind == anno::IntentKind::SourceDeclared ||
        a.mKind == anno::IntentKind::SinkDeclared) {
        j["name"] = a.mName;
    }
    return j;
}

json annotationsToJson(const std::vector<anno::Annotation>& annos) {
    json arr = json::array();
    for (const auto& a : annos)
        arr.push_back(annotationToJson(a));
    return arr;
}

static void pushUnique(json& arr, const std::string& s) {
    bool seen = std::any_of(arr.begin(), arr.end(), [&](const json& e) {
        return e.get<std::string>() == s;
    });
    if (!seen) arr.push_back(s);
}

json wiringViewJson(const std::vector<anno::Annotation>& annos) {
    json view = json::object();
    auto entry = [&](const std::string& id) -> json& {
        if (!view.contains(id)) {
            view[id] = {{"sources", json::array()},
                        {"sinks", json::array()},
                        {"noDedup", json::array()}};
        }
        return view[id];
    };

    std::vector<std::string> noDedup;
    for (const auto& a : annos) {
        switch (a.mKind) {
        case anno::IntentKind::SourceDeclared:
            entry(a.mName)["sources"].push_back(ir::toString(a.mTarget));
            break;
        case anno::IntentKind::SinkDeclared:
            entry(a.mName)["sinks"].push_back(ir::toString(a.mTarget));
            break;
        case anno::IntentKind::DedupSuppressed:
            noDedup.push_back(ir::toString(a.mTarget));
            break;
        case anno::IntentKind::NoOptimizeAway: break;
        }
    }

    // Second pass: attach module-level dedup suppression to each ID whose
    // endpoints live in a suppressed module.
    for (const auto& a : annos) {
        if (a.mKind != anno::IntentKind::SourceDeclared &&
            a.mKind != anno::IntentKind::SinkDeclared)
            continue;
        ir::ModuleTarget m;
        if (auto* c = std::get_if<ir::ComponentTarget>(&a.mTarget))
            m = c->mModule;
        else if (auto* mt = std::get_if<ir::ModuleTarget>(&a.mTarget))
            m = *mt;
        else
            continue;
        std::string ms = ir::toString(m);
        if (std::find(noDedup.begin(), noDedup.end(), ms) != noDedup.end())
            pushUnique(view[a.mName]["noDedup"], ms);
    }
    return view;
}

json namespaceToJson(const NameRegistry& ns) {
    auto names = ns.names();
    return json{{"size", names.size()}, {"names", names}};
}

} // namespace vis
} // namespace bore
