#include "bore/anno/annotation.hpp"

namespace bore::anno {
const char* to_string(IntentKind k) {
    switch (k) {
    case IntentKind::NoOptimizeAway: return "NoOptimizeAway";
    case IntentKind::SourceDeclared: return "SourceDeclared";
    case IntentKind::DedupSuppressed: return "DedupSuppressed";
    case IntentKind::SinkDeclared: return "SinkDeclared";
    }
    return "?";
}

std::string Annotation::toString() const {
    std::string s = std::string(to_string(mKind)) + " " + ir::toString(mTarget);
    if (!mName.empty()) s += " '" + mName + "'";
    return s;
}

Annotation makePin(const ir::ComponentTarget& t) {
    return Annotation{IntentKind::NoOptimizeAway, t, {}};
}
Annotation makeSource(const ir::ComponentTarget& t, const std::string& name) {
    return Annotation{IntentKind::SourceDeclared, t, name};
}
Annotation makeDedupSuppressed(const ir::ModuleTarget& t) {
    return Annotation{IntentKind::DedupSuppressed, t, {}};
}
Annotation makeSink(const ir::Target& t, const std::string& name) {
    return Annotation{IntentKind::SinkDeclared, t, name};
}

void AnnotationSeq::annotate(Annotation a) {
    std::lock_guard<std::mutex> lock(mMu);
    mAnnos.push_back(std::move(a));
}

std::vector<Annotation> AnnotationSeq::snapshot() const {
    std::lock_guard<std::mutex> lock(mMu);
    return mAnnos;
}

std::vector<Annotation> AnnotationSeq::ofKind(IntentKind k) const {
    std::lock_guard<std::mutex> lock(mMu);
    std::vector<Annotation> out;
    for (const auto& a : mAnnos)
        if (a.mKind == k) out.push_back(a);
    return out;
}

std::vector<Annotation> AnnotationSeq::withName(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mMu);
    std::vector<Annotation> out;
    for (const auto& a : mAnnos)
        if (a.mName == name) out.push_back(a);
    return out;
}

size_t AnnotationSeq::size() const {
    std::lock_guard<std::mutex> lock(mMu);
    return mAnnos.size();
}

void AnnotationSeq::clear() {
    std::lock_guard<std::mutex> lock(mMu);
    mAnnos.clear();
}
} // namespace bore::anno
