#pragma once
// Intent records handed to the downstream wiring transform.

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

#include "bore/ir/target.hpp"

namespace bore::anno {

enum class IntentKind {
    NoOptimizeAway,  // pin: keep the component through optimization
    SourceDeclared,  // component is the source of mName
    DedupSuppressed, // module must not be merged with identical ones
    SinkDeclared     // component receives the source of mName
};

const char* to_string(IntentKind k);

struct Annotation {
    IntentKind mKind = IntentKind::NoOptimizeAway;
    ir::Target mTarget;
    std::string mName; // empty for pins and dedup suppression

    std::string toString() const;
};

Annotation makePin(const ir::ComponentTarget& t);
Annotation makeSource(const ir::ComponentTarget& t, const std::string& name);
Annotation makeDedupSuppressed(const ir::ModuleTarget& t);
Annotation makeSink(const ir::Target& t, const std::string& name);

// Receiver of intent records, in emission order.
class AnnotationSink {
  public:
    virtual ~AnnotationSink() = default;
    virtual void annotate(Annotation a) = 0;
};

// Collecting sink used by BuildContext.
class AnnotationSeq : public AnnotationSink {
  public:
    void annotate(Annotation a) override;

    std::vector<Annotation> snapshot() const;
    std::vector<Annotation> ofKind(IntentKind k) const;
    std::vector<Annotation> withName(const std::string& name) const;
    size_t size() const;
    void clear();

  private:
    mutable std::mutex mMu;
    std::vector<Annotation> mAnnos;
};

} // namespace bore::anno
