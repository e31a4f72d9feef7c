#pragma once
// State shared by all boring calls of one build: the boring ID namespace,
// the recorded intents, options and the diagnostics stream.

#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "bore/anno/annotation.hpp"
#include "bore/util/name_registry.hpp"

namespace bore::elab {

struct BuildOptions {
    // Reject verbatim source names that are already in the namespace.
    bool mStrictNames = false;
    // Names the namespace treats as taken when it is created.
    std::vector<std::string> mReservedKeywords;
};

// Apply one NAME=VALUE token. Recognized: strict_names=0|1,
// reserve=<name>[,<name>...]. Bad tokens are reported and ignored.
bool applyOption(BuildOptions& opts, const std::string& token,
                 std::ostream* diag);

BuildOptions parseOptionTokens(const std::vector<std::string>& toks,
                               size_t startIdx, std::ostream* diag,
                               BuildOptions base = {});

class BuildContext {
  public:
    explicit BuildContext(BuildOptions opts = {}, std::ostream* diag = nullptr);
    // Adopt a namespace from an earlier build so IDs stay unique across
    // builds. A null registry behaves like the other constructor.
    BuildContext(std::shared_ptr<NameRegistry> ns, BuildOptions opts = {},
                 std::ostream* diag = nullptr);

    BuildContext(const BuildContext&) = delete;
    BuildContext& operator=(const BuildContext&) = delete;

    // Created on first use.
    NameRegistry& boringNamespace();
    std::shared_ptr<NameRegistry> sharedNamespace();
    bool hasNamespace() const;

    // Where intents go. Defaults to the context's own AnnotationSeq.
    anno::AnnotationSink& sink() { return mSink ? *mSink : mAnnos; }
    void setSink(anno::AnnotationSink* s) { mSink = s; }

    const anno::AnnotationSeq& annotations() const { return mAnnos; }
    // Start a new build; the namespace is kept.
    void clearAnnotations() { mAnnos.clear(); }

    const BuildOptions& options() const { return mOpts; }
    BuildOptions& options() { return mOpts; }
    // Apply NAME=VALUE tokens all or nothing: on any bad token the options
    // are left unchanged and false is returned. New reserved keywords are
    // taken in the namespace right away if it already exists.
    bool updateOptions(const std::vector<std::string>& toks);

    std::ostream* diag() const { return mDiag; }
    void setDiag(std::ostream* d) { mDiag = d; }

  private:
    BuildOptions mOpts;
    std::ostream* mDiag = nullptr;

    anno::AnnotationSeq mAnnos;
    anno::AnnotationSink* mSink = nullptr;

    std::shared_ptr<NameRegistry> mNamespace;
    mutable std::mutex mNsMu;
};

} // namespace bore::elab
