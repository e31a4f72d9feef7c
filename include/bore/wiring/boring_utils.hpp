#pragma once
// Cross-module references that "bore" through the instance hierarchy.
//
// Sources and sinks are matched by name. The actual wires are threaded by the
// downstream wiring transform, which consumes the intents recorded here.
//
// Hierarchical boring (bore) derives the name from the source and allocates
// it from the build context's boring namespace, so it cannot collide.
// Non-hierarchical boring (registerSource/registerSink with a user name)
// relies on the caller to pick non-conflicting names; conflicts are only
// detected when BuildOptions::mStrictNames is set.
//
// The namespace lives as long as the BuildContext that owns it, or as long as
// any context that adopted it, so names stay unique across builds that share
// one registry.

#include <string>
#include <vector>

#include "bore/elab/build_context.hpp"
#include "bore/ir/target.hpp"

namespace bore::wiring {

class BoringUtils {
  public:
    // Label used by bore() when the source has no display name.
    static constexpr const char* kFallbackLabel = "bore";

    explicit BoringUtils(elab::BuildContext& ctx)
        : mCtx(ctx) {}

    // Declare component as the source named name. With uniqueName the name
    // is allocated from the namespace and may differ from the request.
    // Emits: pin, source, and dedup suppression of the owning module if
    // disableDedup. Returns the name used.
    std::string registerSource(const ir::NamedComponent& component,
                               const std::string& name,
                               bool disableDedup = false,
                               bool uniqueName = false);

    // Declare component (a module or a signal) as a sink of name. Several
    // sinks may share one source.
    // Throws NameNotFoundError if forceExists and name was never allocated,
    // InvalidSinkTargetError if the target does not reduce to a module.
    // Nothing is emitted when it throws.
    void registerSink(const ir::InstanceId& component, const std::string& name,
                      bool disableDedup = false, bool forceExists = false);

    // Connect source to every sink, in order. Returns the generated name,
    // derived from the source's display name.
    std::string bore(const ir::NamedComponent& source,
                     const std::vector<const ir::InstanceId*>& sinks);

  private:
    elab::BuildContext& mCtx;
};

} // namespace bore::wiring
