#include "bore/wiring/boring_utils.hpp"

#include "bore/common.hpp"

namespace bore::wiring {
std::string BoringUtils::registerSource(const ir::NamedComponent& component,
                                        const std::string& name,
                                        bool disableDedup, bool uniqueName) {
    ir::ComponentTarget target = component.toComponentTarget();

    std::string id;
    if (uniqueName) {
        id = mCtx.boringNamespace().allocateUnique(name);
    } else if (mCtx.options().mStrictNames) {
        if (!mCtx.boringNamespace().reserve(name)) {
            error(mCtx.diag(),
                  "source '" + name + "' at " + ir::toString(target) +
                    " collides with an existing boring ID");
            throw NameCollisionError(name);
        }
        id = name;
    } else {
        id = name;
    }

    auto& sink = mCtx.sink();
    sink.annotate(anno::makePin(target));
    sink.annotate(anno::makeSource(target, id));
    if (disableDedup) sink.annotate(anno::makeDedupSuppressed(target.mModule));
    return id;
}

void BoringUtils::registerSink(const ir::InstanceId& component,
                               const std::string& name, bool disableDedup,
                               bool forceExists) {
    if (forceExists && !mCtx.boringNamespace().exists(name)) {
        error(mCtx.diag(), "sink ID '" + name + "' was never allocated");
        throw NameNotFoundError(name);
    }

    ir::Target target = component.toTarget();
    ir::ModuleTarget module;
    try {
        module = ir::owningModule(target);
    } catch (const InvalidSinkTargetError& e) {
        error(mCtx.diag(), e.what());
        throw;
    }

    auto& sink = mCtx.sink();
    sink.annotate(anno::makeSink(target, name));
    if (disableDedup) sink.annotate(anno::makeDedupSuppressed(module));
}

std::string
BoringUtils::bore(const ir::NamedComponent& source,
                  const std::vector<const ir::InstanceId*>& sinks) {
    // Every sink must reduce to a module before a name is allocated.
    for (const auto* s : sinks) {
        if (!s) {
            error(mCtx.diag(), "bore: null sink");
            throw InvalidSinkTargetError("<null>");
        }
        try {
            (void)ir::owningModule(s->toTarget());
        } catch (const InvalidSinkTargetError& e) {
            error(mCtx.diag(), e.what());
            throw;
        }
    }

    auto display = source.instanceName();
    std::string label =
      (display && !display->empty()) ? *display : kFallbackLabel;
    std::string genName = registerSource(source, label, true, true);
    for (const auto* s : sinks)
        registerSink(*s, genName, true, false);
    return genName;
}
} // namespace bore::wiring
