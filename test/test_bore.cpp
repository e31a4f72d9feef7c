#include <algorithm>
#include <memory>
#include <set>
#include <sstream>
#include <thread>

#include <gtest/gtest.h>

#include "bore/anno/annotation.hpp"
#include "bore/elab/build_context.hpp"
#include "bore/ir/circuit.hpp"
#include "bore/util/name_registry.hpp"
#include "bore/vis/json.hpp"
#include "bore/wiring/boring_utils.hpp"
#include "demo_circuit.hpp"

using namespace bore;
using namespace bore::anno;
using namespace bore::ir;

// Helpers
struct Fixture {
    Circuit mCircuit{"Top"};
    demo::DemoCircuit mDemo = demo::buildDemoCircuit(mCircuit);
    elab::BuildContext mCtx;
    wiring::BoringUtils mBoring{mCtx};

    Signal x() const { return *mDemo.mConstant->wire("x"); }
    Signal y() const { return *mDemo.mExpect->wire("y"); }
    Signal probe() const { return *mDemo.mMonitor->port("probe"); }
    Signal lit() const {
        return Signal(*mDemo.mConstant, SignalKind::Literal, 0);
    }
    std::vector<Annotation> annos() const {
        return mCtx.annotations().snapshot();
    }
};

// A component whose display name lookup yields nothing.
class Anonymous : public NamedComponent {
  public:
    ComponentTarget toComponentTarget() const override {
        return ComponentTarget{ModuleTarget{"Top", "Anon"}, "_T_3"};
    }
    std::optional<std::string> instanceName() const override {
        return std::nullopt;
    }
};

// A sink whose target reduces to no module.
class BogusSink : public InstanceId {
  public:
    Target toTarget() const override { return CircuitTarget{"Top"}; }
    std::optional<std::string> instanceName() const override {
        return std::nullopt;
    }
};

TEST(NameRegistry, FirstAllocationIsVerbatim) {
    NameRegistry ns;
    EXPECT_FALSE(ns.exists("sig"));
    EXPECT_EQ(ns.allocateUnique("sig"), "sig");
    EXPECT_TRUE(ns.exists("sig"));
}

TEST(NameRegistry, CollidingPrefixesGetSuffixes) {
    NameRegistry ns;
    EXPECT_EQ(ns.allocateUnique("sig"), "sig");
    EXPECT_EQ(ns.allocateUnique("sig"), "sig_1");
    EXPECT_EQ(ns.allocateUnique("sig"), "sig_2");
    // A suffixed name requested directly is itself taken.
    EXPECT_EQ(ns.allocateUnique("sig_1"), "sig_1_1");
    EXPECT_EQ(ns.size(), 4u);
}

TEST(NameRegistry, SuffixSkipsNamesTakenElsewhere) {
    NameRegistry ns;
    EXPECT_TRUE(ns.reserve("a_1"));
    EXPECT_EQ(ns.allocateUnique("a"), "a");
    EXPECT_EQ(ns.allocateUnique("a"), "a_2");
}

TEST(NameRegistry, AllPairwiseDistinct) {
    NameRegistry ns;
    std::set<std::string> seen;
    const char* prefixes[] = {"a", "a", "a_1", "b", "a", "a_1", "", "1x"};
    for (int round = 0; round < 5; ++round) {
        for (const char* p : prefixes) {
            std::string n = ns.allocateUnique(p);
            EXPECT_TRUE(seen.insert(n).second) << "duplicate " << n;
            EXPECT_TRUE(ns.exists(n));
        }
    }
    EXPECT_EQ(ns.size(), seen.size());
}

TEST(NameRegistry, ExistsIsFalseForUnknownNames) {
    NameRegistry ns;
    EXPECT_FALSE(ns.exists("nope"));
    ns.allocateUnique("yes");
    EXPECT_FALSE(ns.exists("nope"));
    EXPECT_EQ(ns.size(), 1u);
}

TEST(NameRegistry, Sanitize) {
    EXPECT_EQ(NameRegistry::sanitize("io.out[3]"), "ioout3");
    EXPECT_EQ(NameRegistry::sanitize("3abc"), "_3abc");
    EXPECT_EQ(NameRegistry::sanitize("3abc", true), "3abc");
    EXPECT_EQ(NameRegistry::sanitize(""), "_");
    EXPECT_EQ(NameRegistry::sanitize("..."), "_");

    NameRegistry ns;
    EXPECT_EQ(ns.allocateUnique("a.b"), "ab");
    EXPECT_TRUE(ns.exists("ab"));
    EXPECT_FALSE(ns.exists("a.b"));
}

TEST(NameRegistry, Keywords) {
    NameRegistry ns({"reg", "wire"});
    EXPECT_TRUE(ns.exists("reg"));
    EXPECT_EQ(ns.allocateUnique("reg"), "reg_1");
    EXPECT_FALSE(ns.reserve("wire"));
    EXPECT_TRUE(ns.reserve("other"));
}

TEST(NameRegistry, ConcurrentAllocationStaysUnique) {
    NameRegistry ns;
    constexpr int kThreads = 8;
    constexpr int kPerThread = 200;
    std::vector<std::vector<std::string>> got(kThreads);
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&ns, &got, t]() {
            for (int i = 0; i < kPerThread; ++i)
                got[t].push_back(ns.allocateUnique("w"));
        });
    }
    for (auto& w : workers)
        w.join();
    std::set<std::string> all;
    for (const auto& v : got)
        all.insert(v.begin(), v.end());
    EXPECT_EQ(all.size(), static_cast<size_t>(kThreads * kPerThread));
    EXPECT_EQ(ns.size(), all.size());
}

TEST(Target, Rendering) {
    Fixture f;
    EXPECT_EQ(toString(f.x().toTarget()), "~Top|Constant>x");
    EXPECT_EQ(toString(f.mDemo.mExpect->toTarget()), "~Top|Expect");
    EXPECT_EQ(toString(f.mCircuit.toTarget()), "~Top");
    EXPECT_EQ(toString(f.lit().toTarget()), "~Top|Constant>_lit_0");
}

TEST(Target, OwningModule) {
    Fixture f;
    ModuleTarget expect{"Top", "Expect"};
    EXPECT_EQ(owningModule(f.y().toTarget()), expect);
    EXPECT_EQ(owningModule(f.mDemo.mExpect->toTarget()), expect);
    EXPECT_THROW(owningModule(f.mCircuit.toTarget()), InvalidSinkTargetError);
}

TEST(Circuit, Lookup) {
    Fixture f;
    EXPECT_EQ(f.mCircuit.top(), f.mDemo.mTop);
    EXPECT_EQ(f.mDemo.mConstant->findWireIndex("x"), 0);
    EXPECT_EQ(f.mDemo.mConstant->findPortIndex("x"), -1);
    EXPECT_FALSE(f.mDemo.mConstant->signal("nope").has_value());
    EXPECT_EQ(f.x().width(), 6u);
    EXPECT_EQ(f.x().instanceName(), std::optional<std::string>("x"));
    EXPECT_FALSE(f.lit().instanceName().has_value());
    EXPECT_THROW(f.mCircuit.addModule("Top"), std::invalid_argument);
    EXPECT_THROW(f.mDemo.mExpect->addPort("y", PortDirection::In),
                 std::invalid_argument);
}

TEST(Circuit, RejectsInstantiationCycles) {
    Fixture f;
    EXPECT_THROW(f.mDemo.mExpect->addInstance("self", *f.mDemo.mExpect),
                 std::invalid_argument);
    // Top > wrapper > expect; Expect must not instantiate Top or Wrapper.
    EXPECT_THROW(f.mDemo.mExpect->addInstance("up", *f.mDemo.mTop),
                 std::invalid_argument);
    EXPECT_THROW(f.mDemo.mExpect->addInstance("up", *f.mDemo.mWrapper),
                 std::invalid_argument);
    EXPECT_TRUE(f.mDemo.mExpect->instances().empty());
    // Sharing a module below two parents is not a cycle.
    EXPECT_NO_THROW(f.mDemo.mMonitor->addInstance("expect", *f.mDemo.mExpect));
    EXPECT_EQ(hier::findInstancePaths(*f.mDemo.mTop, *f.mDemo.mExpect).size(),
              2u);
    std::ostringstream os;
    hier::dumpInstanceTree(*f.mDemo.mTop, os);
    EXPECT_NE(os.str().find("[0] expect : Expect"), std::string::npos);
}

TEST(Circuit, Resolve) {
    Fixture f;
    ComponentRef r;
    ASSERT_TRUE(f.mCircuit.resolve("Expect.y", r));
    ASSERT_TRUE(r.mSignal.has_value());
    EXPECT_EQ(toString(r.id().toTarget()), "~Top|Expect>y");

    ASSERT_TRUE(f.mCircuit.resolve("Monitor", r));
    EXPECT_FALSE(r.mSignal.has_value());
    EXPECT_EQ(toString(r.id().toTarget()), "~Top|Monitor");

    ASSERT_TRUE(f.mCircuit.resolve("~", r));
    EXPECT_EQ(toString(r.id().toTarget()), "~Top");

    std::ostringstream diag;
    EXPECT_FALSE(f.mCircuit.resolve("Nope.y", r, &diag));
    EXPECT_FALSE(f.mCircuit.resolve("Expect.nope", r, &diag));
    EXPECT_NE(diag.str().find("ERROR: no such signal"), std::string::npos);
}

TEST(Hierarchy, InstancePathsAndCommonAncestor) {
    Fixture f;
    const auto& top = *f.mDemo.mTop;
    auto cPaths = hier::findInstancePaths(top, *f.mDemo.mConstant);
    auto ePaths = hier::findInstancePaths(top, *f.mDemo.mExpect);
    ASSERT_EQ(cPaths.size(), 1u);
    ASSERT_EQ(ePaths.size(), 1u);
    EXPECT_EQ(hier::renderScope(top, cPaths[0]), "Top/constant");
    EXPECT_EQ(hier::renderScope(top, ePaths[0]), "Top/wrapper/expect");
    EXPECT_EQ(ePaths[0].toString(), "1/0");

    auto lca = hier::lowestCommonAncestor(cPaths[0], ePaths[0]);
    EXPECT_TRUE(lca.mPath.empty());
    EXPECT_EQ(hier::moduleAt(top, lca), &top);
    EXPECT_EQ(hier::moduleAt(top, ePaths[0]), f.mDemo.mExpect);

    hier::ScopeId bad{{7}};
    EXPECT_EQ(hier::moduleAt(top, bad), nullptr);

    std::ostringstream os;
    hier::dumpInstanceTree(top, os);
    EXPECT_NE(os.str().find("[0] expect : Expect"), std::string::npos);
}

TEST(RegisterSource, EmitsPinThenSource) {
    Fixture f;
    std::string id = f.mBoring.registerSource(f.x(), "myname");
    EXPECT_EQ(id, "myname");
    auto a = f.annos();
    ASSERT_EQ(a.size(), 2u);
    EXPECT_EQ(a[0].mKind, IntentKind::NoOptimizeAway);
    EXPECT_EQ(toString(a[0].mTarget), "~Top|Constant>x");
    EXPECT_EQ(a[1].mKind, IntentKind::SourceDeclared);
    EXPECT_EQ(a[1].mName, "myname");
    EXPECT_EQ(toString(a[1].mTarget), "~Top|Constant>x");
}

TEST(RegisterSource, DisableDedupSuppressesOwningModule) {
    Fixture f;
    f.mBoring.registerSource(f.x(), "s", true);
    auto a = f.annos();
    ASSERT_EQ(a.size(), 3u);
    EXPECT_EQ(a[2].mKind, IntentKind::DedupSuppressed);
    EXPECT_EQ(toString(a[2].mTarget), "~Top|Constant");
    EXPECT_TRUE(a[2].mName.empty());
}

TEST(RegisterSource, NonUniqueNameIsPassedThrough) {
    Fixture f;
    EXPECT_EQ(f.mCtx.boringNamespace().allocateUnique("myname"), "myname");
    EXPECT_EQ(f.mBoring.registerSource(f.x(), "myname", false, false),
              "myname");
    EXPECT_EQ(f.mBoring.registerSource(f.y(), "myname", false, false),
              "myname");
    // Verbatim names are not recorded in the namespace.
    EXPECT_EQ(f.mCtx.boringNamespace().size(), 1u);
}

TEST(RegisterSource, NonUniqueDoesNotTouchNamespace) {
    Fixture f;
    f.mBoring.registerSource(f.x(), "user");
    EXPECT_FALSE(f.mCtx.boringNamespace().exists("user"));
}

TEST(RegisterSink, ForceExistsOnEmptyRegistryThrowsAndEmitsNothing) {
    Fixture f;
    EXPECT_THROW(f.mBoring.registerSink(f.y(), "missing", false, true),
                 NameNotFoundError);
    EXPECT_THROW(f.mBoring.registerSink(f.y(), "missing", true, true),
                 NameNotFoundError);
    EXPECT_EQ(f.mCtx.annotations().size(), 0u);
}

TEST(RegisterSink, ErrorMessageNamesTheId) {
    Fixture f;
    try {
        f.mBoring.registerSink(f.y(), "missing", false, true);
        FAIL() << "expected NameNotFoundError";
    } catch (const NameNotFoundError& e) {
        EXPECT_EQ(e.name(), "missing");
        EXPECT_NE(std::string(e.what()).find("'missing'"), std::string::npos);
    }
}

TEST(RegisterSink, ComponentAndModuleTargets) {
    Fixture f;
    f.mBoring.registerSink(f.y(), "n", true);
    f.mBoring.registerSink(*f.mDemo.mMonitor, "n", true);
    auto a = f.annos();
    ASSERT_EQ(a.size(), 4u);
    EXPECT_EQ(a[0].mKind, IntentKind::SinkDeclared);
    EXPECT_EQ(toString(a[0].mTarget), "~Top|Expect>y");
    EXPECT_EQ(a[1].mKind, IntentKind::DedupSuppressed);
    EXPECT_EQ(toString(a[1].mTarget), "~Top|Expect");
    EXPECT_EQ(a[2].mKind, IntentKind::SinkDeclared);
    EXPECT_EQ(toString(a[2].mTarget), "~Top|Monitor");
    EXPECT_EQ(toString(a[3].mTarget), "~Top|Monitor");
}

TEST(RegisterSink, NoPinForSinks) {
    Fixture f;
    f.mBoring.registerSink(f.y(), "dangling");
    auto a = f.annos();
    ASSERT_EQ(a.size(), 1u);
    EXPECT_EQ(a[0].mKind, IntentKind::SinkDeclared);
    EXPECT_EQ(f.mCtx.annotations().ofKind(IntentKind::NoOptimizeAway).size(),
              0u);
}

TEST(RegisterSink, InvalidTargetThrowsAndEmitsNothing) {
    Fixture f;
    BogusSink bogus;
    EXPECT_THROW(f.mBoring.registerSink(bogus, "n", true),
                 InvalidSinkTargetError);
    EXPECT_THROW(f.mBoring.registerSink(f.mCircuit, "n"),
                 InvalidSinkTargetError);
    EXPECT_EQ(f.mCtx.annotations().size(), 0u);
}

TEST(RegisterSink, ErrorsAreLoggedToDiag) {
    std::ostringstream diag;
    elab::BuildContext ctx({}, &diag);
    wiring::BoringUtils boring(ctx);
    Circuit c("Top");
    auto& m = c.addModule("M");
    auto w = m.addWire("w");
    EXPECT_THROW(boring.registerSink(w, "ghost", false, true),
                 NameNotFoundError);
    EXPECT_NE(diag.str().find("ERROR: sink ID 'ghost'"), std::string::npos);
}

TEST(Bore, RoundTrip) {
    Fixture f;
    auto y = f.y();
    auto probe = f.probe();
    std::string g = f.mBoring.bore(f.x(), {&y, &probe});
    EXPECT_EQ(g, "x");
    EXPECT_TRUE(f.mCtx.boringNamespace().exists(g));

    auto sources = f.mCtx.annotations().ofKind(IntentKind::SourceDeclared);
    auto sinks = f.mCtx.annotations().ofKind(IntentKind::SinkDeclared);
    ASSERT_EQ(sources.size(), 1u);
    ASSERT_EQ(sinks.size(), 2u);
    EXPECT_EQ(sources[0].mName, g);
    EXPECT_EQ(sinks[0].mName, g);
    EXPECT_EQ(sinks[1].mName, g);
    EXPECT_EQ(toString(sinks[0].mTarget), "~Top|Expect>y");
    EXPECT_EQ(toString(sinks[1].mTarget), "~Top|Monitor>probe");

    // Source and every sink carry dedup suppression.
    auto dedup = f.mCtx.annotations().ofKind(IntentKind::DedupSuppressed);
    ASSERT_EQ(dedup.size(), 3u);
    EXPECT_EQ(toString(dedup[0].mTarget), "~Top|Constant");
    EXPECT_EQ(toString(dedup[1].mTarget), "~Top|Expect");
    EXPECT_EQ(toString(dedup[2].mTarget), "~Top|Monitor");

    // pin, source, dedup, (sink, dedup) x 2
    auto a = f.annos();
    ASSERT_EQ(a.size(), 7u);
    EXPECT_EQ(a[0].mKind, IntentKind::NoOptimizeAway);
    EXPECT_EQ(a[1].mKind, IntentKind::SourceDeclared);
    EXPECT_EQ(a[2].mKind, IntentKind::DedupSuppressed);
    EXPECT_EQ(a[3].mKind, IntentKind::SinkDeclared);
    EXPECT_EQ(a[4].mKind, IntentKind::DedupSuppressed);
    EXPECT_EQ(a[5].mKind, IntentKind::SinkDeclared);
    EXPECT_EQ(a[6].mKind, IntentKind::DedupSuppressed);
}

TEST(Bore, RepeatedBoresFromSameNameAreDistinct) {
    Fixture f;
    auto y = f.y();
    std::string g1 = f.mBoring.bore(f.x(), {&y});
    std::string g2 = f.mBoring.bore(f.x(), {&y});
    EXPECT_EQ(g1, "x");
    EXPECT_EQ(g2, "x_1");
}

TEST(Bore, FallsBackToBoreLabel) {
    Fixture f;
    auto y = f.y();
    EXPECT_EQ(f.mBoring.bore(f.lit(), {&y}), "bore");
    Anonymous anon;
    EXPECT_EQ(f.mBoring.bore(anon, {&y}), "bore_1");
}

TEST(Bore, KeepsDuplicateSinksInOrder) {
    Fixture f;
    auto y = f.y();
    auto probe = f.probe();
    std::string g = f.mBoring.bore(f.x(), {&y, &probe, &y});
    auto sinks = f.mCtx.annotations().ofKind(IntentKind::SinkDeclared);
    ASSERT_EQ(sinks.size(), 3u);
    EXPECT_EQ(toString(sinks[0].mTarget), "~Top|Expect>y");
    EXPECT_EQ(toString(sinks[1].mTarget), "~Top|Monitor>probe");
    EXPECT_EQ(toString(sinks[2].mTarget), "~Top|Expect>y");
    EXPECT_EQ(f.mCtx.annotations().withName(g).size(), 4u);
}

TEST(Bore, NoSinksStillDeclaresSource) {
    Fixture f;
    std::string g = f.mBoring.bore(f.x(), {});
    EXPECT_EQ(g, "x");
    EXPECT_EQ(f.mCtx.annotations().size(), 3u);
}

TEST(Bore, NullSinkRejectedBeforeEmission) {
    Fixture f;
    auto y = f.y();
    EXPECT_THROW(f.mBoring.bore(f.x(), {&y, nullptr}), InvalidSinkTargetError);
    EXPECT_EQ(f.mCtx.annotations().size(), 0u);
    EXPECT_FALSE(f.mCtx.boringNamespace().exists("x"));
}

TEST(Bore, InvalidSinkRejectedBeforeEmission) {
    Fixture f;
    auto y = f.y();
    BogusSink bogus;
    EXPECT_THROW(f.mBoring.bore(f.x(), {&y, &f.mCircuit}),
                 InvalidSinkTargetError);
    EXPECT_THROW(f.mBoring.bore(f.x(), {&bogus}), InvalidSinkTargetError);
    EXPECT_EQ(f.mCtx.annotations().size(), 0u);
    EXPECT_FALSE(f.mCtx.boringNamespace().exists("x"));
    // The name is still free for the next valid bore.
    EXPECT_EQ(f.mBoring.bore(f.x(), {&y}), "x");
}

TEST(Scenario, UniqueSourcesAndForcedSinks) {
    Fixture f;
    auto c = f.y();
    auto d = f.probe();
    EXPECT_EQ(f.mBoring.registerSource(f.x(), "sig", false, true), "sig");
    EXPECT_EQ(f.mBoring.registerSource(f.lit(), "sig", false, true), "sig_1");
    EXPECT_NO_THROW(f.mBoring.registerSink(c, "sig", false, true));
    EXPECT_NO_THROW(f.mBoring.registerSink(d, "sig_1", false, true));
    size_t before = f.mCtx.annotations().size();
    EXPECT_THROW(f.mBoring.registerSink(*f.mDemo.mMonitor, "nope", false, true),
                 NameNotFoundError);
    EXPECT_EQ(f.mCtx.annotations().size(), before);
}

TEST(BuildContext, NamespaceIsLazy) {
    elab::BuildContext ctx;
    EXPECT_FALSE(ctx.hasNamespace());
    ctx.boringNamespace();
    EXPECT_TRUE(ctx.hasNamespace());
}

TEST(BuildContext, SharedNamespacePersistsAcrossBuilds) {
    std::shared_ptr<NameRegistry> ns;
    {
        Fixture first;
        auto y = first.y();
        EXPECT_EQ(first.mBoring.bore(first.x(), {&y}), "x");
        ns = first.mCtx.sharedNamespace();
    }
    Circuit c("Top");
    auto d = demo::buildDemoCircuit(c);
    elab::BuildContext ctx(ns);
    wiring::BoringUtils boring(ctx);
    auto y = *d.mExpect->wire("y");
    EXPECT_EQ(boring.bore(*d.mConstant->wire("x"), {&y}), "x_1");
    EXPECT_NO_THROW(boring.registerSink(y, "x", false, true));
}

TEST(BuildContext, ClearAnnotationsKeepsNamespace) {
    Fixture f;
    auto y = f.y();
    f.mBoring.bore(f.x(), {&y});
    f.mCtx.clearAnnotations();
    EXPECT_EQ(f.mCtx.annotations().size(), 0u);
    EXPECT_TRUE(f.mCtx.boringNamespace().exists("x"));
}

TEST(BuildContext, CustomSink) {
    struct Counting : AnnotationSink {
        std::vector<IntentKind> mKinds;
        void annotate(Annotation a) override { mKinds.push_back(a.mKind); }
    };
    Fixture f;
    Counting counting;
    f.mCtx.setSink(&counting);
    f.mBoring.registerSource(f.x(), "s", true);
    EXPECT_EQ(f.mCtx.annotations().size(), 0u);
    ASSERT_EQ(counting.mKinds.size(), 3u);
    EXPECT_EQ(counting.mKinds[1], IntentKind::SourceDeclared);
    f.mCtx.setSink(nullptr);
    f.mBoring.registerSink(f.y(), "s");
    EXPECT_EQ(f.mCtx.annotations().size(), 1u);
}

TEST(Options, ParseTokens) {
    std::ostringstream diag;
    auto o = elab::parseOptionTokens(
      {"strict_names=1", "reserve=reg,wire", "bogus=3", "noequals"}, 0, &diag);
    EXPECT_TRUE(o.mStrictNames);
    ASSERT_EQ(o.mReservedKeywords.size(), 2u);
    EXPECT_EQ(o.mReservedKeywords[1], "wire");
    EXPECT_NE(diag.str().find("WARN: unknown option: bogus"), std::string::npos);
    EXPECT_NE(diag.str().find("WARN: ignoring option token"),
              std::string::npos);

    elab::BuildOptions b;
    EXPECT_FALSE(elab::applyOption(b, "strict_names=maybe", nullptr));
    EXPECT_FALSE(b.mStrictNames);
}

TEST(Options, UpdateIsAllOrNothing) {
    std::ostringstream diag;
    elab::BuildContext ctx({}, &diag);
    ctx.boringNamespace();
    EXPECT_FALSE(ctx.updateOptions({"reserve=a", "bogus=1"}));
    EXPECT_TRUE(ctx.options().mReservedKeywords.empty());
    EXPECT_FALSE(ctx.boringNamespace().exists("a"));
    EXPECT_NE(diag.str().find("WARN: unknown option: bogus"), std::string::npos);

    // Applied to an existing namespace right away; repeats are not stored
    // twice.
    EXPECT_TRUE(ctx.updateOptions({"reserve=a", "reserve=a,b"}));
    EXPECT_EQ(ctx.options().mReservedKeywords,
              (std::vector<std::string>{"a", "b"}));
    EXPECT_TRUE(ctx.boringNamespace().exists("a"));
    Circuit c("Top");
    auto& m = c.addModule("M");
    auto a = m.addWire("a");
    wiring::BoringUtils boring(ctx);
    EXPECT_EQ(boring.bore(a, {}), "a_1");
}

TEST(Options, ReservedKeywordsSeedNamespace) {
    elab::BuildOptions o;
    o.mReservedKeywords = {"x"};
    elab::BuildContext ctx(o);
    Circuit c("Top");
    auto& m = c.addModule("M");
    auto x = m.addWire("x");
    wiring::BoringUtils boring(ctx);
    EXPECT_EQ(boring.bore(x, {}), "x_1");
}

TEST(Options, StrictNamesRejectsCollisions) {
    elab::BuildOptions o;
    o.mStrictNames = true;
    elab::BuildContext ctx(o);
    wiring::BoringUtils boring(ctx);
    Circuit c("Top");
    auto& m = c.addModule("M");
    auto a = m.addWire("a");
    auto b = m.addWire("b");

    EXPECT_EQ(boring.registerSource(a, "user"), "user");
    EXPECT_TRUE(ctx.boringNamespace().exists("user"));
    EXPECT_THROW(boring.registerSource(b, "user"), NameCollisionError);
    EXPECT_EQ(ctx.annotations().size(), 2u);

    // Unique allocation steers around the reserved user name.
    EXPECT_EQ(boring.registerSource(b, "user", false, true), "user_1");
    // And a user name cannot claim an allocated one.
    EXPECT_THROW(boring.registerSource(a, "user_1"), NameCollisionError);
}

TEST(Json, AnnotationArray) {
    Fixture f;
    auto y = f.y();
    f.mBoring.bore(f.x(), {&y});
    auto j = vis::annotationsToJson(f.annos());
    ASSERT_TRUE(j.is_array());
    ASSERT_EQ(j.size(), 5u);
    EXPECT_EQ(j[0]["class"], "NoOptimizeAway");
    EXPECT_FALSE(j[0].contains("name"));
    EXPECT_EQ(j[1]["class"], "SourceDeclared");
    EXPECT_EQ(j[1]["target"], "~Top|Constant>x");
    EXPECT_EQ(j[1]["name"], "x");
    EXPECT_EQ(j[3]["class"], "SinkDeclared");
    EXPECT_EQ(j[3]["target"], "~Top|Expect>y");
}

TEST(Json, WiringViewGroupsById) {
    Fixture f;
    auto y = f.y();
    auto probe = f.probe();
    f.mBoring.bore(f.x(), {&y});
    f.mBoring.registerSource(f.lit(), "answer");
    f.mBoring.registerSink(probe, "answer");
    auto v = vis::wiringViewJson(f.annos());
    ASSERT_TRUE(v.contains("x"));
    ASSERT_TRUE(v.contains("answer"));
    EXPECT_EQ(v["x"]["sources"].size(), 1u);
    EXPECT_EQ(v["x"]["sinks"][0], "~Top|Expect>y");
    EXPECT_EQ(v["x"]["noDedup"].size(), 2u);
    EXPECT_EQ(v["answer"]["sinks"][0], "~Top|Monitor>probe");
    // Constant is suppressed by the bore, so the literal's ID lists it too.
    EXPECT_EQ(v["answer"]["noDedup"].size(), 1u);
    EXPECT_EQ(v["answer"]["noDedup"][0], "~Top|Constant");
}

TEST(Json, Namespace) {
    NameRegistry ns;
    ns.allocateUnique("b");
    ns.allocateUnique("a");
    auto j = vis::namespaceToJson(ns);
    EXPECT_EQ(j["size"], 2);
    EXPECT_EQ(j["names"][0], "a");
    EXPECT_EQ(j["names"][1], "b");
}

TEST(Json, WriteFileFailure) {
    EXPECT_THROW(vis::writeJsonFile("/nonexistent-dir/x.json", {}),
                 std::runtime_error);
}
