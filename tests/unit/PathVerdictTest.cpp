#include <gtest/gtest.h>

#include <Analysis/PathVerdict.h>

#include "utils/GraphTestFixture.h"

using namespace taintreach;
using namespace taintreach::testing;

// ============================================================================
// Path Verdict Unit Tests
// ============================================================================

class PathVerdictTest : public GraphTestFixture {
protected:
    PathVerdict onlyVerdict(const std::string& SinkId) {
        std::vector<PathVerdict> Verdicts = verdictsFor(SinkId);
        EXPECT_EQ(Verdicts.size(), 1u);
        return Verdicts.empty() ? PathVerdict() : Verdicts.front();
    }
};

TEST_F(PathVerdictTest, UnprotectedPathIsVulnerable) {
    entry("api");
    sink("exec");
    edge("api", "exec");

    PathVerdict V = onlyVerdict("exec");
    EXPECT_EQ(V.Kind, PathVerdictKind::Vulnerable);
    EXPECT_TRUE(V.isLive());
    EXPECT_TRUE(isExploitable(V.Kind));
    EXPECT_FALSE(V.Protector.hasValue());
}

TEST_F(PathVerdictTest, StrictValidatorSanitizes) {
    entry("api");
    call("check", {{"role", "validator"}, {"strength", "strict"}});
    sink("exec");
    edge("api", "check");
    edge("check", "exec");

    PathVerdict V = onlyVerdict("exec");
    EXPECT_EQ(V.Kind, PathVerdictKind::Sanitized);
    ASSERT_TRUE(V.Protector.hasValue());
    EXPECT_EQ(*V.Protector, indexOf("check"));
}

TEST_F(PathVerdictTest, WeakValidatorPartiallyMitigates) {
    entry("api");
    call("check", {{"role", "validator"}, {"strength", "weak"}});
    sink("render", "template");
    edge("api", "check");
    edge("check", "render");

    PathVerdict V = onlyVerdict("render");
    EXPECT_EQ(V.Kind, PathVerdictKind::PartiallyMitigated);
    EXPECT_TRUE(V.WeakValidatorSeen);
    EXPECT_TRUE(isExploitable(V.Kind)) << "Weak validation is still exploitable";
}

TEST_F(PathVerdictTest, GateWithoutSanitizerIsAuthProtected) {
    entry("api");
    call("login_required", {{"role", "authz-gate"}});
    sink("exec");
    edge("api", "login_required");
    edge("login_required", "exec");

    PathVerdict V = onlyVerdict("exec");
    EXPECT_EQ(V.Kind, PathVerdictKind::AuthProtected);
    EXPECT_TRUE(V.AuthGateSeen);
    ASSERT_TRUE(V.Gate.hasValue());
    EXPECT_EQ(*V.Gate, indexOf("login_required"));
    EXPECT_FALSE(isExploitable(V.Kind));
}

TEST_F(PathVerdictTest, GateOutranksWeakValidator) {
    entry("api");
    call("admin_required", {{"role", "authz-gate"}});
    call("check", {{"role", "validator"}, {"strength", "weak"}});
    sink("exec");
    edge("api", "admin_required");
    edge("admin_required", "check");
    edge("check", "exec");

    PathVerdict V = onlyVerdict("exec");
    EXPECT_EQ(V.Kind, PathVerdictKind::AuthProtected);
    EXPECT_TRUE(V.WeakValidatorSeen) << "Evidence is kept even when it does not decide";
}

TEST_F(PathVerdictTest, SanitizedWinsOverGate) {
    entry("api");
    call("admin_required", {{"role", "authz-gate"}});
    call("throttle", {{"role", "rate-limiter"}});
    call("escape", {{"role", "sanitizer"}});
    sink("render", "template");
    edge("api", "admin_required");
    edge("admin_required", "throttle");
    edge("throttle", "escape");
    edge("escape", "render");

    PathVerdict V = onlyVerdict("render");
    EXPECT_EQ(V.Kind, PathVerdictKind::Sanitized);
    EXPECT_TRUE(V.AuthGateSeen);
    EXPECT_TRUE(V.RateLimiterSeen);
}

TEST_F(PathVerdictTest, RateLimiterAloneProtectsNothing) {
    entry("api");
    call("throttle", {{"role", "rate-limiter"}});
    sink("exec");
    edge("api", "throttle");
    edge("throttle", "exec");

    PathVerdict V = onlyVerdict("exec");
    EXPECT_EQ(V.Kind, PathVerdictKind::Vulnerable);
    EXPECT_TRUE(V.RateLimiterSeen);
}

TEST_F(PathVerdictTest, SanitizerForOtherSubtypeDoesNotProtect) {
    entry("api");
    call("escape_html", {{"role", "sanitizer"}, {"protects", "template-injection"}});
    sink("exec", "sql");
    edge("api", "escape_html");
    edge("escape_html", "exec");

    PathVerdict V = onlyVerdict("exec");
    EXPECT_EQ(V.Kind, PathVerdictKind::Vulnerable);
    EXPECT_FALSE(V.Protector.hasValue());
}

// ============================================================================
// Dead paths
// ============================================================================

TEST_F(PathVerdictTest, NeverEdgeIsDeadRegardlessOfRoles) {
    entry("api");
    call("escape", {{"role", "sanitizer"}});
    call("admin_required", {{"role", "authz-gate"}});
    sink("exec");
    edge("api", "escape");
    edge("escape", "admin_required", BranchCondition::Never);
    edge("admin_required", "exec");

    PathVerdict V = onlyVerdict("exec");
    EXPECT_EQ(V.Kind, PathVerdictKind::Dead);
    EXPECT_EQ(V.Dead, DeadReason::NeverEdge);
    EXPECT_FALSE(V.isLive());
}

TEST_F(PathVerdictTest, UnregisteredEntryIsDead) {
    entry("internal_diagnostic", false);
    sink("exec");
    edge("internal_diagnostic", "exec");

    PathVerdict V = onlyVerdict("exec");
    EXPECT_EQ(V.Kind, PathVerdictKind::Dead);
    EXPECT_EQ(V.Dead, DeadReason::UnregisteredEntry);
}

TEST_F(PathVerdictTest, UnwiredFunctionIsDead) {
    entry("api");
    call("unused_legacy_search");
    sink("legacy_search_raw", "sql-injection");
    edge("unused_legacy_search", "legacy_search_raw");

    PathVerdict V = onlyVerdict("legacy_search_raw");
    EXPECT_EQ(V.Kind, PathVerdictKind::Dead);
    EXPECT_EQ(V.Dead, DeadReason::Unwired);
    EXPECT_EQ(toString(V.Dead), "unwired");
}

TEST_F(PathVerdictTest, DeadGuardIsDead) {
    entry("api");
    branch("if_legacy", {{"role", "dead-guard"}});
    sink("exec");
    edge("api", "if_legacy");
    edge("if_legacy", "exec");

    PathVerdict V = onlyVerdict("exec");
    EXPECT_EQ(V.Kind, PathVerdictKind::Dead);
    EXPECT_EQ(V.Dead, DeadReason::DeadGuard);
}

// ============================================================================
// Evidence flags
// ============================================================================

TEST_F(PathVerdictTest, RuntimeAndUnclassifiableEvidence) {
    entry("api");
    branch("maybe");
    call("mystery", {{"role", "quantum-sanitizer"}});
    sink("exec");
    edge("api", "maybe");
    edge("maybe", "mystery", BranchCondition::Runtime);
    edge("mystery", "exec");

    PathVerdict V = onlyVerdict("exec");
    EXPECT_EQ(V.Kind, PathVerdictKind::Vulnerable) << "Unknown roles never protect";
    EXPECT_TRUE(V.ReliesOnRuntime);
    EXPECT_TRUE(V.HasUnclassifiable);
}

TEST_F(PathVerdictTest, VerdictNames) {
    EXPECT_EQ(toString(PathVerdictKind::PartiallyMitigated), "PARTIALLY_MITIGATED");
    EXPECT_EQ(toString(PathVerdictKind::AuthProtected), "AUTH_PROTECTED");
    EXPECT_EQ(toString(DeadReason::NeverEdge), "never-edge");
}
