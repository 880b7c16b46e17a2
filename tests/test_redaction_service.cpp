#include <catch2/catch_test_macros.hpp>
#include "service/redaction_service.hpp"
#include "mocks/mock_audit_sink.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace redactor;
using redactor::testing::MockAuditSink;

namespace {

Policy gdpr_policy() {
    Policy p;
    p.id = "gdpr-pii";
    p.status = PolicyStatus::ACTIVE;
    p.data_categories = {"pii"};
    p.retention_period_days = 30;
    p.redaction_rules = {RedactionRule("email", ReplacementStrategy::MASK)};
    return p;
}

Policy inactive_policy() {
    Policy p;
    p.id = "paused";
    p.status = PolicyStatus::INACTIVE;
    p.redaction_rules = {RedactionRule("email", ReplacementStrategy::MASK)};
    return p;
}

Policy org_policy() {
    Policy p = gdpr_policy();
    p.id = "org-scoped";
    p.org_id = "org-1";
    return p;
}

Policy silent_policy() {
    Policy p = gdpr_policy();
    p.id = "no-audit";
    p.audit_enabled = false;
    return p;
}

struct Fixture {
    std::shared_ptr<MockAuditSink::State> audit_state;
    std::shared_ptr<AuditEmitter> emitter;
    RedactionService service;

    explicit Fixture(RedactionEngine engine = RedactionEngine{})
        : audit_state(std::make_shared<MockAuditSink::State>()),
          emitter(make_emitter(audit_state)),
          service(std::make_shared<InMemoryPolicyStore>(std::vector<Policy>{
                      gdpr_policy(), inactive_policy(), org_policy(), silent_policy()}),
                  emitter, engine) {}

    static std::shared_ptr<AuditEmitter> make_emitter(std::shared_ptr<MockAuditSink::State> state) {
        std::vector<std::unique_ptr<IAuditSink>> sinks;
        sinks.push_back(std::make_unique<MockAuditSink>(std::move(state)));
        return std::make_shared<AuditEmitter>(std::move(sinks));
    }
};

RedactionRequest request(std::string content, std::string policy_id) {
    RedactionRequest r;
    r.content = std::move(content);
    r.policy_id = std::move(policy_id);
    return r;
}

CallerContext caller(std::string org = "org-1") {
    CallerContext c;
    c.org_id = std::move(org);
    return c;
}

} // anonymous namespace

TEST_CASE("RedactionService: successful redaction is audited", "[service]") {
    Fixture f;
    auto req = request("Contact me at a@b.com please, or 555-123-4567", "gdpr-pii");
    req.agent_id = "agent-7";
    req.data_type = "response";

    CallerContext c = caller();
    c.agent_id = req.agent_id;

    auto result = f.service.redact(req, c, "trace-123");
    REQUIRE(result.is_ok());

    const auto& resp = result.value();
    CHECK(resp.redacted_content == "Contact me at ******* please, or [PHONE_REDACTED]");
    CHECK(resp.redaction_count == 2);
    CHECK(resp.patterns_matched == std::vector<std::string>{"email", "phone"});
    CHECK(resp.original_hash.size() == 64);
    CHECK(resp.audit_recorded);

    REQUIRE(f.audit_state->lines.size() == 1);
    const auto& line = f.audit_state->lines[0];
    CHECK(line.find("\"policy_id\":\"gdpr-pii\"") != std::string::npos);
    CHECK(line.find("\"org_id\":\"org-1\"") != std::string::npos);
    CHECK(line.find("\"agent_id\":\"agent-7\"") != std::string::npos);
    CHECK(line.find("\"data_type\":\"response\"") != std::string::npos);
    CHECK(line.find("\"trace_id\":\"trace-123\"") != std::string::npos);
    CHECK(line.find("\"retention_period_days\":30") != std::string::npos);
    CHECK(line.find("\"original_hash\":\"" + resp.original_hash + "\"") != std::string::npos);
    CHECK(line.find("a@b.com") == std::string::npos);
    CHECK(line.find("555-123-4567") == std::string::npos);
}

TEST_CASE("RedactionService: missing fields are rejected before any work", "[service][error]") {
    Fixture f;

    SECTION("No content") {
        auto result = f.service.redact(request("", "gdpr-pii"), caller(), "t");
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::VALIDATION_ERROR);
    }

    SECTION("No policy id") {
        auto result = f.service.redact(request("a@b.com", ""), caller(), "t");
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::VALIDATION_ERROR);
    }

    CHECK(f.audit_state->lines.empty());
}

TEST_CASE("RedactionService: unusable policies look absent", "[service][error]") {
    Fixture f;

    SECTION("Inactive") {
        auto result = f.service.redact(request("a@b.com", "paused"), caller(), "t");
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::POLICY_NOT_FOUND);
        CHECK(result.error_message() == "Policy not found or inactive");
    }

    SECTION("Unknown") {
        auto result = f.service.redact(request("a@b.com", "nope"), caller(), "t");
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::POLICY_NOT_FOUND);
    }

    SECTION("Other organization") {
        auto result = f.service.redact(request("a@b.com", "org-scoped"), caller("org-2"), "t");
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::POLICY_NOT_FOUND);
    }

    SECTION("Own organization") {
        auto result = f.service.redact(request("a@b.com", "org-scoped"), caller("org-1"), "t");
        CHECK(result.is_ok());
    }
}

TEST_CASE("RedactionService: audit failure does not withhold content", "[service][audit]") {
    Fixture f;
    f.audit_state->fail_writes = true;

    auto result = f.service.redact(request("mail a@b.com", "gdpr-pii"), caller(), "t");
    REQUIRE(result.is_ok());
    CHECK(result.value().redacted_content == "mail *******");
    CHECK_FALSE(result.value().audit_recorded);
}

TEST_CASE("RedactionService: policy can opt out of auditing", "[service][audit]") {
    Fixture f;

    auto result = f.service.redact(request("mail a@b.com", "no-audit"), caller(), "t");
    REQUIRE(result.is_ok());
    CHECK_FALSE(result.value().audit_recorded);
    CHECK(f.audit_state->lines.empty());
}

TEST_CASE("RedactionService: runs without an audit emitter", "[service]") {
    const RedactionService service(
        std::make_shared<InMemoryPolicyStore>(std::vector<Policy>{gdpr_policy()}), nullptr);

    auto result = service.redact(request("mail a@b.com", "gdpr-pii"), caller(), "t");
    REQUIRE(result.is_ok());
    CHECK_FALSE(result.value().audit_recorded);
}

TEST_CASE("RedactionService: engine errors propagate", "[service][error]") {
    Policy broken;
    broken.id = "broken";
    broken.status = PolicyStatus::ACTIVE;
    broken.redaction_rules = {RedactionRule("custom_regex", "(unclosed", ReplacementStrategy::MASK)};

    auto state = std::make_shared<MockAuditSink::State>();
    const RedactionService service(
        std::make_shared<InMemoryPolicyStore>(std::vector<Policy>{broken}),
        Fixture::make_emitter(state));

    auto result = service.redact(request("anything", "broken"), caller(), "t");
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::CONFIG_ERROR);
    CHECK(state->lines.empty());
}

TEST_CASE("RedactionService: caller context", "[service]") {
    auto req = request("x", "p");
    req.run_id = "run-1";

    auto defaulted = RedactionService::caller_for(req, "org-default");
    CHECK(defaulted.org_id == "org-default");
    CHECK(defaulted.run_id == std::optional<std::string>("run-1"));
    CHECK_FALSE(defaulted.agent_id.has_value());

    req.org_id = "org-explicit";
    CHECK(RedactionService::caller_for(req, "org-default").org_id == "org-explicit");
}
