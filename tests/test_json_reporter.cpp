#include "bastion/core/sandbox_executor.hpp"
#include "bastion/reporters/json_reporter.hpp"
#include "bastion/utils/scoped_temp_dir.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace bastion;
using reporters::JsonReporter;
using reporters::JsonReporterConfig;

namespace {

core::ExecutionResult SampleResult() {
    core::ExecutionResult result;
    result.execution_id = "3f2a9c1e-0000-4000-8000-000000000000";
    result.status = core::ExecutionStatus::COMPLETED;
    result.backend = "container";
    result.command_executed = "pytest -q";
    result.exit_code = 0;
    result.stdout_output = "3 passed\n";
    result.duration = std::chrono::milliseconds(1250);
    result.resource_usage["peak_memory_mb"] = 42.5;
    result.backend_resource_id = "bastion-3f2a9c1e";
    result.files_created = {"report.xml"};
    result.files_modified = {fs::path("src") / "app.py"};
    result.warnings = {"Command chaining operators (;, &&, ||)"};
    return result;
}

} // namespace

TEST(JsonReporterTest, ResultContainsEveryField) {
    JsonReporter reporter;
    auto j = json::parse(reporter.GenerateResultJson(SampleResult()));

    EXPECT_EQ(j["execution_id"], "3f2a9c1e-0000-4000-8000-000000000000");
    EXPECT_EQ(j["status"], "COMPLETED");
    EXPECT_EQ(j["backend"], "container");
    EXPECT_EQ(j["command"], "pytest -q");
    EXPECT_EQ(j["exit_code"], 0);
    EXPECT_EQ(j["duration_ms"], 1250);
    EXPECT_EQ(j["stdout"], "3 passed\n");
    EXPECT_EQ(j["stderr"], "");
    EXPECT_DOUBLE_EQ(j["resource_usage"]["peak_memory_mb"].get<double>(), 42.5);
    EXPECT_EQ(j["backend_resource_id"], "bastion-3f2a9c1e");
    EXPECT_EQ(j["files"]["created"], json::array({"report.xml"}));
    EXPECT_EQ(j["files"]["modified"], json::array({"src/app.py"}));
    EXPECT_TRUE(j["files"]["deleted"].empty());
    EXPECT_EQ(j["warnings"].size(), 1u);
    ASSERT_TRUE(j.contains("generated_at"));
    EXPECT_EQ(j["generated_at"].get<std::string>().back(), 'Z');
}

TEST(JsonReporterTest, BlockedResultHasNullResource) {
    core::ExecutionResult result;
    result.status = core::ExecutionStatus::BLOCKED;
    result.exit_code = 1;
    result.stderr_output = "Command blocked: Privilege escalation (sudo/su)";

    JsonReporter reporter;
    auto j = json::parse(reporter.GenerateResultJson(result));

    EXPECT_EQ(j["status"], "BLOCKED");
    EXPECT_TRUE(j["backend_resource_id"].is_null());
    EXPECT_EQ(j["backend"], "");
    EXPECT_TRUE(j["resource_usage"].is_object());
}

TEST(JsonReporterTest, OutputAndTimestampCanBeOmitted) {
    JsonReporterConfig config;
    config.pretty_print = false;
    config.include_output = false;
    config.include_timestamp = false;
    JsonReporter reporter(config);

    auto text = reporter.GenerateResultJson(SampleResult());
    EXPECT_EQ(text.find('\n'), std::string::npos);

    auto j = json::parse(text);
    EXPECT_FALSE(j.contains("stdout"));
    EXPECT_FALSE(j.contains("stderr"));
    EXPECT_FALSE(j.contains("generated_at"));
}

TEST(JsonReporterTest, ValidationVerdict) {
    security::CommandValidator validator(security::SecurityLevel::STRICT);
    JsonReporter reporter;

    auto blocked = json::parse(reporter.GenerateValidationJson("sudo ls", validator.Validate("sudo ls")));
    EXPECT_EQ(blocked["command"], "sudo ls");
    EXPECT_FALSE(blocked["is_safe"].get<bool>());
    EXPECT_EQ(blocked["risk"], "critical");
    EXPECT_TRUE(blocked["blocked_reason"].is_string());

    auto approved = json::parse(reporter.GenerateValidationJson("ls  -la", validator.Validate("ls  -la")));
    EXPECT_TRUE(approved["is_safe"].get<bool>());
    EXPECT_EQ(approved["risk"], "low");
    EXPECT_TRUE(approved["blocked_reason"].is_null());
    EXPECT_EQ(approved["sanitized_command"], "ls -la");
}

TEST(JsonReporterTest, StatsLayout) {
    core::ExecutorStats stats;
    stats.total_executions = 7;
    stats.active_resource_count = 2;
    stats.container_runtime_available = true;
    stats.backend = "container";
    stats.validator_stats.total_validations = 7;
    stats.validator_stats.blocked_count = 1;
    stats.validator_stats.block_rate_percent = 14.29;
    stats.validator_stats.whitelist_size = 52;

    JsonReporter reporter;
    auto j = json::parse(reporter.GenerateStatsJson(stats));

    EXPECT_EQ(j["total_executions"], 7);
    EXPECT_EQ(j["active_resource_count"], 2);
    EXPECT_TRUE(j["container_runtime_available"].get<bool>());
    EXPECT_EQ(j["default_limits"]["max_memory_mb"], 512);
    EXPECT_FALSE(j["default_limits"]["allow_network"].get<bool>());
    EXPECT_EQ(j["validator"]["security_level"], "strict");
    EXPECT_DOUBLE_EQ(j["validator"]["block_rate_percent"].get<double>(), 14.29);
}

TEST(JsonReporterTest, SaveAndValidateSyntax) {
    utils::ScopedTempDir dir;
    dir.CreateUnderPath(fs::temp_directory_path(), "bastion-json-test-");
    auto path = dir.GetPath() / "result.json";

    JsonReporter reporter;
    auto text = reporter.GenerateResultJson(SampleResult());
    ASSERT_TRUE(reporter.SaveJson(text, path));

    std::ifstream in(path);
    std::stringstream saved;
    saved << in.rdbuf();
    EXPECT_EQ(saved.str(), text);

    EXPECT_TRUE(JsonReporter::ValidateSyntax(text));
    EXPECT_FALSE(JsonReporter::ValidateSyntax("{\"unterminated\": "));
    EXPECT_FALSE(reporter.SaveJson(text, dir.GetPath() / "missing" / "result.json"));
}
