#include "gtest/gtest.h"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include "destination.hpp"
#include "fakes.hpp"
#include "reset_policy.hpp"

namespace {

ConnectionTarget localTarget() {
    return ConnectionTarget{"localhost", 5432, "app", "user", "pw"};
}

TunnelConfig bastion() {
    TunnelConfig tunnel;
    tunnel.host = "bastion";
    tunnel.user = "ops";
    return tunnel;
}

bool argsContain(const CommandSpec& spec, const std::string& needle) {
    return std::any_of(spec.args.begin(), spec.args.end(),
                       [&](const std::string& arg) { return arg.find(needle) != std::string::npos; });
}

class PostgreSQLDestinationTest : public ::testing::Test {
protected:
    std::shared_ptr<RecordingExecutor> executor = std::make_shared<RecordingExecutor>();
    std::shared_ptr<FakeToolLocator> locator =
        std::make_shared<FakeToolLocator>(std::set<std::string>{"psql", "mysql", "ssh", "sshpass"});
};

TEST_F(PostgreSQLDestinationTest, initialize_without_reset_runs_nothing) {
    PostgreSQLDestination destination(localTarget(), false, std::nullopt, executor, locator);
    auto result = destination.initialize();
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(executor->commands.empty());
    EXPECT_TRUE(destination.initialized());
    EXPECT_EQ(locator->lookups, std::vector<std::string>{"psql"});
}

TEST_F(PostgreSQLDestinationTest, missing_tool_fails_before_any_process) {
    auto noTools = std::make_shared<FakeToolLocator>(std::set<std::string>{});
    PostgreSQLDestination destination(localTarget(), true, std::nullopt, executor, noTools);
    auto result = destination.initialize();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, RestoreErrorKind::ToolNotFound);
    EXPECT_TRUE(executor->commands.empty());
    EXPECT_FALSE(destination.initialized());
}

TEST_F(PostgreSQLDestinationTest, initialize_with_reset_runs_reset_statement) {
    PostgreSQLDestination destination(localTarget(), true, std::nullopt, executor, locator);
    ASSERT_TRUE(destination.initialize().has_value());

    ASSERT_EQ(executor->commands.size(), 1u);
    const auto& command = executor->commands[0];
    EXPECT_EQ(command.spec.program, "psql");
    std::vector<std::string> expected{"-h", "localhost", "-p", "5432", "-d", "app", "-U", "user",
                                      "-c", resetStatement("user")};
    EXPECT_EQ(command.spec.args, expected);
    EXPECT_EQ(command.spec.env.at("PGPASSWORD"), "pw");
    EXPECT_FALSE(command.input.has_value());
}

TEST_F(PostgreSQLDestinationTest, write_streams_payload_to_psql) {
    PostgreSQLDestination destination(localTarget(), false, std::nullopt, executor, locator);
    ASSERT_TRUE(destination.initialize().has_value());
    ASSERT_TRUE(destination.write(toBytes("SELECT 1;")).has_value());

    ASSERT_EQ(executor->commands.size(), 1u);
    const auto& command = executor->commands[0];
    std::vector<std::string> expected{"-h", "localhost", "-p", "5432", "-d", "app", "-U", "user"};
    EXPECT_EQ(command.spec.program, "psql");
    EXPECT_EQ(command.spec.args, expected);
    ASSERT_TRUE(command.input.has_value());
    EXPECT_EQ(*command.input, toBytes("SELECT 1;"));
    EXPECT_EQ(command.spec.env.at("PGPASSWORD"), "pw");
}

TEST_F(PostgreSQLDestinationTest, password_never_appears_in_arguments) {
    PostgreSQLDestination destination(ConnectionTarget{"localhost", 5432, "app", "user", "top-secret"},
                                      true, std::nullopt, executor, locator);
    ASSERT_TRUE(destination.initialize().has_value());
    ASSERT_TRUE(destination.write(toBytes("SELECT 1;")).has_value());
    ASSERT_EQ(executor->commands.size(), 2u);
    for (const auto& command : executor->commands) {
        EXPECT_FALSE(argsContain(command.spec, "top-secret"));
        EXPECT_EQ(command.spec.program, "psql");
    }
}

TEST_F(PostgreSQLDestinationTest, every_write_is_an_independent_invocation) {
    PostgreSQLDestination destination(localTarget(), false, std::nullopt, executor, locator);
    ASSERT_TRUE(destination.initialize().has_value());
    ASSERT_TRUE(destination.write(toBytes("CREATE TABLE t (id int);")).has_value());
    ASSERT_TRUE(destination.write(toBytes("INSERT INTO t VALUES (1);")).has_value());
    ASSERT_EQ(executor->commands.size(), 2u);
    EXPECT_EQ(*executor->commands[0].input, toBytes("CREATE TABLE t (id int);"));
    EXPECT_EQ(*executor->commands[1].input, toBytes("INSERT INTO t VALUES (1);"));
}

TEST_F(PostgreSQLDestinationTest, reset_failure_propagates) {
    executor->failNext(RestoreErrorKind::ProcessFailed, "psql failed with exit status 2", 2);
    PostgreSQLDestination destination(localTarget(), true, std::nullopt, executor, locator);
    auto result = destination.initialize();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, RestoreErrorKind::ProcessFailed);
    EXPECT_EQ(result.error().exitCode, 2);
    EXPECT_FALSE(destination.initialized());
}

TEST_F(PostgreSQLDestinationTest, write_failure_propagates) {
    PostgreSQLDestination destination(localTarget(), false, std::nullopt, executor, locator);
    ASSERT_TRUE(destination.initialize().has_value());
    executor->failNext(RestoreErrorKind::SpawnFailed, "Failed to start psql: No such file or directory");
    auto result = destination.write(toBytes("SELECT 1;"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, RestoreErrorKind::SpawnFailed);
}

TEST_F(PostgreSQLDestinationTest, tunneled_commands_run_through_ssh) {
    PostgreSQLDestination destination(localTarget(), true, bastion(), executor, locator);
    ASSERT_TRUE(destination.initialize().has_value());
    ASSERT_TRUE(destination.write(toBytes("SELECT 1;")).has_value());

    ASSERT_EQ(executor->commands.size(), 2u);
    const auto& reset = executor->commands[0];
    EXPECT_EQ(reset.spec.program, "ssh");
    EXPECT_TRUE(argsContain(reset.spec, "bastion"));
    const std::string& remoteReset = reset.spec.args.back();
    EXPECT_EQ(remoteReset.rfind("export PGPASSWORD=pw; psql -h localhost -p 5432 -d app -U user -c ", 0), 0u)
        << remoteReset;
    EXPECT_FALSE(reset.spec.env.contains("PGPASSWORD"));

    const auto& write = executor->commands[1];
    EXPECT_EQ(write.spec.args.back(), "export PGPASSWORD=pw; psql -h localhost -p 5432 -d app -U user");
    ASSERT_TRUE(write.input.has_value());
    EXPECT_EQ(*write.input, toBytes("SELECT 1;"));
    EXPECT_EQ(locator->lookups, (std::vector<std::string>{"psql", "ssh"}));
}

TEST_F(PostgreSQLDestinationTest, missing_transport_client_is_tool_not_found) {
    auto onlyPsql = std::make_shared<FakeToolLocator>(std::set<std::string>{"psql"});
    PostgreSQLDestination destination(localTarget(), false, bastion(), executor, onlyPsql);
    auto result = destination.initialize();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, RestoreErrorKind::ToolNotFound);
    EXPECT_TRUE(executor->commands.empty());
}

TEST_F(PostgreSQLDestinationTest, transport_failure_maps_to_spawn_failed) {
    PostgreSQLDestination destination(localTarget(), false, bastion(), executor, locator);
    ASSERT_TRUE(destination.initialize().has_value());
    executor->failNext(RestoreErrorKind::ProcessFailed, "ssh failed with exit status 255", 255);
    auto result = destination.write(toBytes("SELECT 1;"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, RestoreErrorKind::SpawnFailed);
    EXPECT_NE(result.error().message.find("bastion"), std::string::npos);
}

TEST_F(PostgreSQLDestinationTest, remote_tool_failure_stays_process_failed) {
    PostgreSQLDestination destination(localTarget(), false, bastion(), executor, locator);
    ASSERT_TRUE(destination.initialize().has_value());
    executor->failNext(RestoreErrorKind::ProcessFailed, "ssh failed with exit status 2", 2);
    auto result = destination.write(toBytes("SELECT 1;"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, RestoreErrorKind::ProcessFailed);
}

TEST_F(PostgreSQLDestinationTest, password_tunnel_checks_sshpass) {
    TunnelConfig tunnel = bastion();
    tunnel.password = "hop";
    PostgreSQLDestination destination(localTarget(), false, tunnel, executor, locator);
    ASSERT_TRUE(destination.initialize().has_value());
    EXPECT_EQ(locator->lookups, (std::vector<std::string>{"psql", "sshpass"}));
    ASSERT_TRUE(destination.write(toBytes("SELECT 1;")).has_value());
    EXPECT_EQ(executor->commands[0].spec.program, "sshpass");
    EXPECT_EQ(executor->commands[0].spec.env.at("SSHPASS"), "hop");
}

TEST_F(PostgreSQLDestinationTest, rejects_invalid_targets) {
    EXPECT_THROW(PostgreSQLDestination(ConnectionTarget{"localhost", 0, "app", "user", "pw"}, false,
                                       std::nullopt, executor, locator),
                 std::runtime_error);
    EXPECT_THROW(PostgreSQLDestination(ConnectionTarget{"localhost", 65536, "app", "user", "pw"}, false,
                                       std::nullopt, executor, locator),
                 std::runtime_error);
    EXPECT_THROW(PostgreSQLDestination(ConnectionTarget{"", 5432, "app", "user", "pw"}, false,
                                       std::nullopt, executor, locator),
                 std::runtime_error);
    TunnelConfig noHost;
    EXPECT_THROW(PostgreSQLDestination(localTarget(), false, noHost, executor, locator), std::runtime_error);
    EXPECT_THROW(PostgreSQLDestination(localTarget(), false, std::nullopt, nullptr, locator), std::runtime_error);
}

TEST_F(PostgreSQLDestinationTest, empty_password_is_not_exported) {
    PostgreSQLDestination destination(ConnectionTarget{"localhost", 5432, "app", "user", ""},
                                      false, std::nullopt, executor, locator);
    ASSERT_TRUE(destination.write(toBytes("SELECT 1;")).has_value());
    EXPECT_FALSE(executor->commands[0].spec.env.contains("PGPASSWORD"));
}

TEST_F(PostgreSQLDestinationTest, mysql_destination_uses_mysql_client) {
    MySQLDestination destination(ConnectionTarget{"db", 3306, "app", "root", "pw"}, true, std::nullopt,
                                 executor, locator);
    ASSERT_TRUE(destination.initialize().has_value());
    ASSERT_TRUE(destination.write(toBytes("SELECT 1;")).has_value());

    ASSERT_EQ(executor->commands.size(), 2u);
    std::vector<std::string> resetArgs{"-h", "db", "-P", "3306", "-u", "root",
                                       "-e", "DROP DATABASE IF EXISTS `app`; CREATE DATABASE `app`;"};
    EXPECT_EQ(executor->commands[0].spec.program, "mysql");
    EXPECT_EQ(executor->commands[0].spec.args, resetArgs);
    std::vector<std::string> writeArgs{"-h", "db", "-P", "3306", "-u", "root", "-D", "app"};
    EXPECT_EQ(executor->commands[1].spec.args, writeArgs);
    EXPECT_EQ(executor->commands[1].spec.env.at("MYSQL_PWD"), "pw");
    EXPECT_FALSE(argsContain(executor->commands[1].spec, "pw"));
}

} // namespace
