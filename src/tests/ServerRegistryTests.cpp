// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <mcp/ProjectConfigStore.hpp>
#include <mcp/ServerRegistry.hpp>

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

using namespace mcpman;

/// @brief Mock command runner for testing ServerRegistry without the external tool.
///
/// Safe to call from several threads; an empty response queue answers with an error.
class MockCommandRunner: public CommandRunner
{
  public:
    std::queue<Result<CommandOutput>> responses;
    std::vector<std::vector<std::string>> calls;
    std::vector<std::optional<std::string>> workingDirectories;
    std::vector<std::vector<std::string>> detachedCalls;

    auto run(const std::vector<std::string>& args, const std::optional<std::string>& workingDirectory = std::nullopt)
        -> Result<CommandOutput> override
    {
        auto const lock = std::lock_guard(_mutex);
        calls.push_back(args);
        workingDirectories.push_back(workingDirectory);
        if (responses.empty())
            return makeError(ErrorCode::ProcessError, "No more mock responses");
        auto response = std::move(responses.front());
        responses.pop();
        return response;
    }

    auto spawnDetached(const std::vector<std::string>& args) -> VoidResult override
    {
        auto const lock = std::lock_guard(_mutex);
        detachedCalls.push_back(args);
        return {};
    }

    void queueOutput(std::string stdoutText, int exitCode = 0, std::string stderrText = {})
    {
        responses.push(CommandOutput {
            .stdoutText = std::move(stdoutText),
            .stderrText = std::move(stderrText),
            .exitCode = exitCode,
        });
    }

    void queueError(ErrorCode code, std::string message) { responses.push(makeError(code, std::move(message))); }

  private:
    std::mutex _mutex;
};

namespace
{

struct TempProject
{
    std::filesystem::path dir;

    explicit TempProject(std::string_view name): dir(std::filesystem::temp_directory_path() / name)
    {
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);
    }

    ~TempProject()
    {
        auto ec = std::error_code {};
        std::filesystem::remove_all(dir, ec);
    }

    [[nodiscard]] auto path() const -> std::string { return dir.string(); }
    [[nodiscard]] auto configPath() const -> std::string { return projectConfigPath(path()); }

    void writeConfig(std::string_view content) const
    {
        auto file = std::ofstream(configPath());
        file << content;
    }
};

struct Fixture
{
    TempProject project;
    MockCommandRunner* mock = nullptr;
    std::unique_ptr<ServerRegistry> registry;

    explicit Fixture(std::string_view name): project(name)
    {
        auto runner = std::make_unique<MockCommandRunner>();
        mock = runner.get();
        registry = std::make_unique<ServerRegistry>(std::move(runner), project.path());
    }
};

using Args = std::vector<std::string>;

} // namespace

TEST_CASE("buildAddArguments for a stdio server", "[registry]")
{
    auto const request = AddRequest {
        .name = "github",
        .transport = TransportKind::Stdio,
        .command = "docker",
        .args = { "run", "-i", "--rm" },
        .env = { { "GITHUB_TOKEN", "abc" } },
        .scope = Scope::Project,
    };

    auto args = buildAddArguments(request);
    REQUIRE(args.has_value());
    CHECK(*args
          == Args { "add", "-s", "project", "-e", "GITHUB_TOKEN=abc", "github", "--", "docker", "run", "-i", "--rm" });
}

TEST_CASE("buildAddArguments for an sse server", "[registry]")
{
    auto const request = AddRequest {
        .name = "remote",
        .transport = TransportKind::Sse,
        .url = "https://example.com/sse",
        .scope = Scope::User,
    };

    auto args = buildAddArguments(request);
    REQUIRE(args.has_value());
    CHECK(*args == Args { "add", "-s", "user", "--transport", "sse", "remote", "https://example.com/sse" });
}

TEST_CASE("buildAddArguments rejects incomplete requests", "[registry]")
{
    SECTION("empty name")
    {
        auto args = buildAddArguments(AddRequest { .name = "  ", .command = "npx" });
        REQUIRE(!args.has_value());
        CHECK(args.error().code == ErrorCode::ValidationError);
        CHECK(args.error().message == "Server name is required");
    }

    SECTION("stdio without command")
    {
        auto args = buildAddArguments(AddRequest { .name = "x", .transport = TransportKind::Stdio });
        REQUIRE(!args.has_value());
        CHECK(args.error().message == "Command is required for stdio transport");
    }

    SECTION("sse without url")
    {
        auto args = buildAddArguments(AddRequest { .name = "x", .transport = TransportKind::Sse, .command = "npx" });
        REQUIRE(!args.has_value());
        CHECK(args.error().message == "URL is required for SSE transport");
    }
}

TEST_CASE("ServerRegistry add runs the external tool", "[registry]")
{
    auto fixture = Fixture("mcpman_registry_add");
    fixture.mock->queueOutput("Added stdio MCP server fetch to local config\n");

    auto const result =
        fixture.registry->add(AddRequest { .name = "fetch", .command = "uvx", .args = { "mcp-server-fetch" } });

    CHECK(result.success);
    CHECK(result.message == "Added stdio MCP server fetch to local config");
    CHECK(result.serverName == "fetch");
    REQUIRE(fixture.mock->calls.size() == 1);
    CHECK(fixture.mock->calls[0] == Args { "add", "-s", "local", "fetch", "--", "uvx", "mcp-server-fetch" });
}

TEST_CASE("ServerRegistry add reports validation errors without running anything", "[registry]")
{
    auto fixture = Fixture("mcpman_registry_add_invalid");

    auto const result = fixture.registry->add(AddRequest { .name = "fetch" });

    CHECK(!result.success);
    CHECK(result.message == "Command is required for stdio transport");
    CHECK(!result.serverName.has_value());
    CHECK(fixture.mock->calls.empty());
}

TEST_CASE("ServerRegistry add reports a failing command", "[registry]")
{
    auto fixture = Fixture("mcpman_registry_add_failed");
    fixture.mock->queueOutput("", 1, "MCP server fetch already exists\n");

    auto const result = fixture.registry->add(AddRequest { .name = "fetch", .command = "uvx" });

    CHECK(!result.success);
    CHECK(result.message == "Command failed: MCP server fetch already exists");
}

TEST_CASE("ServerRegistry add reports a runner error", "[registry]")
{
    auto fixture = Fixture("mcpman_registry_add_spawn");
    fixture.mock->queueError(ErrorCode::ProcessError, "Failed to spawn process 'claude'");

    auto const result = fixture.registry->add(AddRequest { .name = "fetch", .command = "uvx" });

    CHECK(!result.success);
    CHECK(result.message == "Failed to spawn process 'claude'");
}

TEST_CASE("ServerRegistry addFromJson passes the definition through", "[registry]")
{
    auto fixture = Fixture("mcpman_registry_add_json");
    fixture.mock->queueOutput("Added stdio MCP server weather to project config");

    auto const definition = std::string(R"({"type":"stdio","command":"weather-mcp"})");
    auto const result = fixture.registry->addFromJson("weather", definition, Scope::Project);

    CHECK(result.success);
    CHECK(result.serverName == "weather");
    REQUIRE(fixture.mock->calls.size() == 1);
    CHECK(fixture.mock->calls[0] == Args { "add-json", "weather", definition, "-s", "project" });
}

TEST_CASE("ServerRegistry addFromJson rejects invalid definitions", "[registry]")
{
    auto fixture = Fixture("mcpman_registry_add_json_invalid");

    SECTION("not JSON")
    {
        auto const result = fixture.registry->addFromJson("weather", "{oops", Scope::Local);
        CHECK(!result.success);
        CHECK(result.message.starts_with("Invalid JSON configuration"));
    }

    SECTION("not an object")
    {
        auto const result = fixture.registry->addFromJson("weather", "[1, 2]", Scope::Local);
        CHECK(!result.success);
        CHECK(result.message.starts_with("Invalid JSON configuration"));
    }

    SECTION("empty name")
    {
        auto const result = fixture.registry->addFromJson("", "{}", Scope::Local);
        CHECK(!result.success);
        CHECK(result.message == "Server name is required");
    }

    CHECK(fixture.mock->calls.empty());
}

TEST_CASE("ServerRegistry remove leaves the sidecar untouched", "[registry]")
{
    auto fixture = Fixture("mcpman_registry_remove");
    fixture.project.writeConfig(R"({"mcpServers": {"alpha": {"command": "a", "disabled": true}}})");
    fixture.mock->queueOutput("Removed MCP server alpha from local config\n");

    auto result = fixture.registry->remove("alpha");

    REQUIRE(result.has_value());
    CHECK(*result == "Removed MCP server alpha from local config");
    CHECK(fixture.mock->calls[0] == Args { "remove", "alpha" });

    auto config = readProjectConfigFile(fixture.project.configPath());
    REQUIRE(config.has_value());
    CHECK(config->servers.contains("alpha"));
}

TEST_CASE("ServerRegistry remove propagates failures", "[registry]")
{
    auto fixture = Fixture("mcpman_registry_remove_failed");
    fixture.mock->queueOutput("No MCP server found with name: ghost", 1);

    auto result = fixture.registry->remove("ghost");

    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ProcessError);
    CHECK(result.error().message == "Command failed: No MCP server found with name: ghost");
}

TEST_CASE("ServerRegistry list merges the disabled flag from the sidecar", "[registry]")
{
    auto fixture = Fixture("mcpman_registry_list");
    fixture.project.writeConfig(R"({"mcpServers": {"beta": {"command": "other", "disabled": true}}})");
    fixture.mock->queueOutput("alpha: npx alpha-mcp\nbeta: uvx beta-mcp\n");

    auto servers = fixture.registry->list();

    REQUIRE(servers.has_value());
    REQUIRE(servers->size() == 2);
    CHECK((*servers)[0].name == "alpha");
    CHECK(!(*servers)[0].disabled);
    CHECK((*servers)[1].name == "beta");
    CHECK((*servers)[1].disabled);
    CHECK((*servers)[1].command == "uvx beta-mcp");
    CHECK(fixture.mock->calls[0] == Args { "list" });
}

TEST_CASE("ServerRegistry list returns nothing when no servers are configured", "[registry]")
{
    auto fixture = Fixture("mcpman_registry_list_empty");
    fixture.mock->queueOutput("No MCP servers configured. Use `claude mcp add` to add a server.\n");

    auto servers = fixture.registry->list();

    REQUIRE(servers.has_value());
    CHECK(servers->empty());
}

TEST_CASE("ServerRegistry list ignores an unreadable sidecar", "[registry]")
{
    auto fixture = Fixture("mcpman_registry_list_corrupt");
    fixture.project.writeConfig("{ this is not json");
    fixture.mock->queueOutput("alpha: npx alpha-mcp\n");

    auto warnings = std::vector<std::string> {};
    log::setCallback([&](log::Level level, std::string_view message) {
        if (level == log::Level::Warning)
            warnings.emplace_back(message);
    });
    auto servers = fixture.registry->list();
    log::setCallback({});

    REQUIRE(servers.has_value());
    REQUIRE(servers->size() == 1);
    CHECK(!(*servers)[0].disabled);
    REQUIRE(warnings.size() == 1);
    CHECK(warnings[0].starts_with("Ignoring unreadable project config"));
}

TEST_CASE("ServerRegistry list propagates a failing command", "[registry]")
{
    auto fixture = Fixture("mcpman_registry_list_failed");
    fixture.mock->queueOutput("", 2, "unknown command 'mcp'");

    auto servers = fixture.registry->list();

    REQUIRE(!servers.has_value());
    CHECK(servers.error().code == ErrorCode::ProcessError);
}

TEST_CASE("ServerRegistry get parses details and applies the overlay", "[registry]")
{
    auto fixture = Fixture("mcpman_registry_get");
    fixture.project.writeConfig(R"({"mcpServers": {"alpha": {"command": "npx", "disabled": true}}})");
    fixture.mock->queueOutput("alpha:\n"
                              "  Scope: User config\n"
                              "  Type: stdio\n"
                              "  Command: npx\n"
                              "  Args: alpha-mcp --debug\n");

    auto server = fixture.registry->get("alpha");

    REQUIRE(server.has_value());
    CHECK(server->name == "alpha");
    CHECK(server->scope == Scope::User);
    CHECK(server->command == "npx");
    CHECK(server->args == Args { "alpha-mcp", "--debug" });
    CHECK(server->disabled);
    CHECK(fixture.mock->calls[0] == Args { "get", "alpha" });
}

TEST_CASE("ServerRegistry toggleDisabled creates an entry from the server details", "[registry]")
{
    auto fixture = Fixture("mcpman_registry_toggle_detail");
    fixture.mock->queueOutput("alpha:\n  Scope: Local config\n  Command: node server.js\n  Args: --port 3000\n");

    auto result = fixture.registry->toggleDisabled("alpha", true);

    REQUIRE(result.has_value());
    CHECK(*result == "Server 'alpha' has been disabled");
    CHECK(fixture.mock->calls == std::vector<Args> { Args { "get", "alpha" } });
    CHECK(fixture.mock->workingDirectories == std::vector<std::optional<std::string>> { std::nullopt });

    auto config = readProjectConfigFile(fixture.project.configPath());
    REQUIRE(config.has_value());
    auto const& entry = config->servers.at("alpha");
    CHECK(entry.command == "node");
    CHECK(entry.args == Args { "server.js", "--port", "3000" });
    CHECK(entry.disabled);
}

TEST_CASE("ServerRegistry toggleDisabled falls back to a minimal entry", "[registry]")
{
    auto fixture = Fixture("mcpman_registry_toggle_minimal");
    fixture.mock->queueOutput("", 1, "No MCP server found with name: ghost");

    auto result = fixture.registry->toggleDisabled("ghost", true);

    REQUIRE(result.has_value());
    CHECK(*result == "Server 'ghost' has been disabled");

    auto config = readProjectConfigFile(fixture.project.configPath());
    REQUIRE(config.has_value());
    auto const& entry = config->servers.at("ghost");
    CHECK(entry.command.empty());
    CHECK(entry.args.empty());
    CHECK(entry.disabled);
}

TEST_CASE("ServerRegistry toggleDisabled updates an existing entry without running anything", "[registry]")
{
    auto fixture = Fixture("mcpman_registry_toggle_existing");
    fixture.project.writeConfig(R"({"mcpServers": {"alpha": {"command": "uvx", "args": ["alpha-mcp"]}}})");

    auto result = fixture.registry->toggleDisabled("alpha", true);

    REQUIRE(result.has_value());
    CHECK(fixture.mock->calls.empty());

    auto config = readProjectConfigFile(fixture.project.configPath());
    REQUIRE(config.has_value());
    CHECK(config->servers.at("alpha").disabled);
    CHECK(config->servers.at("alpha").command == "uvx");
}

TEST_CASE("ServerRegistry toggleDisabled twice leaves one enabled entry", "[registry]")
{
    auto fixture = Fixture("mcpman_registry_toggle_twice");
    fixture.mock->queueOutput("", 1);

    REQUIRE(fixture.registry->toggleDisabled("alpha", true).has_value());
    auto result = fixture.registry->toggleDisabled("alpha", false);

    REQUIRE(result.has_value());
    CHECK(*result == "Server 'alpha' has been enabled");
    CHECK(fixture.mock->calls.size() == 1);

    auto config = readProjectConfigFile(fixture.project.configPath());
    REQUIRE(config.has_value());
    REQUIRE(config->servers.size() == 1);
    CHECK(!config->servers.at("alpha").disabled);
}

TEST_CASE("ServerRegistry toggleDisabled does not overwrite a corrupt sidecar", "[registry]")
{
    auto fixture = Fixture("mcpman_registry_toggle_corrupt");
    fixture.project.writeConfig("{ broken");

    auto result = fixture.registry->toggleDisabled("alpha", true);

    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigParseError);

    auto file = std::ifstream(fixture.project.configPath());
    auto content = std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    CHECK(content == "{ broken");
}

TEST_CASE("ServerRegistry toggleDisabled honours an explicit project path", "[registry]")
{
    auto fixture = Fixture("mcpman_registry_toggle_default");
    auto const other = TempProject("mcpman_registry_toggle_other");
    fixture.mock->queueOutput("", 1);

    REQUIRE(fixture.registry->toggleDisabled("alpha", true, other.path()).has_value());

    CHECK(std::filesystem::exists(other.configPath()));
    CHECK(!std::filesystem::exists(fixture.project.configPath()));

    // The detail lookup runs in the other project, where its project-scoped servers resolve.
    REQUIRE(fixture.mock->calls == std::vector<Args> { Args { "get", "alpha" } });
    CHECK(fixture.mock->workingDirectories == std::vector<std::optional<std::string>> { other.path() });
}

TEST_CASE("ServerRegistry toggleDisabled from two threads loses no update", "[registry]")
{
    auto fixture = Fixture("mcpman_registry_toggle_threads");
    constexpr auto NamesPerThread = 50;

    auto failures = std::atomic<int> { 0 };
    auto const toggleAll = [&](std::string_view prefix) {
        for (auto i = 0; i < NamesPerThread; ++i)
        {
            if (!fixture.registry->toggleDisabled(std::format("{}{}", prefix, i), true))
                ++failures;
        }
    };

    auto first = std::thread(toggleAll, "first-");
    auto second = std::thread(toggleAll, "second-");
    first.join();
    second.join();

    CHECK(failures.load() == 0);

    auto config = readProjectConfigFile(fixture.project.configPath());
    REQUIRE(config.has_value());
    CHECK(config->servers.size() == 2 * NamesPerThread);
    for (auto i = 0; i < NamesPerThread; ++i)
    {
        for (auto const prefix: { "first-", "second-" })
        {
            auto const name = std::format("{}{}", prefix, i);
            REQUIRE(config->servers.contains(name));
            CHECK(config->servers.at(name).disabled);
        }
    }
}

TEST_CASE("ServerRegistry toggleDisabled rejects an empty name", "[registry]")
{
    auto fixture = Fixture("mcpman_registry_toggle_empty");

    auto result = fixture.registry->toggleDisabled("", true);

    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ValidationError);
    CHECK(!std::filesystem::exists(fixture.project.configPath()));
}

TEST_CASE("ServerRegistry testConnection", "[registry]")
{
    auto fixture = Fixture("mcpman_registry_test");

    SECTION("success")
    {
        fixture.mock->queueOutput("alpha:\n  Command: npx\n");
        auto result = fixture.registry->testConnection("alpha");
        REQUIRE(result.has_value());
        CHECK(*result == "Connection to alpha successful");
    }

    SECTION("failure")
    {
        fixture.mock->queueOutput("", 1, "No MCP server found with name: alpha");
        auto result = fixture.registry->testConnection("alpha");
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ProcessError);
    }
}

TEST_CASE("ServerRegistry resetProjectChoices", "[registry]")
{
    auto fixture = Fixture("mcpman_registry_reset");
    fixture.mock->queueOutput("All project-scoped server approvals have been reset.\n");

    auto result = fixture.registry->resetProjectChoices();

    REQUIRE(result.has_value());
    CHECK(*result == "All project-scoped server approvals have been reset.");
    CHECK(fixture.mock->calls[0] == Args { "reset-project-choices" });
}

TEST_CASE("ServerRegistry serve starts the tool without waiting", "[registry]")
{
    auto fixture = Fixture("mcpman_registry_serve");

    auto result = fixture.registry->serve();

    REQUIRE(result.has_value());
    CHECK(*result == "MCP server started");
    CHECK(fixture.mock->calls.empty());
    CHECK(fixture.mock->detachedCalls == std::vector<Args> { Args { "serve" } });
}

TEST_CASE("ServerRegistry importServers keeps going after a failure", "[registry][import]")
{
    auto fixture = Fixture("mcpman_registry_import");
    fixture.mock->queueOutput("Added one");
    fixture.mock->queueOutput("Added two");
    fixture.mock->queueOutput("Added four");

    auto const document = nlohmann::ordered_json::parse(R"({
        "mcpServers": {
            "one": {"command": "npx", "args": ["-y", "one-mcp"]},
            "two": {"command": "uvx", "env": {"TOKEN": "t"}},
            "three": {"args": ["no-command"]},
            "four": {"command": "four-mcp"}
        }
    })");

    auto outcome = fixture.registry->importServers(document, Scope::User);

    REQUIRE(outcome.has_value());
    CHECK(outcome->importedCount == 3);
    CHECK(outcome->failedCount == 1);
    REQUIRE(outcome->servers.size() == 4);
    CHECK(outcome->servers[0].name == "one");
    CHECK(outcome->servers[1].name == "two");
    CHECK(outcome->servers[2].name == "three");
    CHECK(outcome->servers[3].name == "four");
    CHECK(outcome->servers[0].success);
    CHECK(!outcome->servers[2].success);
    CHECK(outcome->servers[2].error == "Missing command field");

    REQUIRE(fixture.mock->calls.size() == 3);
    auto const& first = fixture.mock->calls[0];
    REQUIRE(first.size() == 5);
    CHECK(first[0] == "add-json");
    CHECK(first[1] == "one");
    CHECK(first[3] == "-s");
    CHECK(first[4] == "user");

    auto const payload = nlohmann::json::parse(first[2]);
    CHECK(payload["type"] == "stdio");
    CHECK(payload["command"] == "npx");
    CHECK(payload["args"] == nlohmann::json::array({ "-y", "one-mcp" }));
    CHECK(payload["env"] == nlohmann::json::object());

    auto const second = nlohmann::json::parse(fixture.mock->calls[1][2]);
    CHECK(second["args"] == nlohmann::json::array());
    CHECK(second["env"]["TOKEN"] == "t");
}

TEST_CASE("ServerRegistry importServers records failing adds", "[registry][import]")
{
    auto fixture = Fixture("mcpman_registry_import_failed");
    fixture.mock->queueOutput("", 1, "MCP server one already exists");

    auto const document = nlohmann::ordered_json::parse(R"({"mcpServers": {"one": {"command": "npx"}}})");
    auto outcome = fixture.registry->importServers(document, Scope::Local);

    REQUIRE(outcome.has_value());
    CHECK(outcome->importedCount == 0);
    CHECK(outcome->failedCount == 1);
    REQUIRE(outcome->servers.size() == 1);
    CHECK(outcome->servers[0].error == "Command failed: MCP server one already exists");
}

TEST_CASE("ServerRegistry importServers requires an mcpServers object", "[registry][import]")
{
    auto fixture = Fixture("mcpman_registry_import_empty");

    auto outcome = fixture.registry->importServers(nlohmann::ordered_json::parse(R"({"other": 1})"), Scope::Local);

    REQUIRE(!outcome.has_value());
    CHECK(outcome.error().code == ErrorCode::ParseError);
    CHECK(outcome.error().message == "No MCP servers found in Claude Desktop config");
    CHECK(fixture.mock->calls.empty());
}

TEST_CASE("ServerRegistry importFromForeignConfig reads the given file", "[registry][import]")
{
    auto fixture = Fixture("mcpman_registry_import_file");
    auto const path = (fixture.project.dir / "claude_desktop_config.json").string();
    {
        auto file = std::ofstream(path);
        file << R"({"mcpServers": {"one": {"command": "npx"}}})";
    }
    fixture.mock->queueOutput("Added one");

    auto outcome = fixture.registry->importFromForeignConfig(Scope::Project, path);

    REQUIRE(outcome.has_value());
    CHECK(outcome->importedCount == 1);
    CHECK(fixture.mock->calls[0][4] == "project");
}

TEST_CASE("ServerRegistry importFromForeignConfig reports a missing file", "[registry][import]")
{
    auto fixture = Fixture("mcpman_registry_import_missing");

    auto outcome = fixture.registry->importFromForeignConfig(
        Scope::Local, (fixture.project.dir / "does-not-exist.json").string());

    REQUIRE(!outcome.has_value());
    CHECK(outcome.error().code == ErrorCode::NotFound);
}

TEST_CASE("ServerRegistry saveProjectConfig and readProjectConfig", "[registry]")
{
    auto fixture = Fixture("mcpman_registry_project_config");

    auto config = ProjectConfig {};
    config.servers["alpha"] = ServerConfigEntry { .command = "npx", .args = { "alpha-mcp" }, .disabled = true };

    auto saved = fixture.registry->saveProjectConfig(fixture.project.path(), config);
    REQUIRE(saved.has_value());
    CHECK(*saved == "Project MCP configuration saved");

    auto loaded = fixture.registry->readProjectConfig(fixture.project.path());
    REQUIRE(loaded.has_value());
    REQUIRE(loaded->servers.contains("alpha"));
    CHECK(loaded->servers.at("alpha").disabled);
    CHECK(loaded->servers.at("alpha").args == Args { "alpha-mcp" });
}
