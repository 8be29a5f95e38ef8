#include <catch2/catch_test_macros.hpp>

#include <dgraph_client/config/config_loader.hpp>

#include <cstdlib>
#include <string>
#include <vector>

#ifdef _WIN32
#include <stdlib.h>  // _putenv_s
#endif

using namespace dgraph_client;
using namespace std::chrono_literals;

namespace {
void SetEnv(const char* name, const char* value) {
#ifdef _WIN32
    _putenv_s(name, value);
#else
    setenv(name, value, 1);
#endif
}

void UnsetEnv(const char* name) {
#ifdef _WIN32
    _putenv_s(name, "");
#else
    unsetenv(name);
#endif
}
} // namespace

// ===========================================================================
// Helper: path to test data files
// ===========================================================================

// Tests run from the build directory; derive the testdata path from __FILE__.
namespace {

std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto last_slash = this_file.rfind('/');
    auto test_dir = this_file.substr(0, last_slash);   // .../test/config
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));  // .../test
    return test_root + "/testdata/" + filename;
}

Result<AppConfig, Error> ParseCli(std::vector<const char*> args) {
    args.insert(args.begin(), "dgraph-cli");
    return LoadFromCli(static_cast<int>(args.size()), args.data());
}

AppConfig WithEndpoint(const std::string& address) {
    AppConfig config;
    auto endpoint = Endpoint::Create(address);
    REQUIRE(endpoint.IsOk());
    config.connection.endpoints.push_back(endpoint.Value());
    return config;
}

} // anonymous namespace

// ===========================================================================
// LoadFromYaml
// ===========================================================================

TEST_CASE("LoadFromYaml: valid full config", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    const auto& conn = config.connection;
    REQUIRE(conn.endpoints.size() == 2);
    CHECK(conn.endpoints[0].Value() == "alpha1.example.com:9080");
    CHECK(conn.endpoints[1].Value() == "alpha2.example.com:9080");
    CHECK(conn.use_https);
    CHECK_FALSE(conn.tls_verify);
    CHECK(conn.user == "groot");
    CHECK(conn.password == "password");
    CHECK(conn.namespace_id == 2);
    CHECK(conn.selection == SelectionPolicy::Random);

    CHECK(config.retry.max_retries == 3);
    CHECK(config.retry.base_delay == 50ms);
    CHECK(config.retry.max_delay == 2000ms);
    CHECK(config.retry.jitter == 0.25);

    REQUIRE(config.log_file.has_value());
    CHECK(*config.log_file == "/tmp/dgraph-cli.log");
    REQUIRE(config.log_level.has_value());
    CHECK(*config.log_level == LogLevel::Debug);

    CHECK(config.json_output);
    CHECK(config.timeout_seconds == 60);
    CHECK(config.command.session_file == "/tmp/dgraph.session");
}

TEST_CASE("LoadFromYaml: minimal config keeps defaults", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("minimal_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();
    REQUIRE(config.connection.endpoints.size() == 1);
    CHECK(config.connection.endpoints[0].Host() == "localhost");
    CHECK_FALSE(config.connection.use_https);
    CHECK(config.connection.selection == SelectionPolicy::RoundRobin);
    CHECK(config.retry.max_retries == 5);
    CHECK(config.timeout_seconds == 30);
    CHECK_FALSE(config.log_level.has_value());
    CHECK(config.command.session_file == ".dgraph.session");
}

TEST_CASE("LoadFromYaml: connection string expands", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("connect_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& conn = result.Value().connection;
    REQUIRE(conn.endpoints.size() == 1);
    CHECK(conn.endpoints[0].Value() == "db.example.com:443");
    CHECK(conn.user == "groot");
    CHECK(conn.password == "secret");
    CHECK(conn.use_https);
    CHECK(conn.namespace_id == 5);
}

TEST_CASE("LoadFromYaml: missing file", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("does_not_exist.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
    CHECK(result.Error().message.find("Failed to parse YAML file") != std::string::npos);
}

TEST_CASE("LoadFromYaml: malformed YAML", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("malformed.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("Failed to parse YAML file") != std::string::npos);
}

TEST_CASE("LoadFromYaml: invalid endpoint", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("invalid_endpoint.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("Invalid endpoint") != std::string::npos);
}

TEST_CASE("LoadFromYaml: invalid selection", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("invalid_selection.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message ==
          "Invalid endpoint selection 'fastest', expected round_robin or random");
}

TEST_CASE("LoadFromYaml: invalid log level", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("invalid_log_level.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("chatty") != std::string::npos);
}

TEST_CASE("LoadFromYaml: wrongly typed value", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("bad_value.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("Invalid value in YAML file") != std::string::npos);
}

// ===========================================================================
// LoadFromCli
// ===========================================================================

TEST_CASE("LoadFromCli: connection flags", "[config][cli]") {
    auto result = ParseCli({"--endpoint", "a:9080", "--endpoint", "b:9080",
                            "--https", "--insecure", "--user", "groot",
                            "--password", "pw", "--namespace", "4",
                            "--random-endpoint"});
    REQUIRE(result.IsOk());
    const auto& conn = result.Value().connection;
    REQUIRE(conn.endpoints.size() == 2);
    CHECK(conn.endpoints[1].Value() == "b:9080");
    CHECK(conn.use_https);
    CHECK_FALSE(conn.tls_verify);
    CHECK(conn.user == "groot");
    CHECK(conn.password == "pw");
    CHECK(conn.namespace_id == 4);
    CHECK(conn.selection == SelectionPolicy::Random);
}

TEST_CASE("LoadFromCli: connect string", "[config][cli]") {
    auto result = ParseCli({"--connect", "dgraph://localhost:9080?apikey=k"});
    REQUIRE(result.IsOk());
    const auto& conn = result.Value().connection;
    REQUIRE(conn.endpoints.size() == 1);
    CHECK(conn.api_key == "k");
    CHECK(conn.use_https);
}

TEST_CASE("LoadFromCli: bad connect string", "[config][cli]") {
    auto result = ParseCli({"--connect", "postgres://localhost:5432"});
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "Invalid connection string: scheme must be 'dgraph'");
}

TEST_CASE("LoadFromCli: bad endpoint flag", "[config][cli]") {
    auto result = ParseCli({"--endpoint", "localhost"});
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("Invalid --endpoint") != std::string::npos);
}

TEST_CASE("LoadFromCli: retry flags", "[config][cli]") {
    auto result = ParseCli({"--max-retries", "2", "--base-delay-ms", "10",
                            "--max-delay-ms", "100", "--jitter", "0.5"});
    REQUIRE(result.IsOk());
    const auto& retry = result.Value().retry;
    CHECK(retry.max_retries == 2);
    CHECK(retry.base_delay == 10ms);
    CHECK(retry.max_delay == 100ms);
    CHECK(retry.jitter == 0.5);
}

TEST_CASE("LoadFromCli: command inputs", "[config][cli]") {
    auto result = ParseCli({"--query", "{ q(func: has(name)) { name } }",
                            "--vars", R"({"$a":"1"})", "--set-json", R"({"name":"x"})",
                            "--cond", "@if(eq(len(v), 0))", "--commit-now",
                            "--read-only", "--best-effort", "--format", "rdf"});
    REQUIRE(result.IsOk());
    const auto& cmd = result.Value().command;
    CHECK(cmd.query == "{ q(func: has(name)) { name } }");
    CHECK(cmd.vars_json == R"({"$a":"1"})");
    CHECK(cmd.set_json == R"({"name":"x"})");
    CHECK(cmd.cond == "@if(eq(len(v), 0))");
    CHECK(cmd.commit_now);
    CHECK(cmd.read_only);
    CHECK(cmd.best_effort);
    CHECK(cmd.format == ResponseFormat::Rdf);
}

TEST_CASE("LoadFromCli: alter inputs", "[config][cli]") {
    auto result = ParseCli({"--schema", "name: string .", "--drop-attr", "age",
                            "--background"});
    REQUIRE(result.IsOk());
    const auto& cmd = result.Value().command;
    CHECK(cmd.schema == "name: string .");
    CHECK(cmd.drop_attr == "age");
    CHECK(cmd.run_in_background);
    CHECK_FALSE(cmd.drop_all);
}

TEST_CASE("LoadFromCli: bad response format", "[config][cli]") {
    auto result = ParseCli({"--format", "xml"});
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "Response format should be either RDF or JSON");
}

TEST_CASE("LoadFromCli: options", "[config][cli]") {
    auto result = ParseCli({"-c", "cfg.yaml", "--timeout", "5", "--json",
                            "--log-file", "out.log", "--log-level", "warn", "--verbose"});
    REQUIRE(result.IsOk());
    const auto& config = result.Value();
    REQUIRE(config.config_file.has_value());
    CHECK(*config.config_file == "cfg.yaml");
    CHECK(config.timeout_seconds == 5);
    CHECK(config.json_output);
    CHECK(*config.log_file == "out.log");
    CHECK(*config.log_level == LogLevel::Warn);
    CHECK(config.verbose);
    CHECK_FALSE(config.quiet);
}

TEST_CASE("LoadFromCli: unknown flag", "[config][cli]") {
    auto result = ParseCli({"--no-such-flag"});
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("CLI parse error") != std::string::npos);
}

// ===========================================================================
// MergeConfigs
// ===========================================================================

TEST_CASE("MergeConfigs: CLI values override YAML", "[config][merge]") {
    auto yaml = WithEndpoint("yaml:9080");
    yaml.connection.user = "yaml-user";
    yaml.connection.password = "yaml-pw";
    yaml.retry.max_retries = 1;
    yaml.timeout_seconds = 90;
    yaml.command.session_file = "/yaml/session";

    auto cli = WithEndpoint("cli:9080");
    cli.connection.user = "cli-user";
    cli.retry.max_retries = 9;
    cli.command.query = "{ q }";

    auto merged = MergeConfigs(yaml, cli);
    CHECK(merged.connection.endpoints[0].Value() == "cli:9080");
    CHECK(merged.connection.user == "cli-user");
    CHECK(merged.connection.password == "yaml-pw");
    CHECK(merged.retry.max_retries == 9);
    CHECK(merged.timeout_seconds == 90);
    CHECK(merged.command.query == "{ q }");
    CHECK(merged.command.session_file == "/yaml/session");
}

TEST_CASE("MergeConfigs: empty CLI keeps YAML", "[config][merge]") {
    auto yaml = WithEndpoint("yaml:9080");
    yaml.connection.use_https = true;
    yaml.connection.selection = SelectionPolicy::Random;
    yaml.log_level = LogLevel::Error;

    auto merged = MergeConfigs(yaml, AppConfig{});
    REQUIRE(merged.connection.endpoints.size() == 1);
    CHECK(merged.connection.use_https);
    CHECK(merged.connection.selection == SelectionPolicy::Random);
    CHECK(*merged.log_level == LogLevel::Error);
}

TEST_CASE("MergeConfigs: CLI session file wins when set", "[config][merge]") {
    AppConfig yaml;
    yaml.command.session_file = "/yaml/session";
    AppConfig cli;
    cli.command.session_file = "/cli/session";
    CHECK(MergeConfigs(yaml, cli).command.session_file == "/cli/session");
}

// ===========================================================================
// ResolvePasswordEnv
// ===========================================================================

TEST_CASE("ResolvePasswordEnv: reads the named variable", "[config][env]") {
    SetEnv("DGRAPH_CLIENT_TEST_PASSWORD", "from-env");
    auto loaded = LoadFromYaml(TestDataPath("password_env_config.yaml"));
    REQUIRE(loaded.IsOk());
    auto resolved = ResolvePasswordEnv(loaded.Value());
    REQUIRE(resolved.IsOk());
    CHECK(resolved.Value().connection.password == "from-env");
    UnsetEnv("DGRAPH_CLIENT_TEST_PASSWORD");
}

TEST_CASE("ResolvePasswordEnv: explicit password wins", "[config][env]") {
    SetEnv("DGRAPH_CLIENT_TEST_PASSWORD", "from-env");
    AppConfig config;
    config.connection.password = "explicit";
    config.connection.password_env = "DGRAPH_CLIENT_TEST_PASSWORD";
    auto resolved = ResolvePasswordEnv(config);
    REQUIRE(resolved.IsOk());
    CHECK(resolved.Value().connection.password == "explicit");
    UnsetEnv("DGRAPH_CLIENT_TEST_PASSWORD");
}

TEST_CASE("ResolvePasswordEnv: unset variable", "[config][env]") {
    UnsetEnv("DGRAPH_CLIENT_TEST_UNSET");
    AppConfig config;
    config.connection.password_env = "DGRAPH_CLIENT_TEST_UNSET";
    auto resolved = ResolvePasswordEnv(config);
    REQUIRE(resolved.IsErr());
    CHECK(resolved.Error().message ==
          "Environment variable 'DGRAPH_CLIENT_TEST_UNSET' not set (specified by password_env)");
}

// ===========================================================================
// ValidateConfig
// ===========================================================================

TEST_CASE("ValidateConfig: minimal config is valid", "[config][validate]") {
    CHECK(ValidateConfig(WithEndpoint("localhost:9080")).IsOk());
}

TEST_CASE("ValidateConfig: rejects bad combinations", "[config][validate]") {
    SECTION("no endpoint") {
        auto r = ValidateConfig(AppConfig{});
        REQUIRE(r.IsErr());
        CHECK(r.Error().message == "At least one endpoint must be configured");
    }
    SECTION("user without password") {
        auto config = WithEndpoint("localhost:9080");
        config.connection.user = "groot";
        auto r = ValidateConfig(config);
        REQUIRE(r.IsErr());
        CHECK(r.Error().message == "Missing required field: password or password_env");
    }
    SECTION("api key and bearer token") {
        auto config = WithEndpoint("localhost:9080");
        config.connection.api_key = "k";
        config.connection.bearer_token = "t";
        auto r = ValidateConfig(config);
        REQUIRE(r.IsErr());
        CHECK(r.Error().message == "apikey and bearertoken cannot both be provided");
    }
    SECTION("non-positive timeout") {
        auto config = WithEndpoint("localhost:9080");
        config.timeout_seconds = 0;
        auto r = ValidateConfig(config);
        REQUIRE(r.IsErr());
        CHECK(r.Error().message == "Timeout must be positive, got 0");
    }
    SECTION("verbose and quiet") {
        auto config = WithEndpoint("localhost:9080");
        config.verbose = true;
        config.quiet = true;
        auto r = ValidateConfig(config);
        REQUIRE(r.IsErr());
        CHECK(r.Error().message == "Cannot use both --verbose and --quiet");
    }
    SECTION("bad retry policy") {
        auto config = WithEndpoint("localhost:9080");
        config.retry.jitter = 2.0;
        auto r = ValidateConfig(config);
        REQUIRE(r.IsErr());
        CHECK(r.Error().message == "jitter must be between 0 and 1, got 2");
    }
}

TEST_CASE("ValidateConfig: user with password_env is valid", "[config][validate]") {
    auto config = WithEndpoint("localhost:9080");
    config.connection.user = "groot";
    config.connection.password_env = "SOME_VAR";
    CHECK(ValidateConfig(config).IsOk());
}
