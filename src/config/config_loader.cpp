#include <dgraph_client/config/config_loader.hpp>

#include <dgraph_client/client/connection_string.hpp>
#include <dgraph_client/core/version.hpp>
#include <dgraph_client/txn/protocol.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>

namespace dgraph_client {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", "", std::nullopt, message, std::nullopt,
                 ErrorCategory::Config};
}

Result<Endpoint, Error> ParseEndpoint(const std::string& text, const std::string& source) {
    auto endpoint = Endpoint::Create(text);
    if (endpoint.IsErr()) {
        return Result<Endpoint, Error>::Err(
            MakeConfigError("Invalid " + source + ": " + endpoint.Error()));
    }
    return Result<Endpoint, Error>::Ok(std::move(endpoint).Value());
}

Result<SelectionPolicy, Error> ParseSelection(const std::string& text) {
    if (text == "round_robin" || text == "round-robin") {
        return Result<SelectionPolicy, Error>::Ok(SelectionPolicy::RoundRobin);
    }
    if (text == "random") {
        return Result<SelectionPolicy, Error>::Ok(SelectionPolicy::Random);
    }
    return Result<SelectionPolicy, Error>::Err(MakeConfigError(
        "Invalid endpoint selection '" + text + "', expected round_robin or random"));
}

// Copy a parsed dgraph:// string into the connection block.
void ApplyConnectionString(const ConnectionString& conn, ConnectionConfig& out) {
    out.endpoints = {conn.endpoint};
    out.use_https = conn.use_https;
    out.tls_verify = conn.tls_verify;
    out.user = conn.user;
    out.password = conn.password;
    out.api_key = conn.api_key;
    out.bearer_token = conn.bearer_token;
}

Result<void, Error> ParseYamlConnection(const YAML::Node& conn, ConnectionConfig& out) {
    if (conn["connect"]) {
        auto parsed = ParseConnectionString(conn["connect"].as<std::string>());
        if (parsed.IsErr()) {
            return Result<void, Error>::Err(std::move(parsed).Error());
        }
        ApplyConnectionString(parsed.Value(), out);
    }
    if (conn["endpoints"]) {
        out.endpoints.clear();
        for (const auto& node : conn["endpoints"]) {
            auto endpoint = ParseEndpoint(node.as<std::string>(), "endpoint");
            if (endpoint.IsErr()) {
                return Result<void, Error>::Err(std::move(endpoint).Error());
            }
            out.endpoints.push_back(std::move(endpoint).Value());
        }
    }
    if (conn["https"]) {
        out.use_https = conn["https"].as<bool>();
    }
    if (conn["tls_verify"]) {
        out.tls_verify = conn["tls_verify"].as<bool>();
    }
    if (conn["user"]) {
        out.user = conn["user"].as<std::string>();
    }
    if (conn["password"]) {
        out.password = conn["password"].as<std::string>();
    }
    if (conn["password_env"]) {
        out.password_env = conn["password_env"].as<std::string>();
    }
    if (conn["namespace"]) {
        out.namespace_id = conn["namespace"].as<uint64_t>();
    }
    if (conn["api_key"]) {
        out.api_key = conn["api_key"].as<std::string>();
    }
    if (conn["bearer_token"]) {
        out.bearer_token = conn["bearer_token"].as<std::string>();
    }
    if (conn["selection"]) {
        auto selection = ParseSelection(conn["selection"].as<std::string>());
        if (selection.IsErr()) {
            return Result<void, Error>::Err(std::move(selection).Error());
        }
        out.selection = selection.Value();
    }
    return Result<void, Error>::Ok();
}

void ParseYamlRetry(const YAML::Node& retry, RetryPolicy& out) {
    if (retry["max_retries"]) {
        out.max_retries = retry["max_retries"].as<int>();
    }
    if (retry["base_delay_ms"]) {
        out.base_delay = std::chrono::milliseconds(retry["base_delay_ms"].as<long long>());
    }
    if (retry["max_delay_ms"]) {
        out.max_delay = std::chrono::milliseconds(retry["max_delay_ms"].as<long long>());
    }
    if (retry["jitter"]) {
        out.jitter = retry["jitter"].as<double>();
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    AppConfig config;
    try {
        // -- Connection --
        if (root["connection"]) {
            auto conn = ParseYamlConnection(root["connection"], config.connection);
            if (conn.IsErr()) {
                return Result<AppConfig, Error>::Err(std::move(conn).Error());
            }
        }

        // -- Retry --
        if (root["retry"]) {
            ParseYamlRetry(root["retry"], config.retry);
        }

        // -- Logging --
        if (root["logging"]) {
            const auto& logging = root["logging"];
            if (logging["file"]) {
                config.log_file = logging["file"].as<std::string>();
            }
            if (logging["level"]) {
                auto level = ParseLogLevel(logging["level"].as<std::string>());
                if (level.IsErr()) {
                    return Result<AppConfig, Error>::Err(MakeConfigError(level.Error()));
                }
                config.log_level = level.Value();
            }
        }

        // -- Options --
        if (root["json_output"]) {
            config.json_output = root["json_output"].as<bool>();
        }
        if (root["verbose"]) {
            config.verbose = root["verbose"].as<bool>();
        }
        if (root["quiet"]) {
            config.quiet = root["quiet"].as<bool>();
        }
        if (root["timeout"]) {
            config.timeout_seconds = root["timeout"].as<int>();
        }
        if (root["session_file"]) {
            config.command.session_file = root["session_file"].as<std::string>();
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Invalid value in YAML file: " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("dgraph-cli", kVersion);

    // Connection flags
    program.add_argument("--endpoint")
        .help("Dgraph alpha address host:port (repeatable)")
        .append();
    program.add_argument("--connect")
        .help("Connection string dgraph://[user:password@]host:port[?params]");
    program.add_argument("--https")
        .help("Use HTTPS")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--insecure")
        .help("Skip TLS certificate verification")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--user")
        .help("Dgraph username");
    program.add_argument("--password")
        .help("Dgraph password");
    program.add_argument("--password-env")
        .help("Environment variable containing the password");
    program.add_argument("--namespace")
        .help("Namespace to log into")
        .scan<'u', unsigned long long>();
    program.add_argument("--api-key")
        .help("API key sent as Authorization header");
    program.add_argument("--bearer-token")
        .help("Bearer token sent as Authorization header");
    program.add_argument("--random-endpoint")
        .help("Pick endpoints at random instead of round-robin")
        .default_value(false)
        .implicit_value(true);

    // Retry flags
    program.add_argument("--max-retries")
        .help("Retries after a transaction conflict")
        .scan<'i', int>();
    program.add_argument("--base-delay-ms")
        .help("Initial backoff delay in milliseconds")
        .scan<'i', int>();
    program.add_argument("--max-delay-ms")
        .help("Backoff delay cap in milliseconds")
        .scan<'i', int>();
    program.add_argument("--jitter")
        .help("Random backoff fraction between 0 and 1")
        .scan<'g', double>();

    // Command inputs
    program.add_argument("--query")
        .help("DQL query");
    program.add_argument("--vars")
        .help("Query variables as a JSON object of strings");
    program.add_argument("--set-json")
        .help("JSON object to set");
    program.add_argument("--delete-json")
        .help("JSON object to delete");
    program.add_argument("--set-nquads")
        .help("N-Quads to set");
    program.add_argument("--del-nquads")
        .help("N-Quads to delete");
    program.add_argument("--cond")
        .help("Upsert condition, e.g. @if(eq(len(v), 0))");
    program.add_argument("--commit-now")
        .help("Commit in the same round trip")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--read-only")
        .help("Read-only transaction")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--best-effort")
        .help("Best-effort read-only transaction")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--format")
        .help("Response format: json or rdf");
    program.add_argument("--schema")
        .help("Schema text for alter");
    program.add_argument("--drop-all")
        .help("Drop all data and schema")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--drop-attr")
        .help("Drop one predicate");
    program.add_argument("--background")
        .help("Run the alter operation in the background")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--session-file")
        .help("Where login stores the session tokens");

    // Options
    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--timeout")
        .help("Timeout in seconds")
        .scan<'i', int>();
    program.add_argument("--json")
        .help("JSON output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Log file path");
    program.add_argument("--log-level")
        .help("Log level: debug, info, warn or error");
    program.add_argument("-v", "--verbose")
        .help("Verbose output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-q", "--quiet")
        .help("Quiet output")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;
    auto& conn = config.connection;

    // Connection
    if (auto val = program.present("--connect")) {
        auto parsed = ParseConnectionString(*val);
        if (parsed.IsErr()) {
            return Result<AppConfig, Error>::Err(std::move(parsed).Error());
        }
        ApplyConnectionString(parsed.Value(), conn);
    }
    if (auto vals = program.present<std::vector<std::string>>("--endpoint")) {
        conn.endpoints.clear();
        for (const auto& text : *vals) {
            auto endpoint = ParseEndpoint(text, "--endpoint");
            if (endpoint.IsErr()) {
                return Result<AppConfig, Error>::Err(std::move(endpoint).Error());
            }
            conn.endpoints.push_back(std::move(endpoint).Value());
        }
    }
    if (program.get<bool>("--https")) {
        conn.use_https = true;
    }
    if (program.get<bool>("--insecure")) {
        conn.tls_verify = false;
    }
    if (auto val = program.present("--user")) {
        conn.user = *val;
    }
    if (auto val = program.present("--password")) {
        conn.password = *val;
    }
    if (auto val = program.present("--password-env")) {
        conn.password_env = *val;
    }
    if (auto val = program.present<unsigned long long>("--namespace")) {
        conn.namespace_id = *val;
    }
    if (auto val = program.present("--api-key")) {
        conn.api_key = *val;
    }
    if (auto val = program.present("--bearer-token")) {
        conn.bearer_token = *val;
    }
    if (program.get<bool>("--random-endpoint")) {
        conn.selection = SelectionPolicy::Random;
    }

    // Retry
    if (auto val = program.present<int>("--max-retries")) {
        config.retry.max_retries = *val;
    }
    if (auto val = program.present<int>("--base-delay-ms")) {
        config.retry.base_delay = std::chrono::milliseconds(*val);
    }
    if (auto val = program.present<int>("--max-delay-ms")) {
        config.retry.max_delay = std::chrono::milliseconds(*val);
    }
    if (auto val = program.present<double>("--jitter")) {
        config.retry.jitter = *val;
    }

    // Command inputs
    auto& cmd = config.command;
    if (auto val = program.present("--query")) cmd.query = *val;
    if (auto val = program.present("--vars")) cmd.vars_json = *val;
    if (auto val = program.present("--set-json")) cmd.set_json = *val;
    if (auto val = program.present("--delete-json")) cmd.delete_json = *val;
    if (auto val = program.present("--set-nquads")) cmd.set_nquads = *val;
    if (auto val = program.present("--del-nquads")) cmd.del_nquads = *val;
    if (auto val = program.present("--cond")) cmd.cond = *val;
    cmd.commit_now = program.get<bool>("--commit-now");
    cmd.read_only = program.get<bool>("--read-only");
    cmd.best_effort = program.get<bool>("--best-effort");
    if (auto val = program.present("--format")) {
        auto format = ParseResponseFormat(*val);
        if (format.IsErr()) {
            return Result<AppConfig, Error>::Err(MakeConfigError(format.Error().message));
        }
        cmd.format = format.Value();
    }
    if (auto val = program.present("--schema")) cmd.schema = *val;
    cmd.drop_all = program.get<bool>("--drop-all");
    if (auto val = program.present("--drop-attr")) cmd.drop_attr = *val;
    cmd.run_in_background = program.get<bool>("--background");
    if (auto val = program.present("--session-file")) cmd.session_file = *val;

    // Options
    if (auto val = program.present("--config")) {
        config.config_file = *val;
    }
    if (auto val = program.present<int>("--timeout")) {
        config.timeout_seconds = *val;
    }
    if (program.get<bool>("--json")) {
        config.json_output = true;
    }
    if (auto val = program.present("--log-file")) {
        config.log_file = *val;
    }
    if (auto val = program.present("--log-level")) {
        auto level = ParseLogLevel(*val);
        if (level.IsErr()) {
            return Result<AppConfig, Error>::Err(MakeConfigError(level.Error()));
        }
        config.log_level = level.Value();
    }
    if (program.get<bool>("--verbose")) {
        config.verbose = true;
    }
    if (program.get<bool>("--quiet")) {
        config.quiet = true;
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides) {
    AppConfig merged = yaml_base;
    const AppConfig defaults;

    // Connection overrides
    const auto& cli_conn = cli_overrides.connection;
    if (!cli_conn.endpoints.empty()) {
        merged.connection.endpoints = cli_conn.endpoints;
    }
    if (cli_conn.use_https) {
        merged.connection.use_https = true;
    }
    if (!cli_conn.tls_verify) {
        merged.connection.tls_verify = false;
    }
    if (!cli_conn.user.empty()) {
        merged.connection.user = cli_conn.user;
    }
    if (!cli_conn.password.empty()) {
        merged.connection.password = cli_conn.password;
    }
    if (cli_conn.password_env.has_value()) {
        merged.connection.password_env = cli_conn.password_env;
    }
    if (cli_conn.namespace_id != 0) {
        merged.connection.namespace_id = cli_conn.namespace_id;
    }
    if (!cli_conn.api_key.empty()) {
        merged.connection.api_key = cli_conn.api_key;
    }
    if (!cli_conn.bearer_token.empty()) {
        merged.connection.bearer_token = cli_conn.bearer_token;
    }
    if (cli_conn.selection != defaults.connection.selection) {
        merged.connection.selection = cli_conn.selection;
    }

    // Retry overrides
    if (cli_overrides.retry.max_retries != defaults.retry.max_retries) {
        merged.retry.max_retries = cli_overrides.retry.max_retries;
    }
    if (cli_overrides.retry.base_delay != defaults.retry.base_delay) {
        merged.retry.base_delay = cli_overrides.retry.base_delay;
    }
    if (cli_overrides.retry.max_delay != defaults.retry.max_delay) {
        merged.retry.max_delay = cli_overrides.retry.max_delay;
    }
    if (cli_overrides.retry.jitter != defaults.retry.jitter) {
        merged.retry.jitter = cli_overrides.retry.jitter;
    }

    // Command inputs only come from the CLI, except the session file.
    auto session_file = merged.command.session_file;
    merged.command = cli_overrides.command;
    if (cli_overrides.command.session_file == defaults.command.session_file) {
        merged.command.session_file = session_file;
    }

    // Options
    if (cli_overrides.config_file.has_value()) {
        merged.config_file = cli_overrides.config_file;
    }
    if (cli_overrides.json_output) {
        merged.json_output = true;
    }
    if (cli_overrides.verbose) {
        merged.verbose = true;
    }
    if (cli_overrides.quiet) {
        merged.quiet = true;
    }
    if (cli_overrides.timeout_seconds != defaults.timeout_seconds) {
        merged.timeout_seconds = cli_overrides.timeout_seconds;
    }
    if (cli_overrides.log_file.has_value()) {
        merged.log_file = cli_overrides.log_file;
    }
    if (cli_overrides.log_level.has_value()) {
        merged.log_level = cli_overrides.log_level;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ResolvePasswordEnv
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ResolvePasswordEnv(AppConfig config) {
    if (config.connection.password.empty() &&
        config.connection.password_env.has_value()) {
        const auto& env_var = *config.connection.password_env;
        const char* env_val = std::getenv(env_var.c_str());
        if (env_val == nullptr) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("Environment variable '" + env_var +
                                "' not set (specified by password_env)"));
        }
        config.connection.password = env_val;
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    const auto& conn = config.connection;
    if (conn.endpoints.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("At least one endpoint must be configured"));
    }
    if (!conn.user.empty() && conn.password.empty() && !conn.password_env.has_value()) {
        return Result<void, Error>::Err(
            MakeConfigError("Missing required field: password or password_env"));
    }
    if (!conn.api_key.empty() && !conn.bearer_token.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("apikey and bearertoken cannot both be provided"));
    }
    if (config.timeout_seconds <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Timeout must be positive, got " +
                            std::to_string(config.timeout_seconds)));
    }
    if (config.verbose && config.quiet) {
        return Result<void, Error>::Err(
            MakeConfigError("Cannot use both --verbose and --quiet"));
    }
    auto retry = ValidateRetryPolicy(config.retry);
    if (retry.IsErr()) {
        return Result<void, Error>::Err(MakeConfigError(retry.Error().message));
    }
    return Result<void, Error>::Ok();
}

} // namespace dgraph_client
