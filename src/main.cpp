#include <dgraph_client/client/client.hpp>
#include <dgraph_client/config/config_loader.hpp>
#include <dgraph_client/core/ansi.hpp>
#include <dgraph_client/core/log.hpp>
#include <dgraph_client/core/terminal.hpp>
#include <dgraph_client/core/version.hpp>
#include <dgraph_client/retry/retry.hpp>
#include <dgraph_client/transport/http_stub.hpp>

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

using namespace dgraph_client;

constexpr int kExitSuccess = 0;
constexpr int kExitUsage = 8;

enum class Subcommand {
    Query,
    Mutate,
    Upsert,
    Alter,
    Version,
    Login,
};

std::optional<Subcommand> ParseSubcommand(std::string_view arg) {
    if (arg == "query") return Subcommand::Query;
    if (arg == "mutate") return Subcommand::Mutate;
    if (arg == "upsert") return Subcommand::Upsert;
    if (arg == "alter") return Subcommand::Alter;
    if (arg == "version") return Subcommand::Version;
    if (arg == "login") return Subcommand::Login;
    return std::nullopt;
}

void PrintUsage(std::ostream& out, bool use_color) {
    const char* bold = use_color ? ansi::kBold : "";
    const char* reset = use_color ? ansi::kReset : "";
    out << bold << "dgraph-cli" << reset << " " << kVersion << "\n\n"
        << "Usage: dgraph-cli <command> [flags]\n\n"
        << bold << "Commands:" << reset << "\n"
        << "  query    Run a read-only query (--query, --vars, --format, --best-effort)\n"
        << "  mutate   Run a mutation and commit, retrying on conflict\n"
        << "  upsert   Run a query plus conditional mutation, retrying on conflict\n"
        << "  alter    Change the schema (--schema) or drop data (--drop-all, --drop-attr)\n"
        << "  version  Print the server version\n"
        << "  login    Log in and store the session in --session-file\n\n"
        << bold << "Connection:" << reset << "\n"
        << "  --endpoint host:port   (repeatable) or --connect dgraph://...\n"
        << "  --user, --password, --password-env, --namespace\n"
        << "  --https, --insecure, --api-key, --bearer-token\n\n"
        << "Run 'dgraph-cli <command> --help' for all flags.\n";
}

bool HasFlag(int argc, const char* const* argv, std::string_view flag) {
    for (int i = 1; i < argc; ++i) {
        if (std::string_view{argv[i]} == flag) return true;
    }
    return false;
}

// Build argv without the subcommand token and the color flags, so
// LoadFromCli sees only its own flags.
std::vector<const char*> StripArgs(int argc, const char* const* argv) {
    std::vector<const char*> stripped;
    stripped.push_back(argv[0]);
    for (int i = 2; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "--color" || arg == "--no-color") continue;
        stripped.push_back(argv[i]);
    }
    return stripped;
}

void PrintError(const Error& error, bool json_output) {
    if (json_output) {
        std::cerr << error.ToJson() << "\n";
    } else {
        std::cerr << "Error: " << error.ToString() << "\n";
    }
}

void PrintSuccess(const std::string& message, bool json_output, bool quiet) {
    if (json_output || quiet) return;
    const bool color = ResolveUseColor(false, NoColorEnvSet(), IsStdoutTty());
    if (color) {
        std::cout << ansi::kGreen << message << ansi::kReset << "\n";
    } else {
        std::cout << message << "\n";
    }
}

void PrintResponse(const Response& response, ResponseFormat format, bool json_output) {
    if (json_output) {
        nlohmann::json out;
        if (format == ResponseFormat::Rdf) {
            out["rdf"] = response.rdf;
        } else {
            out["data"] = nlohmann::json::parse(response.json, nullptr, false);
        }
        if (!response.uids.empty()) {
            out["uids"] = response.uids;
        }
        out["start_ts"] = response.txn.start_ts;
        out["latency_ns"] = response.latency.total_ns;
        std::cout << out.dump() << "\n";
        return;
    }
    if (format == ResponseFormat::Rdf) {
        std::cout << response.rdf << "\n";
        return;
    }
    auto data = nlohmann::json::parse(response.json, nullptr, false);
    std::cout << (data.is_discarded() ? response.json : data.dump(2)) << "\n";
}

Error MakeCliError(const std::string& message) {
    return Error{"Cli", "", std::nullopt, message, std::nullopt, ErrorCategory::Config};
}

// Parse an optional JSON document given on the command line.
Result<std::optional<nlohmann::json>, Error> ParseJsonFlag(const std::string& text,
                                                           const std::string& flag) {
    using R = Result<std::optional<nlohmann::json>, Error>;
    if (text.empty()) {
        return R::Ok(std::nullopt);
    }
    auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        return R::Err(MakeCliError("Invalid JSON in " + flag));
    }
    return R::Ok(std::optional<nlohmann::json>(std::move(j)));
}

Result<Mutation, Error> MutationFromFlags(const CommandConfig& cmd) {
    auto set_obj = ParseJsonFlag(cmd.set_json, "--set-json");
    if (set_obj.IsErr()) {
        return Result<Mutation, Error>::Err(std::move(set_obj).Error());
    }
    auto del_obj = ParseJsonFlag(cmd.delete_json, "--delete-json");
    if (del_obj.IsErr()) {
        return Result<Mutation, Error>::Err(std::move(del_obj).Error());
    }
    MutationInput input;
    input.set_obj = std::move(set_obj).Value();
    input.del_obj = std::move(del_obj).Value();
    input.set_nquads = cmd.set_nquads;
    input.del_nquads = cmd.del_nquads;
    input.cond = cmd.cond;
    input.commit_now = cmd.commit_now;
    return CreateMutation(input);
}

Result<Variables, Error> VarsFromFlags(const CommandConfig& cmd) {
    auto vars = ParseJsonFlag(cmd.vars_json, "--vars");
    if (vars.IsErr()) {
        return Result<Variables, Error>::Err(std::move(vars).Error());
    }
    if (!vars.Value().has_value()) {
        return Result<Variables, Error>::Ok(Variables{});
    }
    return VariablesFromJson(*vars.Value());
}

// ---------------------------------------------------------------------------
// Client construction
// ---------------------------------------------------------------------------
Result<std::unique_ptr<Client>, Error> BuildClient(const AppConfig& config) {
    HttpStubOptions stub_options;
    stub_options.read_timeout = std::chrono::seconds(config.timeout_seconds);
    stub_options.use_https = config.connection.use_https;
    stub_options.tls_verify = config.connection.tls_verify;
    stub_options.api_key = config.connection.api_key;
    stub_options.bearer_token = config.connection.bearer_token;

    std::vector<std::unique_ptr<IDgraphStub>> stubs;
    for (const auto& endpoint : config.connection.endpoints) {
        stubs.push_back(std::make_unique<HttpDgraphStub>(endpoint, stub_options));
    }

    ClientOptions options;
    options.selection = config.connection.selection;
    options.timeout = std::chrono::seconds(config.timeout_seconds);
    return Client::Create(std::move(stubs), std::move(options));
}

// Log in with configured credentials, or reuse a saved session.
Result<void, Error> EstablishSession(Client& client, const AppConfig& config) {
    const auto& conn = config.connection;
    if (!conn.user.empty()) {
        return client.LoginIntoNamespace(conn.user, conn.password, conn.namespace_id);
    }
    std::ifstream probe(config.command.session_file);
    if (!probe) {
        return Result<void, Error>::Ok();
    }
    probe.close();
    auto loaded = client.Credentials().LoadFromFile(config.command.session_file);
    if (loaded.IsErr()) {
        LogWarn("cli", "Ignoring unreadable session file: " + loaded.Error().ToString());
    } else {
        LogDebug("cli", "Using session from " + config.command.session_file);
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// Subcommands
// ---------------------------------------------------------------------------
int RunQuery(Client& client, const AppConfig& config) {
    const auto& cmd = config.command;
    if (cmd.query.empty()) {
        PrintError(MakeCliError("query requires --query"), config.json_output);
        return kExitUsage;
    }
    auto vars = VarsFromFlags(cmd);
    if (vars.IsErr()) {
        PrintError(vars.Error(), config.json_output);
        return vars.Error().ExitCode();
    }
    TxnOptions options;
    options.read_only = true;
    options.best_effort = cmd.best_effort;
    auto txn = client.NewTxn(options);
    if (txn.IsErr()) {
        PrintError(txn.Error(), config.json_output);
        return txn.Error().ExitCode();
    }
    auto response = txn.Value().Query(cmd.query, vars.Value(), cmd.format);
    if (response.IsErr()) {
        PrintError(response.Error(), config.json_output);
        return response.Error().ExitCode();
    }
    PrintResponse(response.Value(), cmd.format, config.json_output);
    return kExitSuccess;
}

int RunMutate(Client& client, const AppConfig& config, bool upsert) {
    const auto& cmd = config.command;
    if (upsert && cmd.query.empty()) {
        PrintError(MakeCliError("upsert requires --query"), config.json_output);
        return kExitUsage;
    }
    auto mutation = MutationFromFlags(cmd);
    if (mutation.IsErr()) {
        PrintError(mutation.Error(), config.json_output);
        return mutation.Error().ExitCode();
    }
    auto vars = VarsFromFlags(cmd);
    if (vars.IsErr()) {
        PrintError(vars.Error(), config.json_output);
        return vars.Error().ExitCode();
    }

    auto result = RunTransaction(
        client,
        [&](Transaction& txn) -> Result<Response, Error> {
            auto response = upsert
                ? txn.Upsert(cmd.query, {mutation.Value()}, cmd.commit_now, vars.Value())
                : txn.Mutate(mutation.Value());
            if (response.IsErr() || txn.IsFinished()) {
                return response;
            }
            auto committed = txn.Commit();
            if (committed.IsErr()) {
                return Result<Response, Error>::Err(std::move(committed).Error());
            }
            return response;
        },
        config.retry);

    if (result.IsErr()) {
        PrintError(result.Error(), config.json_output);
        return result.Error().ExitCode();
    }
    PrintResponse(result.Value(), ResponseFormat::Json, config.json_output);
    PrintSuccess("Committed", config.json_output, config.quiet);
    return kExitSuccess;
}

int RunAlter(Client& client, const AppConfig& config) {
    const auto& cmd = config.command;
    Operation op;
    op.schema = cmd.schema;
    op.drop_all = cmd.drop_all;
    op.drop_attr = cmd.drop_attr;
    op.run_in_background = cmd.run_in_background;
    if (op.schema.empty() && !op.drop_all && op.drop_attr.empty()) {
        PrintError(MakeCliError("alter requires --schema, --drop-all or --drop-attr"),
                   config.json_output);
        return kExitUsage;
    }
    auto result = client.Alter(op);
    if (result.IsErr()) {
        PrintError(result.Error(), config.json_output);
        return result.Error().ExitCode();
    }
    if (config.json_output) {
        std::cout << result.Value().data << "\n";
    }
    PrintSuccess("Alter succeeded", config.json_output, config.quiet);
    return kExitSuccess;
}

int RunVersion(Client& client, const AppConfig& config) {
    auto result = client.CheckVersion();
    if (result.IsErr()) {
        PrintError(result.Error(), config.json_output);
        return result.Error().ExitCode();
    }
    if (config.json_output) {
        nlohmann::json out;
        out["server"] = result.Value();
        out["client"] = kVersion;
        std::cout << out.dump() << "\n";
    } else {
        std::cout << result.Value() << "\n";
    }
    return kExitSuccess;
}

int RunLogin(Client& client, const AppConfig& config) {
    if (config.connection.user.empty()) {
        PrintError(MakeCliError("login requires --user"), config.json_output);
        return kExitUsage;
    }
    // EstablishSession already logged in with the configured user.
    auto saved = client.Credentials().SaveToFile(config.command.session_file);
    if (saved.IsErr()) {
        PrintError(saved.Error(), config.json_output);
        return saved.Error().ExitCode();
    }
    if (config.json_output) {
        nlohmann::json out;
        out["logged_in"] = true;
        out["session_file"] = config.command.session_file;
        std::cout << out.dump() << "\n";
    }
    PrintSuccess("Logged in as " + config.connection.user + ", session saved to " +
                     config.command.session_file,
                 config.json_output, config.quiet);
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace dgraph_client;

    const bool help_color = ResolveUseColor(HasFlag(argc, argv, "--color"),
                                            HasFlag(argc, argv, "--no-color") ||
                                                NoColorEnvSet(),
                                            IsStdoutTty());
    if (argc == 1) {
        PrintUsage(std::cout, help_color);
        return kExitSuccess;
    }
    auto first = std::string_view{argv[1]};
    if (first == "--version") {
        std::cout << "dgraph-cli " << kVersion << "\n";
        return kExitSuccess;
    }
    if (first == "--help" || first == "-h") {
        PrintUsage(std::cout, help_color);
        return kExitSuccess;
    }

    auto subcommand = ParseSubcommand(first);
    if (!subcommand.has_value()) {
        std::cerr << "Unknown command: " << first << "\n\n";
        PrintUsage(std::cerr, false);
        return kExitUsage;
    }

    // Step 1: Parse CLI flags (argparse handles --help itself).
    auto stripped = StripArgs(argc, argv);
    auto cli_result = LoadFromCli(static_cast<int>(stripped.size()), stripped.data());
    if (cli_result.IsErr()) {
        PrintError(cli_result.Error(), false);
        return cli_result.Error().ExitCode();
    }
    auto config = std::move(cli_result).Value();

    // Step 2: Merge the YAML config underneath the CLI flags.
    if (config.config_file.has_value()) {
        auto yaml_result = LoadFromYaml(*config.config_file);
        if (yaml_result.IsErr()) {
            PrintError(yaml_result.Error(), config.json_output);
            return yaml_result.Error().ExitCode();
        }
        config = MergeConfigs(std::move(yaml_result).Value(), config);
    }

    // Step 3: Resolve password_env and validate.
    auto resolved = ResolvePasswordEnv(config);
    if (resolved.IsErr()) {
        PrintError(resolved.Error(), config.json_output);
        return resolved.Error().ExitCode();
    }
    config = std::move(resolved).Value();
    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        PrintError(valid.Error(), config.json_output);
        return valid.Error().ExitCode();
    }

    // Step 4: Logging.
    auto log_level = LogLevel::Warn;
    if (config.verbose) log_level = LogLevel::Info;
    if (config.quiet) log_level = LogLevel::Error;
    if (config.log_level.has_value()) log_level = *config.log_level;
    if (config.log_file.has_value()) {
        auto sink = std::make_unique<FileSink>(*config.log_file);
        if (!sink->IsOpen()) {
            PrintError(MakeCliError("Cannot open log file " + *config.log_file),
                       config.json_output);
            return kExitUsage;
        }
        InitGlobalLogger(std::move(sink), log_level);
    } else if (config.json_output) {
        InitGlobalLogger(std::make_unique<JsonSink>(std::cerr), log_level);
    } else {
        const bool use_color = ResolveUseColor(HasFlag(argc, argv, "--color"),
                                               HasFlag(argc, argv, "--no-color") ||
                                                   NoColorEnvSet(),
                                               IsStderrTty());
        InitGlobalLogger(std::make_unique<ConsoleSink>(use_color), log_level);
    }

    // Step 5: Client and session.
    auto client_result = BuildClient(config);
    if (client_result.IsErr()) {
        PrintError(client_result.Error(), config.json_output);
        return client_result.Error().ExitCode();
    }
    auto client = std::move(client_result).Value();
    auto session = EstablishSession(*client, config);
    if (session.IsErr()) {
        PrintError(session.Error(), config.json_output);
        return session.Error().ExitCode();
    }

    // Step 6: Dispatch.
    int rc = kExitSuccess;
    switch (*subcommand) {
        case Subcommand::Query:   rc = RunQuery(*client, config); break;
        case Subcommand::Mutate:  rc = RunMutate(*client, config, false); break;
        case Subcommand::Upsert:  rc = RunMutate(*client, config, true); break;
        case Subcommand::Alter:   rc = RunAlter(*client, config); break;
        case Subcommand::Version: rc = RunVersion(*client, config); break;
        case Subcommand::Login:   rc = RunLogin(*client, config); break;
    }
    client->Close();
    return rc;
}
