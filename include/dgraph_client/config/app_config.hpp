#pragma once

#include <dgraph_client/client/client.hpp>
#include <dgraph_client/core/log.hpp>
#include <dgraph_client/core/types.hpp>
#include <dgraph_client/retry/retry.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dgraph_client {

struct ConnectionConfig {
    std::vector<Endpoint> endpoints;
    bool use_https = false;
    bool tls_verify = true;
    std::string user;
    std::string password;
    std::optional<std::string> password_env; // env var name to read password from
    uint64_t namespace_id = 0;
    std::string api_key;
    std::string bearer_token;
    SelectionPolicy selection = SelectionPolicy::RoundRobin;
};

// Inputs for the CLI subcommands (query, mutate, upsert, alter, version,
// login). Unused fields stay empty.
struct CommandConfig {
    std::string query;
    std::string vars_json;
    std::string set_json;
    std::string delete_json;
    std::string set_nquads;
    std::string del_nquads;
    std::string cond;
    bool commit_now = false;
    bool read_only = false;
    bool best_effort = false;
    ResponseFormat format = ResponseFormat::Json;
    std::string schema;
    bool drop_all = false;
    std::string drop_attr;
    bool run_in_background = false;
    std::string session_file = ".dgraph.session";
};

struct AppConfig {
    ConnectionConfig connection;
    RetryPolicy retry;
    CommandConfig command;
    std::optional<std::string> config_file;
    std::optional<std::string> log_file;
    std::optional<LogLevel> log_level;
    bool json_output = false;
    bool verbose = false;
    bool quiet = false;
    int timeout_seconds = 30;
};

} // namespace dgraph_client
