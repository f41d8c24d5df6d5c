// ─────────────────────────────────────────────────────────────────────────────
// towerlink - reverse tunnel agent
// ─────────────────────────────────────────────────────────────────────────────
// Dials out to the relay with the credentials written by device registration
// and serves the relay's streams against the local control daemon.
//
// Usage:
//   towerlink --config ~/.config/tower/tunnel.json
//   towerlink -c tunnel.json --local-port 4100 --project ~/src/app:app
//   towerlink -c tunnel.json --server-host 127.0.0.1 --tunnel-port 7000 --plain-tcp
//
// Runs until SIGINT/SIGTERM, or until the relay rejects the API key.

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include "towerlink/log/logger.hpp"
#include "towerlink/log/spdlog_logger.hpp"
#include "towerlink/tunnel/metadata.hpp"
#include "towerlink/tunnel/tunnel_client.hpp"
#include "towerlink/tunnel/tunnel_config.hpp"
#include "towerlink/tunnel/tunnel_status.hpp"

#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>

#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

using namespace towerlink;

// ═══════════════════════════════════════════════════════════════════════════
// ANSI Color Codes
// ═══════════════════════════════════════════════════════════════════════════

namespace color {
    const char* reset  = "\033[0m";
    const char* bold   = "\033[1m";
    const char* dim    = "\033[2m";
    const char* red    = "\033[31m";
    const char* green  = "\033[32m";
    const char* yellow = "\033[33m";

    bool enabled = true;

    std::string c(const char* code) {
        return enabled ? code : "";
    }
}

void print_error(const std::string& msg) {
    std::cerr << color::c(color::red) << "Error: " << color::c(color::reset) << msg << "\n";
}

// ═══════════════════════════════════════════════════════════════════════════
// Workspace Registry
// ═══════════════════════════════════════════════════════════════════════════
// Projects announced through the tunnel. Owned by main and handed to the
// client as snapshots; there is no process-wide registry.

struct WorkspaceRegistry {
    std::vector<ProjectInfo> projects;
    std::vector<TerminalInfo> terminals;

    /// "path" or "path:name"; the name defaults to the last path component.
    void add_project_spec(const std::string& spec) {
        std::string path = spec;
        std::string name;
        if (const auto colon = spec.rfind(':'); colon != std::string::npos && colon > 0) {
            path = spec.substr(0, colon);
            name = spec.substr(colon + 1);
        }
        if (name.empty()) {
            name = std::filesystem::path(path).lexically_normal().filename().string();
            if (name.empty()) {
                name = std::filesystem::path(path).lexically_normal().parent_path().filename().string();
            }
        }
        projects.push_back(ProjectInfo{std::move(path), std::move(name)});
    }

    [[nodiscard]] TowerMetadata snapshot() const {
        return TowerMetadata{projects, terminals};
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Helpers
// ═══════════════════════════════════════════════════════════════════════════

std::string get_env(const char* name, const std::string& fallback = "") {
    const char* value = std::getenv(name);
    return value ? value : fallback;
}

const char* state_color(TunnelState state) {
    switch (state) {
        case TunnelState::Connected:    return color::green;
        case TunnelState::Connecting:   return color::yellow;
        case TunnelState::AuthFailed:   return color::red;
        case TunnelState::Disconnected: return color::dim;
    }
    return color::reset;
}

void install_logger(const std::string& level_name, const std::string& log_file) {
    const LogLevel level = parse_log_level(level_name);
    if (log_file.empty()) {
        set_logger(make_spdlog_console_logger(level));
    } else {
        set_logger(make_spdlog_console_file_logger(log_file, level));
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("towerlink", "Reverse tunnel agent for the tower control daemon");

    options.add_options()
        ("c,config", "Credential file (or TOWERLINK_CONFIG)", cxxopts::value<std::string>())
        ("server-host", "Override the relay host", cxxopts::value<std::string>())
        ("tunnel-port", "Override the relay port", cxxopts::value<std::uint16_t>())
        ("local-port", "Port of the local control daemon", cxxopts::value<std::uint16_t>())
        ("plain-tcp", "Connect to the relay without TLS")
        ("p,project", "Announce a project as path[:name] (repeatable)", cxxopts::value<std::vector<std::string>>())
        ("log-level", "trace, debug, info, warn, error or off", cxxopts::value<std::string>()->default_value("info"))
        ("log-file", "Also write logs to this file", cxxopts::value<std::string>())
        ("no-color", "Disable colored output")
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            return 0;
        }

        color::enabled = !result.count("no-color");
        install_logger(
            result["log-level"].as<std::string>(),
            result.count("log-file") ? result["log-file"].as<std::string>() : std::string{}
        );

        const std::string config_path = result.count("config")
            ? result["config"].as<std::string>()
            : get_env("TOWERLINK_CONFIG");
        if (config_path.empty()) {
            print_error("Credential file required. Use --config or set TOWERLINK_CONFIG");
            return 1;
        }

        auto credentials = load_credentials(config_path);
        if (!credentials) {
            print_error(credentials.error().message);
            return 1;
        }

        TunnelClientConfig config = credentials->config;
        if (result.count("server-host")) {
            config.server_host = result["server-host"].as<std::string>();
        }
        if (result.count("tunnel-port")) {
            config.tunnel_port = result["tunnel-port"].as<std::uint16_t>();
        }
        if (result.count("local-port")) {
            config.with_local_port(result["local-port"].as<std::uint16_t>());
        }
        if (result.count("plain-tcp")) {
            config.with_plain_tcp();
        }
        if (auto problem = config.validate()) {
            print_error(*problem);
            return 1;
        }

        WorkspaceRegistry registry;
        if (result.count("project")) {
            for (const auto& spec : result["project"].as<std::vector<std::string>>()) {
                registry.add_project_spec(spec);
            }
        }

        asio::io_context io;
        TunnelClient client(io.get_executor(), config);
        int exit_code = 0;

        client.on_state_change([&](TunnelState state, TunnelState previous) {
            std::cout << color::c(color::dim) << "state: " << color::c(color::reset)
                      << color::c(state_color(state)) << to_string(state) << color::c(color::reset)
                      << color::c(color::dim) << " (was " << to_string(previous) << ")"
                      << color::c(color::reset) << "\n";
            if (state == TunnelState::AuthFailed) {
                print_error("The relay rejected this device's API key. Re-register the tower to continue.");
                exit_code = 2;
                io.stop();
            }
        });

        client.send_metadata(registry.snapshot());

        asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&](const asio::error_code& ec, int signal_number) {
            if (ec) {
                return;
            }
            std::cout << color::c(color::dim) << "received signal " << signal_number
                      << ", shutting down" << color::c(color::reset) << "\n";
            client.disconnect();
            io.stop();
        });

        if (!credentials->server_url.empty() && !credentials->tower_name.empty()) {
            std::cout << color::c(color::bold) << "Public URL: " << color::c(color::reset)
                      << public_access_url(credentials->server_url, credentials->tower_name) << "\n";
        }

        client.connect();
        io.run();

        const auto status = make_status(client, credentials->server_url, credentials->tower_name);
        std::cout << status.to_json().dump(2) << "\n";
        return exit_code;

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    } catch (const std::exception& e) {
        print_error(e.what());
        return 1;
    }
}
