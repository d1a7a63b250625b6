// ============================================================
// server/main.cpp -- parxfer object endpoint server entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "object_server.hpp"
#include <iostream>
#include <fstream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <csignal>

static ObjectServer* g_server = nullptr;

static void sig_handler(int /*sig*/) {
    if (g_server) g_server->request_stop();
}

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " <store_dir> <ip> <port> [options]\n"
        << "\n"
        << "  store_dir          directory holding committed objects\n"
        << "  ip                 IP address to listen on (use 0.0.0.0 for all interfaces)\n"
        << "  port               TCP port of endpoint 1; endpoint N listens on port+N-1\n"
        << "\nOptions:\n"
        << "  --endpoints N      number of endpoints to host (default: 1)\n"
        << "  --auth-file FILE   accepted session strings, one per line\n"
        << "                     (default: any non-empty session string)\n"
        << "  --flood-every N    answer every Nth chunk/part request with FLOOD_WAIT\n"
        << "  --flood-wait S     suggested wait carried by injected FLOOD_WAIT (default: 1)\n"
        << "  --advertise HOST   host name printed in the endpoint list (default: 127.0.0.1)\n"
        << "  --log-file FILE    also append log lines to FILE\n"
        << "  --verbose          enable debug logging\n"
        << "\nExample:\n"
        << "  " << prog << " /var/lib/parxfer 0.0.0.0 7700 --endpoints 3\n";
}

static size_t load_auth_file(const std::string& path, AuthTable& auth) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("Cannot open auth file: " + path);
    size_t n = 0;
    std::string line;
    while (std::getline(in, line)) {
        while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) line.pop_back();
        if (line.empty() || line[0] == '#') continue;
        auth.allow_session(line);
        ++n;
    }
    return n;
}

int main(int argc, char* argv[]) {
    platform::NetworkScope network;

    if (argc < 4) {
        print_usage(argv[0]);
        return 1;
    }

    ServerConfig cfg;
    cfg.store_dir  = argv[1];
    cfg.listen_ip  = argv[2];
    int port_int   = std::atoi(argv[3]);
    std::string auth_file;
    std::string log_file;
    u64 flood_every = 0, flood_wait = 1;

    for (int i = 4; i < argc; ++i) {
        if (std::strcmp(argv[i], "--endpoints") == 0 && i + 1 < argc) {
            cfg.endpoints = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--auth-file") == 0 && i + 1 < argc) {
            auth_file = argv[++i];
        } else if (std::strcmp(argv[i], "--flood-every") == 0 && i + 1 < argc) {
            if (!utils::parse_u64(argv[++i], flood_every)) {
                std::cerr << "ERROR: --flood-every needs a number\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "--flood-wait") == 0 && i + 1 < argc) {
            if (!utils::parse_u64(argv[++i], flood_wait)) {
                std::cerr << "ERROR: --flood-wait needs a number of seconds\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "--advertise") == 0 && i + 1 < argc) {
            cfg.advertise_host = argv[++i];
        } else if (std::strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
            log_file = argv[++i];
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            Logger::get().set_level(LogLevel::DEBUG);
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (!utils::validate_path(cfg.store_dir)) {
        std::cerr << "ERROR: Invalid store_dir\n";
        return 1;
    }
    if (cfg.endpoints < 1 || cfg.endpoints > 64) {
        std::cerr << "ERROR: --endpoints must be 1-64\n";
        return 1;
    }
    if (!utils::validate_port(port_int) || port_int + cfg.endpoints - 1 > 65535) {
        std::cerr << "ERROR: Invalid port: " << port_int << "\n";
        return 1;
    }
    if (flood_every > 0xFFFFFFFFull || flood_wait > 3600) {
        std::cerr << "ERROR: --flood-every or --flood-wait out of range\n";
        return 1;
    }

    cfg.base_port    = (u16)port_int;
    cfg.flood_every  = (u32)flood_every;
    cfg.flood_wait_s = (u32)flood_wait;
    if (!log_file.empty()) Logger::get().set_log_file(log_file);

    try {
        ObjectServer server(std::move(cfg));
        if (!auth_file.empty()) {
            size_t n = load_auth_file(auth_file, server.auth());
            LOG_INFO("Accepting " + std::to_string(n) + " session strings from " + auth_file);
        }
        g_server = &server;

        std::signal(SIGINT,  sig_handler);
        std::signal(SIGTERM, sig_handler);
        platform::ignore_sigpipe();

        int rc = server.run();
        g_server = nullptr;
        return rc;
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }
}
