// ============================================================
// client/main.cpp -- parxfer command-line client
// ============================================================

#include "../common/platform.hpp"
#include "../common/config.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "credential_store.hpp"
#include "tcp_remote.hpp"
#include "transfer_service.hpp"
#include <atomic>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <cstdlib>
#include <cstring>
#include <csignal>

static std::atomic<bool> g_interrupted{false};

static void sig_handler(int /*sig*/) {
    g_interrupted.store(true);
}

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " <command> <args> [options]\n"
        << "\nCommands:\n"
        << "  download <endpoint_id> <location_id> <size> <out_path>\n"
        << "                      fetch a stored object into out_path\n"
        << "  upload <in_path>    store a file; prints its location\n"
        << "\nOptions:\n"
        << "  --endpoint ID=HOST:PORT  remote endpoint (repeatable; the first is home)\n"
        << "  --owner N           owner id (default: 1)\n"
        << "  --session S         stored session string (default: $SESSION_STRING)\n"
        << "  --api-id N          API id (default: $API_ID)\n"
        << "  --api-hash H        API hash (default: $API_HASH)\n"
        << "  --creds FILE        credentials file: \"owner api_id api_hash session\" per line\n"
        << "  --name NAME         stored name for upload (default: file name)\n"
        << "  --conns N           parallel connections (default: by file size, max 8)\n"
        << "  --fixed-conns       always use the full connection count\n"
        << "  --premium           privileged tier (shorter cooldown)\n"
        << "  --log-file FILE     also append log lines to FILE\n"
        << "  --verbose           enable debug logging\n"
        << "\nExamples:\n"
        << "  " << prog << " upload ./video.mp4 --endpoint 1=127.0.0.1:7700 --session s1 --api-id 1 --api-hash h\n"
        << "  " << prog << " download 1 4242 1048576 ./out.bin --endpoint 1=127.0.0.1:7700 "
        << "--endpoint 2=127.0.0.1:7701 --creds creds.txt --owner 7\n";
}

static bool parse_u64_arg(const char* s, u64& out, const char* what) {
    if (!utils::parse_u64(s, out)) {
        std::cerr << "ERROR: Invalid " << what << ": " << s << "\n";
        return false;
    }
    return true;
}

int main(int argc, char* argv[]) {
    platform::NetworkScope network;
    platform::ignore_sigpipe();

    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    TransferRequest request;
    int first_opt = 0;

    if (command == "download") {
        if (argc < 6) {
            print_usage(argv[0]);
            return 1;
        }
        u64 endpoint_id = 0, location_id = 0, size = 0;
        if (!parse_u64_arg(argv[2], endpoint_id, "endpoint id") ||
            !parse_u64_arg(argv[3], location_id, "location id") ||
            !parse_u64_arg(argv[4], size, "size")) {
            return 1;
        }
        if (endpoint_id == 0 || endpoint_id > 0xFFFFFFFFull) {
            std::cerr << "ERROR: Invalid endpoint id: " << argv[2] << "\n";
            return 1;
        }
        request = TransferRequest::download(FileLocation{(u32)endpoint_id, location_id, size}, argv[5]);
        first_opt = 6;
    } else if (command == "upload") {
        request = TransferRequest::upload(argv[2]);
        first_opt = 3;
    } else {
        std::cerr << "Unknown command: " << command << "\n";
        print_usage(argv[0]);
        return 1;
    }

    if (const char* lv = std::getenv("PARXFER_LOG_LEVEL")) {
        Logger::get().set_level(parse_log_level(lv, LogLevel::INFO));
    }

    ServiceConfig cfg = ServiceConfig::from_env();
    i64 owner = 1;
    Tier tier = Tier::STANDARD;
    std::string creds_file;
    std::vector<EndpointAddress> cli_endpoints;

    for (int i = first_opt; i < argc; ++i) {
        if (std::strcmp(argv[i], "--endpoint") == 0 && i + 1 < argc) {
            auto ep = parse_endpoint(argv[++i]);
            if (!ep) {
                std::cerr << "ERROR: Invalid endpoint (want ID=HOST:PORT): " << argv[i] << "\n";
                return 1;
            }
            cli_endpoints.push_back(*ep);
        } else if (std::strcmp(argv[i], "--owner") == 0 && i + 1 < argc) {
            if (!utils::parse_i64(argv[++i], owner)) {
                std::cerr << "ERROR: Invalid owner: " << argv[i] << "\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "--session") == 0 && i + 1 < argc) {
            cfg.default_session = argv[++i];
        } else if (std::strcmp(argv[i], "--api-id") == 0 && i + 1 < argc) {
            u64 id = 0;
            if (!parse_u64_arg(argv[++i], id, "api id")) return 1;
            cfg.default_api_id = (u32)id;
        } else if (std::strcmp(argv[i], "--api-hash") == 0 && i + 1 < argc) {
            cfg.default_api_hash = argv[++i];
        } else if (std::strcmp(argv[i], "--creds") == 0 && i + 1 < argc) {
            creds_file = argv[++i];
        } else if (std::strcmp(argv[i], "--name") == 0 && i + 1 < argc) {
            request.name = argv[++i];
        } else if (std::strcmp(argv[i], "--conns") == 0 && i + 1 < argc) {
            cfg.connections_per_transfer = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--fixed-conns") == 0) {
            cfg.connection_policy = ConnectionPolicyKind::FIXED;
        } else if (std::strcmp(argv[i], "--premium") == 0) {
            tier = Tier::PRIVILEGED;
        } else if (std::strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
            cfg.log_file = argv[++i];
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            Logger::get().set_level(LogLevel::DEBUG);
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }
    if (!cli_endpoints.empty()) cfg.endpoints = cli_endpoints;

    if (!utils::validate_path(request.path)) {
        std::cerr << "ERROR: Invalid path\n";
        return 1;
    }
    if (cfg.endpoints.empty()) {
        std::cerr << "ERROR: No endpoints; pass --endpoint or set PARXFER_ENDPOINTS\n";
        return 1;
    }

    try {
        cfg.validate();
        if (!cfg.log_file.empty()) Logger::get().set_log_file(cfg.log_file);
        Logger::get().set_transfer_error_file(cfg.transfer_error_log);

        auto credentials = std::make_shared<FileCredentialStore>();
        if (!creds_file.empty()) credentials->load(creds_file);
        credentials->set_default(Credentials{cfg.default_api_id, cfg.default_api_hash},
                                 cfg.default_session);

        auto sessions = std::make_shared<TcpSessionFactory>(EndpointTable(cfg.endpoints), cfg);
        TransferService service(cfg, sessions, credentials);
        service.init();

        std::signal(SIGINT,  sig_handler);
        std::signal(SIGTERM, sig_handler);

        std::promise<TransferOutcome> done;
        std::future<TransferOutcome> result = done.get_future();
        Admission adm = service.start_transfer(owner, request, tier,
            [&done](const TransferOutcome& out) { done.set_value(out); });
        if (!adm.accepted()) {
            std::cerr << "Rejected: " << adm.message() << "\n";
            return 1;
        }

        bool cancel_sent = false;
        while (result.wait_for(std::chrono::milliseconds(200)) != std::future_status::ready) {
            if (g_interrupted.load() && !cancel_sent) {
                std::cerr << "Interrupted, cancelling transfer...\n";
                service.cancel_transfer(owner);
                cancel_sent = true;
            }
        }
        TransferOutcome out = result.get();
        service.wait_idle(std::chrono::seconds(5));
        LOG_INFO(service.status_line(owner));
        LOG_INFO(service.resource_status());

        if (out.cancelled) {
            std::cerr << "Cancelled\n";
            return 130;
        }
        if (!out.ok) {
            std::cerr << "FAILED: " << out.error << "\n";
            return 1;
        }
        if (out.location) {
            std::cout << "Uploaded " << request.name << ": endpoint=" << out.location->endpoint_id
                      << " location=" << out.location->location_id
                      << " size=" << out.location->size << "\n";
        } else {
            std::cout << "Downloaded " << utils::format_bytes(out.bytes) << " to " << request.path << "\n";
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }
}
