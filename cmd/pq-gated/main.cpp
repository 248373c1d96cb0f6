#include "../../audit/audit_logger.hpp"
#include "../../common/errors.hpp"
#include "../../policy/config.hpp"
#include "../../service/command_dispatch.hpp"
#include "../../service/gateway_service.hpp"

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>

namespace {

volatile std::sig_atomic_t g_terminate = 0;

void handle_signal(int) {
    g_terminate = 1;
}

bool write_all(int fd, const std::string &data) {
    std::size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        off += static_cast<std::size_t>(n);
    }
    return true;
}

// One connection: newline-delimited JSON commands, one response line each.
void serve_client(int client_fd, std::shared_ptr<pqgate::GatewayService> gateway) {
    pqgate::CommandLineBuffer buffer;
    char chunk[4096];
    ssize_t n;
    while ((n = ::read(client_fd, chunk, sizeof(chunk))) > 0) {
        buffer.append(chunk, static_cast<std::size_t>(n));
        std::string line;
        while (buffer.next_line(line)) {
            if (line.empty()) continue;

            std::string response_json = pqgate::handle_command_line(*gateway, line);
            response_json.push_back('\n');
            if (!write_all(client_fd, response_json)) {
                std::perror("write");
                ::close(client_fd);
                return;
            }
        }
        if (buffer.overflowed()) {
            std::cerr << "pq-gated: dropping client, command line exceeds "
                      << pqgate::CommandLineBuffer::kMaxLineBytes << " bytes" << std::endl;
            if (!write_all(client_fd, pqgate::line_too_long_response() + "\n")) {
                std::perror("write");
            }
            ::close(client_fd);
            return;
        }
    }
    if (n < 0) {
        std::perror("read");
    }
    ::close(client_fd);
}

} // namespace

int main(int argc, char **argv) {
    using namespace pqgate;

    const std::string config_path = argc > 1 ? argv[1] : kDefaultConfigPath;

    Config cfg;
    std::shared_ptr<GatewayService> gateway;
    std::shared_ptr<AuditLogger> audit;
    try {
        cfg = load_config_or_default(config_path);
        audit = std::make_shared<AuditLogger>(cfg.log_path);
        gateway = make_gateway_service(cfg, audit);
    } catch (const GateError &ex) {
        std::cerr << "pq-gated: startup failed (" << ex.code() << "): " << ex.what() << std::endl;
        return 1;
    } catch (const std::exception &ex) {
        std::cerr << "pq-gated: startup failed: " << ex.what() << std::endl;
        return 1;
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
    std::signal(SIGPIPE, SIG_IGN);

    int server_fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (server_fd < 0) {
        std::perror("socket");
        return 1;
    }

    ::unlink(cfg.socket_path.c_str());

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, cfg.socket_path.c_str(), sizeof(addr.sun_path) - 1);

    if (::bind(server_fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
        std::perror("bind");
        ::close(server_fd);
        return 1;
    }

    if (::listen(server_fd, 64) < 0) {
        std::perror("listen");
        ::close(server_fd);
        return 1;
    }

    const IssuerPublicKeys keys = gateway->issuer().public_keys();
    std::cout << "pq-gated listening on UNIX socket: " << cfg.socket_path
              << " (mode " << signing_mode_to_string(keys.mode) << ", kid " << keys.kid << ")"
              << std::endl;
    audit->log_event("startup", {{"socket", cfg.socket_path}, {"kid", keys.kid}});

    while (!g_terminate) {
        int client_fd = ::accept(server_fd, nullptr, nullptr);
        if (client_fd < 0) {
            if (errno == EINTR && g_terminate) {
                break;
            }
            std::perror("accept");
            continue;
        }

        try {
            std::thread(serve_client, client_fd, gateway).detach();
        } catch (const std::system_error &ex) {
            std::cerr << "pq-gated: cannot spawn client thread: " << ex.what() << std::endl;
            ::close(client_fd);
        }
    }

    ::close(server_fd);
    ::unlink(cfg.socket_path.c_str());
    audit->log_event("shutdown", {{"socket", cfg.socket_path}});

    return 0;
}
