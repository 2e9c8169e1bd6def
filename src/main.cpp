#include "api_client.hpp"
#include "command_runner.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "event_queue.hpp"
#include "http.hpp"
#include "reducer.hpp"
#include "net/websocket.hpp"
#include "render.hpp"
#include "session.hpp"
#include "terminal.hpp"
#include "transport.hpp"
#include "util.hpp"

#include <atomic>
#include <chrono>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>

#include <unistd.h>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: prisma [options]\n"
              << "\n"
              << "Options:\n"
              << "  --username NAME      Username to log in with\n"
              << "  --password PASS      Password to log in with\n"
              << "  --server URL         Server base URL (default: http://localhost:8081)\n"
              << "  --no-color           Render without colors\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Chat commands:\n"
              << "  /next, /n            Switch to the next channel\n"
              << "  /prev, /p            Switch to the previous channel\n"
              << "  /up, /down           Scroll the messages by " << prisma::kScrollStep << "\n"
              << "  /top, /bottom        Jump to the oldest or newest message\n"
              << "  /quit, /exit         Exit\n"
              << "\n"
              << "Environment variables:\n"
              << "  PRISMA_SERVER_URL    Server base URL\n"
              << "  PRISMA_USERNAME      Username to log in with\n";
}

// Prompt until the server accepts the credentials. False on end of input.
static bool login_loop(prisma::ApiClient& api, std::string username, std::string password) {
    while (!g_shutdown.load()) {
        if (username.empty() && !prisma::prompt_line("Enter username: ", username, &g_shutdown))
            return false;
        if (password.empty() && !prisma::prompt_password("Enter password: ", password, &g_shutdown))
            return false;

        try {
            api.login(username, password);
            return true;
        } catch (const prisma::AuthError& e) {
            std::cout << "Login failed: " << e.what() << ". Please try again.\n";
            password.clear();
        }
    }
    return false;
}

int main(int argc, char* argv[]) try {
    std::string username;
    std::string password;
    std::string server;
    bool no_color = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--username") == 0 && i + 1 < argc) {
            username = prisma::trim(argv[++i]);
        } else if (std::strcmp(argv[i], "--password") == 0 && i + 1 < argc) {
            password = argv[++i];
        } else if (std::strcmp(argv[i], "--server") == 0 && i + 1 < argc) {
            server = argv[++i];
        } else if (std::strcmp(argv[i], "--no-color") == 0) {
            no_color = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    prisma::http_init();
    auto config = prisma::Config::load();
    if (!server.empty()) config.server_url = server;
    if (username.empty()) username = config.username;
    if (no_color) config.ui.color = false;

    prisma::install_shutdown_handler(signal_handler);
    prisma::http_set_abort_flag(&g_shutdown);

    std::cout << "Attempting to connect to server at " << config.server_url << "\n";

    prisma::PlatformHttpClient http_client;
    prisma::ApiClient api(config.server_url, http_client, config.http_timeout);

    if (!login_loop(api, username, password)) {
        std::cout << "\n";
        prisma::http_cleanup();
        return 1;
    }
    std::cout << "Login successful! Starting chat...\n";

    // Log lines would tear the full-screen view; keep them in a file.
    std::unique_ptr<prisma::LogRedirect> log_redirect;
    if (isatty(STDERR_FILENO))
        log_redirect = std::make_unique<prisma::LogRedirect>(
            prisma::expand_home(prisma::kLogFilePath));

    prisma::EventQueue queue;
    prisma::CommandRunner runner(api, queue);

    prisma::TransportOptions stream_opts;
    stream_opts.heartbeat_interval = std::chrono::seconds(config.stream.heartbeat_interval);
    stream_opts.heartbeat_timeout  = std::chrono::seconds(config.stream.heartbeat_timeout);
    stream_opts.connect_timeout    = config.stream.connect_timeout;
    prisma::SessionTransport transport(queue,
        []() { return std::make_unique<prisma::WebSocket>(); }, stream_opts);
    transport.connect(api.base_url(), api.token());

    prisma::Renderer renderer(config.ui.color ? prisma::RenderStyle::colored()
                                              : prisma::RenderStyle::plain(),
                              std::cout);

    prisma::InputReader input(queue, STDIN_FILENO, &g_shutdown);
    input.start();

    prisma::ChatSession session(queue, api.user(),
        [&runner](const prisma::Command& cmd) { runner.dispatch(cmd); },
        [&renderer](const prisma::SessionState& state) {
            renderer.draw(state, prisma::terminal_size());
        });
    session.run();

    // Abort in-flight requests, then release every worker.
    g_shutdown.store(true);
    input.stop();
    transport.stop();
    queue.close();
    runner.wait_all();

    std::cout << "\033[H\033[2J" << "Goodbye!\n";
    prisma::http_cleanup();
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
