#include <catch2/catch.hpp>
#include "terminal.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <thread>
#include <utility>

#include <pthread.h>
#include <signal.h>
#include <unistd.h>

using namespace prisma;

// ── parse_input_line ────────────────────────────────────────────

TEST_CASE("parse_input_line: plain text is submitted as typed", "[terminal]") {
    auto ev = parse_input_line("  hello world ");
    auto* submit = std::get_if<SubmitTextEvent>(&ev);
    REQUIRE(submit != nullptr);
    REQUIRE(submit->text == "  hello world ");
}

TEST_CASE("parse_input_line: channel navigation", "[terminal]") {
    for (const char* line : {"/next", "/n", "/NEXT"}) {
        auto ev = parse_input_line(line);
        REQUIRE(std::holds_alternative<SelectChannelEvent>(ev));
        REQUIRE(std::get<SelectChannelEvent>(ev).delta == 1);
    }
    for (const char* line : {"/prev", "/p", " /prev "}) {
        auto ev = parse_input_line(line);
        REQUIRE(std::holds_alternative<SelectChannelEvent>(ev));
        REQUIRE(std::get<SelectChannelEvent>(ev).delta == -1);
    }
}

TEST_CASE("parse_input_line: scroll commands", "[terminal]") {
    using Kind = ScrollViewEvent::Kind;
    const std::pair<const char*, Kind> cases[] = {
        {"/up", Kind::Up}, {"/down", Kind::Down}, {" /TOP", Kind::Top}, {"/bottom ", Kind::Bottom},
    };
    for (const auto& c : cases) {
        auto ev = parse_input_line(c.first);
        auto* scroll = std::get_if<ScrollViewEvent>(&ev);
        REQUIRE(scroll != nullptr);
        REQUIRE(scroll->kind == c.second);
    }
}

TEST_CASE("parse_input_line: quit aliases", "[terminal]") {
    for (const char* line : {"/quit", "/exit", "/q"})
        REQUIRE(std::holds_alternative<QuitRequestedEvent>(parse_input_line(line)));
}

TEST_CASE("parse_input_line: unknown slash command", "[terminal]") {
    auto ev = parse_input_line(" /dance now ");
    auto* unknown = std::get_if<UnknownCommandEvent>(&ev);
    REQUIRE(unknown != nullptr);
    REQUIRE(unknown->command == "/dance now");
}

TEST_CASE("parse_input_line: empty line is an empty submission", "[terminal]") {
    auto ev = parse_input_line("");
    REQUIRE(std::holds_alternative<SubmitTextEvent>(ev));
}

// ── InputReader ─────────────────────────────────────────────────

namespace {

struct Pipe {
    int read_fd = -1;
    int write_fd = -1;

    Pipe() {
        int fds[2];
        if (pipe(fds) == 0) {
            read_fd = fds[0];
            write_fd = fds[1];
        }
    }
    ~Pipe() {
        close_write();
        if (read_fd >= 0) close(read_fd);
    }
    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    void write_text(const std::string& s) {
        REQUIRE(::write(write_fd, s.data(), s.size()) == static_cast<ssize_t>(s.size()));
    }
    void close_write() {
        if (write_fd >= 0) close(write_fd);
        write_fd = -1;
    }
};

SessionEvent next_event(EventQueue& q) {
    auto ev = q.pop_for(std::chrono::seconds(5));
    REQUIRE(ev.has_value());
    return *ev;
}

} // namespace

TEST_CASE("InputReader: lines become events in order", "[terminal]") {
    Pipe p;
    REQUIRE(p.read_fd >= 0);
    EventQueue q;
    InputReader reader(q, p.read_fd);
    reader.start();

    p.write_text("hello\r\n/next\n/p");
    p.write_text("\n/quit\n");

    auto e1 = next_event(q);
    REQUIRE(std::get<SubmitTextEvent>(e1).text == "hello");
    auto e2 = next_event(q);
    REQUIRE(std::get<SelectChannelEvent>(e2).delta == 1);
    auto e3 = next_event(q);
    REQUIRE(std::get<SelectChannelEvent>(e3).delta == -1);
    auto e4 = next_event(q);
    REQUIRE(std::holds_alternative<QuitRequestedEvent>(e4));

    reader.stop();
}

TEST_CASE("InputReader: end of input requests quit", "[terminal]") {
    Pipe p;
    EventQueue q;
    InputReader reader(q, p.read_fd);
    reader.start();

    p.close_write();
    auto ev = next_event(q);
    REQUIRE(std::holds_alternative<QuitRequestedEvent>(ev));
    reader.stop();
}

TEST_CASE("InputReader: abort flag requests quit", "[terminal]") {
    Pipe p;
    EventQueue q;
    std::atomic<bool> abort{false};
    InputReader reader(q, p.read_fd, &abort);
    reader.start();

    abort.store(true);
    auto ev = next_event(q);
    REQUIRE(std::holds_alternative<QuitRequestedEvent>(ev));
    reader.stop();
}

TEST_CASE("InputReader: stop does not push quit", "[terminal]") {
    Pipe p;
    EventQueue q;
    InputReader reader(q, p.read_fd);
    reader.start();
    reader.stop();

    REQUIRE(q.size() == 0);
}

// ── Prompts on a raw descriptor ─────────────────────────────────

TEST_CASE("read_line_fd: leaves later lines for the input reader", "[terminal]") {
    Pipe p;
    p.write_text("user\npass\r\nhello\n/quit\n");

    std::string line;
    REQUIRE(read_line_fd(p.read_fd, line));
    REQUIRE(line == "user");
    REQUIRE(read_line_fd(p.read_fd, line));
    REQUIRE(line == "pass");

    EventQueue q;
    InputReader reader(q, p.read_fd);
    reader.start();
    auto e1 = next_event(q);
    REQUIRE(std::get<SubmitTextEvent>(e1).text == "hello");
    auto e2 = next_event(q);
    REQUIRE(std::holds_alternative<QuitRequestedEvent>(e2));
    reader.stop();
}

TEST_CASE("read_line_fd: end of input", "[terminal]") {
    Pipe p;
    p.write_text("partial");
    p.close_write();

    std::string line;
    REQUIRE(read_line_fd(p.read_fd, line));
    REQUIRE(line == "partial");
    REQUIRE_FALSE(read_line_fd(p.read_fd, line));
    REQUIRE(line.empty());
}

namespace {
void ignore_signal(int) {}
} // namespace

TEST_CASE("read_line_fd: interrupted read returns once abort is set", "[terminal]") {
    struct sigaction sa{};
    struct sigaction previous{};
    sa.sa_handler = ignore_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    REQUIRE(sigaction(SIGUSR1, &sa, &previous) == 0);

    Pipe p;
    std::atomic<bool> abort{false};
    std::atomic<bool> done{false};
    bool result = true;
    std::thread reader([&]() {
        std::string line;
        result = read_line_fd(p.read_fd, line, &abort);
        done.store(true);
    });

    abort.store(true);
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!done.load() && std::chrono::steady_clock::now() < deadline) {
        pthread_kill(reader.native_handle(), SIGUSR1);
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    // Unblock the reader if the signal never landed.
    if (!done.load()) p.write_text("\n");
    reader.join();
    sigaction(SIGUSR1, &previous, nullptr);

    REQUIRE(done.load());
    REQUIRE_FALSE(result);
}

TEST_CASE("install_shutdown_handler: blocking reads are not restarted", "[terminal]") {
    struct sigaction old_int{}, old_term{}, old_pipe{};
    sigaction(SIGINT, nullptr, &old_int);
    sigaction(SIGTERM, nullptr, &old_term);
    sigaction(SIGPIPE, nullptr, &old_pipe);

    install_shutdown_handler(ignore_signal);

    struct sigaction now{};
    sigaction(SIGINT, nullptr, &now);
    bool int_ok = now.sa_handler == ignore_signal && (now.sa_flags & SA_RESTART) == 0;
    sigaction(SIGTERM, nullptr, &now);
    bool term_ok = now.sa_handler == ignore_signal && (now.sa_flags & SA_RESTART) == 0;
    sigaction(SIGPIPE, nullptr, &now);
    bool pipe_ok = now.sa_handler == SIG_IGN;

    sigaction(SIGINT, &old_int, nullptr);
    sigaction(SIGTERM, &old_term, nullptr);
    sigaction(SIGPIPE, &old_pipe, nullptr);

    REQUIRE(int_ok);
    REQUIRE(term_ok);
    REQUIRE(pipe_ok);
}

// ── LogRedirect ─────────────────────────────────────────────────

TEST_CASE("LogRedirect: cerr goes to the file until destroyed", "[terminal]") {
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / ("prisma_log_" + std::to_string(getpid()));
    fs::remove_all(dir);
    fs::path file = dir / "logs" / "prisma.log";

    std::streambuf* original = std::cerr.rdbuf();
    {
        LogRedirect redirect(file.string());
        REQUIRE(redirect.active());
        REQUIRE(std::cerr.rdbuf() != original);
        std::cerr << "[transport] connected\n";
    }
    REQUIRE(std::cerr.rdbuf() == original);
    {
        LogRedirect redirect(file.string());
        std::cerr << "[session] live -> error\n";
    }

    std::ifstream in(file);
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    REQUIRE(contents == "[transport] connected\n[session] live -> error\n");
    fs::remove_all(dir);
}

TEST_CASE("LogRedirect: unopenable path leaves cerr alone", "[terminal]") {
    namespace fs = std::filesystem;
    fs::path blocker = fs::temp_directory_path() / ("prisma_log_file_" + std::to_string(getpid()));
    { std::ofstream touch(blocker); }

    std::streambuf* original = std::cerr.rdbuf();
    {
        LogRedirect redirect((blocker / "prisma.log").string());
        REQUIRE_FALSE(redirect.active());
        REQUIRE(std::cerr.rdbuf() == original);
    }
    REQUIRE(std::cerr.rdbuf() == original);
    fs::remove(blocker);
}
