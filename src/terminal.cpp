#include "terminal.hpp"
#include "util.hpp"

#include <cerrno>
#include <filesystem>
#include <iostream>

#include <poll.h>
#include <signal.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>

namespace prisma {

static constexpr int kPollSliceMs = 250;

void install_shutdown_handler(void (*handler)(int)) {
    struct sigaction sa{};
    sa.sa_handler = handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    struct sigaction ignore{};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    sigaction(SIGPIPE, &ignore, nullptr);
}

bool read_line_fd(int fd, std::string& out, const std::atomic<bool>* abort_flag) {
    out.clear();
    bool got_any = false;
    char c;
    while (true) {
        ssize_t n = ::read(fd, &c, 1);
        if (n == 1) {
            got_any = true;
            if (c == '\n') break;
            out.push_back(c);
            continue;
        }
        if (n == 0) {
            if (!got_any) return false;
            break;
        }
        if (errno == EINTR && !(abort_flag && abort_flag->load())) continue;
        return false;
    }
    if (!out.empty() && out.back() == '\r') out.pop_back();
    return true;
}

bool prompt_line(const std::string& prompt, std::string& out,
                 const std::atomic<bool>* abort_flag) {
    std::cout << prompt << std::flush;
    if (!read_line_fd(STDIN_FILENO, out, abort_flag)) return false;
    out = trim(out);
    return true;
}

bool prompt_password(const std::string& prompt, std::string& out,
                     const std::atomic<bool>* abort_flag) {
    std::cout << prompt << std::flush;

    struct termios old_term{};
    bool tty = isatty(STDIN_FILENO) && tcgetattr(STDIN_FILENO, &old_term) == 0;
    if (tty) {
        struct termios no_echo = old_term;
        no_echo.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        tcsetattr(STDIN_FILENO, TCSAFLUSH, &no_echo);
    }

    bool ok = read_line_fd(STDIN_FILENO, out, abort_flag);

    if (tty) {
        tcsetattr(STDIN_FILENO, TCSAFLUSH, &old_term);
        std::cout << "\n";
    }
    return ok;
}

LogRedirect::LogRedirect(const std::string& path) {
    size_t slash = path.rfind('/');
    if (slash != std::string::npos && slash > 0) {
        std::error_code ec;
        std::filesystem::create_directories(path.substr(0, slash), ec);
    }
    file_.open(path, std::ios::app);
    if (file_) previous_ = std::cerr.rdbuf(file_.rdbuf());
}

LogRedirect::~LogRedirect() {
    if (previous_) {
        std::cerr.flush();
        std::cerr.rdbuf(previous_);
    }
}

ViewSize terminal_size() {
    ViewSize size;
    struct winsize ws{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0 && ws.ws_row > 0) {
        size.width = ws.ws_col;
        size.height = ws.ws_row;
    }
    return size;
}

SessionEvent parse_input_line(const std::string& raw) {
    std::string line = trim(raw);
    if (line.empty() || line[0] != '/')
        return SubmitTextEvent{raw};

    std::string cmd = to_lower(line.substr(0, line.find(' ')));
    if (cmd == "/next" || cmd == "/n") return SelectChannelEvent{1};
    if (cmd == "/prev" || cmd == "/p") return SelectChannelEvent{-1};
    if (cmd == "/up")     return ScrollViewEvent{ScrollViewEvent::Kind::Up};
    if (cmd == "/down")   return ScrollViewEvent{ScrollViewEvent::Kind::Down};
    if (cmd == "/top")    return ScrollViewEvent{ScrollViewEvent::Kind::Top};
    if (cmd == "/bottom") return ScrollViewEvent{ScrollViewEvent::Kind::Bottom};
    if (cmd == "/quit" || cmd == "/exit" || cmd == "/q") return QuitRequestedEvent{};
    return UnknownCommandEvent{line};
}

// ── InputReader ────────────────────────────────────────────────

InputReader::InputReader(EventQueue& queue, int fd, const std::atomic<bool>* abort_flag)
    : queue_(queue), fd_(fd), abort_flag_(abort_flag)
{}

InputReader::~InputReader() {
    stop();
}

void InputReader::start() {
    if (running_.exchange(true)) return;
    thread_ = std::thread([this]() { read_loop(); });
}

void InputReader::stop() {
    running_.store(false);
    if (thread_.joinable()) thread_.join();
}

void InputReader::read_loop() {
    std::string pending;
    char buf[1024];
    while (running_.load()) {
        if (abort_flag_ && abort_flag_->load()) break;

        struct pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = POLLIN;
        int rc = ::poll(&pfd, 1, kPollSliceMs);
        if (rc == 0) continue;
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }

        ssize_t n = ::read(fd_, buf, sizeof(buf));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        pending.append(buf, static_cast<size_t>(n));

        size_t nl;
        while ((nl = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, nl);
            pending.erase(0, nl + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            queue_.push(parse_input_line(line));
        }
    }
    // Ending for any reason other than stop() means the user is gone.
    if (running_.load()) queue_.push(QuitRequestedEvent{});
}

} // namespace prisma
