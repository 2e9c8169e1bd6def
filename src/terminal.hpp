#pragma once
#include "event.hpp"
#include "event_queue.hpp"
#include "render.hpp"

#include <atomic>
#include <fstream>
#include <string>
#include <thread>

namespace prisma {

// Install handler for SIGINT and SIGTERM without SA_RESTART, so a blocked
// read returns EINTR, and ignore SIGPIPE.
void install_shutdown_handler(void (*handler)(int));

// Read one line from fd a byte at a time, so nothing past the newline is
// consumed. A trailing '\r' is dropped. False on EOF before any byte, on a
// read error, or when interrupted while abort_flag is set.
bool read_line_fd(int fd, std::string& out, const std::atomic<bool>* abort_flag = nullptr);

// Print prompt and read one trimmed line from stdin. False on EOF or abort.
bool prompt_line(const std::string& prompt, std::string& out,
                 const std::atomic<bool>* abort_flag = nullptr);

// Read a line with terminal echo disabled when stdin is a tty. The value is
// not trimmed.
bool prompt_password(const std::string& prompt, std::string& out,
                     const std::atomic<bool>* abort_flag = nullptr);

constexpr const char* kLogFilePath = "~/.prisma/prisma.log";

// Sends std::cerr to a file in append mode while alive, so log lines stay
// out of the full-screen view. If the file cannot be opened std::cerr is
// left as it was.
class LogRedirect {
public:
    explicit LogRedirect(const std::string& path);
    ~LogRedirect();
    LogRedirect(const LogRedirect&)            = delete;
    LogRedirect& operator=(const LogRedirect&) = delete;

    bool active() const { return previous_ != nullptr; }

private:
    std::ofstream file_;
    std::streambuf* previous_ = nullptr;
};

// Current terminal dimensions; 80x24 when stdout is not a terminal.
ViewSize terminal_size();

// Map one line of user input to an event:
//   /next /n → SelectChannel(+1), /prev /p → SelectChannel(-1),
//   /up /down /top /bottom → ScrollView,
//   /quit /exit /q → QuitRequested, other /… → UnknownCommand,
//   anything else → SubmitText.
SessionEvent parse_input_line(const std::string& line);

// Reads lines from a file descriptor on its own thread and pushes the parsed
// events. End of input, a read error or the abort flag pushes QuitRequested.
class InputReader {
public:
    InputReader(EventQueue& queue, int fd, const std::atomic<bool>* abort_flag = nullptr);
    ~InputReader();
    InputReader(const InputReader&)            = delete;
    InputReader& operator=(const InputReader&) = delete;

    void start();
    void stop();

private:
    void read_loop();

    EventQueue& queue_;
    int fd_;
    const std::atomic<bool>* abort_flag_;
    std::atomic<bool> running_{false};
    std::thread thread_;
};

} // namespace prisma
