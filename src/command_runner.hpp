#pragma once
#include "api_client.hpp"
#include "event.hpp"
#include "event_queue.hpp"
#include "history_loader.hpp"

#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace prisma {

// Executes reducer commands off the session thread, one worker per command.
// Fetch results and send failures come back as events on the queue; a
// successful send produces none.
class CommandRunner {
public:
    CommandRunner(ApiClient& api, EventQueue& queue);
    ~CommandRunner();
    CommandRunner(const CommandRunner&)            = delete;
    CommandRunner& operator=(const CommandRunner&) = delete;

    void dispatch(const Command& command);

    // Join every worker, finished or not.
    void wait_all();

    size_t in_flight() const;

    // Run a command synchronously. A successful send yields no event.
    std::optional<SessionEvent> execute(const Command& command);

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void reap_finished();

    ApiClient& api_;
    EventQueue& queue_;
    HistoryLoader loader_;

    mutable std::mutex mutex_;
    std::list<Worker> workers_;
};

} // namespace prisma
