#include "command_runner.hpp"
#include <exception>
#include <type_traits>

namespace prisma {

CommandRunner::CommandRunner(ApiClient& api, EventQueue& queue)
    : api_(api), queue_(queue), loader_(api)
{}

CommandRunner::~CommandRunner() {
    wait_all();
}

std::optional<SessionEvent> CommandRunner::execute(const Command& command) {
    return std::visit([this](const auto& cmd) -> std::optional<SessionEvent> {
        using T = std::decay_t<decltype(cmd)>;
        if constexpr (std::is_same_v<T, FetchTopologyCommand>) {
            try {
                return TopologyLoadedEvent{api_.get_categories()};
            } catch (const std::exception& e) {
                return TopologyFailedEvent{e.what()};
            }
        } else if constexpr (std::is_same_v<T, FetchHistoryCommand>) {
            return loader_.load(cmd.channel_id);
        } else {
            try {
                api_.send_message(cmd.channel_id, cmd.content);
                return std::nullopt;
            } catch (const std::exception& e) {
                return SendFailedEvent{cmd.channel_id, e.what()};
            }
        }
    }, command);
}

void CommandRunner::dispatch(const Command& command) {
    auto done = std::make_shared<std::atomic<bool>>(false);
    std::lock_guard<std::mutex> lock(mutex_);
    reap_finished();
    Worker w;
    w.done = done;
    w.thread = std::thread([this, command, done]() {
        auto ev = execute(command);
        if (ev) queue_.push(std::move(*ev));
        done->store(true);
    });
    workers_.push_back(std::move(w));
}

void CommandRunner::reap_finished() {
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->done->load()) {
            it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

void CommandRunner::wait_all() {
    std::list<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        workers.swap(workers_);
    }
    for (auto& w : workers)
        if (w.thread.joinable()) w.thread.join();
}

size_t CommandRunner::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto& w : workers_)
        if (!w.done->load()) ++n;
    return n;
}

} // namespace prisma
