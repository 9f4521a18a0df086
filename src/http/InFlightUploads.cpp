#include "http/InFlightUploads.hpp"

#include <trantor/utils/Logger.h>

#include <vector>

namespace infstore::http {

InFlightUploads &InFlightUploads::instance() {
    static InFlightUploads uploads;
    return uploads;
}

std::uint64_t InFlightUploads::add(const std::shared_ptr<StreamPipe> &pipe) {
    std::lock_guard guard(mutex_);
    auto ticket = nextTicket_++;
    pipes_.emplace(ticket, pipe);
    return ticket;
}

void InFlightUploads::remove(std::uint64_t ticket) {
    {
        std::lock_guard guard(mutex_);
        pipes_.erase(ticket);
    }
    drained_.notify_all();
}

void InFlightUploads::closeAll() {
    std::vector<std::shared_ptr<StreamPipe>> pipes;
    {
        std::lock_guard guard(mutex_);
        for (auto &[ticket, weak] : pipes_) {
            if (auto pipe = weak.lock()) {
                pipes.push_back(std::move(pipe));
            }
        }
    }
    for (auto &pipe : pipes) {
        pipe->close();
    }
    pipes.clear();

    std::unique_lock lock(mutex_);
    if (pipes_.empty()) {
        return;
    }
    LOG_WARN << "Aborting " << pipes_.size() << " upload(s) still receiving data";
    drained_.wait(lock, [this] { return pipes_.empty(); });
    LOG_INFO << "All uploads returned";
}

std::size_t InFlightUploads::active() const {
    std::lock_guard guard(mutex_);
    return pipes_.size();
}

}  // namespace infstore::http
