#pragma once

#include "http/StreamPipe.hpp"

#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>

namespace infstore::http {

// Tracks the uploads whose threads are still running so shutdown can cut off their
// request bodies and then wait for the threads to return before the services they use
// are torn down.
class InFlightUploads {
  public:
    static InFlightUploads &instance();

    std::uint64_t add(const std::shared_ptr<StreamPipe> &pipe);

    // Called by the upload thread as the last thing it does.
    void remove(std::uint64_t ticket);

    // Closes every registered pipe, then blocks until each upload has called remove().
    void closeAll();

    [[nodiscard]] std::size_t active() const;

  private:
    mutable std::mutex mutex_;
    std::condition_variable drained_;
    std::uint64_t nextTicket_{1};
    std::map<std::uint64_t, std::weak_ptr<StreamPipe>> pipes_;
};

// Removes the ticket when the upload thread leaves its scope.
class InFlightTicket {
  public:
    InFlightTicket(InFlightUploads &uploads, std::uint64_t ticket) : uploads_(uploads), ticket_(ticket) {}
    ~InFlightTicket() { uploads_.remove(ticket_); }

    InFlightTicket(const InFlightTicket &) = delete;
    InFlightTicket &operator=(const InFlightTicket &) = delete;

  private:
    InFlightUploads &uploads_;
    std::uint64_t ticket_;
};

}  // namespace infstore::http
