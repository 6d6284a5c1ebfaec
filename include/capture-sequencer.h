#pragma once

#include "event-hub.h"

#include <httplib.h>

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>

// Hands out one ticket per accepted connection and releases each
// connection's outcome to the hub strictly in ticket order, so events of one
// session follow accept order even when connections finish out of order.
class CaptureSequencer {
public:
    CaptureSequencer(int port, EventHub& events);

    uint64_t open();

    // First outcome recorded for a ticket wins.
    void record(uint64_t ticket, RedirectEvent event);

    // A ticket closed without an outcome is reported as an invalid redirect.
    void close(uint64_t ticket);

    size_t pending() const;

    int port() const noexcept { return _port; }

    // Ticket of the connection served by the calling thread, if any.
    static std::optional<uint64_t> currentTicket() noexcept;

    class TicketScope {
    public:
        explicit TicketScope(uint64_t ticket) noexcept;
        ~TicketScope();

        TicketScope(const TicketScope&) = delete;
        TicketScope& operator=(const TicketScope&) = delete;
    };

private:
    struct Slot {
        bool done = false;
        std::optional<RedirectEvent> event;
    };

    void flushLocked();

    int _port;
    EventHub& _events;

    mutable std::mutex _mutex;
    std::map<uint64_t, Slot> _slots;
    uint64_t _next_ticket = 0;
    uint64_t _next_release = 0;
};

// httplib task queue that wraps every accepted connection in a ticket before
// handing it to a worker pool.
class SequencedTaskQueue : public httplib::TaskQueue {
public:
    SequencedTaskQueue(CaptureSequencer& sequencer, size_t workers);

    bool enqueue(std::function<void()> fn) override;
    void shutdown() override;

private:
    CaptureSequencer& _sequencer;
    httplib::ThreadPool _pool;
};
