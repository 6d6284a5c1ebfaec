#include "capture-sequencer.h"
#include "logger.h"

#include <string>

static thread_local std::optional<uint64_t> t_current_ticket;

CaptureSequencer::CaptureSequencer(int port, EventHub& events)
    : _port(port), _events(events)
{
}

uint64_t CaptureSequencer::open() {
    std::lock_guard lock(_mutex);
    uint64_t ticket = _next_ticket++;
    _slots.emplace(ticket, Slot{});
    return ticket;
}

void CaptureSequencer::record(uint64_t ticket, RedirectEvent event) {
    std::lock_guard lock(_mutex);
    auto it = _slots.find(ticket);
    if (it == _slots.end()) {
        LOG_WARNING("CaptureSequencer", "Outcome for unknown connection #%llu on port %d, publishing unordered",
            static_cast<unsigned long long>(ticket), _port);
        _events.publish(std::move(event));
        return;
    }
    if (it->second.event) {
        LOG_WARNING("CaptureSequencer", "Connection #%llu on port %d already has an outcome, ignoring %s",
            static_cast<unsigned long long>(ticket), _port, to_cstr(kindOf(event)));
        return;
    }
    it->second.event = std::move(event);
}

void CaptureSequencer::close(uint64_t ticket) {
    std::lock_guard lock(_mutex);
    auto it = _slots.find(ticket);
    if (it == _slots.end()) {
        return;
    }
    it->second.done = true;
    flushLocked();
}

size_t CaptureSequencer::pending() const {
    std::lock_guard lock(_mutex);
    return _slots.size();
}

void CaptureSequencer::flushLocked() {
    for (auto it = _slots.find(_next_release); it != _slots.end() && it->second.done; it = _slots.find(_next_release)) {
        if (it->second.event) {
            _events.publish(std::move(*it->second.event));
        }
        else {
            LOG_WARNING("CaptureSequencer", "Connection #%llu on port %d closed without a request",
                static_cast<unsigned long long>(it->first), _port);
            _events.publish(InvalidRedirect{ _port, "connection closed before a complete request was received", "" });
        }
        _slots.erase(it);
        ++_next_release;
    }
}

std::optional<uint64_t> CaptureSequencer::currentTicket() noexcept {
    return t_current_ticket;
}

CaptureSequencer::TicketScope::TicketScope(uint64_t ticket) noexcept {
    t_current_ticket = ticket;
}

CaptureSequencer::TicketScope::~TicketScope() {
    t_current_ticket.reset();
}

SequencedTaskQueue::SequencedTaskQueue(CaptureSequencer& sequencer, size_t workers)
    : _sequencer(sequencer), _pool(workers)
{
}

bool SequencedTaskQueue::enqueue(std::function<void()> fn) {
    uint64_t ticket = _sequencer.open();
    bool queued = _pool.enqueue([this, ticket, fn = std::move(fn)]() {
        {
            ScopedThreadName name("Conn:" + std::to_string(_sequencer.port()));
            CaptureSequencer::TicketScope scope(ticket);
            try {
                fn();
            }
            catch (const std::exception& e) {
                LOG_ERROR("SequencedTaskQueue", "Connection #%llu failed: %s",
                    static_cast<unsigned long long>(ticket), e.what());
                _sequencer.record(ticket, InvalidRedirect{ _sequencer.port(), std::string("connection error: ") + e.what(), "" });
            }
        }
        _sequencer.close(ticket);
        });

    if (!queued) {
        _sequencer.record(ticket, InvalidRedirect{ _sequencer.port(), "connection rejected, worker queue is full", "" });
        _sequencer.close(ticket);
    }
    return queued;
}

void SequencedTaskQueue::shutdown() {
    _pool.shutdown();
}
