#include "event_reporter.hpp"

const char* event_kind_name(EventKind kind) {
    switch (kind) {
        case EventKind::JobSubmitted:       return "job-submitted";
        case EventKind::JobStatusChanged:   return "job-status";
        case EventKind::JobCancelRequested: return "job-cancel";
        case EventKind::JobAmbiguous:       return "job-ambiguous";
        case EventKind::LogReconnect:       return "log-reconnect";
        case EventKind::TransferPlanned:    return "transfer-planned";
        case EventKind::TransferStarted:    return "transfer-started";
        case EventKind::TransferRetry:      return "transfer-retry";
        case EventKind::TransferVerified:   return "transfer-verified";
        case EventKind::TransferFailed:     return "transfer-failed";
        case EventKind::SyncFinished:       return "sync-finished";
        case EventKind::Notice:             return "notice";
    }
    return "unknown";
}

EventReporter::EventReporter(size_t capacity) : channel_(capacity) {}

bool EventReporter::emit(const std::string& source, EventKind kind,
                         const std::string& subject, const std::string& message) {
    // Held across the (possibly blocking) push: seq order == queue order.
    std::lock_guard<std::mutex> lock(emit_mutex_);
    if (channel_.closed()) return false;

    Event ev;
    ev.seq = next_seq_.fetch_add(1);
    ev.source = source;
    ev.source_seq = ++source_seq_[source];
    ev.kind = kind;
    ev.subject = subject;
    ev.message = message;
    ev.time = std::chrono::system_clock::now();
    return channel_.push(std::move(ev));
}

std::optional<Event> EventReporter::next() {
    return channel_.pop();
}

void EventReporter::close() {
    channel_.close();
}
