#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <core/channel.hpp>

enum class EventKind {
    JobSubmitted,
    JobStatusChanged,
    JobCancelRequested,
    JobAmbiguous,
    LogReconnect,
    TransferPlanned,
    TransferStarted,
    TransferRetry,
    TransferVerified,
    TransferFailed,
    SyncFinished,
    Notice,
};

const char* event_kind_name(EventKind kind);

struct Event {
    uint64_t seq = 0;            // global emission order
    std::string source;          // operation that emitted it ("job:<id>", "sync:<n>")
    uint64_t source_seq = 0;     // order within the source
    EventKind kind = EventKind::Notice;
    std::string subject;         // job id or item path
    std::string message;
    std::chrono::system_clock::time_point time;
};

// Merges events from concurrent operations into one ordered stream.
// Sequence numbers are assigned under the same lock as the enqueue, so the
// stream order is the emission order and no source is reordered. emit()
// blocks when the buffer is full instead of dropping.
class EventReporter {
public:
    explicit EventReporter(size_t capacity);

    // Returns false if the reporter is closed.
    bool emit(const std::string& source, EventKind kind,
              const std::string& subject, const std::string& message);

    // Blocks for the next event; nullopt after close() once drained.
    std::optional<Event> next();

    void close();

    uint64_t emitted() const { return next_seq_.load() - 1; }

private:
    BoundedChannel<Event> channel_;
    std::mutex emit_mutex_;
    std::atomic<uint64_t> next_seq_{1};
    std::map<std::string, uint64_t> source_seq_;
};
