#pragma once

#include <string>

// Error taxonomy shared by the job controller, the storage sync engine and the
// transport. Retry decisions are made on the kind alone.
enum class ErrorKind {
    TransientNetwork,   // connection dropped, 5xx, timeout before send
    RateLimited,        // HTTP 429
    AmbiguousState,     // remote effect could not be confirmed
    Integrity,          // content hash mismatch after transfer
    UnsupportedEntry,   // symlink or special file
    Timeout,            // local wait exceeded, remote job unaffected
    Permanent,          // validation, authorization, not found
    SequenceGap,        // log chunk sequence skipped a number
    Consistency,        // illegal job status transition
    Cancelled,          // user cancelled the operation
};

struct Error {
    ErrorKind kind = ErrorKind::Permanent;
    std::string message;
    std::string subject;     // job id or item path
    int attempts = 0;
    int http_status = 0;
    std::string cause;       // last underlying cause (curl / server text)

    static Error make(ErrorKind kind, const std::string& message,
                      const std::string& subject = "") {
        Error e;
        e.kind = kind;
        e.message = message;
        e.subject = subject;
        return e;
    }

    bool is_transient() const {
        return kind == ErrorKind::TransientNetwork || kind == ErrorKind::RateLimited;
    }

    // One-line rendering: "[kind] subject: message (attempts, cause)"
    std::string describe() const;
};

const char* error_kind_name(ErrorKind kind);
