#pragma once
#include <stdexcept>
#include <string>

namespace ClipRelay {
    enum class ErrorKind {
        None,
        NotFound,   // empty queue/cache pop
        Timeout,    // collaborator exceeded its bound
        Rejected,   // policy skip (duration window)
        Transient,  // expected to succeed on retry
        Fatal       // cannot establish session / nothing to discover
    };

    const char* ToString(ErrorKind kind);

    class PipelineError : public std::runtime_error {
    public:
        PipelineError(ErrorKind kind, const std::string& message)
            : std::runtime_error(message), kind_(kind) {}

        ErrorKind Kind() const { return kind_; }

    private:
        ErrorKind kind_;
    };

    class QueueEmpty : public PipelineError {
    public:
        explicit QueueEmpty(const std::string& what)
            : PipelineError(ErrorKind::NotFound, what + " is empty") {}
    };
}
