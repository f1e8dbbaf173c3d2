#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace specsel {

// ─── Error Context ─────────────────────────────────────────────
// Where in a run an error was raised. iteration < 0 means the error
// happened outside of a running loop (setup, direct API use).

struct ErrorContext {
    int iteration = -1;
    size_t labeled = 0;
    size_t pool = 0;
    size_t validation = 0;

    bool inRun() const { return iteration >= 0; }
    std::string describe() const;
};

// ─── Error ─────────────────────────────────────────────────────
// Base for every failure raised by the engine. All of them are fatal
// for the run that raised them; nothing inside the loop retries.

class Error : public std::runtime_error {
public:
    Error(const std::string& kind, const std::string& message,
          ErrorContext context = {});

    const std::string& kind() const { return kind_; }
    const std::string& detail() const { return detail_; }
    const ErrorContext& context() const { return context_; }

private:
    std::string kind_;
    std::string detail_;
    ErrorContext context_;
};

/// Partition or configuration invariant violated.
class InvariantError : public Error {
public:
    explicit InvariantError(const std::string& message, ErrorContext context = {})
        : Error("InvariantError", message, context) {}
};

/// An id was expected in the Pool but is not there (strategy bug or
/// duplicate id inside one batch).
class NotInPoolError : public Error {
public:
    explicit NotInPoolError(const std::string& message, ErrorContext context = {})
        : Error("NotInPoolError", message, context) {}
};

/// Fewer than two distinct classes in the labeled set.
class InsufficientLabelsError : public Error {
public:
    explicit InsufficientLabelsError(const std::string& message, ErrorContext context = {})
        : Error("InsufficientLabelsError", message, context) {}
};

} // namespace specsel
