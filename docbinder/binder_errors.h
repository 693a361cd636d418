#ifndef DOCBINDER_BINDER_ERRORS_H
#define DOCBINDER_BINDER_ERRORS_H

#include <stdexcept>
#include <string>

namespace DocBinder {

// Exit codes
constexpr int EC_SUCCESS = 0;
constexpr int EC_INVALID_ARGS = 1;
constexpr int EC_SCAN_FAILURE = 2;
constexpr int EC_RENDER_FAILURE = 3;
constexpr int EC_PAGINATION_DRIFT = 4;
constexpr int EC_OUTPUT_WRITE_FAILURE = 5;
constexpr int EC_UNKNOWN_ERROR = 10;

// Base of every fatal condition; aborts the run with exitCode()
class BinderError : public std::runtime_error {
public:
    BinderError(const std::string& message, int exitCode)
        : std::runtime_error(message), exitCode_(exitCode) {}

    int exitCode() const { return exitCode_; }

private:
    int exitCode_;
};

// Unreadable directory or missing root
class ScanFailure : public BinderError {
public:
    explicit ScanFailure(const std::string& message)
        : BinderError(message, EC_SCAN_FAILURE) {}
};

// Source missing, converter unavailable or conversion produced nothing
class RenderFailure : public BinderError {
public:
    explicit RenderFailure(const std::string& message)
        : BinderError(message, EC_RENDER_FAILURE) {}
};

// Committed contents page no longer has the page count the numbers assume
class PaginationDrift : public BinderError {
public:
    PaginationDrift(const std::string& message, int dryPages, int committedPages)
        : BinderError(message, EC_PAGINATION_DRIFT),
          dryPages_(dryPages), committedPages_(committedPages) {}

    int dryPages() const { return dryPages_; }
    int committedPages() const { return committedPages_; }

private:
    int dryPages_;
    int committedPages_;
};

// Merge, annotation, publish or work directory failure
class OutputWriteFailure : public BinderError {
public:
    explicit OutputWriteFailure(const std::string& message)
        : BinderError(message, EC_OUTPUT_WRITE_FAILURE) {}
};

} // namespace DocBinder

#endif // DOCBINDER_BINDER_ERRORS_H
