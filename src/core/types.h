#pragma once

#include <optional>
#include <string>
#include <utility>

namespace station {

using SessionId = std::string;
using ProjectId = std::string;

enum class ErrorCode {
    Ok,
    SpawnError,
    UnknownSession,
    IOError,
    ResizeIgnored
};

const char* error_code_name(ErrorCode code);

// ResizeIgnored is informational: a resize against a dead session is dropped
// without being reported as a failure.
struct Status {
    ErrorCode code = ErrorCode::Ok;
    std::string message;

    Status() = default;
    Status(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    bool ok() const { return code == ErrorCode::Ok || code == ErrorCode::ResizeIgnored; }
    std::string to_string() const;
};

template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)) {}
    Result(Status status) : status_(std::move(status)) {}

    bool ok() const { return value_.has_value(); }
    ErrorCode code() const { return status_.code; }
    const Status& status() const { return status_; }

    T& value() { return *value_; }
    const T& value() const { return *value_; }
    T take() { return std::move(*value_); }

private:
    std::optional<T> value_;
    Status status_;
};

struct SessionDescriptor {
    SessionId id;
    ProjectId project_id;
    bool is_running = false;
};

struct Project {
    ProjectId id;
    std::string path;
    std::string name;
};

}
