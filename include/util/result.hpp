#pragma once
#include <string>
#include <utility>

namespace extupd {

enum class ErrorKind : int {
    None = 0,
    IOFailure,
    TransportFailure,
    Cancelled,
    ValidationFailure,
};

const char* ErrorKindName(ErrorKind kind);

struct Result {
    bool ok{true};
    int err{0};
    std::string msg;
    ErrorKind kind{ErrorKind::None};

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(int e, std::string m) {
        return {.ok = false, .err = e, .msg = std::move(m), .kind = ErrorKind::IOFailure};
    }
    static Result Fail(ErrorKind k, std::string m, int e = 0) {
        return {.ok = false, .err = e, .msg = std::move(m), .kind = k};
    }
};

} // namespace extupd
