#pragma once

#include <quantum/runtime/value.hpp>

#include <exception>
#include <string>
#include <utility>

namespace quantum::runtime {

// Outcome of executing one node. Return and Redirect short-circuit the
// enclosing statement lists; Error carries the exception to rethrow at the
// host boundary.
struct ExecResult {
    enum class Kind { Continue, Return, Redirect, Error };

    Kind kind = Kind::Continue;
    Value value;                 // Return
    std::string url;             // Redirect
    int status = 302;            // Redirect
    std::exception_ptr error;    // Error

    static ExecResult next() { return {}; }

    static ExecResult returned(Value value)
    {
        ExecResult r;
        r.kind = Kind::Return;
        r.value = std::move(value);
        return r;
    }

    static ExecResult redirect(std::string url, int status = 302)
    {
        ExecResult r;
        r.kind = Kind::Redirect;
        r.url = std::move(url);
        r.status = status;
        return r;
    }

    static ExecResult failure(std::exception_ptr error)
    {
        ExecResult r;
        r.kind = Kind::Error;
        r.error = std::move(error);
        return r;
    }

    bool is_continue() const { return kind == Kind::Continue; }
    bool is_return() const { return kind == Kind::Return; }
    bool is_redirect() const { return kind == Kind::Redirect; }
    bool is_error() const { return kind == Kind::Error; }

    [[noreturn]] void rethrow() const { std::rethrow_exception(error); }
};

} // namespace quantum::runtime
