#pragma once
#include <stdexcept>
#include <string>

#include "token.hpp"

enum class ErrorKind {
    LexError,
    ParseError,
    NameError,
    TypeError,
    ArityError,
    ArithmeticError,
    ValueError
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::LexError:
            return "LexError";
        case ErrorKind::ParseError:
            return "ParseError";
        case ErrorKind::NameError:
            return "NameError";
        case ErrorKind::TypeError:
            return "TypeError";
        case ErrorKind::ArityError:
            return "ArityError";
        case ErrorKind::ArithmeticError:
            return "ArithmeticError";
        case ErrorKind::ValueError:
            return "ValueError";
    }
    return "Error";
}

// Every language-level failure. The first one raised aborts the current unit.
class SoorjError : public std::runtime_error {
   public:
    SoorjError(ErrorKind kind,
        const std::string& message,
        const TokenLocation& loc) : std::runtime_error(format_message(kind, message, loc)),
                                    kind_(kind),
                                    message_(message),
                                    loc_(loc) {}

    ErrorKind kind() const { return kind_; }
    const std::string& message() const { return message_; }
    const TokenLocation& location() const { return loc_; }

   private:
    ErrorKind kind_;
    std::string message_;
    TokenLocation loc_;

    static std::string format_message(ErrorKind kind,
        const std::string& message,
        const TokenLocation& loc) {
        return std::string(error_kind_name(kind)) + " at " + loc.to_string() + "\n" +
            message + "\n" +
            " --> Traced at:\n" +
            loc.get_line_trace();
    }
};

// Host resource exhaustion (runaway recursion). Not a language error: nothing recovers from it.
class FatalError : public std::runtime_error {
   public:
    explicit FatalError(const std::string& message) : std::runtime_error(message) {}
};
