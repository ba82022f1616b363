#ifndef PARG_ERROR_HPP
#define PARG_ERROR_HPP

#include <string>
#include <string_view>
#include <utility>

namespace parg {

enum class ErrorKind {
    Conversion,          // token is not a valid literal of the declared kind
    MissingRequired,     // required argument never seen and no default
    MissingValue,        // argument seen without a value and no default
    DefaultTypeMismatch, // stored default does not match the declared kind
    MissingValueKind,    // default accepted on an argument that takes no value
    UnknownArgument,
    NotValueTaking,
    TypeMismatch,
    NoValueNoDefault,
    InternalCast,
    HelpRequested,       // --help was given; message is empty
};

// Failures are returned as std::optional<Error>; an empty optional means success.
struct Error {
    ErrorKind kind;
    std::string message;

    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}

    static Error helpRequested() { return Error(ErrorKind::HelpRequested, ""); }

    [[nodiscard]] bool isHelpRequested() const { return kind == ErrorKind::HelpRequested; }
};

std::string_view errorKindName(ErrorKind kind);

} // namespace parg

#endif // PARG_ERROR_HPP
