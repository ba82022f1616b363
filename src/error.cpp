#include "parg/error.hpp"

namespace parg {

std::string_view errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Conversion: return "conversion";
        case ErrorKind::MissingRequired: return "missing-required";
        case ErrorKind::MissingValue: return "missing-value";
        case ErrorKind::DefaultTypeMismatch: return "default-type-mismatch";
        case ErrorKind::MissingValueKind: return "missing-value-kind";
        case ErrorKind::UnknownArgument: return "unknown-argument";
        case ErrorKind::NotValueTaking: return "not-value-taking";
        case ErrorKind::TypeMismatch: return "type-mismatch";
        case ErrorKind::NoValueNoDefault: return "no-value-no-default";
        case ErrorKind::InternalCast: return "internal-cast";
        case ErrorKind::HelpRequested: return "help-requested";
    }
    return "unknown";
}

} // namespace parg
