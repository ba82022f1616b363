#include "parg/argument.hpp"

#include <stdexcept>

#include "parg/debug.hpp"

namespace {

std::string stripMarker(std::string name) {
    const auto start = name.find_first_not_of('-');
    if (start == std::string::npos) return {};
    return name.substr(start);
}

} // namespace

namespace parg {

Argument::Argument(std::string name, std::optional<ValueKind> kind, std::optional<Value> defaultValue, bool required)
    : name_(stripMarker(std::move(name))),
      kind_(kind),
      defaultValue_(std::move(defaultValue)),
      required_(required) {
    if (name_.empty()) throw std::invalid_argument("argument name must not be empty");
}

Argument Argument::withValue(std::string name, ValueKind kind, bool required) {
    return Argument(std::move(name), kind, std::nullopt, required);
}

Argument Argument::withDefaultValue(std::string name, ValueKind kind, Value defaultValue, bool required) {
    return Argument(std::move(name), kind, std::move(defaultValue), required);
}

Argument Argument::withoutValue(std::string name, bool required) {
    return Argument(std::move(name), std::nullopt, std::nullopt, required);
}

std::optional<Error> Argument::acceptDefault() {
    if (!kind_) {
        return Error(ErrorKind::MissingValueKind, "Argument --" + name_ + " takes no value and cannot have a default");
    }
    if (!defaultValue_) {
        return Error(ErrorKind::NoValueNoDefault, "\"" + name_ + "\" has no value nor default value");
    }
    const ValueKind actual = kindOf(*defaultValue_);
    if (actual != *kind_) {
        return Error(ErrorKind::DefaultTypeMismatch,
                     "Default value for --" + name_ + " must be " + std::string(kindName(*kind_)) + ", got " +
                         std::string(kindName(actual)));
    }
    PARG_DEBUG_LOG("accepting default for --", name_, ": ", parg::formatValue(*defaultValue_));
    value_ = *defaultValue_;
    return std::nullopt;
}

std::string Argument::formatValue() const {
    if (!kind_ || !value_) return {};
    return parg::formatValue(*value_);
}

std::string Argument::formatDefault() const {
    if (!kind_ || !defaultValue_) return {};
    return parg::formatValue(*defaultValue_);
}

std::ostream& operator<<(std::ostream& os, const Argument& arg) {
    os << "--" << arg.name();
    if (!arg.takesValue()) return os;
    return os << "=" << (arg.value() ? arg.formatValue() : "None");
}

} // namespace parg
