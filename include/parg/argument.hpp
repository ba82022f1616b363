#ifndef PARG_ARGUMENT_HPP
#define PARG_ARGUMENT_HPP

#include <optional>
#include <ostream>
#include <string>
#include <utility>

#include "error.hpp"
#include "value.hpp"

namespace parg {

class ArgumentRegistry;

// Declaration of one `--name` argument plus the state of the most recent parse.
//
// The declaration (name, kind, required, default, description) is fixed once the
// argument is handed to a registry. `seen()` and `value()` are reset and refilled
// by every ArgumentRegistry::parse call.
class Argument {
public:
    // `--name <value>`, read as `kind`.
    static Argument withValue(std::string name, ValueKind kind, bool required);

    // Like withValue, falling back to `defaultValue` when the argument is absent.
    // The default must hold a value of `kind`; a mismatch surfaces from acceptDefault().
    static Argument withDefaultValue(std::string name, ValueKind kind, Value defaultValue, bool required);

    // Presence-only `--name`.
    static Argument withoutValue(std::string name, bool required);

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::string& description() const { return description_; }
    [[nodiscard]] const std::optional<ValueKind>& kind() const { return kind_; }
    [[nodiscard]] bool takesValue() const { return kind_.has_value(); }
    [[nodiscard]] bool required() const { return required_; }
    [[nodiscard]] bool hasDefault() const { return defaultValue_.has_value(); }
    [[nodiscard]] const std::optional<Value>& defaultValue() const { return defaultValue_; }

    [[nodiscard]] bool seen() const { return seen_; }
    [[nodiscard]] const std::optional<Value>& value() const { return value_; }

    Argument& setDescription(std::string description) {
        description_ = std::move(description);
        return *this;
    }

    // Copies the default into the current value after checking it against the declared kind.
    std::optional<Error> acceptDefault();

    // Current value in its native text form; empty when unset or when the argument takes no value.
    [[nodiscard]] std::string formatValue() const;
    [[nodiscard]] std::string formatDefault() const;

private:
    friend class ArgumentRegistry;

    Argument(std::string name, std::optional<ValueKind> kind, std::optional<Value> defaultValue, bool required);

    void reset() {
        seen_ = false;
        value_.reset();
    }

    void markSeen() { seen_ = true; }
    void markPresent() { value_ = makeValue<ValueKind::Bool>(true); }
    void setValue(Value v) { value_ = std::move(v); }

    std::string name_;                   // threshold (from --threshold)
    std::string description_;            // shown in usage
    std::optional<ValueKind> kind_;      // empty: presence-only
    std::optional<Value> defaultValue_;
    bool required_{false};

    bool seen_{false};
    std::optional<Value> value_;
};

// `--name=value`, `--name=None` while unset, `--name` for presence-only arguments.
std::ostream& operator<<(std::ostream& os, const Argument& arg);

} // namespace parg

#endif // PARG_ARGUMENT_HPP
