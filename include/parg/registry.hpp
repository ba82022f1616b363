#ifndef PARG_REGISTRY_HPP
#define PARG_REGISTRY_HPP

#include <cstddef>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "argument.hpp"
#include "error.hpp"
#include "value.hpp"

namespace parg {

// Name-ordered set of arguments and the parser that fills them.
//
// parse() resets every argument before walking the tokens, so one registry can be
// parsed again with another token list. It is not safe to parse from several
// threads at once; exists()/get() only read and may run concurrently with each other.
class ArgumentRegistry {
public:
    struct Options {
        bool allowUnknownFlags{true};       // ignore `--name` tokens nobody registered
        bool suggestFlags{true};            // "did you mean" hint when unknown flags are rejected
        std::size_t suggestionsMinimumDistance{2};
        bool consumedValueIsFlag{false};    // also test a token consumed as a value as a new flag
        bool helpFlag{true};                // `--help` (any case) prints usage and stops
    };

    using Map = std::map<std::string, Argument>;
    using const_iterator = Map::const_iterator;
    using TokenIterator = std::vector<std::string>::const_iterator;

    ArgumentRegistry() = default;
    explicit ArgumentRegistry(std::vector<Argument> args);
    ArgumentRegistry(std::vector<Argument> args, Options options);

    // Registers `arg`, replacing any argument of the same name.
    ArgumentRegistry& add(Argument arg);

    ArgumentRegistry& setInfo(std::string appName, std::string description) {
        appName_ = std::move(appName);
        description_ = std::move(description);
        return *this;
    }

    ArgumentRegistry& setOptions(Options options) {
        options_ = options;
        return *this;
    }

    // Stream `--help` writes usage to. Defaults to std::cout.
    ArgumentRegistry& setOut(std::ostream& os) {
        out_ = &os;
        return *this;
    }

    [[nodiscard]] const Options& options() const { return options_; }
    [[nodiscard]] const std::string& appName() const { return appName_; }
    [[nodiscard]] const std::string& description() const { return description_; }

    // Parses argv[1..argc).
    std::optional<Error> parse(int argc, char** argv);
    std::optional<Error> parse(const std::vector<std::string>& tokens);
    // Parses [first, last), e.g. what follows a leading program or command name.
    std::optional<Error> parseSubset(TokenIterator first, TokenIterator last);

    // True if `name` is registered and was given in the last parse.
    [[nodiscard]] bool exists(const std::string& name) const;

    // Reads the value of `name` into `out`: the parsed value, else the default.
    // The argument must be declared with kind `K`; get<ValueKind::U64> on a usize argument fails.
    template <ValueKind K>
    std::optional<Error> get(const std::string& name, KindType_t<K>& out) const {
        return read(name, out, [](ValueKind declared) { return declared == K; });
    }

    // Same, keyed on the C++ type: `T` must be the native type of the argument's kind
    // (std::uint8_t for u8, std::string for String, ...). Kinds that share a native type
    // (usize and u64 on LP64) are not told apart; use the kind-keyed form for that.
    template <typename T>
    std::optional<Error> get(const std::string& name, T& out) const {
        return read(name, out, [](ValueKind declared) { return nativeTypeMatches<T>(declared); });
    }

    // get(), or `fallback` if it fails.
    template <ValueKind K>
    KindType_t<K> getOr(const std::string& name, KindType_t<K> fallback) const {
        KindType_t<K> out{};
        if (get<K>(name, out)) return fallback;
        return out;
    }

    template <typename T>
    T getOr(const std::string& name, T fallback) const {
        T out{};
        if (get(name, out)) return fallback;
        return out;
    }

    [[nodiscard]] const Argument* find(const std::string& name) const;

    [[nodiscard]] const_iterator begin() const { return args_.begin(); }
    [[nodiscard]] const_iterator end() const { return args_.end(); }
    [[nodiscard]] std::size_t size() const { return args_.size(); }

    [[nodiscard]] std::string generateUsage() const;
    void printUsage(std::ostream& os) const;

private:
    void resetArgs();
    std::optional<Error> readValue(const std::string& token, const std::string& name);
    std::optional<Error> checkArgs();
    [[nodiscard]] Error unknownFlag(const std::string& name) const;
    [[nodiscard]] std::ostream& out() const;

    template <typename T, typename KindMatch>
    std::optional<Error> read(const std::string& name, T& out, KindMatch kindMatches) const;

    template <typename T>
    static bool extract(const Value& v, T& out);

    Map args_;
    Options options_;
    std::string appName_;
    std::string description_;
    std::ostream* out_{nullptr};
};

// Every argument in name order, one per line.
std::ostream& operator<<(std::ostream& os, const ArgumentRegistry& registry);

template <typename T>
bool ArgumentRegistry::extract(const Value& v, T& out) {
    return std::visit(
        [&out](const auto& x) -> bool {
            if constexpr (std::is_same_v<std::decay_t<decltype(x)>, T>) {
                out = x;
                return true;
            } else {
                return false;
            }
        },
        v);
}

template <typename T, typename KindMatch>
std::optional<Error> ArgumentRegistry::read(const std::string& name, T& out, KindMatch kindMatches) const {
    const auto it = args_.find(name);
    if (it == args_.end()) return Error(ErrorKind::UnknownArgument, "Argument " + name + " does not exist");

    const Argument& arg = it->second;
    if (!arg.takesValue()) return Error(ErrorKind::NotValueTaking, "Argument " + name + " does not take a value");

    const ValueKind kind = *arg.kind();
    if (!kindMatches(kind)) {
        return Error(ErrorKind::TypeMismatch,
                     "The requested type for \"" + name + "\" does not match the reading type " +
                         std::string(kindName(kind)));
    }

    const Value* resolved = nullptr;
    if (arg.value()) {
        resolved = &*arg.value();
    } else if (arg.defaultValue()) {
        resolved = &*arg.defaultValue();
    } else {
        return Error(ErrorKind::NoValueNoDefault, "\"" + name + "\" has no value nor default value");
    }

    if (kindOf(*resolved) != kind || !extract(*resolved, out)) {
        return Error(ErrorKind::InternalCast, "Error casting argument " + name + " to " + std::string(kindName(kind)));
    }
    return std::nullopt;
}

} // namespace parg

#endif // PARG_REGISTRY_HPP
