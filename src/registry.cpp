#include "parg/registry.hpp"

#include <iostream>
#include <sstream>
#include <stdexcept>

#include "parg/debug.hpp"
#include "parg/utils.hpp"

namespace parg {

ArgumentRegistry::ArgumentRegistry(std::vector<Argument> args) : ArgumentRegistry(std::move(args), Options{}) {}

ArgumentRegistry::ArgumentRegistry(std::vector<Argument> args, Options options) : options_(options) {
    for (auto& arg : args) add(std::move(arg));
}

ArgumentRegistry& ArgumentRegistry::add(Argument arg) {
    std::string name = arg.name();
    args_.insert_or_assign(std::move(name), std::move(arg));
    return *this;
}

std::optional<Error> ArgumentRegistry::parse(int argc, char** argv) {
    std::vector<std::string> tokens;
    if (argc > 1) tokens.reserve(static_cast<std::size_t>(argc - 1));
    for (int i = 1; i < argc; ++i) tokens.emplace_back(argv[i]);
    return parseSubset(tokens.begin(), tokens.end());
}

std::optional<Error> ArgumentRegistry::parse(const std::vector<std::string>& tokens) {
    return parseSubset(tokens.begin(), tokens.end());
}

std::optional<Error> ArgumentRegistry::parseSubset(TokenIterator first, TokenIterator last) {
    resetArgs();

    // One token of lookahead: a value-taking flag leaves its name pending for the next token.
    std::string pending;
    bool consumingValue = false;

    for (auto it = first; it != last; ++it) {
        const std::string& token = *it;

        if (consumingValue) {
            consumingValue = false;
            if (auto err = readValue(token, pending)) return err;
            if (!options_.consumedValueIsFlag) continue;
        }

        if (token.size() < 3 || token.compare(0, 2, "--") != 0) continue;
        std::string name = token.substr(2);

        if (options_.helpFlag && utils::equalsNoCase(name, "help")) {
            PARG_DEBUG_LOG("help requested by ", token);
            printUsage(out());
            return Error::helpRequested();
        }

        const auto found = args_.find(name);
        if (found == args_.end()) {
            if (!options_.allowUnknownFlags) return unknownFlag(name);
            PARG_DEBUG_LOG("ignoring unknown flag ", token);
            continue;
        }

        Argument& arg = found->second;
        arg.markSeen();
        if (arg.takesValue()) {
            pending = std::move(name);
            consumingValue = true;
        } else {
            arg.markPresent();
        }
        PARG_DEBUG_LOG("matched --", found->first, arg.takesValue() ? " (awaiting value)" : "");
    }

    return checkArgs();
}

bool ArgumentRegistry::exists(const std::string& name) const {
    const auto it = args_.find(name);
    return it != args_.end() && it->second.seen();
}

const Argument* ArgumentRegistry::find(const std::string& name) const {
    const auto it = args_.find(name);
    if (it == args_.end()) return nullptr;
    return &it->second;
}

void ArgumentRegistry::resetArgs() {
    for (auto& [name, arg] : args_) arg.reset();
}

std::optional<Error> ArgumentRegistry::readValue(const std::string& token, const std::string& name) {
    const auto it = args_.find(name);
    if (it == args_.end()) return std::nullopt;

    Argument& arg = it->second;
    const ValueKind kind = *arg.kind();
    try {
        arg.setValue(parseValue(kind, token));
    } catch (const std::invalid_argument& e) {
        PARG_DEBUG_LOG("rejected value ", token, " for --", name, ": ", e.what());
        return Error(ErrorKind::Conversion,
                     "Argument value " + token + " for " + name + " must be " + std::string(kindName(kind)) + ": " +
                         e.what());
    }
    PARG_DEBUG_LOG("--", name, " = ", arg.formatValue());
    return std::nullopt;
}

std::optional<Error> ArgumentRegistry::checkArgs() {
    for (auto& [name, arg] : args_) {
        if (!arg.seen()) {
            if (!arg.hasDefault()) {
                if (arg.required()) return Error(ErrorKind::MissingRequired, "Argument --" + name + " is required");
            } else if (auto err = arg.acceptDefault()) {
                return err;
            }
        }

        if (arg.seen() && arg.takesValue() && !arg.value()) {
            if (!arg.hasDefault()) return Error(ErrorKind::MissingValue, "Argument --" + name + " needs a value");
            if (auto err = arg.acceptDefault()) return err;
        }
    }
    return std::nullopt;
}

Error ArgumentRegistry::unknownFlag(const std::string& name) const {
    std::string msg = "Argument --" + name + " does not exist";
    if (options_.suggestFlags) {
        std::vector<std::string> names;
        names.reserve(args_.size());
        for (const auto& [known, arg] : args_) names.push_back(known);
        const auto hints = utils::suggest(name, names, options_.suggestionsMinimumDistance);
        if (!hints.empty()) {
            msg += "\n\nDid you mean this?\n";
            for (const auto& h : hints) msg += "\t--" + h + "\n";
        }
    }
    PARG_DEBUG_LOG("rejecting unknown flag --", name);
    return Error(ErrorKind::UnknownArgument, std::move(msg));
}

std::ostream& ArgumentRegistry::out() const {
    if (out_) return *out_;
    return std::cout;
}

std::string ArgumentRegistry::generateUsage() const {
    std::ostringstream os;
    os << description_ << "\n";

    os << "Usage:\n" << appName_;
    for (const auto& entry : args_) os << " --" << entry.first << " <value>";
    os << "\n\n";

    os << "Arguments:\n";
    for (const auto& [name, arg] : args_) {
        os << "--" << name << " <value>    " << arg.description() << " (default: " << arg.formatDefault() << ")\n";
    }
    os << "--help    Display this help message\n";
    return os.str();
}

void ArgumentRegistry::printUsage(std::ostream& os) const { os << generateUsage(); }

std::ostream& operator<<(std::ostream& os, const ArgumentRegistry& registry) {
    for (const auto& [name, arg] : registry) os << arg << "\n";
    return os;
}

} // namespace parg
