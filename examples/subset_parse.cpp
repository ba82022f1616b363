#include <iostream>
#include <string>
#include <vector>

#include "parg/parg.hpp"

// app <command> [--flags...]: the command word is read by hand, the rest by the registry.
int main(int argc, char** argv) {
    const std::vector<std::string> tokens(argv, argv + argc);
    if (tokens.size() < 2) {
        std::cerr << "usage: subset_parse <command> [--name <value>] [--shout]\n";
        return 1;
    }

    parg::ArgumentRegistry cli({
        parg::Argument::withDefaultValue("name", parg::ValueKind::String, parg::makeValue<parg::ValueKind::String>("world"), false),
        parg::Argument::withoutValue("shout", false),
    });
    cli.setInfo("subset_parse " + tokens[1], "Greets someone");

    if (const auto err = cli.parseSubset(tokens.begin() + 2, tokens.end())) {
        if (err->isHelpRequested()) return 0;
        std::cerr << err->message << "\n";
        return 1;
    }

    std::string greeting = tokens[1] + ", " + cli.getOr<parg::ValueKind::String>("name", "") + (cli.exists("shout") ? "!" : ".");
    std::cout << greeting << "\n";
    return 0;
}
