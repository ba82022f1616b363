#include <cstdint>
#include <iostream>
#include <string>

#include "parg/parg.hpp"

int main(int argc, char** argv) {
    parg::ArgumentRegistry cli;
    cli.add(parg::Argument::withDefaultValue("thread", parg::ValueKind::U8, parg::makeValue<parg::ValueKind::U8>(42), false)
                .setDescription("worker threads"))
        .add(parg::Argument::withDefaultValue("ratio", parg::ValueKind::F64, parg::makeValue<parg::ValueKind::F64>(0.5), false)
                 .setDescription("sampling ratio"))
        .add(parg::Argument::withDefaultValue("sep", parg::ValueKind::Char, parg::makeValue<parg::ValueKind::Char>(U','), false)
                 .setDescription("field separator"))
        .add(parg::Argument::withoutValue("verbose", false).setDescription("print every argument"))
        .setInfo("default_values", "Arguments that fall back to defaults");

    if (const auto err = cli.parse(argc, argv)) {
        if (err->isHelpRequested()) return 0;
        std::cerr << err->message << "\n";
        return 1;
    }

    std::cout << "thread=" << static_cast<unsigned>(cli.getOr<parg::ValueKind::U8>("thread", 0)) << "\n";
    std::cout << "ratio=" << cli.getOr<parg::ValueKind::F64>("ratio", 0.0) << "\n";
    const char32_t sep = cli.getOr<parg::ValueKind::Char>("sep", U' ');
    std::cout << "sep=" << parg::formatValue(parg::makeValue<parg::ValueKind::Char>(sep)) << "\n";

    if (cli.exists("verbose")) std::cout << cli;
    return 0;
}
