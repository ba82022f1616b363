#include <cstdint>
#include <iostream>
#include <string>

#include "parg/parg.hpp"

int main(int argc, char** argv) {
    auto threshold = parg::Argument::withValue("threshold", parg::ValueKind::U8, true);
    threshold.setDescription("a little description for the argument");
    auto path = parg::Argument::withValue("path", parg::ValueKind::String, true);
    path.setDescription("file to read");

    parg::ArgumentRegistry cli({path, threshold});
    cli.setInfo("basic_usage", "Reads a file and filters it by threshold");

    if (const auto err = cli.parse(argc, argv)) {
        if (err->isHelpRequested()) return 0;
        std::cerr << err->message << "\n";
        return 1;
    }

    std::uint8_t thresholdValue = 0;
    if (const auto err = cli.get<parg::ValueKind::U8>("threshold", thresholdValue)) {
        std::cerr << err->message << "\n";
        return 1;
    }
    std::cout << "threshold = " << static_cast<unsigned>(thresholdValue) << "\n";
    std::cout << "path = " << cli.getOr<parg::ValueKind::String>("path", "") << "\n";

    // threshold is u8; asking for another kind is refused.
    std::uint16_t wide = 0;
    if (const auto err = cli.get<parg::ValueKind::U16>("threshold", wide)) std::cout << err->message << "\n";
    return 0;
}
