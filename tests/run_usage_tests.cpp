#include <parg/parg.hpp>

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

    using parg::Argument;
    using parg::ArgumentRegistry;
    using parg::ValueKind;

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    static ArgumentRegistry make_described_registry_() {
        auto path = Argument::withValue("path", ValueKind::String, true);
        path.setDescription("input path");
        auto threshold =
            Argument::withDefaultValue("threshold", ValueKind::U8, parg::makeValue<ValueKind::U8>(42), false);
        threshold.setDescription("a little description for the argument");
        auto verbose = Argument::withoutValue("verbose", false);
        verbose.setDescription("chatty output");

        ArgumentRegistry reg({path, threshold, verbose});
        reg.setInfo("my_command", "The description");
        return reg;
    }

    static bool test_usage_layout_() {
        const auto reg = make_described_registry_();
        const std::string expected =
            "The description\n"
            "Usage:\n"
            "my_command --path <value> --threshold <value> --verbose <value>\n"
            "\n"
            "Arguments:\n"
            "--path <value>    input path (default: )\n"
            "--threshold <value>    a little description for the argument (default: 42)\n"
            "--verbose <value>    chatty output (default: )\n"
            "--help    Display this help message\n";

        bool ok = true;
        ok &= require_(reg.generateUsage() == expected, "usage text layout");
        if (!ok) std::cerr << reg.generateUsage();
        return ok;
    }

    static bool test_usage_ignores_run_state_() {
        auto reg = make_described_registry_();
        const std::string before = reg.generateUsage();
        const auto err = reg.parse({"--path", "x", "--threshold", "7", "--verbose"});

        bool ok = true;
        ok &= require_(!err, "parse succeeds");
        ok &= require_(reg.generateUsage() == before, "usage shows defaults, not parsed values");
        return ok;
    }

    static bool test_print_usage_and_help_() {
        auto reg = make_described_registry_();
        std::ostringstream direct;
        reg.printUsage(direct);

        std::ostringstream viaHelp;
        reg.setOut(viaHelp);
        const auto err = reg.parse({"--HELP"});

        bool ok = true;
        ok &= require_(direct.str() == reg.generateUsage(), "printUsage writes generateUsage");
        ok &= require_(err && err->isHelpRequested(), "--HELP requests help");
        ok &= require_(viaHelp.str() == direct.str(), "--help renders the same usage");
        return ok;
    }

    static bool test_empty_registry_usage_() {
        ArgumentRegistry reg;
        reg.setInfo("bare", "");
        const std::string expected =
            "\n"
            "Usage:\n"
            "bare\n"
            "\n"
            "Arguments:\n"
            "--help    Display this help message\n";

        bool ok = true;
        ok &= require_(reg.generateUsage() == expected, "usage with no arguments");
        ok &= require_(reg.appName() == "bare" && reg.description().empty(), "info is kept");
        return ok;
    }

    static bool test_iteration_for_display_() {
        const auto reg = make_described_registry_();
        std::vector<std::string> names;
        for (const auto& [name, arg] : reg) {
            if (arg.takesValue()) names.push_back(name);
        }

        bool ok = true;
        ok &= require_(names.size() == 2 && names[0] == "path" && names[1] == "threshold",
                       "value-taking arguments in name order");
        return ok;
    }

    static std::string streamed_(const Argument& arg) {
        std::ostringstream os;
        os << arg;
        return os.str();
    }

    static bool test_argument_display_() {
        auto reg = make_described_registry_();

        bool ok = true;
        ok &= require_(streamed_(*reg.find("path")) == "--path=None", "unset value shows None");
        ok &= require_(streamed_(*reg.find("verbose")) == "--verbose", "presence flag shows its name only");

        const auto err = reg.parse({"--path", "in.txt", "--verbose"});
        ok &= require_(!err, "parse succeeds");
        ok &= require_(streamed_(*reg.find("path")) == "--path=in.txt", "parsed value is shown");
        ok &= require_(streamed_(*reg.find("threshold")) == "--threshold=42", "accepted default is shown");
        ok &= require_(streamed_(*reg.find("verbose")) == "--verbose", "seen presence flag shows its name only");
        return ok;
    }

    static bool test_registry_display_() {
        auto reg = make_described_registry_();
        std::ostringstream before;
        before << reg;

        const auto err = reg.parse({"--threshold", "7", "--path", "a b"});
        std::ostringstream after;
        after << reg;

        bool ok = true;
        ok &= require_(before.str() == "--path=None\n--threshold=None\n--verbose\n", "one line per argument");
        ok &= require_(!err, "parse succeeds");
        ok &= require_(after.str() == "--path=a b\n--threshold=7\n--verbose\n", "lines follow name order");

        std::ostringstream empty;
        empty << ArgumentRegistry();
        ok &= require_(empty.str().empty(), "empty registry prints nothing");
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"usage_layout", test_usage_layout_},
        {"usage_ignores_run_state", test_usage_ignores_run_state_},
        {"print_usage_and_help", test_print_usage_and_help_},
        {"empty_registry_usage", test_empty_registry_usage_},
        {"iteration_for_display", test_iteration_for_display_},
        {"argument_display", test_argument_display_},
        {"registry_display", test_registry_display_},
    };

    int failed = 0;
    for (const auto& c : cases) {
        std::cout << "[TEST] " << c.name << "\n";
        if (!c.fn()) {
            ++failed;
            std::cout << "  -> FAIL\n";
        } else {
            std::cout << "  -> PASS\n";
        }
    }

    if (failed != 0) {
        std::cout << "\nFAILED " << failed << " test(s)\n";
        return 1;
    }
    std::cout << "\nALL TESTS PASSED\n";
    return 0;
}
