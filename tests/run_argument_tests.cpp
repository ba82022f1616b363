#include <parg/argument.hpp>

#include <iostream>
#include <stdexcept>
#include <string>

namespace {

    using parg::Argument;
    using parg::ErrorKind;
    using parg::ValueKind;

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    static bool test_construction_() {
        const auto threshold = Argument::withValue("threshold", ValueKind::U8, true);
        const auto thread = Argument::withDefaultValue("thread", ValueKind::U8, parg::makeValue<ValueKind::U8>(42), false);
        const auto verbose = Argument::withoutValue("verbose", false);

        bool ok = true;
        ok &= require_(threshold.name() == "threshold", "name is kept");
        ok &= require_(threshold.takesValue() && *threshold.kind() == ValueKind::U8, "value kind is kept");
        ok &= require_(threshold.required(), "required is kept");
        ok &= require_(!threshold.hasDefault(), "withValue has no default");
        ok &= require_(thread.hasDefault() && !thread.required(), "withDefaultValue keeps its default");
        ok &= require_(!verbose.takesValue() && !verbose.kind().has_value(), "withoutValue takes no value");
        ok &= require_(!verbose.hasDefault(), "withoutValue has no default");
        ok &= require_(!threshold.seen() && !threshold.value().has_value(), "fresh argument has no run state");
        return ok;
    }

    static bool test_name_marker_stripped_() {
        bool ok = true;
        ok &= require_(Argument::withValue("--threshold", ValueKind::U8, true).name() == "threshold",
                       "leading -- is stripped");
        ok &= require_(Argument::withoutValue("-v", false).name() == "v", "leading - is stripped");
        ok &= require_(Argument::withoutValue("dry-run", false).name() == "dry-run", "inner dashes are kept");

        bool threw = false;
        try {
            (void)Argument::withoutValue("--", false);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        ok &= require_(threw, "a name that is only a marker is rejected");

        threw = false;
        try {
            (void)Argument::withValue("", ValueKind::String, false);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        ok &= require_(threw, "an empty name is rejected");
        return ok;
    }

    static bool test_accept_default_() {
        auto thread = Argument::withDefaultValue("thread", ValueKind::U8, parg::makeValue<ValueKind::U8>(42), false);

        bool ok = true;
        ok &= require_(thread.formatValue().empty(), "no value before the default is accepted");
        ok &= require_(!thread.acceptDefault().has_value(), "matching default is accepted");
        ok &= require_(thread.value().has_value() && std::get<std::uint8_t>(*thread.value()) == 42,
                       "default is copied into the value");
        ok &= require_(thread.formatValue() == "42", "accepted default formats");
        return ok;
    }

    static bool test_accept_default_failures_() {
        auto mismatched =
            Argument::withDefaultValue("ratio", ValueKind::F64, parg::makeValue<ValueKind::F32>(0.5f), false);
        const auto mismatch = mismatched.acceptDefault();

        auto noDefault = Argument::withValue("path", ValueKind::String, false);
        const auto missing = noDefault.acceptDefault();

        auto presence = Argument::withoutValue("verbose", false);
        const auto noKind = presence.acceptDefault();

        bool ok = true;
        ok &= require_(mismatch && mismatch->kind == ErrorKind::DefaultTypeMismatch, "kind mismatch is reported");
        ok &= require_(mismatch && mismatch->message.find("f64") != std::string::npos &&
                           mismatch->message.find("f32") != std::string::npos,
                       "mismatch names both kinds");
        ok &= require_(!mismatched.value().has_value(), "mismatched default is not copied");
        ok &= require_(missing && missing->kind == ErrorKind::NoValueNoDefault, "no default to accept");
        ok &= require_(noKind && noKind->kind == ErrorKind::MissingValueKind, "presence flag has no value kind");
        return ok;
    }

    static bool test_format_default_() {
        const auto ratio = Argument::withDefaultValue("ratio", ValueKind::F64, parg::makeValue<ValueKind::F64>(2.5), false);
        const auto sep = Argument::withDefaultValue("sep", ValueKind::Char, parg::makeValue<ValueKind::Char>(U','), false);
        const auto out =
            Argument::withDefaultValue("out", ValueKind::String, parg::makeValue<ValueKind::String>("a.txt"), false);
        const auto plain = Argument::withValue("plain", ValueKind::I32, false);
        const auto flag = Argument::withoutValue("flag", false);

        bool ok = true;
        ok &= require_(ratio.formatDefault() == "2.5", "f64 default");
        ok &= require_(sep.formatDefault() == ",", "char default");
        ok &= require_(out.formatDefault() == "a.txt", "string default");
        ok &= require_(plain.formatDefault().empty(), "no default formats empty");
        ok &= require_(flag.formatDefault().empty() && flag.formatValue().empty(), "presence flag formats empty");
        return ok;
    }

    static bool test_description_() {
        auto path = Argument::withValue("path", ValueKind::String, true);
        path.setDescription("input file");

        bool ok = true;
        ok &= require_(path.description() == "input file", "description is kept");
        ok &= require_(Argument::withoutValue("q", false).description().empty(), "description defaults to empty");
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"construction", test_construction_},
        {"name_marker_stripped", test_name_marker_stripped_},
        {"accept_default", test_accept_default_},
        {"accept_default_failures", test_accept_default_failures_},
        {"format_default", test_format_default_},
        {"description", test_description_},
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
