#include <cstddef>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "golden_bridge/request.hpp"
#include "golden_bridge/wire_codec.hpp"
#include "golden_refdump/dump_module.hpp"

using golden::bridge::ArgumentList;
using golden::bridge::Request;
using golden::refdump::DumpModule;

namespace {

constexpr std::string_view kWhitespace = " \t\r\f\v";

void print_usage(const char* argv0) {
    std::cerr << "Usage:\n"
              << "  " << argv0 << " <module> [key=value ...]\n"
              << "  " << argv0 << " batch   (reads one request per line from stdin)\n"
              << "\n"
              << "Available dumps:\n";
    for (const auto& name : golden::refdump::module_names()) {
        std::cerr << "  " << name << "\n";
    }
}

void report_error(const std::string& error, const DumpModule* module, const char* argv0) {
    std::cerr << "Error: " << error << "\n\n";
    if (module != nullptr) {
        std::cerr << "Module usage:\n  " << module->usage() << "\n";
    } else {
        print_usage(argv0);
    }
}

int run_single(int argc, char** argv) {
    if (argc < 2) {
        report_error("No dump module specified", nullptr, argv[0]);
        return 1;
    }

    const auto* module = golden::refdump::find_module(argv[1]);
    if (module == nullptr) {
        report_error("Unknown dump module: " + std::string{argv[1]}, nullptr, argv[0]);
        return 1;
    }

    ArgumentList arguments;
    for (int i = 2; i < argc; ++i) {
        const std::string token = argv[i];
        const auto eq = token.find('=');
        if (eq == std::string::npos || eq == 0 || eq + 1 == token.size()) {
            report_error("Invalid argument '" + token + "', expected key=value", module, argv[0]);
            return 1;
        }
        arguments.emplace_back(token.substr(0, eq), token.substr(eq + 1));
    }

    try {
        const auto table = module->run(Request::build(argv[1], std::move(arguments)));
        std::cout << golden::bridge::wire::encode_csv(table) << std::flush;
    } catch (const std::invalid_argument& ex) {
        report_error(ex.what(), module, argv[0]);
        return 1;
    }
    return 0;
}

// A malformed line aborts the batch; a request the modules reject only loses its frame.
int run_batch(const char* argv0) {
    std::string raw_line;
    std::size_t line_no = 0;
    while (std::getline(std::cin, raw_line)) {
        ++line_no;
        const auto begin = raw_line.find_first_not_of(kWhitespace);
        if (begin == std::string::npos) {
            continue;
        }
        const auto end = raw_line.find_last_not_of(kWhitespace);
        const auto request = Request::parse_wire_line(std::string_view{raw_line}.substr(begin, end - begin + 1));

        const auto* module = golden::refdump::find_module(request.module());
        if (module == nullptr) {
            std::cerr << "Error: line " << line_no << ": unknown dump module: " << request.module() << "\n";
            continue;
        }
        try {
            const auto table = module->run(request);
            std::cout << golden::bridge::wire::encode_frame(request, table) << "\n";
        } catch (const std::invalid_argument& ex) {
            std::cerr << "Error: line " << line_no << ": " << ex.what() << "\n";
            std::cerr << "Module usage:\n  " << module->usage() << "\n";
        }
    }
    if (std::cin.bad()) {
        std::cerr << argv0 << ": error reading batch input\n";
        return 1;
    }
    std::cout << std::flush;
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    try {
        if (argc > 1 && std::string_view{argv[1]} == "batch") {
            return run_batch(argv[0]);
        }
        return run_single(argc, argv);
    } catch (const std::exception& ex) {
        std::cout << std::flush;
        std::cerr << "Exception caught in golden_refdump: " << ex.what() << "\n";
        return 1;
    }
}
