#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "golden_bridge/declaration_loader.hpp"
#include "golden_bridge/errors.hpp"
#include "golden_bridge/orchestrator.hpp"
#include "golden_bridge/process_oracle.hpp"
#include "golden_bridge/report_writer.hpp"
#include "golden_bridge/result_cache.hpp"
#include "golden_bridge/schema.hpp"
#include "golden_bridge/schema_validator.hpp"
#include "golden_bridge/session_report.hpp"
#include "golden_bridge/wire_codec.hpp"

using golden::bridge::ArgumentList;
using golden::bridge::BridgeError;
using golden::bridge::DeclarationLoader;
using golden::bridge::ErrorCategory;
using golden::bridge::OracleDeclaration;
using golden::bridge::Orchestrator;
using golden::bridge::ProcessOracle;
using golden::bridge::ReportWriter;
using golden::bridge::Request;
using golden::bridge::ResultCache;
using golden::bridge::SchemaRegistry;
using golden::bridge::SchemaViolationError;

namespace {

enum class Command { none, run, single };

struct Args {
    Command command{Command::none};
    std::filesystem::path oracle;
    std::vector<std::string> oracle_args;
    std::vector<std::string> batch_args;
    std::vector<std::filesystem::path> declaration_paths;
    std::filesystem::path schema_path{};
    std::vector<std::string> filters;
    std::filesystem::path artifact_root{"build/golden"};
    std::filesystem::path summary_path{};
    std::filesystem::path html_path{};
    long long timeout_ms{0};
    bool emit_html{true};
    bool help{false};

    // single mode
    std::string module;
    ArgumentList arguments;
};

void print_usage(const char* argv0) {
    std::cerr
        << "Golden reference bridge\n"
        << "Usage:\n"
        << "  " << argv0 << " run --oracle <exe> --declarations <file-or-dir> [--declarations <file-or-dir> ...]\n"
        << "                 [--oracle-arg <arg>]... [--batch-arg <arg>]... [--schemas <json>]\n"
        << "                 [--filter <substring>]... [--artifact-dir <dir>] [--summary <path>]\n"
        << "                 [--html <path>] [--timeout-ms <n>] [--ci]\n"
        << "  " << argv0 << " single --oracle <exe> [--oracle-arg <arg>]... [--schemas <json>]\n"
        << "                 [--timeout-ms <n>] <module> [key=value]...\n"
        << "\n"
        << "Options:\n"
        << "  --oracle       Reference oracle executable (bare names are searched on PATH).\n"
        << "  --oracle-arg   Argument passed to the oracle before the mode arguments.\n"
        << "  --batch-arg    Argument selecting batch mode (default: batch).\n"
        << "  --declarations One or more declaration files or directories.\n"
        << "  --schemas      JSON schema registry (default: built-in reference schemas).\n"
        << "  --filter       Only collect tests whose name contains this substring.\n"
        << "  --artifact-dir Root directory for outputs (default: build/golden).\n"
        << "  --summary      Write JSON summary to this path (default: <artifact-dir>/summary.json).\n"
        << "  --html         Write HTML report to this path (default: <artifact-dir>/report.html).\n"
        << "  --timeout-ms   Kill the oracle after this many milliseconds (default: no limit).\n"
        << "  --ci           CI mode: suppress HTML generation (JSON only).\n"
        << "  -h, --help     Show this help message.\n"
        << "\n"
        << "Exit codes: 0 all requests resolved, 1 missing or invalid reference data,\n"
        << "            2 configuration or oracle failure, 3 internal error.\n"
        << std::endl;
}

bool arg_eq(std::string_view a, std::string_view b) {
    return a == b;
}

const char* expect_value(int& i, int argc, char** argv, std::string_view flag) {
    if (i + 1 >= argc) {
        throw std::runtime_error(std::string{flag} + " expects a value");
    }
    return argv[++i];
}

Args parse_args(int argc, char** argv) {
    Args args;
    int i = 1;
    if (i < argc) {
        std::string_view first = argv[i];
        if (arg_eq(first, "run")) {
            args.command = Command::run;
            ++i;
        } else if (arg_eq(first, "single")) {
            args.command = Command::single;
            ++i;
        }
    }

    std::vector<std::string> positional;
    for (; i < argc; ++i) {
        std::string_view tok = argv[i];
        if (arg_eq(tok, "-h") || arg_eq(tok, "--help")) {
            args.help = true;
            return args;
        } else if (arg_eq(tok, "--oracle")) {
            args.oracle = expect_value(i, argc, argv, tok);
        } else if (arg_eq(tok, "--oracle-arg")) {
            args.oracle_args.emplace_back(expect_value(i, argc, argv, tok));
        } else if (arg_eq(tok, "--batch-arg")) {
            args.batch_args.emplace_back(expect_value(i, argc, argv, tok));
        } else if (arg_eq(tok, "--declarations")) {
            args.declaration_paths.emplace_back(expect_value(i, argc, argv, tok));
        } else if (arg_eq(tok, "--schemas")) {
            args.schema_path = expect_value(i, argc, argv, tok);
        } else if (arg_eq(tok, "--filter")) {
            args.filters.emplace_back(expect_value(i, argc, argv, tok));
        } else if (arg_eq(tok, "--artifact-dir")) {
            args.artifact_root = expect_value(i, argc, argv, tok);
        } else if (arg_eq(tok, "--summary")) {
            args.summary_path = expect_value(i, argc, argv, tok);
        } else if (arg_eq(tok, "--html")) {
            args.html_path = expect_value(i, argc, argv, tok);
        } else if (arg_eq(tok, "--timeout-ms")) {
            const std::string value = expect_value(i, argc, argv, tok);
            std::size_t consumed = 0;
            args.timeout_ms = std::stoll(value, &consumed);
            if (consumed != value.size() || args.timeout_ms < 0) {
                throw std::runtime_error("--timeout-ms expects a non-negative integer, got '" + value + "'");
            }
        } else if (arg_eq(tok, "--ci")) {
            args.emit_html = false;
        } else if (args.command == Command::run) {
            // Treat as declaration path for convenience
            args.declaration_paths.emplace_back(std::string(tok));
        } else {
            positional.emplace_back(tok);
        }
    }

    if (args.command == Command::none) {
        throw std::runtime_error("Expected a command: run or single");
    }
    if (args.oracle.empty()) {
        throw std::runtime_error("--oracle is required");
    }

    if (args.command == Command::run) {
        if (args.declaration_paths.empty()) {
            throw std::runtime_error("No declarations specified (--declarations)");
        }
        if (args.summary_path.empty()) {
            args.summary_path = args.artifact_root / "summary.json";
        }
        if (args.html_path.empty()) {
            args.html_path = args.artifact_root / "report.html";
        }
    } else {
        if (positional.empty()) {
            throw std::runtime_error("single expects a module name");
        }
        args.module = positional.front();
        for (std::size_t p = 1; p < positional.size(); ++p) {
            const auto& token = positional[p];
            const auto eq = token.find('=');
            if (eq == std::string::npos || eq == 0) {
                throw std::runtime_error("Expected 'key=value' argument, got '" + token + "'");
            }
            args.arguments.emplace_back(token.substr(0, eq), token.substr(eq + 1));
        }
    }

    return args;
}

SchemaRegistry load_schemas(const Args& args) {
    if (args.schema_path.empty()) {
        return SchemaRegistry::reference_schemas();
    }
    return SchemaRegistry::load_json(args.schema_path);
}

ProcessOracle::Config oracle_config(const Args& args, const std::filesystem::path& artifact_dir) {
    ProcessOracle::Config cfg;
    cfg.executable = args.oracle;
    cfg.leading_args = args.oracle_args;
    if (!args.batch_args.empty()) {
        cfg.batch_args = args.batch_args;
    }
    cfg.timeout = std::chrono::milliseconds(args.timeout_ms);
    cfg.artifact_dir = artifact_dir;
    return cfg;
}

bool selected_by_filters(const OracleDeclaration& declaration, const std::vector<std::string>& filters) {
    if (filters.empty()) {
        return true;
    }
    for (const auto& filter : filters) {
        if (declaration.test_name.find(filter) != std::string::npos) {
            return true;
        }
    }
    return false;
}

int run_session(const Args& args) {
    DeclarationLoader loader;
    golden::bridge::DeclarationRegistry registry;
    for (const auto& path : args.declaration_paths) {
        for (auto& declaration : loader.load_directory(path)) {
            registry.add(std::move(declaration));
        }
    }
    const auto selected = registry.select(
        [&args](const OracleDeclaration& declaration) { return selected_by_filters(declaration, args.filters); });

    const auto schemas = load_schemas(args);
    std::filesystem::create_directories(args.artifact_root);

    ProcessOracle oracle(oracle_config(args, args.artifact_root / "oracle"));
    ResultCache cache;
    Orchestrator orchestrator(oracle, cache, schemas, Orchestrator::Config{.log = &std::cerr});
    orchestrator.collect(selected);

    auto report = golden::bridge::evaluate_session(orchestrator, selected);
    report.oracle_invocations = oracle.invocations();

    ReportWriter writer;
    writer.write_summary(args.summary_path, report);
    if (args.emit_html) {
        writer.write_detailed(args.html_path, report);
    }

    std::cout << "Golden reference session\n"
              << "  Declarations: " << selected.size() << " of " << registry.size() << "\n"
              << "  Test invocations: " << report.outcomes.size()
              << "  Unique requests: " << report.unique_requests
              << "  Oracle invocations: " << report.oracle_invocations << "\n"
              << "  PASS: " << report.count("PASS") << "  MISSING: " << report.count("MISSING")
              << "  SCHEMA_ERROR: " << report.count("SCHEMA_ERROR") << "\n"
              << "Artifacts:\n"
              << "  JSON: " << args.summary_path << "\n";
    if (args.emit_html) {
        std::cout << "  HTML: " << args.html_path << "\n";
    }
    for (const auto& outcome : report.outcomes) {
        if (outcome.status != "PASS") {
            std::cerr << outcome.status << " " << outcome.test_name << ": " << outcome.message << "\n";
        }
    }

    return report.all_passed() ? 0 : 1;
}

int run_single(const Args& args) {
    const auto schemas = load_schemas(args);
    ProcessOracle oracle(oracle_config(args, {}));
    const auto request = Request::build(args.module, args.arguments);
    const auto table = oracle.run_single(request);

    if (!schemas.contains(request.module())) {
        std::cout << golden::bridge::wire::encode_csv(table);
        return 0;
    }

    try {
        const auto records = golden::bridge::validate(table, schemas.at(request.module()));
        std::cout << golden::bridge::wire::encode_csv(table);
        std::cerr << records.size() << " row(s) valid against schema '" << request.module() << "'\n";
        return 0;
    } catch (const SchemaViolationError& ex) {
        std::cerr << "SCHEMA_ERROR: " << ex.what() << "\n";
        return 1;
    }
}

}  // namespace

int main(int argc, char** argv) {
    try {
        const auto args = parse_args(argc, argv);
        if (args.help) {
            print_usage(argv[0]);
            return 0;
        }
        return args.command == Command::run ? run_session(args) : run_single(args);
    } catch (const BridgeError& ex) {
        std::cerr << "ERROR [" << golden::bridge::to_string(ex.category()) << "]: " << ex.what() << "\n";
        return ex.category() == ErrorCategory::data ? 1 : 2;
    } catch (const std::exception& ex) {
        std::cerr << "ERROR: " << ex.what() << "\n";
        print_usage(argv[0]);
        return 2;  // configuration/environment issue
    } catch (...) {
        std::cerr << "ERROR: Unknown exception\n";
        return 3;  // internal error
    }
}
