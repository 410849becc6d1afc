#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <iterator>

#include "bundle_validation/archive_bridge.hpp"
#include "bundle_validation/build_request.hpp"
#include "bundle_validation/engine.hpp"
#include "bundle_validation/metrics_writer.hpp"
#include "bundle_validation/packager_bridge.hpp"
#include "bundle_validation/platform.hpp"
#include "bundle_validation/scenario_loader.hpp"

using bundle::validation::DependencyGraph;
using bundle::validation::Engine;
using bundle::validation::MetricsWriter;
using bundle::validation::Platform;
using bundle::validation::ScenarioLoader;
using bundle::validation::ScenarioOutcome;
using bundle::validation::ScenarioPack;

namespace archive_bridge = bundle::validation::archive_bridge;
namespace packager_bridge = bundle::validation::packager_bridge;

namespace {

struct Args {
    std::vector<std::filesystem::path> scenario_paths;
    std::filesystem::path scripts_dir{"."};
    std::filesystem::path manifest_dir{};
    std::filesystem::path modules_dir{};
    std::filesystem::path work_root{"build/validation"};
    std::string packager{"pyinstaller"};
    std::string lister{};
    std::vector<std::string> lister_args{};
    std::filesystem::path graph_path{};
    Platform platform{bundle::validation::host_platform()};
    std::filesystem::path summary_path{};
    std::filesystem::path html_path{};
    bool emit_html{true};
    bool help{false};
};

void print_usage(const char* argv0) {
    std::cerr
        << "Bundle Validation CLI\n"
        << "Usage:\n"
        << "  " << argv0 << " --scenarios <file-or-dir> [--scenarios <file-or-dir> ...]\n"
        << "                 [--scripts-dir <dir>] [--manifest-dir <dir>] [--modules-dir <dir>]\n"
        << "                 [--work-dir <dir>] [--packager <exe>] [--lister <cmd>] [--lister-arg <arg> ...]\n"
        << "                 [--graph <file.json>]\n"
        << "                 [--platform windows|macos|unix] [--summary <path>] [--html <path>] [--ci]\n"
        << "\n"
        << "Options:\n"
        << "  --scenarios    One or more scenario files or directories (line-oriented *.scn).\n"
        << "  --scripts-dir  Directory relative script paths are resolved against (default: .).\n"
        << "  --manifest-dir Directory holding <name>.toc manifests (default: no manifest checks).\n"
        << "  --modules-dir  Shared module directory added to every build's search path (--paths).\n"
        << "  --work-dir     Root directory for scenario builds and reports (default: build/validation).\n"
        << "  --packager     Packaging tool executable (default: pyinstaller).\n"
        << "  --lister       Command printing the internal file names of an executable, one per line;\n"
        << "                 the executable path is appended (e.g. \"pyi-archive_viewer --list --brief\").\n"
        << "  --lister-arg   One more lister argument, taken verbatim; repeatable. Quote --lister\n"
        << "                 words containing spaces, or pass the executable alone and add the rest here.\n"
        << "  --graph        Precomputed dependency graph (JSON) shared by every build.\n"
        << "  --platform     Naming conventions to search artifacts with (default: host).\n"
        << "  --summary      Write JSON summary to this path (default: <work-dir>/summary.json).\n"
        << "  --html         Write HTML report to this path (default: <work-dir>/report.html).\n"
        << "  --ci           CI mode: suppress HTML generation (JSON only), deterministic paths.\n"
        << "  -h, --help     Show this help message.\n"
        << std::endl;
}

bool arg_eq(std::string_view a, std::string_view b) {
    return a == b;
}

const char* take_value(int argc, char** argv, int& i, std::string_view flag) {
    if (i + 1 >= argc) {
        throw std::runtime_error(std::string(flag) + " expects a value");
    }
    return argv[++i];
}

Args parse_args(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string_view tok = argv[i];
        if (arg_eq(tok, "-h") || arg_eq(tok, "--help")) {
            args.help = true;
            break;
        } else if (arg_eq(tok, "--scenarios")) {
            args.scenario_paths.emplace_back(take_value(argc, argv, i, tok));
        } else if (arg_eq(tok, "--scripts-dir")) {
            args.scripts_dir = take_value(argc, argv, i, tok);
        } else if (arg_eq(tok, "--manifest-dir")) {
            args.manifest_dir = take_value(argc, argv, i, tok);
        } else if (arg_eq(tok, "--modules-dir")) {
            args.modules_dir = take_value(argc, argv, i, tok);
        } else if (arg_eq(tok, "--work-dir")) {
            args.work_root = take_value(argc, argv, i, tok);
        } else if (arg_eq(tok, "--packager")) {
            args.packager = take_value(argc, argv, i, tok);
        } else if (arg_eq(tok, "--lister")) {
            args.lister = take_value(argc, argv, i, tok);
        } else if (arg_eq(tok, "--lister-arg")) {
            args.lister_args.emplace_back(take_value(argc, argv, i, tok));
        } else if (arg_eq(tok, "--graph")) {
            args.graph_path = take_value(argc, argv, i, tok);
        } else if (arg_eq(tok, "--platform")) {
            const std::string value = take_value(argc, argv, i, tok);
            const auto parsed = bundle::validation::parse_platform(value);
            if (!parsed) {
                throw std::runtime_error("Unknown platform '" + value + "' (expected windows, macos or unix)");
            }
            args.platform = *parsed;
        } else if (arg_eq(tok, "--summary")) {
            args.summary_path = take_value(argc, argv, i, tok);
        } else if (arg_eq(tok, "--html")) {
            args.html_path = take_value(argc, argv, i, tok);
        } else if (arg_eq(tok, "--ci")) {
            args.emit_html = false;
        } else {
            // Treat as scenario path for convenience
            args.scenario_paths.emplace_back(std::string(tok));
        }
    }

    if (args.help) {
        return args;
    }

    if (args.scenario_paths.empty()) {
        throw std::runtime_error("No scenarios specified");
    }

    if (args.summary_path.empty()) {
        args.summary_path = args.work_root / "summary.json";
    }
    if (args.html_path.empty()) {
        args.html_path = args.work_root / "report.html";
    }

    return args;
}

int aggregate_exit_code(const std::vector<ScenarioOutcome>& outcomes) {
    for (const auto& o : outcomes) {
        if (o.status == "ERROR" || o.status == "FAIL") return 1;
    }
    return 0; // PASS only
}

} // namespace

int main(int argc, char** argv) {
    try {
        const auto args = parse_args(argc, argv);
        if (args.help) {
            print_usage(argv[0]);
            return 0;
        }

        // A run with nothing to build is a configuration error, not a pass.
        const std::vector<ScenarioPack> packs = ScenarioLoader{}.load_all(args.scenario_paths);

        const DependencyGraph graph =
            args.graph_path.empty() ? DependencyGraph{} : DependencyGraph::load(args.graph_path);

        std::string diag;
        packager_bridge::Session packager(packager_bridge::Session::Config{.executable = args.packager});
        if (!packager.init(diag)) {
            throw std::runtime_error("Packaging tool unavailable: " + diag);
        }

        std::unique_ptr<archive_bridge::Session> lister;
        if (!args.lister.empty()) {
            auto command = archive_bridge::split_command(args.lister);
            command.insert(command.end(), args.lister_args.begin(), args.lister_args.end());
            lister = std::make_unique<archive_bridge::Session>(archive_bridge::Session::Config{
                .command = std::move(command),
                .work_dir = args.work_root / "listings"});
            if (!lister->init(diag)) {
                throw std::runtime_error("Content lister unavailable: " + diag);
            }
        }

        // Ensure work root exists
        std::filesystem::create_directories(args.work_root);
        Engine engine(Engine::Config{.work_root = args.work_root,
                                     .scripts_dir = args.scripts_dir,
                                     .manifest_dir = args.manifest_dir,
                                     .modules_dir = args.modules_dir,
                                     .platform = args.platform},
                      packager,
                      lister.get(),
                      graph);

        // Execute engine per pack
        std::vector<ScenarioOutcome> all_outcomes;
        for (const auto& pack : packs) {
            auto partial = engine.run(pack);
            all_outcomes.insert(all_outcomes.end(),
                                std::make_move_iterator(partial.begin()),
                                std::make_move_iterator(partial.end()));
        }

        // Emit reports
        MetricsWriter writer;
        writer.write_summary(args.summary_path, all_outcomes);
        if (args.emit_html) {
            writer.write_detailed(args.html_path, all_outcomes);
        }

        // Console summary
        std::map<std::string, std::size_t> counts;
        for (const auto& o : all_outcomes) {
            ++counts[o.status];
        }

        std::cout << "Bundle Validation (" << bundle::validation::to_string(args.platform) << ")\n"
                  << "  Scenarios: " << all_outcomes.size() << "\n"
                  << "  PASS: " << counts["PASS"] << "  FAIL: " << counts["FAIL"]
                  << "  ERROR: " << counts["ERROR"] << "\n";
        for (const auto& o : all_outcomes) {
            if (o.status == "FAIL" || o.status == "ERROR") {
                std::cout << "  " << o.status << " " << o.scenario.suite << "/" << o.scenario.id << ": "
                          << o.message << "\n";
            }
        }
        std::cout << "Reports:\n"
                  << "  JSON: " << args.summary_path << "\n";
        if (args.emit_html) {
            std::cout << "  HTML: " << args.html_path << "\n";
        }

        return aggregate_exit_code(all_outcomes);
    } catch (const std::exception& ex) {
        std::cerr << "ERROR: " << ex.what() << "\n";
        print_usage(argv[0]);
        return 2; // configuration/environment issue
    } catch (...) {
        std::cerr << "ERROR: Unknown exception\n";
        return 3; // internal error
    }
}
