/// @file main.cpp
/// @brief loom-derive entry point - compiles UI descriptions into C++ builder code
///
/// Reads a JSON UI description (root struct plus partials), runs the UI graph
/// compiler and writes one builder function per struct. With --plan the
/// construction plan is listed instead of printed as code.

#include <loom/core/core.hpp>
#include <loom/derive/compiler.hpp>
#include <loom/derive/config.hpp>
#include <loom/derive/frontend.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

namespace fs = std::filesystem;

namespace {

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [OPTIONS] UI_JSON\n"
              << "\n"
              << "Arguments:\n"
              << "  UI_JSON              UI description (root struct and partials)\n"
              << "\n"
              << "Options:\n"
              << "  --config, -c FILE    Read compiler and log settings from FILE (default: ./loom.toml if present)\n"
              << "  --output, -o FILE    Write generated code to FILE instead of stdout\n"
              << "  --plan               List the construction plan instead of generating code\n"
              << "  --help, -h           Show this help message\n"
              << "  --version, -v        Show version information\n"
              << "\n"
              << "Examples:\n"
              << "  " << program_name << " examples/layout_demo/basic.json\n"
              << "  " << program_name << " -c loom.toml -o basic_ui.inl examples/layout_demo/basic.json\n";
}

void print_version() {
    std::cout << "loom-derive " << LOOM_VERSION_STRING << "\n"
              << "loom UI graph compiler\n";
}

std::string describe_plan(const loom_derive::ConstructionPlan& plan) {
    std::string out = (plan.partial ? "partial " : "struct ") + plan.name + " (" +
                      std::to_string(plan.steps.size()) + " steps)\n";
    for (std::size_t i = 0; i < plan.steps.size(); ++i) {
        const auto& step = plan.steps[i];
        out += "  " + std::to_string(i + 1) + ". " + loom_derive::step_kind_name(step.kind) + " " +
               step.target_slot + ": " + step.target_type;
        if (step.parent) {
            out += " parent=" + (step.parent->is_partial_parent() ? std::string("<partial parent>") : step.parent->name);
        }
        if (!step.children.empty()) {
            out += " children=" + std::to_string(step.children.size());
        }
        if (!step.events.empty()) {
            out += " events=" + std::to_string(step.events.size());
        }
        out += "\n";
    }
    return out;
}

int report(const loom_core::Error& error) {
    loom_core::debug::record_error(error);
    loom_core::core_logger()->error("{}", loom_core::build_error_chain(error));
    std::cerr << "error: " << error.message() << "\n";
    return 1;
}

} // anonymous namespace

// =============================================================================
// Main
// =============================================================================

int main(int argc, char** argv) {
    fs::path input_path;
    std::optional<fs::path> config_path;
    std::optional<fs::path> output_path;
    bool plan_only = false;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            print_version();
            return 0;
        } else if (arg == "--config" || arg == "-c" || arg == "--output" || arg == "-o") {
            if (i + 1 >= argc) {
                std::cerr << "Option " << arg << " requires a file argument\n";
                print_usage(argv[0]);
                return 1;
            }
            if (arg == "--config" || arg == "-c") {
                config_path = argv[++i];
            } else {
                output_path = argv[++i];
            }
        } else if (arg == "--plan") {
            plan_only = true;
        } else if (!arg.empty() && arg[0] != '-') {
            input_path = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (input_path.empty()) {
        std::cerr << "Error: No UI description specified.\n\n";
        print_usage(argv[0]);
        return 1;
    }

    // Configuration: explicit file, else ./loom.toml when present, else defaults
    loom_derive::LoomConfig config;
    if (!config_path && fs::is_regular_file("loom.toml")) {
        config_path = fs::path("loom.toml");
    }
    if (config_path) {
        loom_derive::ConfigLoader loader;
        auto loaded = loader.load(*config_path);
        if (!loaded) {
            return report(loaded.error());
        }
        config = std::move(loaded.value());
        loom_core::configure_logging(config.log);
        loom_core::core_logger()->debug("Loaded configuration from {}", config_path->string());
    }

    loom_core::core_logger()->info("Compiling UI description: {}", input_path.string());
    auto doc = loom_derive::UiDocument::load(input_path);
    if (!doc) {
        return report(doc.error());
    }

    loom_derive::UiCompiler compiler(config.derive);
    std::string output;

    if (plan_only) {
        for (const auto& partial : doc.value().partials) {
            auto plan = compiler.compile(partial);
            if (!plan) {
                return report(plan.error());
            }
            output += describe_plan(plan.value()) + "\n";
        }
        auto plan = compiler.compile(doc.value().root);
        if (!plan) {
            return report(plan.error());
        }
        output += describe_plan(plan.value());
    } else {
        auto code = compiler.generate(doc.value());
        if (!code) {
            return report(code.error());
        }
        output = std::move(code.value());
    }

    if (output_path) {
        std::ofstream file(*output_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            return report(loom_core::Error(loom_core::ErrorCode::IOError,
                                           "Failed to open output file: " + output_path->string()));
        }
        file << output;
        loom_core::core_logger()->info("Wrote {} bytes to {}", output.size(), output_path->string());
    } else {
        std::cout << output;
    }

    if (loom_core::debug::total_error_count() > 0) {
        loom_core::core_logger()->debug("{}", loom_core::debug::error_stats_summary());
    }

    loom_core::shutdown_logging();
    return 0;
}
