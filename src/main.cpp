#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include "core/config.hpp"
#include "core/logger.hpp"
#include "workflow/compiler.hpp"
#include "workflow/toolsets.hpp"

using json = nlohmann::json;
using namespace warden;

namespace {

void print_usage() {
    std::cerr
        << "Usage:\n"
        << "  warden compile <workflow.json> [--dev|--release] [--version V]\n"
        << "                 [--workflows-dir DIR] [--source PATH] [--no-fail-fast] [--output FILE]\n"
        << "  warden toolsets\n"
        << "\n"
        << "The input is the workflow frontmatter as JSON, or an object with\n"
        << "\"frontmatter\" and \"markdown\" fields.\n";
}

struct CompileOptions {
    std::string input;
    std::string source_path;
    std::string output;
    workflow::CompilerConfig config;
};

bool parse_compile_args(const std::vector<std::string>& args, CompileOptions& opts) {
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto next = [&](std::string& target) {
            if (i + 1 >= args.size()) {
                spdlog::error("{} needs a value", arg);
                return false;
            }
            target = args[++i];
            return true;
        };

        if (arg == "--dev") {
            opts.config.action_mode = workflow::ActionMode::DEV;
        } else if (arg == "--release") {
            opts.config.action_mode = workflow::ActionMode::RELEASE;
        } else if (arg == "--no-fail-fast") {
            opts.config.fail_fast = false;
        } else if (arg == "--version") {
            if (!next(opts.config.version)) return false;
        } else if (arg == "--workflows-dir") {
            std::string dir;
            if (!next(dir)) return false;
            opts.config.workflows_dir = dir;
        } else if (arg == "--source") {
            if (!next(opts.source_path)) return false;
        } else if (arg == "--output" || arg == "-o") {
            if (!next(opts.output)) return false;
        } else if (!arg.empty() && arg[0] == '-') {
            spdlog::error("Unknown option {}", arg);
            return false;
        } else if (opts.input.empty()) {
            opts.input = arg;
        } else {
            spdlog::error("Unexpected argument {}", arg);
            return false;
        }
    }
    if (opts.input.empty()) {
        spdlog::error("No input file given");
        return false;
    }
    return true;
}

int run_compile(const std::vector<std::string>& args) {
    CompileOptions opts;
    opts.config.action_mode = workflow::action_mode_from_string(
        core::config::get_env_or("WARDEN_ACTION_MODE", "release"));
    opts.config.version = core::config::get_env_or("WARDEN_VERSION", "dev");
    opts.config.fail_fast = core::config::get_env_bool("WARDEN_FAIL_FAST", true);

    if (!parse_compile_args(args, opts)) {
        print_usage();
        return 2;
    }

    std::ifstream file(opts.input);
    if (!file.is_open()) {
        spdlog::error("Cannot open {}", opts.input);
        return 1;
    }

    json document;
    try {
        document = json::parse(file);
    } catch (const json::parse_error& e) {
        spdlog::error("{}: {}", opts.input, e.what());
        return 1;
    }

    json frontmatter = document;
    std::string markdown;
    if (document.is_object() && document.contains("frontmatter")) {
        frontmatter = document["frontmatter"];
        if (document.contains("markdown") && document["markdown"].is_string()) {
            markdown = document["markdown"].get<std::string>();
        }
    }

    std::string source_path = opts.source_path.empty() ? opts.input : opts.source_path;
    auto parsed = workflow::parse_workflow_data(frontmatter, source_path, markdown);
    if (!parsed.success) {
        spdlog::error("{}: {}", opts.input, parsed.error);
        return 1;
    }

    workflow::Compiler compiler(opts.config);
    auto result = compiler.compile(parsed.data);
    if (!result.success) {
        spdlog::error("{}: {}", opts.input, result.error);
        return 1;
    }

    std::string rendered = result.workflow.to_json().dump(2);
    if (opts.output.empty()) {
        std::cout << rendered << "\n";
        return 0;
    }

    std::ofstream out(opts.output);
    if (!out.is_open()) {
        spdlog::error("Cannot write {}", opts.output);
        return 1;
    }
    out << rendered << "\n";
    spdlog::info("Wrote {}", opts.output);
    return 0;
}

int run_toolsets() {
    workflow::ToolsetInferenceEngine inference;
    for (const auto& name : inference.all_toolsets()) {
        const auto* def = inference.get_toolset_permissions(name);
        std::cout << name;
        if (def && !def->description.empty()) {
            std::cout << "  " << def->description;
        }
        std::cout << "\n";
    }
    return 0;
}

} // anonymous namespace

int main(int argc, char** argv) {
    core::config::load_dotenv();
    core::init_logger();

    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty() || args[0] == "--help" || args[0] == "-h") {
        print_usage();
        return args.empty() ? 2 : 0;
    }

    const std::string command = args[0];
    args.erase(args.begin());

    if (command == "compile") {
        return run_compile(args);
    }
    if (command == "toolsets") {
        return run_toolsets();
    }

    spdlog::error("Unknown command '{}'", command);
    print_usage();
    return 2;
}
