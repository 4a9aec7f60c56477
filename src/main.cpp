/*
 * coderun - run short python, javascript and bash snippets
 * with a wall-clock deadline and bounded output
 */

#include "code_executor.h"
#include "config.h"
#include "result_json.h"
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace coderun;

namespace {

enum class Mode { EXECUTE, VALIDATE, DETECT, INFO, STATUS };

void print_usage(const char* program) {
    std::cerr << "Usage:\n"
              << "  " << program << " [--config FILE] [--language L] [--timeout S] [--stdin FILE]\n"
              << "          [--workers N] [--max-output N] [--verbose] [FILE|-]\n"
              << "  " << program << " --validate [--language L] FILE|-\n"
              << "  " << program << " --detect FILE|-\n"
              << "  " << program << " --info LANGUAGE\n"
              << "  " << program << " --status\n";
}

// "-" reads standard input
bool read_source(const std::string& path, std::string& content) {
    std::stringstream buffer;
    if (path == "-") {
        buffer << std::cin.rdbuf();
    } else {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return false;
        }
        buffer << file.rdbuf();
    }
    content = buffer.str();
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    Mode mode = Mode::EXECUTE;
    std::string config_file;
    std::string source_path;
    std::string stdin_path;
    std::string info_language;
    std::optional<std::string> language;
    std::optional<std::string> timeout_arg;
    std::optional<std::string> workers_arg;
    std::optional<std::string> max_output_arg;
    std::optional<int> timeout;
    bool verbose = false;

    // Parse command line
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_file = argv[++i];
        } else if (arg == "--language" && i + 1 < argc) {
            language = argv[++i];
        } else if (arg == "--timeout" && i + 1 < argc) {
            timeout_arg = argv[++i];
        } else if (arg == "--stdin" && i + 1 < argc) {
            stdin_path = argv[++i];
        } else if (arg == "--workers" && i + 1 < argc) {
            workers_arg = argv[++i];
        } else if (arg == "--max-output" && i + 1 < argc) {
            max_output_arg = argv[++i];
        } else if (arg == "--info" && i + 1 < argc) {
            mode = Mode::INFO;
            info_language = argv[++i];
        } else if (arg == "--validate") {
            mode = Mode::VALIDATE;
        } else if (arg == "--detect") {
            mode = Mode::DETECT;
        } else if (arg == "--status") {
            mode = Mode::STATUS;
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if ((arg == "-" || arg[0] != '-') && source_path.empty()) {
            source_path = arg;
        } else {
            std::cerr << "❌ Unknown or incomplete argument: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    bool needs_source = mode == Mode::EXECUTE || mode == Mode::VALIDATE || mode == Mode::DETECT;
    if (needs_source && source_path.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    // Load configuration, flags override the file
    ExecutorConfig config;
    try {
        if (!config_file.empty()) {
            config = ConfigLoader::load_file(config_file);
        }
        if (timeout_arg) {
            timeout = static_cast<int>(ConfigLoader::parse_integer(*timeout_arg, "--timeout"));
        }
        if (workers_arg) {
            long workers = ConfigLoader::parse_integer(*workers_arg, "--workers");
            if (workers <= 0) {
                throw std::invalid_argument("--workers must be positive");
            }
            config.worker_count = static_cast<size_t>(workers);
        }
        if (max_output_arg) {
            long max_output = ConfigLoader::parse_integer(*max_output_arg, "--max-output");
            if (max_output <= 0) {
                throw std::invalid_argument("--max-output must be positive");
            }
            config.max_output_length = static_cast<size_t>(max_output);
        }
        if (verbose) {
            config.verbose = true;
        }
        config.validate();
    } catch (const std::exception& e) {
        std::cerr << "❌ " << e.what() << std::endl;
        return 1;
    }

    std::string code;
    if (needs_source && !read_source(source_path, code)) {
        std::cerr << "❌ Cannot read source file: " << source_path << std::endl;
        return 1;
    }

    std::optional<std::string> stdin_data;
    if (!stdin_path.empty()) {
        std::string data;
        if (stdin_path == "-" && source_path == "-") {
            std::cerr << "❌ Source and --stdin cannot both read standard input" << std::endl;
            return 1;
        }
        if (!read_source(stdin_path, data)) {
            std::cerr << "❌ Cannot read stdin file: " << stdin_path << std::endl;
            return 1;
        }
        stdin_data = data;
    }

    std::unique_ptr<CodeExecutor> executor;
    try {
        executor = std::make_unique<CodeExecutor>(config);
    } catch (const std::exception& e) {
        std::cerr << "❌ Failed to initialize executor: " << e.what() << std::endl;
        return 2;
    }

    Json::Value document;
    switch (mode) {
        case Mode::EXECUTE: {
            ExecutionRequest request;
            request.code = code;
            request.language = language;
            request.stdin_data = stdin_data;
            request.timeout_seconds = timeout;
            document = to_json(executor->execute(request));
            break;
        }
        case Mode::VALIDATE:
            document = to_json(executor->validate(code, language));
            break;
        case Mode::DETECT:
            document["language"] = executor->detect_language(code);
            break;
        case Mode::INFO: {
            auto info = executor->get_language_info(info_language);
            if (!info) {
                document["error"] = "Unsupported language: " + info_language;
                document["supported_languages"] = Json::Value(Json::arrayValue);
                for (const auto& name : executor->supported_languages()) {
                    document["supported_languages"].append(name);
                }
            } else {
                document = to_json(*info);
            }
            break;
        }
        case Mode::STATUS:
            document = to_json(executor->get_service_status());
            document["stats"] = to_json(executor->get_stats());
            break;
    }

    std::cout << write_json(document) << std::endl;
    return 0;
}
