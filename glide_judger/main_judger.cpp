/**
 * @file main_judger.cpp
 * @brief 命令行评测入口
 *
 * glide_judger <language> <source-file> <cases.json>
 *              [--function NAME] [--config engine.conf]
 *              [--trace] [--case N] [--breakpoint N]... [--max-steps N]
 *
 * 报告以 JSON 输出到 stdout。
 * 退出码：0 已输出报告，2 用法/配置错误，3 不支持的语言，4 沙箱故障
 */

#include <iostream>
#include <string>
#include <vector>
#include <optional>
#include <cstdlib>
#include <cerrno>
#include <unistd.h>

#include "glide_env.h"
#include "core/error.h"
#include "core/config.h"
#include "core/language_loader.h"
#include "core/dispatcher.h"
#include "core/report.h"
#include "core/grader_logger.h"
#include "sandbox/cgroup.h"

using namespace glide;

namespace {

constexpr int EXIT_REPORT = 0;
constexpr int EXIT_USAGE = 2;
constexpr int EXIT_UNSUPPORTED = 3;
constexpr int EXIT_SANDBOX = 4;

struct CliOptions {
    std::string language;
    std::string source_file;
    std::string problem_file;
    std::string function;
    std::string config_file;
    bool trace = false;
    std::optional<int> case_index;
    std::vector<int> breakpoints;
    int max_steps = 0;
};

void usage(const char *prog) {
    std::cerr << "Usage: " << prog << " <language> <source-file> <cases.json>\n"
              << "       [--function NAME] [--config engine.conf]\n"
              << "       [--trace] [--case N] [--breakpoint N]... [--max-steps N]\n";
}

Result<int> parse_int(const std::string &flag, const std::string &text) {
    char *end = nullptr;
    errno = 0;
    long v = std::strtol(text.c_str(), &end, 10);
    if (errno != 0 || !end || *end != '\0' || text.empty()) {
        return Err<int>(ErrorCode::INVALID_REQUEST, flag + ": not an integer: " + text);
    }
    return Ok(static_cast<int>(v));
}

Result<CliOptions> parse_args(int argc, char **argv) {
    CliOptions opts;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto next = [&](const std::string &flag) -> Result<std::string> {
            if (i + 1 >= argc) {
                return Err<std::string>(ErrorCode::INVALID_REQUEST, flag + " requires a value");
            }
            return Ok(std::string(argv[++i]));
        };

        if (arg == "--function") {
            GLIDE_TRY_UNWRAP(v, next(arg));
            opts.function = v;
        } else if (arg == "--config") {
            GLIDE_TRY_UNWRAP(v, next(arg));
            opts.config_file = v;
        } else if (arg == "--trace") {
            opts.trace = true;
        } else if (arg == "--case") {
            GLIDE_TRY_UNWRAP(v, next(arg));
            GLIDE_TRY_UNWRAP(n, parse_int(arg, v));
            opts.case_index = n;
        } else if (arg == "--breakpoint") {
            GLIDE_TRY_UNWRAP(v, next(arg));
            GLIDE_TRY_UNWRAP(n, parse_int(arg, v));
            opts.breakpoints.push_back(n);
        } else if (arg == "--max-steps") {
            GLIDE_TRY_UNWRAP(v, next(arg));
            GLIDE_TRY_UNWRAP(n, parse_int(arg, v));
            GLIDE_ENSURE(n > 0, ErrorCode::INVALID_REQUEST, "--max-steps must be > 0");
            opts.max_steps = n;
        } else if (arg.size() > 1 && arg[0] == '-') {
            return Err<CliOptions>(ErrorCode::INVALID_REQUEST, "Unknown option: " + arg);
        } else {
            positional.push_back(arg);
        }
    }

    GLIDE_ENSURE(positional.size() == 3, ErrorCode::INVALID_REQUEST,
                 "expected <language> <source-file> <cases.json>");
    opts.language = positional[0];
    opts.source_file = positional[1];
    opts.problem_file = positional[2];
    return Ok(std::move(opts));
}

/**
 * @brief 未指定 --config 时使用安装目录下的配置，不存在则全部取默认值
 */
Result<EngineConfig> load_engine_config(const std::string &explicit_file) {
    if (!explicit_file.empty()) {
        return EngineConfig::load(explicit_file);
    }
    if (access(env::DEFAULT_CONFIG_FILE, R_OK) == 0) {
        return EngineConfig::load(env::DEFAULT_CONFIG_FILE);
    }
    return Ok(EngineConfig());
}

int exit_code_for(const Error &err) {
    switch (err.code()) {
        case ErrorCode::UNSUPPORTED_LANGUAGE:
            return EXIT_UNSUPPORTED;
        case ErrorCode::INVALID_REQUEST:
            return EXIT_USAGE;
        default:
            return EXIT_SANDBOX;
    }
}

} // namespace

int main(int argc, char **argv) {
    auto parsed = parse_args(argc, argv);
    if (parsed.is_error()) {
        std::cerr << "Error: " << parsed.error().message() << std::endl;
        usage(argv[0]);
        return EXIT_USAGE;
    }
    const CliOptions &opts = parsed.value();

    auto engine = load_engine_config(opts.config_file);
    if (engine.is_error()) {
        std::cerr << "Error: " << engine.error().to_string() << std::endl;
        return EXIT_USAGE;
    }
    EngineConfig &config = engine.value();
    grader_log().init(config.log_level, config.log_console, config.log_dir);

    // 无 cgroup 支持时退化为 rlimit
    auto cgroup_result = sandbox::CgroupManager::instance().initialize();
    if (cgroup_result.is_error()) {
        GLOG_WARN << "Cgroup unavailable, falling back to rlimits: " << cgroup_result.error().message();
    }

    DescriptorTable table;
    auto overrides = load_language_overrides(table, config.language_dir);
    if (overrides.is_error()) {
        std::cerr << "Error: " << overrides.error().to_string() << std::endl;
        return EXIT_USAGE;
    }

    auto source = read_file(opts.source_file);
    if (source.is_error()) {
        std::cerr << "Error: " << source.error().to_string() << std::endl;
        return EXIT_USAGE;
    }
    auto problem = load_problem(opts.problem_file);
    if (problem.is_error()) {
        std::cerr << "Error: " << problem.error().to_string() << std::endl;
        return EXIT_USAGE;
    }

    SubmissionRequest request;
    request.language_tag = opts.language;
    request.source_code = source.value();
    request.problem_id = problem.value().id;
    request.entry_function = opts.function.empty() ? problem.value().entry_function : opts.function;

    Dispatcher dispatcher(config, std::move(table));

    if (opts.trace) {
        TraceRequest trace;
        trace.submission = request;
        trace.test_cases = problem.value().cases;
        trace.test_index = opts.case_index;
        trace.breakpoints = opts.breakpoints;
        trace.max_steps = opts.max_steps;

        auto report = dispatcher.trace(trace);
        if (report.is_error()) {
            GLOG_ERROR << "Trace failed: " << report.error().to_string();
            std::cerr << "Error: " << report.error().message() << std::endl;
            return exit_code_for(report.error());
        }
        std::cout << to_json(report.value()).dump(2, ' ', false, Value::error_handler_t::replace) << std::endl;
        return EXIT_REPORT;
    }

    auto report = dispatcher.grade(request, problem.value().cases);
    if (report.is_error()) {
        GLOG_ERROR << "Grading failed: " << report.error().to_string();
        std::cerr << "Error: " << report.error().message() << std::endl;
        return exit_code_for(report.error());
    }
    std::cout << to_json(report.value()).dump(2, ' ', false, Value::error_handler_t::replace) << std::endl;
    return EXIT_REPORT;
}
