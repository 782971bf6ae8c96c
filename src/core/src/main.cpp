/**
 * @file main.cpp
 * @brief cyclebind - render op templates over a cycle range as JSON lines
 *
 * Usage:
 *   cyclebind <workload.yaml> [--config engine.yaml] [--cycles A..B]
 *             [--threads N] [--op NAME] [--pretty] [key=value ...]
 *   cyclebind --functions
 */

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "bindings/FunctionRegistry.hpp"
#include "command/CompiledCommand.hpp"
#include "config/ActivityConfig.hpp"
#include "config/ConfigManager.hpp"
#include "errors/Errors.hpp"
#include "logging/Logger.hpp"
#include "templating/WorkloadLoader.hpp"
#include "value/JsonCodec.hpp"

using namespace cyclebind;
using namespace cyclebind::config;

namespace {

struct Options {
    std::string workload;
    std::string configFile;
    std::string opName;
    std::optional<int64_t> cyclesStart;
    std::optional<int64_t> cyclesEnd;
    std::optional<int> threads;
    bool pretty = false;
    bool listFunctions = false;
    std::vector<std::string> activityArgs;
};

void printUsage() {
    std::cerr << "usage: cyclebind <workload.yaml> [--config engine.yaml] [--cycles A..B]\n"
                 "                 [--threads N] [--op NAME] [--pretty] [key=value ...]\n"
                 "       cyclebind --functions\n";
}

/**
 * "A..B" (B exclusive) or a single count "N" meaning 0..N
 */
bool parseCycles(const std::string& text, Options& opts) {
    auto sep = text.find("..");
    if (sep == std::string::npos) {
        auto count = value::TypeConverter::parseInt(text);
        if (!count) return false;
        opts.cyclesStart = 0;
        opts.cyclesEnd = *count;
        return true;
    }
    auto start = value::TypeConverter::parseInt(text.substr(0, sep));
    auto end = value::TypeConverter::parseInt(text.substr(sep + 2));
    if (!start || !end || *end < *start) return false;
    opts.cyclesStart = *start;
    opts.cyclesEnd = *end;
    return true;
}

std::optional<Options> parseArgs(int argc, char* argv[]) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "missing value for " << arg << "\n";
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--config") {
            auto v = next();
            if (!v) return std::nullopt;
            opts.configFile = *v;
        } else if (arg == "--cycles") {
            auto v = next();
            if (!v || !parseCycles(*v, opts)) {
                std::cerr << "invalid cycle range\n";
                return std::nullopt;
            }
        } else if (arg == "--threads") {
            auto v = next();
            auto n = v ? value::TypeConverter::parseInt(*v) : std::nullopt;
            if (!n || *n < 1) {
                std::cerr << "invalid thread count\n";
                return std::nullopt;
            }
            opts.threads = static_cast<int>(*n);
        } else if (arg == "--op") {
            auto v = next();
            if (!v) return std::nullopt;
            opts.opName = *v;
        } else if (arg == "--pretty") {
            opts.pretty = true;
        } else if (arg == "--functions") {
            opts.listFunctions = true;
        } else if (arg == "-h" || arg == "--help") {
            return std::nullopt;
        } else if (arg.find('=') != std::string::npos) {
            opts.activityArgs.push_back(arg);
        } else if (opts.workload.empty()) {
            opts.workload = arg;
        } else {
            std::cerr << "unexpected argument: " << arg << "\n";
            return std::nullopt;
        }
    }
    if (opts.workload.empty() && !opts.listFunctions) {
        return std::nullopt;
    }
    return opts;
}

void listFunctions() {
    const auto& registry = bindings::FunctionRegistry::defaults();
    for (const auto& name : registry.functionNames()) {
        auto entry = registry.findEntry(name);
        if (!entry) continue;
        std::cout << entry->name << "\t" << entry->category << "\t"
                  << (entry->threadSafe ? "thread-safe" : "unsafe") << "\t"
                  << bindings::portTypeToString(entry->input) << "->"
                  << bindings::portTypeToString(entry->output) << "\t"
                  << entry->example << "\n";
    }
}

/**
 * Render [start, end) for every command into lines, cycle-major
 */
std::vector<std::string> renderSlice(const std::vector<std::shared_ptr<const command::CompiledCommand>>& commands,
                                     int64_t start, int64_t end, bool pretty) {
    std::vector<std::string> lines;
    lines.reserve(static_cast<size_t>(end - start) * commands.size());
    for (int64_t cycle = start; cycle < end; ++cycle) {
        for (const auto& cmd : commands) {
            value::json line;
            line["op"] = cmd->getName();
            line["cycle"] = cycle;
            line["fields"] = value::toJson(cmd->apply(cycle));
            lines.push_back(pretty ? line.dump(2) : line.dump());
        }
    }
    return lines;
}

} // namespace

int main(int argc, char* argv[]) {
    auto parsed = parseArgs(argc, argv);
    if (!parsed) {
        printUsage();
        return 2;
    }
    Options opts = *parsed;

    // Basic setup, reconfigured after loading config
    Logger::init("logs/cyclebind.log", "warn");

    if (opts.listFunctions) {
        listFunctions();
        return 0;
    }

    auto& config = ConfigManager::instance();
    if (!opts.configFile.empty() && !config.loadEngineConfig(opts.configFile)) {
        LOG_ERROR("Failed to load engine configuration from {}", opts.configFile);
        return 1;
    }
    const EngineConfig& engine = config.engineConfig();

    const auto& logConfig = engine.logging;
    Logger::shutdown();
    Logger::init(logConfig.file,
                 logConfig.level,
                 static_cast<size_t>(logConfig.max_size_mb) * 1024 * 1024,
                 static_cast<size_t>(logConfig.max_files),
                 logConfig.console_enabled);

    LOG_INFO("cyclebind v{}", engine.version);
    LOG_INFO("Workload: {}", opts.workload);

    auto workload = templating::WorkloadLoader::loadFile(opts.workload);
    if (!workload) {
        return 1;
    }

    // Activity tier: engine policy < workload document < command line
    value::ValueMap policy;
    policy.set("allow_unsafe_functions", value::Value(engine.bindings.allow_unsafe_functions));
    ActivityConfig activity = ActivityConfig(policy).mergedWith(workload->activity);
    if (!opts.activityArgs.empty()) {
        auto cliActivity = ActivityConfig::fromArgs(opts.activityArgs);
        if (!cliActivity) {
            return 2;
        }
        activity = activity.mergedWith(*cliActivity);
    }
    auto sharedActivity = std::make_shared<const ActivityConfig>(activity);

    std::vector<std::shared_ptr<const command::CompiledCommand>> commands;
    for (const auto& op : workload->ops) {
        if (!opts.opName.empty() && op.name() != opts.opName) {
            continue;
        }
        try {
            commands.push_back(std::make_shared<const command::CompiledCommand>(op, sharedActivity));
        } catch (const CycleBindError& e) {
            LOG_ERROR("Cannot compile op '{}': {}", op.name(), e.what());
            return 1;
        }
    }
    if (commands.empty()) {
        LOG_ERROR("No ops to render{}", opts.opName.empty() ? "" : " named '" + opts.opName + "'");
        return 1;
    }

    // Command line > activity params > engine defaults
    int64_t start = opts.cyclesStart.value_or(activity.getOr<long long>("cycles_start", engine.render.cycles_start));
    int64_t end = opts.cyclesEnd.value_or(activity.getOr<long long>("cycles_end", engine.render.cycles_end));
    int threads = opts.threads.value_or(activity.getOr<int>("threads", engine.render.threads));
    bool pretty = opts.pretty || engine.render.pretty;

    if (end < start) {
        LOG_ERROR("Invalid cycle range {}..{}", start, end);
        return 1;
    }
    threads = static_cast<int>(std::max<int64_t>(1, std::min<int64_t>(threads, end - start)));

    LOG_INFO("Rendering cycles {}..{} for {} ops on {} threads", start, end, commands.size(), threads);

    // Each worker renders a disjoint slice; slices are printed in cycle order
    const int64_t total = end - start;
    std::vector<std::vector<std::string>> slices(static_cast<size_t>(threads));
    std::vector<std::optional<std::string>> failures(static_cast<size_t>(threads));
    std::vector<std::thread> workers;
    workers.reserve(static_cast<size_t>(threads));
    for (int t = 0; t < threads; ++t) {
        int64_t sliceStart = start + total * t / threads;
        int64_t sliceEnd = start + total * (t + 1) / threads;
        workers.emplace_back([&commands, &slices, &failures, t, sliceStart, sliceEnd, pretty]() {
            try {
                slices[static_cast<size_t>(t)] = renderSlice(commands, sliceStart, sliceEnd, pretty);
            } catch (const std::exception& e) {
                failures[static_cast<size_t>(t)] = e.what();
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    bool failed = false;
    for (size_t t = 0; t < failures.size(); ++t) {
        if (failures[t]) {
            LOG_ERROR("Render worker {} failed: {}", t, *failures[t]);
            failed = true;
        }
    }
    if (failed) {
        Logger::shutdown();
        return 1;
    }

    for (const auto& slice : slices) {
        for (const auto& line : slice) {
            std::cout << line << "\n";
        }
    }
    std::cout.flush();

    LOG_INFO("Rendered {} lines", static_cast<long long>(total) * static_cast<long long>(commands.size()));
    Logger::shutdown();
    return 0;
}
