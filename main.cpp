#include "runtime/Initializer.hpp"
#include "queue/OperationQueue.hpp"
#include "network/Monitor.hpp"
#include "integrity/Validator.hpp"
#include "error/CloudError.hpp"
#include "log/Registry.hpp"
#include "util/cmdLineHelpers.hpp"
#include "util/files.hpp"

#include <chrono>
#include <csignal>
#include <fstream>
#include <future>
#include <iostream>
#include <fmt/core.h>
#include <fmt/ranges.h>
#include <nlohmann/json.hpp>

using namespace cs;
using namespace cs::cli;
using namespace cs::runtime;
using namespace cs::queue;
using namespace cs::log;

namespace {

constexpr int EXIT_USAGE = 2;
constexpr int EXIT_QUEUED = 3;   // offline, operation persisted for a later run
constexpr int EXIT_RETRYING = 4; // failed transiently, persisted with backoff

void usage() {
    fmt::print(stderr,
        "usage: cloudsave <command> [options]\n"
        "\n"
        "commands:\n"
        "  status                                   initialization status and queue summary\n"
        "  queue                                    list persisted operations\n"
        "  drain                                    process the offline queue now\n"
        "  save   --user ID --slot N --file PATH    upload a game state\n"
        "  load   --user ID --slot N [--out PATH]   download a game state\n"
        "  delete --user ID --slot N                remove a save slot\n"
        "  sync   --user ID --slot N --file PATH    last-write-wins sync of one slot\n"
        "  validate --file PATH [--checksum HEX] [--strict] [--recover]\n"
        "\n"
        "common options:\n"
        "  --config PATH      YAML configuration file\n"
        "  --priority N       queue priority (default 5)\n"
        "  --check            run live connection tests during startup\n"
        "  --offline          start with the platform network signal offline\n"
        "  --json             machine readable output\n");
}

nlohmann::json readJsonFile(const std::string& path) {
    const auto j = nlohmann::json::parse(util::readFileToString(path), nullptr, false);
    if (j.is_discarded()) throw std::invalid_argument(path + " is not valid JSON");
    return j;
}

InitOptions initOptions(const Args& args) {
    InitOptions opts;
    if (const auto path = args.opt("config")) opts.resolve.configFile = *path;
    opts.skipConnectionTest = !args.has("check");
    opts.systemOnline = !args.has("offline");
    opts.onWarning = [](const std::string& w) { fmt::print(stderr, "warning: {}\n", w); };
    return opts;
}

std::shared_ptr<Services> startCore(Initializer& init, const Args& args) {
    const auto status = init.initialize(initOptions(args));
    if (!status.isInitialized) {
        for (const auto& e : status.errors) fmt::print(stderr, "error: {}\n", e);
        throw error::ConfigurationError("cloudsave failed to initialize");
    }
    return init.getServices();
}

int cmdStatus(Initializer& init, const Args& args) {
    const auto status = init.initialize(initOptions(args));
    const auto summary = init.getConfigurationSummary();

    nlohmann::json out{{"initialization", status}, {"summary", summary}};
    if (const auto services = init.getServices()) {
        if (services->offlineQueue) out["queue"] = services->offlineQueue->getStatus();
        if (services->networkMonitor) out["network"] = services->networkMonitor->getStatus();
    }

    if (args.has("json")) {
        fmt::print("{}\n", out.dump(2));
    } else {
        fmt::print("status:    {} ({})\n", summary.status, to_string(status.phase));
        fmt::print("provider:  {}{}\n", summary.provider, status.isConnected ? " (connected)" : "");
        fmt::print("features:  {}\n", fmt::join(summary.features, ", "));
        if (out.contains("queue"))
            fmt::print("queue:     {} total, {} pending, {} failed\n", out["queue"]["total"].get<size_t>(),
                       out["queue"]["pending"].get<size_t>(), out["queue"]["failed"].get<size_t>());
        for (const auto& e : summary.errors) fmt::print("error:     {}\n", e);
    }
    return init.isReady() ? 0 : 1;
}

int cmdQueue(Initializer& init, const Args& args) {
    const auto services = startCore(init, args);
    if (!services->offlineQueue) {
        fmt::print(stderr, "offline queue is disabled\n");
        return 1;
    }

    std::vector<OperationRecord> records;
    for (const auto type : {OperationType::Save, OperationType::Load, OperationType::Delete,
                            OperationType::Sync, OperationType::Custom})
        for (auto& r : services->offlineQueue->getOperationsByType(type)) records.push_back(std::move(r));

    if (args.has("json")) {
        fmt::print("{}\n", nlohmann::json(records).dump(2));
        return 0;
    }

    for (const auto& r : records)
        fmt::print("{:<32} {:<7} prio={:<3} tries={}/{} owner={} slot={}\n",
                   ellipsize_middle(r.id, 32), to_string(r.type), r.priority, r.retryCount, r.maxRetries,
                   r.metadata.ownerId, r.metadata.slotNumber ? std::to_string(*r.metadata.slotNumber) : "-");
    fmt::print("{} operation(s)\n", records.size());
    return 0;
}

int cmdDrain(Initializer& init, const Args& args) {
    const auto services = startCore(init, args);
    if (!services->offlineQueue) {
        fmt::print(stderr, "offline queue is disabled\n");
        return 1;
    }

    const auto outcome = services->offlineQueue->processQueue().get();
    const nlohmann::json out{{"outcome", outcome}, {"queue", services->offlineQueue->getStatus()}};
    fmt::print("{}\n", args.has("json") ? out.dump(2) : out.dump());
    return outcome.skippedOffline ? EXIT_QUEUED : 0;
}

// Enqueues one slot operation and drains until it settles or is parked for later
int runSlotOperation(Initializer& init, const Args& args, const OperationType type) {
    const auto services = startCore(init, args);
    if (!services->offlineQueue) {
        fmt::print(stderr, "offline queue is disabled\n");
        return 1;
    }

    EnqueueOptions opts;
    opts.metadata.ownerId = args.required("user");
    opts.metadata.slotNumber = parseUnsigned(args.required("slot"), "slot");
    opts.metadata.saveName = args.opt("name");
    if (const auto p = args.opt("priority")) opts.priority = static_cast<int>(parseUnsigned(*p, "priority"));

    nlohmann::json payload = nlohmann::json::object();
    if (type == OperationType::Save || type == OperationType::Sync)
        payload["gameState"] = readJsonFile(args.required("file"));

    auto done = std::make_shared<std::promise<std::pair<bool, nlohmann::json>>>();
    auto settledFuture = done->get_future();
    opts.handle.onSuccess = [done](const nlohmann::json& r) { done->set_value({true, r}); };
    opts.handle.onError = [done](const error::OperationError& e) {
        done->set_value({false, nlohmann::json{{"code", error::codeToString(e.code())}, {"message", e.userMessage()},
                                               {"detail", e.what()}}});
    };

    const auto id = services->offlineQueue->enqueue(type, std::move(payload), std::move(opts));
    const auto outcome = services->offlineQueue->processQueue().get();

    if (settledFuture.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        if (outcome.skippedOffline) {
            fmt::print(stderr, "offline: {} queued as {}\n", to_string(type), id);
            return EXIT_QUEUED;
        }
        fmt::print(stderr, "{} failed transiently; {} will be retried on the next run\n", to_string(type), id);
        return EXIT_RETRYING;
    }

    auto [ok, result] = settledFuture.get();
    if (!ok) {
        fmt::print(stderr, "{} failed: {}\n", to_string(type), result.dump());
        return 1;
    }

    if (type == OperationType::Load || (type == OperationType::Sync && result.value("direction", "") == "download")) {
        if (const auto outPath = args.opt("out")) {
            std::ofstream out(*outPath, std::ios::trunc);
            if (!out) throw std::runtime_error("cannot write " + *outPath);
            out << result["gameState"].dump(2) << '\n';
            result.erase("gameState");
        }
    }

    fmt::print("{}\n", args.has("json") ? result.dump(2) : result.dump());
    return 0;
}

int cmdValidate(const Args& args) {
    const auto data = readJsonFile(args.required("file"));
    const integrity::Validator validator;

    const auto result = validator.validateDataIntegrity(data, args.opt("checksum"), nullptr, {
        .deepValidation = true,
        .strictMode = args.has("strict"),
        .enableRecovery = args.has("recover")
    });

    nlohmann::json out = result;
    if (args.has("json")) {
        fmt::print("{}\n", out.dump(2));
    } else {
        fmt::print("valid:     {}\n", result.isValid);
        fmt::print("checksum:  {}\n", result.checksum);
        fmt::print("size:      {}\n", human_bytes(data.dump().size()));
        for (const auto& e : result.errors) fmt::print("error:     {}\n", e);
        for (const auto& w : result.warnings) fmt::print("warning:   {}\n", w);
        if (result.recoveredData) fmt::print("recovered: {}\n", result.recoveredData->dump());
    }
    return result.isValid ? 0 : 1;
}

}

int main(const int argc, char** argv) {
    const auto args = parseArgs(argc, argv, {"json", "check", "offline", "strict", "recover", "help"});
    if (args.command.empty() || args.has("help")) {
        usage();
        return args.has("help") ? 0 : EXIT_USAGE;
    }

    std::signal(SIGPIPE, SIG_IGN);

    try {
        Registry::init();

        if (args.command == "validate") return cmdValidate(args);

        Initializer init;
        int rc;
        if (args.command == "status") rc = cmdStatus(init, args);
        else if (args.command == "queue") rc = cmdQueue(init, args);
        else if (args.command == "drain") rc = cmdDrain(init, args);
        else if (args.command == "save") rc = runSlotOperation(init, args, OperationType::Save);
        else if (args.command == "load") rc = runSlotOperation(init, args, OperationType::Load);
        else if (args.command == "delete") rc = runSlotOperation(init, args, OperationType::Delete);
        else if (args.command == "sync") rc = runSlotOperation(init, args, OperationType::Sync);
        else {
            fmt::print(stderr, "unknown command '{}'\n\n", args.command);
            usage();
            return EXIT_USAGE;
        }

        init.cleanup();
        return rc;
    } catch (const std::invalid_argument& e) {
        fmt::print(stderr, "error: {}\n", e.what());
        return EXIT_USAGE;
    } catch (const std::exception& e) {
        fmt::print(stderr, "error: {}\n", e.what());
        return 1;
    }
}
