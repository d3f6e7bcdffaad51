#include "aggregator/result_serializer.hpp"
#include "config/config_loader.hpp"
#include "core/collection_types.hpp"
#include "core/utils.hpp"
#include "db/adapter_registry.hpp"
#include "db/connection_params.hpp"
#include "orchestrator/collection_orchestrator.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <format>
#include <string>

using namespace dbsurvey;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFatal = 1;
constexpr int kExitBadConfig = 2;

// Set while a run is in progress so SIGINT/SIGTERM can cancel it
std::atomic<CollectionOrchestrator*> g_orchestrator{nullptr};

void signal_handler(int /*signal*/) {
    if (auto* orchestrator = g_orchestrator.load()) {
        orchestrator->cancel();
    }
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        std::string config_file = "config/dbsurvey.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        utils::log::info(std::format("{} {} starting", kCollectorName, kCollectorVersion));
        utils::log::info(std::format("[1/5] Loading configuration from {}", config_file));

        auto loaded = ConfigLoader::load_from_file(config_file);
        if (!loaded.success) {
            utils::log::error(std::format("Invalid configuration: {}", loaded.error_message));
            return kExitBadConfig;
        }
        const auto& cfg = loaded.config;

        auto params = ConnectionParams::from_config(cfg.connection);
        if (params.is_error()) {
            utils::log::error(std::format("Invalid connection settings: {}", params.error_message()));
            return kExitBadConfig;
        }

        utils::log::info("[2/5] Building adapter registry");
        const auto registry = make_default_registry();
        auto adapter = registry.create(params.value().type);
        if (adapter.is_error()) {
            utils::log::error(adapter.error_message());
            return kExitFatal;
        }

        utils::log::info(std::format("[3/5] Connecting to {}", params.value().display()));
        CollectionOrchestrator orchestrator(cfg.collection, cfg.sampling, RetryPolicy(cfg.retry), cfg.quality);
        g_orchestrator.store(&orchestrator);
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        utils::log::info(std::format("[4/5] Collecting ({})",
            cfg.collection.all_databases ? "all databases" : "connected database"));
        auto result = orchestrator.run(*adapter.value(), params.value());
        g_orchestrator.store(nullptr);

        if (result.is_error()) {
            utils::log::error(std::format("Collection failed ({}): {}",
                error_code_to_string(result.error_code()), result.error_message()));
            return kExitFatal;
        }

        utils::log::info(std::format("[5/5] Writing {}", cfg.output.path));
        auto written = write_result(result.value(), cfg.output);
        if (written.is_error()) {
            utils::log::error(written.error_message());
            return kExitFatal;
        }

        const auto& server = result.value().server_info;
        utils::log::info(std::format("Done: {} of {} database(s) collected in {}ms",
            server.collected_databases, server.total_databases,
            result.value().metadata.duration_ms));
        return kExitOk;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
        return kExitFatal;
    }
}
