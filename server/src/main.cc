#include "ledger_service.hpp"
#include "stockledger/catalog.hpp"
#include "stockledger/checkpoint.hpp"
#include "stockledger/config.hpp"
#include "stockledger/engine.hpp"
#include "stockledger/errors.hpp"
#include "stockledger/ledger_store.hpp"
#include "stockledger/logging.hpp"
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <chrono>
#include <csignal>
#include <exception>
#include <memory>
#include <string>
#include <thread>

namespace {

volatile std::sig_atomic_t g_stop = 0;

void handle_signal(int) { g_stop = 1; }

} // anonymous namespace

int main() {
    using namespace stockledger;

    try {
        auto config = Config::from_env();
        set_log_level(config.log_level);

        auto catalog = config.catalog_path.empty()
            ? std::make_unique<InMemoryCatalog>()
            : InMemoryCatalog::load_file(config.catalog_path);

        std::unique_ptr<LedgerStore> store;
        if (config.journal_path.empty()) {
            log_warn("server", "ledger_in_memory", {{"reason", "STOCKLEDGER_JOURNAL not set"}});
            store = std::make_unique<InMemoryLedgerStore>();
        } else {
            store = std::make_unique<JournalLedgerStore>(config.journal_path);
        }

        EngineOptions options;
        options.version_retention = config.version_retention;
        options.sales_window_days = config.sales_window_days;
        InventoryEngine engine(*catalog, std::move(store), options);

        if (!config.checkpoint_path.empty()) {
            if (auto saved = checkpoint::read(config.checkpoint_path)) {
                engine.restore(*saved);
            }
        }
        engine.recover();

        grpc::EnableDefaultHealthCheckService(true);

        auto service = server::create_ledger_service(engine);

        grpc::ServerBuilder builder;
        builder.AddListeningPort(config.server_address(), grpc::InsecureServerCredentials());
        builder.RegisterService(service.get());

        std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
        if (!server) {
            log_error("server", "server_start_failed", {{"address", config.server_address()}});
            return 1;
        }

        log_info("server", "ledger_server_started", {{"port", config.port}});

        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);
        std::thread waiter([&server] { server->Wait(); });
        while (!g_stop) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        server->Shutdown();
        waiter.join();

        if (!config.checkpoint_path.empty()) {
            checkpoint::write(config.checkpoint_path, engine.checkpoint());
            log_info("server", "checkpoint_written", {{"path", config.checkpoint_path}});
        }
        log_info("server", "ledger_server_stopped");
        return 0;
    } catch (const LedgerError& e) {
        log_error("server", "startup_failed", {{"rule", e.rule()}, {"error", e.what()}});
        return 1;
    } catch (const std::exception& e) {
        log_error("server", "startup_failed", {{"error", e.what()}});
        return 1;
    }
}
