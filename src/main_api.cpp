#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <memory>
#include <thread>
#include <utility>

#include "adapters/duckdb/DuckCandleRepo.hpp"
#include "adapters/duckdb/DuckStore.hpp"
#include "api/Controllers.hpp"
#include "api/HttpServer.hpp"
#include "api/Router.hpp"
#include "common/Config.hpp"
#include "common/Log.hpp"

namespace {

volatile std::sig_atomic_t gStopSignal = 0;

void onStopSignal(int signal) { gStopSignal = signal; }

[[noreturn]] void reportTerminate() {
    const auto eptr = std::current_exception();
    if (!eptr) {
        std::fprintf(stderr, "std::terminate sin excepción activa\n");
        std::_Exit(EXIT_FAILURE);
    }
    try {
        std::rethrow_exception(eptr);
    } catch (const std::exception& ex) {
        std::fprintf(stderr, "std::terminate: %s\n", ex.what());
    } catch (...) {
        std::fprintf(stderr, "std::terminate: excepción de tipo desconocido\n");
    }
    std::_Exit(EXIT_FAILURE);
}

void logConfig(const ohlcv::common::Config& config) {
    LOG_INFO("ohlcv_api " << config.bindAddress << ':' << config.port << " workers=" << config.threads
                          << " log=" << ohlcv::log::levelToString(config.logLevel));
    LOG_INFO("duckdb=" << config.duckdbPath << " csv=" << config.csvPath << " static=" << config.staticDir);
    LOG_INFO("limit default=" << config.httpDefaultLimit << " max=" << config.httpMaxLimit
                              << " cors=" << (config.httpCorsEnable ? config.httpCorsOrigin : "off"));
}

// Migrates the schema and seeds an empty table from the CSV, then opens the
// read repository. The store's connection is closed before the repository
// opens its own.
std::shared_ptr<const domain::contracts::ICandleReadRepo> openRepository(const ohlcv::common::Config& config) {
    {
        adapters::duckdb::DuckStore store(config.duckdbPath);
        store.migrate();
        if (const auto imported = store.importCsvIfEmpty(config.csvPath); imported > 0) {
            LOG_INFO("Carga inicial: " << imported << " velas desde " << config.csvPath);
        }
    }

    auto repo = std::make_shared<adapters::duckdb::DuckCandleRepo>(config.duckdbPath);
    LOG_INFO("Velas disponibles en " << repo->path() << ": " << repo->count());
    return repo;
}

void waitForStopSignal() {
    std::signal(SIGINT, onStopSignal);
    std::signal(SIGTERM, onStopSignal);
    while (gStopSignal == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    LOG_INFO("Señal " << gStopSignal << " recibida, deteniendo el servidor");
}

}  // namespace

int main(int argc, char** argv) {
    std::set_terminate(reportTerminate);

    try {
        const auto config = ohlcv::common::Config::fromArgs(argc, argv);
        ohlcv::log::setLevel(config.logLevel);
        logConfig(config);

        auto repo = openRepository(config);
        ohlcv::api::setHttpLimits(config.httpDefaultLimit, config.httpMaxLimit);

        ohlcv::api::HttpServer server({config.bindAddress, config.port},
                                      config.threads,
                                      ohlcv::api::Router(std::move(repo), config.staticDir, config.threads));
        server.setCorsPolicy({config.httpCorsEnable && !config.httpCorsOrigin.empty(), config.httpCorsOrigin});
        server.start();

        waitForStopSignal();
        server.stop();
        LOG_INFO("Servidor detenido");
    } catch (const std::exception& ex) {
        LOG_ERR("Error fatal en la API: " << ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
