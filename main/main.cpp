// Services
#include "runtime/HttpService.hpp"
#include "runtime/ServiceInfo.hpp"

// Rendering
#include "render/WtPdfRenderer.hpp"

// Misc
#include "config/Config.hpp"
#include "log/Registry.hpp"

// Libraries
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <sodium.h>
#include <thread>

using namespace folio::config;
using namespace folio::runtime;

namespace {
std::atomic shouldExit = false;
std::atomic reopenLogs = false;

void signalHandler(const int signum) {
    if (signum == SIGHUP) reopenLogs = true;
    else shouldExit = true;
}
}

int main() {
    std::shared_ptr<const Config> config;
    try {
        config = std::make_shared<const Config>(loadConfigFromEnvironment());
        folio::log::Registry::init(config->logging);
    } catch (const std::exception& e) {
        std::cerr << "[-] Failed to load configuration: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    const auto log = folio::log::Registry::folio();

    try {
        if (sodium_init() < 0) throw std::runtime_error("libsodium initialization failed");

        log->info("[*] Starting {} {}", SERVICE_NAME, SERVICE_VERSION);
        log->debug("[*] Effective configuration:\n{}", toYaml(*config));

        if (config->usesDefaultApiKey())
            log->warn("[!] Using the default API key. Set FOLIO_API_KEY before exposing this service.");
        log->warn("[!] Requests without an Authorization header are accepted; only presented keys are checked.");

        auto renderer = std::make_shared<folio::render::WtPdfRenderer>(config->render);

        HttpService service(config, renderer);
        service.start();

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);
        std::signal(SIGHUP, signalHandler);

        log->info("[✓] {} listening on {}:{}", SERVICE_NAME, config->server.host, config->server.port);

        while (!shouldExit) {
            std::this_thread::sleep_for(std::chrono::milliseconds(250));
            if (reopenLogs.exchange(false)) folio::log::Registry::reopenMainLog();
        }

        log->info("[!] Shutdown signal received, stopping...");
        service.stop();
        log->info("[✓] {} shut down cleanly.", SERVICE_NAME);

        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        log->error("[-] Failed to run {}: {}", SERVICE_NAME, e.what());
        return EXIT_FAILURE;
    }
}
