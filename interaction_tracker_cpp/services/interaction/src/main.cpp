#include <drogon/drogon.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>

#include "config_manager.h"
#include "mqtt_client.h"
#include "interaction_engine.h"
#include "event_publisher.h"
#include "interaction_service.h"
#include "controllers/health_controller.h"

namespace fs = std::filesystem;

namespace {

std::atomic<int> g_exit_code{0};
std::shared_ptr<itrack::InteractionService> g_service;

void signal_handler(int sig) {
    spdlog::info("Received signal {}, shutting down...", sig);
    drogon::app().quit();
}

void reload_handler(int /*sig*/) {
    if (g_service) g_service->requestReload();
}

void setup_logging(const y2m::LoggingConfig& log_config, bool verbose) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!log_config.file.empty()) {
        auto dir = fs::path(log_config.file).parent_path();
        if (!dir.empty()) fs::create_directories(dir);
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_config.file, log_config.max_bytes, log_config.backup_count));
    }

    auto logger = std::make_shared<spdlog::logger>("interaction-tracker", sinks.begin(), sinks.end());

    spdlog::level::level_enum level = spdlog::level::info;
    if (log_config.level == "DEBUG" || log_config.level == "debug") level = spdlog::level::debug;
    else if (log_config.level == "WARNING" || log_config.level == "warning") level = spdlog::level::warn;
    else if (log_config.level == "ERROR" || log_config.level == "error") level = spdlog::level::err;
    if (verbose) level = spdlog::level::debug;

    logger->set_level(level);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");
    spdlog::set_default_logger(logger);
    spdlog::flush_every(std::chrono::seconds(3));
}

bool has_flag(int argc, char* argv[], const std::string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (flag == argv[i]) return true;
    }
    return false;
}

std::string find_config_path(int argc, char* argv[]) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string(argv[i]) == "--config") return argv[i + 1];
    }
    if (fs::exists("config.yaml")) return "config.yaml";
    if (fs::exists("/app/config/config.yaml")) return "/app/config/config.yaml";
    return "config.yaml";
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        auto config_path = find_config_path(argc, argv);
        auto config = y2m::ConfigManager::load(config_path);
        bool verbose = has_flag(argc, argv, "--verbose") || has_flag(argc, argv, "-v");

        setup_logging(config.logging, verbose);
        spdlog::info("Starting interaction-tracker v1.0.0");
        spdlog::info("Config: {} ({} interactions)", config_path, config.interactions.size());

        std::vector<y2m::InteractionConfig> interactions;
        for (const auto& [name, ic] : config.interactions) {
            interactions.push_back(ic);
        }
        auto engine = std::make_shared<itrack::InteractionEngine>(
            std::move(interactions), static_cast<size_t>(config.engine.max_slot_depth));

        // --- MQTT (independent of the HTTP server) ---
        auto mqtt = std::make_shared<y2m::MqttClient>(config.mqtt);
        try {
            mqtt->connect();
        } catch (const std::exception& e) {
            spdlog::warn("MQTT unavailable: {} (will keep retrying)", e.what());
        }

        auto publisher = std::make_shared<itrack::EventPublisher>(
            [mqtt](const std::string& topic, const std::string& payload, int qos, bool retain) {
                mqtt->publish(topic, payload, qos, retain);
            },
            config.mqtt, config.home_assistant);

        g_service = std::make_shared<itrack::InteractionService>(
            engine, publisher, mqtt, config, config_path);
        g_service->setFatalHandler([](const std::string& /*reason*/) {
            g_exit_code = 2;
            drogon::app().quit();
        });

        itrack::HealthController::setEngine(engine);
        itrack::HealthController::setMqttClient(mqtt);

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
        std::signal(SIGHUP, reload_handler);

        g_service->start();

        auto& app = drogon::app();
        app.setLogLevel(trantor::Logger::kWarn);
        app.addListener(config.api.host, static_cast<uint16_t>(config.api.port));
        app.setThreadNum(1);
        app.setMaxConnectionNum(100);

        spdlog::info("Listening on {}:{}", config.api.host, config.api.port);

        app.run();  // Blocks until quit

        spdlog::info("Shutting down...");
        g_service->stop();
        mqtt->disconnect();

        g_service.reset();
        spdlog::info("Shutdown complete");

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return g_exit_code;
}
