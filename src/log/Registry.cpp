#include "log/Registry.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <filesystem>

namespace cs::log {

void Registry::init(const config::LoggingConfig& cfg) {
    if (initialized_) {
        spdlog::warn("[Registry] Already initialized, ignoring second init()");
        return;
    }

    // console
    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(cfg.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    auto makeLogger = [&](const std::string& name) {
        const auto logger = std::make_shared<spdlog::logger>(name, console_sink_);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    makeLogger("cloudsave");
    makeLogger("queue");
    makeLogger("network");
    makeLogger("integrity");
    makeLogger("storage");
    makeLogger("config");
    makeLogger("runtime");

    applyLevels_(cfg.subsystem_levels);
    if (!cfg.log_dir.empty()) openMainLog_(cfg);

    initialized_ = true;
    cloudsave()->debug("[Registry] Initialized");
}

void Registry::reconfigure(const config::LoggingConfig& cfg) {
    if (!initialized_) {
        init(cfg);
        return;
    }

    console_sink_->set_level(cfg.console_log_level);
    applyLevels_(cfg.subsystem_levels);

    if (!cfg.log_dir.empty() && !main_file_sink_) openMainLog_(cfg);
    else if (main_file_sink_) main_file_sink_->set_level(cfg.file_log_level);
}

void Registry::openMainLog_(const config::LoggingConfig& cfg) {
    namespace fs = std::filesystem;

    log_dir_ = cfg.log_dir;
    main_log_path_ = log_dir_ / "cloudsave.log";
    if (!fs::exists(log_dir_)) fs::create_directories(log_dir_);

    // main file sink (rotating)
    main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        main_log_path_.string(), main_max_bytes_, main_max_files_);
    main_file_sink_->set_level(cfg.file_log_level);
    main_file_sink_->set_pattern(LOG_FORMAT);

    spdlog::apply_all([&](const std::shared_ptr<spdlog::logger>& lg) {
        if (lg->name().empty()) return;
        lg->sinks().push_back(main_file_sink_);
    });
}

void Registry::applyLevels_(const config::SubsystemLogLevelsConfig& levels) {
    get("cloudsave")->set_level(levels.cloudsave);
    get("queue")->set_level(levels.queue);
    get("network")->set_level(levels.network);
    get("integrity")->set_level(levels.integrity);
    get("storage")->set_level(levels.storage);
    get("config")->set_level(levels.config);
    get("runtime")->set_level(levels.runtime);
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_ && !console_sink_) throw std::runtime_error("[Registry] Not initialized, cannot get logger: " + name);
        throw std::runtime_error("[Registry] Logger not found: " + name);
    }
    return logger;
}

bool Registry::isInitialized() { return initialized_; }

}
