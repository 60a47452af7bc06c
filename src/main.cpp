/**
 * Build Fetch - Locate and download the newest build package from a
 * remote build repository
 *
 * Copyright (C) 2024
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <atomic>
#include <csignal>
#include <iostream>
#include <optional>

#include <QCoreApplication>
#include <QCommandLineParser>
#include <QTimer>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include "acquisition/AcquisitionOrchestrator.hpp"
#include "core/config/ConfigManager.hpp"
#include "core/platform/Platform.hpp"
#include "network/QtHttpClient.hpp"
#include "selection/CandidateSelector.hpp"

namespace {

enum ExitCode {
    ExitOk = 0,
    ExitUsage = 1,
    ExitNotFound = 2,
    ExitAmbiguous = 3,
    ExitAuth = 4,
    ExitTransport = 5,
    ExitIntegrity = 6,
    ExitCancelled = 7,
    ExitStorage = 8
};

std::atomic<bool> g_interrupted{false};

void handleInterrupt(int) {
    g_interrupted = true;
}

int exitCodeFor(buildfetch::ErrorKind kind) {
    using buildfetch::ErrorKind;
    switch (kind) {
        case ErrorKind::NotFound:  return ExitNotFound;
        case ErrorKind::Ambiguous: return ExitAmbiguous;
        case ErrorKind::Auth:      return ExitAuth;
        case ErrorKind::Transport: return ExitTransport;
        case ErrorKind::Integrity: return ExitIntegrity;
        case ErrorKind::Cancelled: return ExitCancelled;
        case ErrorKind::Storage:   return ExitStorage;
    }
    return ExitUsage;
}

spdlog::level::level_enum levelFromName(const std::string& name) {
    if (name == "debug") return spdlog::level::debug;
    if (name == "warning" || name == "warn") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    return spdlog::level::info;
}

std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> setupLogging(bool verbose) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(verbose ? spdlog::level::debug : spdlog::level::info);

    std::vector<spdlog::sink_ptr> sinks{console_sink};

    auto logPath = buildfetch::Platform::getLogPath() / "build-fetch.log";
    std::error_code ec;
    std::filesystem::create_directories(logPath.parent_path(), ec);
    if (!ec) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logPath.string(), 1024 * 1024 * 5, 3);
        file_sink->set_level(spdlog::level::debug);
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("build-fetch", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::debug);

    spdlog::set_default_logger(logger);
    if (ec) {
        spdlog::warn("Logging to console only, cannot create {}: {}",
                     logPath.parent_path().string(), ec.message());
    }
    return console_sink;
}

int printStatus(const std::filesystem::path& target) {
    auto state = buildfetch::TransferManager::readState(target);
    if (!state) {
        std::cout << "No transfer record for " << target.string() << std::endl;
        return ExitUsage;
    }

    std::cout << "file:        " << state->localPath << "\n"
              << "source:      " << state->sourceUrl << "\n"
              << "status:      " << buildfetch::transferStatusLabel(state->status) << "\n"
              << "transferred: " << state->bytesTransferred;
    if (state->totalBytes) {
        std::cout << " / " << *state->totalBytes;
    }
    std::cout << "\n";
    if (!state->etag.empty()) {
        std::cout << "etag:        " << state->etag << "\n";
    }
    if (!state->lastModified.empty()) {
        std::cout << "modified:    " << state->lastModified << "\n";
    }
    std::cout << std::flush;
    return ExitOk;
}

int listCandidates(buildfetch::AcquisitionOrchestrator& orchestrator, const QString& url) {
    try {
        auto ranked = orchestrator.discover(url);
        if (ranked.empty()) {
            std::cout << "No package candidates found" << std::endl;
            return ExitNotFound;
        }
        // Mark the winner unless the top two tie
        bool hasWinner = ranked.size() == 1 ||
            buildfetch::CandidateSelector::outranks(ranked[0], ranked[1]);
        for (size_t i = 0; i < ranked.size(); ++i) {
            const auto& candidate = ranked[i];
            std::cout << (i == 0 && hasWinner ? "* " : "  ")
                      << buildfetch::packageKindLabel(candidate.kind) << "\t"
                      << (candidate.sizeHint ? std::to_string(*candidate.sizeHint) : std::string("-"))
                      << "\t" << candidate.url.toString().toStdString() << "\n";
        }
        std::cout << std::flush;
        if (!hasWinner) {
            spdlog::warn("The top candidates tie; a download would fail as ambiguous");
        }
        return ExitOk;
    } catch (const buildfetch::AcquisitionError& e) {
        spdlog::error("{}", e.describe());
        return exitCodeFor(e.kind());
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("build-fetch");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("build-fetch");

    // Parse command line arguments
    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Find the best build package under a repository URL and download it, resumably");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("url", "Repository directory URL or direct file URL");

    QCommandLineOption outputOption(
        QStringList() << "o" << "output",
        "Directory to download into",
        "directory"
    );
    parser.addOption(outputOption);

    QCommandLineOption configDirOption(
        QStringList() << "c" << "config-directory",
        "Configuration directory path",
        "path"
    );
    parser.addOption(configDirOption);

    QCommandLineOption depthOption(
        QStringList() << "d" << "max-depth",
        "Maximum directory depth below the root",
        "levels"
    );
    parser.addOption(depthOption);

    QCommandLineOption listOption(
        "list",
        "List ranked candidates without downloading"
    );
    parser.addOption(listOption);

    QCommandLineOption statusOption(
        "status",
        "Show the recorded transfer state of a downloaded or partial file",
        "file"
    );
    parser.addOption(statusOption);

    QCommandLineOption verboseOption(
        QStringList() << "v" << "verbose",
        "Debug output on the console"
    );
    parser.addOption(verboseOption);

    parser.process(app);

    auto consoleSink = setupLogging(parser.isSet(verboseOption));

    if (parser.isSet(statusOption)) {
        return printStatus(parser.value(statusOption).toStdString());
    }

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        parser.showHelp(ExitUsage);
    }
    const QString url = positional.first();

    // Initialize configuration
    std::filesystem::path configPath;
    if (parser.isSet(configDirOption)) {
        configPath = parser.value(configDirOption).toStdString();
    } else {
        configPath = buildfetch::Platform::getConfigPath();
    }

    auto& configManager = buildfetch::ConfigManager::instance();
    if (!configManager.initialize(configPath)) {
        spdlog::error("Failed to initialize configuration");
        return ExitUsage;
    }
    spdlog::info("Configuration loaded from: {}", configPath.string());

    // First run: leave an editable config.json behind
    if (configManager.isFirstRun() && configManager.save()) {
        spdlog::info("Wrote default configuration to {}", configManager.configFilePath().string());
    }

    if (!parser.isSet(verboseOption)) {
        consoleSink->set_level(levelFromName(configManager.programConfig().logVerbosity));
    }

    buildfetch::FetchConfig fetchConfig = configManager.fetchConfig();
    if (parser.isSet(depthOption)) {
        bool ok = false;
        int depth = parser.value(depthOption).toInt(&ok);
        if (!ok || depth < 0) {
            spdlog::error("Invalid --max-depth value: {}", parser.value(depthOption).toStdString());
            return ExitUsage;
        }
        fetchConfig.repository.maxDepth = depth;
    }

    buildfetch::QtHttpClient http(configManager.authConfig(), fetchConfig.transfer);
    buildfetch::AcquisitionOrchestrator orchestrator(http, fetchConfig);

    if (parser.isSet(listOption)) {
        return listCandidates(orchestrator, url);
    }

    std::filesystem::path outputDir = parser.isSet(outputOption)
        ? std::filesystem::path(parser.value(outputOption).toStdString())
        : configManager.downloadDirectory();

    std::signal(SIGINT, handleInterrupt);
    std::signal(SIGTERM, handleInterrupt);

    buildfetch::AcquisitionHandle handle = orchestrator.start(url, outputDir);

    int exitCode = ExitOk;
    bool cancelRequested = false;
    std::optional<buildfetch::AcquisitionPhase> lastPhase;
    QTimer monitor;
    QObject::connect(&monitor, &QTimer::timeout, [&]() {
        if (g_interrupted && !cancelRequested) {
            cancelRequested = true;
            spdlog::info("Interrupted, pausing download");
            orchestrator.cancel(handle);
        }
        if (auto progress = orchestrator.queryProgress(handle)) {
            if (progress->phase != lastPhase) {
                lastPhase = progress->phase;
                spdlog::debug("Acquisition #{}: {}", handle,
                              buildfetch::acquisitionPhaseLabel(progress->phase));
                if (progress->phase == buildfetch::AcquisitionPhase::Transferring) {
                    spdlog::info("Selected {}", progress->currentFile.toStdString());
                }
            }
        }
        if (!orchestrator.isFinished(handle)) {
            return;
        }

        monitor.stop();
        buildfetch::AcquisitionResult result = orchestrator.wait(handle);
        if (result.success && result.file) {
            std::cout << result.file->localPath.string() << std::endl;
        } else if (result.error) {
            spdlog::error("{}", result.error->describe());
            exitCode = exitCodeFor(result.error->kind());
        }
        app.exit(exitCode);
    });
    monitor.start(100);

    return app.exec();
}
