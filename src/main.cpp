#include <spdlog/spdlog.h>

#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "Core/MpvPlayer.h"
#include "Core/NetworkQualityEstimator.h"
#include "FeedConsole.h"
#include "Logging.h"
#include "MediaEngine.h"
#include "Net/BeastHttpClient.h"
#include "PersistenceManager.h"

namespace {
    const std::string DEFAULT_CONFIG_FILE = "reelcast.jsonc";
    const std::string CRASH_LOG_FILE = "reelcast_crash.log";
}

// --- Utility Functions ---

void print_help() {
    std::cout << "reelcast: adaptive media delivery engine for a vertical video feed." << std::endl;
    std::cout << "\nUSAGE:" << std::endl;
    std::cout << "  reelcast [--config <file>] --feed <file>" << std::endl;
    std::cout << "  reelcast [--config <file>] --probe" << std::endl;
    std::cout << "\nOPTIONS:" << std::endl;
    std::cout << "  --feed <file>        Plays the feed described by a JSON array of items." << std::endl;
    std::cout << "                       Viewport commands are read from stdin, type 'help' for a list." << std::endl;
    std::cout << "  --config <file>      Reads settings from <file> instead of " << DEFAULT_CONFIG_FILE << "." << std::endl;
    std::cout << "  --probe              Measures the network once and prints the quality tier." << std::endl;
    std::cout << "  --help, -h           Displays this help message." << std::endl;
}

void log_critical_error(const std::exception& e) {
    spdlog::critical("A critical error occurred: {}", e.what());
    std::cout << "\n\nA critical error occurred during startup:\n" << e.what() << std::endl;
    std::cout << "The application must close." << std::endl;

    FILE* logfile = fopen(CRASH_LOG_FILE.c_str(), "a");
    if (logfile) {
        time_t now = time(0);
        char dt[30];
        strftime(dt, sizeof(dt), "%Y-%m-%d %H:%M:%S", localtime(&now));
        fprintf(logfile, "[%s] Critical Error: %s\n", dt, e.what());
        fclose(logfile);
    }
}

struct CommandLine {
    std::string config_file = DEFAULT_CONFIG_FILE;
    std::string feed_file;
    bool probe = false;
    bool help = false;
};

// Returns false after printing the problem when the arguments make no sense.
bool parse_command_line(int argc, const char* argv[], CommandLine& cli) {
    std::vector<std::string> args(argv + 1, argv + argc);
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--help" || arg == "-h") {
            cli.help = true;
        } else if (arg == "--probe") {
            cli.probe = true;
        } else if (arg == "--config" || arg == "--feed") {
            if (i + 1 >= args.size()) {
                std::cerr << "Error: " << arg << " flag requires a filename." << std::endl;
                return false;
            }
            (arg == "--config" ? cli.config_file : cli.feed_file) = args[++i];
        } else {
            std::cerr << "Error: Unknown command '" << arg << "'." << std::endl;
            return false;
        }
    }
    if (!cli.help && !cli.probe && cli.feed_file.empty()) {
        std::cerr << "Error: nothing to do, pass --feed <file> or --probe." << std::endl;
        return false;
    }
    return true;
}

// --- Core Logic Functions ---

int run_probe(const EngineConfig& config) {
    if (config.network.probe_url.empty()) {
        std::cerr << "Error: network.probe_url is not configured." << std::endl;
        return 1;
    }
    BeastHttpClient http;
    NetworkQualityEstimator estimator(http, config.network);
    const QualityTier tier = estimator.measure();
    std::cout << to_string(tier) << " (" << std::fixed << std::setprecision(1) << estimator.lastSpeedKbps()
              << " KiB/s, chunk " << NetworkQualityEstimator::chunkSizeFor(tier) / 1024 << " KiB, initial buffer "
              << NetworkQualityEstimator::initialBufferFor(tier) / 1024 << " KiB)" << std::endl;
    return 0;
}

// Index of the item shown when the last session ended, 0 otherwise.
int resume_index(const EngineConfig& config, const std::vector<MediaItem>& items) {
    if (config.session_file.empty()) {
        return 0;
    }
    PersistenceManager persistence(config.session_file);
    if (auto last_media_id = persistence.loadLastMediaId()) {
        for (size_t i = 0; i < items.size(); ++i) {
            if (items[i].id == *last_media_id) {
                return static_cast<int>(i);
            }
        }
    }
    return 0;
}

void run_feed(const EngineConfig& config, const std::string& feed_file) {
    PersistenceManager persistence;
    std::vector<MediaItem> items = persistence.loadFeed(feed_file); // Can throw if file is invalid
    const int start_index = resume_index(config, items);
    StaticFeedSource feed(std::move(items));

    BeastHttpClient http;
    MpvPlayerFactory players(config.player);
    MediaEngine engine(config, feed, http, players);
    engine.onViewportChanged(start_index);

    Logging::quietConsole();
    FeedConsole console(engine, std::cin, std::cout);
    console.run();
    engine.shutdown();
}

// --- Main Entry Point ---
int main(int argc, const char* argv[]) {
    CommandLine cli;
    if (!parse_command_line(argc, argv, cli)) {
        print_help();
        return 1;
    }
    if (cli.help) {
        print_help();
        return 0;
    }

    try {
        PersistenceManager persistence;
        EngineConfig config = persistence.loadConfig(cli.config_file);
        Logging::init(config.log_level, config.log_file);

        if (cli.probe) {
            return run_probe(config);
        }
        run_feed(config, cli.feed_file);
    } catch (const std::exception& e) {
        log_critical_error(e);
        return 1;
    }
    return 0;
}
