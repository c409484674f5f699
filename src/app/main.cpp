/**
 * stratagem: Headless campaign runner.
 *
 * Loads a campaign scenario JSON, advances it day by day through the tick
 * driver, and writes the resulting campaign report as JSON.
 *
 * Usage:
 *   stratagem --campaign <path> [--days N] [--rules <path>]
 *             [--output <path>] [--verbose] [--progress]
 */

#include "core/rules_config.hpp"
#include "io/json_reader.hpp"
#include "io/report_writer.hpp"
#include "io/rules_loader.hpp"
#include "io/scenario_loader.hpp"
#include "orders/tick_driver.hpp"
#include <chrono>
#include <fstream>
#include <iostream>
#include <string>

namespace {

struct RunConfig {
    std::string campaign_path;
    std::string rules_path;
    std::string output_path;        // empty = stdout
    int days = 1;
    bool verbose = false;
    bool progress = false;
};

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " --campaign <path> [options]\n"
              << "\n"
              << "Options:\n"
              << "  --campaign <path>    Campaign scenario JSON file (required)\n"
              << "  --days N             Number of days to advance (default: 1)\n"
              << "  --rules <path>       Rules override JSON file\n"
              << "  --output <path>      Report JSON file (default: stdout)\n"
              << "  --verbose            Order and tick log to stderr\n"
              << "  --progress           JSON-Lines progress to stderr\n"
              << "  --help               Show this message\n";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    RunConfig config;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--campaign" && i + 1 < argc) {
            config.campaign_path = argv[++i];
        } else if (arg == "--days" && i + 1 < argc) {
            try {
                config.days = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: --days expects an integer\n";
                return 1;
            }
        } else if (arg == "--rules" && i + 1 < argc) {
            config.rules_path = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            config.output_path = argv[++i];
        } else if (arg == "--verbose" || arg == "-v") {
            config.verbose = true;
        } else if (arg == "--progress") {
            config.progress = true;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (config.campaign_path.empty()) {
        std::cerr << "Error: --campaign is required\n\n";
        print_usage(argv[0]);
        return 1;
    }
    if (config.days < 0) {
        std::cerr << "Error: --days must not be negative\n";
        return 1;
    }

    strat::RulesConfig rules;
    strat::Campaign campaign;
    try {
        strat::JsonValue scenario = strat::JsonReader::parse_file(config.campaign_path);
        strat::load_rules_overrides(scenario["rules"], rules);
        if (!config.rules_path.empty()) strat::load_rules_file(config.rules_path, rules);
        campaign = strat::ScenarioLoader::load(scenario);
    } catch (const std::exception& e) {
        std::cerr << "Error loading campaign: " << e.what() << "\n";
        return 1;
    }

    if (config.verbose) {
        std::cerr << "[LOAD] " << campaign.name << " (id " << campaign.id << ")\n"
                  << "[LOAD] day " << campaign.current_day << ", "
                  << campaign.armies.size() << " armies, "
                  << campaign.strongholds.size() << " strongholds, "
                  << campaign.orders.size() << " orders\n";
    }

    auto t_start = std::chrono::high_resolution_clock::now();

    strat::orders::TickDriver driver(campaign, rules, {config.verbose});
    strat::orders::TickDriver::ProgressCallback progress_cb = nullptr;
    if (config.progress) {
        progress_cb = [&](int done, int total) {
            std::cerr << "{\"type\":\"day_complete\",\"day\":" << campaign.current_day
                      << ",\"done\":" << done << ",\"total\":" << total << "}\n" << std::flush;
        };
    }
    driver.run_days(config.days, progress_cb);

    auto t_end = std::chrono::high_resolution_clock::now();
    double elapsed = std::chrono::duration<double>(t_end - t_start).count();

    if (config.output_path.empty()) {
        strat::write_campaign_report(campaign, std::cout);
    } else {
        std::ofstream out(config.output_path);
        if (!out.is_open()) {
            std::cerr << "Error: cannot open output file: " << config.output_path << "\n";
            return 1;
        }
        strat::write_campaign_report(campaign, out);
        if (config.verbose) {
            std::cerr << "Report written to: " << config.output_path << "\n";
        }
    }

    if (config.progress) {
        std::cerr << "{\"type\":\"done\",\"days\":" << config.days
                  << ",\"elapsed\":" << elapsed << "}\n" << std::flush;
    }
    return 0;
}
