#include <iostream>
#include <string>

#include "core/Config.hpp"
#include "core/TargetRegionFinder.hpp"
#include "core/TmbProcessor.hpp"
#include "utils/ArgParser.hpp"
#include "utils/Logger.hpp"
#include "utils/ResourceMonitor.hpp"

int main(int argc, char** argv) {
    Tmber::Utils::ResourceMonitor monitor;

    Tmber::Config config;

    int parse_exit = 1;
    if (!Tmber::Utils::ArgParser::parse(argc, argv, config, &parse_exit)) {
        return parse_exit;  // Parse failed or help/version printed
    }

    // Configure Logger
    auto& logger = Tmber::Utils::Logger::instance();
    logger.set_log_level(config.log_level);
    if (!config.log_file.empty()) {
        try {
            logger.set_log_file(config.log_file);
        } catch (const Tmber::ConfigError& e) {
            LOG_ERROR(e.what());
            return 1;
        }
    }

    if (!config.validate()) {
        LOG_ERROR("Configuration validation failed.");
        return 1;
    }

    config.print();

    try {
        Tmber::Utils::ScopedLogger main_scope("Main Execution");

        if (config.command == Tmber::Command::BED) {
            Tmber::TargetRegionFinder finder(config);
            std::string bed_path = finder.run_and_write();
            std::cout << ">>\tWrite a BED file: " << bed_path << std::endl;
        } else if (config.command == Tmber::Command::TMB) {
            Tmber::TmbProcessor processor(config);

            LOG_INFO("[1] Loading region sets...");
            processor.load_region_sets();

            LOG_INFO("[2] Counting variants in " + std::to_string(processor.region_sets().size()) +
                     " region set(s)...");
            auto results = processor.process_all();

            LOG_INFO("[3] Writing results...");
            for (const auto& path : processor.write_results(results)) {
                std::cout << ">>\tWrite a TSV file: " << path << std::endl;
            }
            processor.print_summary(results);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: " + std::string(e.what()));
        return 1;
    }

    monitor.print_stats("Total Execution");

    return 0;
}
