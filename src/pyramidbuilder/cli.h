#ifndef CLI_H
#define CLI_H

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "PyramidPipeline.h"
#include "esri/ImageServiceTileSource.h"

namespace cli {
    struct Args {
        std::string endpoint;
        std::filesystem::path output_path;
        std::string name;
        unsigned min_zoom = 12;
        unsigned max_zoom = 20;
        unsigned concurrency = 32;
        unsigned tile_size = 256;
        std::string format = "png";
        std::string pixel_type = "U8";
        std::vector<int> no_data = {255};
        std::vector<std::size_t> blank_sizes = {776, 777};
        unsigned timeout_seconds = 15;
        unsigned retries = 5;
        unsigned retry_backoff_ms = 500;
        std::size_t batch_size = 1000;
        std::size_t result_queue_capacity = 1000;
        unsigned progress_interval_ms = 1000;
        spdlog::level::level_enum log_level = spdlog::level::level_enum::info;
    };

    // exits the process on invalid arguments
    Args parse(int argc, const char * const * argv);

    PipelineConfig to_pipeline_config(const Args &args);
    esri::ServiceRequestOptions to_request_options(const Args &args);
    // the tileset name, defaults to the output file name
    std::string tileset_name(const Args &args);
}; // namespace cli

#endif
