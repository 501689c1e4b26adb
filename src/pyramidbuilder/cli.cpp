#include "cli.h"

#include <cstdlib>
#include <map>
#include <string>

#include <CLI/CLI.hpp>

using namespace cli;

Args cli::parse(int argc, const char * const * argv) {
    CLI::App app{"Pyramid Builder: downloads an ArcGIS image service into an mbtiles file"};
    app.set_config("--config", "", "Read options from an ini or toml file");

    Args args;
    app.add_option("--endpoint", args.endpoint, "ImageServer endpoint, e.g. https://host/arcgis/rest/services/Name/ImageServer")
        ->required();
    app.add_option("--output", args.output_path, "Path of the mbtiles file, created if it does not exist")
        ->required();
    app.add_option("--name", args.name, "Tileset name written to the metadata (default: output file name)");

    app.add_option("--min-zoom", args.min_zoom, "Zoom level of the base cover")
        ->check(CLI::Range(0, 30))
        ->capture_default_str();
    app.add_option("--max-zoom", args.max_zoom, "Deepest zoom level that is fetched")
        ->check(CLI::Range(0, 30))
        ->capture_default_str();
    app.add_option("--concurrency", args.concurrency, "Number of parallel requests")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();

    app.add_option("--tile-size", args.tile_size, "Tile width and height in pixels")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();
    app.add_option("--format", args.format, "exportImage format")
        ->check(CLI::IsMember({"jpgpng", "png", "png8", "png24", "png32", "jpg", "bmp", "gif", "tiff"}, CLI::ignore_case))
        ->capture_default_str();
    app.add_option("--pixel-type", args.pixel_type, "exportImage pixel type")
        ->check(CLI::IsMember({"C128", "C64", "F32", "F64", "S16", "S32", "S8", "U1", "U16", "U2", "U32", "U4", "U8"}))
        ->capture_default_str();
    app.add_option("--no-data", args.no_data, "Pixel values the service renders transparent")
        ->expected(1, -1)
        ->capture_default_str();
    app.add_option("--blank-sizes", args.blank_sizes, "Payload sizes in bytes of tiles that contain no data")
        ->expected(1, -1)
        ->capture_default_str();

    app.add_option("--timeout", args.timeout_seconds, "Timeout per tile in seconds, covers all requests of the tile")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();
    app.add_option("--retries", args.retries, "Attempts per tile before it is dropped")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();
    app.add_option("--retry-backoff", args.retry_backoff_ms, "Delay before the first retry in milliseconds, doubles with every retry")
        ->capture_default_str();
    app.add_option("--batch-size", args.batch_size, "Tiles per transaction")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();
    app.add_option("--result-queue-capacity", args.result_queue_capacity, "Fetched tiles waiting for the writer before the workers block")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();
    app.add_option("--progress-interval", args.progress_interval_ms, "Progress log interval in milliseconds, 0 disables it")
        ->capture_default_str();

    const std::map<std::string, spdlog::level::level_enum> log_level_names{
        {"off", spdlog::level::level_enum::off},
        {"critical", spdlog::level::level_enum::critical},
        {"error", spdlog::level::level_enum::err},
        {"warn", spdlog::level::level_enum::warn},
        {"info", spdlog::level::level_enum::info},
        {"debug", spdlog::level::level_enum::debug},
        {"trace", spdlog::level::level_enum::trace}};
    app.add_option("--verbosity", args.log_level, "Verbosity level of logging")
        ->transform(CLI::CheckedTransformer(log_level_names, CLI::ignore_case));

    try {
        app.parse(argc, argv);
        if (args.max_zoom < args.min_zoom)
            throw CLI::ValidationError("--max-zoom", "must not be smaller than --min-zoom");
    } catch (const CLI::ParseError &e) {
        const int code = app.exit(e);
        exit(code == 0 ? 0 : 1);
    }

    return args;
}

PipelineConfig cli::to_pipeline_config(const Args &args) {
    PipelineConfig config;
    config.min_zoom = args.min_zoom;
    config.max_zoom = args.max_zoom;
    config.concurrency = args.concurrency;
    config.batch_size = args.batch_size;
    config.result_queue_capacity = args.result_queue_capacity;
    config.retry_policy.max_attempts = args.retries;
    config.retry_policy.initial_backoff = std::chrono::milliseconds(args.retry_backoff_ms);
    config.progress_interval = std::chrono::milliseconds(args.progress_interval_ms);
    return config;
}

esri::ServiceRequestOptions cli::to_request_options(const Args &args) {
    esri::ServiceRequestOptions options;
    options.tile_size = args.tile_size;
    options.format = args.format;
    options.pixel_type = args.pixel_type;
    options.no_data = args.no_data;
    options.timeout = std::chrono::seconds(args.timeout_seconds);
    return options;
}

std::string cli::tileset_name(const Args &args) {
    if (!args.name.empty())
        return args.name;
    return args.output_path.stem().string();
}
