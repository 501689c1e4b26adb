#include <exception>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "BaseCoverTiler.h"
#include "BlankTileClassifier.h"
#include "ExtentResolver.h"
#include "MBTilesStore.h"
#include "PyramidPipeline.h"
#include "cli.h"
#include "ctb/GlobalMercator.hpp"
#include "esri/ImageServiceClient.h"
#include "esri/ImageServiceTileSource.h"
#include "http.h"
#include "log.h"

namespace {
constexpr int cExitStartupFailure = 1;
constexpr int cExitPersistenceFailure = 2;

// mbtiles only knows png, jpg and webp
std::string mbtiles_format(const std::string &export_format) {
    if (export_format.starts_with("png"))
        return "png";
    if (export_format == "jpg" || export_format == "jpgpng")
        return "jpg";
    return export_format;
}
}

int run(const cli::Args &args) {
    std::unique_ptr<http::CurlGlobal> curl;
    std::unique_ptr<esri::ImageServiceClient> client;
    std::optional<BaseCoverTiler> tiler;
    std::unique_ptr<esri::ImageServiceTileSource> source;
    std::unique_ptr<MBTilesStore> store;
    std::unique_ptr<PayloadSizeBlankTileClassifier> classifier;
    std::unique_ptr<PyramidPipeline> pipeline;
    std::vector<tile::Id> base_tiles;

    try {
        curl = std::make_unique<http::CurlGlobal>();
        client = std::make_unique<esri::ImageServiceClient>(args.endpoint);
        const auto request_options = cli::to_request_options(args);

        const ctb::GlobalMercator grid(args.tile_size);
        const auto service_extent = extent::fetch_full_extent(*client, request_options.timeout);
        const auto bounds = extent::to_grid_bounds(service_extent, grid);
        tiler.emplace(grid, bounds, tile::Scheme::SlippyMap);

        source = std::make_unique<esri::ImageServiceTileSource>(*client, *tiler, request_options);
        classifier = std::make_unique<PayloadSizeBlankTileClassifier>(std::set<std::size_t>(args.blank_sizes.begin(), args.blank_sizes.end()));

        store = std::make_unique<MBTilesStore>(args.output_path);
        store->writeMetadata({ cli::tileset_name(args),
            mbtiles_format(args.format),
            args.min_zoom,
            args.max_zoom,
            extent::to_wgs84_bounds(tiler->bounds(), grid),
            args.endpoint });

        pipeline = std::make_unique<PyramidPipeline>(*source, *store, *classifier, cli::to_pipeline_config(args));
        base_tiles = tiler->generateTiles(args.min_zoom);
    } catch (const std::exception &e) {
        LOG_FATAL("Startup failed: {}", e.what());
        return cExitStartupFailure;
    }

    LOG_INFO("Building the pyramid of {} from zoom level {} to {} into {}", args.endpoint, args.min_zoom, args.max_zoom, args.output_path.string());
    try {
        const auto statistics = pipeline->run(base_tiles);
        if (statistics.writer.failed > 0)
            LOG_WARN("{} tiles could not be fetched, their sub pyramids are missing.", statistics.writer.failed);
    } catch (const std::exception &e) {
        LOG_FATAL("Writing {} failed: {}", args.output_path.string(), e.what());
        return cExitPersistenceFailure;
    }
    return 0;
}

int main(int argc, char **argv) {
    const cli::Args args = cli::parse(argc, argv);
    Log::init(args.log_level);

    return run(args);
}
