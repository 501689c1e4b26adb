/*****************************************************************************
 * Alpine Pyramid Builder
 * Copyright (C) 2024 alpinemaps.org
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 *****************************************************************************/

#ifndef PYRAMIDPIPELINE_H
#define PYRAMIDPIPELINE_H

#include <chrono>
#include <cstddef>
#include <vector>

#include "BlankTileClassifier.h"
#include "RetryPolicy.h"
#include "TileImageSource.h"
#include "TileStore.h"
#include "TileStoreWriter.h"
#include "tile.h"

struct PipelineConfig {
    unsigned min_zoom = 12;
    unsigned max_zoom = 20;
    unsigned concurrency = 32;
    std::size_t batch_size = 1000;
    std::size_t result_queue_capacity = 1000;
    RetryPolicy retry_policy;
    // 0 disables the progress log
    std::chrono::milliseconds progress_interval = std::chrono::milliseconds(1000);
};

struct PipelineStatistics {
    std::size_t base_tiles = 0;
    WriterStatistics writer;
    std::size_t outstanding_at_exit = 0;
};

/// Fetches the pyramid below a set of base tiles and stores every non blank tile.
/// A tile is subdivided only if it was fetched successfully and is not blank.
///
/// Dataflow: task queue -> fetch workers -> result queue -> writer (on the calling thread) -> task queue.
class PyramidPipeline {
public:
    PyramidPipeline(const TileImageSource& source, TileStore& store, const BlankTileClassifier& classifier, PipelineConfig config);

    /// blocks until the pyramid is complete. throws if the store fails, in that case all threads are stopped first.
    PipelineStatistics run(const std::vector<tile::Id>& base_tiles);

    [[nodiscard]] const PipelineConfig& config() const;

    /// throws Exception describing the first invalid setting.
    static void validate(const PipelineConfig& config);

private:
    const TileImageSource& m_source;
    TileStore& m_store;
    const BlankTileClassifier& m_classifier;
    const PipelineConfig m_config;
};

#endif // PYRAMIDPIPELINE_H
