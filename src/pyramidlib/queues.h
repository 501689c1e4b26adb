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

#ifndef QUEUES_H
#define QUEUES_H

#include "BlockingQueue.h"
#include "TileImageSource.h"
#include "tile.h"

// unbounded: the writer pushes children into it and must never block.
using TaskQueue = BlockingQueue<tile::Id>;
using ResultQueue = BlockingQueue<FetchResult>;

#endif // QUEUES_H
