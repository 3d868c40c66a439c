/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 *
 * Permission is hereby granted, free of charge, to any person obtaining
 * a copy of this software and associated documentation files (the
 * "Software"), to deal in the Software without restriction, including
 * without limitation the rights to use, copy, modify, merge, publish,
 * distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject
 * to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included
 * in all copies or substantial portions of the Software.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS
 * IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED
 * TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A
 * PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT OWNER
 * OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL,
 * EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
 * PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR
 * PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF
 * LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING
 * NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

#include "GeometryCache.h"
#include "../Core/GridException.h"
#include "../Core/Logger.h"

#include <string>

namespace vgrid {

//=============================================================================
// Rebuild
//=============================================================================

void GeometryCache::ensure(std::uint64_t generation, const BuildFn& build) {
  if (is_current(generation)) {
    ++stats_.hits;
    return;
  }
  ++stats_.misses;

  VGRID_THROW_IF(!build, InternalConsistencyException,
                 "GeometryCache rebuild requested without a build function");

  // Build into locals first so a throwing build leaves the old entries intact.
  CellGeometry geom = build();
  auto centers = std::make_shared<const CellCenters>(std::move(geom.centers));
  auto vertices = std::make_shared<const CellVertices>(std::move(geom.vertices));

  centers_.data = std::move(centers);
  centers_.generation = generation;
  vertices_.data = std::move(vertices);
  vertices_.generation = generation;
  ++stats_.rebuilds;

  VGRID_LOG_DEBUG("Rebuilt cell geometry for " + std::to_string(vertices_.data->n_cells()) +
                  " cells at generation " + std::to_string(generation));
}

//=============================================================================
// Owned copies
//=============================================================================

CellCenters GeometryCache::cell_centers(std::uint64_t generation, const BuildFn& build) {
  ensure(generation, build);
  return *centers_.data;
}

CellVertices GeometryCache::cell_vertices(std::uint64_t generation, const BuildFn& build) {
  ensure(generation, build);
  return *vertices_.data;
}

//=============================================================================
// Shared views
//=============================================================================

GeometryView<CellCenters> GeometryCache::view_cell_centers(std::uint64_t generation,
                                                           const BuildFn& build) {
  ensure(generation, build);
  return GeometryView<CellCenters>(centers_.data, centers_.generation);
}

GeometryView<CellVertices> GeometryCache::view_cell_vertices(std::uint64_t generation,
                                                             const BuildFn& build) {
  ensure(generation, build);
  return GeometryView<CellVertices>(vertices_.data, vertices_.generation);
}

//=============================================================================
// Cache management
//=============================================================================

bool GeometryCache::is_current(GeometryKey key, std::uint64_t generation) const {
  switch (key) {
    case GeometryKey::CellCenters: return centers_.current(generation);
    case GeometryKey::XyzGrid:     return vertices_.current(generation);
  }
  return false;
}

void GeometryCache::invalidate() {
  centers_ = CachedEntry<CellCenters>{};
  vertices_ = CachedEntry<CellVertices>{};
}

} // namespace vgrid
