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

#include "PointLocator.h"
#include "../Core/GridException.h"
#include "../Core/Logger.h"
#include "../Geometry/PolygonGeometry.h"

#include <algorithm>
#include <sstream>
#include <string>

namespace vgrid {

PointLocator::PointLocator(const CellVertices& vertices,
                           const LayeredValues& top_botm,
                           const ReferenceFrame& frame,
                           index_t nlay,
                           index_t ncpl)
    : vertices_(vertices),
      top_botm_(top_botm),
      frame_(frame),
      nlay_(nlay),
      ncpl_(std::min(ncpl, vertices.n_cells())) {}

bool PointLocator::cell_contains(index_t c, real_t x, real_t y, real_t tolerance) const {
  const size_t n = vertices_.ring_size(c);
  const real_t* xr = vertices_.x_ring(c);
  const real_t* yr = vertices_.y_ring(c);

  if (!PolygonGeometry::in_bounding_box(x, y, xr, yr, n)) {
    return false;
  }

  // Negative radius for clockwise rings, positive for counter-clockwise:
  // contains_point() then grows either ring by the same band.
  const real_t radius = PolygonGeometry::is_clockwise(xr, yr, n) ? -tolerance : tolerance;
  return PolygonGeometry::contains_point(x, y, xr, yr, n, radius);
}

index_t PointLocator::find_layer(index_t c, real_t z) const {
  const index_t nbounds = std::min(nlay_, top_botm_.nrow - 1);
  for (index_t lay = 0; lay < nbounds; ++lay) {
    if (top_botm_.at(lay, c) >= z && z >= top_botm_.at(lay + 1, c)) {
      return lay;
    }
  }
  return INVALID_INDEX;
}

CellLocation PointLocator::locate(real_t x, real_t y,
                                  std::optional<real_t> z,
                                  const LocateOptions& options) const {
  VGRID_THROW_IF(z.has_value() && top_botm_.empty(), ConstructionIncompleteException,
                 "Locating by elevation requires top and botm");

  real_t px = x;
  real_t py = y;
  if (options.local) {
    const Point2 world = CoordinateTransform::to_world(x, y, frame_);
    px = world[0];
    py = world[1];
  }

  for (index_t c = 0; c < ncpl_; ++c) {
    if (!cell_contains(c, px, py, options.tolerance)) {
      continue;
    }
    CellLocation result;
    result.cell = c;
    if (!z) {
      result.found = true;
      return result;
    }
    const index_t lay = find_layer(c, *z);
    if (lay != INVALID_INDEX) {
      result.layer = lay;
      result.has_layer = true;
      result.found = true;
      return result;
    }
  }

  if (!options.forgive) {
    std::ostringstream oss;
    oss << "No cell contains the point";
    if (z) {
      oss << " at elevation " << *z;
    }
    throw LocationNotFoundException(oss.str(), px, py, __FILE__, __LINE__, __FUNCTION__);
  }

  VGRID_LOG_DEBUG("Point (" + std::to_string(px) + ", " + std::to_string(py) +
                  ") is outside the grid; returning an empty location");
  CellLocation miss;
  miss.has_layer = z.has_value();
  return miss;
}

} // namespace vgrid
