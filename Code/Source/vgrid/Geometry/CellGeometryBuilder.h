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

#ifndef VGRID_CELL_GEOMETRY_BUILDER_H
#define VGRID_CELL_GEOMETRY_BUILDER_H

#include "../Core/GridTypes.h"
#include "CoordinateTransform.h"
#include "ElevationMidpoints.h"

#include <cstddef>
#include <vector>

namespace vgrid {

class TopologyStore;

/**
 * @brief Per-cell center coordinates (cache key "cellcenters").
 *
 * x and y are world coordinates, one entry per cell. z holds, for 2-D grids,
 * the per-layer midpoint elevations (nlay rows); for 1-D grids one row of the
 * explicit cell z centers. z is empty for 2-D grids without elevations.
 */
struct CellCenters {
  std::vector<real_t> x;
  std::vector<real_t> y;
  LayeredValues z;
};

/**
 * @brief Per-cell vertex rings (cache key "xyzgrid").
 *
 * Rings are packed CSR-style: cell c owns entries [offsets[c], offsets[c+1])
 * of x and y, in the order the topology lists them. For 1-D grids z is
 * ring-aligned like x and y; for 2-D grids z_bounds holds the layer boundary
 * elevations (nlay+1 rows of ncpl) instead.
 */
struct CellVertices {
  std::vector<offset_t> offsets;
  std::vector<real_t> x;
  std::vector<real_t> y;
  std::vector<real_t> z;
  LayeredValues z_bounds;

  index_t n_cells() const noexcept {
    return offsets.empty() ? 0 : static_cast<index_t>(offsets.size() - 1);
  }

  size_t ring_size(index_t c) const {
    return static_cast<size_t>(offsets[static_cast<size_t>(c) + 1] - offsets[static_cast<size_t>(c)]);
  }

  const real_t* x_ring(index_t c) const { return x.data() + offsets[static_cast<size_t>(c)]; }
  const real_t* y_ring(index_t c) const { return y.data() + offsets[static_cast<size_t>(c)]; }

  std::vector<real_t> x_of(index_t c) const { return std::vector<real_t>(x_ring(c), x_ring(c) + ring_size(c)); }
  std::vector<real_t> y_of(index_t c) const { return std::vector<real_t>(y_ring(c), y_ring(c) + ring_size(c)); }

  Ring ring(index_t c) const;
};

/**
 * @brief Both derived bundles, produced together from one vertex-resolution pass
 */
struct CellGeometry {
  CellCenters centers;
  CellVertices vertices;
};

/**
 * @brief Resolves cell topology against the vertex table and applies the
 *        reference frame.
 *
 * x/y centers come from the cell records. For 2-D grids z comes from the
 * elevation-midpoint routine; for 1-D grids from the vertex z values and the
 * explicit cell z centers. When the frame is not the identity every center and
 * ring vertex is mapped to world coordinates. Cell and ring order are kept.
 */
class CellGeometryBuilder {
public:
  /**
   * @param store   Topology to resolve; must have vertices and cells
   * @param frame   Reference frame applied to every produced x/y
   * @param zfn     Elevation-midpoint routine for 2-D grids; an empty
   *                function selects compute_elevation_midpoints()
   */
  CellGeometryBuilder(const TopologyStore& store,
                      const ReferenceFrame& frame,
                      ElevationMidpointFn zfn = {});

  /**
   * @brief Build both bundles
   * @throws ConstructionIncompleteException if the store lacks vertices or cells
   * @throws IndexOutOfRangeException if a ring references an unknown vertex id
   */
  CellGeometry build() const;

private:
  const TopologyStore& store_;
  ReferenceFrame frame_;
  ElevationMidpointFn zfn_;
};

} // namespace vgrid

#endif // VGRID_CELL_GEOMETRY_BUILDER_H
