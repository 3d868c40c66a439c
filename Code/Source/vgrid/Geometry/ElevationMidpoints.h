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

#ifndef VGRID_ELEVATION_MIDPOINTS_H
#define VGRID_ELEVATION_MIDPOINTS_H

#include "../Core/GridTypes.h"

#include <functional>

namespace vgrid {

class TopologyStore;

/**
 * @brief Vertical geometry of a layered 2-D grid, aligned with cell order.
 *
 * z_vertices holds the layer boundary elevations (nlay+1 rows of ncpl),
 * z_centers the per-layer cell mid elevations (nlay rows of ncpl). Both are
 * empty when the grid has no elevation data.
 */
struct ElevationMidpoints {
  LayeredValues z_vertices;
  LayeredValues z_centers;
};

/**
 * @brief Pluggable routine producing ElevationMidpoints for a store.
 *
 * Grids use compute_elevation_midpoints() unless a caller installs another
 * routine through VertexGrid::set_elevation_midpoint_fn().
 */
using ElevationMidpointFn = std::function<ElevationMidpoints(const TopologyStore&)>;

// z_vertices = top_botm; z_centers[l] = (top_botm[l] + top_botm[l+1]) / 2
ElevationMidpoints compute_elevation_midpoints(const TopologyStore& store);

} // namespace vgrid

#endif // VGRID_ELEVATION_MIDPOINTS_H
