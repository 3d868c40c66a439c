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

#include "CellGeometryBuilder.h"
#include "../Core/GridException.h"
#include "../Topology/TopologyStore.h"

#include <utility>

namespace vgrid {

Ring CellVertices::ring(index_t c) const {
  const size_t n = ring_size(c);
  const real_t* xr = x_ring(c);
  const real_t* yr = y_ring(c);
  Ring out;
  out.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    out.push_back({xr[i], yr[i]});
  }
  return out;
}

CellGeometryBuilder::CellGeometryBuilder(const TopologyStore& store,
                                         const ReferenceFrame& frame,
                                         ElevationMidpointFn zfn)
    : store_(store), frame_(frame), zfn_(std::move(zfn)) {
  if (!zfn_) {
    zfn_ = compute_elevation_midpoints;
  }
}

CellGeometry CellGeometryBuilder::build() const {
  VGRID_THROW_IF(!store_.has_vertices() || !store_.has_topology(),
                 ConstructionIncompleteException,
                 "Cell geometry requires vertices and cell topology");

  CellGeometry geom;
  auto& centers = geom.centers;
  auto& verts = geom.vertices;
  const bool is_1d = store_.cell_kind() == CellKind::Cell1D;

  centers.x = store_.center_x();
  centers.y = store_.center_y();

  // ---- Resolve vertex ids to coordinates ----
  const auto& conn = store_.cell2vertex();
  const auto& vertex_table = store_.vertices();
  verts.offsets = store_.cell2vertex_offsets();
  verts.x.reserve(conn.size());
  verts.y.reserve(conn.size());
  if (is_1d) {
    verts.z.reserve(conn.size());
  }
  for (index_t id : conn) {
    const Vertex& v = vertex_table[static_cast<size_t>(store_.vertex_row(id))];
    verts.x.push_back(v.x);
    verts.y.push_back(v.y);
    if (is_1d) {
      verts.z.push_back(v.z);
    }
  }

  // ---- Vertical geometry ----
  if (is_1d) {
    centers.z.nrow = 1;
    centers.z.ncol = store_.ncells();
    centers.z.data = store_.center_z();
  } else {
    ElevationMidpoints zm = zfn_(store_);
    centers.z = std::move(zm.z_centers);
    verts.z_bounds = std::move(zm.z_vertices);
  }

  // ---- Reference frame ----
  if (!frame_.is_identity()) {
    CoordinateTransform::to_world(centers.x, centers.y, frame_);
    CoordinateTransform::to_world(verts.x, verts.y, frame_);
  }

  return geom;
}

} // namespace vgrid
