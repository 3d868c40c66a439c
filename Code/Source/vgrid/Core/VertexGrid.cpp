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

#include "VertexGrid.h"
#include "GridException.h"
#include "Logger.h"
#include "../Fields/LayerArrayProjector.h"

#include <algorithm>
#include <string>
#include <utility>

namespace vgrid {

// ==========================================
// Construction
// ==========================================

VertexGrid::VertexGrid(const GridInput& input) {
  VGRID_CHECK_ARG(input.cell2d.empty() || input.cell1d.empty(),
                  "A grid takes either cell2d or cell1d records, not both");

  store_.set_vertices(input.vertices);
  if (!input.cell1d.empty()) {
    store_.set_cell1d(input.cell1d);
  } else if (!input.cell2d.empty()) {
    store_.set_cell2d(input.cell2d);
  }
  store_.set_layering(input.nlay, input.ncpl);
  store_.set_elevations(input.top, input.botm);
  store_.set_idomain(input.idomain);

  frame_.xoffset = input.xoffset;
  frame_.yoffset = input.yoffset;
  frame_.rotation = input.rotation;
}

// ==========================================
// Mutation
// ==========================================

void VertexGrid::touch(GridEvent event) {
  ++generation_;
  bus_.notify(event, generation_);
}

void VertexGrid::set_vertices(const std::vector<Vertex>& vertices) {
  store_.set_vertices(vertices);
  touch(GridEvent::GeometryChanged);
}

void VertexGrid::set_cell2d(const std::vector<Cell2D>& cells) {
  store_.set_cell2d(cells);
  touch(GridEvent::TopologyChanged);
}

void VertexGrid::set_cell1d(const std::vector<Cell1D>& cells) {
  store_.set_cell1d(cells);
  touch(GridEvent::TopologyChanged);
}

void VertexGrid::set_layering(std::optional<index_t> nlay, std::optional<index_t> ncpl) {
  store_.set_layering(nlay, ncpl);
  touch(GridEvent::TopologyChanged);
}

void VertexGrid::set_elevations(const std::vector<real_t>& top,
                                const std::vector<std::vector<real_t>>& botm) {
  store_.set_elevations(top, botm);
  touch(GridEvent::ElevationChanged);
}

void VertexGrid::set_idomain(const std::vector<int>& idomain) {
  store_.set_idomain(idomain);
  touch(GridEvent::DomainChanged);
}

void VertexGrid::set_elevation_midpoint_fn(ElevationMidpointFn fn) {
  zfn_ = std::move(fn);
  touch(GridEvent::ElevationChanged);
}

void VertexGrid::set_offsets(real_t xoffset, real_t yoffset) {
  frame_.xoffset = xoffset;
  frame_.yoffset = yoffset;
  VGRID_LOG_DEBUG("Grid offsets set to (" + std::to_string(xoffset) + ", " +
                  std::to_string(yoffset) + ")");
  touch(GridEvent::FrameChanged);
}

void VertexGrid::set_rotation(real_t radians) {
  frame_.rotation = radians;
  VGRID_LOG_DEBUG("Grid rotation set to " + std::to_string(radians) + " rad");
  touch(GridEvent::FrameChanged);
}

void VertexGrid::set_angrot_degrees(real_t degrees) {
  set_rotation(ReferenceFrame::degrees_to_radians(degrees));
}

void VertexGrid::set_reference_frame(const ReferenceFrame& frame) {
  frame_ = frame;
  VGRID_LOG_DEBUG("Grid reference frame replaced");
  touch(GridEvent::FrameChanged);
}

// ==========================================
// Derived geometry
// ==========================================

void VertexGrid::require_valid(const char* operation) const {
  VGRID_THROW_IF(!is_valid(), ConstructionIncompleteException,
                 std::string(operation) + " requires vertices and cell2d or cell1d data");
}

GeometryCache::BuildFn VertexGrid::builder() const {
  return [this]() { return CellGeometryBuilder(store_, frame_, zfn_).build(); };
}

std::vector<Point2> VertexGrid::verts() const {
  std::vector<Point2> out;
  out.reserve(store_.vertices().size());
  for (const auto& v : store_.vertices()) {
    out.push_back(frame_.is_identity() ? Point2{v.x, v.y}
                                       : CoordinateTransform::to_world(v.x, v.y, frame_));
  }
  return out;
}

CellCenters VertexGrid::xyzcellcenters() const {
  require_valid("xyzcellcenters");
  return cache_.cell_centers(generation_, builder());
}

GeometryView<CellCenters> VertexGrid::xyzcellcenters_view() const {
  require_valid("xyzcellcenters");
  return cache_.view_cell_centers(generation_, builder());
}

CellVertices VertexGrid::xyzvertices() const {
  require_valid("xyzvertices");
  return cache_.cell_vertices(generation_, builder());
}

GeometryView<CellVertices> VertexGrid::xyzvertices_view() const {
  require_valid("xyzvertices");
  return cache_.view_cell_vertices(generation_, builder());
}

std::vector<real_t> VertexGrid::xcellcenters() const {
  return xyzcellcenters_view()->x;
}

std::vector<real_t> VertexGrid::ycellcenters() const {
  return xyzcellcenters_view()->y;
}

LayeredValues VertexGrid::zcellcenters() const {
  return xyzcellcenters_view()->z;
}

std::vector<std::vector<real_t>> VertexGrid::xvertices() const {
  const auto view = xyzvertices_view();
  std::vector<std::vector<real_t>> out;
  out.reserve(static_cast<size_t>(view->n_cells()));
  for (index_t c = 0; c < view->n_cells(); ++c) {
    out.push_back(view->x_of(c));
  }
  return out;
}

std::vector<std::vector<real_t>> VertexGrid::yvertices() const {
  const auto view = xyzvertices_view();
  std::vector<std::vector<real_t>> out;
  out.reserve(static_cast<size_t>(view->n_cells()));
  for (index_t c = 0; c < view->n_cells(); ++c) {
    out.push_back(view->y_of(c));
  }
  return out;
}

std::vector<std::vector<real_t>> VertexGrid::xvertices_for_layer(index_t layer) const {
  VGRID_CHECK_INDEX(layer, nlay(), "Layer");
  return xvertices();
}

std::vector<std::vector<real_t>> VertexGrid::yvertices_for_layer(index_t layer) const {
  VGRID_CHECK_INDEX(layer, nlay(), "Layer");
  return yvertices();
}

std::vector<real_t> VertexGrid::xcellcenters_for_layer(index_t layer) const {
  VGRID_CHECK_INDEX(layer, nlay(), "Layer");
  return xcellcenters();
}

std::vector<real_t> VertexGrid::ycellcenters_for_layer(index_t layer) const {
  VGRID_CHECK_INDEX(layer, nlay(), "Layer");
  return ycellcenters();
}

Ring VertexGrid::cell_vertices(index_t cellid) const {
  require_valid("cell_vertices");
  VGRID_CHECK_INDEX(cellid, nnodes(), "Cell id");

  // Node ids repeat the horizontal geometry every ncpl
  const index_t cell = cellid % ncpl();

  const auto view = xyzvertices_view();
  VGRID_CHECK_INDEX(cell, view->n_cells(), "Cell id");
  return view->ring(cell);
}

Extent VertexGrid::extent() const {
  const auto view = xyzvertices_view();
  Extent ext;
  if (view->x.empty()) {
    return ext;
  }
  const auto xr = std::minmax_element(view->x.begin(), view->x.end());
  const auto yr = std::minmax_element(view->y.begin(), view->y.end());
  ext.xmin = *xr.first;
  ext.xmax = *xr.second;
  ext.ymin = *yr.first;
  ext.ymax = *yr.second;
  return ext;
}

std::vector<GridLine> VertexGrid::grid_lines() const {
  const auto view = xyzvertices_view();
  std::vector<GridLine> lines;
  lines.reserve(view->x.size());
  for (index_t c = 0; c < view->n_cells(); ++c) {
    const size_t n = view->ring_size(c);
    const real_t* xr = view->x_ring(c);
    const real_t* yr = view->y_ring(c);
    for (size_t i = 0; i < n; ++i) {
      const size_t prev = (i == 0) ? n - 1 : i - 1;
      lines.push_back(GridLine{{xr[prev], yr[prev]}, {xr[i], yr[i]}});
    }
  }
  return lines;
}

std::vector<Ring> VertexGrid::cell_polygons() const {
  const auto view = xyzvertices_view();
  const index_t ncells = std::min(ncpl(), view->n_cells());
  std::vector<Ring> polygons;
  polygons.reserve(static_cast<size_t>(ncells));
  for (index_t c = 0; c < ncells; ++c) {
    Ring ring = view->ring(c);
    if (!ring.empty()) {
      ring.push_back(ring.front());
    }
    polygons.push_back(std::move(ring));
  }
  return polygons;
}

std::vector<std::vector<Ring>> VertexGrid::export_polygons() const {
  std::vector<std::vector<Ring>> rows;
  for (auto& ring : cell_polygons()) {
    rows.push_back(std::vector<Ring>{std::move(ring)});
  }
  return rows;
}

// ==========================================
// Point location
// ==========================================

CellLocation VertexGrid::intersect(real_t x, real_t y,
                                   std::optional<real_t> z,
                                   const LocateOptions& options) const {
  const auto view = xyzvertices_view();
  const LayeredValues top_botm = z ? store_.top_botm() : LayeredValues{};
  const PointLocator locator(*view, top_botm, frame_, nlay(), ncpl());
  return locator.locate(x, y, z, options);
}

// ==========================================
// Layer arrays
// ==========================================

std::vector<real_t> VertexGrid::get_plottable_layer_array(const LayerArray& array,
                                                          index_t layer) const {
  return LayerArrayProjector(nlay(), ncpl()).project(array, layer);
}

index_t VertexGrid::get_number_plottable_layers(const LayerArray& array) const {
  return LayerArrayProjector(nlay(), ncpl()).number_plottable_layers(array);
}

LayerArray::Shape VertexGrid::get_plottable_layer_shape() const {
  return LayerArrayProjector(nlay(), ncpl()).plottable_layer_shape();
}

// ==========================================
// Conversion
// ==========================================

VertexGrid VertexGrid::convert_grid(real_t factor) const {
  VGRID_THROW_IF(!is_complete(), ConstructionIncompleteException,
                 "convert_grid requires vertices, cell data, top and botm");
  VGRID_CHECK_ARG(factor > 0.0, "Conversion factor must be positive, got " +
                  std::to_string(factor));

  GridInput input;
  input.vertices = store_.vertices();
  for (auto& v : input.vertices) {
    v.x *= factor;
    v.y *= factor;
    if (v.has_z) {
      v.z *= factor;
    }
  }

  input.cell2d = store_.cell2d();
  for (auto& cell : input.cell2d) {
    cell.xc *= factor;
    cell.yc *= factor;
  }
  input.cell1d = store_.cell1d();
  for (auto& cell : input.cell1d) {
    cell.xc *= factor;
    cell.yc *= factor;
    cell.zc *= factor;
  }

  input.top = store_.top();
  for (auto& t : input.top) {
    t *= factor;
  }
  const LayeredValues& botm = store_.botm();
  input.botm.reserve(static_cast<size_t>(botm.nrow));
  for (index_t lay = 0; lay < botm.nrow; ++lay) {
    std::vector<real_t> row = botm.row(lay);
    for (auto& b : row) {
      b *= factor;
    }
    input.botm.push_back(std::move(row));
  }

  if (store_.has_idomain()) {
    input.idomain = store_.idomain();
  }
  input.xoffset = frame_.xoffset * factor;
  input.yoffset = frame_.yoffset * factor;
  input.rotation = frame_.rotation;

  VertexGrid converted(input);
  converted.zfn_ = zfn_;

  VGRID_LOG_INFO("Converted vertex grid (" + std::to_string(nnodes()) +
                 " nodes) by factor " + std::to_string(factor));
  return converted;
}

} // namespace vgrid
