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

#ifndef VGRID_VERTEX_GRID_H
#define VGRID_VERTEX_GRID_H

#include "GridTypes.h"
#include "../Fields/LayerArray.h"
#include "../Geometry/CellGeometryBuilder.h"
#include "../Geometry/CoordinateTransform.h"
#include "../Geometry/ElevationMidpoints.h"
#include "../Geometry/GeometryCache.h"
#include "../Observer/GridObserver.h"
#include "../Search/PointLocator.h"
#include "../Topology/TopologyStore.h"

#include <array>
#include <cstdint>
#include <optional>
#include <vector>

namespace vgrid {

/**
 * @brief Everything a grid-file loader hands to VertexGrid.
 *
 * Supply either cell2d or cell1d. rotation is in radians (loaders reading
 * degrees convert with ReferenceFrame::degrees_to_radians()). nlay and ncpl
 * are only consulted when botm is absent.
 */
struct GridInput {
  std::vector<Vertex> vertices;
  std::vector<Cell2D> cell2d;
  std::vector<Cell1D> cell1d;
  std::vector<real_t> top;
  std::vector<std::vector<real_t>> botm;
  std::vector<int> idomain;
  real_t xoffset = 0.0;
  real_t yoffset = 0.0;
  real_t rotation = 0.0;
  std::optional<index_t> nlay;
  std::optional<index_t> ncpl;
};

/**
 * @brief Unstructured layered grid of polygon (2-D) or segment-chain (1-D)
 *        cells over a shared vertex table.
 *
 * The horizontal geometry is the same in every layer; layers differ only in
 * their elevations. Node ids run layer by layer, node = layer * ncpl + cell.
 *
 * **Derived geometry:** cell centers and cell vertex rings in world
 * coordinates are built on first use and cached. Every mutation bumps the
 * grid generation, which makes the cached bundles stale, and publishes a
 * GridEvent on event_bus(). Accessors ending in _view() hand out read-only
 * shared views; the others return owned copies.
 *
 * **Preconditions:** operations on derived geometry require is_valid()
 * (vertices plus cell topology) and throw ConstructionIncompleteException
 * otherwise.
 *
 * **Thread Safety:** single writer, no concurrent readers during mutation.
 */
class VertexGrid {
public:
  VertexGrid() = default;
  explicit VertexGrid(const GridInput& input);

  VertexGrid(const VertexGrid&) = delete;
  VertexGrid& operator=(const VertexGrid&) = delete;
  VertexGrid(VertexGrid&&) = default;
  VertexGrid& operator=(VertexGrid&&) = default;

  const char* grid_type() const noexcept { return "vertex"; }

  // ---- Mutation ----
  void set_vertices(const std::vector<Vertex>& vertices);
  void set_cell2d(const std::vector<Cell2D>& cells);
  void set_cell1d(const std::vector<Cell1D>& cells);
  void set_layering(std::optional<index_t> nlay, std::optional<index_t> ncpl);
  void set_elevations(const std::vector<real_t>& top,
                      const std::vector<std::vector<real_t>>& botm);
  void set_idomain(const std::vector<int>& idomain);
  void set_elevation_midpoint_fn(ElevationMidpointFn fn);

  void set_offsets(real_t xoffset, real_t yoffset);
  void set_rotation(real_t radians);
  void set_angrot_degrees(real_t degrees);
  void set_reference_frame(const ReferenceFrame& frame);

  // ---- State ----
  bool is_valid() const noexcept { return store_.has_vertices() && store_.has_topology(); }
  bool is_complete() const noexcept { return is_valid() && store_.has_top() && store_.has_botm(); }
  std::uint64_t generation() const noexcept { return generation_; }
  GridEventBus& event_bus() noexcept { return bus_; }
  const TopologyStore& topology() const noexcept { return store_; }
  const GeometryCache::CacheStats& cache_stats() const noexcept { return cache_.stats(); }

  // ---- Sizes ----
  index_t nlay() const { return store_.nlay(); }
  index_t ncpl() const { return store_.ncpl(); }
  index_t nnodes() const { return store_.nnodes(); }
  index_t nvert() const noexcept { return store_.nvert(); }
  std::array<index_t, 2> shape() const { return {nlay(), ncpl()}; }

  // ---- Frame ----
  real_t xoffset() const noexcept { return frame_.xoffset; }
  real_t yoffset() const noexcept { return frame_.yoffset; }
  real_t angrot() const noexcept { return frame_.rotation_degrees(); }
  real_t angrot_radians() const noexcept { return frame_.rotation; }
  const ReferenceFrame& frame() const noexcept { return frame_; }

  // ---- Raw data ----
  const std::vector<Vertex>& vertices() const noexcept { return store_.vertices(); }
  std::vector<Cell2D> cell2d() const { return store_.cell2d(); }
  std::vector<Cell1D> cell1d() const { return store_.cell1d(); }
  std::vector<std::vector<index_t>> iverts() const { return store_.iverts(); }
  const std::vector<real_t>& top() const noexcept { return store_.top(); }
  const LayeredValues& botm() const noexcept { return store_.botm(); }
  LayeredValues top_botm() const { return store_.top_botm(); }
  std::vector<int> idomain() const { return store_.idomain(); }

  /// Vertex table positions in world coordinates, in table order
  std::vector<Point2> verts() const;

  // ---- Derived geometry ----
  CellCenters xyzcellcenters() const;
  GeometryView<CellCenters> xyzcellcenters_view() const;
  CellVertices xyzvertices() const;
  GeometryView<CellVertices> xyzvertices_view() const;

  std::vector<real_t> xcellcenters() const;
  std::vector<real_t> ycellcenters() const;
  LayeredValues zcellcenters() const;
  std::vector<std::vector<real_t>> xvertices() const;
  std::vector<std::vector<real_t>> yvertices() const;

  // Layer-invariant horizontal geometry; the layer is only range checked
  std::vector<std::vector<real_t>> xvertices_for_layer(index_t layer) const;
  std::vector<std::vector<real_t>> yvertices_for_layer(index_t layer) const;
  std::vector<real_t> xcellcenters_for_layer(index_t layer) const;
  std::vector<real_t> ycellcenters_for_layer(index_t layer) const;

  /**
   * @brief World-coordinate ring of a cell or node
   * @param cellid Cell id, or node id (layer * ncpl + cell); reduced modulo ncpl
   * @throws IndexOutOfRangeException if cellid < 0 or cellid >= nnodes
   */
  Ring cell_vertices(index_t cellid) const;

  Extent extent() const;

  /**
   * @brief Ring edges of every cell, for edge rendering
   *
   * For ring position i the segment runs from vertex i-1 to vertex i, so the
   * first segment of each cell is the closing edge (last -> first).
   */
  std::vector<GridLine> grid_lines() const;

  /// One closed ring (first vertex repeated) per cell
  std::vector<Ring> cell_polygons() const;

  /// Per cell, a one-element list holding its closed ring
  std::vector<std::vector<Ring>> export_polygons() const;

  // ---- Point location ----

  /**
   * @brief Cell (and layer, when @p z is given) containing a point
   * @see PointLocator::locate
   */
  CellLocation intersect(real_t x, real_t y,
                         std::optional<real_t> z = std::nullopt,
                         const LocateOptions& options = LocateOptions{}) const;

  // ---- Layer arrays ----
  std::vector<real_t> get_plottable_layer_array(const LayerArray& array, index_t layer) const;
  index_t get_number_plottable_layers(const LayerArray& array) const;
  LayerArray::Shape get_plottable_layer_shape() const;

  // ---- Conversion ----

  /**
   * @brief Copy of this grid with lengths multiplied by @p factor
   *
   * Scales vertex and center coordinates, elevations and offsets; keeps the
   * rotation and idomain.
   * @throws ConstructionIncompleteException unless is_complete()
   * @throws InvalidArgumentException if factor <= 0
   */
  VertexGrid convert_grid(real_t factor) const;

private:
  void require_valid(const char* operation) const;
  void touch(GridEvent event);
  GeometryCache::BuildFn builder() const;

  TopologyStore store_;
  ReferenceFrame frame_;
  ElevationMidpointFn zfn_;
  std::uint64_t generation_ = 0;
  mutable GeometryCache cache_;
  GridEventBus bus_;
};

} // namespace vgrid

#endif // VGRID_VERTEX_GRID_H
