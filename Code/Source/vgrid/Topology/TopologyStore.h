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

#ifndef VGRID_TOPOLOGY_STORE_H
#define VGRID_TOPOLOGY_STORE_H

#include "../Core/GridTypes.h"

#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace vgrid {

/**
 * @brief Raw grid input: vertex table, cell topology, elevations, idomain.
 *
 * Cell-to-vertex connectivity is kept in CSR form: `cell2vertex_offsets()`
 * has ncells+1 entries and cell c owns
 * `cell2vertex()[offsets[c] .. offsets[c+1])`. Padding entries
 * (INVALID_INDEX) in the incoming records are dropped here, so every stored
 * ring is compact.
 *
 * A store holds either Cell2D or Cell1D records, never both; setting one
 * table clears the other.
 *
 * The store does no topology validation beyond what is needed to keep its
 * own arrays consistent (duplicate vertex ids, ragged elevation rows).
 */
class TopologyStore {
public:
  TopologyStore() = default;

  // ---- Builders ----
  void set_vertices(const std::vector<Vertex>& vertices);
  void set_cell2d(const std::vector<Cell2D>& cells);
  void set_cell1d(const std::vector<Cell1D>& cells);
  void clear_topology();

  /**
   * @brief Set layer elevations
   * @param top  Top elevation per cell, size ncpl
   * @param botm Bottom elevation per layer and cell, botm[lay][cell]
   *
   * Either argument may be empty to clear it; when both are given every botm
   * row must have the length of @p top.
   */
  void set_elevations(const std::vector<real_t>& top,
                      const std::vector<std::vector<real_t>>& botm);
  void set_idomain(const std::vector<int>& idomain);

  /**
   * @brief Explicit layering, used only when botm is absent
   */
  void set_layering(std::optional<index_t> nlay, std::optional<index_t> ncpl);

  // ---- Completeness ----
  bool has_vertices() const noexcept { return !vertices_.empty(); }
  bool has_topology() const noexcept { return kind_ != CellKind::None; }
  bool has_top() const noexcept { return !top_.empty(); }
  bool has_botm() const noexcept { return !botm_.empty(); }
  bool has_elevations() const noexcept { return has_top() && has_botm(); }
  bool has_idomain() const noexcept { return !idomain_.empty(); }
  CellKind cell_kind() const noexcept { return kind_; }

  // ---- Sizes ----
  index_t nlay() const;
  index_t ncpl() const;
  index_t nnodes() const { return nlay() * ncpl(); }
  index_t nvert() const noexcept { return static_cast<index_t>(vertices_.size()); }
  index_t ncells() const noexcept { return static_cast<index_t>(cell_ids_.size()); }

  // ---- Vertices ----
  const std::vector<Vertex>& vertices() const noexcept { return vertices_; }
  /// Row of vertex @p id in vertices(); throws IndexOutOfRangeException if absent
  index_t vertex_row(index_t id) const;
  const Vertex& vertex(index_t id) const { return vertices_[static_cast<size_t>(vertex_row(id))]; }

  // ---- Topology access ----
  std::pair<const index_t*, size_t> cell_vertices_span(index_t c) const;
  std::vector<index_t> cell_vertex_ids(index_t c) const;
  const std::vector<offset_t>& cell2vertex_offsets() const noexcept { return cell2vertex_offsets_; }
  const std::vector<index_t>& cell2vertex() const noexcept { return cell2vertex_; }
  std::vector<std::vector<index_t>> iverts() const;

  const std::vector<index_t>& cell_ids() const noexcept { return cell_ids_; }
  const std::vector<real_t>& center_x() const noexcept { return xc_; }
  const std::vector<real_t>& center_y() const noexcept { return yc_; }
  // Explicit z centers; 1-D grids only
  const std::vector<real_t>& center_z() const noexcept { return zc_; }

  // Record views; empty unless the store holds that kind
  std::vector<Cell2D> cell2d() const;
  std::vector<Cell1D> cell1d() const;

  // ---- Elevations ----
  const std::vector<real_t>& top() const noexcept { return top_; }
  const LayeredValues& botm() const noexcept { return botm_; }
  /// top stacked over botm: nlay+1 rows of ncpl; empty without elevations
  LayeredValues top_botm() const;

  /// idomain per node; all ones (active) when none was supplied
  std::vector<int> idomain() const;

private:
  void set_cells(CellKind kind, size_t n_cells);
  void append_ring(const std::vector<index_t>& vertex_ids);

  std::vector<Vertex> vertices_;
  std::unordered_map<index_t, index_t> vertex_row_by_id_;

  CellKind kind_ = CellKind::None;
  std::vector<index_t> cell_ids_;
  std::vector<real_t> xc_;
  std::vector<real_t> yc_;
  std::vector<real_t> zc_;
  std::vector<offset_t> cell2vertex_offsets_;
  std::vector<index_t> cell2vertex_;

  std::vector<real_t> top_;
  LayeredValues botm_;
  std::vector<int> idomain_;

  std::optional<index_t> nlay_;
  std::optional<index_t> ncpl_;
};

} // namespace vgrid

#endif // VGRID_TOPOLOGY_STORE_H
