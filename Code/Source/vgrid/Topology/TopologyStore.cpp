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

#include "TopologyStore.h"
#include "../Core/GridException.h"

#include <string>

namespace vgrid {

// ==========================================
// Builders
// ==========================================

void TopologyStore::set_vertices(const std::vector<Vertex>& vertices) {
  std::unordered_map<index_t, index_t> row_by_id;
  row_by_id.reserve(vertices.size());
  for (size_t i = 0; i < vertices.size(); ++i) {
    const bool inserted = row_by_id.emplace(vertices[i].id, static_cast<index_t>(i)).second;
    VGRID_CHECK_ARG(inserted, "Duplicate vertex id " + std::to_string(vertices[i].id));
  }
  vertices_ = vertices;
  vertex_row_by_id_ = std::move(row_by_id);
}

void TopologyStore::set_cells(CellKind kind, size_t n_cells) {
  kind_ = kind;
  cell_ids_.clear();
  xc_.clear();
  yc_.clear();
  zc_.clear();
  cell2vertex_.clear();
  cell2vertex_offsets_.assign(1, 0);

  cell_ids_.reserve(n_cells);
  xc_.reserve(n_cells);
  yc_.reserve(n_cells);
  cell2vertex_offsets_.reserve(n_cells + 1);
}

void TopologyStore::append_ring(const std::vector<index_t>& vertex_ids) {
  for (index_t iv : vertex_ids) {
    if (iv != INVALID_INDEX) {
      cell2vertex_.push_back(iv);
    }
  }
  cell2vertex_offsets_.push_back(static_cast<offset_t>(cell2vertex_.size()));
}

void TopologyStore::set_cell2d(const std::vector<Cell2D>& cells) {
  set_cells(CellKind::Cell2D, cells.size());
  for (const auto& cell : cells) {
    cell_ids_.push_back(cell.cellid);
    xc_.push_back(cell.xc);
    yc_.push_back(cell.yc);
    append_ring(cell.vertex_ids);
  }
}

void TopologyStore::set_cell1d(const std::vector<Cell1D>& cells) {
  set_cells(CellKind::Cell1D, cells.size());
  zc_.reserve(cells.size());
  for (const auto& cell : cells) {
    cell_ids_.push_back(cell.cellid);
    xc_.push_back(cell.xc);
    yc_.push_back(cell.yc);
    zc_.push_back(cell.zc);
    append_ring(cell.vertex_ids);
  }
}

void TopologyStore::clear_topology() {
  set_cells(CellKind::None, 0);
  cell2vertex_offsets_.clear();
}

void TopologyStore::set_elevations(const std::vector<real_t>& top,
                                   const std::vector<std::vector<real_t>>& botm) {
  LayeredValues table;
  if (!botm.empty()) {
    table.nrow = static_cast<index_t>(botm.size());
    table.ncol = static_cast<index_t>(botm.front().size());
    table.data.reserve(botm.size() * botm.front().size());
    for (size_t lay = 0; lay < botm.size(); ++lay) {
      VGRID_CHECK_ARG(botm[lay].size() == botm.front().size(),
                      "botm layer " + std::to_string(lay) + " has " +
                      std::to_string(botm[lay].size()) + " cells, expected " +
                      std::to_string(botm.front().size()));
      table.data.insert(table.data.end(), botm[lay].begin(), botm[lay].end());
    }
    VGRID_CHECK_ARG(top.empty() || top.size() == botm.front().size(),
                    "top has " + std::to_string(top.size()) + " cells but botm rows have " +
                    std::to_string(botm.front().size()));
  }
  top_ = top;
  botm_ = std::move(table);
}

void TopologyStore::set_idomain(const std::vector<int>& idomain) {
  idomain_ = idomain;
}

void TopologyStore::set_layering(std::optional<index_t> nlay, std::optional<index_t> ncpl) {
  VGRID_CHECK_ARG(!nlay || *nlay >= 0, "nlay must be non-negative");
  VGRID_CHECK_ARG(!ncpl || *ncpl >= 0, "ncpl must be non-negative");
  nlay_ = nlay;
  ncpl_ = ncpl;
}

// ==========================================
// Sizes
// ==========================================

index_t TopologyStore::nlay() const {
  if (kind_ == CellKind::Cell1D) {
    return 1;
  }
  if (has_botm()) {
    return botm_.nrow;
  }
  if (nlay_) {
    return *nlay_;
  }
  return has_topology() ? 1 : 0;
}

index_t TopologyStore::ncpl() const {
  if (kind_ == CellKind::Cell1D) {
    return ncells();
  }
  if (has_botm()) {
    return botm_.ncol;
  }
  if (kind_ == CellKind::Cell2D && !nlay_) {
    return ncells();
  }
  if (ncpl_) {
    return *ncpl_;
  }
  return ncells();
}

// ==========================================
// Vertex / topology access
// ==========================================

index_t TopologyStore::vertex_row(index_t id) const {
  auto it = vertex_row_by_id_.find(id);
  if (it == vertex_row_by_id_.end()) {
    throw IndexOutOfRangeException("Vertex id " + std::to_string(id) + " is not in the vertex table",
                                   id, nvert(), __FILE__, __LINE__, __FUNCTION__);
  }
  return it->second;
}

std::pair<const index_t*, size_t> TopologyStore::cell_vertices_span(index_t c) const {
  VGRID_CHECK_INDEX(c, ncells(), "Cell index");
  const auto start = cell2vertex_offsets_[static_cast<size_t>(c)];
  const auto end = cell2vertex_offsets_[static_cast<size_t>(c) + 1];
  return {cell2vertex_.data() + start, static_cast<size_t>(end - start)};
}

std::vector<index_t> TopologyStore::cell_vertex_ids(index_t c) const {
  auto span = cell_vertices_span(c);
  return std::vector<index_t>(span.first, span.first + span.second);
}

std::vector<std::vector<index_t>> TopologyStore::iverts() const {
  std::vector<std::vector<index_t>> out;
  out.reserve(cell_ids_.size());
  for (index_t c = 0; c < ncells(); ++c) {
    out.push_back(cell_vertex_ids(c));
  }
  return out;
}

std::vector<Cell2D> TopologyStore::cell2d() const {
  std::vector<Cell2D> out;
  if (kind_ != CellKind::Cell2D) {
    return out;
  }
  out.reserve(cell_ids_.size());
  for (index_t c = 0; c < ncells(); ++c) {
    const auto i = static_cast<size_t>(c);
    out.push_back(Cell2D{cell_ids_[i], xc_[i], yc_[i], cell_vertex_ids(c)});
  }
  return out;
}

std::vector<Cell1D> TopologyStore::cell1d() const {
  std::vector<Cell1D> out;
  if (kind_ != CellKind::Cell1D) {
    return out;
  }
  out.reserve(cell_ids_.size());
  for (index_t c = 0; c < ncells(); ++c) {
    const auto i = static_cast<size_t>(c);
    out.push_back(Cell1D{cell_ids_[i], xc_[i], yc_[i], zc_[i], cell_vertex_ids(c)});
  }
  return out;
}

// ==========================================
// Elevations
// ==========================================

LayeredValues TopologyStore::top_botm() const {
  LayeredValues out;
  if (!has_elevations()) {
    return out;
  }
  out.nrow = botm_.nrow + 1;
  out.ncol = botm_.ncol;
  out.data.reserve(top_.size() + botm_.data.size());
  out.data.insert(out.data.end(), top_.begin(), top_.end());
  out.data.insert(out.data.end(), botm_.data.begin(), botm_.data.end());
  return out;
}

std::vector<int> TopologyStore::idomain() const {
  if (has_idomain()) {
    return idomain_;
  }
  return std::vector<int>(static_cast<size_t>(nnodes()), 1);
}

} // namespace vgrid
