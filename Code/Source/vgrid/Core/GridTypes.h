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

#ifndef VGRID_GRID_TYPES_H
#define VGRID_GRID_TYPES_H

#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

namespace vgrid {

// ------------------------
// Fundamental type aliases
// ------------------------
using index_t  = int32_t;     // cell / vertex / layer indices
using offset_t = int64_t;     // CSR offsets
using real_t   = double;      // coordinates and elevations

// ---------
// Constants
// ---------
constexpr index_t INVALID_INDEX = -1;

// ---------
// Enums
// ---------
enum class CellKind {
  None,     // no topology set
  Cell2D,   // polygon rings, layered
  Cell1D    // segment chains, single layer
};

// --------------------
// Basic data structures
// --------------------
using Point2 = std::array<real_t,2>;
using Ring   = std::vector<Point2>;

/**
 * @brief One row of the vertex table.
 *
 * `z` is only meaningful for 1-D grids; 2-D grids take elevations from the
 * top/botm arrays instead.
 */
struct Vertex {
  index_t id = INVALID_INDEX;
  real_t x = 0.0;
  real_t y = 0.0;
  real_t z = 0.0;
  bool has_z = false;
};

/**
 * @brief Polygon cell record (one per cell in a layer).
 *
 * `vertex_ids` lists the ring in order; trailing INVALID_INDEX entries are
 * padding and are dropped when the record is stored.
 */
struct Cell2D {
  index_t cellid = INVALID_INDEX;
  real_t xc = 0.0;
  real_t yc = 0.0;
  std::vector<index_t> vertex_ids;
};

/**
 * @brief Segment-chain cell record. 1-D grids always have a single layer.
 */
struct Cell1D {
  index_t cellid = INVALID_INDEX;
  real_t xc = 0.0;
  real_t yc = 0.0;
  real_t zc = 0.0;
  std::vector<index_t> vertex_ids;
};

/**
 * @brief Dense row-major 2-D table of reals, e.g. top_botm[layer][cell].
 */
struct LayeredValues {
  std::vector<real_t> data;
  index_t nrow = 0;
  index_t ncol = 0;

  bool empty() const noexcept { return data.empty(); }

  real_t at(index_t row, index_t col) const {
    return data.at(static_cast<size_t>(row) * static_cast<size_t>(ncol) + static_cast<size_t>(col));
  }

  real_t& at(index_t row, index_t col) {
    return data.at(static_cast<size_t>(row) * static_cast<size_t>(ncol) + static_cast<size_t>(col));
  }

  std::vector<real_t> row(index_t r) const {
    const auto first = data.begin() + static_cast<std::ptrdiff_t>(r) * ncol;
    return std::vector<real_t>(first, first + ncol);
  }
};

struct Extent {
  real_t xmin = 0.0;
  real_t xmax = 0.0;
  real_t ymin = 0.0;
  real_t ymax = 0.0;
};

struct GridLine {
  Point2 start{};
  Point2 end{};
};

// --------------------
// Search result structures
// --------------------

/**
 * @brief Result of a point location query.
 *
 * When the query is forgiven and nothing contains the point, `found` is false
 * and both indices are INVALID_INDEX; the *_or_nan() accessors then return NaN.
 */
struct CellLocation {
  index_t cell = INVALID_INDEX;
  index_t layer = INVALID_INDEX;
  bool has_layer = false;   // true when the query carried an elevation
  bool found = false;

  real_t cell_or_nan() const noexcept {
    return found ? static_cast<real_t>(cell) : std::numeric_limits<real_t>::quiet_NaN();
  }

  real_t layer_or_nan() const noexcept {
    return (found && has_layer) ? static_cast<real_t>(layer)
                                : std::numeric_limits<real_t>::quiet_NaN();
  }
};

} // namespace vgrid

#endif // VGRID_GRID_TYPES_H
