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

#ifndef VGRID_POINT_LOCATOR_H
#define VGRID_POINT_LOCATOR_H

#include "../Core/GridConfig.h"
#include "../Core/GridTypes.h"
#include "../Geometry/CellGeometryBuilder.h"
#include "../Geometry/CoordinateTransform.h"

#include <optional>

namespace vgrid {

/**
 * @brief Per-query point location settings
 */
struct LocateOptions {
  bool local = false;     // (x, y) are in the local grid frame
  bool forgive = false;   // report a miss as found == false instead of throwing
  real_t tolerance = GridConfig::boundary_tolerance();
};

/**
 * @brief Point-in-cell lookup over world-coordinate cell rings
 *
 * Cells are scanned in ascending index order and the first cell whose ring
 * contains the point wins. Each ring is tested with a boundary band of
 * `tolerance`, signed by the ring orientation so the band always grows the
 * cell; a point on an edge shared by two cells therefore belongs to the
 * lower-indexed one.
 *
 * The locator borrows its inputs; they must outlive it.
 */
class PointLocator {
public:
  /**
   * @param vertices World-coordinate cell rings
   * @param top_botm Layer boundary elevations (nlay+1 rows); may be empty
   *                 when no query carries an elevation
   * @param frame    Frame used for queries with LocateOptions::local
   * @param nlay     Number of layers
   * @param ncpl     Number of cells per layer (cells scanned)
   */
  PointLocator(const CellVertices& vertices,
               const LayeredValues& top_botm,
               const ReferenceFrame& frame,
               index_t nlay,
               index_t ncpl);

  /**
   * @brief Locate the cell (and, with @p z, the layer) containing (x, y)
   *
   * With @p z, the first layer l of the containing cell with
   * top_botm[l][cell] >= z >= top_botm[l+1][cell] is reported. If that cell
   * has no such layer, the scan continues with the next cell.
   *
   * @throws LocationNotFoundException if nothing matches and !options.forgive
   * @throws ConstructionIncompleteException if @p z is given without elevations
   */
  CellLocation locate(real_t x, real_t y,
                      std::optional<real_t> z = std::nullopt,
                      const LocateOptions& options = LocateOptions{}) const;

  // Ring-only containment for cell @p c, with the orientation-signed band
  bool cell_contains(index_t c, real_t x, real_t y, real_t tolerance) const;

private:
  index_t find_layer(index_t c, real_t z) const;

  const CellVertices& vertices_;
  const LayeredValues& top_botm_;
  ReferenceFrame frame_;
  index_t nlay_;
  index_t ncpl_;
};

} // namespace vgrid

#endif // VGRID_POINT_LOCATOR_H
