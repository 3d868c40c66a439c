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

#ifndef VGRID_POLYGON_GEOMETRY_H
#define VGRID_POLYGON_GEOMETRY_H

#include "../Core/GridTypes.h"

#include <cstddef>

namespace vgrid {

/**
 * @brief Planar polygon predicates over (x[], y[]) vertex rings.
 *
 * Rings are implicitly closed: the edge from the last vertex back to the
 * first is always included, and the first vertex should not be repeated.
 * Rings with fewer than three vertices (1-D chains) have zero area and are
 * reported as counter-clockwise.
 */
class PolygonGeometry {
public:
  // Shoelace area; positive for counter-clockwise rings.
  static real_t signed_area(const real_t* x, const real_t* y, size_t n);

  static bool is_clockwise(const real_t* x, const real_t* y, size_t n);

  /**
   * @brief Winding number of the ring around (px, py), Sunday's crossing rule
   *
   * Non-zero means inside. Points on the boundary may land either way; use
   * contains_point() with a radius for a deterministic boundary rule.
   */
  static int winding_number(real_t px, real_t py, const real_t* x, const real_t* y, size_t n);

  // Shortest distance from (px, py) to any ring edge.
  static real_t distance_to_boundary(real_t px, real_t py, const real_t* x, const real_t* y, size_t n);

  /**
   * @brief Inclusive bounding-box test: min(x) <= px <= max(x), same for y
   */
  static bool in_bounding_box(real_t px, real_t py, const real_t* x, const real_t* y, size_t n);

  /**
   * @brief Point-in-polygon with a boundary band.
   * @param radius Band half-width. A positive radius grows a counter-clockwise
   *        ring and shrinks a clockwise one; a negative radius does the
   *        opposite. Zero uses the bare winding number.
   *
   * Growing includes every point within |radius| of the boundary; shrinking
   * excludes them.
   */
  static bool contains_point(real_t px, real_t py, const real_t* x, const real_t* y, size_t n,
                             real_t radius = 0.0);
};

} // namespace vgrid

#endif // VGRID_POLYGON_GEOMETRY_H
