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

#include "PolygonGeometry.h"
#include "../Core/GridConfig.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace vgrid {

namespace {

// > 0 if (px,py) is left of the directed edge a->b, < 0 if right, 0 if collinear
inline real_t is_left(real_t ax, real_t ay, real_t bx, real_t by, real_t px, real_t py) {
  return (bx - ax) * (py - ay) - (px - ax) * (by - ay);
}

inline real_t segment_distance(real_t px, real_t py,
                               real_t ax, real_t ay, real_t bx, real_t by) {
  const real_t dx = bx - ax;
  const real_t dy = by - ay;
  const real_t len2 = dx * dx + dy * dy;
  real_t t = 0.0;
  if (len2 > 0.0) {
    t = ((px - ax) * dx + (py - ay) * dy) / len2;
    t = std::min(std::max(t, static_cast<real_t>(0.0)), static_cast<real_t>(1.0));
  }
  const real_t cx = ax + t * dx - px;
  const real_t cy = ay + t * dy - py;
  return std::sqrt(cx * cx + cy * cy);
}

} // namespace

real_t PolygonGeometry::signed_area(const real_t* x, const real_t* y, size_t n) {
  if (n < 3) {
    return 0.0;
  }
  real_t twice_area = 0.0;
  for (size_t i = 0; i < n; ++i) {
    const size_t j = (i + 1) % n;
    twice_area += x[i] * y[j] - x[j] * y[i];
  }
  return static_cast<real_t>(0.5) * twice_area;
}

bool PolygonGeometry::is_clockwise(const real_t* x, const real_t* y, size_t n) {
  return signed_area(x, y, n) < -GridConfig::area_epsilon();
}

int PolygonGeometry::winding_number(real_t px, real_t py,
                                    const real_t* x, const real_t* y, size_t n) {
  int wn = 0;
  for (size_t i = 0; i < n; ++i) {
    const size_t j = (i + 1) % n;
    if (y[i] <= py) {
      if (y[j] > py && is_left(x[i], y[i], x[j], y[j], px, py) > 0.0) {
        ++wn;
      }
    } else {
      if (y[j] <= py && is_left(x[i], y[i], x[j], y[j], px, py) < 0.0) {
        --wn;
      }
    }
  }
  return wn;
}

real_t PolygonGeometry::distance_to_boundary(real_t px, real_t py,
                                             const real_t* x, const real_t* y, size_t n) {
  if (n == 0) {
    return std::numeric_limits<real_t>::infinity();
  }
  if (n == 1) {
    return std::hypot(px - x[0], py - y[0]);
  }
  real_t best = std::numeric_limits<real_t>::infinity();
  for (size_t i = 0; i < n; ++i) {
    const size_t j = (i + 1) % n;
    best = std::min(best, segment_distance(px, py, x[i], y[i], x[j], y[j]));
  }
  return best;
}

bool PolygonGeometry::in_bounding_box(real_t px, real_t py,
                                      const real_t* x, const real_t* y, size_t n) {
  if (n == 0) {
    return false;
  }
  const auto xr = std::minmax_element(x, x + n);
  const auto yr = std::minmax_element(y, y + n);
  return px >= *xr.first && px <= *xr.second &&
         py >= *yr.first && py <= *yr.second;
}

bool PolygonGeometry::contains_point(real_t px, real_t py,
                                     const real_t* x, const real_t* y, size_t n,
                                     real_t radius) {
  if (n == 0) {
    return false;
  }
  const bool inside = winding_number(px, py, x, y, n) != 0;
  if (radius == 0.0) {
    return inside;
  }

  // Orientation decides whether the signed radius grows or shrinks the ring.
  const real_t band = is_clockwise(x, y, n) ? -radius : radius;
  const real_t dist = distance_to_boundary(px, py, x, y, n);
  if (band > 0.0) {
    return inside || dist <= band;
  }
  return inside && dist > -band;
}

} // namespace vgrid
