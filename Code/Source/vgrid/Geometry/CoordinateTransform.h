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

#ifndef VGRID_COORDINATE_TRANSFORM_H
#define VGRID_COORDINATE_TRANSFORM_H

#include "../Core/GridTypes.h"

#include <vector>

namespace vgrid {

/**
 * @brief Rigid placement of the local grid frame in world coordinates.
 *
 * World = R(rotation) * local + (xoffset, yoffset), with rotation in radians,
 * counter-clockwise positive, about the local origin.
 */
struct ReferenceFrame {
  real_t xoffset = 0.0;
  real_t yoffset = 0.0;
  real_t rotation = 0.0;   // radians

  bool is_identity() const noexcept {
    return xoffset == 0.0 && yoffset == 0.0 && rotation == 0.0;
  }

  real_t rotation_degrees() const noexcept;

  static real_t degrees_to_radians(real_t degrees) noexcept;
};

/**
 * @brief Local <-> world coordinate mapping for a ReferenceFrame.
 *
 * Scalar and batched forms are element-wise identical. to_local() is the
 * algebraic inverse of to_world(): translate by -offset, then rotate by
 * -rotation.
 */
class CoordinateTransform {
public:
  static Point2 to_world(real_t x, real_t y, const ReferenceFrame& frame);
  static Point2 to_local(real_t x, real_t y, const ReferenceFrame& frame);

  // Batched, in place. x and y must have equal length.
  static void to_world(std::vector<real_t>& x, std::vector<real_t>& y, const ReferenceFrame& frame);
  static void to_local(std::vector<real_t>& x, std::vector<real_t>& y, const ReferenceFrame& frame);
};

} // namespace vgrid

#endif // VGRID_COORDINATE_TRANSFORM_H
