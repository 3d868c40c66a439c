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

#include "CoordinateTransform.h"
#include "../Core/GridException.h"

#include <Eigen/Dense>
#include <Eigen/Geometry>

#include <string>

namespace vgrid {

namespace {

using Points2 = Eigen::Matrix<real_t, 2, Eigen::Dynamic>;
using Coords = Eigen::Map<Eigen::Matrix<real_t, 1, Eigen::Dynamic>>;

Eigen::Rotation2D<real_t> rotation_of(const ReferenceFrame& frame) {
  return Eigen::Rotation2D<real_t>(frame.rotation);
}

Eigen::Matrix<real_t, 2, 1> offset_of(const ReferenceFrame& frame) {
  return Eigen::Matrix<real_t, 2, 1>(frame.xoffset, frame.yoffset);
}

void check_batch(const std::vector<real_t>& x, const std::vector<real_t>& y) {
  VGRID_CHECK_ARG(x.size() == y.size(),
                  "Coordinate batch size mismatch: " + std::to_string(x.size()) +
                  " x values, " + std::to_string(y.size()) + " y values");
}

} // namespace

real_t ReferenceFrame::rotation_degrees() const noexcept {
  return rotation * static_cast<real_t>(180.0) / static_cast<real_t>(EIGEN_PI);
}

real_t ReferenceFrame::degrees_to_radians(real_t degrees) noexcept {
  return degrees * static_cast<real_t>(EIGEN_PI) / static_cast<real_t>(180.0);
}

// ---- Scalar ----

Point2 CoordinateTransform::to_world(real_t x, real_t y, const ReferenceFrame& frame) {
  const Eigen::Matrix<real_t, 2, 1> p =
      rotation_of(frame) * Eigen::Matrix<real_t, 2, 1>(x, y) + offset_of(frame);
  return {p.x(), p.y()};
}

Point2 CoordinateTransform::to_local(real_t x, real_t y, const ReferenceFrame& frame) {
  const Eigen::Matrix<real_t, 2, 1> p =
      rotation_of(frame).inverse() * (Eigen::Matrix<real_t, 2, 1>(x, y) - offset_of(frame));
  return {p.x(), p.y()};
}

// ---- Batched ----

void CoordinateTransform::to_world(std::vector<real_t>& x, std::vector<real_t>& y,
                                   const ReferenceFrame& frame) {
  check_batch(x, y);
  if (x.empty()) {
    return;
  }
  const auto n = static_cast<Eigen::Index>(x.size());
  Coords xs(x.data(), n);
  Coords ys(y.data(), n);

  Points2 pts(2, n);
  pts.row(0) = xs;
  pts.row(1) = ys;
  const Points2 rotated = rotation_of(frame).toRotationMatrix() * pts;
  pts = rotated.colwise() + offset_of(frame);

  xs = pts.row(0);
  ys = pts.row(1);
}

void CoordinateTransform::to_local(std::vector<real_t>& x, std::vector<real_t>& y,
                                   const ReferenceFrame& frame) {
  check_batch(x, y);
  if (x.empty()) {
    return;
  }
  const auto n = static_cast<Eigen::Index>(x.size());
  Coords xs(x.data(), n);
  Coords ys(y.data(), n);

  Points2 pts(2, n);
  pts.row(0) = xs;
  pts.row(1) = ys;
  const Points2 shifted = pts.colwise() - offset_of(frame);
  pts = rotation_of(frame).inverse().toRotationMatrix() * shifted;

  xs = pts.row(0);
  ys = pts.row(1);
}

} // namespace vgrid
