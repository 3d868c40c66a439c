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

#ifndef VGRID_GRID_CONFIG_H
#define VGRID_GRID_CONFIG_H

/**
 * @file GridConfig.h
 * @brief Compile-time configuration and numeric policies for the vgrid library
 *
 * Settings can be overridden via CMake or compiler flags.
 */

#include "GridTypes.h"

// ============================================================================
// Build Configuration Detection
// ============================================================================

#if !defined(NDEBUG) || defined(DEBUG) || defined(_DEBUG)
    #define VGRID_DEBUG_MODE 1
#else
    #define VGRID_DEBUG_MODE 0
#endif

// Branch prediction hints
#if defined(__GNUC__) || defined(__clang__)
    #define VGRID_LIKELY(x)   __builtin_expect(!!(x), 1)
    #define VGRID_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
    #define VGRID_LIKELY(x)   (x)
    #define VGRID_UNLIKELY(x) (x)
#endif

namespace vgrid {

/**
 * @brief Global numeric tolerances for grid geometry.
 *
 * The boundary tolerance is the half-width of the band around a cell ring that
 * point location treats as part of the cell. It is a tunable default; callers
 * can override it per query through LocateOptions.
 */
struct GridConfig {
  // Default point-location boundary band
#ifndef VGRID_BOUNDARY_TOLERANCE
  static constexpr real_t boundary_tolerance() noexcept { return static_cast<real_t>(1e-9); }
#else
  static constexpr real_t boundary_tolerance() noexcept { return static_cast<real_t>(VGRID_BOUNDARY_TOLERANCE); }
#endif

  // Signed ring areas below this are treated as degenerate (collinear / 1-D chains)
  static constexpr real_t area_epsilon() noexcept { return static_cast<real_t>(1e-14); }
};

} // namespace vgrid

#endif // VGRID_GRID_CONFIG_H
