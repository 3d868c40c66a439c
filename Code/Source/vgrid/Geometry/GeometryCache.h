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

#ifndef VGRID_GEOMETRY_CACHE_H
#define VGRID_GEOMETRY_CACHE_H

#include "CellGeometryBuilder.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <utility>

namespace vgrid {

/**
 * @brief Named derived bundles held by the GeometryCache
 */
enum class GeometryKey {
  CellCenters,   // "cellcenters"
  XyzGrid        // "xyzgrid"
};

inline const char* geometry_key_name(GeometryKey key) {
  switch (key) {
    case GeometryKey::CellCenters: return "cellcenters";
    case GeometryKey::XyzGrid:     return "xyzgrid";
  }
  return "unknown";
}

/**
 * @brief Read-only borrowed view of a cached bundle.
 *
 * The view shares ownership of the bundle it was taken from, so it stays
 * valid (and unchanged) after the cache rebuilds; it simply keeps reading the
 * generation it was taken at. Only const access is exposed.
 */
template <typename T>
class GeometryView {
public:
  GeometryView() = default;
  GeometryView(std::shared_ptr<const T> data, std::uint64_t generation)
      : data_(std::move(data)), generation_(generation) {}

  const T& operator*() const { return *data_; }
  const T* operator->() const { return data_.get(); }
  const T& get() const { return *data_; }

  explicit operator bool() const noexcept { return static_cast<bool>(data_); }

  /// Grid generation the bundle was built at
  std::uint64_t generation() const noexcept { return generation_; }

private:
  std::shared_ptr<const T> data_;
  std::uint64_t generation_ = 0;
};

/**
 * @brief Generation-stamped cache of derived cell geometry
 *
 * Holds the two derived bundles of a grid, CellCenters and CellVertices.
 * Every read passes the owning grid's current generation counter together
 * with a build callable; when an entry is absent or was stamped with a
 * different generation, the callable runs once and both entries are replaced
 * together (all-or-nothing), stamped with the same generation.
 *
 * **Access modes:**
 * - cell_centers() / cell_vertices() return an owned copy the caller may mutate
 * - view_cell_centers() / view_cell_vertices() return a GeometryView without
 *   copying; used by read-heavy operations (extent, point location, grid lines)
 *
 * **Thread Safety:**
 * - Not thread-safe; the owning grid is single-writer
 */
class GeometryCache {
public:
  using BuildFn = std::function<CellGeometry()>;

  struct CacheStats {
    size_t hits{0};
    size_t misses{0};
    size_t rebuilds{0};
  };

  GeometryCache() = default;

  // ---- Owned copies ----
  CellCenters cell_centers(std::uint64_t generation, const BuildFn& build);
  CellVertices cell_vertices(std::uint64_t generation, const BuildFn& build);

  // ---- Shared views ----
  GeometryView<CellCenters> view_cell_centers(std::uint64_t generation, const BuildFn& build);
  GeometryView<CellVertices> view_cell_vertices(std::uint64_t generation, const BuildFn& build);

  // ---- Cache management ----

  /**
   * @brief True if @p key holds data built at @p generation
   */
  bool is_current(GeometryKey key, std::uint64_t generation) const;

  /// True if both bundles were built at @p generation
  bool is_current(std::uint64_t generation) const {
    return centers_.current(generation) && vertices_.current(generation);
  }

  /**
   * @brief Drop both bundles; the next read rebuilds
   */
  void invalidate();

  const CacheStats& stats() const noexcept { return stats_; }
  void reset_stats() { stats_ = CacheStats{}; }

private:
  template <typename T>
  struct CachedEntry {
    std::shared_ptr<const T> data;
    std::uint64_t generation = 0;

    bool current(std::uint64_t gen) const noexcept { return data && generation == gen; }
  };

  void ensure(std::uint64_t generation, const BuildFn& build);

  CachedEntry<CellCenters> centers_;
  CachedEntry<CellVertices> vertices_;
  CacheStats stats_;
};

} // namespace vgrid

#endif // VGRID_GEOMETRY_CACHE_H
