/* layout.hpp

   Copyright (C) 2012 Risto Saarelma

   This program is free software: you can redistribute it and/or modify
   it under the terms of the GNU General Public License as published by
   the Free Software Foundation, either version 3 of the License, or
   (at your option) any later version.

   This program is distributed in the hope that it will be useful,
   but WITHOUT ANY WARRANTY; without even the implied warranty of
   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
   GNU General Public License for more details.

   You should have received a copy of the GNU General Public License
   along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef HEXLAT_LAYOUT_HPP
#define HEXLAT_LAYOUT_HPP

/** \file layout.hpp
 * Mapping between hex coordinates and pixel space.
 */

#include <hexlat/hex.hpp>
#include <hexlat/direction.hpp>
#include <hexlat/mtx.hpp>
#include <hexlat/vec.hpp>
#include <hexlat/box.hpp>
#include <boost/optional.hpp>
#include <array>
#include <vector>

namespace hexlat {

/**
 * Shape of the hexes on screen.
 *
 * The forward matrix takes axial (q, r) to pixel (x, y) for hexes of unit
 * size, the inverse takes pixels back to fractional axial coordinates. The
 * start angle, in sixths of a turn, is the angle of corner 0.
 */
class Orientation {
 public:
  /// Custom orientation. Throws Invalid_Orientation for a singular matrix.
  Orientation(const Mtx2d& forward, double start_angle);

  static const Orientation& pointy();

  static const Orientation& flat();

  const Mtx2d& forward() const { return forward_mtx; }

  const Mtx2d& inverse() const { return inverse_mtx; }

  double start_angle() const { return angle; }

  Orientation_Kind kind() const { return orientation_kind; }

 private:
  Orientation(const Mtx2d& forward, double start_angle, Orientation_Kind kind);

  Mtx2d forward_mtx;
  Mtx2d inverse_mtx;
  double angle;
  Orientation_Kind orientation_kind;
};

/**
 * Orientation, hex size and pixel offset of a hex grid on screen.
 *
 * The size is the distance from a hex center to its corners, separately for
 * the x and y axes so that hexes can be stretched. The origin is the pixel
 * position of the center of the origin hex.
 */
class Layout {
 public:
  /// Throws Invalid_Size if either size component is zero.
  Layout(const Orientation& orientation, const Vec2d& size, const Vec2d& origin = Vec2d(0, 0));

  Layout(const Orientation& orientation, double size, const Vec2d& origin = Vec2d(0, 0));

  static Layout pointy(double size = 1.0, const Vec2d& origin = Vec2d(0, 0));

  static Layout flat(double size = 1.0, const Vec2d& origin = Vec2d(0, 0));

  const Orientation& orientation() const { return orient; }

  const Vec2d& size() const { return hex_size; }

  const Vec2d& origin() const { return pixel_origin; }

  /// Pixel position of a hex center.
  template<class T>
  Vec2d to_pixel(const Hex<T>& hex) const {
    Vec2d pos = orient.forward() * Vec2d(static_cast<double>(hex.q()), static_cast<double>(hex.r()));
    return pos.elem_mul(hex_size) + pixel_origin;
  }

  /// Fractional hex at a pixel position. Use hex_at for the cell containing the pixel.
  Hexd to_hex(const Vec2d& pixel) const;

  Hexi hex_at(const Vec2d& pixel) const;

  /// Offset from a hex center to its corner `index`, 0 to 5.
  Vec2d corner_offset(int index) const;

  /**
   * Return the six corners of a hex in corner index order.
   *
   * A `factor` below 1 shrinks the polygon around the hex center, which
   * leaves gaps between neighboring hexes.
   */
  template<class T>
  std::array<Vec2d, 6> polygon_corners(const Hex<T>& hex, double factor = 1.0) const {
    std::array<Vec2d, 6> result;
    Vec2d center = to_pixel(hex);
    for (int i = 0; i < 6; i++)
      result[i] = center + corner_offset(i) * factor;
    return result;
  }

  /// Smallest pixel rectangle covering all the given hexes.
  template<class Hex_Range>
  Rectd pixel_bounds(const Hex_Range& hexes) const {
    std::vector<Vec2d> points;
    for (const auto& hex : hexes) {
      auto corners = polygon_corners(hex);
      points.insert(points.end(), corners.begin(), corners.end());
    }
    return Rectd::smallest_containing(points.begin(), points.end());
  }

  // Hex metrics are only defined for the preset orientations, custom
  // orientations throw Invalid_Orientation.

  double width() const;

  double height() const;

  /// Distance between the centers of horizontally adjacent hexes.
  double horizontal_spacing() const;

  /// Distance between the centers of vertically adjacent hexes.
  double vertical_spacing() const;

  Hexi o_clock(int hour) const;

  Hexi compass(Compass_Point point) const;

 private:
  Orientation orient;
  Vec2d hex_size;
  Vec2d pixel_origin;
};

/**
 * \name Default layout
 *
 * A process-wide layout for programs that only ever draw one grid. Nothing
 * in the library reads it except the convenience functions below, and it
 * starts out unset. Passing a Layout explicitly is preferred.
 */
///@{

void set_default_layout(const Layout& layout);

void clear_default_layout();

bool has_default_layout();

/// Throws Layout_Not_Set if no default layout has been set.
const Layout& default_layout();

/// Installs a default layout for its lifetime and then restores the previous state.
class Scoped_Default_Layout {
 public:
  explicit Scoped_Default_Layout(const Layout& layout);

  ~Scoped_Default_Layout();
 private:
  Scoped_Default_Layout(const Scoped_Default_Layout&);
  Scoped_Default_Layout& operator=(const Scoped_Default_Layout&);

  boost::optional<Layout> previous;
};

template<class T>
Vec2d to_pixel(const Hex<T>& hex) {
  return default_layout().to_pixel(hex);
}

Hexd to_hex(const Vec2d& pixel);

Hexi hex_at(const Vec2d& pixel);

template<class T>
std::array<Vec2d, 6> polygon_corners(const Hex<T>& hex, double factor = 1.0) {
  return default_layout().polygon_corners(hex, factor);
}

///@}

}

#endif
