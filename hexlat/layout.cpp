/* layout.cpp

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

#include "layout.hpp"
#include <hexlat/error.hpp>
#include <hexlat/num.hpp>
#include <cmath>

namespace hexlat {

// Built on first use so that layouts in other files' static initializers can
// see it.
static boost::optional<Layout>& default_layout_slot() {
  static boost::optional<Layout> slot;
  return slot;
}

static Mtx2d checked_inverse(const Mtx2d& forward) {
  if (near_zero(forward.determinant()))
    throw Invalid_Orientation();
  return forward.inverted();
}

Orientation::Orientation(const Mtx2d& forward, double start_angle)
  : forward_mtx(forward)
  , inverse_mtx(checked_inverse(forward))
  , angle(start_angle)
  , orientation_kind(custom_kind) {}

Orientation::Orientation(const Mtx2d& forward, double start_angle, Orientation_Kind kind)
  : forward_mtx(forward)
  , inverse_mtx(checked_inverse(forward))
  , angle(start_angle)
  , orientation_kind(kind) {}

const Orientation& Orientation::pointy() {
  static const Orientation result(
      Mtx2d{sqrt3, sqrt3 / 2.0,
            0.0, 3.0 / 2.0},
      0.5, pointy_kind);
  return result;
}

const Orientation& Orientation::flat() {
  static const Orientation result(
      Mtx2d{3.0 / 2.0, 0.0,
            sqrt3 / 2.0, sqrt3},
      0.0, flat_kind);
  return result;
}

Layout::Layout(const Orientation& orientation, const Vec2d& size, const Vec2d& origin)
  : orient(orientation)
  , hex_size(size)
  , pixel_origin(origin) {
  if (size[0] == 0.0 || size[1] == 0.0)
    throw Invalid_Size();
}

Layout::Layout(const Orientation& orientation, double size, const Vec2d& origin)
  : orient(orientation)
  , hex_size(size, size)
  , pixel_origin(origin) {
  if (size == 0.0)
    throw Invalid_Size();
}

Layout Layout::pointy(double size, const Vec2d& origin) {
  return Layout(Orientation::pointy(), size, origin);
}

Layout Layout::flat(double size, const Vec2d& origin) {
  return Layout(Orientation::flat(), size, origin);
}

Hexd Layout::to_hex(const Vec2d& pixel) const {
  Vec2d pos = orient.inverse() * (pixel - pixel_origin).elem_div(hex_size);
  return Hexd(pos[0], pos[1]);
}

Hexi Layout::hex_at(const Vec2d& pixel) const {
  return to_hex(pixel).rounded();
}

Vec2d Layout::corner_offset(int index) const {
  if (index < 0 || index >= 6)
    throw Invalid_Direction();
  double angle = 2.0 * pi * (orient.start_angle() - index) / 6.0;
  return Vec2d(hex_size[0] * std::cos(angle), hex_size[1] * std::sin(angle));
}

double Layout::width() const {
  switch (orient.kind()) {
  case pointy_kind:
    return sqrt3 * hex_size[0];
  case flat_kind:
    return 2.0 * hex_size[0];
  default:
    throw Invalid_Orientation();
  }
}

double Layout::height() const {
  switch (orient.kind()) {
  case pointy_kind:
    return 2.0 * hex_size[1];
  case flat_kind:
    return sqrt3 * hex_size[1];
  default:
    throw Invalid_Orientation();
  }
}

double Layout::horizontal_spacing() const {
  switch (orient.kind()) {
  case pointy_kind:
    return sqrt3 * hex_size[0];
  case flat_kind:
    return 1.5 * hex_size[0];
  default:
    throw Invalid_Orientation();
  }
}

double Layout::vertical_spacing() const {
  switch (orient.kind()) {
  case pointy_kind:
    return 1.5 * hex_size[1];
  case flat_kind:
    return sqrt3 * hex_size[1];
  default:
    throw Invalid_Orientation();
  }
}

Hexi Layout::o_clock(int hour) const {
  return hexlat::o_clock(hour, orient.kind());
}

Hexi Layout::compass(Compass_Point point) const {
  return hexlat::compass(point, orient.kind());
}

void set_default_layout(const Layout& layout) {
  default_layout_slot() = layout;
}

void clear_default_layout() {
  default_layout_slot() = boost::none;
}

bool has_default_layout() {
  return static_cast<bool>(default_layout_slot());
}

const Layout& default_layout() {
  auto& slot = default_layout_slot();
  if (!slot)
    throw Layout_Not_Set();
  return *slot;
}

Scoped_Default_Layout::Scoped_Default_Layout(const Layout& layout)
  : previous(default_layout_slot()) {
  default_layout_slot() = layout;
}

Scoped_Default_Layout::~Scoped_Default_Layout() {
  default_layout_slot() = previous;
}

Hexd to_hex(const Vec2d& pixel) {
  return default_layout().to_hex(pixel);
}

Hexi hex_at(const Vec2d& pixel) {
  return default_layout().hex_at(pixel);
}

}
