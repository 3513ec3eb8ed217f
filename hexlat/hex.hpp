/* hex.hpp

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

#ifndef HEXLAT_HEX_HPP
#define HEXLAT_HEX_HPP

/** \file hex.hpp
 * Cube coordinate value type for hexagonal tiles.
 */

#include <hexlat/error.hpp>
#include <hexlat/num.hpp>
#include <hexlat/vec.hpp>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <type_traits>

namespace hexlat {

enum Hex_Axis {
  q_axis = 0,
  r_axis = 1,
  s_axis = 2
};

/**
 * A hexagonal cell or offset in cube coordinates.
 *
 * The three coordinates always satisfy `q + r + s == 0`. Only `q` and `r`
 * are stored and `s` is derived from them, so every Hex that exists obeys
 * the invariant by construction. The three-argument constructor checks the
 * supplied `s` against the other two and throws Invalid_Coordinate if the
 * sum is off by more than `hex_epsilon`.
 *
 * Hexes are immutable values. All operations return new hexes.
 *
 * Integer hexes (`Hexi`) are lattice cells. Fractional hexes (`Hexd`) come
 * out of division, interpolation and pixel conversion and are snapped back
 * onto the lattice with rounded().
 */
template<class T> class Hex {
 public:
  typedef T Coord;

  constexpr Hex() : q_val(0), r_val(0) {}

  constexpr Hex(T q, T r) : q_val(q), r_val(r) {}

  Hex(T q, T r, T s) : q_val(q), r_val(r) {
    if (!near_zero(q + r + s))
      throw Invalid_Coordinate();
  }

  template<class U>
  explicit Hex(const Hex<U>& rhs)
    : q_val(static_cast<T>(rhs.q())), r_val(static_cast<T>(rhs.r())) {}

  /// Build a hex from the values of two different axes.
  static Hex<T> from_axes(Hex_Axis axis1, T value1, Hex_Axis axis2, T value2) {
    if (axis1 == axis2)
      throw Invalid_Coordinate();
    T coords[3];
    coords[axis1] = value1;
    coords[axis2] = value2;
    coords[3 - axis1 - axis2] = -value1 - value2;
    return Hex<T>(coords[q_axis], coords[r_axis]);
  }

  T q() const { return q_val; }

  T r() const { return r_val; }

  T s() const { return -q_val - r_val; }

  T coord(Hex_Axis axis) const {
    switch (axis) {
    case q_axis:
      return q();
    case r_axis:
      return r();
    default:
      return s();
    }
  }

  Vec<T, 3> cube() const { return Vec<T, 3>(q(), r(), s()); }

  bool operator==(const Hex<T>& rhs) const {
    return near_zero(q_val - rhs.q_val) && near_zero(r_val - rhs.r_val);
  }

  bool operator!=(const Hex<T>& rhs) const { return !(*this == rhs); }

  Hex<T> operator-() const { return Hex<T>(-q_val, -r_val); }

  /// Reflect through another hex.
  Hex<T> negated_around(const Hex<T>& center) const {
    return Hex<T>(2 * center.q_val - q_val, 2 * center.r_val - r_val);
  }

  /**
   * Return the hex distance from origin to this hex.
   *
   * The hex distance of two cells is the minimum number of moves between
   * adjacent cells needed to get from one to the other. The value is exact
   * for integer hexes, since the absolute coordinates always sum to an even
   * number.
   */
  T length() const {
    return (std::abs(q()) + std::abs(r()) + std::abs(s())) / T(2);
  }

  T distance_to(const Hex<T>& other) const {
    return Hex<T>(q_val - other.q_val, r_val - other.r_val).length();
  }

  /**
   * Snap to the nearest lattice cell.
   *
   * Each coordinate is rounded on its own, which may break the zero sum.
   * The coordinate that moved furthest when rounded is the least reliable
   * one and is recomputed from the other two.
   */
  Hex<int> rounded() const {
    double q = std::round(static_cast<double>(q_val));
    double r = std::round(static_cast<double>(r_val));
    double s = std::round(static_cast<double>(this->s()));

    double dq = std::fabs(q - q_val);
    double dr = std::fabs(r - r_val);
    double ds = std::fabs(s - this->s());

    if (dq > dr && dq > ds)
      q = -r - s;
    else if (dr > ds)
      r = -q - s;
    else
      s = -q - r;

    return Hex<int>(static_cast<int>(q), static_cast<int>(r), static_cast<int>(s));
  }

  /// Rotate `steps` sixths of a turn to the left around the origin.
  Hex<T> rotated_left(int steps = 1) const {
    // One left step maps (q, r, s) to (-s, -q, -r). Every multiple is a
    // cyclic shift of the coordinates, negated on odd step counts.
    switch (mod(steps, 6)) {
    case 0:
      return *this;
    case 1:
      return Hex<T>(-s(), -q());
    case 2:
      return Hex<T>(r(), s());
    case 3:
      return Hex<T>(-q(), -r());
    case 4:
      return Hex<T>(s(), q());
    default:
      return Hex<T>(-r(), -s());
    }
  }

  Hex<T> rotated_right(int steps = 1) const {
    return rotated_left(-steps);
  }

  Hex<T> rotated_left_around(const Hex<T>& center, int steps = 1) const {
    Hex<T> offset(q_val - center.q_val, r_val - center.r_val);
    offset = offset.rotated_left(steps);
    return Hex<T>(center.q_val + offset.q_val, center.r_val + offset.r_val);
  }

  Hex<T> rotated_right_around(const Hex<T>& center, int steps = 1) const {
    return rotated_left_around(center, -steps);
  }

  /// Mirror over an axis. The coordinate of that axis stays, the other two swap.
  Hex<T> reflected(Hex_Axis axis) const {
    switch (axis) {
    case q_axis:
      return Hex<T>(q(), s());
    case r_axis:
      return Hex<T>(s(), r());
    default:
      return Hex<T>(r(), q());
    }
  }

  Hex<T> reflected_around(const Hex<T>& center, Hex_Axis axis) const {
    Hex<T> offset(q_val - center.q_val, r_val - center.r_val);
    offset = offset.reflected(axis);
    return Hex<T>(center.q_val + offset.q_val, center.r_val + offset.r_val);
  }

  /// Linear interpolation towards `other`, `t` = 0 gives this hex and 1 gives other.
  Hex<double> lerp_to(const Hex<T>& other, double t) const {
    return Hex<double>(
        static_cast<double>(q_val) * (1.0 - t) + static_cast<double>(other.q_val) * t,
        static_cast<double>(r_val) * (1.0 - t) + static_cast<double>(other.r_val) * t);
  }

  /**
   * Offset by a tiny fixed amount in a consistent direction.
   *
   * Lerps between nudged endpoints never land exactly on a cell edge, so the
   * rounding has a single answer for every sample.
   */
  Hex<double> nudged(double factor = 1.0) const {
    return Hex<double>(
        static_cast<double>(q_val) + hex_epsilon * factor,
        static_cast<double>(r_val) + hex_epsilon * factor);
  }

 private:
  T q_val;
  T r_val;
};

typedef Hex<int>    Hexi;
typedef Hex<double> Hexd;

/// The origin hex, (0, 0, 0).
const Hexi origin(0, 0);

template<class T>
Hex<T> operator+(const Hex<T>& lhs, const Hex<T>& rhs) {
  return Hex<T>(lhs.q() + rhs.q(), lhs.r() + rhs.r());
}

template<class T>
Hex<T> operator-(const Hex<T>& lhs, const Hex<T>& rhs) {
  return Hex<T>(lhs.q() - rhs.q(), lhs.r() - rhs.r());
}

// Scalar operators only accept plain arithmetic types. There is no overload
// for adding a number to a hex or multiplying two hexes, so those don't
// compile.

template<class T, class K>
typename std::enable_if<std::is_arithmetic<K>::value,
                        Hex<typename std::common_type<T, K>::type>>::type
operator*(const Hex<T>& lhs, K rhs) {
  typedef typename std::common_type<T, K>::type C;
  return Hex<C>(static_cast<C>(lhs.q()) * rhs, static_cast<C>(lhs.r()) * rhs);
}

template<class T, class K>
typename std::enable_if<std::is_arithmetic<K>::value,
                        Hex<typename std::common_type<T, K>::type>>::type
operator*(K lhs, const Hex<T>& rhs) {
  return rhs * lhs;
}

/// True division, the result is always fractional.
template<class T, class K>
typename std::enable_if<std::is_arithmetic<K>::value, Hexd>::type
operator/(const Hex<T>& lhs, K rhs) {
  if (rhs == K(0))
    throw Division_By_Zero();
  double d = static_cast<double>(rhs);
  return Hexd(lhs.q() / d, lhs.r() / d);
}

/// Division snapped to the nearest lattice cell.
template<class T, class K>
typename std::enable_if<std::is_arithmetic<K>::value, Hexi>::type
floor_div(const Hex<T>& lhs, K rhs) {
  return (lhs / rhs).rounded();
}

/// Sort by distance from origin.
struct By_Length {
  template<class T>
  bool operator()(const Hex<T>& lhs, const Hex<T>& rhs) const {
    return lhs.length() < rhs.length();
  }
};

/// Arbitrary strict ordering of lattice hexes for use as container keys.
struct Hex_Less {
  bool operator()(const Hexi& lhs, const Hexi& rhs) const {
    if (lhs.q() != rhs.q())
      return lhs.q() < rhs.q();
    return lhs.r() < rhs.r();
  }
};

template<class T>
std::ostream& operator<<(std::ostream& out, const Hex<T>& hex) {
  out << "Hex(" << hex.q() << ", " << hex.r() << ", " << hex.s() << ")";
  return out;
}

std::ostream& operator<<(std::ostream& out, Hex_Axis axis);

}

#endif
