#include <hexlat/hex.hpp>
#include <hexlat/hex_geom.hpp>
#include <boost/static_assert.hpp>
#include <algorithm>
#include <sstream>
#include <utility>
#include <vector>
#define BOOST_TEST_MODULE hex
#include <boost/test/unit_test.hpp>

using namespace hexlat;

// Detect whether `A + B` and `A * B` are valid expressions.
template<class A, class B>
struct Can_Add {
  template<class X, class Y>
  static char test(decltype(std::declval<X>() + std::declval<Y>())*);
  template<class X, class Y>
  static long test(...);
  static const bool value = sizeof(test<A, B>(0)) == 1;
};

template<class A, class B>
struct Can_Multiply {
  template<class X, class Y>
  static char test(decltype(std::declval<X>() * std::declval<Y>())*);
  template<class X, class Y>
  static long test(...);
  static const bool value = sizeof(test<A, B>(0)) == 1;
};

BOOST_STATIC_ASSERT(Can_Add<Hexi, Hexi>::value);
BOOST_STATIC_ASSERT(!Can_Add<Hexi, int>::value);
BOOST_STATIC_ASSERT(!Can_Add<double, Hexd>::value);
BOOST_STATIC_ASSERT(Can_Multiply<Hexi, int>::value);
BOOST_STATIC_ASSERT(Can_Multiply<double, Hexi>::value);
BOOST_STATIC_ASSERT(!Can_Multiply<Hexi, Hexi>::value);

BOOST_AUTO_TEST_CASE( construction ) {
  BOOST_CHECK_EQUAL(Hexi(1, 2).s(), -3);
  BOOST_CHECK_EQUAL(Hexi(1, 2), Hexi(1, 2, -3));
  BOOST_CHECK_THROW(Hexi(1, 2, 3), Invalid_Coordinate);
  BOOST_CHECK_THROW(Hexd(0.5, 0.5, 0.5), Invalid_Coordinate);
  BOOST_CHECK_NO_THROW(Hexd(0.5, 0.25, -0.75));
  // Within tolerance.
  BOOST_CHECK_NO_THROW(Hexd(0.5, 0.5, -1.0000001));

  BOOST_CHECK_EQUAL(origin, Hexi(0, 0, 0));
  BOOST_CHECK_EQUAL(Hexd(Hexi(2, -1)), Hexd(2.0, -1.0));

  BOOST_CHECK_EQUAL(Hexi::from_axes(r_axis, 2, s_axis, -1), Hexi(-1, 2, -1));
  BOOST_CHECK_EQUAL(Hexi::from_axes(s_axis, 3, q_axis, 1), Hexi(1, -4, 3));
  BOOST_CHECK_THROW(Hexi::from_axes(q_axis, 1, q_axis, 2), Invalid_Coordinate);

  Hexi hex(3, -5);
  BOOST_CHECK_EQUAL(hex.coord(q_axis), 3);
  BOOST_CHECK_EQUAL(hex.coord(r_axis), -5);
  BOOST_CHECK_EQUAL(hex.coord(s_axis), 2);
  BOOST_CHECK((hex.cube() == Vec3i(3, -5, 2)));
}

BOOST_AUTO_TEST_CASE( arithmetic ) {
  BOOST_CHECK_EQUAL(Hexi(1, 0) + Hexi(1, 2), Hexi(2, 2, -4));
  BOOST_CHECK_EQUAL(Hexi(1, 0) - Hexi(1, 2), Hexi(0, -2, 2));
  BOOST_CHECK_EQUAL(Hexi(4, -3) * 2, Hexi(8, -6, -2));
  BOOST_CHECK_EQUAL(2 * Hexi(4, -3), Hexi(8, -6, -2));
  BOOST_CHECK_EQUAL(Hexi(4, -3) * 0.5, Hexd(2.0, -1.5));
  BOOST_CHECK_EQUAL(Hexi(4, -3) / 2, Hexd(2.0, -1.5));
  BOOST_CHECK_EQUAL(floor_div(Hexi(4, -3), 2), Hexi(2, -2, 0));
  BOOST_CHECK_THROW(Hexi(4, -3) / 0, Division_By_Zero);
  BOOST_CHECK_THROW(floor_div(Hexi(4, -3), 0), Division_By_Zero);
  BOOST_CHECK_THROW(Hexd(1.0, 1.0) / 0.0, Division_By_Zero);

  BOOST_CHECK_EQUAL(-Hexi(1, -3), Hexi(-1, 3, -2));
  BOOST_CHECK_EQUAL(Hexi(3, 0).negated_around(Hexi(1, 1)), Hexi(-1, 2));

  for (auto a : hex_range(origin, 2)) {
    BOOST_CHECK_EQUAL(a + origin, a);
    BOOST_CHECK_EQUAL(a + (-a), origin);
    BOOST_CHECK_EQUAL(a - a, origin);
  }
}

BOOST_AUTO_TEST_CASE( equality ) {
  BOOST_CHECK_EQUAL(Hexd(1.0, 0.0), Hexd(1.0 + 1e-9, -1e-9));
  BOOST_CHECK_NE(Hexd(1.0, 0.0), Hexd(1.001, 0.0));
  BOOST_CHECK_NE(Hexi(1, 0), Hexi(0, 1));
}

BOOST_AUTO_TEST_CASE( distance ) {
  BOOST_CHECK_EQUAL(Hexi(10, -15, 5).distance_to(Hexi(4, -3, -1)), 12);
  BOOST_CHECK_EQUAL(Hexi(3, -1).length(), 3);
  BOOST_CHECK_EQUAL(origin.length(), 0);
  BOOST_CHECK_CLOSE(Hexd(1.5, -0.5).length(), 1.5, 1e-9);

  auto cells = hex_range(Hexi(1, -1), 2);
  for (auto a : cells) {
    for (auto b : cells) {
      BOOST_CHECK_EQUAL(a.distance_to(b), b.distance_to(a));
      BOOST_CHECK(a.distance_to(b) >= 0);
      BOOST_CHECK_EQUAL(a.distance_to(b) == 0, a == b);
      for (auto c : hex_ring(origin, 1))
        BOOST_CHECK(a.distance_to(c) <= a.distance_to(b) + b.distance_to(c));
    }
  }
}

BOOST_AUTO_TEST_CASE( rounding ) {
  BOOST_CHECK_EQUAL(Hexd(0.4, 0.3).rounded(), Hexi(1, 0, -1));
  BOOST_CHECK_EQUAL(Hexd(2.0, -1.5).rounded(), Hexi(2, -2, 0));
  BOOST_CHECK_EQUAL(Hexd(-0.1, 0.1).rounded(), origin);

  for (auto hex : hex_range(origin, 3)) {
    BOOST_CHECK_EQUAL(Hexd(hex).rounded(), hex);
    BOOST_CHECK_EQUAL((Hexd(hex) + Hexd(0.2, -0.1)).rounded(), hex);
    BOOST_CHECK_EQUAL((Hexd(hex) + Hexd(-0.3, 0.3)).rounded(), hex);
  }
}

BOOST_AUTO_TEST_CASE( rotation ) {
  BOOST_CHECK_EQUAL(Hexi(-1, -2, 3).rotated_left(), Hexi(-3, 1, 2));
  BOOST_CHECK_EQUAL(Hexi(-1, -2, 3).rotated_right(), Hexi(2, -3, 1));
  BOOST_CHECK_EQUAL(Hexi(2, 0).rotated_left_around(Hexi(1, 0)), Hexi(2, -1));
  BOOST_CHECK_EQUAL(Hexi(2, -1).rotated_right_around(Hexi(1, 0)), Hexi(2, 0));

  for (auto hex : hex_range(origin, 2)) {
    BOOST_CHECK_EQUAL(hex.rotated_left(6), hex);
    BOOST_CHECK_EQUAL(hex.rotated_left().rotated_right(), hex);
    BOOST_CHECK_EQUAL(hex.rotated_left(-1), hex.rotated_right());
    BOOST_CHECK_EQUAL(hex.rotated_left(3), -hex);
    BOOST_CHECK_EQUAL(hex.rotated_left().length(), hex.length());

    Hexi stepped = hex;
    for (int n = 0; n <= 12; n++) {
      BOOST_CHECK_EQUAL(hex.rotated_left(n), stepped);
      BOOST_CHECK_EQUAL(hex.rotated_left(n), hex.rotated_left(n - 12));
      BOOST_CHECK_EQUAL(hex.rotated_right(n), hex.rotated_left(6 - n % 6));
      stepped = stepped.rotated_left();
    }
  }
}

BOOST_AUTO_TEST_CASE( reflection ) {
  Hexi hex(1, 2, -3);
  BOOST_CHECK_EQUAL(hex.reflected(q_axis), Hexi(1, -3, 2));
  BOOST_CHECK_EQUAL(hex.reflected(r_axis), Hexi(-3, 2, 1));
  BOOST_CHECK_EQUAL(hex.reflected(s_axis), Hexi(2, 1, -3));
  BOOST_CHECK_EQUAL(hex.reflected_around(Hexi(1, 0), q_axis), Hexi(1, -2));

  for (auto h : hex_range(origin, 2)) {
    BOOST_CHECK_EQUAL(h.reflected(q_axis).reflected(q_axis), h);
    BOOST_CHECK_EQUAL(h.reflected(r_axis).length(), h.length());
  }
}

BOOST_AUTO_TEST_CASE( interpolation ) {
  BOOST_CHECK_EQUAL(origin.lerp_to(Hexi(4, -2), 0.5), Hexd(2.0, -1.0));
  BOOST_CHECK_EQUAL(Hexi(1, 1).lerp_to(Hexi(4, -2), 0.0), Hexd(1.0, 1.0));
  BOOST_CHECK_EQUAL(Hexi(1, 1).lerp_to(Hexi(4, -2), 1.0), Hexd(4.0, -2.0));

  Hexd nudged = Hexi(2, -1).nudged();
  BOOST_CHECK_CLOSE(nudged.q(), 2.000001, 1e-9);
  BOOST_CHECK_CLOSE(nudged.r(), -0.999999, 1e-9);
  BOOST_CHECK_CLOSE(nudged.s(), -1.000002, 1e-9);
  BOOST_CHECK_SMALL(nudged.q() + nudged.r() + nudged.s(), 1e-12);
  BOOST_CHECK_NO_THROW(Hexd(nudged.q(), nudged.r(), nudged.s()));
}

BOOST_AUTO_TEST_CASE( ordering ) {
  std::vector<Hexi> hexes{Hexi(3, 0), Hexi(0, 1), origin, Hexi(-2, 1)};
  std::sort(hexes.begin(), hexes.end(), By_Length());
  BOOST_CHECK_EQUAL(hexes[0], origin);
  BOOST_CHECK_EQUAL(hexes[1], Hexi(0, 1));
  BOOST_CHECK_EQUAL(hexes[3], Hexi(3, 0));

  Hex_Less less;
  BOOST_CHECK(less(Hexi(0, 5), Hexi(1, 0)));
  BOOST_CHECK(less(Hexi(1, -1), Hexi(1, 0)));
  BOOST_CHECK(!less(Hexi(1, 0), Hexi(1, 0)));
}

BOOST_AUTO_TEST_CASE( output ) {
  std::stringstream out;
  out << Hexi(1, 2);
  BOOST_CHECK_EQUAL(out.str(), "Hex(1, 2, -3)");
}
