#include <hexlat/direction.hpp>
#define BOOST_TEST_MODULE direction
#include <boost/test/unit_test.hpp>

using namespace hexlat;

BOOST_AUTO_TEST_CASE( tables ) {
  BOOST_CHECK_EQUAL(hex_direction(0), Hexi(1, 0, -1));
  BOOST_CHECK_EQUAL(hex_direction(2), Hexi(0, -1, 1));
  BOOST_CHECK_EQUAL(hex_direction(5), Hexi(0, 1, -1));
  BOOST_CHECK_EQUAL(hex_diagonal(0), Hexi(2, -1, -1));
  BOOST_CHECK_EQUAL(hex_diagonal(3), Hexi(-2, 1, 1));
  BOOST_CHECK_THROW(hex_direction(6), Invalid_Direction);
  BOOST_CHECK_THROW(hex_direction(-1), Invalid_Direction);
  BOOST_CHECK_THROW(hex_diagonal(6), Invalid_Direction);

  for (int i = 0; i < 6; i++) {
    BOOST_CHECK_EQUAL(hex_direction(i).length(), 1);
    BOOST_CHECK_EQUAL(hex_diagonal(i).length(), 2);
    BOOST_CHECK_EQUAL(hex_direction(i).rotated_left(), hex_direction((i + 1) % 6));
    BOOST_CHECK_EQUAL(hex_diagonal(i), hex_direction(i) + hex_direction((i + 1) % 6));
    BOOST_CHECK(is_direction(hex_dirs[i]));
    BOOST_CHECK(!is_direction(hex_diagonals[i]));
    BOOST_CHECK(is_diagonal(hex_diagonals[i]));
    BOOST_CHECK(!is_diagonal(hex_dirs[i]));
  }
  BOOST_CHECK(!is_direction(origin));
}

BOOST_AUTO_TEST_CASE( neighbors_test ) {
  Hexi center(2, -3);
  BOOST_CHECK_EQUAL(neighbor(center, 0), Hexi(3, -3));
  BOOST_CHECK_EQUAL(diagonal_neighbor(center, 1), Hexi(3, -5));
  BOOST_CHECK_THROW(neighbor(center, 7), Invalid_Direction);

  auto adjacent = neighbors(center);
  auto diagonal = diagonal_neighbors(center);
  for (int i = 0; i < 6; i++) {
    BOOST_CHECK_EQUAL(adjacent[i], neighbor(center, i));
    BOOST_CHECK_EQUAL(center.distance_to(adjacent[i]), 1);
    BOOST_CHECK_EQUAL(center.distance_to(diagonal[i]), 2);
    // Diagonal cells are adjacent to two of the neighbors.
    BOOST_CHECK_EQUAL(diagonal[i].distance_to(adjacent[i]), 1);
    BOOST_CHECK_EQUAL(diagonal[i].distance_to(adjacent[(i + 1) % 6]), 1);
  }

  BOOST_CHECK_EQUAL(neighbor(Hexd(0.5, 0.5), 3), Hexd(-0.5, 0.5));
}

BOOST_AUTO_TEST_CASE( clock_hours ) {
  BOOST_CHECK_EQUAL(o_clock(3), Hexi(1, 0));
  BOOST_CHECK_EQUAL(o_clock(1), Hexi(1, -1));
  BOOST_CHECK_EQUAL(o_clock(12), Hexi(1, -2));
  BOOST_CHECK_EQUAL(o_clock(12, flat_kind), Hexi(0, -1));
  BOOST_CHECK_EQUAL(o_clock(3, flat_kind), Hexi(2, -1));
  BOOST_CHECK_EQUAL(o_clock(4, flat_kind), Hexi(1, 0));
  BOOST_CHECK_THROW(o_clock(0), Invalid_Direction);
  BOOST_CHECK_THROW(o_clock(13, flat_kind), Invalid_Direction);

  for (int hour = 1; hour <= 12; hour++) {
    bool odd = hour % 2 == 1;
    BOOST_CHECK_EQUAL(is_direction(o_clock(hour, pointy_kind)), odd);
    BOOST_CHECK_EQUAL(is_diagonal(o_clock(hour, pointy_kind)), !odd);
    BOOST_CHECK_EQUAL(is_direction(o_clock(hour, flat_kind)), !odd);
    BOOST_CHECK_EQUAL(o_clock(hour, custom_kind), o_clock(hour, pointy_kind));

    // Opposite hours point the opposite way.
    int opposite = (hour + 5) % 12 + 1;
    BOOST_CHECK_EQUAL(o_clock(opposite), -o_clock(hour));
    BOOST_CHECK_EQUAL(o_clock(opposite, flat_kind), -o_clock(hour, flat_kind));
  }

  BOOST_CHECK_EQUAL(clock_neighbor(Hexi(1, 1), 9), Hexi(0, 1));
  BOOST_CHECK_EQUAL(clock_neighbor(Hexi(1, 1), 6, flat_kind), Hexi(1, 2));
}

BOOST_AUTO_TEST_CASE( compass_test ) {
  BOOST_CHECK_EQUAL(compass(east), Hexi(1, 0));
  BOOST_CHECK_EQUAL(compass(west), Hexi(-1, 0));
  BOOST_CHECK_EQUAL(compass(north_east), Hexi(1, -1));
  BOOST_CHECK_EQUAL(compass(south_west), Hexi(-1, 1));
  BOOST_CHECK_THROW(compass(north), Invalid_Direction);
  BOOST_CHECK_THROW(compass(south), Invalid_Direction);

  BOOST_CHECK_EQUAL(compass(north, flat_kind), Hexi(0, -1));
  BOOST_CHECK_EQUAL(compass(south, flat_kind), Hexi(0, 1));
  BOOST_CHECK_EQUAL(compass(south_east, flat_kind), Hexi(1, 0));
  BOOST_CHECK_THROW(compass(east, flat_kind), Invalid_Direction);
  BOOST_CHECK_THROW(compass(west, flat_kind), Invalid_Direction);

  // Every compass point an orientation has is a distinct direction.
  int pointy_count = 0;
  int flat_count = 0;
  for (int i = north; i <= north_west; i++) {
    Compass_Point point = static_cast<Compass_Point>(i);
    if (point != north && point != south) {
      BOOST_CHECK(is_direction(compass(point)));
      pointy_count++;
    }
    if (point != east && point != west) {
      BOOST_CHECK(is_direction(compass(point, flat_kind)));
      flat_count++;
    }
  }
  BOOST_CHECK_EQUAL(pointy_count, 6);
  BOOST_CHECK_EQUAL(flat_count, 6);
}
