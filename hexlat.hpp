#ifndef HEXLAT_HEXLAT_HPP
#define HEXLAT_HEXLAT_HPP

#include <hexlat/util.hpp>
#include <hexlat/alg.hpp>
#include <hexlat/num.hpp>
#include <hexlat/vec.hpp>
#include <hexlat/mtx.hpp>
#include <hexlat/box.hpp>
#include <hexlat/error.hpp>
#include <hexlat/hex.hpp>
#include <hexlat/direction.hpp>
#include <hexlat/hex_geom.hpp>
#include <hexlat/layout.hpp>
#include <hexlat/shape.hpp>
#include <hexlat/hex_map.hpp>

#endif
