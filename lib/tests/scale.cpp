//  scale.cpp -- unit tests for the scale implementation
//  Copyright (C) 2026  Katachi contributors
//
//  License: GPL-3.0+
//
//  This file is part of the 'Katachi' package.
//  This package is free software: you can redistribute it and/or modify
//  it under the terms of the GNU General Public License as published by
//  the Free Software Foundation, either version 3 of the License or, at
//  your option, any later version.
//
//    This program is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//  You ought to have received a copy of the GNU General Public License
//  along with this package.  If not, see <http://www.gnu.org/licenses/>.

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <vector>

#include <boost/assign/list_of.hpp>
#include <boost/test/unit_test.hpp>

#include "katachi/exception.hpp"
#include "katachi/scale.hpp"
#include "katachi/test/memory.hpp"

using namespace katachi;

namespace {

//! 2 x 2 blocks with 0, 1, 2, 3 and 4 pixels set, plus a ragged edge
const char *blocks =
  "..x.xxxxxxx\n"
  "......x.xxx";

}       // namespace

BOOST_AUTO_TEST_CASE (rank_levels)
{
  image img (test::from_rows (blocks));

  for (int level = 1; level <= 4; ++level)
    {
      image rv (reduce_rank_binary_2 (img, level));

      BOOST_REQUIRE_EQUAL (6, rv.width ());
      BOOST_REQUIRE_EQUAL (1, rv.height ());

      BOOST_CHECK_EQUAL (0u, rv.get (0, 0));
      BOOST_CHECK_EQUAL (level <= 1 ? 1u : 0u, rv.get (1, 0));
      BOOST_CHECK_EQUAL (level <= 2 ? 1u : 0u, rv.get (2, 0));
      BOOST_CHECK_EQUAL (level <= 3 ? 1u : 0u, rv.get (3, 0));
      BOOST_CHECK_EQUAL (1u, rv.get (4, 0));
      BOOST_CHECK_EQUAL (level <= 2 ? 1u : 0u, rv.get (5, 0));
    }
}

BOOST_AUTO_TEST_CASE (odd_sizes_round_up)
{
  image img (test::random_mono (51, 37, 50));
  image rv (reduce_rank_binary_2 (img, 1));

  BOOST_CHECK_EQUAL (26, rv.width ());
  BOOST_CHECK_EQUAL (19, rv.height ());
}

BOOST_AUTO_TEST_CASE (cascade)
{
  image img (test::random_mono (64, 48, 50));
  std::vector< int > levels = boost::assign::list_of (1)(3)(2);

  image rv (reduce_rank_cascade (img, levels));
  image expect (reduce_rank_binary_2
                (reduce_rank_binary_2
                 (reduce_rank_binary_2 (img, 1), 3), 2));

  BOOST_CHECK_EQUAL (8, rv.width ());
  BOOST_CHECK_EQUAL (6, rv.height ());
  BOOST_CHECK (expect == rv);
}

BOOST_AUTO_TEST_CASE (rank_errors)
{
  image img (10, 10);

  BOOST_CHECK_THROW (reduce_rank_binary_2 (img, 0), invalid_size);
  BOOST_CHECK_THROW (reduce_rank_binary_2 (img, 5), invalid_size);
  BOOST_CHECK_THROW (reduce_rank_cascade (img, std::vector< int > ()),
                     invalid_size);
  BOOST_CHECK_THROW (reduce_rank_cascade (img, std::vector< int > (5, 1)),
                     invalid_size);
  BOOST_CHECK_THROW (reduce_rank_binary_2 (image (4, 4, image::GRAY8), 1),
                     wrong_depth);
}

BOOST_AUTO_TEST_CASE (expand_mono)
{
  image img (test::random_mono (13, 7, 50));
  image rv (expand_replicate (img, 4));

  BOOST_REQUIRE_EQUAL (52, rv.width ());
  BOOST_REQUIRE_EQUAL (28, rv.height ());
  BOOST_CHECK_EQUAL (16 * img.count_pixels (), rv.count_pixels ());

  for (int y = 0; y < rv.height (); ++y)
    for (int x = 0; x < rv.width (); ++x)
      BOOST_REQUIRE_EQUAL (img.get (x / 4, y / 4), rv.get (x, y));
}

BOOST_AUTO_TEST_CASE (expand_gray)
{
  image img (test::random_gray (5, 3));
  image rv (expand_replicate (img, 2));

  BOOST_REQUIRE_EQUAL (10, rv.width ());
  BOOST_CHECK_EQUAL (img.get (4, 2), rv.get (9, 5));
  BOOST_CHECK_EQUAL (img.get (2, 1), rv.get (5, 2));
}

BOOST_AUTO_TEST_CASE (reduce_after_expand)
{
  image img (test::random_mono (13, 7, 50));

  BOOST_CHECK (img == reduce_rank_binary_2 (expand_replicate (img, 2), 4));
  BOOST_CHECK (img == reduce_rank_binary_2 (expand_replicate (img, 2), 1));
}

BOOST_AUTO_TEST_CASE (expand_errors)
{
  BOOST_CHECK_THROW (expand_replicate (image (4, 4), 0), invalid_size);
  BOOST_CHECK_THROW (expand_replicate (image (), 2), invalid_size);
  BOOST_CHECK_THROW (expand_replicate (image (4, 4), 1 << 30), invalid_size);
  BOOST_CHECK_THROW (expand_replicate (image (64, 64), 1 << 16),
                     invalid_size);
}

#include "katachi/test/runner.ipp"
