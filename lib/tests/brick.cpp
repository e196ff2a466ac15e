//  brick.cpp -- unit tests for the brick implementation
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

#include <list>
#include <utility>

#include <boost/assign/list_inserter.hpp>
#include <boost/test/parameterized_test.hpp>
#include <boost/test/unit_test.hpp>

#include "katachi/brick.hpp"
#include "katachi/exception.hpp"
#include "katachi/format.hpp"
#include "katachi/morph.hpp"
#include "katachi/test/memory.hpp"
#include "katachi/test/tools.hpp"

using namespace katachi;

typedef std::pair< int, int > size_pair;

namespace {

std::string
name (const size_pair& sz)
{
  return (format ("%1%x%2%") % sz.first % sz.second).str ();
}

}       // namespace

void
separable_matches_rasterop (const size_pair& sz)
{
  test::suffix_test_case_name (name (sz));

  const int w = sz.first;
  const int h = sz.second;
  const sel s (sel::brick (w, h));

  image sparse (test::random_mono (50, 37, 10));
  image dense  (test::random_mono (50, 37, 90));

  BOOST_CHECK (dilate (sparse, s) == dilate_brick (sparse, w, h));
  BOOST_CHECK (erode (dense, s) == erode_brick (dense, w, h));
  BOOST_CHECK (open (dense, s) == open_brick (dense, w, h));
  BOOST_CHECK (close (sparse, s) == close_brick (sparse, w, h));
  BOOST_CHECK (close_safe (sparse, s) == close_safe_brick (sparse, w, h));
}

void
composite_matches_rasterop (const size_pair& sz)
{
  test::suffix_test_case_name (name (sz));

  const int w = sz.first;
  const int h = sz.second;
  const sel s (sel::brick (w, h));

  image sparse (test::random_mono (157, 131, 1));
  image dense  (test::random_mono (157, 131, 99));

  BOOST_CHECK (dilate (sparse, s) == dilate_comp_brick (sparse, w, h));
  BOOST_CHECK (erode (dense, s) == erode_comp_brick (dense, w, h));
  BOOST_CHECK (open (dense, s) == open_comp_brick (dense, w, h));
  BOOST_CHECK (close (sparse, s) == close_comp_brick (sparse, w, h));
  BOOST_CHECK (close_safe (sparse, s)
               == close_safe_comp_brick (sparse, w, h));

  image half (test::random_mono (61, 23, 50));

  BOOST_CHECK (dilate (half, s) == dilate_comp_brick (half, w, h));
  BOOST_CHECK (open (half, s) == open_comp_brick (half, w, h));
  BOOST_CHECK (close (half, s) == close_comp_brick (half, w, h));
}

void
composable_sizes (const std::pair< int, size_pair >& arg)
{
  test::suffix_test_case_name ((format ("%1%") % arg.first).str ());

  int f1 = 0;
  int f2 = 0;

  select_composable_sizes (arg.first, f1, f2);

  BOOST_CHECK_EQUAL (arg.second.first, f1);
  BOOST_CHECK_EQUAL (arg.second.second, f2);
}

BOOST_AUTO_TEST_CASE (even_sizes_are_incremented)
{
  image img (test::random_mono (50, 37, 10));

  BOOST_CHECK (dilate_brick (img, 5, 3) == dilate_brick (img, 4, 2));
  BOOST_CHECK (erode_brick (img, 5, 3) == erode_brick (img, 5, 2));
  BOOST_CHECK (dilate (img, sel::brick (5, 5)) == dilate_brick (img, 4, 4));
}

BOOST_AUTO_TEST_CASE (composite_sizes_are_exact)
{
  image img (test::random_mono (50, 37, 10));

  BOOST_CHECK (dilate (img, sel::brick (4, 6))
               == dilate_comp_brick (img, 4, 6));
}

BOOST_AUTO_TEST_CASE (composite_dilation_at_image_edges)
{
  image::builder b (40, 1);
  b.set (0, 0, 1);
  image corner (b);

  image rv (dilate_comp_brick (corner, 9, 1));

  BOOST_CHECK_EQUAL (5, rv.count_pixels ());
  BOOST_CHECK_EQUAL (1u, rv.get (2, 0));
  BOOST_CHECK (dilate (corner, sel::brick (9, 1)) == rv);

  image::builder c (40, 40);
  c.set (0, 20, 1);
  c.set (20, 0, 1);
  c.set (39, 39, 1);
  image edges (c);

  BOOST_CHECK (dilate (edges, sel::brick (9, 9))
               == dilate_comp_brick (edges, 9, 9));
  BOOST_CHECK (dilate (edges, sel::brick (12, 8))
               == dilate_comp_brick (edges, 12, 8));
  BOOST_CHECK (close (edges, sel::brick (9, 9))
               == close_comp_brick (edges, 9, 9));
}

BOOST_AUTO_TEST_CASE (unit_brick_returns_input)
{
  image img (test::random_mono (50, 37, 50));

  BOOST_CHECK_EQUAL (img.data (), dilate_brick (img, 1, 1).data ());
  BOOST_CHECK_EQUAL (img.data (), erode_brick (img, 1, 1).data ());
  BOOST_CHECK_EQUAL (img.data (), close_safe_brick (img, 1, 1).data ());
  BOOST_CHECK (img == open_comp_brick (img, 1, 1));
}

BOOST_AUTO_TEST_CASE (zero_sizes)
{
  image img (10, 10);
  int f1, f2;

  BOOST_CHECK_THROW (dilate_brick (img, 0, 3), invalid_size);
  BOOST_CHECK_THROW (erode_brick (img, 3, 0), invalid_size);
  BOOST_CHECK_THROW (close_safe_brick (img, 0, 0), invalid_size);
  BOOST_CHECK_THROW (dilate_comp_brick (img, 0, 3), invalid_size);
  BOOST_CHECK_THROW (select_composable_sizes (0, f1, f2), invalid_size);
}

BOOST_AUTO_TEST_CASE (wrong_depth_images)
{
  image img (10, 10, image::GRAY8);

  BOOST_CHECK_THROW (dilate_brick (img, 3, 3), wrong_depth);
  BOOST_CHECK_THROW (open_comp_brick (img, 4, 4), wrong_depth);
  BOOST_CHECK_THROW (erode_separable (img, sel::brick (3, 3)), wrong_depth);
}

BOOST_AUTO_TEST_CASE (separable_keeps_origin)
{
  image img (test::random_mono (50, 37, 10));
  sel s (sel::brick (4, 6, 0, 5));

  BOOST_CHECK (dilate (img, s) == dilate_separable (img, s));
  BOOST_CHECK (erode (img, s) == erode_separable (img, s));
}

BOOST_AUTO_TEST_CASE (separable_falls_back)
{
  image img (test::random_mono (50, 37, 30));
  sel s (sel::cross (5));

  BOOST_CHECK (dilate (img, s) == dilate_separable (img, s));
  BOOST_CHECK (erode (img, s) == erode_separable (img, s));
}

bool
init_test_runner ()
{
  namespace but = ::boost::unit_test;

  std::list< size_pair > bricks;
  boost::assign::push_back (bricks)
    (size_pair ( 3,  3))
    (size_pair ( 5,  7))
    (size_pair (21, 15))
    (size_pair ( 1,  5))
    (size_pair ( 5,  1))
    ;
  but::framework::master_test_suite ()
    .add (BOOST_PARAM_TEST_CASE (separable_matches_rasterop,
                                 bricks.begin (), bricks.end ()));

  std::list< size_pair > composites;
  boost::assign::push_back (composites)
    (size_pair (  4,   1))
    (size_pair (  1,   9))
    (size_pair ( 12,  12))
    (size_pair (120,   1))
    (size_pair (  1, 120))
    (size_pair (  7,  13))
    (size_pair ( 10,  6))
    ;
  but::framework::master_test_suite ()
    .add (BOOST_PARAM_TEST_CASE (composite_matches_rasterop,
                                 composites.begin (), composites.end ()));

  std::list< std::pair< int, size_pair > > factors;
  boost::assign::push_back (factors)
    (std::make_pair (  1, size_pair ( 1,   1)))
    (std::make_pair (  4, size_pair ( 2,   2)))
    (std::make_pair (  7, size_pair ( 1,   7)))
    (std::make_pair (  9, size_pair ( 3,   3)))
    (std::make_pair ( 12, size_pair ( 3,   4)))
    (std::make_pair ( 13, size_pair ( 1,  13)))
    (std::make_pair (120, size_pair (10,  12)))
    ;
  but::framework::master_test_suite ()
    .add (BOOST_PARAM_TEST_CASE (composable_sizes,
                                 factors.begin (), factors.end ()));

  return true;
}

#include "katachi/test/runner.ipp"
