//  sequence.cpp -- unit tests for the sequence implementation
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
#include <string>

#include <boost/assign/list_inserter.hpp>
#include <boost/assign/list_of.hpp>
#include <boost/test/parameterized_test.hpp>
#include <boost/test/unit_test.hpp>

#include "katachi/border.hpp"
#include "katachi/brick.hpp"
#include "katachi/exception.hpp"
#include "katachi/gray-morph.hpp"
#include "katachi/morph.hpp"
#include "katachi/scale.hpp"
#include "katachi/sequence.hpp"
#include "katachi/test/memory.hpp"
#include "katachi/test/tools.hpp"

using namespace katachi;

void
malformed_sequence (const std::string& text)
{
  test::suffix_test_case_name (text);

  BOOST_CHECK_THROW (morph_sequence::parse (text), invalid_sequence);
}

void
unsupported_sequence (const std::string& text)
{
  test::suffix_test_case_name (text);

  BOOST_CHECK_THROW (morph_sequence::parse (text), unsupported_operation);
}

BOOST_AUTO_TEST_SUITE (parsing);

BOOST_AUTO_TEST_CASE (bricks)
{
  morph_sequence seq (morph_sequence::parse ("d3.3 + E5.1 + o7.7+c11.3"));

  BOOST_REQUIRE_EQUAL (4u, seq.size ());
  BOOST_CHECK (morph_op (brick_op (brick_op::DILATE, 3, 3)) == seq[0]);
  BOOST_CHECK (morph_op (brick_op (brick_op::ERODE, 5, 1)) == seq[1]);
  BOOST_CHECK (morph_op (brick_op (brick_op::OPEN, 7, 7)) == seq[2]);
  BOOST_CHECK (morph_op (brick_op (brick_op::CLOSE, 11, 3)) == seq[3]);
}

BOOST_AUTO_TEST_CASE (whitespace_and_case)
{
  morph_sequence seq (morph_sequence::parse ("  D 3 . 3\t+\nx 2 "));

  BOOST_REQUIRE_EQUAL (2u, seq.size ());
  BOOST_CHECK (morph_op (brick_op (brick_op::DILATE, 3, 3)) == seq[0]);
  BOOST_CHECK (morph_op (expand_op (2)) == seq[1]);
}

BOOST_AUTO_TEST_CASE (scaling_and_border)
{
  morph_sequence seq (morph_sequence::parse ("b32 + r1423 + x16 + r2"));

  BOOST_REQUIRE_EQUAL (4u, seq.size ());
  BOOST_CHECK (morph_op (border_op (32)) == seq[0]);

  rank_op rank;
  boost::assign::push_back (rank.levels) (1)(4)(2)(3);
  BOOST_CHECK (morph_op (rank) == seq[1]);
  BOOST_CHECK (morph_op (expand_op (16)) == seq[2]);

  rank.levels.assign (1, 2);
  BOOST_CHECK (morph_op (rank) == seq[3]);
}

BOOST_AUTO_TEST_CASE (tophats)
{
  morph_sequence seq (morph_sequence::parse ("tw5.5 + TB3.1"));

  BOOST_REQUIRE_EQUAL (2u, seq.size ());
  BOOST_CHECK (morph_op (tophat_op (WHITE, 5, 5)) == seq[0]);
  BOOST_CHECK (morph_op (tophat_op (BLACK, 3, 1)) == seq[1]);
}

BOOST_AUTO_TEST_CASE (unsupported_token_is_named)
{
  try
    {
      morph_sequence::parse ("d3.3 + y7.3");
      BOOST_FAIL ("expected an exception");
    }
  catch (const unsupported_operation& e)
    {
      BOOST_CHECK_EQUAL (error::unsupported_operation, e.code ());
      BOOST_CHECK (std::string (e.what ()).find ("y7.3")
                   != std::string::npos);
    }
}

BOOST_AUTO_TEST_SUITE_END (/* parsing */);

BOOST_AUTO_TEST_SUITE (binary_execution);

BOOST_AUTO_TEST_CASE (bricks)
{
  image img (test::random_mono (50, 37, 30));

  BOOST_CHECK (close_brick (img, 3, 3)
               == morph_sequence_apply (img, "d3.3 + e3.3"));
  BOOST_CHECK (open_brick (img, 5, 1)
               == morph_sequence_apply (img, "o5.1"));
  BOOST_CHECK (dilate_brick (img, 5, 5)
               == morph_sequence_apply (img, "d4.4"));
}

BOOST_AUTO_TEST_CASE (composite_at_image_edges)
{
  image::builder b (40, 40);
  b.set (0, 20, 1);
  image img (b);

  morph_sequence seq (morph_sequence::parse ("d9.9"));

  BOOST_CHECK (execute (img, seq) == execute_composite (img, seq));
  BOOST_CHECK_EQUAL (5 * 9, execute_composite (img, seq).count_pixels ());
}

BOOST_AUTO_TEST_CASE (composite)
{
  image img (test::random_mono (50, 37, 30));
  morph_sequence seq (morph_sequence::parse ("d12.12 + e4.1"));

  image expect (erode (dilate (img, sel::brick (12, 12)), sel::brick (4, 1)));

  BOOST_CHECK (expect == execute_composite (img, seq));
  BOOST_CHECK (erode_brick (dilate_brick (img, 13, 13), 5, 1)
               == execute (img, seq));
}

BOOST_AUTO_TEST_CASE (border_is_removed)
{
  image::builder b (40, 40);
  b.set_all ();
  image img (b);

  image rv (morph_sequence_apply (img, "b32 + c5.5"));

  BOOST_CHECK (img == rv);
  BOOST_CHECK (close_safe_brick (img, 5, 5) == rv);
}

BOOST_AUTO_TEST_CASE (scaled_border)
{
  image img (test::random_mono (50, 37, 30));

  image rv (morph_sequence_apply (img, "b8 + r1"));

  BOOST_CHECK_EQUAL (25, rv.width ());
  BOOST_CHECK_EQUAL (19, rv.height ());

  rv = morph_sequence_apply (img, "b3 + x4 + r22");

  BOOST_CHECK_EQUAL (50, rv.width ());
  BOOST_CHECK_EQUAL (37, rv.height ());
}

BOOST_AUTO_TEST_CASE (unremovable_border)
{
  image img (test::random_mono (50, 37, 30));

  BOOST_CHECK_THROW (morph_sequence_apply (img, "b3 + r1"),
                     invalid_sequence);
}

BOOST_AUTO_TEST_CASE (many_rank_reductions)
{
  std::string text ("r1111");
  for (int i = 1; i < 16; ++i) text += " + r1111";

  image rv (morph_sequence_apply (image (64, 64), text));

  BOOST_CHECK_EQUAL (1, rv.width ());
  BOOST_CHECK_EQUAL (1, rv.height ());

  BOOST_CHECK_THROW (morph_sequence_apply (image (64, 64), "b4 + " + text),
                     invalid_sequence);
}

BOOST_AUTO_TEST_CASE (excessive_expansion)
{
  image img (64, 64);

  BOOST_CHECK_THROW (morph_sequence_apply (img, "x16 + x16 + x16 + x16"),
                     invalid_sequence);
  BOOST_CHECK_THROW (morph_sequence_apply
                     (img, "x16 + x16 + x16 + x16 + x16 + x16 + x16 + x16"),
                     invalid_sequence);
}

BOOST_AUTO_TEST_CASE (rank_and_expand)
{
  image img (test::random_mono (50, 37, 30));

  std::vector< int > levels = boost::assign::list_of (2)(3);
  image expect (expand_replicate (reduce_rank_cascade (img, levels), 4));

  BOOST_CHECK (expect == morph_sequence_apply (img, "r23 + x4"));
}

BOOST_AUTO_TEST_CASE (no_tophats)
{
  image img (10, 10);

  BOOST_CHECK_THROW (morph_sequence_apply (img, "d3.3 + tw3.3"),
                     unsupported_operation);
}

BOOST_AUTO_TEST_SUITE_END (/* binary_execution */);

BOOST_AUTO_TEST_SUITE (gray_execution);

BOOST_AUTO_TEST_CASE (bricks_and_tophats)
{
  image img (test::random_gray (37, 29));

  image expect (tophat_gray (dilate_gray (img, 3, 3), 5, 5, WHITE));

  BOOST_CHECK (expect == morph_sequence_apply (img, "d3.3 + tw5.5"));
  BOOST_CHECK (close_gray (img, 7, 1) == morph_sequence_apply (img, "c7.1"));
  BOOST_CHECK (tophat_gray (img, 3, 3, BLACK)
               == execute_composite (img, morph_sequence::parse ("tb3.3")));
}

BOOST_AUTO_TEST_CASE (binary_only_operations)
{
  image img (test::random_gray (37, 29));

  BOOST_CHECK_THROW (morph_sequence_apply (img, "d3.3 + r1"),
                     unsupported_operation);
  BOOST_CHECK_THROW (morph_sequence_apply (img, "x2"),
                     unsupported_operation);
  BOOST_CHECK_THROW (morph_sequence_apply (img, "b4 + d3.3"),
                     unsupported_operation);
}

BOOST_AUTO_TEST_SUITE_END (/* gray_execution */);

BOOST_AUTO_TEST_CASE (empty_image)
{
  BOOST_CHECK_THROW (morph_sequence_apply (image (), "d3.3"), invalid_size);
}

bool
init_test_runner ()
{
  namespace but = ::boost::unit_test;

  std::list< std::string > malformed;
  boost::assign::push_back (malformed)
    ("")
    ("   ")
    ("O1.")
    ("D8")
    ("E0.4")
    ("d3.0")
    ("d3.3.3")
    ("d-3.3")
    ("r25")
    ("r0")
    ("r")
    ("r12341")
    ("x5")
    ("x1")
    ("x")
    ("b0")
    ("b")
    ("d3.3 + b32")
    ("d3.3 ++ e3.3")
    ("d3.3 +")
    ("+ d3.3")
    ("3.3")
    ("d3.3;")
    ("tq3.3")
    ("t")
    ("d99999999999.3")
    ;
  but::framework::master_test_suite ()
    .add (BOOST_PARAM_TEST_CASE (malformed_sequence,
                                 malformed.begin (), malformed.end ()));

  std::list< std::string > unsupported;
  boost::assign::push_back (unsupported)
    ("y7.3")
    ("d3.3 + s2")
    ("Z")
    ;
  but::framework::master_test_suite ()
    .add (BOOST_PARAM_TEST_CASE (unsupported_sequence,
                                 unsupported.begin (), unsupported.end ()));

  return true;
}

#include "katachi/test/runner.ipp"
