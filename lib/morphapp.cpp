//  morphapp.cpp -- compound binary morphology
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

#include <algorithm>

#include <boost/throw_exception.hpp>

#include "katachi/exception.hpp"
#include "katachi/log.hpp"
#include "katachi/morph.hpp"
#include "katachi/morphapp.hpp"
#include "katachi/sequence.hpp"

#include "morph-check.hpp"
#include "rasterop.hpp"

namespace katachi {

typedef image::size_type size_type;

namespace {

image
apply (const image& img, const sel& s, sel_operation op)
{
  switch (op)
    {
    case SEL_DILATE:   return dilate (img, s);
    case SEL_ERODE:    return erode (img, s);
    case SEL_OPEN:     return open (img, s);
    case SEL_CLOSE:    return close (img, s);
    case SEL_HIT_MISS: return hit_miss (img, s);
    }

  BOOST_THROW_EXCEPTION
    (unsupported_operation ((format ("unknown operation %1%")
                             % op).str ()));
}

//! Combines the results of \a op for all of \a sels into \a b
image
combine (image::builder& b, const image& img,
         const std::vector< sel >& sels, sel_operation op,
         rop::operation how, const char *what)
{
  if (sels.empty ())
    BOOST_THROW_EXCEPTION
      (invalid_size ((format ("%1%: no structuring elements")
                      % what).str ()));

  log::debug (log::BINARY, "%1% over %2% structuring elements")
    % what % sels.size ();

  std::vector< sel >::const_iterator it;
  for (it = sels.begin (); sels.end () != it; ++it)
    {
      rop::translate (b, apply (img, *it, op), 0, 0, how);
    }

  return image (b);
}

}       // namespace

image
union_of_morph_ops (const image& img, const std::vector< sel >& sels,
                    sel_operation op)
{
  check_mono (img, "union_of_morph_ops");

  image::builder b (img.width (), img.height (), image::MONO);

  return combine (b, img, sels, op, rop::SRC_OR_DST, "union_of_morph_ops");
}

image
intersection_of_morph_ops (const image& img, const std::vector< sel >& sels,
                           sel_operation op)
{
  check_mono (img, "intersection_of_morph_ops");

  image::builder b (img.width (), img.height (), image::MONO);
  b.set_all ();

  return combine (b, img, sels, op, rop::SRC_AND_DST,
                  "intersection_of_morph_ops");
}

image
seedfill_morph (const image& seed, const image& mask,
                int max_iters, int connectivity)
{
  check_mono (seed, "seedfill_morph");
  check_mono (mask, "seedfill_morph");

  if (seed.width () != mask.width () || seed.height () != mask.height ())
    BOOST_THROW_EXCEPTION
      (invalid_size ((format ("seed (%1% x %2%) and mask (%3% x %4%)"
                              " differ in size")
                      % seed.width () % seed.height ()
                      % mask.width () % mask.height ()).str ()));

  if (0 > max_iters)
    BOOST_THROW_EXCEPTION
      (invalid_size ((format ("seedfill_morph: %1% iterations")
                      % max_iters).str ()));

  if (4 != connectivity && 8 != connectivity)
    BOOST_THROW_EXCEPTION
      (unsupported_operation ((format ("seedfill_morph: %1%-connectivity")
                               % connectivity).str ()));

  if (0 == max_iters) max_iters = 1000;

  const sel s (8 == connectivity ? sel::square (3) : sel::cross (3));

  image current (seed);
  int i = 0;

  while (i < max_iters)
    {
      image tmp (dilate (current, s));
      image::builder b (tmp);
      rop::translate (b, mask, 0, 0, rop::SRC_AND_DST);

      image next (b);
      ++i;

      if (next == current) break;
      current = next;
    }

  log::debug (log::BINARY, "seedfill_morph: %1% iterations") % i;

  return current;
}

image
morph_sequence_masked (const image& img, const image& mask,
                       const std::string& text)
{
  image rv (morph_sequence_apply (img, text));

  if (mask.empty ()) return rv;

  check_mono (mask, "morph_sequence_masked");

  const size_type w = std::min (std::min (img.width (), mask.width ()),
                                rv.width ());
  const size_type h = std::min (std::min (img.height (), mask.height ()),
                                rv.height ());

  image::builder b (rv);

  for (size_type y = 0; y < h; ++y)
    for (size_type x = 0; x < w; ++x)
      if (mask.get_unchecked (x, y))
        b.set_unchecked (x, y, img.get_unchecked (x, y));

  return image (b);
}

}       // namespace katachi
