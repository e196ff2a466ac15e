//  morph.cpp -- binary morphology with structuring elements
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

#include "katachi/border.hpp"
#include "katachi/exception.hpp"
#include "katachi/log.hpp"
#include "katachi/morph.hpp"

#include "morph-check.hpp"
#include "rasterop.hpp"

namespace katachi {

typedef image::size_type size_type;

namespace {

void
check_hits (const sel& s)
{
  if (0 < s.hit_count ()) return;

  BOOST_THROW_EXCEPTION
    (invalid_size ((format ("structuring element %1% has no hits")
                    % s.name ()).str ()));
}

//! Foreground of \a lhs that is background in \a rhs
image
subtract (image lhs, const image& rhs)
{
  image::builder b (lhs);
  rop::translate (b, rhs, 0, 0, rop::NOT_SRC_AND_DST);
  return image (b);
}

}       // namespace

image
dilate (const image& img, const sel& s)
{
  check_mono (img, "dilate");
  check_hits (s);

  log::debug (log::BINARY, "dilate %1% x %2% with %3% (%4% hits)")
    % img.width () % img.height () % s.name () % s.hit_count ();

  image::builder out (img.width (), img.height (), image::MONO);

  sel::offset_list hits (s.hit_offsets ());
  sel::offset_list::const_iterator it;
  for (it = hits.begin (); hits.end () != it; ++it)
    {
      rop::translate (out, img, it->first, it->second, rop::SRC_OR_DST);
    }

  return image (out);
}

image
erode (const image& img, const sel& s)
{
  check_mono (img, "erode");
  check_hits (s);

  log::debug (log::BINARY, "erode %1% x %2% with %3% (%4% hits)")
    % img.width () % img.height () % s.name () % s.hit_count ();

  image::builder out (img.width (), img.height (), image::MONO);
  out.set_all ();

  sel::offset_list hits (s.hit_offsets ());
  sel::offset_list::const_iterator it;
  for (it = hits.begin (); hits.end () != it; ++it)
    {
      rop::translate (out, img, -it->first, -it->second, rop::SRC_AND_DST);
      rop::clear_uncovered (out, -it->first, -it->second,
                            img.width (), img.height ());
    }

  return image (out);
}

image
open (const image& img, const sel& s)
{
  return dilate (erode (img, s), s);
}

image
close (const image& img, const sel& s)
{
  return erode (dilate (img, s), s);
}

image
close_safe (const image& img, const sel& s)
{
  check_mono (img, "close_safe");

  size_type left, right, up, down;
  s.max_translations (left, right, up, down);

  size_type xmax = std::max (left, right);
  size_type ymax = std::max (up, down);

  if (0 == xmax && 0 == ymax)
    return close (img, s);

  //  keep the image word aligned inside the border
  size_type xbord = 32 * ((xmax + 31) / 32);

  log::debug (log::BINARY, "close_safe adds a (%1%, %2%) border")
    % xbord % ymax;

  image tmp (add_border (img, xbord, xbord, ymax, ymax, 0));
  return remove_border (close (tmp, s), xbord, xbord, ymax, ymax);
}

image
hit_miss (const image& img, const sel& s)
{
  check_mono (img, "hit_miss");

  if (0 == s.hit_count () && 0 == s.miss_count ())
    BOOST_THROW_EXCEPTION
      (invalid_size ((format ("structuring element %1% has no elements")
                      % s.name ()).str ()));

  image::builder out (img.width (), img.height (), image::MONO);
  out.set_all ();

  sel::offset_list hits (s.hit_offsets ());
  sel::offset_list::const_iterator it;
  for (it = hits.begin (); hits.end () != it; ++it)
    {
      rop::translate (out, img, -it->first, -it->second, rop::SRC_AND_DST);
      rop::clear_uncovered (out, -it->first, -it->second,
                            img.width (), img.height ());
    }

  //  Misses need background, which is what lies outside the image.
  sel::offset_list misses (s.miss_offsets ());
  for (it = misses.begin (); misses.end () != it; ++it)
    {
      rop::translate (out, img, -it->first, -it->second,
                      rop::NOT_SRC_AND_DST);
    }

  return image (out);
}

image
open_generalized (const image& img, const sel& s)
{
  return dilate (hit_miss (img, s), s);
}

image
close_generalized (const image& img, const sel& s)
{
  return hit_miss (dilate (img, s), s);
}

image
gradient (const image& img, const sel& s)
{
  return subtract (dilate (img, s), erode (img, s));
}

image
top_hat (const image& img, const sel& s)
{
  return subtract (img, open (img, s));
}

image
bottom_hat (const image& img, const sel& s)
{
  return subtract (close (img, s), img);
}

image
extract_boundary (const image& img, boundary_type type)
{
  check_mono (img, "extract_boundary");

  if (INNER == type)
    return subtract (img, erode (img, sel::square (3)));

  return subtract (dilate (img, sel::square (3)), img);
}

}       // namespace katachi
