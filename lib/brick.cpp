//  brick.cpp -- brick, separable and composite morphology
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

#include <boost/throw_exception.hpp>

#include "katachi/border.hpp"
#include "katachi/brick.hpp"
#include "katachi/exception.hpp"
#include "katachi/log.hpp"
#include "katachi/morph.hpp"

#include "morph-check.hpp"

namespace katachi {

typedef image::size_type size_type;

namespace {

typedef image (*morph_fn) (const image&, const sel&);

void
check_sizes (size_type hsize, size_type vsize, const char *what)
{
  if (0 < hsize && 0 < vsize) return;

  BOOST_THROW_EXCEPTION
    (invalid_size ((format ("%1%: brick sizes must be positive"
                            " (got %2% x %3%)")
                    % what % hsize % vsize).str ()));
}

//! Bumps even sizes to the next odd one
void
make_odd (size_type& hsize, size_type& vsize, const char *what)
{
  size_type h = hsize | 1;
  size_type v = vsize | 1;

  if (h == hsize && v == vsize) return;

  log::trace (log::BINARY, "%1%: using %2% x %3% instead of %4% x %5%")
    % what % h % v % hsize % vsize;

  hsize = h;
  vsize = v;
}

//! Applies \a fn with a horizontal and then a vertical line
image
line_passes (morph_fn fn, const image& img,
             size_type hsize, size_type vsize)
{
  image rv (img);

  if (1 < hsize) rv = fn (rv, sel::horizontal (hsize));
  if (1 < vsize) rv = fn (rv, sel::vertical (vsize));

  return rv;
}

//! Applies \a fn along one direction, decomposing \a size if possible
image
comp_pass (morph_fn fn, const image& img, size_type size,
           sel::direction dir)
{
  if (1 == size) return img;

  size_type f1, f2;
  select_composable_sizes (size, f1, f2);

  const bool horizontal = (sel::HORIZONTAL == dir);

  if (1 == f1)
    {
      return fn (img, (horizontal
                       ? sel::horizontal (size)
                       : sel::vertical (size)));
    }

  log::debug (log::BINARY, "%1% line of %2% as %3% x %4%")
    % (horizontal ? "horizontal" : "vertical") % size % f1 % f2;

  image tmp (fn (img, (horizontal
                       ? sel::horizontal (f1)
                       : sel::vertical (f1))));
  return fn (tmp, sel::comb (f1, f2, dir));
}

image
comp_passes (morph_fn fn, const image& img,
             size_type hsize, size_type vsize)
{
  image tmp (comp_pass (fn, img, hsize, sel::HORIZONTAL));
  return comp_pass (fn, tmp, vsize, sel::VERTICAL);
}

//! Horizontal border needed around a closing with a brick
size_type
safe_border_width (size_type hsize)
{
  return 32 * ((hsize / 2 + 31) / 32);
}

//! Composite dilation on a canvas that is large enough to hold it
/*! The brick pass spreads foreground beyond the image edge and the
 *  comb pass may move it back in.  Without the extra background that
 *  foreground would be lost.
 */
image
comp_dilate (const image& img, size_type hsize, size_type vsize)
{
  if (1 == hsize && 1 == vsize) return img;

  size_type xbord = safe_border_width (hsize);
  size_type ybord = vsize / 2;

  image tmp (add_border (img, xbord, xbord, ybord, ybord, 0));
  tmp = comp_passes (dilate, tmp, hsize, vsize);

  return remove_border (tmp, xbord, xbord, ybord, ybord);
}

}       // namespace

image
dilate_brick (const image& img, size_type hsize, size_type vsize)
{
  check_mono (img, "dilate_brick");
  check_sizes (hsize, vsize, "dilate_brick");
  make_odd (hsize, vsize, "dilate_brick");

  return line_passes (dilate, img, hsize, vsize);
}

image
erode_brick (const image& img, size_type hsize, size_type vsize)
{
  check_mono (img, "erode_brick");
  check_sizes (hsize, vsize, "erode_brick");
  make_odd (hsize, vsize, "erode_brick");

  return line_passes (erode, img, hsize, vsize);
}

image
open_brick (const image& img, size_type hsize, size_type vsize)
{
  check_mono (img, "open_brick");
  check_sizes (hsize, vsize, "open_brick");
  make_odd (hsize, vsize, "open_brick");

  image tmp (line_passes (erode, img, hsize, vsize));
  return line_passes (dilate, tmp, hsize, vsize);
}

image
close_brick (const image& img, size_type hsize, size_type vsize)
{
  check_mono (img, "close_brick");
  check_sizes (hsize, vsize, "close_brick");
  make_odd (hsize, vsize, "close_brick");

  image tmp (line_passes (dilate, img, hsize, vsize));
  return line_passes (erode, tmp, hsize, vsize);
}

image
close_safe_brick (const image& img, size_type hsize, size_type vsize)
{
  check_mono (img, "close_safe_brick");
  check_sizes (hsize, vsize, "close_safe_brick");
  make_odd (hsize, vsize, "close_safe_brick");

  if (1 == hsize && 1 == vsize) return img;

  size_type xbord = safe_border_width (hsize);
  size_type ybord = vsize / 2;

  image tmp (add_border (img, xbord, xbord, ybord, ybord, 0));
  tmp = line_passes (dilate, tmp, hsize, vsize);
  tmp = line_passes (erode, tmp, hsize, vsize);

  return remove_border (tmp, xbord, xbord, ybord, ybord);
}

image
dilate_separable (const image& img, const sel& s)
{
  if (!s.is_brick ()) return dilate (img, s);

  check_mono (img, "dilate_separable");

  image rv (img);
  if (1 < s.width ())
    rv = dilate (rv, sel::brick (s.width (), 1, s.cx (), 0));
  if (1 < s.height ())
    rv = dilate (rv, sel::brick (1, s.height (), 0, s.cy ()));
  return rv;
}

image
erode_separable (const image& img, const sel& s)
{
  if (!s.is_brick ()) return erode (img, s);

  check_mono (img, "erode_separable");

  image rv (img);
  if (1 < s.width ())
    rv = erode (rv, sel::brick (s.width (), 1, s.cx (), 0));
  if (1 < s.height ())
    rv = erode (rv, sel::brick (1, s.height (), 0, s.cy ()));
  return rv;
}

void
select_composable_sizes (size_type size, size_type& f1, size_type& f2)
{
  if (0 >= size)
    BOOST_THROW_EXCEPTION
      (invalid_size ((format ("cannot decompose a size of %1%")
                      % size).str ()));

  f1 = 1;
  for (size_type i = 2; i * i <= size; ++i)
    if (0 == size % i) f1 = i;

  f2 = size / f1;
}

image
dilate_comp_brick (const image& img, size_type hsize, size_type vsize)
{
  check_mono (img, "dilate_comp_brick");
  check_sizes (hsize, vsize, "dilate_comp_brick");

  return comp_dilate (img, hsize, vsize);
}

image
erode_comp_brick (const image& img, size_type hsize, size_type vsize)
{
  check_mono (img, "erode_comp_brick");
  check_sizes (hsize, vsize, "erode_comp_brick");

  return comp_passes (erode, img, hsize, vsize);
}

image
open_comp_brick (const image& img, size_type hsize, size_type vsize)
{
  check_mono (img, "open_comp_brick");
  check_sizes (hsize, vsize, "open_comp_brick");

  image tmp (comp_passes (erode, img, hsize, vsize));
  return comp_dilate (tmp, hsize, vsize);
}

image
close_comp_brick (const image& img, size_type hsize, size_type vsize)
{
  check_mono (img, "close_comp_brick");
  check_sizes (hsize, vsize, "close_comp_brick");

  image tmp (comp_dilate (img, hsize, vsize));
  return comp_passes (erode, tmp, hsize, vsize);
}

image
close_safe_comp_brick (const image& img, size_type hsize, size_type vsize)
{
  check_mono (img, "close_safe_comp_brick");
  check_sizes (hsize, vsize, "close_safe_comp_brick");

  if (1 == hsize && 1 == vsize) return img;

  size_type xbord = safe_border_width (hsize);
  size_type ybord = vsize / 2;

  image tmp (add_border (img, xbord, xbord, ybord, ybord, 0));
  tmp = comp_passes (dilate, tmp, hsize, vsize);
  tmp = comp_passes (erode, tmp, hsize, vsize);

  return remove_border (tmp, xbord, xbord, ybord, ybord);
}

}       // namespace katachi
