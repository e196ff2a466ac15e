//  border.cpp -- image border padding and removal
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
#include <climits>

#include <boost/throw_exception.hpp>

#include "katachi/border.hpp"
#include "katachi/exception.hpp"
#include "katachi/format.hpp"

#include "rasterop.hpp"

namespace katachi {

typedef image::size_type size_type;
typedef image::word_type word_type;

image
add_border (const image& img, size_type npix, uint32_t value)
{
  return add_border (img, npix, npix, npix, npix, value);
}

image
add_border (const image& img, size_type left, size_type right,
            size_type top, size_type bottom, uint32_t value)
{
  if (img.empty ())
    BOOST_THROW_EXCEPTION (invalid_size ("cannot add a border to nothing"));

  if (0 > left || 0 > right || 0 > top || 0 > bottom)
    BOOST_THROW_EXCEPTION
      (invalid_size ("border sizes must not be negative"));

  if (0 == left && 0 == right && 0 == top && 0 == bottom)
    return img;

  if (INT_MAX - img.width () < 0LL + left + right
      || INT_MAX - img.height () < 0LL + top + bottom)
    BOOST_THROW_EXCEPTION
      (invalid_size ((format ("a (%1%, %2%, %3%, %4%) border is too large"
                              " for a %5% x %6% image")
                      % left % right % top % bottom
                      % img.width () % img.height ()).str ()));

  image::builder b (img.width () + left + right,
                    img.height () + top + bottom, img.type ());

  if (image::MONO == img.type ()) value = (value ? 1 : 0);
  else                            value &= 0xff;

  if (value)
    {
      word_type fill = (image::MONO == img.type ()
                        ? ~word_type (0)
                        : value * 0x01010101);
      std::fill (b.data (), b.data () + b.words_per_line () * b.height (),
                 fill);
      b.clear_padding ();
      rop::clear_rect (b, left, top, img.width (), img.height ());
    }
  rop::translate (b, img, left, top, rop::SRC_OR_DST);

  return image (b);
}

image
remove_border (const image& img, size_type npix)
{
  return remove_border (img, npix, npix, npix, npix);
}

image
remove_border (const image& img, size_type left, size_type right,
               size_type top, size_type bottom)
{
  if (img.empty ())
    BOOST_THROW_EXCEPTION (invalid_size ("cannot remove a border from nothing"));

  if (0 > left || 0 > right || 0 > top || 0 > bottom)
    BOOST_THROW_EXCEPTION
      (invalid_size ("border sizes must not be negative"));

  if (0 == left && 0 == right && 0 == top && 0 == bottom)
    return img;

  size_type w = img.width ()  - left - right;
  size_type h = img.height () - top - bottom;

  if (0 >= w || 0 >= h)
    BOOST_THROW_EXCEPTION
      (invalid_size ((format ("cannot remove (%1%, %2%, %3%, %4%) border"
                              " from a %5% x %6% image")
                      % left % right % top % bottom
                      % img.width () % img.height ()).str ()));

  image::builder b (w, h, img.type ());
  rop::translate (b, img, -left, -top, rop::SRC_OR_DST);

  return image (b);
}

}       // namespace katachi
