//  scale.cpp -- rank reduction and replicated expansion
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

#include <climits>

#include <boost/throw_exception.hpp>

#include "katachi/exception.hpp"
#include "katachi/log.hpp"
#include "katachi/scale.hpp"

#include "morph-check.hpp"

namespace katachi {

typedef image::size_type size_type;

image
reduce_rank_binary_2 (const image& img, int level)
{
  check_mono (img, "reduce_rank_binary_2");

  if (1 > level || 4 < level)
    BOOST_THROW_EXCEPTION
      (invalid_size ((format ("rank reduction level %1% not in [1,4]")
                      % level).str ()));

  const size_type w = img.width ();
  const size_type h = img.height ();

  image::builder b ((w + 1) / 2, (h + 1) / 2, image::MONO);

  for (size_type y = 0; y < b.height (); ++y)
    for (size_type x = 0; x < b.width (); ++x)
      {
        const size_type sx = 2 * x;
        const size_type sy = 2 * y;

        int count = img.get_unchecked (sx, sy);
        if (sx + 1 < w) count += img.get_unchecked (sx + 1, sy);
        if (sy + 1 < h)
          {
            count += img.get_unchecked (sx, sy + 1);
            if (sx + 1 < w) count += img.get_unchecked (sx + 1, sy + 1);
          }
        if (count >= level) b.set_unchecked (x, y, 1);
      }

  return image (b);
}

image
reduce_rank_cascade (const image& img, const std::vector< int >& levels)
{
  if (levels.empty () || 4 < levels.size ())
    BOOST_THROW_EXCEPTION
      (invalid_size ((format ("rank cascade needs 1 to 4 levels, not %1%")
                      % levels.size ()).str ()));

  image rv (img);

  std::vector< int >::const_iterator it;
  for (it = levels.begin (); levels.end () != it; ++it)
    {
      rv = reduce_rank_binary_2 (rv, *it);
    }

  log::debug (log::BINARY, "reduced %1% x %2% to %3% x %4%")
    % img.width () % img.height () % rv.width () % rv.height ();

  return rv;
}

image
expand_replicate (const image& img, size_type factor)
{
  if (img.empty ())
    BOOST_THROW_EXCEPTION
      (invalid_size ("expand_replicate: empty image"));

  if (0 >= factor)
    BOOST_THROW_EXCEPTION
      (invalid_size ((format ("expansion factor %1% must be positive")
                      % factor).str ()));

  if (1 == factor) return img;

  if (INT_MAX / factor < img.width () || INT_MAX / factor < img.height ())
    BOOST_THROW_EXCEPTION
      (invalid_size ((format ("cannot expand a %1% x %2% image by %3%")
                      % img.width () % img.height () % factor).str ()));

  image::builder b (img.width () * factor, img.height () * factor,
                    img.type ());

  for (size_type y = 0; y < b.height (); ++y)
    for (size_type x = 0; x < b.width (); ++x)
      b.set_unchecked (x, y, img.get_unchecked (x / factor, y / factor));

  return image (b);
}

}       // namespace katachi
