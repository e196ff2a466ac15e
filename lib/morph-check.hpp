//  morph-check.hpp -- argument checks shared by morphology functions
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

#ifndef lib_morph_check_hpp_
#define lib_morph_check_hpp_

#include <boost/throw_exception.hpp>

#include "katachi/exception.hpp"
#include "katachi/format.hpp"
#include "katachi/image.hpp"

namespace katachi {

//! Makes sure \a img is a non-empty bit-packed image
inline void
check_mono (const image& img, const char *what)
{
  if (img.empty ())
    BOOST_THROW_EXCEPTION
      (invalid_size ((format ("%1%: empty image") % what).str ()));

  if (image::MONO != img.type ())
    BOOST_THROW_EXCEPTION
      (wrong_depth ((format ("%1%: needs a 1-bit image, not %2%-bit")
                     % what % img.depth ()).str ()));
}

//! Makes sure \a img is a non-empty 8-bit grayscale image
inline void
check_gray (const image& img, const char *what)
{
  if (img.empty ())
    BOOST_THROW_EXCEPTION
      (invalid_size ((format ("%1%: empty image") % what).str ()));

  if (image::GRAY8 != img.type ())
    BOOST_THROW_EXCEPTION
      (wrong_depth ((format ("%1%: needs an 8-bit image, not %2%-bit")
                     % what % img.depth ()).str ()));
}

}       // namespace katachi

#endif  /* lib_morph_check_hpp_ */
