//  cstdint.hpp -- fixed width integer types
//  Copyright (C) 2026  Katachi contributors
//  Copyright (C) 2012, 2015  SEIKO EPSON CORPORATION
//
//  License: GPL-3.0+
//  Author : EPSON AVASYS CORPORATION
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

#ifndef katachi_cstdint_hpp_
#define katachi_cstdint_hpp_

/*! \file
 *  \brief Inject fixed width integral types into the katachi namespace
 *
 *  Raster data is stored in 32-bit words and pixel values are handed
 *  around as unsigned integers of well-defined width.  Whether these
 *  come from the standard library or from Boost should not matter to
 *  the rest of the code.  This header file takes care of that.
 */

#if __cplusplus >= 201103L

#include <cstdint>
#define NAMESPACE std

#else   /* emulate C++11 */

#include <boost/cstdint.hpp>
#define NAMESPACE boost

#endif

namespace katachi {

using NAMESPACE::uint8_t;
using NAMESPACE::uint32_t;

}       // namespace katachi

#undef NAMESPACE

#endif  /* katachi_cstdint_hpp_ */
