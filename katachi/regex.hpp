//  regex.hpp -- regular expression selection
//  Copyright (C) 2026  Katachi contributors
//  Copyright (C) 2015  SEIKO EPSON CORPORATION
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

#ifndef katachi_regex_hpp_
#define katachi_regex_hpp_

/*! \file
 *  \brief Inject standard compliant \c regex API
 *
 *  Boost.Regex provides the same API as C++11's \c std::regex.  This
 *  header file lets code in the \c katachi namespace use either one
 *  without caring which.
 */

#if __cplusplus >= 201103L

#include <regex>
#define NAMESPACE std

#else   /* emulate C++11 */

#include <boost/regex.hpp>
#define NAMESPACE boost

#endif

namespace katachi {

using NAMESPACE::cmatch;
using NAMESPACE::regex;
using NAMESPACE::regex_match;
using NAMESPACE::sregex_iterator;
using NAMESPACE::smatch;

}       // namespace katachi

#undef NAMESPACE

#endif  /* katachi_regex_hpp_ */
