//  exception.hpp -- morphology specific exception types
//  Copyright (C) 2026  Katachi contributors
//  Copyright (C) 2013-2015  SEIKO EPSON CORPORATION
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

#ifndef katachi_exception_hpp_
#define katachi_exception_hpp_

#include <stdexcept>
#include <string>

namespace katachi {

//! Morphology related error conditions
/*! Every error detected by the library is an input validation error.
 *  They are reported before any output becomes visible to the caller
 *  so a caller can always retry with corrected parameters.
 *
 *  Catch an error to handle all of them or one of the subclasses to
 *  handle a single condition.
 */
class error
  : public std::runtime_error
{
public:
  enum error_code {
    no_error = 0,

    wrong_depth,
    invalid_size,
    invalid_sequence,
    unsupported_operation,
    out_of_bounds,

    unknown_error               // keep this last
  };

  error ();
  error (error_code ec, const std::string& message);
  error (error_code ec, const char *message);

  const error_code& code () const;

private:
  error_code ec_;
};

//! An image does not have the pixel depth an operation needs
class wrong_depth : public error
{
public:
  wrong_depth (const std::string& message = "wrong pixel depth")
    : error (error::wrong_depth, message)
  {}
};

//! A structuring element or operation size is out of range
class invalid_size : public error
{
public:
  invalid_size (const std::string& message = "invalid size")
    : error (error::invalid_size, message)
  {}
};

//! Sequence text does not follow the grammar
class invalid_sequence : public error
{
public:
  invalid_sequence (const std::string& message = "invalid sequence")
    : error (error::invalid_sequence, message)
  {}
};

//! Sequence text names an operation that cannot be carried out
class unsupported_operation : public error
{
public:
  unsupported_operation (const std::string& message
                         = "unsupported operation")
    : error (error::unsupported_operation, message)
  {}
};

//! Pixel access outside of the image extent
class out_of_bounds : public error
{
public:
  out_of_bounds (const std::string& message = "pixel out of bounds")
    : error (error::out_of_bounds, message)
  {}
};

}       // namespace katachi

#endif  /* katachi_exception_hpp_ */
