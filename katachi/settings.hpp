//  settings.hpp -- run-time configuration of the library
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

#ifndef katachi_settings_hpp_
#define katachi_settings_hpp_

#include <string>

#include "log.hpp"

namespace katachi {

//! Run-time tunables picked up from the environment
/*! The library itself has no settings that affect the results of the
 *  morphological operations.  Only the amount of logging is subject
 *  to configuration, via
 *
 *   - \c KATACHI_LOG_LEVEL, one of \c fatal, \c alert, \c error,
 *     \c brief, \c trace or \c debug
 *   - \c KATACHI_LOG_CATEGORY, a comma separated list of \c binary,
 *     \c gray, \c sequence and \c all
 *
 *  Values are case-insensitive.  Unset variables leave the library's
 *  defaults in place.
 */
class settings
{
public:
  //! Creates settings with the library defaults
  settings ();

  //! Creates settings from the \c KATACHI_ environment variables
  /*! \throw std::invalid_argument for unknown values
   */
  static settings from_environment ();

  log::priority level () const;
  log::category categories () const;

  //! \throw std::invalid_argument if \a name is not a log level
  void level (const std::string& name);
  //! \throw std::invalid_argument if \a names contains an unknown one
  void categories (const std::string& names);

  //! Makes the log obey these settings
  void apply () const;

private:
  log::priority level_;
  log::category categories_;
};

}       // namespace katachi

#endif  /* katachi_settings_hpp_ */
