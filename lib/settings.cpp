//  settings.cpp -- run-time configuration of the library
//  Copyright (C) 2026  Katachi contributors
//  Copyright (C) 2012-2015  SEIKO EPSON CORPORATION
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

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <locale>
#include <stdexcept>

#include <boost/program_options.hpp>
#include <boost/throw_exception.hpp>

#include "katachi/format.hpp"
#include "katachi/regex.hpp"
#include "katachi/settings.hpp"

#ifndef PACKAGE_ENV_VAR_PREFIX
#define PACKAGE_ENV_VAR_PREFIX "KATACHI_"
#endif

namespace katachi {

namespace po = boost::program_options;

namespace {

//! Maps \c KATACHI_ prefixed variables onto option names
struct env_var_mapper
{
  po::options_description opts_;

  enum { approx = true, exact = false };

  env_var_mapper (const po::options_description& opts)
    : opts_(opts)
  {}

  std::string
  operator() (const std::string& env_var)
  {
    static regex re (PACKAGE_ENV_VAR_PREFIX "(.*)");
    smatch option;

    if (regex_match (env_var, option, re)
        && opts_.find_nothrow (option[1], exact))
      return option[1];

    return std::string ();
  }
};

std::string
lower_case (std::string s)
{
  const std::locale& loc (std::locale::classic ());

  std::string::iterator it;
  for (it = s.begin (); s.end () != it; ++it)
    *it = std::tolower (*it, loc);

  return s;
}

void
unknown (const char *what, const std::string& value)
{
  BOOST_THROW_EXCEPTION
    (std::invalid_argument ((format ("unknown %1%: '%2%'")
                             % what % value).str ()));
}

}       // namespace

settings::settings ()
  : level_(log::ERROR)
  , categories_(log::ALL)
{}

settings
settings::from_environment ()
{
  std::string level;
  std::string categories;

  po::options_description env_args;
  env_args
    .add_options ()
    ("LOG_LEVEL", po::value< std::string > (&level))
    ("LOG_CATEGORY", po::value< std::string > (&categories))
    ;

  po::variables_map vm;
  po::store (po::parse_environment (env_args, env_var_mapper (env_args)), vm);
  po::notify (vm);

  settings rv;
  if (vm.count ("LOG_LEVEL"))    rv.level (level);
  if (vm.count ("LOG_CATEGORY")) rv.categories (categories);

  return rv;
}

log::priority
settings::level () const
{
  return level_;
}

log::category
settings::categories () const
{
  return categories_;
}

void
settings::level (const std::string& name)
{
  std::string s (lower_case (name));

  if      ("fatal" == s) level_ = log::FATAL;
  else if ("alert" == s) level_ = log::ALERT;
  else if ("error" == s) level_ = log::ERROR;
  else if ("brief" == s) level_ = log::BRIEF;
  else if ("trace" == s) level_ = log::TRACE;
  else if ("debug" == s) level_ = log::DEBUG;
  else unknown ("log level", name);
}

void
settings::categories (const std::string& names)
{
  std::string s (lower_case (names));

  if (std::string::npos == s.find_first_not_of (" \t,"))
    unknown ("log category", names);

  static regex re ("[^, \t]+");
  int matching = log::NOTHING;

  sregex_iterator it (s.begin (), s.end (), re);
  for (; sregex_iterator () != it; ++it)
    {
      std::string name (it->str ());

      if      ("binary"   == name) matching |= log::BINARY;
      else if ("gray"     == name) matching |= log::GRAY;
      else if ("sequence" == name) matching |= log::SEQUENCE;
      else if ("all"      == name) matching |= log::ALL;
      else unknown ("log category", name);
    }

  categories_ = log::category (matching);
}

void
settings::apply () const
{
  log::threshold = level_;
  log::matching  = categories_;

  log::debug ("log level %1%, categories %2%")
    % level_ % categories_;
}

}       // namespace katachi
