//  log.hpp -- prioritized, categorized message logging
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

#ifndef katachi_log_hpp_
#define katachi_log_hpp_

#include <ostream>
#include <sstream>
#include <string>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/optional.hpp>

#include "format.hpp"

namespace katachi {

class log
{
public:
  typedef enum {
    FATAL,                      //!<  famous last words
    ALERT,                      //!<  outside intervention required
    ERROR,                      //!<  something went wrong
    BRIEF,                      //!<  short informational notes
    TRACE,                      //!<  more chattery feedback
    DEBUG,                      //!<  the gory details
  } priority;

  typedef enum {
    NOTHING  = 0,
    BINARY   = 1 << 0,          //!<  bit-packed morphology
    GRAY     = 1 << 1,          //!<  grayscale morphology
    SEQUENCE = 1 << 2,          //!<  sequence interpretation
    ALL      = ~0
  } category;

  //!  The priority at and above which messages may be logged
  static priority threshold;
  //!  The categories for which messages will be logged
  static category matching;

  //!  Where log messages end up, \c std::clog unless redirected
  static std::ostream& os_;

  static bool make_noise (int level, int cat = ALL)
  {
    return (threshold >= level && (matching & cat));
  }

  //!  Formatted, self-outputting log messages
  /*!  A message collects its arguments via operator%(), in the same
   *   way as boost::format does, and writes itself to os_ when it is
   *   destroyed.  Messages that fail to make_noise() never construct
   *   a boost::format object so that argument processing is next to
   *   free for suppressed messages.
   *
   *   Missing arguments are replaced by their placeholder text rather
   *   than causing an exception at destruction time.
   */
  class message
  {
  public:
    typedef boost::format format_type;
    typedef std::string   string_type;

    message ()
      : arg_(0), cnt_(0), dumped_(false)
    {}

    message (int lvl, const string_type& fmt)
      : arg_(0), cnt_(0), dumped_(false)
    {
      init (fmt, lvl, ALL);
    }

    message (int lvl, int cat, const string_type& fmt)
      : arg_(0), cnt_(0), dumped_(false)
    {
      init (fmt, lvl, cat);
    }

    ~message ()
    {
      if (!fmt_ || dumped_) return;

      while (arg_ < cnt_)
        {
          std::ostringstream os;
          os << "%" << ++arg_ << "%";
          *fmt_ % os.str ();
        }
      os_ << string_type (*this);
    }

    //!  Feeds the argument \a t to a message
    template <typename T> message& operator% (const T& t)
    {
      ++arg_;
      if (fmt_) *fmt_ % t;
      return *this;
    }

    operator string_type () const
    {
      string_type rv;

      if (fmt_)
        {
          std::ostringstream os;
          os << *timestamp_ << ": " << *fmt_ << std::endl;
          rv = os.str ();
        }
      dumped_ = true;
      return rv;
    }

  private:
    boost::optional< boost::posix_time::ptime > timestamp_;
    boost::optional< format_type > fmt_;
    int arg_;
    int cnt_;
    mutable bool dumped_;

    void init (const string_type& fmt, int lvl, int cat)
    {
      if (!make_noise (lvl, cat)) return;

      timestamp_ = boost::posix_time::microsec_clock::local_time ();
      fmt_ = format_type (fmt);
      fmt_->exceptions (boost::io::no_error_bits);
      cnt_ = fmt_->expected_args ();
    }
  };

  //!  Prioritized log messages
  /*!  Rather than writing
   *
   *     \code
   *     log::message (log::ERROR, log::GRAY, "error message");
   *     \endcode
   *
   *   the named constructors let you write
   *
   *     \code
   *     log::error (log::GRAY, "error message");
   *     \endcode
   */
#define expand_named_ctors(ctor,level)                                  \
  inline static message                                                 \
  ctor (const message::string_type& fmt)                                \
  { return message (level, ALL, fmt); }                                 \
  inline static message                                                 \
  ctor (const category& cat, const message::string_type& fmt)           \
  { return message (level, cat, fmt); }                                 \
  /**/

  expand_named_ctors (fatal, FATAL);
  expand_named_ctors (alert, ALERT);
  expand_named_ctors (error, ERROR);
  expand_named_ctors (brief, BRIEF);
  expand_named_ctors (trace, TRACE);
  expand_named_ctors (debug, DEBUG);

#undef expand_named_ctors
};

inline std::ostream&
operator<< (std::ostream& os, const log::message& msg)
{
  os << log::message::string_type (msg);
  return os;
}

}       // namespace katachi

#endif  /* katachi_log_hpp_ */
