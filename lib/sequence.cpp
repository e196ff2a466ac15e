//  sequence.cpp -- morphological operation sequences
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

#include <cctype>
#include <climits>
#include <locale>

#include <boost/spirit/include/qi.hpp>
#include <boost/throw_exception.hpp>

#include "katachi/border.hpp"
#include "katachi/brick.hpp"
#include "katachi/exception.hpp"
#include "katachi/log.hpp"
#include "katachi/scale.hpp"
#include "katachi/sequence.hpp"

namespace katachi {

typedef image::size_type size_type;

brick_op::brick_op (operation op, size_type hsize, size_type vsize)
  : op (op), hsize (hsize), vsize (vsize)
{}

bool
brick_op::operator== (const brick_op& rhs) const
{
  return (op == rhs.op && hsize == rhs.hsize && vsize == rhs.vsize);
}

tophat_op::tophat_op (tophat_type type, size_type hsize, size_type vsize)
  : type (type), hsize (hsize), vsize (vsize)
{}

bool
tophat_op::operator== (const tophat_op& rhs) const
{
  return (type == rhs.type && hsize == rhs.hsize && vsize == rhs.vsize);
}

bool
rank_op::operator== (const rank_op& rhs) const
{
  return levels == rhs.levels;
}

expand_op::expand_op (size_type factor)
  : factor (factor)
{}

bool
expand_op::operator== (const expand_op& rhs) const
{
  return factor == rhs.factor;
}

border_op::border_op (size_type size)
  : size (size)
{}

bool
border_op::operator== (const border_op& rhs) const
{
  return size == rhs.size;
}

namespace {

namespace qi = boost::spirit::qi;

typedef std::string::const_iterator iterator;

void
malformed (const std::string& token, const char *why)
{
  BOOST_THROW_EXCEPTION
    (invalid_sequence ((format ("%1%: %2%") % token % why).str ()));
}

//! Drops all whitespace and lower cases what remains
std::string
normalize (const std::string& text)
{
  const std::locale& loc (std::locale::classic ());
  std::string rv;

  std::string::const_iterator it;
  for (it = text.begin (); text.end () != it; ++it)
    {
      if (std::isspace (*it, loc)) continue;
      rv += std::tolower (*it, loc);
    }
  return rv;
}

size_type
checked_size (unsigned value, const std::string& token)
{
  if (0 == value) malformed (token, "sizes must be positive");
  if (unsigned (INT_MAX) < value) malformed (token, "size too large");
  return value;
}

//! Parses the "<w>.<h>" tail of a brick or tophat token
void
parse_sizes (iterator head, iterator tail, const std::string& token,
             size_type& hsize, size_type& vsize)
{
  unsigned w = 0;
  unsigned h = 0;

  if (!qi::parse (head, tail, qi::uint_ >> '.' >> qi::uint_ >> qi::eoi,
                  w, h))
    malformed (token, "expected <width>.<height>");

  hsize = checked_size (w, token);
  vsize = checked_size (h, token);
}

morph_op
parse_brick (const std::string& token)
{
  brick_op op;

  switch (token[0])
    {
    case 'd': op.op = brick_op::DILATE; break;
    case 'e': op.op = brick_op::ERODE;  break;
    case 'o': op.op = brick_op::OPEN;   break;
    case 'c': op.op = brick_op::CLOSE;  break;
    }
  parse_sizes (token.begin () + 1, token.end (), token, op.hsize, op.vsize);

  return op;
}

morph_op
parse_tophat (const std::string& token)
{
  tophat_op op;

  if (2 > token.size ()) malformed (token, "expected tw or tb");

  switch (token[1])
    {
    case 'w': op.type = WHITE; break;
    case 'b': op.type = BLACK; break;
    default:
      malformed (token, "expected tw or tb");
    }
  parse_sizes (token.begin () + 2, token.end (), token, op.hsize, op.vsize);

  return op;
}

morph_op
parse_rank (const std::string& token)
{
  iterator head = token.begin () + 1;
  iterator tail = token.end ();
  std::string digits;

  if (!qi::parse (head, tail,
                  qi::repeat (1, 4)[qi::char_ ('1', '4')] >> qi::eoi,
                  digits))
    malformed (token, "expected one to four rank levels from 1 to 4");

  rank_op op;
  std::string::const_iterator it;
  for (it = digits.begin (); digits.end () != it; ++it)
    op.levels.push_back (*it - '0');

  return op;
}

morph_op
parse_expand (const std::string& token)
{
  iterator head = token.begin () + 1;
  iterator tail = token.end ();
  unsigned factor = 0;

  if (!qi::parse (head, tail, qi::uint_ >> qi::eoi, factor)
      || !(2 == factor || 4 == factor || 8 == factor || 16 == factor))
    malformed (token, "expansion factor must be 2, 4, 8 or 16");

  return expand_op (factor);
}

morph_op
parse_border (const std::string& token, bool first)
{
  if (!first) malformed (token, "a border is only allowed first");

  iterator head = token.begin () + 1;
  iterator tail = token.end ();
  unsigned size = 0;

  if (!qi::parse (head, tail, qi::uint_ >> qi::eoi, size))
    malformed (token, "expected a border size");

  return border_op (checked_size (size, token));
}

morph_op
parse_token (const std::string& token, bool first)
{
  if (token.empty ()) malformed ("+", "empty operation");

  switch (token[0])
    {
    case 'd':
    case 'e':
    case 'o':
    case 'c': return parse_brick (token);
    case 't': return parse_tophat (token);
    case 'r': return parse_rank (token);
    case 'x': return parse_expand (token);
    case 'b': return parse_border (token, first);
    default:
      break;
    }

  if (std::isalpha (token[0], std::locale::classic ()))
    BOOST_THROW_EXCEPTION
      (unsupported_operation ((format ("%1%: unsupported operation")
                               % token).str ()));

  malformed (token, "operations start with a letter");
  return morph_op ();           // not reached
}

//! Checks whether \a seq can be run on \a img as a whole
/*! Returns the size of the border to remove at the end, if any.
 *  Image sizes are followed through the sequence so that nothing is
 *  started that cannot be represented.
 */
size_type
prepare (const image& img, const morph_sequence& seq)
{
  if (img.empty ())
    BOOST_THROW_EXCEPTION (invalid_size ("cannot run a sequence on nothing"));

  const bool mono = (image::MONO == img.type ());

  size_type border = 0;
  int scale = 0;                // net scale as a power of two
  long long w = img.width ();
  long long h = img.height ();

  morph_sequence::const_iterator it;
  for (it = seq.begin (); seq.end () != it; ++it)
    {
      const char *what = 0;

      if (const border_op *op = boost::get< border_op > (&*it))
        {
          border = op->size;
          w += 2LL * border;
          h += 2LL * border;
          what = "border";
        }
      if (const expand_op *op = boost::get< expand_op > (&*it))
        {
          for (size_type f = op->factor; 1 < f; f /= 2) ++scale;
          w *= op->factor;
          h *= op->factor;
          what = "expansion";
        }
      if (const rank_op *op = boost::get< rank_op > (&*it))
        {
          for (std::vector< int >::size_type i = 0;
               i < op->levels.size (); ++i)
            {
              w = (w + 1) / 2;
              h = (h + 1) / 2;
              --scale;
            }
          what = "rank reduction";
        }
      if (boost::get< tophat_op > (&*it) && mono)
        BOOST_THROW_EXCEPTION
          (unsupported_operation ("tophat needs an 8-bit image"));

      if (what && !mono)
        BOOST_THROW_EXCEPTION
          (unsupported_operation ((format ("%1% needs a 1-bit image")
                                   % what).str ()));

      if (INT_MAX < w || INT_MAX < h
          || INT_MAX / h < (w * img.depth () + 31) / 32)
        BOOST_THROW_EXCEPTION
          (invalid_sequence ((format ("step %1% would need a %2% x %3% image")
                              % (it - seq.begin () + 1) % w % h).str ()));
    }

  if (!border) return 0;

  long long removed = border;
  if (0 <= scale)
    {
      if (31 < scale) removed = LLONG_MAX;
      else            removed <<= scale;
    }
  else if (31 < -scale || 0 != removed % (1LL << -scale))
    {
      BOOST_THROW_EXCEPTION
        (invalid_sequence ((format ("a %1% pixel border cannot be removed"
                                    " after scaling by 2^%2%")
                            % border % scale).str ()));
    }
  else
    {
      removed >>= -scale;
    }

  if (INT_MAX < removed)
    BOOST_THROW_EXCEPTION
      (invalid_sequence ((format ("a %1% pixel border scaled by 2^%2%"
                                  " is too large to remove")
                          % border % scale).str ()));

  return removed;
}

typedef image (*brick_fn) (const image&, size_type, size_type);

class mono_step
  : public boost::static_visitor< image >
{
public:
  mono_step (const image& img, bool composite)
    : img_(img), composite_(composite)
  {}

  image operator() (const brick_op& op) const
  {
    static const brick_fn plain[] = {
      dilate_brick, erode_brick, open_brick, close_brick,
    };
    static const brick_fn comp[] = {
      dilate_comp_brick, erode_comp_brick, open_comp_brick, close_comp_brick,
    };

    return (composite_ ? comp : plain)[op.op] (img_, op.hsize, op.vsize);
  }

  image operator() (const tophat_op&) const
  {
    BOOST_THROW_EXCEPTION
      (unsupported_operation ("tophat needs an 8-bit image"));
  }

  image operator() (const rank_op& op) const
  {
    return reduce_rank_cascade (img_, op.levels);
  }

  image operator() (const expand_op& op) const
  {
    return expand_replicate (img_, op.factor);
  }

  image operator() (const border_op& op) const
  {
    return add_border (img_, op.size, 0);
  }

private:
  const image& img_;
  bool composite_;
};

class gray_step
  : public boost::static_visitor< image >
{
public:
  explicit gray_step (const image& img)
    : img_(img)
  {}

  image operator() (const brick_op& op) const
  {
    static const brick_fn gray[] = {
      dilate_gray, erode_gray, open_gray, close_gray,
    };

    return gray[op.op] (img_, op.hsize, op.vsize);
  }

  image operator() (const tophat_op& op) const
  {
    return tophat_gray (img_, op.hsize, op.vsize, op.type);
  }

  template< typename T >
  image operator() (const T&) const
  {
    BOOST_THROW_EXCEPTION
      (unsupported_operation ("operation needs a 1-bit image"));
  }

private:
  const image& img_;
};

image
run (const image& img, const morph_sequence& seq, bool composite)
{
  size_type border = prepare (img, seq);

  log::trace (log::SEQUENCE, "running %1% operations on %2% x %3% image%4%")
    % seq.size () % img.width () % img.height ()
    % (composite ? " (composite)" : "");

  image rv (img);

  morph_sequence::const_iterator it;
  for (it = seq.begin (); seq.end () != it; ++it)
    {
      if (image::MONO == rv.type ())
        rv = boost::apply_visitor (mono_step (rv, composite), *it);
      else
        rv = boost::apply_visitor (gray_step (rv), *it);

      log::debug (log::SEQUENCE, "step %1%: %2% x %3%")
        % (it - seq.begin () + 1) % rv.width () % rv.height ();
    }

  if (border) rv = remove_border (rv, border);

  return rv;
}

}       // namespace

morph_sequence::morph_sequence ()
{}

morph_sequence
morph_sequence::parse (const std::string& text)
{
  std::string s (normalize (text));

  if (s.empty ())
    BOOST_THROW_EXCEPTION (invalid_sequence ("empty sequence"));

  morph_sequence rv;
  std::string::size_type head = 0;

  while (head <= s.size ())
    {
      std::string::size_type tail = s.find ('+', head);
      if (std::string::npos == tail) tail = s.size ();

      rv.ops_.push_back (parse_token (s.substr (head, tail - head),
                                      rv.ops_.empty ()));
      head = tail + 1;
    }

  log::debug (log::SEQUENCE, "parsed \"%1%\" into %2% operations")
    % text % rv.ops_.size ();

  return rv;
}

morph_sequence::const_iterator
morph_sequence::begin () const
{
  return ops_.begin ();
}

morph_sequence::const_iterator
morph_sequence::end () const
{
  return ops_.end ();
}

morph_sequence::size_type
morph_sequence::size () const
{
  return ops_.size ();
}

bool
morph_sequence::empty () const
{
  return ops_.empty ();
}

const morph_op&
morph_sequence::operator[] (size_type i) const
{
  return ops_[i];
}

image
execute (const image& img, const morph_sequence& seq)
{
  return run (img, seq, false);
}

image
execute_composite (const image& img, const morph_sequence& seq)
{
  return run (img, seq, true);
}

image
morph_sequence_apply (const image& img, const std::string& text)
{
  return execute (img, morph_sequence::parse (text));
}

}       // namespace katachi
