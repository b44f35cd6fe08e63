/* libircstate
* Copyright (C) 2016 Leetsoftwerx.
*
* This program is free software; you can redistribute it and/or modify
* it under the terms of the GNU General Public License as published by
* the Free Software Foundation; either version 2 of the License, or
* (at your option) any later version.
*
* This program is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
* GNU General Public License for more details.
*
* You should have received a copy of the GNU General Public License
* along with this program; if not, write to the Free Software
* Foundation, Inc., 51 Franklin St, Fifth Floor, Boston, MA 02110-1301, USA
*/

#include <algorithm>
#include <iterator>
#include <string>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/utility/string_ref.hpp>
#include "casemap.hpp"

namespace ircstate
{
	char fold_char(char c, casemapping map) LIBIRCSTATE_NOEXCEPT
	{
		if (c >= 'A' && c <= 'Z')
			return static_cast<char>(c - 'A' + 'a');
		if (map == casemapping::ascii)
			return c;

		switch (c)
		{
		case '[':
			return '{';
		case ']':
			return '}';
		case '\\':
			return '|';
		case '^':
			/* strict-rfc1459 leaves ^ and ~ distinct */
			return map == casemapping::rfc1459 ? '~' : c;
		default:
			return c;
		}
	}

	std::string fold(const boost::string_ref & raw, casemapping map)
	{
		std::string folded;
		folded.reserve(raw.size());
		std::transform(raw.cbegin(), raw.cend(), std::back_inserter(folded),
			[map](char c){ return fold_char(c, map); });
		return folded;
	}

	casemapping casemapping_from_token(const boost::string_ref & token)
	{
		if (boost::iequals(token, "ascii"))
			return casemapping::ascii;
		if (boost::iequals(token, "strict-rfc1459"))
			return casemapping::strict_rfc1459;
		return casemapping::rfc1459;
	}

	const char * to_string(casemapping map)
	{
		switch (map)
		{
		case casemapping::ascii:
			return "ascii";
		case casemapping::strict_rfc1459:
			return "strict-rfc1459";
		case casemapping::rfc1459:
		default:
			return "rfc1459";
		}
	}
} // namespace ircstate
