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

#ifndef LIBIRCSTATE_CASEMAP_HPP
#define LIBIRCSTATE_CASEMAP_HPP

#ifdef _MSC_VER
#pragma once
#endif

#include <string>
#include <boost/utility/string_ref_fwd.hpp>
#include "config.hpp"

namespace ircstate
{
	/* the CASEMAPPING= families we know how to fold.
	   rfc1459        A-Z[]\^ -> a-z{}|~
	   strict_rfc1459 A-Z[]\  -> a-z{}|
	   ascii          A-Z     -> a-z */
	enum class casemapping
	{
		ascii,
		rfc1459,
		strict_rfc1459
	};

	char fold_char(char c, casemapping map) LIBIRCSTATE_NOEXCEPT;
	std::string fold(const boost::string_ref & raw, casemapping map);

	// unrecognised tokens get rfc1459, the protocol default
	casemapping casemapping_from_token(const boost::string_ref & token);
	const char * to_string(casemapping map);
} // namespace ircstate

#endif // LIBIRCSTATE_CASEMAP_HPP
