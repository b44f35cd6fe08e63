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

#ifndef LIBIRCSTATE_SESSION_OPTIONS_HPP
#define LIBIRCSTATE_SESSION_OPTIONS_HPP

#ifdef _MSC_VER
#pragma once
#endif

#include <string>
#include <boost/utility/string_ref_fwd.hpp>
#include "casemap.hpp"

namespace ircstate
{
	/* per connection settings, normally filled in from the 005 numeric
	   by whoever negotiates ISUPPORT */
	struct session_options
	{
		session_options();

		std::string nick;				/* our own nick */
		std::string prefix;				/* PREFIX= value, e.g. "(ohv)@%+" */
		casemapping mapping;			/* CASEMAPPING= */
		std::string chantypes;			/* CHANTYPES=, e.g. "#&" */
		std::string set_only_argument_modes;	/* modes with an argument only when set */

		static session_options from_isupport(const boost::string_ref & prefix,
			const boost::string_ref & casemapping_token,
			const boost::string_ref & chantypes);
	};
} // namespace ircstate

#endif // LIBIRCSTATE_SESSION_OPTIONS_HPP
