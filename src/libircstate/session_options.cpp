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

#include <string>
#include <boost/utility/string_ref.hpp>
#include "modes.hpp"
#include "prefix_table.hpp"
#include "session_options.hpp"

namespace ircstate
{
	namespace
	{
		const char default_chantypes[] = "#&";
	}

	session_options::session_options()
		:prefix(prefix_table::default_prefix),
		mapping(casemapping::rfc1459),
		chantypes(default_chantypes),
		set_only_argument_modes(modes::default_set_only_argument_modes)
	{}

	session_options session_options::from_isupport(const boost::string_ref & prefix,
		const boost::string_ref & casemapping_token,
		const boost::string_ref & chantypes)
	{
		session_options options;
		if (!prefix.empty())
			options.prefix = prefix.to_string();
		options.mapping = casemapping_from_token(casemapping_token);
		if (!chantypes.empty())
			options.chantypes = chantypes.to_string();
		return options;
	}
} // namespace ircstate
