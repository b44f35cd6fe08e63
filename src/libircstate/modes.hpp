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

#ifndef LIBIRCSTATE_MODES_HPP
#define LIBIRCSTATE_MODES_HPP

#ifdef _MSC_VER
#pragma once
#endif

#include <string>
#include <vector>
#include <boost/optional.hpp>
#include <boost/utility/string_ref.hpp>

namespace ircstate
{
	class prefix_table;

	namespace modes
	{
		// limit and key only carry an argument when being set
		extern const char default_set_only_argument_modes[];

		struct argument_change
		{
			char letter;
			bool add;
			boost::optional<std::string> argument;
		};

		/* one MODE line broken down. Each list keeps the order in which
		   the letters appeared, +o-o nick applies as two changes */
		struct change_set
		{
			std::vector<char> added;
			std::vector<char> removed;
			std::vector<argument_change> with_argument;

			bool empty() const;
		};

		change_set parse(const boost::string_ref & modes,
			const boost::string_ref & args,
			const prefix_table & prefixes,
			const boost::string_ref & set_only_argument_modes = default_set_only_argument_modes);

		change_set parse(const boost::string_ref & modes,
			const std::vector<std::string> & args,
			const prefix_table & prefixes,
			const boost::string_ref & set_only_argument_modes = default_set_only_argument_modes);
	} // namespace modes
} // namespace ircstate

#endif // LIBIRCSTATE_MODES_HPP
