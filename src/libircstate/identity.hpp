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

#ifndef LIBIRCSTATE_IDENTITY_HPP
#define LIBIRCSTATE_IDENTITY_HPP

#ifdef _MSC_VER
#pragma once
#endif

#include <cstdint>
#include <set>
#include <string>
#include <boost/optional.hpp>

namespace ircstate
{
	typedef std::uint64_t identity_id;

	// what a JOIN, WHO or WHOIS told us about someone, unset means unknown
	struct identity_attributes
	{
		boost::optional<std::string> login;
		boost::optional<std::string> host;
		boost::optional<std::string> realname;
		boost::optional<std::string> info;
		boost::optional<std::string> account;
	};

	/* one per nickname known on the connection, shared by every channel
	   the nick is on */
	struct identity
	{
		identity_id id;
		std::string key;	/* folded nick, the registry key */
		std::string nick;	/* as last seen */
		boost::optional<std::string> login;
		boost::optional<std::string> host;
		boost::optional<std::string> realname;
		boost::optional<std::string> info;
		boost::optional<std::string> account;
		bool away;
		std::set<std::string> channels;	/* folded names of the rosters holding us */
	};
} // namespace ircstate

#endif // LIBIRCSTATE_IDENTITY_HPP
