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

#ifndef LIBIRCSTATE_ERRORS_HPP
#define LIBIRCSTATE_ERRORS_HPP

#ifdef _MSC_VER
#pragma once
#endif

#include <stdexcept>
#include <string>

namespace ircstate
{
	// base for every error the state layer reports to its caller
	class state_error : public std::runtime_error
	{
	public:
		explicit state_error(const std::string & what)
			:std::runtime_error(what)
		{}
	};

	/* the registry has never seen this nick, the caller is out of sync
	   with the protocol decoder */
	class unknown_identity : public state_error
	{
		std::string nick_;
	public:
		explicit unknown_identity(const std::string & nick)
			:state_error("unknown identity: " + nick), nick_(nick)
		{}

		const std::string & nick() const { return nick_; }
	};

	// a rename would fold onto a key owned by a different identity
	class nick_collision : public state_error
	{
		std::string nick_;
	public:
		explicit nick_collision(const std::string & nick)
			:state_error("nick already in use by another identity: " + nick), nick_(nick)
		{}

		const std::string & nick() const { return nick_; }
	};
} // namespace ircstate

#endif // LIBIRCSTATE_ERRORS_HPP
