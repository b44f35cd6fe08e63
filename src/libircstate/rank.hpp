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

#ifndef LIBIRCSTATE_RANK_HPP
#define LIBIRCSTATE_RANK_HPP

#ifdef _MSC_VER
#pragma once
#endif

#include <boost/optional/optional_fwd.hpp>
#include "config.hpp"

namespace ircstate
{
	// ordered lowest to highest
	enum class rank
	{
		voice,
		halfop,
		op,
		admin,
		owner
	};

	/* a network may grant several of these at once (+ov), so they are kept
	   as independent flags rather than a single level */
	struct rank_flags
	{
		rank_flags();

		bool voice;
		bool halfop;
		bool op;
		bool admin;
		bool owner;

		bool get(rank r) const LIBIRCSTATE_NOEXCEPT;
		// returns true if the flag actually changed
		bool set(rank r, bool value) LIBIRCSTATE_NOEXCEPT;
		bool any() const LIBIRCSTATE_NOEXCEPT;
		boost::optional<rank> highest() const;
	};

	bool operator==(const rank_flags & lhs, const rank_flags & rhs);
	bool operator!=(const rank_flags & lhs, const rank_flags & rhs);
} // namespace ircstate

#endif // LIBIRCSTATE_RANK_HPP
