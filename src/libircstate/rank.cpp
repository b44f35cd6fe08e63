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

#include <boost/optional.hpp>
#include "rank.hpp"

namespace ircstate
{
	namespace
	{
		bool & flag_for(rank_flags & flags, rank r)
		{
			switch (r)
			{
			case rank::owner:
				return flags.owner;
			case rank::admin:
				return flags.admin;
			case rank::op:
				return flags.op;
			case rank::halfop:
				return flags.halfop;
			case rank::voice:
			default:
				return flags.voice;
			}
		}
	}

	rank_flags::rank_flags()
		:voice(),
		halfop(),
		op(),
		admin(),
		owner()
	{}

	bool rank_flags::get(rank r) const LIBIRCSTATE_NOEXCEPT
	{
		return flag_for(const_cast<rank_flags&>(*this), r);
	}

	bool rank_flags::set(rank r, bool value) LIBIRCSTATE_NOEXCEPT
	{
		bool & flag = flag_for(*this, r);
		if (flag == value)
			return false;
		flag = value;
		return true;
	}

	bool rank_flags::any() const LIBIRCSTATE_NOEXCEPT
	{
		return voice || halfop || op || admin || owner;
	}

	boost::optional<rank> rank_flags::highest() const
	{
		if (owner)
			return rank::owner;
		if (admin)
			return rank::admin;
		if (op)
			return rank::op;
		if (halfop)
			return rank::halfop;
		if (voice)
			return rank::voice;
		return boost::none;
	}

	bool operator==(const rank_flags & lhs, const rank_flags & rhs)
	{
		return lhs.voice == rhs.voice &&
			lhs.halfop == rhs.halfop &&
			lhs.op == rhs.op &&
			lhs.admin == rhs.admin &&
			lhs.owner == rhs.owner;
	}

	bool operator!=(const rank_flags & lhs, const rank_flags & rhs)
	{
		return !(lhs == rhs);
	}
} // namespace ircstate
