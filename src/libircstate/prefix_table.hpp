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

#ifndef LIBIRCSTATE_PREFIX_TABLE_HPP
#define LIBIRCSTATE_PREFIX_TABLE_HPP

#ifdef _MSC_VER
#pragma once
#endif

#include <string>
#include <boost/optional.hpp>
#include <boost/utility/string_ref_fwd.hpp>
#include "rank.hpp"

namespace ircstate
{
	/**
	 * Pairs the membership mode letters of a network with the glyphs it
	 * puts in front of nicknames, as announced by ISUPPORT PREFIX=(ohv)@%+
	 *
	 * Letters outside q/a/o/h/v are accepted and ranked as voice so that
	 * nonstandard networks still get a usable userlist.
	 */
	class prefix_table
	{
	public:
		// one token of a RPL_NAMREPLY
		struct names_entry
		{
			rank_flags ranks;
			std::string nick;
			boost::optional<std::string> user;
			boost::optional<std::string> host;
		};

		static const char default_prefix[];

	public:
		prefix_table();
		explicit prefix_table(const boost::string_ref & isupport_prefix);

	public:
		boost::optional<rank> rank_of(char letter) const;
		boost::optional<char> letter_of(rank r) const;
		char glyph_of(rank r) const;
		boost::optional<rank> rank_of_glyph(char glyph) const;

		bool is_membership_letter(char letter) const;
		bool is_prefix_glyph(char glyph) const;

		/* strips every leading prefix glyph (multi-prefix) and splits
		   nick!user@host (userhost-in-names). A leading character that
		   cannot open a nickname but is not in the table counts as voice */
		names_entry decode(const boost::string_ref & entry) const;

		// glyph of the highest rank held or '\0'
		char prefix_of(const rank_flags & ranks) const;

		const std::string & letters() const { return letters_; }
		const std::string & glyphs() const { return glyphs_; }
		// true when the announced value was unusable and the default is in effect
		bool fallback() const { return fallback_; }

	private:
		std::string letters_;
		std::string glyphs_;
		// glyphs from a PREFIX= without (modes), the letter is unknown
		std::string bare_glyphs_;
		bool fallback_;
	};
} // namespace ircstate

#endif // LIBIRCSTATE_PREFIX_TABLE_HPP
