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

#include <cctype>
#include <cstring>
#include <string>
#include <boost/optional.hpp>
#include <boost/utility/string_ref.hpp>
#include <boost/log/trivial.hpp>
#include "prefix_table.hpp"

namespace ircstate
{
	namespace
	{
		const char standard_letters[] = "qaohv";
		const char standard_glyphs[] = "~&@%+";

		boost::optional<rank> standard_rank(char letter)
		{
			switch (letter)
			{
			case 'q':
				return rank::owner;
			case 'a':
				return rank::admin;
			case 'o':
				return rank::op;
			case 'h':
				return rank::halfop;
			case 'v':
				return rank::voice;
			default:
				return boost::none;
			}
		}

		char standard_letter(rank r)
		{
			switch (r)
			{
			case rank::owner:
				return 'q';
			case rank::admin:
				return 'a';
			case rank::op:
				return 'o';
			case rank::halfop:
				return 'h';
			case rank::voice:
			default:
				return 'v';
			}
		}

		// letters, digits and []\`^_{|} may open a nickname, anything else is a prefix
		bool can_start_nick(char c)
		{
			return std::isalnum(static_cast<unsigned char>(c)) != 0 ||
				std::strchr("[]\\`^_{|}", c) != nullptr;
		}

		char standard_glyph(rank r)
		{
			const std::string letters(standard_letters);
			return standard_glyphs[letters.find(standard_letter(r))];
		}
	}

	const char prefix_table::default_prefix[] = "(qaohv)~&@%+";

	prefix_table::prefix_table()
		:letters_(standard_letters), glyphs_(standard_glyphs), fallback_(true)
	{}

	prefix_table::prefix_table(const boost::string_ref & isupport_prefix)
		:prefix_table()
	{
		if (isupport_prefix.empty())
			return;

		if (isupport_prefix.front() != '(')
		{
			/* bad! some ircds don't give us the modes. */
			/* in this case, we use it only to strip /NAMES */
			if (isupport_prefix.find_first_of("()") == boost::string_ref::npos)
				bare_glyphs_ = isupport_prefix.to_string();
			BOOST_LOG_TRIVIAL(debug) << "PREFIX without modes: " << isupport_prefix;
			return;
		}

		auto close = isupport_prefix.find(')');
		if (close == boost::string_ref::npos)
		{
			BOOST_LOG_TRIVIAL(debug) << "PREFIX missing ')': " << isupport_prefix;
			return;
		}

		auto letters = isupport_prefix.substr(1, close - 1);
		auto glyphs = isupport_prefix.substr(close + 1);
		if (letters.empty() || letters.size() != glyphs.size())
		{
			BOOST_LOG_TRIVIAL(debug) << "PREFIX length mismatch: " << isupport_prefix;
			return;
		}

		letters_ = letters.to_string();
		glyphs_ = glyphs.to_string();
		fallback_ = false;
	}

	boost::optional<rank> prefix_table::rank_of(char letter) const
	{
		if (!is_membership_letter(letter))
			return boost::none;
		auto known = standard_rank(letter);
		if (known)
			return known;
		return rank::voice;
	}

	boost::optional<char> prefix_table::letter_of(rank r) const
	{
		auto canonical = standard_letter(r);
		if (is_membership_letter(canonical))
			return canonical;
		for (auto letter : letters_)
		{
			if (rank_of(letter) == r)
				return letter;
		}
		return boost::none;
	}

	char prefix_table::glyph_of(rank r) const
	{
		auto letter = letter_of(r);
		if (letter)
			return glyphs_[letters_.find(*letter)];
		return standard_glyph(r);
	}

	boost::optional<rank> prefix_table::rank_of_glyph(char glyph) const
	{
		if (glyph == '\0')
			return boost::none;
		auto pos = glyphs_.find(glyph);
		if (pos != std::string::npos)
			return rank_of(letters_[pos]);
		if (bare_glyphs_.find(glyph) != std::string::npos)
			return rank::voice;
		return boost::none;
	}

	bool prefix_table::is_membership_letter(char letter) const
	{
		return letter != '\0' && letters_.find(letter) != std::string::npos;
	}

	bool prefix_table::is_prefix_glyph(char glyph) const
	{
		return static_cast<bool>(rank_of_glyph(glyph));
	}

	prefix_table::names_entry prefix_table::decode(const boost::string_ref & entry) const
	{
		names_entry result;
		boost::string_ref rest = entry;
		while (!rest.empty())
		{
			auto r = rank_of_glyph(rest.front());
			if (!r)
			{
				if (can_start_nick(rest.front()))
					break;
				BOOST_LOG_TRIVIAL(debug) << "unknown NAMES prefix '" << rest.front() << "' taken as voice";
				r = rank::voice;
			}
			result.ranks.set(*r, true);
			rest.remove_prefix(1);
		}

		auto bang = rest.find('!');
		if (bang == boost::string_ref::npos)
		{
			result.nick = rest.to_string();
			return result;
		}

		result.nick = rest.substr(0, bang).to_string();
		auto userhost = rest.substr(bang + 1);
		auto at = userhost.find('@');
		if (at == boost::string_ref::npos)
		{
			result.user = userhost.to_string();
		}
		else
		{
			result.user = userhost.substr(0, at).to_string();
			result.host = userhost.substr(at + 1).to_string();
		}
		return result;
	}

	char prefix_table::prefix_of(const rank_flags & ranks) const
	{
		auto top = ranks.highest();
		if (!top)
			return '\0';
		return glyph_of(*top);
	}
} // namespace ircstate
