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

#include <algorithm>
#include <deque>
#include <string>
#include <vector>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/utility/string_ref.hpp>
#include "modes.hpp"
#include "prefix_table.hpp"

namespace ircstate
{
	namespace modes
	{
		const char default_set_only_argument_modes[] = "kl";

		bool change_set::empty() const
		{
			return added.empty() && removed.empty() && with_argument.empty();
		}

		change_set parse(const boost::string_ref & modes,
			const boost::string_ref & args,
			const prefix_table & prefixes,
			const boost::string_ref & set_only_argument_modes)
		{
			std::vector<std::string> words;
			if (!args.empty())
			{
				boost::split(words, args, boost::is_space(), boost::token_compress_on);
				// leading or trailing blanks leave empty tokens behind
				words.erase(
					std::remove(words.begin(), words.end(), std::string()),
					words.end());
			}
			return parse(modes, words, prefixes, set_only_argument_modes);
		}

		change_set parse(const boost::string_ref & modes,
			const std::vector<std::string> & args,
			const prefix_table & prefixes,
			const boost::string_ref & set_only_argument_modes)
		{
			change_set result;
			std::deque<std::string> remaining(args.cbegin(), args.cend());
			bool adding = true;

			for (auto mode : modes)
			{
				switch (mode)
				{
				case '+':
					adding = true;
					continue;
				case '-':
					adding = false;
					continue;
				case ' ':
				case ':':
					continue;
				default:
					break;
				}

				const bool takes_argument = prefixes.is_membership_letter(mode) ||
					(adding && set_only_argument_modes.find(mode) != boost::string_ref::npos);
				const bool channel_argument_mode = !prefixes.is_membership_letter(mode) &&
					set_only_argument_modes.find(mode) != boost::string_ref::npos;

				if (takes_argument)
				{
					argument_change change{ mode, adding, boost::none };
					if (!remaining.empty())
					{
						change.argument = remaining.front();
						remaining.pop_front();
					}
					result.with_argument.push_back(change);
				}
				else if (channel_argument_mode)
				{
					// -k / -l clear the channel value, no argument is consumed
					result.with_argument.push_back(argument_change{ mode, adding, boost::none });
				}
				else if (adding)
				{
					result.added.push_back(mode);
				}
				else
				{
					result.removed.push_back(mode);
				}
			}
			return result;
		}
	} // namespace modes
} // namespace ircstate
