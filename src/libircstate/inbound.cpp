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
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <string>
#include <vector>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/format.hpp>
#include <boost/log/trivial.hpp>
#include <boost/optional.hpp>
#include <boost/utility/string_ref.hpp>
#include "errors.hpp"
#include "event.hpp"
#include "inbound.hpp"
#include "session.hpp"

namespace ircstate
{
	namespace inbound
	{
		namespace
		{
			bool malformed(const event & ev, std::size_t needed)
			{
				if (ev.params.size() >= needed)
					return false;
				BOOST_LOG_TRIVIAL(debug) << boost::format("%s with %u parameters, need %u")
					% ev.command % ev.params.size() % needed;
				return true;
			}

			const std::string & channel_of(const event & ev)
			{
				return ev.target_channel ? *ev.target_channel : ev.params[0];
			}

			boost::optional<std::string> account_value(const std::string & raw)
			{
				if (raw.empty() || raw == "*")
					return boost::none;
				return raw;
			}

			boost::optional<std::string> non_empty(const std::string & raw)
			{
				if (raw.empty())
					return boost::none;
				return raw;
			}

			/* trailing "hopcount realname" of a WHO reply */
			boost::optional<std::string> who_realname(const std::string & trailing)
			{
				auto space = trailing.find(' ');
				if (space == std::string::npos)
					return boost::none;
				return non_empty(trailing.substr(space + 1));
			}

			bool is_numeric(const std::string & command)
			{
				return command.size() == 3 && std::all_of(command.cbegin(), command.cend(),
					[](char c){ return std::isdigit(static_cast<unsigned char>(c)) != 0; });
			}

			std::vector<std::string> tail(const event & ev, std::size_t from)
			{
				if (ev.params.size() <= from)
					return std::vector<std::string>();
				return std::vector<std::string>(ev.params.cbegin() + from, ev.params.cend());
			}

			bool process_numeric(session & sess, int n, const event & ev)
			{
				switch (n)
				{
				case 1:	/* RPL_WELCOME, the server tells us who we are */
					if (malformed(ev, 1))
						return false;
					sess.set_nick(ev.params[0]);
					return true;

				case 311:	/* WHOIS 1st line */
				{
					// me nick user host * :realname
					if (malformed(ev, 6))
						return false;
					identity_attributes attrs;
					attrs.login = non_empty(ev.params[2]);
					attrs.host = non_empty(ev.params[3]);
					attrs.realname = non_empty(ev.params[5]);
					sess.update_user(ev.params[1], attrs, true);
					return true;
				}

				case 324:	/* RPL_CHANNELMODEIS */
					if (malformed(ev, 3))
						return false;
					sess.set_channel_modes(ev.params[1], ev.params[2], tail(ev, 3));
					return true;

				case 352:	/* WHO */
				{
					// me #chan user host server nick flags :hops realname
					if (malformed(ev, 7))
						return false;
					const std::string & nick = ev.params[5];
					identity_attributes attrs;
					attrs.login = non_empty(ev.params[2]);
					attrs.host = non_empty(ev.params[3]);
					if (ev.params.size() > 7)
						attrs.realname = who_realname(ev.params[7]);
					sess.update_user(nick, attrs, true);
					if (!ev.params[6].empty())
						sess.set_away(nick, ev.params[6][0] == 'G');
					return true;
				}

				case 353:	/* NAMES */
				{
					// me [=*@] #chan :names, the type token is optional on old servers
					if (malformed(ev, 3))
						return false;
					const std::string & channel = ev.params[ev.params.size() - 2];
					std::vector<std::string> names;
					boost::split(names, ev.params.back(), boost::is_space(), boost::token_compress_on);
					for (const auto & name : names)
					{
						if (!name.empty())
							sess.names_entry(channel, name);
					}
					return true;
				}

				case 366:	/* RPL_ENDOFNAMES */
					if (malformed(ev, 2))
						return false;
					sess.names_end(ev.params[1]);
					return true;

				default:
					return false;
				}
			}

			bool process_named(session & sess, const event & ev)
			{
				const std::string & command = ev.command;
				const std::string & nick = ev.source_nick;

				if (boost::iequals(command, "JOIN"))
				{
					if (!ev.target_channel && malformed(ev, 1))
						return false;
					identity_attributes attrs;
					attrs.login = non_empty(ev.source_user);
					attrs.host = non_empty(ev.source_host);
					// extended-join: #chan account :realname
					if (ev.params.size() >= 3)
					{
						attrs.account = account_value(ev.params[1]);
						attrs.realname = non_empty(ev.params[2]);
					}
					sess.join(channel_of(ev), nick, attrs);
					return true;
				}
				if (boost::iequals(command, "PART"))
				{
					if (!ev.target_channel && malformed(ev, 1))
						return false;
					sess.part(channel_of(ev), nick);
					return true;
				}
				if (boost::iequals(command, "KICK"))
				{
					if (malformed(ev, 2))
						return false;
					sess.kick(channel_of(ev), ev.params[1]);
					return true;
				}
				if (boost::iequals(command, "QUIT"))
				{
					sess.quit(nick);
					return true;
				}
				if (boost::iequals(command, "NICK"))
				{
					if (malformed(ev, 1))
						return false;
					if (!sess.identity_of(nick) && !sess.is_me(nick))
					{
						BOOST_LOG_TRIVIAL(debug) << "NICK from unknown " << nick;
						return false;
					}
					try
					{
						sess.rename(nick, ev.params[0]);
					}
					catch (const state_error & e)
					{
						BOOST_LOG_TRIVIAL(warning) << e.what();
						return false;
					}
					return true;
				}
				if (boost::iequals(command, "MODE"))
				{
					if (malformed(ev, 2))
						return false;
					sess.apply_modes(ev.params[0], ev.params[1], tail(ev, 2));
					return true;
				}
				if (boost::iequals(command, "AWAY"))
				{
					sess.set_away(nick, !ev.params.empty() && !ev.params[0].empty());
					return true;
				}
				if (boost::iequals(command, "ACCOUNT"))
				{
					if (malformed(ev, 1))
						return false;
					sess.set_account(nick, account_value(ev.params[0]));
					return true;
				}
				if (boost::iequals(command, "CHGHOST"))
				{
					if (malformed(ev, 2))
						return false;
					identity_attributes attrs;
					attrs.login = non_empty(ev.params[0]);
					attrs.host = non_empty(ev.params[1]);
					sess.update_user(nick, attrs, true);
					return true;
				}
				if (boost::iequals(command, "PRIVMSG") || boost::iequals(command, "NOTICE"))
				{
					if (!ev.target_channel && malformed(ev, 1))
						return false;
					const std::string & target = channel_of(ev);
					if (!sess.is_channel_name(target))
						return false;
					sess.touch(target, nick, std::chrono::system_clock::now());
					return true;
				}
				return false;
			}
		}

		bool handle_event(session & sess, const event & ev)
		{
			if (is_numeric(ev.command))
				return process_numeric(sess, std::atoi(ev.command.c_str()), ev);

			if (ev.source_nick.empty())
			{
				BOOST_LOG_TRIVIAL(debug) << ev.command << " without a source";
				return false;
			}
			if (!process_named(sess, ev))
			{
				BOOST_LOG_TRIVIAL(trace) << "ignoring " << ev.command;
				return false;
			}
			return true;
		}
	} // namespace inbound
} // namespace ircstate
