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

#ifndef LIBIRCSTATE_SESSION_HPP
#define LIBIRCSTATE_SESSION_HPP

#ifdef _MSC_VER
#pragma once
#endif

#include <chrono>
#include <cstddef>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include <boost/optional.hpp>
#include <boost/signals2.hpp>
#include <boost/utility/string_ref_fwd.hpp>
#include "casemap.hpp"
#include "identity.hpp"
#include "prefix_table.hpp"
#include "rank.hpp"
#include "session_options.hpp"

namespace ircstate
{
	struct membership_change
	{
		enum class kind
		{
			roster_created,
			roster_destroyed,
			joined,
			parted,
			kicked,
			quit,
			renamed,
			ranks_changed,
			user_changed,
			activity,
			channel_modes_changed,
			names_synced,
			roster_rebuilt
		};

		kind what;
		std::string channel;	/* display name of the affected channel */
		std::string nick;
		std::string old_nick;	/* renamed only */
	};

	// copy of one roster entry joined with its identity
	struct member
	{
		using time_point = std::chrono::system_clock::time_point;

		std::string nick;
		boost::optional<std::string> login;
		boost::optional<std::string> host;
		boost::optional<std::string> realname;
		boost::optional<std::string> account;
		bool away;
		rank_flags ranks;
		char prefix;	/* highest rank glyph or '\0' */
		boost::optional<time_point> last_activity;
	};

	struct channel_state
	{
		std::string name;
		boost::optional<std::string> key;
		boost::optional<unsigned long> limit;
		std::string flags;
		std::size_t total;
		std::size_t owners;
		std::size_t admins;
		std::size_t ops;
		std::size_t halfops;
		std::size_t voices;
		bool syncing;	/* a NAMES snapshot is open */
	};

	/**
	 * Everything one IRC connection knows about who is where.
	 *
	 * Events must be fed from a single thread, in the order the server sent
	 * them. Queries may come from any thread and return copies. on_change
	 * fires after the state lock has been released, so slots may query.
	 */
	class session
	{
		session(const session&) = delete;
		session& operator=(const session&) = delete;

		class session_impl;
		std::unique_ptr<session_impl> impl_;

		template<class Mutation>
		void mutate(Mutation && mutation);

	public:
		using time_point = std::chrono::system_clock::time_point;

		explicit session(const session_options & options = session_options());
		~session();

	public:
		/* configuration */
		void set_nick(const boost::string_ref & nick);
		void set_prefix(const boost::string_ref & isupport_prefix);
		// full re-key of every identity and roster
		void set_casemapping(casemapping map);

	public:
		/* events */
		void join(const boost::string_ref & channel, const boost::string_ref & nick,
			const identity_attributes & attrs = identity_attributes());
		void part(const boost::string_ref & channel, const boost::string_ref & nick);
		void kick(const boost::string_ref & channel, const boost::string_ref & nick);
		void quit(const boost::string_ref & nick);
		// throws unknown_identity if old_nick was never seen
		void rename(const boost::string_ref & old_nick, const boost::string_ref & new_nick);
		void apply_modes(const boost::string_ref & channel, const boost::string_ref & modes,
			const std::vector<std::string> & args);
		// RPL_CHANNELMODEIS, replaces the channel modes instead of amending them
		void set_channel_modes(const boost::string_ref & channel, const boost::string_ref & modes,
			const std::vector<std::string> & args);
		void names_begin(const boost::string_ref & channel);
		void names_entry(const boost::string_ref & channel, const boost::string_ref & entry);
		void names_end(const boost::string_ref & channel);
		void touch(const boost::string_ref & channel, const boost::string_ref & nick, time_point when);
		void set_away(const boost::string_ref & nick, bool away);
		void set_account(const boost::string_ref & nick, const boost::optional<std::string> & account);
		void update_user(const boost::string_ref & nick, const identity_attributes & attrs, bool overwrite = false);
		// forget everything, e.g. on disconnect
		void clear();

	public:
		/* queries */
		std::string nick() const;
		casemapping mapping() const;
		prefix_table prefixes() const;
		bool is_channel_name(const boost::string_ref & name) const;
		bool is_me(const boost::string_ref & nick) const;

		std::vector<member> members_of(const boost::string_ref & channel) const;
		boost::optional<channel_state> channel_info(const boost::string_ref & channel) const;
		std::vector<std::string> channels() const;
		boost::optional<identity> identity_of(const boost::string_ref & nick) const;
		std::set<std::string> all_nicks() const;

		bool has_rank(const boost::string_ref & channel, const boost::string_ref & nick, rank r) const;
		bool is_voice(const boost::string_ref & channel, const boost::string_ref & nick) const;
		bool is_halfop(const boost::string_ref & channel, const boost::string_ref & nick) const;
		bool is_op(const boost::string_ref & channel, const boost::string_ref & nick) const;
		bool is_admin(const boost::string_ref & channel, const boost::string_ref & nick) const;
		bool is_owner(const boost::string_ref & channel, const boost::string_ref & nick) const;
		bool is_on(const boost::string_ref & channel, const boost::string_ref & nick) const;

		/* walks every identity and roster and reports whether each
		   identity's channel set matches the rosters that hold it */
		bool consistent() const;

	public:
		boost::signals2::signal<void(const membership_change &)> on_change;
	};
} // namespace ircstate

#endif // LIBIRCSTATE_SESSION_HPP
