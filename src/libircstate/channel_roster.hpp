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

#ifndef LIBIRCSTATE_CHANNEL_ROSTER_HPP
#define LIBIRCSTATE_CHANNEL_ROSTER_HPP

#ifdef _MSC_VER
#pragma once
#endif

#include <chrono>
#include <cstddef>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>
#include <boost/optional.hpp>
#include "identity.hpp"
#include "rank.hpp"

namespace ircstate
{
	struct membership
	{
		using clock = std::chrono::system_clock;
		using time_point = clock::time_point;

		explicit membership(identity_id who);

		identity_id who;
		rank_flags ranks;
		boost::optional<time_point> last_activity;
	};

	/**
	 * The occupants of one joined channel keyed by folded nickname,
	 * together with the channel modes that are not about a member.
	 */
	class channel_roster
	{
	public:
		typedef std::size_t size_type;
		typedef std::unordered_map<std::string, membership> member_map;

	public:
		channel_roster(const std::string & name, const std::string & key);

	public:
		const std::string & name() const { return name_; }
		const std::string & key() const { return key_; }
		void rename(const std::string & name, const std::string & key);

		// (membership, inserted)
		std::pair<membership&, bool> insert(const std::string & nick_key, identity_id who);
		bool erase(const std::string & nick_key);
		// moves a membership to a new key, flags and activity travel with it
		bool rekey(const std::string & old_key, const std::string & new_key);
		membership * find(const std::string & nick_key);
		const membership * find(const std::string & nick_key) const;
		bool contains(const std::string & nick_key) const;
		const member_map & members() const { return members_; }
		// swaps in a re-keyed member table, any open snapshot is dropped
		void reset_members(member_map && members);

		size_type total() const { return members_.size(); }
		size_type count(rank r) const;

		/* channel modes */
		const boost::optional<std::string> & channel_key() const { return channel_key_; }
		void channel_key(const boost::optional<std::string> & key) { channel_key_ = key; }
		const boost::optional<unsigned long> & limit() const { return limit_; }
		void limit(const boost::optional<unsigned long> & limit) { limit_ = limit; }
		// argument-less modes currently set, e.g. "nt"
		const std::string & flags() const { return flags_; }
		bool set_flag(char mode, bool on);

		/* NAMES snapshot */
		void begin_names();
		bool in_names() const;
		void mark_seen(const std::string & nick_key);
		// ends the snapshot and returns the keys that were not seen
		std::vector<std::string> end_names();

	private:
		std::string name_;
		std::string key_;
		member_map members_;
		boost::optional<std::string> channel_key_;
		boost::optional<unsigned long> limit_;
		std::string flags_;
		boost::optional<std::unordered_set<std::string> > seen_;
	};
} // namespace ircstate

#endif // LIBIRCSTATE_CHANNEL_ROSTER_HPP
