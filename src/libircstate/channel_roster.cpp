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
#include <string>
#include <utility>
#include <vector>
#include "channel_roster.hpp"

namespace ircstate
{
	membership::membership(identity_id who)
		:who(who)
	{}

	channel_roster::channel_roster(const std::string & name, const std::string & key)
		:name_(name), key_(key)
	{}

	void channel_roster::rename(const std::string & name, const std::string & key)
	{
		name_ = name;
		key_ = key;
	}

	std::pair<membership&, bool> channel_roster::insert(const std::string & nick_key, identity_id who)
	{
		auto result = members_.emplace(nick_key, membership(who));
		return std::pair<membership&, bool>(result.first->second, result.second);
	}

	bool channel_roster::erase(const std::string & nick_key)
	{
		if (seen_)
			seen_->erase(nick_key);
		return members_.erase(nick_key) != 0;
	}

	bool channel_roster::rekey(const std::string & old_key, const std::string & new_key)
	{
		auto existing = members_.find(old_key);
		if (existing == members_.end())
			return false;
		if (old_key == new_key)
			return true;

		membership moved = existing->second;
		auto inserted = members_.emplace(new_key, moved);
		if (!inserted.second)
			return false;
		members_.erase(old_key);

		if (seen_ && seen_->erase(old_key))
			seen_->insert(new_key);
		return true;
	}

	membership * channel_roster::find(const std::string & nick_key)
	{
		auto existing = members_.find(nick_key);
		if (existing == members_.end())
			return nullptr;
		return &existing->second;
	}

	const membership * channel_roster::find(const std::string & nick_key) const
	{
		auto existing = members_.find(nick_key);
		if (existing == members_.end())
			return nullptr;
		return &existing->second;
	}

	bool channel_roster::contains(const std::string & nick_key) const
	{
		return members_.count(nick_key) != 0;
	}

	void channel_roster::reset_members(member_map && members)
	{
		members_ = std::move(members);
		seen_ = boost::none;
	}

	channel_roster::size_type channel_roster::count(rank r) const
	{
		return std::count_if(members_.cbegin(), members_.cend(),
			[r](const member_map::value_type & entry){
				return entry.second.ranks.get(r);
			});
	}

	bool channel_roster::set_flag(char mode, bool on)
	{
		auto pos = flags_.find(mode);
		if (on)
		{
			if (pos != std::string::npos)
				return false;
			flags_.push_back(mode);
			return true;
		}
		if (pos == std::string::npos)
			return false;
		flags_.erase(pos, 1);
		return true;
	}

	void channel_roster::begin_names()
	{
		seen_ = std::unordered_set<std::string>();
	}

	bool channel_roster::in_names() const
	{
		return static_cast<bool>(seen_);
	}

	void channel_roster::mark_seen(const std::string & nick_key)
	{
		if (!seen_)
			begin_names();
		seen_->insert(nick_key);
	}

	std::vector<std::string> channel_roster::end_names()
	{
		std::vector<std::string> stale;
		if (!seen_)
			return stale;

		for (const auto & entry : members_)
		{
			if (!seen_->count(entry.first))
				stale.push_back(entry.first);
		}
		seen_ = boost::none;
		return stale;
	}
} // namespace ircstate
