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
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <boost/log/trivial.hpp>
#include <boost/utility/string_ref.hpp>
#include "errors.hpp"
#include "identity_registry.hpp"

namespace ircstate
{
	namespace
	{
		bool merge_field(boost::optional<std::string> & field,
			const boost::optional<std::string> & value, bool overwrite)
		{
			if (!value || value->empty())
				return false;
			if (field == value)
				return false;
			if (field && !field->empty() && !overwrite)
				return false;
			field = value;
			return true;
		}

		bool merge(identity & who, const identity_attributes & attrs, bool overwrite)
		{
			bool changed = false;
			changed |= merge_field(who.login, attrs.login, overwrite);
			changed |= merge_field(who.host, attrs.host, overwrite);
			changed |= merge_field(who.realname, attrs.realname, overwrite);
			changed |= merge_field(who.info, attrs.info, overwrite);
			changed |= merge_field(who.account, attrs.account, overwrite);
			return changed;
		}
	}

	identity_registry::identity_registry(casemapping map)
		:map_(map), next_id_(1)
	{}

	identity_registry::~identity_registry()
	{}

	identity_registry::acquire_result identity_registry::get_or_create(
		const boost::string_ref & nick,
		const std::string & channel_key,
		const identity_attributes & attrs)
	{
		auto key = key_for(nick);
		auto existing = by_key_.find(key);
		if (existing != by_key_.end())
		{
			identity & who = *by_id_.at(existing->second);
			bool changed = merge(who, attrs, false);
			if (who.nick != nick)
			{
				who.nick = nick.to_string();
				changed = true;
			}
			who.channels.insert(channel_key);
			return acquire_result{ who, false, changed };
		}

		std::unique_ptr<identity> fresh(new identity());
		fresh->id = next_id_;
		fresh->key = key;
		fresh->nick = nick.to_string();
		fresh->away = false;
		merge(*fresh, attrs, true);
		fresh->channels.insert(channel_key);

		identity & who = *fresh;
		by_key_.emplace(key, fresh->id);
		try
		{
			by_id_.emplace(fresh->id, std::move(fresh));
		}
		catch (...)
		{
			by_key_.erase(key);
			throw;
		}
		++next_id_;
		return acquire_result{ who, true, false };
	}

	bool identity_registry::update(const boost::string_ref & nick, const identity_attributes & attrs, bool overwrite)
	{
		auto who = find(nick);
		if (!who)
			return false;
		return merge(*who, attrs, overwrite);
	}

	identity & identity_registry::rename(const boost::string_ref & old_nick, const boost::string_ref & new_nick)
	{
		auto old_key = key_for(old_nick);
		auto existing = by_key_.find(old_key);
		if (existing == by_key_.end())
			throw unknown_identity(old_nick.to_string());

		identity & who = *by_id_.at(existing->second);
		auto new_key = key_for(new_nick);
		if (new_key == old_key)
		{
			// only the case changed
			who.nick = new_nick.to_string();
			return who;
		}

		if (by_key_.count(new_key))
			throw nick_collision(new_nick.to_string());

		std::string display = new_nick.to_string();
		// the insert is the only step that can throw, the rest commits
		by_key_.emplace(new_key, who.id);
		by_key_.erase(old_key);
		who.key.swap(new_key);
		who.nick.swap(display);
		return who;
	}

	bool identity_registry::release(const boost::string_ref & nick, const std::string & channel_key)
	{
		auto existing = by_key_.find(key_for(nick));
		if (existing == by_key_.end())
			return false;

		auto id = existing->second;
		identity & who = *by_id_.at(id);
		if (!who.channels.erase(channel_key))
			return false;
		if (!who.channels.empty())
			return false;

		BOOST_LOG_TRIVIAL(trace) << "identity " << who.nick << " has no channels left";
		by_key_.erase(existing);
		by_id_.erase(id);
		return true;
	}

	bool identity_registry::erase(identity_id id)
	{
		auto existing = by_id_.find(id);
		if (existing == by_id_.end())
			return false;
		by_key_.erase(existing->second->key);
		by_id_.erase(existing);
		return true;
	}

	identity * identity_registry::find(const boost::string_ref & nick)
	{
		return const_cast<identity *>(
			const_cast<const identity_registry&>(*this).find(nick));
	}

	const identity * identity_registry::find(const boost::string_ref & nick) const
	{
		auto existing = by_key_.find(key_for(nick));
		if (existing == by_key_.end())
			return nullptr;
		return find(existing->second);
	}

	identity * identity_registry::find(identity_id id)
	{
		return const_cast<identity *>(
			const_cast<const identity_registry&>(*this).find(id));
	}

	const identity * identity_registry::find(identity_id id) const
	{
		auto existing = by_id_.find(id);
		if (existing == by_id_.end())
			return nullptr;
		return existing->second.get();
	}

	std::set<std::string> identity_registry::all_nicks() const
	{
		std::set<std::string> nicks;
		for (const auto & entry : by_id_)
			nicks.insert(entry.second->nick);
		return nicks;
	}

	std::vector<const identity *> identity_registry::identities() const
	{
		std::vector<const identity *> all;
		all.reserve(by_id_.size());
		for (const auto & entry : by_id_)
			all.push_back(entry.second.get());
		std::sort(all.begin(), all.end(), [](const identity * a, const identity * b){
			return a->id < b->id;
		});
		return all;
	}

	identity_registry::size_type identity_registry::size() const
	{
		return by_id_.size();
	}

	bool identity_registry::empty() const
	{
		return by_id_.empty();
	}

	void identity_registry::clear()
	{
		by_key_.clear();
		by_id_.clear();
	}

	identity_registry::merge_list identity_registry::rebuild(casemapping map)
	{
		merge_list merged;
		std::unordered_map<std::string, identity_id> rekeyed;

		// oldest first so the survivor of a collapse is deterministic
		std::map<identity_id, identity *> ordered;
		for (auto & entry : by_id_)
			ordered.emplace(entry.first, entry.second.get());

		for (auto & entry : ordered)
		{
			identity & who = *entry.second;
			auto key = fold(who.nick, map);
			auto taken = rekeyed.find(key);
			if (taken == rekeyed.end())
			{
				rekeyed.emplace(key, who.id);
				who.key = key;
				continue;
			}

			identity & survivor = *by_id_.at(taken->second);
			BOOST_LOG_TRIVIAL(debug) << "casemapping change folds " << who.nick
				<< " onto " << survivor.nick;
			survivor.channels.insert(who.channels.cbegin(), who.channels.cend());
			merge(survivor, identity_attributes{ who.login, who.host, who.realname, who.info, who.account }, false);
			merged.emplace_back(who.id, survivor.id);
		}

		for (const auto & pair : merged)
			by_id_.erase(pair.first);
		by_key_.swap(rekeyed);
		map_ = map;
		return merged;
	}

	std::string identity_registry::key_for(const boost::string_ref & nick) const
	{
		return fold(nick, map_);
	}
} // namespace ircstate
