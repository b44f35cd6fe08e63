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
#include <set>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <boost/log/trivial.hpp>
#include <boost/thread/locks.hpp>
#include <boost/thread/shared_mutex.hpp>
#include <boost/utility/string_ref.hpp>
#include "channel_roster.hpp"
#include "errors.hpp"
#include "identity_registry.hpp"
#include "modes.hpp"
#include "session.hpp"

namespace ircstate
{
	namespace
	{
		typedef membership_change::kind change_kind;

		bool parse_limit(const std::string & text, unsigned long & limit)
		{
			if (text.empty() || !std::all_of(text.cbegin(), text.cend(),
				[](char c){ return std::isdigit(static_cast<unsigned char>(c)) != 0; }))
				return false;
			try
			{
				limit = std::stoul(text);
			}
			catch (const std::out_of_range &)
			{
				return false;
			}
			return true;
		}
	}

	class session::session_impl
	{
	public:
		typedef std::unordered_map<std::string, channel_roster> roster_map;

		explicit session_impl(const session_options & options)
			:options(options), prefixes(options.prefix), registry(options.mapping)
		{}

		mutable boost::shared_mutex mutex;
		session_options options;
		prefix_table prefixes;
		identity_registry registry;
		roster_map rosters;
		std::vector<membership_change> pending;

	public:
		std::string fold(const boost::string_ref & raw) const
		{
			return ircstate::fold(raw, options.mapping);
		}

		bool is_me(const boost::string_ref & nick) const
		{
			return !options.nick.empty() && fold(nick) == fold(options.nick);
		}

		bool is_channel_name(const boost::string_ref & name) const
		{
			return !name.empty() && options.chantypes.find(name.front()) != std::string::npos;
		}

		channel_roster * find_roster(const boost::string_ref & channel)
		{
			auto existing = rosters.find(fold(channel));
			if (existing == rosters.end())
				return nullptr;
			return &existing->second;
		}

		const channel_roster * find_roster(const boost::string_ref & channel) const
		{
			auto existing = rosters.find(fold(channel));
			if (existing == rosters.end())
				return nullptr;
			return &existing->second;
		}

		const membership * find_member(const boost::string_ref & channel, const boost::string_ref & nick) const
		{
			auto roster = find_roster(channel);
			if (!roster)
				return nullptr;
			return roster->find(fold(nick));
		}

		void notify(change_kind what, const channel_roster & roster,
			const std::string & nick, const std::string & old_nick = std::string())
		{
			pending.push_back(membership_change{ what, roster.name(), nick, old_nick });
		}

		void fan_out(const identity & who, change_kind what)
		{
			for (const auto & channel_key : who.channels)
			{
				auto roster = rosters.find(channel_key);
				if (roster != rosters.end())
					notify(what, roster->second, who.nick);
			}
		}

		/* puts a nick on a roster that does not hold it yet. The identity
		   reference is taken first and given back if the roster insert fails */
		membership & admit(channel_roster & roster, const boost::string_ref & nick,
			const identity_attributes & attrs)
		{
			auto acquired = registry.get_or_create(nick, roster.key(), attrs);
			try
			{
				membership & added = roster.insert(acquired.who.key, acquired.who.id).first;
				notify(change_kind::joined, roster, acquired.who.nick);
				if (acquired.changed)
					fan_out(acquired.who, change_kind::user_changed);
				return added;
			}
			catch (...)
			{
				registry.release(nick, roster.key());
				throw;
			}
		}

		void remove_member(channel_roster & roster, const std::string & nick_key, change_kind what)
		{
			auto existing = roster.find(nick_key);
			if (!existing)
				return;

			auto who = registry.find(existing->who);
			const std::string nick = who ? who->nick : nick_key;
			roster.erase(nick_key);
			if (who)
				registry.release(nick, roster.key());
			notify(what, roster, nick);
		}

		// takes an identity off every roster, which also erases it
		void evict(const identity & who, change_kind what)
		{
			const std::string nick_key = who.key;
			// copied, the last release destroys who
			const std::set<std::string> channels = who.channels;
			for (const auto & channel_key : channels)
			{
				auto roster = rosters.find(channel_key);
				if (roster != rosters.end())
					remove_member(roster->second, nick_key, what);
			}
		}

		void destroy_roster(roster_map::iterator existing)
		{
			channel_roster & roster = existing->second;
			for (const auto & entry : roster.members())
			{
				auto who = registry.find(entry.second.who);
				if (who)
					registry.release(who->nick, roster.key());
			}
			notify(change_kind::roster_destroyed, roster, options.nick);
			rosters.erase(existing);
		}

	public:
		void join(const boost::string_ref & channel, const boost::string_ref & nick,
			const identity_attributes & attrs)
		{
			auto channel_key = fold(channel);
			auto existing = rosters.find(channel_key);
			if (existing == rosters.end())
			{
				if (!is_me(nick))
				{
					BOOST_LOG_TRIVIAL(debug) << "JOIN by " << nick << " for " << channel
						<< " which we are not on";
					return;
				}
				existing = rosters.emplace(channel_key,
					channel_roster(channel.to_string(), channel_key)).first;
				notify(change_kind::roster_created, existing->second, nick.to_string());
			}

			channel_roster & roster = existing->second;
			if (roster.contains(fold(nick)))
			{
				// duplicate JOIN, the roster stays as it is but the info may be fresher
				auto acquired = registry.get_or_create(nick, channel_key, attrs);
				if (acquired.changed)
					fan_out(acquired.who, change_kind::user_changed);
				return;
			}
			admit(roster, nick, attrs);
		}

		void leave(const boost::string_ref & channel, const boost::string_ref & nick, change_kind what)
		{
			auto existing = rosters.find(fold(channel));
			if (existing == rosters.end())
			{
				BOOST_LOG_TRIVIAL(debug) << "PART/KICK of " << nick << " from unknown channel " << channel;
				return;
			}
			if (is_me(nick))
			{
				destroy_roster(existing);
				return;
			}

			auto nick_key = fold(nick);
			if (!existing->second.contains(nick_key))
			{
				BOOST_LOG_TRIVIAL(debug) << "PART/KICK of " << nick << " who is not on " << channel;
				return;
			}
			remove_member(existing->second, nick_key, what);
		}

		void quit(const boost::string_ref & nick)
		{
			if (is_me(nick))
			{
				clear();
				return;
			}
			auto who = registry.find(nick);
			if (!who)
			{
				BOOST_LOG_TRIVIAL(debug) << "QUIT from unknown nick " << nick;
				return;
			}
			evict(*who, change_kind::quit);
		}

		void rename(const boost::string_ref & old_nick, const boost::string_ref & new_nick)
		{
			const bool me = is_me(old_nick);
			auto who = registry.find(old_nick);
			if (!who)
			{
				// we are not on any channel yet, but we still know our own nick
				if (me)
				{
					options.nick = new_nick.to_string();
					return;
				}
				throw unknown_identity(old_nick.to_string());
			}

			if (fold(new_nick) != who->key)
			{
				auto stale = registry.find(new_nick);
				if (stale)
				{
					BOOST_LOG_TRIVIAL(debug) << "NICK " << old_nick << " -> " << new_nick
						<< " replaces a stale entry";
					evict(*stale, change_kind::parted);
				}
			}

			const std::string old_key = who->key;
			const std::string old_display = who->nick;
			identity & renamed = registry.rename(old_nick, new_nick);
			for (const auto & channel_key : renamed.channels)
			{
				auto roster = rosters.find(channel_key);
				if (roster == rosters.end())
					continue;
				roster->second.rekey(old_key, renamed.key);
				notify(change_kind::renamed, roster->second, renamed.nick, old_display);
			}

			if (me)
				options.nick = new_nick.to_string();
		}

		void apply_modes(const boost::string_ref & channel, const boost::string_ref & modes_field,
			const std::vector<std::string> & args)
		{
			if (!is_channel_name(channel))
			{
				BOOST_LOG_TRIVIAL(trace) << "user mode " << modes_field << " for " << channel;
				return;
			}
			auto roster = find_roster(channel);
			if (!roster)
			{
				BOOST_LOG_TRIVIAL(debug) << "MODE for " << channel << " which we are not on";
				return;
			}

			auto changes = modes::parse(modes_field, args, prefixes, options.set_only_argument_modes);
			bool channel_changed = false;
			for (auto mode : changes.added)
				channel_changed |= roster->set_flag(mode, true);
			for (auto mode : changes.removed)
				channel_changed |= roster->set_flag(mode, false);

			for (const auto & change : changes.with_argument)
			{
				if (prefixes.is_membership_letter(change.letter))
					apply_rank(*roster, change);
				else
					channel_changed |= apply_channel_argument(*roster, change);
			}

			if (channel_changed)
				notify(change_kind::channel_modes_changed, *roster, std::string());
		}

		void set_channel_modes(const boost::string_ref & channel, const boost::string_ref & modes_field,
			const std::vector<std::string> & args)
		{
			auto roster = find_roster(channel);
			if (!roster)
				return;

			const bool had_modes = !roster->flags().empty() || roster->channel_key() || roster->limit();
			for (auto mode : std::string(roster->flags()))
				roster->set_flag(mode, false);
			roster->channel_key(boost::none);
			roster->limit(boost::none);
			if (had_modes)
				notify(change_kind::channel_modes_changed, *roster, std::string());
			apply_modes(channel, modes_field, args);
		}

		void apply_rank(channel_roster & roster, const modes::argument_change & change)
		{
			if (!change.argument)
			{
				BOOST_LOG_TRIVIAL(debug) << "mode " << change.letter << " on " << roster.name()
					<< " without a nick";
				return;
			}

			auto target = roster.find(fold(*change.argument));
			if (!target)
			{
				// a grant for someone known from another channel means they are here
				auto known = registry.find(*change.argument);
				if (!change.add || !known)
				{
					BOOST_LOG_TRIVIAL(debug) << "mode " << change.letter << " for " << *change.argument
						<< " who is not on " << roster.name();
					return;
				}
				target = &admit(roster, known->nick, identity_attributes());
			}

			auto r = prefixes.rank_of(change.letter);
			if (r && target->ranks.set(*r, change.add))
			{
				auto who = registry.find(target->who);
				notify(change_kind::ranks_changed, roster, who ? who->nick : *change.argument);
			}
		}

		bool apply_channel_argument(channel_roster & roster, const modes::argument_change & change)
		{
			switch (change.letter)
			{
			case 'k':
				if (!change.add)
				{
					if (!roster.channel_key())
						return false;
					roster.channel_key(boost::none);
					return true;
				}
				if (!change.argument || roster.channel_key() == change.argument)
					return false;
				roster.channel_key(change.argument);
				return true;
			case 'l':
			{
				if (!change.add)
				{
					if (!roster.limit())
						return false;
					roster.limit(boost::none);
					return true;
				}
				unsigned long limit = 0;
				if (!change.argument || !parse_limit(*change.argument, limit))
				{
					BOOST_LOG_TRIVIAL(debug) << "bad limit on " << roster.name();
					return false;
				}
				if (roster.limit() == limit)
					return false;
				roster.limit(limit);
				return true;
			}
			default:
				return roster.set_flag(change.letter, change.add);
			}
		}

		void names_begin(const boost::string_ref & channel)
		{
			auto roster = find_roster(channel);
			if (!roster)
			{
				BOOST_LOG_TRIVIAL(debug) << "NAMES for " << channel << " which we are not on";
				return;
			}
			roster->begin_names();
		}

		void names_entry(const boost::string_ref & channel, const boost::string_ref & entry)
		{
			auto roster = find_roster(channel);
			if (!roster)
				return;

			auto decoded = prefixes.decode(entry);
			if (decoded.nick.empty())
			{
				BOOST_LOG_TRIVIAL(debug) << "empty NAMES entry '" << entry << "' on " << channel;
				return;
			}
			if (!roster->in_names())
				roster->begin_names();

			identity_attributes attrs;
			attrs.login = decoded.user;
			attrs.host = decoded.host;

			auto nick_key = fold(decoded.nick);
			auto existing = roster->find(nick_key);
			if (existing)
			{
				auto acquired = registry.get_or_create(decoded.nick, roster->key(), attrs);
				if (acquired.changed)
					fan_out(acquired.who, change_kind::user_changed);
			}
			else
			{
				existing = &admit(*roster, decoded.nick, attrs);
			}

			if (existing->ranks != decoded.ranks)
			{
				existing->ranks = decoded.ranks;
				notify(change_kind::ranks_changed, *roster, decoded.nick);
			}
			roster->mark_seen(nick_key);
		}

		void names_end(const boost::string_ref & channel)
		{
			auto roster = find_roster(channel);
			if (!roster || !roster->in_names())
			{
				BOOST_LOG_TRIVIAL(debug) << "end of NAMES for " << channel << " without a snapshot";
				return;
			}
			for (const auto & stale : roster->end_names())
				remove_member(*roster, stale, change_kind::parted);
			notify(change_kind::names_synced, *roster, std::string());
		}

		void touch(const boost::string_ref & channel, const boost::string_ref & nick, const time_point & when)
		{
			auto roster = find_roster(channel);
			if (!roster)
				return;
			auto target = roster->find(fold(nick));
			if (!target)
				return;
			target->last_activity = when;
			notify(change_kind::activity, *roster, nick.to_string());
		}

		void set_away(const boost::string_ref & nick, bool away)
		{
			auto who = registry.find(nick);
			if (!who || who->away == away)
				return;
			who->away = away;
			fan_out(*who, change_kind::user_changed);
		}

		void set_account(const boost::string_ref & nick, const boost::optional<std::string> & account)
		{
			auto who = registry.find(nick);
			if (!who || who->account == account)
				return;
			who->account = account;
			fan_out(*who, change_kind::user_changed);
		}

		void update_user(const boost::string_ref & nick, const identity_attributes & attrs, bool overwrite)
		{
			if (registry.update(nick, attrs, overwrite))
				fan_out(*registry.find(nick), change_kind::user_changed);
		}

		void set_casemapping(casemapping map)
		{
			if (map == options.mapping)
				return;

			auto merged = registry.rebuild(map);
			std::unordered_map<identity_id, identity_id> redirect(merged.cbegin(), merged.cend());

			// walk in old key order so the roster that survives a collapse is stable
			std::vector<std::string> old_keys;
			old_keys.reserve(rosters.size());
			for (const auto & entry : rosters)
				old_keys.push_back(entry.first);
			std::sort(old_keys.begin(), old_keys.end());

			roster_map rebuilt;
			std::vector<channel_roster> dropped;
			for (const auto & old_key : old_keys)
			{
				channel_roster & roster = rosters.at(old_key);
				channel_roster::member_map members;
				for (const auto & held : roster.members())
				{
					membership moved = held.second;
					auto target = redirect.find(moved.who);
					if (target != redirect.end())
						moved.who = target->second;
					auto who = registry.find(moved.who);
					if (who)
						members.emplace(who->key, moved);
				}

				auto channel_key = ircstate::fold(roster.name(), map);
				roster.reset_members(std::move(members));
				if (rebuilt.count(channel_key))
				{
					BOOST_LOG_TRIVIAL(warning) << "casemapping change folds " << roster.name()
						<< " onto " << rebuilt.at(channel_key).name() << ", dropping it";
					dropped.push_back(std::move(roster));
					continue;
				}
				roster.rename(roster.name(), channel_key);
				rebuilt.emplace(channel_key, std::move(roster));
			}
			rosters.swap(rebuilt);
			options.mapping = map;

			// the channel sets still hold keys folded the old way
			std::unordered_map<identity_id, std::set<std::string> > holders;
			for (const auto & entry : rosters)
			{
				for (const auto & held : entry.second.members())
					holders[held.second.who].insert(entry.first);
			}
			for (auto who : registry.identities())
			{
				auto id = who->id;
				auto found = holders.find(id);
				if (found != holders.end())
				{
					registry.find(id)->channels = found->second;
					continue;
				}

				// only a dropped roster held this one
				for (const auto & roster : dropped)
				{
					if (roster.contains(who->key))
						notify(change_kind::parted, roster, who->nick);
				}
				registry.erase(id);
			}

			for (const auto & roster : dropped)
				notify(change_kind::roster_destroyed, roster, options.nick);
			for (const auto & entry : rosters)
				notify(change_kind::roster_rebuilt, entry.second, std::string());
		}

		void clear()
		{
			for (const auto & entry : rosters)
				notify(change_kind::roster_destroyed, entry.second, options.nick);
			rosters.clear();
			registry.clear();
		}

		member snapshot(const membership & held) const
		{
			member copy;
			auto who = registry.find(held.who);
			if (who)
			{
				copy.nick = who->nick;
				copy.login = who->login;
				copy.host = who->host;
				copy.realname = who->realname;
				copy.account = who->account;
				copy.away = who->away;
			}
			else
			{
				copy.away = false;
			}
			copy.ranks = held.ranks;
			copy.prefix = prefixes.prefix_of(held.ranks);
			copy.last_activity = held.last_activity;
			return copy;
		}

		bool consistent() const
		{
			std::unordered_map<identity_id, std::set<std::string> > holders;
			for (const auto & entry : rosters)
			{
				for (const auto & held : entry.second.members())
				{
					auto who = registry.find(held.second.who);
					if (!who || who->key != held.first)
						return false;
					holders[who->id].insert(entry.first);
				}
			}
			for (auto who : registry.identities())
			{
				auto found = holders.find(who->id);
				if (found == holders.end() || found->second != who->channels)
					return false;
			}
			return holders.size() == registry.size();
		}
	};

	template<class Mutation>
	void session::mutate(Mutation && mutation)
	{
		std::vector<membership_change> changes;
		{
			boost::unique_lock<boost::shared_mutex> lock(impl_->mutex);
			impl_->pending.clear();
			mutation(*impl_);
			changes.swap(impl_->pending);
		}
		for (const auto & change : changes)
			on_change(change);
	}

	session::session(const session_options & options)
		:impl_(new session_impl(options))
	{}

	// required to be explicit for the impl_ unique_ptr
	session::~session()
	{}

	void session::set_nick(const boost::string_ref & nick)
	{
		mutate([&nick](session_impl & impl){ impl.options.nick = nick.to_string(); });
	}

	void session::set_prefix(const boost::string_ref & isupport_prefix)
	{
		mutate([&isupport_prefix](session_impl & impl){
			impl.prefixes = prefix_table(isupport_prefix);
			impl.options.prefix = isupport_prefix.to_string();
		});
	}

	void session::set_casemapping(casemapping map)
	{
		mutate([map](session_impl & impl){ impl.set_casemapping(map); });
	}

	void session::join(const boost::string_ref & channel, const boost::string_ref & nick,
		const identity_attributes & attrs)
	{
		mutate([&](session_impl & impl){ impl.join(channel, nick, attrs); });
	}

	void session::part(const boost::string_ref & channel, const boost::string_ref & nick)
	{
		mutate([&](session_impl & impl){ impl.leave(channel, nick, change_kind::parted); });
	}

	void session::kick(const boost::string_ref & channel, const boost::string_ref & nick)
	{
		mutate([&](session_impl & impl){ impl.leave(channel, nick, change_kind::kicked); });
	}

	void session::quit(const boost::string_ref & nick)
	{
		mutate([&](session_impl & impl){ impl.quit(nick); });
	}

	void session::rename(const boost::string_ref & old_nick, const boost::string_ref & new_nick)
	{
		mutate([&](session_impl & impl){ impl.rename(old_nick, new_nick); });
	}

	void session::apply_modes(const boost::string_ref & channel, const boost::string_ref & modes,
		const std::vector<std::string> & args)
	{
		mutate([&](session_impl & impl){ impl.apply_modes(channel, modes, args); });
	}

	void session::set_channel_modes(const boost::string_ref & channel, const boost::string_ref & modes,
		const std::vector<std::string> & args)
	{
		mutate([&](session_impl & impl){ impl.set_channel_modes(channel, modes, args); });
	}

	void session::names_begin(const boost::string_ref & channel)
	{
		mutate([&](session_impl & impl){ impl.names_begin(channel); });
	}

	void session::names_entry(const boost::string_ref & channel, const boost::string_ref & entry)
	{
		mutate([&](session_impl & impl){ impl.names_entry(channel, entry); });
	}

	void session::names_end(const boost::string_ref & channel)
	{
		mutate([&](session_impl & impl){ impl.names_end(channel); });
	}

	void session::touch(const boost::string_ref & channel, const boost::string_ref & nick, time_point when)
	{
		mutate([&](session_impl & impl){ impl.touch(channel, nick, when); });
	}

	void session::set_away(const boost::string_ref & nick, bool away)
	{
		mutate([&](session_impl & impl){ impl.set_away(nick, away); });
	}

	void session::set_account(const boost::string_ref & nick, const boost::optional<std::string> & account)
	{
		mutate([&](session_impl & impl){ impl.set_account(nick, account); });
	}

	void session::update_user(const boost::string_ref & nick, const identity_attributes & attrs, bool overwrite)
	{
		mutate([&](session_impl & impl){ impl.update_user(nick, attrs, overwrite); });
	}

	void session::clear()
	{
		mutate([](session_impl & impl){ impl.clear(); });
	}

	std::string session::nick() const
	{
		boost::shared_lock<boost::shared_mutex> lock(impl_->mutex);
		return impl_->options.nick;
	}

	casemapping session::mapping() const
	{
		boost::shared_lock<boost::shared_mutex> lock(impl_->mutex);
		return impl_->options.mapping;
	}

	prefix_table session::prefixes() const
	{
		boost::shared_lock<boost::shared_mutex> lock(impl_->mutex);
		return impl_->prefixes;
	}

	bool session::is_channel_name(const boost::string_ref & name) const
	{
		boost::shared_lock<boost::shared_mutex> lock(impl_->mutex);
		return impl_->is_channel_name(name);
	}

	bool session::is_me(const boost::string_ref & nick) const
	{
		boost::shared_lock<boost::shared_mutex> lock(impl_->mutex);
		return impl_->is_me(nick);
	}

	std::vector<member> session::members_of(const boost::string_ref & channel) const
	{
		boost::shared_lock<boost::shared_mutex> lock(impl_->mutex);
		std::vector<member> members;
		auto roster = impl_->find_roster(channel);
		if (!roster)
			return members;
		members.reserve(roster->total());
		for (const auto & entry : roster->members())
			members.push_back(impl_->snapshot(entry.second));
		return members;
	}

	boost::optional<channel_state> session::channel_info(const boost::string_ref & channel) const
	{
		boost::shared_lock<boost::shared_mutex> lock(impl_->mutex);
		auto roster = impl_->find_roster(channel);
		if (!roster)
			return boost::none;

		channel_state state;
		state.name = roster->name();
		state.key = roster->channel_key();
		state.limit = roster->limit();
		state.flags = roster->flags();
		state.total = roster->total();
		state.owners = roster->count(rank::owner);
		state.admins = roster->count(rank::admin);
		state.ops = roster->count(rank::op);
		state.halfops = roster->count(rank::halfop);
		state.voices = roster->count(rank::voice);
		state.syncing = roster->in_names();
		return state;
	}

	std::vector<std::string> session::channels() const
	{
		boost::shared_lock<boost::shared_mutex> lock(impl_->mutex);
		std::vector<std::string> names;
		names.reserve(impl_->rosters.size());
		for (const auto & entry : impl_->rosters)
			names.push_back(entry.second.name());
		return names;
	}

	boost::optional<identity> session::identity_of(const boost::string_ref & nick) const
	{
		boost::shared_lock<boost::shared_mutex> lock(impl_->mutex);
		auto who = impl_->registry.find(nick);
		if (!who)
			return boost::none;
		return *who;
	}

	std::set<std::string> session::all_nicks() const
	{
		boost::shared_lock<boost::shared_mutex> lock(impl_->mutex);
		return impl_->registry.all_nicks();
	}

	bool session::has_rank(const boost::string_ref & channel, const boost::string_ref & nick, rank r) const
	{
		boost::shared_lock<boost::shared_mutex> lock(impl_->mutex);
		auto held = impl_->find_member(channel, nick);
		return held && held->ranks.get(r);
	}

	bool session::is_voice(const boost::string_ref & channel, const boost::string_ref & nick) const
	{
		return has_rank(channel, nick, rank::voice);
	}

	bool session::is_halfop(const boost::string_ref & channel, const boost::string_ref & nick) const
	{
		return has_rank(channel, nick, rank::halfop);
	}

	bool session::is_op(const boost::string_ref & channel, const boost::string_ref & nick) const
	{
		return has_rank(channel, nick, rank::op);
	}

	bool session::is_admin(const boost::string_ref & channel, const boost::string_ref & nick) const
	{
		return has_rank(channel, nick, rank::admin);
	}

	bool session::is_owner(const boost::string_ref & channel, const boost::string_ref & nick) const
	{
		return has_rank(channel, nick, rank::owner);
	}

	bool session::is_on(const boost::string_ref & channel, const boost::string_ref & nick) const
	{
		boost::shared_lock<boost::shared_mutex> lock(impl_->mutex);
		return impl_->find_member(channel, nick) != nullptr;
	}

	bool session::consistent() const
	{
		boost::shared_lock<boost::shared_mutex> lock(impl_->mutex);
		return impl_->consistent();
	}
} // namespace ircstate
