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

#ifndef LIBIRCSTATE_IDENTITY_REGISTRY_HPP
#define LIBIRCSTATE_IDENTITY_REGISTRY_HPP

#ifdef _MSC_VER
#pragma once
#endif

#include <cstddef>
#include <memory>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <boost/utility/string_ref_fwd.hpp>
#include "casemap.hpp"
#include "identity.hpp"

namespace ircstate
{
	/**
	 * Session wide table of identities keyed by folded nickname.
	 *
	 * An identity lives exactly as long as at least one channel roster
	 * refers to it: it is created together with its first channel
	 * reference and erased when the last one is released.
	 */
	class identity_registry
	{
		identity_registry(const identity_registry&) = delete;
		identity_registry& operator=(const identity_registry&) = delete;
	public:
		typedef std::size_t size_type;
		// (collapsed identity, identity it was merged into)
		typedef std::vector<std::pair<identity_id, identity_id> > merge_list;

		struct acquire_result
		{
			identity & who;
			bool created;
			bool changed;	/* an existing identity picked up new attributes */
		};

	public:
		explicit identity_registry(casemapping map = casemapping::rfc1459);
		~identity_registry();

	public:
		acquire_result get_or_create(const boost::string_ref & nick,
			const std::string & channel_key,
			const identity_attributes & attrs = identity_attributes());

		/* merge into an existing identity, by default only filling fields
		   that are still unknown. Returns true if anything changed */
		bool update(const boost::string_ref & nick, const identity_attributes & attrs, bool overwrite = false);

		// throws unknown_identity or nick_collision, leaving the table untouched
		identity & rename(const boost::string_ref & old_nick, const boost::string_ref & new_nick);

		// returns true when this was the last reference and the identity is gone
		bool release(const boost::string_ref & nick, const std::string & channel_key);
		// drops an identity regardless of its channel references
		bool erase(identity_id id);

		identity * find(const boost::string_ref & nick);
		const identity * find(const boost::string_ref & nick) const;
		identity * find(identity_id id);
		const identity * find(identity_id id) const;

		std::set<std::string> all_nicks() const;
		std::vector<const identity *> identities() const;
		size_type size() const;
		bool empty() const;
		void clear();

		/* re-key everything under a new casemapping, nicks that now fold
		   together are merged into the oldest identity */
		merge_list rebuild(casemapping map);

		casemapping mapping() const { return map_; }
		std::string key_for(const boost::string_ref & nick) const;

	private:
		casemapping map_;
		identity_id next_id_;
		std::unordered_map<identity_id, std::unique_ptr<identity> > by_id_;
		std::unordered_map<std::string, identity_id> by_key_;
	};
} // namespace ircstate

#endif // LIBIRCSTATE_IDENTITY_REGISTRY_HPP
