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

// do not uncomment this should only be defined once
//#define BOOST_TEST_MODULE libircstate_tests
#ifndef _MSC_VER
#define BOOST_TEST_DYN_LINK
#endif
#include <string>
#include <errors.hpp>
#include <identity_registry.hpp>
#include <boost/test/unit_test.hpp>
#include <boost/utility/string_ref.hpp>
#include <boost/optional.hpp>

using ircstate::casemapping;
using ircstate::identity_attributes;
using ircstate::identity_registry;

BOOST_AUTO_TEST_SUITE(identity_registry_tests)

BOOST_AUTO_TEST_CASE(shared_across_channels)
{
	identity_registry registry;
	auto first = registry.get_or_create("Bob", "#a");
	BOOST_REQUIRE(first.created);
	auto second = registry.get_or_create("bob", "#b");
	BOOST_REQUIRE(!second.created);
	BOOST_REQUIRE_EQUAL(&first.who, &second.who);
	BOOST_REQUIRE_EQUAL(registry.size(), 1u);
	BOOST_REQUIRE_EQUAL(second.who.channels.size(), 2u);
	// the display nick follows the latest sighting
	BOOST_REQUIRE_EQUAL(second.who.nick, "bob");
}

BOOST_AUTO_TEST_CASE(release_last_reference_erases)
{
	identity_registry registry;
	registry.get_or_create("bob", "#a");
	registry.get_or_create("bob", "#b");
	BOOST_REQUIRE(!registry.release("bob", "#a"));
	BOOST_REQUIRE(registry.find("bob") != nullptr);
	BOOST_REQUIRE(registry.release("BOB", "#b"));
	BOOST_REQUIRE(registry.find("bob") == nullptr);
	BOOST_REQUIRE(registry.empty());
}

BOOST_AUTO_TEST_CASE(rename_keeps_identity)
{
	identity_registry registry;
	auto & who = registry.get_or_create("alice", "#a").who;
	const auto id = who.id;
	auto & renamed = registry.rename("Alice", "alicia");
	BOOST_REQUIRE_EQUAL(&renamed, &who);
	BOOST_REQUIRE_EQUAL(renamed.id, id);
	BOOST_REQUIRE_EQUAL(renamed.key, "alicia");
	BOOST_REQUIRE(registry.find("alice") == nullptr);
	BOOST_REQUIRE_EQUAL(registry.find("ALICIA"), &who);
}

BOOST_AUTO_TEST_CASE(rename_case_only)
{
	identity_registry registry;
	auto & who = registry.get_or_create("alice", "#a").who;
	registry.rename("alice", "ALICE");
	BOOST_REQUIRE_EQUAL(who.nick, "ALICE");
	BOOST_REQUIRE_EQUAL(who.key, "alice");
	BOOST_REQUIRE_EQUAL(registry.size(), 1u);
}

BOOST_AUTO_TEST_CASE(rename_failures_leave_table_untouched)
{
	identity_registry registry;
	registry.get_or_create("alice", "#a");
	registry.get_or_create("bob", "#a");
	BOOST_REQUIRE_THROW(registry.rename("carol", "dave"), ircstate::unknown_identity);
	BOOST_REQUIRE_THROW(registry.rename("alice", "BOB"), ircstate::nick_collision);
	BOOST_REQUIRE(registry.find("alice") != nullptr);
	BOOST_REQUIRE(registry.find("bob") != nullptr);
	BOOST_REQUIRE_EQUAL(registry.size(), 2u);
}

BOOST_AUTO_TEST_CASE(update_fills_unknown_fields)
{
	identity_registry registry;
	identity_attributes attrs;
	attrs.host = std::string("old.example.org");
	registry.get_or_create("bob", "#a", attrs);

	identity_attributes fresh;
	fresh.host = std::string("new.example.org");
	fresh.realname = std::string("Bob");
	BOOST_REQUIRE(registry.update("bob", fresh));
	BOOST_REQUIRE(registry.find("bob")->host == std::string("old.example.org"));
	BOOST_REQUIRE(registry.find("bob")->realname == std::string("Bob"));

	BOOST_REQUIRE(registry.update("bob", fresh, true));
	BOOST_REQUIRE(registry.find("bob")->host == std::string("new.example.org"));
	BOOST_REQUIRE_MESSAGE(!registry.update("bob", fresh, true), "Repeating an update should report no change");
	BOOST_REQUIRE(!registry.update("nobody", fresh));
}

BOOST_AUTO_TEST_CASE(rebuild_merges_into_oldest)
{
	identity_registry registry(casemapping::ascii);
	auto older = registry.get_or_create("a[", "#a").who.id;
	auto newer = registry.get_or_create("a{", "#b").who.id;
	BOOST_REQUIRE_EQUAL(registry.size(), 2u);

	auto merged = registry.rebuild(casemapping::rfc1459);
	BOOST_REQUIRE_EQUAL(merged.size(), 1u);
	BOOST_REQUIRE_EQUAL(merged[0].first, newer);
	BOOST_REQUIRE_EQUAL(merged[0].second, older);
	BOOST_REQUIRE_EQUAL(registry.size(), 1u);

	auto survivor = registry.find("A[");
	BOOST_REQUIRE(survivor != nullptr);
	BOOST_REQUIRE_EQUAL(survivor->id, older);
	BOOST_REQUIRE_EQUAL(survivor->channels.size(), 2u);
	BOOST_REQUIRE(registry.mapping() == casemapping::rfc1459);
}

BOOST_AUTO_TEST_CASE(all_nicks_use_display_form)
{
	identity_registry registry;
	registry.get_or_create("Alice", "#a");
	registry.get_or_create("bob", "#a");
	auto nicks = registry.all_nicks();
	BOOST_REQUIRE_EQUAL(nicks.size(), 2u);
	BOOST_REQUIRE(nicks.count("Alice"));
}

BOOST_AUTO_TEST_SUITE_END()
