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
#include <vector>
#include <event.hpp>
#include <inbound.hpp>
#include <session.hpp>
#include <boost/test/unit_test.hpp>
#include <boost/utility/string_ref.hpp>
#include <boost/optional.hpp>

using ircstate::event;
using ircstate::inbound::handle_event;

namespace
{
	event make_event(const std::string & command, const std::string & nick,
		const std::vector<std::string> & params)
	{
		event ev;
		ev.command = command;
		ev.source_nick = nick;
		ev.source_user = nick.empty() ? std::string() : "~" + nick;
		ev.source_host = nick.empty() ? std::string() : nick + ".example.org";
		ev.params = params;
		return ev;
	}

	struct welcomed
	{
		ircstate::session sess;

		welcomed()
		{
			handle_event(sess, make_event("001", "", { "me", "Welcome to the network" }));
			handle_event(sess, make_event("JOIN", "me", { "#chan" }));
			handle_event(sess, make_event("JOIN", "alice", { "#chan" }));
		}
	};
}

BOOST_AUTO_TEST_SUITE(inbound_events)

BOOST_FIXTURE_TEST_CASE(welcome_sets_nick, welcomed)
{
	BOOST_REQUIRE_EQUAL(sess.nick(), "me");
	BOOST_REQUIRE(sess.is_on("#chan", "me"));
	auto alice = sess.identity_of("alice");
	BOOST_REQUIRE(alice);
	BOOST_REQUIRE(alice->login == std::string("~alice"));
	BOOST_REQUIRE(alice->host == std::string("alice.example.org"));
}

BOOST_FIXTURE_TEST_CASE(extended_join, welcomed)
{
	BOOST_REQUIRE(handle_event(sess, make_event("JOIN", "bob", { "#chan", "bobacct", "Bob Builder" })));
	auto bob = sess.identity_of("bob");
	BOOST_REQUIRE(bob->account == std::string("bobacct"));
	BOOST_REQUIRE(bob->realname == std::string("Bob Builder"));

	handle_event(sess, make_event("JOIN", "carol", { "#chan", "*", "Carol" }));
	BOOST_REQUIRE_MESSAGE(!sess.identity_of("carol")->account, "A * account means logged out");
}

BOOST_FIXTURE_TEST_CASE(target_channel_overrides_params, welcomed)
{
	auto ev = make_event("PART", "alice", { "leaving" });
	ev.target_channel = std::string("#chan");
	BOOST_REQUIRE(handle_event(sess, ev));
	BOOST_REQUIRE(!sess.is_on("#chan", "alice"));
}

BOOST_FIXTURE_TEST_CASE(names_reply, welcomed)
{
	handle_event(sess, make_event("353", "", { "me", "=", "#chan", "@me +alice bob " }));
	BOOST_REQUIRE(sess.channel_info("#chan")->syncing);
	handle_event(sess, make_event("366", "", { "me", "#chan", "End of /NAMES list." }));
	BOOST_REQUIRE(!sess.channel_info("#chan")->syncing);
	BOOST_REQUIRE(sess.is_op("#chan", "me"));
	BOOST_REQUIRE(sess.is_voice("#chan", "alice"));
	BOOST_REQUIRE(sess.is_on("#chan", "bob"));
	BOOST_REQUIRE(sess.consistent());
}

BOOST_FIXTURE_TEST_CASE(mode_and_kick, welcomed)
{
	BOOST_REQUIRE(handle_event(sess, make_event("MODE", "me", { "#chan", "+o", "alice" })));
	BOOST_REQUIRE(sess.is_op("#chan", "alice"));
	BOOST_REQUIRE(handle_event(sess, make_event("KICK", "me", { "#chan", "alice", "bye" })));
	BOOST_REQUIRE(!sess.is_on("#chan", "alice"));
	BOOST_REQUIRE(!sess.identity_of("alice"));
}

BOOST_FIXTURE_TEST_CASE(channel_mode_reply, welcomed)
{
	BOOST_REQUIRE(handle_event(sess, make_event("324", "", { "me", "#chan", "+ntl", "50" })));
	auto info = sess.channel_info("#chan");
	BOOST_REQUIRE_EQUAL(info->flags, "nt");
	BOOST_REQUIRE(info->limit == 50ul);
}

BOOST_FIXTURE_TEST_CASE(nick_change, welcomed)
{
	BOOST_REQUIRE(handle_event(sess, make_event("NICK", "alice", { "alicia" })));
	BOOST_REQUIRE(sess.is_on("#chan", "alicia"));
	BOOST_REQUIRE_MESSAGE(!handle_event(sess, make_event("NICK", "ghost", { "spirit" })),
		"A NICK from a stranger should be ignored");
	BOOST_REQUIRE(!sess.identity_of("spirit"));

	BOOST_REQUIRE(handle_event(sess, make_event("NICK", "me", { "me_" })));
	BOOST_REQUIRE_EQUAL(sess.nick(), "me_");
}

BOOST_FIXTURE_TEST_CASE(quit_and_away, welcomed)
{
	handle_event(sess, make_event("AWAY", "alice", { "gone fishing" }));
	BOOST_REQUIRE(sess.identity_of("alice")->away);
	handle_event(sess, make_event("AWAY", "alice", {}));
	BOOST_REQUIRE(!sess.identity_of("alice")->away);
	BOOST_REQUIRE(handle_event(sess, make_event("QUIT", "alice", { "Quit: bye" })));
	BOOST_REQUIRE(!sess.identity_of("alice"));
}

BOOST_FIXTURE_TEST_CASE(account_and_chghost, welcomed)
{
	handle_event(sess, make_event("ACCOUNT", "alice", { "aliceacct" }));
	BOOST_REQUIRE(sess.identity_of("alice")->account == std::string("aliceacct"));
	handle_event(sess, make_event("ACCOUNT", "alice", { "*" }));
	BOOST_REQUIRE(!sess.identity_of("alice")->account);

	handle_event(sess, make_event("CHGHOST", "alice", { "al", "cloak.example" }));
	auto alice = sess.identity_of("alice");
	BOOST_REQUIRE(alice->login == std::string("al"));
	BOOST_REQUIRE(alice->host == std::string("cloak.example"));
}

BOOST_FIXTURE_TEST_CASE(who_and_whois_replies, welcomed)
{
	handle_event(sess, make_event("352", "", { "me", "#chan", "ali", "a.example", "irc.example", "alice", "G@", "0 Alice A" }));
	auto alice = sess.identity_of("alice");
	BOOST_REQUIRE(alice->away);
	BOOST_REQUIRE(alice->login == std::string("ali"));
	BOOST_REQUIRE(alice->realname == std::string("Alice A"));

	handle_event(sess, make_event("311", "", { "me", "alice", "al", "b.example", "*", "Alice B" }));
	alice = sess.identity_of("alice");
	BOOST_REQUIRE(alice->host == std::string("b.example"));
	BOOST_REQUIRE(alice->realname == std::string("Alice B"));
}

BOOST_FIXTURE_TEST_CASE(channel_messages_mark_activity, welcomed)
{
	BOOST_REQUIRE(handle_event(sess, make_event("PRIVMSG", "alice", { "#chan", "hello" })));
	BOOST_REQUIRE(!handle_event(sess, make_event("PRIVMSG", "alice", { "me", "psst" })));
	for (const auto & member : sess.members_of("#chan"))
	{
		if (member.nick == "alice")
			BOOST_REQUIRE(member.last_activity);
		else
			BOOST_REQUIRE(!member.last_activity);
	}
}

BOOST_FIXTURE_TEST_CASE(malformed_and_unknown_lines, welcomed)
{
	BOOST_REQUIRE(!handle_event(sess, make_event("KICK", "me", { "#chan" })));
	BOOST_REQUIRE(!handle_event(sess, make_event("MODE", "me", { "#chan" })));
	BOOST_REQUIRE(!handle_event(sess, make_event("366", "", {})));
	BOOST_REQUIRE(!handle_event(sess, make_event("TOPIC", "alice", { "#chan", "new topic" })));
	BOOST_REQUIRE(!handle_event(sess, make_event("JOIN", "", { "#chan" })));
	BOOST_REQUIRE(sess.is_on("#chan", "alice"));
	BOOST_REQUIRE(sess.consistent());
}

BOOST_AUTO_TEST_SUITE_END()
