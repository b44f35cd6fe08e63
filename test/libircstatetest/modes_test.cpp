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
#include <modes.hpp>
#include <prefix_table.hpp>
#include <boost/test/unit_test.hpp>
#include <boost/utility/string_ref.hpp>
#include <boost/optional.hpp>

namespace modes = ircstate::modes;

namespace
{
	std::string letters(const std::vector<char> & modes)
	{
		return std::string(modes.cbegin(), modes.cend());
	}
}

BOOST_AUTO_TEST_SUITE(mode_parser)

BOOST_AUTO_TEST_CASE(op_and_voice_pair_in_order)
{
	ircstate::prefix_table table;
	auto changes = modes::parse("+ov", "alice bob", table);
	BOOST_REQUIRE_EQUAL(changes.with_argument.size(), 2u);
	BOOST_REQUIRE_EQUAL(changes.with_argument[0].letter, 'o');
	BOOST_REQUIRE(changes.with_argument[0].add);
	BOOST_REQUIRE(changes.with_argument[0].argument == std::string("alice"));
	BOOST_REQUIRE_EQUAL(changes.with_argument[1].letter, 'v');
	BOOST_REQUIRE(changes.with_argument[1].argument == std::string("bob"));
	BOOST_REQUIRE(changes.added.empty());
	BOOST_REQUIRE(changes.removed.empty());
}

BOOST_AUTO_TEST_CASE(polarity_switch)
{
	ircstate::prefix_table table;
	auto changes = modes::parse("+o-v", "alice bob", table);
	BOOST_REQUIRE_EQUAL(changes.with_argument.size(), 2u);
	BOOST_REQUIRE(changes.with_argument[0].add);
	BOOST_REQUIRE(!changes.with_argument[1].add);
}

BOOST_AUTO_TEST_CASE(same_letter_added_then_removed)
{
	ircstate::prefix_table table;
	auto changes = modes::parse("+o-o", "alice alice", table);
	BOOST_REQUIRE_EQUAL(changes.with_argument.size(), 2u);
	BOOST_REQUIRE_EQUAL(changes.with_argument[0].letter, 'o');
	BOOST_REQUIRE(changes.with_argument[0].add);
	BOOST_REQUIRE(changes.with_argument[0].argument == std::string("alice"));
	BOOST_REQUIRE_EQUAL(changes.with_argument[1].letter, 'o');
	BOOST_REQUIRE(!changes.with_argument[1].add);
	BOOST_REQUIRE(changes.with_argument[1].argument == std::string("alice"));
}

BOOST_AUTO_TEST_CASE(plain_flags)
{
	ircstate::prefix_table table;
	auto changes = modes::parse("+nt-s", "", table);
	BOOST_REQUIRE_EQUAL(letters(changes.added), "nt");
	BOOST_REQUIRE_EQUAL(letters(changes.removed), "s");
	BOOST_REQUIRE(changes.with_argument.empty());
}

BOOST_AUTO_TEST_CASE(key_and_limit_take_argument_when_set)
{
	ircstate::prefix_table table;
	auto changes = modes::parse("+kl", "secret 10", table);
	BOOST_REQUIRE_EQUAL(changes.with_argument.size(), 2u);
	BOOST_REQUIRE(changes.with_argument[0].argument == std::string("secret"));
	BOOST_REQUIRE(changes.with_argument[1].argument == std::string("10"));
}

BOOST_AUTO_TEST_CASE(key_removal_consumes_nothing)
{
	ircstate::prefix_table table;
	auto changes = modes::parse("-kl+o", "alice", table);
	BOOST_REQUIRE_EQUAL(changes.with_argument.size(), 3u);
	BOOST_REQUIRE(!changes.with_argument[0].argument);
	BOOST_REQUIRE(!changes.with_argument[1].add);
	BOOST_REQUIRE(!changes.with_argument[1].argument);
	BOOST_REQUIRE(changes.with_argument[2].argument == std::string("alice"));
}

BOOST_AUTO_TEST_CASE(missing_argument)
{
	ircstate::prefix_table table;
	auto changes = modes::parse("+oo", "alice", table);
	BOOST_REQUIRE_EQUAL(changes.with_argument.size(), 2u);
	BOOST_REQUIRE_MESSAGE(!changes.with_argument[1].argument, "An exhausted argument list should leave the argument unset");
}

BOOST_AUTO_TEST_CASE(extra_whitespace_in_arguments)
{
	ircstate::prefix_table table;
	auto changes = modes::parse("+vv", "  alice   bob ", table);
	BOOST_REQUIRE_EQUAL(changes.with_argument.size(), 2u);
	BOOST_REQUIRE(changes.with_argument[1].argument == std::string("bob"));
}

BOOST_AUTO_TEST_CASE(no_leading_sign_means_add)
{
	ircstate::prefix_table table;
	auto changes = modes::parse("o", std::vector<std::string>{ "alice" }, table);
	BOOST_REQUIRE_EQUAL(changes.with_argument.size(), 1u);
	BOOST_REQUIRE(changes.with_argument[0].add);
}

BOOST_AUTO_TEST_CASE(empty_mode_string)
{
	ircstate::prefix_table table;
	BOOST_REQUIRE(modes::parse("", "alice", table).empty());
	BOOST_REQUIRE(modes::parse("+-", "", table).empty());
}

BOOST_AUTO_TEST_SUITE_END()
