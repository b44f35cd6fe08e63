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

#ifndef LIBIRCSTATE_LOGGING_HPP
#define LIBIRCSTATE_LOGGING_HPP

#ifdef _MSC_VER
#pragma once
#endif

#include <boost/log/trivial.hpp>

namespace ircstate
{
	namespace log
	{
		// drops every record below the given severity
		void set_level(boost::log::trivial::severity_level level);
	}
}

#endif // LIBIRCSTATE_LOGGING_HPP
