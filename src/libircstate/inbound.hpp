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

#ifndef LIBIRCSTATE_INBOUND_HPP
#define LIBIRCSTATE_INBOUND_HPP

#ifdef _MSC_VER
#pragma once
#endif

namespace ircstate
{
	class session;
	struct event;

	namespace inbound
	{
		/* feeds one decoded line into the session. Returns false when the
		   line was not about membership or was too short to use */
		bool handle_event(session & sess, const event & ev);
	}
} // namespace ircstate

#endif // LIBIRCSTATE_INBOUND_HPP
