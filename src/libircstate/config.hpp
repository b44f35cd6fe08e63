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

#ifndef LIBIRCSTATE_CONFIG_HPP
#define LIBIRCSTATE_CONFIG_HPP

#if !defined(__clang__) && !defined(__has_feature)
#define __has_feature(a) 0
#endif

#if defined(__clang__) && __has_feature(cxx_noexcept) || \
    defined(__GNUC__) && __GNUC__ * 10 + __GNUC_MINOR__ >= 46 || \
    defined(_MSC_FULL_VER) && _MSC_FULL_VER > 180040629
#  define LIBIRCSTATE_NOEXCEPT noexcept
#elif defined(_MSC_VER)
#  define LIBIRCSTATE_NOEXCEPT throw()
#else
#error noexcept is required to compile this code!
#endif

#endif //LIBIRCSTATE_CONFIG_HPP
