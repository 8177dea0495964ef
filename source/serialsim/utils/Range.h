/*  This file is part of Serialsim, a cycle-accurate simulator for bit-serial arithmetic circuits.
	Copyright (C) 2021 Michael Offel, Andreas Ley

	Serialsim is free software; you can redistribute it and/or
	modify it under the terms of the GNU Lesser General Public
	License as published by the Free Software Foundation; either
	version 3 of the License, or (at your option) any later version.

	Serialsim is distributed in the hope that it will be useful,
	but WITHOUT ANY WARRANTY; without even the implied warranty of
	MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
	Lesser General Public License for more details.

	You should have received a copy of the GNU Lesser General Public
	License along with this library; if not, write to the Free Software
	Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301  USA
*/
#pragma once

#include <cstddef>
#include <iterator>

namespace ssim::utils {

/// Counts from 0 up to, but excluding, a given end, for use in range based for loops.
template<typename T = size_t>
class Range
{
	public:
		explicit Range(T end) : m_end(end) { }

		class iterator {
			public:
				using iterator_category = std::forward_iterator_tag;
				using value_type = T;
				using difference_type = std::ptrdiff_t;

				explicit iterator(T value) : m_value(value) { }

				iterator &operator++() { ++m_value; return *this; }
				bool operator==(const iterator &rhs) const = default;
				T operator*() const { return m_value; }
			protected:
				T m_value;
		};

		iterator begin() const { return iterator(T{0}); }
		iterator end() const { return iterator(m_end); }
	protected:
		T m_end;
};

}
