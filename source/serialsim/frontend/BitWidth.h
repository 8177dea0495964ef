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

#include "../utils/BitManipulation.h"
#include <compare>
#include <ostream>

namespace ssim
{
	/// Width of a register or port in bits.
	struct BitWidth
	{
		auto operator <=> (const BitWidth&) const = default;
		bool operator == (const BitWidth&) const = default;

		BitWidth& operator += (const BitWidth& rhs) { value += rhs.value; return *this; }
		BitWidth& operator *= (const uint64_t rhs) { value *= rhs; return *this; }

		explicit operator bool() const { return value != 0; }

		uint64_t value = 0;

		BitWidth() = default;
		constexpr explicit BitWidth(uint64_t v) : value(v) { }

		/// Largest unsigned value representable, saturated at 64 bits.
		constexpr uint64_t mask() const { return (value >= 64) ? ~0ull : (1ull << value) - 1; }
		constexpr uint64_t bits() const { return value; }

		/// Width needed to hold the values 0 .. value inclusive.
		inline static BitWidth last(uint64_t value) { return BitWidth{ utils::Log2C(value + 1) }; }
	};

	inline namespace literals
	{
		constexpr BitWidth operator"" _b(unsigned long long bit) { return BitWidth{ bit }; }
	}

	inline BitWidth operator + (BitWidth l, BitWidth r) { return BitWidth{ l.value + r.value }; }
	inline BitWidth operator * (BitWidth l, uint64_t r) { return BitWidth{ l.value * r }; }
	inline BitWidth operator * (uint64_t l, BitWidth r) { return BitWidth{ l * r.value }; }

	inline std::ostream& operator << (std::ostream& s, BitWidth width)
	{
		s << width.value << 'b';
		return s;
	}
}
