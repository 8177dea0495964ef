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

#include "Exceptions.h"

#include <cstdint>
#include <cstddef>

namespace ssim::utils
{

template<typename T>
T Log2(T v)
{
	SSIM_ASSERT(v > 0);
	T ret = 0;
	while (v >>= 1)
		++ret;
	return ret;
}

/// Number of bits required to represent the values 0 .. v-1.
template<typename T>
T Log2C(T v)
{
	SSIM_ASSERT(v > 0);
	if (v == 1)
		return 0;

	return Log2(v - 1) + 1;
}


inline bool bitExtract(std::uint64_t a, size_t idx) {
	return a & (1ull << idx);
}

inline bool bitExtract(const std::uint64_t *a, size_t idx) {
	return a[idx/64] & (1ull << (idx % 64));
}

inline void bitSet(std::uint64_t *a, size_t idx) {
	a[idx/64] |= 1ull << (idx % 64);
}

inline void bitClear(std::uint64_t *a, size_t idx) {
	a[idx/64] &= ~(1ull << (idx % 64));
}

inline void bitWrite(std::uint64_t *a, size_t idx, bool value) {
	if (value)
		bitSet(a, idx);
	else
		bitClear(a, idx);
}

}
