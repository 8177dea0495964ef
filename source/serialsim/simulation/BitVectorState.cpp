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
#include "serialsim/pch.h"
#include "BitVectorState.h"

namespace ssim::sim {

template class BitVectorState<DefaultConfig>;

template void insertBigInt(BitVectorState<DefaultConfig> &, size_t, size_t, BigInt);
template BigInt extractBigInt<DefaultConfig>(const BitVectorState<DefaultConfig> &, size_t, size_t);

DefaultBitVectorState createDefaultBitVectorState(std::size_t bitWidth, std::uint64_t value)
{
	DefaultBitVectorState state;
	state.resize(bitWidth);
	state.setRange(DefaultConfig::DEFINED, 0, bitWidth);
	state.insert(DefaultConfig::VALUE, 0, std::min<size_t>(bitWidth, 64), value);
	return state;
}

DefaultBitVectorState createDefaultBitVectorState(std::size_t bitWidth, const BigInt &value)
{
	DefaultBitVectorState state;
	state.resize(bitWidth);
	insertBigInt(state, 0, bitWidth, value);
	return state;
}

DefaultBitVectorState createUndefinedBitVectorState(std::size_t bitWidth)
{
	DefaultBitVectorState state;
	state.resize(bitWidth);
	return state;
}

std::ostream& operator << (std::ostream& s, LogicBit bit)
{
	if (!bit.defined)
		return s << 'X';
	return s << (bit.value ? '1' : '0');
}

DefaultBitVectorState parseBitVector(std::string_view value)
{
	size_t width = 0;
	for (char c : value)
		if (c != '_')
			width++;

	DefaultBitVectorState ret;
	ret.resize(width);

	size_t bitIdx = width;
	for (char c : value) {
		if (c == '_')
			continue;
		SSIM_DESIGNCHECK_HINT(c == '0' || c == '1' || c == 'x' || c == 'X', std::string("invalid character in bit vector: ") + c);
		bitIdx--;
		ret.set(DefaultConfig::VALUE, bitIdx, c == '1');
		ret.set(DefaultConfig::DEFINED, bitIdx, c == '0' || c == '1');
	}
	return ret;
}

}
