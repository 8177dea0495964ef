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

#include "../utils/Exceptions.h"
#include "../utils/Preprocessor.h"
#include "../utils/BitManipulation.h"
#include "../utils/Range.h"

#include <boost/multiprecision/cpp_int.hpp>

#include <vector>
#include <array>
#include <cstdint>
#include <string_view>
#include <ostream>

namespace ssim::sim {
typedef boost::multiprecision::number<boost::multiprecision::cpp_int_backend<>> BigInt;


struct DefaultConfig
{
	using BaseType = std::uint64_t;
	enum {
		NUM_BITS_PER_BLOCK = sizeof(BaseType)*8
	};
	enum Plane {
		VALUE,
		DEFINED,
		NUM_PLANES
	};
};


/**
 * @brief Arbitrary width vector of bits where every bit additionally carries a defined flag.
 * @details Bit 0 is the least significant bit. A bit whose DEFINED plane is cleared holds no meaningful value
 * (e.g. a register that has not been written since power on).
 */
template<class Config>
class BitVectorState
{
	public:
		BitVectorState() = default;

		void resize(size_t size);
		inline size_t size() const { return m_size; }
		inline size_t getNumBlocks() const { return m_values[0].size(); }
		void clear();

		bool get(typename Config::Plane plane, size_t idx = 0) const;
		void set(typename Config::Plane plane, size_t idx, bool bit = true);

		void setRange(typename Config::Plane plane, size_t offset, size_t size, bool bit = true);
		void copyRange(size_t dstOffset, const BitVectorState<Config> &src, size_t srcOffset, size_t size);

		typename Config::BaseType *data(typename Config::Plane plane) { return m_values[plane].data(); }
		const typename Config::BaseType *data(typename Config::Plane plane) const { return m_values[plane].data(); }

		BitVectorState<Config> extract(size_t start, size_t size) const;
		void insert(const BitVectorState& state, size_t offset);

		/// Reads up to 64 bits of one plane starting at offset.
		typename Config::BaseType extract(typename Config::Plane plane, size_t offset, size_t size) const;
		/// Writes up to 64 bits of one plane starting at offset.
		void insert(typename Config::Plane plane, size_t offset, size_t size, typename Config::BaseType value);

		bool operator == (const BitVectorState& o) const;
	protected:
		size_t m_size = 0;
		std::array<std::vector<typename Config::BaseType>, Config::NUM_PLANES> m_values;
};

using DefaultBitVectorState = BitVectorState<DefaultConfig>;

extern template class BitVectorState<DefaultConfig>;


template<typename Config>
void BitVectorState<Config>::resize(size_t size)
{
	size_t numBlocks = (size + Config::NUM_BITS_PER_BLOCK-1) / Config::NUM_BITS_PER_BLOCK;
	for (auto &plane : m_values)
		plane.resize(numBlocks, 0);

	for (size_t i = size; i < numBlocks * Config::NUM_BITS_PER_BLOCK; i++)
		for (auto &plane : m_values)
			utils::bitClear(plane.data(), i);
	for (size_t i = m_size; i < size; i++)
		for (auto &plane : m_values)
			utils::bitClear(plane.data(), i);

	m_size = size;
}

template<typename Config>
void BitVectorState<Config>::clear()
{
	m_size = 0;
	for (auto &plane : m_values)
		plane.clear();
}

template<typename Config>
bool BitVectorState<Config>::get(typename Config::Plane plane, size_t idx) const
{
	SSIM_ASSERT(idx < m_size);
	return utils::bitExtract(m_values[plane].data(), idx);
}

template<typename Config>
void BitVectorState<Config>::set(typename Config::Plane plane, size_t idx, bool bit)
{
	SSIM_ASSERT(idx < m_size);
	utils::bitWrite(m_values[plane].data(), idx, bit);
}

template<typename Config>
void BitVectorState<Config>::setRange(typename Config::Plane plane, size_t offset, size_t size, bool bit)
{
	SSIM_ASSERT(offset + size <= m_size);
	for (size_t i = offset; i < offset + size; i++)
		utils::bitWrite(m_values[plane].data(), i, bit);
}

template<typename Config>
void BitVectorState<Config>::copyRange(size_t dstOffset, const BitVectorState<Config> &src, size_t srcOffset, size_t size)
{
	SSIM_ASSERT(dstOffset + size <= m_size);
	SSIM_ASSERT(srcOffset + size <= src.size());
	for (size_t p = 0; p < Config::NUM_PLANES; p++)
		for (size_t i = 0; i < size; i++)
			utils::bitWrite(m_values[p].data(), dstOffset + i, utils::bitExtract(src.m_values[p].data(), srcOffset + i));
}

template<typename Config>
BitVectorState<Config> BitVectorState<Config>::extract(size_t start, size_t size) const
{
	BitVectorState<Config> result;
	result.resize(size);
	result.copyRange(0, *this, start, size);
	return result;
}

template<typename Config>
void BitVectorState<Config>::insert(const BitVectorState& state, size_t offset)
{
	copyRange(offset, state, 0, state.size());
}

template<typename Config>
typename Config::BaseType BitVectorState<Config>::extract(typename Config::Plane plane, size_t offset, size_t size) const
{
	SSIM_ASSERT(size <= Config::NUM_BITS_PER_BLOCK);
	SSIM_ASSERT(offset + size <= m_size);

	typename Config::BaseType result = 0;
	for (size_t i = 0; i < size; i++)
		if (utils::bitExtract(m_values[plane].data(), offset + i))
			result |= typename Config::BaseType(1) << i;
	return result;
}

template<typename Config>
void BitVectorState<Config>::insert(typename Config::Plane plane, size_t offset, size_t size, typename Config::BaseType value)
{
	SSIM_ASSERT(size <= Config::NUM_BITS_PER_BLOCK);
	SSIM_ASSERT(offset + size <= m_size);

	for (size_t i = 0; i < size; i++)
		utils::bitWrite(m_values[plane].data(), offset + i, utils::bitExtract(value, i));
}

template<typename Config>
bool BitVectorState<Config>::operator==(const BitVectorState& o) const
{
	if (m_size != o.m_size)
		return false;
	return m_values == o.m_values;
}


template<typename Config>
bool allDefined(const BitVectorState<Config> &vec, size_t start = 0ull, size_t size = ~0ull) {
	size = std::min(size, vec.size()-start);
	for (size_t i = start; i < start+size; i++)
		if (!vec.get(Config::DEFINED, i)) return false;
	return true;
}

template<typename Config>
bool anyDefined(const BitVectorState<Config> &vec, size_t start = 0ull, size_t size = ~0ull) {
	size = std::min(size, vec.size()-start);
	for (size_t i = start; i < start+size; i++)
		if (vec.get(Config::DEFINED, i)) return true;
	return false;
}

/// True if every bit of the value plane in the range is cleared, regardless of definedness.
template<typename Config>
bool allZero(const BitVectorState<Config> &vec, typename Config::Plane plane, size_t start = 0ull, size_t size = ~0ull) {
	size = std::min(size, vec.size()-start);
	for (size_t i = start; i < start+size; i++)
		if (vec.get(plane, i)) return false;
	return true;
}


template<typename Config>
BigInt extractBigInt(const BitVectorState<Config> &vec, size_t offset, size_t size)
{
	SSIM_ASSERT(offset + size <= vec.size());

	std::vector<std::uint64_t> words;
	words.reserve((size + 63) / 64);
	for (size_t i = 0; i < size; i += 64)
		words.push_back(vec.extract(Config::VALUE, offset + i, std::min<size_t>(64, size - i)));

	BigInt result;
	import_bits(result, words.begin(), words.end(), 64, false);
	return result;
}

template<typename Config>
BigInt extractBigInt(const BitVectorState<Config>& vec) {
	return extractBigInt(vec, 0, vec.size());
}

template<typename Config>
void insertBigInt(BitVectorState<Config> &vec, size_t offset, size_t size, BigInt v)
{
	SSIM_ASSERT(offset + size <= vec.size());

	std::vector<std::uint64_t> words;
	export_bits(v, std::back_inserter(words), 64, false);

	for (size_t i = 0; i < size; i += 64) {
		size_t chunk = std::min<size_t>(64, size - i);
		std::uint64_t word = i/64 < words.size() ? words[i/64] : 0;
		vec.insert(Config::VALUE, offset + i, chunk, word);
		vec.insert(Config::DEFINED, offset + i, chunk, ~0ull);
	}
}

extern template BigInt extractBigInt<DefaultConfig>(const BitVectorState<DefaultConfig> &, size_t, size_t);
extern template void insertBigInt(BitVectorState<DefaultConfig> &, size_t, size_t, BigInt);


/// All bits defined and holding the low bits of value.
DefaultBitVectorState createDefaultBitVectorState(std::size_t bitWidth, std::uint64_t value);
/// All bits defined and holding the low bits of value.
DefaultBitVectorState createDefaultBitVectorState(std::size_t bitWidth, const BigInt &value);
/// All bits undefined.
DefaultBitVectorState createUndefinedBitVectorState(std::size_t bitWidth);

/// Parses a string of '0', '1' and 'x'/'X' characters, most significant bit first. Underscores are ignored.
DefaultBitVectorState parseBitVector(std::string_view value);


/// A single bit together with its defined flag.
struct LogicBit
{
	bool value = false;
	bool defined = false;

	static LogicBit known(bool value) { return { value, true }; }
	static LogicBit undefined() { return {}; }

	bool isHigh() const { return defined && value; }
	bool isLow() const { return defined && !value; }

	bool operator == (const LogicBit &) const = default;
};

/// A defined low operand dominates, everything else involving an undefined operand is undefined.
inline LogicBit operator & (LogicBit lhs, LogicBit rhs) {
	if (lhs.isLow() || rhs.isLow())
		return LogicBit::known(false);
	if (lhs.defined && rhs.defined)
		return LogicBit::known(true);
	return LogicBit::undefined();
}

/// A defined high operand dominates, everything else involving an undefined operand is undefined.
inline LogicBit operator | (LogicBit lhs, LogicBit rhs) {
	if (lhs.isHigh() || rhs.isHigh())
		return LogicBit::known(true);
	if (lhs.defined && rhs.defined)
		return LogicBit::known(false);
	return LogicBit::undefined();
}

inline LogicBit operator ^ (LogicBit lhs, LogicBit rhs) {
	return { lhs.value != rhs.value, lhs.defined && rhs.defined };
}

inline LogicBit operator ~ (LogicBit bit) {
	return { !bit.value, bit.defined };
}

std::ostream& operator << (std::ostream& s, LogicBit bit);

inline LogicBit getBit(const DefaultBitVectorState &state, size_t idx) {
	return { state.get(DefaultConfig::VALUE, idx), state.get(DefaultConfig::DEFINED, idx) };
}

inline void setBit(DefaultBitVectorState &state, size_t idx, LogicBit bit) {
	state.set(DefaultConfig::VALUE, idx, bit.value);
	state.set(DefaultConfig::DEFINED, idx, bit.defined);
}


template<typename Config>
std::ostream& operator << (std::ostream& s, const BitVectorState<Config>& state)
{
	for (auto i : utils::Range(state.size())) {
		auto bitIdx = state.size() - 1 - i;
		if (!state.get(Config::DEFINED, bitIdx))
			s << "X";
		else
			s << (state.get(Config::VALUE, bitIdx) ? '1' : '0');
	}
	return s;
}

}
