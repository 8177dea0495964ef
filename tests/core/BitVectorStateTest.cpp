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
#include "core/pch.h"

#include <boost/test/unit_test.hpp>

#include <sstream>

using namespace boost::unit_test;
using namespace ssim;
using namespace ssim::sim;

BOOST_AUTO_TEST_SUITE(BitVectorStateTests)

BOOST_AUTO_TEST_CASE(ParseBitVector)
{
	auto state = parseBitVector("10x1");
	BOOST_TEST(state.size() == 4);
	BOOST_TEST(getBit(state, 0) == LogicBit::known(true));
	BOOST_TEST(getBit(state, 1) == LogicBit::undefined());
	BOOST_TEST(getBit(state, 2) == LogicBit::known(false));
	BOOST_TEST(getBit(state, 3) == LogicBit::known(true));

	BOOST_TEST(parseBitVector("1100_0011").size() == 8);
	BOOST_CHECK_THROW(parseBitVector("10z"), ssim::utils::DesignError);
}

BOOST_AUTO_TEST_CASE(PrintMsbFirst)
{
	std::stringstream s;
	s << parseBitVector("1x0");
	BOOST_TEST(s.str() == "1X0");
}

BOOST_AUTO_TEST_CASE(DefinedStates)
{
	auto state = createDefaultBitVectorState(8, 0xA5);
	BOOST_TEST(allDefined(state));
	BOOST_TEST(state.extract(DefaultConfig::VALUE, 0, 8) == 0xA5u);
	BOOST_TEST(state.extract(DefaultConfig::VALUE, 4, 4) == 0xAu);

	auto undefined = createUndefinedBitVectorState(8);
	BOOST_TEST(!anyDefined(undefined));

	undefined.insert(state.extract(0, 4), 2);
	BOOST_TEST(anyDefined(undefined));
	BOOST_TEST(!allDefined(undefined));
	BOOST_TEST(undefined.extract(DefaultConfig::VALUE, 2, 4) == 0x5u);
}

BOOST_AUTO_TEST_CASE(WideIntegers)
{
	BigInt value = (BigInt(1) << 129) + 12345;
	auto state = createDefaultBitVectorState(130, value);
	BOOST_TEST(allDefined(state));
	BOOST_TEST(extractBigInt(state) == value);
	BOOST_TEST(state.get(DefaultConfig::VALUE, 129));
	BOOST_TEST(!state.get(DefaultConfig::VALUE, 128));

	BOOST_TEST(extractBigInt(state, 0, 64) == 12345);
}

BOOST_AUTO_TEST_CASE(LogicBitOperators)
{
	auto x = LogicBit::undefined();
	auto zero = LogicBit::known(false);
	auto one = LogicBit::known(true);

	BOOST_TEST((x & zero) == zero);
	BOOST_TEST((x & one) == x);
	BOOST_TEST((x | one) == one);
	BOOST_TEST((x | zero) == x);
	BOOST_TEST(!(x ^ one).defined);
	BOOST_TEST((one ^ one) == zero);
	BOOST_TEST((~zero) == one);
	BOOST_TEST(!(~x).defined);
}

BOOST_AUTO_TEST_SUITE_END()
