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

using namespace boost::unit_test;
using namespace ssim;

BOOST_AUTO_TEST_SUITE(CounterTests)

BOOST_AUTO_TEST_CASE(HoldAtTop)
{
	hlim::ModularCounter counter("cnt", 0, 3, hlim::WrapPolicy::HOLD_AT_TOP);
	BOOST_TEST(counter.value() == 0u);
	BOOST_TEST(counter.getWidth() == 2_b);

	std::vector<std::uint64_t> seen;
	for ([[maybe_unused]] auto i : ssim::utils::Range(6)) {
		counter.tick(false, true);
		counter.simulateAdvance();
		seen.push_back(counter.value());
	}
	std::vector<std::uint64_t> expected = { 1, 2, 3, 3, 3, 3 };
	BOOST_TEST(seen == expected, boost::test_tools::per_element());
	BOOST_TEST(counter.atTop());
}

BOOST_AUTO_TEST_CASE(WrapToBottom)
{
	hlim::ModularCounter counter("cnt", 2, 4, hlim::WrapPolicy::WRAP_TO_BOTTOM);

	std::vector<std::uint64_t> seen;
	for ([[maybe_unused]] auto i : ssim::utils::Range(5)) {
		counter.tick(false, true);
		counter.simulateAdvance();
		seen.push_back(counter.value());
	}
	std::vector<std::uint64_t> expected = { 3, 4, 2, 3, 4 };
	BOOST_TEST(seen == expected, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(ResetOverridesEnable)
{
	hlim::ModularCounter counter("cnt", 1, 8, hlim::WrapPolicy::HOLD_AT_TOP);
	counter.tick(false, true);
	counter.simulateAdvance();
	counter.tick(false, true);
	counter.simulateAdvance();
	BOOST_TEST(counter.value() == 3u);

	BOOST_TEST(counter.tick(false, false) == 3u);
	counter.simulateAdvance();
	BOOST_TEST(counter.value() == 3u);

	BOOST_TEST(counter.tick(true, true) == 1u);
	BOOST_TEST(counter.value() == 3u);
	counter.simulateAdvance();
	BOOST_TEST(counter.value() == 1u);
}

BOOST_AUTO_TEST_CASE(SingleValueRange)
{
	hlim::ModularCounter counter("cnt", 5, 5, hlim::WrapPolicy::WRAP_TO_BOTTOM);
	BOOST_TEST(counter.atTop());
	counter.tick(false, true);
	counter.simulateAdvance();
	BOOST_TEST(counter.value() == 5u);
}

BOOST_AUTO_TEST_CASE(PowerOnAtBottom)
{
	hlim::ModularCounter counter("cnt", 2, 9, hlim::WrapPolicy::HOLD_AT_TOP);
	counter.tick(false, true);
	counter.simulateAdvance();
	counter.simulatePowerOn();
	BOOST_TEST(counter.value() == 2u);

	counter.tick(false, true);
	BOOST_CHECK_THROW(counter.tick(false, true), ssim::utils::InternalError);
}

BOOST_AUTO_TEST_SUITE_END()
