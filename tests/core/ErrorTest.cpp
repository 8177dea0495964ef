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

BOOST_AUTO_TEST_SUITE(ErrorTests)

BOOST_AUTO_TEST_CASE(ErrorsCarryLocation)
{
	try {
		SSIM_DESIGNCHECK_HINT(1 + 1 == 3, "arithmetic is broken");
		BOOST_FAIL("no exception thrown");
	} catch (const ssim::utils::DesignError &e) {
		std::string what = e.what();
		BOOST_TEST(what.find("Design failed") != std::string::npos);
		BOOST_TEST(what.find("arithmetic is broken") != std::string::npos);
		BOOST_TEST(what.find("ErrorTest.cpp") != std::string::npos);
		BOOST_TEST(!e.getStackTrace().getTrace().empty());
	}
}

BOOST_AUTO_TEST_CASE(ErrorCategories)
{
	BOOST_CHECK_THROW(SSIM_ASSERT(false), ssim::utils::InternalError);
	BOOST_CHECK_THROW(SSIM_ASSERT(false), std::logic_error);
	BOOST_CHECK_THROW(SSIM_DESIGNCHECK(false), std::runtime_error);
	BOOST_CHECK_THROW(SSIM_CONFIGCHECK(false), ssim::utils::ConfigurationError);
	BOOST_CHECK_THROW(SSIM_CONFIGCHECK(false), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(PrintWithStackTrace)
{
	try {
		SSIM_CONFIGCHECK_HINT(false, "width must not be zero");
	} catch (const ssim::utils::ConfigurationError &e) {
		std::stringstream s;
		s << e;
		BOOST_TEST(s.str().find("Stack trace:") != std::string::npos);
		BOOST_TEST(s.str().find("width must not be zero") != std::string::npos);
	}
}

BOOST_AUTO_TEST_CASE(InvalidGenerics)
{
	hlim::Circuit circuit;
	hlim::ClockConfig stopped{ .name = "stopped", .absoluteFrequency = { 0, 1 } };
	BOOST_CHECK_THROW(circuit.createClock(stopped), ssim::utils::ConfigurationError);

	auto &clock = circuit.createClock({});
	BOOST_CHECK_THROW(circuit.createClock({}), ssim::utils::DesignError);

	BOOST_CHECK_THROW(hlim::ClockedRegister("r", 0_b, hlim::ShiftMode::ROTATE), ssim::utils::ConfigurationError);
	BOOST_CHECK_THROW(hlim::ModularCounter("c", 5, 4, hlim::WrapPolicy::HOLD_AT_TOP), ssim::utils::ConfigurationError);
	BOOST_CHECK_THROW(hlim::Synchronizer("s", 1), ssim::utils::ConfigurationError);

	BOOST_CHECK_THROW(circuit.createModule<scl::arith::BitSerialMultiplier>(clock, scl::arith::BitSerialMultiplierConfig{ .numBits = 0_b }), ssim::utils::ConfigurationError);
	BOOST_CHECK_THROW(circuit.createModule<scl::arith::Gcd>(clock, scl::arith::GcdConfig{ .numBits = 0_b }), ssim::utils::ConfigurationError);
	BOOST_TEST(circuit.getModules().empty());
}

BOOST_AUTO_TEST_CASE(PinRangeChecks)
{
	hlim::Node_Pin pin("A", 4_b);
	BOOST_TEST(!sim::anyDefined(pin.value()));

	pin.set(15);
	BOOST_TEST(pin.value().extract(sim::DefaultConfig::VALUE, 0, 4) == 15u);
	BOOST_CHECK_THROW(pin.set(16), ssim::utils::DesignError);
	BOOST_CHECK_THROW(pin.set(sim::BigInt(16)), ssim::utils::DesignError);
	BOOST_CHECK_THROW(pin.set(sim::LogicBit::known(true)), ssim::utils::DesignError);

	pin.setUndefined();
	BOOST_TEST(!sim::anyDefined(pin.value()));
}

BOOST_AUTO_TEST_SUITE_END()
