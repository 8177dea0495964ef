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

BOOST_AUTO_TEST_SUITE(LoggingTests)

BOOST_AUTO_TEST_CASE(DefaultBackendIsSilent)
{
	dbg::logDisable();
	dbg::log(dbg::LogMessage{"nobody hears this"});
	BOOST_TEST(dbg::howToReachLog().find("Logging disabled") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(StreamBackendFormatsAndFilters)
{
	std::stringstream stream;
	dbg::logToStream(stream, dbg::LogMessage::LOG_WARNING);

	hlim::Node_Pin pin("START", 1_b, 0);

	dbg::log(dbg::LogMessage{} << dbg::LogMessage::LOG_INFO << "filtered");
	dbg::log(dbg::LogMessage{} << dbg::LogMessage::LOG_WARNING << dbg::LogMessage::LOG_SIMULATION
			<< "Undefined input " << pin << " at tick " << std::uint64_t(3));

	dbg::logDisable();

	BOOST_TEST(stream.str() == "[warning/simulation] Undefined input START at tick 3\n");
}

BOOST_AUTO_TEST_CASE(UnwritableLogFile)
{
	BOOST_CHECK_THROW(dbg::logToFile("/nonexistent/dir/serialsim.log"), ssim::utils::ConfigurationError);
	// Falls back to the silent backend.
	dbg::log(dbg::LogMessage{"still works"});
	BOOST_TEST(dbg::howToReachLog().find("Logging disabled") != std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()
