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
#include "FrontendUnitTestSimulationFixture.h"

#include <serialsim/debug/DebugInterface.h>

#include <boost/test/unit_test.hpp>


namespace ssim {

UnitTestSimulationFixture::UnitTestSimulationFixture()
{
}

UnitTestSimulationFixture::~UnitTestSimulationFixture()
{
	// Waveform recorder and processes refer to the circuit, tear them down before it goes.
	m_vcdSink.reset();
	m_simulator.reset(nullptr);
	dbg::changeState(dbg::State::DESIGN);
}

void UnitTestSimulationFixture::runTicks(const hlim::Clock& clock, unsigned numTicks)
{
	prepRun();
	sim::UnitTestSimulationFixture::runTicks(circuit, &clock, numTicks);
}

void UnitTestSimulationFixture::recordVCD(const std::string& filename)
{
	m_vcdSink.emplace(circuit, *m_simulator, filename.c_str());
	m_vcdSink->addAllModules();
}

void UnitTestSimulationFixture::stopTest()
{
	m_simulator->abort();
	m_stopTestCalled = true;
}

bool UnitTestSimulationFixture::runHitsTimeout(const hlim::ClockRational &timeoutSeconds)
{
	prepRun();
	m_stopTestCalled = false;
	m_simulator->compileProgram(circuit);
	m_simulator->powerOn();
	m_simulator->advance(timeoutSeconds);
	m_simulator->commitState();

	reportIssues();

	return !m_stopTestCalled;
}

void UnitTestSimulationFixture::prepRun()
{
}

void BoostUnitTestSimulationFixture::runTest(const hlim::ClockRational &timeoutSeconds)
{
	BOOST_CHECK_MESSAGE(!runHitsTimeout(timeoutSeconds), "Simulation timed out without being called to a stop by any simulation process!");
}

void BoostUnitTestSimulationFixture::prepRun()
{
	UnitTestSimulationFixture::prepRun();

	const std::string& filename = boost::unit_test::framework::current_test_case().p_name;
	auto& testSuite = boost::unit_test::framework::master_test_suite();
	for (int i = 1; i < testSuite.argc; i++) {
		std::string_view arg(testSuite.argv[i]);

		if (arg == "--vcd" && !m_vcdSink)
			recordVCD(filename + ".vcd");
	}
}

}
