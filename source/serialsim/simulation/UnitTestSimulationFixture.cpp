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
#include "UnitTestSimulationFixture.h"

#include "ReferenceSimulator.h"

#include <boost/test/unit_test.hpp>

#include "../hlim/Circuit.h"

#include <sstream>

namespace ssim::sim {

UnitTestSimulationFixture::UnitTestSimulationFixture()
{
	m_simulator.reset(new ReferenceSimulator());
	m_simulator->addCallbacks(this);
}

UnitTestSimulationFixture::~UnitTestSimulationFixture()
{
}


void UnitTestSimulationFixture::addSimulationProcess(std::function<SimulationFunction<>()> simProc)
{
	m_simulator->addSimulationProcess(std::move(simProc));
}

void UnitTestSimulationFixture::runTicks(const hlim::Circuit &circuit, const hlim::Clock *clock, unsigned numTicks)
{
	m_simulator->compileProgram(circuit);
	m_simulator->powerOn();
	m_simulator->advance(hlim::ClockRational(numTicks) / clock->absoluteFrequency());
	m_simulator->commitState();

	reportIssues();
}

void UnitTestSimulationFixture::reportIssues()
{
	if (!m_protocolViolationsAllowed && !m_protocolViolations.empty()) {
		std::stringstream msg;
		msg << "Unexpected protocol violation: " << m_protocolViolations.front();
		BOOST_ERROR(msg.str());
	}
}

void UnitTestSimulationFixture::onProtocolViolation(const ProtocolViolation &violation)
{
	m_protocolViolations.push_back(violation);
}

}
