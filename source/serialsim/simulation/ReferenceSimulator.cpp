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
#include "ReferenceSimulator.h"

#include "../hlim/Circuit.h"
#include "../hlim/Module.h"
#include "../debug/DebugInterface.h"
#include "../utils/Preprocessor.h"

#include <algorithm>

namespace ssim::sim {

ReferenceSimulator::ReferenceSimulator()
{
}

ReferenceSimulator::~ReferenceSimulator()
{
	// Processes may hold references into the circuit, tear them down first.
	m_simulationCoroutineHandler.stopAll();
}

void ReferenceSimulator::compileProgram(const hlim::Circuit &circuit)
{
	m_circuit = &circuit;
	m_clockDomains.clear();
	m_poweredOn = false;

	for (const auto &clock : circuit.getClocks())
		m_clockDomains.push_back({ .clock = clock.get() });

	for (const auto &module : circuit.getModules()) {
		auto it = std::find_if(m_clockDomains.begin(), m_clockDomains.end(), [&](const ClockDomain &d) {
			return d.clock == &module->getClock();
		});
		SSIM_DESIGNCHECK_HINT(it != m_clockDomains.end(), "Module " + module->getName() + " is driven by a clock that is not part of the circuit");
		it->modules.push_back(module.get());
	}
}

void ReferenceSimulator::powerOn()
{
	SSIM_DESIGNCHECK_HINT(m_circuit != nullptr, "compileProgram must be called before powerOn");

	m_simulationCoroutineHandler.stopAll();
	m_simulationTime = 0;
	m_abortCalled = false;
	m_poweredOn = true;

	dbg::changeState(dbg::State::SIMULATION);
	dbg::log(dbg::LogMessage{} << dbg::LogMessage::LOG_INFO << dbg::LogMessage::LOG_SIMULATION
			<< "Power on of " << m_circuit->getModules().size() << " modules on "
			<< m_clockDomains.size() << " clocks");

	m_callbackDispatcher.onPowerOn();

	for (auto &domain : m_clockDomains) {
		domain.ticks = 0;
		for (auto *module : domain.modules)
			module->simulatePowerOn();
	}

	m_callbackDispatcher.onAfterPowerOn();

	for (auto &proc : m_simProcs)
		m_simulationCoroutineHandler.start(proc);
	m_simulationCoroutineHandler.run();

	commitState();
}

void ReferenceSimulator::commitState()
{
	m_callbackDispatcher.onCommitState();
}

hlim::ClockRational ReferenceSimulator::nextEdgeTime() const
{
	SSIM_DESIGNCHECK_HINT(!m_clockDomains.empty(), "Cannot advance a simulation without clocks");

	hlim::ClockRational earliest = m_clockDomains.front().clock->edgeTime(m_clockDomains.front().ticks + 1);
	for (const auto &domain : m_clockDomains) {
		auto t = domain.clock->edgeTime(domain.ticks + 1);
		if (hlim::clockLess(t, earliest))
			earliest = t;
	}
	return earliest;
}

void ReferenceSimulator::advanceEvent()
{
	SSIM_DESIGNCHECK_HINT(m_poweredOn, "powerOn must be called before advancing the simulation");

	m_simulationTime = nextEdgeTime();
	m_callbackDispatcher.onNewTick(m_simulationTime);

	std::vector<ClockDomain*> triggered;
	for (auto &domain : m_clockDomains)
		if (domain.clock->edgeTime(domain.ticks + 1) == m_simulationTime)
			triggered.push_back(&domain);

	// All modules compute their next state from the same snapshot before any of them commits.
	for (auto *domain : triggered)
		for (auto *module : domain->modules)
			module->simulateEvaluate(m_callbackDispatcher, domain->ticks + 1);

	for (auto *domain : triggered) {
		for (auto *module : domain->modules)
			module->simulateAdvance();
		domain->ticks++;
	}

	for (auto *domain : triggered) {
		m_callbackDispatcher.onClock(domain->clock);
		m_simulationCoroutineHandler.clockTriggered(domain->clock);
	}

	m_simulationCoroutineHandler.run();

	commitState();
}

void ReferenceSimulator::advance(hlim::ClockRational seconds)
{
	hlim::ClockRational targetTime = m_simulationTime + seconds;

	while (!m_abortCalled) {
		if (hlim::clockLess(targetTime, nextEdgeTime()))
			break;
		advanceEvent();
	}

	if (!m_abortCalled)
		m_simulationTime = targetTime;
	else
		dbg::log(dbg::LogMessage{} << dbg::LogMessage::LOG_INFO << dbg::LogMessage::LOG_SIMULATION
				<< "Simulation aborted");
}

void ReferenceSimulator::abort()
{
	m_abortCalled = true;
}

std::uint64_t ReferenceSimulator::getTickCount(const hlim::Clock &clock) const
{
	for (const auto &domain : m_clockDomains)
		if (domain.clock == &clock)
			return domain.ticks;

	SSIM_DESIGNCHECK_HINT(false, "Clock " + clock.getName() + " is not part of the simulated circuit");
	return 0;
}

void ReferenceSimulator::addSimulationProcess(std::function<SimulationFunction<void>()> simProc)
{
	m_simProcs.push_back(std::move(simProc));
}

}
