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
#include "SimulationProcess.h"

namespace ssim::sim {

thread_local SimulationCoroutineHandler *SimulationCoroutineHandler::activeHandler = nullptr;

SimulationCoroutineHandler::~SimulationCoroutineHandler()
{
	stopAll();
}

void SimulationCoroutineHandler::start(std::function<SimulationFunction<void>()> functor)
{
	// Invoke a heap copy of the functor so that the coroutine frame refers to captures that outlive the caller's copy.
	auto functorInstance = std::make_unique<std::function<SimulationFunction<void>()>>(std::move(functor));
	auto simFunc = (*functorInstance)();
	SSIM_ASSERT(!simFunc.done());
	simFunc.getHandle().promise().functorInstance = std::move(functorInstance);

	readyToResume(simFunc.getHandle());
	m_simulationCoroutines.push_back(std::move(simFunc));
}

void SimulationCoroutineHandler::stopAll()
{
	auto lastHandler = activeHandler;
	activeHandler = this;
	m_waitingForClock.clear();
	while (!m_coroutinesReadyToResume.empty())
		m_coroutinesReadyToResume.pop();
	m_simulationCoroutines.clear();
	activeHandler = lastHandler;
}

void SimulationCoroutineHandler::waitForClock(std::coroutine_handle<> handle, const hlim::Clock *clock)
{
	m_waitingForClock[clock].push_back(handle);
}

void SimulationCoroutineHandler::clockTriggered(const hlim::Clock *clock)
{
	auto it = m_waitingForClock.find(clock);
	if (it == m_waitingForClock.end())
		return;

	std::vector<std::coroutine_handle<>> waiting;
	std::swap(waiting, it->second);
	for (auto handle : waiting)
		readyToResume(handle);
}

void SimulationCoroutineHandler::run()
{
	auto lastHandler = activeHandler;
	activeHandler = this;
	try {
		while (!m_coroutinesReadyToResume.empty()) {
			auto handle = m_coroutinesReadyToResume.front();
			m_coroutinesReadyToResume.pop();
			handle.resume();
		}
	} catch (...) {
		activeHandler = lastHandler;
		throw;
	}
	activeHandler = lastHandler;
}

size_t SimulationCoroutineHandler::numRunningProcesses() const
{
	size_t count = 0;
	for (const auto &proc : m_simulationCoroutines)
		if (!proc.done())
			count++;
	return count;
}

}
