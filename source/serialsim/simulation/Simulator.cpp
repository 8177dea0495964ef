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
#include "Simulator.h"

#include <algorithm>

namespace ssim::sim {

void Simulator::removeCallbacks(SimulatorCallbacks *simCallbacks)
{
	auto &callbacks = m_callbackDispatcher.m_callbacks;
	callbacks.erase(std::remove(callbacks.begin(), callbacks.end(), simCallbacks), callbacks.end());
}

void Simulator::CallbackDispatcher::onPowerOn()
{
	for (auto *c : m_callbacks) c->onPowerOn();
}

void Simulator::CallbackDispatcher::onAfterPowerOn()
{
	for (auto *c : m_callbacks) c->onAfterPowerOn();
}

void Simulator::CallbackDispatcher::onCommitState()
{
	for (auto *c : m_callbacks) c->onCommitState();
}

void Simulator::CallbackDispatcher::onNewTick(const hlim::ClockRational &simulationTime)
{
	for (auto *c : m_callbacks) c->onNewTick(simulationTime);
}

void Simulator::CallbackDispatcher::onClock(const hlim::Clock *clock)
{
	for (auto *c : m_callbacks) c->onClock(clock);
}

void Simulator::CallbackDispatcher::onProtocolViolation(const ProtocolViolation &violation)
{
	for (auto *c : m_callbacks) c->onProtocolViolation(violation);
}

}
