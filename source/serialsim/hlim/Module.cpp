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
#include "Module.h"

#include "../simulation/SimulatorCallbacks.h"
#include "../debug/DebugInterface.h"

namespace ssim::hlim {

Module::Module(std::string name, Clock &clock) : m_name(std::move(name)), m_clock(&clock)
{
}

BaseNode *Module::findNode(std::string_view name) const
{
	for (auto *node : m_nodes)
		if (node->getName() == name)
			return node;
	return nullptr;
}

void Module::addNode(BaseNode &node)
{
	SSIM_ASSERT_HINT(findNode(node.getName()) == nullptr, "Duplicate node name " + node.getName() + " in module " + m_name);
	m_nodes.push_back(&node);
}

void Module::simulatePowerOn()
{
	for (auto *node : m_nodes)
		node->simulatePowerOn();
}

void Module::simulateAdvance()
{
	for (auto *node : m_nodes)
		node->simulateAdvance();
}

void Module::reportViolation(sim::SimulatorCallbacks &simCallbacks, std::uint64_t tick, std::string message) const
{
	dbg::log(dbg::LogMessage{} << dbg::LogMessage::LOG_WARNING << dbg::LogMessage::LOG_SIMULATION
			<< m_name << " tick " << tick << ": " << message);

	simCallbacks.onProtocolViolation(sim::ProtocolViolation{
		.module = m_name,
		.tick = tick,
		.message = std::move(message),
	});
}

bool Module::sampleControl(sim::SimulatorCallbacks &simCallbacks, std::uint64_t tick, const Node_Pin &pin, bool inactiveLevel) const
{
	sim::LogicBit bit = pin.bit();
	if (!bit.defined) {
		reportViolation(simCallbacks, tick, "Control input " + pin.getName() + " is undefined, treating it as inactive.");
		return inactiveLevel;
	}
	return bit.value;
}

sim::DefaultBitVectorState Module::sampleOperand(const Node_Pin &pin) const
{
	sim::DefaultBitVectorState state = pin.value();
	for (auto i : utils::Range(state.size()))
		if (!state.get(sim::DefaultConfig::DEFINED, i)) {
			state.set(sim::DefaultConfig::VALUE, i, false);
			state.set(sim::DefaultConfig::DEFINED, i, true);
		}
	return state;
}

bool Module::checkOperandDefined(sim::SimulatorCallbacks &simCallbacks, std::uint64_t tick, const Node_Pin &pin) const
{
	if (sim::allDefined(pin.value()))
		return true;

	reportViolation(simCallbacks, tick, "Operand " + pin.getName() + " has undefined bits, they are taken as zero.");
	return false;
}

}
