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
#include "WaveformRecorder.h"

#include "Simulator.h"

#include "../hlim/Circuit.h"
#include "../hlim/Module.h"
#include "../hlim/Node_Pin.h"
#include "../hlim/Node_SignalTap.h"
#include "../utils/Range.h"

namespace ssim::sim {

WaveformRecorder::WaveformRecorder(const hlim::Circuit &circuit, Simulator &simulator) : m_circuit(circuit), m_simulator(simulator)
{
	m_simulator.addCallbacks(this);
}

WaveformRecorder::~WaveformRecorder()
{
	m_simulator.removeCallbacks(this);
}

void WaveformRecorder::addNode(const hlim::Module &module, const hlim::BaseNode &node)
{
	SSIM_DESIGNCHECK_HINT(!m_initialized, "Waveform signals must be added before power on");

	if (m_alreadyAddedNodes.contains(&node))
		return;

	m_alreadyAddedNodes[&node] = m_id2Signal.size();
	m_id2Signal.push_back({
		.name = node.getName(),
		.module = &module,
		.node = &node,
		.isText = node.hasTextState(),
	});
}

void WaveformRecorder::addModule(const hlim::Module &module)
{
	for (auto *node : module.getNodes())
		addNode(module, *node);
}

void WaveformRecorder::addAllModules()
{
	for (auto &module : m_circuit.getModules())
		addModule(*module);
}

void WaveformRecorder::addAllPins()
{
	for (auto &module : m_circuit.getModules())
		for (auto *node : module->getNodes())
			if (dynamic_cast<const hlim::Node_Pin*>(node))
				addNode(*module, *node);
}

void WaveformRecorder::addAllTaps()
{
	for (auto &module : m_circuit.getModules())
		for (auto *node : module->getNodes())
			if (dynamic_cast<const hlim::Node_SignalTap*>(node))
				addNode(*module, *node);
}

void WaveformRecorder::onAfterPowerOn()
{
	initializeStates();
	initialize();
	m_initialized = true;
}

void WaveformRecorder::initializeStates()
{
	size_t totalSize = 0;

	m_id2StateOffsetSize.resize(m_id2Signal.size());
	for (auto id : utils::Range(m_id2Signal.size())) {
		size_t size = m_id2Signal[id].node->getWidth().bits();
		m_id2StateOffsetSize[id].offset = totalSize;
		m_id2StateOffsetSize[id].size = size;
		totalSize += size;
	}
	m_trackedState.resize(totalSize);
	m_trackedState.setRange(DefaultConfig::DEFINED, 0, totalSize, false);

	m_id2TextState.clear();
	m_id2TextState.resize(m_id2Signal.size());
}

void WaveformRecorder::onCommitState()
{
	if (!m_initialized)
		return;

	for (auto id : utils::Range(m_id2Signal.size())) {
		auto &signal = m_id2Signal[id];

		if (signal.isText) {
			std::string text = signal.node->getTextState();
			if (text != m_id2TextState[id]) {
				m_id2TextState[id] = std::move(text);
				signalChanged(id);
			}
			continue;
		}

		auto offset = m_id2StateOffsetSize[id].offset;
		auto size = m_id2StateOffsetSize[id].size;

		DefaultBitVectorState newState = signal.node->getState();
		SSIM_ASSERT(newState.size() == size);

		bool stateChanged = false;
		for (auto i : utils::Range(size))
			if (newState.get(DefaultConfig::VALUE, i) != m_trackedState.get(DefaultConfig::VALUE, offset+i) ||
				newState.get(DefaultConfig::DEFINED, i) != m_trackedState.get(DefaultConfig::DEFINED, offset+i)) {
				stateChanged = true;
				break;
			}

		if (stateChanged) {
			m_trackedState.copyRange(offset, newState, 0, size);
			signalChanged(id);
		}
	}
}

void WaveformRecorder::onNewTick(const hlim::ClockRational &simulationTime)
{
	if (m_initialized)
		advanceTick(simulationTime);
}

}
