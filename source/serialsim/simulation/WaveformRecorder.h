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
#pragma once

#include "SimulatorCallbacks.h"
#include "BitVectorState.h"

#include <map>
#include <string>
#include <vector>

namespace ssim::hlim {
	class Circuit;
	class Module;
	class BaseNode;
}

namespace ssim::sim {

class Simulator;

/**
 * @brief Base class for waveform recorders (e.g. to write VCD files of a simulation run).
 * @details Nodes must be added before power on. After every committed state, the recorder compares each node's
 * value with the last recorded one and reports changes through signalChanged().
 */
class WaveformRecorder : public SimulatorCallbacks
{
	public:
		WaveformRecorder(const hlim::Circuit &circuit, Simulator &simulator);
		virtual ~WaveformRecorder() override;

		void addNode(const hlim::Module &module, const hlim::BaseNode &node);
		void addModule(const hlim::Module &module);
		void addAllModules();
		void addAllPins();
		void addAllTaps();

		virtual void onAfterPowerOn() override;
		virtual void onCommitState() override;
		virtual void onNewTick(const hlim::ClockRational &simulationTime) override;
	protected:
		const hlim::Circuit &m_circuit;
		Simulator &m_simulator;
		bool m_initialized = false;

		struct StateOffsetSize {
			size_t offset, size;
		};
		struct Signal {
			std::string name;
			const hlim::Module *module;
			const hlim::BaseNode *node;
			bool isText;
		};
		std::vector<StateOffsetSize> m_id2StateOffsetSize;
		std::vector<Signal> m_id2Signal;
		std::vector<std::string> m_id2TextState;
		DefaultBitVectorState m_trackedState;
		std::map<const hlim::BaseNode*, size_t> m_alreadyAddedNodes;

		void initializeStates();
		virtual void initialize() = 0;
		virtual void signalChanged(size_t id) = 0;
		virtual void advanceTick(const hlim::ClockRational &simulationTime) = 0;
};

}
