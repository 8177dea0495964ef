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
#include "VCDSink.h"

#include "../Simulator.h"
#include "../../hlim/Circuit.h"
#include "../../hlim/Module.h"
#include "../../utils/Range.h"

#include <boost/format.hpp>

#include <sstream>

namespace ssim::sim
{
	namespace {
		const char *clocksModuleName = "clocks";
		const char *syntheticModuleName = "synthetic";
		const char *violationsLabel = "Protocol_Violations";
	}

	VCDSink::VCDSink(const hlim::Circuit& circuit, Simulator& simulator, const char* filename) :
		WaveformRecorder(circuit, simulator),
		m_VCD(filename),
		m_pendingFallingEdges(&hlim::clockLess)
	{
	}

	VCDSink::~VCDSink()
	{
		m_VCD.flush();
	}

	void VCDSink::onProtocolViolation(const ProtocolViolation &violation)
	{
		if (!m_initialized) return;

		std::stringstream text;
		text << violation;
		m_VCD.writeString(m_violationsID, text.str());
	}

	class VCDIdentifierGenerator {
	public:
		enum {
			IDENT_BEG = 33,
			IDENT_END = 127
		};
		VCDIdentifierGenerator()
		{
			m_nextIdentifier.reserve(10);
			m_nextIdentifier.resize(1);
			m_nextIdentifier[0] = IDENT_BEG;
		}
		std::string getIdentifer()
		{
			std::string res = m_nextIdentifier;

			unsigned idx = 0;
			while(true) {
				if(idx >= m_nextIdentifier.size()) {
					m_nextIdentifier.push_back(IDENT_BEG);
					break;
				}
				else {
					m_nextIdentifier[idx]++;
					if(m_nextIdentifier[idx] >= IDENT_END) {
						m_nextIdentifier[idx] = IDENT_BEG;
						idx++;
					}
					else break;
				}
			}

			return res;
		}
	protected:
		std::string m_nextIdentifier;
	};

	void VCDSink::initialize()
	{
		VCDIdentifierGenerator identifierGenerator;
		m_id2sigCode.resize(m_id2Signal.size());

		std::map<const hlim::Module*, std::vector<size_t>> module2ids;
		std::vector<const hlim::Module*> moduleOrder;
		for (auto id : utils::Range(m_id2Signal.size())) {
			m_id2sigCode[id] = identifierGenerator.getIdentifer();
			auto *module = m_id2Signal[id].module;
			if (!module2ids.contains(module))
				moduleOrder.push_back(module);
			module2ids[module].push_back(id);
		}

		for (auto *module : moduleOrder) {
			auto named_module = m_VCD.beginModule(module->getName());
			for (auto id : module2ids[module]) {
				auto &signal = m_id2Signal[id];
				if (signal.isText)
					m_VCD.declareString(m_id2sigCode[id], signal.name);
				else
					m_VCD.declareWire(signal.node->getWidth().bits(), m_id2sigCode[id], signal.name);
			}
		}

		{
			auto clocks_module = m_VCD.beginModule(clocksModuleName);
			for (auto &clk : m_circuit.getClocks()) {
				std::string id = identifierGenerator.getIdentifer();
				m_clock2code[clk.get()] = id;
				m_VCD.declareWire(1, id, clk->getName());
			}
		}

		{
			auto synthetic_module = m_VCD.beginModule(syntheticModuleName);
			m_violationsID = identifierGenerator.getIdentifer();
			m_VCD.declareString(m_violationsID, violationsLabel);
		}

		{
			auto dumpvars = m_VCD.beginDumpVars();
			for (auto &c : m_clock2code)
				m_VCD.writeBitState(c.second, true, false);
		}
		m_VCD.writeTime(0);
	}

	void VCDSink::signalChanged(size_t id)
	{
		const auto& signal = m_id2Signal[id];
		const auto& offsetSize = m_id2StateOffsetSize[id];
		if (signal.isText)
			m_VCD.writeString(m_id2sigCode[id], m_id2TextState[id]);
		else if (offsetSize.size == 1)
			m_VCD.writeBitState(m_id2sigCode[id],
				m_trackedState.get(DefaultConfig::DEFINED, offsetSize.offset),
				m_trackedState.get(DefaultConfig::VALUE, offsetSize.offset)
			);
		else
			m_VCD.writeState(m_id2sigCode[id], m_trackedState, offsetSize.offset, offsetSize.size);
	}

	size_t VCDSink::toPicoseconds(const hlim::ClockRational &time)
	{
		return hlim::floor(time * hlim::ClockRational(1'000'000'000'000ull, 1));
	}

	void VCDSink::advanceTick(const hlim::ClockRational& simulationTime)
	{
		// Falling edges lie between the rising edges that the simulator steps through.
		while (!m_pendingFallingEdges.empty() && hlim::clockLess(m_pendingFallingEdges.begin()->first, simulationTime)) {
			auto time = m_pendingFallingEdges.begin()->first;
			m_VCD.writeTime(toPicoseconds(time));
			while (!m_pendingFallingEdges.empty() && m_pendingFallingEdges.begin()->first == time) {
				m_VCD.writeBitState(m_clock2code[m_pendingFallingEdges.begin()->second], true, false);
				m_pendingFallingEdges.erase(m_pendingFallingEdges.begin());
			}
		}

		m_VCD.writeTime(toPicoseconds(simulationTime));
	}

	void VCDSink::onClock(const hlim::Clock* clock)
	{
		if (!m_initialized) return;

		auto it = m_clock2code.find(clock);
		if (it != m_clock2code.end()) {
			m_VCD.writeBitState(it->second, true, true);
			m_pendingFallingEdges.insert({m_simulator.getCurrentSimulationTime() + clock->period() / hlim::ClockRational(2), clock});
		}
	}

	void VCDSink::onCommitState()
	{
		WaveformRecorder::onCommitState();

		if (m_commitCounter++ % 128 == 0)
			m_VCD.flush();
	}
}
