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

#include "../WaveformRecorder.h"
#include "VCDWriter.h"

#include <map>
#include <string>
#include <vector>

namespace ssim::sim {

/**
 * @brief Writes the recorded nodes of a simulation run into a VCD file.
 * @details Every module becomes a VCD scope. Clocks are drawn as square waves in a separate scope, and protocol
 * violations are written as strings into a synthetic scope.
 */
class VCDSink : public WaveformRecorder
{
	public:
		VCDSink(const hlim::Circuit &circuit, Simulator &simulator, const char *filename);
		virtual ~VCDSink() override;

		virtual void onProtocolViolation(const ProtocolViolation &violation) override;
		virtual void onClock(const hlim::Clock *clock) override;
		virtual void onCommitState() override;
	protected:
		VCDWriter m_VCD;

		std::vector<std::string> m_id2sigCode;
		std::map<const hlim::Clock*, std::string> m_clock2code;
		std::multimap<hlim::ClockRational, const hlim::Clock*, bool(*)(const hlim::ClockRational&, const hlim::ClockRational&)> m_pendingFallingEdges;
		size_t m_commitCounter = 0;

		std::string m_violationsID;

		virtual void initialize() override;
		virtual void signalChanged(size_t id) override;
		virtual void advanceTick(const hlim::ClockRational &simulationTime) override;

		static size_t toPicoseconds(const hlim::ClockRational &time);
};

}
