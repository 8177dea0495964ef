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

#include "ClockedRegister.h"

namespace ssim::hlim {

/**
 * @brief Chain of flip flops that brings an asynchronous input into the clock domain.
 * @details The input enters at the MSB every clock edge, the synchronized value is the LSB and thus
 * reflects the input as it was sampled depth edges ago. Powers on filled with the idle level.
 */
class Synchronizer : public ClockedRegister
{
	public:
		Synchronizer(std::string name, size_t depth = 2, bool idleLevel = false);

		virtual std::string getTypeName() const override { return "Synchronizer"; }
		virtual void simulatePowerOn() override;

		void sample(sim::LogicBit asyncInput) { stageShift(asyncInput); }
		inline sim::LogicBit output() const { return lsb(); }

		inline size_t getDepth() const { return m_width.bits(); }
	protected:
		bool m_idleLevel;
};

}
