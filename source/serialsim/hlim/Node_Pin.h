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

#include "BaseNode.h"

namespace ssim::hlim {

/**
 * @brief Input port of a module, driven from outside the circuit (e.g. by a simulation process).
 * @details Writes take effect immediately and are sampled by the owning module at its next clock edge.
 */
class Node_Pin : public BaseNode
{
	public:
		/// Pin that powers on undefined.
		Node_Pin(std::string name, BitWidth width);
		/// Pin that powers on with a defined value.
		Node_Pin(std::string name, BitWidth width, std::uint64_t powerOnValue);

		virtual std::string getTypeName() const override { return "Pin"; }
		virtual sim::DefaultBitVectorState getState() const override { return m_value; }
		virtual void simulatePowerOn() override;

		void set(const sim::DefaultBitVectorState &state);
		void set(std::uint64_t value);
		void set(const sim::BigInt &value);
		void set(sim::LogicBit bit);
		void setUndefined();

		inline const sim::DefaultBitVectorState &value() const { return m_value; }
		inline sim::LogicBit bit(size_t idx = 0) const { return sim::getBit(m_value, idx); }
	protected:
		sim::DefaultBitVectorState m_powerOnValue;
		sim::DefaultBitVectorState m_value;
};

}
