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

#include <optional>

namespace ssim::hlim {

/**
 * @brief What happens to the bit leaving a register at the LSB end during a shift.
 * @details Shifts always move bits towards the LSB (index 0).
 */
enum class ShiftMode {
	ROTATE,			///< The old LSB re-enters at the MSB.
	SHIFT_DISCARD	///< The old LSB is dropped, a serial input bit enters at the MSB.
};

/// Write request for one clock edge. Precedence is clear > load > shift > hold.
struct RegisterDrive
{
	bool clear = false;
	bool load = false;
	sim::DefaultBitVectorState loadValue;
	bool shift = false;
	/// Must be given for SHIFT_DISCARD registers when shifting and must be empty for ROTATE registers.
	std::optional<sim::LogicBit> serialIn;
};

/**
 * @brief N bit register with synchronous clear, parallel load, and shift.
 * @details Powers on undefined. At most one drive can be staged per clock edge, registers that are not driven hold their value.
 */
class ClockedRegister : public BaseNode
{
	public:
		ClockedRegister(std::string name, BitWidth width, ShiftMode mode);

		virtual std::string getTypeName() const override { return "Register"; }
		virtual sim::DefaultBitVectorState getState() const override { return m_value; }

		virtual void simulatePowerOn() override;
		virtual void simulateAdvance() override;

		void stage(const RegisterDrive &drive);
		void stageClear();
		void stageLoad(const sim::DefaultBitVectorState &value);
		void stageShift(std::optional<sim::LogicBit> serialIn = {});

		inline ShiftMode getShiftMode() const { return m_mode; }

		inline const sim::DefaultBitVectorState &value() const { return m_value; }
		inline sim::LogicBit bit(size_t idx) const { return sim::getBit(m_value, idx); }
		inline sim::LogicBit lsb() const { return bit(0); }
		inline sim::LogicBit msb() const { return bit(m_value.size()-1); }

		inline bool isDefined() const { return sim::allDefined(m_value); }
		/// Defined high if all bits are defined low, defined low if any bit is defined high, otherwise undefined.
		sim::LogicBit isZero() const;
		/// Value plane interpreted as unsigned integer. Undefined bits read as whatever they hold.
		sim::BigInt toBigInt() const { return sim::extractBigInt(m_value); }
	protected:
		ShiftMode m_mode;
		sim::DefaultBitVectorState m_value;
		sim::DefaultBitVectorState m_next;
		bool m_staged = false;

		void computeShift(std::optional<sim::LogicBit> serialIn);
};

}
