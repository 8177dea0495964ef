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

/// Behavior of a counter that is enabled while at its top value.
enum class WrapPolicy {
	HOLD_AT_TOP,
	WRAP_TO_BOTTOM
};

/**
 * @brief Counter over the closed range [bottom, top].
 * @details Powers on at bottom. A synchronous reset returns to bottom and takes precedence over enable.
 */
class ModularCounter : public BaseNode
{
	public:
		ModularCounter(std::string name, std::uint64_t bottom, std::uint64_t top, WrapPolicy policy);

		virtual std::string getTypeName() const override { return "Counter"; }
		virtual sim::DefaultBitVectorState getState() const override;

		virtual void simulatePowerOn() override;
		virtual void simulateAdvance() override;

		/// Stages the value for the next clock edge and returns it.
		std::uint64_t tick(bool reset, bool enable);

		inline std::uint64_t value() const { return m_value; }
		inline bool atTop() const { return m_value == m_top; }
		inline std::uint64_t bottom() const { return m_bottom; }
		inline std::uint64_t top() const { return m_top; }
		inline WrapPolicy getWrapPolicy() const { return m_policy; }
	protected:
		std::uint64_t m_bottom;
		std::uint64_t m_top;
		WrapPolicy m_policy;

		std::uint64_t m_value;
		std::uint64_t m_next;
		bool m_staged = false;
};

}
