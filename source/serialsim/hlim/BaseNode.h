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

#include "../frontend/BitWidth.h"
#include "../simulation/BitVectorState.h"

#include <string>

namespace ssim::hlim {

/**
 * @brief Base class for everything in a circuit that holds or exposes a value.
 * @details Stateful nodes follow a two step protocol: During evaluation the owning module stages the next value
 * while all reads still return the current one. simulateAdvance() then commits the staged value.
 */
class BaseNode
{
	public:
		BaseNode(std::string name, BitWidth width);
		virtual ~BaseNode() = default;

		BaseNode(const BaseNode &) = delete;
		BaseNode &operator=(const BaseNode &) = delete;

		inline const std::string &getName() const { return m_name; }
		inline BitWidth getWidth() const { return m_width; }

		virtual std::string getTypeName() const = 0;

		/// Current (committed) value.
		virtual sim::DefaultBitVectorState getState() const = 0;
		/// Nodes with symbolic values (e.g. fsm states) return true and report them through getTextState().
		virtual bool hasTextState() const { return false; }
		virtual std::string getTextState() const { return {}; }

		virtual void simulatePowerOn() { }
		virtual void simulateAdvance() { }
	protected:
		std::string m_name;
		BitWidth m_width;
};

}
