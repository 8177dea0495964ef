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

#include <functional>

namespace ssim::hlim {

/**
 * @brief Combinational output of a module.
 * @details The value is computed on demand from the committed state of the module's other nodes.
 */
class Node_SignalTap : public BaseNode
{
	public:
		using Probe = std::function<sim::DefaultBitVectorState()>;

		Node_SignalTap(std::string name, BitWidth width, Probe probe);

		virtual std::string getTypeName() const override { return "SignalTap"; }
		virtual sim::DefaultBitVectorState getState() const override;
	protected:
		Probe m_probe;
};

}
