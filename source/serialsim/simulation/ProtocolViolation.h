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

#include <cstdint>
#include <ostream>
#include <string>

namespace ssim::sim {

/**
 * @brief Inputs were driven in a way the circuit does not define.
 * @details Not an exception: the module resolves the situation with a fixed default, reports it through
 * SimulatorCallbacks::onProtocolViolation and the simulation continues.
 */
struct ProtocolViolation
{
	std::string module;
	/// Clock edge (counted from one) at which the offending input was sampled.
	std::uint64_t tick = 0;
	std::string message;
};

inline std::ostream &operator<<(std::ostream &stream, const ProtocolViolation &violation)
{
	return stream << violation.module << " @ tick " << violation.tick << ": " << violation.message;
}

}
