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
#include "Circuit.h"

namespace ssim::hlim {

Clock &Circuit::createClock(const ClockConfig &config)
{
	for (const auto &clock : m_clocks)
		SSIM_DESIGNCHECK_HINT(clock->getName() != config.name, "A clock named " + config.name + " already exists");

	m_clocks.push_back(std::make_unique<Clock>(config));
	return *m_clocks.back();
}

Module *Circuit::findModule(std::string_view name) const
{
	for (const auto &module : m_modules)
		if (module->getName() == name)
			return module.get();
	return nullptr;
}

}
