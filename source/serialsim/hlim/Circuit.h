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

#include "Clock.h"
#include "Module.h"

#include <concepts>
#include <memory>
#include <vector>

namespace ssim::hlim {

/// Owns all clocks and modules that are simulated together.
class Circuit
{
	public:
		Circuit() = default;
		Circuit(const Circuit &) = delete;
		Circuit &operator=(const Circuit &) = delete;

		Clock &createClock(const ClockConfig &config);

		template<std::derived_from<Module> ModuleType, typename... Args>
		ModuleType &createModule(Args&&... args) {
			auto module = std::make_unique<ModuleType>(std::forward<Args>(args)...);
			auto &ref = *module;
			SSIM_DESIGNCHECK_HINT(findModule(ref.getName()) == nullptr, "A module named " + ref.getName() + " already exists");
			m_modules.push_back(std::move(module));
			return ref;
		}

		Module *findModule(std::string_view name) const;

		inline const std::vector<std::unique_ptr<Clock>> &getClocks() const { return m_clocks; }
		inline const std::vector<std::unique_ptr<Module>> &getModules() const { return m_modules; }
	protected:
		std::vector<std::unique_ptr<Clock>> m_clocks;
		std::vector<std::unique_ptr<Module>> m_modules;
};

}
