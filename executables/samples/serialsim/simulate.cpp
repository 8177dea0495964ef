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
#include <serialsim/serialsim.h>

#include <boost/format.hpp>

#include <iostream>
#include <optional>
#include <utility>
#include <vector>

using namespace ssim;

namespace {

std::vector<std::pair<std::uint64_t, std::uint64_t>> readOperands(const utils::ConfigTree &list)
{
	std::vector<std::pair<std::uint64_t, std::uint64_t>> operands;
	for (auto pair : list) {
		SSIM_CONFIGCHECK_HINT(pair.isSequence() && pair.size() == 2, "Operands must be given as pairs [a, b]");
		operands.push_back({ pair[0].as<std::uint64_t>(), pair[1].as<std::uint64_t>() });
	}
	return operands;
}

}

int main(int argc, char *argv[])
{
	if (argc != 2) {
		std::cerr << "Usage: " << argv[0] << " <config.yaml>" << std::endl;
		return 1;
	}

	try {
		utils::ConfigTree config;
		config.loadFromFile(argv[1]);

		auto logLevel = config["log/level"].as(dbg::LogMessage::LOG_WARNING);
		if (config["log/file"])
			dbg::logToFile(config["log/file"].as<std::string>(), logLevel);
		else
			dbg::logToStream(std::cerr, logLevel);

		hlim::Circuit circuit;
		auto &clock = circuit.createClock({
			.name = "clk",
			.absoluteFrequency = { config["clock/frequency"].as<std::uint64_t>(100'000'000), 1 },
		});

		auto &multiplier = circuit.createModule<scl::arith::BitSerialMultiplier>(clock, scl::arith::BitSerialMultiplierConfig{
			.numBits = config["multiplier/numBits"].as(8_b),
			.clearPolicy = config["multiplier/clearPolicy"].as(scl::arith::ClearPolicy::ON_START),
		});
		auto &gcd = circuit.createModule<scl::arith::Gcd>(clock, scl::arith::GcdConfig{
			.numBits = config["gcd/numBits"].as(16_b),
		});

		auto multiplications = readOperands(config["multiplier/operands"]);
		auto gcds = readOperands(config["gcd/operands"]);

		sim::ReferenceSimulator simulator;

		std::optional<sim::VCDSink> vcdSink;
		if (config["waveform/file"]) {
			vcdSink.emplace(circuit, simulator, config["waveform/file"].as<std::string>().c_str());
			vcdSink->addAllModules();
		}

		size_t runningProcesses = 2;

		simulator.addSimulationProcess([&]()->sim::SimProcess {
			for (auto [a, b] : multiplications) {
				multiplier.setOperands(a, b);
				multiplier.setStart(true);
				co_await sim::OnClk(clock);
				multiplier.setStart(false);

				std::uint64_t ticks = 0;
				while (!multiplier.done()) {
					co_await sim::OnClk(clock);
					ticks++;
				}
				std::cout << boost::format("%d * %d = %s (%d ticks)") % a % b % multiplier.product() % ticks << std::endl;
				co_await sim::OnClk(clock);
			}
			if (--runningProcesses == 0)
				simulator.abort();
		});

		simulator.addSimulationProcess([&]()->sim::SimProcess {
			gcd.setCanReadVals(true);
			for (auto [a, b] : gcds) {
				gcd.setOperands(a, b);
				gcd.setCalculate(true);

				std::uint64_t ticks = 0;
				do {
					co_await sim::OnClk(clock);
					ticks++;
					if (gcd.state() != scl::arith::Gcd::State::IDLE)
						gcd.setCalculate(false);
				} while (!gcd.resultReady());

				std::cout << boost::format("gcd(%d, %d) = %s (%d ticks)") % a % b % gcd.result() % ticks << std::endl;
				co_await sim::OnClk(clock);
			}
			if (--runningProcesses == 0)
				simulator.abort();
		});

		simulator.compileProgram(circuit);
		simulator.powerOn();
		// Runs until both processes are through their lists.
		simulator.advance(hlim::ClockRational(3600));
		simulator.commitState();
	} catch (const utils::ConfigurationError &e) {
		std::cerr << e.what() << std::endl;
		return 2;
	} catch (const std::exception &e) {
		std::cerr << e.what() << std::endl;
		return 3;
	}

	return 0;
}
