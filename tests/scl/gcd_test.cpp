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
#include "scl/pch.h"

#include <boost/test/unit_test.hpp>
#include <boost/test/data/dataset.hpp>
#include <boost/test/data/test_case.hpp>
#include <boost/test/data/monomorphic.hpp>

#include <numeric>

using namespace boost::unit_test;
using namespace ssim;
using scl::arith::Gcd;
using scl::arith::GcdConfig;

namespace {
	/// Requests a calculation and waits for ResultRdy, CanReadVals is kept high throughout.
	sim::SimulationFunction<std::uint64_t> computeGcd(Gcd &gcd, const hlim::Clock &clock, std::uint64_t a, std::uint64_t b)
	{
		gcd.setOperands(a, b);
		gcd.setCanReadVals(true);
		gcd.setCalculate(true);

		do
			co_await sim::OnClk(clock);
		while (gcd.state() == Gcd::State::IDLE);
		gcd.setCalculate(false);

		while (!gcd.resultReady())
			co_await sim::OnClk(clock);

		co_return gcd.result().convert_to<std::uint64_t>();
	}

	std::uint64_t ticksUntilResult(std::uint64_t a, std::uint64_t b)
	{
		hlim::Circuit circuit;
		auto &clock = circuit.createClock({});
		auto &gcd = circuit.createModule<Gcd>(clock, GcdConfig{});

		std::uint64_t ticks = 0;

		sim::ReferenceSimulator simulator;
		simulator.addSimulationProcess([&]()->sim::SimProcess {
			std::uint64_t result = co_await computeGcd(gcd, clock, a, b);
			BOOST_TEST(result == std::gcd(a, b));
			ticks = simulator.getTickCount(clock);
			simulator.abort();
		});
		simulator.compileProgram(circuit);
		simulator.powerOn();
		simulator.advance({ 1, 100 });

		return ticks;
	}
}

BOOST_TEST_DONT_PRINT_LOG_VALUE(Gcd::State)

BOOST_DATA_TEST_CASE_F(BoostUnitTestSimulationFixture, gcd_16bit_results,
	data::make({ 0, 1, 255, 60 }) ^ data::make({ 0, 0xFFFF, 110, 84 }) ^ data::make({ 0, 1, 5, 12 }),
	a, b, expected)
{
	auto &clock = circuit.createClock({ .absoluteFrequency = { 100'000'000, 1 } });
	auto &gcd = circuit.createModule<Gcd>(clock, GcdConfig{ .numBits = 16_b });

	addSimulationProcess([&, this]()->sim::SimProcess {
		std::uint64_t result = co_await computeGcd(gcd, clock, a, b);
		BOOST_TEST(result == std::uint64_t(expected));
		BOOST_TEST(sim::extractBigInt(gcd.tapResult().getState()) == expected);
		BOOST_TEST(sim::getBit(gcd.tapResultRdy().getState(), 0) == sim::LogicBit::known(true));

		// With CanReadVals high the result is only presented for one cycle.
		co_await sim::OnClk(clock);
		BOOST_TEST(gcd.state() == Gcd::State::IDLE);
		BOOST_TEST(!gcd.resultReady());

		stopTest();
	});

	runTest({ 1, 10 });
}

BOOST_DATA_TEST_CASE_F(BoostUnitTestSimulationFixture, gcd_zero_and_equal_operands,
	data::make({ 48, 0, 37, 255, 1 }) ^ data::make({ 0, 48, 37, 255, 0 }) ^ data::make({ 48, 48, 37, 255, 1 }),
	a, b, expected)
{
	auto &clock = circuit.createClock({});
	auto &gcd = circuit.createModule<Gcd>(clock, GcdConfig{ .numBits = 8_b });

	addSimulationProcess([&, this]()->sim::SimProcess {
		std::uint64_t result = co_await computeGcd(gcd, clock, a, b);
		BOOST_TEST(result == std::uint64_t(expected));
		stopTest();
	});

	runTest({ 1, 1000 });
}

BOOST_FIXTURE_TEST_CASE(gcd_repeated_request, BoostUnitTestSimulationFixture)
{
	auto &clock = circuit.createClock({});
	auto &gcd = circuit.createModule<Gcd>(clock, GcdConfig{ .numBits = 8_b });

	addSimulationProcess([&, this]()->sim::SimProcess {
		std::uint64_t results[2];
		std::uint64_t durations[2];

		for (auto run : ssim::utils::Range(2)) {
			std::uint64_t startTick = getSimulator().getTickCount(clock);
			results[run] = co_await computeGcd(gcd, clock, 255, 110);
			durations[run] = getSimulator().getTickCount(clock) - startTick;

			co_await sim::OnClk(clock);
			BOOST_TEST(gcd.state() == Gcd::State::IDLE);
		}

		BOOST_TEST(results[0] == 5u);
		BOOST_TEST(results[1] == results[0]);
		BOOST_TEST(durations[1] == durations[0]);

		stopTest();
	});

	runTest({ 1, 1000 });
}

BOOST_FIXTURE_TEST_CASE(gcd_synchronizer_latency, BoostUnitTestSimulationFixture)
{
	auto &clock = circuit.createClock({});
	auto &gcd = circuit.createModule<Gcd>(clock, GcdConfig{ .numBits = 8_b });
	auto &slowGcd = circuit.createModule<Gcd>(clock, GcdConfig{ .name = "gcd3", .numBits = 8_b, .synchronizerDepth = 3 });

	addSimulationProcess([&, this]()->sim::SimProcess {
		for (Gcd *g : { &gcd, &slowGcd }) {
			g->setOperands(9, 6);
			g->setCanReadVals(true);
			g->setCalculate(true);
		}

		co_await sim::OnClk(clock);
		co_await sim::OnClk(clock);
		BOOST_TEST(gcd.state() == Gcd::State::IDLE);
		BOOST_TEST(slowGcd.state() == Gcd::State::IDLE);

		co_await sim::OnClk(clock);
		BOOST_TEST(gcd.state() == Gcd::State::CHECK_ZERO);
		BOOST_TEST(slowGcd.state() == Gcd::State::IDLE);

		co_await sim::OnClk(clock);
		BOOST_TEST(slowGcd.state() == Gcd::State::CHECK_ZERO);

		stopTest();
	});

	runTest({ 1, 1000 });
}

BOOST_FIXTURE_TEST_CASE(gcd_waits_for_can_read_vals, BoostUnitTestSimulationFixture)
{
	auto &clock = circuit.createClock({});
	auto &gcd = circuit.createModule<Gcd>(clock, GcdConfig{ .numBits = 8_b });

	addSimulationProcess([&, this]()->sim::SimProcess {
		gcd.setOperands(48, 18);
		gcd.setCalculate(true);

		// No calculation starts while the consumer is not ready.
		for ([[maybe_unused]] auto i : ssim::utils::Range(10)) {
			co_await sim::OnClk(clock);
			BOOST_TEST(gcd.state() == Gcd::State::IDLE);
		}

		gcd.setCanReadVals(true);
		co_await sim::OnClk(clock);
		BOOST_TEST(gcd.state() == Gcd::State::CHECK_ZERO);
		gcd.setCalculate(false);
		gcd.setCanReadVals(false);

		while (gcd.state() != Gcd::State::DONE)
			co_await sim::OnClk(clock);

		// Held in DONE until the result can be read.
		for ([[maybe_unused]] auto i : ssim::utils::Range(5)) {
			BOOST_TEST(!gcd.resultReady());
			BOOST_TEST(sim::getBit(gcd.tapResultRdy().getState(), 0) == sim::LogicBit::known(false));
			co_await sim::OnClk(clock);
			BOOST_TEST(gcd.state() == Gcd::State::DONE);
		}
		BOOST_TEST(gcd.result() == 6);

		gcd.setCanReadVals(true);
		BOOST_TEST(gcd.resultReady());
		co_await sim::OnClk(clock);
		BOOST_TEST(gcd.state() == Gcd::State::IDLE);

		stopTest();
	});

	runTest({ 1, 1000 });
}

BOOST_FIXTURE_TEST_CASE(gcd_back_to_back, BoostUnitTestSimulationFixture)
{
	auto &clock = circuit.createClock({});
	auto &gcd = circuit.createModule<Gcd>(clock, GcdConfig{ .numBits = 10_b });

	addSimulationProcess([&, this]()->sim::SimProcess {
		std::mt19937 rng{ 42 };
		std::uniform_int_distribution<std::uint64_t> operand(1, 1023);

		for ([[maybe_unused]] auto i : ssim::utils::Range(8)) {
			std::uint64_t a = operand(rng);
			std::uint64_t b = operand(rng);
			std::uint64_t result = co_await computeGcd(gcd, clock, a, b);
			BOOST_TEST(result == std::gcd(a, b));
			co_await sim::OnClk(clock);
		}

		stopTest();
	});

	runTest({ 1, 100 });
}

BOOST_FIXTURE_TEST_CASE(gcd_undefined_operand, BoostUnitTestSimulationFixture)
{
	auto &clock = circuit.createClock({});
	auto &gcd = circuit.createModule<Gcd>(clock, GcdConfig{ .numBits = 8_b });
	allowProtocolViolations();

	addSimulationProcess([&, this]()->sim::SimProcess {
		gcd.pinB().set(21);
		gcd.setCanReadVals(true);
		gcd.setCalculate(true);

		while (gcd.state() == Gcd::State::IDLE)
			co_await sim::OnClk(clock);
		gcd.setCalculate(false);

		while (!gcd.resultReady())
			co_await sim::OnClk(clock);

		// A is taken as zero.
		BOOST_TEST(gcd.result() == 21);
		stopTest();
	});

	runTest({ 1, 1000 });

	BOOST_REQUIRE(getProtocolViolations().size() == 1u);
	BOOST_TEST(getProtocolViolations()[0].module == "gcd");
	BOOST_TEST(getProtocolViolations()[0].tick == 3u);
}

BOOST_AUTO_TEST_CASE(gcd_deterministic)
{
	std::uint64_t first = ticksUntilResult(255, 110);
	BOOST_TEST(first > 0u);
	BOOST_TEST(ticksUntilResult(255, 110) == first);
	BOOST_TEST(ticksUntilResult(60, 84) == ticksUntilResult(60, 84));
}

BOOST_AUTO_TEST_CASE(gcd_invalid_configuration)
{
	hlim::Circuit circuit;
	auto &clock = circuit.createClock({});
	BOOST_CHECK_THROW(circuit.createModule<Gcd>(clock, GcdConfig{ .numBits = 0_b }), ssim::utils::ConfigurationError);
	BOOST_CHECK_THROW(circuit.createModule<Gcd>(clock, GcdConfig{ .synchronizerDepth = 1 }), ssim::utils::ConfigurationError);
}
