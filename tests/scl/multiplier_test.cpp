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

using namespace boost::unit_test;
using namespace ssim;
using scl::arith::BitSerialMultiplier;
using scl::arith::BitSerialMultiplierConfig;
using scl::arith::ClearPolicy;

namespace {
	/// Product after every clock edge, starting with the edge that samples START.
	std::vector<std::uint64_t> traceProduct(std::uint64_t a, std::uint64_t b, size_t numTicks)
	{
		hlim::Circuit circuit;
		auto &clock = circuit.createClock({});
		auto &mul = circuit.createModule<BitSerialMultiplier>(clock, BitSerialMultiplierConfig{ .numBits = 4_b });

		std::vector<std::uint64_t> trace;

		sim::ReferenceSimulator simulator;
		simulator.addSimulationProcess([&]()->sim::SimProcess {
			mul.setOperands(a, b);
			mul.setStart(true);
			co_await sim::OnClk(clock);
			mul.setStart(false);
			while (true) {
				trace.push_back(mul.productAsUint64());
				co_await sim::OnClk(clock);
			}
		});
		simulator.compileProgram(circuit);
		simulator.powerOn();
		simulator.advance(hlim::ClockRational(numTicks) / clock.absoluteFrequency());

		return trace;
	}
}

BOOST_TEST_DONT_PRINT_LOG_VALUE(BitSerialMultiplier::State)

BOOST_DATA_TEST_CASE_F(BoostUnitTestSimulationFixture, multiplier_4bit_products, data::make({ 5, 0, 15, 15 }) ^ data::make({ 5, 0, 1, 15 }), a, b)
{
	auto &clock = circuit.createClock({ .absoluteFrequency = { 100'000'000, 1 } });
	auto &mul = circuit.createModule<BitSerialMultiplier>(clock, BitSerialMultiplierConfig{ .numBits = 4_b });
	BOOST_TEST(mul.latency() == 32u);

	addSimulationProcess([&, this]()->sim::SimProcess {
		mul.setOperands(a, b);
		mul.setStart(true);
		co_await sim::OnClk(clock);
		mul.setStart(false);

		BOOST_TEST(mul.state() == BitSerialMultiplier::State::MULTIPLYING);
		BOOST_TEST(mul.productAsUint64() == 0u);

		for ([[maybe_unused]] auto i : ssim::utils::Range(31)) {
			co_await sim::OnClk(clock);
			BOOST_TEST(!mul.done());
		}

		co_await sim::OnClk(clock);
		BOOST_TEST(mul.done());
		BOOST_TEST(mul.productAsUint64() == std::uint64_t(a * b));
		BOOST_TEST(sim::extractBigInt(mul.tapQ().getState()) == a * b);
		BOOST_TEST(sim::getBit(mul.tapDone().getState(), 0) == sim::LogicBit::known(true));
		BOOST_TEST(getSimulator().getTickCount(clock) == 33u);

		// DONE is a single cycle pulse, the product stays until the next START.
		co_await sim::OnClk(clock);
		BOOST_TEST(!mul.done());
		BOOST_TEST(mul.state() == BitSerialMultiplier::State::IDLE);
		BOOST_TEST(sim::getBit(mul.tapDone().getState(), 0) == sim::LogicBit::known(false));

		co_await sim::OnClk(clock);
		co_await sim::OnClk(clock);
		BOOST_TEST(mul.productAsUint64() == std::uint64_t(a * b));

		stopTest();
	});

	runTest({ 1, 1000 });
}

BOOST_FIXTURE_TEST_CASE(multiplier_4bit_all_operands, BoostUnitTestSimulationFixture)
{
	auto &clock = circuit.createClock({});
	auto &mul = circuit.createModule<BitSerialMultiplier>(clock, BitSerialMultiplierConfig{ .numBits = 4_b });

	addSimulationProcess([&, this]()->sim::SimProcess {
		for (auto a : ssim::utils::Range<std::uint64_t>(16))
			for (auto b : ssim::utils::Range<std::uint64_t>(16)) {
				mul.setOperands(a, b);
				mul.setStart(true);
				co_await sim::OnClk(clock);
				mul.setStart(false);

				size_t ticks = 0;
				while (!mul.done()) {
					co_await sim::OnClk(clock);
					ticks++;
				}
				BOOST_TEST(ticks == mul.latency(), "operands " << a << " * " << b);
				BOOST_TEST(mul.productAsUint64() == a * b, "operands " << a << " * " << b);

				co_await sim::OnClk(clock);
			}

		stopTest();
	});

	runTest({ 1, 1000 });
}

BOOST_FIXTURE_TEST_CASE(multiplier_back_to_back, BoostUnitTestSimulationFixture)
{
	auto &clock = circuit.createClock({});
	auto &mul = circuit.createModule<BitSerialMultiplier>(clock, BitSerialMultiplierConfig{ .numBits = 8_b });

	addSimulationProcess([&, this]()->sim::SimProcess {
		std::mt19937 rng{ 1234 };
		std::uniform_int_distribution<std::uint64_t> operand(0, 255);

		for ([[maybe_unused]] auto i : ssim::utils::Range(10)) {
			std::uint64_t a = operand(rng);
			std::uint64_t b = operand(rng);

			mul.setOperands(a, b);
			mul.setStart(true);
			co_await sim::OnClk(clock);
			mul.setStart(false);

			size_t ticks = 0;
			while (!mul.done()) {
				co_await sim::OnClk(clock);
				ticks++;
			}
			BOOST_TEST(ticks == mul.latency());
			BOOST_TEST(mul.productAsUint64() == a * b);

			co_await sim::OnClk(clock);
		}

		stopTest();
	});

	runTest({ 1, 1000 });
}

BOOST_FIXTURE_TEST_CASE(multiplier_clear_while_idle, BoostUnitTestSimulationFixture)
{
	auto &clock = circuit.createClock({});
	auto &mul = circuit.createModule<BitSerialMultiplier>(clock, BitSerialMultiplierConfig{ .numBits = 4_b, .clearPolicy = ClearPolicy::WHILE_IDLE });

	addSimulationProcess([&, this]()->sim::SimProcess {
		// Cleared on the first edge even without START.
		co_await sim::OnClk(clock);
		BOOST_TEST(mul.regQ().isZero() == sim::LogicBit::known(true));

		mul.setOperands(7, 9);
		mul.setStart(true);
		co_await sim::OnClk(clock);
		mul.setStart(false);

		while (!mul.done())
			co_await sim::OnClk(clock);
		BOOST_TEST(mul.productAsUint64() == 63u);

		co_await sim::OnClk(clock);
		BOOST_TEST(mul.state() == BitSerialMultiplier::State::IDLE);
		BOOST_TEST(mul.productAsUint64() == 63u);

		co_await sim::OnClk(clock);
		BOOST_TEST(mul.productAsUint64() == 0u);

		stopTest();
	});

	runTest({ 1, 1000 });
}

BOOST_FIXTURE_TEST_CASE(multiplier_start_while_busy, BoostUnitTestSimulationFixture)
{
	auto &clock = circuit.createClock({});
	auto &mul = circuit.createModule<BitSerialMultiplier>(clock, BitSerialMultiplierConfig{ .numBits = 4_b });
	allowProtocolViolations();

	addSimulationProcess([&, this]()->sim::SimProcess {
		mul.setOperands(13, 11);
		mul.setStart(true);
		co_await sim::OnClk(clock);
		mul.setOperands(2, 2);
		co_await sim::OnClk(clock);
		co_await sim::OnClk(clock);
		mul.setStart(false);

		while (!mul.done())
			co_await sim::OnClk(clock);

		BOOST_TEST(getSimulator().getTickCount(clock) == 33u);
		BOOST_TEST(mul.productAsUint64() == 143u);
		stopTest();
	});

	runTest({ 1, 1000 });

	BOOST_REQUIRE(getProtocolViolations().size() == 2u);
	BOOST_TEST(getProtocolViolations()[0].module == "multiplier");
	BOOST_TEST(getProtocolViolations()[0].tick == 2u);
	BOOST_TEST(getProtocolViolations()[1].tick == 3u);
}

BOOST_FIXTURE_TEST_CASE(multiplier_undefined_operand, BoostUnitTestSimulationFixture)
{
	auto &clock = circuit.createClock({});
	auto &mul = circuit.createModule<BitSerialMultiplier>(clock, BitSerialMultiplierConfig{ .numBits = 4_b });
	allowProtocolViolations();

	addSimulationProcess([&, this]()->sim::SimProcess {
		mul.pinB().set(6);
		mul.setStart(true);
		co_await sim::OnClk(clock);
		mul.setStart(false);

		while (!mul.done())
			co_await sim::OnClk(clock);

		BOOST_TEST(mul.productAsUint64() == 0u);
		BOOST_TEST(mul.regQ().isDefined());
		stopTest();
	});

	runTest({ 1, 1000 });

	BOOST_REQUIRE(getProtocolViolations().size() == 1u);
	BOOST_TEST(getProtocolViolations()[0].tick == 1u);
	BOOST_TEST(getProtocolViolations()[0].message.find("A") != std::string::npos);
}

BOOST_FIXTURE_TEST_CASE(multiplier_wide_operands, BoostUnitTestSimulationFixture)
{
	auto &clock = circuit.createClock({});
	auto &mul = circuit.createModule<BitSerialMultiplier>(clock, BitSerialMultiplierConfig{ .name = "wide", .numBits = 40_b });

	const std::uint64_t allOnes = (1ull << 40) - 1;

	addSimulationProcess([&, this]()->sim::SimProcess {
		mul.setOperands(allOnes, allOnes);
		mul.setStart(true);
		co_await sim::OnClk(clock);
		mul.setStart(false);

		while (!mul.done())
			co_await sim::OnClk(clock);

		sim::BigInt expected = sim::BigInt(allOnes) * sim::BigInt(allOnes);
		BOOST_TEST(mul.product() == expected);
		BOOST_CHECK_THROW(mul.productAsUint64(), ssim::utils::DesignError);
		stopTest();
	});

	runTest({ 1, 1000 });
}

BOOST_AUTO_TEST_CASE(multiplier_invalid_width)
{
	hlim::Circuit circuit;
	auto &clock = circuit.createClock({});
	BOOST_CHECK_THROW(circuit.createModule<BitSerialMultiplier>(clock, BitSerialMultiplierConfig{ .numBits = 0_b }), ssim::utils::ConfigurationError);
}

BOOST_AUTO_TEST_CASE(multiplier_deterministic)
{
	auto first = traceProduct(11, 13, 40);
	auto second = traceProduct(11, 13, 40);

	BOOST_TEST(first.size() == 40u);
	BOOST_TEST(first == second, boost::test_tools::per_element());
	BOOST_TEST(first[32] == 143u);
}
