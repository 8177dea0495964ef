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
#include "core/pch.h"

#include <boost/test/unit_test.hpp>

using namespace boost::unit_test;
using namespace ssim;

namespace {

	enum class Phase { IDLE, COUNT, DONE };

	/// Counts the set bits of a 4 bit operand by rotating it through its LSB once.
	class OnesCounter : public hlim::Module
	{
		public:
			OnesCounter(hlim::Clock &clock) : hlim::Module("ones", clock),
				m_pinIn("in", 4_b),
				m_pinStart("start", 1_b, 0),
				m_fsm("phase", Phase::IDLE),
				m_reg("reg", 4_b, hlim::ShiftMode::ROTATE),
				m_position("position", 0, 3, hlim::WrapPolicy::WRAP_TO_BOTTOM),
				m_ones("ones", 0, 4, hlim::WrapPolicy::HOLD_AT_TOP)
			{
				addNode(m_pinIn);
				addNode(m_pinStart);
				addNode(m_fsm);
				addNode(m_reg);
				addNode(m_position);
				addNode(m_ones);
			}

			virtual void simulateEvaluate(sim::SimulatorCallbacks &simCallbacks, std::uint64_t tick) override {
				switch (m_fsm.state()) {
					case Phase::IDLE:
						if (sampleControl(simCallbacks, tick, m_pinStart, false)) {
							m_reg.stageLoad(sampleOperand(m_pinIn));
							m_position.tick(true, false);
							m_ones.tick(true, false);
							m_fsm.stage(Phase::COUNT);
						}
					break;
					case Phase::COUNT:
						m_reg.stageShift();
						m_ones.tick(false, m_reg.lsb().isHigh());
						m_position.tick(false, true);
						if (m_position.atTop())
							m_fsm.stage(Phase::DONE);
					break;
					case Phase::DONE:
						m_fsm.stage(Phase::IDLE);
					break;
				}
			}

			hlim::Node_Pin &pinIn() { return m_pinIn; }
			hlim::Node_Pin &pinStart() { return m_pinStart; }
			const hlim::ControlFsm<Phase> &fsm() const { return m_fsm; }
			std::uint64_t ones() const { return m_ones.value(); }
		protected:
			hlim::Node_Pin m_pinIn;
			hlim::Node_Pin m_pinStart;
			hlim::ControlFsm<Phase> m_fsm;
			hlim::ClockedRegister m_reg;
			hlim::ModularCounter m_position;
			hlim::ModularCounter m_ones;
	};

}

BOOST_TEST_DONT_PRINT_LOG_VALUE(Phase)

BOOST_AUTO_TEST_SUITE(FsmTests)

BOOST_AUTO_TEST_CASE(StagingAndText)
{
	hlim::ControlFsm<Phase> fsm("phase", Phase::IDLE);
	BOOST_TEST(fsm.getTextState() == "IDLE");
	BOOST_TEST(fsm.hasTextState());
	BOOST_TEST(!fsm.transitionStaged());

	fsm.stage(Phase::DONE);
	BOOST_TEST(fsm.in(Phase::IDLE));
	BOOST_TEST(fsm.transitionStaged());
	BOOST_TEST(fsm.stagedState() == Phase::DONE);
	BOOST_CHECK_THROW(fsm.stage(Phase::COUNT), ssim::utils::InternalError);

	fsm.simulateAdvance();
	BOOST_TEST(fsm.in(Phase::DONE));
	BOOST_TEST(fsm.getTextState() == "DONE");
	BOOST_TEST(fsm.getState().extract(sim::DefaultConfig::VALUE, 0, fsm.getWidth().bits()) == 2u);

	// Unstaged cycles hold the state.
	fsm.simulateAdvance();
	BOOST_TEST(fsm.in(Phase::DONE));

	fsm.simulatePowerOn();
	BOOST_TEST(fsm.in(Phase::IDLE));
}

BOOST_FIXTURE_TEST_CASE(ModuleSequencing, BoostUnitTestSimulationFixture)
{
	auto &clock = circuit.createClock({ .name = "clk", .absoluteFrequency = { 10'000'000, 1 } });
	auto &counter = circuit.createModule<OnesCounter>(clock);

	addSimulationProcess([&clock, &counter, this]()->sim::SimProcess {
		counter.pinIn().set(0b1011);
		counter.pinStart().set(1);
		co_await sim::OnClk(clock);
		counter.pinStart().set(0);
		BOOST_TEST(counter.fsm().getTextState() == "COUNT");

		for ([[maybe_unused]] auto i : ssim::utils::Range(3)) {
			co_await sim::OnClk(clock);
			BOOST_TEST(counter.fsm().getTextState() == "COUNT");
		}
		co_await sim::OnClk(clock);
		BOOST_TEST(counter.fsm().getTextState() == "DONE");
		BOOST_TEST(counter.ones() == 3u);

		co_await sim::OnClk(clock);
		BOOST_TEST(counter.fsm().getTextState() == "IDLE");
		BOOST_TEST(getSimulator().getTickCount(clock) == 6u);

		stopTest();
	});

	runTest({ 1, 1000 });
}

BOOST_FIXTURE_TEST_CASE(UndefinedControlIsReported, BoostUnitTestSimulationFixture)
{
	auto &clock = circuit.createClock({});
	auto &counter = circuit.createModule<OnesCounter>(clock);
	allowProtocolViolations();

	addSimulationProcess([&clock, &counter, this]()->sim::SimProcess {
		counter.pinStart().setUndefined();
		co_await sim::OnClk(clock);
		BOOST_TEST(counter.fsm().getTextState() == "IDLE");
		stopTest();
	});

	runTest({ 1, 1000 });

	BOOST_REQUIRE(getProtocolViolations().size() == 1u);
	BOOST_TEST(getProtocolViolations().front().module == "ones");
	BOOST_TEST(getProtocolViolations().front().tick == 1u);
}

BOOST_AUTO_TEST_SUITE_END()
