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
#include "Gcd.h"

#include <serialsim/debug/DebugInterface.h>

#include <magic_enum.hpp>

namespace ssim::scl::arith
{
	namespace {
		BitWidth checkedNumBits(const GcdConfig &config)
		{
			SSIM_CONFIGCHECK_HINT(config.numBits.bits() > 0, "GCD " + config.name + " needs an operand width of at least one bit.");
			return config.numBits;
		}
	}

	Gcd::Gcd(hlim::Clock &clock, const GcdConfig &config) :
		hlim::Module(config.name, clock),
		m_numBits(checkedNumBits(config).bits()),
		m_pinA("A", config.numBits),
		m_pinB("B", config.numBits),
		m_pinNCalculate("nCalculate", 1_b, 1),
		m_pinCanReadVals("CanReadVals", 1_b, 0),
		m_fsm("state", State::IDLE),
		m_syncNCalculate("nCalculate_sync", config.synchronizerDepth, true),
		m_regA("regA", config.numBits, hlim::ShiftMode::SHIFT_DISCARD),
		m_regB("regB", config.numBits, hlim::ShiftMode::ROTATE),
		m_subCounter("subCounter", 0, m_numBits, hlim::WrapPolicy::WRAP_TO_BOTTOM),
		m_addCounter("addCounter", 0, m_numBits, hlim::WrapPolicy::WRAP_TO_BOTTOM),
		m_carry("carry"),
		m_tapResult("Result", config.numBits, [this]{ return m_regA.value(); }),
		m_tapResultRdy("ResultRdy", 1_b, [this]{ return sim::createDefaultBitVectorState(1, resultReady()); })
	{
		for (hlim::BaseNode *node : std::initializer_list<hlim::BaseNode*>{
				&m_pinA, &m_pinB, &m_pinNCalculate, &m_pinCanReadVals, &m_fsm, &m_syncNCalculate,
				&m_regA, &m_regB, &m_subCounter, &m_addCounter, &m_carry, &m_tapResult, &m_tapResultRdy })
			addNode(*node);
	}

	void Gcd::setOperands(std::uint64_t a, std::uint64_t b)
	{
		m_pinA.set(a);
		m_pinB.set(b);
	}

	bool Gcd::resultReady() const
	{
		return m_fsm.in(State::DONE) && m_pinCanReadVals.bit().isHigh();
	}

	void Gcd::serialStep(bool subtract)
	{
		hlim::SerialResult step = hlim::SerialArithmeticUnit::compute(m_regA.lsb(), m_regB.lsb(), m_carry.value(), subtract);
		m_regA.stageShift(step.result);
		m_regB.stageShift();
		m_carry.update(step.carryOut);
	}

	void Gcd::simulateEvaluate(sim::SimulatorCallbacks &simCallbacks, std::uint64_t tick)
	{
		m_syncNCalculate.sample(sim::LogicBit::known(sampleControl(simCallbacks, tick, m_pinNCalculate, true)));
		const bool canReadVals = sampleControl(simCallbacks, tick, m_pinCanReadVals, false);
		const bool calculate = m_syncNCalculate.output().isLow();

		const State state = m_fsm.state();
		State next = state;

		m_subCounter.tick(state != State::SUB, state == State::SUB);
		m_addCounter.tick(state != State::RESTORE, state == State::RESTORE);

		switch (state) {
			case State::IDLE:
				m_regA.stageLoad(sampleOperand(m_pinA));
				m_regB.stageLoad(sampleOperand(m_pinB));
				if (calculate && canReadVals) {
					checkOperandDefined(simCallbacks, tick, m_pinA);
					checkOperandDefined(simCallbacks, tick, m_pinB);
					next = State::CHECK_ZERO;
				}
			break;
			case State::CHECK_ZERO:
				m_carry.preset();
				next = m_regB.isZero().isHigh() ? State::DONE : State::SUB;
			break;
			case State::SUB:
				if (m_subCounter.atTop()) {
					// The final carry of the subtraction: low means regA went negative.
					if (m_carry.value().isLow()) {
						m_carry.clear();
						next = State::RESTORE;
					} else
						m_carry.preset();
				} else
					serialStep(true);
			break;
			case State::RESTORE:
				if (m_addCounter.atTop())
					next = State::SWAP;
				else
					serialStep(false);
			break;
			case State::SWAP:
				m_regA.stageLoad(m_regB.value());
				m_regB.stageLoad(m_regA.value());
				next = State::CHECK_ZERO;
			break;
			case State::DONE:
				if (canReadVals)
					next = State::IDLE;
			break;
			default:
				SSIM_ASSERT_HINT(false, "Unhandled GCD state");
		}

		if (next != state)
			dbg::log(dbg::LogMessage{} << dbg::LogMessage::LOG_INFO << dbg::LogMessage::LOG_SIMULATION
					<< m_name << " tick " << tick << ": " << magic_enum::enum_name(state)
					<< " -> " << magic_enum::enum_name(next));
		m_fsm.stage(next);
	}
}
