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
#include "BitSerialMultiplier.h"

#include <serialsim/debug/DebugInterface.h>

#include <magic_enum.hpp>

namespace ssim::scl::arith
{
	namespace {
		BitWidth checkedNumBits(const BitSerialMultiplierConfig &config)
		{
			SSIM_CONFIGCHECK_HINT(config.numBits.bits() > 0, "Multiplier " + config.name + " needs an operand width of at least one bit.");
			return config.numBits;
		}
	}

	BitSerialMultiplier::BitSerialMultiplier(hlim::Clock &clock, const BitSerialMultiplierConfig &config) :
		hlim::Module(config.name, clock),
		m_numBits(checkedNumBits(config).bits()),
		m_clearPolicy(config.clearPolicy),
		m_pinA("A", config.numBits),
		m_pinB("B", config.numBits),
		m_pinStart("START", 1_b, 0),
		m_fsm("state", State::IDLE),
		m_regA("Areg", config.numBits, hlim::ShiftMode::ROTATE),
		m_regB("Breg", config.numBits, hlim::ShiftMode::ROTATE),
		m_regQ("Qreg", config.numBits * 2, hlim::ShiftMode::SHIFT_DISCARD),
		m_shiftCountA("shiftCountA", 0, m_numBits, hlim::WrapPolicy::HOLD_AT_TOP),
		m_shiftCountB("shiftCountB", 0, m_numBits, hlim::WrapPolicy::HOLD_AT_TOP),
		m_shiftCountQ("shiftCountQ", 0, 2 * m_numBits - 1, hlim::WrapPolicy::HOLD_AT_TOP),
		m_carry("carry"),
		m_tapQ("Q", config.numBits * 2, [this]{ return m_regQ.value(); }),
		m_tapDone("DONE", 1_b, [this]{ return sim::createDefaultBitVectorState(1, m_fsm.in(State::FINISHED)); })
	{
		for (hlim::BaseNode *node : std::initializer_list<hlim::BaseNode*>{
				&m_pinA, &m_pinB, &m_pinStart, &m_fsm, &m_regA, &m_regB, &m_regQ,
				&m_shiftCountA, &m_shiftCountB, &m_shiftCountQ, &m_carry, &m_tapQ, &m_tapDone })
			addNode(*node);
	}

	void BitSerialMultiplier::setOperands(std::uint64_t a, std::uint64_t b)
	{
		m_pinA.set(a);
		m_pinB.set(b);
	}

	std::uint64_t BitSerialMultiplier::productAsUint64() const
	{
		SSIM_DESIGNCHECK_HINT(2 * m_numBits <= 64, "The product of " + m_name + " does not fit into 64 bits, use product() instead.");
		return m_regQ.value().extract(sim::DefaultConfig::VALUE, 0, 2 * m_numBits);
	}

	BitSerialMultiplier::ControlSignals BitSerialMultiplier::decode(bool start) const
	{
		ControlSignals ctrl;
		switch (m_fsm.state()) {
			case State::IDLE:
				ctrl.loadRegs = true;
				ctrl.carryClear = true;
				switch (m_clearPolicy) {
					case ClearPolicy::ON_START: ctrl.clearQ = start; break;
					case ClearPolicy::WHILE_IDLE: ctrl.clearQ = true; break;
					default: SSIM_ASSERT_HINT(false, "Unhandled clear policy");
				}
			break;
			case State::MULTIPLYING:
				ctrl.serEnQ = true;
				// Pass i adds the multiplicand at accumulator bits i..i+n-1.
				ctrl.serEnA = m_shiftCountQ.value() >= m_shiftCountB.value() && m_shiftCountA.value() != m_numBits;
				ctrl.adderEnable = ctrl.serEnA;
				ctrl.serEnB = m_shiftCountQ.atTop();
				ctrl.carryClear = ctrl.serEnB;
			break;
			case State::FINISHED:
			break;
			default:
				SSIM_ASSERT_HINT(false, "Unhandled multiplier state");
		}
		return ctrl;
	}

	BitSerialMultiplier::State BitSerialMultiplier::nextState(bool start, const ControlSignals &ctrl) const
	{
		switch (m_fsm.state()) {
			case State::IDLE:
				return start ? State::MULTIPLYING : State::IDLE;
			case State::MULTIPLYING:
				if (ctrl.serEnB && m_shiftCountB.value() + 1 == m_numBits)
					return State::FINISHED;
				return State::MULTIPLYING;
			case State::FINISHED:
				return State::IDLE;
			default:
				SSIM_ASSERT_HINT(false, "Unhandled multiplier state");
				return State::IDLE;
		}
	}

	void BitSerialMultiplier::simulateEvaluate(sim::SimulatorCallbacks &simCallbacks, std::uint64_t tick)
	{
		bool start = sampleControl(simCallbacks, tick, m_pinStart, false);

		if (start && m_fsm.in(State::MULTIPLYING))
			reportViolation(simCallbacks, tick, "START asserted during a running multiplication, ignoring it.");

		if (start && m_fsm.in(State::IDLE)) {
			checkOperandDefined(simCallbacks, tick, m_pinA);
			checkOperandDefined(simCallbacks, tick, m_pinB);
		}

		const ControlSignals ctrl = decode(start);
		const bool idle = m_fsm.in(State::IDLE);

		// Counters
		m_shiftCountQ.tick(idle || m_shiftCountQ.atTop(), ctrl.serEnQ);
		m_shiftCountA.tick(idle || ctrl.serEnB, ctrl.serEnA);
		m_shiftCountB.tick(idle, ctrl.serEnB);

		// Serial adder: the old LSB of Q plus one partial product bit, the sum enters Q at the MSB.
		sim::LogicBit partialProduct = m_regA.lsb() & m_regB.lsb() & sim::LogicBit::known(ctrl.adderEnable);
		hlim::SerialResult sum = hlim::SerialArithmeticUnit::compute(m_regQ.lsb(), partialProduct, m_carry.value(), false);

		if (ctrl.carryClear)
			m_carry.clear();
		else if (ctrl.serEnQ)
			m_carry.update(sum.carryOut);

		// Registers
		if (ctrl.loadRegs) {
			m_regA.stageLoad(sampleOperand(m_pinA));
			m_regB.stageLoad(sampleOperand(m_pinB));
		} else {
			if (ctrl.serEnA) m_regA.stageShift();
			if (ctrl.serEnB) m_regB.stageShift();
		}

		if (ctrl.clearQ)
			m_regQ.stageClear();
		else if (ctrl.serEnQ)
			m_regQ.stageShift(sum.result);

		State next = nextState(start, ctrl);
		if (next != m_fsm.state()) {
			dbg::log(dbg::LogMessage{} << dbg::LogMessage::LOG_INFO << dbg::LogMessage::LOG_SIMULATION
					<< m_name << " tick " << tick << ": " << magic_enum::enum_name(m_fsm.state())
					<< " -> " << magic_enum::enum_name(next));
		}
		m_fsm.stage(next);
	}
}
