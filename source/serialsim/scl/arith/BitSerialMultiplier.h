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

#include <serialsim/hlim/Module.h>
#include <serialsim/hlim/Node_Pin.h>
#include <serialsim/hlim/Node_SignalTap.h>
#include <serialsim/hlim/ClockedRegister.h>
#include <serialsim/hlim/ModularCounter.h>
#include <serialsim/hlim/SerialArithmeticUnit.h>
#include <serialsim/hlim/ControlFsm.h>

namespace ssim::scl::arith
{
	/// When the accumulator is cleared before a new product.
	enum class ClearPolicy {
		ON_START,	///< Only on the edge that samples START in IDLE, the previous product stays readable until then.
		WHILE_IDLE	///< On every edge in IDLE.
	};

	struct BitSerialMultiplierConfig
	{
		std::string name = "multiplier";
		BitWidth numBits = 8_b;
		ClearPolicy clearPolicy = ClearPolicy::ON_START;
	};

	/**
	 * @brief Shift-and-add multiplier that processes one bit of the accumulator per clock cycle.
	 * @details Operands are loaded while idle. A START sampled in IDLE clears Q and begins the multiplication,
	 * which takes exactly 2*numBits^2 clock cycles independent of the operands. DONE is high for one cycle
	 * afterwards, Q then holds A*B.
	 *
	 * For every multiplier bit b_i the 2n bit accumulator is rotated once through the serial adder, A is added
	 * to it at bit positions i to i+n-1 while the carry ripples through the remaining upper bits.
	 */
	class BitSerialMultiplier : public hlim::Module
	{
	public:
		enum class State {
			IDLE,
			MULTIPLYING,
			FINISHED
		};

		BitSerialMultiplier(hlim::Clock &clock, const BitSerialMultiplierConfig &config);

		virtual void simulateEvaluate(sim::SimulatorCallbacks &simCallbacks, std::uint64_t tick) override;

		inline size_t numBits() const { return m_numBits; }
		inline size_t latency() const { return 2 * m_numBits * m_numBits; }
		inline ClearPolicy clearPolicy() const { return m_clearPolicy; }

		hlim::Node_Pin &pinA() { return m_pinA; }
		hlim::Node_Pin &pinB() { return m_pinB; }
		hlim::Node_Pin &pinStart() { return m_pinStart; }
		const hlim::Node_SignalTap &tapQ() const { return m_tapQ; }
		const hlim::Node_SignalTap &tapDone() const { return m_tapDone; }

		/// Drives both operands for the next clock edge.
		void setOperands(std::uint64_t a, std::uint64_t b);
		void setStart(bool start) { m_pinStart.set(sim::LogicBit::known(start)); }

		bool done() const { return m_fsm.in(State::FINISHED); }
		State state() const { return m_fsm.state(); }
		/// Content of the accumulator, undefined bits read as zero.
		sim::BigInt product() const { return m_regQ.toBigInt(); }
		/// Only for products of up to 64 bits.
		std::uint64_t productAsUint64() const;
		const hlim::ClockedRegister &regQ() const { return m_regQ; }
	protected:
		size_t m_numBits;
		ClearPolicy m_clearPolicy;

		hlim::Node_Pin m_pinA;
		hlim::Node_Pin m_pinB;
		hlim::Node_Pin m_pinStart;

		hlim::ControlFsm<State> m_fsm;
		hlim::ClockedRegister m_regA;
		hlim::ClockedRegister m_regB;
		hlim::ClockedRegister m_regQ;
		hlim::ModularCounter m_shiftCountA;
		hlim::ModularCounter m_shiftCountB;
		hlim::ModularCounter m_shiftCountQ;
		hlim::CarryFlag m_carry;

		hlim::Node_SignalTap m_tapQ;
		hlim::Node_SignalTap m_tapDone;

		struct ControlSignals {
			bool loadRegs = false;
			bool clearQ = false;
			bool carryClear = false;
			bool serEnA = false;
			bool serEnB = false;
			bool serEnQ = false;
			bool adderEnable = false;
		};
		ControlSignals decode(bool start) const;
		State nextState(bool start, const ControlSignals &ctrl) const;
	};
}
