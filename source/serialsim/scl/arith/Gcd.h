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
#include <serialsim/hlim/Synchronizer.h>
#include <serialsim/hlim/ControlFsm.h>

namespace ssim::scl::arith
{
	struct GcdConfig
	{
		std::string name = "gcd";
		BitWidth numBits = 16_b;
		/// Flip flops between the asynchronous nCalculate pin and the state machine.
		size_t synchronizerDepth = 2;
	};

	/**
	 * @brief Euclidean greatest common divisor by repeated bit serial subtraction.
	 * @details Operands are loaded while idle. Pulling nCalculate low (seen through the synchronizer) while
	 * CanReadVals is high starts the calculation. regA is repeatedly reduced by regB until the subtraction borrows,
	 * the last subtraction is then undone by adding regB back and both registers are swapped. Once regB is zero,
	 * regA holds the result, which is presented with ResultRdy as soon as CanReadVals is high.
	 */
	class Gcd : public hlim::Module
	{
	public:
		enum class State {
			IDLE,
			CHECK_ZERO,
			SUB,
			RESTORE,
			SWAP,
			DONE
		};

		Gcd(hlim::Clock &clock, const GcdConfig &config);

		virtual void simulateEvaluate(sim::SimulatorCallbacks &simCallbacks, std::uint64_t tick) override;

		inline size_t numBits() const { return m_numBits; }

		hlim::Node_Pin &pinA() { return m_pinA; }
		hlim::Node_Pin &pinB() { return m_pinB; }
		hlim::Node_Pin &pinNCalculate() { return m_pinNCalculate; }
		hlim::Node_Pin &pinCanReadVals() { return m_pinCanReadVals; }
		const hlim::Node_SignalTap &tapResult() const { return m_tapResult; }
		const hlim::Node_SignalTap &tapResultRdy() const { return m_tapResultRdy; }

		void setOperands(std::uint64_t a, std::uint64_t b);
		/// Active low.
		void setCalculate(bool calculate) { m_pinNCalculate.set(sim::LogicBit::known(!calculate)); }
		void setCanReadVals(bool canRead) { m_pinCanReadVals.set(sim::LogicBit::known(canRead)); }

		bool resultReady() const;
		sim::BigInt result() const { return m_regA.toBigInt(); }
		State state() const { return m_fsm.state(); }
	protected:
		size_t m_numBits;

		hlim::Node_Pin m_pinA;
		hlim::Node_Pin m_pinB;
		hlim::Node_Pin m_pinNCalculate;
		hlim::Node_Pin m_pinCanReadVals;

		hlim::ControlFsm<State> m_fsm;
		hlim::Synchronizer m_syncNCalculate;
		hlim::ClockedRegister m_regA;
		hlim::ClockedRegister m_regB;
		hlim::ModularCounter m_subCounter;
		hlim::ModularCounter m_addCounter;
		hlim::CarryFlag m_carry;

		hlim::Node_SignalTap m_tapResult;
		hlim::Node_SignalTap m_tapResultRdy;

		/// One bit of regA -/+ regB, shifting the result into regA.
		void serialStep(bool subtract);
	};
}
