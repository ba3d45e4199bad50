/***********************************************************************************************************************
*                                                                                                                      *
* vanhal                                                                                                               *
*                                                                                                                      *
* Copyright (c) 2012-2024 Andrew D. Zonenberg and contributors                                                         *
* All rights reserved.                                                                                                 *
*                                                                                                                      *
* Redistribution and use in source and binary forms, with or without modification, are permitted provided that the     *
* following conditions are met:                                                                                        *
*                                                                                                                      *
*    * Redistributions of source code must retain the above copyright notice, this list of conditions, and the         *
*      following disclaimer.                                                                                           *
*                                                                                                                      *
*    * Redistributions in binary form must reproduce the above copyright notice, this list of conditions and the       *
*      following disclaimer in the documentation and/or other materials provided with the distribution.                *
*                                                                                                                      *
*    * Neither the name of the author nor the names of any contributors may be used to endorse or promote products     *
*      derived from this software without specific prior written permission.                                           *
*                                                                                                                      *
* THIS SOFTWARE IS PROVIDED BY THE AUTHORS "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED   *
* TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL *
* THE AUTHORS BE HELD LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES        *
* (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR       *
* BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT *
* (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE       *
* POSSIBILITY OF SUCH DAMAGE.                                                                                          *
*                                                                                                                      *
***********************************************************************************************************************/

/**
	@file
	@brief Declaration of BiphaseDecoder
 */

#ifndef BiphaseDecoder_h
#define BiphaseDecoder_h

/**
	@brief Differential biphase line decoder with VAN bit destuffing

	Every bit cell has a transition in the middle. A transition at the start of the cell is a 0, no transition a 1.

	After every four data bits the transmitter inserts one bit that complements the previous one, so the line can
	never stay constant for long. Two zeroes in that position mark the end of the data (and the checksum) field.
 */
class BiphaseDecoder
{
public:
	BiphaseDecoder(BitTimingRecovery&& timing, const VanDecoderConfig& config);

	StreamStatus GetNextBit(VanBit& bit);

	enum phase_t
	{
		PHASE_HUNT,			//not synchronized, waiting for bit lock
		PHASE_BOUNDARY,		//last edge was at a cell boundary, a mid-cell edge comes next
		PHASE_MID			//last edge was in the middle of a cell
	};

	phase_t GetPhase() const
	{ return m_phase; }

	///@brief Number of data bits between two stuff bits
	static constexpr size_t STUFF_INTERVAL = 4;

protected:
	void OnCell(const VanBitCell& cell);
	void OnInterval(bool full, const VanBitCell& cell, bool recovered);
	void OnLineBit(bool value, int64_t start, int64_t end, bool recovered);
	void LineError(VanDecodeError::errtype type, int64_t timestamp, const std::string& detail);

	BitTimingRecovery m_timing;

	double m_glitchTolerance;

	phase_t m_phase;

	///@brief Start of the cell currently being decoded
	int64_t m_cellStart;

	///@brief A recovered interval contributed to the cell currently being decoded
	bool m_cellRecovered;

	///@brief Raw bit count (including stuff bits) since the last sync
	size_t m_rawIndex;

	///@brief Stuff bits are still expected (cleared after end of data)
	bool m_destuff;

	bool m_lastValue;

	///@brief An unsynchronized run has already been reported
	bool m_noiseReported;

	std::deque<VanBit> m_pending;
};

#endif
