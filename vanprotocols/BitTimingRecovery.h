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
	@brief Declaration of BitTimingRecovery
 */

#ifndef BitTimingRecovery_h
#define BitTimingRecovery_h

/**
	@brief Recovers the bit clock of a self-clocked line from edge spacing

	Acquires lock on a run of half-bit intervals following an idle bus (the start of a VAN frame is four zero bits,
	which is eight transitions half a bit apart), then classifies every following interval as a half bit, a full bit,
	or invalid, tracking slow drift of the half-bit period.
 */
class BitTimingRecovery
{
public:
	BitTimingRecovery(EdgeExtractor&& edges, const VanDecoderConfig& config);

	StreamStatus GetNextCell(VanBitCell& cell);

	static VanBitCell::celltype Classify(double interval, double halfBit, double tolerance);

	bool IsLocked() const
	{ return m_locked; }

	double GetHalfBitPeriod() const
	{ return m_halfBit; }

protected:
	void OnUnlockedEdge(const VanEdge& edge);
	void OnLockedEdge(const VanEdge& edge);
	void Lock();
	void ReleaseBurst();
	void StartBurst(const VanEdge& edge);

	EdgeExtractor m_edges;

	//Settings
	double m_nominalHalfBit;
	double m_tolerance;
	double m_acquireTolerance;
	size_t m_lockIntervals;
	double m_trackingWeight;
	double m_idleHalfBits;
	size_t m_maxInvalid;

	///@brief Current half-bit period estimate, in ticks
	double m_halfBit;

	bool m_locked;

	bool m_haveLastEdge;
	VanEdge m_lastEdge;

	///@brief Edges of the candidate start of frame while acquiring, empty after a failed candidate until idle
	std::vector<VanEdge> m_burst;

	size_t m_consecutiveInvalid;

	///@brief Cells ready to be handed out
	std::deque<VanBitCell> m_pending;
};

#endif
