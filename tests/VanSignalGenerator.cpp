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
	@brief Implementation of VanSignalGenerator
 */

#include "../vanprotocols/vanprotocols.h"
#include "VanSignalGenerator.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// VanTestFrame

VanTestFrame::VanTestFrame(uint16_t identifier, uint8_t command, const vector<uint8_t>& data)
	: m_identifier(identifier & 0xfff)
	, m_command(command & 0xf)
	, m_data(data)
	, m_ack(true)
	, m_eofBits(8)
	, m_checksumFlip(0)
	, m_stuffViolationAfter(-1)
	, m_truncateAfter(SIZE_MAX)
	, m_glitchBit(-1)
	, m_glitchShift(0)
{
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

/**
	@brief Creates a generator

	@param halfBit	Nominal half bit period, in ticks
	@param seed		Seed for the jitter generator
 */
VanSignalGenerator::VanSignalGenerator(int64_t halfBit, uint32_t seed)
	: m_scale(1)
	, m_drift(0)
	, m_jitter(0)
	, m_gapHalfBits(40)
	, m_halfBit(halfBit)
	, m_rng(seed)
	, m_idleLevel(true)
	, m_now(20 * halfBit)
{
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Bit level encoding

/**
	@brief Gets the bits of a frame from the start of frame to the end of the checksum, without stuffing
 */
vector<bool> VanSignalGenerator::GetFrameBits(const VanTestFrame& frame)
{
	vector<bool> covered;
	auto append = [](vector<bool>& bits, uint32_t value, int nbits)
	{
		for(int i=nbits-1; i>=0; i--)
			bits.push_back( (value >> i) & 1 );
	};

	append(covered, frame.m_identifier, 12);
	append(covered, frame.m_command, 4);
	for(auto b : frame.m_data)
		append(covered, b, 8);

	uint16_t crc = VanCRC::ToWireFormat(VanCRC::Compute(covered) ^ frame.m_checksumFlip);

	vector<bool> bits;
	append(bits, VanFrameDecoder::SOF_PATTERN, 8);
	bits.insert(bits.end(), covered.begin(), covered.end());
	append(bits, crc, 16);
	return bits;
}

/**
	@brief Gets the bits of a frame as sent on the wire: stuffed, then end of data, acknowledge and end of frame
 */
vector<bool> VanSignalGenerator::GetLineBits(const VanTestFrame& frame)
{
	auto bits = GetFrameBits(frame);

	vector<bool> raw;
	size_t count = 0;
	auto push = [&raw, &count, &frame](bool v) -> bool
	{
		raw.push_back(v);
		count ++;
		return (count >= frame.m_truncateAfter);
	};

	for(size_t i=0; i<bits.size(); i++)
	{
		//Stuff bit after every four bits
		if( (raw.size() % 5) == 4)
		{
			bool prev = raw.back();
			if(static_cast<int>(i) - 1 == frame.m_stuffViolationAfter)
				raw.push_back(prev);
			else
				raw.push_back(!prev);
		}

		if(push(bits[i]))
			return raw;
	}

	//End of data: the checksum ends in 0, and so does the following stuff slot
	if(push(false))
		return raw;

	//Acknowledge delimiter and slot
	if(push(true))
		return raw;
	if(push(!frame.m_ack))
		return raw;

	for(size_t i=0; i<frame.m_eofBits; i++)
	{
		if(push(true))
			return raw;
	}

	return raw;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Waveform synthesis

/**
	@brief Gets the time of a half bit boundary

	@param start	Time of the first transition of the frame
	@param n		Number of half bits since then
 */
int64_t VanSignalGenerator::GetHalfBitTime(int64_t start, size_t n) const
{
	double halfbits = n + m_drift * n * (n - 1.0) / 2;
	return start + llround(halfbits * m_halfBit * m_scale);
}

/**
	@brief Appends a frame, then m_gapHalfBits of quiet bus
 */
void VanSignalGenerator::AddFrame(const VanTestFrame& frame)
{
	auto raw = GetLineBits(frame);

	//Mid-bit transition to move, counted in half bits. Every fifth line bit is a stuff bit.
	size_t glitchEdge = SIZE_MAX;
	if(frame.m_glitchBit >= 0)
	{
		size_t d = frame.m_glitchBit;
		glitchEdge = 2*(d + d/4) + 1;
	}

	int64_t start = m_now;
	auto push = [this, start, glitchEdge, &frame](size_t halfbits)
	{
		int64_t t = GetHalfBitTime(start, halfbits);
		if(halfbits == glitchEdge)
			t += frame.m_glitchShift;
		if(m_jitter)
			t += uniform_int_distribution<int64_t>(-m_jitter, m_jitter)(m_rng);
		m_edges.push_back(t);
	};

	//A zero has a transition at the start of the cell, every bit has one in the middle
	for(size_t i=0; i<raw.size(); i++)
	{
		if(!raw[i])
			push(2*i);
		push(2*i + 1);
	}

	m_now = GetHalfBitTime(start, 2*raw.size()) + m_gapHalfBits*m_halfBit;
}

void VanSignalGenerator::AddIdle(size_t halfBits)
{
	m_now += halfBits * m_halfBit;
}

/**
	@brief Appends a single transition, for simulating noise
 */
void VanSignalGenerator::AddEdge(int64_t delay)
{
	m_now += delay;
	m_edges.push_back(m_now);
}

/**
	@brief Writes everything generated so far to a waveform, one sample per level change
 */
void VanSignalGenerator::Render(SparseDigitalWaveform& wfm) const
{
	wfm.clear();
	wfm.m_timescale = 1;
	wfm.m_triggerPhase = 0;

	bool level = m_idleLevel;
	if(m_edges.empty())
	{
		wfm.push_back(0, m_now, level);
		return;
	}

	wfm.push_back(0, m_edges[0], level);
	for(size_t i=0; i<m_edges.size(); i++)
	{
		level = !level;

		int64_t next;
		if(i+1 < m_edges.size())
			next = m_edges[i+1];
		else
			next = max(m_now, m_edges[i] + 1);

		wfm.push_back(m_edges[i], next - m_edges[i], level);
	}
}

/**
	@brief Gets everything generated so far as samples, for push mode

	@param secondChannel	Put the signal on channel 1 and hold channel 0 low
 */
vector<LogicSample> VanSignalGenerator::GetSamples(bool secondChannel) const
{
	vector<LogicSample> ret;

	bool level = m_idleLevel;
	auto push = [&ret, secondChannel](int64_t t, bool v)
	{
		if(secondChannel)
			ret.push_back(LogicSample(t, false, v));
		else
			ret.push_back(LogicSample(t, v));
	};

	push(0, level);
	for(auto t : m_edges)
	{
		level = !level;
		push(t, level);
	}
	return ret;
}
