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
	@brief Implementation of BitTimingRecovery
 */

#include "vanprotocols.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

BitTimingRecovery::BitTimingRecovery(EdgeExtractor&& edges, const VanDecoderConfig& config)
	: m_edges(std::move(edges))
	, m_nominalHalfBit(config.GetNominalHalfBit())
	, m_tolerance(config.GetTolerance())
	, m_acquireTolerance(config.GetAcquisitionTolerance())
	, m_lockIntervals(config.GetLockIntervals())
	, m_trackingWeight(config.GetTrackingWeight())
	, m_idleHalfBits(config.GetIdleHalfBits())
	, m_maxInvalid(config.GetMaxInvalidIntervals())
	, m_halfBit(m_nominalHalfBit)
	, m_locked(false)
	, m_haveLastEdge(false)
	, m_consecutiveInvalid(0)
{
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Classification

/**
	@brief Classifies an interval against a half-bit period

	Windows are half open: [T(1-tol), T(1+tol)) is a half bit, [2T(1-tol), 2T(1+tol)) a full bit.
 */
VanBitCell::celltype BitTimingRecovery::Classify(double interval, double halfBit, double tolerance)
{
	if( (interval >= halfBit*(1 - tolerance)) && (interval < halfBit*(1 + tolerance)) )
		return VanBitCell::CELL_HALF;

	if( (interval >= 2*halfBit*(1 - tolerance)) && (interval < 2*halfBit*(1 + tolerance)) )
		return VanBitCell::CELL_FULL;

	return VanBitCell::CELL_INVALID;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Actual recovery logic

/**
	@brief Gets the next classified interval

	Every edge read from the extractor produces exactly one cell, although cells of a start-of-frame candidate are
	held back until it is known whether the candidate achieves lock.
 */
StreamStatus BitTimingRecovery::GetNextCell(VanBitCell& cell)
{
	while(m_pending.empty())
	{
		VanEdge edge;
		auto status = m_edges.GetNextEdge(edge);

		if(status == STREAM_PENDING)
			return status;

		if(status == STREAM_END)
		{
			if(m_burst.empty())
				return status;

			//Candidate never locked
			ReleaseBurst();
			continue;
		}

		if(m_locked)
			OnLockedEdge(edge);
		else
			OnUnlockedEdge(edge);
	}

	cell = m_pending.front();
	m_pending.pop_front();
	return STREAM_OK;
}

/**
	@brief Handles an edge while looking for a start of frame
 */
void BitTimingRecovery::OnUnlockedEdge(const VanEdge& edge)
{
	//The first edge of the stream, or the first edge after a quiet bus, may be a start of frame
	bool idle = true;
	double gap = 0;
	int64_t start = edge.m_timestamp;
	if(m_haveLastEdge)
	{
		start = m_lastEdge.m_timestamp;
		gap = edge.m_timestamp - start;
		idle = (gap >= m_idleHalfBits * m_halfBit);
	}
	m_haveLastEdge = true;
	m_lastEdge = edge;

	if(idle)
	{
		ReleaseBurst();
		StartBurst(edge);
		return;
	}

	//Not in a candidate, wait for the bus to go idle
	if(m_burst.empty())
	{
		m_pending.push_back(VanBitCell(VanBitCell::CELL_UNCLASSIFIED, start, edge.m_timestamp, m_halfBit));
		return;
	}

	//Interval has to be close to the expected half bit, and to the mean of the candidate including this interval
	bool ok = fabs(gap - m_halfBit) <= m_acquireTolerance * m_halfBit;
	if(ok && (m_burst.size() >= 2) )
	{
		double mean = (edge.m_timestamp - m_burst.front().m_timestamp) / double(m_burst.size());
		ok = fabs(gap - mean) <= m_tolerance * mean;
	}

	m_burst.push_back(edge);
	if(!ok)
	{
		LogTrace("BitTimingRecovery: candidate at %" PRId64 " rejected after %zu edges\n",
			m_burst.front().m_timestamp, m_burst.size());
		ReleaseBurst();
	}
	else if(m_burst.size() > m_lockIntervals)
		Lock();
}

/**
	@brief Handles an edge while locked
 */
void BitTimingRecovery::OnLockedEdge(const VanEdge& edge)
{
	int64_t start = m_lastEdge.m_timestamp;
	double d = edge.m_timestamp - start;
	m_lastEdge = edge;

	//Bus went quiet, the edge closing the gap may be the next start of frame
	if(d >= m_idleHalfBits * m_halfBit)
	{
		VanBitCell cell(VanBitCell::CELL_INVALID, start, edge.m_timestamp, m_halfBit);
		cell.m_lockLost = true;
		m_pending.push_back(cell);

		LogTrace("BitTimingRecovery: bus idle at %" PRId64 "\n", start);
		m_locked = false;
		StartBurst(edge);
		return;
	}

	auto type = Classify(d, m_halfBit, m_tolerance);
	VanBitCell cell(type, start, edge.m_timestamp, m_halfBit);
	switch(type)
	{
		//Only half bits feed the tracking loop
		case VanBitCell::CELL_HALF:
			m_halfBit += m_trackingWeight * (d - m_halfBit);
			m_consecutiveInvalid = 0;
			break;

		case VanBitCell::CELL_FULL:
			m_consecutiveInvalid = 0;
			break;

		default:
			m_consecutiveInvalid ++;
			if(m_consecutiveInvalid >= m_maxInvalid)
			{
				LogDebug("BitTimingRecovery: lost lock at %" PRId64 " after %zu bad intervals\n",
					edge.m_timestamp, m_consecutiveInvalid);
				cell.m_lockLost = true;
				m_locked = false;
			}
			break;
	}

	m_pending.push_back(cell);
}

/**
	@brief Declares the candidate start of frame good and releases its edges as classified cells
 */
void BitTimingRecovery::Lock()
{
	auto& first = m_burst.front();
	m_halfBit = (m_burst.back().m_timestamp - first.m_timestamp) / double(m_burst.size() - 1);
	m_locked = true;
	m_consecutiveInvalid = 0;

	LogDebug("BitTimingRecovery: locked at %" PRId64 ", half bit = %.2f ticks (nominal %.2f)\n",
		first.m_timestamp, m_halfBit, m_nominalHalfBit);

	m_pending.push_back(VanBitCell(VanBitCell::CELL_SYNC, first.m_timestamp, first.m_timestamp, m_halfBit));
	for(size_t i=1; i<m_burst.size(); i++)
	{
		m_pending.push_back(VanBitCell(
			VanBitCell::CELL_HALF, m_burst[i-1].m_timestamp, m_burst[i].m_timestamp, m_halfBit));
	}
	m_burst.clear();
}

/**
	@brief Gives up on the current candidate, passing its edges on unclassified
 */
void BitTimingRecovery::ReleaseBurst()
{
	for(size_t i=0; i<m_burst.size(); i++)
	{
		int64_t start = (i == 0) ? m_burst[0].m_timestamp : m_burst[i-1].m_timestamp;
		m_pending.push_back(VanBitCell(VanBitCell::CELL_UNCLASSIFIED, start, m_burst[i].m_timestamp, m_halfBit));
	}
	m_burst.clear();
}

void BitTimingRecovery::StartBurst(const VanEdge& edge)
{
	m_burst.clear();
	m_burst.push_back(edge);
}
