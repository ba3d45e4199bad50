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
	@brief Implementation of BiphaseDecoder
 */

#include "vanprotocols.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

BiphaseDecoder::BiphaseDecoder(BitTimingRecovery&& timing, const VanDecoderConfig& config)
	: m_timing(std::move(timing))
	, m_glitchTolerance(config.GetGlitchTolerance())
	, m_phase(PHASE_HUNT)
	, m_cellStart(0)
	, m_cellRecovered(false)
	, m_rawIndex(0)
	, m_destuff(true)
	, m_lastValue(false)
	, m_noiseReported(false)
{
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Actual decoder logic

/**
	@brief Gets the next data bit, end of data marker, or change of line state
 */
StreamStatus BiphaseDecoder::GetNextBit(VanBit& bit)
{
	while(m_pending.empty())
	{
		VanBitCell cell;
		auto status = m_timing.GetNextCell(cell);
		if(status != STREAM_OK)
			return status;

		OnCell(cell);
	}

	bit = m_pending.front();
	m_pending.pop_front();
	return STREAM_OK;
}

void BiphaseDecoder::OnCell(const VanBitCell& cell)
{
	switch(cell.m_type)
	{
		//Activity we can't make sense of, report once per run
		case VanBitCell::CELL_UNCLASSIFIED:
			if(!m_noiseReported)
			{
				LineError(VanDecodeError::ERR_TIMING, cell.m_end, "bus activity without bit lock");
				m_noiseReported = true;
			}
			m_phase = PHASE_HUNT;
			break;

		//First edge of the start of frame is a cell boundary (the frame starts with a 0)
		case VanBitCell::CELL_SYNC:
			m_phase = PHASE_BOUNDARY;
			m_cellStart = cell.m_end;
			m_cellRecovered = false;
			m_rawIndex = 0;
			m_destuff = true;
			m_lastValue = false;
			m_noiseReported = false;
			m_pending.push_back(VanBit(VanBit::TYPE_SYNC, cell.m_end, cell.m_end));
			break;

		case VanBitCell::CELL_HALF:
		case VanBitCell::CELL_FULL:
			if(m_phase != PHASE_HUNT)
				OnInterval(cell.m_type == VanBitCell::CELL_FULL, cell, false);
			break;

		case VanBitCell::CELL_INVALID:
			{
				if(m_phase == PHASE_HUNT)
					break;

				if(cell.m_lockLost)
				{
					m_pending.push_back(VanBit(VanBit::TYPE_IDLE, cell.m_start, cell.m_end));
					m_phase = PHASE_HUNT;
					break;
				}

				//See if the interval is close enough to a half or full bit to guess
				double halfBit = cell.m_halfBit;
				double d = cell.GetLength();
				long n = lround(d / halfBit);
				if( ( (n == 1) || (n == 2) ) && (fabs(d - n*halfBit) <= m_glitchTolerance * halfBit) )
				{
					LogTrace("BiphaseDecoder: recovered %.2f half bit interval at %" PRId64 " as %ld\n",
						d / halfBit, cell.m_start, n);
					OnInterval(n == 2, cell, true);
				}
				else
				{
					char tmp[128];
					snprintf(tmp, sizeof(tmp), "interval of %.2f half bits", d / halfBit);
					LineError(VanDecodeError::ERR_TIMING, cell.m_start, tmp);
				}
			}
			break;
	}
}

/**
	@brief Advances the phase by one interval, decoding a bit whenever a mid-cell transition is reached
 */
void BiphaseDecoder::OnInterval(bool full, const VanBitCell& cell, bool recovered)
{
	if(recovered)
		m_cellRecovered = true;

	int64_t halfBit = llround(cell.m_halfBit);

	switch(m_phase)
	{
		case PHASE_BOUNDARY:

			//Every cell has a mid transition, can't skip one
			if(full)
			{
				LineError(VanDecodeError::ERR_TIMING, cell.m_start, "missing mid-bit transition");
				break;
			}

			//Boundary plus mid transition is a 0
			m_phase = PHASE_MID;
			OnLineBit(false, m_cellStart, cell.m_end + halfBit, m_cellRecovered);
			m_cellRecovered = false;
			break;

		case PHASE_MID:

			//No boundary transition is a 1
			if(full)
			{
				OnLineBit(true, cell.m_start + halfBit, cell.m_end + halfBit, m_cellRecovered);
				m_cellRecovered = false;
			}

			//Boundary transition, bit completes on the next edge
			else
			{
				m_cellStart = cell.m_end;
				m_phase = PHASE_BOUNDARY;
			}
			break;

		default:
			break;
	}
}

/**
	@brief Handles one bit as sent on the wire, removing stuff bits
 */
void BiphaseDecoder::OnLineBit(bool value, int64_t start, int64_t end, bool recovered)
{
	size_t index = m_rawIndex ++;

	if(m_destuff && ( (index % (STUFF_INTERVAL + 1)) == STUFF_INTERVAL) )
	{
		//Normal stuff bit, drop it
		if(value != m_lastValue)
		{
			m_lastValue = value;
			return;
		}

		//Two zeroes: end of data
		if(!value)
		{
			VanBit bit(VanBit::TYPE_EOD, start, end);
			bit.m_index = index;
			bit.m_recovered = recovered;
			m_pending.push_back(bit);

			//Acknowledge and end of frame are not stuffed
			m_destuff = false;
			return;
		}

		LineError(VanDecodeError::ERR_STUFFING, start, "stuff bit missing after bit " + to_string(index));
		return;
	}

	VanBit bit(VanBit::TYPE_BIT, start, end);
	bit.m_value = value;
	bit.m_recovered = recovered;
	bit.m_index = index;
	m_pending.push_back(bit);

	m_lastValue = value;
}

/**
	@brief Reports an error and stops decoding until the next sync
 */
void BiphaseDecoder::LineError(VanDecodeError::errtype type, int64_t timestamp, const string& detail)
{
	LogDebug("BiphaseDecoder: %s at %" PRId64 " (%s)\n",
		VanDecodeError::GetTypeName(type), timestamp, detail.c_str());

	VanBit bit(VanBit::TYPE_ERROR, timestamp, timestamp);
	bit.m_error = VanDecodeError(type, timestamp, detail);
	m_pending.push_back(bit);

	m_phase = PHASE_HUNT;
}
