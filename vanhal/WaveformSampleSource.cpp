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
	@brief Implementation of WaveformSampleSource
 */

#include "vanhal.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

WaveformSampleSource::Cursor::Cursor(const WaveformBase* wfm)
	: m_sparse(dynamic_cast<const SparseDigitalWaveform*>(wfm))
	, m_uniform(dynamic_cast<const UniformDigitalWaveform*>(wfm))
	, m_wfm(wfm)
	, m_index(0)
	, m_len(0)
	, m_level(false)
{
	if(wfm == NULL)
		return;

	if(!m_sparse && !m_uniform)
	{
		LogError("WaveformSampleSource: waveform is not a digital waveform\n");
		return;
	}

	m_len = wfm->size();
	if(m_sparse && ( (m_sparse->m_offsets.size() < m_len) || (m_sparse->m_durations.size() < m_len) ) )
	{
		LogError("WaveformSampleSource: sparse waveform has %zu samples but only %zu offsets\n",
			m_len, m_sparse->m_offsets.size());
		m_len = 0;
	}

	if(m_len)
		m_level = GetValue(m_sparse, m_uniform, 0);
}

WaveformSampleSource::WaveformSampleSource(const WaveformBase* channel0, const WaveformBase* channel1)
	: m_channels{ Cursor(channel0), Cursor(channel1) }
	, m_numChannels(channel1 ? 2 : 1)
{
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Playback

int64_t WaveformSampleSource::Cursor::GetTimestamp() const
{
	return m_wfm->m_triggerPhase + ::GetOffset(m_sparse, m_uniform, m_index) * m_wfm->m_timescale;
}

StreamStatus WaveformSampleSource::GetNextSample(LogicSample& sample)
{
	//Find the earliest pending sample across all channels
	bool found = false;
	int64_t tnext = 0;
	for(size_t i=0; i<m_numChannels; i++)
	{
		auto& c = m_channels[i];
		if(c.Done())
			continue;

		int64_t t = c.GetTimestamp();
		if(!found || (t < tnext) )
		{
			tnext = t;
			found = true;
		}
	}
	if(!found)
		return STREAM_END;

	//Consume every channel that has a sample at this time
	for(size_t i=0; i<m_numChannels; i++)
	{
		auto& c = m_channels[i];
		if(c.Done() || (c.GetTimestamp() != tnext) )
			continue;

		c.m_level = GetValue(c.m_sparse, c.m_uniform, c.m_index);
		c.m_index ++;
	}

	sample = LogicSample(tnext, m_channels[0].m_level, m_channels[1].m_level);
	return STREAM_OK;
}
