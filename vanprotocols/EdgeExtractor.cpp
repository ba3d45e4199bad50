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
	@brief Implementation of EdgeExtractor
 */

#include "vanprotocols.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

/**
	@brief Creates an edge extractor

	@param source	Sample stream to read from. Must outlive the extractor.
	@param channel	Index of the channel to look for edges on
 */
EdgeExtractor::EdgeExtractor(SampleSource& source, size_t channel)
	: m_source(source)
	, m_channel(channel)
	, m_started(false)
	, m_lastLevel(false)
	, m_lastTimestamp(0)
	, m_droppedSamples(0)
{
	if(m_channel >= LogicSample::MAX_CHANNELS)
	{
		LogError("EdgeExtractor: channel %zu does not exist, using channel 0\n", m_channel);
		m_channel = 0;
	}
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Edge detection

/**
	@brief Gets the next transition of the selected channel

	The first sample only sets the reference level. Samples whose timestamp does not increase are dropped.
 */
StreamStatus EdgeExtractor::GetNextEdge(VanEdge& edge)
{
	LogicSample sample;
	while(true)
	{
		auto status = m_source.GetNextSample(sample);
		if(status != STREAM_OK)
			return status;

		bool v = sample.GetLevel(m_channel);

		if(!m_started)
		{
			m_started = true;
			m_lastLevel = v;
			m_lastTimestamp = sample.m_timestamp;
			continue;
		}

		if(sample.m_timestamp <= m_lastTimestamp)
		{
			if(m_droppedSamples == 0)
			{
				LogWarning("EdgeExtractor: sample at %" PRId64 " is not after previous sample at %" PRId64
					", dropping\n", sample.m_timestamp, m_lastTimestamp);
			}
			m_droppedSamples ++;
			continue;
		}
		m_lastTimestamp = sample.m_timestamp;

		//Skip samples with no transition
		if(v == m_lastLevel)
			continue;
		m_lastLevel = v;

		edge = VanEdge(sample.m_timestamp, v);
		return STREAM_OK;
	}
}
