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
	@brief Declaration of WaveformSampleSource
 */

#ifndef WaveformSampleSource_h
#define WaveformSampleSource_h

/**
	@brief Plays back one or two captured digital waveforms as a sample stream

	When two channels are given, every sample of either waveform produces one LogicSample. The other channel holds
	its last level (or its first level, before its first sample).
 */
class WaveformSampleSource : public SampleSource
{
public:
	WaveformSampleSource(const WaveformBase* channel0, const WaveformBase* channel1 = NULL);

	virtual StreamStatus GetNextSample(LogicSample& sample);

protected:

	/**
		@brief Playback cursor for one channel
	 */
	class Cursor
	{
	public:
		Cursor(const WaveformBase* wfm);

		bool Done() const
		{ return (m_index >= m_len); }

		int64_t GetTimestamp() const;

		const SparseDigitalWaveform* m_sparse;
		const UniformDigitalWaveform* m_uniform;
		const WaveformBase* m_wfm;
		size_t m_index;
		size_t m_len;
		bool m_level;
	};

	Cursor m_channels[LogicSample::MAX_CHANNELS];
	size_t m_numChannels;
};

#endif
