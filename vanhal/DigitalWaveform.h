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
	@brief Declaration of the digital waveform containers
 */

#ifndef DigitalWaveform_h
#define DigitalWaveform_h

/**
	@brief Base class for all captured logic waveforms

	All times are in ticks of the capture clock. Sample i starts at m_triggerPhase + GetOffset(i)*m_timescale.
 */
class WaveformBase
{
public:

	/**
		@brief Creates an empty waveform
	 */
	WaveformBase()
		: m_timescale(1)
		, m_triggerPhase(0)
	{
	}

	//empty virtual destructor in case any derived classes need one
	virtual ~WaveformBase()
	{}

	virtual size_t size() const = 0;
	virtual void clear() = 0;

	/**
		@brief The time scale, in ticks per timestep, used by this channel.
	 */
	int64_t m_timescale;

	/**
		@brief Offset, in ticks, from the start of the capture to the first sample
	 */
	int64_t m_triggerPhase;
};

/**
	@brief A digital waveform sampled at a fixed rate, one level per timestep
 */
class UniformDigitalWaveform : public WaveformBase
{
public:
	virtual size_t size() const
	{ return m_samples.size(); }

	virtual void clear()
	{ m_samples.clear(); }

	std::vector<bool> m_samples;
};

/**
	@brief A digital waveform stored as runs of constant level

	Each sample has a start offset and a duration, both in timesteps.
 */
class SparseDigitalWaveform : public WaveformBase
{
public:
	virtual size_t size() const
	{ return m_samples.size(); }

	virtual void clear()
	{
		m_offsets.clear();
		m_durations.clear();
		m_samples.clear();
	}

	void push_back(int64_t offset, int64_t duration, bool value)
	{
		m_offsets.push_back(offset);
		m_durations.push_back(duration);
		m_samples.push_back(value);
	}

	std::vector<int64_t> m_offsets;
	std::vector<int64_t> m_durations;
	std::vector<bool> m_samples;
};

/**
	@brief Gets the offset of a sample in timesteps, whichever representation the waveform uses
 */
inline int64_t GetOffset(const SparseDigitalWaveform* sparse, const UniformDigitalWaveform* /*uniform*/, size_t i)
{
	if(sparse)
		return sparse->m_offsets[i];
	return i;
}

/**
	@brief Gets the value of a sample, whichever representation the waveform uses
 */
inline bool GetValue(const SparseDigitalWaveform* sparse, const UniformDigitalWaveform* uniform, size_t i)
{
	if(sparse)
		return sparse->m_samples[i];
	return uniform->m_samples[i];
}

#endif
