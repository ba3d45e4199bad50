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
	@brief Declaration of SampleSource and LogicSample
 */

#ifndef SampleSource_h
#define SampleSource_h

/**
	@brief Result of asking a stream stage for its next item
 */
enum StreamStatus
{
	STREAM_OK,			//an item was produced
	STREAM_PENDING,		//no item available yet, ask again once more input has been pushed
	STREAM_END			//the stream is over, no more items will ever be produced
};

/**
	@brief Logic levels of all monitored channels at one point in time
 */
class LogicSample
{
public:
	LogicSample()
	: m_timestamp(0)
	, m_levels(0)
	{}

	LogicSample(int64_t timestamp, bool level0, bool level1 = false)
	: m_timestamp(timestamp)
	, m_levels( (level0 ? 1 : 0) | (level1 ? 2 : 0) )
	{}

	///@brief Number of channels a sample can carry
	static constexpr size_t MAX_CHANNELS = 2;

	bool GetLevel(size_t channel) const
	{ return (m_levels >> channel) & 1; }

	bool operator==(const LogicSample& rhs) const
	{ return (m_timestamp == rhs.m_timestamp) && (m_levels == rhs.m_levels); }

	///@brief Time of the sample, in ticks of the capture clock
	int64_t m_timestamp;

	///@brief Bit i is the level of channel i
	uint8_t m_levels;
};

/**
	@brief Abstract supplier of logic samples in timestamp order

	Implementations may be finite (a stored capture), live (samples pushed by the host as they arrive), or both.
 */
class SampleSource
{
public:
	virtual ~SampleSource()
	{}

	/**
		@brief Gets the next sample

		@param sample	Filled with the sample if STREAM_OK is returned, untouched otherwise
	 */
	virtual StreamStatus GetNextSample(LogicSample& sample) = 0;
};

#endif
