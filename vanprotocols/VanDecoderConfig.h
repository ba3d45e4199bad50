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
	@brief Declaration of VanDecoderConfig
 */

#ifndef VanDecoderConfig_h
#define VanDecoderConfig_h

/**
	@brief Settings of a VAN decode run

	All values are plain DecoderParameters, so the whole configuration can be saved and loaded as YAML.
 */
class VanDecoderConfig : public ConfigurableNode
{
public:
	VanDecoderConfig();

	enum Channel
	{
		CHANNEL_0,
		CHANNEL_1
	};

	bool Validate() const;

	double GetNominalHalfBit() const;
	double TicksToFemtoseconds(double ticks) const;

	//Accessors
	int64_t GetSampleRate() const
	{ return GetParameter(m_sampleRateName).GetIntVal(); }

	void SetSampleRate(int64_t rate)
	{ GetParameter(m_sampleRateName).SetIntVal(rate); }

	int64_t GetBitRate() const
	{ return GetParameter(m_bitRateName).GetIntVal(); }

	void SetBitRate(int64_t rate)
	{ GetParameter(m_bitRateName).SetIntVal(rate); }

	size_t GetPrimaryChannel() const
	{ return GetParameter(m_channelName).GetIntVal(); }

	void SetPrimaryChannel(Channel c)
	{ GetParameter(m_channelName).SetIntVal(c); }

	float GetTolerance() const
	{ return GetParameter(m_toleranceName).GetFloatVal(); }

	void SetTolerance(float tol)
	{ GetParameter(m_toleranceName).SetFloatVal(tol); }

	float GetAcquisitionTolerance() const
	{ return GetParameter(m_acqToleranceName).GetFloatVal(); }

	size_t GetLockIntervals() const
	{ return GetParameter(m_lockIntervalsName).GetIntVal(); }

	float GetTrackingWeight() const
	{ return GetParameter(m_trackingWeightName).GetFloatVal(); }

	void SetTrackingWeight(float w)
	{ GetParameter(m_trackingWeightName).SetFloatVal(w); }

	size_t GetIdleHalfBits() const
	{ return GetParameter(m_idleName).GetIntVal(); }

	size_t GetMaxInvalidIntervals() const
	{ return GetParameter(m_maxInvalidName).GetIntVal(); }

	float GetGlitchTolerance() const
	{ return GetParameter(m_glitchToleranceName).GetFloatVal(); }

	void SetGlitchTolerance(float tol)
	{ GetParameter(m_glitchToleranceName).SetFloatVal(tol); }

	size_t GetEofBits() const
	{ return GetParameter(m_eofBitsName).GetIntVal(); }

	void SetEofBits(size_t n)
	{ GetParameter(m_eofBitsName).SetIntVal(n); }

	bool GetFlushOnCancel() const
	{ return GetParameter(m_flushOnCancelName).GetBoolVal(); }

	void SetFlushOnCancel(bool flush)
	{ GetParameter(m_flushOnCancelName).SetBoolVal(flush); }

protected:
	std::string m_sampleRateName;
	std::string m_bitRateName;
	std::string m_channelName;
	std::string m_toleranceName;
	std::string m_acqToleranceName;
	std::string m_lockIntervalsName;
	std::string m_trackingWeightName;
	std::string m_idleName;
	std::string m_maxInvalidName;
	std::string m_glitchToleranceName;
	std::string m_eofBitsName;
	std::string m_flushOnCancelName;
};

#endif
