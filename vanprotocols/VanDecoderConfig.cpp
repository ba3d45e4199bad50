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
	@brief Implementation of VanDecoderConfig
 */

#include "vanprotocols.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

VanDecoderConfig::VanDecoderConfig()
	: m_sampleRateName("Sample Rate")
	, m_bitRateName("Bit Rate")
	, m_channelName("Primary Channel")
	, m_toleranceName("Tolerance")
	, m_acqToleranceName("Acquisition Tolerance")
	, m_lockIntervalsName("Lock Intervals")
	, m_trackingWeightName("Tracking Weight")
	, m_idleName("Idle Half Bits")
	, m_maxInvalidName("Max Invalid Intervals")
	, m_glitchToleranceName("Glitch Tolerance")
	, m_eofBitsName("EOF Bits")
	, m_flushOnCancelName("Flush On Cancel")
{
	m_parameters[m_sampleRateName] = DecoderParameter(DecoderParameter::TYPE_INT, Unit(Unit::UNIT_SAMPLERATE));
	m_parameters[m_sampleRateName].SetIntVal(8000000);

	m_parameters[m_bitRateName] = DecoderParameter(DecoderParameter::TYPE_INT, Unit(Unit::UNIT_BITRATE));
	m_parameters[m_bitRateName].SetIntVal(125000);

	m_parameters[m_channelName] = DecoderParameter(DecoderParameter::TYPE_ENUM, Unit(Unit::UNIT_COUNTS));
	m_parameters[m_channelName].AddEnumValue("Channel 0", CHANNEL_0);
	m_parameters[m_channelName].AddEnumValue("Channel 1", CHANNEL_1);
	m_parameters[m_channelName].SetIntVal(CHANNEL_0);

	//Classification window around the half and full bit periods
	m_parameters[m_toleranceName] = DecoderParameter(DecoderParameter::TYPE_FLOAT, Unit(Unit::UNIT_PERCENT));
	m_parameters[m_toleranceName].SetFloatVal(0.25);

	//Window around the nominal half bit period accepted while looking for a start of frame
	m_parameters[m_acqToleranceName] = DecoderParameter(DecoderParameter::TYPE_FLOAT, Unit(Unit::UNIT_PERCENT));
	m_parameters[m_acqToleranceName].SetFloatVal(0.5);

	m_parameters[m_lockIntervalsName] = DecoderParameter(DecoderParameter::TYPE_INT, Unit(Unit::UNIT_COUNTS));
	m_parameters[m_lockIntervalsName].SetIntVal(4);

	m_parameters[m_trackingWeightName] = DecoderParameter(DecoderParameter::TYPE_FLOAT, Unit(Unit::UNIT_COUNTS));
	m_parameters[m_trackingWeightName].SetFloatVal(0.0625);

	m_parameters[m_idleName] = DecoderParameter(DecoderParameter::TYPE_INT, Unit(Unit::UNIT_COUNTS));
	m_parameters[m_idleName].SetIntVal(6);

	m_parameters[m_maxInvalidName] = DecoderParameter(DecoderParameter::TYPE_INT, Unit(Unit::UNIT_COUNTS));
	m_parameters[m_maxInvalidName].SetIntVal(3);

	//How far from a half or full bit period a glitched interval may be and still be decoded
	m_parameters[m_glitchToleranceName] = DecoderParameter(DecoderParameter::TYPE_FLOAT, Unit(Unit::UNIT_PERCENT));
	m_parameters[m_glitchToleranceName].SetFloatVal(0.4);

	m_parameters[m_eofBitsName] = DecoderParameter(DecoderParameter::TYPE_INT, Unit(Unit::UNIT_COUNTS));
	m_parameters[m_eofBitsName].SetIntVal(8);

	m_parameters[m_flushOnCancelName] = DecoderParameter(DecoderParameter::TYPE_BOOL, Unit(Unit::UNIT_COUNTS));
	m_parameters[m_flushOnCancelName].SetBoolVal(true);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Derived values

/**
	@brief Nominal duration of half a bit, in ticks
 */
double VanDecoderConfig::GetNominalHalfBit() const
{
	auto bitrate = GetBitRate();
	if(bitrate <= 0)
		return 0;
	return static_cast<double>(GetSampleRate()) / (2.0 * bitrate);
}

/**
	@brief Converts a duration in ticks to femtoseconds, for pretty printing
 */
double VanDecoderConfig::TicksToFemtoseconds(double ticks) const
{
	auto rate = GetSampleRate();
	if(rate <= 0)
		return 0;
	return ticks * FS_PER_SECOND / rate;
}

/**
	@brief Checks that the settings describe a decodable configuration

	Every problem found is logged.

	@return True if the configuration is usable
 */
bool VanDecoderConfig::Validate() const
{
	bool ok = true;

	if(GetSampleRate() <= 0)
	{
		LogError("Sample rate must be positive\n");
		ok = false;
	}
	if(GetBitRate() <= 0)
	{
		LogError("Bit rate must be positive\n");
		ok = false;
	}
	if(ok && (GetNominalHalfBit() < 2) )
	{
		LogError("Sample rate %s is too low for bit rate %s\n",
			Unit(Unit::UNIT_SAMPLERATE).PrettyPrintInt64(GetSampleRate()).c_str(),
			Unit(Unit::UNIT_BITRATE).PrettyPrintInt64(GetBitRate()).c_str());
		ok = false;
	}

	//Half and full bit windows overlap beyond 1/3
	float tol = GetTolerance();
	if( (tol <= 0) || (tol > 1.0f/3) )
	{
		LogError("Tolerance must be between 0 and 33%%\n");
		ok = false;
	}

	float acq = GetAcquisitionTolerance();
	if( (acq <= 0) || (acq >= 1) )
	{
		LogError("Acquisition tolerance must be between 0 and 100%%\n");
		ok = false;
	}

	//The start of frame only has seven half bit intervals before the first stuff bit
	auto lock = GetLockIntervals();
	if( (lock < 1) || (lock > 7) )
	{
		LogError("Lock intervals must be between 1 and 7\n");
		ok = false;
	}

	float weight = GetTrackingWeight();
	if( (weight < 0) || (weight > 1) )
	{
		LogError("Tracking weight must be between 0 and 1\n");
		ok = false;
	}

	if(GetIdleHalfBits() < 2*(1 + tol))
	{
		LogError("Idle gap must be longer than a full bit period\n");
		ok = false;
	}

	if(GetMaxInvalidIntervals() < 1)
	{
		LogError("Max invalid intervals must be at least 1\n");
		ok = false;
	}

	float glitch = GetGlitchTolerance();
	if( (glitch < 0) || (glitch > 0.5) )
	{
		LogError("Glitch tolerance must be between 0 and 50%%\n");
		ok = false;
	}

	auto eof = GetEofBits();
	if( (eof < 1) || (eof > 32) )
	{
		LogError("EOF bits must be between 1 and 32\n");
		ok = false;
	}

	if(GetPrimaryChannel() >= LogicSample::MAX_CHANNELS)
	{
		LogError("Primary channel %zu does not exist\n", GetPrimaryChannel());
		ok = false;
	}

	return ok;
}
