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
	@brief Implementation of VanDecoder
 */

#include "vanprotocols.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

VanDecoder::VanDecoder()
	: m_streaming(false)
	, m_cancel(false)
	, m_pumping(false)
	, m_configChanged(false)
	, m_frameCount(0)
	, m_wellFormedCount(0)
	, m_checksumFailures(0)
	, m_errorCount(0)
{
	ConnectParameters();
}

VanDecoder::VanDecoder(const VanDecoderConfig& config)
	: m_config(config)
	, m_streaming(false)
	, m_cancel(false)
	, m_pumping(false)
	, m_configChanged(false)
	, m_frameCount(0)
	, m_wellFormedCount(0)
	, m_checksumFailures(0)
	, m_errorCount(0)
{
	ConnectParameters();
}

VanDecoder::~VanDecoder()
{
	if(m_frames)
		m_frames->Discard();
}

void VanDecoder::ConnectParameters()
{
	for(auto& it : m_config)
		it.second.signal_changed().connect(sigc::mem_fun(*this, &VanDecoder::OnParameterChanged));
}

void VanDecoder::OnParameterChanged()
{
	if(m_frames && !m_configChanged)
		LogDebug("VanDecoder: configuration changed, takes effect on the next run\n");
	m_configChanged = true;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Run control

/**
	@brief Decodes everything a source has to offer

	Returns when the source reports the end of the stream, or after Cancel() is called from an event handler.

	@return False if the configuration is invalid or a push mode run is in progress
 */
bool VanDecoder::Run(SampleSource& source)
{
	if(m_streaming || m_pumping)
	{
		LogError("VanDecoder: Run() called while another run is in progress\n");
		return false;
	}

	if(!StartRun(source))
		return false;

	auto status = Pump();
	if(m_cancel)
	{
		EndRun(m_config.GetFlushOnCancel());
		return true;
	}

	//Non-blocking source ran dry. Pull mode has no way to wait for more.
	if(status == STREAM_PENDING)
		LogWarning("VanDecoder: source has no more samples available, ending run\n");

	EndRun(true);
	return true;
}

/**
	@brief Feeds one sample to the decoder, starting a new run if none is in progress

	Events for everything the sample completes are emitted before this function returns. When called from an event
	handler the sample is only queued, and is decoded by the pipeline that raised the event.

	@return False if the sample was not accepted
 */
bool VanDecoder::PushSample(const LogicSample& sample)
{
	if(m_cancel)
	{
		LogWarning("VanDecoder: run was cancelled, sample ignored until Reset()\n");
		return false;
	}

	if(m_pumping)
	{
		if(!m_streaming || m_queue.IsClosed())
		{
			LogError("VanDecoder: PushSample() called from an event handler outside of a push mode run\n");
			return false;
		}
		m_queue.Push(sample);
		return true;
	}

	if(!m_frames)
	{
		m_queue = QueueSampleSource();
		if(!StartRun(m_queue))
			return false;
		m_streaming = true;
	}
	else if(!m_streaming)
	{
		LogError("VanDecoder: PushSample() called during Run()\n");
		return false;
	}

	m_queue.Push(sample);
	auto status = Pump();

	if(m_cancel)
		EndRun(m_config.GetFlushOnCancel());

	//Finish() was called from an event handler
	else if(status == STREAM_END)
		EndRun(true);
	return true;
}

/**
	@brief Ends a push mode run, flushing any frame in progress

	When called from an event handler, the run ends once the samples already queued have been decoded.
 */
void VanDecoder::Finish()
{
	if(!m_streaming)
		return;

	m_queue.Close();
	if(m_pumping)
		return;
	Pump();

	if(m_cancel)
		EndRun(m_config.GetFlushOnCancel());
	else
		EndRun(true);
}

/**
	@brief Stops decoding

	Safe to call from an event handler. The frame in progress is flushed as truncated, or discarded if the
	"Flush On Cancel" parameter is cleared.
 */
void VanDecoder::Cancel()
{
	m_cancel = true;

	if(m_pumping)
		return;
	if(m_frames)
		EndRun(m_config.GetFlushOnCancel());
}

/**
	@brief Drops any run in progress and clears the statistics
 */
void VanDecoder::Reset()
{
	if(m_pumping)
	{
		LogError("VanDecoder: Reset() can't be called from an event handler\n");
		return;
	}

	if(m_frames)
		m_frames->Discard();
	m_frames.reset();
	m_queue = QueueSampleSource();

	m_streaming = false;
	m_cancel = false;
	m_configChanged = false;

	m_frameCount = 0;
	m_wellFormedCount = 0;
	m_checksumFailures = 0;
	m_errorCount = 0;
}

/**
	@brief Builds a fresh pipeline reading from a source
 */
bool VanDecoder::StartRun(SampleSource& source)
{
	if(!m_config.Validate())
	{
		LogError("VanDecoder: invalid configuration, not decoding\n");
		return false;
	}

	m_cancel = false;
	m_configChanged = false;
	m_frameCount = 0;
	m_wellFormedCount = 0;
	m_checksumFailures = 0;
	m_errorCount = 0;

	LogDebug("VanDecoder: starting run at %s, %s (half bit %.2f ticks, %s)\n",
		Unit(Unit::UNIT_BITRATE).PrettyPrintInt64(m_config.GetBitRate()).c_str(),
		Unit(Unit::UNIT_SAMPLERATE).PrettyPrintInt64(m_config.GetSampleRate()).c_str(),
		m_config.GetNominalHalfBit(),
		Unit(Unit::UNIT_FS).PrettyPrint(m_config.TicksToFemtoseconds(m_config.GetNominalHalfBit())).c_str());

	m_frames = make_unique<VanFrameDecoder>(
		BiphaseDecoder(
			BitTimingRecovery(
				EdgeExtractor(source, m_config.GetPrimaryChannel()),
				m_config),
			m_config),
		*this,
		m_config);
	return true;
}

/**
	@brief Runs the pipeline until it needs more input, reaches the end of the stream, or is cancelled
 */
StreamStatus VanDecoder::Pump()
{
	StreamStatus status = STREAM_OK;

	m_pumping = true;
	while(!m_cancel)
	{
		status = m_frames->Step();
		if(status != STREAM_OK)
			break;
	}
	m_pumping = false;

	return status;
}

void VanDecoder::EndRun(bool flush)
{
	//Flushing emits events too, and handlers can't feed this run any more
	m_streaming = false;
	m_pumping = true;
	if(flush)
		m_frames->Flush();
	else
		m_frames->Discard();
	m_pumping = false;

	m_frames.reset();

	LogSummary();
}

void VanDecoder::LogSummary()
{
	LogDebug("VanDecoder: run %s\n", m_cancel ? "cancelled" : "complete");
	LogIndenter li;
	LogDebug("%zu frames, %zu well formed\n", m_frameCount, m_wellFormedCount);
	LogDebug("%zu checksum failures\n", m_checksumFailures);
	LogDebug("%zu errors\n", m_errorCount);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Event delivery

void VanDecoder::OnField(const VanField& field)
{
	m_fieldSignal.emit(field);
}

void VanDecoder::OnFrame(const VanFrame& frame)
{
	m_frameCount ++;
	if(frame.m_validity == VanFrame::VALID_WELL_FORMED)
	{
		m_wellFormedCount ++;
		if(!frame.m_checksumValid)
			m_checksumFailures ++;
	}
	m_errorCount += frame.m_errors.size();

	m_frameSignal.emit(frame);
}

void VanDecoder::OnError(const VanDecodeError& error)
{
	m_errorCount ++;
	m_errorSignal.emit(error);
}
