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
	@brief Implementation of VanFrameDecoder
 */

#include "vanprotocols.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

VanFrameDecoder::VanFrameDecoder(BiphaseDecoder&& bits, VanEventSink& sink, const VanDecoderConfig& config)
	: m_bits(std::move(bits))
	, m_sink(sink)
	, m_eofBits(config.GetEofBits())
	, m_state(STATE_IDLE)
	, m_inFrame(false)
	, m_bitCount(0)
	, m_fieldStart(0)
	, m_fieldFirstBit(0)
	, m_fieldRecovered(false)
	, m_sofRecovered(0)
	, m_ackDone(false)
	, m_lastBitEnd(0)
	, m_lastTimestamp(0)
{
	if(m_eofBits < 1)
		m_eofBits = 1;
}

const char* VanFrameDecoder::GetStateName(state_t s)
{
	switch(s)
	{
		case STATE_IDLE:
			return "idle";

		case STATE_SOF:
			return "start of frame";

		case STATE_IDENTIFIER:
			return "identifier";

		case STATE_CONTROL:
			return "command";

		case STATE_DATA:
			return "data";

		case STATE_CHECKSUM:
			return "checksum";

		case STATE_END_FIELDS:
			return "end of frame";

		default:
			return "unknown";
	}
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Actual decoder logic

/**
	@brief Pulls one item from the line decoder and processes it
 */
StreamStatus VanFrameDecoder::Step()
{
	VanBit bit;
	auto status = m_bits.GetNextBit(bit);
	if(status == STREAM_OK)
		OnBit(bit);
	return status;
}

/**
	@brief Processes one item of the line decoder output
 */
void VanFrameDecoder::OnBit(const VanBit& bit)
{
	if(bit.m_end > m_lastTimestamp)
		m_lastTimestamp = bit.m_end;

	switch(bit.m_type)
	{
		//New burst, look for a start of frame
		case VanBit::TYPE_SYNC:
			if(m_inFrame)
				Abandon(VanDecodeError(VanDecodeError::ERR_FRAMING, bit.m_start, "start of frame inside a frame"));
			else if( (m_state == STATE_SOF) && !m_fieldBits.empty() )
			{
				m_sink.OnError(
					VanDecodeError(VanDecodeError::ERR_FRAMING, m_fieldStart, "start of frame interrupted"));
			}

			m_state = STATE_SOF;
			m_bitCount = 0;
			m_sofRecovered = 0;
			ResetField();
			break;

		case VanBit::TYPE_IDLE:
			if(m_inFrame)
				Abandon(VanDecodeError(VanDecodeError::ERR_TIMING, bit.m_start, "bit lock lost"));
			else if( (m_state == STATE_SOF) && !m_fieldBits.empty() )
			{
				m_sink.OnError(
					VanDecodeError(VanDecodeError::ERR_FRAMING, m_fieldStart, "start of frame interrupted"));
			}
			m_state = STATE_IDLE;
			break;

		//Line errors kill the frame, or stand alone if there is none
		case VanBit::TYPE_ERROR:
			if(m_inFrame)
				Abandon(bit.m_error);
			else
				m_sink.OnError(bit.m_error);
			m_state = STATE_IDLE;
			break;

		case VanBit::TYPE_EOD:
			OnEndOfData(bit);
			break;

		case VanBit::TYPE_BIT:
			OnDataBit(bit);
			break;
	}
}

void VanFrameDecoder::OnDataBit(const VanBit& bit)
{
	switch(m_state)
	{
		//Nothing to do until the next sync
		case STATE_IDLE:
			break;

		//Start of frame: 0000 1110 after destuffing
		case STATE_SOF:
			if(m_fieldBits.empty())
			{
				m_fieldStart = bit.m_start;
				m_fieldFirstBit = 0;
			}
			m_fieldBits.push_back(bit.m_value);
			m_lastBitEnd = bit.m_end;
			m_bitCount ++;
			if(bit.m_recovered)
			{
				m_sofRecovered ++;
				m_fieldRecovered = true;
			}

			if(m_fieldBits.size() == SOF_BITS)
			{
				uint32_t sof = ConvertVectorSignalToScalar(m_fieldBits);
				if(sof != SOF_PATTERN)
				{
					LogDebug("VanFrameDecoder: bad start of frame %s at %" PRId64 "\n",
						to_string_hex(sof, true, 2).c_str(), m_fieldStart);
					m_sink.OnError(VanDecodeError(VanDecodeError::ERR_FRAMING, m_fieldStart,
						"start of frame " + to_string_hex(sof, true, 2) + " instead of 0e"));
					ResetField();
					m_state = STATE_IDLE;
				}
				else
					StartFrame();
			}
			break;

		//Identifier (12 bits, MSB first)
		case STATE_IDENTIFIER:
			if(!AcceptBit(bit, true))
				return;
			m_covered.push_back(bit.m_value);

			if(m_fieldBits.size() == ID_BITS)
			{
				m_frame.m_identifier = ConvertVectorSignalToScalar(m_fieldBits);
				EmitField(VanField::FIELD_IDENTIFIER, m_frame.m_identifier, bit.m_end);
				m_state = STATE_CONTROL;
			}
			break;

		//Command (EXT, RAK, R/W, RTR)
		case STATE_CONTROL:
			if(!AcceptBit(bit, false))
				return;
			m_covered.push_back(bit.m_value);

			if(m_fieldBits.size() == COM_BITS)
			{
				uint32_t com = ConvertVectorSignalToScalar(m_fieldBits);
				m_frame.m_ext = (com & COM_EXT) != 0;
				m_frame.m_rak = (com & COM_RAK) != 0;
				m_frame.m_rw = (com & COM_RW) != 0;
				m_frame.m_rtr = (com & COM_RTR) != 0;
				EmitField(VanField::FIELD_CONTROL, com, bit.m_end);

				//Remote transmission requests carry no data
				if(m_frame.m_rtr)
					m_state = STATE_CHECKSUM;
				else
					m_state = STATE_DATA;
			}
			break;

		//Data bytes, MSB first. The last 16 bits are held back until we know they aren't the checksum.
		case STATE_DATA:
			m_held.push_back(bit);
			m_lastBitEnd = bit.m_end;
			m_bitCount ++;
			if(m_held.size() == CRC_SLOTS + 8)
				ReleaseDataByte();
			break;

		//Checksum of a remote transmission request, which has no data phase
		case STATE_CHECKSUM:
			if(m_held.size() == CRC_SLOTS)
			{
				Abandon(VanDecodeError(VanDecodeError::ERR_FRAMING, bit.m_start,
					"checksum not followed by end of data"));
				return;
			}
			m_held.push_back(bit);
			m_lastBitEnd = bit.m_end;
			m_bitCount ++;
			break;

		//Acknowledge delimiter and slot, then end of frame
		case STATE_END_FIELDS:
			if(!AcceptBit(bit, false))
				return;

			if(!m_ackDone)
			{
				if(m_fieldBits.size() == 1)
				{
					if(!bit.m_value)
					{
						Abandon(VanDecodeError(VanDecodeError::ERR_FRAMING, bit.m_start,
							"acknowledge delimiter is not 1"));
					}
				}

				//A receiver acknowledges by pulling the slot to 0
				else
				{
					m_frame.m_ack = !bit.m_value;
					EmitField(VanField::FIELD_ACK, m_frame.m_ack, bit.m_end);
					m_ackDone = true;
				}
			}

			else
			{
				if(!bit.m_value)
				{
					Abandon(VanDecodeError(VanDecodeError::ERR_FRAMING, bit.m_start,
						"end of frame bit " + to_string(m_fieldBits.size() - 1) + " is not 1"));
				}
				else if(m_fieldBits.size() == m_eofBits)
				{
					EmitField(VanField::FIELD_EOF, ConvertVectorSignalToScalar(m_fieldBits), bit.m_end);
					FinishFrame(bit.m_end);
				}
			}
			break;
	}
}

/**
	@brief Handles the end of data code, which closes the checksum

	The code is a 0 bit followed by a 0 in the stuff slot. The 0 bit is the last held slot, the 15 before it are the
	checksum.
 */
void VanFrameDecoder::OnEndOfData(const VanBit& bit)
{
	switch(m_state)
	{
		case STATE_IDLE:
			return;

		case STATE_SOF:
			m_sink.OnError(VanDecodeError(VanDecodeError::ERR_FRAMING, bit.m_start, "end of data in start of frame"));
			ResetField();
			m_state = STATE_IDLE;
			return;

		//Payload has to end on a byte boundary
		case STATE_DATA:
			if(m_held.size() != CRC_SLOTS)
			{
				Abandon(VanDecodeError(VanDecodeError::ERR_FRAMING, bit.m_start,
					"end of data not preceded by a 15 bit checksum"));
				return;
			}
			break;

		case STATE_CHECKSUM:
			if(m_held.size() != CRC_SLOTS)
			{
				size_t n = m_held.empty() ? 0 : m_held.size() - 1;
				Abandon(VanDecodeError(VanDecodeError::ERR_FRAMING, bit.m_start,
					"end of data after " + to_string(n) + " checksum bits"));
				return;
			}
			break;

		default:
			Abandon(VanDecodeError(VanDecodeError::ERR_FRAMING, bit.m_start,
				string("end of data in ") + GetStateName(m_state)));
			return;
	}

	for(size_t i=0; i<CRC_BITS; i++)
	{
		if(m_held[i].m_recovered)
		{
			Abandon(VanDecodeError(VanDecodeError::ERR_TIMING, m_held[i].m_start, "recovered bit in checksum"));
			return;
		}
	}

	CheckChecksum();

	auto lead = m_held.back();
	m_held.clear();

	VanField eod(VanField::FIELD_EOD, 0, lead.m_start, bit.m_end, m_bitCount - 1, 2);
	if(lead.m_recovered)
		NoteRecovered(lead.m_start);
	if(bit.m_recovered)
		NoteRecovered(bit.m_start);
	eod.m_recovered = lead.m_recovered || bit.m_recovered;
	m_bitCount ++;
	PublishField(eod);

	m_ackDone = false;
	m_state = STATE_END_FIELDS;
}

/**
	@brief Verifies the held checksum against the covered bits and emits it
 */
void VanFrameDecoder::CheckChecksum()
{
	vector<bool> bits;
	for(size_t i=0; i<CRC_BITS; i++)
		bits.push_back(m_held[i].m_value);

	m_frame.m_checksum = ConvertVectorSignalToScalar(bits);
	m_frame.m_checksumValid = VanCRC::Validate(m_covered, m_frame.m_checksum);

	int64_t start = m_held[0].m_start;
	PublishField(VanField(VanField::FIELD_CHECKSUM, m_frame.m_checksum, start, m_held[CRC_BITS-1].m_end,
		m_bitCount - m_held.size(), CRC_BITS));

	if(!m_frame.m_checksumValid)
	{
		string detail = "received " + to_string_hex(m_frame.m_checksum, true, 4) +
			", computed " + to_string_hex(VanCRC::Compute(m_covered), true, 4);

		LogDebug("VanFrameDecoder: checksum mismatch in frame %s (%s)\n",
			to_string_hex(m_frame.m_identifier, true, 3).c_str(), detail.c_str());
		m_frame.m_errors.push_back(VanDecodeError(VanDecodeError::ERR_CHECKSUM, start, detail));
	}
}

/**
	@brief Publishes the oldest held byte, which is too far from the end of data to be part of the checksum

	Recovered bits are only counted here, so bits that end up in the checksum are not counted twice.
 */
void VanFrameDecoder::ReleaseDataByte()
{
	if(m_frame.m_data.size() >= MAX_DATA_BYTES)
	{
		Abandon(VanDecodeError(VanDecodeError::ERR_FRAMING, m_held.front().m_start,
			"more than " + to_string(MAX_DATA_BYTES) + " data bytes"));
		return;
	}

	VanField byte(VanField::FIELD_DATA, 0, m_held[0].m_start, m_held[7].m_end, m_bitCount - m_held.size(), 8);
	byte.m_index = m_frame.m_data.size();
	for(size_t i=0; i<8; i++)
	{
		auto& b = m_held[i];
		byte.m_value = (byte.m_value << 1) | b.m_value;
		m_covered.push_back(b.m_value);
		if(b.m_recovered)
		{
			NoteRecovered(b.m_start);
			byte.m_recovered = true;
		}
	}
	m_held.erase(m_held.begin(), m_held.begin() + 8);

	m_frame.m_data.push_back(byte.m_value);
	PublishField(byte);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Field helpers

/**
	@brief Adds a bit to the field being accumulated

	@param bit		The bit
	@param critical	If set, a recovered bit abandons the frame

	@return False if the frame was abandoned
 */
bool VanFrameDecoder::AcceptBit(const VanBit& bit, bool critical)
{
	if(bit.m_recovered)
	{
		if(critical)
		{
			Abandon(VanDecodeError(VanDecodeError::ERR_TIMING, bit.m_start,
				string("recovered bit in ") + GetStateName(m_state)));
			return false;
		}

		NoteRecovered(bit.m_start);
		m_fieldRecovered = true;
	}

	if(m_fieldBits.empty())
	{
		m_fieldStart = bit.m_start;
		m_fieldFirstBit = m_bitCount;
	}
	m_fieldBits.push_back(bit.m_value);
	m_lastBitEnd = bit.m_end;
	m_bitCount ++;
	return true;
}

/**
	@brief Counts a recovered bit on the frame, attaching a note the first time
 */
void VanFrameDecoder::NoteRecovered(int64_t timestamp)
{
	m_frame.m_recoveredBits ++;
	if(m_frame.m_recoveredBits == 1)
	{
		m_frame.m_errors.push_back(
			VanDecodeError(VanDecodeError::ERR_TIMING, timestamp, "bit recovered after timing glitch"));
	}
}

void VanFrameDecoder::ResetField()
{
	m_fieldBits.clear();
	m_fieldRecovered = false;
}

/**
	@brief Emits the accumulated field and starts a new one
 */
void VanFrameDecoder::EmitField(VanField::ftype type, uint32_t value, int64_t end)
{
	VanField field(type, value, m_fieldStart, end, m_fieldFirstBit, m_fieldBits.size());
	field.m_recovered = m_fieldRecovered;
	ResetField();

	PublishField(field);
}

void VanFrameDecoder::PublishField(const VanField& field)
{
	LogTrace("VanFrameDecoder: %s\n", field.ToString().c_str());

	m_frame.m_fields.push_back(field);
	m_sink.OnField(field);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Frame lifecycle

/**
	@brief Creates the frame once the start of frame pattern has been matched
 */
void VanFrameDecoder::StartFrame()
{
	m_frame = VanFrame();
	m_frame.m_start = m_fieldStart;
	m_inFrame = true;

	m_covered.clear();
	m_held.clear();

	for(size_t i=0; i<m_sofRecovered; i++)
		NoteRecovered(m_fieldStart);

	EmitField(VanField::FIELD_SOF, SOF_PATTERN, m_lastBitEnd);
	m_state = STATE_IDENTIFIER;
}

void VanFrameDecoder::FinishFrame(int64_t end)
{
	m_frame.m_validity = VanFrame::VALID_WELL_FORMED;
	m_frame.m_end = end;

	LogTrace("VanFrameDecoder: frame %s\n", m_frame.ToString().c_str());

	m_inFrame = false;
	m_state = STATE_IDLE;
	m_sink.OnFrame(m_frame);
}

/**
	@brief Gives up on the frame in progress, emitting it with the error that killed it
 */
void VanFrameDecoder::Abandon(const VanDecodeError& error)
{
	LogDebug("VanFrameDecoder: abandoning frame in %s: %s\n", GetStateName(m_state), error.ToString().c_str());

	m_frame.m_errors.push_back(error);
	m_frame.m_validity = VanFrame::VALID_FRAMING_ERROR;
	m_frame.m_end = max(m_lastTimestamp, error.m_timestamp);

	m_inFrame = false;
	m_state = STATE_IDLE;
	m_held.clear();
	ResetField();

	m_sink.OnFrame(m_frame);
}

/**
	@brief Ends decoding at the end of the stream

	A frame in progress is emitted as truncated. Bytes still held back are dropped since it is unknown whether they
	were data or checksum.
 */
void VanFrameDecoder::Flush()
{
	if(m_inFrame)
	{
		string detail = string("stream ended in ") + GetStateName(m_state);
		if( (m_state == STATE_DATA) && (m_held.size() >= 8) )
			detail += ", " + to_string(m_held.size() / 8) + " unconfirmed bytes dropped";

		LogDebug("VanFrameDecoder: frame %s truncated (%s)\n",
			to_string_hex(m_frame.m_identifier, true, 3).c_str(), detail.c_str());

		m_frame.m_errors.push_back(VanDecodeError(VanDecodeError::ERR_TRUNCATION, m_lastTimestamp, detail));
		m_frame.m_validity = VanFrame::VALID_TRUNCATED;
		m_frame.m_end = m_lastTimestamp;
		m_inFrame = false;
		m_sink.OnFrame(m_frame);
	}
	else if(m_state == STATE_SOF)
	{
		m_sink.OnError(
			VanDecodeError(VanDecodeError::ERR_TRUNCATION, m_lastTimestamp, "stream ended in start of frame"));
	}

	m_state = STATE_IDLE;
	m_held.clear();
	ResetField();
}

/**
	@brief Drops the frame in progress without emitting anything
 */
void VanFrameDecoder::Discard()
{
	if(m_inFrame)
	{
		LogDebug("VanFrameDecoder: discarding frame %s in %s\n",
			to_string_hex(m_frame.m_identifier, true, 3).c_str(), GetStateName(m_state));
	}

	m_inFrame = false;
	m_state = STATE_IDLE;
	m_held.clear();
	ResetField();
}
