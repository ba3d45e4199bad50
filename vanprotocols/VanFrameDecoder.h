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
	@brief Declaration of VanFrameDecoder
 */

#ifndef VanFrameDecoder_h
#define VanFrameDecoder_h

/**
	@brief Walks the VAN frame grammar over the destuffed bit stream

	Frame layout, in destuffed bits:

	@code
	SOF (8)  ID (12)  COM (4)  DATA (0-28 bytes)  CRC (15)  EOD (2)  ACK (2)  EOF (n)
	@endcode

	There is no length field: the checksum is the last 15 bits before the end of data code, which is a 0 bit
	followed by a 0 in the stuff slot.
 */
class VanFrameDecoder
{
public:
	VanFrameDecoder(BiphaseDecoder&& bits, VanEventSink& sink, const VanDecoderConfig& config);

	StreamStatus Step();
	void OnBit(const VanBit& bit);

	void Flush();
	void Discard();

	enum state_t
	{
		STATE_IDLE,
		STATE_SOF,
		STATE_IDENTIFIER,
		STATE_CONTROL,
		STATE_DATA,
		STATE_CHECKSUM,
		STATE_END_FIELDS
	};

	static const char* GetStateName(state_t s);

	state_t GetState() const
	{ return m_state; }

	bool InFrame() const
	{ return m_inFrame; }

	static constexpr uint32_t SOF_PATTERN = 0x0e;
	static constexpr size_t SOF_BITS = 8;
	static constexpr size_t ID_BITS = 12;
	static constexpr size_t COM_BITS = 4;
	static constexpr size_t CRC_BITS = 15;

	///@brief Checksum plus the 0 slot that opens the end of data code
	static constexpr size_t CRC_SLOTS = CRC_BITS + 1;
	static constexpr size_t MAX_DATA_BYTES = 28;

	//Command field flags
	static constexpr uint32_t COM_EXT = 0x8;
	static constexpr uint32_t COM_RAK = 0x4;
	static constexpr uint32_t COM_RW = 0x2;
	static constexpr uint32_t COM_RTR = 0x1;

protected:
	void OnDataBit(const VanBit& bit);
	void OnEndOfData(const VanBit& bit);

	bool AcceptBit(const VanBit& bit, bool critical);
	void NoteRecovered(int64_t timestamp);
	void ResetField();
	void EmitField(VanField::ftype type, uint32_t value, int64_t end);
	void PublishField(const VanField& field);

	void ReleaseDataByte();

	void StartFrame();
	void CheckChecksum();
	void FinishFrame(int64_t end);
	void Abandon(const VanDecodeError& error);

	BiphaseDecoder m_bits;
	VanEventSink& m_sink;

	size_t m_eofBits;

	state_t m_state;

	///@brief m_frame is valid (the start of frame has been matched)
	bool m_inFrame;
	VanFrame m_frame;

	///@brief Destuffed bits seen since the first start of frame bit
	size_t m_bitCount;

	//Field being accumulated
	std::vector<bool> m_fieldBits;
	int64_t m_fieldStart;
	size_t m_fieldFirstBit;
	bool m_fieldRecovered;

	///@brief Recovered bits seen before the frame existed
	size_t m_sofRecovered;

	///@brief Bits covered by the checksum
	std::vector<bool> m_covered;

	///@brief The most recent 16 to 23 payload bits, which turn out to be the checksum at end of data
	std::deque<VanBit> m_held;

	///@brief Acknowledge field is done, remaining bits are end of frame
	bool m_ackDone;

	int64_t m_lastBitEnd;
	int64_t m_lastTimestamp;
};

#endif
