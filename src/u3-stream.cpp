/*
 * Copyright (C) 2019 Ola Benderius
 * Based on example code from LabJack.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#include <algorithm>
#include <cmath>
#include <iostream>

#include "u3.hpp"
#include "u3-packet.hpp"

namespace u3 {

namespace {

/*
 * Stream data packet layout:
 *   [0..5]       extended header, command byte 0xF9, extended number 0xC0
 *   [6..9]       time stamp, or missed sample count in autorecover reports
 *   [10]         packet counter
 *   [11]         error code
 *   [12..n-3]    two byte samples
 *   [n-2..n-1]   backlog and reserved
 */
uint32_t const kStreamHeaderSize = 12;
uint32_t const kStreamFooterSize = 2;
uint32_t const kBytesPerSample = 2;

uint32_t const kMaxPacketsPerRequest = 48;

void CheckStreamResponse(std::vector<uint8_t> const &a_result,
    uint8_t a_command, std::string const &a_name)
{
  if (a_result[1] != (uint8_t) (a_command + 1) || a_result[3] != 0x00) {
    throw ProtocolMismatch(a_name + " got incorrect command bytes: "
        + ToHexString(a_result),
        std::vector<uint8_t>{(uint8_t) (a_command + 1)},
        std::vector<uint8_t>{a_result[1]});
  }
  if (a_result[2] != 0) {
    throw LowlevelError(a_name + " returned an error:\n    "
        + LowlevelErrorToString(a_result[2]), a_result[2]);
  }
}

}

void U3::StreamConfig(StreamConfigRequest const &a_request)
{
  uint32_t const numChannels = a_request.pChannels.size();
  if (numChannels != a_request.nChannels.size()) {
    throw InvalidParameter(
        "Length of PChannels didn't match the length of NChannels.");
  }
  if (numChannels == 0) {
    throw InvalidParameter("At least one stream channel is needed.");
  }

  double samplesPerPacket = a_request.samplesPerPacket;
  double scanInterval = a_request.scanInterval;
  bool divideClockBy256 = a_request.divideClockBy256;
  if (a_request.scanFrequency.isSet) {
    double const scanFrequency = a_request.scanFrequency.value;
    if (!std::isfinite(scanFrequency) || scanFrequency <= 0.0) {
      throw InvalidParameter("Scan frequency must be positive.");
    }
    if (scanFrequency < 1000.0) {
      if (scanFrequency < 25.0) {
        samplesPerPacket = scanFrequency;
      }
      divideClockBy256 = true;
      scanInterval = 15625.0 / scanFrequency;
    } else {
      divideClockBy256 = false;
      scanInterval = 4000000.0 / scanFrequency;
    }
  }

  // Out of range values are clamped, not rejected.
  scanInterval = std::min(scanInterval, 65535.0);
  uint32_t const scanIntervalBits = std::max((uint32_t) scanInterval,
      (uint32_t) 1);
  samplesPerPacket = std::max(samplesPerPacket, 1.0);
  uint32_t const samplesPerPacketBits = std::min((uint32_t) samplesPerPacket,
      (uint32_t) 25);

  std::vector<uint8_t> payload(6 + 2 * numChannels, 0);
  payload[0] = (uint8_t) numChannels;
  payload[1] = (uint8_t) samplesPerPacketBits;
  payload[3] |= (a_request.internalStreamClockFrequency & 0x01) << 3;
  if (divideClockBy256) {
    payload[3] |= 1 << 2;
  }
  payload[3] |= a_request.resolution & 3;
  payload[4] = (uint8_t) (scanIntervalBits & 0xFF);
  payload[5] = (uint8_t) (scanIntervalBits >> 8);
  for (uint32_t i = 0; i < numChannels; i++) {
    payload[6 + i * 2] = a_request.pChannels[i];
    payload[7 + i * 2] = (a_request.nChannels[i] == 32) ? 30
      : a_request.nChannels[i];
  }

  WriteRead(BuildExtendedCommand(0x11, payload), 8,
      ExpectedExtendedHeader(0x11, 8));

  m_stream_samples_per_packet = samplesPerPacketBits;
  m_stream_channel_numbers = a_request.pChannels;
  m_stream_neg_channels = a_request.nChannels;
  m_stream_configured = true;
  m_stream_packet_offset = 0;

  double freq = (a_request.internalStreamClockFrequency == 1) ? 48000000.0
    : 4000000.0;
  if (divideClockBy256) {
    freq /= 256.0;
  }
  freq /= scanIntervalBits;

  if (samplesPerPacketBits < 25) {
    m_packets_per_request = 1;
  } else {
    uint32_t packets = (uint32_t) (freq / samplesPerPacketBits);
    m_packets_per_request = std::min(std::max(packets, (uint32_t) 1),
        kMaxPacketsPerRequest);
  }
}

void U3::StreamStart()
{
  if (!m_stream_configured) {
    throw U3Error("Stream must be configured before it can be started.");
  }
  if (m_stream_started) {
    throw U3Error("Stream already started.");
  }

  std::vector<uint8_t> result = WriteReadSimple(
      std::vector<uint8_t>{0xA8, 0xA8}, 4);
  CheckStreamResponse(result, 0xA8, "StreamStart");

  m_stream_started = true;
}

void U3::StreamStop()
{
  std::vector<uint8_t> result = WriteReadSimple(
      std::vector<uint8_t>{0xB0, 0xB0}, 4);
  CheckStreamResponse(result, 0xB0, "StreamStop");

  m_stream_started = false;
}

StreamDataResult U3::StreamData(bool a_convert)
{
  if (!m_stream_started) {
    throw U3Error("Please start streaming before reading.");
  }

  uint32_t const numBytes = kStreamHeaderSize + kStreamFooterSize
    + m_stream_samples_per_packet * kBytesPerSample;

  StreamDataResult data;
  data.numPackets = 0;
  data.errors = 0;
  data.missed = 0;
  data.firstPacket = 0;
  data.result = m_transport->ReadStream(numBytes * m_packets_per_request);
  if (data.result.size() < numBytes) {
    return data;
  }

  data.numPackets = data.result.size() / numBytes;
  data.firstPacket = data.result[10];
  for (uint32_t i = 0; i < data.numPackets; i++) {
    uint8_t const *packet = data.result.data() + i * numBytes;
    if (packet[1] != 0xF9 || packet[3] != 0xC0) {
      throw ProtocolMismatch("Read buffer, invalid stream packet: "
          + ToHexString(std::vector<uint8_t>(packet, packet + numBytes)),
          std::vector<uint8_t>{0xF9, 0xC0},
          std::vector<uint8_t>{packet[1], packet[3]});
    }

    uint8_t const e = packet[11];
    if (e != 0) {
      data.errors++;
      if (m_debug && e != kErrorStreamAutorecoverReport && e != 59) {
        std::cout << "Stream packet error: " << LowlevelErrorToString(e)
          << std::endl;
      }
      if (e == kErrorStreamAutorecoverReport) {
        data.missed += ToUint32(packet + 6);
      }
    }
  }

  if (a_convert) {
    data.samples = ProcessStreamData(data.result, numBytes);
  }
  return data;
}

StreamSamples U3::ProcessStreamData(std::vector<uint8_t> const &a_result,
    uint32_t a_num_bytes)
{
  if (m_stream_channel_numbers.empty()) {
    throw U3Error("Stream must be configured before its data can be "
        "processed.");
  }

  uint32_t numBytes = a_num_bytes;
  if (numBytes == 0) {
    numBytes = kStreamHeaderSize + kStreamFooterSize
      + m_stream_samples_per_packet * kBytesPerSample;
  }
  if (numBytes <= kStreamHeaderSize + kStreamFooterSize) {
    throw InvalidParameter("Stream packets must hold at least one sample.");
  }

  StreamSamples samples;
  uint32_t const channelCount = m_stream_channel_numbers.size();
  for (uint32_t start = 0; start + numBytes <= a_result.size();
      start += numBytes) {
    uint32_t const end = start + numBytes - kStreamFooterSize;
    for (uint32_t i = start + kStreamHeaderSize; i + kBytesPerSample <= end;
        i += kBytesPerSample) {
      if (m_stream_packet_offset >= channelCount) {
        m_stream_packet_offset = 0;
      }

      uint8_t const *sample = a_result.data() + i;
      uint8_t const channel = m_stream_channel_numbers[m_stream_packet_offset];
      uint8_t const negChannel = m_stream_neg_channels[m_stream_packet_offset];
      std::string const label = "AIN" + std::to_string(channel);

      // Channels 193, 194 and 200 and above are digital and timer/counter
      // readbacks, passed on undecoded.
      if (channel == 193 || channel == 194) {
        samples.bytePairs[label].push_back(
            std::array<uint8_t, 2>{{sample[0], sample[1]}});
      } else if (channel >= 200) {
        samples.values[label].push_back(ToUint16(sample));
      } else {
        bool const singleEnded = (negChannel == 31);
        bool const isSpecial = (negChannel == 32);
        bool const lvChannel = !IsHighVoltageChannel(channel);
        samples.values[label].push_back(BinaryToCalibratedAnalogVoltage(
              ToUint16(sample), lvChannel, singleEnded, isSpecial, channel));
      }

      m_stream_packet_offset++;
    }
  }
  return samples;
}

uint32_t U3::PacketsPerRequest() const
{
  return m_packets_per_request;
}

}
