/*
 * Copyright (C) 2019 Ola Benderius
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

#ifndef LABJACK_U3_FAKE_TRANSPORT_HPP
#define LABJACK_U3_FAKE_TRANSPORT_HPP

#include <cmath>
#include <deque>
#include <memory>
#include <vector>

#include "gtest/gtest.h"

#include "u3-packet.hpp"
#include "u3-transport.hpp"

// Replays queued responses and records every request. Shared state lives
// outside the transport so a test can inspect it after handing the
// transport over to a U3.
struct FakeLink {
  FakeLink():
      written(),
      responses(),
      streamResponses(),
      readLengths(),
      forbidIo(false)
  {
  }

  std::vector<std::vector<uint8_t>> written;
  std::deque<std::vector<uint8_t>> responses;
  std::deque<std::vector<uint8_t>> streamResponses;
  std::vector<uint32_t> readLengths;
  bool forbidIo;
};

class FakeTransport : public u3::Transport {
 public:
  explicit FakeTransport(std::shared_ptr<FakeLink> a_link):
      m_link(a_link)
  {
  }

  void Write(std::vector<uint8_t> const &a_bytes) override
  {
    EXPECT_FALSE(m_link->forbidIo) << "Unexpected write: "
      << u3::ToHexString(a_bytes);
    m_link->written.push_back(a_bytes);
  }

  std::vector<uint8_t> Read(uint32_t a_length) override
  {
    EXPECT_FALSE(m_link->forbidIo) << "Unexpected read.";
    m_link->readLengths.push_back(a_length);
    if (m_link->responses.empty()) {
      return std::vector<uint8_t>();
    }
    std::vector<uint8_t> response = m_link->responses.front();
    m_link->responses.pop_front();
    return response;
  }

  std::vector<uint8_t> ReadStream(uint32_t) override
  {
    EXPECT_FALSE(m_link->forbidIo) << "Unexpected stream read.";
    if (m_link->streamResponses.empty()) {
      return std::vector<uint8_t>();
    }
    std::vector<uint8_t> response = m_link->streamResponses.front();
    m_link->streamResponses.pop_front();
    return response;
  }

 private:
  std::shared_ptr<FakeLink> m_link;
};

// Extended response of the given length with a valid header and checksums.
// Bytes from index 6 onwards are taken from the given body.
inline std::vector<uint8_t> MakeResponse(uint8_t a_command_number,
    uint32_t a_length, std::vector<uint8_t> const &a_body)
{
  std::vector<uint8_t> response(a_length, 0);
  response[1] = u3::kExtendedCommand;
  response[2] = (uint8_t) ((a_length - 6) / 2);
  response[3] = a_command_number;
  for (uint32_t i = 0; i < a_body.size() && 6 + i < a_length; i++) {
    response[6 + i] = a_body[i];
  }
  u3::SetChecksum(response);
  return response;
}

// Little endian 32.32 fixed point, as stored in calibration memory.
inline void AppendFixedPoint(std::vector<uint8_t> &a_bytes, double a_value)
{
  double const whole = std::floor(a_value);
  uint32_t const fraction = (uint32_t) ((a_value - whole) * 4294967296.0);
  uint32_t const wholeBits = (uint32_t) (int32_t) whole;
  for (uint32_t i = 0; i < 4; i++) {
    a_bytes.push_back((uint8_t) ((fraction >> (8 * i)) & 0xFF));
  }
  for (uint32_t i = 0; i < 4; i++) {
    a_bytes.push_back((uint8_t) ((wholeBits >> (8 * i)) & 0xFF));
  }
}

// ReadCal response carrying four calibration constants.
inline std::vector<uint8_t> CalibrationResponse(double a_first, double a_second,
    double a_third, double a_fourth)
{
  std::vector<uint8_t> body{0, 0};
  AppendFixedPoint(body, a_first);
  AppendFixedPoint(body, a_second);
  AppendFixedPoint(body, a_third);
  AppendFixedPoint(body, a_fourth);
  return MakeResponse(0x2D, 40, body);
}

#endif
