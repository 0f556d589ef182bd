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

#include "u3.hpp"
#include "u3-packet.hpp"

namespace u3 {

namespace {

// Odd byte counts are sent with a zero pad byte, the count field keeps the
// real length.
bool PadToEven(std::vector<uint8_t> *a_bytes)
{
  if (a_bytes->size() % 2 != 0) {
    a_bytes->push_back(0);
    return true;
  }
  return false;
}

}

// Requires hardware version 1.21 or later.
std::vector<uint8_t> U3::Spi(SpiRequest const &a_request)
{
  uint8_t mode;
  switch (a_request.spiMode) {
    case 'A':
      mode = 0;
      break;
    case 'B':
      mode = 1;
      break;
    case 'C':
      mode = 2;
      break;
    case 'D':
      mode = 3;
      break;
    default:
      throw InvalidParameter(std::string("Unknown SPI mode '")
          + a_request.spiMode + "', should be one of A, B, C or D.");
  }

  uint32_t const numBytes = a_request.bytes.size();
  std::vector<uint8_t> bytes = a_request.bytes;
  bool const padded = PadToEven(&bytes);
  uint32_t const numSentBytes = bytes.size();

  std::vector<uint8_t> payload(8, 0);
  if (a_request.autoCs) {
    payload[0] |= 1 << 7;
  }
  if (a_request.disableDirConfig) {
    payload[0] |= 1 << 6;
  }
  payload[0] |= mode & 3;
  payload[1] = a_request.spiClockFactor;
  payload[3] = a_request.csPinNum;
  payload[4] = a_request.clkPinNum;
  payload[5] = a_request.misoPinNum;
  payload[6] = a_request.mosiPinNum;
  payload[7] = (uint8_t) numBytes;
  payload.insert(payload.end(), bytes.begin(), bytes.end());

  uint32_t const responseLength = 8 + numSentBytes;
  std::vector<uint8_t> result = WriteRead(BuildExtendedCommand(0x3A, payload),
      responseLength, ExpectedExtendedHeader(0x3A, responseLength));

  std::vector<uint8_t> received(result.begin() + 8, result.end());
  if (padded && !received.empty()) {
    received.pop_back();
  }
  return received;
}

AsynchConfigResult U3::AsynchConfig(AsynchConfigRequest const &a_request)
{
  if (a_request.desiredBaud == 0) {
    throw InvalidParameter("Desired baud rate must be positive.");
  }

  std::vector<uint8_t> payload(4, 0);
  if (a_request.update) {
    payload[1] |= 1 << 7;
  }
  if (a_request.uartEnable) {
    payload[1] |= 1 << 6;
  }

  if (a_request.olderHardware) {
    if (!a_request.timerClockFrequency.isSet) {
      throw InvalidParameter("Hardware 1.21 needs the timer clock frequency "
          "to compute the baud factor.");
    }
    int64_t const baudFactor = 256
      - (int64_t) (a_request.timerClockFrequency.value
          / a_request.desiredBaud);
    if (baudFactor < 0 || baudFactor > 255) {
      throw InvalidParameter("Baud rate " + std::to_string(
            a_request.desiredBaud) + " can not be reached with the current "
          "timer clock.");
    }
    payload[3] = (uint8_t) baudFactor;
  } else {
    int64_t const baudFactor = 65536
      - (int64_t) (48000000 / (2 * (uint64_t) a_request.desiredBaud));
    if (baudFactor < 0 || baudFactor > 65535) {
      throw InvalidParameter("Baud rate " + std::to_string(
            a_request.desiredBaud) + " is out of range.");
    }
    payload[2] = (uint8_t) (baudFactor & 0xFF);
    payload[3] = (uint8_t) (baudFactor >> 8);
  }

  if (a_request.configurePins) {
    ConfigIoRequest io;
    io.enableUart = true;
    ConfigIo(io);
  }

  std::vector<uint8_t> result = WriteRead(BuildExtendedCommand(0x14, payload),
      10, ExpectedExtendedHeader(0x14, 10));

  AsynchConfigResult config;
  config.update = (result[7] >> 7) & 1;
  config.uartEnable = (result[7] >> 6) & 1;
  if (a_request.olderHardware) {
    config.baudFactor = result[9];
  } else {
    config.baudFactor = ToUint16(result.data() + 8);
  }
  return config;
}

AsynchTxResult U3::AsynchTx(std::vector<uint8_t> const &a_bytes)
{
  std::vector<uint8_t> bytes = a_bytes;
  PadToEven(&bytes);

  std::vector<uint8_t> payload(2, 0);
  payload[1] = (uint8_t) a_bytes.size();
  payload.insert(payload.end(), bytes.begin(), bytes.end());

  std::vector<uint8_t> result = WriteRead(BuildExtendedCommand(0x15, payload),
      10, ExpectedExtendedHeader(0x15, 10));

  AsynchTxResult tx;
  tx.numAsynchBytesSent = result[7];
  tx.numAsynchBytesInRxBuffer = result[8];
  return tx;
}

AsynchRxResult U3::AsynchRx(bool a_flush)
{
  std::vector<uint8_t> payload(2, 0);
  payload[1] = a_flush ? 1 : 0;

  std::vector<uint8_t> result = WriteRead(BuildExtendedCommand(0x16, payload),
      40, ExpectedExtendedHeader(0x16, 40));

  AsynchRxResult rx;
  rx.numAsynchBytesInRxBuffer = result[7];
  rx.asynchBytes.assign(result.begin() + 8, result.end());
  return rx;
}

// Requires hardware version 1.21 or later.
I2cResult U3::I2c(I2cRequest const &a_request)
{
  std::vector<uint8_t> bytes = a_request.bytes;
  PadToEven(&bytes);

  std::vector<uint8_t> payload(8, 0);
  if (a_request.resetAtStart) {
    payload[0] |= 1 << 1;
  }
  if (a_request.noStopWhenRestarting) {
    payload[0] |= 1 << 2;
  }
  if (a_request.enableClockStretching) {
    payload[0] |= 1 << 3;
  }
  payload[1] = a_request.speedAdjust;
  payload[2] = a_request.sdaPinNum;
  payload[3] = a_request.sclPinNum;
  payload[4] = a_request.addressByte.isSet ? a_request.addressByte.value
    : (uint8_t) (a_request.address << 1);
  payload[6] = (uint8_t) a_request.bytes.size();
  payload[7] = a_request.numI2cBytesToReceive;
  payload.insert(payload.end(), bytes.begin(), bytes.end());

  uint32_t numReceive = a_request.numI2cBytesToReceive;
  bool const oddResponse = (numReceive % 2 != 0);
  if (oddResponse) {
    numReceive++;
  }

  uint32_t const responseLength = 12 + numReceive;
  std::vector<uint8_t> result = WriteRead(BuildExtendedCommand(0x3B, payload),
      responseLength, ExpectedExtendedHeader(0x3B, responseLength));

  I2cResult i2c;
  i2c.ackArray.assign(result.begin() + 8, result.begin() + 12);
  i2c.bytes.assign(result.begin() + 12, result.end());
  if (oddResponse && !i2c.bytes.empty()) {
    i2c.bytes.pop_back();
  }
  return i2c;
}

// Reads a Sensirion SHT1X, as used by the EI-1050. Options bit 7
// reads temperature, bit 6 humidity, bit 2 turns on the heater.
Sht1xResult U3::Sht1x(uint8_t a_data_pin, uint8_t a_clock_pin,
    uint8_t a_options)
{
  std::vector<uint8_t> payload(4, 0);
  payload[0] = a_data_pin;
  payload[1] = a_clock_pin;
  payload[3] = a_options;

  std::vector<uint8_t> result = WriteRead(BuildExtendedCommand(0x39, payload),
      16, ExpectedExtendedHeader(0x39, 16));

  Sht1xResult sht;
  sht.statusReg = result[8];
  sht.statusRegCrc = result[9];

  double val = (double) ToUint16(result.data() + 10);
  sht.temperature = -39.60 + 0.01 * val;
  sht.temperatureCrc = result[12];

  val = (double) ToUint16(result.data() + 13);
  double humidity = -4.0 + 0.0405 * val - 0.0000028 * (val * val);
  sht.humidity = (sht.temperature - 25.0) * (0.01 + 0.00008 * val)
    + humidity;
  sht.humidityCrc = result[15];
  return sht;
}

}
