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

#include <iomanip>
#include <map>
#include <sstream>

#include "u3-errors.hpp"
#include "u3-packet.hpp"

namespace u3 {

namespace {

struct LowlevelErrorInfo {
  char const *name;
  char const *advice;
};

std::map<uint8_t, LowlevelErrorInfo> const &LowlevelErrors()
{
  static std::map<uint8_t, LowlevelErrorInfo> const errors = {
    {1, {"SCRATCH_WRT_FAIL", ""}},
    {2, {"SCRATCH_ERASE_FAIL", ""}},
    {3, {"DATA_BUFFER_OVERFLOW", ""}},
    {4, {"ADC0_BUFFER_OVERFLOW", ""}},
    {5, {"FUNCTION_INVALID", ""}},
    {6, {"SWDT_TIME_INVALID", "This error is caused when an invalid time "
        "was passed to the watchdog."}},
    {7, {"XBR_CONFIG_ERROR", ""}},
    {16, {"FLASH_WRITE_FAIL", "For some reason, the LabJack was unable to "
        "write the specified page of its internal flash."}},
    {17, {"FLASH_ERASE_FAIL", "For some reason, the LabJack was unable to "
        "erase the specified page of its internal flash."}},
    {18, {"FLASH_JMP_FAIL", "For some reason, the LabJack was unable to "
        "jump to a different section of flash. This may be an indication the "
        "flash is corrupted."}},
    {19, {"FLASH_PSP_TIMEOUT", ""}},
    {20, {"FLASH_ABORT_RECEIVED", ""}},
    {21, {"FLASH_PAGE_MISMATCH", ""}},
    {22, {"FLASH_BLOCK_MISMATCH", ""}},
    {23, {"FLASH_PAGE_NOT_IN_CODE_AREA", "Usually, this error is raised "
        "when you try to write new firmware before upgrading the "
        "bootloader."}},
    {24, {"MEM_ILLEGAL_ADDRESS", ""}},
    {25, {"FLASH_LOCKED", "Tried to write to flash before unlocking it."}},
    {26, {"INVALID_BLOCK", ""}},
    {27, {"FLASH_ILLEGAL_PAGE", ""}},
    {28, {"FLASH_TOO_MANY_BYTES", ""}},
    {29, {"FLASH_INVALID_STRING_NUM", ""}},
    {40, {"SHT1x_COMM_TIME_OUT", "LabJack never received the ACK it was "
        "expecting from the SHT. This is usually due to incorrect wiring. "
        "Double check that all wires are securely connected to the correct "
        "pins."}},
    {41, {"SHT1x_NO_ACK", ""}},
    {42, {"SHT1x_CRC_FAILED", ""}},
    {43, {"SHT1x_TOO_MANY_W_BYTES", ""}},
    {44, {"SHT1x_TOO_MANY_R_BYTES", ""}},
    {45, {"SHT1x_INVALID_MODE", ""}},
    {46, {"SHT1x_INVALID_LINE", ""}},
    {48, {"STREAM_IS_ACTIVE", "This error is raised when you call "
        "StreamStart after the stream has already been started."}},
    {49, {"STREAM_TABLE_INVALID", ""}},
    {50, {"STREAM_CONFIG_INVALID", ""}},
    {52, {"STREAM_NOT_RUNNING", "This error is raised when you call "
        "StopStream after the stream has already been stopped."}},
    {53, {"STREAM_INVALID_TRIGGER", ""}},
    {54, {"STREAM_ADC0_BUFFER_OVERFLOW", ""}},
    {55, {"STREAM_SCAN_OVERLAP", "This error is raised when a scan "
        "interrupt is fired before the LabJack has completed the previous "
        "scan. The most common cause of this error is a configuration with "
        "a high sampling rate and a large number of channels."}},
    {56, {"STREAM_SAMPLE_NUM_INVALID", ""}},
    {57, {"STREAM_BIPOLAR_GAIN_INVALID", ""}},
    {58, {"STREAM_SCAN_RATE_INVALID", ""}},
    {59, {"STREAM_AUTORECOVER_ACTIVE", "This error is to inform you that "
        "the autorecover feature has been activated. Autorecovery is usually "
        "triggered by not reading data fast enough from the LabJack."}},
    {60, {"STREAM_AUTORECOVER_REPORT", "This error marks the packet as an "
        "autorecovery report packet which contains how many packets were "
        "lost."}},
    {63, {"STREAM_AUTORECOVER_OVERFLOW", ""}},
    {64, {"TIMER_INVALID_MODE", ""}},
    {65, {"TIMER_QUADRATURE_AB_ERROR", ""}},
    {66, {"TIMER_QUAD_PULSE_SEQUENCE", ""}},
    {67, {"TIMER_BAD_CLOCK_SOURCE", ""}},
    {68, {"TIMER_STREAM_ACTIVE", ""}},
    {69, {"TIMER_PWMSTOP_MODULE_ERROR", ""}},
    {70, {"TIMER_SEQUENCE_ERROR", ""}},
    {71, {"TIMER_LINE_SEQUENCE_ERROR", ""}},
    {72, {"TIMER_SHARING_ERROR", ""}},
    {80, {"EXT_OSC_NOT_STABLE", ""}},
    {81, {"INVALID_POWER_SETTING", ""}},
    {82, {"PLL_NOT_LOCKED", ""}},
    {96, {"INVALID_PIN", ""}},
    {97, {"PIN_CONFIGURED_FOR_ANALOG", "This error is raised when you try "
        "to do a digital operation on a pin that's configured for analog. "
        "Use a command like ConfigIO to set the pin to digital."}},
    {98, {"PIN_CONFIGURED_FOR_DIGITAL", "This error is raised when you try "
        "to do an analog operation on a pin which is configured for digital. "
        "Use a command like ConfigIO to set the pin to analog."}},
    {99, {"IOTYPE_SYNCH_ERROR", ""}},
    {100, {"INVALID_OFFSET", ""}},
    {101, {"IOTYPE_NOT_VALID", ""}},
    {102, {"TC_PIN_OFFSET_MUST_BE_4-8", "This error is raised when you try "
        "to configure the Timer/Counter pin offset to be 0-3."}}
  };
  return errors;
}

}

uint8_t GetChecksum8(std::vector<uint8_t> const &a_b, uint32_t a_n)
{
  // Sums bytes 1 to n-1. Sums quotient and remainder of 256 division. Again,
  // sums quotient and remainder of 256 division.
  uint32_t val1 = 0;
  for (uint32_t i = 1; i < a_n && i < a_b.size(); i++) {
    val1 += (uint32_t) a_b[i];
  }

  uint32_t val2 = val1 / 256;
  val1 = (val1 - 256 * val2) + val2;
  val2 = val1 / 256;

  return (uint8_t) ((val1 - 256 * val2) + val2);
}

uint16_t GetExtendedChecksum16(std::vector<uint8_t> const &a_b)
{
  // Sums bytes 6 to n-1 to a unsigned 2 byte value
  uint32_t val = 0;
  for (uint32_t i = 6; i < a_b.size(); i++) {
    val += (uint32_t) a_b[i];
  }
  return (uint16_t) (val & 0xFFFF);
}

void SetChecksum(std::vector<uint8_t> &a_b)
{
  if (a_b.size() < 2) {
    throw InvalidParameter("Command does not contain enough bytes.");
  }

  bool const extended = (((a_b[1] & 0x78) >> 3) == 15);
  if (extended) {
    if (a_b.size() < 6) {
      throw InvalidParameter("Extended command does not contain enough "
          "bytes.");
    }
    uint16_t val = GetExtendedChecksum16(a_b);
    a_b[4] = (uint8_t) (val & 0xff);
    a_b[5] = (uint8_t) ((val / 256) & 0xff);
    a_b[0] = GetChecksum8(a_b, 6);
  } else {
    a_b[0] = GetChecksum8(a_b, static_cast<uint32_t>(a_b.size()));
  }
}

bool VerifyChecksum(std::vector<uint8_t> const &a_b)
{
  std::vector<uint8_t> copy(a_b);
  SetChecksum(copy);
  return copy[0] == a_b[0] && (copy.size() < 6
      || (copy[4] == a_b[4] && copy[5] == a_b[5]));
}

std::vector<uint8_t> BuildExtendedCommand(uint8_t a_command_number,
    std::vector<uint8_t> const &a_payload)
{
  std::vector<uint8_t> command(6, 0);
  command[1] = kExtendedCommand;
  command[3] = a_command_number;
  command.insert(command.end(), a_payload.begin(), a_payload.end());
  if (command.size() % 2 != 0) {
    command.push_back(0);
  }
  command[2] = (uint8_t) ((command.size() - 6) / 2); // Number of data words
  SetChecksum(command);
  return command;
}

std::vector<uint8_t> ExpectedExtendedHeader(uint8_t a_command_number,
    uint32_t a_response_length)
{
  std::vector<uint8_t> header = {kExtendedCommand,
    (uint8_t) ((a_response_length - 6) / 2), a_command_number};
  return header;
}

void ValidateLength(std::vector<uint8_t> const &a_buffer,
    uint32_t a_expected_length)
{
  uint32_t const actual = static_cast<uint32_t>(a_buffer.size());
  if (actual != a_expected_length) {
    std::stringstream ss;
    ss << "Read buffer, expected " << a_expected_length << " bytes but got "
      << actual << ": " << ToHexString(a_buffer);
    throw FramingError(ss.str(), a_expected_length, actual);
  }
}

void CheckCommandBytes(std::vector<uint8_t> const &a_results,
    std::vector<uint8_t> const &a_command_bytes)
{
  if (a_results.empty()) {
    throw FramingError("Got a zero length packet.", 0, 0);
  }
  if (a_results.size() >= 2 && a_results[0] == 0xB8 && a_results[1] == 0xB8) {
    throw ChecksumError("Device detected a bad checksum.");
  }

  std::vector<uint8_t> actual;
  for (uint32_t i = 0; i < a_command_bytes.size(); i++) {
    if (i + 1 < a_results.size()) {
      actual.push_back(a_results[i + 1]);
    }
  }
  if (actual != a_command_bytes) {
    std::stringstream ss;
    ss << "Got incorrect command bytes." << std::endl
      << "Expected: " << ToHexString(a_command_bytes) << std::endl
      << "Got: " << ToHexString(actual) << std::endl
      << "Full packet: " << ToHexString(a_results);
    throw ProtocolMismatch(ss.str(), a_command_bytes, actual);
  }

  if (a_results.size() <= kStatusByte) {
    throw FramingError("Read buffer, too short for an extended response.",
        kStatusByte + 1, static_cast<uint32_t>(a_results.size()));
  }

  if (!VerifyChecksum(a_results)) {
    throw ChecksumError("Checksum was incorrect: " + ToHexString(a_results));
  }

  uint8_t const error_code = a_results[kStatusByte];
  if (error_code != 0) {
    throw LowlevelError("The U3 returned an error:\n    "
        + LowlevelErrorToString(error_code), error_code);
  }
}

uint16_t ToUint16(uint8_t const *a_b)
{
  return (uint16_t) (a_b[0] + a_b[1] * 256);
}

uint32_t ToUint32(uint8_t const *a_b)
{
  return (uint32_t) a_b[0] | ((uint32_t) a_b[1] << 8)
    | ((uint32_t) a_b[2] << 16) | ((uint32_t) a_b[3] << 24);
}

int32_t ToInt32(uint8_t const *a_b)
{
  return static_cast<int32_t>(ToUint32(a_b));
}

double ToDouble(uint8_t const *a_buffer)
{
  // Little endian 32.32 fixed point, signed whole part.
  uint32_t result_dec = ToUint32(a_buffer);
  int32_t result_wh = ToInt32(a_buffer + 4);
  return (double) result_wh + ((double) result_dec) / 4294967296.0;
}

std::string LowlevelErrorToString(uint8_t a_error_code)
{
  std::string name = "UNKNOWN_ERROR";
  std::string advice;
  auto const &errors = LowlevelErrors();
  auto it = errors.find(a_error_code);
  if (it != errors.end()) {
    name = it->second.name;
    advice = it->second.advice;
  } else {
    std::stringstream ss;
    ss << "Unrecognized error code (" << (int32_t) a_error_code << ")";
    advice = ss.str();
  }

  std::stringstream ss;
  ss << name << " (" << (int32_t) a_error_code << ")";
  if (!advice.empty()) {
    ss << std::endl << advice;
  }
  return ss.str();
}

std::string ToHexString(std::vector<uint8_t> const &a_bytes)
{
  std::stringstream ss;
  ss << "[";
  for (uint32_t i = 0; i < a_bytes.size(); i++) {
    if (i > 0) {
      ss << ", ";
    }
    ss << "0x" << std::hex << (int32_t) a_bytes[i] << std::dec;
  }
  ss << "]";
  return ss.str();
}

}
