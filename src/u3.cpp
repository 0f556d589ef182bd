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

#include <iostream>
#include <sstream>

#include "u3.hpp"
#include "u3-packet.hpp"

namespace u3 {

U3::U3(std::unique_ptr<Transport> a_transport, bool a_debug):
    m_transport(std::move(a_transport)),
    m_calibration_info(),
    m_state(),
    m_debug(a_debug),
    m_stream_configured(false),
    m_stream_started(false),
    m_stream_samples_per_packet(25),
    m_stream_channel_numbers(),
    m_stream_neg_channels(),
    m_packets_per_request(1),
    m_stream_packet_offset(0)
{
  if (m_transport == nullptr) {
    throw InvalidParameter("A U3 needs a transport.");
  }
}

U3::~U3()
{
}

std::vector<uint8_t> U3::WriteRead(std::vector<uint8_t> a_command,
    uint32_t a_read_length, std::vector<uint8_t> const &a_command_bytes,
    bool a_check_bytes, bool a_checksum)
{
  if (a_command.size() > kMaxUsbPacketLength) {
    throw PacketTooLarge("The command is " + std::to_string(a_command.size())
        + " bytes, more than the 64 bytes of one USB packet.");
  }
  if (a_read_length > kMaxUsbPacketLength) {
    throw PacketTooLarge("The response would be "
        + std::to_string(a_read_length)
        + " bytes, more than the 64 bytes of one USB packet.");
  }

  if (a_checksum) {
    SetChecksum(a_command);
  }

  m_transport->Write(a_command);
  if (m_debug) {
    std::cout << "Sent: " << ToHexString(a_command) << std::endl;
  }

  std::vector<uint8_t> result = m_transport->Read(a_read_length);
  if (m_debug) {
    std::cout << "Response: " << ToHexString(result) << std::endl;
  }

  if (a_check_bytes) {
    try {
      CheckCommandBytes(result, a_command_bytes);
    } catch (LowlevelError const &e) {
      throw LowlevelError("The " + m_state.deviceName
          + " returned an error:\n    "
          + LowlevelErrorToString(e.ErrorCode()), e.ErrorCode());
    }
    ValidateLength(result, a_read_length);
  }

  return result;
}

// For the short non-extended commands: reset, stream start and stop.
std::vector<uint8_t> U3::WriteReadSimple(std::vector<uint8_t> const &a_command,
    uint32_t a_read_length)
{
  std::vector<uint8_t> result = WriteRead(a_command, a_read_length,
      std::vector<uint8_t>(), false, false);
  ValidateLength(result, a_read_length);
  return result;
}

std::vector<FeedbackResult> U3::GetFeedback(FeedbackList const &a_commands)
{
  std::vector<FeedbackCommand const *> flattened;
  for (auto const &command : a_commands) {
    if (command == nullptr) {
      throw InvalidParameter("Feedback list contains an empty command.");
    }
    command->Flatten(flattened);
  }

  // Byte 6 is the echo byte, the commands follow.
  std::vector<uint8_t> payload(1, 0);
  uint32_t read_length = 9;
  for (auto command : flattened) {
    std::vector<uint8_t> const &bytes = command->CmdBytes();
    payload.insert(payload.end(), bytes.begin(), bytes.end());
    read_length += command->ReadLength();
  }
  if (read_length % 2 != 0) {
    read_length++;
  }

  uint32_t send_length = 6 + payload.size();
  if (send_length % 2 != 0) {
    send_length++;
  }
  if (send_length > kMaxUsbPacketLength) {
    throw PacketTooLarge("The feedback command you are attempting to send is "
        "bigger than 64 bytes (" + std::to_string(send_length) + " bytes). "
        "Break your commands up into separate calls to GetFeedback.");
  }
  if (read_length > kMaxUsbPacketLength) {
    throw PacketTooLarge("The feedback command you are attempting to send "
        "would yield a response that is greater than 64 bytes ("
        + std::to_string(read_length) + " bytes). Break your commands up "
        "into separate calls to GetFeedback.");
  }

  std::vector<uint8_t> command = BuildExtendedCommand(0x00, payload);
  std::vector<uint8_t> rcv = WriteRead(command, read_length,
      std::vector<uint8_t>(), false, false);

  try {
    CheckCommandBytes(rcv, std::vector<uint8_t>{kExtendedCommand});
    if (rcv[3] != 0x00) {
      throw ProtocolMismatch("Got incorrect command bytes: "
          + ToHexString(rcv), std::vector<uint8_t>{0x00},
          std::vector<uint8_t>{rcv[3]});
    }
  } catch (LowlevelError const &e) {
    std::string culprit;
    if (rcv.size() > 7 && rcv[7] >= 1 && rcv[7] <= flattened.size()) {
      culprit = flattened[rcv[7] - 1]->ToString();
    } else {
      std::stringstream ss;
      ss << "<command index " << (rcv.size() > 7 ? (int32_t) rcv[7] : -1)
        << " outside the sent batch of " << flattened.size() << ">";
      culprit = ss.str();
    }
    throw LowlevelError("\nThis Command\n    " + culprit
        + "\nreturned an error:\n    " + LowlevelErrorToString(e.ErrorCode()),
        e.ErrorCode(), culprit);
  }
  ValidateLength(rcv, read_length);

  std::vector<FeedbackResult> results;
  uint32_t offset = 9;
  for (auto command : flattened) {
    results.push_back(command->Handle(rcv.data() + offset));
    offset += command->ReadLength();
  }
  return results;
}

void U3::ToggleLed()
{
  GetFeedback({std::make_shared<Led>(!m_state.ledState)});
  m_state.ledState = !m_state.ledState;
}

void U3::SetFioState(uint8_t a_fio_num, bool a_state)
{
  SetDoState(a_fio_num, a_state);
}

bool U3::GetFioState(uint8_t a_fio_num)
{
  return GetDioState(a_fio_num);
}

void U3::SetDoState(uint8_t a_io_num, bool a_state)
{
  GetFeedback({std::make_shared<BitDirWrite>(a_io_num, true),
      std::make_shared<BitStateWrite>(a_io_num, a_state)});
}

bool U3::GetDiState(uint8_t a_io_num)
{
  std::vector<FeedbackResult> results = GetFeedback({
      std::make_shared<BitDirWrite>(a_io_num, false),
      std::make_shared<BitStateRead>(a_io_num)});
  return results[1].value != 0;
}

bool U3::GetDioState(uint8_t a_io_num)
{
  std::vector<FeedbackResult> results = GetFeedback({
      std::make_shared<BitStateRead>(a_io_num)});
  return results[0].value != 0;
}

double U3::GetTemperature()
{
  // Uncalibrated readings are off by several degrees.
  if (m_calibration_info == nullptr) {
    GetCalibrationData();
  }
  std::vector<FeedbackResult> results = GetFeedback({
      std::make_shared<Ain>(30, 31)});
  return BinaryToCalibratedAnalogTemperature(results[0].value);
}

double U3::GetAin(uint8_t a_pos_channel, uint8_t a_neg_channel,
    bool a_long_settle, bool a_quick_sample)
{
  // Negative channel 32 selects the special 0-3.6 V range, sent as 30.
  bool const isSpecial = (a_neg_channel == 32);
  uint8_t const negChannel = isSpecial ? 30 : a_neg_channel;

  std::vector<FeedbackResult> results = GetFeedback({
      std::make_shared<Ain>(a_pos_channel, negChannel, a_long_settle,
          a_quick_sample)});

  bool const singleEnded = (negChannel == 31);
  bool const lvChannel = !IsHighVoltageChannel(a_pos_channel);
  return BinaryToCalibratedAnalogVoltage(results[0].value, lvChannel,
      singleEnded, isSpecial, a_pos_channel);
}

std::vector<uint8_t> U3::ReadMem(uint8_t a_block_num, bool a_read_cal)
{
  uint8_t const type = a_read_cal ? 0x2D : 0x2A;
  std::vector<uint8_t> command = BuildExtendedCommand(type,
      std::vector<uint8_t>{0x00, a_block_num});
  std::vector<uint8_t> result = WriteRead(command, 40,
      ExpectedExtendedHeader(type, 40));
  return std::vector<uint8_t>(result.begin() + 8, result.end());
}

std::vector<uint8_t> U3::ReadCal(uint8_t a_block_num)
{
  return ReadMem(a_block_num, true);
}

void U3::WriteMem(uint8_t a_block_num, std::vector<uint8_t> const &a_data,
    bool a_write_cal)
{
  if (a_data.size() != 32) {
    throw InvalidParameter("Memory blocks are 32 bytes, got "
        + std::to_string(a_data.size()) + ".");
  }

  uint8_t const type = a_write_cal ? 0x2B : 0x28;
  std::vector<uint8_t> payload{0x00, a_block_num};
  payload.insert(payload.end(), a_data.begin(), a_data.end());
  WriteRead(BuildExtendedCommand(type, payload), 8,
      ExpectedExtendedHeader(type, 8));
}

void U3::WriteCal(uint8_t a_block_num, std::vector<uint8_t> const &a_data)
{
  WriteMem(a_block_num, a_data, true);
}

void U3::EraseMem(bool a_erase_cal)
{
  std::vector<uint8_t> command;
  uint8_t type;
  if (a_erase_cal) {
    type = 0x2C;
    command = BuildExtendedCommand(type, std::vector<uint8_t>{0x4C, 0x6C});
  } else {
    type = 0x29;
    command = BuildExtendedCommand(type, std::vector<uint8_t>());
  }
  WriteRead(command, 8, ExpectedExtendedHeader(type, 8));
}

void U3::EraseCal()
{
  EraseMem(true);
}

void U3::Reset(bool a_hard_reset)
{
  std::vector<uint8_t> command{0x00, 0x99, (uint8_t) (a_hard_reset ? 2 : 1),
    0x00};
  SetChecksum(command);
  WriteReadSimple(command, 4);
}

CalibrationInfo const &U3::GetCalibrationData()
{
  std::unique_ptr<CalibrationInfo> cal(new CalibrationInfo);

  DecodeCalibrationBlock(ReadCal(0), &cal->lvSESlope, &cal->lvSEOffset,
      &cal->lvDiffSlope, &cal->lvDiffOffset);
  DecodeCalibrationBlock(ReadCal(1), &cal->dacSlope[0], &cal->dacOffset[0],
      &cal->dacSlope[1], &cal->dacOffset[1]);
  DecodeCalibrationBlock(ReadCal(2), &cal->tempSlope, &cal->vRefAtCal,
      &cal->vRef15AtCal, &cal->vRegAtCal);

  try {
    DecodeCalibrationBlock(ReadCal(3), &cal->hvSlope[0], &cal->hvSlope[1],
        &cal->hvSlope[2], &cal->hvSlope[3]);
    DecodeCalibrationBlock(ReadCal(4), &cal->hvOffset[0], &cal->hvOffset[1],
        &cal->hvOffset[2], &cal->hvOffset[3]);
    cal->hasHighVoltage = true;
  } catch (LowlevelError const &e) {
    // Blocks 3 and 4 do not exist on hardware revisions < 1.30.
    if (e.ErrorCode() != kErrorInvalidBlock) {
      throw;
    }
    cal->hasHighVoltage = false;
  }

  m_calibration_info = std::move(cal);
  return *m_calibration_info;
}

void U3::SetCalibrationData(CalibrationInfo const &a_calibration_info)
{
  m_calibration_info.reset(new CalibrationInfo(a_calibration_info));
}

CalibrationInfo const *U3::Calibration() const
{
  return m_calibration_info.get();
}

double U3::BinaryToCalibratedAnalogVoltage(uint32_t a_bits,
    bool a_is_low_voltage, bool a_is_single_ended, bool a_is_special_setting,
    uint8_t a_channel_number) const
{
  return u3::BinaryToCalibratedAnalogVoltage(m_calibration_info.get(), a_bits,
      a_is_low_voltage, a_is_single_ended, a_is_special_setting,
      a_channel_number);
}

double U3::BinaryToCalibratedAnalogTemperature(uint32_t a_bits) const
{
  return u3::BinaryToCalibratedAnalogTemperature(m_calibration_info.get(),
      a_bits);
}

int32_t U3::VoltageToDacBits(double a_volts, uint8_t a_dac,
    bool a_is_16_bits) const
{
  return u3::VoltageToDacBits(m_calibration_info.get(), a_volts, a_dac,
      a_is_16_bits);
}

DeviceState const &U3::State() const
{
  return m_state;
}

// AIN0-AIN3 of a U3-HV are the high-voltage inputs.
bool U3::IsHighVoltageChannel(uint8_t a_channel) const
{
  std::string const &name = m_state.deviceName;
  bool const isHv = name.size() >= 2
    && (name.compare(name.size() - 2, 2, "HV") == 0
        || name.compare(name.size() - 2, 2, "hv") == 0);
  return isHv && a_channel < 4;
}

}
