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

#include <cerrno>
#include <cstdlib>
#include <sstream>

#include "u3-errors.hpp"
#include "u3-feedback.hpp"
#include "u3-packet.hpp"

namespace u3 {

namespace {

std::string BoolToString(bool a_value)
{
  return a_value ? "true" : "false";
}

std::string PortBytesToString(PortBytes const &a_bytes)
{
  std::stringstream ss;
  ss << "[" << (int32_t) a_bytes[0] << ", " << (int32_t) a_bytes[1] << ", "
    << (int32_t) a_bytes[2] << "]";
  return ss.str();
}

bool IsValidAinChannel(uint8_t a_channel)
{
  return a_channel < 16 || a_channel == 30 || a_channel == 31;
}

void ValidateIoNumber(uint8_t a_io_number)
{
  if (a_io_number > CIO3) {
    throw InvalidParameter("IO number should be in 0-19, got "
        + std::to_string(a_io_number) + ".");
  }
}

void ValidateTimer(uint8_t a_timer)
{
  if (a_timer != 0 && a_timer != 1) {
    throw InvalidParameter("Timer should be either 0 or 1.");
  }
}

std::vector<uint8_t> PortWriteBytes(uint8_t a_opcode, PortBytes const &a_mask,
    PortBytes const &a_value)
{
  std::vector<uint8_t> bytes;
  bytes.push_back(a_opcode);
  bytes.insert(bytes.end(), a_mask.begin(), a_mask.end());
  bytes.insert(bytes.end(), a_value.begin(), a_value.end());
  return bytes;
}

FeedbackResult PortResult(uint8_t const *a_input)
{
  FeedbackResult result;
  result.type = FeedbackResult::kPorts;
  result.ports[0] = a_input[0];
  result.ports[1] = a_input[1];
  result.ports[2] = a_input[2];
  return result;
}

FeedbackResult BitResult(uint8_t const *a_input)
{
  FeedbackResult result;
  result.type = FeedbackResult::kUnsigned;
  result.value = (a_input[0] != 0) ? 1 : 0;
  return result;
}

}

FeedbackCommand::FeedbackCommand(std::vector<uint8_t> const &a_cmd_bytes,
    uint32_t a_read_length):
    m_cmd_bytes(a_cmd_bytes),
    m_read_length(a_read_length)
{
}

FeedbackCommand::~FeedbackCommand()
{
}

std::vector<uint8_t> const &FeedbackCommand::CmdBytes() const
{
  return m_cmd_bytes;
}

uint32_t FeedbackCommand::ReadLength() const
{
  return m_read_length;
}

FeedbackResult FeedbackCommand::Handle(uint8_t const *) const
{
  return FeedbackResult();
}

void FeedbackCommand::Flatten(
    std::vector<FeedbackCommand const *> &a_commands) const
{
  a_commands.push_back(this);
}


FeedbackGroup::FeedbackGroup(FeedbackList const &a_commands):
    FeedbackCommand(std::vector<uint8_t>(), 0),
    m_commands(a_commands)
{
  for (auto const &command : m_commands) {
    if (command == nullptr) {
      throw InvalidParameter("Feedback group contains an empty command.");
    }
  }
}

std::string FeedbackGroup::ToString() const
{
  std::stringstream ss;
  ss << "FeedbackGroup(";
  for (uint32_t i = 0; i < m_commands.size(); i++) {
    if (i > 0) {
      ss << ", ";
    }
    ss << m_commands[i]->ToString();
  }
  ss << ")";
  return ss.str();
}

void FeedbackGroup::Flatten(
    std::vector<FeedbackCommand const *> &a_commands) const
{
  for (auto const &command : m_commands) {
    command->Flatten(a_commands);
  }
}


Ain::Ain(uint8_t a_positive_channel, uint8_t a_negative_channel,
    bool a_long_settling, bool a_quick_sample):
    FeedbackCommand(std::vector<uint8_t>{0x01,
        (uint8_t) (a_positive_channel | (a_long_settling << 6)
          | (a_quick_sample << 7)), a_negative_channel}, 2),
    m_positive_channel(a_positive_channel),
    m_negative_channel(a_negative_channel),
    m_long_settling(a_long_settling),
    m_quick_sample(a_quick_sample)
{
  if (!IsValidAinChannel(a_positive_channel)) {
    throw InvalidParameter("Invalid positive channel "
        + std::to_string(a_positive_channel) + ".");
  }
  if (!IsValidAinChannel(a_negative_channel)) {
    throw InvalidParameter("Invalid negative channel "
        + std::to_string(a_negative_channel) + ".");
  }
}

FeedbackResult Ain::Handle(uint8_t const *a_input) const
{
  FeedbackResult result;
  result.type = FeedbackResult::kUnsigned;
  result.value = ToUint16(a_input);
  return result;
}

std::string Ain::ToString() const
{
  std::stringstream ss;
  ss << "Ain(PositiveChannel = " << (int32_t) m_positive_channel
    << ", NegativeChannel = " << (int32_t) m_negative_channel
    << ", LongSettling = " << BoolToString(m_long_settling)
    << ", QuickSample = " << BoolToString(m_quick_sample) << ")";
  return ss.str();
}


WaitShort::WaitShort(uint32_t a_time):
    FeedbackCommand(std::vector<uint8_t>{5, (uint8_t) (a_time % 256)}, 0),
    m_time((uint8_t) (a_time % 256))
{
}

std::string WaitShort::ToString() const
{
  return "WaitShort(Time = " + std::to_string(m_time) + ")";
}


WaitLong::WaitLong(uint32_t a_time):
    FeedbackCommand(std::vector<uint8_t>{6, (uint8_t) (a_time % 256)}, 0),
    m_time((uint8_t) (a_time % 256))
{
}

std::string WaitLong::ToString() const
{
  return "WaitLong(Time = " + std::to_string(m_time) + ")";
}


Led::Led(bool a_state):
    FeedbackCommand(std::vector<uint8_t>{9, (uint8_t) a_state}, 0),
    m_state(a_state)
{
}

std::string Led::ToString() const
{
  return "Led(State = " + BoolToString(m_state) + ")";
}


BitStateRead::BitStateRead(uint8_t a_io_number):
    FeedbackCommand(std::vector<uint8_t>{10, a_io_number}, 1),
    m_io_number(a_io_number)
{
  ValidateIoNumber(a_io_number);
}

FeedbackResult BitStateRead::Handle(uint8_t const *a_input) const
{
  return BitResult(a_input);
}

std::string BitStateRead::ToString() const
{
  return "BitStateRead(IONumber = " + std::to_string(m_io_number) + ")";
}


BitStateWrite::BitStateWrite(uint8_t a_io_number, bool a_state):
    FeedbackCommand(std::vector<uint8_t>{11,
        (uint8_t) (a_io_number | (a_state << 7))}, 0),
    m_io_number(a_io_number),
    m_state(a_state)
{
  ValidateIoNumber(a_io_number);
}

std::string BitStateWrite::ToString() const
{
  return "BitStateWrite(IONumber = " + std::to_string(m_io_number)
    + ", State = " + BoolToString(m_state) + ")";
}


BitDirRead::BitDirRead(uint8_t a_io_number):
    FeedbackCommand(std::vector<uint8_t>{12, a_io_number}, 1),
    m_io_number(a_io_number)
{
  ValidateIoNumber(a_io_number);
}

FeedbackResult BitDirRead::Handle(uint8_t const *a_input) const
{
  return BitResult(a_input);
}

std::string BitDirRead::ToString() const
{
  return "BitDirRead(IONumber = " + std::to_string(m_io_number) + ")";
}


BitDirWrite::BitDirWrite(uint8_t a_io_number, bool a_direction):
    FeedbackCommand(std::vector<uint8_t>{13,
        (uint8_t) (a_io_number | (a_direction << 7))}, 0),
    m_io_number(a_io_number),
    m_direction(a_direction)
{
  ValidateIoNumber(a_io_number);
}

std::string BitDirWrite::ToString() const
{
  return "BitDirWrite(IONumber = " + std::to_string(m_io_number)
    + ", Direction = " + BoolToString(m_direction) + ")";
}


PortStateRead::PortStateRead():
    FeedbackCommand(std::vector<uint8_t>{26}, 3)
{
}

FeedbackResult PortStateRead::Handle(uint8_t const *a_input) const
{
  return PortResult(a_input);
}

std::string PortStateRead::ToString() const
{
  return "PortStateRead()";
}


PortStateWrite::PortStateWrite(PortBytes const &a_state,
    PortBytes const &a_write_mask):
    FeedbackCommand(PortWriteBytes(27, a_write_mask, a_state), 0),
    m_state(a_state),
    m_write_mask(a_write_mask)
{
}

std::string PortStateWrite::ToString() const
{
  return "PortStateWrite(State = " + PortBytesToString(m_state)
    + ", WriteMask = " + PortBytesToString(m_write_mask) + ")";
}


PortDirRead::PortDirRead():
    FeedbackCommand(std::vector<uint8_t>{28}, 3)
{
}

FeedbackResult PortDirRead::Handle(uint8_t const *a_input) const
{
  return PortResult(a_input);
}

std::string PortDirRead::ToString() const
{
  return "PortDirRead()";
}


PortDirWrite::PortDirWrite(PortBytes const &a_direction,
    PortBytes const &a_write_mask):
    FeedbackCommand(PortWriteBytes(29, a_write_mask, a_direction), 0),
    m_direction(a_direction),
    m_write_mask(a_write_mask)
{
}

std::string PortDirWrite::ToString() const
{
  return "PortDirWrite(Direction = " + PortBytesToString(m_direction)
    + ", WriteMask = " + PortBytesToString(m_write_mask) + ")";
}


Dac::Dac(uint8_t a_dac, uint16_t a_value, bool a_is_16_bits):
    FeedbackCommand(a_is_16_bits
        ? std::vector<uint8_t>{(uint8_t) (38 + a_dac),
            (uint8_t) (a_value & 0xFF), (uint8_t) (a_value >> 8)}
        : std::vector<uint8_t>{(uint8_t) (34 + a_dac),
            (uint8_t) (a_value & 0xFF)}, 0),
    m_dac(a_dac),
    m_value(a_is_16_bits ? a_value : (uint16_t) (a_value & 0xFF)),
    m_is_16_bits(a_is_16_bits)
{
  if (a_dac != 0 && a_dac != 1) {
    throw InvalidParameter("DAC should be either 0 or 1.");
  }
}

std::string Dac::ToString() const
{
  return std::string(m_is_16_bits ? "Dac16" : "Dac8") + "(Dac = "
    + std::to_string(m_dac) + ", Value = " + std::to_string(m_value) + ")";
}


Timer::Timer(uint8_t a_timer, bool a_update_reset, uint16_t a_value,
    uint8_t a_mode):
    FeedbackCommand(std::vector<uint8_t>{(uint8_t) (42 + 2 * a_timer),
        (uint8_t) a_update_reset, (uint8_t) (a_value & 0xFF),
        (uint8_t) (a_value >> 8)}, 4),
    m_timer(a_timer),
    m_update_reset(a_update_reset),
    m_value(a_value),
    m_mode(a_mode)
{
  ValidateTimer(a_timer);
}

FeedbackResult Timer::Handle(uint8_t const *a_input) const
{
  FeedbackResult result;
  if (m_mode == kTimerModeQuadrature) {
    result.type = FeedbackResult::kSigned;
    result.signedValue = ToInt32(a_input);
  } else if (m_mode == kTimerModeTimerStop) {
    result.type = FeedbackResult::kStopInput;
    result.stopValue = ToUint16(a_input);
    result.count = ToUint16(a_input + 2);
  } else {
    result.type = FeedbackResult::kUnsigned;
    result.value = ToUint32(a_input);
  }
  return result;
}

std::string Timer::ToString() const
{
  std::stringstream ss;
  ss << "Timer(timer = " << (int32_t) m_timer << ", UpdateReset = "
    << BoolToString(m_update_reset) << ", Value = " << m_value << ", Mode = ";
  if (m_mode == kTimerModeNone) {
    ss << "none";
  } else {
    ss << (int32_t) m_mode;
  }
  ss << ")";
  return ss.str();
}


TimerConfig::TimerConfig(uint8_t a_timer, uint8_t a_timer_mode,
    uint16_t a_value):
    FeedbackCommand(std::vector<uint8_t>{(uint8_t) (43 + 2 * a_timer),
        a_timer_mode, (uint8_t) (a_value & 0xFF), (uint8_t) (a_value >> 8)},
        0),
    m_timer(a_timer),
    m_timer_mode(a_timer_mode),
    m_value(a_value)
{
  ValidateTimer(a_timer);
  if (a_timer_mode > 14) {
    throw InvalidParameter("Invalid timer mode "
        + std::to_string(a_timer_mode) + ".");
  }
}

std::string TimerConfig::ToString() const
{
  return "TimerConfig(timer = " + std::to_string(m_timer) + ", TimerMode = "
    + std::to_string(m_timer_mode) + ", Value = " + std::to_string(m_value)
    + ")";
}


Counter::Counter(uint8_t a_counter, bool a_reset):
    FeedbackCommand(std::vector<uint8_t>{(uint8_t) (54 + a_counter),
        (uint8_t) a_reset}, 4),
    m_counter(a_counter),
    m_reset(a_reset)
{
  if (a_counter != 0 && a_counter != 1) {
    throw InvalidParameter("Counter should be either 0 or 1.");
  }
}

FeedbackResult Counter::Handle(uint8_t const *a_input) const
{
  FeedbackResult result;
  result.type = FeedbackResult::kUnsigned;
  result.value = ToUint32(a_input);
  return result;
}

std::string Counter::ToString() const
{
  return "Counter(counter = " + std::to_string(m_counter) + ", Reset = "
    + BoolToString(m_reset) + ")";
}


FeedbackCommandPtr QuadratureInputTimer(bool a_update_reset, uint16_t a_value)
{
  return std::make_shared<Timer>(0, a_update_reset, a_value,
      kTimerModeQuadrature);
}

FeedbackCommandPtr TimerStopInput1(bool a_update_reset, uint16_t a_value)
{
  return std::make_shared<Timer>(1, a_update_reset, a_value,
      kTimerModeTimerStop);
}

std::vector<uint8_t> ParseAinChannelList(std::string const &a_list)
{
  std::vector<uint8_t> channels;
  std::stringstream ss(a_list);
  std::string channel;
  while (std::getline(ss, channel, ',')) {
    if (channel.empty()) {
      continue;
    }
    char *end = nullptr;
    errno = 0;
    long const value = std::strtol(channel.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || value < 0 || value > 30
        || (value > 15 && value != 30)) {
      throw InvalidParameter("Invalid AIN channel '" + channel + "'.");
    }
    channels.push_back((uint8_t) value);
  }
  if (channels.empty()) {
    throw InvalidParameter("No AIN channel given.");
  }
  return channels;
}

}
