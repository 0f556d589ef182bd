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

#ifndef LABJACK_U3_FEEDBACK_HPP
#define LABJACK_U3_FEEDBACK_HPP

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace u3 {

/* IO numbers */
uint8_t const EIO0 = 8;
uint8_t const EIO7 = 15;
uint8_t const CIO3 = 19;

/* timer modes with special return values */

// Quadrature, signed 32-bit count
uint8_t const kTimerModeQuadrature = 8;

// Timer stop input, edge count and stop value
uint8_t const kTimerModeTimerStop = 9;

// No mode given, plain unsigned 32-bit value
uint8_t const kTimerModeNone = 0xFF;

// FIO, EIO and CIO in that order.
typedef std::array<uint8_t, 3> PortBytes;

struct FeedbackResult {
  enum Type {
    kNone,
    kUnsigned,
    kSigned,
    kStopInput,
    kPorts
  };

  FeedbackResult():
      type(kNone),
      value(0),
      signedValue(0),
      count(0),
      stopValue(0),
      ports()
  {
  }

  Type type;
  uint32_t value;
  int32_t signedValue;
  uint16_t count;
  uint16_t stopValue;
  PortBytes ports;
};

// One unit of work batched into a Feedback exchange. Immutable after
// construction.
class FeedbackCommand {
 public:
  virtual ~FeedbackCommand();

  std::vector<uint8_t> const &CmdBytes() const;
  uint32_t ReadLength() const;
  virtual FeedbackResult Handle(uint8_t const *) const;
  virtual std::string ToString() const = 0;
  virtual void Flatten(std::vector<FeedbackCommand const *> &) const;

 protected:
  FeedbackCommand(std::vector<uint8_t> const &, uint32_t);

 private:
  std::vector<uint8_t> m_cmd_bytes;
  uint32_t m_read_length;
};

typedef std::shared_ptr<FeedbackCommand const> FeedbackCommandPtr;
typedef std::vector<FeedbackCommandPtr> FeedbackList;

// A nested list of commands, flattened in order before transmission.
class FeedbackGroup : public FeedbackCommand {
 public:
  explicit FeedbackGroup(FeedbackList const &);
  std::string ToString() const override;
  void Flatten(std::vector<FeedbackCommand const *> &) const override;

 private:
  FeedbackList m_commands;
};

class Ain : public FeedbackCommand {
 public:
  Ain(uint8_t, uint8_t = 31, bool = false, bool = false);
  FeedbackResult Handle(uint8_t const *) const override;
  std::string ToString() const override;

 private:
  uint8_t m_positive_channel;
  uint8_t m_negative_channel;
  bool m_long_settling;
  bool m_quick_sample;
};

// Waits in 128 us increments.
class WaitShort : public FeedbackCommand {
 public:
  explicit WaitShort(uint32_t);
  std::string ToString() const override;

 private:
  uint8_t m_time;
};

// Waits in 32 ms increments.
class WaitLong : public FeedbackCommand {
 public:
  explicit WaitLong(uint32_t);
  std::string ToString() const override;

 private:
  uint8_t m_time;
};

class Led : public FeedbackCommand {
 public:
  explicit Led(bool);
  std::string ToString() const override;

 private:
  bool m_state;
};

class BitStateRead : public FeedbackCommand {
 public:
  explicit BitStateRead(uint8_t);
  FeedbackResult Handle(uint8_t const *) const override;
  std::string ToString() const override;

 private:
  uint8_t m_io_number;
};

class BitStateWrite : public FeedbackCommand {
 public:
  BitStateWrite(uint8_t, bool);
  std::string ToString() const override;

 private:
  uint8_t m_io_number;
  bool m_state;
};

class BitDirRead : public FeedbackCommand {
 public:
  explicit BitDirRead(uint8_t);
  FeedbackResult Handle(uint8_t const *) const override;
  std::string ToString() const override;

 private:
  uint8_t m_io_number;
};

class BitDirWrite : public FeedbackCommand {
 public:
  BitDirWrite(uint8_t, bool);
  std::string ToString() const override;

 private:
  uint8_t m_io_number;
  bool m_direction;
};

class PortStateRead : public FeedbackCommand {
 public:
  PortStateRead();
  FeedbackResult Handle(uint8_t const *) const override;
  std::string ToString() const override;
};

class PortStateWrite : public FeedbackCommand {
 public:
  explicit PortStateWrite(PortBytes const &,
      PortBytes const & = PortBytes{{0xFF, 0xFF, 0xFF}});
  std::string ToString() const override;

 private:
  PortBytes m_state;
  PortBytes m_write_mask;
};

class PortDirRead : public FeedbackCommand {
 public:
  PortDirRead();
  FeedbackResult Handle(uint8_t const *) const override;
  std::string ToString() const override;
};

class PortDirWrite : public FeedbackCommand {
 public:
  explicit PortDirWrite(PortBytes const &,
      PortBytes const & = PortBytes{{0xFF, 0xFF, 0xFF}});
  std::string ToString() const override;

 private:
  PortBytes m_direction;
  PortBytes m_write_mask;
};

// Analog output, 8-bit or 16-bit value.
class Dac : public FeedbackCommand {
 public:
  Dac(uint8_t, uint16_t, bool = false);
  std::string ToString() const override;

 private:
  uint8_t m_dac;
  uint16_t m_value;
  bool m_is_16_bits;
};

/*
 * Reads a timer, optionally updating or resetting it first. The mode decides
 * how the four response bytes are decoded: quadrature as signed, timer stop
 * input as (edge count, stop value), anything else as unsigned.
 */
class Timer : public FeedbackCommand {
 public:
  Timer(uint8_t, bool = false, uint16_t = 0, uint8_t = kTimerModeNone);
  FeedbackResult Handle(uint8_t const *) const override;
  std::string ToString() const override;

 private:
  uint8_t m_timer;
  bool m_update_reset;
  uint16_t m_value;
  uint8_t m_mode;
};

class TimerConfig : public FeedbackCommand {
 public:
  TimerConfig(uint8_t, uint8_t, uint16_t = 0);
  std::string ToString() const override;

 private:
  uint8_t m_timer;
  uint8_t m_timer_mode;
  uint16_t m_value;
};

class Counter : public FeedbackCommand {
 public:
  Counter(uint8_t, bool = false);
  FeedbackResult Handle(uint8_t const *) const override;
  std::string ToString() const override;

 private:
  uint8_t m_counter;
  bool m_reset;
};

FeedbackCommandPtr QuadratureInputTimer(bool = false, uint16_t = 0);
FeedbackCommandPtr TimerStopInput1(bool = false, uint16_t = 0);

// Comma separated single-ended AIN channels (0-15 or 30), empty entries
// skipped.
std::vector<uint8_t> ParseAinChannelList(std::string const &);

}

#endif
