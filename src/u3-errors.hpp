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

#ifndef LABJACK_U3_ERRORS_HPP
#define LABJACK_U3_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace u3 {

class U3Error : public std::runtime_error {
 public:
  explicit U3Error(std::string const &a_what):
      std::runtime_error(a_what)
  {
  }
};

// Out-of-domain argument, detected before any I/O.
class InvalidParameter : public U3Error {
 public:
  explicit InvalidParameter(std::string const &a_what):
      U3Error(a_what)
  {
  }
};

// Request or expected response does not fit in one 64 byte USB packet.
class PacketTooLarge : public U3Error {
 public:
  explicit PacketTooLarge(std::string const &a_what):
      U3Error(a_what)
  {
  }
};

class TransportError : public U3Error {
 public:
  explicit TransportError(std::string const &a_what):
      U3Error(a_what)
  {
  }
};

class ProtocolError : public U3Error {
 public:
  explicit ProtocolError(std::string const &a_what):
      U3Error(a_what)
  {
  }
};

class FramingError : public ProtocolError {
 public:
  FramingError(std::string const &a_what, uint32_t a_expected,
      uint32_t a_actual):
      ProtocolError(a_what),
      m_expected(a_expected),
      m_actual(a_actual)
  {
  }

  uint32_t Expected() const { return m_expected; }
  uint32_t Actual() const { return m_actual; }

 private:
  uint32_t m_expected;
  uint32_t m_actual;
};

class ProtocolMismatch : public ProtocolError {
 public:
  ProtocolMismatch(std::string const &a_what,
      std::vector<uint8_t> const &a_expected,
      std::vector<uint8_t> const &a_actual):
      ProtocolError(a_what),
      m_expected(a_expected),
      m_actual(a_actual)
  {
  }

  std::vector<uint8_t> const &Expected() const { return m_expected; }
  std::vector<uint8_t> const &Actual() const { return m_actual; }

 private:
  std::vector<uint8_t> m_expected;
  std::vector<uint8_t> m_actual;
};

class ChecksumError : public ProtocolError {
 public:
  explicit ChecksumError(std::string const &a_what):
      ProtocolError(a_what)
  {
  }
};

// The device reported a nonzero status byte.
class LowlevelError : public U3Error {
 public:
  LowlevelError(std::string const &a_what, uint8_t a_error_code,
      std::string const &a_culprit = std::string()):
      U3Error(a_what),
      m_error_code(a_error_code),
      m_culprit(a_culprit)
  {
  }

  uint8_t ErrorCode() const { return m_error_code; }
  std::string const &Culprit() const { return m_culprit; }

 private:
  uint8_t m_error_code;
  std::string m_culprit;
};

// Conversion asked for a channel combination the hardware cannot measure.
class UnsupportedChannelMode : public U3Error {
 public:
  explicit UnsupportedChannelMode(std::string const &a_what):
      U3Error(a_what)
  {
  }
};

}

#endif
