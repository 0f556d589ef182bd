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

#ifndef LABJACK_U3_TRANSPORT_HPP
#define LABJACK_U3_TRANSPORT_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace u3 {

// Blocking byte pipe to one device. Read returns at most the requested
// number of bytes, fewer only when the underlying link timed out.
class Transport {
 public:
  virtual ~Transport() {}
  virtual void Write(std::vector<uint8_t> const &) = 0;
  virtual std::vector<uint8_t> Read(uint32_t) = 0;
  virtual std::vector<uint8_t> ReadStream(uint32_t) = 0;
};

uint16_t const kU3ProductId = 3;
int32_t const kLjSocketServerPort = 6000;

// One device line of an LJSocket scan reply,
// "<product id> <command port> <modbus port> <stream port> <local id> <serial>".
// Ports the server does not offer ("x") are -1.
struct LjSocketDevice {
  LjSocketDevice():
      productId(0),
      commandPort(-1),
      modbusPort(-1),
      streamPort(-1),
      localId(0),
      serialNumber(0)
  {
  }

  uint16_t productId;
  int32_t commandPort;
  int32_t modbusPort;
  int32_t streamPort;
  uint32_t localId;
  uint32_t serialNumber;
};

// Number of device lines announced by the status line, "OK <n>".
uint32_t ParseLjSocketStatus(std::string const &);
LjSocketDevice ParseLjSocketLine(std::string const &);

// First device of the product, or the one whose local id or serial number
// equals the address. A negative address selects the first one found.
LjSocketDevice SelectLjSocketDevice(std::vector<LjSocketDevice> const &,
    uint16_t, int64_t = -1);

// Talks to a U3 relayed by an LJSocket server, one TCP connection for
// command/response and an optional one for spontaneous stream data.
class TcpTransport : public Transport {
 public:
  TcpTransport(std::string const &, int32_t, int32_t = 0, int32_t = 1000);
  TcpTransport(std::string const &, LjSocketDevice const &, int32_t = 1000);
  ~TcpTransport() override;
  void Write(std::vector<uint8_t> const &) override;
  std::vector<uint8_t> Read(uint32_t) override;
  std::vector<uint8_t> ReadStream(uint32_t) override;

  // Sends "scan" to the server port and lists the devices it relays.
  static std::vector<LjSocketDevice> Scan(std::string const &,
      int32_t = kLjSocketServerPort, int32_t = 1000);

 private:
  TcpTransport(TcpTransport const &);
  TcpTransport &operator=(TcpTransport const &);

  static int32_t Connect(std::string const &, int32_t, int32_t);
  static void Disconnect(int32_t);
  static std::string ReceiveLine(int32_t);
  std::vector<uint8_t> Receive(int32_t, uint32_t);

  int32_t m_socket_command;
  int32_t m_socket_stream;
};

}

#endif
