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

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>

#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <unistd.h>
#include <arpa/inet.h>

#include "u3-errors.hpp"
#include "u3-transport.hpp"

namespace u3 {

namespace {

uint32_t const kMaxLineLength = 256;

bool ParseNumber(std::string const &a_token, int64_t *a_value)
{
  if (a_token.empty()) {
    return false;
  }
  char *end = nullptr;
  errno = 0;
  long long const value = std::strtoll(a_token.c_str(), &end, 10);
  if (errno != 0 || *end != '\0') {
    return false;
  }
  *a_value = (int64_t) value;
  return true;
}

bool ParsePort(std::string const &a_token, int32_t *a_port)
{
  if (a_token[0] == 'x') {
    *a_port = -1;
    return true;
  }
  int64_t value;
  if (!ParseNumber(a_token, &value) || value < 0 || value > 65535) {
    return false;
  }
  *a_port = (int32_t) value;
  return true;
}

int32_t CommandPortOf(LjSocketDevice const &a_device)
{
  if (a_device.commandPort < 0) {
    throw TransportError("The LJSocket server offers no command port for "
        "serial " + std::to_string(a_device.serialNumber) + ".");
  }
  return a_device.commandPort;
}

}

uint32_t ParseLjSocketStatus(std::string const &a_line)
{
  std::istringstream ss(a_line);
  std::string status;
  std::string count;
  std::string rest;
  ss >> status >> count >> rest;

  if (status.size() < 2 || (status[0] != 'O' && status[0] != 'o')
      || (status[1] != 'K' && status[1] != 'k')) {
    throw TransportError("Got an error from LJSocket. It said '" + a_line
        + "'.");
  }
  int64_t lines;
  if (!rest.empty() || !ParseNumber(count, &lines) || lines < 0) {
    throw TransportError("Got invalid line from LJSocket: " + a_line);
  }
  return (uint32_t) lines;
}

LjSocketDevice ParseLjSocketLine(std::string const &a_line)
{
  std::istringstream ss(a_line);
  std::vector<std::string> tokens;
  std::string token;
  while (ss >> token) {
    tokens.push_back(token);
  }

  LjSocketDevice device;
  int64_t productId;
  int64_t localId;
  int64_t serialNumber;
  if (tokens.size() != 6
      || !ParseNumber(tokens[0], &productId) || productId < 0
      || !ParsePort(tokens[1], &device.commandPort)
      || !ParsePort(tokens[2], &device.modbusPort)
      || !ParsePort(tokens[3], &device.streamPort)
      || !ParseNumber(tokens[4], &localId) || localId < 0
      || !ParseNumber(tokens[5], &serialNumber) || serialNumber < 0) {
    throw TransportError("Got invalid device line from LJSocket: " + a_line);
  }
  device.productId = (uint16_t) productId;
  device.localId = (uint32_t) localId;
  device.serialNumber = (uint32_t) serialNumber;
  return device;
}

LjSocketDevice SelectLjSocketDevice(std::vector<LjSocketDevice> const &a_devices,
    uint16_t a_product_id, int64_t a_address)
{
  for (auto const &device : a_devices) {
    if (device.productId != a_product_id) {
      continue;
    }
    if (a_address < 0 || device.localId == a_address
        || device.serialNumber == a_address) {
      return device;
    }
  }
  throw TransportError("LabJack not found.");
}

TcpTransport::TcpTransport(std::string const &a_address,
    int32_t a_port_command, int32_t a_port_stream, int32_t a_timeout_ms):
    m_socket_command(-1),
    m_socket_stream(-1)
{
  m_socket_command = Connect(a_address, a_port_command, a_timeout_ms);
  if (a_port_stream > 0) {
    try {
      m_socket_stream = Connect(a_address, a_port_stream, a_timeout_ms);
    } catch (TransportError const &) {
      Disconnect(m_socket_command);
      throw;
    }
  }
}

TcpTransport::TcpTransport(std::string const &a_address,
    LjSocketDevice const &a_device, int32_t a_timeout_ms):
    TcpTransport(a_address, CommandPortOf(a_device),
        (a_device.streamPort < 0) ? 0 : a_device.streamPort, a_timeout_ms)
{
}

TcpTransport::~TcpTransport()
{
  Disconnect(m_socket_stream);
  Disconnect(m_socket_command);
}

int32_t TcpTransport::Connect(std::string const &a_address, int32_t a_port,
    int32_t a_timeout_ms)
{
  int32_t s = socket(PF_INET, SOCK_STREAM, IPPROTO_TCP);
  if (s == -1) {
    throw TransportError("Could not create TCP socket.");
  }

  struct sockaddr_in address;
  memset(&address, 0, sizeof(address));
  address.sin_family = AF_INET;
  address.sin_port = htons(a_port);
  address.sin_addr.s_addr = inet_addr(a_address.c_str());

  struct timeval timeout;
  timeout.tv_sec = a_timeout_ms / 1000;
  timeout.tv_usec = (a_timeout_ms % 1000) * 1000;
  if (setsockopt(s, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout))
      != 0) {
    close(s);
    throw TransportError("Could not set the receive timeout.");
  }

  int32_t res = connect(s, (struct sockaddr *) &address, sizeof(address));
  if (res < 0) {
    close(s);
    throw TransportError("Could not connect to " + a_address + ":"
        + std::to_string(a_port) + ".");
  }

  return s;
}

void TcpTransport::Disconnect(int32_t a_socket)
{
  if (a_socket != -1) {
    shutdown(a_socket, SHUT_RDWR);
    close(a_socket);
  }
}

void TcpTransport::Write(std::vector<uint8_t> const &a_buffer)
{
  int32_t res = send(m_socket_command, a_buffer.data(), a_buffer.size(), 0);
  if (res < (int32_t) a_buffer.size()) {
    throw TransportError("Failed to send, could only write "
        + std::to_string(res) + " of " + std::to_string(a_buffer.size())
        + " bytes.");
  }
}

std::vector<uint8_t> TcpTransport::Read(uint32_t a_length)
{
  return Receive(m_socket_command, a_length);
}

std::vector<uint8_t> TcpTransport::ReadStream(uint32_t a_length)
{
  if (m_socket_stream == -1) {
    throw TransportError("No stream port was given.");
  }
  return Receive(m_socket_stream, a_length);
}

std::vector<LjSocketDevice> TcpTransport::Scan(std::string const &a_address,
    int32_t a_server_port, int32_t a_timeout_ms)
{
  int32_t s = Connect(a_address, a_server_port, a_timeout_ms);

  std::vector<LjSocketDevice> devices;
  try {
    std::string const request("scan\r\n");
    int32_t res = send(s, request.data(), request.size(), 0);
    if (res < (int32_t) request.size()) {
      throw TransportError("Failed to send scan request to LJSocket.");
    }

    uint32_t const count = ParseLjSocketStatus(ReceiveLine(s));
    for (uint32_t i = 0; i < count; i++) {
      devices.push_back(ParseLjSocketLine(ReceiveLine(s)));
    }
  } catch (TransportError const &) {
    Disconnect(s);
    throw;
  }

  Disconnect(s);
  return devices;
}

std::string TcpTransport::ReceiveLine(int32_t a_socket)
{
  std::string line;
  while (line.size() < kMaxLineLength) {
    char c;
    int32_t res = recv(a_socket, &c, 1, 0);
    if (res == 0) {
      throw TransportError("LJSocket closed the connection mid line.");
    }
    if (res < 0) {
      throw TransportError(std::string("Failed to receive from LJSocket: ")
          + strerror(errno));
    }
    if (c == '\n') {
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      return line;
    }
    line.push_back(c);
  }
  throw TransportError("Line from LJSocket is too long.");
}

std::vector<uint8_t> TcpTransport::Receive(int32_t a_socket,
    uint32_t a_length)
{
  std::vector<uint8_t> buffer(a_length);

  uint32_t received = 0;
  while (received < a_length) {
    int32_t res = recv(a_socket, buffer.data() + received,
        a_length - received, 0);
    if (res == 0) {
      throw TransportError("Failed to receive, connection closed.");
    }
    if (res < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        break;
      }
      throw TransportError(std::string("Failed to receive: ")
          + strerror(errno));
    }
    received += res;
  }

  buffer.resize(received);
  return buffer;
}

}
