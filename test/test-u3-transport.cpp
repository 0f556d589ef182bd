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

#include <cstring>
#include <string>
#include <thread>
#include <vector>

#include <sys/socket.h>
#include <netinet/in.h>
#include <unistd.h>
#include <arpa/inet.h>

#include "gtest/gtest.h"

#include "u3-errors.hpp"
#include "u3-transport.hpp"

namespace {

u3::LjSocketDevice MakeDevice(uint16_t a_product_id, uint32_t a_local_id,
    uint32_t a_serial_number, int32_t a_command_port)
{
  u3::LjSocketDevice device;
  device.productId = a_product_id;
  device.localId = a_local_id;
  device.serialNumber = a_serial_number;
  device.commandPort = a_command_port;
  return device;
}

}

TEST(Transport, ParsesScanStatusLine)
{
  EXPECT_EQ(2u, u3::ParseLjSocketStatus("OK 2"));
  EXPECT_EQ(0u, u3::ParseLjSocketStatus("ok 0"));
  EXPECT_THROW(u3::ParseLjSocketStatus("ERR 1"), u3::TransportError);
  EXPECT_THROW(u3::ParseLjSocketStatus("OK"), u3::TransportError);
  EXPECT_THROW(u3::ParseLjSocketStatus("OK two"), u3::TransportError);
}

TEST(Transport, ParsesDeviceLines)
{
  u3::LjSocketDevice const device =
    u3::ParseLjSocketLine("3 6001 x 6002 1 320032000");
  EXPECT_EQ(u3::kU3ProductId, device.productId);
  EXPECT_EQ(6001, device.commandPort);
  EXPECT_EQ(-1, device.modbusPort);
  EXPECT_EQ(6002, device.streamPort);
  EXPECT_EQ(1u, device.localId);
  EXPECT_EQ(320032000u, device.serialNumber);

  u3::LjSocketDevice const noPorts = u3::ParseLjSocketLine("9 x x x 0 5");
  EXPECT_EQ(-1, noPorts.commandPort);
  EXPECT_EQ(-1, noPorts.streamPort);
}

TEST(Transport, RejectsMalformedDeviceLines)
{
  EXPECT_THROW(u3::ParseLjSocketLine("3 6001 x 6002 1"), u3::TransportError);
  EXPECT_THROW(u3::ParseLjSocketLine("3 6001 x 6002 1 2 3"),
      u3::TransportError);
  EXPECT_THROW(u3::ParseLjSocketLine("3 port x 6002 1 2"),
      u3::TransportError);
  EXPECT_THROW(u3::ParseLjSocketLine("3 70000 x 6002 1 2"),
      u3::TransportError);
  EXPECT_THROW(u3::ParseLjSocketLine(""), u3::TransportError);
}

TEST(Transport, SelectsDeviceByProductAndAddress)
{
  std::vector<u3::LjSocketDevice> const devices{
    MakeDevice(9, 1, 100, 6001),
    MakeDevice(3, 2, 200, 6003),
    MakeDevice(3, 5, 300, 6005)};

  EXPECT_EQ(6003, u3::SelectLjSocketDevice(devices, 3).commandPort);
  EXPECT_EQ(6005, u3::SelectLjSocketDevice(devices, 3, 5).commandPort);
  EXPECT_EQ(6005, u3::SelectLjSocketDevice(devices, 3, 300).commandPort);
  EXPECT_EQ(6001, u3::SelectLjSocketDevice(devices, 9).commandPort);
  EXPECT_THROW(u3::SelectLjSocketDevice(devices, 3, 100),
      u3::TransportError);
  EXPECT_THROW(u3::SelectLjSocketDevice(devices, 6), u3::TransportError);
}

TEST(Transport, ConnectNeedsACommandPort)
{
  u3::LjSocketDevice const device = u3::ParseLjSocketLine("3 x x 6002 1 2");
  EXPECT_THROW(u3::TcpTransport("127.0.0.1", device), u3::TransportError);
}

TEST(Transport, ScansLocalServer)
{
  int32_t server = socket(PF_INET, SOCK_STREAM, IPPROTO_TCP);
  ASSERT_NE(-1, server);

  struct sockaddr_in address;
  memset(&address, 0, sizeof(address));
  address.sin_family = AF_INET;
  address.sin_port = 0;
  address.sin_addr.s_addr = inet_addr("127.0.0.1");
  ASSERT_EQ(0, bind(server, (struct sockaddr *) &address, sizeof(address)));
  ASSERT_EQ(0, listen(server, 1));

  socklen_t length = sizeof(address);
  ASSERT_EQ(0, getsockname(server, (struct sockaddr *) &address, &length));
  int32_t const port = ntohs(address.sin_port);

  std::string request;
  std::thread serverThread([server, &request]() {
      int32_t client = accept(server, nullptr, nullptr);
      if (client == -1) {
        return;
      }
      char c;
      while (recv(client, &c, 1, 0) == 1) {
        request.push_back(c);
        if (c == '\n') {
          break;
        }
      }
      std::string const reply("OK 2\r\n9 5001 x x 0 1\r\n"
          "3 6001 502 6002 1 320032000\r\n");
      EXPECT_EQ((ssize_t) reply.size(),
          send(client, reply.data(), reply.size(), 0));
      close(client);
    });

  std::vector<u3::LjSocketDevice> devices;
  EXPECT_NO_THROW(devices = u3::TcpTransport::Scan("127.0.0.1", port));
  serverThread.join();
  close(server);

  EXPECT_EQ("scan\r\n", request);
  ASSERT_EQ(2u, devices.size());
  u3::LjSocketDevice const device =
    u3::SelectLjSocketDevice(devices, u3::kU3ProductId, 320032000);
  EXPECT_EQ(6001, device.commandPort);
  EXPECT_EQ(502, device.modbusPort);
  EXPECT_EQ(6002, device.streamPort);
}
