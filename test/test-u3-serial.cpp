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

#include <memory>
#include <vector>

#include "gtest/gtest.h"

#include "fake-transport.hpp"
#include "u3.hpp"

namespace {

std::unique_ptr<u3::U3> MakeDevice(std::shared_ptr<FakeLink> a_link)
{
  std::unique_ptr<u3::Transport> transport(new FakeTransport(a_link));
  return std::unique_ptr<u3::U3>(new u3::U3(std::move(transport)));
}

std::vector<uint8_t> Tail(std::vector<uint8_t> const &a_bytes,
    uint32_t a_from)
{
  return std::vector<uint8_t>(a_bytes.begin() + a_from, a_bytes.end());
}

}

TEST(Serial, SpiPadsOddTransfers)
{
  auto link = std::make_shared<FakeLink>();
  auto device = MakeDevice(link);

  link->responses.push_back(MakeResponse(0x3A, 12,
        std::vector<uint8_t>{0, 0, 9, 8, 7, 0}));

  u3::SpiRequest request;
  request.bytes = std::vector<uint8_t>{1, 2, 3};
  request.spiMode = 'C';
  std::vector<uint8_t> received = device->Spi(request);

  std::vector<uint8_t> const &sent = link->written[0];
  ASSERT_EQ(18u, sent.size());
  EXPECT_EQ(0x3a, sent[3]);
  EXPECT_EQ(0x82, sent[6]);
  EXPECT_EQ(4, sent[9]);
  EXPECT_EQ(7, sent[12]);
  EXPECT_EQ(3, sent[13]);
  EXPECT_EQ((std::vector<uint8_t>{1, 2, 3, 0}), Tail(sent, 14));
  EXPECT_EQ(std::vector<uint32_t>{12}, link->readLengths);

  EXPECT_EQ((std::vector<uint8_t>{9, 8, 7}), received);
}

TEST(Serial, SpiKeepsEvenTransfers)
{
  auto link = std::make_shared<FakeLink>();
  auto device = MakeDevice(link);

  link->responses.push_back(MakeResponse(0x3A, 10,
        std::vector<uint8_t>{0, 0, 5, 0}));

  u3::SpiRequest request;
  request.bytes = std::vector<uint8_t>{0xaa, 0x55};
  request.autoCs = false;
  std::vector<uint8_t> received = device->Spi(request);

  EXPECT_EQ(0x00, link->written[0][6]);
  EXPECT_EQ(2, link->written[0][13]);
  EXPECT_EQ((std::vector<uint8_t>{5, 0}), received);
}

TEST(Serial, SpiRejectsUnknownMode)
{
  auto link = std::make_shared<FakeLink>();
  link->forbidIo = true;
  auto device = MakeDevice(link);

  u3::SpiRequest request;
  request.bytes = std::vector<uint8_t>{1};
  request.spiMode = 'E';
  EXPECT_THROW(device->Spi(request), u3::InvalidParameter);
}

TEST(Serial, I2cPadsBothDirections)
{
  auto link = std::make_shared<FakeLink>();
  auto device = MakeDevice(link);

  link->responses.push_back(MakeResponse(0x3B, 16,
        std::vector<uint8_t>{0, 0, 1, 0, 0, 0, 0x0a, 0x0b, 0x0c, 0}));

  u3::I2cRequest request;
  request.address = 0x48;
  request.bytes = std::vector<uint8_t>{0x10};
  request.numI2cBytesToReceive = 3;
  request.enableClockStretching = true;
  u3::I2cResult result = device->I2c(request);

  std::vector<uint8_t> const &sent = link->written[0];
  ASSERT_EQ(16u, sent.size());
  EXPECT_EQ(0x08, sent[6]);
  EXPECT_EQ(6, sent[8]);
  EXPECT_EQ(7, sent[9]);
  EXPECT_EQ(0x90, sent[10]);
  EXPECT_EQ(1, sent[12]);
  EXPECT_EQ(3, sent[13]);
  EXPECT_EQ((std::vector<uint8_t>{0x10, 0}), Tail(sent, 14));
  EXPECT_EQ(std::vector<uint32_t>{16}, link->readLengths);

  EXPECT_EQ((std::vector<uint8_t>{1, 0, 0, 0}), result.ackArray);
  EXPECT_EQ((std::vector<uint8_t>{0x0a, 0x0b, 0x0c}), result.bytes);
}

TEST(Serial, I2cSendsAddressByteUnshifted)
{
  auto link = std::make_shared<FakeLink>();
  auto device = MakeDevice(link);

  link->responses.push_back(MakeResponse(0x3B, 12, std::vector<uint8_t>()));

  u3::I2cRequest request;
  request.address = 0x48;
  request.addressByte = 0x91;
  request.bytes = std::vector<uint8_t>{1, 2};
  u3::I2cResult result = device->I2c(request);

  EXPECT_EQ(0x91, link->written[0][10]);
  EXPECT_EQ(2, link->written[0][12]);
  EXPECT_EQ(4u, result.ackArray.size());
  EXPECT_TRUE(result.bytes.empty());
}

TEST(Serial, AsynchConfigComputesBaudFactor)
{
  auto link = std::make_shared<FakeLink>();
  auto device = MakeDevice(link);

  link->responses.push_back(MakeResponse(0x0B, 12,
        std::vector<uint8_t>{0, 0, 0x40, 0, 0x0f, 0}));
  link->responses.push_back(MakeResponse(0x14, 10,
        std::vector<uint8_t>{0, 0xc0, 0x3c, 0xf6}));

  u3::AsynchConfigResult config = device->AsynchConfig();

  ASSERT_EQ(2u, link->written.size());
  EXPECT_EQ(0x0b, link->written[0][3]);
  EXPECT_EQ(0x21, link->written[0][6]);

  std::vector<uint8_t> const &sent = link->written[1];
  EXPECT_EQ(0x14, sent[3]);
  EXPECT_EQ(0xc0, sent[7]);
  EXPECT_EQ(0x3c, sent[8]);
  EXPECT_EQ(0xf6, sent[9]);

  EXPECT_TRUE(config.update);
  EXPECT_TRUE(config.uartEnable);
  EXPECT_EQ(63036, config.baudFactor);
}

TEST(Serial, AsynchConfigOnOlderHardwareNeedsTimerClock)
{
  auto link = std::make_shared<FakeLink>();
  auto device = MakeDevice(link);

  u3::AsynchConfigRequest request;
  request.olderHardware = true;
  request.configurePins = false;
  link->forbidIo = true;
  EXPECT_THROW(device->AsynchConfig(request), u3::InvalidParameter);
  link->forbidIo = false;

  request.timerClockFrequency = 1000000;
  link->responses.push_back(MakeResponse(0x14, 10,
        std::vector<uint8_t>{0, 0xc0, 0, 152}));
  u3::AsynchConfigResult config = device->AsynchConfig(request);

  EXPECT_EQ(1u, link->written.size());
  EXPECT_EQ(152, link->written[0][9]);
  EXPECT_EQ(152, config.baudFactor);
}

TEST(Serial, AsynchTxPadsOddPayload)
{
  auto link = std::make_shared<FakeLink>();
  auto device = MakeDevice(link);

  link->responses.push_back(MakeResponse(0x15, 10,
        std::vector<uint8_t>{0, 3, 5}));
  u3::AsynchTxResult tx = device->AsynchTx(std::vector<uint8_t>{1, 2, 3});

  EXPECT_EQ((std::vector<uint8_t>{0, 3, 1, 2, 3, 0}),
      Tail(link->written[0], 6));
  EXPECT_EQ(3, tx.numAsynchBytesSent);
  EXPECT_EQ(5, tx.numAsynchBytesInRxBuffer);
}

TEST(Serial, AsynchRxReturnsBuffer)
{
  auto link = std::make_shared<FakeLink>();
  auto device = MakeDevice(link);

  link->responses.push_back(MakeResponse(0x16, 40,
        std::vector<uint8_t>{0, 2, 'o', 'k'}));
  u3::AsynchRxResult rx = device->AsynchRx(true);

  EXPECT_EQ(1, link->written[0][7]);
  EXPECT_EQ(2, rx.numAsynchBytesInRxBuffer);
  ASSERT_EQ(32u, rx.asynchBytes.size());
  EXPECT_EQ('o', rx.asynchBytes[0]);
  EXPECT_EQ('k', rx.asynchBytes[1]);
}

TEST(Serial, Sht1xConvertsReadings)
{
  auto link = std::make_shared<FakeLink>();
  auto device = MakeDevice(link);

  // Raw temperature 6400, raw humidity 1500.
  link->responses.push_back(MakeResponse(0x39, 16,
        std::vector<uint8_t>{0, 0, 0x07, 0x11, 0x00, 0x19, 0x22, 0xdc, 0x05,
        0x33}));
  u3::Sht1xResult sht = device->Sht1x();

  std::vector<uint8_t> const &sent = link->written[0];
  EXPECT_EQ(4, sent[6]);
  EXPECT_EQ(5, sent[7]);
  EXPECT_EQ(0xc0, sent[9]);

  double const temperature = -39.60 + 0.01 * 6400;
  double const humidity = (temperature - 25.0) * (0.01 + 0.00008 * 1500)
    + (-4.0 + 0.0405 * 1500 - 0.0000028 * 1500 * 1500);
  EXPECT_EQ(0x07, sht.statusReg);
  EXPECT_EQ(0x11, sht.statusRegCrc);
  EXPECT_NEAR(temperature, sht.temperature, 1e-9);
  EXPECT_EQ(0x22, sht.temperatureCrc);
  EXPECT_NEAR(humidity, sht.humidity, 1e-9);
  EXPECT_EQ(0x33, sht.humidityCrc);
}
