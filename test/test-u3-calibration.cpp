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

#include <cmath>
#include <limits>
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

}

TEST(Calibration, FallsBackToNominalConstants)
{
  EXPECT_DOUBLE_EQ(1248 * 0.000037231,
      u3::BinaryToCalibratedAnalogVoltage(nullptr, 1248));
  EXPECT_DOUBLE_EQ(1000 * 0.000074463 - 2.44,
      u3::BinaryToCalibratedAnalogVoltage(nullptr, 1000, true, false));
  EXPECT_DOUBLE_EQ(1000 * 0.000074463,
      u3::BinaryToCalibratedAnalogVoltage(nullptr, 1000, true, false, true));
  EXPECT_DOUBLE_EQ(1000 * 0.000314 - 10.3,
      u3::BinaryToCalibratedAnalogVoltage(nullptr, 1000, false, true, false,
        2));
  EXPECT_DOUBLE_EQ(1000 * 0.000074463 * (0.000314 / 0.000037231) - 10.3,
      u3::BinaryToCalibratedAnalogVoltage(nullptr, 1000, false, false, true,
        2));
  EXPECT_DOUBLE_EQ(22000 * 0.013021,
      u3::BinaryToCalibratedAnalogTemperature(nullptr, 22000));
}

TEST(Calibration, LoadedTableReplacesFallback)
{
  auto link = std::make_shared<FakeLink>();
  auto device = MakeDevice(link);

  EXPECT_EQ(nullptr, device->Calibration());
  EXPECT_DOUBLE_EQ(1248 * 0.000037231,
      device->BinaryToCalibratedAnalogVoltage(1248));

  u3::CalibrationInfo info;
  info.lvSESlope = 0.00005;
  info.lvSEOffset = 0.0;
  device->SetCalibrationData(info);

  ASSERT_NE(nullptr, device->Calibration());
  EXPECT_DOUBLE_EQ(1248 * 0.00005,
      device->BinaryToCalibratedAnalogVoltage(1248));
}

TEST(Calibration, RefusesHighVoltageDifferential)
{
  EXPECT_THROW(u3::BinaryToCalibratedAnalogVoltage(nullptr, 1000, false,
        false, false, 0), u3::UnsupportedChannelMode);

  u3::CalibrationInfo info;
  info.hasHighVoltage = true;
  EXPECT_THROW(u3::BinaryToCalibratedAnalogVoltage(&info, 1000, false,
        false, false, 0), u3::UnsupportedChannelMode);
}

TEST(Calibration, RejectsHighVoltageChannelAboveThree)
{
  EXPECT_THROW(u3::BinaryToCalibratedAnalogVoltage(nullptr, 1000, false,
        true, false, 4), u3::InvalidParameter);
}

TEST(Calibration, UsesPerChannelHighVoltageConstants)
{
  u3::CalibrationInfo info;
  info.hasHighVoltage = true;
  info.hvSlope[3] = 0.0003;
  info.hvOffset[3] = -10.0;
  EXPECT_DOUBLE_EQ(2000 * 0.0003 - 10.0,
      u3::BinaryToCalibratedAnalogVoltage(&info, 2000, false, true, false,
        3));

  // Without the high-voltage blocks the nominal constants apply.
  info.hasHighVoltage = false;
  EXPECT_DOUBLE_EQ(2000 * 0.000314 - 10.3,
      u3::BinaryToCalibratedAnalogVoltage(&info, 2000, false, true, false,
        3));
}

TEST(Calibration, ConvertsVoltageToDacBits)
{
  EXPECT_EQ(51, u3::VoltageToDacBits(nullptr, 1.0));
  EXPECT_EQ(13239, u3::VoltageToDacBits(nullptr, 1.0, 1, true));
  EXPECT_THROW(u3::VoltageToDacBits(nullptr, 1.0, 2), u3::InvalidParameter);

  u3::CalibrationInfo info;
  info.dacSlope[1] = 50.0;
  info.dacOffset[1] = 2.0;
  EXPECT_EQ(102, u3::VoltageToDacBits(&info, 2.0, 1));
}

TEST(Calibration, SaturatesDacBits)
{
  EXPECT_EQ(65535, u3::VoltageToDacBits(nullptr, 1.0e7, 0, true));
  EXPECT_EQ(255, u3::VoltageToDacBits(nullptr, 1.0e7));
  EXPECT_EQ(0, u3::VoltageToDacBits(nullptr, -1.0e7, 1, true));
  EXPECT_THROW(u3::VoltageToDacBits(nullptr, std::nan(""), 0, true),
      u3::InvalidParameter);
  EXPECT_THROW(u3::VoltageToDacBits(nullptr,
        std::numeric_limits<double>::infinity()), u3::InvalidParameter);
}

TEST(Calibration, DecodesBlocks)
{
  std::vector<uint8_t> block;
  AppendFixedPoint(block, 0.5);
  AppendFixedPoint(block, -1.5);
  AppendFixedPoint(block, 0.25);
  AppendFixedPoint(block, 2.0);

  double a;
  double b;
  double c;
  double d;
  u3::DecodeCalibrationBlock(block, &a, &b, &c, &d);
  EXPECT_DOUBLE_EQ(0.5, a);
  EXPECT_DOUBLE_EQ(-1.5, b);
  EXPECT_DOUBLE_EQ(0.25, c);
  EXPECT_DOUBLE_EQ(2.0, d);

  block.resize(31);
  EXPECT_THROW(u3::DecodeCalibrationBlock(block, &a, &b, &c, &d),
      u3::FramingError);
}

TEST(Calibration, ToleratesMissingHighVoltageBlocks)
{
  auto link = std::make_shared<FakeLink>();
  auto device = MakeDevice(link);

  link->responses.push_back(CalibrationResponse(0.5, 0.25, 1.5, -2.0));
  link->responses.push_back(CalibrationResponse(50.0, 1.0, 51.0, 2.0));
  link->responses.push_back(CalibrationResponse(0.25, 2.5, 1.5, 3.25));
  link->responses.push_back(MakeResponse(0x2D, 40,
        std::vector<uint8_t>{u3::kErrorInvalidBlock}));

  u3::CalibrationInfo const &info = device->GetCalibrationData();
  EXPECT_FALSE(info.hasHighVoltage);
  EXPECT_DOUBLE_EQ(0.5, info.lvSESlope);
  EXPECT_DOUBLE_EQ(0.25, info.lvSEOffset);
  EXPECT_DOUBLE_EQ(1.5, info.lvDiffSlope);
  EXPECT_DOUBLE_EQ(-2.0, info.lvDiffOffset);
  EXPECT_DOUBLE_EQ(51.0, info.dacSlope[1]);
  EXPECT_DOUBLE_EQ(0.25, info.tempSlope);
  EXPECT_DOUBLE_EQ(2.5, info.vRefAtCal);

  ASSERT_EQ(4u, link->written.size());
  for (uint32_t i = 0; i < 4; i++) {
    EXPECT_EQ(0x2d, link->written[i][3]);
    EXPECT_EQ(i, link->written[i][7]);
  }
  EXPECT_EQ(device->Calibration(), &info);
}

TEST(Calibration, PropagatesOtherBlockErrors)
{
  auto link = std::make_shared<FakeLink>();
  auto device = MakeDevice(link);

  link->responses.push_back(CalibrationResponse(0.5, 0.25, 1.5, -2.0));
  link->responses.push_back(CalibrationResponse(50.0, 1.0, 51.0, 2.0));
  link->responses.push_back(CalibrationResponse(0.25, 2.5, 1.5, 3.25));
  link->responses.push_back(MakeResponse(0x2D, 40,
        std::vector<uint8_t>{25}));

  EXPECT_THROW(device->GetCalibrationData(), u3::LowlevelError);
  EXPECT_EQ(nullptr, device->Calibration());
}

TEST(Calibration, LoadsHighVoltageBlocks)
{
  auto link = std::make_shared<FakeLink>();
  auto device = MakeDevice(link);

  link->responses.push_back(CalibrationResponse(0.5, 0.25, 1.5, -2.0));
  link->responses.push_back(CalibrationResponse(50.0, 1.0, 51.0, 2.0));
  link->responses.push_back(CalibrationResponse(0.25, 2.5, 1.5, 3.25));
  link->responses.push_back(CalibrationResponse(0.5, 0.25, 0.125, 0.75));
  link->responses.push_back(CalibrationResponse(-10.5, -10.25, -10.0,
        -9.75));

  u3::CalibrationInfo const &info = device->GetCalibrationData();
  EXPECT_TRUE(info.hasHighVoltage);
  EXPECT_DOUBLE_EQ(0.125, info.hvSlope[2]);
  EXPECT_DOUBLE_EQ(-9.75, info.hvOffset[3]);
}
