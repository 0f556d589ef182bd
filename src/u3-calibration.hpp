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

#ifndef LABJACK_U3_CALIBRATION_HPP
#define LABJACK_U3_CALIBRATION_HPP

#include <cstdint>
#include <vector>

namespace u3 {

/* nominal constants used when no calibration has been read */

double const kNominalLvSESlope = 0.000037231;
double const kNominalLvDiffSlope = 0.000074463;
double const kNominalLvDiffOffset = -2.44;
double const kNominalHvSlope = 0.000314;
double const kNominalHvOffset = -10.3;
double const kNominalTempSlope = 0.013021;
double const kNominalDacSlope = 51.717;

// Factory constants from the calibration memory, blocks 0-4.
struct CalibrationInfo {
  CalibrationInfo():
      lvSESlope(0.0),
      lvSEOffset(0.0),
      lvDiffSlope(0.0),
      lvDiffOffset(0.0),
      dacSlope(),
      dacOffset(),
      tempSlope(0.0),
      vRefAtCal(0.0),
      vRef15AtCal(0.0),
      vRegAtCal(0.0),
      hasHighVoltage(false),
      hvSlope(),
      hvOffset()
  {
  }

  double lvSESlope;
  double lvSEOffset;
  double lvDiffSlope;
  double lvDiffOffset;
  double dacSlope[2];
  double dacOffset[2];
  double tempSlope;
  double vRefAtCal;
  double vRef15AtCal;
  double vRegAtCal;

  // Blocks 3 and 4 are missing on hardware revisions older than 1.30.
  bool hasHighVoltage;
  double hvSlope[4];
  double hvOffset[4];
};

void DecodeCalibrationBlock(std::vector<uint8_t> const &, double *, double *,
    double *, double *);

/*
 * A null calibration selects the nominal constants. Special range is the
 * 0-3.6 V single-ended setting (negative channel 30). High-voltage
 * differential is not measurable and throws UnsupportedChannelMode.
 */
double BinaryToCalibratedAnalogVoltage(CalibrationInfo const *, uint32_t,
    bool = true, bool = true, bool = false, uint8_t = 0);

// Kelvin.
double BinaryToCalibratedAnalogTemperature(CalibrationInfo const *,
    uint32_t);

// Saturates at 0..255, or 0..65535 for 16 bit writes.
int32_t VoltageToDacBits(CalibrationInfo const *, double, uint8_t = 0,
    bool = false);

}

#endif
