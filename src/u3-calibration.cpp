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

#include <cmath>

#include "u3-calibration.hpp"
#include "u3-errors.hpp"
#include "u3-packet.hpp"

namespace u3 {

void DecodeCalibrationBlock(std::vector<uint8_t> const &a_block,
    double *a_first, double *a_second, double *a_third, double *a_fourth)
{
  if (a_block.size() < 32) {
    throw FramingError("Calibration block too short.", 32, a_block.size());
  }
  *a_first = ToDouble(a_block.data());
  *a_second = ToDouble(a_block.data() + 8);
  *a_third = ToDouble(a_block.data() + 16);
  *a_fourth = ToDouble(a_block.data() + 24);
}

double BinaryToCalibratedAnalogVoltage(CalibrationInfo const *a_cal,
    uint32_t a_bits, bool a_is_low_voltage, bool a_is_single_ended,
    bool a_is_special_setting, uint8_t a_channel_number)
{
  double const bits = (double) a_bits;

  if (a_is_low_voltage) {
    if (a_is_single_ended && !a_is_special_setting) {
      if (a_cal != nullptr) {
        return bits * a_cal->lvSESlope + a_cal->lvSEOffset;
      }
      return bits * kNominalLvSESlope;
    } else if (a_is_special_setting) {
      if (a_cal != nullptr) {
        return bits * a_cal->lvDiffSlope + a_cal->lvDiffOffset
          + a_cal->vRefAtCal;
      }
      return bits * kNominalLvDiffSlope;
    } else {
      if (a_cal != nullptr) {
        return bits * a_cal->lvDiffSlope + a_cal->lvDiffOffset;
      }
      return bits * kNominalLvDiffSlope + kNominalLvDiffOffset;
    }
  }

  if (a_is_single_ended || a_is_special_setting) {
    if (a_channel_number > 3) {
      throw InvalidParameter("High-voltage channels are AIN0-AIN3, got "
          + std::to_string(a_channel_number) + ".");
    }
  }

  bool const hasHvCal = (a_cal != nullptr && a_cal->hasHighVoltage);
  if (a_is_single_ended && !a_is_special_setting) {
    if (hasHvCal) {
      return bits * a_cal->hvSlope[a_channel_number]
        + a_cal->hvOffset[a_channel_number];
    }
    return bits * kNominalHvSlope + kNominalHvOffset;
  } else if (a_is_special_setting) {
    if (hasHvCal) {
      double const diff = bits * a_cal->lvDiffSlope + a_cal->lvDiffOffset
        + a_cal->vRefAtCal;
      return diff * a_cal->hvSlope[a_channel_number] / a_cal->lvSESlope
        + a_cal->hvOffset[a_channel_number];
    }
    return bits * kNominalLvDiffSlope * (kNominalHvSlope / kNominalLvSESlope)
      + kNominalHvOffset;
  }

  throw UnsupportedChannelMode(
      "Differential readings are not possible on high-voltage channels.");
}

double BinaryToCalibratedAnalogTemperature(CalibrationInfo const *a_cal,
    uint32_t a_bits)
{
  if (a_cal != nullptr) {
    return a_cal->tempSlope * (double) a_bits;
  }
  return (double) a_bits * kNominalTempSlope;
}

int32_t VoltageToDacBits(CalibrationInfo const *a_cal, double a_volts,
    uint8_t a_dac, bool a_is_16_bits)
{
  if (a_dac != 0 && a_dac != 1) {
    throw InvalidParameter("DAC should be either 0 or 1.");
  }
  if (!std::isfinite(a_volts)) {
    throw InvalidParameter("DAC voltage must be a finite number.");
  }

  double bits;
  if (a_cal != nullptr) {
    bits = a_volts * a_cal->dacSlope[a_dac] + a_cal->dacOffset[a_dac];
  } else {
    bits = a_volts * kNominalDacSlope;
  }

  if (a_is_16_bits) {
    bits *= 256;
  }

  // Saturate at the DAC range.
  double const maxBits = a_is_16_bits ? 65535.0 : 255.0;
  if (bits < 0.0) {
    bits = 0.0;
  } else if (bits > maxBits) {
    bits = maxBits;
  }

  return (int32_t) bits;
}

}
