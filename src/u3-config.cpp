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

#include <cstdio>

#include "u3.hpp"
#include "u3-packet.hpp"

namespace u3 {

namespace {

std::string VersionToString(uint8_t a_major, uint8_t a_minor)
{
  char buffer[16];
  snprintf(buffer, sizeof(buffer), "%d.%02d", a_major, a_minor);
  return std::string(buffer);
}

template <typename T>
void Put(std::vector<uint8_t> &a_payload, uint32_t a_index,
    Setting<T> const &a_setting)
{
  if (a_setting.isSet) {
    a_payload[a_index] = (uint8_t) a_setting.value;
  }
}

}

DeviceState U3::ConfigU3(ConfigU3Request const &a_request)
{
  uint8_t writeMask = 0;
  if (a_request.fioAnalog.isSet || a_request.fioDirection.isSet
      || a_request.fioState.isSet || a_request.eioAnalog.isSet
      || a_request.eioDirection.isSet || a_request.eioState.isSet
      || a_request.cioDirection.isSet || a_request.cioState.isSet) {
    writeMask |= 2;
  }
  if (a_request.dac1Enable.isSet || a_request.dac0.isSet
      || a_request.dac1.isSet) {
    writeMask |= 4;
  }
  if (a_request.localId.isSet) {
    writeMask |= 8;
  }
  if (a_request.timerClockConfig.isSet || a_request.timerClockDivisor.isSet) {
    writeMask |= 16;
  }
  if (a_request.compatibilityOptions.isSet) {
    writeMask |= 32;
  }

  // Payload offsets are command offsets minus the six header bytes.
  std::vector<uint8_t> payload(20, 0);
  payload[0] = writeMask;
  Put(payload, 2, a_request.localId);
  Put(payload, 3, a_request.timerCounterConfig);
  Put(payload, 4, a_request.fioAnalog);
  Put(payload, 5, a_request.fioDirection);
  Put(payload, 6, a_request.fioState);
  Put(payload, 7, a_request.eioAnalog);
  Put(payload, 8, a_request.eioDirection);
  Put(payload, 9, a_request.eioState);
  Put(payload, 10, a_request.cioDirection);
  Put(payload, 11, a_request.cioState);
  Put(payload, 12, a_request.dac1Enable);
  Put(payload, 13, a_request.dac0);
  Put(payload, 14, a_request.dac1);
  Put(payload, 15, a_request.timerClockConfig);
  Put(payload, 16, a_request.timerClockDivisor);
  Put(payload, 17, a_request.compatibilityOptions);

  std::vector<uint8_t> result = WriteRead(BuildExtendedCommand(0x08, payload),
      38, ExpectedExtendedHeader(0x08, 38));

  DeviceState state(m_state);
  state.firmwareVersion = VersionToString(result[10], result[9]);
  state.bootloaderVersion = VersionToString(result[12], result[11]);
  state.hardwareVersion = VersionToString(result[14], result[13]);
  state.serialNumber = ToUint32(result.data() + 15);
  state.productId = ToUint16(result.data() + 19);
  state.localId = result[21];
  state.timerCounterConfig = result[22];
  state.numberOfTimersEnabled = result[22] & 3;
  state.counter0Enabled = ((result[22] >> 2) & 1) != 0;
  state.counter1Enabled = ((result[22] >> 3) & 1) != 0;
  state.timerCounterPinOffset = result[22] >> 4;
  state.fioAnalog = result[23];
  state.fioDirection = result[24];
  state.fioState = result[25];
  state.eioAnalog = result[26];
  state.eioDirection = result[27];
  state.eioState = result[28];
  state.cioDirection = result[29];
  state.cioState = result[30];
  state.dac1Enable = result[31];
  state.dac0 = result[32];
  state.dac1 = result[33];
  state.timerClockConfig = result[34];
  state.timerClockBase = result[34] & 7;
  state.timerClockDivisor = (result[35] == 0) ? 256 : result[35];
  state.compatibilityOptions = result[36];
  state.versionInfo = result[37];

  state.deviceName = "U3";
  if (state.versionInfo == 1) {
    state.deviceName += "B";
  } else if (state.versionInfo == 2) {
    state.deviceName += "-LV";
  } else if (state.versionInfo == 18) {
    state.deviceName += "-HV";
  }

  m_state = state;
  return m_state;
}

ConfigIoResult U3::ConfigIo(ConfigIoRequest const &a_request)
{
  bool const timerCounterSet = a_request.timerCounterPinOffset.isSet
    || a_request.enableCounter1.isSet || a_request.enableCounter0.isSet
    || a_request.numberOfTimersEnabled.isSet;

  uint8_t writeMask = 0;
  if (timerCounterSet) {
    writeMask |= 1;
  }
  if (a_request.fioAnalog.isSet) {
    writeMask |= 4;
  }
  if (a_request.eioAnalog.isSet) {
    writeMask |= 8;
  }
  if (a_request.enableUart.isSet) {
    // The UART pins follow the timer/counter pin offset.
    writeMask |= 1;
    writeMask |= (1 << 5);
  }

  uint8_t timerCounterConfig = 0;
  if (a_request.timerCounterPinOffset.isSet) {
    timerCounterConfig |= (a_request.timerCounterPinOffset.value & 15) << 4;
  } else {
    timerCounterConfig |= (4 & 15) << 4;
  }
  if (a_request.enableCounter1.isSet && a_request.enableCounter1.value) {
    timerCounterConfig |= 1 << 3;
  }
  if (a_request.enableCounter0.isSet && a_request.enableCounter0.value) {
    timerCounterConfig |= 1 << 2;
  }
  if (a_request.numberOfTimersEnabled.isSet) {
    timerCounterConfig |= a_request.numberOfTimersEnabled.value & 3;
  }

  std::vector<uint8_t> payload(6, 0);
  payload[0] = writeMask;
  payload[2] = timerCounterConfig;
  if (a_request.enableUart.isSet) {
    payload[3] = (uint8_t) (a_request.enableUart.value << 2);
  }
  Put(payload, 4, a_request.fioAnalog);
  Put(payload, 5, a_request.eioAnalog);

  std::vector<uint8_t> result = WriteRead(BuildExtendedCommand(0x0B, payload),
      12, ExpectedExtendedHeader(0x0B, 12));

  ConfigIoResult config;
  config.timerCounterConfig = result[8];
  config.numberOfTimersEnabled = result[8] & 3;
  config.enableCounter0 = ((result[8] >> 2) & 1) != 0;
  config.enableCounter1 = ((result[8] >> 3) & 1) != 0;
  config.timerCounterPinOffset = result[8] >> 4;
  config.dac1Enable = result[9];
  config.fioAnalog = result[10];
  config.eioAnalog = result[11];

  ApplyConfigIo(config);
  return config;
}

void U3::ApplyConfigIo(ConfigIoResult const &a_config)
{
  m_state.timerCounterConfig = a_config.timerCounterConfig;
  m_state.numberOfTimersEnabled = a_config.numberOfTimersEnabled;
  m_state.counter0Enabled = a_config.enableCounter0;
  m_state.counter1Enabled = a_config.enableCounter1;
  m_state.timerCounterPinOffset = a_config.timerCounterPinOffset;
  m_state.dac1Enable = a_config.dac1Enable;
  m_state.fioAnalog = a_config.fioAnalog;
  m_state.eioAnalog = a_config.eioAnalog;
}

TimerClockResult U3::ConfigTimerClock(Setting<uint8_t> a_timer_clock_base,
    Setting<uint8_t> a_timer_clock_divisor)
{
  std::vector<uint8_t> payload(4, 0);
  if (a_timer_clock_base.isSet) {
    payload[2] = (uint8_t) ((1 << 7) + (a_timer_clock_base.value & 7));
    if (a_timer_clock_divisor.isSet) {
      payload[3] = a_timer_clock_divisor.value;
    }
  } else if (a_timer_clock_divisor.isSet) {
    throw InvalidParameter("You can't set just the divisor, must set both.");
  }

  std::vector<uint8_t> result = WriteRead(BuildExtendedCommand(0x0A, payload),
      10, ExpectedExtendedHeader(0x0A, 10));

  TimerClockResult clock;
  clock.timerClockBase = result[8] & 7;
  clock.timerClockDivisor = result[9];

  m_state.timerClockBase = clock.timerClockBase;
  m_state.timerClockDivisor = (clock.timerClockDivisor == 0) ? 256
    : clock.timerClockDivisor;
  return clock;
}

ConfigIoResult U3::ConfigAnalog(std::vector<uint8_t> const &a_lines)
{
  ConfigIoResult current = ConfigIo();
  if (a_lines.empty()) {
    return current;
  }

  uint8_t fioAnalog = current.fioAnalog;
  uint8_t eioAnalog = current.eioAnalog;
  for (uint8_t line : a_lines) {
    if (line > EIO7) {
      continue;
    } else if (line < EIO0) {
      fioAnalog |= (uint8_t) (1 << line);
    } else {
      eioAnalog |= (uint8_t) (1 << (line - EIO0));
    }
  }

  ConfigIoRequest request;
  request.fioAnalog = fioAnalog;
  request.eioAnalog = eioAnalog;
  return ConfigIo(request);
}

ConfigIoResult U3::ConfigDigital(std::vector<uint8_t> const &a_lines)
{
  ConfigIoResult current = ConfigIo();
  if (a_lines.empty()) {
    return current;
  }

  uint8_t fioAnalog = current.fioAnalog;
  uint8_t eioAnalog = current.eioAnalog;
  for (uint8_t line : a_lines) {
    if (line > EIO7) {
      continue;
    } else if (line < EIO0) {
      fioAnalog &= (uint8_t) ~(1 << line);
    } else {
      eioAnalog &= (uint8_t) ~(1 << (line - EIO0));
    }
  }

  ConfigIoRequest request;
  request.fioAnalog = fioAnalog;
  request.eioAnalog = eioAnalog;
  return ConfigIo(request);
}

void U3::SetDefaults(bool a_set_to_factory_defaults)
{
  std::vector<uint8_t> payload{0xBA, 0x26};
  if (a_set_to_factory_defaults) {
    payload = {0x82, 0xC7};
  }
  WriteRead(BuildExtendedCommand(0x0E, payload), 8,
      ExpectedExtendedHeader(0x0E, 8));
}

std::vector<uint8_t> U3::ReadDefaults(uint8_t a_block_num,
    bool a_read_current)
{
  if (a_block_num > 7) {
    throw InvalidParameter("Defaults must be in range 0-7.");
  }

  uint8_t const byte7 = (uint8_t) ((a_read_current << 7) + a_block_num);
  std::vector<uint8_t> result = WriteRead(
      BuildExtendedCommand(0x0E, std::vector<uint8_t>{0x00, byte7}), 40,
      ExpectedExtendedHeader(0x0E, 40));
  return std::vector<uint8_t>(result.begin() + 8, result.end());
}

DefaultsConfig U3::ReadDefaultsConfig()
{
  DefaultsConfig config;

  std::vector<uint8_t> defaults = ReadDefaults(0);
  config.fioDirection = defaults[4];
  config.fioState = defaults[5];
  config.fioAnalog = defaults[6];
  config.eioDirection = defaults[8];
  config.eioState = defaults[9];
  config.eioAnalog = defaults[10];
  config.cioDirection = defaults[12];
  config.cioState = defaults[13];
  config.numOfTimersEnable = defaults[17];
  config.counterMask = defaults[18];
  config.pinOffset = defaults[19];
  config.options = defaults[20];

  defaults = ReadDefaults(1);
  config.clockSource = defaults[0];
  config.divisor = defaults[1];
  config.tmr0Mode = defaults[16];
  config.tmr0ValueL = defaults[17];
  config.tmr0ValueH = defaults[18];
  config.tmr1Mode = defaults[20];
  config.tmr1ValueL = defaults[21];
  config.tmr1ValueH = defaults[22];

  // Stored big endian.
  defaults = ReadDefaults(2);
  config.dac0 = (uint16_t) ((defaults[16] << 8) + defaults[17]);
  config.dac1 = (uint16_t) ((defaults[20] << 8) + defaults[21]);

  defaults = ReadDefaults(3);
  for (uint32_t i = 0; i < 16; i++) {
    config.ainNegChannel[i] = defaults[i];
  }

  return config;
}

WatchdogResult U3::Watchdog(WatchdogRequest const &a_request)
{
  std::vector<uint8_t> payload(10, 0);
  if (!a_request.onlyRead) {
    payload[0] = 1;
  }
  if (a_request.resetOnTimeout) {
    payload[1] |= 1 << 5;
  }
  if (a_request.setDioStateOnTimeout) {
    payload[1] |= 1 << 4;
  }
  payload[2] = (uint8_t) (a_request.timeoutPeriod & 0xFF);
  payload[3] = (uint8_t) (a_request.timeoutPeriod >> 8);
  payload[4] = (uint8_t) (((a_request.dioState & 1) << 7)
      + (a_request.dioNumber & 15));

  std::vector<uint8_t> result = WriteRead(BuildExtendedCommand(0x09, payload),
      16, ExpectedExtendedHeader(0x09, 16));

  WatchdogResult status;
  if (result[7] == 0 || result[7] == 255) {
    status.watchdogEnabled = false;
    status.resetOnTimeout = false;
    status.setDioStateOnTimeout = false;
  } else {
    status.watchdogEnabled = true;
    status.resetOnTimeout = ((result[7] >> 5) & 1) != 0;
    status.setDioStateOnTimeout = ((result[7] >> 4) & 1) != 0;
  }
  status.timeoutPeriod = ToUint16(result.data() + 8);
  status.dioState = (result[10] >> 7) & 1;
  status.dioNumber = result[10] & 15;
  return status;
}

}
