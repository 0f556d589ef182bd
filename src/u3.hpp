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

#ifndef LABJACK_U3_HPP
#define LABJACK_U3_HPP

#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "u3-calibration.hpp"
#include "u3-errors.hpp"
#include "u3-feedback.hpp"
#include "u3-transport.hpp"

namespace u3 {

// A request field that is only sent, and only sets its write mask bit, when
// it has been assigned.
template <typename T>
struct Setting {
  Setting():
      isSet(false),
      value()
  {
  }

  Setting(T const &a_value):
      isSet(true),
      value(a_value)
  {
  }

  bool isSet;
  T value;
};

struct ConfigU3Request {
  Setting<uint8_t> localId;
  Setting<uint8_t> timerCounterConfig;
  Setting<uint8_t> fioAnalog;
  Setting<uint8_t> fioDirection;
  Setting<uint8_t> fioState;
  Setting<uint8_t> eioAnalog;
  Setting<uint8_t> eioDirection;
  Setting<uint8_t> eioState;
  Setting<uint8_t> cioDirection;
  Setting<uint8_t> cioState;
  Setting<uint8_t> dac1Enable;
  Setting<uint8_t> dac0;
  Setting<uint8_t> dac1;
  Setting<uint8_t> timerClockConfig;
  Setting<uint8_t> timerClockDivisor;
  Setting<uint8_t> compatibilityOptions;
};

struct ConfigIoRequest {
  Setting<uint8_t> timerCounterPinOffset;
  Setting<bool> enableCounter1;
  Setting<bool> enableCounter0;
  Setting<uint8_t> numberOfTimersEnabled;
  Setting<uint8_t> fioAnalog;
  Setting<uint8_t> eioAnalog;
  Setting<bool> enableUart;
};

struct ConfigIoResult {
  uint8_t timerCounterConfig;
  uint8_t dac1Enable;
  uint8_t fioAnalog;
  uint8_t eioAnalog;
  uint8_t numberOfTimersEnabled;
  bool enableCounter0;
  bool enableCounter1;
  uint8_t timerCounterPinOffset;
};

struct TimerClockResult {
  uint8_t timerClockBase;
  uint8_t timerClockDivisor;
};

struct StreamConfigRequest {
  StreamConfigRequest():
      samplesPerPacket(25),
      internalStreamClockFrequency(0),
      divideClockBy256(false),
      resolution(3),
      scanInterval(1),
      pChannels{30},
      nChannels{31},
      scanFrequency()
  {
  }

  uint32_t samplesPerPacket;
  uint8_t internalStreamClockFrequency;
  bool divideClockBy256;
  uint8_t resolution;
  uint32_t scanInterval;
  std::vector<uint8_t> pChannels;
  std::vector<uint8_t> nChannels;

  // When set, overrides the clock fields above.
  Setting<double> scanFrequency;
};

// Decoded samples keyed by "AIN<channel>". Channels 193 and 194 are kept as
// raw byte pairs, everything else as a number.
struct StreamSamples {
  std::map<std::string, std::vector<double>> values;
  std::map<std::string, std::vector<std::array<uint8_t, 2>>> bytePairs;
};

struct StreamDataResult {
  uint32_t numPackets;
  uint32_t errors;
  uint32_t missed;
  uint8_t firstPacket;
  std::vector<uint8_t> result;
  StreamSamples samples;
};

struct WatchdogRequest {
  WatchdogRequest():
      resetOnTimeout(false),
      setDioStateOnTimeout(false),
      timeoutPeriod(60),
      dioState(0),
      dioNumber(0),
      onlyRead(false)
  {
  }

  bool resetOnTimeout;
  bool setDioStateOnTimeout;
  uint16_t timeoutPeriod;
  uint8_t dioState;
  uint8_t dioNumber;
  bool onlyRead;
};

struct WatchdogResult {
  bool watchdogEnabled;
  bool resetOnTimeout;
  bool setDioStateOnTimeout;
  uint16_t timeoutPeriod;
  uint8_t dioState;
  uint8_t dioNumber;
};

struct SpiRequest {
  SpiRequest():
      bytes(),
      autoCs(true),
      disableDirConfig(false),
      spiMode('A'),
      spiClockFactor(0),
      csPinNum(4),
      clkPinNum(5),
      misoPinNum(6),
      mosiPinNum(7)
  {
  }

  std::vector<uint8_t> bytes;
  bool autoCs;
  bool disableDirConfig;
  char spiMode;
  uint8_t spiClockFactor;
  uint8_t csPinNum;
  uint8_t clkPinNum;
  uint8_t misoPinNum;
  uint8_t mosiPinNum;
};

struct AsynchConfigRequest {
  AsynchConfigRequest():
      update(true),
      uartEnable(true),
      desiredBaud(9600),
      olderHardware(false),
      configurePins(true),
      timerClockFrequency()
  {
  }

  bool update;
  bool uartEnable;
  uint32_t desiredBaud;
  bool olderHardware;
  bool configurePins;

  // Timer clock in Hz, required for the 8-bit baud factor of hardware 1.21.
  Setting<uint32_t> timerClockFrequency;
};

struct AsynchConfigResult {
  bool update;
  bool uartEnable;
  uint16_t baudFactor;
};

struct AsynchTxResult {
  uint8_t numAsynchBytesSent;
  uint8_t numAsynchBytesInRxBuffer;
};

struct AsynchRxResult {
  std::vector<uint8_t> asynchBytes;
  uint8_t numAsynchBytesInRxBuffer;
};

struct I2cRequest {
  I2cRequest():
      address(0),
      bytes(),
      enableClockStretching(false),
      noStopWhenRestarting(false),
      resetAtStart(false),
      speedAdjust(0),
      sdaPinNum(6),
      sclPinNum(7),
      numI2cBytesToReceive(0),
      addressByte()
  {
  }

  uint8_t address;
  std::vector<uint8_t> bytes;
  bool enableClockStretching;
  bool noStopWhenRestarting;
  bool resetAtStart;
  uint8_t speedAdjust;
  uint8_t sdaPinNum;
  uint8_t sclPinNum;
  uint8_t numI2cBytesToReceive;

  // Sent as is instead of the shifted address.
  Setting<uint8_t> addressByte;
};

struct I2cResult {
  std::vector<uint8_t> ackArray;
  std::vector<uint8_t> bytes;
};

struct Sht1xResult {
  uint8_t statusReg;
  uint8_t statusRegCrc;
  double temperature;
  uint8_t temperatureCrc;
  double humidity;
  uint8_t humidityCrc;
};

struct DefaultsConfig {
  uint8_t fioDirection;
  uint8_t fioState;
  uint8_t fioAnalog;
  uint8_t eioDirection;
  uint8_t eioState;
  uint8_t eioAnalog;
  uint8_t cioDirection;
  uint8_t cioState;
  uint8_t numOfTimersEnable;
  uint8_t counterMask;
  uint8_t pinOffset;
  uint8_t options;
  uint8_t clockSource;
  uint8_t divisor;
  uint8_t tmr0Mode;
  uint8_t tmr0ValueL;
  uint8_t tmr0ValueH;
  uint8_t tmr1Mode;
  uint8_t tmr1ValueL;
  uint8_t tmr1ValueH;
  uint16_t dac0;
  uint16_t dac1;
  std::array<uint8_t, 16> ainNegChannel;
};

// Last known device configuration, refreshed only from successful responses.
struct DeviceState {
  DeviceState():
      firmwareVersion(),
      bootloaderVersion(),
      hardwareVersion(),
      serialNumber(0),
      productId(0),
      localId(0),
      timerCounterConfig(0),
      numberOfTimersEnabled(0),
      counter0Enabled(false),
      counter1Enabled(false),
      timerCounterPinOffset(0),
      fioAnalog(0),
      fioDirection(0),
      fioState(0),
      eioAnalog(0),
      eioDirection(0),
      eioState(0),
      cioDirection(0),
      cioState(0),
      dac1Enable(0),
      dac0(0),
      dac1(0),
      timerClockConfig(0),
      timerClockBase(0),
      timerClockDivisor(0),
      compatibilityOptions(0),
      versionInfo(0),
      deviceName("U3"),
      ledState(true)
  {
  }

  std::string firmwareVersion;
  std::string bootloaderVersion;
  std::string hardwareVersion;
  uint32_t serialNumber;
  uint16_t productId;
  uint8_t localId;
  uint8_t timerCounterConfig;
  uint8_t numberOfTimersEnabled;
  bool counter0Enabled;
  bool counter1Enabled;
  uint8_t timerCounterPinOffset;
  uint8_t fioAnalog;
  uint8_t fioDirection;
  uint8_t fioState;
  uint8_t eioAnalog;
  uint8_t eioDirection;
  uint8_t eioState;
  uint8_t cioDirection;
  uint8_t cioState;
  uint8_t dac1Enable;
  uint8_t dac0;
  uint8_t dac1;
  uint8_t timerClockConfig;
  uint8_t timerClockBase;
  uint16_t timerClockDivisor;
  uint8_t compatibilityOptions;
  uint8_t versionInfo;
  std::string deviceName;
  bool ledState;
};

/*
 * One open U3. Every call performs complete blocking request/response
 * exchanges over the owned transport and is not safe for concurrent use;
 * callers sharing a device across threads must serialize access themselves.
 */
class U3 {
 public:
  U3(std::unique_ptr<Transport>, bool = false);
  virtual ~U3();

  std::vector<uint8_t> WriteRead(std::vector<uint8_t>, uint32_t,
      std::vector<uint8_t> const &, bool = true, bool = true);
  std::vector<FeedbackResult> GetFeedback(FeedbackList const &);

  DeviceState ConfigU3(ConfigU3Request const & = ConfigU3Request());
  ConfigIoResult ConfigIo(ConfigIoRequest const & = ConfigIoRequest());
  TimerClockResult ConfigTimerClock(Setting<uint8_t> = Setting<uint8_t>(),
      Setting<uint8_t> = Setting<uint8_t>());
  ConfigIoResult ConfigAnalog(std::vector<uint8_t> const &);
  ConfigIoResult ConfigDigital(std::vector<uint8_t> const &);

  void ToggleLed();
  void SetFioState(uint8_t, bool = true);
  bool GetFioState(uint8_t);
  void SetDoState(uint8_t, bool = true);
  bool GetDiState(uint8_t);
  bool GetDioState(uint8_t);
  double GetTemperature();
  double GetAin(uint8_t, uint8_t = 31, bool = false, bool = false);

  std::vector<uint8_t> ReadMem(uint8_t, bool = false);
  std::vector<uint8_t> ReadCal(uint8_t);
  void WriteMem(uint8_t, std::vector<uint8_t> const &, bool = false);
  void WriteCal(uint8_t, std::vector<uint8_t> const &);
  void EraseMem(bool = false);
  void EraseCal();
  void Reset(bool = false);
  void SetDefaults(bool = false);
  std::vector<uint8_t> ReadDefaults(uint8_t, bool = false);
  DefaultsConfig ReadDefaultsConfig();

  void StreamConfig(StreamConfigRequest const &);
  void StreamStart();
  void StreamStop();
  StreamDataResult StreamData(bool = true);
  StreamSamples ProcessStreamData(std::vector<uint8_t> const &,
      uint32_t = 0);
  uint32_t PacketsPerRequest() const;

  WatchdogResult Watchdog(WatchdogRequest const & = WatchdogRequest());
  std::vector<uint8_t> Spi(SpiRequest const &);
  AsynchConfigResult AsynchConfig(
      AsynchConfigRequest const & = AsynchConfigRequest());
  AsynchTxResult AsynchTx(std::vector<uint8_t> const &);
  AsynchRxResult AsynchRx(bool = false);
  I2cResult I2c(I2cRequest const &);
  Sht1xResult Sht1x(uint8_t = 4, uint8_t = 5, uint8_t = 0xC0);

  CalibrationInfo const &GetCalibrationData();
  void SetCalibrationData(CalibrationInfo const &);
  CalibrationInfo const *Calibration() const;
  double BinaryToCalibratedAnalogVoltage(uint32_t, bool = true, bool = true,
      bool = false, uint8_t = 0) const;
  double BinaryToCalibratedAnalogTemperature(uint32_t) const;
  int32_t VoltageToDacBits(double, uint8_t = 0, bool = false) const;

  DeviceState const &State() const;
  bool IsHighVoltageChannel(uint8_t) const;

 private:
  U3(U3 const &);
  U3 &operator=(U3 const &);

  std::vector<uint8_t> WriteReadSimple(std::vector<uint8_t> const &,
      uint32_t);
  void ApplyConfigIo(ConfigIoResult const &);

  std::unique_ptr<Transport> m_transport;
  std::unique_ptr<CalibrationInfo> m_calibration_info;
  DeviceState m_state;
  bool m_debug;
  bool m_stream_configured;
  bool m_stream_started;
  uint32_t m_stream_samples_per_packet;
  std::vector<uint8_t> m_stream_channel_numbers;
  std::vector<uint8_t> m_stream_neg_channels;
  uint32_t m_packets_per_request;
  uint32_t m_stream_packet_offset;
};

}

#endif
