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

#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "cluon-complete.hpp"
#include "opendlv-message-set-daq.hpp"
#include "u3.hpp"

static void PrintUsage(char const *a_name)
{
  std::cerr << a_name
    << " interfaces to a LabJack U3 data acquisition device through an "
    << "LJSocket server using TCP." << std::endl;
  std::cerr << "Usage:   " << a_name
    << " --ip=<IP address of the LJSocket server> "
    << "--port=<The LJSocket server port, default 6000> "
    << "--serial=<Serial number or local id, default first U3 found> "
    << "--freq=<Polling frequency, default 10> "
    << "--channels=<Comma separated AIN channels 0-15 or 30, default 0> "
    << "--id=<Sender stamp offset, default 0> "
    << "--cid=<OpenDLV session> [--verbose]" << std::endl;
  std::cerr << "Example: " << a_name
    << " --ip=127.0.0.1 --channels=0,1,2 --cid=111" << std::endl;
}

int32_t main(int32_t argc, char **argv) {
  int32_t retCode{0};
  auto commandlineArguments = cluon::getCommandlineArguments(argc, argv);
  if (0 == commandlineArguments.count("cid")
      || 0 == commandlineArguments.count("ip")) {
    PrintUsage(argv[0]);
    retCode = 1;
  } else {
    bool const VERBOSE{commandlineArguments.count("verbose") != 0};
    uint16_t const CID = std::stoi(commandlineArguments["cid"]);

    int32_t const PORT{(commandlineArguments["port"].size() != 0)
      ? std::stoi(commandlineArguments["port"]) : u3::kLjSocketServerPort};
    int64_t const SERIAL{(commandlineArguments["serial"].size() != 0)
      ? std::stoll(commandlineArguments["serial"]) : -1};
    float const FREQ{(commandlineArguments["freq"].size() != 0)
      ? std::stof(commandlineArguments["freq"]) : 10.0f};
    uint32_t const ID{(commandlineArguments["id"].size() != 0)
      ? static_cast<uint32_t>(std::stoi(commandlineArguments["id"])) : 0};

    std::vector<uint8_t> channels;
    {
      std::string const channelList{
        (commandlineArguments["channels"].size() != 0)
          ? commandlineArguments["channels"] : "0"};
      try {
        channels = u3::ParseAinChannelList(channelList);
      } catch (u3::InvalidParameter const &e) {
        std::cerr << e.what() << std::endl;
        PrintUsage(argv[0]);
        return 1;
      }
    }

    std::string const IP = commandlineArguments["ip"];

    std::unique_ptr<u3::U3> device;
    try {
      u3::LjSocketDevice const ljSocketDevice = u3::SelectLjSocketDevice(
          u3::TcpTransport::Scan(IP, PORT), u3::kU3ProductId, SERIAL);
      std::unique_ptr<u3::Transport> transport(
          new u3::TcpTransport(IP, ljSocketDevice));
      device.reset(new u3::U3(std::move(transport), VERBOSE));

      u3::DeviceState const state = device->ConfigU3();
      device->GetCalibrationData();

      std::vector<uint8_t> analogLines;
      for (uint8_t channel : channels) {
        if (channel < 16) {
          analogLines.push_back(channel);
        }
      }
      if (!analogLines.empty()) {
        device->ConfigAnalog(analogLines);
      }

      if (VERBOSE) {
        std::cout << "Connected to " << state.deviceName << " (serial "
          << state.serialNumber << ", firmware " << state.firmwareVersion
          << ")." << std::endl;
      }
    } catch (u3::U3Error const &e) {
      std::cerr << "Could not set up the U3: " << e.what() << std::endl;
      return 1;
    }

    std::mutex deviceMutex;
    cluon::OD4Session od4{CID};

    auto onSwitchStateRequest{[&device, &deviceMutex, &od4, &ID, &VERBOSE](
        cluon::data::Envelope &&envelope)
      {
        uint32_t const senderStamp = envelope.senderStamp();
        if (senderStamp < ID || senderStamp - ID > u3::CIO3) {
          return;
        }
        uint8_t const line = static_cast<uint8_t>(senderStamp - ID);
        auto switchStateRequest =
          cluon::extractMessage<opendlv::proxy::SwitchStateRequest>(
              std::move(envelope));
        bool const state = (switchStateRequest.state() != 0);

        std::lock_guard<std::mutex> lock(deviceMutex);
        try {
          device->SetDoState(line, state);
        } catch (u3::U3Error const &e) {
          std::cerr << "Failed to set line " << +line << ": " << e.what()
            << std::endl;
          return;
        }

        opendlv::proxy::SwitchStateReading switchStateReading;
        switchStateReading.state(state ? 1 : 0);
        od4.send(switchStateReading, cluon::time::now(), senderStamp);

        if (VERBOSE) {
          std::cout << "Line " << +line << " set to " << state << std::endl;
        }
      }};

    auto onVoltageRequest{[&device, &deviceMutex, &ID, &VERBOSE](
        cluon::data::Envelope &&envelope)
      {
        uint32_t const senderStamp = envelope.senderStamp();
        if (senderStamp < ID || senderStamp - ID > 1) {
          return;
        }
        uint8_t const dac = static_cast<uint8_t>(senderStamp - ID);
        auto voltageRequest =
          cluon::extractMessage<opendlv::proxy::VoltageRequest>(
              std::move(envelope));

        std::lock_guard<std::mutex> lock(deviceMutex);
        try {
          int32_t const bits = device->VoltageToDacBits(
              voltageRequest.voltage(), dac, true);
          u3::FeedbackList commands{std::make_shared<u3::Dac const>(dac,
              static_cast<uint16_t>(bits), true)};
          device->GetFeedback(commands);

          if (VERBOSE) {
            std::cout << "DAC" << +dac << " set to "
              << voltageRequest.voltage() << " V (" << bits << ")"
              << std::endl;
          }
        } catch (u3::U3Error const &e) {
          std::cerr << "Failed to set DAC" << +dac << ": " << e.what()
            << std::endl;
        }
      }};

    auto atFrequency{[&device, &deviceMutex, &od4, &channels, &ID, &VERBOSE](
        ) -> bool
      {
        std::lock_guard<std::mutex> lock(deviceMutex);
        try {
          cluon::data::TimeStamp sampleTime = cluon::time::now();
          for (uint8_t channel : channels) {
            double const voltage = device->GetAin(channel);

            opendlv::proxy::VoltageReading voltageReading;
            voltageReading.voltage(static_cast<float>(voltage));
            od4.send(voltageReading, sampleTime, ID + channel);

            if (VERBOSE) {
              std::cout << "AIN" << +channel << ": " << voltage << " V"
                << std::endl;
            }
          }

          double const temperature = device->GetTemperature() - 273.15;

          opendlv::proxy::TemperatureReading temperatureReading;
          temperatureReading.temperature(static_cast<float>(temperature));
          od4.send(temperatureReading, sampleTime, ID);

          if (VERBOSE) {
            std::cout << "Temperature: " << temperature << " C" << std::endl;
          }
        } catch (u3::U3Error const &e) {
          std::cerr << "Failed to read the U3: " << e.what() << std::endl;
        }
        return true;
      }};

    od4.dataTrigger(opendlv::proxy::SwitchStateRequest::ID(),
        onSwitchStateRequest);
    od4.dataTrigger(opendlv::proxy::VoltageRequest::ID(), onVoltageRequest);
    od4.timeTrigger(FREQ, atFrequency);
  }
  return retCode;
}
