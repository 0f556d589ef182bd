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

#ifndef LABJACK_U3_PACKET_HPP
#define LABJACK_U3_PACKET_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace u3 {

uint32_t const kMaxUsbPacketLength = 64;

// Command byte of all extended commands.
uint8_t const kExtendedCommand = 0xF8;

// Status byte of every extended response.
uint32_t const kStatusByte = 6;

uint8_t const kErrorInvalidBlock = 26;
uint8_t const kErrorStreamAutorecoverReport = 60;

/*
 * Extended packet layout:
 *   [0]    checksum8 over bytes 1..5
 *   [1]    0xF8
 *   [2]    number of data words following the six header bytes
 *   [3]    extended command number
 *   [4..5] checksum16 (LSB, MSB) over bytes 6..n-1
 *   [6..]  payload
 */
uint8_t GetChecksum8(std::vector<uint8_t> const &, uint32_t);
uint16_t GetExtendedChecksum16(std::vector<uint8_t> const &);
void SetChecksum(std::vector<uint8_t> &);
bool VerifyChecksum(std::vector<uint8_t> const &);

std::vector<uint8_t> BuildExtendedCommand(uint8_t, std::vector<uint8_t> const &);
std::vector<uint8_t> ExpectedExtendedHeader(uint8_t, uint32_t);

void ValidateLength(std::vector<uint8_t> const &, uint32_t);
void CheckCommandBytes(std::vector<uint8_t> const &,
    std::vector<uint8_t> const &);

uint16_t ToUint16(uint8_t const *);
uint32_t ToUint32(uint8_t const *);
int32_t ToInt32(uint8_t const *);
double ToDouble(uint8_t const *);

std::string LowlevelErrorToString(uint8_t);
std::string ToHexString(std::vector<uint8_t> const &);

}

#endif
