/* TFModbusPDU
 * Copyright (C) 2024 Matthias Bolte <matthias@tinkerforge.com>
 *
 * This library is free software; you can redistribute it and/or
 * modify it under the terms of the GNU Lesser General Public
 * License as published by the Free Software Foundation; either
 * version 2 of the License, or (at your option) any later version.
 *
 * This library is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public
 * License along with this library; if not, write to the
 * Free Software Foundation, Inc., 59 Temple Place - Suite 330,
 * Boston, MA 02111-1307, USA.
 */

#include <stdint.h>
#include <string.h>
#include <memory>
#include <vector>
#include <gtest/gtest.h>

#include "../src/TFModbusPDUEncoder.h"

static std::vector<uint8_t> to_vector(const TFModbusPDURequest &request)
{
    return std::vector<uint8_t>(request.payload.bytes, request.payload.bytes + request.length);
}

TEST(Encoder, ReadCoils)
{
    TFModbusPDUEncoder encoder;
    TFModbusPDURequest request;

    ASSERT_EQ(TFModbusPDUResult::Success, encoder.read_coils(0, 3, &request));
    EXPECT_EQ((std::vector<uint8_t>{0x01, 0x00, 0x00, 0x00, 0x03}), to_vector(request));
}

TEST(Encoder, ReadFunctionsUseBigEndianFields)
{
    TFModbusPDUEncoder encoder;
    TFModbusPDURequest request;

    ASSERT_EQ(TFModbusPDUResult::Success, encoder.read_discrete_inputs(0x1234, 0x0010, &request));
    EXPECT_EQ((std::vector<uint8_t>{0x02, 0x12, 0x34, 0x00, 0x10}), to_vector(request));

    ASSERT_EQ(TFModbusPDUResult::Success, encoder.read_holding_registers(100, 2, &request));
    EXPECT_EQ((std::vector<uint8_t>{0x03, 0x00, 0x64, 0x00, 0x02}), to_vector(request));

    ASSERT_EQ(TFModbusPDUResult::Success, encoder.read_input_registers(0xFFFF, 125, &request));
    EXPECT_EQ((std::vector<uint8_t>{0x04, 0xFF, 0xFF, 0x00, 0x7D}), to_vector(request));
}

TEST(Encoder, WriteSingleCoil)
{
    TFModbusPDUEncoder encoder;
    TFModbusPDURequest request;

    ASSERT_EQ(TFModbusPDUResult::Success, encoder.write_single_coil(100, true, &request));
    EXPECT_EQ((std::vector<uint8_t>{0x05, 0x00, 0x64, 0xFF, 0xFF}), to_vector(request));

    ASSERT_EQ(TFModbusPDUResult::Success, encoder.write_single_coil(100, false, &request));
    EXPECT_EQ((std::vector<uint8_t>{0x05, 0x00, 0x64, 0x00, 0x00}), to_vector(request));
}

TEST(Encoder, WriteSingleRegister)
{
    TFModbusPDUEncoder encoder;
    TFModbusPDURequest request;

    ASSERT_EQ(TFModbusPDUResult::Success, encoder.write_single_register(11, 1337, &request));
    EXPECT_EQ((std::vector<uint8_t>{0x06, 0x00, 0x0B, 0x05, 0x39}), to_vector(request));
}

TEST(Encoder, WriteSingleRegisterNetworkByteOrder)
{
    TFModbusPDUEncoder encoder(TFModbusPDUByteOrder::Network);
    TFModbusPDURequest request;
    const uint8_t raw[2] = {0x05, 0x39};
    uint16_t value;

    memcpy(&value, raw, sizeof(value));

    ASSERT_EQ(TFModbusPDUResult::Success, encoder.write_single_register(11, value, &request));
    EXPECT_EQ((std::vector<uint8_t>{0x06, 0x00, 0x0B, 0x05, 0x39}), to_vector(request));
}

TEST(Encoder, WriteMultipleCoilsPacksLeastSignificantBitFirst)
{
    TFModbusPDUEncoder encoder;
    TFModbusPDURequest request;
    const bool values[9] = {true, false, true, true, false, false, false, false, true};

    ASSERT_EQ(TFModbusPDUResult::Success, encoder.write_multiple_coils(0, values, 9, &request));
    EXPECT_EQ((std::vector<uint8_t>{0x0F, 0x00, 0x00, 0x00, 0x09, 0x02, 0x0D, 0x01}), to_vector(request));
}

TEST(Encoder, WriteMultipleCoilsExactByteCount)
{
    TFModbusPDUEncoder encoder;
    TFModbusPDURequest request;
    const bool values[8] = {true, true, true, true, true, true, true, true};

    ASSERT_EQ(TFModbusPDUResult::Success, encoder.write_multiple_coils(9, values, 8, &request));
    EXPECT_EQ((std::vector<uint8_t>{0x0F, 0x00, 0x09, 0x00, 0x08, 0x01, 0xFF}), to_vector(request));
}

TEST(Encoder, WriteMultipleCoilsLegacyByteCount)
{
    TFModbusPDUEncoder encoder(TFModbusPDUByteOrder::Host, TFModbusPDUCoilByteCount::Legacy);
    TFModbusPDURequest request;
    const bool eight[8] = {true, true, true, true, true, true, true, true};
    const bool nine[9] = {true, false, true, true, false, false, false, false, true};

    ASSERT_EQ(TFModbusPDUResult::Success, encoder.write_multiple_coils(9, eight, 8, &request));
    EXPECT_EQ((std::vector<uint8_t>{0x0F, 0x00, 0x09, 0x00, 0x08, 0x02, 0xFF, 0x00}), to_vector(request));

    // identical to Exact when the count is not a multiple of 8
    ASSERT_EQ(TFModbusPDUResult::Success, encoder.write_multiple_coils(0, nine, 9, &request));
    EXPECT_EQ((std::vector<uint8_t>{0x0F, 0x00, 0x00, 0x00, 0x09, 0x02, 0x0D, 0x01}), to_vector(request));
}

TEST(Encoder, WriteMultipleCoilsByteCountIsCeiling)
{
    TFModbusPDUEncoder encoder;
    TFModbusPDURequest request;
    std::unique_ptr<bool[]> values(new bool[64]());

    for (size_t count = 1; count <= 64; ++count) {
        ASSERT_EQ(TFModbusPDUResult::Success, encoder.write_multiple_coils(0, values.get(), count, &request));
        EXPECT_EQ((count + 7) / 8, static_cast<size_t>(request.payload.byte_count)) << "count " << count;
        EXPECT_EQ(6 + (count + 7) / 8, request.length) << "count " << count;
    }
}

TEST(Encoder, WriteMultipleRegisters)
{
    TFModbusPDUEncoder encoder;
    TFModbusPDURequest request;
    const uint16_t values[2] = {1337, 15};

    ASSERT_EQ(TFModbusPDUResult::Success, encoder.write_multiple_registers(9, values, 2, &request));
    EXPECT_EQ((std::vector<uint8_t>{0x10, 0x00, 0x09, 0x00, 0x02, 0x04, 0x05, 0x39, 0x00, 0x0F}), to_vector(request));
}

TEST(Encoder, WriteMultipleRegistersNetworkByteOrder)
{
    TFModbusPDUEncoder encoder(TFModbusPDUByteOrder::Network);
    TFModbusPDURequest request;
    const uint8_t raw[4] = {0x05, 0x39, 0x00, 0x0F};
    uint16_t values[2];

    memcpy(values, raw, sizeof(values));

    ASSERT_EQ(TFModbusPDUResult::Success, encoder.write_multiple_registers(9, values, 2, &request));
    EXPECT_EQ((std::vector<uint8_t>{0x10, 0x00, 0x09, 0x00, 0x02, 0x04, 0x05, 0x39, 0x00, 0x0F}), to_vector(request));
}

TEST(Encoder, NoLimitCheckByDefault)
{
    TFModbusPDUEncoder encoder;
    TFModbusPDURequest request;

    EXPECT_EQ(TFModbusPDUResult::Success, encoder.read_coils(0, 0, &request));
    EXPECT_EQ(TFModbusPDUResult::Success, encoder.read_coils(0, 2001, &request));
    EXPECT_EQ(TFModbusPDUResult::Success, encoder.read_holding_registers(0, 126, &request));
    EXPECT_EQ((std::vector<uint8_t>{0x03, 0x00, 0x00, 0x00, 0x7E}), to_vector(request));

    EXPECT_EQ(TFModbusPDUResult::Success, encoder.write_multiple_coils(0, nullptr, 0, &request));
    EXPECT_EQ((std::vector<uint8_t>{0x0F, 0x00, 0x00, 0x00, 0x00, 0x00}), to_vector(request));
}

TEST(Encoder, LimitCheck)
{
    TFModbusPDUEncoder encoder(TFModbusPDUByteOrder::Host, TFModbusPDUCoilByteCount::Exact, true);
    TFModbusPDURequest request;
    std::unique_ptr<bool[]> coils(new bool[1969]());
    std::unique_ptr<uint16_t[]> registers(new uint16_t[124]());

    EXPECT_EQ(TFModbusPDUResult::InvalidArgument, encoder.read_coils(0, 0, &request));
    EXPECT_EQ(TFModbusPDUResult::InvalidArgument, encoder.read_discrete_inputs(0, 2001, &request));
    EXPECT_EQ(TFModbusPDUResult::Success, encoder.read_discrete_inputs(0, 2000, &request));
    EXPECT_EQ(TFModbusPDUResult::InvalidArgument, encoder.read_input_registers(0, 126, &request));
    EXPECT_EQ(TFModbusPDUResult::Success, encoder.read_input_registers(0, 125, &request));
    EXPECT_EQ(TFModbusPDUResult::InvalidArgument, encoder.write_multiple_coils(0, coils.get(), 1969, &request));
    EXPECT_EQ(TFModbusPDUResult::Success, encoder.write_multiple_coils(0, coils.get(), 1968, &request));
    EXPECT_EQ(TFModbusPDUResult::InvalidArgument, encoder.write_multiple_registers(0, registers.get(), 124, &request));
    EXPECT_EQ(TFModbusPDUResult::Success, encoder.write_multiple_registers(0, registers.get(), 123, &request));

    // valid requests produce the same bytes as without limit check
    ASSERT_EQ(TFModbusPDUResult::Success, encoder.read_coils(0, 3, &request));
    EXPECT_EQ((std::vector<uint8_t>{0x01, 0x00, 0x00, 0x00, 0x03}), to_vector(request));
}

TEST(Encoder, PayloadLayout)
{
    EXPECT_EQ(static_cast<size_t>(TF_MODBUS_PDU_MAX_LENGTH), sizeof(TFModbusPDURequestPayload));
    EXPECT_EQ(static_cast<size_t>(TF_MODBUS_PDU_MAX_LENGTH), sizeof(TFModbusPDUResponsePayload));
}

TEST(Encoder, RejectsRequestsLongerThanMaximum)
{
    TFModbusPDUEncoder encoder;
    TFModbusPDUEncoder legacy_encoder(TFModbusPDUByteOrder::Host, TFModbusPDUCoilByteCount::Legacy);
    TFModbusPDURequest request;
    std::unique_ptr<bool[]> coils(new bool[2041]());
    std::unique_ptr<uint16_t[]> registers(new uint16_t[128]());

    ASSERT_EQ(TFModbusPDUResult::Success, encoder.write_multiple_coils(0, coils.get(), 1976, &request));
    EXPECT_EQ(247u, static_cast<unsigned>(request.payload.byte_count));
    EXPECT_EQ(static_cast<size_t>(TF_MODBUS_PDU_MAX_LENGTH), request.length);

    for (size_t coil_count = 1977; coil_count <= 2040; ++coil_count) {
        EXPECT_EQ(TFModbusPDUResult::InvalidArgument, encoder.write_multiple_coils(0, coils.get(), coil_count, &request)) << "coil_count " << coil_count;
    }

    ASSERT_EQ(TFModbusPDUResult::Success, legacy_encoder.write_multiple_coils(0, coils.get(), 1975, &request));
    EXPECT_EQ(static_cast<size_t>(TF_MODBUS_PDU_MAX_LENGTH), request.length);
    EXPECT_EQ(TFModbusPDUResult::InvalidArgument, legacy_encoder.write_multiple_coils(0, coils.get(), 1976, &request));

    ASSERT_EQ(TFModbusPDUResult::Success, encoder.write_multiple_registers(0, registers.get(), 123, &request));
    EXPECT_EQ(252u, request.length);

    for (size_t register_count = 124; register_count <= 127; ++register_count) {
        EXPECT_EQ(TFModbusPDUResult::InvalidArgument, encoder.write_multiple_registers(0, registers.get(), register_count, &request)) << "register_count " << register_count;
    }

    EXPECT_EQ(TFModbusPDUResult::InvalidArgument, encoder.write_multiple_coils(0, coils.get(), 65536, &request));
}

TEST(Encoder, RejectsNullArguments)
{
    TFModbusPDUEncoder encoder;
    const bool coils[1] = {true};

    EXPECT_EQ(TFModbusPDUResult::InvalidArgument, encoder.read_coils(0, 1, nullptr));
    EXPECT_EQ(TFModbusPDUResult::InvalidArgument, encoder.write_single_coil(0, true, nullptr));
    EXPECT_EQ(TFModbusPDUResult::InvalidArgument, encoder.write_multiple_coils(0, coils, 1, nullptr));

    TFModbusPDURequest request;

    EXPECT_EQ(TFModbusPDUResult::InvalidArgument, encoder.write_multiple_coils(0, nullptr, 1, &request));
    EXPECT_EQ(TFModbusPDUResult::InvalidArgument, encoder.write_multiple_registers(0, nullptr, 1, &request));
}
