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

#include <stdio.h>
#include <stdint.h>
#include <stdarg.h>
#include <string>
#include <gtest/gtest.h>

#include "../src/TFModbusPDUUtil.h"

TEST(Util, CoilByteCount)
{
    EXPECT_EQ(1u, TFModbusPDUUtil::get_coil_byte_count(1, TFModbusPDUCoilByteCount::Exact));
    EXPECT_EQ(1u, TFModbusPDUUtil::get_coil_byte_count(8, TFModbusPDUCoilByteCount::Exact));
    EXPECT_EQ(2u, TFModbusPDUUtil::get_coil_byte_count(9, TFModbusPDUCoilByteCount::Exact));
    EXPECT_EQ(246u, TFModbusPDUUtil::get_coil_byte_count(1968, TFModbusPDUCoilByteCount::Exact));

    EXPECT_EQ(1u, TFModbusPDUUtil::get_coil_byte_count(1, TFModbusPDUCoilByteCount::Legacy));
    EXPECT_EQ(2u, TFModbusPDUUtil::get_coil_byte_count(8, TFModbusPDUCoilByteCount::Legacy));
    EXPECT_EQ(2u, TFModbusPDUUtil::get_coil_byte_count(9, TFModbusPDUCoilByteCount::Legacy));
    EXPECT_EQ(3u, TFModbusPDUUtil::get_coil_byte_count(16, TFModbusPDUCoilByteCount::Legacy));
}

TEST(Util, PackCoilValues)
{
    const bool coil_values[10] = {true, false, true, true, false, false, true, true, true, false};
    uint8_t bytes[3] = {0xAA, 0xAA, 0xAA};

    TFModbusPDUUtil::pack_coil_values(coil_values, 10, bytes, sizeof(bytes));

    EXPECT_EQ(0xCD, bytes[0]);
    EXPECT_EQ(0x01, bytes[1]);
    EXPECT_EQ(0x00, bytes[2]); // padding byte cleared
}

TEST(Util, PackUnpackCoilValues)
{
    for (size_t coil_count = 1; coil_count <= 40; ++coil_count) {
        bool coil_values[40];
        bool unpacked[40];
        uint8_t bytes[5];
        size_t byte_count = TFModbusPDUUtil::get_coil_byte_count(coil_count, TFModbusPDUCoilByteCount::Exact);

        for (size_t i = 0; i < coil_count; ++i) {
            coil_values[i] = (i * 7 + coil_count) % 3 == 0;
        }

        TFModbusPDUUtil::pack_coil_values(coil_values, coil_count, bytes, byte_count);

        // bits beyond coil_count stay clear
        if (coil_count % 8 != 0) {
            EXPECT_EQ(0, bytes[byte_count - 1] >> (coil_count % 8)) << "coil_count " << coil_count;
        }

        TFModbusPDUUtil::unpack_coil_values(bytes, coil_count, unpacked);

        for (size_t i = 0; i < coil_count; ++i) {
            ASSERT_EQ(coil_values[i], unpacked[i]) << "coil_count " << coil_count << " coil " << i;
        }
    }
}

TEST(Util, PrintfSafe)
{
    EXPECT_STREQ("[nullptr]", TFModbusPDUUtil::printf_safe(nullptr));
    EXPECT_STREQ("foo", TFModbusPDUUtil::printf_safe("foo"));
}

TEST(Util, LogFLnForwardsToVLogFLn)
{
    TFModbusPDUUtilVLogFLnFunction previous_vlogfln = TFModbusPDUUtil::vlogfln;
    std::string output;

    TFModbusPDUUtil::vlogfln = [&output](const char *fmt, va_list args) {
        char buffer[256];

        vsnprintf(buffer, sizeof(buffer), fmt, args);
        output = buffer;
    };

    TFModbusPDUUtil::logfln("route %u -> %s", 42u, TFModbusPDUUtil::printf_safe(nullptr));

    TFModbusPDUUtil::vlogfln = previous_vlogfln;

    EXPECT_EQ("route 42 -> [nullptr]", output);
}

TEST(Util, Names)
{
    EXPECT_STREQ("Network", get_tf_modbus_pdu_byte_order_name(TFModbusPDUByteOrder::Network));
    EXPECT_STREQ("Legacy", get_tf_modbus_pdu_coil_byte_count_name(TFModbusPDUCoilByteCount::Legacy));
    EXPECT_STREQ("WriteMultipleCoils", get_tf_modbus_pdu_function_code_name(TFModbusPDUFunctionCode::WriteMultipleCoils));
    EXPECT_STREQ("<Unknown>", get_tf_modbus_pdu_function_code_name(static_cast<TFModbusPDUFunctionCode>(0x2B)));
}

TEST(Util, FunctionCodeSupported)
{
    const uint8_t supported[8] = {1, 2, 3, 4, 5, 6, 15, 16};

    for (size_t i = 0; i < sizeof(supported); ++i) {
        EXPECT_TRUE(is_tf_modbus_pdu_function_code_supported(supported[i]));
    }

    EXPECT_FALSE(is_tf_modbus_pdu_function_code_supported(0));
    EXPECT_FALSE(is_tf_modbus_pdu_function_code_supported(7));
    EXPECT_FALSE(is_tf_modbus_pdu_function_code_supported(0x83));
}

TEST(Util, ResultFromExceptionCode)
{
    EXPECT_EQ(TFModbusPDUResult::ModbusIllegalFunction, get_tf_modbus_pdu_result_from_exception_code(0x01));
    EXPECT_EQ(TFModbusPDUResult::ModbusGatewayTargetDeviceFailedToRespond, get_tf_modbus_pdu_result_from_exception_code(0x0B));
    EXPECT_EQ(TFModbusPDUResult::ModbusUnknownException, get_tf_modbus_pdu_result_from_exception_code(0x00));
    EXPECT_EQ(TFModbusPDUResult::ModbusUnknownException, get_tf_modbus_pdu_result_from_exception_code(0x09));
}
