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

#include "TFModbusPDUDecoder.h"

#include <stddef.h>
#include <string.h>
#include <arpa/inet.h>

#include "TFModbusPDUUtil.h"

#define debugfln(fmt, ...) tf_modbus_pdu_util_debugfln("TFModbusPDUDecoder[%p]::" fmt, static_cast<const void *>(this) __VA_OPT__(,) __VA_ARGS__)

const char *get_tf_modbus_pdu_response_kind_name(TFModbusPDUResponseKind kind)
{
    switch (kind) {
    case TFModbusPDUResponseKind::Normal:
        return "Normal";

    case TFModbusPDUResponseKind::Exception:
        return "Exception";
    }

    return "<Unknown>";
}

TFModbusPDUResult TFModbusPDUDecoder::decode_response(const uint8_t *bytes, size_t length, TFModbusPDUDecodedResponse *response) const
{
    if (bytes == nullptr || length < TF_MODBUS_PDU_MIN_LENGTH) {
        debugfln("decode_response(length=%zu) response too short", length);
        return TFModbusPDUResult::MalformedResponse;
    }

    TFModbusPDUDecodedResponse decoded;

    decoded.function_code = bytes[0] & TF_MODBUS_PDU_FUNCTION_CODE_MASK;

    if ((bytes[0] & TF_MODBUS_PDU_EXCEPTION_BIT) != 0) {
        decoded.kind           = TFModbusPDUResponseKind::Exception;
        decoded.exception_code = bytes[1];

        debugfln("decode_response(length=%zu) exception response (function_code=0x%02x exception_code=0x%02x)",
                 length, decoded.function_code, decoded.exception_code);

        if (response != nullptr) {
            *response = decoded;
        }

        return get_tf_modbus_pdu_result_from_exception_code(decoded.exception_code);
    }

    decoded.kind        = TFModbusPDUResponseKind::Normal;
    decoded.data        = bytes + 1;
    decoded.data_length = length - 1;

    if (response != nullptr) {
        *response = decoded;
    }

    return TFModbusPDUResult::Success;
}

TFModbusPDUResult TFModbusPDUDecoder::parse_read_bits_response(TFModbusPDUFunctionCode function_code,
                                                               uint16_t data_count,
                                                               const uint8_t *bytes,
                                                               size_t length,
                                                               bool *coil_values) const
{
    if (function_code != TFModbusPDUFunctionCode::ReadCoils && function_code != TFModbusPDUFunctionCode::ReadDiscreteInputs) {
        return TFModbusPDUResult::InvalidArgument;
    }

    if (data_count < TF_MODBUS_PDU_MIN_READ_COIL_COUNT || data_count > TF_MODBUS_PDU_MAX_READ_COIL_COUNT) {
        return TFModbusPDUResult::InvalidArgument;
    }

    uint8_t expected_byte_count = static_cast<uint8_t>((data_count + 7) / 8);
    TFModbusPDUResponsePayload payload;
    TFModbusPDUResult result = load_response(function_code, bytes, length,
                                             offsetof(TFModbusPDUResponsePayload, coil_values) + expected_byte_count,
                                             &payload);

    if (result != TFModbusPDUResult::Success) {
        return result;
    }

    if (payload.byte_count != expected_byte_count) {
        debugfln("parse_read_bits_response() byte count mismatch (byte_count=%u expected_byte_count=%u)",
                 payload.byte_count, expected_byte_count);
        return TFModbusPDUResult::ResponseByteCountMismatch;
    }

    if (coil_values != nullptr) {
        TFModbusPDUUtil::unpack_coil_values(payload.coil_values, data_count, coil_values);
    }

    return TFModbusPDUResult::Success;
}

TFModbusPDUResult TFModbusPDUDecoder::parse_read_registers_response(TFModbusPDUFunctionCode function_code,
                                                                    uint16_t data_count,
                                                                    const uint8_t *bytes,
                                                                    size_t length,
                                                                    uint16_t *register_values) const
{
    if (function_code != TFModbusPDUFunctionCode::ReadHoldingRegisters && function_code != TFModbusPDUFunctionCode::ReadInputRegisters) {
        return TFModbusPDUResult::InvalidArgument;
    }

    if (data_count < TF_MODBUS_PDU_MIN_READ_REGISTER_COUNT || data_count > TF_MODBUS_PDU_MAX_READ_REGISTER_COUNT) {
        return TFModbusPDUResult::InvalidArgument;
    }

    uint8_t expected_byte_count = static_cast<uint8_t>(data_count * 2);
    TFModbusPDUResponsePayload payload;
    TFModbusPDUResult result = load_response(function_code, bytes, length,
                                             offsetof(TFModbusPDUResponsePayload, register_values) + expected_byte_count,
                                             &payload);

    if (result != TFModbusPDUResult::Success) {
        return result;
    }

    if (payload.byte_count != expected_byte_count) {
        debugfln("parse_read_registers_response() byte count mismatch (byte_count=%u expected_byte_count=%u)",
                 payload.byte_count, expected_byte_count);
        return TFModbusPDUResult::ResponseByteCountMismatch;
    }

    if (register_values != nullptr) {
        if (register_byte_order == TFModbusPDUByteOrder::Host) {
            for (size_t i = 0; i < data_count; ++i) {
                register_values[i] = ntohs(payload.register_values[i]);
            }
        }
        else { // TFModbusPDUByteOrder::Network
            memcpy(register_values, payload.register_values, expected_byte_count);
        }
    }

    return TFModbusPDUResult::Success;
}

TFModbusPDUResult TFModbusPDUDecoder::parse_write_single_coil_response(uint16_t address,
                                                                       bool coil_value,
                                                                       const uint8_t *bytes,
                                                                       size_t length) const
{
    TFModbusPDUResponsePayload payload;
    TFModbusPDUResult result = check_write_echo(TFModbusPDUFunctionCode::WriteSingleCoil, address, bytes, length, &payload);

    if (result != TFModbusPDUResult::Success) {
        return result;
    }

    uint16_t actual_data_value = ntohs(payload.data_value);
    bool matches;

    if (coil_value) {
        matches = actual_data_value == TF_MODBUS_PDU_COIL_ON || actual_data_value == TF_MODBUS_PDU_COIL_ON_STANDARD;
    }
    else {
        matches = actual_data_value == TF_MODBUS_PDU_COIL_OFF;
    }

    if (!matches) {
        debugfln("parse_write_single_coil_response() data value mismatch (data_value=0x%04x coil_value=%d)",
                 actual_data_value, coil_value ? 1 : 0);
        return TFModbusPDUResult::ResponseDataValueMismatch;
    }

    return TFModbusPDUResult::Success;
}

TFModbusPDUResult TFModbusPDUDecoder::parse_write_single_register_response(uint16_t address,
                                                                           uint16_t register_value,
                                                                           const uint8_t *bytes,
                                                                           size_t length) const
{
    TFModbusPDUResponsePayload payload;
    TFModbusPDUResult result = check_write_echo(TFModbusPDUFunctionCode::WriteSingleRegister, address, bytes, length, &payload);

    if (result != TFModbusPDUResult::Success) {
        return result;
    }

    uint16_t actual_data_value   = ntohs(payload.data_value);
    uint16_t expected_data_value; // as TFModbusPDUByteOrder::Host

    if (register_byte_order == TFModbusPDUByteOrder::Host) {
        expected_data_value = register_value;
    }
    else { // TFModbusPDUByteOrder::Network
        expected_data_value = ntohs(register_value);
    }

    if (actual_data_value != expected_data_value) {
        debugfln("parse_write_single_register_response() data value mismatch (data_value=%u expected_data_value=%u)",
                 actual_data_value, expected_data_value);
        return TFModbusPDUResult::ResponseDataValueMismatch;
    }

    return TFModbusPDUResult::Success;
}

TFModbusPDUResult TFModbusPDUDecoder::parse_write_multiple_response(TFModbusPDUFunctionCode function_code,
                                                                    uint16_t start_address,
                                                                    uint16_t data_count,
                                                                    const uint8_t *bytes,
                                                                    size_t length) const
{
    if (function_code != TFModbusPDUFunctionCode::WriteMultipleCoils && function_code != TFModbusPDUFunctionCode::WriteMultipleRegisters) {
        return TFModbusPDUResult::InvalidArgument;
    }

    TFModbusPDUResponsePayload payload;
    TFModbusPDUResult result = check_write_echo(function_code, start_address, bytes, length, &payload);

    if (result != TFModbusPDUResult::Success) {
        return result;
    }

    uint16_t actual_data_count = ntohs(payload.data_count);

    if (actual_data_count != data_count) {
        debugfln("parse_write_multiple_response() data count mismatch (data_count=%u expected_data_count=%u)",
                 actual_data_count, data_count);
        return TFModbusPDUResult::ResponseDataCountMismatch;
    }

    return TFModbusPDUResult::Success;
}

TFModbusPDUResult TFModbusPDUDecoder::load_response(TFModbusPDUFunctionCode function_code,
                                                    const uint8_t *bytes,
                                                    size_t length,
                                                    size_t expected_length,
                                                    TFModbusPDUResponsePayload *payload) const
{
    TFModbusPDUDecodedResponse decoded;
    TFModbusPDUResult result = decode_response(bytes, length, &decoded);

    if (result == TFModbusPDUResult::MalformedResponse) {
        return result;
    }

    if (decoded.function_code != static_cast<uint8_t>(function_code)) {
        debugfln("load_response() function code mismatch (function_code=0x%02x expected_function_code=0x%02x)",
                 bytes[0], static_cast<uint8_t>(function_code));
        return TFModbusPDUResult::ResponseFunctionCodeMismatch;
    }

    if (result != TFModbusPDUResult::Success) {
        return result;
    }

    if (length > TF_MODBUS_PDU_MAX_LENGTH) {
        debugfln("load_response() response too long (length=%zu max_length=%u)", length, TF_MODBUS_PDU_MAX_LENGTH);
        return TFModbusPDUResult::ResponseLongerThanMaximum;
    }

    if (length < expected_length) {
        debugfln("load_response() response too short (length=%zu expected_length=%zu)", length, expected_length);
        return TFModbusPDUResult::ResponseShorterThanExpected;
    }

    if (length > expected_length) {
        // Intentionally accept too long responses
        debugfln("load_response() accepting excess length (excess_length=%zu)", length - expected_length);
    }

    memset(payload->bytes, 0, sizeof(payload->bytes));
    memcpy(payload->bytes, bytes, length);

    return TFModbusPDUResult::Success;
}

TFModbusPDUResult TFModbusPDUDecoder::check_write_echo(TFModbusPDUFunctionCode function_code,
                                                       uint16_t start_address,
                                                       const uint8_t *bytes,
                                                       size_t length,
                                                       TFModbusPDUResponsePayload *payload) const
{
    TFModbusPDUResult result = load_response(function_code, bytes, length, offsetof(TFModbusPDUResponsePayload, write_sentinel), payload);

    if (result != TFModbusPDUResult::Success) {
        return result;
    }

    uint16_t actual_start_address = ntohs(payload->start_address);

    if (actual_start_address != start_address) {
        debugfln("check_write_echo() start address mismatch (start_address=%u expected_start_address=%u)",
                 actual_start_address, start_address);
        return TFModbusPDUResult::ResponseStartAddressMismatch;
    }

    return TFModbusPDUResult::Success;
}
