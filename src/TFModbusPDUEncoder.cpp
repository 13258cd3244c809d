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

#include "TFModbusPDUEncoder.h"

#include <stddef.h>
#include <string.h>
#include <arpa/inet.h>

#include "TFModbusPDUUtil.h"

#define debugfln(fmt, ...) tf_modbus_pdu_util_debugfln("TFModbusPDUEncoder[%p]::" fmt, static_cast<const void *>(this) __VA_OPT__(,) __VA_ARGS__)

TFModbusPDUResult TFModbusPDUEncoder::read_coils(uint16_t start_address, uint16_t data_count, TFModbusPDURequest *request) const
{
    return encode_read(TFModbusPDUFunctionCode::ReadCoils, start_address, data_count,
                       TF_MODBUS_PDU_MIN_READ_COIL_COUNT, TF_MODBUS_PDU_MAX_READ_COIL_COUNT, request);
}

TFModbusPDUResult TFModbusPDUEncoder::read_discrete_inputs(uint16_t start_address, uint16_t data_count, TFModbusPDURequest *request) const
{
    return encode_read(TFModbusPDUFunctionCode::ReadDiscreteInputs, start_address, data_count,
                       TF_MODBUS_PDU_MIN_READ_COIL_COUNT, TF_MODBUS_PDU_MAX_READ_COIL_COUNT, request);
}

TFModbusPDUResult TFModbusPDUEncoder::read_holding_registers(uint16_t start_address, uint16_t data_count, TFModbusPDURequest *request) const
{
    return encode_read(TFModbusPDUFunctionCode::ReadHoldingRegisters, start_address, data_count,
                       TF_MODBUS_PDU_MIN_READ_REGISTER_COUNT, TF_MODBUS_PDU_MAX_READ_REGISTER_COUNT, request);
}

TFModbusPDUResult TFModbusPDUEncoder::read_input_registers(uint16_t start_address, uint16_t data_count, TFModbusPDURequest *request) const
{
    return encode_read(TFModbusPDUFunctionCode::ReadInputRegisters, start_address, data_count,
                       TF_MODBUS_PDU_MIN_READ_REGISTER_COUNT, TF_MODBUS_PDU_MAX_READ_REGISTER_COUNT, request);
}

TFModbusPDUResult TFModbusPDUEncoder::write_single_coil(uint16_t address, bool coil_value, TFModbusPDURequest *request) const
{
    if (request == nullptr) {
        debugfln("write_single_coil(address=%u) request is null", address);
        return TFModbusPDUResult::InvalidArgument;
    }

    request->payload.function_code = static_cast<uint8_t>(TFModbusPDUFunctionCode::WriteSingleCoil);
    request->payload.start_address = htons(address);
    request->payload.data_value    = htons(coil_value ? TF_MODBUS_PDU_COIL_ON : TF_MODBUS_PDU_COIL_OFF);
    request->length                = offsetof(TFModbusPDURequestPayload, byte_count);

    return TFModbusPDUResult::Success;
}

TFModbusPDUResult TFModbusPDUEncoder::write_single_register(uint16_t address, uint16_t register_value, TFModbusPDURequest *request) const
{
    if (request == nullptr) {
        debugfln("write_single_register(address=%u) request is null", address);
        return TFModbusPDUResult::InvalidArgument;
    }

    request->payload.function_code = static_cast<uint8_t>(TFModbusPDUFunctionCode::WriteSingleRegister);
    request->payload.start_address = htons(address);

    if (register_byte_order == TFModbusPDUByteOrder::Host) {
        request->payload.data_value = htons(register_value);
    }
    else { // TFModbusPDUByteOrder::Network
        request->payload.data_value = register_value;
    }

    request->length = offsetof(TFModbusPDURequestPayload, byte_count);

    return TFModbusPDUResult::Success;
}

TFModbusPDUResult TFModbusPDUEncoder::write_multiple_coils(uint16_t start_address,
                                                           const bool *coil_values,
                                                           size_t coil_count,
                                                           TFModbusPDURequest *request) const
{
    if (request == nullptr || (coil_values == nullptr && coil_count > 0)) {
        debugfln("write_multiple_coils(start_address=%u coil_count=%zu) invalid argument", start_address, coil_count);
        return TFModbusPDUResult::InvalidArgument;
    }

    if (check_limits && (coil_count < TF_MODBUS_PDU_MIN_WRITE_COIL_COUNT || coil_count > TF_MODBUS_PDU_MAX_WRITE_COIL_COUNT)) {
        debugfln("write_multiple_coils(start_address=%u coil_count=%zu) coil count out-of-range", start_address, coil_count);
        return TFModbusPDUResult::InvalidArgument;
    }

    size_t byte_count = TFModbusPDUUtil::get_coil_byte_count(coil_count, coil_byte_count);

    if (coil_count > TF_MODBUS_PDU_MAX_DATA_COUNT || byte_count > TF_MODBUS_PDU_MAX_REQUEST_DATA_LENGTH) {
        debugfln("write_multiple_coils(start_address=%u coil_count=%zu byte_count=%zu) not representable",
                 start_address, coil_count, byte_count);
        return TFModbusPDUResult::InvalidArgument;
    }

    request->payload.function_code = static_cast<uint8_t>(TFModbusPDUFunctionCode::WriteMultipleCoils);
    request->payload.start_address = htons(start_address);
    request->payload.data_count    = htons(static_cast<uint16_t>(coil_count));
    request->payload.byte_count    = static_cast<uint8_t>(byte_count);
    request->length                = offsetof(TFModbusPDURequestPayload, coil_values) + byte_count;

    TFModbusPDUUtil::pack_coil_values(coil_values, coil_count, request->payload.coil_values, byte_count);

    return TFModbusPDUResult::Success;
}

TFModbusPDUResult TFModbusPDUEncoder::write_multiple_registers(uint16_t start_address,
                                                               const uint16_t *register_values,
                                                               size_t register_count,
                                                               TFModbusPDURequest *request) const
{
    if (request == nullptr || (register_values == nullptr && register_count > 0)) {
        debugfln("write_multiple_registers(start_address=%u register_count=%zu) invalid argument", start_address, register_count);
        return TFModbusPDUResult::InvalidArgument;
    }

    if (check_limits && (register_count < TF_MODBUS_PDU_MIN_WRITE_REGISTER_COUNT || register_count > TF_MODBUS_PDU_MAX_WRITE_REGISTER_COUNT)) {
        debugfln("write_multiple_registers(start_address=%u register_count=%zu) register count out-of-range", start_address, register_count);
        return TFModbusPDUResult::InvalidArgument;
    }

    if (register_count > TF_MODBUS_PDU_MAX_ENCODED_REGISTER_COUNT) {
        debugfln("write_multiple_registers(start_address=%u register_count=%zu) not representable", start_address, register_count);
        return TFModbusPDUResult::InvalidArgument;
    }

    size_t byte_count = register_count * 2;

    request->payload.function_code = static_cast<uint8_t>(TFModbusPDUFunctionCode::WriteMultipleRegisters);
    request->payload.start_address = htons(start_address);
    request->payload.data_count    = htons(static_cast<uint16_t>(register_count));
    request->payload.byte_count    = static_cast<uint8_t>(byte_count);
    request->length                = offsetof(TFModbusPDURequestPayload, register_values) + byte_count;

    if (register_byte_order == TFModbusPDUByteOrder::Host) {
        for (size_t i = 0; i < register_count; ++i) {
            request->payload.register_values[i] = htons(register_values[i]);
        }
    }
    else if (byte_count > 0) { // TFModbusPDUByteOrder::Network
        memcpy(request->payload.register_values, register_values, byte_count);
    }

    return TFModbusPDUResult::Success;
}

TFModbusPDUResult TFModbusPDUEncoder::encode_read(TFModbusPDUFunctionCode function_code,
                                                  uint16_t start_address,
                                                  uint16_t data_count,
                                                  uint16_t min_data_count,
                                                  uint16_t max_data_count,
                                                  TFModbusPDURequest *request) const
{
    if (request == nullptr) {
        debugfln("encode_read(function_code=%s start_address=%u data_count=%u) request is null",
                 get_tf_modbus_pdu_function_code_name(function_code), start_address, data_count);
        return TFModbusPDUResult::InvalidArgument;
    }

    if (check_limits && (data_count < min_data_count || data_count > max_data_count)) {
        debugfln("encode_read(function_code=%s start_address=%u data_count=%u) data count out-of-range",
                 get_tf_modbus_pdu_function_code_name(function_code), start_address, data_count);
        return TFModbusPDUResult::InvalidArgument;
    }

    request->payload.function_code = static_cast<uint8_t>(function_code);
    request->payload.start_address = htons(start_address);
    request->payload.data_count    = htons(data_count);
    request->length                = offsetof(TFModbusPDURequestPayload, byte_count);

    return TFModbusPDUResult::Success;
}
