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

#include "TFModbusPDUServer.h"

#include <stddef.h>
#include <string.h>
#include <arpa/inet.h>

#include "TFModbusPDUUtil.h"

#define debugfln(fmt, ...) tf_modbus_pdu_util_debugfln("TFModbusPDUServer[%p]::" fmt, static_cast<const void *>(this) __VA_OPT__(,) __VA_ARGS__)

TFModbusPDUResult TFModbusPDUServer::decode_request(const uint8_t *bytes, size_t length, TFModbusPDURequestInfo *request) const
{
    if (bytes == nullptr || request == nullptr) {
        return TFModbusPDUResult::InvalidArgument;
    }

    if (length < 1 || length > TF_MODBUS_PDU_MAX_LENGTH) {
        debugfln("decode_request(length=%zu) length out-of-range", length);
        return TFModbusPDUResult::MalformedRequest;
    }

    if (!is_tf_modbus_pdu_function_code_supported(bytes[0])) {
        debugfln("decode_request(length=%zu) unsupported function code 0x%02x", length, bytes[0]);
        return TFModbusPDUResult::ModbusIllegalFunction;
    }

    TFModbusPDURequestPayload payload;

    memset(payload.bytes, 0, sizeof(payload.bytes));
    memcpy(payload.bytes, bytes, length);

    request->function_code = static_cast<TFModbusPDUFunctionCode>(payload.function_code);
    request->start_address = 0;
    request->data_count    = 0;
    request->data_value    = 0;

    size_t fixed_length = offsetof(TFModbusPDURequestPayload, byte_count);

    switch (request->function_code) {
    case TFModbusPDUFunctionCode::ReadCoils:
    case TFModbusPDUFunctionCode::ReadDiscreteInputs:
    case TFModbusPDUFunctionCode::ReadHoldingRegisters:
    case TFModbusPDUFunctionCode::ReadInputRegisters:
        {
            if (length != fixed_length) {
                debugfln("decode_request() length mismatch (length=%zu expected_length=%zu)", length, fixed_length);
                return TFModbusPDUResult::MalformedRequest;
            }

            uint16_t data_count = ntohs(payload.data_count);
            bool registers      = request->function_code == TFModbusPDUFunctionCode::ReadHoldingRegisters
                               || request->function_code == TFModbusPDUFunctionCode::ReadInputRegisters;
            uint16_t min_count  = registers ? TF_MODBUS_PDU_MIN_READ_REGISTER_COUNT : TF_MODBUS_PDU_MIN_READ_COIL_COUNT;
            uint16_t max_count  = registers ? TF_MODBUS_PDU_MAX_READ_REGISTER_COUNT : TF_MODBUS_PDU_MAX_READ_COIL_COUNT;

            request->start_address = ntohs(payload.start_address);
            request->data_count    = data_count;

            if (data_count < min_count || data_count > max_count) {
                return TFModbusPDUResult::ModbusIllegalDataValue;
            }
        }

        break;

    case TFModbusPDUFunctionCode::WriteSingleCoil:
        {
            if (length != fixed_length) {
                debugfln("decode_request() length mismatch (length=%zu expected_length=%zu)", length, fixed_length);
                return TFModbusPDUResult::MalformedRequest;
            }

            uint16_t data_value = ntohs(payload.data_value);

            request->start_address = ntohs(payload.start_address);
            request->data_count    = 1;
            request->data_value    = data_value;

            if (data_value != TF_MODBUS_PDU_COIL_OFF && data_value != TF_MODBUS_PDU_COIL_ON && data_value != TF_MODBUS_PDU_COIL_ON_STANDARD) {
                return TFModbusPDUResult::ModbusIllegalDataValue;
            }

            request->coil_values[0] = data_value != TF_MODBUS_PDU_COIL_OFF;
        }

        break;

    case TFModbusPDUFunctionCode::WriteSingleRegister:
        if (length != fixed_length) {
            debugfln("decode_request() length mismatch (length=%zu expected_length=%zu)", length, fixed_length);
            return TFModbusPDUResult::MalformedRequest;
        }

        request->start_address = ntohs(payload.start_address);
        request->data_count    = 1;
        request->data_value    = ntohs(payload.data_value);

        if (register_byte_order == TFModbusPDUByteOrder::Host) {
            request->register_values[0] = ntohs(payload.data_value);
        }
        else { // TFModbusPDUByteOrder::Network
            request->register_values[0] = payload.data_value;
        }

        break;

    case TFModbusPDUFunctionCode::WriteMultipleCoils:
        {
            size_t min_length = offsetof(TFModbusPDURequestPayload, coil_values) + TF_MODBUS_PDU_MIN_WRITE_COIL_BYTE_COUNT;

            if (length < min_length) {
                debugfln("decode_request() too short (length=%zu min_length=%zu)", length, min_length);
                return TFModbusPDUResult::MalformedRequest;
            }

            uint16_t data_count = ntohs(payload.data_count);

            request->start_address = ntohs(payload.start_address);
            request->data_count    = data_count;

            // Also accept count / 8 + 1 as sent by TFModbusPDUCoilByteCount::Legacy
            if (data_count < TF_MODBUS_PDU_MIN_WRITE_COIL_COUNT
             || data_count > TF_MODBUS_PDU_MAX_WRITE_COIL_COUNT
             || (payload.byte_count != TFModbusPDUUtil::get_coil_byte_count(data_count, TFModbusPDUCoilByteCount::Exact)
              && payload.byte_count != TFModbusPDUUtil::get_coil_byte_count(data_count, TFModbusPDUCoilByteCount::Legacy))) {
                return TFModbusPDUResult::ModbusIllegalDataValue;
            }

            size_t expected_length = offsetof(TFModbusPDURequestPayload, coil_values) + payload.byte_count;

            if (length != expected_length) {
                debugfln("decode_request() length mismatch (length=%zu expected_length=%zu)", length, expected_length);
                return TFModbusPDUResult::MalformedRequest;
            }

            TFModbusPDUUtil::unpack_coil_values(payload.coil_values, data_count, request->coil_values);
        }

        break;

    case TFModbusPDUFunctionCode::WriteMultipleRegisters:
        {
            size_t min_length = offsetof(TFModbusPDURequestPayload, register_values) + TF_MODBUS_PDU_MIN_WRITE_REGISTER_COUNT * 2;

            if (length < min_length) {
                debugfln("decode_request() too short (length=%zu min_length=%zu)", length, min_length);
                return TFModbusPDUResult::MalformedRequest;
            }

            uint16_t data_count = ntohs(payload.data_count);

            request->start_address = ntohs(payload.start_address);
            request->data_count    = data_count;

            if (data_count < TF_MODBUS_PDU_MIN_WRITE_REGISTER_COUNT
             || data_count > TF_MODBUS_PDU_MAX_WRITE_REGISTER_COUNT
             || payload.byte_count != data_count * 2) {
                return TFModbusPDUResult::ModbusIllegalDataValue;
            }

            size_t expected_length = offsetof(TFModbusPDURequestPayload, register_values) + payload.byte_count;

            if (length != expected_length) {
                debugfln("decode_request() length mismatch (length=%zu expected_length=%zu)", length, expected_length);
                return TFModbusPDUResult::MalformedRequest;
            }

            if (register_byte_order == TFModbusPDUByteOrder::Host) {
                for (size_t i = 0; i < data_count; ++i) {
                    request->register_values[i] = ntohs(payload.register_values[i]);
                }
            }
            else { // TFModbusPDUByteOrder::Network
                memcpy(request->register_values, payload.register_values, payload.byte_count);
            }
        }

        break;
    }

    return TFModbusPDUResult::Success;
}

TFModbusPDUResult TFModbusPDUServer::encode_exception_response(uint8_t function_code,
                                                               TFModbusPDUExceptionCode exception_code,
                                                               TFModbusPDUResponse *response) const
{
    if (response == nullptr || exception_code == TFModbusPDUExceptionCode::Success) {
        return TFModbusPDUResult::InvalidArgument;
    }

    response->payload.function_code  = function_code | TF_MODBUS_PDU_EXCEPTION_BIT;
    response->payload.exception_code = static_cast<uint8_t>(exception_code);
    response->length                 = offsetof(TFModbusPDUResponsePayload, exception_sentinel);

    return TFModbusPDUResult::Success;
}

TFModbusPDUResult TFModbusPDUServer::encode_read_bits_response(TFModbusPDUFunctionCode function_code,
                                                               const bool *coil_values,
                                                               uint16_t data_count,
                                                               TFModbusPDUResponse *response) const
{
    if (response == nullptr || coil_values == nullptr
     || (function_code != TFModbusPDUFunctionCode::ReadCoils && function_code != TFModbusPDUFunctionCode::ReadDiscreteInputs)
     || data_count < TF_MODBUS_PDU_MIN_READ_COIL_COUNT
     || data_count > TF_MODBUS_PDU_MAX_READ_COIL_COUNT) {
        return TFModbusPDUResult::InvalidArgument;
    }

    size_t byte_count = TFModbusPDUUtil::get_coil_byte_count(data_count, TFModbusPDUCoilByteCount::Exact);

    response->payload.function_code = static_cast<uint8_t>(function_code);
    response->payload.byte_count    = static_cast<uint8_t>(byte_count);
    response->length                = offsetof(TFModbusPDUResponsePayload, coil_values) + byte_count;

    TFModbusPDUUtil::pack_coil_values(coil_values, data_count, response->payload.coil_values, byte_count);

    return TFModbusPDUResult::Success;
}

TFModbusPDUResult TFModbusPDUServer::encode_read_registers_response(TFModbusPDUFunctionCode function_code,
                                                                    const uint16_t *register_values,
                                                                    uint16_t data_count,
                                                                    TFModbusPDUResponse *response) const
{
    if (response == nullptr || register_values == nullptr
     || (function_code != TFModbusPDUFunctionCode::ReadHoldingRegisters && function_code != TFModbusPDUFunctionCode::ReadInputRegisters)
     || data_count < TF_MODBUS_PDU_MIN_READ_REGISTER_COUNT
     || data_count > TF_MODBUS_PDU_MAX_READ_REGISTER_COUNT) {
        return TFModbusPDUResult::InvalidArgument;
    }

    size_t byte_count = data_count * 2;

    response->payload.function_code = static_cast<uint8_t>(function_code);
    response->payload.byte_count    = static_cast<uint8_t>(byte_count);
    response->length                = offsetof(TFModbusPDUResponsePayload, register_values) + byte_count;

    if (register_byte_order == TFModbusPDUByteOrder::Host) {
        for (size_t i = 0; i < data_count; ++i) {
            response->payload.register_values[i] = htons(register_values[i]);
        }
    }
    else { // TFModbusPDUByteOrder::Network
        memcpy(response->payload.register_values, register_values, byte_count);
    }

    return TFModbusPDUResult::Success;
}

TFModbusPDUResult TFModbusPDUServer::encode_write_response(const TFModbusPDURequestInfo &request, TFModbusPDUResponse *response) const
{
    if (response == nullptr) {
        return TFModbusPDUResult::InvalidArgument;
    }

    switch (request.function_code) {
    case TFModbusPDUFunctionCode::WriteSingleCoil:
    case TFModbusPDUFunctionCode::WriteSingleRegister:
        response->payload.data_value = htons(request.data_value);
        break;

    case TFModbusPDUFunctionCode::WriteMultipleCoils:
    case TFModbusPDUFunctionCode::WriteMultipleRegisters:
        response->payload.data_count = htons(request.data_count);
        break;

    default:
        return TFModbusPDUResult::InvalidArgument;
    }

    response->payload.function_code = static_cast<uint8_t>(request.function_code);
    response->payload.start_address = htons(request.start_address);
    response->length                = offsetof(TFModbusPDUResponsePayload, write_sentinel);

    return TFModbusPDUResult::Success;
}

TFModbusPDUResult TFModbusPDUServer::handle_request(uint8_t slave_id,
                                                    const uint8_t *bytes,
                                                    size_t length,
                                                    const TFModbusPDURouteTable &route_table,
                                                    const TFModbusPDUServerRequestCallback &request_callback,
                                                    TFModbusPDUResponse *response) const
{
    if (!request_callback || response == nullptr) {
        return TFModbusPDUResult::InvalidArgument;
    }

    TFModbusPDURequestInfo request;
    TFModbusPDUResult result = decode_request(bytes, length, &request);

    if (result == TFModbusPDUResult::InvalidArgument || result == TFModbusPDUResult::MalformedRequest) {
        debugfln("handle_request(slave_id=%u length=%zu) no response possible: %s",
                 slave_id, length, get_tf_modbus_pdu_result_name(result));
        return result;
    }

    if (result != TFModbusPDUResult::Success) {
        return encode_exception_response(bytes[0], static_cast<TFModbusPDUExceptionCode>(result), response);
    }

    void *endpoint = resolve_endpoint(route_table, slave_id, bytes[0], request.start_address, request.data_count);

    if (endpoint == nullptr) {
        debugfln("handle_request(slave_id=%u function_code=%s start_address=%u data_count=%u) no route",
                 slave_id, get_tf_modbus_pdu_function_code_name(request.function_code), request.start_address, request.data_count);

        return encode_exception_response(bytes[0], TFModbusPDUExceptionCode::IllegalDataAddress, response);
    }

    TFModbusPDUExceptionCode exception_code = TFModbusPDUExceptionCode::Success;

    switch (request.function_code) {
    case TFModbusPDUFunctionCode::ReadCoils:
    case TFModbusPDUFunctionCode::ReadDiscreteInputs:
        {
            bool coil_values[TF_MODBUS_PDU_MAX_READ_COIL_COUNT] = {};

            exception_code = request_callback(endpoint, slave_id, request.function_code, request.start_address, request.data_count, coil_values);

            if (exception_code == TFModbusPDUExceptionCode::Success) {
                return encode_read_bits_response(request.function_code, coil_values, request.data_count, response);
            }
        }

        break;

    case TFModbusPDUFunctionCode::ReadHoldingRegisters:
    case TFModbusPDUFunctionCode::ReadInputRegisters:
        {
            uint16_t register_values[TF_MODBUS_PDU_MAX_READ_REGISTER_COUNT] = {};

            exception_code = request_callback(endpoint, slave_id, request.function_code, request.start_address, request.data_count, register_values);

            if (exception_code == TFModbusPDUExceptionCode::Success) {
                return encode_read_registers_response(request.function_code, register_values, request.data_count, response);
            }
        }

        break;

    case TFModbusPDUFunctionCode::WriteSingleCoil:
    case TFModbusPDUFunctionCode::WriteMultipleCoils:
        exception_code = request_callback(endpoint, slave_id, TFModbusPDUFunctionCode::WriteMultipleCoils,
                                          request.start_address, request.data_count, request.coil_values);
        break;

    case TFModbusPDUFunctionCode::WriteSingleRegister:
    case TFModbusPDUFunctionCode::WriteMultipleRegisters:
        exception_code = request_callback(endpoint, slave_id, TFModbusPDUFunctionCode::WriteMultipleRegisters,
                                          request.start_address, request.data_count, request.register_values);
        break;
    }

    if (exception_code != TFModbusPDUExceptionCode::Success) {
        debugfln("handle_request(slave_id=%u function_code=%s) request callback failed: %s",
                 slave_id, get_tf_modbus_pdu_function_code_name(request.function_code), get_tf_modbus_pdu_exception_code_name(exception_code));

        return encode_exception_response(bytes[0], exception_code, response);
    }

    return encode_write_response(request, response);
}

void *TFModbusPDUServer::resolve_endpoint(const TFModbusPDURouteTable &route_table,
                                          uint8_t slave_id,
                                          uint8_t function_code,
                                          uint16_t start_address,
                                          uint16_t data_count) const
{
    if (static_cast<uint32_t>(start_address) + data_count > TF_MODBUS_PDU_MAX_DATA_COUNT + 1u) {
        return nullptr;
    }

    void *endpoint = route_table.match(slave_id, function_code, start_address);

    if (endpoint == nullptr) {
        return nullptr;
    }

    for (uint32_t i = 1; i < data_count; ++i) {
        if (route_table.match(slave_id, function_code, static_cast<uint16_t>(start_address + i)) != endpoint) {
            return nullptr;
        }
    }

    return endpoint;
}
