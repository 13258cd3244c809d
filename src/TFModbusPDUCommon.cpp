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

#include "TFModbusPDUCommon.h"

#include <stddef.h>

static_assert(sizeof(TFModbusPDURequestPayload) == TF_MODBUS_PDU_MAX_LENGTH, "TFModbusPDURequestPayload has unexpected size");
static_assert(offsetof(TFModbusPDURequestPayload, function_code)   == 0, "TFModbusPDURequestPayload::function_code has unexpected offset");
static_assert(offsetof(TFModbusPDURequestPayload, start_address)   == 1, "TFModbusPDURequestPayload::start_address has unexpected offset");
static_assert(offsetof(TFModbusPDURequestPayload, data_count)      == 3, "TFModbusPDURequestPayload::data_count has unexpected offset");
static_assert(offsetof(TFModbusPDURequestPayload, data_value)      == 3, "TFModbusPDURequestPayload::data_value has unexpected offset");
static_assert(offsetof(TFModbusPDURequestPayload, byte_count)      == 5, "TFModbusPDURequestPayload::byte_count has unexpected offset");
static_assert(offsetof(TFModbusPDURequestPayload, coil_values)     == 6, "TFModbusPDURequestPayload::coil_values has unexpected offset");
static_assert(offsetof(TFModbusPDURequestPayload, register_values) == 6, "TFModbusPDURequestPayload::register_values has unexpected offset");
static_assert(offsetof(TFModbusPDURequestPayload, bytes)           == 0, "TFModbusPDURequestPayload::bytes has unexpected offset");

static_assert(sizeof(TFModbusPDUResponsePayload) == TF_MODBUS_PDU_MAX_LENGTH, "TFModbusPDUResponsePayload has unexpected size");
static_assert(offsetof(TFModbusPDUResponsePayload, function_code)   == 0, "TFModbusPDUResponsePayload::function_code has unexpected offset");
static_assert(offsetof(TFModbusPDUResponsePayload, exception_code)  == 1, "TFModbusPDUResponsePayload::exception_code has unexpected offset");
static_assert(offsetof(TFModbusPDUResponsePayload, byte_count)      == 1, "TFModbusPDUResponsePayload::byte_count has unexpected offset");
static_assert(offsetof(TFModbusPDUResponsePayload, coil_values)     == 2, "TFModbusPDUResponsePayload::coil_values has unexpected offset");
static_assert(offsetof(TFModbusPDUResponsePayload, register_values) == 2, "TFModbusPDUResponsePayload::register_values has unexpected offset");
static_assert(offsetof(TFModbusPDUResponsePayload, start_address)   == 1, "TFModbusPDUResponsePayload::start_address has unexpected offset");
static_assert(offsetof(TFModbusPDUResponsePayload, data_value)      == 3, "TFModbusPDUResponsePayload::data_value has unexpected offset");
static_assert(offsetof(TFModbusPDUResponsePayload, data_count)      == 3, "TFModbusPDUResponsePayload::data_count has unexpected offset");
static_assert(offsetof(TFModbusPDUResponsePayload, bytes)           == 0, "TFModbusPDUResponsePayload::bytes has unexpected offset");

const char *get_tf_modbus_pdu_byte_order_name(TFModbusPDUByteOrder byte_order)
{
    switch (byte_order) {
    case TFModbusPDUByteOrder::Host:
        return "Host";

    case TFModbusPDUByteOrder::Network:
        return "Network";
    }

    return "<Unknown>";
}

const char *get_tf_modbus_pdu_coil_byte_count_name(TFModbusPDUCoilByteCount coil_byte_count)
{
    switch (coil_byte_count) {
    case TFModbusPDUCoilByteCount::Exact:
        return "Exact";

    case TFModbusPDUCoilByteCount::Legacy:
        return "Legacy";
    }

    return "<Unknown>";
}

const char *get_tf_modbus_pdu_function_code_name(TFModbusPDUFunctionCode function_code)
{
    switch (function_code) {
    case TFModbusPDUFunctionCode::ReadCoils:
        return "ReadCoils";

    case TFModbusPDUFunctionCode::ReadDiscreteInputs:
        return "ReadDiscreteInputs";

    case TFModbusPDUFunctionCode::ReadHoldingRegisters:
        return "ReadHoldingRegisters";

    case TFModbusPDUFunctionCode::ReadInputRegisters:
        return "ReadInputRegisters";

    case TFModbusPDUFunctionCode::WriteSingleCoil:
        return "WriteSingleCoil";

    case TFModbusPDUFunctionCode::WriteSingleRegister:
        return "WriteSingleRegister";

    case TFModbusPDUFunctionCode::WriteMultipleCoils:
        return "WriteMultipleCoils";

    case TFModbusPDUFunctionCode::WriteMultipleRegisters:
        return "WriteMultipleRegisters";
    }

    return "<Unknown>";
}

bool is_tf_modbus_pdu_function_code_supported(uint8_t function_code)
{
    switch (static_cast<TFModbusPDUFunctionCode>(function_code)) {
    case TFModbusPDUFunctionCode::ReadCoils:
    case TFModbusPDUFunctionCode::ReadDiscreteInputs:
    case TFModbusPDUFunctionCode::ReadHoldingRegisters:
    case TFModbusPDUFunctionCode::ReadInputRegisters:
    case TFModbusPDUFunctionCode::WriteSingleCoil:
    case TFModbusPDUFunctionCode::WriteSingleRegister:
    case TFModbusPDUFunctionCode::WriteMultipleCoils:
    case TFModbusPDUFunctionCode::WriteMultipleRegisters:
        return true;
    }

    return false;
}

const char *get_tf_modbus_pdu_exception_code_name(TFModbusPDUExceptionCode exception_code)
{
    switch (exception_code) {
    case TFModbusPDUExceptionCode::Success:
        return "Success";

    case TFModbusPDUExceptionCode::IllegalFunction:
        return "IllegalFunction";

    case TFModbusPDUExceptionCode::IllegalDataAddress:
        return "IllegalDataAddress";

    case TFModbusPDUExceptionCode::IllegalDataValue:
        return "IllegalDataValue";

    case TFModbusPDUExceptionCode::ServerDeviceFailure:
        return "ServerDeviceFailure";

    case TFModbusPDUExceptionCode::Acknowledge:
        return "Acknowledge";

    case TFModbusPDUExceptionCode::ServerDeviceBusy:
        return "ServerDeviceBusy";

    case TFModbusPDUExceptionCode::MemoryParityError:
        return "MemoryParityError";

    case TFModbusPDUExceptionCode::GatewayPathUnvailable:
        return "GatewayPathUnvailable";

    case TFModbusPDUExceptionCode::GatewayTargetDeviceFailedToRespond:
        return "GatewayTargetDeviceFailedToRespond";
    }

    return "<Unknown>";
}

const char *get_tf_modbus_pdu_result_name(TFModbusPDUResult result)
{
    switch (result) {
    case TFModbusPDUResult::Success:
        return "Success";

    case TFModbusPDUResult::ModbusIllegalFunction:
        return "ModbusIllegalFunction";

    case TFModbusPDUResult::ModbusIllegalDataAddress:
        return "ModbusIllegalDataAddress";

    case TFModbusPDUResult::ModbusIllegalDataValue:
        return "ModbusIllegalDataValue";

    case TFModbusPDUResult::ModbusServerDeviceFailure:
        return "ModbusServerDeviceFailure";

    case TFModbusPDUResult::ModbusAcknowledge:
        return "ModbusAcknowledge";

    case TFModbusPDUResult::ModbusServerDeviceBusy:
        return "ModbusServerDeviceBusy";

    case TFModbusPDUResult::ModbusMemoryParityError:
        return "ModbusMemoryParityError";

    case TFModbusPDUResult::ModbusGatewayPathUnvailable:
        return "ModbusGatewayPathUnvailable";

    case TFModbusPDUResult::ModbusGatewayTargetDeviceFailedToRespond:
        return "ModbusGatewayTargetDeviceFailedToRespond";

    case TFModbusPDUResult::ModbusUnknownException:
        return "ModbusUnknownException";

    case TFModbusPDUResult::InvalidArgument:
        return "InvalidArgument";

    case TFModbusPDUResult::MalformedRequest:
        return "MalformedRequest";

    case TFModbusPDUResult::MalformedResponse:
        return "MalformedResponse";

    case TFModbusPDUResult::ResponseLongerThanMaximum:
        return "ResponseLongerThanMaximum";

    case TFModbusPDUResult::ResponseFunctionCodeMismatch:
        return "ResponseFunctionCodeMismatch";

    case TFModbusPDUResult::ResponseFunctionCodeNotSupported:
        return "ResponseFunctionCodeNotSupported";

    case TFModbusPDUResult::ResponseByteCountMismatch:
        return "ResponseByteCountMismatch";

    case TFModbusPDUResult::ResponseStartAddressMismatch:
        return "ResponseStartAddressMismatch";

    case TFModbusPDUResult::ResponseDataValueMismatch:
        return "ResponseDataValueMismatch";

    case TFModbusPDUResult::ResponseDataCountMismatch:
        return "ResponseDataCountMismatch";

    case TFModbusPDUResult::ResponseShorterThanExpected:
        return "ResponseShorterThanExpected";
    }

    return "<Unknown>";
}

TFModbusPDUResult get_tf_modbus_pdu_result_from_exception_code(uint8_t exception_code)
{
    switch (static_cast<TFModbusPDUExceptionCode>(exception_code)) {
    case TFModbusPDUExceptionCode::IllegalFunction:
    case TFModbusPDUExceptionCode::IllegalDataAddress:
    case TFModbusPDUExceptionCode::IllegalDataValue:
    case TFModbusPDUExceptionCode::ServerDeviceFailure:
    case TFModbusPDUExceptionCode::Acknowledge:
    case TFModbusPDUExceptionCode::ServerDeviceBusy:
    case TFModbusPDUExceptionCode::MemoryParityError:
    case TFModbusPDUExceptionCode::GatewayPathUnvailable:
    case TFModbusPDUExceptionCode::GatewayTargetDeviceFailedToRespond:
        return static_cast<TFModbusPDUResult>(exception_code);

    case TFModbusPDUExceptionCode::Success:
        break;
    }

    return TFModbusPDUResult::ModbusUnknownException;
}
