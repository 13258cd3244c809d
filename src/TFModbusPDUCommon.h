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

#pragma once

#include <stddef.h>
#include <stdint.h>

// Modbus protocol limits
#define TF_MODBUS_PDU_MIN_LENGTH                   2u
#define TF_MODBUS_PDU_MAX_LENGTH                   253u
#define TF_MODBUS_PDU_EXCEPTION_BIT                0x80u
#define TF_MODBUS_PDU_FUNCTION_CODE_MASK           0x7Fu
#define TF_MODBUS_PDU_COIL_ON                      0xFFFFu
#define TF_MODBUS_PDU_COIL_ON_STANDARD             0xFF00u
#define TF_MODBUS_PDU_COIL_OFF                     0x0000u
#define TF_MODBUS_PDU_MIN_READ_COIL_COUNT          1u
#define TF_MODBUS_PDU_MAX_READ_COIL_COUNT          2000u
#define TF_MODBUS_PDU_MIN_READ_COIL_BYTE_COUNT     1u
#define TF_MODBUS_PDU_MAX_READ_COIL_BYTE_COUNT     ((TF_MODBUS_PDU_MAX_READ_COIL_COUNT + 7u) / 8u)
#define TF_MODBUS_PDU_MIN_WRITE_COIL_COUNT         1u
#define TF_MODBUS_PDU_MAX_WRITE_COIL_COUNT         1968u
#define TF_MODBUS_PDU_MIN_WRITE_COIL_BYTE_COUNT    1u
#define TF_MODBUS_PDU_MAX_WRITE_COIL_BYTE_COUNT    ((TF_MODBUS_PDU_MAX_WRITE_COIL_COUNT + 7u) / 8u)
#define TF_MODBUS_PDU_MIN_READ_REGISTER_COUNT      1u
#define TF_MODBUS_PDU_MAX_READ_REGISTER_COUNT      125u
#define TF_MODBUS_PDU_MIN_WRITE_REGISTER_COUNT     1u
#define TF_MODBUS_PDU_MAX_WRITE_REGISTER_COUNT     123u

// wire format, a request PDU has to fit into TF_MODBUS_PDU_MAX_LENGTH
#define TF_MODBUS_PDU_MAX_DATA_COUNT               65535u
#define TF_MODBUS_PDU_REQUEST_BEFORE_DATA_LENGTH   6u
#define TF_MODBUS_PDU_MAX_REQUEST_DATA_LENGTH      (TF_MODBUS_PDU_MAX_LENGTH - TF_MODBUS_PDU_REQUEST_BEFORE_DATA_LENGTH)
#define TF_MODBUS_PDU_MAX_ENCODED_REGISTER_COUNT   (TF_MODBUS_PDU_MAX_REQUEST_DATA_LENGTH / 2u)

enum class TFModbusPDUByteOrder
{
    Host,
    Network,
};

const char *get_tf_modbus_pdu_byte_order_name(TFModbusPDUByteOrder byte_order);

// Exact is ceil(count / 8). Legacy is count / 8 + 1 as emitted by older
// deployments, it adds a zero byte if count is a multiple of 8.
enum class TFModbusPDUCoilByteCount
{
    Exact,
    Legacy,
};

const char *get_tf_modbus_pdu_coil_byte_count_name(TFModbusPDUCoilByteCount coil_byte_count);

enum class TFModbusPDUFunctionCode : uint8_t
{
    ReadCoils              = 1,
    ReadDiscreteInputs     = 2,
    ReadHoldingRegisters   = 3,
    ReadInputRegisters     = 4,
    WriteSingleCoil        = 5,
    WriteSingleRegister    = 6,
    WriteMultipleCoils     = 15,
    WriteMultipleRegisters = 16,
};

const char *get_tf_modbus_pdu_function_code_name(TFModbusPDUFunctionCode function_code);
bool is_tf_modbus_pdu_function_code_supported(uint8_t function_code);

enum class TFModbusPDUExceptionCode : uint8_t
{
    Success                            = 0,

    IllegalFunction                    = 0x01,
    IllegalDataAddress                 = 0x02,
    IllegalDataValue                   = 0x03,
    ServerDeviceFailure                = 0x04,
    Acknowledge                        = 0x05,
    ServerDeviceBusy                   = 0x06,
    MemoryParityError                  = 0x08,
    GatewayPathUnvailable              = 0x0A,
    GatewayTargetDeviceFailedToRespond = 0x0B,
};

const char *get_tf_modbus_pdu_exception_code_name(TFModbusPDUExceptionCode exception_code);

enum class TFModbusPDUResult
{
    Success = 0,

    // exception responses, same value as the exception code
    ModbusIllegalFunction                    = 0x01,
    ModbusIllegalDataAddress                 = 0x02,
    ModbusIllegalDataValue                   = 0x03,
    ModbusServerDeviceFailure                = 0x04,
    ModbusAcknowledge                        = 0x05,
    ModbusServerDeviceBusy                   = 0x06,
    ModbusMemoryParityError                  = 0x08,
    ModbusGatewayPathUnvailable              = 0x0A,
    ModbusGatewayTargetDeviceFailedToRespond = 0x0B,
    ModbusUnknownException                   = 0xFF,

    InvalidArgument = 256,
    MalformedRequest,
    MalformedResponse,
    ResponseLongerThanMaximum,
    ResponseFunctionCodeMismatch,
    ResponseFunctionCodeNotSupported,
    ResponseByteCountMismatch,
    ResponseStartAddressMismatch,
    ResponseDataValueMismatch,
    ResponseDataCountMismatch,
    ResponseShorterThanExpected,
};

const char *get_tf_modbus_pdu_result_name(TFModbusPDUResult result);
TFModbusPDUResult get_tf_modbus_pdu_result_from_exception_code(uint8_t exception_code);

#if defined(__GNUC__)
    #pragma GCC diagnostic push
    #pragma GCC diagnostic ignored "-Wattributes"
    #pragma GCC diagnostic ignored "-Wpedantic"
#endif

union TFModbusPDURequestPayload
{
    struct [[gnu::packed]] {
        uint8_t function_code;
        uint16_t start_address;  // Read Coils (1),
                                 // Read Discrete Inputs (2),
                                 // Read Holding Registers (3),
                                 // Read Input Registers(4),
                                 // Write Single Coil (5),
                                 // Write Single Register (6),
                                 // Write Multiple Coils (15),
                                 // Write Multiple Registers (16)
        union {
            uint16_t data_count; // Read Coils (1),
                                 // Read Discrete Inputs (2),
                                 // Read Holding Registers (3),
                                 // Read Input Registers (4),
                                 // Write Multiple Coils (15),
                                 // Write Multiple registers (16)
            uint16_t data_value; // Write Single Coil (5),
                                 // Write Single Register (6)
        };
        uint8_t byte_count;      // Write Multiple Coils (15),
                                 // Write Multiple Registers (16)
        union [[gnu::packed]] {  // odd length, a legacy coil byte count can fill all of it
            uint8_t coil_values[TF_MODBUS_PDU_MAX_REQUEST_DATA_LENGTH];         // Write Multiple Coils (15),
            uint16_t register_values[TF_MODBUS_PDU_MAX_ENCODED_REGISTER_COUNT]; // Write Multiple Registers (16)
        };
    };
    uint8_t bytes[TF_MODBUS_PDU_MAX_LENGTH];
};

union TFModbusPDUResponsePayload
{
    struct [[gnu::packed]] {
        uint8_t function_code;
        union {
            struct [[gnu::packed]] {
                union {
                    uint8_t exception_code;
                    uint8_t byte_count;  // Read Coils (1),
                                         // Read Discrete Inputs (2),
                                         // Read Holding Registers (3),
                                         // Read Input Registers (4)
                };
                union {
                    uint8_t coil_values[TF_MODBUS_PDU_MAX_READ_COIL_BYTE_COUNT];     // Read Coils (1),
                                                                                     // Read Discrete Inputs (2)
                    uint16_t register_values[TF_MODBUS_PDU_MAX_READ_REGISTER_COUNT]; // Read Holding Registers (3),
                                                                                     // Read Input Registers (4)
                    uint8_t exception_sentinel;                                      // Not part of the actual protocol, there for offsetof() calculations
                };
            };
            struct [[gnu::packed]] {
                uint16_t start_address;  // Write Single Coil (5),
                                         // Write Single Register (6),
                                         // Write Multiple Coils (15),
                                         // Write Multiple Registers (16)
                union {
                    uint16_t data_value; // Write Single Coil (5),
                                         // Write Single Register (6)
                    uint16_t data_count; // Write Multiple Coils (15),
                                         // Write Multiple Registers (16)
                };
                uint8_t write_sentinel;  // Not part of the actual protocol, there for offsetof() calculations
            };
        };
    };
    uint8_t bytes[TF_MODBUS_PDU_MAX_LENGTH];
};

#if defined(__GNUC__)
    #pragma GCC diagnostic pop
#endif

// An encoded PDU, only the first length bytes of payload are valid
struct TFModbusPDURequest
{
    TFModbusPDURequestPayload payload;
    size_t length = 0;
};

struct TFModbusPDUResponse
{
    TFModbusPDUResponsePayload payload;
    size_t length = 0;
};
