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
#include <functional>

#include "TFModbusPDUCommon.h"
#include "TFModbusPDURouteTable.h"

struct TFModbusPDURequestInfo
{
    TFModbusPDUFunctionCode function_code;
    uint16_t start_address;
    uint16_t data_count; // 1 for Write Single Coil (5) and Write Single Register (6)
    uint16_t data_value; // as received, Write Single Coil (5) and Write Single Register (6)
    bool coil_values[TF_MODBUS_PDU_MAX_WRITE_COIL_COUNT];             // Write Single Coil (5),
                                                                      // Write Multiple Coils (15)
    uint16_t register_values[TF_MODBUS_PDU_MAX_WRITE_REGISTER_COUNT]; // Write Single Register (6),
                                                                      // Write Multiple Registers (16)
};

// data_values is bool * for coils and discrete inputs and uint16_t * for
// registers. Single writes are reported as Write Multiple Coils (15) and
// Write Multiple Registers (16) with a data count of 1.
typedef std::function<TFModbusPDUExceptionCode(void *endpoint,
                                               uint8_t slave_id,
                                               TFModbusPDUFunctionCode function_code,
                                               uint16_t start_address,
                                               uint16_t data_count,
                                               void *data_values)> TFModbusPDUServerRequestCallback;

class TFModbusPDUServer final
{
public:
    TFModbusPDUServer(TFModbusPDUByteOrder register_byte_order_ = TFModbusPDUByteOrder::Host) : register_byte_order(register_byte_order_) {}

    // Returns MalformedRequest if the PDU cannot be parsed, the Modbus*
    // result matching the exception code to answer with if it is invalid
    // and Success otherwise.
    TFModbusPDUResult decode_request(const uint8_t *bytes, size_t length, TFModbusPDURequestInfo *request) const;

    TFModbusPDUResult encode_exception_response(uint8_t function_code,
                                                TFModbusPDUExceptionCode exception_code,
                                                TFModbusPDUResponse *response) const;
    TFModbusPDUResult encode_read_bits_response(TFModbusPDUFunctionCode function_code,
                                                const bool *coil_values,
                                                uint16_t data_count,
                                                TFModbusPDUResponse *response) const;
    TFModbusPDUResult encode_read_registers_response(TFModbusPDUFunctionCode function_code,
                                                     const uint16_t *register_values,
                                                     uint16_t data_count,
                                                     TFModbusPDUResponse *response) const;
    TFModbusPDUResult encode_write_response(const TFModbusPDURequestInfo &request, TFModbusPDUResponse *response) const;

    // Decodes the request, routes it by its start address and builds the
    // response. Every address of the request has to resolve to the same
    // endpoint, otherwise IllegalDataAddress is answered. Returns
    // MalformedRequest if no response can be given.
    TFModbusPDUResult handle_request(uint8_t slave_id,
                                     const uint8_t *bytes,
                                     size_t length,
                                     const TFModbusPDURouteTable &route_table,
                                     const TFModbusPDUServerRequestCallback &request_callback,
                                     TFModbusPDUResponse *response) const;

private:
    void *resolve_endpoint(const TFModbusPDURouteTable &route_table,
                           uint8_t slave_id,
                           uint8_t function_code,
                           uint16_t start_address,
                           uint16_t data_count) const;

    TFModbusPDUByteOrder register_byte_order;
};
