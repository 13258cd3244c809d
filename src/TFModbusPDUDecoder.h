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

#include "TFModbusPDUCommon.h"

enum class TFModbusPDUResponseKind
{
    Normal,
    Exception,
};

const char *get_tf_modbus_pdu_response_kind_name(TFModbusPDUResponseKind kind);

struct TFModbusPDUDecodedResponse
{
    TFModbusPDUResponseKind kind = TFModbusPDUResponseKind::Normal;
    uint8_t function_code        = 0; // exception bit cleared
    uint8_t exception_code       = 0; // Exception only, unrecognized codes are kept as received
    const uint8_t *data          = nullptr; // Normal only, points into the decoded bytes
    size_t data_length           = 0;
};

class TFModbusPDUDecoder final
{
public:
    TFModbusPDUDecoder(TFModbusPDUByteOrder register_byte_order_ = TFModbusPDUByteOrder::Host) : register_byte_order(register_byte_order_) {}

    // Returns Success for a normal response, the Modbus* classification for an
    // exception response and MalformedResponse for less than two bytes.
    TFModbusPDUResult decode_response(const uint8_t *bytes, size_t length, TFModbusPDUDecodedResponse *response) const;

    // The parse functions validate the response against the request it
    // answers. coil_values and register_values may be null to only validate.
    TFModbusPDUResult parse_read_bits_response(TFModbusPDUFunctionCode function_code,
                                               uint16_t data_count,
                                               const uint8_t *bytes,
                                               size_t length,
                                               bool *coil_values) const;
    TFModbusPDUResult parse_read_registers_response(TFModbusPDUFunctionCode function_code,
                                                    uint16_t data_count,
                                                    const uint8_t *bytes,
                                                    size_t length,
                                                    uint16_t *register_values) const;
    TFModbusPDUResult parse_write_single_coil_response(uint16_t address,
                                                       bool coil_value,
                                                       const uint8_t *bytes,
                                                       size_t length) const;
    TFModbusPDUResult parse_write_single_register_response(uint16_t address,
                                                           uint16_t register_value,
                                                           const uint8_t *bytes,
                                                           size_t length) const;
    TFModbusPDUResult parse_write_multiple_response(TFModbusPDUFunctionCode function_code,
                                                    uint16_t start_address,
                                                    uint16_t data_count,
                                                    const uint8_t *bytes,
                                                    size_t length) const;

private:
    TFModbusPDUResult load_response(TFModbusPDUFunctionCode function_code,
                                    const uint8_t *bytes,
                                    size_t length,
                                    size_t expected_length,
                                    TFModbusPDUResponsePayload *payload) const;
    TFModbusPDUResult check_write_echo(TFModbusPDUFunctionCode function_code,
                                       uint16_t start_address,
                                       const uint8_t *bytes,
                                       size_t length,
                                       TFModbusPDUResponsePayload *payload) const;

    TFModbusPDUByteOrder register_byte_order;
};
