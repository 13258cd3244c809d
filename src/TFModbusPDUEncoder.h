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

// Builds request PDUs. Without check_limits only values that the wire format
// cannot represent are rejected, quantities outside the Modbus limits are left
// for the server to answer with an exception response.
class TFModbusPDUEncoder final
{
public:
    TFModbusPDUEncoder(TFModbusPDUByteOrder register_byte_order_ = TFModbusPDUByteOrder::Host,
                       TFModbusPDUCoilByteCount coil_byte_count_ = TFModbusPDUCoilByteCount::Exact,
                       bool check_limits_ = false) :
        register_byte_order(register_byte_order_), coil_byte_count(coil_byte_count_), check_limits(check_limits_) {}

    TFModbusPDUResult read_coils(uint16_t start_address, uint16_t data_count, TFModbusPDURequest *request) const;
    TFModbusPDUResult read_discrete_inputs(uint16_t start_address, uint16_t data_count, TFModbusPDURequest *request) const;
    TFModbusPDUResult read_holding_registers(uint16_t start_address, uint16_t data_count, TFModbusPDURequest *request) const;
    TFModbusPDUResult read_input_registers(uint16_t start_address, uint16_t data_count, TFModbusPDURequest *request) const;

    TFModbusPDUResult write_single_coil(uint16_t address, bool coil_value, TFModbusPDURequest *request) const;
    TFModbusPDUResult write_single_register(uint16_t address, uint16_t register_value, TFModbusPDURequest *request) const;

    TFModbusPDUResult write_multiple_coils(uint16_t start_address,
                                           const bool *coil_values,
                                           size_t coil_count,
                                           TFModbusPDURequest *request) const;
    TFModbusPDUResult write_multiple_registers(uint16_t start_address,
                                               const uint16_t *register_values,
                                               size_t register_count,
                                               TFModbusPDURequest *request) const;

    TFModbusPDUByteOrder get_register_byte_order() const { return register_byte_order; }
    TFModbusPDUCoilByteCount get_coil_byte_count() const { return coil_byte_count; }
    bool get_check_limits() const { return check_limits; }

private:
    TFModbusPDUResult encode_read(TFModbusPDUFunctionCode function_code,
                                  uint16_t start_address,
                                  uint16_t data_count,
                                  uint16_t min_data_count,
                                  uint16_t max_data_count,
                                  TFModbusPDURequest *request) const;

    TFModbusPDUByteOrder register_byte_order;
    TFModbusPDUCoilByteCount coil_byte_count;
    bool check_limits;
};
