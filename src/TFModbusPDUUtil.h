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

#include <stdint.h>
#include <stdarg.h>
#include <stddef.h>
#include <functional>

#include "TFModbusPDUCommon.h"

// configuration
#ifndef TF_MODBUS_PDU_UTIL_DEBUG_LOG
#define TF_MODBUS_PDU_UTIL_DEBUG_LOG 0
#endif

#if TF_MODBUS_PDU_UTIL_DEBUG_LOG
#define tf_modbus_pdu_util_debugfln(fmt, ...) TFModbusPDUUtil::logfln(fmt __VA_OPT__(,) __VA_ARGS__)
#else
#define tf_modbus_pdu_util_debugfln(fmt, ...) do {} while (0)
#endif

typedef std::function<void(const char *fmt, va_list args)> TFModbusPDUUtilVLogFLnFunction;

namespace TFModbusPDUUtil
{
    const char *printf_safe(const char *string);

    extern TFModbusPDUUtilVLogFLnFunction vlogfln;
    [[gnu::format(__printf__, 1, 2)]] void logfln(const char *fmt, ...);

    size_t get_coil_byte_count(size_t coil_count, TFModbusPDUCoilByteCount coil_byte_count);

    // Bit 0 of each byte is the first coil of its group of 8. Trailing bits are zero.
    void pack_coil_values(const bool *coil_values, size_t coil_count, uint8_t *bytes, size_t byte_count);
    void unpack_coil_values(const uint8_t *bytes, size_t coil_count, bool *coil_values);
};
