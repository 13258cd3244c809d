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

#include "TFModbusPDUUtil.h"

#include <stdio.h>
#include <stdarg.h>
#include <string.h>

const char *TFModbusPDUUtil::printf_safe(const char *string)
{
    return string != nullptr ? string : "[nullptr]";
}

static void vlogfln_dummy(const char *fmt, va_list args)
{
    (void)fmt;
    (void)args;
}

TFModbusPDUUtilVLogFLnFunction TFModbusPDUUtil::vlogfln = vlogfln_dummy;

void TFModbusPDUUtil::logfln(const char *fmt, ...)
{
    va_list args;

    va_start(args, fmt);
    vlogfln(fmt, args);
    va_end(args);
}

size_t TFModbusPDUUtil::get_coil_byte_count(size_t coil_count, TFModbusPDUCoilByteCount coil_byte_count)
{
    switch (coil_byte_count) {
    case TFModbusPDUCoilByteCount::Exact:
        return (coil_count + 7) / 8;

    case TFModbusPDUCoilByteCount::Legacy:
        return coil_count / 8 + 1;
    }

    return (coil_count + 7) / 8;
}

void TFModbusPDUUtil::pack_coil_values(const bool *coil_values, size_t coil_count, uint8_t *bytes, size_t byte_count)
{
    memset(bytes, 0, byte_count);

    for (size_t i = 0; i < coil_count && i / 8 < byte_count; ++i) {
        if (coil_values[i]) {
            bytes[i / 8] |= static_cast<uint8_t>(1u << (i % 8));
        }
    }
}

void TFModbusPDUUtil::unpack_coil_values(const uint8_t *bytes, size_t coil_count, bool *coil_values)
{
    for (size_t i = 0; i < coil_count; ++i) {
        coil_values[i] = ((bytes[i / 8] >> (i % 8)) & 1) != 0;
    }
}
