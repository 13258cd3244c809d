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

#include "TFModbusPDURouteTable.h"

#include <errno.h>
#include <string.h>
#include <algorithm>

#include "TFModbusPDUUtil.h"

#define debugfln(fmt, ...) tf_modbus_pdu_util_debugfln("TFModbusPDURouteTable[%p]::" fmt, static_cast<const void *>(this) __VA_OPT__(,) __VA_ARGS__)

const char *get_tf_modbus_pdu_route_constraint_kind_name(TFModbusPDURouteConstraintKind kind)
{
    switch (kind) {
    case TFModbusPDURouteConstraintKind::Any:
        return "Any";

    case TFModbusPDURouteConstraintKind::OneOf:
        return "OneOf";

    case TFModbusPDURouteConstraintKind::Range:
        return "Range";
    }

    return "<Unknown>";
}

const char *get_tf_modbus_pdu_route_table_state_name(TFModbusPDURouteTableState state)
{
    switch (state) {
    case TFModbusPDURouteTableState::Building:
        return "Building";

    case TFModbusPDURouteTableState::Sealed:
        return "Sealed";
    }

    return "<Unknown>";
}

TFModbusPDURouteConstraint TFModbusPDURouteConstraint::any()
{
    return TFModbusPDURouteConstraint();
}

TFModbusPDURouteConstraint TFModbusPDURouteConstraint::one_of(std::initializer_list<uint16_t> values)
{
    return one_of(values.begin(), values.size());
}

TFModbusPDURouteConstraint TFModbusPDURouteConstraint::one_of(const uint16_t *values, size_t value_count)
{
    TFModbusPDURouteConstraint constraint;

    constraint.kind = TFModbusPDURouteConstraintKind::OneOf;

    if (values != nullptr) {
        constraint.values.assign(values, values + value_count);
    }

    std::sort(constraint.values.begin(), constraint.values.end());
    constraint.values.erase(std::unique(constraint.values.begin(), constraint.values.end()), constraint.values.end());

    return constraint;
}

TFModbusPDURouteConstraint TFModbusPDURouteConstraint::range(uint16_t first_value, uint16_t last_value)
{
    TFModbusPDURouteConstraint constraint;

    constraint.kind        = TFModbusPDURouteConstraintKind::Range;
    constraint.first_value = first_value;
    constraint.last_value  = last_value;

    return constraint;
}

size_t TFModbusPDURouteConstraint::get_value_count() const
{
    switch (kind) {
    case TFModbusPDURouteConstraintKind::Any:
        return 0;

    case TFModbusPDURouteConstraintKind::OneOf:
        return values.size();

    case TFModbusPDURouteConstraintKind::Range:
        if (first_value > last_value) {
            return 0;
        }

        return static_cast<size_t>(last_value - first_value) + 1;
    }

    return 0;
}

bool TFModbusPDURouteConstraint::matches(uint16_t value) const
{
    switch (kind) {
    case TFModbusPDURouteConstraintKind::Any:
        return true;

    case TFModbusPDURouteConstraintKind::OneOf:
        return std::binary_search(values.begin(), values.end(), value);

    case TFModbusPDURouteConstraintKind::Range:
        return value >= first_value && value <= last_value;
    }

    return false;
}

TFModbusPDURouteTable::TFModbusPDURouteTable()
{
    memset(rules, 0, sizeof(rules));
}

TFModbusPDURouteTable::~TFModbusPDURouteTable()
{
    for (size_t i = 0; i < rule_count; ++i) {
        delete rules[i];
        rules[i] = nullptr;
    }
}

bool TFModbusPDURouteTable::add_rule(void *endpoint,
                                     const TFModbusPDURouteConstraint &slave_ids,
                                     const TFModbusPDURouteConstraint &function_codes,
                                     const TFModbusPDURouteConstraint &addresses)
{
    if (endpoint == nullptr) {
        debugfln("add_rule(endpoint=%p) invalid argument", endpoint);

        errno = EINVAL;
        return false;
    }

    if (state != TFModbusPDURouteTableState::Building) {
        debugfln("add_rule(endpoint=%p) table is %s", endpoint, get_tf_modbus_pdu_route_table_state_name(state));

        errno = EPERM;
        return false;
    }

    if (rule_count >= TF_MODBUS_PDU_ROUTE_TABLE_MAX_RULE_COUNT) {
        debugfln("add_rule(endpoint=%p) no free rule slot", endpoint);

        errno = ENOSPC;
        return false;
    }

    debugfln("add_rule(endpoint=%p) slave_ids=%s function_codes=%s addresses=%s",
             endpoint,
             get_tf_modbus_pdu_route_constraint_kind_name(slave_ids.get_kind()),
             get_tf_modbus_pdu_route_constraint_kind_name(function_codes.get_kind()),
             get_tf_modbus_pdu_route_constraint_kind_name(addresses.get_kind()));

    rules[rule_count++] = new TFModbusPDURouteRule(endpoint, slave_ids, function_codes, addresses);

    return true;
}

bool TFModbusPDURouteTable::seal()
{
    if (state == TFModbusPDURouteTableState::Sealed) {
        debugfln("seal() already sealed");

        errno = EALREADY;
        return false;
    }

    debugfln("seal() rule_count=%zu", rule_count);

    state = TFModbusPDURouteTableState::Sealed;

    return true;
}

void *TFModbusPDURouteTable::match(uint8_t slave_id, uint8_t function_code, uint16_t address) const
{
    if (rule_count == 0) {
        return nullptr;
    }

    if (!rules[0]->matches_slave_id(slave_id)) {
        return nullptr;
    }

    for (size_t i = 0; i < rule_count; ++i) {
        if (rules[i]->matches(function_code, address)) {
            return rules[i]->get_endpoint();
        }
    }

    return nullptr;
}
