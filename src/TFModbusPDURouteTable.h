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
#include <initializer_list>
#include <vector>

// configuration
#ifndef TF_MODBUS_PDU_ROUTE_TABLE_MAX_RULE_COUNT
#define TF_MODBUS_PDU_ROUTE_TABLE_MAX_RULE_COUNT 64
#endif

enum class TFModbusPDURouteConstraintKind
{
    Any,
    OneOf,
    Range,
};

const char *get_tf_modbus_pdu_route_constraint_kind_name(TFModbusPDURouteConstraintKind kind);

class TFModbusPDURouteConstraint final
{
public:
    TFModbusPDURouteConstraint() {}

    static TFModbusPDURouteConstraint any();
    static TFModbusPDURouteConstraint one_of(std::initializer_list<uint16_t> values);
    static TFModbusPDURouteConstraint one_of(const uint16_t *values, size_t value_count);
    static TFModbusPDURouteConstraint range(uint16_t first_value, uint16_t last_value); // inclusive

    TFModbusPDURouteConstraintKind get_kind() const { return kind; }
    size_t get_value_count() const; // OneOf and Range, 0 for Any
    bool matches(uint16_t value) const;

private:
    TFModbusPDURouteConstraintKind kind = TFModbusPDURouteConstraintKind::Any;
    std::vector<uint16_t> values; // OneOf only, sorted, unique
    uint16_t first_value = 0;     // Range only
    uint16_t last_value = 0;      // Range only, empty if less than first_value
};

class TFModbusPDURouteRule final
{
public:
    TFModbusPDURouteRule(void *endpoint_,
                         const TFModbusPDURouteConstraint &slave_ids_,
                         const TFModbusPDURouteConstraint &function_codes_,
                         const TFModbusPDURouteConstraint &addresses_) :
        endpoint(endpoint_), slave_ids(slave_ids_), function_codes(function_codes_), addresses(addresses_) {}

    TFModbusPDURouteRule(TFModbusPDURouteRule const &other) = delete;
    TFModbusPDURouteRule &operator=(TFModbusPDURouteRule const &other) = delete;

    bool matches_slave_id(uint8_t slave_id) const { return slave_ids.matches(slave_id); }
    bool matches(uint8_t function_code, uint16_t address) const { return function_codes.matches(function_code) && addresses.matches(address); }

    void *get_endpoint() const { return endpoint; }

private:
    void *const endpoint;
    const TFModbusPDURouteConstraint slave_ids;
    const TFModbusPDURouteConstraint function_codes;
    const TFModbusPDURouteConstraint addresses;
};

enum class TFModbusPDURouteTableState
{
    Building,
    Sealed,
};

const char *get_tf_modbus_pdu_route_table_state_name(TFModbusPDURouteTableState state);

// Ordered first-match-wins rule list. Rules can only be added while Building,
// after seal() the table is read-only and match() may be called concurrently.
class TFModbusPDURouteTable final
{
public:
    TFModbusPDURouteTable();
    ~TFModbusPDURouteTable();

    TFModbusPDURouteTable(TFModbusPDURouteTable const &other) = delete;
    TFModbusPDURouteTable &operator=(TFModbusPDURouteTable const &other) = delete;

    // Appends a rule. Fails with EINVAL for a null endpoint, with EPERM after
    // seal() and with ENOSPC if TF_MODBUS_PDU_ROUTE_TABLE_MAX_RULE_COUNT rules
    // have already been added.
    bool add_rule(void *endpoint,
                  const TFModbusPDURouteConstraint &slave_ids,
                  const TFModbusPDURouteConstraint &function_codes,
                  const TFModbusPDURouteConstraint &addresses);
    bool seal();

    // Only the slave ID constraint of the first rule is checked, it gates the
    // whole table. Returns nullptr if no rule matches.
    void *match(uint8_t slave_id, uint8_t function_code, uint16_t address) const;

    TFModbusPDURouteTableState get_state() const { return state; }
    size_t get_rule_count() const { return rule_count; }

private:
    TFModbusPDURouteTableState state = TFModbusPDURouteTableState::Building;
    TFModbusPDURouteRule *rules[TF_MODBUS_PDU_ROUTE_TABLE_MAX_RULE_COUNT];
    size_t rule_count = 0;
};
