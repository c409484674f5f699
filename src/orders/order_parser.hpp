/**
 * Order parameter parsing: JsonValue parameter object to typed payload.
 *
 * Integers are accepted as JSON numbers (truncated), numeric strings or
 * booleans; anything else for a required key is a PayloadError whose
 * message becomes the failed order's detail.
 */

#ifndef STRAT_ORDERS_ORDER_PARSER_HPP
#define STRAT_ORDERS_ORDER_PARSER_HPP

#include "io/json_reader.hpp"
#include "orders/order_types.hpp"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace strat::orders {

class PayloadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/** Integer reading of a loosely typed value, nullopt if it has none. */
std::optional<int64_t> to_integer(const JsonValue& value);

/** Flag reading: booleans, non-zero numbers, "true"/"yes"/"y"/"1"/"on". */
bool is_truthy_flag(const JsonValue& value);

/** @throws PayloadError naming the first missing or malformed key */
OrderPayload parse_payload(OrderKind kind, const JsonValue& parameters);

} // namespace strat::orders

#endif // STRAT_ORDERS_ORDER_PARSER_HPP
