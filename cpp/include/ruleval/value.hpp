
#pragma once

#include <cstdint>
#include <iosfwd>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <boost/date_time/gregorian/gregorian_types.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/json.hpp>

#include "errors.hpp"

namespace ruleval {

/// a calendar offset as produced by rdelta or by subtracting dates
/// \details
///    years and months are applied before days and seconds
///    (see date_provider::add_delta).
struct relative_delta {
  std::int64_t years = 0;
  std::int64_t months = 0;
  std::int64_t days = 0;
  std::int64_t seconds = 0;
};

bool operator==(const relative_delta &lhs, const relative_delta &rhs);

/// field-wise negation and sum
/// \throws type_error if a field overflows
/// \{
relative_delta operator-(const relative_delta &delta);
relative_delta operator+(const relative_delta &lhs, const relative_delta &rhs);
/// \}

struct value_variant;

using value_array  = std::vector<value_variant>;
using value_object = std::map<std::string, value_variant, std::less<>>;

/// containers are shared and never modified after construction
/// \{
using array_ptr  = std::shared_ptr<const value_array>;
using object_ptr = std::shared_ptr<const value_object>;
/// \}

/// the value types the evaluator operates on
/// \details
///    (1) json values map to the first eight alternatives.
///    (2) dates, datetimes, and deltas are only produced by
///        the date operators and by date arithmetic.
using value_variant_base = std::variant< std::nullptr_t,
                                         bool,
                                         std::int64_t,
                                         std::uint64_t,
                                         double,
                                         std::string,
                                         array_ptr,
                                         object_ptr,
                                         boost::gregorian::date,
                                         boost::posix_time::ptime,
                                         relative_delta
                                       >;

struct value_variant : value_variant_base {
  using base = value_variant_base;
  using base::base;

  value_variant()
  : base(nullptr)
  {}

  // literals are the most common source of ambiguity
  value_variant(int v)
  : base(std::int64_t(v))
  {}

  value_variant(const char* s)
  : base(std::string(s))
  {}

  value_variant(std::string_view s)
  : base(std::string(s))
  {}

  value_variant(value_array arr)
  : base(std::make_shared<const value_array>(std::move(arr)))
  {}

  value_variant(value_object obj)
  : base(std::make_shared<const value_object>(std::move(obj)))
  {}
};

enum { null_variant = 0,
       bool_variant = 1,
       int_variant  = 2,
       uint_variant = 3,
       real_variant = 4,
       strg_variant = 5,
       arry_variant = 6,
       objt_variant = 7,
       date_variant = 8,
       dttm_variant = 9,
       dlta_variant = 10
     };

/// deep structural comparison; numbers are compared by value
///   across int, unsigned and real representations.
bool operator==(const value_variant& lhs, const value_variant& rhs);
bool operator!=(const value_variant& lhs, const value_variant& rhs);

//
// predicates and coercions

/// returns true if \p el is truthy
/// \details
///    null, false, 0, NaN, "", [], and {} are falsy.
///    dates and datetimes are truthy; a delta is truthy
///    when any of its fields is non-zero.
bool truthy(const value_variant &el);

/// returns true if \p el is !truthy
bool falsy(const value_variant &el);

bool is_null(const value_variant &el);
bool is_number(const value_variant &el);
bool is_string(const value_variant &el);
bool is_array(const value_variant &el);
bool is_object(const value_variant &el);

/// loose equality (==)
/// \details
///    values of the same kind compare by value. null and containers are
///    only equal to values of the same kind. Other mixed kinds are
///    compared numerically; a side that does not convert to a number
///    makes the comparison false.
bool soft_equals(const value_variant &lhs, const value_variant &rhs);

/// strict equality (===), no type coercion
bool strict_equals(const value_variant &lhs, const value_variant &rhs);

enum class ordering { less, equal, greater, uncomparable };

/// ordering used by <, <=, >, >=
/// \details
///    strings compare lexicographically when both sides are strings,
///    dates and datetimes compare with values of the same kind. All other
///    pairs are compared numerically after coercion; null, containers, and
///    non-numeric strings are uncomparable.
ordering compare(const value_variant &lhs, const value_variant &rhs);

/// parses \p str as a number
/// \details
///    surrounding ascii whitespace is ignored; the remaining text must be a
///    complete decimal number (optional sign, fraction, exponent).
///    strings without fraction or exponent that fit into an int64 yield
///    an int64, all others a double.
/// \return the number or std::nullopt
std::optional<value_variant> parse_number(std::string_view str);

/// returns the numeric interpretation of \p el or std::nullopt
/// \details bool converts to 0/1, strings are parsed by parse_number.
std::optional<value_variant> try_to_number(const value_variant &el);

/// converts \p el to a number
/// \throws type_error if \p el has no numeric interpretation
value_variant to_number(const value_variant &el);

/// converts \p el to a double
/// \throws type_error if \p el has no numeric interpretation
double to_double(const value_variant &el);

/// converts \p el to an integer, truncating fractions
/// \throws type_error if \p el has no numeric interpretation or
///         its value is outside the range of int64.
std::int64_t to_int64(const value_variant &el);

/// returns an integral double as int64
value_variant normalize_number(double val);

/// string representation as used by cat and in
/// \details
///    strings are not quoted, doubles use the shortest representation
///    that round-trips, containers are rendered as compact json.
std::string to_string(const value_variant &el);

/// iso representation of dates and datetimes
/// \{
std::string to_iso_string(const boost::gregorian::date &d);
std::string to_iso_string(const boost::posix_time::ptime &t);
/// \}

/// interprets \p el as relative delta
/// \details
///    accepts deltas and objects with at least one of the numeric
///    fields years, months, days, and seconds.
std::optional<relative_delta> as_relative_delta(const value_variant &el);

//
// conversion functions

/// creates a value representation for \p n
value_variant to_value(const boost::json::value &n);

/// creates a json representation from \p val
/// \details
///    dates and datetimes are converted to iso strings, deltas to
///    objects with the fields years, months, days (and seconds if set).
boost::json::value to_json(const value_variant &val);

/// prints out \p val to \p os
/// \details strings are quoted as in json.
std::ostream &operator<<(std::ostream &os, const value_variant &val);

} // namespace ruleval
