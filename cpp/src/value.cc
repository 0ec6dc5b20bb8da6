/// implements the value model: truthiness, equality, ordering, and coercions

#include "ruleval/value.hpp"

// standard headers
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <iostream>
#include <iterator>
#include <limits>
#include <sstream>

// 3rd party headers
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/json.hpp>

#include "ruleval/details/cxx-compat.hpp"

namespace ruleval {

namespace json = boost::json;

static_assert(std::variant_size_v<value_variant_base> == 11);
static_assert(std::is_same_v<std::nullptr_t,
                             std::variant_alternative_t<null_variant, value_variant_base> >);
static_assert(std::is_same_v<bool,
                             std::variant_alternative_t<bool_variant, value_variant_base> >);
static_assert(std::is_same_v<std::int64_t,
                             std::variant_alternative_t<int_variant, value_variant_base> >);
static_assert(std::is_same_v<std::uint64_t,
                             std::variant_alternative_t<uint_variant, value_variant_base> >);
static_assert(std::is_same_v<double,
                             std::variant_alternative_t<real_variant, value_variant_base> >);
static_assert(std::is_same_v<std::string,
                             std::variant_alternative_t<strg_variant, value_variant_base> >);
static_assert(std::is_same_v<array_ptr,
                             std::variant_alternative_t<arry_variant, value_variant_base> >);
static_assert(std::is_same_v<object_ptr,
                             std::variant_alternative_t<objt_variant, value_variant_base> >);
static_assert(std::is_same_v<boost::gregorian::date,
                             std::variant_alternative_t<date_variant, value_variant_base> >);
static_assert(std::is_same_v<boost::posix_time::ptime,
                             std::variant_alternative_t<dttm_variant, value_variant_base> >);
static_assert(std::is_same_v<relative_delta,
                             std::variant_alternative_t<dlta_variant, value_variant_base> >);

//
// relative_delta

bool operator==(const relative_delta &lhs, const relative_delta &rhs) {
  return (  lhs.years == rhs.years
         && lhs.months == rhs.months
         && lhs.days == rhs.days
         && lhs.seconds == rhs.seconds
         );
}

namespace {

CXX_NORETURN
void throw_type_error(const char *msg) { throw type_error(msg); }

constexpr double INT64_LO = double(std::numeric_limits<std::int64_t>::min());
constexpr double INT64_HI = double(std::numeric_limits<std::int64_t>::max());

/// lhs + rhs on delta fields
std::int64_t checked_add(std::int64_t lhs, std::int64_t rhs) {
  constexpr std::int64_t lo = std::numeric_limits<std::int64_t>::min();
  constexpr std::int64_t hi = std::numeric_limits<std::int64_t>::max();

  if ((rhs > 0 && lhs > hi - rhs) || (rhs < 0 && lhs < lo - rhs)) {
    CXX_UNLIKELY;
    throw_type_error("relative delta out of range");
  }

  return lhs + rhs;
}

std::int64_t checked_negate(std::int64_t val) {
  if (val == std::numeric_limits<std::int64_t>::min()) {
    CXX_UNLIKELY;
    throw_type_error("relative delta out of range");
  }

  return -val;
}

bool is_integral_variant(std::size_t idx) {
  return idx == int_variant || idx == uint_variant;
}

bool is_numeric_variant(std::size_t idx) {
  return is_integral_variant(idx) || idx == real_variant;
}

template <class T>
ordering three_way(const T &lhs, const T &rhs) {
  if (lhs < rhs) return ordering::less;
  if (rhs < lhs) return ordering::greater;

  return ordering::equal;
}

/// compares two values that hold numeric alternatives
ordering compare_numbers(const value_variant &lhs, const value_variant &rhs) {
  const std::size_t li = lhs.index();
  const std::size_t ri = rhs.index();

  if (li == int_variant && ri == int_variant)
    return three_way(std::get<std::int64_t>(lhs), std::get<std::int64_t>(rhs));

  if (li == uint_variant && ri == uint_variant)
    return three_way(std::get<std::uint64_t>(lhs), std::get<std::uint64_t>(rhs));

  if (li == int_variant && ri == uint_variant) {
    const std::int64_t lv = std::get<std::int64_t>(lhs);

    if (lv < 0) return ordering::less;

    return three_way(std::uint64_t(lv), std::get<std::uint64_t>(rhs));
  }

  if (li == uint_variant && ri == int_variant) {
    const std::int64_t rv = std::get<std::int64_t>(rhs);

    if (rv < 0) return ordering::greater;

    return three_way(std::get<std::uint64_t>(lhs), std::uint64_t(rv));
  }

  const double lv = to_double(lhs);
  const double rv = to_double(rhs);

  if (std::isnan(lv) || std::isnan(rv)) {
    CXX_UNLIKELY;
    return ordering::uncomparable;
  }

  return three_way(lv, rv);
}

bool equal_sequences(const value_array &lhs, const value_array &rhs) {
  return std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
                    [](const value_variant &l, const value_variant &r) -> bool {
                      return strict_equals(l, r);
                    });
}

bool equal_objects(const value_object &lhs, const value_object &rhs) {
  if (lhs.size() != rhs.size()) return false;

  auto sameEntry = [](const value_object::value_type &l,
                      const value_object::value_type &r) -> bool {
    return l.first == r.first && strict_equals(l.second, r.second);
  };

  return std::equal(lhs.begin(), lhs.end(), rhs.begin(), sameEntry);
}

std::string_view trim(std::string_view str) {
  constexpr std::string_view whitespace = " \t\n\r\f\v";

  const std::size_t beg = str.find_first_not_of(whitespace);

  if (beg == std::string_view::npos) return {};

  const std::size_t lim = str.find_last_not_of(whitespace);

  return str.substr(beg, lim - beg + 1);
}

std::string double_to_string(double val) {
  if (std::isnan(val)) return "NaN";
  if (std::isinf(val)) return val < 0 ? "-Infinity" : "Infinity";

  char buf[32];
  auto [ptr, err] = std::to_chars(buf, buf + sizeof(buf), val);

  if (err != std::errc{}) {
    CXX_UNLIKELY;
    throw std::logic_error{"value.cc: in double_to_string"};
  }

  return std::string(buf, ptr);
}

/// prints \p val in json notation
void print(std::ostream &os, const value_variant &val) {
  switch (val.index()) {
    case null_variant: {
      os << "null";
      break;
    }

    case bool_variant: {
      os << (std::get<bool>(val) ? "true" : "false");
      break;
    }

    case int_variant: {
      os << std::get<std::int64_t>(val);
      break;
    }

    case uint_variant: {
      os << std::get<std::uint64_t>(val);
      break;
    }

    case real_variant: {
      os << double_to_string(std::get<double>(val));
      break;
    }

    case strg_variant: {
      // serialize escapes quotes and control characters
      os << json::serialize(json::string(std::get<std::string>(val)));
      break;
    }

    case arry_variant: {
      bool first = true;

      os << "[";
      for (const value_variant &el : *std::get<array_ptr>(val)) {
        if (first)
          first = false;
        else
          os << ",";

        print(os, el);
      }

      os << "]";
      break;
    }

    case objt_variant: {
      bool first = true;

      os << "{";
      for (const value_object::value_type &el : *std::get<object_ptr>(val)) {
        if (first)
          first = false;
        else
          os << ",";

        os << json::serialize(json::string(el.first)) << ":";
        print(os, el.second);
      }

      os << "}";
      break;
    }

    case date_variant: {
      os << '"' << ruleval::to_iso_string(std::get<boost::gregorian::date>(val)) << '"';
      break;
    }

    case dttm_variant: {
      os << '"' << ruleval::to_iso_string(std::get<boost::posix_time::ptime>(val)) << '"';
      break;
    }

    case dlta_variant: {
      const relative_delta &delta = std::get<relative_delta>(val);

      os << "{\"years\":" << delta.years
         << ",\"months\":" << delta.months
         << ",\"days\":" << delta.days;

      if (delta.seconds) os << ",\"seconds\":" << delta.seconds;

      os << "}";
      break;
    }

    default:
      // did val hold a valid value?
      os << "<error>";
  }
}

}  // namespace

//
// relative_delta

relative_delta operator-(const relative_delta &delta) {
  return { checked_negate(delta.years),
           checked_negate(delta.months),
           checked_negate(delta.days),
           checked_negate(delta.seconds)
         };
}

relative_delta operator+(const relative_delta &lhs, const relative_delta &rhs) {
  return { checked_add(lhs.years, rhs.years),
           checked_add(lhs.months, rhs.months),
           checked_add(lhs.days, rhs.days),
           checked_add(lhs.seconds, rhs.seconds)
         };
}

//
// equality

bool strict_equals(const value_variant &lhs, const value_variant &rhs) {
  const std::size_t li = lhs.index();
  const std::size_t ri = rhs.index();

  if (is_numeric_variant(li) && is_numeric_variant(ri))
    return compare_numbers(lhs, rhs) == ordering::equal;

  if (li != ri) return false;

  switch (li) {
    case null_variant:
      return true;

    case bool_variant:
      return std::get<bool>(lhs) == std::get<bool>(rhs);

    case strg_variant:
      return std::get<std::string>(lhs) == std::get<std::string>(rhs);

    case arry_variant:
      return equal_sequences(*std::get<array_ptr>(lhs), *std::get<array_ptr>(rhs));

    case objt_variant:
      return equal_objects(*std::get<object_ptr>(lhs), *std::get<object_ptr>(rhs));

    case date_variant:
      return std::get<boost::gregorian::date>(lhs) == std::get<boost::gregorian::date>(rhs);

    case dttm_variant:
      return std::get<boost::posix_time::ptime>(lhs) == std::get<boost::posix_time::ptime>(rhs);

    case dlta_variant:
      return std::get<relative_delta>(lhs) == std::get<relative_delta>(rhs);

    default: ;
  }

  return false;
}

bool operator==(const value_variant &lhs, const value_variant &rhs) {
  return strict_equals(lhs, rhs);
}

bool operator!=(const value_variant &lhs, const value_variant &rhs) {
  return !strict_equals(lhs, rhs);
}

bool soft_equals(const value_variant &lhs, const value_variant &rhs) {
  const std::size_t li = lhs.index();
  const std::size_t ri = rhs.index();

  if ((li == ri) || (is_numeric_variant(li) && is_numeric_variant(ri)))
    return strict_equals(lhs, rhs);

  // null, containers, and dates only equal values of the same kind
  auto coercible = [](std::size_t idx) -> bool {
    return idx == bool_variant || idx == strg_variant || is_numeric_variant(idx);
  };

  if (!coercible(li) || !coercible(ri)) return false;

  std::optional<value_variant> lnum = try_to_number(lhs);
  std::optional<value_variant> rnum = try_to_number(rhs);

  return lnum && rnum && (compare_numbers(*lnum, *rnum) == ordering::equal);
}

ordering compare(const value_variant &lhs, const value_variant &rhs) {
  const std::size_t li = lhs.index();
  const std::size_t ri = rhs.index();

  if (li == strg_variant && ri == strg_variant)
    return three_way(std::get<std::string>(lhs), std::get<std::string>(rhs));

  if (li == date_variant && ri == date_variant)
    return three_way(std::get<boost::gregorian::date>(lhs),
                     std::get<boost::gregorian::date>(rhs));

  if (li == dttm_variant && ri == dttm_variant)
    return three_way(std::get<boost::posix_time::ptime>(lhs),
                     std::get<boost::posix_time::ptime>(rhs));

  std::optional<value_variant> lnum = try_to_number(lhs);
  std::optional<value_variant> rnum = try_to_number(rhs);

  if (!lnum || !rnum) return ordering::uncomparable;

  return compare_numbers(*lnum, *rnum);
}

//
// truthiness

bool truthy(const value_variant &el) {
  switch (el.index()) {
    case null_variant:
      return false;

    case bool_variant:
      return std::get<bool>(el);

    case int_variant:
      return std::get<std::int64_t>(el) != 0;

    case uint_variant:
      return std::get<std::uint64_t>(el) != 0;

    case real_variant: {
      const double val = std::get<double>(el);

      // NaN compares unequal to 0, but is falsy
      return !std::isnan(val) && val != 0;
    }

    case strg_variant:
      return !std::get<std::string>(el).empty();

    case arry_variant:
      return !std::get<array_ptr>(el)->empty();

    case objt_variant:
      return !std::get<object_ptr>(el)->empty();

    case dlta_variant:
      return !(std::get<relative_delta>(el) == relative_delta{});

    default: ;
  }

  return true;
}

bool falsy(const value_variant &el) { return !truthy(el); }

bool is_null(const value_variant &el) { return el.index() == null_variant; }
bool is_number(const value_variant &el) { return is_numeric_variant(el.index()); }
bool is_string(const value_variant &el) { return el.index() == strg_variant; }
bool is_array(const value_variant &el) { return el.index() == arry_variant; }
bool is_object(const value_variant &el) { return el.index() == objt_variant; }

//
// coercion functions

std::optional<value_variant> parse_number(std::string_view str) {
  str = trim(str);

  if (!str.empty() && str.front() == '+') {
    str.remove_prefix(1);

    // from_chars would accept the minus of "+-1"
    if (!str.empty() && str.front() == '-') return std::nullopt;
  }

  std::string_view digits = str;

  if (!digits.empty() && digits.front() == '-') digits.remove_prefix(1);

  // rejects empty strings, inf, nan, and a second sign
  if (digits.empty() ||
      !(std::isdigit(static_cast<unsigned char>(digits.front())) || digits.front() == '.'))
    return std::nullopt;

  const char *beg = str.data();
  const char *lim = str.data() + str.size();

  if (str.find_first_of(".eE") == std::string_view::npos) {
    std::int64_t ival = 0;
    auto [ptr, err] = std::from_chars(beg, lim, ival);

    if (err == std::errc{} && ptr == lim) {
      CXX_LIKELY;
      return value_variant(ival);
    }

    // too large for an int64, try a double
    if (err != std::errc::result_out_of_range) return std::nullopt;
  }

  double rval = 0;
  auto [ptr, err] = std::from_chars(beg, lim, rval);

  if (err != std::errc{} || ptr != lim) return std::nullopt;

  return value_variant(rval);
}

std::optional<value_variant> try_to_number(const value_variant &el) {
  switch (el.index()) {
    case int_variant:
    case uint_variant:
    case real_variant:
      return el;

    case bool_variant:
      return value_variant(std::int64_t(std::get<bool>(el)));

    case strg_variant:
      return parse_number(std::get<std::string>(el));

    default: ;
  }

  return std::nullopt;
}

value_variant to_number(const value_variant &el) {
  std::optional<value_variant> res = try_to_number(el);

  if (!res) {
    CXX_UNLIKELY;
    throw_type_error("not a number");
  }

  return std::move(*res);
}

double to_double(const value_variant &el) {
  switch (el.index()) {
    case int_variant:
      return double(std::get<std::int64_t>(el));

    case uint_variant:
      return double(std::get<std::uint64_t>(el));

    case real_variant:
      return std::get<double>(el);

    default: ;
  }

  return to_double(to_number(el));
}

std::int64_t to_int64(const value_variant &el) {
  value_variant num = to_number(el);

  if (const std::int64_t *ival = std::get_if<std::int64_t>(&num))
    return *ival;

  if (const std::uint64_t *uval = std::get_if<std::uint64_t>(&num)) {
    if (*uval > std::uint64_t(std::numeric_limits<std::int64_t>::max())) {
      CXX_UNLIKELY;
      throw_type_error("integer out of range");
    }

    return std::int64_t(*uval);
  }

  const double rval = std::trunc(std::get<double>(num));

  // INT64_HI rounds up to 2^63
  if (!(rval >= INT64_LO && rval < INT64_HI)) {
    CXX_UNLIKELY;
    throw_type_error("integer out of range");
  }

  return std::int64_t(rval);
}

value_variant normalize_number(double val) {
  if (std::isfinite(val) && std::trunc(val) == val && val >= INT64_LO && val < INT64_HI)
    return value_variant(std::int64_t(val));

  return value_variant(val);
}

std::string to_iso_string(const boost::gregorian::date &d) {
  return boost::gregorian::to_iso_extended_string(d);
}

std::string to_iso_string(const boost::posix_time::ptime &t) {
  // to_iso_extended_string would separate fractional seconds by a comma
  return ruleval::to_iso_string(t.date()) + 'T' +
         boost::posix_time::to_simple_string(t.time_of_day());
}

std::string to_string(const value_variant &el) {
  switch (el.index()) {
    case null_variant:
      return "null";

    case bool_variant:
      return std::get<bool>(el) ? "true" : "false";

    case int_variant:
      return std::to_string(std::get<std::int64_t>(el));

    case uint_variant:
      return std::to_string(std::get<std::uint64_t>(el));

    case real_variant:
      return double_to_string(std::get<double>(el));

    case strg_variant:
      return std::get<std::string>(el);

    case date_variant:
      return ruleval::to_iso_string(std::get<boost::gregorian::date>(el));

    case dttm_variant:
      return ruleval::to_iso_string(std::get<boost::posix_time::ptime>(el));

    default: ;
  }

  std::stringstream os;

  print(os, el);
  return os.str();
}

std::optional<relative_delta> as_relative_delta(const value_variant &el) {
  if (const relative_delta *delta = std::get_if<relative_delta>(&el))
    return *delta;

  const object_ptr *obj = std::get_if<object_ptr>(&el);

  if (obj == nullptr) return std::nullopt;

  relative_delta res;
  bool hasField = false;

  auto field = [&obj, &hasField](std::string_view nm, std::int64_t &fld) -> void {
    const value_object &o = **obj;

    if (auto pos = o.find(nm); pos != o.end()) {
      fld = to_int64(pos->second);
      hasField = true;
    }
  };

  field("years", res.years);
  field("months", res.months);
  field("days", res.days);
  field("seconds", res.seconds);

  if (!hasField) return std::nullopt;

  return res;
}

//
// conversion functions

value_variant to_value(const json::value &n) {
  switch (n.kind()) {
    case json::kind::null:
      return nullptr;

    case json::kind::bool_:
      return n.get_bool();

    case json::kind::int64:
      return n.get_int64();

    case json::kind::uint64:
      return n.get_uint64();

    case json::kind::double_:
      return n.get_double();

    case json::kind::string: {
      const json::string &str = n.get_string();

      return std::string(str.data(), str.size());
    }

    case json::kind::array: {
      const json::array &arr = n.get_array();
      value_array res;

      res.reserve(arr.size());
      std::transform(arr.begin(), arr.end(), std::back_inserter(res),
                     [](const json::value &el) -> value_variant { return to_value(el); });

      return res;
    }

    case json::kind::object: {
      value_object res;

      for (const json::key_value_pair &el : n.get_object())
        res.emplace(std::string(el.key()), to_value(el.value()));

      return res;
    }
  }

  throw std::logic_error{"value.cc: unknown json kind"};
}

json::value to_json(const value_variant &val) {
  switch (val.index()) {
    case null_variant:
      return nullptr;

    case bool_variant:
      return std::get<bool>(val);

    case int_variant:
      return std::get<std::int64_t>(val);

    case uint_variant:
      return std::get<std::uint64_t>(val);

    case real_variant:
      return std::get<double>(val);

    case strg_variant:
      return json::string(std::get<std::string>(val));

    case arry_variant: {
      json::array res;

      for (const value_variant &el : *std::get<array_ptr>(val))
        res.push_back(to_json(el));

      return res;
    }

    case objt_variant: {
      json::object res;

      for (const value_object::value_type &el : *std::get<object_ptr>(val))
        res.emplace(el.first, to_json(el.second));

      return res;
    }

    case date_variant:
      return json::string(ruleval::to_iso_string(std::get<boost::gregorian::date>(val)));

    case dttm_variant:
      return json::string(ruleval::to_iso_string(std::get<boost::posix_time::ptime>(val)));

    case dlta_variant: {
      const relative_delta &delta = std::get<relative_delta>(val);
      json::object res;

      res["years"] = delta.years;
      res["months"] = delta.months;
      res["days"] = delta.days;

      if (delta.seconds) res["seconds"] = delta.seconds;

      return res;
    }

    default: ;
  }

  throw std::logic_error{"value.cc: valueless value_variant"};
}

std::ostream &operator<<(std::ostream &os, const value_variant &val) {
  print(os, val);
  return os;
}

} // namespace ruleval
