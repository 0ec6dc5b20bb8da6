/// implements the Boost.Date_Time based date provider

#include "ruleval/date_provider.hpp"

// standard headers
#include <algorithm>
#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>

// 3rd party headers
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/lexical_cast.hpp>

#include "ruleval/details/cxx-compat.hpp"

namespace ruleval {

namespace greg = boost::gregorian;
namespace ptm  = boost::posix_time;

namespace {

constexpr std::size_t ISO_DATE_LENGTH = 10; // YYYY-MM-DD

// Boost.Date_Time covers the years 1400 to 9999; larger offsets
//   cannot produce a valid date.
constexpr std::int64_t MAX_DELTA_YEARS   = 10000;
constexpr std::int64_t MAX_DELTA_MONTHS  = MAX_DELTA_YEARS * 12;
constexpr std::int64_t MAX_DELTA_DAYS    = MAX_DELTA_YEARS * 366;
constexpr std::int64_t MAX_DELTA_SECONDS = MAX_DELTA_DAYS * 86400;

CXX_NORETURN
void throw_date_error(std::string_view what, std::string_view str) {
  std::string msg{what};

  msg.append(": '").append(str).append("'");
  throw date_error(msg);
}

std::string_view trim(std::string_view str) {
  while (!str.empty() && str.front() == ' ') str.remove_prefix(1);
  while (!str.empty() && str.back() == ' ') str.remove_suffix(1);

  return str;
}

/// tests the shape of YYYY-MM-DD
bool iso_date_shape(std::string_view str) {
  if (str.size() != ISO_DATE_LENGTH) return false;

  for (std::size_t i = 0; i < str.size(); ++i) {
    const bool sep = (i == 4 || i == 7);
    const char ch  = str[i];

    if (sep ? (ch != '-') : (ch < '0' || ch > '9')) return false;
  }

  return true;
}

/// tests the shape of HH:MM:SS[.fff]
bool iso_time_shape(std::string_view str) {
  if (str.size() < 8 || str[2] != ':' || str[5] != ':') return false;

  // field ranges; the digits compare like numbers
  if (str.substr(0, 2) > "23" || str.substr(3, 2) > "59" || str.substr(6, 2) > "59")
    return false;

  return std::all_of(str.begin(), str.end(),
                     [](char ch) -> bool { return (ch >= '0' && ch <= '9') || ch == ':' || ch == '.'; });
}

greg::date checked(greg::date d, std::string_view str) {
  if (d.is_special()) {
    CXX_UNLIKELY;
    throw_date_error("invalid date", str);
  }

  return d;
}

ptm::ptime checked(ptm::ptime t, std::string_view str) {
  if (t.is_special()) {
    CXX_UNLIKELY;
    throw_date_error("invalid datetime", str);
  }

  return t;
}

bool within(std::int64_t val, std::int64_t limit) {
  return val >= -limit && val <= limit;
}

void check_delta(const relative_delta &delta) {
  if (  !within(delta.years, MAX_DELTA_YEARS)
     || !within(delta.months, MAX_DELTA_MONTHS)
     || !within(delta.days, MAX_DELTA_DAYS)
     || !within(delta.seconds, MAX_DELTA_SECONDS)
     ) {
    CXX_UNLIKELY;
    throw date_error("relative delta out of range");
  }
}

std::int64_t floor_div(std::int64_t num, std::int64_t den) {
  std::int64_t res = num / den;

  if ((num % den != 0) && ((num < 0) != (den < 0))) --res;

  return res;
}

}  // namespace

greg::date gregorian_date_provider::parse_date(std::string_view str) const {
  std::string_view text = trim(str);

  // a datetime is truncated to its date
  if (text.size() > ISO_DATE_LENGTH && (text[ISO_DATE_LENGTH] == 'T' || text[ISO_DATE_LENGTH] == ' '))
    text = text.substr(0, ISO_DATE_LENGTH);

  if (!iso_date_shape(text)) {
    CXX_UNLIKELY;
    throw_date_error("not an iso date", str);
  }

  try {
    return checked(greg::from_simple_string(std::string(text)), str);
  } catch (const std::out_of_range &ex) {
    // bad_year, bad_month, bad_day_of_month
    throw_date_error(ex.what(), str);
  }
}

ptm::ptime gregorian_date_provider::parse_datetime(std::string_view str) const {
  std::string_view text = trim(str);

  if (!text.empty() && (text.back() == 'Z' || text.back() == 'z'))
    text.remove_suffix(1);

  std::string_view datepart = text.substr(0, std::min(text.size(), ISO_DATE_LENGTH));
  std::string_view timepart = "00:00:00";

  if (text.size() > ISO_DATE_LENGTH) {
    if (text[ISO_DATE_LENGTH] != 'T' && text[ISO_DATE_LENGTH] != ' ')
      throw_date_error("not an iso datetime", str);

    timepart = text.substr(ISO_DATE_LENGTH + 1);
  }

  if (!iso_date_shape(datepart) || !iso_time_shape(timepart)) {
    CXX_UNLIKELY;
    throw_date_error("not an iso datetime", str);
  }

  std::string normalized{datepart};

  normalized.append(" ").append(timepart);

  try {
    return checked(ptm::time_from_string(normalized), str);
  } catch (const std::out_of_range &ex) {
    throw_date_error(ex.what(), str);
  } catch (const boost::bad_lexical_cast &ex) {
    throw_date_error(ex.what(), str);
  }
}

greg::date gregorian_date_provider::today() const {
  return greg::day_clock::local_day();
}

greg::date gregorian_date_provider::add_delta(greg::date d,
                                              const relative_delta &delta) const {
  check_delta(delta);

  const std::int64_t months = std::int64_t(d.year()) * 12 + (d.month() - 1)
                            + delta.years * 12 + delta.months;
  const std::int64_t year  = floor_div(months, 12);
  const std::int64_t month = months - year * 12 + 1;

  if (year < 1400 || year > 9999) {
    CXX_UNLIKELY;
    throw date_error("date out of range");
  }

  // clamp the day to the length of the month instead of Boost's
  //   end-of-month snapping.
  const unsigned short lastday =
      greg::gregorian_calendar::end_of_month_day(greg::greg_year(year), greg::greg_month(month));

  try {
    greg::date res(greg::greg_year(year), greg::greg_month(month),
                   std::min<unsigned short>(d.day(), lastday));

    // dates have no time, whole days of the seconds are applied
    return res + greg::days(delta.days + floor_div(delta.seconds, 86400));
  } catch (const std::out_of_range &ex) {
    throw date_error(ex.what());
  }
}

ptm::ptime gregorian_date_provider::add_delta(ptm::ptime t,
                                              const relative_delta &delta) const {
  check_delta(delta);

  const greg::date d = add_delta(t.date(), relative_delta{delta.years, delta.months, 0, 0});

  try {
    const ptm::ptime res = ptm::ptime(d, t.time_of_day())
                           + greg::days(delta.days)
                           + ptm::seconds(delta.seconds);

    // year() throws beyond the supported range
    if (res.is_special() || res.date().year() > 9999) {
      CXX_UNLIKELY;
      throw date_error("datetime out of range");
    }

    return res;
  } catch (const std::out_of_range &ex) {
    throw date_error(ex.what());
  }
}

std::shared_ptr<const date_provider> default_date_provider() {
  static const std::shared_ptr<const date_provider> provider =
      std::make_shared<const gregorian_date_provider>();

  return provider;
}

} // namespace ruleval
