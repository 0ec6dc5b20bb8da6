
#pragma once

#include <memory>
#include <string_view>

#include <boost/date_time/gregorian/gregorian_types.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>

#include "value.hpp"

namespace ruleval {

/// calendar services used by the date operators
/// \details
///    the evaluator never computes calendar dates itself; date, datetime,
///    today, and date arithmetic are delegated to a date_provider.
///    Implementations must be usable concurrently from several threads.
struct date_provider {
  date_provider() = default;
  virtual ~date_provider() = default;

  /// parses a date (e.g., 2021-05-05)
  virtual boost::gregorian::date parse_date(std::string_view str) const = 0;

  /// parses a datetime (e.g., 2021-05-05T10:30:00)
  virtual boost::posix_time::ptime parse_datetime(std::string_view str) const = 0;

  /// the current date
  virtual boost::gregorian::date today() const = 0;

  /// returns \p d moved by \p delta
  /// \{
  virtual boost::gregorian::date add_delta(boost::gregorian::date d,
                                           const relative_delta &delta) const = 0;
  virtual boost::posix_time::ptime add_delta(boost::posix_time::ptime t,
                                             const relative_delta &delta) const = 0;
  /// \}

private:
  date_provider(date_provider &&) = delete;
  date_provider(const date_provider &) = delete;
  date_provider &operator=(date_provider &&) = delete;
  date_provider &operator=(const date_provider &) = delete;
};

/// date provider based on Boost.Date_Time
/// \details
///    * dates are read in iso format (YYYY-MM-DD); a datetime string is
///      accepted and truncated to its date.
///    * datetimes are read as YYYY-MM-DDTHH:MM:SS[.fff][Z]; a blank instead
///      of the T and a plain date (midnight) are accepted as well.
///    * years and months are added first, clamping the day to the length
///      of the resulting month (2020-02-29 + 1 year = 2021-02-28).
///    * today() reports the local date.
/// \throws date_error for strings that cannot be parsed and invalid dates.
struct gregorian_date_provider : date_provider {
  boost::gregorian::date parse_date(std::string_view str) const override;
  boost::posix_time::ptime parse_datetime(std::string_view str) const override;
  boost::gregorian::date today() const override;
  boost::gregorian::date add_delta(boost::gregorian::date d,
                                   const relative_delta &delta) const override;
  boost::posix_time::ptime add_delta(boost::posix_time::ptime t,
                                     const relative_delta &delta) const override;
};

/// returns a shared gregorian_date_provider
std::shared_ptr<const date_provider> default_date_provider();

} // namespace ruleval
