// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <chrono>
#include <compare>
#include <cstddef>
#include <istream>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "sorted_table_map.hpp"

namespace kressler::ordered_tables::flights {

/**
 * Raised for malformed flight rows or field values. Row-level errors carry
 * the 1-based line number in the message.
 */
class flight_parse_error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Calendar day without a year, ordered chronologically
struct flight_date {
  int month{1};  // 1..12
  int day{1};    // 1..31

  auto operator<=>(const flight_date&) const = default;
};

enum class seat_class { first, coach };

/**
 * Index key of a flight. Ordered field by field, so all flights of a route
 * are adjacent and sorted by date then departure time.
 */
struct flight_key {
  std::string origin;
  std::string destination;
  flight_date date;
  std::chrono::minutes departure{0};  // since midnight

  auto operator<=>(const flight_key&) const = default;
};

struct flight {
  flight_key key;
  std::string flight_number;
  int seats_first{0};
  int seats_coach{0};
  std::chrono::minutes duration{0};
  double fare{0.0};
};

/**
 * Parses a "ddMon" date such as "05May".
 * @throws flight_parse_error on an unknown month or out of range day
 */
flight_date parse_date(std::string_view text);

/**
 * Parses an "hh:mm" time into minutes since midnight.
 * @throws flight_parse_error
 */
std::chrono::minutes parse_time(std::string_view text);

/**
 * Parses an "XhYm" duration such as "2h30m".
 * @throws flight_parse_error
 */
std::chrono::minutes parse_duration(std::string_view text);

// "first" or "coach"; std::nullopt for anything else
std::optional<seat_class> parse_seat_class(std::string_view text);

/**
 * Parses one CSV row:
 *   origin,destination,date,time,flight_number,seats_first,seats_coach,
 *   duration,fare
 * @throws flight_parse_error naming the offending field
 */
flight parse_flight(std::string_view row);

std::string format_date(const flight_date& date);
std::string format_time(std::chrono::minutes time);
std::string format_duration(std::chrono::minutes duration);
std::string_view to_string(seat_class cls);

// "LAX to SFO on 09May at 14:45"
std::ostream& operator<<(std::ostream& os, const flight_key& key);

/**
 * Flight records indexed by flight_key in a sorted_table_map.
 *
 * Not thread safe: share an instance across threads only under an external
 * lock.
 */
class flight_database {
 public:
  using table_type = sorted_table_map<flight_key, flight>;

  struct load_report {
    std::size_t added{0};
    std::vector<flight_key> duplicates;
  };

  /**
   * Adds a flight. A flight whose key is already present is skipped and the
   * stored record is left as is.
   *
   * @return true if the flight was added
   */
  bool add_flight(flight f);

  /**
   * Parses every row of a CSV stream and adds it. Blank lines are skipped.
   *
   * @throws flight_parse_error on the first malformed row; rows before it
   * stay added
   */
  load_report read_flights(std::istream& in);

  /**
   * @throws std::runtime_error if the file cannot be opened
   * @throws flight_parse_error on a malformed row
   */
  load_report read_flights_from_file(const std::string& path);

  /**
   * Flights on a route and date departing within [time_start, time_end]
   * (both ends inclusive), in departure order.
   */
  std::vector<flight> find_flights(std::string_view origin,
                                   std::string_view destination,
                                   const flight_date& date,
                                   std::chrono::minutes time_start,
                                   std::chrono::minutes time_end) const;

  // Remaining seats, or std::nullopt if the flight is unknown
  std::optional<int> check_seat_availability(const flight_key& key,
                                             seat_class cls) const;

  // Takes one seat. False if the flight is unknown or the class is sold out.
  bool book_seat(const flight_key& key, seat_class cls);

  // Returns one seat. False if the flight is unknown.
  bool cancel_booking(const flight_key& key, seat_class cls);

  std::optional<std::chrono::minutes> flight_duration(
      const flight_key& key) const;

  const table_type& flights() const { return flights_; }
  [[nodiscard]] std::size_t size() const { return flights_.size(); }

 private:
  table_type flights_;
};

}  // namespace kressler::ordered_tables::flights
