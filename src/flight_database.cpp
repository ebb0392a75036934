// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <ordered_tables/flight_database.hpp>

#include <algorithm>
#include <array>
#include <charconv>
#include <format>
#include <fstream>
#include <system_error>

namespace kressler::ordered_tables::flights {

namespace {

constexpr std::array<std::string_view, 12> kMonthNames{
    "Jan", "Feb", "Mar", "Apr", "May", "Jun",
    "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

// No year in the data, so February allows the 29th
constexpr std::array<int, 12> kDaysInMonth{31, 29, 31, 30, 31, 30,
                                           31, 31, 30, 31, 30, 31};

constexpr std::size_t kFieldsPerRow = 9;

std::string_view trim(std::string_view text) {
  constexpr std::string_view blanks = " \t\r\n";
  const auto first = text.find_first_not_of(blanks);
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(blanks);
  return text.substr(first, last - first + 1);
}

std::vector<std::string_view> split_fields(std::string_view row) {
  std::vector<std::string_view> fields;
  std::size_t start = 0;
  while (true) {
    const auto comma = row.find(',', start);
    if (comma == std::string_view::npos) {
      fields.push_back(trim(row.substr(start)));
      return fields;
    }
    fields.push_back(trim(row.substr(start, comma - start)));
    start = comma + 1;
  }
}

template <typename T>
T parse_number(std::string_view text, std::string_view what) {
  T value{};
  const auto* end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (text.empty() || ec != std::errc{} || ptr != end) {
    throw flight_parse_error(
        std::format("invalid {} '{}': expected a number", what, text));
  }
  return value;
}

int parse_count(std::string_view text, std::string_view what) {
  const int value = parse_number<int>(text, what);
  if (value < 0) {
    throw flight_parse_error(
        std::format("invalid {} '{}': must not be negative", what, text));
  }
  return value;
}

int& seats_for(flight& f, seat_class cls) {
  return cls == seat_class::first ? f.seats_first : f.seats_coach;
}

}  // namespace

// ============================================================================
// Field Parsing and Formatting
// ============================================================================

flight_date parse_date(std::string_view text) {
  if (text.size() < 4 || text.size() > 5) {
    throw flight_parse_error(
        std::format("invalid date '{}': expected ddMon", text));
  }
  const auto month_name = text.substr(text.size() - 3);
  const auto day_text = text.substr(0, text.size() - 3);

  flight_date date;
  const auto month_it =
      std::find(kMonthNames.begin(), kMonthNames.end(), month_name);
  if (month_it == kMonthNames.end()) {
    throw flight_parse_error(
        std::format("invalid date '{}': unknown month '{}'", text, month_name));
  }
  date.month = static_cast<int>(month_it - kMonthNames.begin()) + 1;
  date.day = parse_number<int>(day_text, "day");
  if (date.day < 1 || date.day > kDaysInMonth[date.month - 1]) {
    throw flight_parse_error(
        std::format("invalid date '{}': day out of range", text));
  }
  return date;
}

std::chrono::minutes parse_time(std::string_view text) {
  const auto colon = text.find(':');
  if (colon == std::string_view::npos || text.size() - colon != 3) {
    throw flight_parse_error(
        std::format("invalid time '{}': expected hh:mm", text));
  }
  const int hours = parse_number<int>(text.substr(0, colon), "hour");
  const int minutes = parse_number<int>(text.substr(colon + 1), "minute");
  if (hours < 0 || hours > 23 || minutes < 0 || minutes > 59) {
    throw flight_parse_error(
        std::format("invalid time '{}': out of range", text));
  }
  return std::chrono::hours{hours} + std::chrono::minutes{minutes};
}

std::chrono::minutes parse_duration(std::string_view text) {
  const auto h = text.find('h');
  if (h == std::string_view::npos || text.empty() || text.back() != 'm') {
    throw flight_parse_error(
        std::format("invalid duration '{}': expected XhYm", text));
  }
  const int hours = parse_count(text.substr(0, h), "duration hours");
  const int minutes = parse_count(text.substr(h + 1, text.size() - h - 2),
                                  "duration minutes");
  return std::chrono::hours{hours} + std::chrono::minutes{minutes};
}

std::optional<seat_class> parse_seat_class(std::string_view text) {
  if (text == "first") {
    return seat_class::first;
  }
  if (text == "coach") {
    return seat_class::coach;
  }
  return std::nullopt;
}

flight parse_flight(std::string_view row) {
  const auto fields = split_fields(row);
  if (fields.size() != kFieldsPerRow) {
    throw flight_parse_error(std::format("expected {} fields, found {}",
                                         kFieldsPerRow, fields.size()));
  }
  if (fields[0].empty() || fields[1].empty()) {
    throw flight_parse_error("origin and destination must not be empty");
  }

  flight f;
  f.key.origin = std::string(fields[0]);
  f.key.destination = std::string(fields[1]);
  f.key.date = parse_date(fields[2]);
  f.key.departure = parse_time(fields[3]);
  f.flight_number = std::string(fields[4]);
  f.seats_first = parse_count(fields[5], "first class seats");
  f.seats_coach = parse_count(fields[6], "coach seats");
  f.duration = parse_duration(fields[7]);
  f.fare = parse_number<double>(fields[8], "fare");
  return f;
}

std::string format_date(const flight_date& date) {
  return std::format("{:02}{}", date.day, kMonthNames.at(date.month - 1));
}

std::string format_time(std::chrono::minutes time) {
  return std::format("{:02}:{:02}", time.count() / 60, time.count() % 60);
}

std::string format_duration(std::chrono::minutes duration) {
  return std::format("{}h{}m", duration.count() / 60, duration.count() % 60);
}

std::string_view to_string(seat_class cls) {
  return cls == seat_class::first ? "first" : "coach";
}

std::ostream& operator<<(std::ostream& os, const flight_key& key) {
  return os << key.origin << " to " << key.destination << " on "
            << format_date(key.date) << " at " << format_time(key.departure);
}

// ============================================================================
// flight_database
// ============================================================================

bool flight_database::add_flight(flight f) {
  return flights_.insert(f.key, f).second;
}

flight_database::load_report flight_database::read_flights(std::istream& in) {
  load_report report;
  std::string line;
  std::size_t line_number = 0;
  while (std::getline(in, line)) {
    ++line_number;
    if (trim(line).empty()) {
      continue;
    }

    flight f;
    try {
      f = parse_flight(line);
    } catch (const flight_parse_error& e) {
      throw flight_parse_error(
          std::format("line {}: {}", line_number, e.what()));
    }

    flight_key key = f.key;
    if (add_flight(std::move(f))) {
      ++report.added;
    } else {
      report.duplicates.push_back(std::move(key));
    }
  }
  return report;
}

flight_database::load_report flight_database::read_flights_from_file(
    const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("Cannot open flight file: " + path);
  }
  return read_flights(in);
}

std::vector<flight> flight_database::find_flights(
    std::string_view origin, std::string_view destination,
    const flight_date& date, std::chrono::minutes time_start,
    std::chrono::minutes time_end) const {
  std::vector<flight> result;
  if (time_end < time_start) {
    return result;
  }

  // Departures are whole minutes, so [start, end] == [start, end + 1m)
  const flight_key start{std::string(origin), std::string(destination), date,
                         time_start};
  const flight_key stop{std::string(origin), std::string(destination), date,
                        time_end + std::chrono::minutes{1}};
  for (const auto& entry : flights_.find_range(start, stop)) {
    result.push_back(entry.second);
  }
  return result;
}

std::optional<int> flight_database::check_seat_availability(
    const flight_key& key, seat_class cls) const {
  const auto it = flights_.find(key);
  if (it == flights_.end()) {
    return std::nullopt;
  }
  return cls == seat_class::first ? it->second.seats_first
                                  : it->second.seats_coach;
}

bool flight_database::book_seat(const flight_key& key, seat_class cls) {
  auto it = flights_.find(key);
  if (it == flights_.end()) {
    return false;
  }
  int& seats = seats_for(it->second, cls);
  if (seats <= 0) {
    return false;
  }
  --seats;
  return true;
}

bool flight_database::cancel_booking(const flight_key& key, seat_class cls) {
  auto it = flights_.find(key);
  if (it == flights_.end()) {
    return false;
  }
  ++seats_for(it->second, cls);
  return true;
}

std::optional<std::chrono::minutes> flight_database::flight_duration(
    const flight_key& key) const {
  const auto it = flights_.find(key);
  if (it == flights_.end()) {
    return std::nullopt;
  }
  return it->second.duration;
}

}  // namespace kressler::ordered_tables::flights
