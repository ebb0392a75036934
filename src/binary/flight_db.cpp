// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <functional>
#include <iostream>
#include <lyra/lyra.hpp>
#include <map>
#include <optional>
#include <ordered_tables/flight_database.hpp>
#include <print>
#include <stdexcept>
#include <string>

using namespace kressler::ordered_tables::flights;

namespace {

struct options {
  std::string origin;
  std::string destination;
  std::string date;
  std::string time;
  std::string from = "00:00";
  std::string until = "23:59";
  std::string cls;
};

// Throws std::runtime_error naming the first missing option
void require(const options& opts, bool need_time, bool need_class) {
  auto check = [](const std::string& value, const char* name) {
    if (value.empty()) {
      throw std::runtime_error(std::string("missing required option --") +
                               name);
    }
  };
  check(opts.origin, "origin");
  check(opts.destination, "destination");
  check(opts.date, "date");
  if (need_time) {
    check(opts.time, "time");
  }
  if (need_class) {
    check(opts.cls, "class");
  }
}

flight_key key_from(const options& opts) {
  return {opts.origin, opts.destination, parse_date(opts.date),
          parse_time(opts.time)};
}

seat_class class_from(const options& opts) {
  const auto cls = parse_seat_class(opts.cls);
  if (!cls) {
    throw std::runtime_error("unknown class '" + opts.cls +
                             "' (expected first or coach)");
  }
  return *cls;
}

void print_flight(const flight& f) {
  std::println("  {:<6} {:<4} -> {:<4} {} {}  first {:>3}  coach {:>3}  {:>7}  "
               "{:>8.2f}",
               f.flight_number, f.key.origin, f.key.destination,
               format_date(f.key.date), format_time(f.key.departure),
               f.seats_first, f.seats_coach, format_duration(f.duration),
               f.fare);
}

int list_flights(flight_database& db, const options&) {
  std::cout << "All flights in the database:" << std::endl;
  for (const auto& entry : db.flights()) {
    std::cout << "  " << entry.first << std::endl;
  }
  return 0;
}

int find_flights(flight_database& db, const options& opts) {
  require(opts, false, false);
  const auto found =
      db.find_flights(opts.origin, opts.destination, parse_date(opts.date),
                      parse_time(opts.from), parse_time(opts.until));
  std::cout << found.size() << " flight(s) from " << opts.origin << " to "
            << opts.destination << " on " << opts.date << " between "
            << opts.from << " and " << opts.until << std::endl;
  for (const auto& f : found) {
    print_flight(f);
  }
  return 0;
}

int seats(flight_database& db, const options& opts) {
  require(opts, true, true);
  const auto key = key_from(opts);
  const auto available = db.check_seat_availability(key, class_from(opts));
  if (!available) {
    std::cerr << "No flight " << key << std::endl;
    return 1;
  }
  std::cout << "Available " << opts.cls << " seats on " << key << ": "
            << *available << std::endl;
  return 0;
}

int book(flight_database& db, const options& opts) {
  require(opts, true, true);
  const auto key = key_from(opts);
  if (!db.book_seat(key, class_from(opts))) {
    std::cout << "Booking failed for " << key << ": no " << opts.cls
              << " seats available or no such flight" << std::endl;
    return 1;
  }
  std::cout << "Booked " << opts.cls << " seat on " << key << std::endl;
  return 0;
}

int cancel(flight_database& db, const options& opts) {
  require(opts, true, true);
  const auto key = key_from(opts);
  if (!db.cancel_booking(key, class_from(opts))) {
    std::cout << "Cancellation failed: no flight " << key << std::endl;
    return 1;
  }
  std::cout << "Cancelled " << opts.cls << " booking on " << key << std::endl;
  return 0;
}

int duration(flight_database& db, const options& opts) {
  require(opts, true, false);
  const auto key = key_from(opts);
  const auto d = db.flight_duration(key);
  if (!d) {
    std::cerr << "No flight " << key << std::endl;
    return 1;
  }
  std::cout << "Flight duration for " << key << ": " << format_duration(*d)
            << std::endl;
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  bool show_help = false;
  std::string file;
  std::string action = "list";
  options opts;

  using action_fn = std::function<int(flight_database&, const options&)>;
  const std::map<std::string, action_fn> actions{
      {"list", list_flights}, {"find", find_flights}, {"seats", seats},
      {"book", book},         {"cancel", cancel},     {"duration", duration},
  };

  // Define command line interface
  auto cli =
      lyra::cli() | lyra::help(show_help) |
      lyra::opt(opts.origin, "origin")["-o"]["--origin"]("Origin airport") |
      lyra::opt(opts.destination,
                "destination")["-t"]["--destination"]("Destination airport") |
      lyra::opt(opts.date, "ddMon")["-d"]["--date"]("Departure date") |
      lyra::opt(opts.time, "hh:mm")["--time"]("Departure time") |
      lyra::opt(opts.from, "hh:mm")["--from"](
          "Earliest departure for find (default 00:00)") |
      lyra::opt(opts.until, "hh:mm")["--until"](
          "Latest departure for find (default 23:59)") |
      lyra::opt(opts.cls, "class")["-c"]["--class"]("Seat class: first or coach") |
      lyra::arg(file, "file")("Flight CSV file").required() |
      lyra::arg(action, "action")(
          "One of list, find, seats, book, cancel, duration");

  // Parse command line
  auto result = cli.parse({argc, argv});
  if (!result) {
    std::cerr << "Error in command line: " << result.message() << std::endl;
    std::cerr << cli << std::endl;
    return 1;
  }

  // Show help if requested
  if (show_help) {
    std::cout << cli << std::endl;
    return 0;
  }

  const auto it = actions.find(action);
  if (it == actions.end()) {
    std::cerr << "Unknown action: " << action << std::endl;
    return 1;
  }

  flight_database db;
  try {
    const auto report = db.read_flights_from_file(file);
    for (const auto& key : report.duplicates) {
      std::cerr << "Warning: duplicate flight " << key << ", skipped"
                << std::endl;
    }
    std::cout << "Loaded " << report.added << " flight(s) from " << file
              << std::endl;
    return it->second(db, opts);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
