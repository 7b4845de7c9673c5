#include "slotkeeper/cli/commands.hpp"

#include "slotkeeper/common/fs.hpp"
#include "slotkeeper/common/json_util.hpp"
#include "slotkeeper/config/config.hpp"
#include "slotkeeper/observability/factory.hpp"
#include "slotkeeper/observability/global.hpp"
#include "slotkeeper/scheduling/booking_service.hpp"
#include "slotkeeper/store/sqlite_store.hpp"

#include <charconv>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace slotkeeper::cli {

namespace {

using scheduling::BookingService;

std::string version_string() {
#ifdef SLOTKEEPER_VERSION
  std::string version = SLOTKEEPER_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "slotkeeper " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

std::optional<std::string> take_optional(std::vector<std::string> &args,
                                         const std::string &long_name,
                                         const std::string &short_name = "") {
  std::string value;
  if (take_option(args, long_name, short_name, value)) {
    return value;
  }
  return std::nullopt;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

bool parse_int(const std::string &text, int &out) {
  const auto *first = text.data();
  const auto *last = first + text.size();
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && ptr == last;
}

int usage(const std::string &line) {
  std::cerr << "usage: slotkeeper " << line << "\n";
  return 1;
}

int report(const common::Status &status) {
  std::cerr << common::error_code_name(status.code()) << ": " << status.error() << "\n";
  return status.code() == common::ErrorCode::Conflict ? 2 : 1;
}

std::string optional_json(const std::optional<std::string> &value) {
  return value.has_value() ? common::json_string(*value) : "null";
}

std::string slot_json(const scheduling::TimeSlot &slot) {
  std::ostringstream out;
  out << "{\"start\":" << common::json_string(scheduling::format_time(slot.time.start))
      << ",\"end\":" << common::json_string(scheduling::format_time(slot.time.end))
      << ",\"available\":" << (slot.available ? "true" : "false")
      << ",\"staff_id\":" << optional_json(slot.staff_id) << "}";
  return out.str();
}

std::string day_json(const scheduling::DayAvailability &day) {
  std::ostringstream out;
  out << "{\"date\":" << common::json_string(scheduling::format_date(day.date))
      << ",\"is_open\":" << (day.is_open ? "true" : "false");
  if (day.open_time.has_value() && day.close_time.has_value()) {
    out << ",\"open_time\":" << common::json_string(scheduling::format_time(*day.open_time))
        << ",\"close_time\":" << common::json_string(scheduling::format_time(*day.close_time));
  }
  out << ",\"slots\":[";
  for (std::size_t i = 0; i < day.slots.size(); ++i) {
    out << (i > 0 ? "," : "") << slot_json(day.slots[i]);
  }
  out << "],\"blocked_slots\":[";
  for (std::size_t i = 0; i < day.blocked_slots.size(); ++i) {
    const auto &blocked = day.blocked_slots[i];
    out << (i > 0 ? "," : "") << "{\"start\":"
        << common::json_string(scheduling::format_time(blocked.time.start))
        << ",\"end\":" << common::json_string(scheduling::format_time(blocked.time.end))
        << ",\"reason\":" << common::json_string(blocked.reason)
        << ",\"id\":" << common::json_string(blocked.period_id) << "}";
  }
  out << "]}";
  return out.str();
}

std::string appointment_json(const scheduling::Appointment &appointment) {
  std::ostringstream out;
  out << "{\"id\":" << common::json_string(appointment.id)
      << ",\"business_id\":" << common::json_string(appointment.business_id)
      << ",\"customer_id\":" << common::json_string(appointment.customer_id)
      << ",\"staff_id\":" << optional_json(appointment.staff_id)
      << ",\"date\":" << common::json_string(scheduling::format_date(appointment.date))
      << ",\"start\":" << common::json_string(scheduling::format_time(appointment.time.start))
      << ",\"end\":" << common::json_string(scheduling::format_time(appointment.time.end))
      << ",\"status\":"
      << common::json_string(std::string(scheduling::status_name(appointment.status)))
      << ",\"reschedules\":" << appointment.reschedule_history.size() << "}";
  return out.str();
}

void print_day(const scheduling::DayAvailability &day) {
  std::cout << scheduling::format_date(day.date) << " "
            << scheduling::weekday_name(scheduling::weekday_index(day.date));
  if (!day.is_open) {
    std::cout << " closed\n";
    return;
  }
  if (day.open_time.has_value() && day.close_time.has_value()) {
    std::cout << " open " << scheduling::format_time(*day.open_time) << "-"
              << scheduling::format_time(*day.close_time);
  }
  std::cout << "\n";
  for (const auto &slot : day.slots) {
    std::cout << "  " << scheduling::format_range(slot.time) << "  "
              << (slot.available ? "available" : "taken") << "\n";
  }
  for (const auto &blocked : day.blocked_slots) {
    std::cout << "  blocked " << scheduling::format_range(blocked.time);
    if (!blocked.reason.empty()) {
      std::cout << " (" << blocked.reason << ")";
    }
    std::cout << "\n";
  }
}

void print_appointment(const scheduling::Appointment &appointment, const bool json) {
  if (json) {
    std::cout << appointment_json(appointment) << "\n";
    return;
  }
  std::cout << appointment.id << " " << scheduling::format_date(appointment.date) << " "
            << scheduling::format_range(appointment.time) << " "
            << scheduling::status_name(appointment.status) << "\n";
}

/// Store and service opened from the loaded config for one command.
struct Session {
  config::Config config;
  std::unique_ptr<store::SqliteScheduleStore> store;
  std::unique_ptr<BookingService> service;
};

common::Result<std::unique_ptr<Session>> open_session() {
  using Out = common::Result<std::unique_ptr<Session>>;
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return Out::failure(cfg.status());
  }
  auto validated = config::validate_config(cfg.value());
  if (!validated.ok()) {
    return Out::failure(validated.status());
  }

  auto session = std::make_unique<Session>();
  session->config = cfg.value();
  observability::set_global_observer(observability::create_observer(session->config));
  for (const auto &warning : validated.value()) {
    std::cerr << "[WARN] " << warning << "\n";
  }

  session->store =
      std::make_unique<store::SqliteScheduleStore>(common::expand_path(session->config.store.path));
  if (!session->store->health_check()) {
    return Out::failure(common::ErrorCode::StoreUnavailable,
                        "unable to open " + std::string(session->store->name()) +
                            " store at " + session->config.store.path);
  }

  const auto &availability = session->config.availability;
  session->service = std::make_unique<BookingService>(
      *session->store, scheduling::ResolverOptions{
                           .slot_step_minutes = availability.slot_step_minutes,
                           .search_horizon_days = availability.search_horizon_days,
                           .max_range_days = availability.max_range_days,
                           .cache_enabled = availability.cache_enabled});
  return Out::success(std::move(session));
}

int read_duration(std::vector<std::string> &args, int &duration) {
  duration = 30;
  if (auto value = take_optional(args, "--duration", "-d"); value.has_value()) {
    if (!parse_int(*value, duration) || duration <= 0) {
      std::cerr << "invalid --duration: " << *value << "\n";
      return 1;
    }
  }
  return 0;
}

int run_business(BookingService &service, std::vector<std::string> args) {
  const auto name = take_optional(args, "--name");
  if (args.size() != 2 || args[0] != "add") {
    return usage("business add <id> [--name NAME]");
  }
  if (auto status = service.register_business(args[1], name.value_or(args[1])); !status.ok()) {
    return report(status);
  }
  std::cout << "business " << args[1] << " registered\n";
  return 0;
}

int run_staff(BookingService &service, std::vector<std::string> args) {
  const auto business = take_optional(args, "--business", "-b");
  const auto name = take_optional(args, "--name");
  if (args.size() != 2 || args[0] != "add" || !business.has_value()) {
    return usage("staff add <id> --business ID [--name NAME]");
  }
  if (auto status = service.register_staff(args[1], *business, name.value_or(args[1]));
      !status.ok()) {
    return report(status);
  }
  std::cout << "staff " << args[1] << " registered\n";
  return 0;
}

int run_hours(BookingService &service, std::vector<std::string> args) {
  scheduling::DayScheduleRequest request;
  std::string value;
  while (take_option(args, "--break", "", value)) {
    request.breaks.push_back(value);
  }
  if (args.size() == 3 && args[2] == "closed") {
    request.is_open = false;
  } else if (args.size() != 4) {
    return usage("hours <business> <weekday> (<open> <close> [--break HH:MM-HH:MM]... | closed)");
  } else {
    request.open_time = args[2];
    request.close_time = args[3];
  }
  request.business_id = args[0];
  request.weekday = args[1];
  if (auto status = service.set_day_schedule(request); !status.ok()) {
    return report(status);
  }
  std::cout << "hours updated for " << request.business_id << " " << request.weekday << "\n";
  return 0;
}

int run_special(BookingService &service, std::vector<std::string> args) {
  scheduling::SpecialDayRequest request;
  request.note = take_optional(args, "--note").value_or("");
  if (args.size() == 3 && (args[2] == "closed" || args[2] == "open")) {
    request.is_open = args[2] == "open";
  } else if (args.size() == 4) {
    request.is_open = true;
    request.open_time = args[2];
    request.close_time = args[3];
  } else {
    return usage("special <business> <date> (closed | open | <open> <close>) [--note TEXT]");
  }
  request.business_id = args[0];
  request.date = args[1];
  if (auto status = service.set_special_day(request); !status.ok()) {
    return report(status);
  }
  std::cout << "special day " << request.date << " saved\n";
  return 0;
}

int run_override(BookingService &service, std::vector<std::string> args) {
  scheduling::StaffOverrideRequest request;
  request.reason = take_optional(args, "--reason").value_or("");
  if (args.size() == 3 && (args[2] == "off" || args[2] == "on")) {
    request.is_available = args[2] == "on";
  } else if (args.size() == 4) {
    request.start_time = args[2];
    request.end_time = args[3];
  } else {
    return usage("override <staff> <date> (off | on | <start> <end>) [--reason TEXT]");
  }
  request.staff_id = args[0];
  request.date = args[1];
  if (auto status = service.set_staff_override(request); !status.ok()) {
    return report(status);
  }
  std::cout << "override for " << request.staff_id << " on " << request.date << " saved\n";
  return 0;
}

int run_slots(BookingService &service, std::vector<std::string> args) {
  const bool json = take_flag(args, "--json");
  const auto staff = take_optional(args, "--staff", "-s");
  const auto to = take_optional(args, "--to");
  int duration = 0;
  if (read_duration(args, duration) != 0) {
    return 1;
  }
  if (args.size() != 2) {
    return usage("slots <business> <date> [--to DATE] [--duration MIN] [--staff ID] [--json]");
  }

  auto days = service.get_range_availability(args[0], args[1], to.value_or(args[1]), duration,
                                             staff);
  if (!days.ok()) {
    return report(days.status());
  }
  if (json) {
    std::cout << "[";
    for (std::size_t i = 0; i < days.value().size(); ++i) {
      std::cout << (i > 0 ? "," : "") << day_json(*days.value()[i]);
    }
    std::cout << "]\n";
    return 0;
  }
  for (const auto &day : days.value()) {
    print_day(*day);
  }
  return 0;
}

int run_next(BookingService &service, std::vector<std::string> args) {
  const bool json = take_flag(args, "--json");
  const auto staff = take_optional(args, "--staff", "-s");
  const auto from = take_optional(args, "--from");
  const auto horizon_text = take_optional(args, "--horizon");
  int duration = 0;
  if (read_duration(args, duration) != 0) {
    return 1;
  }
  if (args.size() != 1 || !from.has_value()) {
    return usage("next <business> --from DATE [--duration MIN] [--staff ID] [--horizon DAYS]");
  }
  std::optional<int> horizon;
  if (horizon_text.has_value()) {
    int parsed = 0;
    if (!parse_int(*horizon_text, parsed)) {
      std::cerr << "invalid --horizon: " << *horizon_text << "\n";
      return 1;
    }
    horizon = parsed;
  }

  auto next = service.find_next_available_slot(args[0], duration, staff, *from, horizon);
  if (!next.ok()) {
    return report(next.status());
  }
  if (!next.value().has_value()) {
    if (json) {
      std::cout << "null\n";
    } else {
      std::cout << "no available slot within "
                << horizon.value_or(service.resolver().options().search_horizon_days)
                << " days\n";
    }
    return 0;
  }
  const auto &found = *next.value();
  if (json) {
    std::cout << "{\"date\":" << common::json_string(scheduling::format_date(found.date))
              << ",\"slot\":" << slot_json(found.slot) << "}\n";
  } else {
    std::cout << scheduling::format_date(found.date) << " "
              << scheduling::format_range(found.slot.time) << "\n";
  }
  return 0;
}

int run_stats(BookingService &service, std::vector<std::string> args) {
  const bool json = take_flag(args, "--json");
  const auto staff = take_optional(args, "--staff", "-s");
  int duration = 0;
  if (read_duration(args, duration) != 0) {
    return 1;
  }
  if (args.size() != 3) {
    return usage("stats <business> <start> <end> [--duration MIN] [--staff ID] [--json]");
  }

  auto stats = service.get_statistics(args[0], args[1], args[2], duration, staff);
  if (!stats.ok()) {
    return report(stats.status());
  }
  const auto &s = stats.value();
  if (json) {
    std::cout << "{\"total_slots\":" << s.total_slots
              << ",\"available_slots\":" << s.available_slots
              << ",\"booked_slots\":" << s.booked_slots << ",\"blocked_count\":" << s.blocked_count
              << ",\"utilization_rate\":" << s.utilization_rate << "}\n";
    return 0;
  }
  std::cout << "total:       " << s.total_slots << "\n"
            << "available:   " << s.available_slots << "\n"
            << "booked:      " << s.booked_slots << "\n"
            << "blocked:     " << s.blocked_count << "\n"
            << "utilization: " << std::fixed << std::setprecision(1)
            << s.utilization_rate * 100.0 << "%\n";
  return 0;
}

int run_book(BookingService &service, std::vector<std::string> args) {
  const bool json = take_flag(args, "--json");
  scheduling::BookingRequest request;
  request.staff_id = take_optional(args, "--staff", "-s");
  request.notes = take_optional(args, "--notes").value_or("");
  const auto customer = take_optional(args, "--customer", "-c");
  if (args.size() != 4 || !customer.has_value()) {
    return usage("book <business> <date> <start> <end> --customer ID [--staff ID] [--notes TEXT]");
  }
  request.business_id = args[0];
  request.customer_id = *customer;
  request.date = args[1];
  request.start_time = args[2];
  request.end_time = args[3];

  auto booked = service.book_appointment(request);
  if (!booked.ok()) {
    return report(booked.status());
  }
  print_appointment(booked.value(), json);
  return 0;
}

int run_cancel(BookingService &service, std::vector<std::string> args) {
  const auto reason = take_optional(args, "--reason").value_or("");
  const auto by = take_optional(args, "--by").value_or("");
  if (args.size() != 1) {
    return usage("cancel <appointment> [--reason TEXT] [--by WHO]");
  }
  auto cancelled = service.cancel_appointment(args[0], reason, by);
  if (!cancelled.ok()) {
    return report(cancelled.status());
  }
  print_appointment(cancelled.value(), false);
  return 0;
}

int run_reschedule(BookingService &service, std::vector<std::string> args) {
  const bool json = take_flag(args, "--json");
  const auto reason = take_optional(args, "--reason").value_or("");
  const auto by = take_optional(args, "--by").value_or("");
  if (args.size() != 4) {
    return usage("reschedule <appointment> <date> <start> <end> [--reason TEXT] [--by WHO]");
  }
  auto moved = service.reschedule_appointment(args[0], args[1], args[2], args[3], reason, by);
  if (!moved.ok()) {
    return report(moved.status());
  }
  print_appointment(moved.value(), json);
  return 0;
}

int run_status(BookingService &service, std::vector<std::string> args) {
  const bool json = take_flag(args, "--json");
  const auto reason = take_optional(args, "--reason").value_or("");
  const auto by = take_optional(args, "--by").value_or("");
  if (args.size() == 1) {
    auto appointment = service.get_appointment(args[0]);
    if (!appointment.ok()) {
      return report(appointment.status());
    }
    print_appointment(appointment.value(), json);
    return 0;
  }
  if (args.size() != 2) {
    return usage("status <appointment> [<new-status>] [--reason TEXT] [--by WHO]");
  }
  auto updated = service.update_appointment_status(args[0], args[1], reason, by);
  if (!updated.ok()) {
    return report(updated.status());
  }
  print_appointment(updated.value(), json);
  return 0;
}

int run_block(BookingService &service, std::vector<std::string> args) {
  scheduling::BlockRequest request;
  request.staff_id = take_optional(args, "--staff", "-s");
  request.reason = take_optional(args, "--reason").value_or("");
  request.recurrence = take_optional(args, "--recurrence", "-r").value_or("none");
  if (args.size() != 4) {
    return usage("block <business> <date> <start> <end> [--staff ID] [--reason TEXT] "
                 "[--recurrence daily|weekly|monthly]");
  }
  request.business_id = args[0];
  request.date = args[1];
  request.start_time = args[2];
  request.end_time = args[3];

  auto blocked = service.block_period(request);
  if (!blocked.ok()) {
    return report(blocked.status());
  }
  std::cout << blocked.value().id << " " << scheduling::format_date(blocked.value().date) << " "
            << scheduling::format_range(blocked.value().time) << " "
            << scheduling::recurrence_name(blocked.value().recurrence) << "\n";
  return 0;
}

int run_unblock(BookingService &service, std::vector<std::string> args) {
  if (args.size() != 1) {
    return usage("unblock <blocked-period>");
  }
  if (auto status = service.remove_blocked_period(args[0]); !status.ok()) {
    return report(status);
  }
  std::cout << "removed " << args[0] << "\n";
  return 0;
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "usage: slotkeeper [--config PATH] <command> [options]\n\n";
  std::cout << "setup:\n"
            << "  business add <id> [--name NAME]\n"
            << "  staff add <id> --business ID [--name NAME]\n"
            << "  hours <business> <weekday> (<open> <close> [--break HH:MM-HH:MM]... | closed)\n"
            << "  special <business> <date> (closed | open | <open> <close>) [--note TEXT]\n"
            << "  override <staff> <date> (off | on | <start> <end>) [--reason TEXT]\n\n";
  std::cout << "availability:\n"
            << "  slots <business> <date> [--to DATE] [--duration MIN] [--staff ID] [--json]\n"
            << "  next <business> --from DATE [--duration MIN] [--staff ID] [--horizon DAYS]\n"
            << "  stats <business> <start> <end> [--duration MIN] [--staff ID] [--json]\n\n";
  std::cout << "bookings:\n"
            << "  book <business> <date> <start> <end> --customer ID [--staff ID] [--notes TEXT]\n"
            << "  cancel <appointment> [--reason TEXT] [--by WHO]\n"
            << "  reschedule <appointment> <date> <start> <end> [--reason TEXT] [--by WHO]\n"
            << "  status <appointment> [<new-status>]\n"
            << "  block <business> <date> <start> <end> [--staff ID] [--recurrence PATTERN]\n"
            << "  unblock <blocked-period>\n\n";
  std::cout << "other:\n"
            << "  config-path    print the config file location\n"
            << "  version        print the version\n"
            << "  help           show this help\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  if (argc <= 1) {
    print_help();
    return 0;
  }

  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }
  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      return report(path_result.status());
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }

  using Handler = int (*)(BookingService &, std::vector<std::string>);
  const std::vector<std::pair<std::string, Handler>> handlers = {
      {"business", run_business}, {"staff", run_staff},
      {"hours", run_hours},       {"special", run_special},
      {"override", run_override}, {"slots", run_slots},
      {"next", run_next},         {"stats", run_stats},
      {"book", run_book},         {"cancel", run_cancel},
      {"reschedule", run_reschedule}, {"status", run_status},
      {"block", run_block},       {"unblock", run_unblock}};

  for (const auto &[name, handler] : handlers) {
    if (name != subcommand) {
      continue;
    }
    auto session = open_session();
    if (!session.ok()) {
      return report(session.status());
    }
    const int code = handler(*session.value()->service, std::move(args));
    if (auto *observer = observability::get_global_observer(); observer != nullptr) {
      observer->flush();
    }
    return code;
  }

  std::cerr << "unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace slotkeeper::cli
