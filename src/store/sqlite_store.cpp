#include "slotkeeper/store/sqlite_store.hpp"

#include "slotkeeper/common/fs.hpp"
#include "slotkeeper/observability/global.hpp"

#include <sstream>

namespace slotkeeper::store {

namespace {

using common::ErrorCode;
using common::Result;
using common::Status;
using scheduling::Appointment;
using scheduling::BlockedPeriod;

constexpr const char *APPOINTMENT_COLUMNS =
    "id, business_id, customer_id, staff_id, date, start_time, end_time, status, notes, "
    "cancellation_reason, cancelled_by, created_at, updated_at";

constexpr const char *BLOCKED_COLUMNS =
    "id, business_id, staff_id, date, start_time, end_time, reason, recurrence";

Status store_error(sqlite3 *db, const std::string &context) {
  const std::string message = context + ": " + (db == nullptr ? "no database" : sqlite3_errmsg(db));
  observability::record_error("store", message);
  return Status::error(ErrorCode::StoreUnavailable, message);
}

Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    observability::record_error("store", msg);
    return Status::error(ErrorCode::StoreUnavailable, msg);
  }
  return Status::success();
}

/// Owns a prepared statement for the duration of one query.
class Statement {
public:
  Statement(sqlite3 *db, const char *sql) {
    if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
      stmt_ = nullptr;
    }
  }
  ~Statement() {
    if (stmt_ != nullptr) {
      sqlite3_finalize(stmt_);
    }
  }

  Statement(const Statement &) = delete;
  Statement &operator=(const Statement &) = delete;

  [[nodiscard]] bool ok() const { return stmt_ != nullptr; }
  [[nodiscard]] sqlite3_stmt *get() const { return stmt_; }

  void bind(const int index, const std::string &value) {
    sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
  }
  void bind(const int index, const int value) { sqlite3_bind_int(stmt_, index, value); }
  void bind(const int index, const std::optional<std::string> &value) {
    if (value.has_value()) {
      bind(index, *value);
    } else {
      sqlite3_bind_null(stmt_, index);
    }
  }
  void bind(const int index, const std::optional<int> &value) {
    if (value.has_value()) {
      bind(index, *value);
    } else {
      sqlite3_bind_null(stmt_, index);
    }
  }

  [[nodiscard]] int step() { return sqlite3_step(stmt_); }

  [[nodiscard]] std::string text(const int column) const {
    const auto *value = reinterpret_cast<const char *>(sqlite3_column_text(stmt_, column));
    return value == nullptr ? std::string() : std::string(value);
  }
  [[nodiscard]] std::optional<std::string> optional_text(const int column) const {
    if (sqlite3_column_type(stmt_, column) == SQLITE_NULL) {
      return std::nullopt;
    }
    return text(column);
  }
  [[nodiscard]] int integer(const int column) const { return sqlite3_column_int(stmt_, column); }
  [[nodiscard]] std::optional<int> optional_integer(const int column) const {
    if (sqlite3_column_type(stmt_, column) == SQLITE_NULL) {
      return std::nullopt;
    }
    return integer(column);
  }

private:
  sqlite3_stmt *stmt_ = nullptr;
};

Status run_write(sqlite3 *db, Statement &stmt, const std::string &context) {
  if (stmt.step() != SQLITE_DONE) {
    return store_error(db, context);
  }
  return Status::success();
}

Result<scheduling::Date> column_date(const Statement &stmt, const int column) {
  auto parsed = scheduling::parse_date(stmt.text(column));
  if (!parsed.ok()) {
    return Result<scheduling::Date>::failure(ErrorCode::StoreUnavailable,
                                             "corrupt date in store: " + parsed.error());
  }
  return parsed;
}

std::string encode_breaks(const std::vector<scheduling::TimeRange> &breaks) {
  std::ostringstream out;
  for (std::size_t i = 0; i < breaks.size(); ++i) {
    if (i > 0) {
      out << ',';
    }
    out << scheduling::format_range(breaks[i]);
  }
  return out.str();
}

Result<std::vector<scheduling::TimeRange>> decode_breaks(const std::string &encoded) {
  std::vector<scheduling::TimeRange> breaks;
  std::stringstream parts(encoded);
  std::string part;
  while (std::getline(parts, part, ',')) {
    part = common::trim(part);
    if (part.empty()) {
      continue;
    }
    auto range = scheduling::parse_range_spec(part);
    if (!range.ok()) {
      return Result<std::vector<scheduling::TimeRange>>::failure(
          ErrorCode::StoreUnavailable, "corrupt break in store: " + range.error());
    }
    breaks.push_back(range.value());
  }
  return Result<std::vector<scheduling::TimeRange>>::success(std::move(breaks));
}

Result<std::vector<scheduling::RescheduleEntry>> load_history(sqlite3 *db,
                                                             const std::string &appointment_id) {
  using History = std::vector<scheduling::RescheduleEntry>;
  Statement stmt(db,
                 "SELECT original_date, original_start, original_end, new_date, new_start, "
                 "new_end, reason, rescheduled_by, rescheduled_at FROM reschedule_history "
                 "WHERE appointment_id = ?1 ORDER BY seq ASC");
  if (!stmt.ok()) {
    return Result<History>::failure(store_error(db, "prepare reschedule history"));
  }
  stmt.bind(1, appointment_id);

  History history;
  int rc = SQLITE_ROW;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    auto original_date = column_date(stmt, 0);
    auto new_date = column_date(stmt, 3);
    if (!original_date.ok() || !new_date.ok()) {
      return Result<History>::failure(ErrorCode::StoreUnavailable,
                                      "corrupt reschedule history for " + appointment_id);
    }
    scheduling::RescheduleEntry entry;
    entry.original_date = original_date.value();
    entry.original_time = {.start = stmt.integer(1), .end = stmt.integer(2)};
    entry.new_date = new_date.value();
    entry.new_time = {.start = stmt.integer(4), .end = stmt.integer(5)};
    entry.reason = stmt.text(6);
    entry.rescheduled_by = stmt.text(7);
    entry.rescheduled_at = stmt.text(8);
    history.push_back(std::move(entry));
  }
  if (rc != SQLITE_DONE) {
    return Result<History>::failure(store_error(db, "read reschedule history"));
  }
  return Result<History>::success(std::move(history));
}

Result<Appointment> row_to_appointment(sqlite3 *db, const Statement &stmt) {
  Appointment appointment;
  appointment.id = stmt.text(0);
  appointment.business_id = stmt.text(1);
  appointment.customer_id = stmt.text(2);
  appointment.staff_id = stmt.optional_text(3);
  auto date = column_date(stmt, 4);
  if (!date.ok()) {
    return Result<Appointment>::failure(date.status());
  }
  appointment.date = date.value();
  appointment.time = {.start = stmt.integer(5), .end = stmt.integer(6)};
  auto status = scheduling::parse_status(stmt.text(7));
  if (!status.ok()) {
    return Result<Appointment>::failure(ErrorCode::StoreUnavailable,
                                        "corrupt appointment status: " + status.error());
  }
  appointment.status = status.value();
  appointment.notes = stmt.text(8);
  appointment.cancellation_reason = stmt.text(9);
  appointment.cancelled_by = stmt.text(10);
  appointment.created_at = stmt.text(11);
  appointment.updated_at = stmt.text(12);

  auto history = load_history(db, appointment.id);
  if (!history.ok()) {
    return Result<Appointment>::failure(history.status());
  }
  appointment.reschedule_history = std::move(history.value());
  return Result<Appointment>::success(std::move(appointment));
}

Result<BlockedPeriod> row_to_blocked_period(const Statement &stmt) {
  BlockedPeriod period;
  period.id = stmt.text(0);
  period.business_id = stmt.text(1);
  period.staff_id = stmt.optional_text(2);
  auto date = column_date(stmt, 3);
  if (!date.ok()) {
    return Result<BlockedPeriod>::failure(date.status());
  }
  period.date = date.value();
  period.time = {.start = stmt.integer(4), .end = stmt.integer(5)};
  period.reason = stmt.text(6);
  auto recurrence = scheduling::parse_recurrence(stmt.text(7));
  if (!recurrence.ok()) {
    return Result<BlockedPeriod>::failure(ErrorCode::StoreUnavailable,
                                          "corrupt recurrence: " + recurrence.error());
  }
  period.recurrence = recurrence.value();
  return Result<BlockedPeriod>::success(std::move(period));
}

/// `date_op` compares the stored date against the bound one: "=" for a single day,
/// ">=" for every day from it onwards.
Result<std::vector<Appointment>> query_active_appointments(sqlite3 *db,
                                                          const std::string &business_id,
                                                          const scheduling::Date &date,
                                                          const char *date_op = "=") {
  const std::string sql = std::string("SELECT ") + APPOINTMENT_COLUMNS +
                          " FROM appointments WHERE business_id = ?1 AND date " + date_op +
                          " ?2 AND status != 'cancelled' ORDER BY date ASC, start_time ASC";
  Statement stmt(db, sql.c_str());
  if (!stmt.ok()) {
    return Result<std::vector<Appointment>>::failure(store_error(db, "prepare appointments"));
  }
  stmt.bind(1, business_id);
  stmt.bind(2, scheduling::format_date(date));

  std::vector<Appointment> out;
  int rc = SQLITE_ROW;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    auto appointment = row_to_appointment(db, stmt);
    if (!appointment.ok()) {
      return Result<std::vector<Appointment>>::failure(appointment.status());
    }
    out.push_back(std::move(appointment.value()));
  }
  if (rc != SQLITE_DONE) {
    return Result<std::vector<Appointment>>::failure(store_error(db, "read appointments"));
  }
  return Result<std::vector<Appointment>>::success(std::move(out));
}

Result<std::vector<BlockedPeriod>> query_blocked_periods(sqlite3 *db,
                                                        const std::string &business_id,
                                                        const scheduling::Date &date) {
  const std::string sql = std::string("SELECT ") + BLOCKED_COLUMNS +
                          " FROM blocked_periods WHERE business_id = ?1 AND "
                          "((recurrence = 'none' AND date = ?2) OR "
                          "(recurrence != 'none' AND date <= ?2)) ORDER BY start_time ASC";
  Statement stmt(db, sql.c_str());
  if (!stmt.ok()) {
    return Result<std::vector<BlockedPeriod>>::failure(store_error(db, "prepare blocked periods"));
  }
  stmt.bind(1, business_id);
  stmt.bind(2, scheduling::format_date(date));

  std::vector<BlockedPeriod> out;
  int rc = SQLITE_ROW;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    auto period = row_to_blocked_period(stmt);
    if (!period.ok()) {
      return Result<std::vector<BlockedPeriod>>::failure(period.status());
    }
    out.push_back(std::move(period.value()));
  }
  if (rc != SQLITE_DONE) {
    return Result<std::vector<BlockedPeriod>>::failure(store_error(db, "read blocked periods"));
  }
  return Result<std::vector<BlockedPeriod>>::success(std::move(out));
}

Result<std::optional<Appointment>> query_appointment(sqlite3 *db, const std::string &id) {
  const std::string sql =
      std::string("SELECT ") + APPOINTMENT_COLUMNS + " FROM appointments WHERE id = ?1";
  Statement stmt(db, sql.c_str());
  if (!stmt.ok()) {
    return Result<std::optional<Appointment>>::failure(store_error(db, "prepare appointment"));
  }
  stmt.bind(1, id);

  const int rc = stmt.step();
  if (rc == SQLITE_DONE) {
    return Result<std::optional<Appointment>>::success(std::nullopt);
  }
  if (rc != SQLITE_ROW) {
    return Result<std::optional<Appointment>>::failure(store_error(db, "read appointment"));
  }
  auto appointment = row_to_appointment(db, stmt);
  if (!appointment.ok()) {
    return Result<std::optional<Appointment>>::failure(appointment.status());
  }
  return Result<std::optional<Appointment>>::success(std::move(appointment.value()));
}

Status write_history(sqlite3 *db, const Appointment &appointment) {
  Statement clear(db, "DELETE FROM reschedule_history WHERE appointment_id = ?1");
  if (!clear.ok()) {
    return store_error(db, "prepare history delete");
  }
  clear.bind(1, appointment.id);
  if (auto status = run_write(db, clear, "clear reschedule history"); !status.ok()) {
    return status;
  }

  int seq = 0;
  for (const auto &entry : appointment.reschedule_history) {
    Statement insert(db,
                     "INSERT INTO reschedule_history(appointment_id, seq, original_date, "
                     "original_start, original_end, new_date, new_start, new_end, reason, "
                     "rescheduled_by, rescheduled_at) "
                     "VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11)");
    if (!insert.ok()) {
      return store_error(db, "prepare history insert");
    }
    insert.bind(1, appointment.id);
    insert.bind(2, seq++);
    insert.bind(3, scheduling::format_date(entry.original_date));
    insert.bind(4, entry.original_time.start);
    insert.bind(5, entry.original_time.end);
    insert.bind(6, scheduling::format_date(entry.new_date));
    insert.bind(7, entry.new_time.start);
    insert.bind(8, entry.new_time.end);
    insert.bind(9, entry.reason);
    insert.bind(10, entry.rescheduled_by);
    insert.bind(11, entry.rescheduled_at);
    if (auto status = run_write(db, insert, "insert reschedule history"); !status.ok()) {
      return status;
    }
  }
  return Status::success();
}

Status write_appointment(sqlite3 *db, const Appointment &appointment) {
  const std::string sql = std::string("INSERT OR REPLACE INTO appointments(") +
                          APPOINTMENT_COLUMNS +
                          ") VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13)";
  Statement stmt(db, sql.c_str());
  if (!stmt.ok()) {
    return store_error(db, "prepare appointment write");
  }
  stmt.bind(1, appointment.id);
  stmt.bind(2, appointment.business_id);
  stmt.bind(3, appointment.customer_id);
  stmt.bind(4, appointment.staff_id);
  stmt.bind(5, scheduling::format_date(appointment.date));
  stmt.bind(6, appointment.time.start);
  stmt.bind(7, appointment.time.end);
  stmt.bind(8, std::string(scheduling::status_name(appointment.status)));
  stmt.bind(9, appointment.notes);
  stmt.bind(10, appointment.cancellation_reason);
  stmt.bind(11, appointment.cancelled_by);
  stmt.bind(12, appointment.created_at);
  stmt.bind(13, appointment.updated_at);
  if (auto status = run_write(db, stmt, "write appointment"); !status.ok()) {
    return status;
  }
  return write_history(db, appointment);
}

Status write_blocked_period(sqlite3 *db, const BlockedPeriod &period) {
  const std::string sql = std::string("INSERT INTO blocked_periods(") + BLOCKED_COLUMNS +
                          ", created_at) VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9)";
  Statement stmt(db, sql.c_str());
  if (!stmt.ok()) {
    return store_error(db, "prepare blocked period insert");
  }
  stmt.bind(1, period.id);
  stmt.bind(2, period.business_id);
  stmt.bind(3, period.staff_id);
  stmt.bind(4, scheduling::format_date(period.date));
  stmt.bind(5, period.time.start);
  stmt.bind(6, period.time.end);
  stmt.bind(7, period.reason);
  stmt.bind(8, std::string(scheduling::recurrence_name(period.recurrence)));
  stmt.bind(9, common::now_rfc3339());
  return run_write(db, stmt, "insert blocked period");
}

class SqliteScheduleTransaction final : public IScheduleTransaction {
public:
  SqliteScheduleTransaction(sqlite3 *db, std::unique_lock<std::mutex> lock)
      : db_(db), lock_(std::move(lock)) {}

  ~SqliteScheduleTransaction() override {
    if (!finished_) {
      (void)rollback();
    }
  }

  [[nodiscard]] Result<std::vector<Appointment>>
  active_appointments(const std::string &business_id, const scheduling::Date &date) override {
    return query_active_appointments(db_, business_id, date);
  }

  [[nodiscard]] Result<std::vector<Appointment>>
  active_appointments_from(const std::string &business_id,
                           const scheduling::Date &from_date) override {
    return query_active_appointments(db_, business_id, from_date, ">=");
  }

  [[nodiscard]] Result<std::vector<BlockedPeriod>>
  blocked_periods(const std::string &business_id, const scheduling::Date &date) override {
    return query_blocked_periods(db_, business_id, date);
  }

  [[nodiscard]] Result<std::optional<Appointment>>
  find_appointment(const std::string &appointment_id) override {
    return query_appointment(db_, appointment_id);
  }

  [[nodiscard]] Status insert_appointment(const Appointment &appointment) override {
    return write_appointment(db_, appointment);
  }

  [[nodiscard]] Status update_appointment(const Appointment &appointment) override {
    return write_appointment(db_, appointment);
  }

  [[nodiscard]] Status insert_blocked_period(const BlockedPeriod &period) override {
    return write_blocked_period(db_, period);
  }

  [[nodiscard]] Status commit() override {
    if (finished_) {
      return Status::error(ErrorCode::StoreUnavailable, "transaction already finished");
    }
    auto status = exec_sql(db_, "COMMIT;");
    if (!status.ok()) {
      (void)rollback();
      return status;
    }
    finished_ = true;
    lock_.unlock();
    return status;
  }

private:
  Status rollback() {
    finished_ = true;
    auto status = exec_sql(db_, "ROLLBACK;");
    if (lock_.owns_lock()) {
      lock_.unlock();
    }
    return status;
  }

  sqlite3 *db_;
  std::unique_lock<std::mutex> lock_;
  bool finished_ = false;
};

} // namespace

SqliteScheduleStore::SqliteScheduleStore(std::filesystem::path db_path)
    : db_path_(std::move(db_path)) {
  const bool in_memory = db_path_ == ":memory:";
  if (!in_memory && db_path_.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(db_path_.parent_path(), ec);
  }

  if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
    open_status_ = store_error(db_, "open " + db_path_.string());
    if (db_ != nullptr) {
      sqlite3_close(db_);
    }
    db_ = nullptr;
    return;
  }

  sqlite3_busy_timeout(db_, 5000);
  open_status_ = init_schema();
}

SqliteScheduleStore::~SqliteScheduleStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status SqliteScheduleStore::ensure_open() const {
  if (db_ == nullptr) {
    return open_status_.ok()
               ? Status::error(ErrorCode::StoreUnavailable, "schedule db not initialized")
               : open_status_;
  }
  return open_status_;
}

common::Status SqliteScheduleStore::init_schema() {
  if (db_ == nullptr) {
    return Status::error(ErrorCode::StoreUnavailable, "schedule db not initialized");
  }

  if (db_path_ != ":memory:") {
    auto status = exec_sql(db_, "PRAGMA journal_mode=WAL;");
    if (!status.ok()) {
      return status;
    }
  }

  return exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS businesses (
  id TEXT PRIMARY KEY,
  name TEXT NOT NULL,
  created_at TEXT NOT NULL
);
CREATE TABLE IF NOT EXISTS staff (
  id TEXT PRIMARY KEY,
  business_id TEXT NOT NULL,
  name TEXT NOT NULL
);
CREATE TABLE IF NOT EXISTS day_schedules (
  business_id TEXT NOT NULL,
  weekday INTEGER NOT NULL,
  is_open INTEGER NOT NULL,
  open_time INTEGER,
  close_time INTEGER,
  breaks TEXT NOT NULL DEFAULT '',
  PRIMARY KEY (business_id, weekday)
);
CREATE TABLE IF NOT EXISTS special_days (
  business_id TEXT NOT NULL,
  date TEXT NOT NULL,
  is_open INTEGER NOT NULL,
  open_time INTEGER,
  close_time INTEGER,
  note TEXT NOT NULL DEFAULT '',
  PRIMARY KEY (business_id, date)
);
CREATE TABLE IF NOT EXISTS staff_overrides (
  staff_id TEXT NOT NULL,
  date TEXT NOT NULL,
  is_available INTEGER NOT NULL,
  start_time INTEGER,
  end_time INTEGER,
  reason TEXT NOT NULL DEFAULT '',
  PRIMARY KEY (staff_id, date)
);
CREATE TABLE IF NOT EXISTS blocked_periods (
  id TEXT PRIMARY KEY,
  business_id TEXT NOT NULL,
  staff_id TEXT,
  date TEXT NOT NULL,
  start_time INTEGER NOT NULL,
  end_time INTEGER NOT NULL,
  reason TEXT NOT NULL DEFAULT '',
  recurrence TEXT NOT NULL DEFAULT 'none',
  created_at TEXT NOT NULL
);
CREATE INDEX IF NOT EXISTS blocked_periods_business_date ON blocked_periods(business_id, date);
CREATE TABLE IF NOT EXISTS appointments (
  id TEXT PRIMARY KEY,
  business_id TEXT NOT NULL,
  customer_id TEXT NOT NULL,
  staff_id TEXT,
  date TEXT NOT NULL,
  start_time INTEGER NOT NULL,
  end_time INTEGER NOT NULL,
  status TEXT NOT NULL,
  notes TEXT NOT NULL DEFAULT '',
  cancellation_reason TEXT NOT NULL DEFAULT '',
  cancelled_by TEXT NOT NULL DEFAULT '',
  created_at TEXT NOT NULL,
  updated_at TEXT NOT NULL
);
CREATE INDEX IF NOT EXISTS appointments_business_date ON appointments(business_id, date);
CREATE INDEX IF NOT EXISTS appointments_staff_date ON appointments(staff_id, date);
CREATE TABLE IF NOT EXISTS reschedule_history (
  appointment_id TEXT NOT NULL,
  seq INTEGER NOT NULL,
  original_date TEXT NOT NULL,
  original_start INTEGER NOT NULL,
  original_end INTEGER NOT NULL,
  new_date TEXT NOT NULL,
  new_start INTEGER NOT NULL,
  new_end INTEGER NOT NULL,
  reason TEXT NOT NULL DEFAULT '',
  rescheduled_by TEXT NOT NULL DEFAULT '',
  rescheduled_at TEXT NOT NULL,
  PRIMARY KEY (appointment_id, seq)
);
)");
}

bool SqliteScheduleStore::health_check() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!ensure_open().ok()) {
    return false;
  }
  return exec_sql(db_, "SELECT 1;").ok();
}

common::Status SqliteScheduleStore::upsert_business(const scheduling::Business &business) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto status = ensure_open(); !status.ok()) {
    return status;
  }
  Statement stmt(db_,
                 "INSERT INTO businesses(id, name, created_at) VALUES(?1, ?2, ?3) "
                 "ON CONFLICT(id) DO UPDATE SET name = excluded.name");
  if (!stmt.ok()) {
    return store_error(db_, "prepare business upsert");
  }
  stmt.bind(1, business.id);
  stmt.bind(2, business.name);
  stmt.bind(3, common::now_rfc3339());
  return run_write(db_, stmt, "upsert business");
}

common::Result<std::optional<scheduling::Business>>
SqliteScheduleStore::find_business(const std::string &business_id) {
  using Out = std::optional<scheduling::Business>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto status = ensure_open(); !status.ok()) {
    return Result<Out>::failure(status);
  }
  Statement stmt(db_, "SELECT id, name FROM businesses WHERE id = ?1");
  if (!stmt.ok()) {
    return Result<Out>::failure(store_error(db_, "prepare business lookup"));
  }
  stmt.bind(1, business_id);
  const int rc = stmt.step();
  if (rc == SQLITE_DONE) {
    return Result<Out>::success(std::nullopt);
  }
  if (rc != SQLITE_ROW) {
    return Result<Out>::failure(store_error(db_, "read business"));
  }
  return Result<Out>::success(scheduling::Business{.id = stmt.text(0), .name = stmt.text(1)});
}

common::Status SqliteScheduleStore::upsert_staff(const scheduling::Staff &staff) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto status = ensure_open(); !status.ok()) {
    return status;
  }
  Statement stmt(db_, "INSERT OR REPLACE INTO staff(id, business_id, name) VALUES(?1, ?2, ?3)");
  if (!stmt.ok()) {
    return store_error(db_, "prepare staff upsert");
  }
  stmt.bind(1, staff.id);
  stmt.bind(2, staff.business_id);
  stmt.bind(3, staff.name);
  return run_write(db_, stmt, "upsert staff");
}

common::Result<std::optional<scheduling::Staff>>
SqliteScheduleStore::find_staff(const std::string &staff_id) {
  using Out = std::optional<scheduling::Staff>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto status = ensure_open(); !status.ok()) {
    return Result<Out>::failure(status);
  }
  Statement stmt(db_, "SELECT id, business_id, name FROM staff WHERE id = ?1");
  if (!stmt.ok()) {
    return Result<Out>::failure(store_error(db_, "prepare staff lookup"));
  }
  stmt.bind(1, staff_id);
  const int rc = stmt.step();
  if (rc == SQLITE_DONE) {
    return Result<Out>::success(std::nullopt);
  }
  if (rc != SQLITE_ROW) {
    return Result<Out>::failure(store_error(db_, "read staff"));
  }
  return Result<Out>::success(
      scheduling::Staff{.id = stmt.text(0), .business_id = stmt.text(1), .name = stmt.text(2)});
}

common::Status SqliteScheduleStore::set_day_schedule(const std::string &business_id,
                                                     const int weekday,
                                                     const scheduling::DaySchedule &schedule) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto status = ensure_open(); !status.ok()) {
    return status;
  }
  Statement stmt(db_,
                 "INSERT OR REPLACE INTO day_schedules(business_id, weekday, is_open, open_time, "
                 "close_time, breaks) VALUES(?1, ?2, ?3, ?4, ?5, ?6)");
  if (!stmt.ok()) {
    return store_error(db_, "prepare day schedule write");
  }
  stmt.bind(1, business_id);
  stmt.bind(2, weekday);
  stmt.bind(3, schedule.is_open ? 1 : 0);
  stmt.bind(4, schedule.open_time);
  stmt.bind(5, schedule.close_time);
  stmt.bind(6, encode_breaks(schedule.breaks));
  return run_write(db_, stmt, "write day schedule");
}

common::Result<std::optional<scheduling::DaySchedule>>
SqliteScheduleStore::day_schedule(const std::string &business_id, const int weekday) {
  using Out = std::optional<scheduling::DaySchedule>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto status = ensure_open(); !status.ok()) {
    return Result<Out>::failure(status);
  }
  Statement stmt(db_,
                 "SELECT is_open, open_time, close_time, breaks FROM day_schedules "
                 "WHERE business_id = ?1 AND weekday = ?2");
  if (!stmt.ok()) {
    return Result<Out>::failure(store_error(db_, "prepare day schedule lookup"));
  }
  stmt.bind(1, business_id);
  stmt.bind(2, weekday);
  const int rc = stmt.step();
  if (rc == SQLITE_DONE) {
    return Result<Out>::success(std::nullopt);
  }
  if (rc != SQLITE_ROW) {
    return Result<Out>::failure(store_error(db_, "read day schedule"));
  }

  auto breaks = decode_breaks(stmt.text(3));
  if (!breaks.ok()) {
    return Result<Out>::failure(breaks.status());
  }
  scheduling::DaySchedule schedule;
  schedule.is_open = stmt.integer(0) != 0;
  schedule.open_time = stmt.optional_integer(1);
  schedule.close_time = stmt.optional_integer(2);
  schedule.breaks = std::move(breaks.value());
  return Result<Out>::success(std::move(schedule));
}

common::Status SqliteScheduleStore::set_special_day(const std::string &business_id,
                                                    const scheduling::SpecialDay &day) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto status = ensure_open(); !status.ok()) {
    return status;
  }
  Statement stmt(db_,
                 "INSERT OR REPLACE INTO special_days(business_id, date, is_open, open_time, "
                 "close_time, note) VALUES(?1, ?2, ?3, ?4, ?5, ?6)");
  if (!stmt.ok()) {
    return store_error(db_, "prepare special day write");
  }
  stmt.bind(1, business_id);
  stmt.bind(2, scheduling::format_date(day.date));
  stmt.bind(3, day.is_open ? 1 : 0);
  stmt.bind(4, day.open_time);
  stmt.bind(5, day.close_time);
  stmt.bind(6, day.note);
  return run_write(db_, stmt, "write special day");
}

common::Result<std::optional<scheduling::SpecialDay>>
SqliteScheduleStore::special_day(const std::string &business_id, const scheduling::Date &date) {
  using Out = std::optional<scheduling::SpecialDay>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto status = ensure_open(); !status.ok()) {
    return Result<Out>::failure(status);
  }
  Statement stmt(db_,
                 "SELECT is_open, open_time, close_time, note FROM special_days "
                 "WHERE business_id = ?1 AND date = ?2");
  if (!stmt.ok()) {
    return Result<Out>::failure(store_error(db_, "prepare special day lookup"));
  }
  stmt.bind(1, business_id);
  stmt.bind(2, scheduling::format_date(date));
  const int rc = stmt.step();
  if (rc == SQLITE_DONE) {
    return Result<Out>::success(std::nullopt);
  }
  if (rc != SQLITE_ROW) {
    return Result<Out>::failure(store_error(db_, "read special day"));
  }
  scheduling::SpecialDay day;
  day.date = date;
  day.is_open = stmt.integer(0) != 0;
  day.open_time = stmt.optional_integer(1);
  day.close_time = stmt.optional_integer(2);
  day.note = stmt.text(3);
  return Result<Out>::success(std::move(day));
}

common::Status
SqliteScheduleStore::set_staff_override(const scheduling::StaffAvailabilityOverride &override_entry) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto status = ensure_open(); !status.ok()) {
    return status;
  }
  Statement stmt(db_,
                 "INSERT OR REPLACE INTO staff_overrides(staff_id, date, is_available, "
                 "start_time, end_time, reason) VALUES(?1, ?2, ?3, ?4, ?5, ?6)");
  if (!stmt.ok()) {
    return store_error(db_, "prepare staff override write");
  }
  stmt.bind(1, override_entry.staff_id);
  stmt.bind(2, scheduling::format_date(override_entry.date));
  stmt.bind(3, override_entry.is_available ? 1 : 0);
  if (override_entry.window.has_value()) {
    stmt.bind(4, override_entry.window->start);
    stmt.bind(5, override_entry.window->end);
  } else {
    stmt.bind(4, std::optional<int>());
    stmt.bind(5, std::optional<int>());
  }
  stmt.bind(6, override_entry.reason);
  return run_write(db_, stmt, "write staff override");
}

common::Result<std::optional<scheduling::StaffAvailabilityOverride>>
SqliteScheduleStore::staff_override(const std::string &staff_id, const scheduling::Date &date) {
  using Out = std::optional<scheduling::StaffAvailabilityOverride>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto status = ensure_open(); !status.ok()) {
    return Result<Out>::failure(status);
  }
  Statement stmt(db_,
                 "SELECT is_available, start_time, end_time, reason FROM staff_overrides "
                 "WHERE staff_id = ?1 AND date = ?2");
  if (!stmt.ok()) {
    return Result<Out>::failure(store_error(db_, "prepare staff override lookup"));
  }
  stmt.bind(1, staff_id);
  stmt.bind(2, scheduling::format_date(date));
  const int rc = stmt.step();
  if (rc == SQLITE_DONE) {
    return Result<Out>::success(std::nullopt);
  }
  if (rc != SQLITE_ROW) {
    return Result<Out>::failure(store_error(db_, "read staff override"));
  }
  scheduling::StaffAvailabilityOverride entry;
  entry.staff_id = staff_id;
  entry.date = date;
  entry.is_available = stmt.integer(0) != 0;
  const auto start = stmt.optional_integer(1);
  const auto end = stmt.optional_integer(2);
  if (start.has_value() && end.has_value()) {
    entry.window = scheduling::TimeRange{.start = *start, .end = *end};
  }
  entry.reason = stmt.text(3);
  return Result<Out>::success(std::move(entry));
}

common::Result<std::vector<scheduling::Appointment>>
SqliteScheduleStore::active_appointments(const std::string &business_id,
                                         const scheduling::Date &date) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto status = ensure_open(); !status.ok()) {
    return Result<std::vector<Appointment>>::failure(status);
  }
  return query_active_appointments(db_, business_id, date);
}

common::Result<std::vector<scheduling::BlockedPeriod>>
SqliteScheduleStore::blocked_periods(const std::string &business_id,
                                     const scheduling::Date &date) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto status = ensure_open(); !status.ok()) {
    return Result<std::vector<BlockedPeriod>>::failure(status);
  }
  return query_blocked_periods(db_, business_id, date);
}

common::Result<std::optional<scheduling::Appointment>>
SqliteScheduleStore::find_appointment(const std::string &appointment_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto status = ensure_open(); !status.ok()) {
    return Result<std::optional<Appointment>>::failure(status);
  }
  return query_appointment(db_, appointment_id);
}

common::Result<std::optional<scheduling::BlockedPeriod>>
SqliteScheduleStore::find_blocked_period(const std::string &period_id) {
  using Out = std::optional<BlockedPeriod>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto status = ensure_open(); !status.ok()) {
    return Result<Out>::failure(status);
  }
  const std::string sql =
      std::string("SELECT ") + BLOCKED_COLUMNS + " FROM blocked_periods WHERE id = ?1";
  Statement stmt(db_, sql.c_str());
  if (!stmt.ok()) {
    return Result<Out>::failure(store_error(db_, "prepare blocked period lookup"));
  }
  stmt.bind(1, period_id);
  const int rc = stmt.step();
  if (rc == SQLITE_DONE) {
    return Result<Out>::success(std::nullopt);
  }
  if (rc != SQLITE_ROW) {
    return Result<Out>::failure(store_error(db_, "read blocked period"));
  }
  auto period = row_to_blocked_period(stmt);
  if (!period.ok()) {
    return Result<Out>::failure(period.status());
  }
  return Result<Out>::success(std::move(period.value()));
}

common::Result<bool> SqliteScheduleStore::remove_blocked_period(const std::string &period_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto status = ensure_open(); !status.ok()) {
    return Result<bool>::failure(status);
  }
  Statement stmt(db_, "DELETE FROM blocked_periods WHERE id = ?1");
  if (!stmt.ok()) {
    return Result<bool>::failure(store_error(db_, "prepare blocked period delete"));
  }
  stmt.bind(1, period_id);
  if (auto status = run_write(db_, stmt, "delete blocked period"); !status.ok()) {
    return Result<bool>::failure(status);
  }
  return Result<bool>::success(sqlite3_changes(db_) > 0);
}

common::Result<std::unique_ptr<IScheduleTransaction>> SqliteScheduleStore::begin_write() {
  using Out = std::unique_ptr<IScheduleTransaction>;
  std::unique_lock<std::mutex> lock(mutex_);
  if (auto status = ensure_open(); !status.ok()) {
    return Result<Out>::failure(status);
  }
  if (auto status = exec_sql(db_, "BEGIN IMMEDIATE;"); !status.ok()) {
    return Result<Out>::failure(status);
  }
  return Result<Out>::success(std::make_unique<SqliteScheduleTransaction>(db_, std::move(lock)));
}

} // namespace slotkeeper::store
