/*
 * Database.cpp
 *
 *  Created on: 4 jan. 2026
 */

#include "Database.hpp"

#include "utils/logger.hpp"

Database::Database(const std::string &path) : mPath(path) {
  LOG_INFO("Using SQLite3 version %s", sqlite3_libversion());

  int rc;
  rc = sqlite3_open_v2(path.c_str(), &mDb,
                       SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                           SQLITE_OPEN_FULLMUTEX,
                       nullptr);
  if (rc != SQLITE_OK) {
    LOG_ERROR("Can't open database %s: %s", path.c_str(),
              mDb ? sqlite3_errmsg(mDb) : sqlite3_errstr(rc));
    sqlite3_close(mDb);
    mDb = nullptr;
    return;
  }
  LOG_INFO("Database %s opened successfully", path.c_str());

  sqlite3_busy_timeout(mDb, kBusyTimeoutMs);
  sqlite3_extended_result_codes(mDb, 1);

  if (exec("PRAGMA foreign_keys = ON") != SQLITE_OK) {
    LOG_ERROR("Failed to enable foreign keys: %s", sqlite3_errmsg(mDb));
  }
  // Lets readers in other processes run next to our writes
  if (path != ":memory:" && exec("PRAGMA journal_mode = WAL") != SQLITE_OK) {
    LOG_WARNING("Failed to enable WAL journal: %s", sqlite3_errmsg(mDb));
  }
}

Database::~Database() {
  if (mDb) {
    sqlite3_close(mDb);
    mDb = nullptr;
  }
}

int Database::exec(const char *sql) {
  if (!mDb)
    return SQLITE_MISUSE;

  char *errmsg = nullptr;
  int rc = sqlite3_exec(mDb, sql, nullptr, nullptr, &errmsg);
  if (rc != SQLITE_OK) {
    LOG_DEBUG("Statement failed: %s", errmsg ? errmsg : sqlite3_errstr(rc));
  }
  sqlite3_free(errmsg);
  return rc;
}

const char *Database::errmsg(void) {
  return mDb ? sqlite3_errmsg(mDb) : "database not open";
}

void Database::rollback(void) {
  if (mDb && !sqlite3_get_autocommit(mDb)) {
    int rc = exec("ROLLBACK");
    if (rc != SQLITE_OK)
      LOG_ERROR("Rollback failed: %s", sqlite3_errmsg(mDb));
  }
}

Statement::Statement(Database &db, const char *sql) {
  if (!db.handle()) {
    mPrepareResult = SQLITE_MISUSE;
    return;
  }
  mPrepareResult = sqlite3_prepare_v2(db.handle(), sql, -1, &mStmt, nullptr);
  if (mPrepareResult != SQLITE_OK) {
    LOG_ERROR("Failed to prepare statement: %s", sqlite3_errmsg(db.handle()));
    sqlite3_finalize(mStmt);
    mStmt = nullptr;
  }
}

Statement::~Statement() { sqlite3_finalize(mStmt); }

void Statement::bind(int index, int64_t value) {
  sqlite3_bind_int64(mStmt, index, value);
}

void Statement::bind(int index, double value) {
  sqlite3_bind_double(mStmt, index, value);
}

void Statement::bind(int index, const std::string &value) {
  sqlite3_bind_text(mStmt, index, value.c_str(), (int)value.size(),
                    SQLITE_TRANSIENT);
}

void Statement::bind(int index, const std::optional<double> &value,
                     bool integer) {
  if (!value)
    bindNull(index);
  else if (integer)
    sqlite3_bind_int64(mStmt, index, (int64_t)*value);
  else
    sqlite3_bind_double(mStmt, index, *value);
}

void Statement::bindNull(int index) { sqlite3_bind_null(mStmt, index); }

int Statement::step(void) { return sqlite3_step(mStmt); }

void Statement::reset(void) {
  sqlite3_reset(mStmt);
  sqlite3_clear_bindings(mStmt);
}

bool Statement::isNull(int column) {
  return sqlite3_column_type(mStmt, column) == SQLITE_NULL;
}

int64_t Statement::columnInt(int column) {
  return sqlite3_column_int64(mStmt, column);
}

double Statement::columnDouble(int column) {
  return sqlite3_column_double(mStmt, column);
}

std::string Statement::columnText(int column) {
  const unsigned char *text = sqlite3_column_text(mStmt, column);
  return text ? (const char *)text : "";
}

std::optional<double> Statement::columnOptional(int column) {
  if (isNull(column))
    return std::nullopt;
  return sqlite3_column_double(mStmt, column);
}
