/*
 * Database.hpp
 *
 *  Created on: 4 jan. 2026
 */

#ifndef DATABASE_HPP_
#define DATABASE_HPP_

#include <mutex>
#include <optional>
#include <string>

#include <stdint.h>

#include <sqlite3.h>

// Owns the sqlite3 connection shared by the registry and the store.
// Callers hold mutex() for the duration of one logical operation.
class Database {
public:
  explicit Database(const std::string &path);
  ~Database();

  Database(const Database &) = delete;
  Database &operator=(const Database &) = delete;

  bool isOpen(void) const { return mDb != nullptr; }
  sqlite3 *handle(void) { return mDb; }
  std::mutex &mutex(void) { return mMutex; }
  const std::string &path(void) const { return mPath; }

  int exec(const char *sql);
  const char *errmsg(void);

  // BEGIN IMMEDIATE takes the write lock up front
  int begin(void) { return exec("BEGIN IMMEDIATE"); }
  int commit(void) { return exec("COMMIT"); }
  void rollback(void);

private:
  std::string mPath;
  sqlite3 *mDb = nullptr;
  std::mutex mMutex;

  static const int kBusyTimeoutMs = 2000;
};

// Prepared statement, finalized when it goes out of scope
class Statement {
public:
  Statement(Database &db, const char *sql);
  ~Statement();

  Statement(const Statement &) = delete;
  Statement &operator=(const Statement &) = delete;

  bool ok(void) const { return mStmt != nullptr; }
  int prepareResult(void) const { return mPrepareResult; }
  sqlite3_stmt *get(void) { return mStmt; }

  void bind(int index, int64_t value);
  void bind(int index, double value);
  void bind(int index, const std::string &value);
  void bind(int index, const std::optional<double> &value, bool integer);
  void bindNull(int index);

  int step(void);
  void reset(void);

  bool isNull(int column);
  int64_t columnInt(int column);
  double columnDouble(int column);
  std::string columnText(int column);
  std::optional<double> columnOptional(int column);

private:
  sqlite3_stmt *mStmt = nullptr;
  int mPrepareResult = SQLITE_OK;
};

#endif /* DATABASE_HPP_ */
