#pragma once

#include <sqlite3.h>

#include <string>

namespace mprisrelay::db::sqlite {

/*
  Owns the connection to the credentials database.

  The file holds trust keys: it is created 0600 before SQLite touches it
  and an existing file is narrowed to 0600 on open. SQLite gives its WAL
  and shm files the same mode as the database.

  One connection is shared by the credential store, which serializes
  access; SQLITE_OPEN_FULLMUTEX covers the rollback path in destructors.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Runs one or more statements; throws std::runtime_error with the
  // SQLite message on failure.
  void Exec(const std::string& sql);

 private:
  bool IsFile() const;
  void CreatePrivateFile();
  void Configure();

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace mprisrelay::db::sqlite
