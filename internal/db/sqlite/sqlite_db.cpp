#include "sqlite_db.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace mprisrelay::db::sqlite {

namespace {

constexpr int kBusyTimeoutMs = 5000;

[[noreturn]] void ThrowErrno(const std::string& what, const std::string& path) {
  throw std::runtime_error(what + " " + path + ": " + std::strerror(errno));
}

} // namespace

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  if (IsFile()) {
    CreatePrivateFile();
  }

  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    std::string msg = "open credentials database " + path_ + ": " + (db_ ? sqlite3_errmsg(db_) : "out of memory");
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  try {
    Configure();
  } catch (const std::exception&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errmsg(db_);
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

bool SqliteDB::IsFile() const {
  return !path_.empty() && path_ != ":memory:" && path_.rfind("file:", 0) != 0;
}

void SqliteDB::CreatePrivateFile() {
  const int fd = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC | O_NOFOLLOW, S_IRUSR | S_IWUSR);
  if (fd < 0) {
    ThrowErrno("open", path_);
  }
  if (::fchmod(fd, S_IRUSR | S_IWUSR) != 0) {
    const int saved = errno;
    ::close(fd);
    errno = saved;
    ThrowErrno("chmod", path_);
  }
  ::close(fd);
}

void SqliteDB::Configure() {
  // The agent relays while `mprisrelayctl` or a pairing writes.
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");

  if (sqlite3_busy_timeout(db_, kBusyTimeoutMs) != SQLITE_OK) {
    throw std::runtime_error(std::string("busy_timeout: ") + sqlite3_errmsg(db_));
  }

  // Keys never reach temp files, and deleted rows are overwritten.
  Exec("PRAGMA temp_store=MEMORY;");
  Exec("PRAGMA secure_delete=ON;");
}

} // namespace mprisrelay::db::sqlite
