#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace orchestrator::db::sql {

/*
  Schema versions are recorded in schema_migrations. On open, every
  migration newer than the highest recorded version is applied in order,
  so an existing database is upgraded in place and a current one is left
  untouched.
*/
struct Migration {
  int64_t                  version;
  std::string              description;
  std::vector<std::string> statements;
};

// One per engine; runs dialect SQL on the bootstrap connection.
class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void    ExecuteSQL(const std::string& sql) = 0;
  virtual int64_t QueryInt(const std::string& sql)   = 0;
};

// Returns the number of migrations applied.
int RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& migrations);

const std::vector<Migration>& SqliteMigrations();
const std::vector<Migration>& PostgresMigrations();

} // namespace orchestrator::db::sql
