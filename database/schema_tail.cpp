)";

/**
 * Callback for sqlite3_exec that expects not to be called.
 */
int
ExpectNoResult (void* data, int columns, char** strs, char** names)
{
  LOG (FATAL) << "Expected no result from DB query";
}

} // anonymous namespace

void
SetupDatabaseSchema (sqlite3* db)
{
  LOG (INFO) << "Setting up the database schema";
  CHECK_EQ (sqlite3_exec (db, SCHEMA_SQL, &ExpectNoResult, nullptr, nullptr),
            SQLITE_OK)
      << "Failed to set up the schema: " << sqlite3_errmsg (db);
}

} // namespace abc
