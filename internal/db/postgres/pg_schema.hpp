#pragma once

#include <memory>

#include "pg_pool.hpp"

namespace resync::db::postgres {

// Creates every table the repository reads. Safe to run on every start.
void BootstrapSchema(PgPool& pool);

} // namespace resync::db::postgres
