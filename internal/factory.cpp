#include "factory.hpp"

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/core/coordinator.hpp"
#include "internal/core/project_space.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/coordination_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/tools/tool_dispatcher.hpp"
#if COORD_DB_SQLITE
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace coord::factory {

std::shared_ptr<db::Repository> BuildRepository(const coord::runtime::config::RuntimeConfig& config,
                                                const project::ProjectLocation&              location) {
  const auto& store = config.store();
  if (store.has_sqlite()) {
#if COORD_DB_SQLITE
    std::error_code ec;
    std::filesystem::create_directories(location.state_root, ec);
    if (ec) {
      throw std::runtime_error("cannot create state directory " + location.state_root.string() + ": " + ec.message());
    }

    auto path      = (location.state_root / store.sqlite().filename()).string();
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(path, static_cast<int>(store.sqlite().busy_timeout_ms()));
    db::sql::RunMigrations(*sqlite_db, db::sql::CoordinationSchema());

    COORD_LOG_DEBUG("sqlite store ready", {observability::StringField("path", path)});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

Application Build(const coord::runtime::config::RuntimeConfig& config, std::shared_ptr<util::TimeSource> time_source) {
  Application app;

  // ------------------------------------------------------------------
  // Projects
  // ------------------------------------------------------------------
  auto opener = [config](const project::ProjectLocation& location) { return BuildRepository(config, location); };

  app.projects = std::make_shared<core::ProjectSpace>(project::ProjectResolver(config.projects()), std::move(opener),
                                                      core::CoordinatorOptions::FromConfig(config.coordination()),
                                                      std::move(time_source));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.projects = app.projects;

  app.coordination_service = std::make_shared<service::CoordinationService>(ctx);
  app.tools                = std::make_shared<tools::ToolDispatcher>(app.coordination_service);

  return app;
}

} // namespace coord::factory
