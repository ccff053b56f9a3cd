#include "sqlite_tool_catalog.hpp"

#include <cstdint>
#include <stdexcept>
#include <vector>

#include "internal/knowledge/response_model.hpp"
#include "internal/model/proto_convert.hpp"
#include "internal/observability/logging.hpp"

namespace fabplan::knowledge::sqlite {

using fabplan::observability::IntField;
using fabplan::observability::StringField;

namespace {

// Number of VM instructions between deadline checks.
constexpr int kProgressInterval = 100;

// Carries a failed sqlite return code out of nested helpers.
struct StepError {
  int rc;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
  sqlite3_bind_double(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

double ColDouble(sqlite3_stmt* st, int col) {
  return sqlite3_column_double(st, col);
}

// Returns true for SQLITE_ROW, false for SQLITE_DONE.
bool Step(sqlite3_stmt* st) {
  const int rc = sqlite3_step(st);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  throw StepError{rc};
}

void Execute(sqlite3_stmt* st) {
  while (Step(st)) {
  }
}

int CategoryColumn(model::ProcessCategory category) {
  return static_cast<int>(category);
}

/*
  Installs a progress handler that interrupts statements once the query
  deadline has passed. Removed on scope exit.
*/
class DeadlineGuard {
 public:
  DeadlineGuard(sqlite3* db, const std::optional<util::TimePoint>& deadline, const util::NowFn& now)
      : db_(db), deadline_(deadline), now_(now) {
    if (deadline_) {
      sqlite3_progress_handler(db_, kProgressInterval, &DeadlineGuard::OnProgress, this);
    }
  }

  ~DeadlineGuard() {
    if (deadline_) {
      sqlite3_progress_handler(db_, 0, nullptr, nullptr);
    }
  }

  DeadlineGuard(const DeadlineGuard&)            = delete;
  DeadlineGuard& operator=(const DeadlineGuard&) = delete;

 private:
  static int OnProgress(void* self) {
    auto* guard = static_cast<DeadlineGuard*>(self);
    return util::Expired(guard->deadline_, guard->now_()) ? 1 : 0;
  }

  sqlite3*                              db_;
  const std::optional<util::TimePoint>& deadline_;
  const util::NowFn&                    now_;
};

} // namespace

SqliteToolCatalog::SqliteToolCatalog(std::shared_ptr<SqliteDB> db, util::NowFn now) : db_(std::move(db)), now_(std::move(now)) {
  try {
    model_cache_ = FitStoredModels();
  } catch (const StepError& e) {
    throw SqliteError(e.rc, sqlite3_errmsg(db_->Handle()));
  }
}

void SqliteToolCatalog::BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS tools (tool_id TEXT PRIMARY KEY, status INTEGER NOT NULL, wafer_size_mm INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS tool_capabilities (tool_id TEXT NOT NULL REFERENCES tools(tool_id) ON DELETE CASCADE, category INTEGER NOT NULL, PRIMARY KEY (tool_id, category));",
      "CREATE TABLE IF NOT EXISTS tool_incompatible_materials (tool_id TEXT NOT NULL REFERENCES tools(tool_id) ON DELETE CASCADE, material TEXT NOT NULL, PRIMARY KEY (tool_id, material));",
      "CREATE TABLE IF NOT EXISTS tool_model_theta (tool_id TEXT NOT NULL REFERENCES tools(tool_id) ON DELETE CASCADE, category INTEGER NOT NULL, parameter TEXT NOT NULL, theta REAL NOT NULL, PRIMARY KEY (tool_id, category, parameter));",
      "CREATE TABLE IF NOT EXISTS tool_runs (tool_id TEXT NOT NULL REFERENCES tools(tool_id) ON DELETE CASCADE, category INTEGER NOT NULL, run_index INTEGER NOT NULL, metric REAL NOT NULL, PRIMARY KEY (tool_id, category, run_index));",
      "CREATE TABLE IF NOT EXISTS tool_run_parameters (tool_id TEXT NOT NULL, category INTEGER NOT NULL, run_index INTEGER NOT NULL, parameter TEXT NOT NULL, value REAL NOT NULL, PRIMARY KEY (tool_id, category, run_index, parameter), FOREIGN KEY (tool_id, category, run_index) REFERENCES tool_runs(tool_id, category, run_index) ON DELETE CASCADE);",
      "CREATE INDEX IF NOT EXISTS tool_capabilities_by_category ON tool_capabilities(category);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }
}

Result SqliteToolCatalog::Translate(int rc) const {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  const char* message = sqlite3_errmsg(db_->Handle());
  switch (rc & 0xff) {
    case SQLITE_INTERRUPT:
      return Result::Err(ErrorCode::DeadlineExceeded, message);
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, message);
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return Result::Err(ErrorCode::IOError, message);
    case SQLITE_CANTOPEN:
      return Result::Err(ErrorCode::Unavailable, message);
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, message);
    default:
      return Result::Err(ErrorCode::InternalError, message);
  }
}

CatalogResult SqliteToolCatalog::FindCandidates(const ToolQuery& query) {
  CatalogResult result;
  if (util::Expired(query.deadline, now_())) {
    result.status = Result::Err(ErrorCode::DeadlineExceeded, "deadline passed before query start");
    return result;
  }

  DeadlineGuard guard(db_->Handle(), query.deadline, now_);

  try {
    auto tools = db_->Prepare(
        "SELECT t.tool_id, t.status, t.wafer_size_mm FROM tools t JOIN tool_capabilities c ON c.tool_id = t.tool_id "
        "WHERE c.category = ?1 AND t.wafer_size_mm = ?2 ORDER BY t.tool_id;");
    BindI32(tools.get(), 1, CategoryColumn(query.category));
    BindI32(tools.get(), 2, static_cast<int>(model::Millimeters(query.wafer_size)));

    auto capabilities = db_->Prepare("SELECT category FROM tool_capabilities WHERE tool_id = ?1;");
    auto materials    = db_->Prepare("SELECT material FROM tool_incompatible_materials WHERE tool_id = ?1;");

    while (Step(tools.get())) {
      model::ToolRecord record;
      record.tool_id    = ColText(tools.get(), 0);
      record.status     = static_cast<model::ToolStatus>(ColI32(tools.get(), 1));
      record.wafer_size = query.wafer_size;

      sqlite3_reset(capabilities.get());
      BindText(capabilities.get(), 1, record.tool_id);
      while (Step(capabilities.get())) {
        record.capable_categories.insert(static_cast<model::ProcessCategory>(ColI32(capabilities.get(), 0)));
      }

      sqlite3_reset(materials.get());
      BindText(materials.get(), 1, record.tool_id);
      while (Step(materials.get())) {
        record.incompatible_materials.insert(ColText(materials.get(), 0));
      }

      record.surrogate_model = CachedModel(record.tool_id, query.category);
      result.tools.push_back(std::move(record));
    }
  } catch (const StepError& e) {
    result.status = Translate(e.rc);
    result.tools.clear();
  } catch (const SqliteError& e) {
    result.status = Translate(e.Code());
    result.tools.clear();
  }

  return result;
}

std::shared_ptr<const surrogate::SurrogateModel> SqliteToolCatalog::CachedModel(const std::string& tool_id,
                                                                                model::ProcessCategory category) const {
  std::lock_guard lock(cache_mutex_);
  auto            it = model_cache_.find(ModelKey{tool_id, category});
  return it == model_cache_.end() ? nullptr : it->second;
}

SqliteToolCatalog::ModelCache SqliteToolCatalog::FitStoredModels() {
  std::map<ModelKey, std::vector<HistoricalRun>> runs;

  auto runs_stmt = db_->Prepare(
      "SELECT r.tool_id, r.category, r.run_index, r.metric, p.parameter, p.value FROM tool_runs r "
      "JOIN tool_run_parameters p ON p.tool_id = r.tool_id AND p.category = r.category AND p.run_index = r.run_index "
      "ORDER BY r.tool_id, r.category, r.run_index, p.parameter;");
  int current_run = -1;
  while (Step(runs_stmt.get())) {
    const ModelKey key{ColText(runs_stmt.get(), 0), static_cast<model::ProcessCategory>(ColI32(runs_stmt.get(), 1))};
    const int      run_index = ColI32(runs_stmt.get(), 2);

    auto& tool_runs = runs[key];
    if (tool_runs.empty() || run_index != current_run) {
      tool_runs.emplace_back();
      tool_runs.back().metric = ColDouble(runs_stmt.get(), 3);
      current_run             = run_index;
    }
    tool_runs.back().parameters[ColText(runs_stmt.get(), 4)] = ColDouble(runs_stmt.get(), 5);
  }

  std::map<ModelKey, std::map<std::string, double>> thetas;
  auto theta_stmt = db_->Prepare("SELECT tool_id, category, parameter, theta FROM tool_model_theta;");
  while (Step(theta_stmt.get())) {
    const ModelKey key{ColText(theta_stmt.get(), 0), static_cast<model::ProcessCategory>(ColI32(theta_stmt.get(), 1))};
    thetas[key][ColText(theta_stmt.get(), 2)] = ColDouble(theta_stmt.get(), 3);
  }

  ModelCache fitted;
  for (const auto& [key, samples] : runs) {
    try {
      fitted[key] = FitResponseModel(samples, thetas[key]);
    } catch (const std::exception& e) {
      FABPLAN_LOG_WARN("Discarding unusable response model",
                       {StringField("tool_id", key.first), StringField("category", model::ToString(key.second)), StringField("error", e.what())});
    }
  }

  FABPLAN_LOG_DEBUG("Response models fitted", {IntField("models", static_cast<std::int64_t>(fitted.size()))});
  return fitted;
}

void SqliteToolCatalog::RollBack() {
  // SQLite ends the transaction on its own after FULL, IOERR or NOMEM.
  if (sqlite3_get_autocommit(db_->Handle()) != 0) {
    return;
  }
  try {
    db_->Exec("ROLLBACK;");
  } catch (const SqliteError& e) {
    FABPLAN_LOG_ERROR("Catalog import rollback failed", {StringField("path", db_->Path()), StringField("error", e.what())});
  }
}

Result SqliteToolCatalog::Import(const fabplan::v1::ToolCatalogSpec& spec) {
  try {
    db_->Exec("BEGIN IMMEDIATE;");
  } catch (const SqliteError& e) {
    return Translate(e.Code());
  }

  try {
    for (const auto& tool : spec.tools()) {
      ImportTool(tool);
    }
    db_->Exec("COMMIT;");
  } catch (const StepError& e) {
    auto status = Translate(e.rc);
    RollBack();
    return status;
  } catch (const std::invalid_argument& e) {
    RollBack();
    return Result::Err(ErrorCode::InvalidArgument, e.what());
  } catch (const SqliteError& e) {
    auto status = Translate(e.Code());
    RollBack();
    return status;
  }

  // Fitting happens here, outside any query deadline.
  ModelCache fitted;
  try {
    fitted = FitStoredModels();
  } catch (const StepError& e) {
    return Translate(e.rc);
  } catch (const SqliteError& e) {
    return Translate(e.Code());
  }

  std::lock_guard lock(cache_mutex_);
  model_cache_ = std::move(fitted);
  return Result::Ok();
}

void SqliteToolCatalog::ImportTool(const fabplan::v1::ToolSpec& tool) {
  if (tool.tool_id().empty()) {
    throw std::invalid_argument("tool catalog entry without tool_id");
  }
  if (!model::WaferSizeFromMillimeters(tool.wafer_size_mm())) {
    throw std::invalid_argument("tool " + tool.tool_id() + ": unsupported wafer size " + std::to_string(tool.wafer_size_mm()));
  }

  auto remove = db_->Prepare("DELETE FROM tools WHERE tool_id = ?1;");
  BindText(remove.get(), 1, tool.tool_id());
  Execute(remove.get());

  auto insert = db_->Prepare("INSERT INTO tools(tool_id, status, wafer_size_mm) VALUES(?1, ?2, ?3);");
  BindText(insert.get(), 1, tool.tool_id());
  BindI32(insert.get(), 2, static_cast<int>(model::FromProto(tool.status())));
  BindI32(insert.get(), 3, static_cast<int>(tool.wafer_size_mm()));
  Execute(insert.get());

  auto capability = db_->Prepare("INSERT OR IGNORE INTO tool_capabilities(tool_id, category) VALUES(?1, ?2);");
  for (int i = 0; i < tool.capabilities_size(); ++i) {
    sqlite3_reset(capability.get());
    BindText(capability.get(), 1, tool.tool_id());
    BindI32(capability.get(), 2, CategoryColumn(model::FromProto(tool.capabilities(i))));
    Execute(capability.get());
  }

  auto material = db_->Prepare("INSERT OR IGNORE INTO tool_incompatible_materials(tool_id, material) VALUES(?1, ?2);");
  for (const auto& name : tool.incompatible_materials()) {
    sqlite3_reset(material.get());
    BindText(material.get(), 1, tool.tool_id());
    BindText(material.get(), 2, name);
    Execute(material.get());
  }

  auto theta     = db_->Prepare("INSERT OR REPLACE INTO tool_model_theta(tool_id, category, parameter, theta) VALUES(?1, ?2, ?3, ?4);");
  auto run       = db_->Prepare("INSERT INTO tool_runs(tool_id, category, run_index, metric) VALUES(?1, ?2, ?3, ?4);");
  auto parameter = db_->Prepare("INSERT INTO tool_run_parameters(tool_id, category, run_index, parameter, value) VALUES(?1, ?2, ?3, ?4, ?5);");

  for (const auto& model_spec : tool.models()) {
    const int category = CategoryColumn(model::FromProto(model_spec.category()));

    for (const auto& [name, value] : model_spec.theta()) {
      sqlite3_reset(theta.get());
      BindText(theta.get(), 1, tool.tool_id());
      BindI32(theta.get(), 2, category);
      BindText(theta.get(), 3, name);
      BindDouble(theta.get(), 4, value);
      Execute(theta.get());
    }

    for (int run_index = 0; run_index < model_spec.runs_size(); ++run_index) {
      const auto& run_spec = model_spec.runs(run_index);

      sqlite3_reset(run.get());
      BindText(run.get(), 1, tool.tool_id());
      BindI32(run.get(), 2, category);
      BindI32(run.get(), 3, run_index);
      BindDouble(run.get(), 4, run_spec.metric());
      Execute(run.get());

      for (const auto& [name, value] : run_spec.parameters()) {
        sqlite3_reset(parameter.get());
        BindText(parameter.get(), 1, tool.tool_id());
        BindI32(parameter.get(), 2, category);
        BindI32(parameter.get(), 3, run_index);
        BindText(parameter.get(), 4, name);
        BindDouble(parameter.get(), 5, value);
        Execute(parameter.get());
      }
    }
  }
}

} // namespace fabplan::knowledge::sqlite
