#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "fabplan/v1.hpp"
#include "internal/knowledge/api/tool_catalog.hpp"
#include "internal/knowledge/sqlite/sqlite_db.hpp"
#include "internal/util/time.hpp"

namespace fabplan::knowledge::sqlite {

/*
  SQLite-backed knowledge store.

  Historical runs are stored raw and fitted into response models when the
  catalog is opened and again after every successful Import. Queries only
  read the fitted models. Query deadlines are enforced through the sqlite
  progress handler.
*/
class SqliteToolCatalog final : public ToolCatalog {
 public:
  // Fits the stored runs. Throws SqliteError when the schema is missing.
  explicit SqliteToolCatalog(std::shared_ptr<SqliteDB> db, util::NowFn now = util::Now);

  // Creates the catalog tables when missing.
  static void BootstrapSchema(SqliteDB& db);

  CatalogResult FindCandidates(const ToolQuery& query) override;

  // Inserts or replaces every tool of the document in one transaction.
  Result Import(const fabplan::v1::ToolCatalogSpec& spec);

 private:
  using ModelKey = std::pair<std::string, model::ProcessCategory>;
  using ModelCache = std::map<ModelKey, std::shared_ptr<const surrogate::SurrogateModel>>;

  Result Translate(int rc) const;

  std::shared_ptr<const surrogate::SurrogateModel> CachedModel(const std::string& tool_id, model::ProcessCategory category) const;

  // Reads every stored run set and fits it; unusable sets are logged and skipped.
  ModelCache FitStoredModels();

  // Never throws. A no-op when sqlite already ended the transaction.
  void RollBack();

  void ImportTool(const fabplan::v1::ToolSpec& tool);

  std::shared_ptr<SqliteDB> db_;
  util::NowFn               now_;

  mutable std::mutex cache_mutex_;
  ModelCache         model_cache_;
};

} // namespace fabplan::knowledge::sqlite
