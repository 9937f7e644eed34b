#include "cardlink/store/sqlite_store.hpp"

#include <chrono>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace cardlink::store {

// SQL schemas and queries
namespace sql {

constexpr const char* kCreateCardsTable = R"(
CREATE TABLE IF NOT EXISTS cards (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  project_id INTEGER NOT NULL,
  title TEXT,
  summary TEXT,
  content TEXT NOT NULL DEFAULT '',
  created INTEGER NOT NULL,
  updated INTEGER NOT NULL
)
)";

constexpr const char* kCreateTagsTable = R"(
CREATE TABLE IF NOT EXISTS tags (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  project_id INTEGER NOT NULL,
  name TEXT NOT NULL,
  namespace TEXT NOT NULL DEFAULT 'user',
  annotation TEXT,  -- JSON payload
  created INTEGER NOT NULL
)
)";

constexpr const char* kCreateCardTagsTable = R"(
CREATE TABLE IF NOT EXISTS card_tags (
  card_id INTEGER NOT NULL REFERENCES cards(id) ON DELETE CASCADE,
  tag_id INTEGER NOT NULL REFERENCES tags(id) ON DELETE CASCADE,
  PRIMARY KEY (card_id, tag_id)
)
)";

// User tags are unique per project; reference tags may share names
constexpr const char* kCreateIndexes = R"(
CREATE INDEX IF NOT EXISTS idx_cards_project ON cards(project_id);
CREATE INDEX IF NOT EXISTS idx_tags_project_namespace ON tags(project_id, namespace);
CREATE UNIQUE INDEX IF NOT EXISTS idx_tags_user_name ON tags(project_id, name) WHERE namespace = 'user';
CREATE INDEX IF NOT EXISTS idx_card_tags_tag ON card_tags(tag_id);
)";

constexpr const char* kPragmas = R"(
PRAGMA foreign_keys = ON;
PRAGMA journal_mode = WAL;
PRAGMA synchronous = NORMAL;
PRAGMA temp_store = MEMORY;
)";

} // namespace sql

namespace {

int64_t nowMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
}

std::optional<std::string> columnText(sqlite3_stmt* stmt, int column) {
  if (sqlite3_column_type(stmt, column) == SQLITE_NULL) {
    return std::nullopt;
  }
  const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
  int size = sqlite3_column_bytes(stmt, column);
  return std::string(text ? text : "", static_cast<size_t>(size));
}

void bindOptionalText(sqlite3_stmt* stmt, int index, const std::optional<std::string>& value) {
  if (value.has_value()) {
    sqlite3_bind_text(stmt, index, value->c_str(), -1, SQLITE_TRANSIENT);
  } else {
    sqlite3_bind_null(stmt, index);
  }
}

// NULL for an empty annotation. Fails when the payload holds invalid UTF-8.
Result<void> bindAnnotation(sqlite3_stmt* stmt, int index, const core::TagAnnotation& annotation) {
  if (core::annotationKind(annotation) == core::AnnotationKind::kNone) {
    sqlite3_bind_null(stmt, index);
    return {};
  }
  std::string payload;
  try {
    payload = core::annotationToJson(annotation).dump();
  } catch (const nlohmann::json::exception& e) {
    return std::unexpected(makeError(ErrorCode::kValidationError,
                                     "Cannot encode tag annotation: " + std::string(e.what())));
  }
  sqlite3_bind_text(stmt, index, payload.c_str(), -1, SQLITE_TRANSIENT);
  return {};
}

core::TagAnnotation decodeAnnotation(const std::optional<std::string>& payload) {
  if (!payload.has_value()) {
    return std::monostate{};
  }
  auto json = nlohmann::json::parse(*payload, nullptr, false);
  if (json.is_discarded()) {
    // Unreadable payloads stay opaque
    return nlohmann::json(*payload);
  }
  return core::annotationFromJson(json);
}

// Resets the statement when the scope ends
class StatementScope {
public:
  explicit StatementScope(sqlite3_stmt* stmt) : stmt_(stmt) {}
  ~StatementScope() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
  }

  StatementScope(const StatementScope&) = delete;
  StatementScope& operator=(const StatementScope&) = delete;

private:
  sqlite3_stmt* stmt_;
};

}  // namespace

SqliteStore::SqliteStore(std::filesystem::path db_path)
    : db_path_(std::move(db_path)) {
}

SqliteStore::~SqliteStore() {
  finalizeStatements();
  if (db_) {
    sqlite3_close(db_);
  }
}

Result<void> SqliteStore::initialize() {
  std::lock_guard<std::mutex> lock(db_mutex_);

  if (db_) {
    return {};
  }

  // Ensure parent directory exists
  bool in_memory = db_path_ == ":memory:";
  auto parent = db_path_.parent_path();
  if (!in_memory && !parent.empty() && !std::filesystem::exists(parent)) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      return std::unexpected(makeError(ErrorCode::kDirectoryCreateError,
                                       "Failed to create workspace directory: " + ec.message()));
    }
  }

  int result = sqlite3_open(db_path_.c_str(), &db_);
  if (result != SQLITE_OK) {
    auto error = makeSqliteError("Failed to open database " + db_path_.string());
    sqlite3_close(db_);
    db_ = nullptr;
    return std::unexpected(error);
  }

  auto config_result = configureDatabase();
  if (!config_result.has_value()) {
    return config_result;
  }

  auto tables_result = createTables();
  if (!tables_result.has_value()) {
    return tables_result;
  }

  auto prepare_result = prepareStatements();
  if (!prepare_result.has_value()) {
    return prepare_result;
  }

  spdlog::debug("Opened workspace {}", db_path_.string());
  return {};
}

Result<void> SqliteStore::configureDatabase() {
  return checkSqliteResult(
      sqlite3_exec(db_, sql::kPragmas, nullptr, nullptr, nullptr),
      "Configure database pragmas");
}

Result<void> SqliteStore::createTables() {
  const char* schemas[] = {
    sql::kCreateCardsTable,
    sql::kCreateTagsTable,
    sql::kCreateCardTagsTable,
    sql::kCreateIndexes
  };

  for (const char* schema : schemas) {
    auto result = checkSqliteResult(
        sqlite3_exec(db_, schema, nullptr, nullptr, nullptr),
        "Create database schema");
    if (!result.has_value()) {
      return result;
    }
  }

  return {};
}

Result<void> SqliteStore::prepareStatements() {
  struct Statement {
    const char* sql;
    sqlite3_stmt** stmt;
  };

  Statement statements[] = {
    {
      R"(INSERT INTO cards (project_id, title, summary, content, created, updated)
         VALUES (?, ?, ?, ?, ?, ?))",
      &stmt_insert_card_
    },
    {
      R"(SELECT id, project_id, title, summary, content FROM cards WHERE id = ?)",
      &stmt_get_card_
    },
    {
      R"(UPDATE cards SET content = ?, updated = ? WHERE id = ?)",
      &stmt_update_card_content_
    },
    {
      R"(SELECT id, project_id, title, summary FROM cards
         WHERE project_id = ? ORDER BY id)",
      &stmt_list_cards_
    },
    {
      R"(SELECT t.id, t.project_id, t.name, t.namespace, t.annotation
         FROM tags t JOIN card_tags ct ON ct.tag_id = t.id
         WHERE ct.card_id = ? ORDER BY t.id)",
      &stmt_list_card_tags_
    },
    {
      R"(INSERT OR IGNORE INTO card_tags (card_id, tag_id) VALUES (?, ?))",
      &stmt_associate_tag_
    },
    {
      R"(INSERT INTO tags (project_id, name, namespace, annotation, created)
         VALUES (?, ?, ?, ?, ?))",
      &stmt_insert_tag_
    },
    {
      R"(UPDATE tags SET name = ? WHERE id = ?)",
      &stmt_update_tag_name_
    },
    {
      R"(UPDATE tags SET annotation = ? WHERE id = ?)",
      &stmt_update_tag_annotation_
    },
    {
      R"(DELETE FROM card_tags WHERE tag_id = ?)",
      &stmt_delete_tag_links_
    },
    {
      R"(DELETE FROM tags WHERE id = ?)",
      &stmt_delete_tag_
    },
    {
      R"(SELECT id, project_id, name, namespace, annotation FROM tags
         WHERE project_id = ? AND namespace = ? AND name = ? LIMIT 1)",
      &stmt_find_user_tag_
    },
    {
      R"(SELECT t.id, t.project_id, t.name, t.namespace, t.annotation,
                c.id, c.project_id, c.title, c.summary
         FROM tags t
         JOIN card_tags ct ON ct.tag_id = t.id
         JOIN cards c ON c.id = ct.card_id
         WHERE t.project_id = ? AND t.namespace = ?
         ORDER BY c.id, t.id)",
      &stmt_project_backlinks_
    }
  };

  for (const auto& stmt_def : statements) {
    int result = sqlite3_prepare_v2(db_, stmt_def.sql, -1, stmt_def.stmt, nullptr);
    if (result != SQLITE_OK) {
      return std::unexpected(makeSqliteError("Failed to prepare statement"));
    }
  }

  return {};
}

void SqliteStore::finalizeStatements() {
  sqlite3_stmt* statements[] = {
    stmt_insert_card_, stmt_get_card_, stmt_update_card_content_, stmt_list_cards_,
    stmt_list_card_tags_, stmt_associate_tag_, stmt_insert_tag_, stmt_update_tag_name_,
    stmt_update_tag_annotation_, stmt_delete_tag_links_, stmt_delete_tag_,
    stmt_find_user_tag_, stmt_project_backlinks_
  };

  for (auto stmt : statements) {
    if (stmt) {
      sqlite3_finalize(stmt);
    }
  }
}

Result<core::CardId> SqliteStore::createCard(const core::CreateCardInput& input) {
  std::lock_guard<std::mutex> lock(db_mutex_);

  if (!stmt_insert_card_) {
    return std::unexpected(makeError(ErrorCode::kDatabaseError, "Statement not prepared"));
  }

  StatementScope scope(stmt_insert_card_);
  auto now = nowMillis();
  sqlite3_bind_int64(stmt_insert_card_, 1, input.project_id);
  bindOptionalText(stmt_insert_card_, 2, input.title);
  bindOptionalText(stmt_insert_card_, 3, input.summary);
  sqlite3_bind_text(stmt_insert_card_, 4, input.content.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt_insert_card_, 5, now);
  sqlite3_bind_int64(stmt_insert_card_, 6, now);

  if (sqlite3_step(stmt_insert_card_) != SQLITE_DONE) {
    return std::unexpected(makeSqliteError("Failed to insert card"));
  }

  return static_cast<core::CardId>(sqlite3_last_insert_rowid(db_));
}

Result<core::CardDetail> SqliteStore::getCard(core::CardId id) {
  std::lock_guard<std::mutex> lock(db_mutex_);

  if (!stmt_get_card_) {
    return std::unexpected(makeError(ErrorCode::kDatabaseError, "Statement not prepared"));
  }

  StatementScope scope(stmt_get_card_);
  sqlite3_bind_int64(stmt_get_card_, 1, id);

  int result = sqlite3_step(stmt_get_card_);
  if (result == SQLITE_DONE) {
    return std::unexpected(makeError(ErrorCode::kNotFound,
                                     "Card not found: " + std::to_string(id)));
  }
  if (result != SQLITE_ROW) {
    return std::unexpected(makeSqliteError("Failed to read card"));
  }

  core::CardDetail card;
  static_cast<core::CardListItem&>(card) = extractCardListItem(stmt_get_card_, 0);
  card.content = columnText(stmt_get_card_, 4).value_or("");
  return card;
}

Result<void> SqliteStore::updateCardContent(core::CardId id, const std::string& content) {
  std::lock_guard<std::mutex> lock(db_mutex_);

  if (!stmt_update_card_content_) {
    return std::unexpected(makeError(ErrorCode::kDatabaseError, "Statement not prepared"));
  }

  StatementScope scope(stmt_update_card_content_);
  sqlite3_bind_text(stmt_update_card_content_, 1, content.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt_update_card_content_, 2, nowMillis());
  sqlite3_bind_int64(stmt_update_card_content_, 3, id);

  if (sqlite3_step(stmt_update_card_content_) != SQLITE_DONE) {
    return std::unexpected(makeSqliteError("Failed to update card content"));
  }
  if (sqlite3_changes(db_) == 0) {
    return std::unexpected(makeError(ErrorCode::kNotFound,
                                     "Card not found: " + std::to_string(id)));
  }
  return {};
}

Result<std::vector<core::CardListItem>> SqliteStore::listCardsByProject(core::ProjectId project_id) {
  std::lock_guard<std::mutex> lock(db_mutex_);

  if (!stmt_list_cards_) {
    return std::unexpected(makeError(ErrorCode::kDatabaseError, "Statement not prepared"));
  }

  StatementScope scope(stmt_list_cards_);
  sqlite3_bind_int64(stmt_list_cards_, 1, project_id);

  std::vector<core::CardListItem> cards;
  while (true) {
    int result = sqlite3_step(stmt_list_cards_);
    if (result == SQLITE_DONE) {
      break;
    } else if (result != SQLITE_ROW) {
      return std::unexpected(makeSqliteError("Card listing failed"));
    }
    cards.push_back(extractCardListItem(stmt_list_cards_, 0));
  }

  return cards;
}

Result<std::vector<core::Tag>> SqliteStore::listCardTags(core::CardId card_id) {
  std::lock_guard<std::mutex> lock(db_mutex_);

  if (!stmt_list_card_tags_) {
    return std::unexpected(makeError(ErrorCode::kDatabaseError, "Statement not prepared"));
  }

  StatementScope scope(stmt_list_card_tags_);
  sqlite3_bind_int64(stmt_list_card_tags_, 1, card_id);

  std::vector<core::Tag> tags;
  while (true) {
    int result = sqlite3_step(stmt_list_card_tags_);
    if (result == SQLITE_DONE) {
      break;
    } else if (result != SQLITE_ROW) {
      return std::unexpected(makeSqliteError("Tag listing failed"));
    }
    tags.push_back(extractTag(stmt_list_card_tags_, 0));
  }

  return tags;
}

Result<void> SqliteStore::associateTag(core::CardId card_id, core::TagId tag_id) {
  std::lock_guard<std::mutex> lock(db_mutex_);

  if (!stmt_associate_tag_) {
    return std::unexpected(makeError(ErrorCode::kDatabaseError, "Statement not prepared"));
  }

  StatementScope scope(stmt_associate_tag_);
  sqlite3_bind_int64(stmt_associate_tag_, 1, card_id);
  sqlite3_bind_int64(stmt_associate_tag_, 2, tag_id);

  // Foreign keys reject unknown cards and tags
  if (sqlite3_step(stmt_associate_tag_) != SQLITE_DONE) {
    return std::unexpected(makeSqliteError("Failed to associate tag " + std::to_string(tag_id) +
                                           " with card " + std::to_string(card_id)));
  }
  return {};
}

Result<core::Tag> SqliteStore::createTag(const core::CreateTagInput& input) {
  std::lock_guard<std::mutex> lock(db_mutex_);
  return insertTagLocked(input);
}

Result<core::Tag> SqliteStore::insertTagLocked(const core::CreateTagInput& input) {
  if (!stmt_insert_tag_) {
    return std::unexpected(makeError(ErrorCode::kDatabaseError, "Statement not prepared"));
  }

  StatementScope scope(stmt_insert_tag_);
  sqlite3_bind_int64(stmt_insert_tag_, 1, input.project_id);
  sqlite3_bind_text(stmt_insert_tag_, 2, input.name.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt_insert_tag_, 3, input.tag_namespace.c_str(), -1, SQLITE_TRANSIENT);
  auto bound = bindAnnotation(stmt_insert_tag_, 4, input.annotation);
  if (!bound.has_value()) {
    return std::unexpected(bound.error());
  }
  sqlite3_bind_int64(stmt_insert_tag_, 5, nowMillis());

  if (sqlite3_step(stmt_insert_tag_) != SQLITE_DONE) {
    return std::unexpected(makeSqliteError("Failed to insert tag '" + input.name + "'"));
  }

  core::Tag tag;
  tag.id = static_cast<core::TagId>(sqlite3_last_insert_rowid(db_));
  tag.project_id = input.project_id;
  tag.name = input.name;
  tag.tag_namespace = input.tag_namespace;
  tag.annotation = input.annotation;
  return tag;
}

Result<void> SqliteStore::updateTagName(core::TagId id, const std::string& name) {
  std::lock_guard<std::mutex> lock(db_mutex_);

  if (!stmt_update_tag_name_) {
    return std::unexpected(makeError(ErrorCode::kDatabaseError, "Statement not prepared"));
  }

  StatementScope scope(stmt_update_tag_name_);
  sqlite3_bind_text(stmt_update_tag_name_, 1, name.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt_update_tag_name_, 2, id);

  if (sqlite3_step(stmt_update_tag_name_) != SQLITE_DONE) {
    return std::unexpected(makeSqliteError("Failed to rename tag"));
  }
  if (sqlite3_changes(db_) == 0) {
    return std::unexpected(makeError(ErrorCode::kNotFound,
                                     "Tag not found: " + std::to_string(id)));
  }
  return {};
}

Result<void> SqliteStore::updateTagAnnotation(core::TagId id, const core::TagAnnotation& annotation) {
  std::lock_guard<std::mutex> lock(db_mutex_);

  if (!stmt_update_tag_annotation_) {
    return std::unexpected(makeError(ErrorCode::kDatabaseError, "Statement not prepared"));
  }

  StatementScope scope(stmt_update_tag_annotation_);
  auto bound = bindAnnotation(stmt_update_tag_annotation_, 1, annotation);
  if (!bound.has_value()) {
    return std::unexpected(bound.error());
  }
  sqlite3_bind_int64(stmt_update_tag_annotation_, 2, id);

  if (sqlite3_step(stmt_update_tag_annotation_) != SQLITE_DONE) {
    return std::unexpected(makeSqliteError("Failed to update tag annotation"));
  }
  if (sqlite3_changes(db_) == 0) {
    return std::unexpected(makeError(ErrorCode::kNotFound,
                                     "Tag not found: " + std::to_string(id)));
  }
  return {};
}

Result<void> SqliteStore::deleteTag(core::TagId id) {
  std::lock_guard<std::mutex> lock(db_mutex_);

  if (!stmt_delete_tag_links_ || !stmt_delete_tag_) {
    return std::unexpected(makeError(ErrorCode::kDatabaseError, "Statement not prepared"));
  }

  auto begin = checkSqliteResult(
      sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr), "Begin transaction");
  if (!begin.has_value()) {
    return begin;
  }

  auto rollback = [this](Error error) -> Result<void> {
    sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
    return std::unexpected(std::move(error));
  };

  {
    StatementScope scope(stmt_delete_tag_links_);
    sqlite3_bind_int64(stmt_delete_tag_links_, 1, id);
    if (sqlite3_step(stmt_delete_tag_links_) != SQLITE_DONE) {
      return rollback(makeSqliteError("Failed to remove tag associations"));
    }
  }

  {
    StatementScope scope(stmt_delete_tag_);
    sqlite3_bind_int64(stmt_delete_tag_, 1, id);
    if (sqlite3_step(stmt_delete_tag_) != SQLITE_DONE) {
      return rollback(makeSqliteError("Failed to delete tag"));
    }
    if (sqlite3_changes(db_) == 0) {
      return rollback(makeError(ErrorCode::kNotFound, "Tag not found: " + std::to_string(id)));
    }
  }

  return checkSqliteResult(
      sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr), "Commit transaction");
}

Result<core::Tag> SqliteStore::findOrCreateTag(core::ProjectId project_id, const std::string& name) {
  std::lock_guard<std::mutex> lock(db_mutex_);

  auto existing = findUserTagLocked(project_id, name);
  if (!existing.has_value()) {
    return std::unexpected(existing.error());
  }
  if (existing->has_value()) {
    return **existing;
  }

  core::CreateTagInput input;
  input.project_id = project_id;
  input.name = name;
  return insertTagLocked(input);
}

Result<std::optional<core::Tag>> SqliteStore::findUserTagLocked(core::ProjectId project_id,
                                                                const std::string& name) {
  if (!stmt_find_user_tag_) {
    return std::unexpected(makeError(ErrorCode::kDatabaseError, "Statement not prepared"));
  }

  StatementScope scope(stmt_find_user_tag_);
  std::string user_namespace(core::kUserNamespace);
  sqlite3_bind_int64(stmt_find_user_tag_, 1, project_id);
  sqlite3_bind_text(stmt_find_user_tag_, 2, user_namespace.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt_find_user_tag_, 3, name.c_str(), -1, SQLITE_TRANSIENT);

  int result = sqlite3_step(stmt_find_user_tag_);
  if (result == SQLITE_DONE) {
    return std::optional<core::Tag>{};
  }
  if (result != SQLITE_ROW) {
    return std::unexpected(makeSqliteError("Tag lookup failed"));
  }
  return std::optional<core::Tag>{extractTag(stmt_find_user_tag_, 0)};
}

Result<std::vector<BacklinkSource>> SqliteStore::findBacklinks(core::CardId target_card_id) {
  auto target = getCard(target_card_id);
  if (!target.has_value()) {
    return std::unexpected(target.error());
  }

  std::lock_guard<std::mutex> lock(db_mutex_);

  if (!stmt_project_backlinks_) {
    return std::unexpected(makeError(ErrorCode::kDatabaseError, "Statement not prepared"));
  }

  StatementScope scope(stmt_project_backlinks_);
  std::string reference_namespace(core::kReferenceNamespace);
  sqlite3_bind_int64(stmt_project_backlinks_, 1, target->project_id);
  sqlite3_bind_text(stmt_project_backlinks_, 2, reference_namespace.c_str(), -1, SQLITE_TRANSIENT);

  std::vector<BacklinkSource> sources;
  while (true) {
    int result = sqlite3_step(stmt_project_backlinks_);
    if (result == SQLITE_DONE) {
      break;
    } else if (result != SQLITE_ROW) {
      return std::unexpected(makeSqliteError("Backlink query failed"));
    }

    auto tag = extractTag(stmt_project_backlinks_, 0);
    const auto* backlink = core::asBacklink(tag.annotation);
    if (backlink == nullptr || backlink->target_card_id != target_card_id) {
      continue;
    }

    BacklinkSource source;
    source.card = extractCardListItem(stmt_project_backlinks_, 5);
    source.tag_id = tag.id;
    source.tag_name = tag.name;
    source.annotation = *backlink;
    sources.push_back(std::move(source));
  }

  return sources;
}

core::Tag SqliteStore::extractTag(sqlite3_stmt* stmt, int first_column) const {
  core::Tag tag;
  tag.id = sqlite3_column_int64(stmt, first_column);
  tag.project_id = sqlite3_column_int64(stmt, first_column + 1);
  tag.name = columnText(stmt, first_column + 2).value_or("");
  tag.tag_namespace = columnText(stmt, first_column + 3).value_or("");
  tag.annotation = decodeAnnotation(columnText(stmt, first_column + 4));
  return tag;
}

core::CardListItem SqliteStore::extractCardListItem(sqlite3_stmt* stmt, int first_column) const {
  core::CardListItem card;
  card.id = sqlite3_column_int64(stmt, first_column);
  card.project_id = sqlite3_column_int64(stmt, first_column + 1);
  card.title = columnText(stmt, first_column + 2);
  card.summary = columnText(stmt, first_column + 3);
  return card;
}

Error SqliteStore::makeSqliteError(const std::string& operation) {
  std::string message = operation;
  if (db_) {
    message += ": " + std::string(sqlite3_errmsg(db_));
  }
  return makeError(ErrorCode::kDatabaseError, message);
}

Result<void> SqliteStore::checkSqliteResult(int result, const std::string& operation) {
  if (result == SQLITE_OK || result == SQLITE_DONE || result == SQLITE_ROW) {
    return {};
  }
  return std::unexpected(makeSqliteError(operation));
}

}  // namespace cardlink::store
