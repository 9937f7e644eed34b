#pragma once

#include <sqlite3.h>

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "cardlink/store/card_store.hpp"
#include "cardlink/store/tag_store.hpp"

namespace cardlink::store {

// Card holding a backlink annotation, as found by SqliteStore::findBacklinks
struct BacklinkSource {
  core::CardListItem card;
  core::TagId tag_id = 0;
  std::string tag_name;
  core::BacklinkAnnotation annotation;
};

// SQLite-backed card and tag storage for one workspace file
class SqliteStore : public CardStore, public TagStore {
public:
  // ":memory:" opens a private in-memory workspace
  explicit SqliteStore(std::filesystem::path db_path);
  ~SqliteStore() override;

  SqliteStore(const SqliteStore&) = delete;
  SqliteStore& operator=(const SqliteStore&) = delete;

  // Opens the database, creates the schema and prepares statements
  Result<void> initialize();

  // CardStore
  Result<core::CardId> createCard(const core::CreateCardInput& input) override;
  Result<core::CardDetail> getCard(core::CardId id) override;
  Result<void> updateCardContent(core::CardId id, const std::string& content) override;
  Result<std::vector<core::CardListItem>> listCardsByProject(core::ProjectId project_id) override;
  Result<std::vector<core::Tag>> listCardTags(core::CardId card_id) override;
  Result<void> associateTag(core::CardId card_id, core::TagId tag_id) override;

  // TagStore
  Result<core::Tag> createTag(const core::CreateTagInput& input) override;
  Result<void> updateTagName(core::TagId id, const std::string& name) override;
  Result<void> updateTagAnnotation(core::TagId id, const core::TagAnnotation& annotation) override;
  Result<void> deleteTag(core::TagId id) override;
  Result<core::Tag> findOrCreateTag(core::ProjectId project_id, const std::string& name) override;

  // Cards of the target's project whose backlink annotations point at the target
  Result<std::vector<BacklinkSource>> findBacklinks(core::CardId target_card_id);

  const std::filesystem::path& path() const { return db_path_; }

private:
  // Database management
  Result<void> configureDatabase();
  Result<void> createTables();

  // SQL statement preparation
  Result<void> prepareStatements();
  void finalizeStatements();

  // Row extraction
  core::Tag extractTag(sqlite3_stmt* stmt, int first_column) const;
  core::CardListItem extractCardListItem(sqlite3_stmt* stmt, int first_column) const;
  Result<std::optional<core::Tag>> findUserTagLocked(core::ProjectId project_id, const std::string& name);
  Result<core::Tag> insertTagLocked(const core::CreateTagInput& input);

  // Error handling
  Error makeSqliteError(const std::string& operation);
  Result<void> checkSqliteResult(int result, const std::string& operation);

  // Database path and connection
  std::filesystem::path db_path_;
  sqlite3* db_ = nullptr;
  std::mutex db_mutex_;

  // Prepared statements for common operations
  sqlite3_stmt* stmt_insert_card_ = nullptr;
  sqlite3_stmt* stmt_get_card_ = nullptr;
  sqlite3_stmt* stmt_update_card_content_ = nullptr;
  sqlite3_stmt* stmt_list_cards_ = nullptr;
  sqlite3_stmt* stmt_list_card_tags_ = nullptr;
  sqlite3_stmt* stmt_associate_tag_ = nullptr;
  sqlite3_stmt* stmt_insert_tag_ = nullptr;
  sqlite3_stmt* stmt_update_tag_name_ = nullptr;
  sqlite3_stmt* stmt_update_tag_annotation_ = nullptr;
  sqlite3_stmt* stmt_delete_tag_links_ = nullptr;
  sqlite3_stmt* stmt_delete_tag_ = nullptr;
  sqlite3_stmt* stmt_find_user_tag_ = nullptr;
  sqlite3_stmt* stmt_project_backlinks_ = nullptr;
};

}  // namespace cardlink::store
