#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cardlink/core/card.hpp"
#include "cardlink/core/tag.hpp"
#include "cardlink/reference/reference_parser.hpp"
#include "cardlink/reference/sync_gate.hpp"
#include "cardlink/store/card_store.hpp"
#include "cardlink/store/tag_store.hpp"

namespace cardlink::reference {

struct SyncOptions {
  bool parallel = true;            // Dispatch reads and each write batch concurrently
  bool serialize_per_card = true;  // Hold the card's SyncGate for the whole run
};

struct CreateOperation {
  std::string name;
  core::BacklinkAnnotation annotation;
};

struct UpdateOperation {
  core::TagId tag_id = 0;
  std::optional<std::string> rename_to;
  core::BacklinkAnnotation annotation;
};

struct DeleteOperation {
  core::TagId tag_id = 0;
  std::string ref_id;  // Empty for records without a readable ref id
};

// Operations needed to make the stored backlinks match the parsed tokens
struct SyncPlan {
  std::vector<UpdateOperation> updates;
  std::vector<CreateOperation> creates;
  std::vector<DeleteOperation> deletes;
  size_t unresolved = 0;  // Tokens with no unique target

  bool empty() const noexcept { return updates.empty() && creates.empty() && deletes.empty(); }
};

struct SyncReport {
  bool synchronized = false;  // False when a collaborator read failed
  size_t created = 0;
  size_t updated = 0;
  size_t deleted = 0;
  size_t failed = 0;
  size_t unresolved = 0;

  size_t mutations() const noexcept { return created + updated + deleted; }
};

struct SyncResult {
  std::string text;
  std::vector<ReferenceToken> tokens;
  SyncReport report;
};

/**
 * @brief Keeps a card's backlink annotations in step with the references in its text
 *
 * A run normalizes the text, reads the project's cards and the card's tags,
 * diffs the resolved references against the annotations stored in the
 * reserved namespace, and applies the difference: updates, then creates, then
 * deletions. Collaborator failures never escape: a failed read leaves the
 * store untouched, a failed write only loses that one operation.
 *
 * The caller persists SyncResult::text as the card's content.
 */
class ReferenceSynchronizer {
 public:
  ReferenceSynchronizer(store::CardStore& cards, store::TagStore& tags, SyncOptions options = {});

  SyncResult sync(core::CardId source_card_id, core::ProjectId project_id, std::string_view text);

  /**
   * @brief Diff parsed tokens against the card's existing tags
   * @param source_card_id Card whose text produced the tokens
   * @param tokens Tokens in text order
   * @param cards Project card listing (the source card may be included)
   * @param existing_tags All tags of the source card; other namespaces are ignored
   */
  static SyncPlan plan(core::CardId source_card_id,
                       const std::vector<ReferenceToken>& tokens,
                       const std::vector<core::CardListItem>& cards,
                       const std::vector<core::Tag>& existing_tags);

  // Trimmed placeholder, else trimmed title, else "card-ref"
  static std::string tagName(std::string_view placeholder, std::string_view title);

  const SyncOptions& options() const noexcept { return options_; }

 private:
  void execute(const SyncPlan& plan, core::CardId source_card_id, core::ProjectId project_id,
               SyncReport& report);

  store::CardStore& cards_;
  store::TagStore& tags_;
  SyncOptions options_;
  SyncGate gate_;
};

}  // namespace cardlink::reference
