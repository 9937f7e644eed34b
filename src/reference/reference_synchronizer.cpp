#include "cardlink/reference/reference_synchronizer.hpp"

#include <exception>
#include <functional>
#include <future>
#include <system_error>
#include <unordered_map>
#include <unordered_set>

#include <spdlog/spdlog.h>

#include "cardlink/reference/title_index.hpp"
#include "cardlink/util/unicode.hpp"

namespace cardlink::reference {

namespace {

enum class Outcome {
  kDone,
  kFailed
};

// Starts `fn` on its own thread when parallel, otherwise defers it to get().
// A thread that cannot be started degrades to deferred execution.
template <typename Fn>
auto dispatch(bool parallel, Fn fn) -> std::future<std::invoke_result_t<Fn>> {
  if (parallel) {
    try {
      return std::async(std::launch::async, fn);
    } catch (const std::system_error& e) {
      spdlog::warn("Reference sync: running inline, cannot start worker: {}", e.what());
    }
  }
  return std::async(std::launch::deferred, fn);
}

// Runs one batch and waits for all of it. An operation that throws counts as
// failed and does not affect its siblings.
template <typename Op, typename Fn>
std::vector<Outcome> runBatch(bool parallel, const std::vector<Op>& ops, Fn fn) {
  std::vector<std::future<Outcome>> pending;
  pending.reserve(ops.size());
  for (const auto& op : ops) {
    pending.push_back(dispatch(parallel, [&fn, &op] {
      try {
        return fn(op);
      } catch (const std::exception& e) {
        spdlog::warn("Reference sync: operation aborted: {}", e.what());
        return Outcome::kFailed;
      }
    }));
  }

  std::vector<Outcome> outcomes;
  outcomes.reserve(pending.size());
  for (auto& future : pending) {
    outcomes.push_back(future.get());
  }
  return outcomes;
}

size_t countFailures(const std::vector<Outcome>& outcomes) {
  size_t failed = 0;
  for (auto outcome : outcomes) {
    if (outcome == Outcome::kFailed) {
      ++failed;
    }
  }
  return failed;
}

core::BacklinkAnnotation makeAnnotation(const ReferenceToken& token, core::CardId source_card_id,
                                        core::CardId target_card_id) {
  core::BacklinkAnnotation annotation;
  annotation.ref_id = token.ref_id;
  annotation.source_card_id = source_card_id;
  annotation.target_card_id = target_card_id;
  annotation.title_snapshot = token.title;
  annotation.placeholder = token.placeholder;
  return annotation;
}

}  // namespace

ReferenceSynchronizer::ReferenceSynchronizer(store::CardStore& cards, store::TagStore& tags,
                                             SyncOptions options)
    : cards_(cards), tags_(tags), options_(options) {}

std::string ReferenceSynchronizer::tagName(std::string_view placeholder, std::string_view title) {
  auto name = util::trim(placeholder);
  if (name.empty()) {
    name = util::trim(title);
  }
  if (name.empty()) {
    name = core::kDefaultReferenceName;
  }
  return std::string(name);
}

SyncPlan ReferenceSynchronizer::plan(core::CardId source_card_id,
                                     const std::vector<ReferenceToken>& tokens,
                                     const std::vector<core::CardListItem>& cards,
                                     const std::vector<core::Tag>& existing_tags) {
  SyncPlan plan;
  const auto index = TitleIndex::build(cards, source_card_id);

  // Partition the reserved namespace. Only the first record per ref id is
  // reusable; later duplicates and unreadable records are removed.
  std::unordered_map<std::string, const core::Tag*> existing_by_ref;
  std::vector<const core::Tag*> reusable;
  for (const auto& tag : existing_tags) {
    if (tag.tag_namespace != core::kReferenceNamespace) {
      continue;
    }
    const auto* backlink = core::asBacklink(tag.annotation);
    if (backlink == nullptr) {
      plan.deletes.push_back({tag.id, {}});
      continue;
    }
    if (!existing_by_ref.emplace(backlink->ref_id, &tag).second) {
      plan.deletes.push_back({tag.id, backlink->ref_id});
      continue;
    }
    reusable.push_back(&tag);
  }

  std::unordered_set<std::string> seen;
  std::unordered_set<std::string> retained;
  for (const auto& token : tokens) {
    // A pasted duplicate shares its ref id with an earlier token; the first
    // occurrence owns the annotation
    if (!seen.insert(token.ref_id).second) {
      continue;
    }

    auto resolution = index.resolve(token.title);
    if (!resolution.isUnique()) {
      ++plan.unresolved;
      continue;
    }

    retained.insert(token.ref_id);
    auto name = tagName(token.placeholder, token.title);
    auto annotation = makeAnnotation(token, source_card_id, resolution.card()->id);

    auto existing = existing_by_ref.find(token.ref_id);
    if (existing == existing_by_ref.end()) {
      plan.creates.push_back({std::move(name), std::move(annotation)});
      continue;
    }

    const core::Tag& tag = *existing->second;
    const auto* stored = core::asBacklink(tag.annotation);
    bool rename = tag.name != name;
    if (rename || *stored != annotation) {
      UpdateOperation update;
      update.tag_id = tag.id;
      if (rename) {
        update.rename_to = std::move(name);
      }
      update.annotation = std::move(annotation);
      plan.updates.push_back(std::move(update));
    }
  }

  for (const auto* tag : reusable) {
    const auto& ref_id = core::asBacklink(tag->annotation)->ref_id;
    if (retained.count(ref_id) == 0) {
      plan.deletes.push_back({tag->id, ref_id});
    }
  }

  return plan;
}

SyncResult ReferenceSynchronizer::sync(core::CardId source_card_id, core::ProjectId project_id,
                                       std::string_view text) {
  SyncResult result;

  auto parsed = ReferenceParser::parse(text, true);
  if (!parsed.has_value()) {
    spdlog::error("Reference sync: card {} could not be normalized: {}", source_card_id,
                  parsed.error().message());
    result.text = std::string(text);
    return result;
  }
  result.text = std::move(parsed->text);
  result.tokens = std::move(parsed->tokens);

  SyncGate::CardLock card_lock;
  if (options_.serialize_per_card) {
    card_lock = gate_.acquire(source_card_id);
  }

  // Both reads complete before any write is issued
  auto cards_future = dispatch(options_.parallel, [this, project_id] {
    return cards_.listCardsByProject(project_id);
  });
  auto tags_future = dispatch(options_.parallel, [this, source_card_id] {
    return cards_.listCardTags(source_card_id);
  });
  auto card_list = cards_future.get();
  auto card_tags = tags_future.get();

  if (!card_list.has_value()) {
    spdlog::warn("Reference sync: card listing for project {} unavailable, skipping card {}: {}",
                 project_id, source_card_id, card_list.error().message());
    return result;
  }
  if (!card_tags.has_value()) {
    spdlog::warn("Reference sync: tags of card {} unavailable, skipping: {}", source_card_id,
                 card_tags.error().message());
    return result;
  }

  auto sync_plan = plan(source_card_id, result.tokens, *card_list, *card_tags);
  result.report.synchronized = true;
  result.report.unresolved = sync_plan.unresolved;

  spdlog::debug("Reference sync: card {}: {} token(s), {} update(s), {} create(s), {} delete(s), {} unresolved",
                source_card_id, result.tokens.size(), sync_plan.updates.size(),
                sync_plan.creates.size(), sync_plan.deletes.size(), sync_plan.unresolved);

  if (!sync_plan.empty()) {
    execute(sync_plan, source_card_id, project_id, result.report);
  }
  return result;
}

void ReferenceSynchronizer::execute(const SyncPlan& plan, core::CardId source_card_id,
                                    core::ProjectId project_id, SyncReport& report) {
  auto updates = runBatch(options_.parallel, plan.updates, [this](const UpdateOperation& op) {
    bool ok = true;
    if (op.rename_to.has_value()) {
      auto renamed = tags_.updateTagName(op.tag_id, *op.rename_to);
      if (!renamed.has_value()) {
        spdlog::warn("Reference sync: rename of tag {} failed: {}", op.tag_id,
                     renamed.error().message());
        ok = false;
      }
    }
    auto refreshed = tags_.updateTagAnnotation(op.tag_id, op.annotation);
    if (!refreshed.has_value()) {
      spdlog::warn("Reference sync: annotation refresh of tag {} failed: {}", op.tag_id,
                   refreshed.error().message());
      ok = false;
    }
    return ok ? Outcome::kDone : Outcome::kFailed;
  });

  auto creates = runBatch(options_.parallel, plan.creates,
                          [this, source_card_id, project_id](const CreateOperation& op) {
    core::CreateTagInput input;
    input.project_id = project_id;
    input.name = op.name;
    input.tag_namespace = std::string(core::kReferenceNamespace);
    input.annotation = op.annotation;

    auto created = tags_.createTag(input);
    if (!created.has_value()) {
      spdlog::warn("Reference sync: creating backlink {} -> {} failed: {}", source_card_id,
                   op.annotation.target_card_id, created.error().message());
      return Outcome::kFailed;
    }

    auto associated = cards_.associateTag(source_card_id, created->id);
    if (!associated.has_value()) {
      spdlog::warn("Reference sync: attaching tag {} to card {} failed: {}", created->id,
                   source_card_id, associated.error().message());
      // An unattached annotation is unreachable from the card; drop it so the
      // next run recreates it
      auto dropped = tags_.deleteTag(created->id);
      if (!dropped.has_value()) {
        spdlog::warn("Reference sync: removing unattached tag {} failed: {}", created->id,
                     dropped.error().message());
      }
      return Outcome::kFailed;
    }
    return Outcome::kDone;
  });

  auto deletes = runBatch(options_.parallel, plan.deletes, [this](const DeleteOperation& op) {
    auto deleted = tags_.deleteTag(op.tag_id);
    if (!deleted.has_value()) {
      spdlog::warn("Reference sync: deleting tag {} failed: {}", op.tag_id,
                   deleted.error().message());
      return Outcome::kFailed;
    }
    return Outcome::kDone;
  });

  size_t failed_updates = countFailures(updates);
  size_t failed_creates = countFailures(creates);
  size_t failed_deletes = countFailures(deletes);

  report.updated += updates.size() - failed_updates;
  report.created += creates.size() - failed_creates;
  report.deleted += deletes.size() - failed_deletes;
  report.failed += failed_updates + failed_creates + failed_deletes;
}

}  // namespace cardlink::reference
