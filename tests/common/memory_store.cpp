#include "memory_store.hpp"

namespace cardlink::test {

namespace {

Error injectedFailure() {
  return makeError(ErrorCode::kStoreError, "injected failure");
}

Error missing(std::string_view what, std::int64_t id) {
  return makeError(ErrorCode::kNotFound, std::string(what) + " " + std::to_string(id) + " not found");
}

}  // namespace

core::CardId MemoryStore::addCard(core::ProjectId project_id, std::optional<std::string> title,
                                  std::string content) {
  std::lock_guard<std::mutex> lock(mutex_);
  core::CardDetail card;
  card.id = next_card_id_++;
  card.project_id = project_id;
  card.title = std::move(title);
  card.content = std::move(content);
  cards_[card.id] = card;
  return card.id;
}

core::TagId MemoryStore::addTag(core::ProjectId project_id, std::string name,
                                std::string tag_namespace, core::TagAnnotation annotation,
                                std::optional<core::CardId> attach_to) {
  std::lock_guard<std::mutex> lock(mutex_);
  core::Tag tag;
  tag.id = next_tag_id_++;
  tag.project_id = project_id;
  tag.name = std::move(name);
  tag.tag_namespace = std::move(tag_namespace);
  tag.annotation = std::move(annotation);
  tags_[tag.id] = tag;
  if (attach_to) {
    links_.emplace(*attach_to, tag.id);
  }
  return tag.id;
}

void MemoryStore::failOn(Operation op) {
  std::lock_guard<std::mutex> lock(mutex_);
  failing_.insert(op);
}

void MemoryStore::failOnce(Operation op) {
  std::lock_guard<std::mutex> lock(mutex_);
  failing_once_.insert(op);
}

void MemoryStore::clearFailures() {
  std::lock_guard<std::mutex> lock(mutex_);
  failing_.clear();
  failing_once_.clear();
}

size_t MemoryStore::callCount(Operation op) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = calls_.find(op);
  return it == calls_.end() ? 0 : it->second;
}

size_t MemoryStore::tagWrites() const {
  return callCount(Operation::kCreateTag) + callCount(Operation::kUpdateTagName) +
         callCount(Operation::kUpdateTagAnnotation) + callCount(Operation::kDeleteTag);
}

void MemoryStore::resetCounts() {
  std::lock_guard<std::mutex> lock(mutex_);
  calls_.clear();
}

std::vector<core::Tag> MemoryStore::tagsOf(core::CardId card_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tagsOfLocked(card_id);
}

std::vector<core::Tag> MemoryStore::tagsInNamespace(core::CardId card_id,
                                                    std::string_view tag_namespace) const {
  std::vector<core::Tag> result;
  for (auto& tag : tagsOf(card_id)) {
    if (tag.tag_namespace == tag_namespace) {
      result.push_back(std::move(tag));
    }
  }
  return result;
}

std::optional<core::Tag> MemoryStore::tag(core::TagId id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tags_.find(id);
  if (it == tags_.end()) {
    return std::nullopt;
  }
  return it->second;
}

size_t MemoryStore::tagCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tags_.size();
}

bool MemoryStore::enter(Operation op) {
  ++calls_[op];
  if (failing_.count(op) > 0) {
    return false;
  }
  return failing_once_.erase(op) == 0;
}

std::vector<core::Tag> MemoryStore::tagsOfLocked(core::CardId card_id) const {
  std::vector<core::Tag> result;
  for (const auto& [card, tag_id] : links_) {
    if (card != card_id) {
      continue;
    }
    auto it = tags_.find(tag_id);
    if (it != tags_.end()) {
      result.push_back(it->second);
    }
  }
  return result;
}

Result<core::CardId> MemoryStore::createCard(const core::CreateCardInput& input) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!enter(Operation::kCreateCard)) {
    return std::unexpected(injectedFailure());
  }
  core::CardDetail card;
  card.id = next_card_id_++;
  card.project_id = input.project_id;
  card.title = input.title;
  card.summary = input.summary;
  card.content = input.content;
  cards_[card.id] = card;
  return card.id;
}

Result<core::CardDetail> MemoryStore::getCard(core::CardId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!enter(Operation::kGetCard)) {
    return std::unexpected(injectedFailure());
  }
  auto it = cards_.find(id);
  if (it == cards_.end()) {
    return std::unexpected(missing("card", id));
  }
  return it->second;
}

Result<void> MemoryStore::updateCardContent(core::CardId id, const std::string& content) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!enter(Operation::kUpdateCardContent)) {
    return std::unexpected(injectedFailure());
  }
  auto it = cards_.find(id);
  if (it == cards_.end()) {
    return std::unexpected(missing("card", id));
  }
  it->second.content = content;
  return {};
}

Result<std::vector<core::CardListItem>> MemoryStore::listCardsByProject(core::ProjectId project_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!enter(Operation::kListCards)) {
    return std::unexpected(injectedFailure());
  }
  std::vector<core::CardListItem> result;
  for (const auto& [id, card] : cards_) {
    if (card.project_id == project_id) {
      result.push_back(card);
    }
  }
  return result;
}

Result<std::vector<core::Tag>> MemoryStore::listCardTags(core::CardId card_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!enter(Operation::kListCardTags)) {
    return std::unexpected(injectedFailure());
  }
  return tagsOfLocked(card_id);
}

Result<void> MemoryStore::associateTag(core::CardId card_id, core::TagId tag_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!enter(Operation::kAssociateTag)) {
    return std::unexpected(injectedFailure());
  }
  if (cards_.count(card_id) == 0) {
    return std::unexpected(missing("card", card_id));
  }
  if (tags_.count(tag_id) == 0) {
    return std::unexpected(missing("tag", tag_id));
  }
  links_.emplace(card_id, tag_id);
  return {};
}

Result<core::Tag> MemoryStore::createTag(const core::CreateTagInput& input) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!enter(Operation::kCreateTag)) {
    return std::unexpected(injectedFailure());
  }
  core::Tag tag;
  tag.id = next_tag_id_++;
  tag.project_id = input.project_id;
  tag.name = input.name;
  tag.tag_namespace = input.tag_namespace;
  tag.annotation = input.annotation;
  tags_[tag.id] = tag;
  return tag;
}

Result<void> MemoryStore::updateTagName(core::TagId id, const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!enter(Operation::kUpdateTagName)) {
    return std::unexpected(injectedFailure());
  }
  auto it = tags_.find(id);
  if (it == tags_.end()) {
    return std::unexpected(missing("tag", id));
  }
  it->second.name = name;
  return {};
}

Result<void> MemoryStore::updateTagAnnotation(core::TagId id, const core::TagAnnotation& annotation) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!enter(Operation::kUpdateTagAnnotation)) {
    return std::unexpected(injectedFailure());
  }
  auto it = tags_.find(id);
  if (it == tags_.end()) {
    return std::unexpected(missing("tag", id));
  }
  it->second.annotation = annotation;
  return {};
}

Result<void> MemoryStore::deleteTag(core::TagId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!enter(Operation::kDeleteTag)) {
    return std::unexpected(injectedFailure());
  }
  if (tags_.erase(id) == 0) {
    return std::unexpected(missing("tag", id));
  }
  for (auto it = links_.begin(); it != links_.end();) {
    if (it->second == id) {
      it = links_.erase(it);
    } else {
      ++it;
    }
  }
  return {};
}

Result<core::Tag> MemoryStore::findOrCreateTag(core::ProjectId project_id, const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!enter(Operation::kFindOrCreateTag)) {
    return std::unexpected(injectedFailure());
  }
  for (const auto& [id, tag] : tags_) {
    if (tag.project_id == project_id && tag.tag_namespace == core::kUserNamespace &&
        tag.name == name) {
      return tag;
    }
  }
  core::Tag tag;
  tag.id = next_tag_id_++;
  tag.project_id = project_id;
  tag.name = name;
  tag.tag_namespace = std::string(core::kUserNamespace);
  tags_[tag.id] = tag;
  return tag;
}

}  // namespace cardlink::test
