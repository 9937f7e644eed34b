#include "cardlink/cli/commands/sync_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "cardlink/cli/command_error_handler.hpp"
#include "cardlink/reference/reference_synchronizer.hpp"
#include "cardlink/tags/content_tag_synchronizer.hpp"
#include "cardlink/util/filesystem.hpp"

namespace cardlink::cli {

SyncCommand::SyncCommand(Application& app) : app_(app) {
}

Result<int> SyncCommand::execute(const GlobalOptions& options) {
  auto& store = app_.store();
  const auto& config = app_.config();

  auto card = store.getCard(card_id_);
  if (!card.has_value()) {
    return std::unexpected(card.error());
  }

  std::string text = card->content;
  if (!content_file_.empty()) {
    auto content = util::FileSystem::readInput(content_file_);
    if (!content.has_value()) {
      return std::unexpected(content.error());
    }
    text = std::move(*content);
  }

  reference::SyncOptions sync_options;
  sync_options.parallel = config.sync.parallel;
  sync_options.serialize_per_card = config.sync.serialize_per_card;

  reference::ReferenceSynchronizer synchronizer(store, store, sync_options);
  auto result = synchronizer.sync(card->id, card->project_id, text);

  bool content_changed = result.text != card->content;
  if (content_changed) {
    auto saved = store.updateCardContent(card->id, result.text);
    if (!saved.has_value()) {
      return std::unexpected(saved.error());
    }
  }

  tags::ContentTagReport tag_report;
  bool content_tags = config.sync.content_tags && !no_content_tags_;
  if (content_tags) {
    tags::ContentTagSynchronizer tag_synchronizer(store, store);
    tag_report = tag_synchronizer.sync(card->id, card->project_id, result.text);
  }

  const auto& report = result.report;
  bool complete = report.synchronized && report.failed == 0 && tag_report.failed.empty();

  if (options.json) {
    nlohmann::json output;
    output["card_id"] = card->id;
    output["synchronized"] = report.synchronized;
    output["content_updated"] = content_changed;
    output["references"] = result.tokens.size();
    output["created"] = report.created;
    output["updated"] = report.updated;
    output["deleted"] = report.deleted;
    output["failed"] = report.failed;
    output["unresolved"] = report.unresolved;
    if (content_tags) {
      output["tags_added"] = tag_report.added;
      output["tags_failed"] = tag_report.failed;
    }
    std::cout << output.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
    return complete ? 0 : 1;
  }

  CommandErrorHandler handler(options);
  if (!report.synchronized) {
    handler.displayWarning("Backlinks of card " + std::to_string(card->id) +
                           " were not synchronized, see the log for details");
  } else if (report.failed > 0) {
    handler.displayWarning(std::to_string(report.failed) + " backlink operation(s) failed");
  }
  if (!tag_report.failed.empty()) {
    handler.displayWarning(std::to_string(tag_report.failed.size()) + " tag(s) could not be attached");
  }

  if (!options.quiet) {
    std::cout << "Card " << card->id << ": " << result.tokens.size() << " reference(s)";
    if (content_changed) {
      std::cout << ", content normalized";
    }
    std::cout << std::endl;
    std::cout << "  backlinks: " << report.created << " created, " << report.updated << " updated, "
              << report.deleted << " deleted, " << report.unresolved << " unresolved" << std::endl;
    if (content_tags && !tag_report.added.empty()) {
      std::cout << "  tags added:";
      for (const auto& name : tag_report.added) {
        std::cout << " #" << name;
      }
      std::cout << std::endl;
    }
  }

  return complete ? 0 : 1;
}

void SyncCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("card_id", card_id_, "Card to synchronize")->required();
  cmd->add_option("--file", content_file_, "Use this text as the card content ('-' for stdin)");
  cmd->add_flag("--no-tags", no_content_tags_, "Skip #tag synchronization");
}

} // namespace cardlink::cli
