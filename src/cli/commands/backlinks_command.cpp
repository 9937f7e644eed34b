#include "cardlink/cli/commands/backlinks_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

namespace cardlink::cli {

BacklinksCommand::BacklinksCommand(Application& app) : app_(app) {
}

Result<int> BacklinksCommand::execute(const GlobalOptions& options) {
  auto backlinks = app_.store().findBacklinks(card_id_);
  if (!backlinks.has_value()) {
    return std::unexpected(backlinks.error());
  }

  if (options.json) {
    nlohmann::json json_backlinks = nlohmann::json::array();
    for (const auto& backlink : *backlinks) {
      nlohmann::json json_backlink;
      json_backlink["card_id"] = backlink.card.id;
      json_backlink["title"] = backlink.card.title ? nlohmann::json(*backlink.card.title)
                                                   : nlohmann::json(nullptr);
      json_backlink["tag_id"] = backlink.tag_id;
      json_backlink["label"] = backlink.tag_name;
      json_backlink["ref_id"] = backlink.annotation.ref_id;
      json_backlink["title_snapshot"] = backlink.annotation.title_snapshot;
      json_backlinks.push_back(json_backlink);
    }

    nlohmann::json output;
    output["card_id"] = card_id_;
    output["total_backlinks"] = backlinks->size();
    output["backlinks"] = json_backlinks;
    std::cout << output.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
    return 0;
  }

  if (backlinks->empty()) {
    if (!options.quiet) {
      std::cout << "No backlinks found for card: " << card_id_ << std::endl;
    }
    return 0;
  }

  if (!options.quiet) {
    std::cout << "Found " << backlinks->size() << " backlink(s) to card: " << card_id_ << std::endl;
    std::cout << std::string(50, '-') << std::endl;
  }

  for (const auto& backlink : *backlinks) {
    std::cout << backlink.card.id << " | " << backlink.card.title.value_or("(untitled)")
              << "  [" << backlink.tag_name << "]" << std::endl;
  }

  return 0;
}

void BacklinksCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("card_id", card_id_, "Card to find backlinks for")->required();
}

} // namespace cardlink::cli
