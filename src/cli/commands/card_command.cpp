#include "cardlink/cli/commands/card_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

#include "cardlink/util/filesystem.hpp"

namespace cardlink::cli {

namespace {

nlohmann::json cardToJson(const core::CardListItem& card) {
  nlohmann::json json;
  json["id"] = card.id;
  json["project_id"] = card.project_id;
  json["title"] = card.title ? nlohmann::json(*card.title) : nlohmann::json(nullptr);
  json["summary"] = card.summary ? nlohmann::json(*card.summary) : nlohmann::json(nullptr);
  return json;
}

}  // namespace

CardCommand::CardCommand(Application& app) : app_(app) {
}

Result<int> CardCommand::execute(const GlobalOptions& options) {
  switch (sub_command_) {
    case SubCommand::Add:
      return executeAdd(options);
    case SubCommand::List:
      return executeList(options);
    case SubCommand::Show:
      return executeShow(options);
  }
  return std::unexpected(makeError(ErrorCode::kInvalidArgument, "Invalid subcommand"));
}

void CardCommand::setupCommand(CLI::App* cmd) {
  auto add_cmd = cmd->add_subcommand("add", "Create a card");
  add_cmd->add_option("--project", project_id_, "Project id")->required();
  add_cmd->add_option("--title", title_, "Card title");
  add_cmd->add_option("--summary", summary_, "Card summary");
  add_cmd->add_option("--file", content_file_, "Read content from file ('-' for stdin)");
  add_cmd->callback([this]() { sub_command_ = SubCommand::Add; });

  auto list_cmd = cmd->add_subcommand("list", "List the cards of a project");
  list_cmd->add_option("--project", project_id_, "Project id")->required();
  list_cmd->callback([this]() { sub_command_ = SubCommand::List; });

  auto show_cmd = cmd->add_subcommand("show", "Print a card with its content");
  show_cmd->add_option("card_id", card_id_, "Card id")->required();
  show_cmd->callback([this]() { sub_command_ = SubCommand::Show; });

  cmd->require_subcommand(1, 1);
}

Result<int> CardCommand::executeAdd(const GlobalOptions& options) {
  core::CreateCardInput input;
  input.project_id = project_id_;
  if (!title_.empty()) input.title = title_;
  if (!summary_.empty()) input.summary = summary_;

  if (!content_file_.empty()) {
    auto content = util::FileSystem::readInput(content_file_);
    if (!content.has_value()) {
      return std::unexpected(content.error());
    }
    input.content = std::move(*content);
  }

  auto card_id = app_.store().createCard(input);
  if (!card_id.has_value()) {
    return std::unexpected(card_id.error());
  }

  if (options.json) {
    nlohmann::json output = {
      {"success", true},
      {"id", *card_id},
      {"project_id", project_id_}
    };
    std::cout << output.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
  } else if (!options.quiet) {
    std::cout << "Created card " << *card_id << " in project " << project_id_ << std::endl;
  } else {
    std::cout << *card_id << std::endl;
  }

  return 0;
}

Result<int> CardCommand::executeList(const GlobalOptions& options) {
  auto cards = app_.store().listCardsByProject(project_id_);
  if (!cards.has_value()) {
    return std::unexpected(cards.error());
  }

  if (options.json) {
    nlohmann::json output = nlohmann::json::array();
    for (const auto& card : *cards) {
      output.push_back(cardToJson(card));
    }
    std::cout << output.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
    return 0;
  }

  if (cards->empty()) {
    if (!options.quiet) {
      std::cout << "No cards in project " << project_id_ << "." << std::endl;
    }
    return 0;
  }

  for (const auto& card : *cards) {
    std::cout << card.id << " | " << card.title.value_or("(untitled)");
    if (card.summary && !card.summary->empty()) {
      std::cout << " - " << *card.summary;
    }
    std::cout << std::endl;
  }
  return 0;
}

Result<int> CardCommand::executeShow(const GlobalOptions& options) {
  auto card = app_.store().getCard(card_id_);
  if (!card.has_value()) {
    return std::unexpected(card.error());
  }

  if (options.json) {
    auto output = cardToJson(*card);
    output["content"] = card->content;
    std::cout << output.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
    return 0;
  }

  if (!options.quiet) {
    std::cout << "# " << card->title.value_or("(untitled)") << " [" << card->id << "]" << std::endl;
    std::cout << std::string(50, '-') << std::endl;
  }
  std::cout << card->content;
  if (!card->content.empty() && card->content.back() != '\n') {
    std::cout << std::endl;
  }
  return 0;
}

} // namespace cardlink::cli
