#include "cardlink/cli/commands/normalize_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

#include "cardlink/reference/reference_parser.hpp"
#include "cardlink/util/filesystem.hpp"

namespace cardlink::cli {

Result<int> NormalizeCommand::execute(const GlobalOptions& options) {
  if (in_place_ && (input_file_.empty() || input_file_ == "-")) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "--in-place requires a file argument"));
  }

  auto text = util::FileSystem::readInput(input_file_);
  if (!text.has_value()) {
    return std::unexpected(text.error());
  }

  auto parsed = reference::ReferenceParser::parse(*text, true);
  if (!parsed.has_value()) {
    return std::unexpected(parsed.error());
  }

  if (in_place_ && parsed->text != *text) {
    auto written = util::FileSystem::writeFileAtomic(input_file_, parsed->text);
    if (!written.has_value()) {
      return std::unexpected(written.error());
    }
  }

  if (options.json) {
    nlohmann::json tokens = nlohmann::json::array();
    for (const auto& token : parsed->tokens) {
      tokens.push_back({
        {"title", token.title},
        {"placeholder", token.placeholder},
        {"ref_id", token.ref_id},
        {"index", token.index}
      });
    }
    nlohmann::json output;
    output["changed"] = parsed->text != *text;
    output["text"] = parsed->text;
    output["tokens"] = tokens;
    std::cout << output.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
  } else if (!in_place_) {
    std::cout << parsed->text;
  } else if (!options.quiet) {
    std::cout << input_file_ << ": " << parsed->tokens.size() << " reference(s)"
              << (parsed->text != *text ? ", rewritten" : ", unchanged") << std::endl;
  }

  return 0;
}

void NormalizeCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("file", input_file_, "Input file (stdin when omitted)");
  cmd->add_flag("-i,--in-place", in_place_, "Rewrite the file instead of printing");
}

} // namespace cardlink::cli
