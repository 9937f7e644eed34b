#include "cardlink/cli/commands/check_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

#include "cardlink/reference/reference_parser.hpp"
#include "cardlink/util/filesystem.hpp"

namespace cardlink::cli {

Result<int> CheckCommand::execute(const GlobalOptions& options) {
  auto text = util::FileSystem::readInput(input_file_);
  if (!text.has_value()) {
    return std::unexpected(text.error());
  }

  // Structural defects surface as kInvalidReference and exit with 1
  auto parsed = reference::ReferenceParser::parse(*text, false);
  if (!parsed.has_value()) {
    return std::unexpected(parsed.error());
  }

  if (options.json) {
    nlohmann::json output;
    output["valid"] = true;
    output["references"] = parsed->tokens.size();
    std::cout << output.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
  } else if (!options.quiet) {
    std::cout << "OK: " << parsed->tokens.size() << " reference(s)" << std::endl;
  }
  return 0;
}

void CheckCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("file", input_file_, "Input file (stdin when omitted)");
}

} // namespace cardlink::cli
