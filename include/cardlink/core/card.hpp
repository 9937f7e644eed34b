#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace cardlink::core {

using CardId = std::int64_t;
using ProjectId = std::int64_t;

// Card as it appears in a project listing (no content)
struct CardListItem {
  CardId id = 0;
  ProjectId project_id = 0;
  std::optional<std::string> title;
  std::optional<std::string> summary;
};

// Card with its full content
struct CardDetail : CardListItem {
  std::string content;
};

struct CreateCardInput {
  ProjectId project_id = 0;
  std::optional<std::string> title;
  std::optional<std::string> summary;
  std::string content;
};

}  // namespace cardlink::core
