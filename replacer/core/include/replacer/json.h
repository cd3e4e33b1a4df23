#pragma once
#include "replacer/deck.h"
#include "replacer/replace.h"

#include <string>
#include <string_view>
#include <vector>

namespace replacer::json {
  auto parse_deck(std::string_view json) -> deck;
  auto to_string(deck const& deck) -> std::string;

  // Throws invalid_argument_error when a value has the wrong kind.
  auto parse_request(std::string_view json) -> request;
  auto parse_requests(std::string_view json) -> std::vector<request>;
} // namespace replacer::json
