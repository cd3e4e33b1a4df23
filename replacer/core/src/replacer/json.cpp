#include "replacer/json.h"

#include "replacer/errors.h"

#include <nlohmann/json.hpp>

namespace replacer {

  void from_json(nlohmann::json const& json, formatting& format) {
    format = formatting{ json.get<formatting::attributes>() };
  }

  void to_json(nlohmann::json& json, formatting const& format) {
    json = format.values();
  }

  void from_json(nlohmann::json const& json, run& run) {
    run.text   = json.at("text").get<std::string>();
    run.format = json.value("format", formatting{});
  }

  void to_json(nlohmann::json& json, run const& run) {
    json = nlohmann::json{ { "text", run.text } };

    if (not run.format.empty())
      json["format"] = run.format;
  }

  void from_json(nlohmann::json const& json, paragraph& paragraph) {
    paragraph.set_runs(json.get<replacer::runs>());
  }

  void to_json(nlohmann::json& json, paragraph const& paragraph) {
    json = paragraph.runs();
  }

  void from_json(nlohmann::json const& json, shape& shape) {
    shape.name       = json.value("name", "");
    shape.paragraphs = json.value("paragraphs", std::vector<paragraph>{});
  }

  void to_json(nlohmann::json& json, shape const& shape) {
    json = nlohmann::json{ { "name", shape.name }, { "paragraphs", shape.paragraphs } };
  }

  void from_json(nlohmann::json const& json, slide& slide) {
    slide = replacer::slide{ json.value("shapes", std::vector<shape>{}) };
  }

  void to_json(nlohmann::json& json, slide const& slide) {
    json = nlohmann::json{ { "shapes", slide.shapes() } };
  }

  void from_json(nlohmann::json const& json, deck& deck) {
    deck.slides = json.at("slides").get<std::vector<slide>>();
    deck.cursor.reset();

    if (auto const cursor = json.find("cursor"); cursor != json.end() and not cursor->is_null())
      deck.cursor = cursor->get<std::size_t>();
  }

  void to_json(nlohmann::json& json, deck const& deck) {
    json = nlohmann::json{ { "slides", deck.slides } };

    if (deck.cursor)
      json["cursor"] = *deck.cursor;
    else
      json["cursor"] = nullptr;
  }

  namespace {
    auto single_string(nlohmann::json const& json, char const* key) -> std::string {
      auto const value = json.find(key);
      if (value == json.end() or not value->is_string())
        throw invalid_argument_error{ std::string{ key } + " must be a single string" };

      return value->get<std::string>();
    }

    auto single_flag(nlohmann::json const& json, char const* key, bool fallback) -> bool {
      auto const value = json.find(key);
      if (value == json.end())
        return fallback;

      if (not value->is_boolean())
        throw invalid_argument_error{ std::string{ key } + " must be a single boolean" };

      return value->get<bool>();
    }

    auto target_of(nlohmann::json const& json) -> scope::target {
      if (single_flag(json, "all", false))
        return scope::entire_deck{};

      auto const index = json.find("slide_index");
      if (index == json.end() or index->is_null())
        return scope::current_slide{};

      if (not index->is_number_integer())
        throw invalid_argument_error{ "slide_index must be a single integer" };

      return scope::slide_number{ index->get<long long>() };
    }
  } // namespace

  void from_json(nlohmann::json const& json, request& request) {
    if (not json.is_object())
      throw invalid_argument_error{ "a request must be an object" };

    request.old_value = single_string(json, "old_value");
    request.new_value = single_string(json, "new_value");
    request.warn      = single_flag(json, "warn", true);
    request.target    = target_of(json);

    request.options.literal       = single_flag(json, "fixed", false);
    request.options.ignore_case   = single_flag(json, "ignore_case", false);
    request.options.multiline     = single_flag(json, "multiline", false);
    request.options.dot_nl        = single_flag(json, "dot_nl", false);
    request.options.longest_match = single_flag(json, "longest_match", false);
    request.options.posix_syntax  = single_flag(json, "posix_syntax", false);
  }
} // namespace replacer

namespace replacer::json {

  auto parse_deck(std::string_view json) -> deck {
    return nlohmann::json::parse(json).get<deck>();
  }

  auto to_string(deck const& deck) -> std::string {
    return nlohmann::json(deck).dump(2);
  }

  auto parse_request(std::string_view json) -> request {
    return nlohmann::json::parse(json).get<request>();
  }

  auto parse_requests(std::string_view json) -> std::vector<request> {
    auto const parsed = nlohmann::json::parse(json);
    if (not parsed.is_array())
      throw invalid_argument_error{ "requests must be an array of request objects" };

    return parsed.get<std::vector<request>>();
  }
} // namespace replacer::json
