/*
 * 설명: 스토리 JSON 파싱과 읽기 전용 조회를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/story_catalog_test.cpp
 */
#include "mystery/story_catalog.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>

namespace mystery {
namespace {
std::vector<std::string> StringList(const nlohmann::json& doc, const char* key) {
  std::vector<std::string> out;
  auto it = doc.find(key);
  if (it == doc.end() || !it->is_array()) {
    return out;
  }
  for (const auto& item : *it) {
    if (item.is_string()) {
      out.push_back(item.get<std::string>());
    }
  }
  return out;
}

CharacterRecord ParseCharacter(const nlohmann::json& doc) {
  CharacterRecord character;
  character.id = doc.at("id").get<std::string>();
  character.name = doc.at("name").get<std::string>();
  character.name_cn = doc.value("name_cn", "");
  character.public_info = doc.value("public_info", "");
  character.private_background = doc.value("private_background", "");
  character.secrets = StringList(doc, "secrets");
  character.goals = StringList(doc, "goals");
  auto rel_it = doc.find("relationships");
  if (rel_it != doc.end() && rel_it->is_object()) {
    for (const auto& [other, relation] : rel_it->items()) {
      if (relation.is_string()) {
        character.relationships[other] = relation.get<std::string>();
      }
    }
  }
  return character;
}
}  // namespace

Story ParseStory(const nlohmann::json& doc) {
  Story story;
  story.id = doc.at("id").get<std::string>();
  story.title = doc.at("title").get<std::string>();
  story.title_cn = doc.value("title_cn", "");
  story.description = doc.value("description", "");
  const auto& count = doc.at("player_count");
  story.player_count.min = count.at("min").get<int>();
  story.player_count.max = count.at("max").get<int>();
  story.difficulty = doc.value("difficulty", "");
  story.duration_minutes = doc.value("duration_minutes", 0);

  auto setting = doc.value("setting", nlohmann::json::object());
  story.setting_location = setting.value("location", "Unknown");
  story.setting_atmosphere = setting.value("atmosphere", "");
  auto victim = doc.value("victim", nlohmann::json::object());
  story.victim_name = victim.value("name", "Unknown");
  story.victim_description = victim.value("description", "");

  for (const auto& item : doc.value("characters", nlohmann::json::array())) {
    story.characters.push_back(ParseCharacter(item));
  }
  for (const auto& item : doc.value("locations", nlohmann::json::array())) {
    LocationRecord location;
    location.id = item.at("id").get<std::string>();
    location.name = item.value("name", location.id);
    location.description = item.value("description", "");
    location.searchable_items = StringList(item, "searchable_items");
    story.locations.push_back(std::move(location));
  }
  for (const auto& item : doc.value("clues", nlohmann::json::array())) {
    ClueRecord clue;
    clue.id = item.at("id").get<std::string>();
    clue.name = item.at("name").get<std::string>();
    clue.description = item.value("description", "");
    clue.location = item.at("location").get<std::string>();
    clue.discovery_hint = item.value("discovery_hint", "");
    story.clues.push_back(std::move(clue));
  }

  auto phases = doc.value("phases", nlohmann::json::object());
  story.intro_narration = phases.value("intro_narration", "");
  story.discussion_prompts = StringList(phases, "discussion_prompts");

  auto solution = doc.value("solution", nlohmann::json::object());
  story.solution.culprit_id = solution.value("culprit_id", "");
  story.solution.method = solution.value("method", "");
  story.solution.motive = solution.value("motive", "");
  story.solution.full_explanation = solution.value("full_explanation", "");
  return story;
}

std::size_t StoryCatalog::LoadDirectory(const std::string& directory) {
  namespace fs = std::filesystem;
  std::error_code ec;
  if (!fs::is_directory(directory, ec)) {
    std::cerr << "스토리 디렉터리를 찾을 수 없습니다: " << directory << "\n";
    return 0;
  }
  std::size_t loaded = 0;
  for (const auto& entry : fs::directory_iterator(directory, ec)) {
    if (!entry.is_regular_file() || entry.path().extension() != ".json") {
      continue;
    }
    try {
      std::ifstream in(entry.path());
      auto doc = nlohmann::json::parse(in);
      auto story = ParseStory(doc);
      std::cout << "스토리 적재: " << story.title << "\n";
      AddStory(std::move(story));
      ++loaded;
    } catch (const std::exception& ex) {
      std::cerr << "스토리 적재 실패 " << entry.path().string() << ": " << ex.what() << "\n";
    }
  }
  return loaded;
}

void StoryCatalog::AddStory(Story story) {
  auto id = story.id;
  stories_[id] = std::move(story);
}

const Story* StoryCatalog::Find(const std::string& story_id) const {
  auto it = stories_.find(story_id);
  return it == stories_.end() ? nullptr : &it->second;
}

const CharacterRecord* StoryCatalog::FindCharacter(const std::string& story_id, const std::string& character_id) const {
  const auto* story = Find(story_id);
  if (!story) {
    return nullptr;
  }
  for (const auto& character : story->characters) {
    if (character.id == character_id) {
      return &character;
    }
  }
  return nullptr;
}

const ClueRecord* StoryCatalog::FindClue(const std::string& story_id, const std::string& clue_id) const {
  const auto* story = Find(story_id);
  if (!story) {
    return nullptr;
  }
  for (const auto& clue : story->clues) {
    if (clue.id == clue_id) {
      return &clue;
    }
  }
  return nullptr;
}

std::vector<const ClueRecord*> StoryCatalog::CluesAt(const std::string& story_id, const std::string& location_id) const {
  std::vector<const ClueRecord*> out;
  const auto* story = Find(story_id);
  if (!story) {
    return out;
  }
  for (const auto& clue : story->clues) {
    if (clue.location == location_id) {
      out.push_back(&clue);
    }
  }
  return out;
}

}  // namespace mystery
