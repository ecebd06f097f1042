/*
 * 설명: 스토리(캐릭터/단서/장소/해답) 읽기 전용 레지스트리를 제공한다.
 *       서버가 연결을 받기 전에 명시적으로 적재하고 이후에는 변경하지 않는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/story_catalog_test.cpp
 */
#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace mystery {

struct PlayerCountRange {
  int min{1};
  int max{1};
};

struct CharacterRecord {
  std::string id;
  std::string name;
  std::string name_cn;
  std::string public_info;
  std::string private_background;
  std::vector<std::string> secrets;
  std::map<std::string, std::string> relationships;
  std::vector<std::string> goals;
};

struct LocationRecord {
  std::string id;
  std::string name;
  std::string description;
  std::vector<std::string> searchable_items;
};

struct ClueRecord {
  std::string id;
  std::string name;
  std::string description;
  std::string location;
  std::string discovery_hint;
};

struct SolutionRecord {
  std::string culprit_id;
  std::string method;
  std::string motive;
  std::string full_explanation;
};

struct Story {
  std::string id;
  std::string title;
  std::string title_cn;
  std::string description;
  PlayerCountRange player_count;
  std::string difficulty;
  int duration_minutes{0};
  std::string setting_location;
  std::string setting_atmosphere;
  std::string victim_name;
  std::string victim_description;
  std::vector<CharacterRecord> characters;
  std::vector<LocationRecord> locations;
  // 선언 순서가 곧 탐색 우선순위다.
  std::vector<ClueRecord> clues;
  std::string intro_narration;
  std::vector<std::string> discussion_prompts;
  SolutionRecord solution;
};

// 필수 필드가 없으면 nlohmann::json::exception을 던진다.
Story ParseStory(const nlohmann::json& doc);

class StoryCatalog {
 public:
  // 디렉터리의 *.json을 모두 적재하고 적재된 개수를 반환한다. 파싱 실패 파일은 건너뛴다.
  std::size_t LoadDirectory(const std::string& directory);
  void AddStory(Story story);

  const Story* Find(const std::string& story_id) const;
  const CharacterRecord* FindCharacter(const std::string& story_id, const std::string& character_id) const;
  const ClueRecord* FindClue(const std::string& story_id, const std::string& clue_id) const;
  std::vector<const ClueRecord*> CluesAt(const std::string& story_id, const std::string& location_id) const;
  std::size_t Size() const { return stories_.size(); }

 private:
  std::unordered_map<std::string, Story> stories_;
};

}  // namespace mystery
