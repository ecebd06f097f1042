/*
 * 설명: 게임 단계를 다섯 프롬프트 템플릿 중 하나로 라우팅하고 언어 모델 호출을 조율한다.
 *       해답(SolutionRecord)은 RevealInput에만 존재한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/narrative_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "mystery/phase.hpp"
#include "mystery/story_catalog.hpp"
#include "mystery/llm_provider.hpp"
#include "mystery/observability.hpp"

namespace mystery {

inline constexpr const char* kNarrationFallback = "The Game Master is silent...";
inline constexpr std::size_t kDiscussionMessageWindow = 5;

struct RosterEntry {
  std::string player_name;
  std::string character_name;
};

struct ClueSummary {
  std::string name;
  std::string description;
};

struct NarrativeContext {
  std::string story_title;
  std::string setting_location;
  std::string setting_atmosphere;
  std::string victim_name;
  std::string victim_description;
  std::string phase_label;
  std::vector<RosterEntry> roster;
  std::vector<ClueSummary> found_clues;
};

struct UnfoundClueHint {
  std::string name;
  std::string location;
};

struct ChatLine {
  std::string sender_name;
  std::string content;
};

struct IntroductionInput {
  NarrativeContext context;
  std::string prepared_introduction;
};

struct InvestigationInput {
  NarrativeContext context;
  std::string action;
  std::vector<UnfoundClueHint> unfound_clues;
};

struct DiscussionInput {
  NarrativeContext context;
  std::vector<ChatLine> recent_messages;
  std::vector<std::string> discussion_prompts;
};

struct VotingInput {
  NarrativeContext context;
};

struct RevealInput {
  NarrativeContext context;
  SolutionRecord solution;
};

using NarrativeInput = std::variant<IntroductionInput, InvestigationInput, DiscussionInput, VotingInput, RevealInput>;

struct NarrationPlayer {
  std::string name;
  std::optional<std::string> character_id;
};

struct NarrationMessage {
  std::string sender_name;
  std::string content;
  bool is_chat{true};
};

struct NarrationRequest {
  std::string story_id;
  GamePhase phase{GamePhase::kLobby};
  std::vector<NarrationPlayer> players;
  std::vector<std::string> found_clue_ids;
  std::vector<NarrationMessage> recent_messages;
  std::string action;
};

class NarrativeOrchestrator {
 public:
  NarrativeOrchestrator(const StoryCatalog& catalog, std::shared_ptr<LanguageModelProvider> provider,
                        std::shared_ptr<Observability> observability = nullptr);

  NarrativeContext BuildContext(const Story& story, const NarrationRequest& request) const;
  // 내레이션이 없는 단계나 알 수 없는 스토리는 nullopt.
  std::optional<NarrativeInput> Assemble(const NarrationRequest& request) const;
  std::string RenderPrompt(const NarrativeInput& input) const;
  // 제공자 실패는 kNarrationFallback으로 대체되며 전파되지 않는다.
  std::optional<std::string> Narrate(const NarrationRequest& request) const;

 private:
  const StoryCatalog& catalog_;
  std::shared_ptr<LanguageModelProvider> provider_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace mystery
