/*
 * 설명: 내레이션 입력을 조립하고 단계별 템플릿으로 프롬프트를 렌더링한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/narrative_test.cpp
 */
#include "mystery/narrative.hpp"

#include <algorithm>
#include <cstddef>
#include <exception>
#include <sstream>
#include <unordered_set>

namespace mystery {

namespace {
constexpr const char* kBasePrompt =
    "You are the Game Master for a murder mystery game.\n"
    "Your role is to guide players through the mystery, reveal information appropriately,\n"
    "and create an immersive, suspenseful atmosphere.\n"
    "\n"
    "RULES:\n"
    "- Never reveal the solution or who the culprit is until the reveal phase\n"
    "- Be dramatic and atmospheric in your narration\n"
    "- Respond in the same language the player uses\n"
    "- Keep responses concise but engaging (2-4 paragraphs max)\n";

void RenderContext(std::ostringstream& out, const NarrativeContext& ctx) {
  out << "\nCONTEXT:\n";
  out << "STORY: " << ctx.story_title << "\n";
  out << "SETTING: " << ctx.setting_location << " - " << ctx.setting_atmosphere << "\n";
  out << "VICTIM: " << ctx.victim_name << " - " << ctx.victim_description << "\n\n";
  out << "CURRENT PHASE: " << ctx.phase_label << "\n\n";
  out << "PLAYERS:\n";
  if (ctx.roster.empty()) {
    out << "No players yet\n";
  }
  for (const auto& entry : ctx.roster) {
    out << "- " << entry.player_name << " plays " << entry.character_name << "\n";
  }
  out << "\nCLUES DISCOVERED:\n";
  if (ctx.found_clues.empty()) {
    out << "No clues found yet\n";
  }
  for (const auto& clue : ctx.found_clues) {
    out << "- " << clue.name << ": " << clue.description << "\n";
  }
}

struct PromptRenderer {
  std::ostringstream& out;

  void operator()(const IntroductionInput& in) const {
    out << kBasePrompt
        << "\nCURRENT TASK: Introduction Phase\n"
           "- Dramatically introduce the setting and victim\n"
           "- Set the scene for the mystery\n"
           "- Build tension and atmosphere\n";
    RenderContext(out, in.context);
    out << "\nPREPARED INTRODUCTION:\n" << in.prepared_introduction << "\n\n";
    out << "Now, as the Game Master, deliver a dramatic opening narration based on the above.\n"
           "Expand on the prepared introduction with atmospheric details.\n"
           "Make players feel the tension and mystery.\n";
  }

  void operator()(const InvestigationInput& in) const {
    out << kBasePrompt
        << "\nCURRENT TASK: Investigation Phase\n"
           "- Guide players in their search\n"
           "- Give hints about where to look without revealing too much\n"
           "- React to clue discoveries with appropriate dramatic flair\n"
           "- Encourage players to discuss findings\n";
    RenderContext(out, in.context);
    out << "\nPLAYER ACTION: " << in.action << "\n\n";
    out << "UNFOUND CLUES (for your reference, do NOT reveal directly):\n";
    for (const auto& hint : in.unfound_clues) {
      out << "- " << hint.name << " at " << hint.location << "\n";
    }
    out << "\nRespond to the player's action or question. If they're stuck, give subtle hints.\n";
  }

  void operator()(const DiscussionInput& in) const {
    out << kBasePrompt
        << "\nCURRENT TASK: Discussion Phase\n"
           "- Facilitate discussion between players\n"
           "- Ask probing questions to spark debate\n"
           "- Summarize key points when helpful\n"
           "- Build tension as the vote approaches\n";
    RenderContext(out, in.context);
    out << "\nRECENT MESSAGES:\n";
    for (const auto& line : in.recent_messages) {
      out << line.sender_name << ": " << line.content << "\n";
    }
    out << "\nSUGGESTED DISCUSSION QUESTIONS:\n";
    for (const auto& prompt : in.discussion_prompts) {
      out << "- " << prompt << "\n";
    }
    out << "\nFacilitate the discussion. Ask a probing question or summarize a key point.\n"
           "Build tension toward the upcoming vote.\n";
  }

  void operator()(const VotingInput& in) const {
    out << kBasePrompt
        << "\nCURRENT TASK: Voting Phase\n"
           "- Remind players of the gravity of their decision\n"
           "- Create dramatic tension\n"
           "- Do NOT reveal any hints about the true culprit\n";
    RenderContext(out, in.context);
    out << "\nDramatically announce that voting is about to begin.\n"
           "Remind players of what's at stake.\n"
           "Do NOT give any hints about who the culprit is.\n";
  }

  void operator()(const RevealInput& in) const {
    out << kBasePrompt
        << "\nCURRENT TASK: Truth Reveal Phase\n"
           "- Dramatically reveal what really happened\n"
           "- Build up the reveal with tension\n"
           "- Congratulate correct guesses or console wrong ones\n";
    RenderContext(out, in.context);
    out << "\nSOLUTION DETAILS:\n";
    out << "- Culprit: " << in.solution.culprit_id << "\n";
    out << "- Method: " << in.solution.method << "\n";
    out << "- Motive: " << in.solution.motive << "\n";
    out << "- Full Story: " << in.solution.full_explanation << "\n\n";
    out << "Dramatically reveal what really happened. Build suspense before the big reveal.\n"
           "Describe the culprit's actions step by step.\n";
  }
};
}  // namespace

NarrativeOrchestrator::NarrativeOrchestrator(const StoryCatalog& catalog,
                                             std::shared_ptr<LanguageModelProvider> provider,
                                             std::shared_ptr<Observability> observability)
    : catalog_(catalog), provider_(std::move(provider)), observability_(std::move(observability)) {}

NarrativeContext NarrativeOrchestrator::BuildContext(const Story& story, const NarrationRequest& request) const {
  NarrativeContext ctx{.story_title = story.title,
                       .setting_location = story.setting_location,
                       .setting_atmosphere = story.setting_atmosphere,
                       .victim_name = story.victim_name,
                       .victim_description = story.victim_description,
                       .phase_label = std::string(ToString(request.phase)),
                       .roster = {},
                       .found_clues = {}};
  for (const auto& player : request.players) {
    if (!player.character_id) {
      continue;
    }
    if (const auto* character = catalog_.FindCharacter(story.id, *player.character_id)) {
      ctx.roster.push_back(RosterEntry{.player_name = player.name, .character_name = character->name});
    }
  }
  for (const auto& clue_id : request.found_clue_ids) {
    if (const auto* clue = catalog_.FindClue(story.id, clue_id)) {
      ctx.found_clues.push_back(ClueSummary{.name = clue->name, .description = clue->description});
    }
  }
  return ctx;
}

std::optional<NarrativeInput> NarrativeOrchestrator::Assemble(const NarrationRequest& request) const {
  const Story* story = catalog_.Find(request.story_id);
  if (!story) {
    return std::nullopt;
  }

  switch (request.phase) {
    case GamePhase::kScriptReading:
      return IntroductionInput{.context = BuildContext(*story, request),
                               .prepared_introduction = story->intro_narration};
    case GamePhase::kInvestigation: {
      std::unordered_set<std::string> found(request.found_clue_ids.begin(), request.found_clue_ids.end());
      std::vector<UnfoundClueHint> unfound;
      for (const auto& clue : story->clues) {
        if (!found.count(clue.id)) {
          unfound.push_back(UnfoundClueHint{.name = clue.name, .location = clue.location});
        }
      }
      return InvestigationInput{
          .context = BuildContext(*story, request), .action = request.action, .unfound_clues = std::move(unfound)};
    }
    case GamePhase::kDiscussion: {
      std::vector<ChatLine> lines;
      for (const auto& message : request.recent_messages) {
        if (message.is_chat) {
          lines.push_back(ChatLine{.sender_name = message.sender_name, .content = message.content});
        }
      }
      if (lines.size() > kDiscussionMessageWindow) {
        lines.erase(lines.begin(), lines.end() - static_cast<std::ptrdiff_t>(kDiscussionMessageWindow));
      }
      return DiscussionInput{.context = BuildContext(*story, request),
                             .recent_messages = std::move(lines),
                             .discussion_prompts = story->discussion_prompts};
    }
    case GamePhase::kVoting:
      return VotingInput{.context = BuildContext(*story, request)};
    case GamePhase::kReveal:
      return RevealInput{.context = BuildContext(*story, request), .solution = story->solution};
    case GamePhase::kLobby:
    case GamePhase::kCharacterSelect:
    case GamePhase::kEnded:
      return std::nullopt;
  }
  return std::nullopt;
}

std::string NarrativeOrchestrator::RenderPrompt(const NarrativeInput& input) const {
  std::ostringstream out;
  std::visit(PromptRenderer{out}, input);
  return out.str();
}

std::optional<std::string> NarrativeOrchestrator::Narrate(const NarrationRequest& request) const {
  auto input = Assemble(request);
  if (!input) {
    return std::nullopt;
  }
  if (!provider_) {
    return std::string(kNarrationFallback);
  }
  try {
    auto text = provider_->Generate(RenderPrompt(*input));
    if (!text.empty()) {
      if (observability_) {
        observability_->IncrementNarration();
      }
      return text;
    }
    if (observability_) {
      observability_->IncrementNarrationFailure();
      observability_->LogEvent(LogLevel::kWarn, "narration_empty", {{"phase", ToString(request.phase)}});
    }
  } catch (const std::exception& ex) {
    if (observability_) {
      observability_->IncrementNarrationFailure();
      observability_->LogEvent(LogLevel::kWarn, "narration_failed",
                               {{"phase", ToString(request.phase)}, {"reason", ex.what()}});
    }
  }
  return std::string(kNarrationFallback);
}

}  // namespace mystery
