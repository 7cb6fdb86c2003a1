#ifndef AISEARCH_HPP
#define AISEARCH_HPP

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "GameSettings.hpp"
#include "GameState.hpp"
#include "Rules.hpp"

// Shared flag; copies observe the same cancellation.
class CancelToken {
public:
	CancelToken();
	void cancel() const;
	bool isCancelled() const;

private:
	std::shared_ptr<std::atomic<bool>> flag;
};

struct ThreatInfo {
	Move position;
	int score;
	bool isWin;
};

struct ThreatReport {
	std::vector<ThreatInfo> critical;
	std::vector<ThreatInfo> serious;
	std::vector<ThreatInfo> moderate;
};

struct SearchResult {
	enum class Status { MoveProduced, Aborted, Failed };

	Status status = Status::Failed;
	bool hasMove = false;
	Move position;
	int score = 0;
	long long nodes = 0;
	GameSettings::Difficulty strategy = GameSettings::Difficulty::Normal;
	int depth = 0;
	int sequences = 0;
	int criticalThreats = 0;
	int seriousThreats = 0;
	int moderateThreats = 0;
	std::string message;

	static SearchResult aborted(GameSettings::Difficulty strategy);
	static SearchResult failed(GameSettings::Difficulty strategy, const std::string& message);
};

struct SearchSettings {
	GameSettings::Difficulty difficulty = GameSettings::Difficulty::Normal;
	int timeoutMs = 0;
	int depth = 0;
	bool useSeed = false;
	unsigned int seed = 0;
	CancelToken cancel;
	std::function<void(int)> onProgress;
	std::function<void(const Board&)> onGhostUpdate;
};

class AISearch {
public:
	static constexpr int kWinScore = 100000;

	static SearchSettings settingsFor(GameSettings::Difficulty difficulty);
	static SearchResult findBestMove(const GameState& state, const Rules& rules, const SearchSettings& settings);

	static ThreatReport analyzeThreats(const GameState& state, const Rules& rules);
	static int evaluateBoard(const Board& board, const Rules& rules, PlayerColor perspective, const Move& lastMove);
	static double heuristicForMove(const Board& board, const Rules& rules, PlayerColor player, const Move& move);
	static std::vector<Move> orderCandidates(const GameState& state, const Rules& rules, size_t maxCandidates);
};

const char* searchStatusName(SearchResult::Status status);

#endif
