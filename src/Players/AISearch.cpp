#include "AISearch.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>
#include <random>

#include "Config.hpp"

namespace {
constexpr int kEvalCap = AISearch::kWinScore - 1;

struct SearchContext {
	const Rules& rules;
	const SearchSettings& settings;
	std::chrono::steady_clock::time_point start;
	PlayerColor root;
	long long nodes;
	double estimatedNodes;
	int lastProgress;
	bool cancelled;
	bool timedOut;
};

SearchContext makeContext(const Rules& rules, const SearchSettings& settings, PlayerColor root) {
	return SearchContext{ rules, settings, std::chrono::steady_clock::now(), root, 0, 1.0, -1, false, false };
}

bool shouldStop(SearchContext& ctx) {
	if (ctx.settings.cancel.isCancelled()) {
		ctx.cancelled = true;
	}
	if (!ctx.timedOut && ctx.settings.timeoutMs > 0) {
		auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - ctx.start).count();
		ctx.timedOut = elapsed >= ctx.settings.timeoutMs;
	}
	return ctx.cancelled || ctx.timedOut;
}

void reportProgress(SearchContext& ctx, double done) {
	if (!ctx.settings.onProgress) {
		return;
	}
	int percent = static_cast<int>(done * 100.0 / std::max(ctx.estimatedNodes, 1.0));
	percent = std::max(0, std::min(100, percent));
	if (percent > ctx.lastProgress) {
		ctx.lastProgress = percent;
		ctx.settings.onProgress(percent);
	}
}

void publishGhost(const SearchContext& ctx, const Board& board) {
	if (Config::kGhostMode && ctx.settings.onGhostUpdate) {
		ctx.settings.onGhostUpdate(board);
	}
}

int minimax(const GameState& state, int depth, int alpha, int beta, SearchContext& ctx);

// Scores the position after `mover` played `move` into `child`.
int scoreChild(const GameState& child, const Move& move, PlayerColor mover, int depthLeft, int alpha, int beta,
	SearchContext& ctx) {
	if (ctx.rules.checkWin(child.board, move.x, move.y, mover).isWin) {
		return (mover == ctx.root) ? AISearch::kWinScore : -AISearch::kWinScore;
	}
	if (depthLeft <= 0 || ctx.rules.isDraw(child.board)) {
		return AISearch::evaluateBoard(child.board, ctx.rules, ctx.root, move);
	}
	return minimax(child, depthLeft, alpha, beta, ctx);
}

int minimax(const GameState& state, int depth, int alpha, int beta, SearchContext& ctx) {
	PlayerColor mover = state.toMove;
	bool maximizing = (mover == ctx.root);
	std::vector<Move> moves = AISearch::orderCandidates(state, ctx.rules, static_cast<size_t>(Config::kAiTopCandidates));
	int best = maximizing ? std::numeric_limits<int>::min() : std::numeric_limits<int>::max();
	bool searched = false;
	for (const Move& move : moves) {
		if (shouldStop(ctx)) {
			break;
		}
		GameState child = state.clone();
		if (child.applyMove(move) != GameState::MoveError::None) {
			continue;
		}
		++ctx.nodes;
		int score = scoreChild(child, move, mover, depth - 1, alpha, beta, ctx);
		searched = true;
		if (maximizing) {
			best = std::max(best, score);
			alpha = std::max(alpha, score);
		} else {
			best = std::min(best, score);
			beta = std::min(beta, score);
		}
		if (beta <= alpha) {
			break;
		}
	}
	if (!searched) {
		return AISearch::evaluateBoard(state.board, ctx.rules, ctx.root, state.lastMove);
	}
	return best;
}

SearchResult runMinimax(const GameState& state, SearchContext& ctx, int depth, GameSettings::Difficulty strategy) {
	std::vector<Move> moves = AISearch::orderCandidates(state, ctx.rules, 0);
	if (moves.empty()) {
		return SearchResult::failed(strategy, "no available moves");
	}
	ctx.estimatedNodes = static_cast<double>(moves.size()) * std::pow(3.0, depth);

	int alpha = std::numeric_limits<int>::min();
	const int beta = std::numeric_limits<int>::max();
	int bestScore = std::numeric_limits<int>::min();
	Move bestMove = moves.front();
	for (const Move& move : moves) {
		if (shouldStop(ctx)) {
			break;
		}
		GameState child = state.clone();
		if (child.applyMove(move) != GameState::MoveError::None) {
			continue;
		}
		++ctx.nodes;
		publishGhost(ctx, child.board);
		int score = scoreChild(child, move, ctx.root, depth - 1, alpha, beta, ctx);
		// A subtree cut short by cancel or deadline has no trustworthy score.
		if (ctx.cancelled || ctx.timedOut) {
			break;
		}
		if (score > bestScore) {
			bestScore = score;
			bestMove = move;
		}
		alpha = std::max(alpha, score);
		reportProgress(ctx, static_cast<double>(ctx.nodes));
	}
	if (ctx.cancelled) {
		return SearchResult::aborted(strategy);
	}

	SearchResult result;
	result.status = SearchResult::Status::MoveProduced;
	result.hasMove = true;
	result.position = bestMove;
	result.strategy = strategy;
	result.depth = depth;
	if (bestScore == std::numeric_limits<int>::min()) {
		result.score = static_cast<int>(AISearch::heuristicForMove(state.board, ctx.rules, ctx.root, bestMove));
		result.message = "deadline reached before the first candidate";
	} else {
		result.score = bestScore;
		if (ctx.timedOut) {
			result.message = "deadline reached, partial root search";
		}
	}
	return result;
}

SearchResult produced(const Move& move, int score, GameSettings::Difficulty strategy, const std::string& message) {
	SearchResult result;
	result.status = SearchResult::Status::MoveProduced;
	result.hasMove = true;
	result.position = move;
	result.score = score;
	result.strategy = strategy;
	result.message = message;
	return result;
}

bool findImmediateWin(const GameState& state, const Rules& rules, Move& outMove) {
	std::vector<Move> moves = rules.getAvailableMoves(state.board, state.getHistory(), state.toMove, Config::kCandidateRange);
	for (const Move& move : moves) {
		if (rules.checkWin(state.board, move.x, move.y, state.toMove).isWin) {
			outMove = move;
			return true;
		}
	}
	return false;
}

ThreatReport collectThreats(const GameState& state, const Rules& rules, SearchContext* ctx) {
	ThreatReport report;
	PlayerColor opponent = otherPlayer(state.toMove);
	std::vector<Move> moves = rules.getAvailableMoves(state.board, state.getHistory(), state.toMove, Config::kCandidateRange);
	for (const Move& move : moves) {
		if (ctx && shouldStop(*ctx)) {
			break;
		}
		if (!rules.validateMove(state.board, move.x, move.y, opponent).ok()) {
			continue;
		}
		WinResult win = rules.checkWin(state.board, move.x, move.y, opponent);
		PatternAnalysis analysis = rules.analyzePattern(state.board, move.x, move.y, opponent);
		ThreatInfo threat{ move, analysis.score, win.isWin };
		if (win.isWin) {
			report.critical.push_back(threat);
		} else if (analysis.count(PatternMatcher::Pattern::LiveFour) > 0
			|| analysis.count(PatternMatcher::Pattern::RushFour) > 1) {
			report.serious.push_back(threat);
		} else if (analysis.count(PatternMatcher::Pattern::LiveThree) > 1) {
			report.moderate.push_back(threat);
		}
	}
	return report;
}

void attachThreats(SearchResult& result, const ThreatReport& threats) {
	result.criticalThreats = static_cast<int>(threats.critical.size());
	result.seriousThreats = static_cast<int>(threats.serious.size());
	result.moderateThreats = static_cast<int>(threats.moderate.size());
}

SearchResult beginnerStrategy(const GameState& state, SearchContext& ctx) {
	const GameSettings::Difficulty strategy = GameSettings::Difficulty::Beginner;
	std::vector<Move> moves = ctx.rules.getAvailableMoves(state.board, state.getHistory(), state.toMove, Config::kCandidateRange);
	if (moves.empty()) {
		return SearchResult::failed(strategy, "no available moves");
	}
	ctx.estimatedNodes = static_cast<double>(moves.size());
	std::vector<std::pair<double, Move>> scored;
	scored.reserve(moves.size());
	for (const Move& move : moves) {
		if (shouldStop(ctx)) {
			break;
		}
		scored.emplace_back(AISearch::heuristicForMove(state.board, ctx.rules, state.toMove, move), move);
		++ctx.nodes;
		reportProgress(ctx, static_cast<double>(ctx.nodes));
	}
	if (ctx.cancelled) {
		return SearchResult::aborted(strategy);
	}
	if (scored.empty()) {
		const Move& first = moves.front();
		return produced(first, static_cast<int>(AISearch::heuristicForMove(state.board, ctx.rules, state.toMove, first)),
			strategy, "deadline reached before the first candidate");
	}
	std::stable_sort(scored.begin(), scored.end(),
		[](const std::pair<double, Move>& a, const std::pair<double, Move>& b) {
			return a.first > b.first;
		});
	scored.resize((scored.size() + 1) / 2);

	double lowest = scored.back().first;
	std::vector<double> weights;
	weights.reserve(scored.size());
	for (const auto& entry : scored) {
		weights.push_back(entry.first - lowest + 1.0);
	}
	std::mt19937 rng(ctx.settings.useSeed ? ctx.settings.seed : std::random_device{}());
	std::discrete_distribution<size_t> pick(weights.begin(), weights.end());
	const auto& chosen = scored[pick(rng)];
	return produced(chosen.second, static_cast<int>(chosen.first), strategy, "weighted pick from the top half");
}

SearchResult hardStrategy(const GameState& state, SearchContext& ctx, int depth) {
	const GameSettings::Difficulty strategy = GameSettings::Difficulty::Hard;
	Move winning;
	if (findImmediateWin(state, ctx.rules, winning)) {
		return produced(winning, AISearch::kWinScore, strategy, "immediate win");
	}
	ThreatReport threats = collectThreats(state, ctx.rules, &ctx);
	if (ctx.cancelled) {
		return SearchResult::aborted(strategy);
	}
	if (!threats.critical.empty()) {
		SearchResult result = produced(threats.critical.front().position, threats.critical.front().score, strategy,
			"critical threat response");
		attachThreats(result, threats);
		return result;
	}
	SearchResult result = runMinimax(state, ctx, depth, strategy);
	attachThreats(result, threats);
	return result;
}

// Scores a sequence by playing every move as the searching side's stone.
int evaluateSequence(const GameState& state, const Rules& rules, const std::vector<Move>& sequence) {
	Board board = state.board;
	Board::Cell cell = playerCell(state.toMove);
	int total = 0;
	for (const Move& move : sequence) {
		if (!board.isEmpty(move.x, move.y)) {
			continue;
		}
		board.set(move.x, move.y, cell);
		total += rules.analyzePattern(board, move.x, move.y, state.toMove).score;
	}
	return total;
}

// Bounded approximation of threat-space search: single critical threats and
// pairs of serious threats only, no deeper forcing chains.
SearchResult hellStrategy(const GameState& state, SearchContext& ctx) {
	const GameSettings::Difficulty strategy = GameSettings::Difficulty::Hell;
	Move winning;
	if (findImmediateWin(state, ctx.rules, winning)) {
		return produced(winning, AISearch::kWinScore, strategy, "immediate win");
	}
	ThreatReport threats = collectThreats(state, ctx.rules, &ctx);
	if (ctx.cancelled) {
		return SearchResult::aborted(strategy);
	}

	// An opponent five must be blocked, so serious pairs only compete when there is none.
	std::vector<std::vector<Move>> sequences;
	for (const ThreatInfo& threat : threats.critical) {
		sequences.push_back({ threat.position });
	}
	for (size_t i = 0; threats.critical.empty() && i < threats.serious.size(); ++i) {
		for (size_t j = i + 1; j < threats.serious.size(); ++j) {
			sequences.push_back({ threats.serious[i].position, threats.serious[j].position });
		}
	}

	if (sequences.empty()) {
		SearchResult result = runMinimax(state, ctx, Config::kHardDepth, strategy);
		attachThreats(result, threats);
		if (result.status == SearchResult::Status::MoveProduced) {
			result.message = "no forcing sequence, deep search";
		}
		return result;
	}

	ctx.estimatedNodes = static_cast<double>(sequences.size());
	int bestScore = std::numeric_limits<int>::min();
	Move bestMove = sequences.front().front();
	int evaluated = 0;
	for (const std::vector<Move>& sequence : sequences) {
		if (shouldStop(ctx)) {
			break;
		}
		int score = evaluateSequence(state, ctx.rules, sequence);
		++ctx.nodes;
		++evaluated;
		if (score > bestScore) {
			bestScore = score;
			bestMove = sequence.front();
		}
		reportProgress(ctx, static_cast<double>(evaluated));
	}
	if (ctx.cancelled) {
		return SearchResult::aborted(strategy);
	}
	if (evaluated == 0) {
		bestScore = threats.critical.empty() ? threats.serious.front().score : threats.critical.front().score;
	}
	SearchResult result = produced(bestMove, bestScore, strategy, "threat space search");
	result.sequences = static_cast<int>(sequences.size());
	attachThreats(result, threats);
	return result;
}
}  // namespace

constexpr int AISearch::kWinScore;

CancelToken::CancelToken() : flag(std::make_shared<std::atomic<bool>>(false)) {
}

void CancelToken::cancel() const {
	flag->store(true);
}

bool CancelToken::isCancelled() const {
	return flag->load();
}

SearchResult SearchResult::aborted(GameSettings::Difficulty strategy) {
	SearchResult result;
	result.status = Status::Aborted;
	result.strategy = strategy;
	result.message = "search aborted";
	return result;
}

SearchResult SearchResult::failed(GameSettings::Difficulty strategy, const std::string& message) {
	SearchResult result;
	result.status = Status::Failed;
	result.strategy = strategy;
	result.message = message;
	return result;
}

SearchSettings AISearch::settingsFor(GameSettings::Difficulty difficulty) {
	SearchSettings settings;
	settings.difficulty = difficulty;
	switch (difficulty) {
	case GameSettings::Difficulty::Beginner:
		settings.timeoutMs = Config::kBeginnerTimeoutMs;
		settings.depth = 0;
		break;
	case GameSettings::Difficulty::Normal:
		settings.timeoutMs = Config::kNormalTimeoutMs;
		settings.depth = Config::kNormalDepth;
		break;
	case GameSettings::Difficulty::Hard:
		settings.timeoutMs = Config::kHardTimeoutMs;
		settings.depth = Config::kHardDepth;
		break;
	case GameSettings::Difficulty::Hell:
		settings.timeoutMs = Config::kHellTimeoutMs;
		settings.depth = 0;
		break;
	}
	return settings;
}

SearchResult AISearch::findBestMove(const GameState& state, const Rules& rules, const SearchSettings& settings) {
	SearchContext ctx = makeContext(rules, settings, state.toMove);
	if (settings.cancel.isCancelled()) {
		return SearchResult::aborted(settings.difficulty);
	}
	if (state.isFinished()) {
		return SearchResult::failed(settings.difficulty, "game is over");
	}

	SearchResult result;
	switch (settings.difficulty) {
	case GameSettings::Difficulty::Beginner:
		result = beginnerStrategy(state, ctx);
		break;
	case GameSettings::Difficulty::Normal:
		result = runMinimax(state, ctx, std::max(1, settings.depth), settings.difficulty);
		break;
	case GameSettings::Difficulty::Hard:
		result = hardStrategy(state, ctx, std::max(1, settings.depth));
		break;
	case GameSettings::Difficulty::Hell:
		result = hellStrategy(state, ctx);
		break;
	}
	result.nodes = ctx.nodes;
	return result;
}

ThreatReport AISearch::analyzeThreats(const GameState& state, const Rules& rules) {
	return collectThreats(state, rules, nullptr);
}

int AISearch::evaluateBoard(const Board& board, const Rules& rules, PlayerColor perspective, const Move& lastMove) {
	int total = 0;
	int size = board.getSize();
	for (int y = 0; y < size; ++y) {
		for (int x = 0; x < size; ++x) {
			Board::Cell cell = board.at(x, y);
			if (cell == Board::Cell::Empty) {
				continue;
			}
			PlayerColor owner = (cell == Board::Cell::Black) ? PlayerColor::Black : PlayerColor::White;
			int score = rules.analyzePattern(board, x, y, owner).score;
			total += (owner == perspective) ? score : -score;
		}
	}
	if (lastMove.isValid(size)) {
		int center = size / 2;
		int distance = std::abs(lastMove.x - center) + std::abs(lastMove.y - center);
		total += (2 * center - distance) * 10;
	}
	return std::max(-kEvalCap, std::min(kEvalCap, total));
}

double AISearch::heuristicForMove(const Board& board, const Rules& rules, PlayerColor player, const Move& move) {
	double own = rules.evaluatePosition(board, move.x, move.y, player);
	double defence = rules.evaluatePosition(board, move.x, move.y, otherPlayer(player));
	return own + defence * Config::kOpponentWeight;
}

std::vector<Move> AISearch::orderCandidates(const GameState& state, const Rules& rules, size_t maxCandidates) {
	std::vector<Move> moves = rules.getAvailableMoves(state.board, state.getHistory(), state.toMove, Config::kCandidateRange);
	std::vector<std::pair<double, Move>> scored;
	scored.reserve(moves.size());
	for (const Move& move : moves) {
		scored.emplace_back(heuristicForMove(state.board, rules, state.toMove, move), move);
	}
	std::stable_sort(scored.begin(), scored.end(),
		[](const std::pair<double, Move>& a, const std::pair<double, Move>& b) {
			return a.first > b.first;
		});
	if (maxCandidates > 0 && scored.size() > maxCandidates) {
		scored.resize(maxCandidates);
	}
	moves.clear();
	for (const auto& entry : scored) {
		moves.push_back(entry.second);
	}
	return moves;
}

const char* searchStatusName(SearchResult::Status status) {
	switch (status) {
	case SearchResult::Status::MoveProduced:
		return "move produced";
	case SearchResult::Status::Aborted:
		return "aborted";
	case SearchResult::Status::Failed:
		return "failed";
	}
	return "unknown";
}
