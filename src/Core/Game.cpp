#include "Game.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

#include "Config.hpp"

namespace {
std::string formatTime(double ms) {
	std::ostringstream out;
	out << std::fixed << std::setprecision(4);
	if (ms >= 1000.0) {
		out << (ms / 1000.0) << "s";
	} else {
		out << ms << "ms";
	}
	return out.str();
}

const char* colorTag(PlayerColor player) {
	return (player == PlayerColor::Black) ? "\033[90m[BLACK]\033[0m" : "\033[97m[WHITE]\033[0m";
}
}  // namespace

Game::Game(const GameSettings& settingsIn, Logger& loggerIn, EventBus& eventsIn)
	: settings(settingsIn),
	  rules(settingsIn),
	  state(settingsIn),
	  logger(loggerIn),
	  events(eventsIn),
	  blackPlayer(),
	  whitePlayer(),
	  aiStalled(false),
	  hintActive(false),
	  hintMove(),
	  coordWidth(1),
	  timeWidth(0) {
	newGame(settingsIn);
}

void Game::newGame(const GameSettings& settingsIn) {
	stopAllThinking();
	settings = settingsIn;
	rules = Rules(settingsIn);
	state.reset(settingsIn);
	aiStalled = false;
	hintActive = false;
	createPlayers();
	computeLogWidths();
	turnStartTime = std::chrono::steady_clock::now();
	logMatchup();
}

const GameState& Game::getState() const {
	return state;
}

const MoveHistory& Game::getHistory() const {
	return state.getHistory();
}

const GameSettings& Game::getSettings() const {
	return settings;
}

const Rules& Game::getRules() const {
	return rules;
}

bool Game::tryApplyMove(const Move& move, std::string* reason) {
	if (state.isFinished()) {
		rejectMove(move, moveErrorText(GameState::MoveError::GameFinished), reason);
		return false;
	}
	if (state.isPaused()) {
		rejectMove(move, moveErrorText(GameState::MoveError::GamePaused), reason);
		return false;
	}
	PlayerColor mover = state.toMove;
	IPlayer* player = currentPlayer();
	bool isAiMove = (player && !player->isHuman());
	ValidationResult validation = rules.validateMove(state.board, move.x, move.y, mover);
	if (!validation.ok()) {
		rejectMove(move, validation.reason(), reason);
		return false;
	}
	GameState::MoveError error = state.applyMove(move);
	if (error != GameState::MoveError::None) {
		rejectMove(move, moveErrorText(error), reason);
		return false;
	}
	state.lastMessage.clear();
	aiStalled = false;
	hintActive = false;
	double elapsedMs = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - turnStartTime).count();
	logMovePlayed(mover, move, elapsedMs, isAiMove);
	publish(GameEvent::Type::MoveApplied, mover, move, "");

	WinResult win = rules.checkWin(state.board, move.x, move.y, mover);
	if (win.isWin) {
		state.finish((mover == PlayerColor::Black) ? GameState::Status::BlackWon : GameState::Status::WhiteWon,
			win.winLine);
		state.lastMessage = std::string(playerName(mover)) + " wins";
		logWin(mover, win.runLength);
		GameEvent event;
		event.type = GameEvent::Type::GameWon;
		event.player = mover;
		event.move = move;
		event.message = state.lastMessage;
		event.line = win.winLine;
		events.publish(event);
		return true;
	}
	if (rules.isDraw(state.board)) {
		state.finish(GameState::Status::Draw, std::vector<Move>());
		state.lastMessage = "draw";
		logger.info("Game", "\033[36mGame ends in a draw.\033[0m");
		publish(GameEvent::Type::GameDrawn, mover, move, state.lastMessage);
		return true;
	}
	turnStartTime = std::chrono::steady_clock::now();
	return true;
}

void Game::tick() {
	if (state.isFinished() || state.isPaused()) {
		return;
	}
	IPlayer* player = currentPlayer();
	if (!player) {
		return;
	}
	if (player->isHuman()) {
		HumanPlayer* human = dynamic_cast<HumanPlayer*>(player);
		if (human && human->hasPendingMove()) {
			std::string reason;
			if (!tryApplyMove(human->takePendingMove(), &reason)) {
				human->noteRejection(reason);
			}
		}
		return;
	}
	AIPlayer* ai = dynamic_cast<AIPlayer*>(player);
	if (!ai) {
		return;
	}
	if (ai->isThinking()) {
		return;
	}
	if (ai->hasMoveReady()) {
		collectAiResult(*ai);
		return;
	}
	if (aiStalled) {
		return;
	}
	ai->startThinking(state, rules);
	logger.debug("Game", std::string(playerName(state.toMove)) + " AI (" + difficultyName(ai->getDifficulty())
		+ ") is thinking");
	publish(GameEvent::Type::AiThinkingStarted, state.toMove, Move(), difficultyName(ai->getDifficulty()));
}

bool Game::submitHumanMove(const Move& move, std::string* reason) {
	if (state.isFinished()) {
		if (reason) {
			*reason = moveErrorText(GameState::MoveError::GameFinished);
		}
		return false;
	}
	if (state.isPaused()) {
		if (reason) {
			*reason = moveErrorText(GameState::MoveError::GamePaused);
		}
		return false;
	}
	IPlayer* player = currentPlayer();
	HumanPlayer* human = dynamic_cast<HumanPlayer*>(player);
	if (!human) {
		if (reason) {
			*reason = "AI is to move";
		}
		return false;
	}
	human->setPendingMove(move);
	return true;
}

int Game::undo() {
	if (state.isPaused()) {
		logger.debug("Game", "undo ignored while paused");
		return 0;
	}
	stopAllThinking();
	clearPendingHumanMoves();
	int undone = 0;
	while (!state.getHistory().empty()) {
		MoveHistory::HistoryEntry entry;
		if (state.undoMove(&entry) != GameState::MoveError::None) {
			break;
		}
		++undone;
		publish(GameEvent::Type::MoveUndone, entry.player, entry.move, "");
		if (settings.typeFor(state.toMove) == GameSettings::PlayerType::Human) {
			break;
		}
	}
	if (undone > 0) {
		aiStalled = false;
		hintActive = false;
		state.lastMessage.clear();
		turnStartTime = std::chrono::steady_clock::now();
		logger.info("Game", "undid " + std::to_string(undone) + " move(s), " + playerName(state.toMove) + " to move");
	}
	return undone;
}

bool Game::hint(Move& outMove) {
	if (state.isFinished()) {
		return false;
	}
	std::vector<Move> moves = rules.getAvailableMoves(state.board, state.getHistory(), state.toMove,
		Config::kCandidateRange);
	if (moves.empty()) {
		return false;
	}
	Move best = moves.front();
	int bestScore = rules.evaluatePosition(state.board, best.x, best.y, state.toMove);
	for (const Move& move : moves) {
		int score = rules.evaluatePosition(state.board, move.x, move.y, state.toMove);
		if (score > bestScore) {
			bestScore = score;
			best = move;
		}
	}
	hintActive = true;
	hintMove = best;
	outMove = best;
	GameEvent event;
	event.type = GameEvent::Type::HintGenerated;
	event.player = state.toMove;
	event.move = best;
	event.score = bestScore;
	events.publish(event);
	return true;
}

void Game::stop() {
	stopAllThinking();
	if (state.isFinished()) {
		return;
	}
	state.finish(GameState::Status::Stopped, std::vector<Move>());
	state.lastMessage = "stopped";
	logger.info("Game", "game stopped");
	publish(GameEvent::Type::GameStopped, state.toMove, Move(), state.lastMessage);
}

bool Game::pause() {
	if (state.isFinished() || state.isPaused()) {
		return false;
	}
	stopAllThinking();
	clearPendingHumanMoves();
	state.pause();
	hintActive = false;
	state.lastMessage = "paused";
	logger.info("Game", "game paused");
	publish(GameEvent::Type::GamePaused, state.toMove, Move(), state.lastMessage);
	return true;
}

// Restarts the turn clock and, on an AI turn, a fresh search.
bool Game::resume() {
	if (!state.resume()) {
		return false;
	}
	aiStalled = false;
	state.lastMessage.clear();
	turnStartTime = std::chrono::steady_clock::now();
	logger.info("Game", "game resumed, " + std::string(playerName(state.toMove)) + " to move");
	publish(GameEvent::Type::GameResumed, state.toMove, Move(), "");
	tick();
	return true;
}

bool Game::isAiTurn() const {
	IPlayer* player = currentPlayer();
	return player && !player->isHuman();
}

bool Game::isAiThinking() const {
	AIPlayer* ai = aiFor(state.toMove);
	return ai && ai->isThinking();
}

int Game::aiProgress() const {
	AIPlayer* ai = aiFor(state.toMove);
	return (ai && ai->isThinking()) ? ai->progress() : 0;
}

bool Game::hasGhostBoard() const {
	AIPlayer* ai = aiFor(state.toMove);
	return ai && ai->isThinking() && ai->hasGhostBoard();
}

Board Game::getGhostBoard() const {
	AIPlayer* ai = aiFor(state.toMove);
	return ai ? ai->ghostBoardCopy() : Board(settings.boardSize);
}

bool Game::hasHint() const {
	return hintActive;
}

Move Game::getHint() const {
	return hintMove;
}

IPlayer* Game::currentPlayer() const {
	return playerForColor(state.toMove);
}

IPlayer* Game::playerForColor(PlayerColor color) const {
	return (color == PlayerColor::Black) ? blackPlayer.get() : whitePlayer.get();
}

AIPlayer* Game::aiFor(PlayerColor color) const {
	return dynamic_cast<AIPlayer*>(playerForColor(color));
}

void Game::createPlayers() {
	auto makePlayer = [this](PlayerColor color) -> std::unique_ptr<IPlayer> {
		if (settings.typeFor(color) == GameSettings::PlayerType::Human) {
			return std::make_unique<HumanPlayer>();
		}
		return std::make_unique<AIPlayer>(settings.difficultyFor(color), settings.aiMoveDelayMs, logger);
	};
	blackPlayer = makePlayer(PlayerColor::Black);
	whitePlayer = makePlayer(PlayerColor::White);
}

void Game::stopAllThinking() {
	for (PlayerColor color : { PlayerColor::Black, PlayerColor::White }) {
		AIPlayer* ai = aiFor(color);
		if (ai && ai->isThinking()) {
			ai->stopThinking();
			publish(GameEvent::Type::AiThinkingAborted, color, Move(), "cancelled");
		} else if (ai) {
			ai->stopThinking();
		}
	}
}

void Game::clearPendingHumanMoves() {
	for (PlayerColor color : { PlayerColor::Black, PlayerColor::White }) {
		HumanPlayer* human = dynamic_cast<HumanPlayer*>(playerForColor(color));
		if (human) {
			human->clearPendingMove();
		}
	}
}

void Game::collectAiResult(AIPlayer& ai) {
	PlayerColor mover = state.toMove;
	SearchResult result = ai.takeResult();
	switch (result.status) {
	case SearchResult::Status::MoveProduced: {
		GameEvent event;
		event.type = GameEvent::Type::AiThinkingCompleted;
		event.player = mover;
		event.move = result.position;
		event.score = result.score;
		event.message = result.message;
		events.publish(event);
		std::string reason;
		if (!tryApplyMove(result.position, &reason)) {
			logger.error("Game", std::string(playerName(mover)) + " AI produced an illegal move "
				+ result.position.toString() + ": " + reason);
			aiStalled = true;
		}
		break;
	}
	case SearchResult::Status::Aborted:
		publish(GameEvent::Type::AiThinkingAborted, mover, Move(), result.message);
		break;
	case SearchResult::Status::Failed:
		logger.warn("Game", std::string(playerName(mover)) + " AI failed: " + result.message);
		state.lastMessage = "AI failed: " + result.message;
		aiStalled = true;
		publish(GameEvent::Type::AiThinkingFailed, mover, Move(), result.message);
		break;
	}
}

void Game::rejectMove(const Move& move, const std::string& reason, std::string* outReason) {
	state.lastMessage = "Illegal move: " + reason;
	logger.warn("Game", std::string(playerName(state.toMove)) + " " + move.toString() + " rejected: " + reason);
	if (outReason) {
		*outReason = reason;
	}
	publish(GameEvent::Type::MoveRejected, state.toMove, move, reason);
}

void Game::publish(GameEvent::Type type, PlayerColor player, const Move& move, const std::string& message) {
	GameEvent event;
	event.type = type;
	event.player = player;
	event.move = move;
	event.message = message;
	events.publish(event);
}

void Game::logMatchup() const {
	auto seatLabel = [this](PlayerColor color) {
		if (settings.typeFor(color) == GameSettings::PlayerType::Human) {
			return std::string("Human");
		}
		return std::string("AI ") + difficultyName(settings.difficultyFor(color));
	};
	std::ostringstream line;
	line << "\033[90mBlack (" << seatLabel(PlayerColor::Black) << ") vs White (" << seatLabel(PlayerColor::White)
		 << ") on " << settings.boardSize << "x" << settings.boardSize << ", " << modeName(settings.mode())
		 << (settings.forbiddenRules ? ", renju rules" : ", free rules") << "\033[0m";
	logger.info("Game", line.str());
}

void Game::logMovePlayed(PlayerColor player, const Move& move, double elapsedMs, bool isAiMove) const {
	auto timeColor = [](double ms) {
		if (ms > 2000.0) {
			return "\033[31m";
		}
		if (ms > 1000.0) {
			return "\033[33m";
		}
		return "\033[32m";
	};
	std::string timeText = formatTime(elapsedMs);
	if (timeText.size() < timeWidth) {
		timeText += std::string(timeWidth - timeText.size(), ' ');
	}
	const char* timeStyle = isAiMove ? timeColor(elapsedMs) : "\033[37m";
	std::ostringstream line;
	line << colorTag(player) << " played at [" << std::setw(coordWidth) << move.x << "," << std::setw(coordWidth)
		 << move.y << "] in " << timeStyle << timeText << "\033[0m | \033[36m#" << state.getHistory().size()
		 << "\033[0m";
	logger.info("Game", line.str());
}

void Game::logWin(PlayerColor player, int runLength) const {
	std::ostringstream line;
	line << colorTag(player) << " \033[35mwins with " << runLength << " in a row\033[0m after "
		 << state.getHistory().size() << " moves.";
	logger.info("Game", line.str());
}

void Game::computeLogWidths() {
	int maxCoord = std::max(0, settings.boardSize - 1);
	coordWidth = static_cast<int>(std::to_string(maxCoord).size());
	timeWidth = std::max(formatTime(999.9999).size(), formatTime(9999.9999).size());
}
