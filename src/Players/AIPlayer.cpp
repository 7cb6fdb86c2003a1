#include "AIPlayer.hpp"

#include <chrono>
#include <sstream>

#include "Config.hpp"

AIPlayer::AIPlayer(GameSettings::Difficulty difficultyIn, int moveDelayMs, Logger& loggerIn)
	: difficulty(difficultyIn),
	  delayMs(moveDelayMs),
	  timeLimitMs(0),
	  logger(loggerIn),
	  sessionId(0),
	  state(ThinkingState::Idle),
	  moveReady(false),
	  readyResult(),
	  progressPercent(0),
	  ghostActive(false),
	  ghostBoard() {
}

AIPlayer::~AIPlayer() {
	stopThinking();
}

bool AIPlayer::isHuman() const {
	return false;
}

std::future<SearchResult> AIPlayer::calculateBestMove(const GameState& snapshot, const Rules& rules,
	std::function<void(int)> onProgress) {
	std::promise<SearchResult> promise;
	std::future<SearchResult> future = promise.get_future();
	CancelToken token;
	std::thread previous;
	unsigned long session = 0;
	{
		std::lock_guard<std::mutex> lock(sessionMutex);
		if (state == ThinkingState::Thinking) {
			promise.set_value(SearchResult::failed(difficulty, "AI is already thinking"));
			return future;
		}
		session = ++sessionId;
		cancel = token;
		state = ThinkingState::Thinking;
		moveReady = false;
		readyResult = SearchResult();
		previous.swap(worker);
	}
	if (previous.joinable()) {
		previous.join();
	}
	progressPercent.store(0);
	ghostActive.store(false);

	SearchSettings settings = makeSettings(token, onProgress);
	GameState stateCopy = snapshot.clone();
	Rules rulesCopy = rules;
	std::thread search([this, stateCopy, rulesCopy, settings, token, session](std::promise<SearchResult> done) {
		SearchResult result;
		if (!waitDelay(token)) {
			result = SearchResult::aborted(difficulty);
		} else {
			result = runSearch(stateCopy, rulesCopy, settings);
		}
		if (token.isCancelled()) {
			result = SearchResult::aborted(difficulty);
		}
		{
			std::lock_guard<std::mutex> lock(sessionMutex);
			if (session == sessionId && state == ThinkingState::Thinking) {
				switch (result.status) {
				case SearchResult::Status::MoveProduced:
					state = ThinkingState::MoveProduced;
					break;
				case SearchResult::Status::Aborted:
					state = ThinkingState::Aborted;
					break;
				case SearchResult::Status::Failed:
					state = ThinkingState::Failed;
					break;
				}
				readyResult = result;
				moveReady = true;
			}
		}
		ghostActive.store(false);
		done.set_value(result);
	}, std::move(promise));

	std::thread stale;
	{
		std::lock_guard<std::mutex> lock(sessionMutex);
		stale.swap(worker);
		worker = std::move(search);
	}
	if (stale.joinable()) {
		stale.join();
	}
	return future;
}

void AIPlayer::startThinking(const GameState& snapshot, const Rules& rules) {
	calculateBestMove(snapshot, rules);
}

void AIPlayer::stopThinking() {
	{
		std::lock_guard<std::mutex> lock(sessionMutex);
		if (state == ThinkingState::Thinking) {
			cancel.cancel();
			state = ThinkingState::Aborted;
			logger.debug("AI", std::string(difficultyName(difficulty)) + " search cancelled");
		}
		moveReady = false;
	}
	joinWorker();
	ghostActive.store(false);
}

AIPlayer::ThinkingState AIPlayer::getState() const {
	std::lock_guard<std::mutex> lock(sessionMutex);
	return state;
}

bool AIPlayer::isThinking() const {
	return getState() == ThinkingState::Thinking;
}

bool AIPlayer::hasMoveReady() const {
	std::lock_guard<std::mutex> lock(sessionMutex);
	return moveReady;
}

SearchResult AIPlayer::takeResult() {
	std::lock_guard<std::mutex> lock(sessionMutex);
	SearchResult result = readyResult;
	moveReady = false;
	readyResult = SearchResult();
	if (state != ThinkingState::Thinking) {
		state = ThinkingState::Idle;
	}
	return result;
}

int AIPlayer::progress() const {
	return progressPercent.load();
}

bool AIPlayer::hasGhostBoard() const {
	return ghostActive.load();
}

Board AIPlayer::ghostBoardCopy() const {
	std::lock_guard<std::mutex> lock(ghostMutex);
	return ghostBoard;
}

GameSettings::Difficulty AIPlayer::getDifficulty() const {
	return difficulty;
}

void AIPlayer::setTimeLimit(int timeoutMs) {
	std::lock_guard<std::mutex> lock(sessionMutex);
	timeLimitMs = timeoutMs;
}

SearchSettings AIPlayer::makeSettings(const CancelToken& token, std::function<void(int)> onProgress) {
	SearchSettings settings = AISearch::settingsFor(difficulty);
	{
		std::lock_guard<std::mutex> lock(sessionMutex);
		if (timeLimitMs > 0) {
			settings.timeoutMs = timeLimitMs;
		}
	}
	settings.cancel = token;
	settings.onProgress = [this, onProgress](int percent) {
		progressPercent.store(percent);
		if (onProgress) {
			onProgress(percent);
		}
	};
	if (Config::kGhostMode) {
		settings.onGhostUpdate = [this](const Board& board) {
			std::lock_guard<std::mutex> lock(ghostMutex);
			ghostBoard = board;
			ghostActive.store(true);
		};
	}
	return settings;
}

SearchResult AIPlayer::runSearch(const GameState& snapshot, const Rules& rules, const SearchSettings& settings) {
	auto start = std::chrono::steady_clock::now();
	SearchResult result = AISearch::findBestMove(snapshot, rules, settings);
	double elapsedMs = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
	if (logger.enabled(Logger::Level::Debug)) {
		std::ostringstream line;
		line << difficultyName(difficulty) << " " << searchStatusName(result.status);
		if (result.hasMove) {
			line << " " << result.position.toString() << " score " << result.score;
		}
		line << " nodes " << result.nodes << " in " << static_cast<long long>(elapsedMs) << "ms";
		if (!result.message.empty()) {
			line << " (" << result.message << ")";
		}
		logger.debug("AI", line.str());
	}
	return result;
}

// Sleeps in short slices so a cancel is seen quickly. False when cancelled.
bool AIPlayer::waitDelay(const CancelToken& token) const {
	auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(delayMs);
	while (std::chrono::steady_clock::now() < deadline) {
		if (token.isCancelled()) {
			return false;
		}
		std::this_thread::sleep_for(std::chrono::milliseconds(Config::kAiPollSliceMs));
	}
	return !token.isCancelled();
}

// The handle is taken under the lock and joined outside it, since the worker
// locks sessionMutex on its way out.
void AIPlayer::joinWorker() {
	std::thread finished;
	{
		std::lock_guard<std::mutex> lock(sessionMutex);
		finished.swap(worker);
	}
	if (finished.joinable() && finished.get_id() != std::this_thread::get_id()) {
		finished.join();
	} else if (finished.joinable()) {
		finished.detach();
	}
}

const char* thinkingStateName(AIPlayer::ThinkingState state) {
	switch (state) {
	case AIPlayer::ThinkingState::Idle:
		return "idle";
	case AIPlayer::ThinkingState::Thinking:
		return "thinking";
	case AIPlayer::ThinkingState::MoveProduced:
		return "move produced";
	case AIPlayer::ThinkingState::Aborted:
		return "aborted";
	case AIPlayer::ThinkingState::Failed:
		return "failed";
	}
	return "unknown";
}
