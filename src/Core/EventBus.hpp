#ifndef EVENTBUS_HPP
#define EVENTBUS_HPP

#include <functional>
#include <map>
#include <string>
#include <vector>

#include "Move.hpp"
#include "PlayerColor.hpp"

struct GameEvent {
	enum class Type {
		MoveApplied,
		MoveRejected,
		MoveUndone,
		GameWon,
		GameDrawn,
		GameStopped,
		GamePaused,
		GameResumed,
		AiThinkingStarted,
		AiThinkingCompleted,
		AiThinkingAborted,
		AiThinkingFailed,
		HintGenerated
	};

	Type type = Type::MoveApplied;
	PlayerColor player = PlayerColor::Black;
	Move move;
	int score = 0;
	std::string message;
	std::vector<Move> line;
};

// Publish/subscribe used by the orchestrator only. Not thread-safe: publish
// from the thread that owns the game.
class EventBus {
public:
	using Listener = std::function<void(const GameEvent&)>;

	EventBus();

	int subscribe(GameEvent::Type type, Listener listener);
	int subscribeOnce(GameEvent::Type type, Listener listener);
	void unsubscribe(int id);
	bool publish(const GameEvent& event);
	size_t listenerCount(GameEvent::Type type) const;
	const std::vector<GameEvent::Type>& recentEvents() const;

private:
	struct Subscription {
		int id;
		GameEvent::Type type;
		Listener listener;
		bool once;
	};

	int nextId;
	std::vector<Subscription> subscriptions;
	std::vector<GameEvent::Type> history;

	int add(GameEvent::Type type, Listener listener, bool once);
};

const char* eventName(GameEvent::Type type);

#endif
