#include "EventBus.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace {
const size_t kMaxHistory = 100;
}  // namespace

EventBus::EventBus() : nextId(1) {
}

int EventBus::subscribe(GameEvent::Type type, Listener listener) {
	return add(type, std::move(listener), false);
}

int EventBus::subscribeOnce(GameEvent::Type type, Listener listener) {
	return add(type, std::move(listener), true);
}

void EventBus::unsubscribe(int id) {
	subscriptions.erase(std::remove_if(subscriptions.begin(), subscriptions.end(),
		[id](const Subscription& sub) {
			return sub.id == id;
		}), subscriptions.end());
}

bool EventBus::publish(const GameEvent& event) {
	history.push_back(event.type);
	if (history.size() > kMaxHistory) {
		history.erase(history.begin());
	}
	std::vector<Subscription> matching;
	for (const Subscription& sub : subscriptions) {
		if (sub.type == event.type) {
			matching.push_back(sub);
		}
	}
	subscriptions.erase(std::remove_if(subscriptions.begin(), subscriptions.end(),
		[&event](const Subscription& sub) {
			return sub.once && sub.type == event.type;
		}), subscriptions.end());
	for (const Subscription& sub : matching) {
		sub.listener(event);
	}
	return !matching.empty();
}

size_t EventBus::listenerCount(GameEvent::Type type) const {
	return static_cast<size_t>(std::count_if(subscriptions.begin(), subscriptions.end(),
		[type](const Subscription& sub) {
			return sub.type == type;
		}));
}

const std::vector<GameEvent::Type>& EventBus::recentEvents() const {
	return history;
}

int EventBus::add(GameEvent::Type type, Listener listener, bool once) {
	if (!listener) {
		throw std::invalid_argument("EventBus listener must be callable");
	}
	int id = nextId++;
	subscriptions.push_back(Subscription{ id, type, std::move(listener), once });
	return id;
}

const char* eventName(GameEvent::Type type) {
	switch (type) {
	case GameEvent::Type::MoveApplied:
		return "move:applied";
	case GameEvent::Type::MoveRejected:
		return "move:rejected";
	case GameEvent::Type::MoveUndone:
		return "move:undone";
	case GameEvent::Type::GameWon:
		return "game:won";
	case GameEvent::Type::GameDrawn:
		return "game:drawn";
	case GameEvent::Type::GameStopped:
		return "game:stopped";
	case GameEvent::Type::GamePaused:
		return "game:paused";
	case GameEvent::Type::GameResumed:
		return "game:resumed";
	case GameEvent::Type::AiThinkingStarted:
		return "ai:thinkingStarted";
	case GameEvent::Type::AiThinkingCompleted:
		return "ai:thinkingCompleted";
	case GameEvent::Type::AiThinkingAborted:
		return "ai:thinkingAborted";
	case GameEvent::Type::AiThinkingFailed:
		return "ai:thinkingFailed";
	case GameEvent::Type::HintGenerated:
		return "hint:generated";
	}
	return "unknown";
}
