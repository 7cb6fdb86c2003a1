#include "Logger.hpp"

namespace {
const char* levelTag(Logger::Level level) {
	switch (level) {
	case Logger::Level::Debug:
		return "debug";
	case Logger::Level::Info:
		return "info";
	case Logger::Level::Warn:
		return "warn";
	case Logger::Level::Error:
		return "error";
	case Logger::Level::Off:
		break;
	}
	return "";
}

const char* levelColor(Logger::Level level) {
	switch (level) {
	case Logger::Level::Debug:
		return "\033[90m";
	case Logger::Level::Info:
		return "\033[36m";
	case Logger::Level::Warn:
		return "\033[33m";
	case Logger::Level::Error:
		return "\033[31m";
	case Logger::Level::Off:
		break;
	}
	return "";
}
}  // namespace

Logger::Logger(std::ostream& outStream, Level levelIn, bool colorsIn)
	: out(outStream),
	  level(levelIn),
	  colors(colorsIn) {
}

void Logger::setLevel(Level levelIn) {
	std::lock_guard<std::mutex> lock(mutex);
	level = levelIn;
}

Logger::Level Logger::getLevel() const {
	std::lock_guard<std::mutex> lock(mutex);
	return level;
}

bool Logger::enabled(Level messageLevel) const {
	std::lock_guard<std::mutex> lock(mutex);
	return messageLevel != Level::Off && messageLevel >= level;
}

void Logger::debug(const std::string& module, const std::string& message) {
	write(Level::Debug, module, message);
}

void Logger::info(const std::string& module, const std::string& message) {
	write(Level::Info, module, message);
}

void Logger::warn(const std::string& module, const std::string& message) {
	write(Level::Warn, module, message);
}

void Logger::error(const std::string& module, const std::string& message) {
	write(Level::Error, module, message);
}

void Logger::write(Level messageLevel, const std::string& module, const std::string& message) {
	std::lock_guard<std::mutex> lock(mutex);
	if (messageLevel == Level::Off || messageLevel < level) {
		return;
	}
	if (colors) {
		out << levelColor(messageLevel) << "[" << levelTag(messageLevel) << "]\033[0m ";
	} else {
		out << "[" << levelTag(messageLevel) << "] ";
	}
	out << "[" << module << "] " << message << std::endl;
}
