#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <iostream>
#include <mutex>
#include <string>

class Logger {
public:
	enum class Level { Debug, Info, Warn, Error, Off };

	explicit Logger(std::ostream& out = std::cout, Level level = Level::Info, bool colors = true);

	void setLevel(Level level);
	Level getLevel() const;
	bool enabled(Level level) const;

	void debug(const std::string& module, const std::string& message);
	void info(const std::string& module, const std::string& message);
	void warn(const std::string& module, const std::string& message);
	void error(const std::string& module, const std::string& message);
	void write(Level level, const std::string& module, const std::string& message);

private:
	std::ostream& out;
	Level level;
	bool colors;
	mutable std::mutex mutex;
};

#endif
