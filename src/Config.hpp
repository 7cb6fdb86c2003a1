#ifndef CONFIG_HPP
#define CONFIG_HPP

namespace Config {
constexpr bool kGhostMode = true;
constexpr int kCandidateRange = 2;
constexpr int kAiTopCandidates = 12;
constexpr int kAiPollSliceMs = 10;
constexpr double kOpponentWeight = 0.8;

constexpr int kBeginnerTimeoutMs = 600;
constexpr int kNormalTimeoutMs = 1000;
constexpr int kHardTimeoutMs = 2000;
constexpr int kHellTimeoutMs = 2400;

constexpr int kNormalDepth = 2;
constexpr int kHardDepth = 3;

constexpr int kMinBoardSize = 5;
constexpr int kMaxBoardSize = 25;
}

#endif
