#pragma once

#include <filesystem>
#include <string>
#include <unordered_map>

namespace cookie {

constexpr const char* kHighScoreKey = "HighScore";

/**
 * HighScoreStore: integer values persisted by key. The game only ever stores
 * one value, kHighScoreKey.
 */
class HighScoreStore {
public:
  virtual ~HighScoreStore() = default;

  virtual int get(const std::string& key, int fallback) const = 0;
  virtual void set(const std::string& key, int value) = 0;
};

class InMemoryHighScoreStore : public HighScoreStore {
public:
  int get(const std::string& key, int fallback) const override;
  void set(const std::string& key, int value) override;

private:
  std::unordered_map<std::string, int> values_;
};

/**
 * JSON object on disk, e.g. {"HighScore": 1200}. Reads tolerate a missing or
 * unreadable file; writes go to a temporary file that is renamed into place.
 */
class JsonFileHighScoreStore : public HighScoreStore {
public:
  explicit JsonFileHighScoreStore(std::filesystem::path path);

  int get(const std::string& key, int fallback) const override;
  // Throws std::runtime_error when the file cannot be written.
  void set(const std::string& key, int value) override;

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
};

struct HighScoreResult {
  int high_score = 0;
  bool new_record = false;
};

// Stores `score` only when it beats the recorded high score.
HighScoreResult update_high_score(HighScoreStore& store, int score);

} // namespace cookie
