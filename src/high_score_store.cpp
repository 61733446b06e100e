#include "cookie/high_score_store.hpp"

#include "cookie/logging.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

namespace cookie {
namespace {

nlohmann::json read_document(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return nlohmann::json::object();
  }
  std::ifstream stream(path);
  if (!stream) {
    logging::get()->warn("High score file '{}' could not be opened", path.string());
    return nlohmann::json::object();
  }
  std::string content((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
  try {
    auto document = nlohmann::json::parse(content);
    if (document.is_object()) {
      return document;
    }
  } catch (const nlohmann::json::parse_error& ex) {
    logging::get()->warn("High score file '{}' is corrupt: {}", path.string(), ex.what());
    return nlohmann::json::object();
  }
  logging::get()->warn("High score file '{}' is not a JSON object", path.string());
  return nlohmann::json::object();
}

} // namespace

int InMemoryHighScoreStore::get(const std::string& key, int fallback) const {
  auto it = values_.find(key);
  return it == values_.end() ? fallback : it->second;
}

void InMemoryHighScoreStore::set(const std::string& key, int value) {
  values_[key] = value;
}

JsonFileHighScoreStore::JsonFileHighScoreStore(std::filesystem::path path) : path_(std::move(path)) {}

int JsonFileHighScoreStore::get(const std::string& key, int fallback) const {
  const auto document = read_document(path_);
  auto it = document.find(key);
  if (it == document.end() || !it->is_number_integer()) {
    return fallback;
  }
  return it->get<int>();
}

void JsonFileHighScoreStore::set(const std::string& key, int value) {
  auto document = read_document(path_);
  document[key] = value;

  std::error_code ec;
  if (path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path(), ec);
  }

  auto temp = path_;
  temp += ".tmp";
  {
    std::ofstream stream(temp, std::ios::trunc);
    if (!stream) {
      throw std::runtime_error("Failed to open high score file for writing: " + temp.string());
    }
    stream << document.dump(2);
    if (!stream) {
      throw std::runtime_error("Failed to write high score file: " + temp.string());
    }
  }
  std::filesystem::rename(temp, path_, ec);
  if (ec) {
    throw std::runtime_error("Failed to replace high score file " + path_.string() + ": " +
                             ec.message());
  }
}

HighScoreResult update_high_score(HighScoreStore& store, int score) {
  HighScoreResult result;
  const int current = store.get(kHighScoreKey, 0);
  if (score > current) {
    store.set(kHighScoreKey, score);
    result.high_score = score;
    result.new_record = true;
    logging::get()->info("New high score: {}", score);
  } else {
    result.high_score = current;
  }
  return result;
}

} // namespace cookie
