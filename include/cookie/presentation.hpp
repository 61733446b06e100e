#pragma once

#include <string>

namespace cookie {

/// Numbers shown on the GameOver / PracticeComplete screens.
struct ResultsView {
  int final_score = 0;
  double accuracy = 0.0;
  std::string grade;
  int high_score = 0;
  bool new_high_score = false;
  bool practice = false;
};

/**
 * Presentation: what the core asks of the UI and audio layer. Screen, music
 * and clip names are plain strings ("MainMenuScreen", "MenuMusic",
 * "Victory", ...). Implementations must not call back into GameFlow.
 */
class Presentation {
public:
  virtual ~Presentation() = default;

  virtual void show_screen(const std::string& name) = 0;
  virtual void hide_screen(const std::string& name) = 0;
  virtual void play_music(const std::string& track) = 0;
  virtual void stop_music() = 0;
  virtual void play_sfx(const std::string& clip) = 0;
  virtual void show_results(const ResultsView& results) = 0;
};

/// Headless presentation: ignores every request.
class NullPresentation : public Presentation {
public:
  void show_screen(const std::string&) override {}
  void hide_screen(const std::string&) override {}
  void play_music(const std::string&) override {}
  void stop_music() override {}
  void play_sfx(const std::string&) override {}
  void show_results(const ResultsView&) override {}
};

} // namespace cookie
