#pragma once

#include <atomic>
#include <deque>
#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "BatchProcessor.hpp"

// Interactive front-end: lists the planned moves, lets the user untick
// files, then runs the batch off the UI thread.
class UI : public std::enable_shared_from_this<UI> {
 public:
  UI(const Config& config, std::vector<fs::path> files);
  void run();

 private:
  static constexpr size_t kActivityLines = 100;

  void refresh_preview();
  void apply_selection();
  void report_result(const BatchResult& result);
  bool handle_preview_key(const ftxui::Event& event);
  ftxui::Element render_preview() const;
  ftxui::Element render_details() const;
  ftxui::Element render_activity();
  void append_activity(std::string_view line);

  ftxui::ScreenInteractive m_screen;
  Config m_config;
  BatchProcessor m_processor;

  std::vector<fs::path> m_files;
  std::vector<PlannedMove> m_preview;
  std::vector<bool> m_selections;
  int m_cursor = 0;
  std::string m_status_text;

  std::mutex m_activity_mutex;
  std::deque<std::string> m_activity;

  // At most one batch at a time; m_busy guards the preview while it runs.
  std::jthread m_batch_thread;
  std::atomic<bool> m_busy = false;
};
