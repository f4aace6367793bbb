#include "UI.hpp"

#include <algorithm>
#include <ftxui/dom/elements.hpp>
#include <utility>

#include "IOManager.hpp"
#include "utils.hpp"

using namespace ftxui;

UI::UI(const Config& config, std::vector<fs::path> files)
    : m_screen(ScreenInteractive::Fullscreen()),
      m_config(config),
      m_processor(m_config),
      m_files(std::move(files)),
      m_status_text("Ready.") {}

void UI::append_activity(std::string_view line) {
  {
    std::scoped_lock lock(m_activity_mutex);
    m_activity.emplace_back(line);
    while (m_activity.size() > kActivityLines) {
      m_activity.pop_front();
    }
  }
  m_screen.Post(Event::Custom);
}

void UI::refresh_preview() {
  m_preview = m_processor.preview(m_files);
  m_selections.assign(m_preview.size(), true);
  m_cursor = 0;

  if (m_preview.empty()) {
    m_status_text = "No files left to organize.";
    return;
  }
  const auto unrecognised =
      std::count_if(m_preview.begin(), m_preview.end(),
                    [](const PlannedMove& move) { return !move.plan; });
  m_status_text = std::format(
      "{} files, {} with an unrecognised name. Space toggles, Enter applies.",
      m_preview.size(), unrecognised);
}

bool UI::handle_preview_key(const Event& event) {
  if (m_busy || event.is_mouse() || m_preview.empty()) {
    return false;
  }
  const int last = static_cast<int>(m_preview.size()) - 1;
  if (event == Event::ArrowUp) {
    m_cursor = std::max(m_cursor - 1, 0);
  } else if (event == Event::ArrowDown) {
    m_cursor = std::min(m_cursor + 1, last);
  } else if (event == Event::Character(' ')) {
    m_selections[m_cursor] = !m_selections[m_cursor];
  } else if (event == Event::Return) {
    apply_selection();
  } else {
    return false;
  }
  return true;
}

Element UI::render_preview() const {
  if (m_preview.empty()) {
    return text(m_status_text) | center;
  }
  Elements rows;
  rows.reserve(m_preview.size());
  for (size_t i = 0; i < m_preview.size(); ++i) {
    const PlannedMove& move = m_preview[i];
    const std::string name = safe_path_to_string(move.from.filename());
    const std::string target =
        move.plan ? safe_path_to_string(move.plan->destination.parent_path())
                  : "skip: " + move.error;
    Element row = hbox({text(m_selections[i] ? "[x] " : "[ ] "),
                        text(name) | size(WIDTH, LESS_THAN, 60), text("  ->  "),
                        text(target) | dim});
    if (!move.plan) row = row | color(Color::Yellow);
    if (static_cast<int>(i) == m_cursor) row = row | inverted | focus;
    rows.push_back(std::move(row));
  }
  return vbox(std::move(rows)) | vscroll_indicator | yframe;
}

Element UI::render_details() const {
  if (m_preview.empty()) {
    return text("");
  }
  const PlannedMove& move = m_preview[m_cursor];
  if (!move.metadata) {
    return hbox({text(" Not recognised: ") | bold, text(move.error)});
  }
  const ScreenshotMetadata& meta = *move.metadata;
  return hbox({text(" Date ") | bold, text(meta.capture_date),
               text("  Character ") | bold, text(meta.character_name),
               text("  Event ") | bold, text(meta.event_type)});
}

Element UI::render_activity() {
  Elements lines;
  std::scoped_lock lock(m_activity_mutex);
  for (const auto& line : m_activity) {
    lines.push_back(text(line) | dim);
  }
  // Pin the view to the newest line.
  auto body = vbox(std::move(lines)) | focusPositionRelative(0, 1) | yframe;
  return window(text(" Activity "), body) | size(HEIGHT, EQUAL, 8);
}

void UI::report_result(const BatchResult& result) {
  // Whatever was moved no longer exists at its old path.
  std::erase_if(m_files, [&](const fs::path& file) {
    return std::any_of(result.entries.begin(), result.entries.end(),
                       [&](const LogEntry& entry) {
                         return entry.outcome == Outcome::Moved &&
                                entry.source_path == file;
                       });
  });
  refresh_preview();

  m_status_text =
      std::format("Done. Moved {}, skipped {}, errors {}.",
                  result.moved_count(), result.skipped_count(),
                  result.errored_count());
  if (result.log_path) {
    m_status_text += std::format(" Log: {}",
                                 safe_path_to_string(*result.log_path));
  }
  if (result.log_write_error) {
    m_status_text += " Warning: " + result.log_write_error->message;
  }
}

void UI::apply_selection() {
  if (m_busy) return;

  std::vector<fs::path> chosen;
  for (size_t i = 0; i < m_preview.size(); ++i) {
    if (m_selections[i]) chosen.push_back(m_preview[i].from);
  }
  if (chosen.empty()) {
    m_status_text = "Nothing selected to apply.";
    return;
  }

  m_status_text = std::format("Organizing {} files...", chosen.size());
  m_busy = true;
  // The previous batch has already cleared m_busy, so this join is immediate.
  m_batch_thread = std::jthread([self = shared_from_this(),
                                 files = std::move(chosen)] {
    try {
      BatchResult result = self->m_processor.process_batch(files);
      if (!self->m_config.journal_path.empty()) {
        IOManager::save_journal(self->m_config.journal_path,
                                IOManager::journal_from_result(result));
      }
      self->m_screen.Post([self, result = std::move(result)] {
        self->report_result(result);
      });
    } catch (const std::exception& e) {
      IOManager::log(std::format("Batch aborted: {}", e.what()));
      self->m_screen.Post([self, reason = std::string(e.what())] {
        self->m_status_text = "Organizing failed: " + reason;
      });
    }
    self->m_busy = false;
  });
}

void UI::run() {
  IOManager::set_log_handler(
      [this](std::string_view line) { append_activity(line); });
  refresh_preview();

  auto preview = Renderer([this] { return render_preview(); }) |
                 CatchEvent([this](Event event) {
                   return handle_preview_key(event);
                 });
  auto refresh = Button(" Refresh ", [this] {
    if (!m_busy) refresh_preview();
  });
  auto apply = Button(" Apply (Enter) ", [this] {
    if (!m_preview.empty()) apply_selection();
  });
  auto quit = Button(" Quit ", m_screen.ExitLoopClosure());
  auto controls = Container::Horizontal({refresh, apply, quit});
  auto root = Container::Vertical({preview, controls});

  auto layout = Renderer(root, [&, this] {
    const bool busy = m_busy;
    auto header = hbox({text(" Screenshot Sorter ") | bold, filler(),
                        text(std::format("{} files ", m_files.size()))}) |
                  inverted;
    auto buttons = hbox({refresh->Render(), apply->Render(), quit->Render()});
    if (busy || m_preview.empty()) buttons = buttons | dim;

    return vbox({header, preview->Render() | flex, separator(),
                 render_details(), separator(),
                 hbox({text(" " + m_status_text), filler(), buttons}),
                 render_activity()});
  });

  m_screen.Loop(layout);

  // A running batch is not interruptible; wait for it before unhooking.
  if (m_batch_thread.joinable()) {
    IOManager::log("Waiting for the running batch to finish...");
    m_batch_thread.join();
  }
  IOManager::set_log_handler(nullptr);
}
