#include "agentboard/coordinator/notifier.hpp"

#include "agentboard/task/state_strings.hpp"
#include "agentboard/util/log.hpp"

#include <stdexcept>

namespace agentboard {

auto LoggingNotifier::on_transition(const TransitionEvent& event) -> void {
  log::info("Task {}: {} -> {} by {}{}{}", event.task_id, event.old_status,
            event.new_status, event.actor, event.note.empty() ? "" : ": ",
            event.note);
}

auto JournalNotifier::on_transition(const TransitionEvent& event) -> void {
  JournalEntry entry;
  entry.task_id = event.task_id.str();
  entry.old_status = std::string{task_status_name(event.old_status)};
  entry.new_status = std::string{task_status_name(event.new_status)};
  entry.actor = event.actor.str();
  entry.note = event.note;
  entry.timestamp = to_millis(event.timestamp);

  std::lock_guard lock(mu_);
  if (auto r = journal_.record(entry); !r) {
    throw std::runtime_error(r.error().message());
  }
}

}  // namespace agentboard
