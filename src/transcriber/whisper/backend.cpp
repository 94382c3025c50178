#include "whisper/backend.hpp"

std::string_view task_name(Task task) {
    return task == Task::Translate ? "translate" : "transcribe";
}

std::optional<Task> parse_task(std::string_view name) {
    if (name == "transcribe") return Task::Transcribe;
    if (name == "translate") return Task::Translate;
    return std::nullopt;
}
