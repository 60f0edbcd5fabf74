#include "JsonlSink.hpp"
#include "supervisor/Logger.hpp"
#include <filesystem>
#include <fstream>
#include <system_error>

bool JsonlWriter::append(const std::string& line) {
    std::lock_guard<std::mutex> lock(mtx);
    std::error_code ec;
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);
    std::ofstream f(path, std::ios::app);
    if (!f) {
        logWarn("Jsonl", "unable to open " + path);
        return false;
    }
    f << line << '\n';
    return static_cast<bool>(f);
}

void JsonlEventSink::publish(const Event& ev) {
    nlohmann::json j = eventToJson(ev);
    j["type"] = "event";
    writer.append(j.dump());
}

void OutboxNotifier::notify(const Event& ev) {
    nlohmann::json j = eventToJson(ev);
    j["type"] = "notification";
    j.erase("detections");
    if (writer.append(j.dump())) {
        logInfo("Notify", ev.id + " queued for delivery");
    }
}
