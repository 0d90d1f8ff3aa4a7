#include "EventQueue.hpp"
#include <iterator>

const char* toString(EventType type) {
    switch (type) {
        case EventType::OpenFolder: return "OpenFolder";
        case EventType::PlayIndex: return "PlayIndex";
        case EventType::Next: return "Next";
        case EventType::Previous: return "Previous";
        case EventType::TrackEnded: return "TrackEnded";
        case EventType::ToggleShuffle: return "ToggleShuffle";
        case EventType::Reshuffle: return "Reshuffle";
        case EventType::ToggleLoop: return "ToggleLoop";
        case EventType::PositionUpdated: return "PositionUpdated";
        case EventType::TogglePause: return "TogglePause";
        case EventType::SeekRelative: return "SeekRelative";
        case EventType::RestartTrack: return "RestartTrack";
        case EventType::SetVolume: return "SetVolume";
        case EventType::AdjustVolume: return "AdjustVolume";
        case EventType::ZoomIn: return "ZoomIn";
        case EventType::ZoomOut: return "ZoomOut";
        case EventType::ZoomReset: return "ZoomReset";
        case EventType::TimerTick: return "TimerTick";
        case EventType::Close: return "Close";
    }
    return "Unknown";
}

void EventQueue::push(AppEvent event) {
    std::lock_guard<std::mutex> l(mutex);
    events.push_back(std::move(event));
}

bool EventQueue::pop(AppEvent& out) {
    std::lock_guard<std::mutex> l(mutex);
    if (events.empty()) return false;
    out = std::move(events.front());
    events.pop_front();
    return true;
}

std::vector<AppEvent> EventQueue::drain() {
    std::lock_guard<std::mutex> l(mutex);
    std::vector<AppEvent> out(std::make_move_iterator(events.begin()), std::make_move_iterator(events.end()));
    events.clear();
    return out;
}

bool EventQueue::empty() const {
    std::lock_guard<std::mutex> l(mutex);
    return events.empty();
}

size_t EventQueue::size() const {
    std::lock_guard<std::mutex> l(mutex);
    return events.size();
}
