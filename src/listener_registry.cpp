#include "listener_registry.hpp"

#include <exception>
#include <iostream>

namespace eventsource {

void ListenerRegistry::add_listener(const std::string& type, EventCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_[type].push_back(std::move(callback));
}

void ListenerRegistry::add_open_listener(OpenCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    open_listeners_.push_back(std::move(callback));
}

void ListenerRegistry::dispatch(const Event& event) const {
    // Copy listeners out under lock, then call without lock held.
    std::vector<EventCallback> to_call;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = listeners_.find(event.type);
        if (it == listeners_.end()) return;
        to_call = it->second;
    }
    for (const auto& listener : to_call) {
        try {
            listener(event);
        } catch (const std::exception& e) {
            std::cerr << "[eventsource] listener for '" << event.type
                      << "' threw: " << e.what() << "\n";
        }
    }
}

void ListenerRegistry::dispatch_open() const {
    std::vector<OpenCallback> to_call;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        to_call = open_listeners_;
    }
    for (const auto& listener : to_call) {
        try {
            listener();
        } catch (const std::exception& e) {
            std::cerr << "[eventsource] open listener threw: " << e.what() << "\n";
        }
    }
}

size_t ListenerRegistry::listener_count(const std::string& type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = listeners_.find(type);
    if (it == listeners_.end()) return 0;
    return it->second.size();
}

size_t ListenerRegistry::open_listener_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_listeners_.size();
}

} // namespace eventsource
