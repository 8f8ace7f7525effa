#pragma once
#include <vector>
#include <unordered_map>
#include <functional>
#include <string>

// Event system for decoupled communication
class EventBus {
public:
    using EventHandler = std::function<void(const void* data)>;

    template<typename T>
    void subscribe(const std::string& event_type, std::function<void(const T&)> handler) {
        handlers_[event_type].push_back([handler](const void* data) {
            handler(*static_cast<const T*>(data));
        });
    }

    template<typename T>
    void emit(const std::string& event_type, const T& data) {
        auto it = handlers_.find(event_type);
        if (it != handlers_.end()) {
            for (auto& handler : it->second) {
                handler(&data);
            }
        }
    }

    bool has_subscribers(const std::string& event_type) const {
        auto it = handlers_.find(event_type);
        return it != handlers_.end() && !it->second.empty();
    }

    size_t get_subscriber_count(const std::string& event_type) const {
        auto it = handlers_.find(event_type);
        return it != handlers_.end() ? it->second.size() : 0;
    }

private:
    std::unordered_map<std::string, std::vector<EventHandler>> handlers_;
};

// Physics events
struct PhysicsUpdateEvent {
    float delta_time;
    size_t particle_count;
    size_t iteration_count;
};

struct BoundsUpdatedEvent {
    float min_x, min_y, min_z;
    float max_x, max_y, max_z;
    size_t valid_particles;
    size_t refresh_count;
};

struct BoundsRefreshFailedEvent {
    std::string reason;
    size_t failure_count;
};

struct SimulationDisposedEvent {
    size_t iteration_count;
    size_t textures_released;
};

// Event type constants to avoid string typos
namespace Events {
    constexpr const char* PHYSICS_UPDATE = "physics_update";
    constexpr const char* BOUNDS_UPDATED = "bounds_updated";
    constexpr const char* BOUNDS_REFRESH_FAILED = "bounds_refresh_failed";
    constexpr const char* SIMULATION_DISPOSED = "simulation_disposed";
}
