#include "tether/network.hpp"
#include <mutex>

namespace tether {

// Global network factory
static std::mutex g_network_factory_mutex;
static std::shared_ptr<network_factory> g_network_factory;

void set_network_factory(std::shared_ptr<network_factory> factory) {
    std::lock_guard<std::mutex> lock(g_network_factory_mutex);
    g_network_factory = std::move(factory);
}

std::shared_ptr<network_factory> get_network_factory() {
    std::lock_guard<std::mutex> lock(g_network_factory_mutex);
    if (!g_network_factory) {
        // Offline until the platform layer registers a real factory
        g_network_factory = std::make_shared<null_network_factory>();
    }
    return g_network_factory;
}

} // namespace tether
