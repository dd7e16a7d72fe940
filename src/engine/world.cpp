/// @file world.cpp
/// @brief EngineWorld implementation

#include <drape_engine/engine/world.hpp>
#include <drape_engine/core/log.hpp>

#include <algorithm>

namespace drape_engine {

EngineWorld::~EngineWorld() {
    // Detach in reverse dispatch order
    for (auto it = m_systems.rbegin(); it != m_systems.rend(); ++it) {
        (*it)->removed = true;
        (*it)->system->on_detach();
    }
}

// =============================================================================
// Registration
// =============================================================================

drape_core::Result<std::string> EngineWorld::add_system(
    std::shared_ptr<ISystem> system, const SystemOptions& options) {
    if (!system) {
        auto err = drape_core::SystemError::null_system();
        drape_core::engine_logger()->error("{}", err.message);
        return drape_core::Err<std::string>(err);
    }

    for (const auto& entry : m_systems) {
        if (entry->system == system) {
            auto err = drape_core::SystemError::duplicate_instance(entry->id);
            drape_core::engine_logger()->error("{}", err.message);
            return drape_core::Err<std::string>(err);
        }
    }

    std::string id = resolve_id(*system, options);
    for (const auto& entry : m_systems) {
        if (entry->id == id) {
            auto err = drape_core::SystemError::duplicate_id(id);
            drape_core::engine_logger()->error("{}", err.message);
            return drape_core::Err<std::string>(err);
        }
    }

    const SystemDescriptor& desc = system->descriptor();
    auto entry = std::make_shared<Entry>();
    entry->id = id;
    entry->system = system;
    entry->priority = options.priority.value_or(desc.priority);
    entry->allow_while_paused = options.allow_while_paused.value_or(desc.allow_while_paused);

    m_systems.push_back(entry);
    std::stable_sort(m_systems.begin(), m_systems.end(),
        [](const std::shared_ptr<Entry>& a, const std::shared_ptr<Entry>& b) {
            return a->priority > b->priority;
        });

    drape_core::engine_logger()->debug("System '{}' registered (priority {}, while paused {})",
        id, entry->priority, entry->allow_while_paused);

    system->on_attach(*this);
    return drape_core::Ok(id);
}

bool EngineWorld::remove_system(const std::string& id) {
    auto it = std::find_if(m_systems.begin(), m_systems.end(),
        [&id](const std::shared_ptr<Entry>& e) { return e->id == id; });
    if (it == m_systems.end()) {
        return false;
    }

    std::shared_ptr<Entry> entry = *it;
    m_systems.erase(it);
    entry->removed = true;
    entry->system->on_detach();

    drape_core::engine_logger()->debug("System '{}' removed", id);
    return true;
}

std::shared_ptr<ISystem> EngineWorld::get_system(const std::string& id) const {
    for (const auto& entry : m_systems) {
        if (entry->id == id) {
            return entry->system;
        }
    }
    return nullptr;
}

std::vector<std::string> EngineWorld::system_ids() const {
    std::vector<std::string> ids;
    ids.reserve(m_systems.size());
    for (const auto& entry : m_systems) {
        ids.push_back(entry->id);
    }
    return ids;
}

std::string EngineWorld::resolve_id(const ISystem& system, const SystemOptions& options) {
    if (options.id && !options.id->empty()) {
        return *options.id;
    }
    const std::string& name = system.descriptor().name;
    if (!name.empty()) {
        return name;
    }
    m_id_counter += 1;
    return "system-" + std::to_string(m_id_counter);
}

// =============================================================================
// Dispatch
// =============================================================================

void EngineWorld::step(float dt) {
    const auto snapshot = m_systems;
    for (const auto& entry : snapshot) {
        if (entry->removed) {
            continue;
        }
        if (m_paused && !entry->allow_while_paused) {
            continue;
        }
        entry->system->fixed_update(dt);
    }
}

void EngineWorld::frame(float dt) {
    const auto snapshot = m_systems;
    for (const auto& entry : snapshot) {
        if (entry->removed) {
            continue;
        }
        entry->system->frame_update(dt);
    }
}

} // namespace drape_engine
