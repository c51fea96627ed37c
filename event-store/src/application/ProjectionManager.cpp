#include "application/ProjectionManager.hpp"
#include "domain/Exceptions.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace eventstore::application {

ProjectionManager::ProjectionManager(
    std::shared_ptr<ports::output::IEventStore> eventStore,
    std::shared_ptr<settings::EventStoreSettings> settings)
    : eventStore_(std::move(eventStore))
    , batchSize_(settings->getProjectionBatchSize())
{
    std::cout << "[ProjectionManager] Initialized, batch size " << batchSize_ << std::endl;
}

// ============================================================================
// REGISTRATION
// ============================================================================

void ProjectionManager::registerProjector(std::shared_ptr<ports::output::IProjector> projector) {
    if (!projector) {
        throw std::invalid_argument("Cannot register null projector");
    }

    auto slot = std::make_shared<ProjectorSlot>();
    slot->projector = projector;
    for (const auto& type : projector->getHandledEvents()) {
        slot->handledEvents.insert(type);
    }

    const std::string name = projector->getName();
    if (!slots_.insertIfAbsent(name, slot)) {
        throw std::invalid_argument("Projector already registered: " + name);
    }

    {
        std::unique_lock<std::shared_mutex> lock(indexMutex_);
        for (const auto& type : slot->handledEvents) {
            slotsByType_[type].push_back(slot);
        }
    }

    std::cout << "[ProjectionManager] Registered projector " << name
              << " (" << slot->handledEvents.size() << " event type(s))" << std::endl;
}

void ProjectionManager::registerProjectors(
    const std::vector<std::shared_ptr<ports::output::IProjector>>& projectors) {
    for (const auto& projector : projectors) {
        registerProjector(projector);
    }
}

// ============================================================================
// LIVE DELIVERY
// ============================================================================

void ProjectionManager::projectEvent(const domain::EventPtr& event) {
    if (!event) {
        throw std::invalid_argument("Cannot project null event");
    }
    for (const auto& slot : slotsFor(event->eventType)) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        deliver(*slot, *event, 0);
    }
}

void ProjectionManager::projectEvents(const std::vector<domain::EventPtr>& events) {
    for (const auto& event : events) {
        projectEvent(event);
    }
}

void ProjectionManager::projectStoredEvents(const std::vector<domain::StoredEvent>& events) {
    std::vector<domain::StoredEvent> ordered(events);
    std::stable_sort(ordered.begin(), ordered.end(),
        [](const domain::StoredEvent& a, const domain::StoredEvent& b) {
            return a.sequenceNumber < b.sequenceNumber;
        });

    for (const auto& stored : ordered) {
        for (const auto& slot : slotsFor(stored.getEventType())) {
            std::lock_guard<std::mutex> lock(slot->mutex);
            if (stored.sequenceNumber <= slot->watermark) {
                auto gap = slot->unscanned.find(stored.sequenceNumber);
                if (gap == slot->unscanned.end()) {
                    continue;
                }
                std::cout << "[ProjectionManager] " << slot->projector->getName()
                          << ": applying sequence " << stored.sequenceNumber
                          << " missed by the last rebuild" << std::endl;
                slot->unscanned.erase(gap);
            }
            deliver(*slot, *stored.event, stored.sequenceNumber);
            slot->position = std::max(slot->position, stored.sequenceNumber);
        }
    }
}

// ============================================================================
// REBUILD
// ============================================================================

void ProjectionManager::rebuild(const std::string& projectorName, const utils::CancellationToken& token) {
    auto slot = requireSlot(projectorName);
    std::lock_guard<std::mutex> lock(slot->mutex);
    rebuildSlots({slot}, projectorName, token);
}

void ProjectionManager::rebuildAll(const utils::CancellationToken& token) {
    auto entries = slots_.getAll();
    // Единый порядок захвата мьютексов исключает взаимоблокировку
    std::sort(entries.begin(), entries.end(),
        [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<SlotPtr> slots;
    std::vector<std::unique_lock<std::mutex>> locks;
    for (const auto& [name, slot] : entries) {
        locks.emplace_back(slot->mutex);
        slots.push_back(slot);
    }
    rebuildSlots(slots, "all projections", token);
}

void ProjectionManager::rebuildSlots(const std::vector<SlotPtr>& slots,
                                     const std::string& target,
                                     const utils::CancellationToken& token) {
    std::cout << "[ProjectionManager] Rebuilding " << target << "..." << std::endl;

    for (const auto& slot : slots) {
        slot->projector->reset();
        slot->position = 0;
        slot->watermark = 0;
        slot->unscanned.clear();
    }

    int64_t lastSequence = 0;
    size_t processed = 0;

    while (true) {
        if (token.isCancelled()) {
            std::cerr << "[ProjectionManager] Rebuild of " << target
                      << " cancelled after sequence " << lastSequence << std::endl;
            throw domain::RebuildCancelledException(target, lastSequence);
        }

        auto page = eventStore_->getAllEvents(lastSequence, batchSize_);
        if (page.empty()) {
            break;
        }

        for (const auto& stored : page) {
            if (token.isCancelled()) {
                std::cerr << "[ProjectionManager] Rebuild of " << target
                          << " cancelled after sequence " << lastSequence << std::endl;
                throw domain::RebuildCancelledException(target, lastSequence);
            }
            for (const auto& slot : slots) {
                for (int64_t missing = lastSequence + 1; missing < stored.sequenceNumber; ++missing) {
                    slot->unscanned.insert(missing);
                }
                if (slot->handledEvents.count(stored.getEventType())) {
                    deliver(*slot, *stored.event, stored.sequenceNumber);
                }
                slot->position = stored.sequenceNumber;
                slot->watermark = stored.sequenceNumber;
            }
            lastSequence = stored.sequenceNumber;
            ++processed;
        }

        std::cout << "[ProjectionManager] " << target << ": " << processed
                  << " event(s) scanned, last sequence " << lastSequence << std::endl;

        if (page.size() < batchSize_) {
            break;
        }
    }

    std::cout << "[ProjectionManager] Rebuilt " << target << " from " << processed
              << " event(s)" << std::endl;
}

void ProjectionManager::deliver(ProjectorSlot& slot, const domain::DomainEvent& event, int64_t sequence) {
    try {
        slot.projector->project(event);
    } catch (const std::exception& e) {
        const std::string name = slot.projector->getName();
        std::cerr << "[ProjectionManager] Projector " << name << " failed on " << event.eventType
                  << " (sequence " << sequence << "): " << e.what() << std::endl;
        throw domain::ProjectionFailedException(name, sequence, e.what());
    }
}

// ============================================================================
// QUERIES
// ============================================================================

std::vector<std::shared_ptr<ports::output::IProjector>> ProjectionManager::getProjectors() const {
    auto entries = slots_.getAll();
    std::sort(entries.begin(), entries.end(),
        [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<std::shared_ptr<ports::output::IProjector>> projectors;
    for (const auto& [name, slot] : entries) {
        projectors.push_back(slot->projector);
    }
    return projectors;
}

std::shared_ptr<ports::output::IProjector> ProjectionManager::getProjector(const std::string& name) const {
    return requireSlot(name)->projector;
}

int64_t ProjectionManager::getPosition(const std::string& name) const {
    auto slot = requireSlot(name);
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->position;
}

std::vector<ProjectionManager::SlotPtr> ProjectionManager::slotsFor(const std::string& eventType) const {
    std::shared_lock<std::shared_mutex> lock(indexMutex_);
    auto it = slotsByType_.find(eventType);
    return it == slotsByType_.end() ? std::vector<SlotPtr>{} : it->second;
}

ProjectionManager::SlotPtr ProjectionManager::requireSlot(const std::string& name) const {
    auto slot = slots_.find(name);
    if (!slot) {
        throw domain::ProjectorNotFoundException(name);
    }
    return slot;
}

} // namespace eventstore::application
