#pragma once

#include "ports/input/IProjectionService.hpp"
#include "ports/output/IEventStore.hpp"
#include "settings/EventStoreSettings.hpp"
#include <ThreadSafeMap.hpp>
#include <memory>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace eventstore::application {

/**
 * @brief Менеджер проекций: живая доставка и перестроение из журнала
 *
 * У каждого проектора свой мьютекс. Перестроение держит мьютексы только
 * перестраиваемых проекторов, поэтому доставка остальным не блокируется.
 *
 * Проход по журналу постраничный (getAllEvents по sequence, размер
 * страницы EVENT_PROJECTIONS_BATCH_SIZE). После перестроения живой
 * конверт с sequence не больше пройденного пропускается, если
 * сканирование его видело. Номера, пропущенные сканированием (транзакция
 * ещё не была зафиксирована или откатилась), запоминаются, и такой
 * конверт при живой доставке применяется.
 *
 * Конверты одного вызова projectStoredEvents доставляются по возрастанию
 * sequence. Между вызовами от разных writer'ов порядок не выравнивается.
 */
class ProjectionManager : public ports::input::IProjectionService {
public:
    ProjectionManager(
        std::shared_ptr<ports::output::IEventStore> eventStore,
        std::shared_ptr<settings::EventStoreSettings> settings
    );

    void registerProjector(std::shared_ptr<ports::output::IProjector> projector) override;
    void registerProjectors(const std::vector<std::shared_ptr<ports::output::IProjector>>& projectors) override;

    void projectEvent(const domain::EventPtr& event) override;
    void projectEvents(const std::vector<domain::EventPtr>& events) override;
    void projectStoredEvents(const std::vector<domain::StoredEvent>& events) override;

    void rebuild(const std::string& projectorName, const utils::CancellationToken& token) override;
    void rebuildAll(const utils::CancellationToken& token) override;

    std::vector<std::shared_ptr<ports::output::IProjector>> getProjectors() const override;
    std::shared_ptr<ports::output::IProjector> getProjector(const std::string& name) const override;
    int64_t getPosition(const std::string& name) const override;

    size_t getBatchSize() const { return batchSize_; }

private:
    struct ProjectorSlot {
        std::shared_ptr<ports::output::IProjector> projector;
        std::unordered_set<std::string> handledEvents;
        std::mutex mutex;
        int64_t position = 0;   ///< последний доставленный sequence
        int64_t watermark = 0;  ///< докуда дошло последнее перестроение
        std::set<int64_t> unscanned;  ///< номера <= watermark, которых не было в журнале при сканировании
    };
    using SlotPtr = std::shared_ptr<ProjectorSlot>;

    std::vector<SlotPtr> slotsFor(const std::string& eventType) const;
    SlotPtr requireSlot(const std::string& name) const;

    /**
     * @brief Вызвать проектор; вызывается под мьютексом слота
     * @throws ProjectionFailedException
     */
    static void deliver(ProjectorSlot& slot, const domain::DomainEvent& event, int64_t sequence);

    /**
     * @brief reset + сканирование журнала; мьютексы слотов уже захвачены
     */
    void rebuildSlots(const std::vector<SlotPtr>& slots,
                      const std::string& target,
                      const utils::CancellationToken& token);

    std::shared_ptr<ports::output::IEventStore> eventStore_;
    size_t batchSize_;

    ThreadSafeMap<std::string, ProjectorSlot> slots_;

    mutable std::shared_mutex indexMutex_;
    std::unordered_map<std::string, std::vector<SlotPtr>> slotsByType_;
};

} // namespace eventstore::application
