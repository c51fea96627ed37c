#pragma once

#include "domain/events/DomainEvent.hpp"
#include "domain/events/StoredEvent.hpp"
#include "ports/output/IProjector.hpp"
#include "utils/CancellationToken.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace eventstore::ports::input {

/**
 * @brief Интерфейс управления проекциями (read-моделями)
 *
 * Input Port: доставка событий проекторам и перестроение проекций
 * из журнала.
 */
class IProjectionService {
public:
    virtual ~IProjectionService() = default;

    /**
     * @throws std::invalid_argument если проектор с таким именем уже есть
     */
    virtual void registerProjector(std::shared_ptr<output::IProjector> projector) = 0;

    virtual void registerProjectors(const std::vector<std::shared_ptr<output::IProjector>>& projectors) = 0;

    /**
     * @brief Доставить событие всем проекторам, обрабатывающим его тип
     * @throws ProjectionFailedException первая ошибка проектора
     */
    virtual void projectEvent(const domain::EventPtr& event) = 0;

    virtual void projectEvents(const std::vector<domain::EventPtr>& events) = 0;

    /**
     * @brief Доставить только что записанные конверты
     *
     * Конверт с sequence <= позиции проектора пропускается, поэтому
     * повторная доставка безопасна.
     */
    virtual void projectStoredEvents(const std::vector<domain::StoredEvent>& events) = 0;

    /**
     * @brief Перестроить одну проекцию: reset + проход по журналу
     *
     * @throws ProjectorNotFoundException неизвестное имя
     * @throws RebuildCancelledException токен взведён
     * @throws ProjectionFailedException проектор бросил исключение
     */
    virtual void rebuild(const std::string& projectorName, const utils::CancellationToken& token) = 0;

    /**
     * @brief Перестроить все проекции одним проходом по журналу
     */
    virtual void rebuildAll(const utils::CancellationToken& token) = 0;

    virtual std::vector<std::shared_ptr<output::IProjector>> getProjectors() const = 0;

    virtual std::shared_ptr<output::IProjector> getProjector(const std::string& name) const = 0;

    /**
     * @brief Sequence последнего конверта, доставленного проектору
     */
    virtual int64_t getPosition(const std::string& name) const = 0;
};

} // namespace eventstore::ports::input
