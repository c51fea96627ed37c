#pragma once

#include "domain/events/DomainEvent.hpp"
#include <string>
#include <vector>

namespace eventstore::ports::output {

/**
 * @brief Интерфейс проектора read-модели
 *
 * Проектор объявляет типы событий, которые он обрабатывает, и
 * строит денормализованное представление. reset() должен быть
 * идемпотентным: повторное перестроение просто начинается заново.
 */
class IProjector {
public:
    virtual ~IProjector() = default;

    /**
     * @brief Уникальное имя проекции
     */
    virtual std::string getName() const = 0;

    /**
     * @brief Типы событий, которые обрабатывает проектор
     */
    virtual std::vector<std::string> getHandledEvents() const = 0;

    /**
     * @brief Применить событие к read-модели
     */
    virtual void project(const domain::DomainEvent& event) = 0;

    /**
     * @brief Очистить read-модель
     */
    virtual void reset() = 0;
};

} // namespace eventstore::ports::output
