#pragma once

#include "enums/TicketType.hpp"
#include <map>

namespace cinema::domain {

/// Максимум мест, которые можно занять одной покупкой
inline constexpr int MAX_TICKETS_PER_PURCHASE = 20;

/**
 * @brief Таблица цен по категориям билетов
 *
 * Создаётся один раз при первом обращении и больше не меняется.
 */
inline const std::map<TicketType, int>& ticketPrices() {
    static const std::map<TicketType, int> prices = {
        {TicketType::INFANT, 0},
        {TicketType::CHILD, 10},
        {TicketType::ADULT, 20}
    };
    return prices;
}

/**
 * @brief Цена одного билета категории
 * @return 0 для категории, которой нет в таблице
 */
inline int unitPrice(TicketType type) {
    const auto& prices = ticketPrices();
    auto it = prices.find(type);
    return it != prices.end() ? it->second : 0;
}

} // namespace cinema::domain
