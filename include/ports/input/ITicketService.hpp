#pragma once

#include "domain/TicketTypeRequest.hpp"
#include "domain/InvalidPurchaseException.hpp"
#include "domain/PurchaseOutcome.hpp"
#include <cstdint>
#include <vector>

namespace cinema::ports::input {

/**
 * @brief Интерфейс сервиса покупки билетов
 */
class ITicketService {
public:
    virtual ~ITicketService() = default;

    /**
     * @brief Купить билеты
     *
     * При успехе списывает оплату и резервирует места, ничего не возвращает.
     *
     * @param accountId ID аккаунта покупателя (> 0)
     * @param ticketTypeRequests Позиции заказа (хотя бы одна)
     * @throws domain::InvalidPurchaseException если заказ не прошёл проверку
     */
    virtual void purchaseTickets(
        int64_t accountId,
        const std::vector<domain::TicketTypeRequest>& ticketTypeRequests) = 0;

    /**
     * @brief Рассчитать заказ без оплаты и бронирования
     *
     * Те же правила, что и у purchaseTickets; порты не вызываются.
     *
     * @throws domain::InvalidPurchaseException если заказ не прошёл проверку
     */
    virtual domain::PurchaseOutcome quoteTickets(
        int64_t accountId,
        const std::vector<domain::TicketTypeRequest>& ticketTypeRequests) const = 0;
};

} // namespace cinema::ports::input
