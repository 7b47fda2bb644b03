#pragma once

#include "domain/TicketTypeRequest.hpp"
#include "domain/TicketPrices.hpp"
#include "domain/PurchaseOutcome.hpp"
#include "domain/InvalidPurchaseException.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace cinema::application {

/**
 * @brief Проверка и расчёт заказа без побочных эффектов
 *
 * Правила (первое нарушенное прерывает проверку):
 * - accountId > 0
 * - есть хотя бы одна позиция
 * - количество в каждой позиции >= 0
 * - накопленное число мест + количество текущей позиции <= MAX_TICKETS_PER_PURCHASE
 * - детские и младенческие билеты только вместе со взрослым
 *
 * Лимит проверяется по каждой позиции против накопленного числа МЕСТ:
 * младенцы сравниваются с остатком, но сами в сумму мест не попадают.
 *
 * Состояния не хранит, можно вызывать из нескольких потоков.
 */
class PurchaseValidator {
public:
    /**
     * @brief Проверить заказ и посчитать сумму и места
     * @throws domain::InvalidPurchaseException при первом нарушенном правиле
     */
    domain::PurchaseOutcome validate(
        int64_t accountId,
        const std::vector<domain::TicketTypeRequest>& ticketTypeRequests) const
    {
        validatePurchaseRequest(accountId, ticketTypeRequests);

        domain::PurchaseOutcome outcome;
        outcome.accountId = accountId;

        bool hasAdultTicket = false;
        bool hasChildOrInfantTicket = false;

        for (const auto& request : ticketTypeRequests) {
            const int numTickets = request.getNoOfTickets();
            const domain::TicketType type = request.getTicketType();

            if (numTickets < 0) {
                throw domain::InvalidPurchaseException(
                    domain::PurchaseErrorCode::INVALID_TICKET_QUANTITY,
                    "Invalid ticket quantity: " + std::to_string(numTickets));
            }

            // totalSeats <= MAX_TICKETS_PER_PURCHASE, вычитание не переполняется
            if (numTickets > domain::MAX_TICKETS_PER_PURCHASE - outcome.totalSeats) {
                throw domain::InvalidPurchaseException(
                    domain::PurchaseErrorCode::MAX_TICKETS_EXCEEDED,
                    "Maximum " + std::to_string(domain::MAX_TICKETS_PER_PURCHASE) +
                    " tickets can be purchased at a time");
            }

            outcome.totalPrice += numTickets * domain::unitPrice(type);

            if (type == domain::TicketType::ADULT) {
                hasAdultTicket = true;
            } else {
                hasChildOrInfantTicket = true;
            }

            if (domain::occupiesSeat(type)) {
                outcome.totalSeats += numTickets;
            }
        }

        if (hasChildOrInfantTicket && !hasAdultTicket) {
            throw domain::InvalidPurchaseException(
                domain::PurchaseErrorCode::MISSING_ADULT_TICKET,
                "Child or infant tickets cannot be purchased without an adult ticket");
        }

        return outcome;
    }

private:
    static void validatePurchaseRequest(
        int64_t accountId,
        const std::vector<domain::TicketTypeRequest>& ticketTypeRequests)
    {
        if (accountId <= 0) {
            throw domain::InvalidPurchaseException(
                domain::PurchaseErrorCode::INVALID_ACCOUNT_ID,
                "Invalid AccountId. An AccountId should be greater than zero");
        }

        if (ticketTypeRequests.empty()) {
            throw domain::InvalidPurchaseException(
                domain::PurchaseErrorCode::MISSING_TICKET_REQUEST,
                "At least one ticket type request is required");
        }
    }
};

} // namespace cinema::application
