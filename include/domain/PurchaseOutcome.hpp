#pragma once

#include <cstdint>

namespace cinema::domain {

/**
 * @brief Итог проверки заказа: сколько списать и сколько мест занять
 */
struct PurchaseOutcome {
    int64_t accountId = 0;
    int totalPrice = 0;   ///< Сумма к оплате
    int totalSeats = 0;   ///< Взрослые + детские, младенцы не учитываются

    bool operator==(const PurchaseOutcome& other) const {
        return accountId == other.accountId
            && totalPrice == other.totalPrice
            && totalSeats == other.totalSeats;
    }
};

} // namespace cinema::domain
