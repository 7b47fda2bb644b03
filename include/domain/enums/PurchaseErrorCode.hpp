#pragma once

#include <string>

namespace cinema::domain {

/**
 * @brief Код причины отказа в покупке
 *
 * Каждой покупке соответствует не более одного кода: проверки
 * прерываются на первом нарушенном правиле.
 */
enum class PurchaseErrorCode {
    INVALID_ACCOUNT_ID,       ///< accountId <= 0
    MISSING_TICKET_REQUEST,   ///< Пустой список позиций
    INVALID_TICKET_QUANTITY,  ///< Отрицательное количество в позиции
    MAX_TICKETS_EXCEEDED,     ///< Превышен лимит мест на покупку
    MISSING_ADULT_TICKET      ///< Детские/младенческие билеты без взрослого
};

inline std::string toString(PurchaseErrorCode code) {
    switch (code) {
        case PurchaseErrorCode::INVALID_ACCOUNT_ID:      return "INVALID_ACCOUNT_ID";
        case PurchaseErrorCode::MISSING_TICKET_REQUEST:  return "MISSING_TICKET_REQUEST";
        case PurchaseErrorCode::INVALID_TICKET_QUANTITY: return "INVALID_TICKET_QUANTITY";
        case PurchaseErrorCode::MAX_TICKETS_EXCEEDED:    return "MAX_TICKETS_EXCEEDED";
        case PurchaseErrorCode::MISSING_ADULT_TICKET:    return "MISSING_ADULT_TICKET";
    }
    return "UNKNOWN";
}

} // namespace cinema::domain
