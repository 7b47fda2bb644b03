#pragma once

#include "enums/PurchaseErrorCode.hpp"
#include <stdexcept>
#include <string>

namespace cinema::domain {

/**
 * @brief Исключение, выбрасываемое при отклонении заказа
 *
 * what() содержит человекочитаемое описание,
 * getErrorCode(): код нарушенного правила для программной обработки.
 */
class InvalidPurchaseException : public std::runtime_error {
public:
    InvalidPurchaseException(PurchaseErrorCode errorCode, const std::string& message)
        : std::runtime_error(message)
        , errorCode_(errorCode) {}

    PurchaseErrorCode getErrorCode() const { return errorCode_; }

private:
    PurchaseErrorCode errorCode_;
};

} // namespace cinema::domain
