#pragma once

#include <string>
#include <cstdlib>

namespace cinema::settings {

/**
 * @brief Настройки приложения из ENV
 *
 * - ORDERS_FILE     : файл с заказами (пусто = stdin)
 * - PAYMENT_FAIL    : "1"/"true": платёжный шлюз отвечает ошибкой
 * - RESERVATION_FAIL: "1"/"true": бронирование отвечает ошибкой
 */
class AppSettings {
public:
    AppSettings() {
        ordersFile_ = getEnvOrDefault("ORDERS_FILE", "");
        paymentFail_ = isTruthy(getEnvOrDefault("PAYMENT_FAIL", "0"));
        reservationFail_ = isTruthy(getEnvOrDefault("RESERVATION_FAIL", "0"));
    }

    std::string getOrdersFile() const { return ordersFile_; }
    bool isPaymentFailing() const { return paymentFail_; }
    bool isReservationFailing() const { return reservationFail_; }

    /// Аргумент командной строки имеет приоритет над ORDERS_FILE
    void setOrdersFile(const std::string& path) { ordersFile_ = path; }

private:
    std::string ordersFile_;
    bool paymentFail_ = false;
    bool reservationFail_ = false;

    static std::string getEnvOrDefault(const char* name, const std::string& defaultValue) {
        const char* value = std::getenv(name);
        return value ? value : defaultValue;
    }

    static bool isTruthy(const std::string& value) {
        return value == "1" || value == "true" || value == "TRUE";
    }
};

} // namespace cinema::settings
