#pragma once

#include "ports/input/ITicketService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <cstdint>
#include <string>
#include <vector>
#include <stdexcept>
#include <limits>
#include <iostream>

namespace cinema::adapters::primary
{

    /**
     * @brief Ответ на заказ: статус в терминах HTTP и JSON-тело
     */
    struct PurchaseResponse
    {
        int status = 200;
        std::string body;
    };

    /**
     * @brief Приём заказа в JSON
     *
     * Формат запроса:
     * ```json
     * {"account_id": 123, "tickets": [{"type": "ADULT", "quantity": 2}]}
     * ```
     *
     * Отсутствующий account_id читается как 0, отсутствующий или null tickets
     * читается как пустой список. Эти случаи отклоняет сам сервис со своим кодом ошибки.
     * quantity должно быть целым числом в диапазоне int, иначе 400.
     *
     * Заказ сначала рассчитывается сервисом (quoteTickets), затем покупается:
     * отказ по правилам приходит до списания оплаты, суммы в ответе считает сервис.
     */
    class PurchaseRequestHandler
    {
    public:
        explicit PurchaseRequestHandler(std::shared_ptr<ports::input::ITicketService> ticketService)
            : ticketService_(std::move(ticketService))
        {
            std::cout << "[PurchaseRequestHandler] Created" << std::endl;
        }

        PurchaseResponse handle(const std::string &body)
        {
            try
            {
                auto json = nlohmann::json::parse(body);

                int64_t accountId = json.value("account_id", int64_t{0});

                std::vector<domain::TicketTypeRequest> requests;
                if (json.contains("tickets") && !json["tickets"].is_null())
                {
                    const auto &tickets = json["tickets"];
                    if (!tickets.is_array())
                    {
                        return error(400, "tickets must be an array");
                    }
                    for (const auto &item : tickets)
                    {
                        auto type = domain::parseTicketType(item.value("type", ""));
                        auto quantity = parseQuantity(item);
                        if (!quantity)
                        {
                            return error(400, "quantity must be an integer within int range");
                        }
                        requests.emplace_back(type, *quantity);
                    }
                }

                auto outcome = ticketService_->quoteTickets(accountId, requests);
                ticketService_->purchaseTickets(accountId, requests);

                nlohmann::json response;
                response["status"] = "OK";
                response["account_id"] = outcome.accountId;
                response["total_price"] = outcome.totalPrice;
                response["total_seats"] = outcome.totalSeats;
                return PurchaseResponse{200, response.dump()};
            }
            catch (const domain::InvalidPurchaseException &e)
            {
                nlohmann::json response;
                response["error"] = e.what();
                response["code"] = domain::toString(e.getErrorCode());
                return PurchaseResponse{400, response.dump()};
            }
            catch (const nlohmann::json::exception &e)
            {
                return error(400, "Invalid JSON");
            }
            catch (const std::invalid_argument &e)
            {
                return error(400, e.what());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[PurchaseRequestHandler] Error: " << e.what() << std::endl;
                return error(500, std::string("Internal error: ") + e.what());
            }
        }

    private:
        std::shared_ptr<ports::input::ITicketService> ticketService_;

        /// Отсутствующее quantity = 0; дробные и выходящие за int значения отклоняются
        static std::optional<int> parseQuantity(const nlohmann::json &item)
        {
            if (!item.contains("quantity"))
            {
                return 0;
            }
            const auto &value = item["quantity"];
            if (!value.is_number_integer())
            {
                return std::nullopt;
            }
            if (value.is_number_unsigned())
            {
                auto raw = value.get<uint64_t>();
                if (raw > static_cast<uint64_t>(std::numeric_limits<int>::max()))
                    return std::nullopt;
                return static_cast<int>(raw);
            }
            auto raw = value.get<int64_t>();
            if (raw < std::numeric_limits<int>::min() || raw > std::numeric_limits<int>::max())
            {
                return std::nullopt;
            }
            return static_cast<int>(raw);
        }

        static PurchaseResponse error(int status, const std::string &message)
        {
            nlohmann::json response;
            response["error"] = message;
            return PurchaseResponse{status, response.dump()};
        }
    };

} // namespace cinema::adapters::primary
