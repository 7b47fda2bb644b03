// include/TicketsApp.hpp
#pragma once

#include <boost/di.hpp>
#include <nlohmann/json.hpp>

// Settings
#include "settings/AppSettings.hpp"

// Ports
#include "ports/input/ITicketService.hpp"
#include "ports/output/ITicketPaymentService.hpp"
#include "ports/output/ISeatReservationService.hpp"

// Application
#include "application/TicketService.hpp"

// Secondary Adapters
#include "adapters/secondary/FakePaymentGateway.hpp"
#include "adapters/secondary/FakeSeatBookingAdapter.hpp"

// Primary Adapters
#include "adapters/primary/PurchaseRequestHandler.hpp"

#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

namespace di = boost::di;

namespace cinema
{

    /**
     * @brief Cinema Tickets Application
     *
     * Template Method:
     * 1. loadEnvironment(): настройки из ENV и аргументов
     * 2. configureInjection(): граф объектов через Boost.DI
     * 3. start(): чтение заказов и вывод ответов
     *
     * Вход (файл или stdin): один JSON-заказ, JSON-массив заказов
     * или JSON Lines (заказ на строку). На каждый заказ печатается
     * строка "<status> <json>".
     */
    class TicketsApp
    {
    public:
        TicketsApp() { std::cout << "[TicketsApp] Initializing..." << std::endl; }
        virtual ~TicketsApp() { std::cout << "[TicketsApp] Shutting down..." << std::endl; }

        void run(int argc, char *argv[])
        {
            loadEnvironment(argc, argv);
            configureInjection();
            start();
        }

    protected:
        virtual void loadEnvironment(int argc, char *argv[])
        {
            settings_ = std::make_shared<settings::AppSettings>();
            if (argc > 1)
            {
                settings_->setOrdersFile(argv[1]);
            }
            std::cout << "[TicketsApp] Environment loaded, orders from "
                      << (settings_->getOrdersFile().empty() ? "stdin" : settings_->getOrdersFile())
                      << std::endl;
        }

        virtual void configureInjection()
        {
            std::cout << "[TicketsApp] Configuring DI..." << std::endl;

            auto injector = di::make_injector(
                di::bind<settings::AppSettings>().to(settings_),

                di::bind<ports::output::ITicketPaymentService>()
                    .to<adapters::secondary::FakePaymentGateway>()
                    .in(di::singleton),
                di::bind<ports::output::ISeatReservationService>()
                    .to<adapters::secondary::FakeSeatBookingAdapter>()
                    .in(di::singleton),

                di::bind<ports::input::ITicketService>().to<application::TicketService>().in(di::singleton));

            handler_ = injector.create<std::shared_ptr<adapters::primary::PurchaseRequestHandler>>();

            std::cout << "[TicketsApp] Ready" << std::endl;
        }

        virtual void start()
        {
            std::string content = readInput();

            if (nlohmann::json::accept(content))
            {
                auto document = nlohmann::json::parse(content);
                if (document.is_array())
                {
                    for (const auto &order : document)
                    {
                        process(order.dump());
                    }
                }
                else
                {
                    process(document.dump());
                }
                return;
            }

            // JSON Lines
            std::istringstream lines(content);
            std::string line;
            while (std::getline(lines, line))
            {
                if (line.find_first_not_of(" \t\r") == std::string::npos)
                    continue;
                process(line);
            }
        }

    private:
        std::shared_ptr<settings::AppSettings> settings_;
        std::shared_ptr<adapters::primary::PurchaseRequestHandler> handler_;

        std::string readInput()
        {
            std::stringstream buffer;
            const std::string path = settings_->getOrdersFile();
            if (path.empty())
            {
                buffer << std::cin.rdbuf();
                return buffer.str();
            }

            std::ifstream file(path);
            if (!file)
            {
                throw std::runtime_error("Cannot open orders file: " + path);
            }
            buffer << file.rdbuf();
            return buffer.str();
        }

        void process(const std::string &order)
        {
            auto response = handler_->handle(order);
            std::cout << response.status << " " << response.body << std::endl;
        }
    };

} // namespace cinema
