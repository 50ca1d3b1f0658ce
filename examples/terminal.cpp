#include <atomic>
#include <csignal>
#include <chrono>
#include <cstdlib>
#include <deque>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>

#include <CLI/CLI.hpp>

#include "poslink.hpp"

using namespace poslink;
using namespace poslink::core::protocol;

// -----------------------------------------------------------------------------
// Ctrl+C / SIGTERM handling
// -----------------------------------------------------------------------------
std::atomic<bool> running{true};

void on_signal(int) {
    running.store(false);
}

// -----------------------------------------------------------------------------
// Console commands, read on a helper thread and executed on the poll loop
// -----------------------------------------------------------------------------
class CommandQueue {
public:
    void push(std::string line) {
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.push_back(std::move(line));
    }

    bool pop(std::string& line) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (lines_.empty()) {
            return false;
        }
        line = std::move(lines_.front());
        lines_.pop_front();
        return true;
    }

private:
    std::mutex mutex_;
    std::deque<std::string> lines_;
};

// Outlives main(): the reader thread is detached while blocked on stdin
CommandQueue commands;

void execute(Client& client, const std::string& line) {
    std::istringstream in(line);
    std::string cmd;
    in >> cmd;
    if (cmd.empty()) {
        return;
    }
    if (cmd == "price") {
        std::string product_id, barcode;
        if (!(in >> product_id >> barcode)) {
            std::cout << "usage: price <productId> <barcode>" << std::endl;
            return;
        }
        std::cout << (client.request_price(product_id, barcode) ? " -> price_request sent" : " -> not connected") << std::endl;
    }
    else if (cmd == "stock") {
        std::string product_id, reason;
        double old_quantity = 0, new_quantity = 0;
        if (!(in >> product_id >> old_quantity >> new_quantity) || !std::getline(in >> std::ws, reason) || reason.empty()) {
            std::cout << "usage: stock <productId> <old> <new> <reason>" << std::endl;
            return;
        }
        std::cout << (client.report_inventory_change(product_id, old_quantity, new_quantity, reason) ? " -> inventory_change sent" : " -> not connected") << std::endl;
    }
    else if (cmd == "hide") {
        client.lifecycle().notify_visibility(false);
    }
    else if (cmd == "show") {
        client.lifecycle().notify_visibility(true);
    }
    else {
        std::cout << "commands: price | stock | hide | show" << std::endl;
    }
}

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main(int argc, char** argv) {
    // -------------------------------------------------------------
    // CLI parsing
    // -------------------------------------------------------------
    CLI::App app{"poslink - POS terminal link\n"
        "Connects this terminal to the store server, keeps the registry informed\n"
        "and prints everything the server pushes.\n"};

    Config cfg;
    configure(app, cfg);
    app.footer(
        "Commands on stdin:\n"
        "  price <productId> <barcode>\n"
        "  stock <productId> <old> <new> <reason>\n"
        "  hide | show\n"
        "Press Ctrl+C to report offline and exit cleanly."
    );

    CLI11_PARSE(app, argc, argv);

    apply_log_level(cfg);
    log::Logger::instance().enable_color(true);
    cfg.dump("Configuration", std::cout);

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    // -------------------------------------------------------------
    // Client setup
    // -------------------------------------------------------------
    Client client{cfg};

    auto link_subs = client.on_connection_state([](const ConnectionEvent& ev) {
        std::cout << " -> LINK " << to_string(ev.state);
        if (ev.state == LinkState::Disconnected) {
            std::cout << " code=" << ev.code << " reason='" << ev.reason << "'";
        }
        else if (ev.state == LinkState::Reconnecting) {
            std::cout << " attempt=" << ev.attempt << " in " << ev.delay.count() << " ms";
        }
        else if (ev.state == LinkState::GaveUp) {
            std::cout << " after " << ev.attempt << " attempts";
        }
        std::cout << std::endl;
    });

    auto price_sub = client.on_price_response([](const schema::PriceResponse& r) {
        std::cout << " -> PRICE product=" << r.product_id << " barcode=" << r.barcode
                  << " price=" << r.price << " available=" << (r.available ? "yes" : "no") << std::endl;
    });

    auto stock_sub = client.on_inventory_changed([](const schema::InventoryChange& c) {
        std::cout << " -> STOCK product=" << c.product_id << " " << c.old_quantity
                  << " -> " << c.new_quantity << " (" << c.reason << ")" << std::endl;
    });

    auto terminal_sub = client.on_terminal_status([](const schema::TerminalStatus& t) {
        std::cout << " -> TERMINAL " << t.id << " '" << t.name << "' " << t.status
                  << " last=" << t.last_activity << std::endl;
    });

    auto tx_sub = client.on_transaction_sync([](std::string_view payload) {
        std::cout << " -> TRANSACTION " << payload << std::endl;
    });

    auto employee_sub = client.on_employee_action([](std::string_view payload) {
        std::cout << " -> EMPLOYEE " << payload << std::endl;
    });

    dispatch::Subscription unknown_sub(client.bus(), dispatch::category::UnknownMessage,
        client.bus().subscribe(dispatch::category::UnknownMessage, [](std::string_view envelope) {
            std::cout << " -> UNKNOWN " << envelope << std::endl;
        }));

    dispatch::Subscription assigned_sub(client.bus(), dispatch::category::TerminalAssigned,
        client.bus().subscribe(dispatch::category::TerminalAssigned, [&client](std::string_view) {
            std::cout << " -> ASSIGNED session id " << client.session_terminal_id().value_or("?") << std::endl;
        }));

    std::cout << "[poslink] Terminal identity: " << client.terminal_id() << std::endl;

    // Transient failures are already scheduled for retry; only misuse is fatal
    const auto err = client.connect();
    if (err != core::transport::Error::None && !core::transport::is_retryable(err)) {
        std::cerr << "Failed to connect: " << core::transport::to_string(err) << std::endl;
        return EXIT_FAILURE;
    }
    if (err != core::transport::Error::None) {
        std::cout << "[poslink] First attempt failed (" << core::transport::to_string(err) << "), retrying" << std::endl;
    }

    // -------------------------------------------------------------
    // Console input
    // -------------------------------------------------------------
    std::thread reader([]() {
        std::string line;
        while (running.load() && std::getline(std::cin, line)) {
            commands.push(line);
        }
    });
    reader.detach();

    // -------------------------------------------------------------
    // Main loop
    // -------------------------------------------------------------
    client.run_while([&]() {
        std::string line;
        while (commands.pop(line)) {
            execute(client, line);
        }
        return running.load();
    }, std::chrono::milliseconds(5));

    // -------------------------------------------------------------
    // Graceful shutdown: offline report first, then a clean close
    // -------------------------------------------------------------
    std::cout << "\n[poslink] Shutting down..." << std::endl;
    client.lifecycle().notify_teardown();
    client.flush_status(std::chrono::seconds(2));
    client.disconnect();

    std::cout << "[poslink] Done." << std::endl;
    return EXIT_SUCCESS;
}
