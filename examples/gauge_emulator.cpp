#include <iostream>
#include <string>
#include <thread>
#include <chrono>
#include <signal.h>
#include "emulator/gauge_emulator.hpp"
#include "transport/serial.hpp"
#include "common/helpers.hpp"

volatile bool running = true;
void sig_handler(int) { running = false; }

int main(int argc, char** argv)
{
    using namespace vgauge;

    signal(SIGINT, sig_handler);

    int device_id = Protocol::DEFAULT_DEVICE_ID;
    if (argc > 1) {
        auto parsed = parse_unsigned(argv[1]);
        if (!parsed || *parsed > static_cast<unsigned long>(Protocol::MAX_DEVICE_ID)) {
            std::cerr << "Invalid device id " << argv[1] << "\n";
            return 2;
        }
        device_id = static_cast<int>(*parsed);
    }
    Dialect dialect = (argc > 2 && std::string(argv[2]) == "b") ? Dialect::PROTOCOL_B : Dialect::PROTOCOL_A;

    SerialPort port;
    auto path = port.open_virtual();
    if (!path.ok()) {
        std::cerr << "Could not create virtual port\n";
        return 1;
    }

    GaugeEmulator emulator(device_id, dialect);
    emulator.set_log_callback([](const std::string& msg) { std::cout << msg << std::endl; });

    if (!emulator.start(port).ok()) {
        return 1;
    }

    std::cout << "Gauge #" << device_id << (dialect == Dialect::PROTOCOL_B ? " (Protocol-B)" : " (Protocol-A)")
              << " listening on " << path.value() << ", Ctrl+C to quit" << std::endl;

    while (running && emulator.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    emulator.stop();
    port.close();
    return 0;
}
